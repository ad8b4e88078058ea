// Kernel data structures.
#pragma once

#include <selftests/selftests.hpp>

namespace DataStruct {
// Run the tests for the List, Queue, Vector and EmbeddedFreeList types.
void Test(SelfTests::TestRunner& runner);
}
