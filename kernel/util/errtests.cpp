// Tests for the Err type.
#include <util/err.hpp>
#include <util/cstring.hpp>
#include <selftests/macros.hpp>

namespace ErrType {

// Helper failing when given an odd value.
static Err failOnOdd(u64 const value) {
    if (value % 2) {
        return Error::InvalidArgument;
    }
    return Ok;
}

SelfTests::TestResult errOkAndErrorTest() {
    Err const defaulted;
    TEST_ASSERT(!defaulted);
    Err const ok(Ok);
    TEST_ASSERT(!ok);
    Err const err(Error::AlreadyMapped);
    TEST_ASSERT(!!err);
    TEST_ASSERT(err.error() == Error::AlreadyMapped);

    TEST_ASSERT(!failOnOdd(4));
    Err const odd(failOnOdd(7));
    TEST_ASSERT(!!odd);
    TEST_ASSERT(odd.error() == Error::InvalidArgument);
    return SelfTests::TestResult::Success;
}

// Comparing an Err with an Error.
SelfTests::TestResult errCompareTest() {
    Err const ok(Ok);
    TEST_ASSERT(!(ok == Error::NotMapped));
    Err const err(Error::NotMapped);
    TEST_ASSERT(err == Error::NotMapped);
    TEST_ASSERT(!(err == Error::BadAddress));
    return SelfTests::TestResult::Success;
}

// Every error has a printable name.
SelfTests::TestResult errToStringTest() {
    TEST_ASSERT(Util::streq(errorToString(Error::NotMapped), "NotMapped"));
    TEST_ASSERT(Util::streq(errorToString(Error::RegistryFull),
                            "RegistryFull"));
    return SelfTests::TestResult::Success;
}

void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, errOkAndErrorTest);
    RUN_TEST(runner, errCompareTest);
    RUN_TEST(runner, errToStringTest);
}
}
