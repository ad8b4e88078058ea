// Useful macros to use within tests.
#pragma once

#include <logging/log.hpp>
#include <selftests/selftests.hpp>

// Run a single test function with the TestRunner.
// @param testRunner: Reference to the TestRunner instance under which the test
// should be ran.
// @param testFunc: The test function to run.
#define RUN_TEST(testRunner, testFunc)              \
    do {                                            \
        testRunner._runTest(#testFunc, testFunc);   \
    } while (0)

// Some helper macros for test functions.

// Assert on a condition. If the condition is false, logs an assert failure and
// return TestResult::Failure.
// @param cond: The condition to assert on.
#define TEST_ASSERT(cond)                                               \
    do {                                                                \
        if (!(cond)) {                                                  \
            char const * const condStr(#cond);                          \
            Log::crit("    Test assert failed: {} ({}:{})", condStr,    \
                      __FILE__, u64(__LINE__));                         \
            return SelfTests::TestResult::Failure;                      \
        }                                                               \
    } while (0)
