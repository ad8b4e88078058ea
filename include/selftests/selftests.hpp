// Kernel self-tests.
#pragma once

#include <util/ints.hpp>

namespace SelfTests {

// The result of a test run.
enum class TestResult {
    Success,
    Failure,
    // The test could not run in the current configuration.
    Skip,
};

// Forward decl for TestFunction.
class TestRunner;
// A test function. Runs a test and indicates, through the return value, if the
// test was successful or not.
using TestFunction = TestResult (*)(void);

// Helper class to run tests and gather statistics, e.g. number of tests passed,
// failed, ...
class TestRunner {
public:
    // Create a TestRunner.
    TestRunner();

    // Run a single test with the TestRunner. You typically want to use the
    // RUN_TEST macro defined below instead as it automatically figures out the
    // name of the test from the func argument.
    // @param testName: The name of the test.
    // @param testFunc: The test function to run.
    void _runTest(char const * const testName, TestFunction const& func);

    // Print a summary of the passed and failed tests, followed by the names of
    // the tests that failed.
    void printSummary() const;

    // Get the number of tests that failed so far.
    u64 numFailures() const;

private:
    // The total number of tests ran so far.
    u64 m_numTestsRan;
    // The total number of tests that passed so far.
    u64 m_numTestsPassed;
    // The total number of tests that were skipped so far.
    u64 m_numTestsSkipped;

    // Names of the failed tests. Only the first MaxReportedFailures are kept,
    // the count is still accurate past that.
    static constexpr u64 MaxReportedFailures = 16;
    char const * m_failedTests[MaxReportedFailures];
};
}
