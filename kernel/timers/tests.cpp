// Timer tests.
#include <timers/timers.hpp>
#include <cpu/cpu.hpp>
#include <selftests/macros.hpp>

namespace Timer {

// Conversions between units and cycles.
SelfTests::TestResult durationTest() {
    TEST_ASSERT(Duration::MilliSecs(10).microSecs() == 10000);
    TEST_ASSERT(Duration::Secs(3).microSecs() == 3000000);
    TEST_ASSERT(Duration::MilliSecs(10).toCycles(10000000) == 100000);
    TEST_ASSERT(Duration::FromCycles(100000, 10000000).microSecs() == 10000);
    // Rounded down.
    TEST_ASSERT(Duration::FromCycles(15, 10000000).microSecs() == 1);
    // Large counts do not overflow.
    u64 const day(86400ULL * 10000000);
    TEST_ASSERT(Duration::FromCycles(day * 1000, 10000000).microSecs()
                == 86400ULL * 1000 * 1000000);
    return SelfTests::TestResult::Success;
}

// Each acknowledge counts a tick and moves the deadline one period forward.
SelfTests::TestResult tickTimerTest() {
    Cpu::InterruptGuard const guard;
    TickTimer timer(Duration::MilliSecs(10), 10000000);
    TEST_ASSERT(timer.periodCycles() == 100000);
    TEST_ASSERT(!timer.ticks());

    u64 const before(Cpu::time());
    timer.start();
    u64 const first(timer.nextDeadline());
    TEST_ASSERT(first >= before + timer.periodCycles());
    TEST_ASSERT(first <= Cpu::time() + timer.periodCycles());

    timer.acknowledge();
    TEST_ASSERT(timer.ticks() == 1);
    TEST_ASSERT(timer.nextDeadline() > Cpu::time());
    TEST_ASSERT(timer.nextDeadline() >= first + timer.periodCycles());
    // Leave the timer far in the future for the next tests.
    Cpu::setTimer(~0ULL);
    return SelfTests::TestResult::Success;
}

// Run Timers tests.
void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, durationTest);
    RUN_TEST(runner, tickTimerTest);
}
}
