// Tests for the Cpu namespace.
#include <cpu/cpu.hpp>
#include <selftests/macros.hpp>

namespace Cpu {

// Nested InterruptGuards restore the state of the outer scope.
SelfTests::TestResult interruptGuardTest() {
    bool const origState(interruptsEnabled());
    enableInterrupts();
    {
        InterruptGuard const outer;
        TEST_ASSERT(!interruptsEnabled());
        {
            InterruptGuard const inner;
            TEST_ASSERT(!interruptsEnabled());
        }
        // The inner guard was created with interrupts disabled.
        TEST_ASSERT(!interruptsEnabled());
    }
    TEST_ASSERT(interruptsEnabled());
    if (!origState) {
        disableInterrupts();
    }
    return SelfTests::TestResult::Success;
}

// writeSatp() followed by satp() returns the written value.
SelfTests::TestResult satpReadWriteTest() {
    InterruptGuard const guard;
    u64 const orig(satp());
    // Bare mode, translation disabled.
    writeSatp(0);
    TEST_ASSERT(satp() == 0);
    writeSatp(orig);
    flushTlb();
    TEST_ASSERT(satp() == orig);
    return SelfTests::TestResult::Success;
}

// The time counter never goes backwards.
SelfTests::TestResult timeMonotonicTest() {
    u64 const t0(time());
    u64 const t1(time());
    TEST_ASSERT(t0 <= t1);
    return SelfTests::TestResult::Success;
}

// Run the tests under this namespace.
void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, interruptGuardTest);
    RUN_TEST(runner, satpReadWriteTest);
    RUN_TEST(runner, timeMonotonicTest);
}
}
