// Tests for the decoding of trap causes.
#include <trap/trap.hpp>
#include <util/cstring.hpp>
#include <selftests/macros.hpp>

namespace Trap {

// An ecall from U-mode takes its number from a7 and its arguments from a0-a5.
SelfTests::TestResult decodeSyscallTest() {
    TrapFrame frame{};
    for (u64 i(0); i < 6; ++i) {
        frame.x[Reg::A0 + i] = 100 + i;
    }
    frame.x[Reg::A7] = 64;
    // a6 is not an argument.
    frame.x[16] = 0xbad;
    Cause const cause(Cause::decode(Scause::EcallFromUser, 0, frame));
    TEST_ASSERT(cause.kind() == Cause::Kind::Syscall);
    TEST_ASSERT(!cause.isInterrupt());
    TEST_ASSERT(cause.syscall().number == 64);
    for (u64 i(0); i < 6; ++i) {
        TEST_ASSERT(cause.syscall().args[i] == 100 + i);
    }
    return SelfTests::TestResult::Success;
}

// The three page fault causes carry the faulting address and access kind.
SelfTests::TestResult decodePageFaultTest() {
    TrapFrame const frame{};
    struct {
        u64 scause;
        Access access;
    } const cases[] = {
        {Scause::LoadPageFault, Access::Load},
        {Scause::StorePageFault, Access::Store},
        {Scause::InstructionPageFault, Access::Fetch},
    };
    for (auto const& c : cases) {
        Cause const cause(Cause::decode(c.scause, 0x12345, frame));
        TEST_ASSERT(cause.kind() == Cause::Kind::PageFault);
        TEST_ASSERT(cause.pageFault().address == VirAddr(0x12345));
        TEST_ASSERT(cause.pageFault().access == c.access);
    }
    return SelfTests::TestResult::Success;
}

// Interrupts and the remaining exceptions.
SelfTests::TestResult decodeOtherCausesTest() {
    TrapFrame const frame{};
    u64 const timer(Scause::Interrupt | Scause::SupervisorTimerInterrupt);
    Cause const timerCause(Cause::decode(timer, 0, frame));
    TEST_ASSERT(timerCause.kind() == Cause::Kind::TimerInterrupt);
    TEST_ASSERT(timerCause.isInterrupt());

    u64 const ext(Scause::Interrupt | Scause::SupervisorExternalInterrupt);
    Cause const extCause(Cause::decode(ext, 0, frame));
    TEST_ASSERT(extCause.kind() == Cause::Kind::ExternalInterrupt);
    TEST_ASSERT(extCause.isInterrupt());

    Cause const illegal(
        Cause::decode(Scause::IllegalInstruction, 0xdead, frame));
    TEST_ASSERT(illegal.kind() == Cause::Kind::IllegalInstruction);
    TEST_ASSERT(illegal.exception().tval == 0xdead);

    // Breakpoint.
    Cause const other(Cause::decode(3, 0x1000, frame));
    TEST_ASSERT(other.kind() == Cause::Kind::OtherException);
    TEST_ASSERT(other.exception().code == 3);
    TEST_ASSERT(!other.isInterrupt());

    TEST_ASSERT(Util::streq(kindToString(timerCause.kind()), "TimerInterrupt"));
    TEST_ASSERT(Util::streq(kindToString(other.kind()), "OtherException"));
    return SelfTests::TestResult::Success;
}

// Run the trap decoding tests.
void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, decodeSyscallTest);
    RUN_TEST(runner, decodePageFaultTest);
    RUN_TEST(runner, decodeOtherCausesTest);
}
}
