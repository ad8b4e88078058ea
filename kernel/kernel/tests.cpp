// Tests of the trap path, run on the simulated hart.
#include <kernel/kernel.hpp>
#include <sim/testkernel.hpp>
#include <syscall/syscall.hpp>
#include <cpu/cpu.hpp>
#include <selftests/macros.hpp>

namespace KernelTests {

using Sched::Task;
using Sim::TestKernel;

// Configuration used by the tests: short slices, everything else default.
static Kernel::Config testConfig() {
    Kernel::Config config;
    config.timeSliceTicks = 2;
    return config;
}

// The first task is resumed in U-mode at the entry of its image, with its
// stack pointer at the top of the user stack.
SelfTests::TestResult bootTest() {
    TestKernel tk(2, testConfig());
    Sim::Hart& hart(tk.hart());
    TEST_ASSERT(tk.current() == 1);
    TEST_ASSERT(hart.mode() == Sim::Mode::User);
    TEST_ASSERT(hart.pc() == TestKernel::LoadAddress);
    TEST_ASSERT(hart.reg(Reg::Sp) == Kernel::UserStackTop);
    TEST_ASSERT(hart.satp() == tk.task(1)->addrSpace()->satpValue());
    TEST_ASSERT(tk.kernel().registry().numTasks() == 2);
    TEST_ASSERT(tk.kernel().scheduler().numReady() == 1);

    // The image was copied at its load address.
    u32 instruction(0);
    TEST_ASSERT(hart.fetch(VirAddr(hart.pc()), instruction));
    TEST_ASSERT(instruction == TestKernel::Program[0]);
    TEST_ASSERT(hart.fetch(VirAddr(hart.pc() + 4), instruction));
    TEST_ASSERT(instruction == TestKernel::Program[1]);
    return SelfTests::TestResult::Success;
}

// Tasks take turns on timer interrupts, each running for a full time slice.
// The context of a preempted task is restored when it runs again.
SelfTests::TestResult timerRoundRobinTest() {
    Kernel::Config const config(testConfig());
    TestKernel tk(3, config);
    Sim::Hart& hart(tk.hart());
    TEST_ASSERT(tk.current() == 1);
    hart.setReg(Reg::A0, 0x1111);
    hart.setReg(Reg::Sp, Kernel::UserStackTop - 0x100);

    Task::Id const expected[] = {2, 3, 1, 2};
    for (Task::Id const next : expected) {
        Task::Id const prev(tk.current());
        for (u64 i(0); i < config.timeSliceTicks; ++i) {
            TEST_ASSERT(tk.current() == prev);
            TEST_ASSERT(hart.timerInterrupt());
        }
        TEST_ASSERT(tk.current() == next);
        TEST_ASSERT(hart.satp() == tk.task(next)->addrSpace()->satpValue());
        if (next == 1) {
            TEST_ASSERT(hart.reg(Reg::A0) == 0x1111);
            TEST_ASSERT(hart.reg(Reg::Sp) == Kernel::UserStackTop - 0x100);
            TEST_ASSERT(hart.pc() == TestKernel::LoadAddress);
        } else if (next == 2) {
            hart.setReg(Reg::A0, 0x2222);
        }
    }
    TEST_ASSERT(hart.reg(Reg::A0) == 0x2222);
    TEST_ASSERT(tk.kernel().timer().ticks() == 4 * config.timeSliceTicks);
    return SelfTests::TestResult::Success;
}

// A single task keeps running when its slice expires.
SelfTests::TestResult singleTaskSliceTest() {
    TestKernel tk(1, testConfig());
    for (u64 i(0); i < 10; ++i) {
        TEST_ASSERT(tk.hart().timerInterrupt());
        TEST_ASSERT(tk.current() == 1);
        TEST_ASSERT(tk.hart().mode() == Sim::Mode::User);
    }
    return SelfTests::TestResult::Success;
}

// A task exits and is never resumed.
SelfTests::TestResult exitTest() {
    TestKernel tk(2, testConfig());
    Sim::Hart& hart(tk.hart());
    hart.ecall(static_cast<u64>(Syscall::Number::Exit), 3);
    TEST_ASSERT(tk.current() == 2);
    Ptr<Task> const task(tk.task(1));
    TEST_ASSERT(task->state() == Task::State::Zombie);
    TEST_ASSERT(task->exitStatus() == 3);
    TEST_ASSERT(!tk.runUntil(1, 20));
    TEST_ASSERT(tk.current() == 2);
    return SelfTests::TestResult::Success;
}

// Once no task is Ready the hart runs the idle task, in S-mode. Orphan zombies
// are reaped on the next timer interrupt.
SelfTests::TestResult idleTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    hart.ecall(static_cast<u64>(Syscall::Number::Exit), 0);
    TEST_ASSERT(tk.current() == Task::IdleId);
    TEST_ASSERT(tk.kernel().scheduler().isIdle());
    TEST_ASSERT(hart.mode() == Sim::Mode::Supervisor);
    TEST_ASSERT(hart.pc() == Sim::IdleEntry);
    TEST_ASSERT(hart.satp() == tk.kernel().kernelSpace()->satpValue());
    TEST_ASSERT(tk.kernel().registry().numTasks() == 1);

    // The idle task runs with interrupts enabled.
    TEST_ASSERT(hart.timerInterrupt());
    TEST_ASSERT(tk.current() == Task::IdleId);
    TEST_ASSERT(hart.mode() == Sim::Mode::Supervisor);
    TEST_ASSERT(!tk.kernel().registry().numTasks());
    TEST_ASSERT(!tk.kernel().registry().lookup(1));
    return SelfTests::TestResult::Success;
}

// An access to an unmapped address kills the task with PageFaultStatus. Other
// tasks are not affected.
SelfTests::TestResult pageFaultKillTest() {
    TestKernel tk(2, testConfig());
    Sim::Hart& hart(tk.hart());
    u64 value(0);
    TEST_ASSERT(!hart.load(VirAddr(u64(0)), &value, sizeof(value)));
    TEST_ASSERT(tk.current() == 2);
    Ptr<Task> const task(tk.task(1));
    TEST_ASSERT(task->state() == Task::State::Zombie);
    TEST_ASSERT(task->exitStatus() == Kernel::PageFaultStatus);

    // Task 2 still runs.
    u64 const pid(hart.ecall(static_cast<u64>(Syscall::Number::GetPid)));
    TEST_ASSERT(pid == 2);

    // The kernel window is not accessible from U-mode.
    TEST_ASSERT(!hart.store(VirAddr(Paging::USER_SPACE_END), &value,
                            sizeof(value)));
    TEST_ASSERT(tk.task(2)->exitStatus() == Kernel::PageFaultStatus);
    TEST_ASSERT(tk.current() == Task::IdleId);
    return SelfTests::TestResult::Success;
}

// The first access to a page of the stack is resolved by allocating a frame,
// the access then completes and the task continues.
SelfTests::TestResult lazyStackTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    VirAddr const addr(Kernel::UserStackTop - 8);
    Paging::AddrSpace const& space(*tk.task(1)->addrSpace());
    TEST_ASSERT(!space.translate(addr));

    u64 const freeBefore(tk.numFreeFrames());
    u64 const value(0xdeadbeefcafebabe);
    TEST_ASSERT(hart.store(addr, &value, sizeof(value)));
    TEST_ASSERT(tk.current() == 1);
    TEST_ASSERT(tk.numFreeFrames() < freeBefore);
    TEST_ASSERT(!!space.translate(addr));

    u64 readBack(0);
    TEST_ASSERT(hart.load(addr, &readBack, sizeof(readBack)));
    TEST_ASSERT(readBack == value);

    // Below the stack is not mapped.
    VirAddr const below(Kernel::UserStackTop
                        - (tk.kernel().config().userStackPages + 1)
                        * PAGE_SIZE);
    TEST_ASSERT(!hart.load(below, &readBack, sizeof(readBack)));
    TEST_ASSERT(tk.task(1)->exitStatus() == Kernel::PageFaultStatus);
    return SelfTests::TestResult::Success;
}

// Illegal instructions and other exceptions kill the task.
SelfTests::TestResult exceptionKillTest() {
    TestKernel tk(3, testConfig());
    Sim::Hart& hart(tk.hart());
    hart.illegalInstruction(0xffffffff);
    TEST_ASSERT(tk.current() == 2);
    TEST_ASSERT(tk.task(1)->exitStatus()
                == Kernel::IllegalInstructionStatus);

    // Breakpoint.
    hart.exception(3, hart.pc());
    TEST_ASSERT(tk.current() == 3);
    TEST_ASSERT(tk.task(2)->exitStatus() == Kernel::OtherExceptionStatus);
    TEST_ASSERT(tk.task(3)->state() == Task::State::Running);
    return SelfTests::TestResult::Success;
}

// External interrupts are acknowledged and the task resumes untouched.
SelfTests::TestResult externalInterruptTest() {
    TestKernel tk(2, testConfig());
    Sim::Hart& hart(tk.hart());
    hart.setReg(Reg::A0, 0x1234);
    u64 const pc(hart.pc());
    TEST_ASSERT(hart.externalInterrupt());
    TEST_ASSERT(tk.current() == 1);
    TEST_ASSERT(hart.reg(Reg::A0) == 0x1234);
    TEST_ASSERT(hart.pc() == pc);
    TEST_ASSERT(hart.mode() == Sim::Mode::User);
    TEST_ASSERT(tk.task(1)->state() == Task::State::Running);
    return SelfTests::TestResult::Success;
}

// Interrupts are taken in U-mode, the hart is back in U-mode with interrupts
// enabled after the trap.
SelfTests::TestResult trapReturnStateTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    TEST_ASSERT(hart.timerInterrupt());
    TEST_ASSERT(hart.mode() == Sim::Mode::User);
    TEST_ASSERT(hart.sstatus() & Cpu::Sstatus::SIE);
    TEST_ASSERT(hart.sscratch()
                == reinterpret_cast<u64>(&tk.task(1)->frame()));
    // The timer was re-armed one period later.
    TEST_ASSERT(hart.timerDeadline() > hart.time());
    return SelfTests::TestResult::Success;
}

// Run the tests of the trap path.
void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, bootTest);
    RUN_TEST(runner, timerRoundRobinTest);
    RUN_TEST(runner, singleTaskSliceTest);
    RUN_TEST(runner, exitTest);
    RUN_TEST(runner, idleTest);
    RUN_TEST(runner, pageFaultKillTest);
    RUN_TEST(runner, lazyStackTest);
    RUN_TEST(runner, exceptionKillTest);
    RUN_TEST(runner, externalInterruptTest);
    RUN_TEST(runner, trapReturnStateTest);
}
}
