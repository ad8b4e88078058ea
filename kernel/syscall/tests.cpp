// Syscall tests, run on the simulated hart.
#include <syscall/syscall.hpp>
#include <sim/testkernel.hpp>
#include <util/cstring.hpp>
#include <selftests/macros.hpp>

namespace Syscall {

using Sched::Task;
using Sim::TestKernel;

// Configuration used by the tests: short slices, everything else default.
static Kernel::Config testConfig() {
    Kernel::Config config;
    config.timeSliceTicks = 2;
    return config;
}

// Issue a syscall from the running task.
// @return: The value of a0 after the trap, as a signed value.
static i64 call(Sim::Hart& hart,
                Number const number,
                u64 const a0 = 0,
                u64 const a1 = 0,
                u64 const a2 = 0) {
    return static_cast<i64>(hart.ecall(static_cast<u64>(number), a0, a1, a2));
}

// Somewhere on the stack of the tasks.
static VirAddr const StackAddr(Kernel::UserStackTop - 0x100);

// getpid returns the id of the caller.
SelfTests::TestResult getPidTest() {
    TestKernel tk(2, testConfig());
    TEST_ASSERT(call(tk.hart(), Number::GetPid) == 1);
    TEST_ASSERT(tk.runUntil(2));
    TEST_ASSERT(call(tk.hart(), Number::GetPid) == 2);
    // The syscall resumes after the ecall.
    TEST_ASSERT(tk.hart().pc() == TestKernel::LoadAddress + 4);
    return SelfTests::TestResult::Success;
}

// write copies the buffer of the task to the console.
SelfTests::TestResult writeTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    char const msg[] = "Hello from user space\n";
    u64 const len(sizeof(msg) - 1);
    TEST_ASSERT(hart.store(StackAddr, msg, len));

    TEST_ASSERT(call(hart, Number::Write, StdOut, StackAddr.raw(), len)
                == static_cast<i64>(len));
    TEST_ASSERT(Sim::consoleOutputLength() == len);
    TEST_ASSERT(Util::memeq(Sim::consoleOutput(), msg, len));

    TEST_ASSERT(call(hart, Number::Write, StdErr, StackAddr.raw(), 5) == 5);
    TEST_ASSERT(Sim::consoleOutputLength() == len + 5);

    // Nothing to write.
    TEST_ASSERT(!call(hart, Number::Write, StdOut, StackAddr.raw(), 0));
    TEST_ASSERT(Sim::consoleOutputLength() == len + 5);
    return SelfTests::TestResult::Success;
}

// write fails on bad descriptors and bad buffers without writing anything.
SelfTests::TestResult writeErrorsTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    TEST_ASSERT(call(hart, Number::Write, 0, TestKernel::LoadAddress, 4)
                == Errno::BadFd);
    TEST_ASSERT(call(hart, Number::Write, 3, TestKernel::LoadAddress, 4)
                == Errno::BadFd);
    TEST_ASSERT(call(hart, Number::Write, StdOut, 0x0, 4) == Errno::Fault);
    // Kernel memory.
    TEST_ASSERT(call(hart, Number::Write, StdOut, Paging::USER_SPACE_END, 4)
                == Errno::Fault);
    TEST_ASSERT(!Sim::consoleOutputLength());
    // The task is still alive.
    TEST_ASSERT(tk.current() == 1);
    return SelfTests::TestResult::Success;
}

// A buffer running into an unmapped page is written up to the chunk that
// faults.
SelfTests::TestResult partialWriteTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    // The image is a single page, the next one is not mapped.
    u64 const buf(TestKernel::LoadAddress + PAGE_SIZE - 130);
    TEST_ASSERT(call(hart, Number::Write, StdOut, buf, 200) == 128);
    TEST_ASSERT(Sim::consoleOutputLength() == 128);
    return SelfTests::TestResult::Success;
}

// yield hands the hart over to the next Ready task.
SelfTests::TestResult yieldTest() {
    TestKernel tk(2, testConfig());
    Sim::Hart& hart(tk.hart());
    call(hart, Number::Yield);
    TEST_ASSERT(tk.current() == 2);
    call(hart, Number::Yield);
    TEST_ASSERT(tk.current() == 1);
    TEST_ASSERT(!hart.reg(Reg::A0));
    return SelfTests::TestResult::Success;
}

// yield of the only task returns to it.
SelfTests::TestResult yieldAloneTest() {
    TestKernel tk(1, testConfig());
    TEST_ASSERT(!call(tk.hart(), Number::Yield));
    TEST_ASSERT(tk.current() == 1);
    TEST_ASSERT(tk.hart().mode() == Sim::Mode::User);
    return SelfTests::TestResult::Success;
}

// fork creates a copy of the caller. The child gets 0, the parent the id of
// the child. Memory is copied, not shared.
SelfTests::TestResult forkTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    u64 value(7);
    TEST_ASSERT(hart.store(StackAddr, &value, sizeof(value)));
    hart.setReg(Reg::Ra, 0x55);

    i64 const child(call(hart, Number::Fork));
    TEST_ASSERT(child == 2);
    TEST_ASSERT(tk.current() == 1);
    u64 const pc(hart.pc());
    value = 8;
    TEST_ASSERT(hart.store(StackAddr, &value, sizeof(value)));
    TEST_ASSERT(tk.task(2)->parent() == 1);

    call(hart, Number::Yield);
    TEST_ASSERT(tk.current() == 2);
    TEST_ASSERT(!hart.reg(Reg::A0));
    TEST_ASSERT(hart.reg(Reg::Ra) == 0x55);
    TEST_ASSERT(hart.pc() == pc);
    TEST_ASSERT(hart.load(StackAddr, &value, sizeof(value)));
    TEST_ASSERT(value == 7);
    TEST_ASSERT(call(hart, Number::GetPid) == 2);
    return SelfTests::TestResult::Success;
}

// wait on a child that already exited returns its status right away and
// reaps it.
SelfTests::TestResult waitZombieTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    TEST_ASSERT(call(hart, Number::Fork) == 2);
    call(hart, Number::Yield);
    TEST_ASSERT(tk.current() == 2);
    call(hart, Number::Exit, 42);
    TEST_ASSERT(tk.current() == 1);
    TEST_ASSERT(tk.task(2)->state() == Task::State::Zombie);

    TEST_ASSERT(call(hart, Number::Wait, 2) == 42);
    TEST_ASSERT(!tk.kernel().registry().lookup(2));
    TEST_ASSERT(call(hart, Number::Wait, static_cast<u64>(-1))
                == Errno::NoChild);
    return SelfTests::TestResult::Success;
}

// wait blocks until a child exits, the parent then gets the exit status.
SelfTests::TestResult waitBlockTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    TEST_ASSERT(call(hart, Number::Fork) == 2);
    call(hart, Number::Wait, static_cast<u64>(-1));
    TEST_ASSERT(tk.current() == 2);
    TEST_ASSERT(tk.task(1)->state() == Task::State::Blocked);

    // The parent stays blocked while the child runs.
    for (u64 i(0); i < 5; ++i) {
        TEST_ASSERT(hart.timerInterrupt());
        TEST_ASSERT(tk.current() == 2);
    }

    call(hart, Number::Exit, static_cast<u64>(-5));
    TEST_ASSERT(tk.current() == 1);
    TEST_ASSERT(static_cast<i64>(hart.reg(Reg::A0)) == -5);
    TEST_ASSERT(!tk.kernel().registry().lookup(2));
    return SelfTests::TestResult::Success;
}

// wait with a pid that is not a child of the caller.
SelfTests::TestResult waitErrorsTest() {
    TestKernel tk(2, testConfig());
    Sim::Hart& hart(tk.hart());
    TEST_ASSERT(call(hart, Number::Wait, static_cast<u64>(-1))
                == Errno::NoChild);
    // Task 2 exists but is not a child of task 1.
    TEST_ASSERT(call(hart, Number::Wait, 2) == Errno::NoChild);
    TEST_ASSERT(call(hart, Number::Wait, static_cast<u64>(-2))
                == Errno::Invalid);
    TEST_ASSERT(tk.current() == 1);
    return SelfTests::TestResult::Success;
}

// A child whose parent exited is reaped when it exits.
SelfTests::TestResult orphanTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    TEST_ASSERT(call(hart, Number::Fork) == 2);
    call(hart, Number::Exit, 0);
    TEST_ASSERT(tk.current() == 2);
    TEST_ASSERT(tk.task(2)->parent() == Task::NoParent);
    call(hart, Number::Exit, 0);
    TEST_ASSERT(tk.current() == Task::IdleId);
    TEST_ASSERT(hart.timerInterrupt());
    TEST_ASSERT(!tk.kernel().registry().numTasks());
    return SelfTests::TestResult::Success;
}

// fork fails once the registry is full.
SelfTests::TestResult forkRegistryFullTest() {
    Kernel::Config config(testConfig());
    config.maxTasks = 2;
    TestKernel tk(1, config);
    Sim::Hart& hart(tk.hart());
    TEST_ASSERT(call(hart, Number::Fork) == 2);
    TEST_ASSERT(call(hart, Number::Fork) == Errno::Again);
    TEST_ASSERT(tk.current() == 1);
    TEST_ASSERT(tk.kernel().registry().numTasks() == 2);
    return SelfTests::TestResult::Success;
}

// sleep blocks the caller for at least the given number of ticks.
SelfTests::TestResult sleepTest() {
    TestKernel tk(2, testConfig());
    Sim::Hart& hart(tk.hart());
    u64 const start(tk.kernel().timer().ticks());
    call(hart, Number::Sleep, 5);
    TEST_ASSERT(tk.current() == 2);
    TEST_ASSERT(tk.task(1)->state() == Task::State::Blocked);
    TEST_ASSERT(tk.runUntil(1));
    TEST_ASSERT(tk.kernel().timer().ticks() >= start + 5);
    TEST_ASSERT(!hart.reg(Reg::A0));

    // Sleeping for 0 ticks is a yield.
    call(hart, Number::Sleep, 0);
    TEST_ASSERT(tk.current() == 2);
    return SelfTests::TestResult::Success;
}

// The idle task runs while the only task sleeps.
SelfTests::TestResult sleepIdleTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    call(hart, Number::Sleep, 3);
    TEST_ASSERT(tk.current() == Task::IdleId);
    TEST_ASSERT(tk.runUntil(1, 10));
    TEST_ASSERT(hart.mode() == Sim::Mode::User);
    return SelfTests::TestResult::Success;
}

// gettime returns microseconds since reset.
SelfTests::TestResult getTimeTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    i64 const t0(call(hart, Number::GetTime));
    TEST_ASSERT(t0 >= 0);
    TEST_ASSERT(hart.timerInterrupt());
    TEST_ASSERT(hart.timerInterrupt());
    i64 const t1(call(hart, Number::GetTime));
    u64 const period(tk.kernel().config().tickPeriod.microSecs());
    TEST_ASSERT(static_cast<u64>(t1 - t0) >= period);
    return SelfTests::TestResult::Success;
}

// Unknown syscalls fail without harming the caller.
SelfTests::TestResult unknownSyscallTest() {
    TestKernel tk(1, testConfig());
    Sim::Hart& hart(tk.hart());
    TEST_ASSERT(static_cast<i64>(hart.ecall(999)) == Errno::NoSys);
    TEST_ASSERT(static_cast<i64>(hart.ecall(0)) == Errno::NoSys);
    TEST_ASSERT(tk.current() == 1);
    TEST_ASSERT(Util::streq(numberToString(64), "Write"));
    TEST_ASSERT(Util::streq(numberToString(999), "unknown"));
    return SelfTests::TestResult::Success;
}

// Run the syscall tests.
void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, getPidTest);
    RUN_TEST(runner, writeTest);
    RUN_TEST(runner, writeErrorsTest);
    RUN_TEST(runner, partialWriteTest);
    RUN_TEST(runner, yieldTest);
    RUN_TEST(runner, yieldAloneTest);
    RUN_TEST(runner, forkTest);
    RUN_TEST(runner, waitZombieTest);
    RUN_TEST(runner, waitBlockTest);
    RUN_TEST(runner, waitErrorsTest);
    RUN_TEST(runner, orphanTest);
    RUN_TEST(runner, forkRegistryFullTest);
    RUN_TEST(runner, sleepTest);
    RUN_TEST(runner, sleepIdleTest);
    RUN_TEST(runner, getTimeTest);
    RUN_TEST(runner, unknownSyscallTest);
}
}
