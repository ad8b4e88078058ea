// A kernel running on the simulated hart, used by the tests of the trap path
// and of the syscalls.
#pragma once

#include <kernel/kernel.hpp>
#include <sim/hart.hpp>

namespace Sim {

// Create a Kernel on a freshly reset hart, start a number of copies of a small
// test program and resume the first one. The hart is reset again once the
// kernel is destroyed. Only one TestKernel may exist at a time.
class TestKernel {
public:
    // Where the test program is loaded in each task.
    static constexpr u64 LoadAddress = 0x10000;

    // The test program: getpid then exit(0). The hart does not execute it,
    // tests only read it back through the MMU.
    static constexpr u32 Program[] = {
        // li a7, 172
        0x0ac00893,
        // ecall
        0x00000073,
        // li a0, 0
        0x00000513,
        // li a7, 93
        0x05d00893,
        // ecall
        0x00000073,
    };

    // Start a kernel.
    // @param numTasks: The number of tasks to start.
    // @param config: The tunables of the kernel.
    TestKernel(u64 const numTasks, Kernel::Config const& config);
    ~TestKernel();

    TestKernel(TestKernel const&) = delete;
    TestKernel& operator=(TestKernel const&) = delete;

    Kernel& kernel();
    Hart& hart();

    // Get the id of the running task, Task::IdleId when idle.
    Sched::Task::Id current();

    // Look up a task that must exist.
    // @param id: The task.
    // @return: The task.
    Ptr<Sched::Task> task(Sched::Task::Id const id);

    // Take timer interrupts until a task is running.
    // @param id: The task to wait for.
    // @param maxTicks: Give up after that many timer interrupts.
    // @return: true if the task is running, false otherwise.
    bool runUntil(Sched::Task::Id const id, u64 const maxTicks = 1000);

    // Number of free physical frames left.
    u64 numFreeFrames();

private:
    // Reset the hart before the kernel is created and after it is destroyed.
    struct HartReset {
        HartReset();
        ~HartReset();
    };

    HartReset m_hartReset;
    Kernel m_kernel;
};
}
