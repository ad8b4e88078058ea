// The kernel object, owning all of the kernel's state.
#pragma once

#include <kernel/bootinfo.hpp>
#include <framealloc/framealloc.hpp>
#include <paging/addrspace.hpp>
#include <sched/registry.hpp>
#include <sched/scheduler.hpp>
#include <timers/timers.hpp>
#include <trap/trapframe.hpp>
#include <util/result.hpp>
#include <selftests/selftests.hpp>

// The kernel. There is a single instance, created at boot after the heap and
// paging are initialized. The trap path reaches it through instance() at the
// extern "C" boundary only, everything else gets a reference.
class Kernel {
public:
    // Tunables of the kernel.
    struct Config {
        // Time between two timer interrupts.
        Timer::Duration tickPeriod = Timer::Duration::MilliSecs(10);
        // Length of a time slice in ticks.
        u64 timeSliceTicks = 5;
        // Maximum number of tasks, zombies included.
        u64 maxTasks = 64;
        // Size of the stack of the tasks started at boot.
        u64 userStackPages = 4;
        // If true the user stacks are only backed when touched.
        bool lazyUserStack = true;
        // Print debug level messages.
        bool debugLogs = false;
        // Frequency of the time counter, 10MHz on QEMU virt.
        u64 timerFrequencyHz = 10000000;
        // Power off once all tasks have exited and been reaped.
        bool shutdownWhenDone = false;
    };

    // Exit statuses of tasks killed by a fault.
    static constexpr i64 PageFaultStatus = -139;
    static constexpr i64 IllegalInstructionStatus = -132;
    static constexpr i64 OtherExceptionStatus = -134;

    // The user stack of the tasks started at boot ends at the top of the user
    // range.
    static constexpr u64 UserStackTop = Paging::USER_SPACE_END;

    // Create the kernel: frame allocator over the free memory, kernel address
    // space, idle task and a task per boot image. PANICs if any of this fails.
    // @param bootInfo: The information from the boot code.
    // @param config: The tunables.
    Kernel(BootInfo const& bootInfo, Config const& config);

    // Only ever called on the simulated machine, where kernels are created by
    // tests.
    ~Kernel();

    Kernel(Kernel const&) = delete;
    Kernel& operator=(Kernel const&) = delete;

    // Get the kernel instance. PANICs if there is none.
    static Kernel& instance();

    // Create a task from an image and make it Ready.
    // @param image: The image to load.
    // @return: The id of the new task, InvalidArgument for a malformed image,
    // or any error from the allocators or the registry.
    Res<Sched::Task::Id> spawn(BootInfo::TaskImage const& image);

    // Start the timer and resume the first task. Does not return on hardware,
    // on the simulated hart it returns once the context is loaded.
    void run();

    // Handle a trap. Called with interrupts disabled, the context of the
    // current task saved in its frame.
    // @param frame: The frame of the current task.
    // @param scause: The value of scause.
    // @param stval: The value of stval.
    // @return: The frame to resume.
    TrapFrame* handleTrap(TrapFrame * const frame,
                          u64 const scause,
                          u64 const stval);

    // Reap a Zombie task.
    // @param id: The task.
    // @return: Any error from Registry::reap.
    Err reap(Sched::Task::Id const id);

    // Reap the zombies that no task can wait for anymore.
    // @return: The number of tasks reaped.
    u64 reapOrphans();

    // Ask for a reschedule at the end of the current trap.
    void requestReschedule();

    Config const& config() const;
    FrameAlloc::Allocator& frameAllocator();
    Ptr<Paging::AddrSpace> const& kernelSpace() const;
    Sched::Registry& registry();
    Sched::Scheduler& scheduler();
    Timer::TickTimer& timer();

private:
    // Make the current task a Zombie after a fault.
    // @param status: The exit status.
    // @param what: Description of the fault, for logging.
    void killCurrent(i64 const status, char const * const what);

    // Timer interrupt handling.
    void handleTick();

    Config const m_config;
    FrameAlloc::FreeListAllocator m_frameAllocator;
    // Address space with the kernel window only, used by the idle task.
    Ptr<Paging::AddrSpace> m_kernelSpace;
    Sched::Registry m_registry;
    Sched::Scheduler m_scheduler;
    Timer::TickTimer m_timer;
    bool m_needReschedule;
};

namespace KernelTests {
// Run the tests of the trap path.
void Test(SelfTests::TestRunner& runner);
}
