// Task representation and manipulation.
#pragma once
#include <util/ints.hpp>
#include <util/addr.hpp>
#include <util/ptr.hpp>
#include <util/result.hpp>
#include <memory/stack.hpp>
#include <paging/addrspace.hpp>
#include <trap/trapframe.hpp>
#include <selftests/selftests.hpp>

namespace Sched {

// Run the scheduling tests.
void Test(SelfTests::TestRunner& runner);

// A task in the kernel, the unit of scheduling. A task owns its address space,
// its kernel stack and its saved context.
class Task {
public:
    // Type for tasks' unique identifiers.
    using Id = u64;

    // Id of the idle task. No other task ever gets this id, hence it is also
    // used as the parent of the tasks that do not have one.
    static constexpr Id IdleId = 0;
    static constexpr Id NoParent = IdleId;

    // The state of a task.
    enum class State {
        // The task is ready to be run and waiting in the ready queue.
        Ready,
        // The task is currently running on the hart.
        Running,
        // The task is not runnable, waiting for a child or for some time to
        // pass.
        Blocked,
        // The task exited. Its resources are retained until it is reaped.
        Zombie,
    };

    // Why a task is blocked.
    struct BlockReason {
        enum class Kind {
            None,
            // Waiting for a child to exit.
            Wait,
            // Waiting for a tick.
            Sleep,
        };
        Kind kind;
        // For Wait: the child waited for, AnyChild for any.
        i64 pid;
        // For Sleep: the tick at which the task wakes up.
        u64 untilTick;

        static constexpr i64 AnyChild = -1;

        static BlockReason None();
        static BlockReason Wait(i64 const pid);
        static BlockReason Sleep(u64 const untilTick);
    };

    // Create a task starting in U-mode. The task is created Ready.
    // @param id: The unique identifier of the task.
    // @param parent: The id of the parent task.
    // @param addrSpace: The address space of the task.
    // @param entry: Address of the first instruction.
    // @param stackTop: Initial value of the stack pointer.
    // @return: A pointer to the Task instance or an error, if any.
    static Res<Ptr<Task>> NewUser(Id const id,
                                  Id const parent,
                                  Ptr<Paging::AddrSpace> const& addrSpace,
                                  VirAddr const entry,
                                  VirAddr const stackTop);

    // Create the idle task. It runs in S-mode with interrupts enabled,
    // starting at Cpu::idleEntry().
    // @param addrSpace: The kernel address space.
    // @return: A pointer to the Task instance or an error, if any.
    static Res<Ptr<Task>> NewIdle(Ptr<Paging::AddrSpace> const& addrSpace);

    // Create a copy of a task for fork. The copy gets its own kernel stack, a
    // copy of the saved context and the given address space.
    // @param id: The unique identifier of the copy.
    // @param addrSpace: The address space of the copy.
    // @return: A pointer to the Task instance or an error, if any.
    Res<Ptr<Task>> fork(Id const id,
                        Ptr<Paging::AddrSpace> const& addrSpace) const;

    // Get the unique identifier associated with this task.
    Id id() const;

    // Get the current state of the task.
    State state() const;

    // Set the current state of the task. Only the following transitions are
    // allowed:
    //   - Ready -> Running: The task has been picked by the scheduler.
    //   - Running -> Ready: The task has been preempted or yielded.
    //   - Running -> Blocked: The task waits for an event.
    //   - Blocked -> Ready: The event the task was waiting for happened.
    //   - Ready, Running or Blocked -> Zombie: The task exited.
    // Any other transition is disallowed and raises a PANIC as it is most
    // likely due to a bug.
    // @param newState: The state to put the task in.
    void setState(State const& newState);

    // Check if the task is the idle task.
    bool isIdle() const;

    // Get the saved context of the task.
    TrapFrame& frame();
    TrapFrame const& frame() const;

    // Get the address space of the task.
    Ptr<Paging::AddrSpace> const& addrSpace() const;

    // Parent of the task, NoParent if it does not have one.
    Id parent() const;
    void setParent(Id const parent);

    // Exit status of a Zombie task.
    i64 exitStatus() const;
    void setExitStatus(i64 const status);

    // Reason of a Blocked task, Kind::None otherwise.
    BlockReason const& blockReason() const;
    void setBlockReason(BlockReason const& reason);

    // Refill the time slice of the task.
    // @param ticks: Length of the slice.
    void refillSlice(u64 const ticks);

    // Account one timer tick to the task.
    // @return: true if the slice is exhausted, false otherwise.
    bool consumeTick();

    // Number of ticks left in the current time slice.
    u64 sliceLeft() const;

    // Check that the kernel stack of the task did not overflow.
    bool kernelStackIntact() const;

private:
    // Create a task. The task starts in the Ready state with a zeroed context.
    // @param id: The unique identifier of the task.
    // @param parent: The id of the parent task.
    // @param addrSpace: The address space of the task.
    // @param kernelStack: The kernel stack to be used by this task.
    Task(Id const id,
         Id const parent,
         Ptr<Paging::AddrSpace> const& addrSpace,
         Ptr<Memory::Stack> const& kernelStack);

    // Allocate the kernel stack and create a task.
    static Res<Ptr<Task>> New(Id const id,
                              Id const parent,
                              Ptr<Paging::AddrSpace> const& addrSpace);

    // Needed to invoke the constructor.
    friend Ptr<Task>;

    // The unique identifier of this task.
    Id m_id;
    // Current state of the task.
    State m_state;
    // Saved context.
    TrapFrame m_frame;
    // The address space of this task.
    Ptr<Paging::AddrSpace> m_addrSpace;
    // The kernel stack used by the task when it traps.
    Ptr<Memory::Stack> m_kernelStack;
    Id m_parent;
    i64 m_exitStatus;
    BlockReason m_blockReason;
    u64 m_sliceLeft;
};

// Get the name of a state, for logging.
char const* stateToString(Task::State const state);
}
