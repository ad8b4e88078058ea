// Round-robin scheduler.
#pragma once
#include <sched/task.hpp>
#include <sched/registry.hpp>
#include <datastruct/queue.hpp>

namespace Sched {

// Round-robin scheduler with a fixed time slice and a single FIFO ready queue.
// The scheduler owns the ready queue and the idle task, the tasks themselves
// are owned by the Registry. All methods must be called with interrupts
// disabled.
class Scheduler {
public:
    // Create a scheduler. The idle task is the current task until the first
    // call to reschedule().
    // @param registry: The registry of the tasks to schedule.
    // @param idle: The idle task, running when no task is Ready.
    // @param timeSliceTicks: Length of a time slice in timer ticks.
    Scheduler(Registry& registry,
              Ptr<Task> const& idle,
              u64 const timeSliceTicks);

    // Append a Ready task to the tail of the ready queue.
    // @param id: The task to enqueue.
    void enqueue(Task::Id const id);

    // Pick the next task to run. If the current task is still Running it
    // becomes Ready and is appended to the ready queue. The head of the queue
    // becomes Running, its address space is activated and its slice refilled.
    // The idle task runs when the queue is empty.
    // @return: The context to resume.
    TrapFrame* reschedule();

    // Block the running task. It stays off the ready queue until it is woken.
    // @param id: The task to block, must be Running.
    // @param reason: Why the task blocks.
    void block(Task::Id const id, Task::BlockReason const& reason);

    // Wake a Blocked task, it becomes Ready and is enqueued.
    // @param id: The task to wake.
    void wake(Task::Id const id);

    // Make a task a Zombie with the given exit status and remove it from the
    // ready queue. The living children of the task lose their parent, its
    // zombie children are reaped. If the parent waits on the task, the parent
    // gets the status as the result of its wait and the task is reaped.
    // @param id: The task exiting.
    // @param status: The exit status.
    void exit(Task::Id const id, i64 const status);

    // Wake the tasks sleeping until a tick that has been reached.
    // @param tick: The current tick.
    void wakeSleepers(u64 const tick);

    // Account a timer tick to the current task.
    // @return: true if the time slice of the current task is exhausted.
    bool tick();

    // Get the task currently running.
    Ptr<Task> const& current() const;

    // Get the idle task.
    Ptr<Task> const& idle() const;

    // Check if the current task is the idle task.
    bool isIdle() const;

    // Number of tasks in the ready queue.
    u64 numReady() const;

    // Check if a task is in the ready queue.
    bool isQueued(Task::Id const id) const;

    // Length of a time slice in ticks.
    u64 timeSliceTicks() const;

private:
    // Get a task of the registry, PANIC if there is no such task.
    Ptr<Task> taskOf(Task::Id const id) const;

    Registry& m_registry;
    Ptr<Task> m_idle;
    // The task running on the hart.
    Ptr<Task> m_current;
    // The last task that exited while running. The trap path still runs on
    // its kernel stack until the next task is resumed, it is released on the
    // next reschedule.
    Ptr<Task> m_retired;
    Queue<Task::Id> m_readyQueue;
    u64 const m_timeSliceTicks;
};
}
