// Round-robin scheduler.
#include <sched/scheduler.hpp>
#include <cpu/cpu.hpp>
#include <logging/log.hpp>
#include <util/panic.hpp>

namespace Sched {

// Create a scheduler.
Scheduler::Scheduler(Registry& registry,
                     Ptr<Task> const& idle,
                     u64 const timeSliceTicks) :
    m_registry(registry),
    m_idle(idle),
    m_current(idle),
    m_retired(),
    m_readyQueue(),
    m_timeSliceTicks(timeSliceTicks) {
    ASSERT(m_idle->isIdle());
    ASSERT(!!m_timeSliceTicks);
    // The boot context is accounted as the idle task until the first
    // reschedule.
    m_idle->setState(Task::State::Running);
}

// Append a Ready task to the tail of the ready queue.
void Scheduler::enqueue(Task::Id const id) {
    Ptr<Task> const task(taskOf(id));
    ASSERT(task->state() == Task::State::Ready);
    ASSERT(!m_readyQueue.contains(id));
    m_readyQueue.enqueue(id);
}

// Pick the next task to run.
TrapFrame* Scheduler::reschedule() {
    ASSERT(!Cpu::interruptsEnabled());
    // The trap path is running on the stack of the current task, the task
    // retired by the last reschedule can go.
    m_retired.clear();

    Ptr<Task> const prev(m_current);
    if (!prev->kernelStackIntact()) {
        PANIC("Kernel stack overflow in task {}", prev->id());
    }
    if (prev->state() == Task::State::Running) {
        prev->setState(Task::State::Ready);
        if (!prev->isIdle()) {
            m_readyQueue.enqueue(prev->id());
        }
    } else if (prev->state() == Task::State::Zombie) {
        m_retired = prev;
    }

    Ptr<Task> next(m_idle);
    if (!m_readyQueue.empty()) {
        next = taskOf(m_readyQueue.dequeue());
    }
    next->setState(Task::State::Running);
    next->addrSpace()->activate();
    next->refillSlice(m_timeSliceTicks);
    if (next.raw() != prev.raw()) {
        Log::debug("Switching from task {} to task {}", prev->id(),
                   next->id());
    }
    m_current = next;
    return &next->frame();
}

// Block the running task.
void Scheduler::block(Task::Id const id, Task::BlockReason const& reason) {
    Ptr<Task> const task(taskOf(id));
    ASSERT(task->state() == Task::State::Running);
    ASSERT(reason.kind != Task::BlockReason::Kind::None);
    task->setState(Task::State::Blocked);
    task->setBlockReason(reason);
}

// Wake a Blocked task.
void Scheduler::wake(Task::Id const id) {
    Ptr<Task> const task(taskOf(id));
    ASSERT(task->state() == Task::State::Blocked);
    task->setState(Task::State::Ready);
    task->setBlockReason(Task::BlockReason::None());
    m_readyQueue.enqueue(id);
}

// Make a task a Zombie with the given exit status.
void Scheduler::exit(Task::Id const id, i64 const status) {
    Ptr<Task> const task(taskOf(id));
    m_readyQueue.remove(id);
    task->setState(Task::State::Zombie);
    task->setExitStatus(status);
    task->setBlockReason(Task::BlockReason::None());
    Log::debug("Task {} exited with status {}", id, status);
    if (task->addrSpace()->isActive()) {
        // The address space must not be active when it is destroyed.
        m_idle->addrSpace()->activate();
    }

    // Orphans. The living children lose their parent, nobody can wait on the
    // zombie ones anymore.
    Vector<Task::Id> zombies;
    m_registry.forEach([&](Ptr<Task> const& child) {
        if (child->parent() != id) {
            return;
        }
        child->setParent(Task::NoParent);
        if (child->state() == Task::State::Zombie) {
            zombies.pushBack(child->id());
        }
    });
    for (Task::Id const zombie : zombies) {
        Err const err(m_registry.reap(zombie));
        ASSERT(!err);
    }

    if (task->parent() == Task::NoParent) {
        return;
    }
    Ptr<Task> const parent(taskOf(task->parent()));
    Task::BlockReason const& reason(parent->blockReason());
    bool const isWaiting(parent->state() == Task::State::Blocked
        && reason.kind == Task::BlockReason::Kind::Wait
        && (reason.pid == Task::BlockReason::AnyChild
            || reason.pid == static_cast<i64>(id)));
    if (isWaiting) {
        parent->frame().x[Reg::A0] = static_cast<u64>(status);
        Err const err(m_registry.reap(id));
        ASSERT(!err);
        wake(parent->id());
    }
}

// Wake the tasks sleeping until a tick that has been reached.
void Scheduler::wakeSleepers(u64 const tick) {
    m_registry.forEach([&](Ptr<Task> const& task) {
        Task::BlockReason const& reason(task->blockReason());
        if (task->state() == Task::State::Blocked
            && reason.kind == Task::BlockReason::Kind::Sleep
            && reason.untilTick <= tick) {
            wake(task->id());
        }
    });
}

// Account a timer tick to the current task.
bool Scheduler::tick() {
    if (isIdle()) {
        return false;
    }
    return m_current->consumeTick();
}

Ptr<Task> const& Scheduler::current() const {
    return m_current;
}

Ptr<Task> const& Scheduler::idle() const {
    return m_idle;
}

bool Scheduler::isIdle() const {
    return m_current->isIdle();
}

u64 Scheduler::numReady() const {
    return m_readyQueue.size();
}

bool Scheduler::isQueued(Task::Id const id) const {
    return m_readyQueue.contains(id);
}

u64 Scheduler::timeSliceTicks() const {
    return m_timeSliceTicks;
}

// Get a task of the registry, PANIC if there is no such task.
Ptr<Task> Scheduler::taskOf(Task::Id const id) const {
    Res<Ptr<Task>> const res(m_registry.lookup(id));
    if (!res) {
        PANIC("No task with id {}", id);
    }
    return res.value();
}
}
