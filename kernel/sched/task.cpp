// Task representation and manipulation.
#include <sched/task.hpp>
#include <cpu/cpu.hpp>
#include <util/cstring.hpp>
#include <util/panic.hpp>

namespace Sched {

Task::BlockReason Task::BlockReason::None() {
    return BlockReason{Kind::None, 0, 0};
}

Task::BlockReason Task::BlockReason::Wait(i64 const pid) {
    return BlockReason{Kind::Wait, pid, 0};
}

Task::BlockReason Task::BlockReason::Sleep(u64 const untilTick) {
    return BlockReason{Kind::Sleep, 0, untilTick};
}

// Allocate the kernel stack and create a task.
// @param id: The unique identifier of the task.
// @param parent: The id of the parent task.
// @param addrSpace: The address space of the task.
// @return: A pointer to the Task instance or an error, if any.
Res<Ptr<Task>> Task::New(Id const id,
                         Id const parent,
                         Ptr<Paging::AddrSpace> const& addrSpace) {
    Res<Ptr<Memory::Stack>> const stackAllocRes(Memory::Stack::New());
    if (!stackAllocRes) {
        return stackAllocRes.error();
    }
    Ptr<Memory::Stack> const kernelStack(stackAllocRes.value());

    Ptr<Task> const task(Ptr<Task>::New(id, parent, addrSpace, kernelStack));
    if (!task) {
        return Error::OutOfHeapMemory;
    } else {
        return task;
    }
}

// Create a task starting in U-mode. The task is created Ready.
Res<Ptr<Task>> Task::NewUser(Id const id,
                             Id const parent,
                             Ptr<Paging::AddrSpace> const& addrSpace,
                             VirAddr const entry,
                             VirAddr const stackTop) {
    Res<Ptr<Task>> const taskAllocRes(New(id, parent, addrSpace));
    if (!taskAllocRes) {
        return taskAllocRes.error();
    }
    Ptr<Task> const task(taskAllocRes.value());
    task->m_frame.sepc = entry.raw();
    task->m_frame.x[Reg::Sp] = stackTop.raw();
    // sret to U-mode with interrupts enabled.
    task->m_frame.sstatus = Cpu::Sstatus::SPIE;
    return task;
}

// Create the idle task.
Res<Ptr<Task>> Task::NewIdle(Ptr<Paging::AddrSpace> const& addrSpace) {
    Res<Ptr<Task>> const taskAllocRes(New(IdleId, NoParent, addrSpace));
    if (!taskAllocRes) {
        return taskAllocRes.error();
    }
    Ptr<Task> const task(taskAllocRes.value());
    task->m_frame.sepc = Cpu::idleEntry();
    task->m_frame.x[Reg::Sp] = task->m_frame.kernelSp;
    // sret to S-mode with interrupts enabled.
    task->m_frame.sstatus = Cpu::Sstatus::SPP | Cpu::Sstatus::SPIE;
    return task;
}

// Create a copy of a task for fork.
Res<Ptr<Task>> Task::fork(Id const id,
                          Ptr<Paging::AddrSpace> const& addrSpace) const {
    Res<Ptr<Task>> const taskAllocRes(New(id, m_id, addrSpace));
    if (!taskAllocRes) {
        return taskAllocRes.error();
    }
    Ptr<Task> const task(taskAllocRes.value());
    // Everything but the kernel stack comes from the parent.
    u64 const kernelSp(task->m_frame.kernelSp);
    Util::memcpy(&task->m_frame, &m_frame, sizeof(m_frame));
    task->m_frame.kernelSp = kernelSp;
    return task;
}

// Get the unique identifier associated with this task.
Task::Id Task::id() const {
    return m_id;
}

// Get the current state of the task.
Task::State Task::state() const {
    return m_state;
}

// Set the current state of the task.
void Task::setState(State const& newState) {
    bool const isValidTransition(
        (m_state == State::Ready && newState == State::Running)
        || (m_state == State::Running && newState == State::Ready)
        || (m_state == State::Running && newState == State::Blocked)
        || (m_state == State::Blocked && newState == State::Ready)
        || (m_state != State::Zombie && newState == State::Zombie));
    if (!isValidTransition) {
        PANIC("Invalid state transition for task {}: {} -> {}", m_id,
              stateToString(m_state), stateToString(newState));
    }
    m_state = newState;
}

bool Task::isIdle() const {
    return m_id == IdleId;
}

TrapFrame& Task::frame() {
    return m_frame;
}

TrapFrame const& Task::frame() const {
    return m_frame;
}

Ptr<Paging::AddrSpace> const& Task::addrSpace() const {
    return m_addrSpace;
}

Task::Id Task::parent() const {
    return m_parent;
}

void Task::setParent(Id const parent) {
    m_parent = parent;
}

i64 Task::exitStatus() const {
    ASSERT(m_state == State::Zombie);
    return m_exitStatus;
}

void Task::setExitStatus(i64 const status) {
    m_exitStatus = status;
}

Task::BlockReason const& Task::blockReason() const {
    return m_blockReason;
}

void Task::setBlockReason(BlockReason const& reason) {
    m_blockReason = reason;
}

// Refill the time slice of the task.
// @param ticks: Length of the slice.
void Task::refillSlice(u64 const ticks) {
    m_sliceLeft = ticks;
}

// Account one timer tick to the task.
// @return: true if the slice is exhausted, false otherwise.
bool Task::consumeTick() {
    if (!!m_sliceLeft) {
        m_sliceLeft--;
    }
    return !m_sliceLeft;
}

u64 Task::sliceLeft() const {
    return m_sliceLeft;
}

bool Task::kernelStackIntact() const {
    return m_kernelStack->isIntact();
}

// Create a task. The task starts in the Ready state with a zeroed context.
Task::Task(Id const id,
           Id const parent,
           Ptr<Paging::AddrSpace> const& addrSpace,
           Ptr<Memory::Stack> const& kernelStack) :
    m_id(id),
    m_state(State::Ready),
    m_frame(),
    m_addrSpace(addrSpace),
    m_kernelStack(kernelStack),
    m_parent(parent),
    m_exitStatus(0),
    m_blockReason(BlockReason::None()),
    m_sliceLeft(0) {
    m_frame.kernelSp = kernelStack->highAddress().raw();
}

// Get the name of a state, for logging.
char const* stateToString(Task::State const state) {
    switch (state) {
        case Task::State::Ready:
            return "Ready";
        case Task::State::Running:
            return "Running";
        case Task::State::Blocked:
            return "Blocked";
        case Task::State::Zombie:
            return "Zombie";
    }
    UNREACHABLE
}
}
