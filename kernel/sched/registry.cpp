// Registry of the tasks of the kernel.
#include <sched/registry.hpp>
#include <logging/log.hpp>

namespace Sched {

// Create an empty registry.
// @param capacity: The maximum number of tasks, zombies included.
Registry::Registry(u64 const capacity) :
    m_slots(capacity), m_numTasks(0), m_nextId(Task::IdleId + 1) {
    ASSERT(!!capacity);
}

// Get a task from its id.
Res<Ptr<Task>> Registry::lookup(Task::Id const id) const {
    Res<u64> const slotRes(slotOf(id));
    if (!slotRes) {
        return slotRes.error();
    }
    return m_slots[*slotRes];
}

// Remove a Zombie task from the registry.
Err Registry::reap(Task::Id const id) {
    Res<u64> const slotRes(slotOf(id));
    if (!slotRes) {
        return slotRes.error();
    }
    Ptr<Task>& slot(m_slots[*slotRes]);
    if (slot->state() != Task::State::Zombie) {
        return Error::InvalidState;
    }
    Log::debug("Reaping task {}", id);
    slot.clear();
    m_numTasks--;
    return Ok;
}

// Check if there is any task that is not a Zombie.
bool Registry::hasLiveTasks() const {
    for (Ptr<Task> const& task : m_slots) {
        if (!!task && task->state() != Task::State::Zombie) {
            return true;
        }
    }
    return false;
}

u64 Registry::numTasks() const {
    return m_numTasks;
}

u64 Registry::capacity() const {
    return m_slots.size();
}

// Find an empty slot.
Res<u64> Registry::freeSlot() const {
    for (u64 i(0); i < m_slots.size(); ++i) {
        if (!m_slots[i]) {
            return i;
        }
    }
    return Error::RegistryFull;
}

// Find the slot of a task.
Res<u64> Registry::slotOf(Task::Id const id) const {
    for (u64 i(0); i < m_slots.size(); ++i) {
        if (!!m_slots[i] && m_slots[i]->id() == id) {
            return i;
        }
    }
    return Error::NotFound;
}
}
