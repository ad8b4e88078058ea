// Registry of the tasks of the kernel.
#pragma once
#include <sched/task.hpp>
#include <datastruct/vector.hpp>

namespace Sched {

// The registry is the only owner of the tasks of the kernel, everything else
// refers to tasks by id. A task lives in one of a fixed number of slots from
// its creation until it is reaped. Ids are monotonically increasing and never
// reused. The idle task is not part of the registry.
class Registry {
public:
    // Create an empty registry.
    // @param capacity: The maximum number of tasks, zombies included.
    Registry(u64 const capacity);

    // Reserve a slot and create a task in it.
    // @param create: Called with the new id, returns the task to store.
    // @return: The new task or RegistryFull if all slots are used. Any error
    // from `create` is forwarded.
    template<typename F>
    Res<Ptr<Task>> allocate(F const& create) {
        Res<u64> const slotRes(freeSlot());
        if (!slotRes) {
            return slotRes.error();
        }
        Task::Id const id(m_nextId);
        Res<Ptr<Task>> const createRes(create(id));
        if (!createRes) {
            return createRes.error();
        }
        ASSERT(createRes.value()->id() == id);
        m_nextId++;
        m_slots[*slotRes] = createRes.value();
        m_numTasks++;
        return createRes.value();
    }

    // Get a task from its id.
    // @param id: The id of the task.
    // @return: The task or NotFound.
    Res<Ptr<Task>> lookup(Task::Id const id) const;

    // Remove a Zombie task from the registry, releasing its address space and
    // kernel stack once nothing else refers to it.
    // @param id: The id of the task.
    // @return: NotFound if there is no such task, InvalidState if it is not a
    // Zombie.
    Err reap(Task::Id const id);

    // Call a function on every task in the registry.
    // @param func: Called with a Ptr<Task> const&.
    template<typename F>
    void forEach(F const& func) const {
        for (Ptr<Task> const& task : m_slots) {
            if (!!task) {
                func(task);
            }
        }
    }

    // Check if there is any task that is not a Zombie.
    bool hasLiveTasks() const;

    // Number of tasks in the registry, zombies included.
    u64 numTasks() const;

    // Maximum number of tasks.
    u64 capacity() const;

private:
    // Find an empty slot.
    // @return: The index of the slot or RegistryFull.
    Res<u64> freeSlot() const;

    // Find the slot of a task.
    // @return: The index of the slot or NotFound.
    Res<u64> slotOf(Task::Id const id) const;

    Vector<Ptr<Task>> m_slots;
    u64 m_numTasks;
    Task::Id m_nextId;
};
}
