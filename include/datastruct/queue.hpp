// Implementation of Queue<T>.
#pragma once

#include <datastruct/list.hpp>

// Generic queue/FIFO data structure holding values of type T. Provides O(1)
// enqueue and dequeue operations.
template<typename T>
class Queue {
public:
    // Construct a default, empty queue. This is guaranteed not to allocate
    // memory in the heap, making it safe to use for global values.
    Queue() = default;

    // Enqueue a value at the tail of the queue. This creates a copy of this
    // value in the queue.
    // @param value: The value to enqueue.
    void enqueue(T const& value) {
        m_list.pushBack(value);
    }

    // Dequeue the value at the head of the queue and return it.
    // @return: A copy of the value.
    T dequeue() {
        return m_list.popFront();
    }

    // Get a reference to the value at the head of the queue, without
    // dequeuing it.
    T const& front() const {
        return m_list.front();
    }

    // Get a reference to the value at the tail of the queue.
    T const& back() const {
        return m_list.back();
    }

    // Remove the first occurrence of a value from the queue, wherever it is.
    // The relative order of the other elements is unchanged.
    // @param value: The value to remove.
    // @return: true if the value was found and removed, false otherwise.
    bool remove(T const& value) {
        for (auto ite(m_list.begin()); ite != m_list.end(); ++ite) {
            if (*ite == value) {
                m_list.erase(ite);
                return true;
            }
        }
        return false;
    }

    // Check if a value is currently enqueued.
    // @param value: The value to look for.
    bool contains(T const& value) const {
        for (T const& elem : m_list) {
            if (elem == value) {
                return true;
            }
        }
        return false;
    }

    // Get the number of elements currently enqueued.
    u64 size() const {
        return m_list.size();
    }

    bool empty() const {
        return m_list.empty();
    }

    // Iterate the queue from head to tail.
    auto begin() const { return m_list.begin(); }
    auto end() const { return m_list.end(); }

private:
    // The underlying linked list holding the enqueued objects.
    List<T> m_list;
};
