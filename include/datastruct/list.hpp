// Doubly linked-list implementation.
#pragma once

#include <util/assert.hpp>

// Generic doubly linked-list holding values of type T, loosely modeled after
// std::list:
//  - O(1) insertion and removal at both ends of the list.
//  - O(1) removal in the middle of the list through an iterator.
//  - O(1) size, the list keeps a count of its elements.
// popFront() returns the popped value, at the cost of a copy, which is needed
// in most cases anyway.
template<typename T>
class List {
public:
    // Create an empty linked-list. This does not allocate, making it safe to
    // use for global values.
    List() : m_size(0) {}

    // Create a copy of a linked-list.
    // @param other: The linked-list to copy.
    List(List const& other) : List() {
        operator=(other);
    }

    // Empty this linked-list and copy the content of another.
    // @param other: The linked-list to copy.
    List& operator=(List const& other) {
        if (this != &other) {
            clear();
            for (T const& elem : other) {
                pushBack(elem);
            }
        }
        return *this;
    }

    List(List && other) = delete;
    void operator=(List && other) = delete;

    ~List() {
        clear();
    }

    // Get the number of elements contained in this list.
    u64 size() const {
        return m_size;
    }

    // Check if the list is empty.
    bool empty() const {
        return !m_size;
    }

    // Remove all elements from this List.
    void clear() {
        while (!empty()) {
            unlink(m_head.next);
        }
    }

    // Add an element to the back of the list. The new value is
    // copy-constructed.
    // @param value: The value to add.
    void pushBack(T const& value) {
        new Node(m_head.prev, &m_head, value);
        m_size++;
    }

    // Remove the first element from the list and return its value.
    // @return: A _copy_ of the first element from the list.
    T popFront() {
        ASSERT(!empty());
        T const first(m_head.next->value);
        unlink(m_head.next);
        return first;
    }

private:
    struct Node;
public:
    // Iterator over the elements of a List. The template parameter U is either
    // T or T const.
    template<typename U, typename N>
    class Iterator {
    public:
        Iterator(N* const node) : m_node(node) {}
        bool operator==(Iterator const& other) const = default;

        U& operator*() const {
            return m_node->value;
        }

        Iterator& operator++() {
            m_node = m_node->next;
            return *this;
        }

    private:
        // The node currently pointed by the iterator. For end() this is the
        // m_head of the parent list.
        N* m_node;

        friend class List;
    };

    using Iter = Iterator<T, Node>;
    using IterConst = Iterator<T const, Node const>;

    Iter begin() {
        return Iter(m_head.next);
    }

    Iter end() {
        return Iter(&m_head);
    }

    IterConst begin() const {
        return IterConst(m_head.next);
    }

    IterConst end() const {
        return IterConst(&m_head);
    }

    // Remove the element pointed by an iterator.
    // @param ite: Iterator to the element to remove. Must not be end().
    // @return: An iterator to the element following the removed one.
    Iter erase(Iter const& ite) {
        Node* const node(ite.m_node);
        ASSERT(node != &m_head);
        Node* const next(node->next);
        unlink(node);
        return Iter(next);
    }

    // Get a reference to the first value in the list.
    T& front() {
        ASSERT(!empty());
        return m_head.next->value;
    }

    T const& front() const {
        ASSERT(!empty());
        return m_head.next->value;
    }

    // Get a reference to the last value in the list.
    T& back() {
        ASSERT(!empty());
        return m_head.prev->value;
    }

    T const& back() const {
        ASSERT(!empty());
        return m_head.prev->value;
    }

private:
    // A node in the linked-list. The head of the list is a sentinel Node that
    // does not hold a value, hence the union.
    struct Node {
        // Construct the sentinel node, linked to itself.
        Node() : prev(this), next(this), hasValue(false) {}

        // Construct a node and insert it between `prev` and `next`.
        Node(Node* const prev, Node* const next, T const& value) :
            prev(prev), next(next), hasValue(true), value(value) {
            prev->next = this;
            next->prev = this;
        }

        ~Node() {
            prev->next = next;
            next->prev = prev;
            if (hasValue) {
                value.~T();
            }
        }

        Node* prev;
        Node* next;
        // If true `value` holds a constructed T.
        bool hasValue;
        union {
            T value;
        };
    };

    // Unlink and free a value node.
    // @param node: The node to remove, must not be the sentinel.
    void unlink(Node* const node) {
        ASSERT(node->hasValue);
        delete node;
        m_size--;
    }

    Node m_head;
    u64 m_size;
};
