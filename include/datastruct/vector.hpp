// Definition of the Vector<T> type representing a dynamic size array.
#pragma once

#include <new>
#include <memory/malloc.hpp>

// A dynamic array in the spirit of std::vector:
//  - O(1) random access.
//  - Amortized O(1) insertion and removal at the end of the vector.
//  - Removal in the middle linear in the distance to the end.
// Only the operations the kernel needs are implemented. All accessors assert
// that their index is within the size of the vector.
// The storage comes from the kernel heap, an allocation failure is fatal.
template<typename T>
class Vector final {
public:
    // Create an empty vector. No dynamic allocation takes place until the first
    // element is inserted.
    explicit Vector() : m_array(nullptr), m_size(0), m_capacity(0) {}

    // Create a vector of `size` default constructed elements.
    // @param size: The starting size of the vector.
    explicit Vector(u64 const size) : Vector() {
        growArray(size);
        for (u64 i(0); i < size; ++i) {
            new (m_array + i) T();
        }
        m_size = size;
    }

    // Create a copy of a vector.
    // @param other: The vector to copy.
    Vector(Vector const& other) : Vector() {
        operator=(other);
    }

    // Destroy the vector and all its elements.
    ~Vector() {
        clear();
        if (!!m_array) {
            HeapAlloc::free(m_array);
        }
    }

    // Replace the content of this vector with a copy of another.
    // @param other: The vector to copy the content from.
    Vector& operator=(Vector const& other) {
        if (this != &other) {
            clear();
            for (T const& elem : other) {
                pushBack(elem);
            }
        }
        return *this;
    }

    T const& operator[](u64 const index) const {
        ASSERT(index < m_size);
        return m_array[index];
    }

    T& operator[](u64 const index) {
        ASSERT(index < m_size);
        return m_array[index];
    }

    // Return the size of the vector.
    // @return: The number of elements in the vector.
    u64 size() const {
        return m_size;
    }

    bool empty() const {
        return !m_size;
    }

    // Get the number of elements the vector can hold before reallocating.
    u64 capacity() const {
        return m_capacity;
    }

    // Destroy all elements of the vector. The capacity is unchanged.
    void clear() {
        while (m_size) {
            popBack();
        }
    }

    // Raw pointer iteration.
    T* begin() { return m_array; }
    T* end() { return m_array + m_size; }
    T const* begin() const { return m_array; }
    T const* end() const { return m_array + m_size; }

    // Append a copy of a value at the end of the vector, growing the
    // underlying array if needed.
    // @param value: The value to insert.
    void pushBack(T const& value) {
        if (m_size == m_capacity) {
            growArray(!!m_capacity ? m_capacity * 2 : 8);
        }
        new (m_array + m_size) T(value);
        m_size++;
    }

    // Remove the last element from the vector.
    void popBack() {
        ASSERT(!!m_size);
        m_array[m_size-1].~T();
        m_size--;
    }

    // Remove the element at the given index. Elements after it are shifted to
    // the left using the assignment operator.
    // @param index: The index of the element to remove from the vector.
    void erase(u64 const index) {
        ASSERT(index < m_size);
        for (u64 i(index); i + 1 < m_size; ++i) {
            m_array[i] = m_array[i+1];
        }
        popBack();
    }

private:
    // The underlying array holding the elements.
    T* m_array;
    // Number of live elements, always <= m_capacity.
    u64 m_size;
    // Number of elements m_array can hold.
    u64 m_capacity;

    // Move the elements to a new array of the given capacity.
    // @param newCapacity: The new capacity, must be >= the current capacity.
    void growArray(u64 const newCapacity) {
        ASSERT(newCapacity >= m_capacity);
        if (!newCapacity) {
            return;
        }
        Res<void*> const allocRes(HeapAlloc::malloc(newCapacity * sizeof(T)));
        if (!allocRes) {
            PANIC("Vector: cannot grow to {} elements: {}", newCapacity,
                  allocRes.error());
        }
        T* const newArray(reinterpret_cast<T*>(allocRes.value()));
        for (u64 i(0); i < m_size; ++i) {
            new (newArray + i) T(m_array[i]);
            m_array[i].~T();
        }
        if (!!m_array) {
            HeapAlloc::free(m_array);
        }
        m_array = newArray;
        m_capacity = newCapacity;
    }
};
