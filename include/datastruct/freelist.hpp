// Definition of the EmbeddedFreeList class.
#pragma once

#include <util/addr.hpp>
#include <util/result.hpp>

namespace DataStruct {

// An embedded free list is an address-ordered singly linked list of free memory
// regions where the list nodes are stored within the free regions themselves,
// hence the term "embedded". Adjacent regions are merged on insertion.
// The list works with byte granularity, it backs both the physical frame
// allocator (page sized allocations) and the kernel heap.
class EmbeddedFreeList {
public:
    // The minimum size of a region in the free-list, enough to hold a Node.
    static constexpr u64 MinAllocSize = 16;

    // Create an empty EmbeddedFreeList.
    EmbeddedFreeList();

    // Give a region of free memory to the free list. Since Nodes are embedded,
    // this writes at address `startAddr`. The region must not overlap with any
    // region already in the list.
    // @param startAddr: The start address of the region of free memory.
    // @param size: The size of the region of free memory, >= MinAllocSize.
    void insert(VirAddr const startAddr, u64 const size);

    // Allocate memory from the free-list. The allocation is carved from the
    // end of the first region big enough to hold it.
    // @param size: The size of the allocation in bytes.
    // @param align: Required alignment of the allocation, power of two.
    // @return: The address of the allocated memory. Error::OutOfHeapMemory if
    // no region can hold the allocation.
    Res<VirAddr> alloc(u64 const size, u64 const align = 1);

    // Give back memory allocated with alloc().
    // @param addr: The address of the memory region to be freed.
    // @param size: The size of the memory region in bytes, as passed to
    // alloc().
    void free(VirAddr const addr, u64 const size);

    // Get the number of bytes currently in the free-list.
    u64 freeBytes() const;

    // Get the number of disjoint regions in the free-list.
    u64 numRegions() const;

private:
    // A node in the list, describing the free region starting at the address
    // of the Node itself.
    struct Node {
        // The size of the region in bytes.
        u64 size;
        // The next region in address order, nullptr for the last one.
        Node* next;

        VirAddr base() const {
            return this;
        }

        // Address of the first byte after the region.
        VirAddr limit() const {
            return base() + size;
        }
    };
    static_assert(sizeof(Node) <= MinAllocSize);

    // Pointer to the first Node of the free list, nullptr if empty.
    Node* m_head;
    // Sum of the sizes of all regions.
    u64 m_freeBytes;
};
}
