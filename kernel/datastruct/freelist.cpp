#include <datastruct/freelist.hpp>
#include <util/assert.hpp>

namespace DataStruct {

EmbeddedFreeList::EmbeddedFreeList() : m_head(nullptr), m_freeBytes(0) {}

// Give a region of free memory to the free list. Since Nodes are embedded, this
// writes at address `startAddr`. The region must not overlap with any region
// already in the list.
// @param startAddr: The start address of the region of free memory.
// @param size: The size of the region of free memory, >= MinAllocSize.
void EmbeddedFreeList::insert(VirAddr const startAddr, u64 const size) {
    ASSERT(MinAllocSize <= size);
    VirAddr const limit(startAddr + size);
    // Find the last node before the new region.
    Node* prev(nullptr);
    Node* next(m_head);
    while (!!next && next->base() < startAddr) {
        prev = next;
        next = next->next;
    }
    // Overlapping with a neighbour means a double free.
    ASSERT(!prev || prev->limit() <= startAddr);
    ASSERT(!next || limit <= next->base());
    m_freeBytes += size;

    if (!!prev && prev->limit() == startAddr) {
        // Grow prev, then possibly swallow next.
        prev->size += size;
        if (!!next && prev->limit() == next->base()) {
            prev->size += next->size;
            prev->next = next->next;
        }
        return;
    }
    Node* const node(startAddr.ptr<Node>());
    node->size = size;
    node->next = next;
    if (!!next && limit == next->base()) {
        node->size += next->size;
        node->next = next->next;
    }
    if (!!prev) {
        prev->next = node;
    } else {
        m_head = node;
    }
}

// Allocate memory from the free-list. The allocation is carved from the end of
// the first region big enough to hold it.
// @param size: The size of the allocation in bytes.
// @param align: Required alignment of the allocation, power of two.
// @return: The address of the allocated memory. Error::OutOfHeapMemory if no
// region can hold the allocation.
Res<VirAddr> EmbeddedFreeList::alloc(u64 const size, u64 const align) {
    u64 const allocSize(roundUp(max(MinAllocSize, size), MinAllocSize));
    Node** prevNext(&m_head);
    for (Node* curr(m_head); !!curr; curr = curr->next) {
        if (allocSize <= curr->size) {
            VirAddr const res(
                roundDown((curr->limit() - allocSize).raw(), align));
            // Both what remains before and after the allocation must be either
            // empty or big enough to hold a Node.
            u64 const before(res - curr->base());
            u64 const after(curr->limit() - (res + allocSize));
            bool const fits(res >= curr->base()
                && (!before || MinAllocSize <= before)
                && (!after || MinAllocSize <= after));
            if (fits) {
                Node* const currNext(curr->next);
                if (!before) {
                    *prevNext = currNext;
                } else {
                    curr->size = before;
                }
                m_freeBytes -= allocSize;
                if (!!after) {
                    // Put the tail back, it never merges since its neighbours
                    // are the allocation and the next region.
                    Node* const tail((res + allocSize).ptr<Node>());
                    tail->size = after;
                    tail->next = currNext;
                    if (!!before) {
                        curr->next = tail;
                    } else {
                        *prevNext = tail;
                    }
                }
                return res;
            }
        }
        prevNext = &curr->next;
    }
    return Error::OutOfHeapMemory;
}

// Give back memory allocated with alloc().
// @param addr: The address of the memory region to be freed.
// @param size: The size of the memory region in bytes, as passed to alloc().
void EmbeddedFreeList::free(VirAddr const addr, u64 const size) {
    insert(addr, roundUp(max(MinAllocSize, size), MinAllocSize));
}

u64 EmbeddedFreeList::freeBytes() const {
    return m_freeBytes;
}

u64 EmbeddedFreeList::numRegions() const {
    u64 res(0);
    for (Node const* curr(m_head); !!curr; curr = curr->next) {
        res++;
    }
    return res;
}
}
