// Definition of a heap allocator using an underlying EmbeddedFreeList.
#pragma once

#include <datastruct/freelist.hpp>

namespace HeapAlloc {

// A heap allocator over memory regions handed to it with addMemory(). Freed
// blocks are merged with their free neighbours.
class HeapAllocator {
public:
    // Instantiate an empty heap allocator.
    HeapAllocator();

    // Give a region of memory to the heap.
    // @param start: The start address of the region.
    // @param size: The size of the region in bytes.
    void addMemory(VirAddr const start, u64 const size);

    // Allocate memory from this heap. The returned memory is 16-byte aligned.
    // @param size: The size of the allocation in bytes.
    // @return: If the allocation is successful returns a void* to the allocated
    // memory. Otherwise returns Error::OutOfHeapMemory.
    Res<void*> alloc(u64 const size);

    // Free memory from this heap. PANICs on a double free or if the pointer
    // does not come from this heap.
    // @param ptr: void* to the memory that should be freed. This pointer should
    // come from a call to alloc() on this same HeapAllocator.
    void free(void const * const ptr);

    // Statistics, in bytes. Used bytes include the per-allocation metadata.
    u64 totalBytes() const;
    u64 usedBytes() const;
    u64 availableBytes() const;

private:
    // Each allocation of N bytes on the heap is preceeded by a Metadata block
    // which contains information about the allocation itself. Therefore
    // allocating N bytes is, in reality, allocating N + sizeof(Metadata) bytes.
    struct Metadata {
        // The size, in bytes, of the allocation immediately following this
        // Metadata block, not counting the Metadata itself.
        u64 size;

        // Magic number used to compute the per-allocation token.
        static const u64 MagicNumber = 0x5256363453763339;

        // XOR of MagicNumber and the address of the allocation. free() checks
        // it to detect, with decent probability, foreign pointers and double
        // frees. It is cleared when the allocation is freed.
        u64 token;
    };
    static_assert(sizeof(Metadata) == DataStruct::EmbeddedFreeList::MinAllocSize);

    // Total number of bytes given to the heap.
    u64 m_totalBytes;

    // The freelist of the heap.
    DataStruct::EmbeddedFreeList m_freeList;

    friend SelfTests::TestResult heapAllocatorAllocFreeTest();
};
}
