#include <memory/malloc.hpp>
#include <util/assert.hpp>
#include "heapallocator.hpp"
#include <logging/log.hpp>

namespace HeapAlloc {

// The global heap allocator.
static HeapAllocator* HEAP_ALLOCATOR = nullptr;

// Has Init() been called already?
static bool IsInitialized = false;

// Initialize the kernel heap with its first region of memory. Must be called
// before the first call to malloc() or free().
// @param start: Start address of the heap's memory.
// @param size: Size of the heap's memory in bytes.
void Init(VirAddr const start, u64 const size) {
    if (IsInitialized) {
        Log::warn("HeapAlloc::Init() called twice, skipping");
        return;
    }
    Log::info("Initializing kernel heap at {} for {} bytes", start, size);
    static HeapAllocator heapAllocator;
    HEAP_ALLOCATOR = &heapAllocator;
    HEAP_ALLOCATOR->addMemory(start, size);
    IsInitialized = true;
}

// Give more memory to the kernel heap.
// @param start: Start address of the region.
// @param size: Size of the region in bytes.
void addMemory(VirAddr const start, u64 const size) {
    ASSERT(IsInitialized);
    HEAP_ALLOCATOR->addMemory(start, size);
}

// Allocate memory into the kernel heap.
// @param size: The number of bytes for the allocation.
// @return: On success a void pointer to the allocated memory, otherwise returns
// an error.
Res<void*> malloc(u64 const size) {
    ASSERT(IsInitialized);
    return HEAP_ALLOCATOR->alloc(size);
}

// Free memory from the heap that was allocated with a call to malloc().
// @param ptr: The pointer to be freed.
void free(void const * const ptr) {
    ASSERT(IsInitialized);
    HEAP_ALLOCATOR->free(ptr);
}

u64 totalBytes() {
    ASSERT(IsInitialized);
    return HEAP_ALLOCATOR->totalBytes();
}

u64 usedBytes() {
    ASSERT(IsInitialized);
    return HEAP_ALLOCATOR->usedBytes();
}

u64 availableBytes() {
    ASSERT(IsInitialized);
    return HEAP_ALLOCATOR->availableBytes();
}
}
