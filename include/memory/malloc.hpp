// Malloc-like heap allocator
#pragma once
#include <util/result.hpp>
#include <util/addr.hpp>

namespace HeapAlloc {

// Initialize the kernel heap with its first region of memory. Must be called
// before the first call to malloc() or free().
// @param start: Start address of the heap's memory.
// @param size: Size of the heap's memory in bytes.
void Init(VirAddr const start, u64 const size);

// Give more memory to the kernel heap.
// @param start: Start address of the region.
// @param size: Size of the region in bytes.
void addMemory(VirAddr const start, u64 const size);

// Allocate memory into the kernel heap.
// @param size: The number of bytes for the allocation.
// @return: On success a void pointer to the allocated memory, otherwise returns
// an error.
Res<void*> malloc(u64 const size);

// Free memory from the heap that was allocated with a call to malloc().
// @param ptr: The pointer to be freed.
void free(void const * const ptr);

// Heap statistics, in bytes.
u64 totalBytes();
u64 usedBytes();
u64 availableBytes();

// Run heap allocation tests.
void Test(SelfTests::TestRunner& runner);

}
