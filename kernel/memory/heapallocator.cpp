#include "heapallocator.hpp"
#include <util/panic.hpp>

namespace HeapAlloc {

HeapAllocator::HeapAllocator() : m_totalBytes(0) {}

// Give a region of memory to the heap. The region is trimmed to a 16-byte
// alignment.
// @param start: The start address of the region.
// @param size: The size of the region in bytes.
void HeapAllocator::addMemory(VirAddr const start, u64 const size) {
    u64 const align(sizeof(Metadata));
    u64 const alignedStart(roundUp(start.raw(), align));
    u64 const alignedEnd(roundDown(start.raw() + size, align));
    if (alignedEnd <= alignedStart) {
        Log::warn("Heap: region {} of {} bytes is too small", start, size);
        return;
    }
    m_freeList.insert(alignedStart, alignedEnd - alignedStart);
    m_totalBytes += alignedEnd - alignedStart;
}

// Allocate memory from this heap. The returned memory is 16-byte aligned.
// @param size: The size of the allocation in bytes.
// @return: If the allocation is successful returns a void* to the allocated
// memory. Otherwise returns Error::OutOfHeapMemory.
Res<void*> HeapAllocator::alloc(u64 const size) {
    // The rounded block and its Metadata must not wrap around.
    if (size > ~0ULL - 2 * sizeof(Metadata)) {
        Log::debug("Heap: cannot allocate {} bytes", size);
        return Error::OutOfHeapMemory;
    }
    // Round here, free() must give back the exact same size.
    u64 const blockSize(roundUp(size, sizeof(Metadata)));
    Res<VirAddr> const allocRes(
        m_freeList.alloc(blockSize + sizeof(Metadata), sizeof(Metadata)));
    if (!allocRes) {
        Log::debug("Heap: cannot allocate {} bytes, {} available", size,
                   availableBytes());
        return Error::OutOfHeapMemory;
    }
    VirAddr const ret(*allocRes + sizeof(Metadata));
    Metadata * const metadata(allocRes->ptr<Metadata>());
    metadata->size = blockSize;
    metadata->token = ret.raw() ^ Metadata::MagicNumber;
    return ret.ptr<void>();
}

// Free memory from this heap.
// @param ptr: void* to the memory that should be freed. This pointer should
// have come from a call to alloc() on this same HeapAllocator.
void HeapAllocator::free(void const * const ptr) {
    if (!ptr) {
        return;
    }
    VirAddr const allocAddr(ptr);
    VirAddr const metadataVAddr(allocAddr - sizeof(Metadata));
    Metadata * const metadata(metadataVAddr.ptr<Metadata>());
    u64 const expToken(allocAddr.raw() ^ Metadata::MagicNumber);
    if (metadata->token != expToken) {
        PANIC("Calling HeapAllocator::free with a non matching token. This is "
              "most likely a double-free or freeing memory that was not "
              "allocated using HeapAlloc::malloc()");
    }
    metadata->token = 0;
    m_freeList.free(metadataVAddr, metadata->size + sizeof(Metadata));
}

u64 HeapAllocator::totalBytes() const {
    return m_totalBytes;
}

u64 HeapAllocator::usedBytes() const {
    return m_totalBytes - m_freeList.freeBytes();
}

u64 HeapAllocator::availableBytes() const {
    return m_freeList.freeBytes();
}
}
