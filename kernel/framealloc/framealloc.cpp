#include <framealloc/framealloc.hpp>
#include <logging/log.hpp>
#include <util/assert.hpp>
#include <util/cstring.hpp>
#include <util/panic.hpp>

namespace FrameAlloc {

// Default constructor. The resulting physical offset is 0x0.
Frame::Frame() : Frame(PhyAddr()) {}

// Create a Frame from its physical address.
// @param physicalAddr: The physical address of the frame, page aligned.
Frame::Frame(PhyAddr const physicalAddr) : m_physicalAddr(physicalAddr) {
    ASSERT(physicalAddr.isPageAligned());
}

// Get the physical address of the frame.
PhyAddr Frame::addr() const {
    return m_physicalAddr;
}

// Create an allocator managing the frames of a physical memory range. Only the
// frames fully contained in the range are used.
// @param base: The start of the range.
// @param length: The length of the range in bytes.
FreeListAllocator::FreeListAllocator(PhyAddr const base, u64 const length) :
    m_start(roundUp(base.raw(), PAGE_SIZE)),
    m_end(roundDown(base.raw() + length, PAGE_SIZE)) {
    if (m_start < m_end) {
        m_freeList.insert(m_start.toVir(), m_end - m_start);
    }
    Log::debug("Frame allocator: {} frames in {} - {}", numFrames(), m_start,
               m_end);
}

Res<Frame> FreeListAllocator::alloc() {
    Res<VirAddr> const res(m_freeList.alloc(PAGE_SIZE, PAGE_SIZE));
    if (!res) {
        return Error::OutOfPhysicalMemory;
    }
    Util::memzero(res->ptr<void>(), PAGE_SIZE);
    // Identity map: the virtual address is the physical address.
    return Frame(PhyAddr(res->raw()));
}

void FreeListAllocator::free(Frame const& frame) {
    PhyAddr const addr(frame.addr());
    if (addr < m_start || m_end <= addr) {
        PANIC("Freeing frame {} not managed by this allocator", addr);
    }
    m_freeList.free(addr.toVir(), PAGE_SIZE);
}

u64 FreeListAllocator::numFreeFrames() const {
    return m_freeList.freeBytes() / PAGE_SIZE;
}

u64 FreeListAllocator::numFrames() const {
    return (m_start < m_end) ? (m_end - m_start) / PAGE_SIZE : 0;
}
}
