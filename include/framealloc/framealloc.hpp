// Everything related to physical page frame allocation.

#pragma once

#include <util/result.hpp>
#include <util/addr.hpp>
#include <datastruct/freelist.hpp>
#include <selftests/selftests.hpp>

namespace FrameAlloc {

// Describes a physical frame.
class Frame {
public:
    // Default constructor. The resulting physical offset is 0x0.
    Frame();

    // Create a Frame from its physical address.
    // @param physicalAddr: The physical address of the frame, page aligned.
    Frame(PhyAddr const physicalAddr);

    bool operator==(Frame const& other) const = default;

    // Get the physical address of the frame.
    PhyAddr addr() const;

private:
    PhyAddr m_physicalAddr;
};

// Abstract interface for a frame allocator.
class Allocator {
public:
    virtual ~Allocator() = default;

    // Allocate a new physical frame. The content of the frame is zeroed.
    // @return: The Frame object describing the allocated frame. If no frame can
    // be allocated this function returns Error::OutOfPhysicalMemory.
    virtual Res<Frame> alloc() = 0;

    // Free a physical frame.
    // @param frame: The Frame describing the physical frame to be freed.
    virtual void free(Frame const& frame) = 0;

    // Get the number of frames that can still be allocated.
    virtual u64 numFreeFrames() const = 0;
};

// Frame allocator keeping free frames in an EmbeddedFreeList, that is the list
// is stored within the free physical frames themselves, accessed through the
// kernel's identity mapping.
class FreeListAllocator : public Allocator {
public:
    // Create an allocator managing the frames of a physical memory range. Only
    // the frames fully contained in the range are used.
    // @param base: The start of the range.
    // @param length: The length of the range in bytes.
    FreeListAllocator(PhyAddr const base, u64 const length);

    virtual Res<Frame> alloc() override;

    virtual void free(Frame const& frame) override;

    virtual u64 numFreeFrames() const override;

    // Get the number of frames managed by this allocator, free or not.
    u64 numFrames() const;

private:
    // Free-list of physical page frames.
    DataStruct::EmbeddedFreeList m_freeList;
    // First and last+1 physical addresses managed by the allocator.
    PhyAddr const m_start;
    PhyAddr const m_end;
};

// Run the frame allocation tests.
void Test(SelfTests::TestRunner& runner);
}

// Shortcut to avoid long typenames.
using Frame = FrameAlloc::Frame;
