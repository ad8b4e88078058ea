// Types and definition related to address spaces.
#pragma once

#include <paging/paging.hpp>
#include <framealloc/framealloc.hpp>
#include <trap/trap.hpp>
#include <datastruct/vector.hpp>
#include <util/ptr.hpp>
#include <util/result.hpp>

namespace Paging {

// Represents an Sv39 address space. An AddrSpace owns its root table, every
// intermediate table and every frame mapped in its user range, all of them
// coming from the frame allocator given at creation. Destroying an AddrSpace
// returns all of them to the allocator. The kernel window is mapped through
// global root entries that are not owned by any AddrSpace.
// No frame is ever mapped by two AddrSpaces.
class AddrSpace {
public:
    // Create a new address space with the kernel window and no user mapping.
    // @param allocator: The allocator providing the frames of this space.
    // @return: A Ptr to the new AddrSpace or an error if any.
    static Res<Ptr<AddrSpace>> New(FrameAlloc::Allocator& allocator);

    // Release every frame owned by this AddrSpace. The AddrSpace must not be
    // active.
    ~AddrSpace();

    // Map a range of user pages. All-or-nothing: on error the AddrSpace is
    // left as it was before the call.
    // @param start: Start of the range, page aligned.
    // @param numPages: Size of the range in pages.
    // @param attrs: Permissions of the pages. Must contain Read or Exec, Write
    // requires Read.
    // @param backing: Whether the frames are allocated now or on first fault.
    // @return: InvalidArgument if the range or the permissions are invalid,
    // AlreadyMapped if any page of the range is mapped or reserved,
    // OutOfPhysicalMemory if frames run out.
    Err map(VirAddr const start,
            u64 const numPages,
            PageAttr const attrs,
            Backing const backing);

    // Unmap a range of user pages, releasing their frames and the tables that
    // become empty. Pages that are not mapped are skipped, lazy reservations
    // intersecting the range are cut.
    // @param start: Start of the range, page aligned.
    // @param numPages: Size of the range in pages.
    void unmap(VirAddr const start, u64 const numPages);

    // Translate a virtual address.
    // @param vaddr: The address to translate.
    // @return: The physical address and attributes, NotMapped if there is no
    // valid mapping. Reserved but not yet backed pages are NotMapped.
    Res<Translation> translate(VirAddr const vaddr) const;

    // Try to resolve a page fault. Succeeds only for a reserved, not yet
    // backed page whose permissions allow the access.
    // @param vaddr: The faulting address.
    // @param access: The faulting access.
    // @return: NotMapped if the page is not reserved, BadAddress if the
    // access is not allowed, OutOfPhysicalMemory if no frame is available.
    Err resolveFault(VirAddr const vaddr, Trap::Access const access);

    // Copy a kernel buffer into this address space. Permissions are not
    // checked, reserved pages are backed as needed.
    // @param dest: Destination in this address space.
    // @param src: Source buffer.
    // @param len: Number of bytes to copy.
    // @return: BadAddress if part of the destination is not mapped or
    // reserved.
    Err copyIn(VirAddr const dest, void const * const src, u64 const len);

    // Copy bytes from this address space into a kernel buffer on behalf of
    // the task owning it. Every page must be User and Read.
    // @param dest: Destination buffer.
    // @param src: Source in this address space.
    // @param len: Number of bytes to copy.
    // @return: BadAddress if part of the source is not readable from U-mode.
    Err copyOut(void * const dest, VirAddr const src, u64 const len);

    // Create a deep copy of this address space: every backed page is copied
    // into a fresh frame, reservations are duplicated.
    // @return: The copy or an error if frames ran out.
    Res<Ptr<AddrSpace>> clone() const;

    // Switch the hart to this address space. Interrupts must be disabled.
    void activate() const;

    // Check if this address space is the one currently used by the hart.
    bool isActive() const;

    // Switch the hart to bare mode, no address space is active afterwards.
    static void deactivate();

    // Get the value of satp selecting this address space.
    u64 satpValue() const;

    // Get the number of frames owned by this address space, the root table
    // included.
    u64 numOwnedFrames() const;

private:
    // Create an AddrSpace.
    // @param allocator: The allocator of the space's frames.
    // @param root: Physical address of the root table.
    AddrSpace(FrameAlloc::Allocator& allocator, PhyAddr const root);
    friend Ptr<AddrSpace>;

    AddrSpace(AddrSpace const& other) = delete;
    AddrSpace& operator=(AddrSpace const& other) = delete;
    AddrSpace(AddrSpace && other) = delete;
    AddrSpace& operator=(AddrSpace && other) = delete;

    // A range of pages reserved with Backing::Lazy.
    struct LazyRegion {
        VirAddr start;
        u64 numPages;
        PageAttr attrs;

        bool contains(VirAddr const vaddr) const;
        VirAddr end() const;
    };

    // Find the reservation containing an address.
    // @return: The region or nullptr.
    LazyRegion const* findLazyRegion(VirAddr const vaddr) const;

    // Allocate a zeroed frame and map it at a page.
    // @param vaddr: The page to map.
    // @param attrs: The attributes of the mapping.
    // @return: Any error from the allocator or the page tables.
    Err mapNewFrame(VirAddr const vaddr, PageAttr const attrs);

    // Get the physical address backing a user address for copyIn/copyOut,
    // backing reserved pages if needed.
    // @param vaddr: The address.
    // @param requireUserRead: If true the page must be User and Read.
    // @return: The physical address or BadAddress.
    Res<PhyAddr> backingOf(VirAddr const vaddr, bool const requireUserRead);

    FrameAlloc::Allocator& m_allocator;
    PhyAddr m_root;
    Vector<LazyRegion> m_lazyRegions;
};
}
