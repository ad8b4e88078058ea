// Types and definition related to address spaces.

#include <paging/addrspace.hpp>
#include <cpu/cpu.hpp>
#include <util/cstring.hpp>
#include <logging/log.hpp>
#include "pagetable.hpp"

namespace Paging {

// Value of the MODE field of satp selecting Sv39.
static constexpr u64 SatpModeSv39 = 8ULL << 60;

// Sv39 only translates the low 2^38 bytes in the lower half.
static constexpr u64 LowerHalfEnd = 1ULL << 38;

// Get the root table of an address space.
static RootTable* rootTable(PhyAddr const root) {
    return root.toVir().ptr<RootTable>();
}

// Check that a range of pages lies within the user range.
static bool isUserRange(VirAddr const start, u64 const numPages) {
    if (!start.isPageAligned() || !numPages) {
        return false;
    } else if (start.raw() < USER_SPACE_START
               || start.raw() >= USER_SPACE_END) {
        return false;
    }
    return numPages <= (USER_SPACE_END - start.raw()) / PAGE_SIZE;
}

// Create a new address space with the kernel window and no user mapping.
// @param allocator: The allocator providing the frames of this space.
// @return: A Ptr to the new AddrSpace or an error if any.
Res<Ptr<AddrSpace>> AddrSpace::New(FrameAlloc::Allocator& allocator) {
    Res<Frame> const rootAlloc(allocator.alloc());
    if (!rootAlloc) {
        return rootAlloc.error();
    }
    PhyAddr const root(rootAlloc->addr());

    // The frame comes zeroed, only the entries of the kernel window need to be
    // copied.
    RootTable const& window(kernelWindowEntries());
    RootTable * const table(rootTable(root));
    for (u64 i(0); i < RootTable::NumEntries; ++i) {
        if (window.entries[i].valid) {
            table->entries[i] = window.entries[i];
        }
    }

    Ptr<AddrSpace> const allocRes(Ptr<AddrSpace>::New(allocator, root));
    if (!allocRes) {
        allocator.free(Frame(root));
        return Error::OutOfHeapMemory;
    } else {
        return allocRes;
    }
}

// Release every frame owned by this AddrSpace.
AddrSpace::~AddrSpace() {
    if (isActive()) {
        PANIC("Destroying the active address space");
    }
    u64 const numFrames(numOwnedFrames());
    rootTable(m_root)->release(m_allocator);
    m_allocator.free(Frame(m_root));
    Log::debug("Destroyed address space {}, released {} frames", m_root,
               numFrames);
}

// Map a range of user pages. All-or-nothing.
Err AddrSpace::map(VirAddr const start,
                   u64 const numPages,
                   PageAttr const attrs,
                   Backing const backing) {
    if (!isUserRange(start, numPages)) {
        return Error::InvalidArgument;
    }
    bool const readable(attrs & PageAttr::Read);
    if (!(attrs & (PageAttr::Read | PageAttr::Exec))
        || ((attrs & PageAttr::Write) && !readable)
        || (attrs & PageAttr::Global)) {
        return Error::InvalidArgument;
    }

    // Check the whole range before touching anything.
    for (u64 i(0); i < numPages; ++i) {
        VirAddr const vaddr(start + i * PAGE_SIZE);
        if (translate(vaddr).ok() || !!findLazyRegion(vaddr)) {
            return Error::AlreadyMapped;
        }
    }

    if (backing == Backing::Lazy) {
        m_lazyRegions.pushBack(LazyRegion{start, numPages, attrs});
        return Ok;
    }

    for (u64 i(0); i < numPages; ++i) {
        Err const err(mapNewFrame(start + i * PAGE_SIZE, attrs));
        if (!!err) {
            Log::debug("Failed to map {} pages at {}: {}", numPages, start,
                       err.error());
            // Roll back the pages mapped so far. The tables they used are
            // freed as they become empty.
            unmap(start, i);
            return err;
        }
    }
    return Ok;
}

// Unmap a range of user pages.
void AddrSpace::unmap(VirAddr const start, u64 const numPages) {
    ASSERT(start.isPageAligned());
    if (!numPages) {
        return;
    }
    RootTable * const root(rootTable(m_root));
    // Nothing is mapped past USER_SPACE_END, clamp the range there.
    u64 const maxPages(start.raw() < USER_SPACE_END
                       ? (USER_SPACE_END - start.raw()) / PAGE_SIZE : 0);
    VirAddr const end(start + min(numPages, maxPages) * PAGE_SIZE);
    VirAddr const first(start.raw() < USER_SPACE_START
                        ? VirAddr(USER_SPACE_START) : start);
    for (VirAddr vaddr(first); vaddr < end; vaddr = vaddr + PAGE_SIZE) {
        root->unmap(vaddr, m_allocator);
    }

    // Cut the reservations intersecting the range, keeping what is left on
    // each side.
    Vector<LazyRegion> remaining;
    for (LazyRegion const& region : m_lazyRegions) {
        if (region.end() <= start || end <= region.start) {
            remaining.pushBack(region);
            continue;
        }
        if (region.start < start) {
            u64 const n((start - region.start) / PAGE_SIZE);
            remaining.pushBack(LazyRegion{region.start, n, region.attrs});
        }
        if (end < region.end()) {
            u64 const n((region.end() - end) / PAGE_SIZE);
            remaining.pushBack(LazyRegion{end, n, region.attrs});
        }
    }
    m_lazyRegions = remaining;

    if (isActive()) {
        Cpu::flushTlb();
    }
}

// Translate a virtual address.
Res<Translation> AddrSpace::translate(VirAddr const vaddr) const {
    if (vaddr.raw() >= LowerHalfEnd) {
        return Error::NotMapped;
    }
    u64 span(0);
    PageTableEntry const * const entry(
        rootTable(m_root)->lookup(vaddr, span));
    if (!entry) {
        return Error::NotMapped;
    }
    u64 const offset(vaddr.raw() & (span - 1));
    return Translation{entry->addr() + offset, entry->attrs()};
}

// Try to resolve a page fault on a reserved page.
Err AddrSpace::resolveFault(VirAddr const vaddr, Trap::Access const access) {
    LazyRegion const * const region(findLazyRegion(vaddr));
    if (!region) {
        return Error::NotMapped;
    }
    PageAttr const attrs(region->attrs);
    bool allowed(false);
    switch (access) {
        case Trap::Access::Load:
            allowed = attrs & PageAttr::Read;
            break;
        case Trap::Access::Store:
            allowed = attrs & PageAttr::Write;
            break;
        case Trap::Access::Fetch:
            allowed = attrs & PageAttr::Exec;
            break;
    }
    if (!allowed || translate(vaddr).ok()) {
        // Either the access is forbidden or the page is already backed and
        // this is a genuine permission fault.
        return Error::BadAddress;
    }
    Err const err(mapNewFrame(vaddr.pageBase(), attrs));
    if (!err && isActive()) {
        Cpu::flushTlb();
    }
    return err;
}

// Copy a kernel buffer into this address space.
Err AddrSpace::copyIn(VirAddr const dest, void const * const src,
                      u64 const len) {
    u8 const * const bytes(reinterpret_cast<u8 const*>(src));
    u64 done(0);
    while (done < len) {
        VirAddr const curr(dest + done);
        u64 const chunk(min(len - done, PAGE_SIZE - curr.pageOffset()));
        Res<PhyAddr> const paddr(backingOf(curr, false));
        if (!paddr) {
            return paddr.error();
        }
        Util::memcpy(paddr->toVir().ptr<u8>(), bytes + done, chunk);
        done += chunk;
    }
    return Ok;
}

// Copy bytes from this address space into a kernel buffer.
Err AddrSpace::copyOut(void * const dest, VirAddr const src, u64 const len) {
    u8 * const bytes(reinterpret_cast<u8*>(dest));
    u64 done(0);
    while (done < len) {
        VirAddr const curr(src + done);
        u64 const chunk(min(len - done, PAGE_SIZE - curr.pageOffset()));
        Res<PhyAddr> const paddr(backingOf(curr, true));
        if (!paddr) {
            return paddr.error();
        }
        Util::memcpy(bytes + done, paddr->toVir().ptr<u8>(), chunk);
        done += chunk;
    }
    return Ok;
}

// Create a deep copy of this address space.
Res<Ptr<AddrSpace>> AddrSpace::clone() const {
    Res<Ptr<AddrSpace>> const newRes(New(m_allocator));
    if (!newRes) {
        return newRes.error();
    }
    Ptr<AddrSpace> const copy(*newRes);

    Err err(Ok);
    rootTable(m_root)->forEachLeaf(VirAddr(u64(0)),
        [&](VirAddr const vaddr, PageTableEntry const& entry) {
        if (!!err) {
            return;
        }
        err = copy->mapNewFrame(vaddr, entry.attrs());
        if (!err) {
            PhyAddr const dest(copy->translate(vaddr)->addr);
            Util::memcpy(dest.toVir().ptr<u8>(),
                         entry.addr().toVir().ptr<u8>(),
                         PAGE_SIZE);
        }
    });
    if (!!err) {
        // The copy releases what it got so far when the last Ptr goes away.
        return err.error();
    }
    copy->m_lazyRegions = m_lazyRegions;
    return copy;
}

// Switch the hart to this address space.
void AddrSpace::activate() const {
    ASSERT(!Cpu::interruptsEnabled());
    Cpu::writeSatp(satpValue());
    Cpu::flushTlb();
}

// Check if this address space is the one currently used by the hart.
bool AddrSpace::isActive() const {
    return Cpu::satp() == satpValue();
}

// Switch the hart to bare mode.
void AddrSpace::deactivate() {
    Cpu::writeSatp(0);
    Cpu::flushTlb();
}

// Get the value of satp selecting this address space.
u64 AddrSpace::satpValue() const {
    return SatpModeSv39 | (m_root.raw() >> 12);
}

// Get the number of frames owned by this address space.
u64 AddrSpace::numOwnedFrames() const {
    return 1 + rootTable(m_root)->numOwnedFrames();
}

// Create an AddrSpace.
// @param allocator: The allocator of the space's frames.
// @param root: Physical address of the root table.
AddrSpace::AddrSpace(FrameAlloc::Allocator& allocator, PhyAddr const root) :
    m_allocator(allocator), m_root(root), m_lazyRegions() {}

bool AddrSpace::LazyRegion::contains(VirAddr const vaddr) const {
    return start <= vaddr && vaddr < end();
}

VirAddr AddrSpace::LazyRegion::end() const {
    return start + numPages * PAGE_SIZE;
}

// Find the reservation containing an address.
AddrSpace::LazyRegion const* AddrSpace::findLazyRegion(
    VirAddr const vaddr) const {
    for (LazyRegion const& region : m_lazyRegions) {
        if (region.contains(vaddr)) {
            return &region;
        }
    }
    return nullptr;
}

// Allocate a zeroed frame and map it at a page.
Err AddrSpace::mapNewFrame(VirAddr const vaddr, PageAttr const attrs) {
    Res<Frame> const frame(m_allocator.alloc());
    if (!frame) {
        return frame.error();
    }
    Err const err(rootTable(m_root)->map(vaddr, frame->addr(), attrs,
                                         m_allocator));
    if (!!err) {
        m_allocator.free(*frame);
    }
    return err;
}

// Get the physical address backing a user address for copyIn/copyOut.
Res<PhyAddr> AddrSpace::backingOf(VirAddr const vaddr,
                                  bool const requireUserRead) {
    if (vaddr.raw() < USER_SPACE_START || vaddr.raw() >= USER_SPACE_END) {
        return Error::BadAddress;
    }
    if (!translate(vaddr)) {
        LazyRegion const * const region(findLazyRegion(vaddr));
        if (!region) {
            return Error::BadAddress;
        }
        PageAttr const attrs(region->attrs);
        if (requireUserRead
            && !((attrs & PageAttr::User) && (attrs & PageAttr::Read))) {
            return Error::BadAddress;
        }
        Err const err(mapNewFrame(vaddr.pageBase(), attrs));
        if (!!err) {
            return err.error();
        }
    }
    Res<Translation> const tr(translate(vaddr));
    ASSERT(tr.ok());
    if (requireUserRead
        && !((tr->attrs & PageAttr::User) && (tr->attrs & PageAttr::Read))) {
        return Error::BadAddress;
    }
    return tr->addr;
}
}
