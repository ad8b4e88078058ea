// Everything related to paging.

#include <paging/paging.hpp>
#include <logging/log.hpp>
#include <util/assert.hpp>
#include "pagetable.hpp"

namespace Paging {

// Root table entries identity mapping the kernel window. Only the entries
// covering the window are valid, they are copied into the root table of every
// AddrSpace.
alignas(PAGE_SIZE) static RootTable KernelWindow;

// Set once Init() has been called.
static bool IsInitialized = false;

// Initialize paging. Builds the global root entries identity mapping the
// kernel window.
void Init(PhyAddr const windowStart, u64 const windowLength) {
    ASSERT(!IsInitialized);
    ASSERT(!(windowStart.raw() % GIGAPAGE_SIZE));
    ASSERT(!!windowLength);
    // The window must not intersect the user range. Gigapages are mapped with
    // the U bit cleared, hence any overlap would make user pages unusable.
    ASSERT(windowStart.raw() >= USER_SPACE_END);

    u64 const numGigapages((windowLength + GIGAPAGE_SIZE - 1) / GIGAPAGE_SIZE);
    PageAttr const attrs(PageAttr::Read | PageAttr::Write | PageAttr::Exec
                         | PageAttr::Global);
    for (u64 i(0); i < numGigapages; ++i) {
        PhyAddr const addr(windowStart + i * GIGAPAGE_SIZE);
        // Identity map, the virtual address is the physical address.
        VirAddr const vaddr(addr.raw());
        KernelWindow.entries[RootTable::index(vaddr)].setLeaf(addr, attrs);
    }
    Log::info("Kernel window: {} - {} ({} gigapages)", windowStart,
              windowStart + numGigapages * GIGAPAGE_SIZE, numGigapages);
    IsInitialized = true;
}

// Get the root table entries of the kernel window.
RootTable const& kernelWindowEntries() {
    return KernelWindow;
}

// operator| for PageAttr. Use to create combination of attributes.
// @param attr1: The first attr.
// @param attr2: The second attr.
// @return: The OR of attr1 and attr2.
PageAttr operator|(PageAttr const& attr1, PageAttr const& attr2) {
    return static_cast<PageAttr>(static_cast<u64>(attr1)|static_cast<u64>(attr2));
}

// operator& for PageAttr. Used to test that a combination of attribute
// (computed using operator| for instance) contains a particular attribute.
// @param attr1: The first attr.
// @param attr2: The second attr.
// @return: true if attr1 and attr2 share at least one bit/flag, false
// otherwise.
bool operator&(PageAttr const& attr1, PageAttr const& attr2) {
    return !!(static_cast<u64>(attr1) & static_cast<u64>(attr2));
}
}
