// Everything related to paging.

#pragma once
#include <util/err.hpp>
#include <util/addr.hpp>
#include <selftests/selftests.hpp>

namespace Paging {

// User mappings
// =============
// Only the range [USER_SPACE_START, USER_SPACE_END) may be mapped in an
// AddrSpace. The first page stays unmapped to catch null pointers. The kernel
// identity window sits above USER_SPACE_END and is shared by all address
// spaces through global entries in the root table.
static constexpr u64 USER_SPACE_START = 0x1000;
static constexpr u64 USER_SPACE_END = 0x80000000;

// Size of the pages used by the kernel identity window (Sv39 gigapages).
static constexpr u64 GIGAPAGE_SIZE = 1ULL << 30;

// Initialize paging. Builds the global root entries identity mapping the
// kernel window. The window must not intersect the user range. Every AddrSpace
// created after this call maps the window.
// @param windowStart: Start of the kernel window, gigapage aligned.
// @param windowLength: Length of the kernel window in bytes.
void Init(PhyAddr const windowStart, u64 const windowLength);

// Run paging tests.
void Test(SelfTests::TestRunner& runner);

// Attributes of pages when mapping virtual addresses to physical addresses.
// Can use a combination of attributes using the operator|. The values are the
// bits of the Sv39 page table entries.
enum class PageAttr : u64 {
    // Helper function to set the value of a PageAttr to 0, e.g. no bits.
    None = 0,
    Read = 2,
    Write = 4,
    Exec = 8,
    // The page can be accessed from U-mode.
    User = 16,
    // The mapping is shared by all address spaces. Only used for the kernel
    // window.
    Global = 32,
};

// operator| for PageAttr. Use to create combination of attributes.
// @param attr1: The first attr.
// @param attr2: The second attr.
// @return: The OR of attr1 and attr2.
PageAttr operator|(PageAttr const& attr1, PageAttr const& attr2);

// operator& for PageAttr. Used to test that a combination of attribute
// (computed using operator| for instance) contains a particular attribute.
// @param attr1: The first attr.
// @param attr2: The second attr.
// @return: true if attr1 and attr2 share at least one bit/flag, false
// otherwise.
bool operator&(PageAttr const& attr1, PageAttr const& attr2);

// How the pages of a mapping get their frames.
enum class Backing {
    // Zeroed frames are allocated when the range is mapped.
    Eager,
    // The range is only reserved. A zeroed frame is allocated on the first
    // fault on each page.
    Lazy,
};

// Result of a translation.
struct Translation {
    // The physical address mapped to the translated virtual address, page
    // offset included.
    PhyAddr addr;
    // The attributes of the mapping.
    PageAttr attrs;
};
}
