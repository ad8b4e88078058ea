// Sv39 page table types, shared by paging.cpp and addrspace.cpp.
#pragma once

#include <paging/paging.hpp>
#include <framealloc/framealloc.hpp>

namespace Paging {

// An Sv39 page table entry. An entry with `valid` clear is interpreted as
// nothing else. A valid entry with none of R, W or X is a pointer to the next
// level table, otherwise it is a leaf.
struct PageTableEntry {
    u64 valid : 1;
    u64 readable : 1;
    u64 writable : 1;
    u64 executable : 1;
    u64 user : 1;
    u64 global : 1;
    u64 accessed : 1;
    u64 dirty : 1;
    u64 rsw : 2;
    u64 ppn : 44;
    u64 : 10;

    // Check if this entry maps a page (or a superpage).
    bool isLeaf() const {
        return readable || writable || executable;
    }

    // Physical address of the frame or table pointed by this entry.
    PhyAddr addr() const {
        return PhyAddr(u64(ppn) << 12);
    }

    // Attributes of a leaf entry.
    PageAttr attrs() const {
        return PageAttr((readable ? u64(PageAttr::Read) : 0)
                      | (writable ? u64(PageAttr::Write) : 0)
                      | (executable ? u64(PageAttr::Exec) : 0)
                      | (user ? u64(PageAttr::User) : 0)
                      | (global ? u64(PageAttr::Global) : 0));
    }

    // Make this entry a leaf. Accessed and Dirty are set upfront so the hart
    // never has to fault to update them.
    // @param frame: The frame to map.
    // @param attrs: The attributes of the mapping.
    void setLeaf(PhyAddr const frame, PageAttr const attrs) {
        clear();
        readable = attrs & PageAttr::Read;
        writable = attrs & PageAttr::Write;
        executable = attrs & PageAttr::Exec;
        user = attrs & PageAttr::User;
        global = attrs & PageAttr::Global;
        accessed = 1;
        dirty = 1;
        ppn = frame.raw() >> 12;
        valid = 1;
    }

    // Make this entry point to a next level table.
    // @param table: Physical address of the table.
    void setTable(PhyAddr const table) {
        clear();
        ppn = table.raw() >> 12;
        valid = 1;
    }

    void clear() {
        *reinterpret_cast<u64*>(this) = 0;
    }
};
static_assert(sizeof(PageTableEntry) == sizeof(u64));

// Result of an unmap operation. Primarily used within the PageTable type,
// defined here so that it does not get duplicated for each level.
enum class UnmapResult {
    // Unmap was successful, nothing else to do.
    Done,
    // Unmap was successful and the PageTable on which unmap was called is
    // now empty, e.g. it does not contain any more valid entries, and can be
    // de-allocated and marked as invalid.
    DeallocateTable,
};

// Type of a level L page table. Level 3 is the root table, level 1 tables map
// 4KiB pages.
template<u8 L> requires (0 < L && L <= 3)
struct PageTable {
    // Number of entries of a page table, always 512 in Sv39.
    static constexpr u64 NumEntries = 512;

    // Size of the region mapped by a single entry of this table.
    static constexpr u64 EntrySpan = PAGE_SIZE << ((L - 1) * 9);

    // Get the index of the entry of this table covering a virtual address.
    static u64 index(VirAddr const vaddr) {
        return (vaddr.raw() >> (12 + (L - 1) * 9)) & 0x1ff;
    }

    // Get the table pointed by a non-leaf entry.
    static auto* next(PageTableEntry const& entry) requires (L > 1) {
        return entry.addr().toVir().template ptr<PageTable<L-1>>();
    }

    // Map vaddr to a frame. If this is a level 1 table, the associated entry is
    // directly modified. Otherwise this method recurse to the level L-1 table,
    // allocating it if necessary. A table allocated by this call is freed again
    // if the recursion fails.
    // @param vaddr: The virtual address to map.
    // @param frame: The frame to map vaddr to.
    // @param attrs: The attributes of the mapping.
    // @param allocator: Allocator for the intermediate tables.
    // @return: AlreadyMapped if the page is already mapped, or any allocation
    // error.
    Err map(VirAddr const vaddr,
            PhyAddr const frame,
            PageAttr const attrs,
            FrameAlloc::Allocator& allocator) {
        PageTableEntry& entry(entries[index(vaddr)]);
        if constexpr (L == 1) {
            if (entry.valid) {
                return Error::AlreadyMapped;
            }
            entry.setLeaf(frame, attrs);
            return Ok;
        } else {
            bool allocatedTable(false);
            if (!entry.valid) {
                Res<Frame> const allocRes(allocator.alloc());
                if (!allocRes) {
                    return allocRes.error();
                }
                entry.setTable(allocRes->addr());
                allocatedTable = true;
            } else if (entry.isLeaf()) {
                // Superpage of the kernel window.
                return Error::AlreadyMapped;
            }
            Err const err(next(entry)->map(vaddr, frame, attrs, allocator));
            if (!!err && allocatedTable) {
                allocator.free(Frame(entry.addr()));
                entry.clear();
            }
            return err;
        }
    }

    // Unmap a virtual page. The frame mapped at a level 1 entry is freed, as
    // well as any table that becomes empty.
    // @param vaddr: The virtual address to unmap.
    // @param allocator: The allocator to give the frames back to.
    // @return: DeallocateTable if this table does not hold any valid entry
    // anymore, Done otherwise.
    UnmapResult unmap(VirAddr const vaddr, FrameAlloc::Allocator& allocator) {
        PageTableEntry& entry(entries[index(vaddr)]);
        if (!entry.valid) {
            // Nothing mapped there.
            return UnmapResult::Done;
        }
        if constexpr (L == 1) {
            allocator.free(Frame(entry.addr()));
            entry.clear();
        } else {
            if (entry.isLeaf()) {
                // Superpages only belong to the kernel window, never unmapped.
                return UnmapResult::Done;
            }
            UnmapResult const res(next(entry)->unmap(vaddr, allocator));
            if (res != UnmapResult::DeallocateTable) {
                return UnmapResult::Done;
            }
            allocator.free(Frame(entry.addr()));
            entry.clear();
        }
        return isEmpty() ? UnmapResult::DeallocateTable : UnmapResult::Done;
    }

    // Find the leaf entry mapping a virtual address.
    // @param vaddr: The address.
    // @param span: Set to the size of the region mapped by the leaf.
    // @return: The leaf entry or nullptr if the address is not mapped.
    PageTableEntry const* lookup(VirAddr const vaddr, u64& span) const {
        PageTableEntry const& entry(entries[index(vaddr)]);
        if (!entry.valid) {
            return nullptr;
        } else if (entry.isLeaf()) {
            span = EntrySpan;
            return &entry;
        }
        if constexpr (L == 1) {
            // A valid level 1 entry is always a leaf.
            return nullptr;
        } else {
            return next(entry)->lookup(vaddr, span);
        }
    }

    // Call a function on every non-global 4KiB leaf mapped under this table.
    // @param base: Virtual address mapped by entries[0].
    // @param func: Called with the virtual address and the leaf entry.
    template<typename F>
    void forEachLeaf(VirAddr const base, F const& func) const {
        for (u64 i(0); i < NumEntries; ++i) {
            PageTableEntry const& entry(entries[i]);
            if (!entry.valid || entry.global) {
                continue;
            }
            VirAddr const vaddr(base + i * EntrySpan);
            if constexpr (L == 1) {
                func(vaddr, entry);
            } else if (!entry.isLeaf()) {
                next(entry)->forEachLeaf(vaddr, func);
            }
        }
    }

    // Free every frame owned under this table: the tables below it and the
    // 4KiB pages they map. Global entries are skipped. This table itself is
    // not freed.
    // @param allocator: The allocator to give the frames back to.
    void release(FrameAlloc::Allocator& allocator) {
        for (u64 i(0); i < NumEntries; ++i) {
            PageTableEntry& entry(entries[i]);
            if (!entry.valid || entry.global) {
                continue;
            }
            if constexpr (L > 1) {
                if (entry.isLeaf()) {
                    continue;
                }
                next(entry)->release(allocator);
            }
            allocator.free(Frame(entry.addr()));
            entry.clear();
        }
    }

    // Count the frames owned under this table, this table excluded.
    u64 numOwnedFrames() const {
        u64 res(0);
        for (u64 i(0); i < NumEntries; ++i) {
            PageTableEntry const& entry(entries[i]);
            if (!entry.valid || entry.global) {
                continue;
            }
            if constexpr (L > 1) {
                if (entry.isLeaf()) {
                    continue;
                }
                res += next(entry)->numOwnedFrames();
            }
            res++;
        }
        return res;
    }

    // Check if none of the entries is valid.
    bool isEmpty() const {
        for (u64 i(0); i < NumEntries; ++i) {
            if (entries[i].valid) {
                return false;
            }
        }
        return true;
    }

    // The entries of this page table.
    PageTableEntry entries[NumEntries];
};

// Sanity check that we got the sizes right.
static_assert(sizeof(PageTable<3>) == PAGE_SIZE);
static_assert(sizeof(PageTable<2>) == PAGE_SIZE);
static_assert(sizeof(PageTable<1>) == PAGE_SIZE);

using RootTable = PageTable<3>;

// Get the root table entries of the kernel window, set by Paging::Init().
// Invalid entries are not part of the window.
RootTable const& kernelWindowEntries();
}
