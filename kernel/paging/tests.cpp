// Paging related tests.
#include <paging/paging.hpp>
#include <paging/addrspace.hpp>
#include <framealloc/framealloc.hpp>
#include <cpu/cpu.hpp>
#include <util/cstring.hpp>
#include <selftests/macros.hpp>

namespace Paging {

// Physical memory given to the address spaces under test.
static constexpr u64 NumTestFrames = 32;
alignas(PAGE_SIZE) static u8 TestMemory[NumTestFrames * PAGE_SIZE];

// Some user address used by the tests, the first page of a level 1 table.
static VirAddr const TestAddr(0x400000);

static PhyAddr testMemoryBase() {
    return PhyAddr(reinterpret_cast<u64>(TestMemory));
}

// Map then translate returns the mapped frame and attributes, unmap then
// translate returns NotMapped.
SelfTests::TestResult mapTranslateUnmapTest() {
    FrameAlloc::FreeListAllocator allocator(testMemoryBase(),
                                            NumTestFrames * PAGE_SIZE);
    Res<Ptr<AddrSpace>> const newRes(AddrSpace::New(allocator));
    TEST_ASSERT(newRes.ok());
    Ptr<AddrSpace> const space(*newRes);
    TEST_ASSERT(space->numOwnedFrames() == 1);
    u64 const freeFrames(allocator.numFreeFrames());

    PageAttr const attrs(PageAttr::Read | PageAttr::Write | PageAttr::User);
    TEST_ASSERT(!space->map(TestAddr, 2, attrs, Backing::Eager));
    // One frame per page and one table for levels 2 and 1.
    TEST_ASSERT(space->numOwnedFrames() == 1 + 2 + 2);
    TEST_ASSERT(allocator.numFreeFrames() == freeFrames - 4);

    for (u64 i(0); i < 2; ++i) {
        VirAddr const vaddr(TestAddr + i * PAGE_SIZE + 0x123);
        Res<Translation> const tr(space->translate(vaddr));
        TEST_ASSERT(tr.ok());
        TEST_ASSERT(tr->addr.pageOffset() == 0x123);
        TEST_ASSERT(testMemoryBase() <= tr->addr);
        TEST_ASSERT(tr->addr < testMemoryBase() + NumTestFrames * PAGE_SIZE);
        TEST_ASSERT(tr->attrs & PageAttr::Read);
        TEST_ASSERT(tr->attrs & PageAttr::Write);
        TEST_ASSERT(tr->attrs & PageAttr::User);
        TEST_ASSERT(!(tr->attrs & PageAttr::Exec));
    }
    Res<Translation> const beyond(space->translate(TestAddr + 2 * PAGE_SIZE));
    TEST_ASSERT(!beyond);
    TEST_ASSERT(beyond.error() == Error::NotMapped);

    space->unmap(TestAddr, 2);
    TEST_ASSERT(!space->translate(TestAddr));
    TEST_ASSERT(space->translate(TestAddr).error() == Error::NotMapped);
    TEST_ASSERT(!space->translate(TestAddr + PAGE_SIZE));
    // Tables that became empty are freed as well.
    TEST_ASSERT(space->numOwnedFrames() == 1);
    TEST_ASSERT(allocator.numFreeFrames() == freeFrames);
    return SelfTests::TestResult::Success;
}

// Mapping a range that overlaps a mapped or reserved page fails with
// AlreadyMapped and leaves the address space untouched.
SelfTests::TestResult mapAlreadyMappedTest() {
    FrameAlloc::FreeListAllocator allocator(testMemoryBase(),
                                            NumTestFrames * PAGE_SIZE);
    Ptr<AddrSpace> const space(*AddrSpace::New(allocator));
    PageAttr const attrs(PageAttr::Read | PageAttr::User);
    TEST_ASSERT(!space->map(TestAddr, 1, attrs, Backing::Eager));
    TEST_ASSERT(!space->map(TestAddr + 4 * PAGE_SIZE, 2, attrs,
                            Backing::Lazy));
    u64 const freeFrames(allocator.numFreeFrames());
    u64 const ownedFrames(space->numOwnedFrames());
    PhyAddr const frame(space->translate(TestAddr)->addr);

    // Overlaps the eager page.
    Err const err1(space->map(TestAddr - PAGE_SIZE, 3, attrs, Backing::Eager));
    TEST_ASSERT(!!err1);
    TEST_ASSERT(err1.error() == Error::AlreadyMapped);
    // Overlaps the reservation.
    Err const err2(space->map(TestAddr + 5 * PAGE_SIZE, 1, attrs,
                              Backing::Lazy));
    TEST_ASSERT(!!err2);
    TEST_ASSERT(err2.error() == Error::AlreadyMapped);

    TEST_ASSERT(!space->translate(TestAddr - PAGE_SIZE));
    TEST_ASSERT(!space->translate(TestAddr + PAGE_SIZE));
    TEST_ASSERT(space->translate(TestAddr)->addr == frame);
    TEST_ASSERT(allocator.numFreeFrames() == freeFrames);
    TEST_ASSERT(space->numOwnedFrames() == ownedFrames);
    return SelfTests::TestResult::Success;
}

// Invalid ranges and permissions are rejected.
SelfTests::TestResult mapInvalidArgumentTest() {
    FrameAlloc::FreeListAllocator allocator(testMemoryBase(),
                                            NumTestFrames * PAGE_SIZE);
    Ptr<AddrSpace> const space(*AddrSpace::New(allocator));
    PageAttr const rw(PageAttr::Read | PageAttr::Write | PageAttr::User);

    auto const isInvalid([&](VirAddr const start,
                             u64 const numPages,
                             PageAttr const attrs) {
        Err const err(space->map(start, numPages, attrs, Backing::Eager));
        return err == Error::InvalidArgument;
    });
    // Unaligned.
    TEST_ASSERT(isInvalid(TestAddr + 8, 1, rw));
    // Empty.
    TEST_ASSERT(isInvalid(TestAddr, 0, rw));
    // Null page.
    TEST_ASSERT(isInvalid(VirAddr(u64(0)), 1, rw));
    // Crosses the end of the user range.
    TEST_ASSERT(isInvalid(VirAddr(USER_SPACE_END - PAGE_SIZE), 2, rw));
    // Kernel window.
    TEST_ASSERT(isInvalid(VirAddr(USER_SPACE_END), 1, rw));
    // Bad permissions.
    TEST_ASSERT(isInvalid(TestAddr, 1, PageAttr::None));
    TEST_ASSERT(isInvalid(TestAddr, 1, PageAttr::Write | PageAttr::User));
    TEST_ASSERT(isInvalid(TestAddr, 1, rw | PageAttr::Global));
    TEST_ASSERT(space->numOwnedFrames() == 1);

    // The last page of the user range is fine.
    TEST_ASSERT(!space->map(VirAddr(USER_SPACE_END - PAGE_SIZE), 1, rw,
                            Backing::Eager));
    return SelfTests::TestResult::Success;
}

// Unmapping twice has the same effect as unmapping once, unmapping pages that
// were never mapped does nothing.
SelfTests::TestResult unmapIdempotentTest() {
    FrameAlloc::FreeListAllocator allocator(testMemoryBase(),
                                            NumTestFrames * PAGE_SIZE);
    Ptr<AddrSpace> const space(*AddrSpace::New(allocator));
    PageAttr const attrs(PageAttr::Read | PageAttr::User);
    TEST_ASSERT(!space->map(TestAddr, 3, attrs, Backing::Eager));
    // Keep another page mapped in the same table.
    TEST_ASSERT(!space->map(TestAddr + 8 * PAGE_SIZE, 1, attrs,
                            Backing::Eager));

    space->unmap(TestAddr, 3);
    u64 const freeFrames(allocator.numFreeFrames());
    u64 const ownedFrames(space->numOwnedFrames());
    TEST_ASSERT(ownedFrames == 1 + 2 + 1);

    space->unmap(TestAddr, 3);
    TEST_ASSERT(allocator.numFreeFrames() == freeFrames);
    TEST_ASSERT(space->numOwnedFrames() == ownedFrames);
    TEST_ASSERT(space->translate(TestAddr + 8 * PAGE_SIZE).ok());

    // Never mapped, different level 2 table.
    space->unmap(VirAddr(0x40000000), 16);
    TEST_ASSERT(allocator.numFreeFrames() == freeFrames);

    // A page count whose size wraps around still unmaps up to the end of the
    // user range.
    VirAddr const lastPage(USER_SPACE_END - PAGE_SIZE);
    TEST_ASSERT(!space->map(lastPage, 1, attrs, Backing::Eager));
    TEST_ASSERT(space->translate(lastPage).ok());
    space->unmap(lastPage, 1ULL << 52);
    TEST_ASSERT(!space->translate(lastPage));
    return SelfTests::TestResult::Success;
}

// A failing eager map rolls back the pages and tables it installed.
SelfTests::TestResult mapOutOfMemoryRollbackTest() {
    // Root table + 2 tables + 3 pages.
    FrameAlloc::FreeListAllocator allocator(testMemoryBase(), 6 * PAGE_SIZE);
    Ptr<AddrSpace> const space(*AddrSpace::New(allocator));
    u64 const freeFrames(allocator.numFreeFrames());
    TEST_ASSERT(freeFrames == 5);

    PageAttr const attrs(PageAttr::Read | PageAttr::User);
    Err const err(space->map(TestAddr, 8, attrs, Backing::Eager));
    TEST_ASSERT(!!err);
    TEST_ASSERT(err.error() == Error::OutOfPhysicalMemory);
    TEST_ASSERT(allocator.numFreeFrames() == freeFrames);
    TEST_ASSERT(space->numOwnedFrames() == 1);
    for (u64 i(0); i < 8; ++i) {
        TEST_ASSERT(!space->translate(TestAddr + i * PAGE_SIZE));
    }

    // What fits still maps.
    TEST_ASSERT(!space->map(TestAddr, 3, attrs, Backing::Eager));
    TEST_ASSERT(!allocator.numFreeFrames());
    return SelfTests::TestResult::Success;
}

// Reserved pages get a zeroed frame on the first allowed fault.
SelfTests::TestResult lazyResolveFaultTest() {
    FrameAlloc::FreeListAllocator allocator(testMemoryBase(),
                                            NumTestFrames * PAGE_SIZE);
    Ptr<AddrSpace> const space(*AddrSpace::New(allocator));
    PageAttr const attrs(PageAttr::Read | PageAttr::Write | PageAttr::User);
    u64 const freeFrames(allocator.numFreeFrames());
    TEST_ASSERT(!space->map(TestAddr, 4, attrs, Backing::Lazy));
    // Reserving does not allocate anything.
    TEST_ASSERT(allocator.numFreeFrames() == freeFrames);
    TEST_ASSERT(!space->translate(TestAddr));

    TEST_ASSERT(!space->resolveFault(TestAddr + 0x10, Trap::Access::Store));
    Res<Translation> const tr(space->translate(TestAddr + 0x10));
    TEST_ASSERT(tr.ok());
    TEST_ASSERT(tr->attrs & PageAttr::Write);
    u64 const* const words(tr->addr.pageBase().toVir().ptr<u64>());
    for (u64 i(0); i < PAGE_SIZE / sizeof(u64); ++i) {
        TEST_ASSERT(!words[i]);
    }

    // A fault on a backed page is a genuine permission fault.
    Err const again(space->resolveFault(TestAddr, Trap::Access::Load));
    TEST_ASSERT(again == Error::BadAddress);
    // The reservation is not executable.
    Err const fetch(space->resolveFault(TestAddr + PAGE_SIZE,
                                        Trap::Access::Fetch));
    TEST_ASSERT(fetch == Error::BadAddress);
    TEST_ASSERT(!space->translate(TestAddr + PAGE_SIZE));
    // Not reserved.
    Err const outside(space->resolveFault(TestAddr + 4 * PAGE_SIZE,
                                          Trap::Access::Load));
    TEST_ASSERT(outside == Error::NotMapped);

    // Unmapping the middle of the reservation cuts it in two.
    space->unmap(TestAddr + PAGE_SIZE, 2);
    Err const cut(space->resolveFault(TestAddr + 2 * PAGE_SIZE,
                                      Trap::Access::Load));
    TEST_ASSERT(cut == Error::NotMapped);
    TEST_ASSERT(!space->resolveFault(TestAddr + 3 * PAGE_SIZE,
                                     Trap::Access::Load));
    return SelfTests::TestResult::Success;
}

// copyIn and copyOut move bytes across page boundaries, copyOut only reads
// pages readable from U-mode.
SelfTests::TestResult copyInOutTest() {
    FrameAlloc::FreeListAllocator allocator(testMemoryBase(),
                                            NumTestFrames * PAGE_SIZE);
    Ptr<AddrSpace> const space(*AddrSpace::New(allocator));
    PageAttr const rw(PageAttr::Read | PageAttr::Write | PageAttr::User);
    TEST_ASSERT(!space->map(TestAddr, 2, rw, Backing::Eager));

    char const msg[] = "Straddling a page boundary";
    u64 const len(sizeof(msg));
    VirAddr const dest(TestAddr + PAGE_SIZE - 10);
    TEST_ASSERT(!space->copyIn(dest, msg, len));
    char buf[sizeof(msg)] = {};
    TEST_ASSERT(!space->copyOut(buf, dest, len));
    TEST_ASSERT(Util::streq(buf, msg));

    // Past the end of the mapping.
    Err const overflow(space->copyOut(buf, TestAddr + 2 * PAGE_SIZE - 4, 8));
    TEST_ASSERT(overflow == Error::BadAddress);

    // Kernel-only page: the kernel may fill it, the task cannot read it.
    VirAddr const kernelOnly(TestAddr + 8 * PAGE_SIZE);
    TEST_ASSERT(!space->map(kernelOnly, 1, PageAttr::Read, Backing::Eager));
    TEST_ASSERT(!space->copyIn(kernelOnly, msg, len));
    Err const denied(space->copyOut(buf, kernelOnly, len));
    TEST_ASSERT(denied == Error::BadAddress);

    // Copying into a reservation backs it.
    VirAddr const lazy(TestAddr + 16 * PAGE_SIZE);
    TEST_ASSERT(!space->map(lazy, 1, rw, Backing::Lazy));
    TEST_ASSERT(!space->copyIn(lazy, msg, len));
    TEST_ASSERT(space->translate(lazy).ok());

    // Outside of the user range.
    Err const kernel(space->copyIn(VirAddr(USER_SPACE_END), msg, len));
    TEST_ASSERT(kernel == Error::BadAddress);
    return SelfTests::TestResult::Success;
}

// A clone gets its own copy of every page and every reservation.
SelfTests::TestResult cloneTest() {
    FrameAlloc::FreeListAllocator allocator(testMemoryBase(),
                                            NumTestFrames * PAGE_SIZE);
    Ptr<AddrSpace> const space(*AddrSpace::New(allocator));
    PageAttr const rw(PageAttr::Read | PageAttr::Write | PageAttr::User);
    PageAttr const rx(PageAttr::Read | PageAttr::Exec | PageAttr::User);
    TEST_ASSERT(!space->map(TestAddr, 1, rw, Backing::Eager));
    TEST_ASSERT(!space->map(VirAddr(0x40000000), 1, rx, Backing::Eager));
    TEST_ASSERT(!space->map(TestAddr + PAGE_SIZE, 2, rw, Backing::Lazy));
    u64 const value(0xcafebabe);
    TEST_ASSERT(!space->copyIn(TestAddr, &value, sizeof(value)));

    Res<Ptr<AddrSpace>> const cloneRes(space->clone());
    TEST_ASSERT(cloneRes.ok());
    Ptr<AddrSpace> const copy(*cloneRes);
    TEST_ASSERT(copy->numOwnedFrames() == space->numOwnedFrames());

    Res<Translation> const orig(space->translate(TestAddr));
    Res<Translation> const dup(copy->translate(TestAddr));
    TEST_ASSERT(orig.ok() && dup.ok());
    TEST_ASSERT(orig->addr != dup->addr);
    TEST_ASSERT(u64(dup->attrs) == u64(rw));
    Res<Translation> const code(copy->translate(VirAddr(0x40000000)));
    TEST_ASSERT(code.ok());
    TEST_ASSERT(u64(code->attrs) == u64(rx));

    u64 read(0);
    TEST_ASSERT(!copy->copyOut(&read, TestAddr, sizeof(read)));
    TEST_ASSERT(read == value);
    // Writing the original does not change the copy.
    u64 const other(0x12345678);
    TEST_ASSERT(!space->copyIn(TestAddr, &other, sizeof(other)));
    TEST_ASSERT(!copy->copyOut(&read, TestAddr, sizeof(read)));
    TEST_ASSERT(read == value);

    // The reservation was duplicated but not backed.
    TEST_ASSERT(!copy->translate(TestAddr + PAGE_SIZE));
    TEST_ASSERT(!copy->resolveFault(TestAddr + PAGE_SIZE,
                                    Trap::Access::Load));
    return SelfTests::TestResult::Success;
}

// Destroying an address space gives all of its frames back.
SelfTests::TestResult destroyReleasesFramesTest() {
    FrameAlloc::FreeListAllocator allocator(testMemoryBase(),
                                            NumTestFrames * PAGE_SIZE);
    u64 const freeFrames(allocator.numFreeFrames());
    {
        Ptr<AddrSpace> const space(*AddrSpace::New(allocator));
        PageAttr const rw(PageAttr::Read | PageAttr::Write | PageAttr::User);
        TEST_ASSERT(!space->map(TestAddr, 3, rw, Backing::Eager));
        TEST_ASSERT(!space->map(VirAddr(0x40000000), 2, rw, Backing::Eager));
        TEST_ASSERT(!space->map(TestAddr + 8 * PAGE_SIZE, 2, rw,
                                Backing::Lazy));
        TEST_ASSERT(!space->resolveFault(TestAddr + 8 * PAGE_SIZE,
                                         Trap::Access::Store));
        TEST_ASSERT(allocator.numFreeFrames()
                    == freeFrames - space->numOwnedFrames());
    }
    TEST_ASSERT(allocator.numFreeFrames() == freeFrames);
    return SelfTests::TestResult::Success;
}

// Activation writes satp, the kernel window is mapped in every space.
SelfTests::TestResult activateTest() {
    FrameAlloc::FreeListAllocator allocator(testMemoryBase(),
                                            NumTestFrames * PAGE_SIZE);
    Ptr<AddrSpace> const space(*AddrSpace::New(allocator));
    Cpu::InterruptGuard const guard;
    u64 const origSatp(Cpu::satp());

    TEST_ASSERT(!space->isActive());
    space->activate();
    TEST_ASSERT(space->isActive());
    TEST_ASSERT(Cpu::satp() == space->satpValue());
    TEST_ASSERT((Cpu::satp() >> 60) == 8);
    AddrSpace::deactivate();
    TEST_ASSERT(!space->isActive());

    // The window is shared but not owned.
    Res<Translation> const window(space->translate(VirAddr(USER_SPACE_END)));
    TEST_ASSERT(window.ok());
    TEST_ASSERT(window->attrs & PageAttr::Global);
    TEST_ASSERT(!(window->attrs & PageAttr::User));
    TEST_ASSERT(window->addr == PhyAddr(USER_SPACE_END));
    TEST_ASSERT(space->numOwnedFrames() == 1);

    Cpu::writeSatp(origSatp);
    Cpu::flushTlb();
    return SelfTests::TestResult::Success;
}

// Run paging tests.
void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, mapTranslateUnmapTest);
    RUN_TEST(runner, mapAlreadyMappedTest);
    RUN_TEST(runner, mapInvalidArgumentTest);
    RUN_TEST(runner, unmapIdempotentTest);
    RUN_TEST(runner, mapOutOfMemoryRollbackTest);
    RUN_TEST(runner, lazyResolveFaultTest);
    RUN_TEST(runner, copyInOutTest);
    RUN_TEST(runner, cloneTest);
    RUN_TEST(runner, destroyReleasesFramesTest);
    RUN_TEST(runner, activateTest);
}
}
