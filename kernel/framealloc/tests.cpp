// Test for FrameAlloc namespace.
#include <framealloc/framealloc.hpp>
#include <selftests/macros.hpp>

namespace FrameAlloc {

// Backing memory for the allocators under test.
static constexpr u64 NumTestFrames = 8;
alignas(PAGE_SIZE) static u8 TestMemory[(NumTestFrames + 1) * PAGE_SIZE];

// Allocate every frame of an allocator, check that they all come from the
// managed range, are zeroed, and that the allocator can then be refilled.
SelfTests::TestResult freeListAllocatorAllocFreeTest() {
    PhyAddr const base(reinterpret_cast<u64>(TestMemory));
    FreeListAllocator allocator(base, NumTestFrames * PAGE_SIZE);
    TEST_ASSERT(allocator.numFrames() == NumTestFrames);
    TEST_ASSERT(allocator.numFreeFrames() == NumTestFrames);

    Frame frames[NumTestFrames];
    // Repeat twice to make sure the frames come back after being freed.
    for (u64 run(0); run < 2; ++run) {
        for (u64 i(0); i < NumTestFrames; ++i) {
            Res<Frame> const res(allocator.alloc());
            TEST_ASSERT(res.ok());
            PhyAddr const addr(res->addr());
            TEST_ASSERT(addr.isPageAligned());
            TEST_ASSERT(base <= addr);
            TEST_ASSERT(addr < base + NumTestFrames * PAGE_SIZE);
            u64* const words(addr.toVir().ptr<u64>());
            for (u64 j(0); j < PAGE_SIZE / sizeof(u64); ++j) {
                TEST_ASSERT(!words[j]);
            }
            // Dirty the frame, the next allocation must zero it again.
            words[3] = 0xdeadbeef;
            frames[i] = *res;
        }
        TEST_ASSERT(!allocator.numFreeFrames());
        Res<Frame> const oom(allocator.alloc());
        TEST_ASSERT(!oom);
        TEST_ASSERT(oom.error() == Error::OutOfPhysicalMemory);

        // Free odd frames first to exercise merging out of order.
        for (u64 i(1); i < NumTestFrames; i += 2) {
            allocator.free(frames[i]);
        }
        for (u64 i(0); i < NumTestFrames; i += 2) {
            allocator.free(frames[i]);
        }
        TEST_ASSERT(allocator.numFreeFrames() == NumTestFrames);
    }
    return SelfTests::TestResult::Success;
}

// Only the frames fully contained in a misaligned range are managed.
SelfTests::TestResult freeListAllocatorUnalignedRangeTest() {
    PhyAddr const base(reinterpret_cast<u64>(TestMemory) + 100);
    FreeListAllocator allocator(base, 3 * PAGE_SIZE);
    TEST_ASSERT(allocator.numFrames() == 2);
    Res<Frame> const res(allocator.alloc());
    TEST_ASSERT(res.ok());
    TEST_ASSERT(base < res->addr());

    FreeListAllocator empty(base, PAGE_SIZE);
    TEST_ASSERT(!empty.numFrames());
    TEST_ASSERT(!empty.alloc());
    return SelfTests::TestResult::Success;
}

// Run the frame allocation tests.
void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, freeListAllocatorAllocFreeTest);
    RUN_TEST(runner, freeListAllocatorUnalignedRangeTest);
}
}
