// Tests for the heap allocation functions.
#include "heapallocator.hpp"
#include <memory/malloc.hpp>
#include <memory/stack.hpp>
#include <selftests/macros.hpp>

namespace HeapAlloc {

// Memory given to the heap allocator under test.
alignas(16) static u8 TestHeapMemory[2 * PAGE_SIZE];

// Alloc, free, re-use of freed blocks and statistics.
SelfTests::TestResult heapAllocatorAllocFreeTest() {
    HeapAllocator allocator;
    TEST_ASSERT(!allocator.alloc(1));
    allocator.addMemory(TestHeapMemory, PAGE_SIZE);
    TEST_ASSERT(allocator.totalBytes() == PAGE_SIZE);
    TEST_ASSERT(allocator.availableBytes() == PAGE_SIZE);
    TEST_ASSERT(!allocator.usedBytes());

    u64 const metaSize(sizeof(HeapAllocator::Metadata));
    Res<void*> const alloc1(allocator.alloc(10));
    TEST_ASSERT(alloc1.ok());
    TEST_ASSERT(!(reinterpret_cast<u64>(*alloc1) % 16));
    // 10 bytes are rounded up to 16.
    TEST_ASSERT(allocator.usedBytes() == 16 + metaSize);
    Res<void*> const alloc2(allocator.alloc(10));
    TEST_ASSERT(alloc2.ok());
    TEST_ASSERT(*alloc1 != *alloc2);

    // Blocks are carved from the end of the heap, the last freed block is
    // handed out again.
    allocator.free(*alloc2);
    Res<void*> const alloc3(allocator.alloc(16));
    TEST_ASSERT(alloc3.ok());
    TEST_ASSERT(*alloc3 == *alloc2);
    allocator.free(*alloc1);
    allocator.free(*alloc3);
    TEST_ASSERT(!allocator.usedBytes());

    // Too big for the heap, fits once more memory is added.
    Res<void*> const big(allocator.alloc(PAGE_SIZE));
    TEST_ASSERT(!big);
    TEST_ASSERT(big.error() == Error::OutOfHeapMemory);
    allocator.addMemory(TestHeapMemory + PAGE_SIZE, PAGE_SIZE);
    TEST_ASSERT(allocator.totalBytes() == 2 * PAGE_SIZE);
    Res<void*> const big2(allocator.alloc(PAGE_SIZE));
    TEST_ASSERT(big2.ok());
    TEST_ASSERT(allocator.usedBytes() == PAGE_SIZE + metaSize);
    allocator.free(*big2);
    TEST_ASSERT(allocator.availableBytes() == 2 * PAGE_SIZE);
    return SelfTests::TestResult::Success;
}

// Zero-sized allocations still return distinct pointers.
SelfTests::TestResult heapAllocatorZeroSizeTest() {
    HeapAllocator allocator;
    allocator.addMemory(TestHeapMemory, PAGE_SIZE);
    Res<void*> const a(allocator.alloc(0));
    Res<void*> const b(allocator.alloc(0));
    TEST_ASSERT(a.ok() && b.ok());
    TEST_ASSERT(*a != *b);
    allocator.free(*a);
    allocator.free(*b);
    allocator.free(nullptr);
    TEST_ASSERT(!allocator.usedBytes());

    // Sizes that would wrap around once rounded up are rejected.
    Res<void*> const huge(allocator.alloc(~0ULL - 8));
    TEST_ASSERT(!huge);
    TEST_ASSERT(huge.error() == Error::OutOfHeapMemory);
    TEST_ASSERT(!allocator.alloc(~0ULL));
    TEST_ASSERT(!allocator.usedBytes());
    return SelfTests::TestResult::Success;
}

// The global heap gives its memory back once a kernel stack is destroyed.
SelfTests::TestResult kernelStackTest() {
    u64 const usedBefore(usedBytes());
    {
        Res<Ptr<Memory::Stack>> const res(Memory::Stack::New());
        TEST_ASSERT(res.ok());
        Ptr<Memory::Stack> const& stack(*res);
        TEST_ASSERT(stack->highAddress() - stack->lowAddress()
                    == Memory::Stack::Size);
        TEST_ASSERT(!(stack->highAddress().raw() % 16));
        TEST_ASSERT(usedBytes() > usedBefore);

        // Overwriting the lowest word, as an overflow would, breaks the
        // canary.
        TEST_ASSERT(stack->isIntact());
        u64 * const bottom(stack->lowAddress().ptr<u64>());
        u64 const canary(*bottom);
        *bottom = 0;
        TEST_ASSERT(!stack->isIntact());
        *bottom = canary;
        TEST_ASSERT(stack->isIntact());
    }
    TEST_ASSERT(usedBytes() == usedBefore);
    return SelfTests::TestResult::Success;
}

// Run heap allocation tests.
void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, heapAllocatorAllocFreeTest);
    RUN_TEST(runner, heapAllocatorZeroSizeTest);
    RUN_TEST(runner, kernelStackTest);
}
}
