// Data structure tests.
#include <datastruct/datastruct.hpp>
#include <datastruct/freelist.hpp>
#include <datastruct/list.hpp>
#include <datastruct/queue.hpp>
#include <datastruct/vector.hpp>
#include <selftests/macros.hpp>

namespace DataStruct {

// Regions inserted out of order are kept sorted and adjacent regions merge,
// including a region bridging two others.
SelfTests::TestResult embeddedFreeListInsertMergeTest() {
    alignas(16) u8 buf[256];
    VirAddr const base(buf);
    EmbeddedFreeList freeList;
    TEST_ASSERT(!freeList.freeBytes());

    freeList.insert(base + 192, 64);
    freeList.insert(base, 64);
    TEST_ASSERT(freeList.numRegions() == 2);
    TEST_ASSERT(freeList.freeBytes() == 128);

    // Adjacent to the first region only.
    freeList.insert(base + 64, 32);
    TEST_ASSERT(freeList.numRegions() == 2);
    // Bridges both regions.
    freeList.insert(base + 96, 96);
    TEST_ASSERT(freeList.numRegions() == 1);
    TEST_ASSERT(freeList.freeBytes() == 256);
    return SelfTests::TestResult::Success;
}

// Allocations are carved from the end of the first fitting region, freeing
// them restores a single region.
SelfTests::TestResult embeddedFreeListAllocFreeTest() {
    alignas(16) u8 buf[256];
    VirAddr const base(buf);
    EmbeddedFreeList freeList;
    freeList.insert(base, 256);

    Res<VirAddr> const a(freeList.alloc(64));
    TEST_ASSERT(a.ok());
    TEST_ASSERT(*a == base + 192);
    // Sizes are rounded up to MinAllocSize.
    Res<VirAddr> const b(freeList.alloc(5));
    TEST_ASSERT(b.ok());
    TEST_ASSERT(*b == base + 192 - EmbeddedFreeList::MinAllocSize);
    TEST_ASSERT(freeList.freeBytes() == 256 - 64 - 16);

    // Too big.
    Res<VirAddr> const c(freeList.alloc(512));
    TEST_ASSERT(!c);
    TEST_ASSERT(c.error() == Error::OutOfHeapMemory);

    freeList.free(*a, 64);
    TEST_ASSERT(freeList.numRegions() == 2);
    freeList.free(*b, 5);
    TEST_ASSERT(freeList.numRegions() == 1);
    TEST_ASSERT(freeList.freeBytes() == 256);

    // Consuming a region entirely removes it from the list.
    Res<VirAddr> const all(freeList.alloc(256));
    TEST_ASSERT(all.ok());
    TEST_ASSERT(*all == base);
    TEST_ASSERT(!freeList.numRegions());
    TEST_ASSERT(!freeList.alloc(16));
    return SelfTests::TestResult::Success;
}

// Aligned allocations split a region in three.
SelfTests::TestResult embeddedFreeListAlignedAllocTest() {
    alignas(256) u8 buf[512];
    VirAddr const base(buf);
    EmbeddedFreeList freeList;
    freeList.insert(base + 16, 400);

    Res<VirAddr> const a(freeList.alloc(64, 256));
    TEST_ASSERT(a.ok());
    TEST_ASSERT(*a == base + 256);
    TEST_ASSERT(freeList.numRegions() == 2);
    TEST_ASSERT(freeList.freeBytes() == 400 - 64);

    // Not enough room before an aligned address for the next one.
    TEST_ASSERT(!freeList.alloc(256, 256));
    freeList.free(*a, 64);
    TEST_ASSERT(freeList.numRegions() == 1);
    return SelfTests::TestResult::Success;
}

// Push, pop, iterate and erase on a List.
SelfTests::TestResult listTest() {
    List<u64> list;
    TEST_ASSERT(list.empty());
    for (u64 i(0); i < 5; ++i) {
        list.pushBack(i);
    }
    TEST_ASSERT(list.size() == 5);
    TEST_ASSERT(list.front() == 0);
    TEST_ASSERT(list.back() == 4);

    // Erase the odd values.
    for (auto ite(list.begin()); ite != list.end();) {
        if (*ite % 2) {
            ite = list.erase(ite);
        } else {
            ++ite;
        }
    }
    TEST_ASSERT(list.size() == 3);
    u64 expected(0);
    for (u64 const value : list) {
        TEST_ASSERT(value == expected);
        expected += 2;
    }

    List<u64> const copy(list);
    TEST_ASSERT(copy.size() == 3);
    TEST_ASSERT(list.popFront() == 0);
    TEST_ASSERT(copy.front() == 0);
    list.clear();
    TEST_ASSERT(list.empty());
    return SelfTests::TestResult::Success;
}

// FIFO order and removal from the middle of a Queue.
SelfTests::TestResult queueTest() {
    Queue<u64> queue;
    TEST_ASSERT(queue.empty());
    queue.enqueue(10);
    queue.enqueue(20);
    queue.enqueue(30);
    queue.enqueue(40);
    TEST_ASSERT(queue.size() == 4);
    TEST_ASSERT(queue.front() == 10);
    TEST_ASSERT(queue.back() == 40);

    TEST_ASSERT(queue.remove(30));
    TEST_ASSERT(!queue.remove(30));
    TEST_ASSERT(!queue.contains(30));
    TEST_ASSERT(queue.contains(40));
    TEST_ASSERT(queue.size() == 3);

    TEST_ASSERT(queue.dequeue() == 10);
    TEST_ASSERT(queue.dequeue() == 20);
    TEST_ASSERT(queue.dequeue() == 40);
    TEST_ASSERT(queue.empty());
    return SelfTests::TestResult::Success;
}

// Sized construction, growth and erase on a Vector.
SelfTests::TestResult vectorTest() {
    Vector<u64> vec(3);
    TEST_ASSERT(vec.size() == 3);
    for (u64 const value : vec) {
        TEST_ASSERT(!value);
    }
    // Force a couple of reallocations.
    for (u64 i(0); i < 30; ++i) {
        vec.pushBack(i + 100);
    }
    TEST_ASSERT(vec.size() == 33);
    TEST_ASSERT(vec.capacity() >= 33);
    TEST_ASSERT(vec[3] == 100);
    TEST_ASSERT(vec[32] == 129);

    vec.erase(0);
    TEST_ASSERT(vec.size() == 32);
    TEST_ASSERT(vec[2] == 100);

    Vector<u64> copy;
    copy = vec;
    TEST_ASSERT(copy.size() == 32);
    TEST_ASSERT(copy[31] == 129);
    vec.clear();
    TEST_ASSERT(vec.empty());
    TEST_ASSERT(copy.size() == 32);
    return SelfTests::TestResult::Success;
}

// Run the data structure tests.
void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, embeddedFreeListInsertMergeTest);
    RUN_TEST(runner, embeddedFreeListAllocFreeTest);
    RUN_TEST(runner, embeddedFreeListAlignedAllocTest);
    RUN_TEST(runner, listTest);
    RUN_TEST(runner, queueTest);
    RUN_TEST(runner, vectorTest);
}
}
