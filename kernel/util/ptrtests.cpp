// Tests for the Ptr<T> smart pointer.
#include <util/ptr.hpp>
#include <selftests/macros.hpp>

namespace SmartPtr {

// Number of Node objects constructed and destroyed since the last reset.
static u64 numConstructed = 0;
static u64 numDestroyed = 0;

class Node {
public:
    Node(u64 const id) : id(id) {
        numConstructed++;
    }

    virtual ~Node() {
        numDestroyed++;
    }

    u64 id;
};

// Subclass of Node, used to check conversion from Ptr<Derived> to Ptr<Node>.
class Derived : public Node {
public:
    Derived(u64 const id, u64 const extra) : Node(id), extra(extra) {}

    u64 extra;
};

// The reference count follows copies and destruction of Ptr<T>, the object is
// freed with its last reference.
SelfTests::TestResult smartPtrRefCountTest() {
    numConstructed = 0;
    numDestroyed = 0;
    {
        Ptr<Node> const first(Ptr<Node>::New(7));
        TEST_ASSERT(numConstructed == 1);
        TEST_ASSERT(first.refCount() == 1);
        TEST_ASSERT(first->id == 7);
        {
            Ptr<Node> const second(first);
            TEST_ASSERT(first.refCount() == 2);
            TEST_ASSERT(second.raw() == first.raw());
        }
        TEST_ASSERT(first.refCount() == 1);
        TEST_ASSERT(!numDestroyed);
    }
    TEST_ASSERT(numDestroyed == 1);
    return SelfTests::TestResult::Success;
}

// Assignment drops the old reference, including when a Ptr<T> is assigned to
// itself.
SelfTests::TestResult smartPtrAssignTest() {
    numConstructed = 0;
    numDestroyed = 0;
    {
        Ptr<Node> a(Ptr<Node>::New(1));
        Ptr<Node> b(Ptr<Node>::New(2));
        a = b;
        TEST_ASSERT(numDestroyed == 1);
        TEST_ASSERT(a->id == 2);
        TEST_ASSERT(b.refCount() == 2);

        // Self-assignment keeps the reference.
        Ptr<Node>& alias(a);
        a = alias;
        TEST_ASSERT(!!a);
        TEST_ASSERT(a.refCount() == 2);
        TEST_ASSERT(b.refCount() == 2);
        TEST_ASSERT(a->id == 2);
        TEST_ASSERT(numDestroyed == 1);

        a.clear();
        TEST_ASSERT(!a);
        TEST_ASSERT(b.refCount() == 1);
    }
    TEST_ASSERT(numDestroyed == 2);
    return SelfTests::TestResult::Success;
}

// Null pointers and conversion to a base class.
SelfTests::TestResult smartPtrNullAndBaseTest() {
    numConstructed = 0;
    numDestroyed = 0;
    Ptr<Node> null;
    TEST_ASSERT(!null);
    TEST_ASSERT(!null.raw());
    {
        Ptr<Derived> const derived(Ptr<Derived>::New(3, 4));
        null = derived;
        TEST_ASSERT(!!null);
        TEST_ASSERT(null->id == 3);
        TEST_ASSERT(derived.refCount() == 2);
    }
    TEST_ASSERT(!numDestroyed);
    null.clear();
    TEST_ASSERT(numDestroyed == 1);
    return SelfTests::TestResult::Success;
}

// Run the tests for the Ptr<T> type.
void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, smartPtrRefCountTest);
    RUN_TEST(runner, smartPtrAssignTest);
    RUN_TEST(runner, smartPtrNullAndBaseTest);
}
}
