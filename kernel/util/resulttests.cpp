// Tests for the Res<T> type.
#include <util/result.hpp>
#include <selftests/macros.hpp>

namespace Result {

// Number of live Tracked objects, updated by its constructors and destructor.
static i64 liveTracked = 0;
// Number of copies made of a Tracked object since the last reset.
static u64 numCopies = 0;

// Value type keeping track of how many instances are alive and how many copies
// were made.
class Tracked {
public:
    Tracked() : m_a(0), m_b(0) {
        liveTracked++;
    }

    Tracked(u64 const a, u64 const b) : m_a(a), m_b(b) {
        liveTracked++;
    }

    Tracked(Tracked const& other) : m_a(other.m_a), m_b(other.m_b) {
        liveTracked++;
        numCopies++;
    }

    ~Tracked() {
        liveTracked--;
    }

    u64 sum() const {
        return m_a + m_b;
    }

private:
    u64 m_a;
    u64 m_b;
};

// Helper returning either a value or an error depending on its input.
// @param fail: If true return an error.
// @return: Error::NotFound if fail is true, Tracked(2, 3) otherwise.
static Res<Tracked> lookupHelper(bool const fail) {
    if (fail) {
        return Error::NotFound;
    }
    return Tracked(2, 3);
}

// Check ok(), the bool conversion, value() and error().
SelfTests::TestResult resultValueOrErrorTest() {
    Res<u64> const withValue(0xcafe);
    TEST_ASSERT(withValue.ok());
    TEST_ASSERT(!!withValue);
    TEST_ASSERT(withValue.value() == 0xcafe);
    TEST_ASSERT(*withValue == 0xcafe);

    Res<u64> const withError(Error::NotMapped);
    TEST_ASSERT(!withError.ok());
    TEST_ASSERT(!withError);
    TEST_ASSERT(withError.error() == Error::NotMapped);

    Res<u64> const defaulted;
    TEST_ASSERT(defaulted.ok());
    TEST_ASSERT(defaulted.value() == 0);
    return SelfTests::TestResult::Success;
}

// A Res<T> built in-place constructs its value exactly once and destroys it
// with itself. A Res<T> holding an error never constructs a value.
SelfTests::TestResult resultLifetimeTest() {
    liveTracked = 0;
    numCopies = 0;
    {
        Res<Tracked> const inPlace(10, 20);
        TEST_ASSERT(liveTracked == 1);
        TEST_ASSERT(!numCopies);
        TEST_ASSERT(inPlace->sum() == 30);

        Res<Tracked> const err(Error::OutOfHeapMemory);
        TEST_ASSERT(liveTracked == 1);
    }
    TEST_ASSERT(liveTracked == 0);
    return SelfTests::TestResult::Success;
}

// Copying a Res<T> copies the value, or the error, it contains.
SelfTests::TestResult resultCopyTest() {
    liveTracked = 0;
    numCopies = 0;
    {
        Res<Tracked> const orig(1, 2);
        Res<Tracked> const copy(orig);
        TEST_ASSERT(copy.ok());
        TEST_ASSERT(copy->sum() == 3);
        TEST_ASSERT(numCopies == 1);
        TEST_ASSERT(liveTracked == 2);

        Res<Tracked> const origErr(Error::RegistryFull);
        Res<Tracked> const copyErr(origErr);
        TEST_ASSERT(!copyErr.ok());
        TEST_ASSERT(copyErr.error() == Error::RegistryFull);
        TEST_ASSERT(liveTracked == 2);
    }
    TEST_ASSERT(liveTracked == 0);
    return SelfTests::TestResult::Success;
}

// Res<T> returned from a function.
SelfTests::TestResult resultReturnTest() {
    liveTracked = 0;
    {
        Res<Tracked> const good(lookupHelper(false));
        TEST_ASSERT(good.ok());
        TEST_ASSERT(good->sum() == 5);
        Res<Tracked> const bad(lookupHelper(true));
        TEST_ASSERT(!bad);
        TEST_ASSERT(bad.error() == Error::NotFound);
    }
    TEST_ASSERT(liveTracked == 0);
    return SelfTests::TestResult::Success;
}

// Run the tests for the Res<T> type.
void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, resultValueOrErrorTest);
    RUN_TEST(runner, resultLifetimeTest);
    RUN_TEST(runner, resultCopyTest);
    RUN_TEST(runner, resultReturnTest);
}
}
