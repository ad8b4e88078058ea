#include <memory/stack.hpp>
#include <memory/malloc.hpp>
#include <logging/log.hpp>
#include <util/assert.hpp>

namespace Memory {

// Allocate a new stack.
// @return: A pointer to the Stack instance associated with the allocated
// stack or an error, if any.
Res<Ptr<Stack>> Stack::New() {
    Res<void*> const allocRes(HeapAlloc::malloc(Size));
    if (!allocRes) {
        return allocRes.error();
    }
    VirAddr const low(*allocRes);
    Log::debug("Allocated kernel stack {}-{}", low, low + Size);
    return Ptr<Stack>::New(low);
}

// De-allocate the associated memory upon destruction.
Stack::~Stack() {
    HeapAlloc::free(m_low.ptr<void>());
}

VirAddr Stack::lowAddress() const {
    return m_low;
}

VirAddr Stack::highAddress() const {
    return m_low + Size;
}

// Check the canary at the bottom of the stack.
bool Stack::isIntact() const {
    return *m_low.ptr<u64 const>() == Canary;
}

Stack::Stack(VirAddr const low) : m_low(low) {
    // The RISC-V ABI requires a 16-byte aligned stack pointer.
    ASSERT(!(low.raw() % 16));
    *m_low.ptr<u64>() = Canary;
}
}
