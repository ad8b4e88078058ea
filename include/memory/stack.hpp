// Kernel stacks.
#pragma once
#include <util/addr.hpp>
#include <util/result.hpp>
#include <util/ptr.hpp>

namespace Memory {

// A kernel stack allocated from the kernel heap. Each task owns one, the trap
// vector switches to it when the task traps into the kernel. The memory is
// released when the Stack is destroyed.
// A Stack instance has ownership of the memory it covers. As such the type is
// non-copyable and non-copy-assignable.
class Stack {
public:
    // Size of a kernel stack in bytes.
    static constexpr u64 Size = 4 * PAGE_SIZE;

    // Allocate a new stack.
    // @return: A pointer to the Stack instance associated with the allocated
    // stack or an error, if any.
    static Res<Ptr<Stack>> New();

    // De-allocate the associated memory upon destruction.
    ~Stack();

    Stack(Stack const&) = delete;
    Stack& operator=(Stack const&) = delete;
    Stack(Stack&&) = delete;
    Stack& operator=(Stack&&) = delete;

    // Get the low or high address of this stack. The high address is one past
    // the last byte and is the initial value of the stack pointer.
    VirAddr lowAddress() const;
    VirAddr highAddress() const;

    // Check the canary at the bottom of the stack. A stack that overflowed at
    // some point most likely overwrote it.
    // @return: true if the canary is intact, false otherwise.
    bool isIntact() const;

private:
    // Create a Stack instance.
    // @param low: Low address of the stack.
    Stack(VirAddr const low);

    // Needed to access private constructor.
    friend Ptr<Stack>;

    // Value written at the lowest address of each stack.
    static constexpr u64 Canary = 0x57ac4ca9a27c0de5;

    // Lowest address contained in the stack.
    VirAddr m_low;
};
}
