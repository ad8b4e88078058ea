// Guard functions expected by GCC around the construction of local static
// variables. The kernel runs on a single hart and static objects are only
// constructed with interrupts disabled, no other context can race on a guard.
#include <util/ints.hpp>
#include <util/panic.hpp>

namespace __cxxabiv1 {

// C++ ABI requires a 64-bit type for the guard. The first byte is set once the
// object is initialized, the second while it is being initialized.
using __guard = u64;

// Return 1 if the object under the guard needs to be initialized, 0 otherwise.
extern "C" int __cxa_guard_acquire(__guard *g) {
    u8 * const bytes(reinterpret_cast<u8*>(g));
    if (!!bytes[0]) {
        return 0;
    } else if (!!bytes[1]) {
        PANIC("Recursive initialization of a static variable");
    }
    bytes[1] = 1;
    return 1;
}

extern "C" void __cxa_guard_release(__guard *g) {
    u8 * const bytes(reinterpret_cast<u8*>(g));
    bytes[0] = 1;
    bytes[1] = 0;
}

// The initialization threw, which never happens without exceptions.
extern "C" void __cxa_guard_abort(__guard *g) {
    reinterpret_cast<u8*>(g)[1] = 0;
}
}
