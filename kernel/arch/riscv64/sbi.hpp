// Calls to the Supervisor Binary Interface implementation (OpenSBI), running in
// M-mode below the kernel.
#pragma once

#include <util/ints.hpp>

namespace Sbi {

// Output a character on the debug console (legacy console extension).
// @param c: The character.
void consolePutChar(char const c);

// Program the timer (TIME extension). Clears the pending timer interrupt.
// @param deadline: The value of the time CSR at which the interrupt fires.
void setTimer(u64 const deadline);

// Power off the machine (SRST extension). Returns only if the reset failed.
void shutdown();
}
