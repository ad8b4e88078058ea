// Byte oriented console output. This is the only output device of the kernel,
// it is used for logging and for the write syscall. The implementation is
// provided by the machine layer (SBI console on RISC-V hardware).
#pragma once

#include <util/ints.hpp>

namespace Console {

// Output a single character to the console. Used by the logger.
// @param c: The character to output.
void putChar(char const c);

// Output a buffer of bytes on behalf of a task.
// @param buf: The bytes to output.
// @param len: The number of bytes in `buf`.
void write(u8 const * const buf, u64 const len);
}
