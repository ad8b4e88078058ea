// Console of the virt machine, through the SBI debug console.
#include <console/console.hpp>
#include "sbi.hpp"

namespace Console {

void putChar(char const c) {
    // New-lines must be preceeded by a carriage return.
    if (c == '\n') {
        Sbi::consolePutChar('\r');
    }
    Sbi::consolePutChar(c);
}

void write(u8 const * const buf, u64 const len) {
    for (u64 i(0); i < len; ++i) {
        putChar(static_cast<char>(buf[i]));
    }
}
}
