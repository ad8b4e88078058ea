// Console of the simulated machine. Characters go to the host's stderr, bytes
// written by tasks are also recorded for tests to inspect.
#include <console/console.hpp>
#include <sim/hart.hpp>
#include <cstdio>

// Capacity of the capture buffer. Bytes past the capacity are dropped.
static constexpr u64 OutputCapacity = 4096;

static char Output[OutputCapacity + 1];
static u64 OutputLength = 0;

namespace Console {

void putChar(char const c) {
    std::fputc(c, stderr);
}

void write(u8 const * const buf, u64 const len) {
    for (u64 i(0); i < len; ++i) {
        if (OutputLength < OutputCapacity) {
            Output[OutputLength++] = static_cast<char>(buf[i]);
        }
        putChar(static_cast<char>(buf[i]));
    }
    Output[OutputLength] = '\0';
}
}

namespace Sim {

char const * consoleOutput() {
    return Output;
}

u64 consoleOutputLength() {
    return OutputLength;
}

void clearConsoleOutput() {
    OutputLength = 0;
    Output[0] = '\0';
}
}
