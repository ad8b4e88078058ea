// System calls. The number is passed in a7, up to six arguments in a0 to a5,
// the result is returned in a0: non-negative on success, a negated error code
// otherwise.
#pragma once

#include <trap/trap.hpp>
#include <util/ints.hpp>
#include <selftests/selftests.hpp>

class Kernel;

namespace Syscall {

// Syscall numbers, following the Linux RISC-V numbering.
enum class Number : u64 {
    // write(fd, buffer, length) -> number of bytes written.
    Write = 64,
    // exit(status). Does not return.
    Exit = 93,
    // sleep(ticks) -> 0.
    Sleep = 101,
    // yield() -> 0.
    Yield = 124,
    // gettime() -> microseconds since reset.
    GetTime = 169,
    // getpid() -> id of the calling task.
    GetPid = 172,
    // fork() -> id of the child in the parent, 0 in the child.
    Fork = 220,
    // wait(pid) -> exit status of the child. pid == -1 waits for any child.
    Wait = 260,
};

// Error codes returned by syscalls.
namespace Errno {
// Bad file descriptor.
static constexpr i64 BadFd = -9;
// No such child.
static constexpr i64 NoChild = -10;
// Task registry full, try again later.
static constexpr i64 Again = -11;
// Out of memory.
static constexpr i64 NoMemory = -12;
// Bad address.
static constexpr i64 Fault = -14;
// Invalid argument.
static constexpr i64 Invalid = -22;
// Unknown syscall.
static constexpr i64 NoSys = -38;
}

// File descriptors accepted by write.
static constexpr u64 StdOut = 1;
static constexpr u64 StdErr = 2;

// Handle a syscall on behalf of the current task. Syscalls may block or exit
// the current task, or request a reschedule.
// @param kernel: The kernel.
// @param call: The syscall number and arguments.
// @return: The result of the syscall. If the task got blocked this is a
// placeholder that the wake up path may overwrite.
i64 handle(Kernel& kernel, Trap::Cause::Syscall const& call);

// Get the name of a syscall, for logging.
// @param number: The syscall number.
// @return: The name, "unknown" if the number is not a syscall.
char const * numberToString(u64 const number);

// Run the syscall tests.
void Test(SelfTests::TestRunner& runner);
}
