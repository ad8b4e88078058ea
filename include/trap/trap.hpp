// Decoding of trap causes.
#pragma once

#include <trap/trapframe.hpp>
#include <util/addr.hpp>
#include <selftests/selftests.hpp>

namespace Trap {

// The kind of memory access that caused a page fault.
enum class Access {
    Load,
    Store,
    Fetch,
};

// Values of scause used by the kernel. Interrupt causes have bit 63 set.
namespace Scause {
static constexpr u64 Interrupt = 1ULL << 63;
static constexpr u64 SupervisorSoftwareInterrupt = 1;
static constexpr u64 SupervisorTimerInterrupt = 5;
static constexpr u64 SupervisorExternalInterrupt = 9;
static constexpr u64 IllegalInstruction = 2;
static constexpr u64 EcallFromUser = 8;
static constexpr u64 InstructionPageFault = 12;
static constexpr u64 LoadPageFault = 13;
static constexpr u64 StorePageFault = 15;
}

// Why the hart trapped into the kernel. Built from scause, stval and the
// trapping context, consumed by the dispatcher within the same trap.
class Cause {
public:
    enum class Kind {
        // ecall from U-mode.
        Syscall,
        TimerInterrupt,
        // Any other interrupt. There are no device drivers, such interrupts
        // are only acknowledged.
        ExternalInterrupt,
        PageFault,
        IllegalInstruction,
        // Any other exception, e.g. breakpoint, misaligned or access fault,
        // ecall from S-mode.
        OtherException,
    };

    // Payload of a Syscall.
    struct Syscall {
        // Syscall number, from a7.
        u64 number;
        // Arguments, from a0 to a5.
        u64 args[6];
    };

    // Payload of a PageFault.
    struct PageFault {
        VirAddr address;
        Access access;
    };

    // Payload of IllegalInstruction and OtherException.
    struct Exception {
        // The value of scause.
        u64 code;
        // The value of stval.
        u64 tval;
    };

    // Decode a trap.
    // @param scause: The value of scause.
    // @param stval: The value of stval.
    // @param frame: The context saved on trap entry.
    // @return: The decoded cause.
    static Cause decode(u64 const scause,
                        u64 const stval,
                        TrapFrame const& frame);

    Kind kind() const;

    // Check if this cause is an interrupt, as opposed to an exception.
    bool isInterrupt() const;

    // Access the payload. The kind must match.
    Syscall const& syscall() const;
    PageFault const& pageFault() const;
    Exception const& exception() const;

private:
    Cause(Kind const kind);

    Kind m_kind;
    union {
        Syscall m_syscall;
        PageFault m_pageFault;
        Exception m_exception;
    };
};

// Get a printable name for a kind of trap.
// @param kind: The kind.
// @return: The name of the kind.
char const * kindToString(Cause::Kind const kind);

// Run the trap decoding tests.
void Test(SelfTests::TestRunner& runner);
}
