// Functions to directly interact with the hart: CSRs, interrupts, timer and
// privilege transitions. This is the boundary between the kernel and the
// machine it runs on, each machine target implements it in its own cpu.cpp.

#pragma once
#include <util/ints.hpp>
#include <selftests/selftests.hpp>

struct TrapFrame;

namespace Cpu {

// Run the tests under this namespace.
void Test(SelfTests::TestRunner& runner);

// Bits of the sstatus CSR used by the kernel.
namespace Sstatus {
// Supervisor Interrupt Enable.
static constexpr u64 SIE = 1ULL << 1;
// Value of SIE before the last trap, restored by sret.
static constexpr u64 SPIE = 1ULL << 5;
// Privilege before the last trap, 1 == S-mode. sret returns to that mode.
static constexpr u64 SPP = 1ULL << 8;
}

// #############################################################################
// Address translation.
// #############################################################################

// Read the satp CSR.
// @return: The current value of satp.
u64 satp();

// Write the satp CSR. This does not flush the TLB.
// @param value: The value to write.
void writeSatp(u64 const value);

// Flush all TLB entries of the hart (sfence.vma).
void flushTlb();

// #############################################################################
// Trap state.
// #############################################################################

// Read the cause of the last trap.
// @return: The value of scause.
u64 scause();

// Read the trap value of the last trap, e.g. the faulting address of a page
// fault.
// @return: The value of stval.
u64 stval();

// Point the trap vector (stvec) to the kernel's trap entry.
void installTrapVector();

// Restore the context saved in a trap frame and return to it through sret.
// The frame is set as the target of the next trap entry (sscratch). This never
// returns on hardware, on the simulated hart it loads the context and returns.
// @param frame: The context to resume.
void resumeContext(TrapFrame * const frame);

// Get the address of the idle loop, where the idle task starts.
// @return: The address of the idle loop.
u64 idleEntry();

// #############################################################################
// Interrupts.
// #############################################################################

// Disable interrupts on the hart.
void disableInterrupts();
// Enable interrupts on the hart.
void enableInterrupts();
// Check if the interrupts are enabled on this hart.
// @return: true if the interrupts are enabled, false otherwise.
bool interruptsEnabled();

// Disable interrupts for the lifetime of the guard, then restore the previous
// state.
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(InterruptGuard const&) = delete;
    InterruptGuard& operator=(InterruptGuard const&) = delete;

private:
    // Were the interrupts enabled when the guard was created?
    bool const m_savedState;
};

// #############################################################################
// Timer.
// #############################################################################

// Read the time CSR.
// @return: The number of timer cycles since reset.
u64 time();

// Program the next timer interrupt. This also clears a pending timer interrupt.
// @param deadline: The value of time() at which the interrupt fires.
void setTimer(u64 const deadline);

// Unmask timer interrupts (sie.STIE).
void enableTimerInterrupts();

// #############################################################################
// Power.
// #############################################################################

// Stop executing forever. THIS DOES NOT RETURN.
[[noreturn]] void haltForever();

// Power off the machine. THIS DOES NOT RETURN.
[[noreturn]] void shutdown();

}
