// Cpu functions of the RISC-V hart.
#include <cpu/cpu.hpp>
#include "sbi.hpp"

// Defined in trap.S.
extern "C" void trapVector();
extern "C" [[noreturn]] void trapReturn(TrapFrame * const frame);
extern "C" void idleLoop();

namespace Cpu {

// Bit of sie enabling supervisor timer interrupts.
static constexpr u64 SieStie = 1ULL << 5;

u64 satp() {
    u64 value;
    asm volatile("csrr %0, satp" : "=r"(value));
    return value;
}

void writeSatp(u64 const value) {
    asm volatile("csrw satp, %0" : : "r"(value) : "memory");
}

void flushTlb() {
    asm volatile("sfence.vma zero, zero" : : : "memory");
}

u64 scause() {
    u64 value;
    asm volatile("csrr %0, scause" : "=r"(value));
    return value;
}

u64 stval() {
    u64 value;
    asm volatile("csrr %0, stval" : "=r"(value));
    return value;
}

void installTrapVector() {
    // Direct mode, all traps go to trapVector.
    u64 const addr(reinterpret_cast<u64>(&trapVector));
    asm volatile("csrw stvec, %0" : : "r"(addr));
    // No trap frame until the first context is resumed.
    asm volatile("csrw sscratch, zero");
}

void resumeContext(TrapFrame * const frame) {
    trapReturn(frame);
}

u64 idleEntry() {
    return reinterpret_cast<u64>(&idleLoop);
}

void disableInterrupts() {
    asm volatile("csrc sstatus, %0" : : "r"(Sstatus::SIE) : "memory");
}

void enableInterrupts() {
    asm volatile("csrs sstatus, %0" : : "r"(Sstatus::SIE) : "memory");
}

bool interruptsEnabled() {
    u64 value;
    asm volatile("csrr %0, sstatus" : "=r"(value));
    return value & Sstatus::SIE;
}

u64 time() {
    u64 value;
    asm volatile("rdtime %0" : "=r"(value));
    return value;
}

void setTimer(u64 const deadline) {
    Sbi::setTimer(deadline);
}

void enableTimerInterrupts() {
    asm volatile("csrs sie, %0" : : "r"(SieStie));
}

void haltForever() {
    disableInterrupts();
    while (true) {
        asm volatile("wfi");
    }
}

void shutdown() {
    Sbi::shutdown();
    // Still there, the SBI does not implement SRST.
    haltForever();
}
}
