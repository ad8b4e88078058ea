// Cpu functions of the simulated machine, forwarded to the simulated hart.
#include <cpu/cpu.hpp>
#include <sim/hart.hpp>
#include <cstdlib>

namespace Cpu {

u64 satp() {
    return Sim::Hart::instance().satp();
}

void writeSatp(u64 const value) {
    Sim::Hart::instance().writeSatp(value);
}

// The simulated hart walks the page tables on each access, there is no TLB.
void flushTlb() {}

u64 scause() {
    return Sim::Hart::instance().scause();
}

u64 stval() {
    return Sim::Hart::instance().stval();
}

// The simulated hart calls handleTrap() directly.
void installTrapVector() {}

void resumeContext(TrapFrame * const frame) {
    Sim::Hart::instance().resume(frame);
}

u64 idleEntry() {
    return Sim::IdleEntry;
}

void disableInterrupts() {
    Sim::Hart& hart(Sim::Hart::instance());
    hart.writeSstatus(hart.sstatus() & ~Sstatus::SIE);
}

void enableInterrupts() {
    Sim::Hart& hart(Sim::Hart::instance());
    hart.writeSstatus(hart.sstatus() | Sstatus::SIE);
}

bool interruptsEnabled() {
    return Sim::Hart::instance().sstatus() & Sstatus::SIE;
}

u64 time() {
    return Sim::Hart::instance().time();
}

void setTimer(u64 const deadline) {
    Sim::Hart::instance().setTimer(deadline);
}

void enableTimerInterrupts() {
    Sim::Hart::instance().enableTimerInterrupts();
}

// Halting the simulated machine terminates the test run with a failure.
void haltForever() {
    std::_Exit(1);
}

void shutdown() {
    std::_Exit(0);
}
}
