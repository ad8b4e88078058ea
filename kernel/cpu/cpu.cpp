// Machine independent parts of the Cpu namespace.

#include <cpu/cpu.hpp>

namespace Cpu {

InterruptGuard::InterruptGuard() : m_savedState(interruptsEnabled()) {
    disableInterrupts();
}

InterruptGuard::~InterruptGuard() {
    if (m_savedState) {
        enableInterrupts();
    }
}
}
