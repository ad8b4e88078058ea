// Decoding of trap causes.

#include <trap/trap.hpp>
#include <util/assert.hpp>
#include <util/panic.hpp>

namespace Trap {

Cause::Cause(Kind const kind) : m_kind(kind), m_exception{0, 0} {}

// Decode a trap.
// @param scause: The value of scause.
// @param stval: The value of stval.
// @param frame: The context saved on trap entry.
// @return: The decoded cause.
Cause Cause::decode(u64 const scause, u64 const stval, TrapFrame const& frame) {
    u64 const code(scause & ~Scause::Interrupt);
    if (scause & Scause::Interrupt) {
        if (code == Scause::SupervisorTimerInterrupt) {
            return Cause(Kind::TimerInterrupt);
        }
        Cause res(Kind::ExternalInterrupt);
        res.m_exception = Exception{scause, stval};
        return res;
    }

    switch (code) {
        case Scause::EcallFromUser: {
            Cause res(Kind::Syscall);
            res.m_syscall.number = frame.x[Reg::A7];
            for (u64 i(0); i < 6; ++i) {
                res.m_syscall.args[i] = frame.x[Reg::A0 + i];
            }
            return res;
        }
        case Scause::InstructionPageFault:
        case Scause::LoadPageFault:
        case Scause::StorePageFault: {
            Cause res(Kind::PageFault);
            Access const access(
                (code == Scause::InstructionPageFault) ? Access::Fetch :
                (code == Scause::LoadPageFault) ? Access::Load : Access::Store);
            res.m_pageFault = PageFault{VirAddr(stval), access};
            return res;
        }
        case Scause::IllegalInstruction: {
            Cause res(Kind::IllegalInstruction);
            res.m_exception = Exception{scause, stval};
            return res;
        }
        default: {
            Cause res(Kind::OtherException);
            res.m_exception = Exception{scause, stval};
            return res;
        }
    }
}

Cause::Kind Cause::kind() const {
    return m_kind;
}

bool Cause::isInterrupt() const {
    return m_kind == Kind::TimerInterrupt || m_kind == Kind::ExternalInterrupt;
}

Cause::Syscall const& Cause::syscall() const {
    ASSERT(m_kind == Kind::Syscall);
    return m_syscall;
}

Cause::PageFault const& Cause::pageFault() const {
    ASSERT(m_kind == Kind::PageFault);
    return m_pageFault;
}

Cause::Exception const& Cause::exception() const {
    ASSERT(m_kind == Kind::IllegalInstruction
        || m_kind == Kind::OtherException
        || m_kind == Kind::ExternalInterrupt);
    return m_exception;
}

// Get a printable name for a kind of trap.
// @param kind: The kind.
// @return: The name of the kind.
char const * kindToString(Cause::Kind const kind) {
#define CASE(value) case Cause::Kind::value : return #value ;
    switch (kind) {
        CASE(Syscall)
        CASE(TimerInterrupt)
        CASE(ExternalInterrupt)
        CASE(PageFault)
        CASE(IllegalInstruction)
        CASE(OtherException)
    }
    UNREACHABLE
#undef CASE
}
}
