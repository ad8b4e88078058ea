// Software model of a RISC-V hart.
#include <sim/hart.hpp>
#include <cpu/cpu.hpp>
#include <util/cstring.hpp>
#include <util/assert.hpp>
#include <util/panic.hpp>

// Entry point of the trap path, called by the trap vector.
extern "C" TrapFrame* handleTrap(TrapFrame * const frame);

namespace Sim {

using Cpu::Sstatus::SIE;
using Cpu::Sstatus::SPIE;
using Cpu::Sstatus::SPP;

// Bits of a Sv39 page table entry.
static constexpr u64 PteValid = 1 << 0;
static constexpr u64 PteRead = 1 << 1;
static constexpr u64 PteWrite = 1 << 2;
static constexpr u64 PteExec = 1 << 3;
static constexpr u64 PteUser = 1 << 4;
static constexpr u64 PpnMask = (1ULL << 44) - 1;

// Value of timerDeadline when no deadline is set.
static constexpr u64 NoDeadline = ~0ULL;

// Get the hart.
Hart& Hart::instance() {
    static Hart hart;
    return hart;
}

Hart::Hart() {
    reset();
}

// Put the hart back in its reset state.
void Hart::reset() {
    for (u64 i(0); i < 32; ++i) {
        m_regs[i] = 0;
    }
    m_pc = 0;
    m_mode = Mode::Supervisor;
    m_satp = 0;
    m_sstatus = 0;
    m_sscratch = 0;
    m_scause = 0;
    m_stval = 0;
    m_sepc = 0;
    m_time = 0;
    m_timerDeadline = NoDeadline;
    m_timerEnabled = false;
}

u64 Hart::reg(u64 const index) const {
    ASSERT(index < 32);
    return m_regs[index];
}

void Hart::setReg(u64 const index, u64 const value) {
    ASSERT(index < 32);
    if (!!index) {
        m_regs[index] = value;
    }
}

u64 Hart::pc() const {
    return m_pc;
}

Mode Hart::mode() const {
    return m_mode;
}

u64 Hart::satp() const {
    return m_satp;
}

void Hart::writeSatp(u64 const value) {
    m_satp = value;
}

u64 Hart::sstatus() const {
    return m_sstatus;
}

void Hart::writeSstatus(u64 const value) {
    m_sstatus = value;
}

u64 Hart::sscratch() const {
    return m_sscratch;
}

u64 Hart::scause() const {
    return m_scause;
}

u64 Hart::stval() const {
    return m_stval;
}

u64 Hart::time() const {
    return m_time;
}

void Hart::advanceTime(u64 const cycles) {
    m_time += cycles;
}

void Hart::setTimer(u64 const deadline) {
    m_timerDeadline = deadline;
}

u64 Hart::timerDeadline() const {
    return m_timerDeadline;
}

void Hart::enableTimerInterrupts() {
    m_timerEnabled = true;
}

// Load a context from a trap frame and sret to it.
// @param frame: The context to resume.
void Hart::resume(TrapFrame * const frame) {
    ASSERT(!!frame);
    m_regs[0] = 0;
    for (u64 i(1); i < 32; ++i) {
        m_regs[i] = frame->x[i];
    }
    m_pc = frame->sepc;
    m_sepc = frame->sepc;

    // sret: return to the mode in SPP, SIE takes the value of SPIE.
    u64 const status(frame->sstatus);
    m_mode = (status & SPP) ? Mode::Supervisor : Mode::User;
    m_sstatus = (status & ~(SPP | SIE)) | SPIE | ((status & SPIE) ? SIE : 0);
    m_sscratch = reinterpret_cast<u64>(frame);
}

// Take a trap.
// @param cause: The value of scause.
// @param tval: The value of stval.
void Hart::trap(u64 const cause, u64 const tval) {
    if (!m_sscratch) {
        PANIC("Trap without trap frame: scause = {x} stval = {x} pc = {x}",
              cause, tval, m_pc);
    }
    TrapFrame * const frame(reinterpret_cast<TrapFrame*>(m_sscratch));

    // Hardware part of the trap entry.
    u64 status(m_sstatus & ~(SPP | SPIE | SIE));
    if (m_mode == Mode::Supervisor) {
        status |= SPP;
    }
    if (m_sstatus & SIE) {
        status |= SPIE;
    }
    m_sstatus = status;
    m_sepc = m_pc;
    m_scause = cause;
    m_stval = tval;
    m_mode = Mode::Supervisor;

    // Trap vector part: save the context, clear sscratch so that a nested
    // trap is caught.
    for (u64 i(1); i < 32; ++i) {
        frame->x[i] = m_regs[i];
    }
    frame->sepc = m_sepc;
    frame->sstatus = m_sstatus;
    m_sscratch = 0;

    TrapFrame * const next(::handleTrap(frame));
    resume(next);
}

// Check if an interrupt can be taken now. Interrupts are always enabled in
// U-mode, sstatus.SIE only applies to S-mode.
bool Hart::interruptDeliverable() const {
    return m_mode == Mode::User || (m_sstatus & SIE);
}

// Execute an ecall.
u64 Hart::ecall(u64 const number,
                u64 const a0,
                u64 const a1,
                u64 const a2,
                u64 const a3,
                u64 const a4,
                u64 const a5) {
    m_regs[Reg::A7] = number;
    m_regs[Reg::A0] = a0;
    m_regs[Reg::A1] = a1;
    m_regs[Reg::A2] = a2;
    m_regs[Reg::A3] = a3;
    m_regs[Reg::A4] = a4;
    m_regs[Reg::A5] = a5;
    u64 const cause(m_mode == Mode::User ? 8 : 9);
    trap(cause, 0);
    return m_regs[Reg::A0];
}

// Let time pass until the timer deadline and take the timer interrupt.
bool Hart::timerInterrupt() {
    if (m_timerDeadline == NoDeadline) {
        return false;
    }
    if (m_time < m_timerDeadline) {
        m_time = m_timerDeadline;
    }
    if (!m_timerEnabled || !interruptDeliverable()) {
        return false;
    }
    trap(Trap::Scause::Interrupt | Trap::Scause::SupervisorTimerInterrupt, 0);
    return true;
}

// Raise an external interrupt.
bool Hart::externalInterrupt() {
    if (!interruptDeliverable()) {
        return false;
    }
    trap(Trap::Scause::Interrupt | Trap::Scause::SupervisorExternalInterrupt,
         0);
    return true;
}

// Raise an illegal instruction exception.
void Hart::illegalInstruction(u64 const instruction) {
    trap(Trap::Scause::IllegalInstruction, instruction);
}

// Raise an arbitrary exception.
void Hart::exception(u64 const code, u64 const tval) {
    ASSERT(!(code & Trap::Scause::Interrupt));
    trap(code, tval);
}

bool Hart::load(VirAddr const vaddr, void * const dest, u64 const size) {
    return access(vaddr, Trap::Access::Load, dest, size);
}

bool Hart::store(VirAddr const vaddr, void const * const src, u64 const size) {
    return access(vaddr, Trap::Access::Store, const_cast<void*>(src), size);
}

bool Hart::fetch(VirAddr const vaddr, u32& instruction) {
    return access(vaddr, Trap::Access::Fetch, &instruction,
                  sizeof(instruction));
}

// Perform an access with the retry protocol.
// @param vaddr: The address of the access.
// @param access: The kind of access.
// @param buf: Source of a store, destination of a load or fetch.
// @param size: The size of the access.
// @return: true if the access completed.
bool Hart::access(VirAddr const vaddr,
                  Trap::Access const access,
                  void * const buf,
                  u64 const size) {
    ASSERT(!!size);
    ASSERT(vaddr.raw() % PAGE_SIZE + size <= PAGE_SIZE);
    for (u64 attempt(0); attempt < 2; ++attempt) {
        PhyAddr paddr;
        if (translate(vaddr, access, paddr)) {
            u8 * const ptr(paddr.toVir().ptr<u8>());
            if (access == Trap::Access::Store) {
                Util::memcpy(ptr, buf, size);
            } else {
                Util::memcpy(buf, ptr, size);
            }
            return true;
        }

        u64 const cause((access == Trap::Access::Fetch) ?
            Trap::Scause::InstructionPageFault :
            (access == Trap::Access::Load) ? Trap::Scause::LoadPageFault :
            Trap::Scause::StorePageFault);
        u64 const prevFrame(m_sscratch);
        u64 const prevPc(m_pc);
        Mode const prevMode(m_mode);
        trap(cause, vaddr.raw());
        // The instruction is only re-executed if the kernel resumed the same
        // context.
        if (m_sscratch != prevFrame || m_pc != prevPc || m_mode != prevMode) {
            return false;
        }
    }
    return false;
}

// Translate an address as the MMU would for the current mode.
bool Hart::translate(VirAddr const vaddr,
                     Trap::Access const access,
                     PhyAddr& paddr) const {
    u64 const va(vaddr.raw());
    if (!(m_satp >> 60)) {
        // Bare mode.
        paddr = PhyAddr(va);
        return true;
    }
    // Bits 63 to 39 must be copies of bit 38.
    u64 const extended(static_cast<u64>(static_cast<i64>(va << 25) >> 25));
    if (extended != va) {
        return false;
    }

    u64 table((m_satp & PpnMask) * PAGE_SIZE);
    for (i64 level(2); level >= 0; --level) {
        u64 const index((va >> (12 + 9 * level)) & 0x1ff);
        u64 const pte(reinterpret_cast<u64 const*>(table)[index]);
        if (!(pte & PteValid) || ((pte & PteWrite) && !(pte & PteRead))) {
            return false;
        }
        u64 const base(((pte >> 10) & PpnMask) * PAGE_SIZE);
        if (!(pte & (PteRead | PteWrite | PteExec))) {
            table = base;
            continue;
        }

        // Leaf. S-mode cannot access user pages (sstatus.SUM is never set)
        // and U-mode can only access user pages.
        if ((m_mode == Mode::User) != !!(pte & PteUser)) {
            return false;
        }
        u64 const needed((access == Trap::Access::Load) ? PteRead :
                         (access == Trap::Access::Store) ? PteWrite : PteExec);
        if (!(pte & needed)) {
            return false;
        }
        u64 const span(1ULL << (12 + 9 * level));
        if (base & (span - 1)) {
            // Misaligned superpage.
            return false;
        }
        paddr = PhyAddr(base + (va & (span - 1)));
        return true;
    }
    return false;
}
}
