// Software model of a RISC-V hart, the machine the kernel runs on when built
// for the host. It models what the kernel consumes from the hardware: the
// general purpose registers, the supervisor CSRs, the privilege mode, the
// trap entry and sret protocol of the trap vector, the time counter with its
// deadline, and an Sv39 MMU used for the memory accesses of U-mode code.
// Tests play the part of the user programs: they inject syscalls, interrupts
// and memory accesses on behalf of whichever task is running.
#pragma once

#include <util/ints.hpp>
#include <util/addr.hpp>
#include <trap/trap.hpp>

namespace Sim {

// Privilege mode of the hart.
enum class Mode {
    User,
    Supervisor,
};

// Address of the idle loop. Nothing is ever fetched from there, the idle task
// only waits for interrupts.
static constexpr u64 IdleEntry = 0x80001000;

class Hart {
public:
    // Get the hart.
    static Hart& instance();

    // Put the hart back in its reset state: S-mode, interrupts disabled,
    // translation disabled, no trap frame.
    void reset();

    // General purpose registers. x0 always reads 0.
    u64 reg(u64 const index) const;
    void setReg(u64 const index, u64 const value);

    // Program counter.
    u64 pc() const;

    // Current privilege mode.
    Mode mode() const;

    // CSRs.
    u64 satp() const;
    void writeSatp(u64 const value);
    u64 sstatus() const;
    void writeSstatus(u64 const value);
    u64 sscratch() const;
    u64 scause() const;
    u64 stval() const;

    // Time counter and timer.
    u64 time() const;
    void advanceTime(u64 const cycles);
    void setTimer(u64 const deadline);
    u64 timerDeadline() const;
    void enableTimerInterrupts();

    // Load a context from a trap frame and sret to it, as done by the end of
    // the trap vector. The frame becomes the target of the next trap entry.
    // @param frame: The context to resume.
    void resume(TrapFrame * const frame);

    // #########################################################################
    // Events. Each of them may trap into the kernel, after which the hart runs
    // the context returned by the kernel.
    // #########################################################################

    // Execute an ecall.
    // @param number: Syscall number, in a7.
    // @param a0-a5: Arguments.
    // @return: The value of a0 once the hart is back from the trap. This is
    // the result of the syscall only if the same task is resumed.
    u64 ecall(u64 const number,
              u64 const a0 = 0,
              u64 const a1 = 0,
              u64 const a2 = 0,
              u64 const a3 = 0,
              u64 const a4 = 0,
              u64 const a5 = 0);

    // Let time pass until the timer deadline and take the timer interrupt if
    // it is enabled.
    // @return: true if the interrupt was taken.
    bool timerInterrupt();

    // Raise an external interrupt.
    // @return: true if the interrupt was taken.
    bool externalInterrupt();

    // Raise an illegal instruction exception.
    // @param instruction: The faulting instruction, stored in stval.
    void illegalInstruction(u64 const instruction);

    // Raise an arbitrary exception.
    // @param code: The value of scause.
    // @param tval: The value of stval.
    void exception(u64 const code, u64 const tval);

    // Memory accesses of the running code, translated through satp. A faulting
    // access traps. If the kernel resolves the fault and resumes the same
    // context the access is retried once, as hardware would re-execute the
    // instruction. Accesses must not cross a page boundary.
    // @return: true if the access completed.
    bool load(VirAddr const vaddr, void * const dest, u64 const size);
    bool store(VirAddr const vaddr, void const * const src, u64 const size);
    bool fetch(VirAddr const vaddr, u32& instruction);

    // Translate an address as the MMU would for the current mode.
    // @param vaddr: The address.
    // @param access: The kind of access.
    // @param paddr: Set to the physical address on success.
    // @return: false if the access faults.
    bool translate(VirAddr const vaddr,
                   Trap::Access const access,
                   PhyAddr& paddr) const;

private:
    Hart();

    // Take a trap: save the context into the frame pointed by sscratch, update
    // the CSRs as hardware does, call the kernel and resume the frame it
    // returns.
    void trap(u64 const cause, u64 const tval);

    // Check if an interrupt can be taken now.
    bool interruptDeliverable() const;

    // Perform an access with the retry protocol.
    bool access(VirAddr const vaddr,
                Trap::Access const access,
                void * const buf,
                u64 const size);

    u64 m_regs[32];
    u64 m_pc;
    Mode m_mode;
    u64 m_satp;
    u64 m_sstatus;
    u64 m_sscratch;
    u64 m_scause;
    u64 m_stval;
    u64 m_sepc;
    u64 m_time;
    u64 m_timerDeadline;
    bool m_timerEnabled;
};

// Console capture. Bytes written with Console::write are recorded, log output
// goes to the host's stderr.
char const * consoleOutput();
u64 consoleOutputLength();
void clearConsoleOutput();
}
