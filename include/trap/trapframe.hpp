// Saved context of a task.
#pragma once

#include <util/ints.hpp>

// The context of a task as saved by the trap vector (trap.S) on trap entry and
// restored by trapReturn. While a task runs, its TrapFrame is the target of
// the next trap entry (sscratch), the frame of a task that is not running is
// the only copy of its state.
// The layout is shared with trap.S, do not reorder.
struct TrapFrame {
    // General purpose registers. x[0] is never read nor written.
    u64 x[32];
    // Program counter to resume at.
    u64 sepc;
    // sstatus to restore, SPP and SPIE select the mode and interrupt state
    // after sret.
    u64 sstatus;
    // Top of the task's kernel stack, loaded into sp by the trap vector.
    u64 kernelSp;
};
static_assert(__builtin_offsetof(TrapFrame, x) == 0);
static_assert(__builtin_offsetof(TrapFrame, sepc) == 256);
static_assert(__builtin_offsetof(TrapFrame, sstatus) == 264);
static_assert(__builtin_offsetof(TrapFrame, kernelSp) == 272);
static_assert(sizeof(TrapFrame) == 280);

// ABI names of the registers the kernel reads or writes in a TrapFrame.
namespace Reg {
static constexpr u64 Ra = 1;
static constexpr u64 Sp = 2;
static constexpr u64 A0 = 10;
static constexpr u64 A1 = 11;
static constexpr u64 A2 = 12;
static constexpr u64 A3 = 13;
static constexpr u64 A4 = 14;
static constexpr u64 A5 = 15;
static constexpr u64 A7 = 17;
}
