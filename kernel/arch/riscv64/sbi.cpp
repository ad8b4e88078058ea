// Calls to the Supervisor Binary Interface implementation.
#include "sbi.hpp"

namespace Sbi {

// Extension ids.
static constexpr u64 LegacyConsolePutChar = 0x01;
static constexpr u64 TimeExtension = 0x54494d45;
static constexpr u64 SystemResetExtension = 0x53525354;

// Value returned by an SBI call.
struct SbiRet {
    i64 error;
    i64 value;
};

// Call into the SBI.
// @param eid: Extension id, in a7.
// @param fid: Function id, in a6.
// @param arg0, arg1: Arguments, in a0 and a1.
// @return: The error code and value returned in a0 and a1.
static SbiRet call(u64 const eid, u64 const fid, u64 const arg0,
                   u64 const arg1) {
    register u64 a0 asm("a0") = arg0;
    register u64 a1 asm("a1") = arg1;
    register u64 a6 asm("a6") = fid;
    register u64 a7 asm("a7") = eid;
    asm volatile("ecall"
                 : "+r"(a0), "+r"(a1)
                 : "r"(a6), "r"(a7)
                 : "memory");
    return SbiRet{static_cast<i64>(a0), static_cast<i64>(a1)};
}

void consolePutChar(char const c) {
    call(LegacyConsolePutChar, 0, static_cast<u8>(c), 0);
}

void setTimer(u64 const deadline) {
    call(TimeExtension, 0, deadline, 0);
}

void shutdown() {
    // Type 0: shutdown, reason 0: no reason.
    call(SystemResetExtension, 0, 0, 0);
}
}
