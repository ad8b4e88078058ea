#include <util/assert.hpp>
#include <logging/log.hpp>
#include <cpu/cpu.hpp>

// Print the condition that failed, the location of the assertion and the trap
// CSRs, then halt the hart forever. THIS DOES NOT RETURN.
void _raiseAssertFailure(char const * const condition,
                         char const * const fileName,
                         u64 const lineNumber,
                         char const * const funcName) {
    Log::crit("=============== ASSERT FAILURE ================");
    Log::crit("Location: {}:{}", fileName, lineNumber);
    Log::crit("Function: {}", funcName);
    Log::crit("Last trap: scause = {x} stval = {x}, satp = {x}", Cpu::scause(),
              Cpu::stval(), Cpu::satp());
    // Using fmtWithPrefix and manually inserting the prefix is a bit hacky
    // here. Oh well...
    Log::fmtWithPrefixAndColor(Logging::Logger::Color::Crit,
                               "[CRIT] Condition: ",
                               condition);
    Cpu::haltForever();
}
