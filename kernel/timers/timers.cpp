// Timekeeping: durations and the periodic tick timer.
#include <timers/timers.hpp>
#include <cpu/cpu.hpp>
#include <util/assert.hpp>
#include <logging/log.hpp>

namespace Timer {
// Create a Duration from microseconds.
// @param us: The number of microseconds for the Duration value.
// @return: A Duration value of `us` microseconds.
Duration Duration::MicroSecs(u64 const us) {
    return Duration(us);
}

// Create a Duration from milliseconds.
// @param ms: The number of milliseconds for the Duration value.
// @return: A Duration value of `ms` milliseconds.
Duration Duration::MilliSecs(u64 const ms) {
    return Duration(ms * 1000);
}

// Create a Duration from seconds.
// @param s: The number of seconds for the Duration value.
// @return: A Duration value of `s` seconds.
Duration Duration::Secs(u64 const s) {
    return Duration(s * 1000000);
}

// Create a Duration from a number of cycles of a clock.
Duration Duration::FromCycles(u64 const cycles, u64 const frequencyHz) {
    ASSERT(!!frequencyHz);
    // Split the computation to avoid overflowing on large cycle counts.
    u64 const secs(cycles / frequencyHz);
    u64 const rem(cycles % frequencyHz);
    return Duration(secs * 1000000 + (rem * 1000000) / frequencyHz);
}

// Get the value of this duration.
// @return: The duration in microseconds.
u64 Duration::microSecs() const {
    return m_us;
}

// Get the number of cycles of a clock covering this duration.
u64 Duration::toCycles(u64 const frequencyHz) const {
    u64 const secs(m_us / 1000000);
    u64 const rem(m_us % 1000000);
    return secs * frequencyHz + (rem * frequencyHz) / 1000000;
}

// Constructor. Only meant to be called from the static methods.
// @param us: The number of microseconds for this Duration.
Duration::Duration(u64 const us) : m_us(us) {}

// Create a timer.
TickTimer::TickTimer(Duration const period, u64 const frequencyHz) :
    m_frequencyHz(frequencyHz),
    m_periodCycles(period.toCycles(frequencyHz)),
    m_nextDeadline(~0ULL),
    m_ticks(0) {
    ASSERT(!!m_periodCycles);
}

// Program the first deadline and unmask timer interrupts.
void TickTimer::start() {
    m_nextDeadline = Cpu::time() + m_periodCycles;
    Cpu::setTimer(m_nextDeadline);
    Cpu::enableTimerInterrupts();
    Log::debug("Tick timer started, period = {} cycles", m_periodCycles);
}

// Acknowledge a timer interrupt.
void TickTimer::acknowledge() {
    m_ticks++;
    u64 const now(Cpu::time());
    m_nextDeadline += m_periodCycles;
    if (m_nextDeadline <= now) {
        // Missed some periods, do not try to catch up.
        m_nextDeadline = now + m_periodCycles;
    }
    Cpu::setTimer(m_nextDeadline);
}

u64 TickTimer::ticks() const {
    return m_ticks;
}

u64 TickTimer::nextDeadline() const {
    return m_nextDeadline;
}

u64 TickTimer::periodCycles() const {
    return m_periodCycles;
}

// Time elapsed since the hart was reset.
Duration TickTimer::now() const {
    return Duration::FromCycles(Cpu::time(), m_frequencyHz);
}
}
