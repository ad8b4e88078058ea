// Timekeeping: durations and the periodic tick timer.
#pragma once
#include <util/ints.hpp>
#include <selftests/selftests.hpp>

namespace Timer {

// Type for a value representing a duration.
class Duration {
public:
    // Create a Duration from microseconds.
    // @param us: The number of microseconds for the Duration value.
    // @return: A Duration value of `us` microseconds.
    static Duration MicroSecs(u64 const us);

    // Create a Duration from milliseconds.
    // @param ms: The number of milliseconds for the Duration value.
    // @return: A Duration value of `ms` milliseconds.
    static Duration MilliSecs(u64 const ms);

    // Create a Duration from seconds.
    // @param s: The number of seconds for the Duration value.
    // @return: A Duration value of `s` seconds.
    static Duration Secs(u64 const s);

    // Create a Duration from a number of cycles of a clock.
    // @param cycles: The number of cycles.
    // @param frequencyHz: The frequency of the clock.
    // @return: The Duration, rounded down to the microsecond.
    static Duration FromCycles(u64 const cycles, u64 const frequencyHz);

    // Get the value of this duration.
    // @return: The duration in microseconds.
    u64 microSecs() const;

    // Get the number of cycles of a clock covering this duration.
    // @param frequencyHz: The frequency of the clock.
    // @return: The number of cycles, rounded down.
    u64 toCycles(u64 const frequencyHz) const;

private:
    // Constructor. Only meant to be called from the static methods.
    // @param us: The number of microseconds for this Duration.
    Duration(u64 const us);

    // The value of this Duration in microseconds. All Durations are stored in
    // microseconds unit.
    u64 m_us;
};

// Periodic timer built on the hart's time counter and its one-shot deadline.
// Each interrupt is acknowledged by programming the next deadline, one period
// after the previous one.
class TickTimer {
public:
    // Create a timer. The timer does not fire until start() is called.
    // @param period: The time between two ticks.
    // @param frequencyHz: The frequency of the time counter.
    TickTimer(Duration const period, u64 const frequencyHz);

    // Program the first deadline and unmask timer interrupts.
    void start();

    // Acknowledge a timer interrupt: count a tick and program the next
    // deadline. Deadlines that are already in the past are skipped.
    void acknowledge();

    // Number of ticks since start().
    u64 ticks() const;

    // Value of the time counter at which the next tick fires.
    u64 nextDeadline() const;

    // Length of a period in cycles of the time counter.
    u64 periodCycles() const;

    // Time elapsed since the hart was reset.
    Duration now() const;

private:
    u64 const m_frequencyHz;
    u64 const m_periodCycles;
    u64 m_nextDeadline;
    u64 m_ticks;
};

// Run Timers tests.
void Test(SelfTests::TestRunner& runner);
}
