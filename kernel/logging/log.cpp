// Util making logging easy.

#include <logging/log.hpp>
#include <console/console.hpp>

namespace Log {

// Logger output device writing to the console.
class ConsoleOutputDev : public Logging::Logger::OutputDev {
public:
    virtual void printChar(char const c) {
        Console::putChar(c);
    }

    virtual void newLine() {
        Console::putChar('\n');
    }

    virtual void setColor(Logging::Logger::Color const color) {
        // FIXME: Add support for color through ANSI escape sequences.
        (void)color;
    }
};

// Are debug messages printed?
static bool DebugEnabled = true;

// Enable or disable the output of debug level messages.
// @param enabled: If true debug messages are printed, otherwise they are
// discarded.
void setDebug(bool const enabled) {
    DebugEnabled = enabled;
}

// Check if debug messages are currently printed.
bool debugEnabled() {
    return DebugEnabled;
}

// Return the global Logger singleton instance.
Logging::Logger& loggerInstance() {
    // This is where the global Logger instance is created.
    static ConsoleOutputDev outDev;
    static Logging::Logger globalLogger(outDev);
    return globalLogger;
}

}
