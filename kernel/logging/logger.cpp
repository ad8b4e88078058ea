#include <logging/logger.hpp>
#include <util/error.hpp>
#include <util/addr.hpp>

namespace Logging {

// Create a new Logger instance using the given OutputDev as backend.
// @param dev: The underlying OutputDev to be used.
Logger::Logger(OutputDev& dev) : m_dev(dev) {}

// Print a string into the log but do not append a new line at the end of
// it. This is useful when prefixing log messages.
// @param str: The string to print into the log.
void Logger::printNoNewLine(char const * const str) {
    for (char const * ptr(str); *ptr; ++ptr) {
        m_dev.printChar(*ptr);
    }
}

// Print a string into the log. This is the base case of the variadic printf
// method.
// @param str: The string to print into the log.
void Logger::printf(char const * const str) {
    printNoNewLine(str);
    m_dev.newLine();
}

void Logger::setColor(Color const color) {
    m_dev.setColor(color);
}

// Quick and dirty implementation of printing a u64.
void Logger::printUnsigned(u64 const val, FmtOption const fmtOption) {
    if (fmtOption == 'x') {
        // Print in base 16 with leading zeroes.
        printNoNewLine("0x");
        u64 shift(60);
        u64 mask(u64(0xf) << shift);
        while (!!mask) {
            u8 const digit((val & mask) >> shift);
            if (digit < 10) {
                m_dev.printChar('0' + digit);
            } else {
                m_dev.printChar('a' + digit - 10);
            }
            mask >>= 4;
            shift -= 4;
        }
    } else {
        // Default behaviour is to print in base 10.
        if (!val) {
            // The code below assumes that val > 0.
            m_dev.printChar('0');
            return;
        }
        // The max u64 takes 20 digits to represent in base 10.
        static constexpr u64 maxDigits = 20;
        char digits[maxDigits];
        u64 numDigits(0);
        u64 rem(val);
        while (!!rem) {
            digits[numDigits++] = '0' + (rem % 10);
            rem /= 10;
        }
        while (!!numDigits) {
            m_dev.printChar(digits[--numDigits]);
        }
    }
}

// Leverage printUnsigned to print the absolute value of val, which definitely
// fits in a u64.
void Logger::printSigned(i64 const val, FmtOption const fmtOption) {
    if (val < 0 && fmtOption != 'x') {
        m_dev.printChar('-');
        printUnsigned(~u64(val) + 1, fmtOption);
    } else {
        printUnsigned(u64(val), fmtOption);
    }
}

// Print a C-string.
// @param str: The string to output to the device.
void Logger::printValue(char const * const str,
                        __attribute__((unused)) FmtOption const& fmtOption) {
    printNoNewLine(!!str ? str : "(null)");
}

// printValue<T> specialization for all currently supported types:

template<>
void Logger::printValue<u64>(u64 const& val, FmtOption const& fmtOption) {
    printUnsigned(val, fmtOption);
}
template<>
void Logger::printValue<u32>(u32 const& val, FmtOption const& fmtOption) {
    printUnsigned(val, fmtOption);
}
template<>
void Logger::printValue<u16>(u16 const& val, FmtOption const& fmtOption) {
    printUnsigned(val, fmtOption);
}
template<>
void Logger::printValue<u8>(u8 const& val, FmtOption const& fmtOption) {
    printUnsigned(val, fmtOption);
}

template<>
void Logger::printValue<i64>(i64 const& val, FmtOption const& fmtOption) {
    printSigned(val, fmtOption);
}
template<>
void Logger::printValue<i32>(i32 const& val, FmtOption const& fmtOption) {
    printSigned(val, fmtOption);
}
template<>
void Logger::printValue<i16>(i16 const& val, FmtOption const& fmtOption) {
    printSigned(val, fmtOption);
}
template<>
void Logger::printValue<i8>(i8 const& val, FmtOption const& fmtOption) {
    printSigned(val, fmtOption);
}

template<>
void Logger::printValue<bool>(bool const& val,
    __attribute__((unused)) FmtOption const& fmtOption) {
    printNoNewLine(val ? "true" : "false");
}

template<>
void Logger::printValue<Error>(Error const& val,
    __attribute__((unused)) FmtOption const& fmtOption) {
    printNoNewLine(errorToString(val));
}

template<>
void Logger::printValue<VirAddr>(VirAddr const& val,
    __attribute__((unused)) FmtOption const& fmtOption) {
    printNoNewLine("v:");
    printUnsigned(val.raw(), 'x');
}

template<>
void Logger::printValue<PhyAddr>(PhyAddr const& val,
    __attribute__((unused)) FmtOption const& fmtOption) {
    printNoNewLine("p:");
    printUnsigned(val.raw(), 'x');
}
}
