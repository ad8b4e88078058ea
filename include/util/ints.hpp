// Fixed-width signed and unsigned ints.

#pragma once
#include <stdint.h>

using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// Compute the min of two value, using operator<().
template<typename T>
inline T min(T const& a, T const& b) {
    return (a < b) ? a : b;
}

// Compute the max of two value, using operator>().
template<typename T>
inline T max(T const& a, T const& b) {
    return (a > b) ? a : b;
}

// Round a value up to the next multiple of `align`.
// @param value: The value to round.
// @param align: The alignment, must be a power of two.
// @return: The smallest multiple of `align` that is >= `value`.
inline constexpr u64 roundUp(u64 const value, u64 const align) {
    return (value + align - 1) & ~(align - 1);
}

// Round a value down to the previous multiple of `align`.
// @param value: The value to round.
// @param align: The alignment, must be a power of two.
// @return: The biggest multiple of `align` that is <= `value`.
inline constexpr u64 roundDown(u64 const value, u64 const align) {
    return value & ~(align - 1);
}
