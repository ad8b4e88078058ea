// Util functions to manipulate C-strings and raw memory buffers.

#include <util/cstring.hpp>

namespace Util {

// Compute the length of a string.
// @param str: The string.
// @return: The number of characters in `str`.
u64 strlen(char const * const str) {
    u64 len(0);
    char const * ptr(str);
    while (!!*(ptr++)) len++;
    return len;
}

// Compare two strings and indicates if they are equals.
// @param str1: The first operand.
// @param str2: The first operand.
// @return: true if the two strings have the same length and the same content,
// false otherwise.
bool streq(char const * const str1, char const * const str2) {
    char const * ptr1(str1);
    char const * ptr2(str2);
    while (!!*ptr1 && *ptr1 == *ptr2) {
        ptr1++;
        ptr2++;
    }
    return *ptr1 == *ptr2;
}

// Zero a memory buffer.
// @param ptr: Memory buffer to zero.
// @param size: Size of the buffer in bytes.
void memzero(void * const ptr, u64 const size) {
    // Volatile so that the compiler does not turn this loop into a call to
    // memset, which does not exist in a freestanding kernel.
    u8 volatile * const wPtr(reinterpret_cast<u8*>(ptr));
    for (u64 i(0); i < size; ++i) {
        wPtr[i] = 0;
    }
}

// Copy a memory buffer into another. The buffers must not overlap.
// @param dest: The destination buffer.
// @param src: The source buffer.
// @param size: The number of bytes to copy.
void memcpy(void * const dst, void const * const src, u64 const size) {
    u8 volatile * const wPtr(reinterpret_cast<u8*>(dst));
    u8 const * const rPtr(reinterpret_cast<u8 const*>(src));
    for (u64 i(0); i < size; ++i) {
        wPtr[i] = rPtr[i];
    }
}

// Compare two memory buffers.
// @param buf1: The first buffer.
// @param buf2: The second buffer.
// @param size: The number of bytes to compare.
// @return: true if the first `size` bytes of both buffers are identical.
bool memeq(void const * const buf1, void const * const buf2, u64 const size) {
    u8 const * const ptr1(reinterpret_cast<u8 const*>(buf1));
    u8 const * const ptr2(reinterpret_cast<u8 const*>(buf2));
    for (u64 i(0); i < size; ++i) {
        if (ptr1[i] != ptr2[i]) {
            return false;
        }
    }
    return true;
}
}
