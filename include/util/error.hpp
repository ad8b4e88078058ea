// Error enum definition.
#pragma once

// Indicate an error condition. Mostly used by the Res<T> and Err classes.
enum class Error {
    // No more physical memory available.
    OutOfPhysicalMemory,

    // The kernel heap does not have a free block big enough for the
    // allocation.
    OutOfHeapMemory,

    // Attempt to map a virtual page that is already mapped or reserved.
    AlreadyMapped,

    // The virtual address does not have a translation.
    NotMapped,

    // No task with the requested id.
    NotFound,

    // The object is not in the state required by the operation, e.g. reaping
    // a task that is not a zombie.
    InvalidState,

    // All slots of the task registry are in use.
    RegistryFull,

    // An argument is outside of its allowed domain, e.g. a virtual range
    // outside of the user half of the address space.
    InvalidArgument,

    // A user-provided buffer is not accessible by its task.
    BadAddress,

    // To be used for testing only.
    Test,
};

// Map an Error value to its string representation.
// @param value: The value to transform into a cstring.
// @return: The cstring representation of the value.
inline char const * errorToString(Error const value) {
#define CASE(value) case Error::value : return #value ;
    switch (value) {
        CASE(OutOfPhysicalMemory)
        CASE(OutOfHeapMemory)
        CASE(AlreadyMapped)
        CASE(NotMapped)
        CASE(NotFound)
        CASE(InvalidState)
        CASE(RegistryFull)
        CASE(InvalidArgument)
        CASE(BadAddress)
        CASE(Test)
        // -Wall makes sure that all values of Error must appear here.
    }
    __builtin_unreachable();
#undef CASE
}
