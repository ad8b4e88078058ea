// new and delete operators definition. Those operators don't need to appear in
// a header file, the compiler just expects them to exist somewhere. Moreover
// they obviously need to be define at the top-level namespace.
// We cannot return errors as new and new[] must return a void*, any allocation
// error raises a PANIC.
#include <memory/malloc.hpp>
#include <util/panic.hpp>

void *operator new(u64 const size) {
    Res<void*> const allocRes(HeapAlloc::malloc(size));
    if (!allocRes) {
        PANIC("Failed to allocate memory: {}", allocRes.error());
    }
    return *allocRes;
}

void *operator new[](u64 const size) {
    Res<void*> const allocRes(HeapAlloc::malloc(size));
    if (!allocRes) {
        PANIC("Failed to allocate memory: {}", allocRes.error());
    }
    return *allocRes;
}

void operator delete(void * const ptr) {
    HeapAlloc::free(ptr);
}

void operator delete[](void * const ptr) {
    HeapAlloc::free(ptr);
}

// The heap knows the size of each allocation.
void operator delete(void * const ptr, __attribute__((unused)) u64 const sz) {
    HeapAlloc::free(ptr);
}

void operator delete[](void * const ptr, __attribute__((unused)) u64 const sz) {
    HeapAlloc::free(ptr);
}
