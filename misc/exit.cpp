// Functions GCC expects to exist for static objects with destructors, e.g. the
// heap allocator created by HeapAlloc::Init(). The kernel never exits, such
// destructors are never called and nothing needs to be registered.

// Identifies the kernel image as the owner of the registered destructors.
extern "C" {
void* __dso_handle = nullptr;
}

// This function is expected to return 0 on success.
extern "C" int __cxa_atexit(void (*destructor) (void *), void *arg, void *dso) {
    (void)destructor;
    (void)arg;
    (void)dso;
    return 0;
}
