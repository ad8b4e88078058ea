// Information handed over by the boot code to the kernel.
#pragma once

#include <util/addr.hpp>

struct BootInfo {
    // A range of physical memory [base; base + length[.
    struct MemRange {
        // Not necessarily page aligned.
        PhyAddr base;
        u64 length;
    };

    // The memory available for physical frames. It must not overlap the
    // kernel image nor the kernel heap.
    MemRange freeMemory;

    // The range identity mapped in every address space, covering all of RAM.
    // Gigapage aligned.
    MemRange kernelWindow;

    // A program to run as a task at boot. The image is a flat binary, copied
    // as is at its load address.
    struct TaskImage {
        // Name of the task, for logging.
        char const * name;
        // The content of the image.
        u8 const * data;
        // Size of the image in bytes.
        u64 size;
        // Where the image is loaded in the task's address space, page
        // aligned.
        VirAddr loadAddress;
        // Offset of the first instruction within the image.
        u64 entryOffset;
    };

    // The images to start at boot.
    TaskImage const * images;
    // The number of entries in `images`.
    u64 numImages;
};
