// C++ entry point of the kernel on the QEMU virt machine.
#include <kernel/kernel.hpp>
#include <kernel/bootinfo.hpp>
#include <memory/malloc.hpp>
#include <paging/paging.hpp>
#include <logging/log.hpp>
#include <util/panic.hpp>

// Defined in linker.ld.
extern "C" u8 __kernel_end[];
// The demo program, defined in userdemo.S.
extern "C" u8 const userDemoStart[];
extern "C" u8 const userDemoEnd[];

// RAM of the virt machine with the default 128MiB.
static constexpr u64 RamStart = 0x80000000;
static constexpr u64 RamEnd = 0x88000000;

// Memory of the kernel heap, for kernel stacks and kernel objects.
static constexpr u64 HeapSize = 8 * 1024 * 1024;
alignas(PAGE_SIZE) static u8 HeapMemory[HeapSize];

// Where the demo program is loaded in its address space.
static constexpr u64 UserDemoLoadAddress = 0x10000;

// Called by the trap vector on a trap in the kernel itself. THIS DOES NOT
// RETURN.
extern "C" [[noreturn]] void nestedTrapPanic() {
    u64 sepc;
    asm volatile("csrr %0, sepc" : "=r"(sepc));
    PANIC("Trap in the kernel: scause = {x} stval = {x} sepc = {x}",
          Cpu::scause(), Cpu::stval(), sepc);
}

// C++ entry point of the kernel. Called by the assembly entry point `_start`
// after calling all global constructors.
// @param hartId: Id of the boot hart.
// @param deviceTree: Physical address of the device tree, unused.
extern "C" [[noreturn]] void kernelMain(u64 const hartId,
                                        u64 const deviceTree) {
    Log::info("=== Kernel C++ Entry point ===");
    Log::info("Boot hart: {}, device tree @{x}", hartId, deviceTree);

    HeapAlloc::Init(VirAddr(reinterpret_cast<u64>(HeapMemory)), HeapSize);
    Paging::Init(PhyAddr(RamStart), Paging::GIGAPAGE_SIZE);

    u64 const freeStart(roundUp(reinterpret_cast<u64>(__kernel_end),
                                PAGE_SIZE));
    BootInfo::TaskImage const images[] = {
        {
            .name = "userdemo",
            .data = userDemoStart,
            .size = static_cast<u64>(userDemoEnd - userDemoStart),
            .loadAddress = VirAddr(UserDemoLoadAddress),
            .entryOffset = 0,
        },
    };
    BootInfo const bootInfo{
        .freeMemory = {
            .base = PhyAddr(freeStart),
            .length = RamEnd - freeStart,
        },
        .kernelWindow = {
            .base = PhyAddr(RamStart),
            .length = Paging::GIGAPAGE_SIZE,
        },
        .images = images,
        .numImages = 1,
    };
    Log::info("Free memory: {} - {}", bootInfo.freeMemory.base,
              PhyAddr(RamEnd));

    Kernel::Config config;
    config.shutdownWhenDone = true;
    // The kernel lives until the machine is powered off.
    Kernel * const kernel(new Kernel(bootInfo, config));
    kernel->run();
    UNREACHABLE
}
