// Entry point of the simulated machine: bring up the kernel's memory
// subsystems on the host and run the self-tests.
#include <logging/log.hpp>
#include <selftests/selftests.hpp>
#include <cpu/cpu.hpp>
#include <util/result.hpp>
#include <util/err.hpp>
#include <util/ptr.hpp>
#include <datastruct/datastruct.hpp>
#include <framealloc/framealloc.hpp>
#include <memory/malloc.hpp>
#include <paging/paging.hpp>
#include <trap/trap.hpp>
#include <timers/timers.hpp>
#include <sched/task.hpp>
#include <syscall/syscall.hpp>
#include <kernel/kernel.hpp>

// Memory of the kernel heap. Kernel stacks are allocated from there.
static constexpr u64 HeapSize = 4 * 1024 * 1024;
alignas(PAGE_SIZE) static u8 HeapMemory[HeapSize];

// Run all the self-tests.
// @return: The number of failed tests.
static u64 runSelfTests() {
    Log::info("Running self-tests:");
    SelfTests::TestRunner runner;

    Cpu::Test(runner);
    Result::Test(runner);
    ErrType::Test(runner);
    SmartPtr::Test(runner);
    DataStruct::Test(runner);
    FrameAlloc::Test(runner);
    HeapAlloc::Test(runner);
    Paging::Test(runner);
    Trap::Test(runner);
    Timer::Test(runner);
    Sched::Test(runner);
    Syscall::Test(runner);
    KernelTests::Test(runner);

    runner.printSummary();
    return runner.numFailures();
}

int main() {
    HeapAlloc::Init(VirAddr(reinterpret_cast<u64>(HeapMemory)), HeapSize);
    // Same kernel window as on the virt machine. The simulated hart never
    // accesses it, it is only seen by the page tables.
    Paging::Init(PhyAddr(0x80000000), Paging::GIGAPAGE_SIZE);
    return !!runSelfTests() ? 1 : 0;
}
