// A kernel running on the simulated hart, for tests.
#include <sim/testkernel.hpp>
#include <paging/paging.hpp>
#include <cpu/cpu.hpp>
#include <util/assert.hpp>

namespace Sim {

// Maximum number of tasks started by a TestKernel.
static constexpr u64 MaxImages = 8;

// Physical memory given to the frame allocator.
static constexpr u64 NumFrames = 256;
alignas(PAGE_SIZE) static u8 FrameMemory[NumFrames * PAGE_SIZE];

static BootInfo::TaskImage Images[MaxImages];

// Build the BootInfo of a TestKernel.
// @param numTasks: The number of tasks to start.
// @return: The BootInfo.
static BootInfo testBootInfo(u64 const numTasks) {
    ASSERT(numTasks <= MaxImages);
    for (u64 i(0); i < numTasks; ++i) {
        Images[i] = BootInfo::TaskImage{
            .name = "test",
            .data = reinterpret_cast<u8 const*>(TestKernel::Program),
            .size = sizeof(TestKernel::Program),
            .loadAddress = VirAddr(TestKernel::LoadAddress),
            .entryOffset = 0,
        };
    }
    return BootInfo{
        .freeMemory = {
            .base = PhyAddr(reinterpret_cast<u64>(FrameMemory)),
            .length = sizeof(FrameMemory),
        },
        .kernelWindow = {
            .base = PhyAddr(0x80000000),
            .length = Paging::GIGAPAGE_SIZE,
        },
        .images = Images,
        .numImages = numTasks,
    };
}

TestKernel::HartReset::HartReset() {
    Hart::instance().reset();
    clearConsoleOutput();
}

TestKernel::HartReset::~HartReset() {
    Hart::instance().reset();
}

// Start a kernel.
TestKernel::TestKernel(u64 const numTasks, Kernel::Config const& config) :
    m_hartReset(),
    m_kernel(testBootInfo(numTasks), config) {
    m_kernel.run();
}

TestKernel::~TestKernel() {
    // The kernel is only ever manipulated with interrupts disabled.
    Cpu::disableInterrupts();
}

Kernel& TestKernel::kernel() {
    return m_kernel;
}

Hart& TestKernel::hart() {
    return Hart::instance();
}

Sched::Task::Id TestKernel::current() {
    return m_kernel.scheduler().current()->id();
}

Ptr<Sched::Task> TestKernel::task(Sched::Task::Id const id) {
    Res<Ptr<Sched::Task>> const res(m_kernel.registry().lookup(id));
    ASSERT(!!res);
    return *res;
}

// Take timer interrupts until a task is running.
bool TestKernel::runUntil(Sched::Task::Id const id, u64 const maxTicks) {
    for (u64 i(0); i < maxTicks && current() != id; ++i) {
        if (!hart().timerInterrupt()) {
            return false;
        }
    }
    return current() == id;
}

u64 TestKernel::numFreeFrames() {
    return m_kernel.frameAllocator().numFreeFrames();
}
}
