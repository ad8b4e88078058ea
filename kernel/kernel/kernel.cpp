// The kernel object and the trap dispatcher.
#include <kernel/kernel.hpp>
#include <syscall/syscall.hpp>
#include <trap/trap.hpp>
#include <cpu/cpu.hpp>
#include <logging/log.hpp>
#include <util/panic.hpp>

using Sched::Task;

// The kernel instance, set for the lifetime of the Kernel object.
static Kernel* Instance = nullptr;

// Create the kernel address space. PANICs on failure.
static Ptr<Paging::AddrSpace> createKernelSpace(
    FrameAlloc::Allocator& allocator) {
    Res<Ptr<Paging::AddrSpace>> const res(Paging::AddrSpace::New(allocator));
    if (!res) {
        PANIC("Cannot create the kernel address space: {}", res.error());
    }
    return res.value();
}

// Create the idle task. PANICs on failure.
static Ptr<Task> createIdle(Ptr<Paging::AddrSpace> const& kernelSpace) {
    Res<Ptr<Task>> const res(Task::NewIdle(kernelSpace));
    if (!res) {
        PANIC("Cannot create the idle task: {}", res.error());
    }
    return res.value();
}

// Create the kernel.
Kernel::Kernel(BootInfo const& bootInfo, Config const& config) :
    m_config(config),
    m_frameAllocator(bootInfo.freeMemory.base, bootInfo.freeMemory.length),
    m_kernelSpace(createKernelSpace(m_frameAllocator)),
    m_registry(config.maxTasks),
    m_scheduler(m_registry, createIdle(m_kernelSpace), config.timeSliceTicks),
    m_timer(config.tickPeriod, config.timerFrequencyHz),
    m_needReschedule(false) {
    if (!!Instance) {
        PANIC("A kernel instance already exists");
    }
    Instance = this;
    Log::setDebug(m_config.debugLogs);
    Log::info("Physical frames: {} ({} free)", m_frameAllocator.numFrames(),
              m_frameAllocator.numFreeFrames());

    for (u64 i(0); i < bootInfo.numImages; ++i) {
        BootInfo::TaskImage const& image(bootInfo.images[i]);
        Res<Task::Id> const spawnRes(spawn(image));
        if (!spawnRes) {
            PANIC("Cannot start task {}: {}", image.name, spawnRes.error());
        }
    }
}

Kernel::~Kernel() {
    // None of the address spaces about to be destroyed may stay active.
    Paging::AddrSpace::deactivate();
    Instance = nullptr;
}

// Get the kernel instance.
Kernel& Kernel::instance() {
    if (!Instance) {
        PANIC("No kernel instance");
    }
    return *Instance;
}

// Create a task from an image and make it Ready.
Res<Task::Id> Kernel::spawn(BootInfo::TaskImage const& image) {
    if (!image.size || !image.loadAddress.isPageAligned()
        || image.entryOffset >= image.size) {
        return Error::InvalidArgument;
    }
    Res<Ptr<Paging::AddrSpace>> const spaceRes(
        Paging::AddrSpace::New(m_frameAllocator));
    if (!spaceRes) {
        return spaceRes.error();
    }
    Ptr<Paging::AddrSpace> const space(*spaceRes);

    using Paging::PageAttr;
    u64 const imagePages(roundUp(image.size, PAGE_SIZE) / PAGE_SIZE);
    PageAttr const imageAttrs(PageAttr::Read | PageAttr::Write | PageAttr::Exec
                              | PageAttr::User);
    Err const mapErr(space->map(image.loadAddress, imagePages, imageAttrs,
                                Paging::Backing::Eager));
    if (!!mapErr) {
        return mapErr.error();
    }
    Err const copyErr(space->copyIn(image.loadAddress, image.data,
                                    image.size));
    if (!!copyErr) {
        return copyErr.error();
    }

    u64 const stackPages(m_config.userStackPages);
    VirAddr const stackBottom(UserStackTop - stackPages * PAGE_SIZE);
    Paging::Backing const stackBacking(m_config.lazyUserStack ?
        Paging::Backing::Lazy : Paging::Backing::Eager);
    Err const stackErr(space->map(stackBottom, stackPages,
                                  PageAttr::Read | PageAttr::Write
                                  | PageAttr::User, stackBacking));
    if (!!stackErr) {
        return stackErr.error();
    }

    VirAddr const entry(image.loadAddress + image.entryOffset);
    Res<Ptr<Task>> const taskRes(m_registry.allocate([&](Task::Id const id) {
        return Task::NewUser(id, Task::NoParent, space, entry,
                             VirAddr(UserStackTop));
    }));
    if (!taskRes) {
        return taskRes.error();
    }
    Task::Id const id(taskRes.value()->id());
    m_scheduler.enqueue(id);
    Log::info("Started task {} ({}): {} bytes at {}, entry {}", id,
              image.name, image.size, image.loadAddress, entry);
    return id;
}

// Start the timer and resume the first task.
void Kernel::run() {
    ASSERT(!Cpu::interruptsEnabled());
    Cpu::installTrapVector();
    m_timer.start();
    TrapFrame * const frame(m_scheduler.reschedule());
    Log::info("Resuming task {}", m_scheduler.current()->id());
    Cpu::resumeContext(frame);
}

// Handle a trap.
TrapFrame* Kernel::handleTrap(TrapFrame * const frame,
                              u64 const scause,
                              u64 const stval) {
    ASSERT(!Cpu::interruptsEnabled());
    // Keep the current task alive until the trap is handled, even if it gets
    // reaped.
    Ptr<Task> const curr(m_scheduler.current());
    if (frame != &curr->frame()) {
        PANIC("Trap frame {} is not the frame of task {}", frame, curr->id());
    }

    Trap::Cause const cause(Trap::Cause::decode(scause, stval, *frame));
    bool const fromKernel(frame->sstatus & Cpu::Sstatus::SPP);
    if (fromKernel && !cause.isInterrupt()) {
        PANIC("{} in kernel code: scause = {x} stval = {x} sepc = {x}",
              Trap::kindToString(cause.kind()), scause, stval, frame->sepc);
    }

    switch (cause.kind()) {
        case Trap::Cause::Kind::Syscall: {
            // Resume after the ecall.
            frame->sepc += 4;
            i64 const res(Syscall::handle(*this, cause.syscall()));
            if (curr->state() != Task::State::Zombie) {
                frame->x[Reg::A0] = static_cast<u64>(res);
            }
            break;
        }
        case Trap::Cause::Kind::TimerInterrupt: {
            handleTick();
            break;
        }
        case Trap::Cause::Kind::ExternalInterrupt: {
            Log::warn("Ignoring interrupt, scause = {x}",
                      cause.exception().code);
            break;
        }
        case Trap::Cause::Kind::PageFault: {
            Trap::Cause::PageFault const& fault(cause.pageFault());
            Err const err(curr->addrSpace()->resolveFault(fault.address,
                                                          fault.access));
            if (!!err) {
                Log::info("Task {}: page fault at {} (sepc = {x}): {}",
                          curr->id(), fault.address, frame->sepc,
                          err.error());
                killCurrent(PageFaultStatus, "page fault");
            }
            break;
        }
        case Trap::Cause::Kind::IllegalInstruction: {
            killCurrent(IllegalInstructionStatus, "illegal instruction");
            break;
        }
        case Trap::Cause::Kind::OtherException: {
            Log::info("Task {}: exception, scause = {x} stval = {x}",
                      curr->id(), scause, stval);
            killCurrent(OtherExceptionStatus, "exception");
            break;
        }
    }

    if (m_needReschedule || curr->state() != Task::State::Running) {
        m_needReschedule = false;
        return m_scheduler.reschedule();
    }
    return frame;
}

// Reap a Zombie task.
Err Kernel::reap(Task::Id const id) {
    return m_registry.reap(id);
}

// Reap the zombies that no task can wait for anymore.
u64 Kernel::reapOrphans() {
    Vector<Task::Id> orphans;
    m_registry.forEach([&](Ptr<Task> const& task) {
        if (task->state() == Task::State::Zombie
            && task->parent() == Task::NoParent) {
            orphans.pushBack(task->id());
        }
    });
    for (Task::Id const id : orphans) {
        Err const err(m_registry.reap(id));
        ASSERT(!err);
    }
    return orphans.size();
}

// Ask for a reschedule at the end of the current trap.
void Kernel::requestReschedule() {
    m_needReschedule = true;
}

Kernel::Config const& Kernel::config() const {
    return m_config;
}

FrameAlloc::Allocator& Kernel::frameAllocator() {
    return m_frameAllocator;
}

Ptr<Paging::AddrSpace> const& Kernel::kernelSpace() const {
    return m_kernelSpace;
}

Sched::Registry& Kernel::registry() {
    return m_registry;
}

Sched::Scheduler& Kernel::scheduler() {
    return m_scheduler;
}

Timer::TickTimer& Kernel::timer() {
    return m_timer;
}

// Make the current task a Zombie after a fault.
void Kernel::killCurrent(i64 const status, char const * const what) {
    Task::Id const id(m_scheduler.current()->id());
    Log::warn("Killing task {} after {}, status {}", id, what, status);
    m_scheduler.exit(id, status);
}

// Timer interrupt handling.
void Kernel::handleTick() {
    m_timer.acknowledge();
    m_scheduler.wakeSleepers(m_timer.ticks());
    if (m_scheduler.isIdle()) {
        reapOrphans();
        if (!!m_scheduler.numReady()) {
            m_needReschedule = true;
        } else if (m_config.shutdownWhenDone && !m_registry.numTasks()) {
            Log::info("All tasks exited, shutting down");
            Cpu::shutdown();
        }
    } else if (m_scheduler.tick()) {
        m_needReschedule = true;
    }
}

// Entry point of the trap path from the trap vector.
// @param frame: The frame in which the context of the current task was saved.
// @return: The frame to resume.
extern "C" TrapFrame* handleTrap(TrapFrame * const frame) {
    return Kernel::instance().handleTrap(frame, Cpu::scause(), Cpu::stval());
}
