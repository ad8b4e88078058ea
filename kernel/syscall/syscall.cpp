// System calls.
#include <syscall/syscall.hpp>
#include <kernel/kernel.hpp>
#include <console/console.hpp>
#include <logging/log.hpp>
#include <util/assert.hpp>

namespace Syscall {

using Sched::Task;

// write(fd, buffer, length).
static i64 sysWrite(Kernel& kernel, u64 const fd, VirAddr const buf,
                    u64 const len) {
    if (fd != StdOut && fd != StdErr) {
        return Errno::BadFd;
    }
    Ptr<Paging::AddrSpace> const& space(
        kernel.scheduler().current()->addrSpace());
    // Bytes are copied out and written one chunk at a time.
    u8 chunk[128];
    u64 done(0);
    while (done < len) {
        u64 const size(min<u64>(len - done, sizeof(chunk)));
        Err const err(space->copyOut(chunk, buf + done, size));
        if (!!err) {
            // Report what has been written already, if anything.
            return !!done ? static_cast<i64>(done) : Errno::Fault;
        }
        Console::write(chunk, size);
        done += size;
    }
    return static_cast<i64>(done);
}

// exit(status).
static i64 sysExit(Kernel& kernel, i64 const status) {
    Task::Id const id(kernel.scheduler().current()->id());
    Log::info("Task {} exited with status {}", id, status);
    kernel.scheduler().exit(id, status);
    // Never seen by the task.
    return 0;
}

// yield().
static i64 sysYield(Kernel& kernel) {
    kernel.requestReschedule();
    return 0;
}

// sleep(ticks).
static i64 sysSleep(Kernel& kernel, u64 const ticks) {
    if (!ticks) {
        return sysYield(kernel);
    }
    Task::Id const id(kernel.scheduler().current()->id());
    u64 const until(kernel.timer().ticks() + ticks);
    kernel.scheduler().block(id, Task::BlockReason::Sleep(until));
    return 0;
}

// wait(pid).
static i64 sysWait(Kernel& kernel, i64 const pid) {
    Ptr<Task> const& curr(kernel.scheduler().current());
    if (pid < Task::BlockReason::AnyChild) {
        return Errno::Invalid;
    }

    // Look for a zombie child to reap right away.
    bool hasChild(false);
    Task::Id zombie(0);
    bool foundZombie(false);
    kernel.registry().forEach([&](Ptr<Task> const& task) {
        bool const matches(task->parent() == curr->id()
            && (pid == Task::BlockReason::AnyChild
                || static_cast<i64>(task->id()) == pid));
        if (!matches) {
            return;
        }
        hasChild = true;
        if (!foundZombie && task->state() == Task::State::Zombie) {
            foundZombie = true;
            zombie = task->id();
        }
    });
    if (!hasChild) {
        return Errno::NoChild;
    } else if (foundZombie) {
        i64 const status((*kernel.registry().lookup(zombie))->exitStatus());
        Err const err(kernel.reap(zombie));
        ASSERT(!err);
        return status;
    }

    // The status is written into a0 by the exit of the child.
    kernel.scheduler().block(curr->id(), Task::BlockReason::Wait(pid));
    return 0;
}

// getpid().
static i64 sysGetPid(Kernel& kernel) {
    return static_cast<i64>(kernel.scheduler().current()->id());
}

// fork().
static i64 sysFork(Kernel& kernel) {
    Ptr<Task> const& curr(kernel.scheduler().current());
    Res<Ptr<Paging::AddrSpace>> const cloneRes(curr->addrSpace()->clone());
    if (!cloneRes) {
        Log::warn("fork: cannot copy address space of task {}: {}",
                  curr->id(), cloneRes.error());
        return Errno::NoMemory;
    }
    Ptr<Paging::AddrSpace> const space(*cloneRes);
    Res<Ptr<Task>> const childRes(kernel.registry().allocate(
        [&](Task::Id const id) { return curr->fork(id, space); }));
    if (!childRes) {
        Log::warn("fork: cannot create task: {}", childRes.error());
        return childRes.error() == Error::RegistryFull ?
            Errno::Again : Errno::NoMemory;
    }
    Ptr<Task> const child(*childRes);
    child->frame().x[Reg::A0] = 0;
    kernel.scheduler().enqueue(child->id());
    Log::debug("Task {} forked task {}", curr->id(), child->id());
    return static_cast<i64>(child->id());
}

// gettime().
static i64 sysGetTime(Kernel& kernel) {
    return static_cast<i64>(kernel.timer().now().microSecs());
}

// Handle a syscall on behalf of the current task.
i64 handle(Kernel& kernel, Trap::Cause::Syscall const& call) {
    u64 const* const args(call.args);
    Log::debug("Task {}: syscall {}({x}, {x}, {x})",
               kernel.scheduler().current()->id(),
               numberToString(call.number), args[0], args[1], args[2]);
    switch (static_cast<Number>(call.number)) {
        case Number::Write:
            return sysWrite(kernel, args[0], VirAddr(args[1]), args[2]);
        case Number::Exit:
            return sysExit(kernel, static_cast<i64>(args[0]));
        case Number::Sleep:
            return sysSleep(kernel, args[0]);
        case Number::Yield:
            return sysYield(kernel);
        case Number::GetTime:
            return sysGetTime(kernel);
        case Number::GetPid:
            return sysGetPid(kernel);
        case Number::Fork:
            return sysFork(kernel);
        case Number::Wait:
            return sysWait(kernel, static_cast<i64>(args[0]));
    }
    Log::warn("Task {}: unknown syscall {}", kernel.scheduler().current()->id(),
              call.number);
    return Errno::NoSys;
}

// Get the name of a syscall, for logging.
char const * numberToString(u64 const number) {
#define CASE(value) case Number::value : return #value ;
    switch (static_cast<Number>(number)) {
        CASE(Write)
        CASE(Exit)
        CASE(Sleep)
        CASE(Yield)
        CASE(GetTime)
        CASE(GetPid)
        CASE(Fork)
        CASE(Wait)
    }
    return "unknown";
#undef CASE
}
}
