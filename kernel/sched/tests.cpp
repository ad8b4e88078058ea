// Scheduling related tests.
#include <sched/task.hpp>
#include <sched/registry.hpp>
#include <sched/scheduler.hpp>
#include <framealloc/framealloc.hpp>
#include <cpu/cpu.hpp>
#include <selftests/macros.hpp>

namespace Sched {

// Physical memory for the address spaces of the tasks under test.
static constexpr u64 NumTestFrames = 64;
alignas(PAGE_SIZE) static u8 TestMemory[NumTestFrames * PAGE_SIZE];

static constexpr u64 TestSliceTicks = 5;

// Restore satp when going out of scope, so that no address space of the test
// is active when it gets destroyed.
class SatpRestorer {
public:
    SatpRestorer() : m_satp(Cpu::satp()) {}
    ~SatpRestorer() {
        Cpu::writeSatp(m_satp);
        Cpu::flushTlb();
    }
private:
    u64 const m_satp;
};

// Everything needed to run a scheduler in a test. Members are destroyed in
// reverse order: satp is restored before any task goes away.
struct TestEnv {
    TestEnv(u64 const capacity) :
        allocator(PhyAddr(reinterpret_cast<u64>(TestMemory)),
                  NumTestFrames * PAGE_SIZE),
        registry(capacity),
        idle(*Task::NewIdle(*Paging::AddrSpace::New(allocator))),
        scheduler(registry, idle, TestSliceTicks) {}

    Cpu::InterruptGuard const guard;
    FrameAlloc::FreeListAllocator allocator;
    Registry registry;
    Ptr<Task> idle;
    Scheduler scheduler;
    SatpRestorer const satpRestorer;
};

// Create a user task in the registry of a test environment.
// @param env: The environment.
// @param parent: The parent of the new task.
// @return: The new task.
static Ptr<Task> newTask(TestEnv& env, Task::Id const parent) {
    Ptr<Paging::AddrSpace> const space(
        *Paging::AddrSpace::New(env.allocator));
    Res<Ptr<Task>> const res(env.registry.allocate([&](Task::Id const id) {
        return Task::NewUser(id, parent, space, VirAddr(0x1000),
                             VirAddr(0x4000));
    }));
    return res.value();
}

// Create a task and make it eligible.
static Task::Id spawn(TestEnv& env, Task::Id const parent = Task::NoParent) {
    Ptr<Task> const task(newTask(env, parent));
    env.scheduler.enqueue(task->id());
    return task->id();
}

// Reschedule and return the id of the task picked.
static Task::Id runNext(TestEnv& env) {
    TrapFrame const * const frame(env.scheduler.reschedule());
    Ptr<Task> const& curr(env.scheduler.current());
    ASSERT(frame == &curr->frame());
    ASSERT(curr->state() == Task::State::Running);
    return curr->id();
}

// Allowed state transitions and initial contexts.
SelfTests::TestResult taskCreationTest() {
    TestEnv env(4);
    Ptr<Task> const task(newTask(env, Task::NoParent));
    TEST_ASSERT(task->state() == Task::State::Ready);
    TEST_ASSERT(!task->isIdle());
    TEST_ASSERT(task->frame().sepc == 0x1000);
    TEST_ASSERT(task->frame().x[Reg::Sp] == 0x4000);
    TEST_ASSERT(!(task->frame().sstatus & Cpu::Sstatus::SPP));
    TEST_ASSERT(task->frame().sstatus & Cpu::Sstatus::SPIE);
    TEST_ASSERT(!!task->frame().kernelSp);

    TEST_ASSERT(env.idle->isIdle());
    TEST_ASSERT(env.idle->frame().sepc == Cpu::idleEntry());
    TEST_ASSERT(env.idle->frame().sstatus & Cpu::Sstatus::SPP);

    task->setState(Task::State::Running);
    task->setState(Task::State::Blocked);
    task->setState(Task::State::Ready);
    task->setState(Task::State::Running);
    task->setState(Task::State::Ready);
    task->setState(Task::State::Zombie);
    task->setExitStatus(3);
    TEST_ASSERT(task->exitStatus() == 3);

    // Slice accounting.
    task->refillSlice(2);
    TEST_ASSERT(!task->consumeTick());
    TEST_ASSERT(task->consumeTick());
    TEST_ASSERT(task->consumeTick());
    return SelfTests::TestResult::Success;
}

// A forked task has the context of its parent, but its own kernel stack.
SelfTests::TestResult taskForkTest() {
    TestEnv env(4);
    Ptr<Task> const parent(newTask(env, Task::NoParent));
    parent->frame().x[Reg::A0] = 0xabcd;
    parent->frame().sepc = 0x2004;
    Ptr<Paging::AddrSpace> const space(*parent->addrSpace()->clone());
    Res<Ptr<Task>> const childRes(env.registry.allocate(
        [&](Task::Id const id) { return parent->fork(id, space); }));
    TEST_ASSERT(childRes.ok());
    Ptr<Task> const child(*childRes);
    TEST_ASSERT(child->parent() == parent->id());
    TEST_ASSERT(child->frame().x[Reg::A0] == 0xabcd);
    TEST_ASSERT(child->frame().sepc == 0x2004);
    TEST_ASSERT(child->frame().kernelSp != parent->frame().kernelSp);
    TEST_ASSERT(child->addrSpace().raw() == space.raw());
    return SelfTests::TestResult::Success;
}

// Ids are unique and never reused, only zombies can be reaped, a full
// registry refuses new tasks.
SelfTests::TestResult registryTest() {
    TestEnv env(2);
    Ptr<Task> const t1(newTask(env, Task::NoParent));
    Ptr<Task> const t2(newTask(env, Task::NoParent));
    TEST_ASSERT(t1->id() != Task::IdleId);
    TEST_ASSERT(t1->id() < t2->id());
    TEST_ASSERT(env.registry.numTasks() == 2);

    Res<Ptr<Task>> const full(env.registry.allocate([&](Task::Id const id) {
        return Task::NewUser(id, Task::NoParent, t1->addrSpace(),
                             VirAddr(0x1000), VirAddr(0x4000));
    }));
    TEST_ASSERT(!full);
    TEST_ASSERT(full.error() == Error::RegistryFull);

    Res<Ptr<Task>> const lookup(env.registry.lookup(t2->id()));
    TEST_ASSERT(lookup.ok());
    TEST_ASSERT(lookup->raw() == t2.raw());
    TEST_ASSERT(env.registry.lookup(12345).error() == Error::NotFound);

    Err const notZombie(env.registry.reap(t1->id()));
    TEST_ASSERT(!!notZombie && notZombie.error() == Error::InvalidState);
    Err const notFound(env.registry.reap(12345));
    TEST_ASSERT(!!notFound && notFound.error() == Error::NotFound);

    t1->setState(Task::State::Zombie);
    TEST_ASSERT(env.registry.hasLiveTasks());
    TEST_ASSERT(!env.registry.reap(t1->id()));
    TEST_ASSERT(env.registry.numTasks() == 1);
    TEST_ASSERT(!env.registry.lookup(t1->id()));

    Ptr<Task> const t3(newTask(env, Task::NoParent));
    TEST_ASSERT(t3->id() > t2->id());
    t2->setState(Task::State::Zombie);
    t3->setState(Task::State::Zombie);
    TEST_ASSERT(!env.registry.hasLiveTasks());
    return SelfTests::TestResult::Success;
}

// With an empty ready queue the idle task runs, it never gets a slice.
SelfTests::TestResult idleWhenEmptyTest() {
    TestEnv env(4);
    TEST_ASSERT(env.scheduler.isIdle());
    TEST_ASSERT(runNext(env) == Task::IdleId);
    TEST_ASSERT(runNext(env) == Task::IdleId);
    TEST_ASSERT(env.idle->addrSpace()->isActive());
    TEST_ASSERT(!env.scheduler.tick());
    TEST_ASSERT(!env.scheduler.numReady());

    Task::Id const id(spawn(env));
    TEST_ASSERT(runNext(env) == id);
    // The idle task is never queued.
    TEST_ASSERT(!env.scheduler.numReady());
    TEST_ASSERT(env.scheduler.current()->addrSpace()->isActive());
    return SelfTests::TestResult::Success;
}

// N tasks that never block all run once within N reschedules, in FIFO order.
SelfTests::TestResult roundRobinTest() {
    TestEnv env(8);
    static constexpr u64 N = 5;
    Task::Id ids[N];
    for (u64 i(0); i < N; ++i) {
        ids[i] = spawn(env);
    }
    for (u64 round(0); round < 3; ++round) {
        for (u64 i(0); i < N; ++i) {
            TEST_ASSERT(runNext(env) == ids[i]);
            TEST_ASSERT(env.scheduler.numReady() == N - 1);
        }
    }
    return SelfTests::TestResult::Success;
}

// A task exhausting its slice is preempted after exactly timeSliceTicks ticks.
SelfTests::TestResult timeSliceTest() {
    TestEnv env(4);
    Task::Id const a(spawn(env));
    Task::Id const b(spawn(env));
    TEST_ASSERT(runNext(env) == a);
    TEST_ASSERT(env.scheduler.current()->sliceLeft() == TestSliceTicks);
    for (u64 i(0); i < TestSliceTicks - 1; ++i) {
        TEST_ASSERT(!env.scheduler.tick());
    }
    TEST_ASSERT(env.scheduler.tick());
    TEST_ASSERT(runNext(env) == b);
    TEST_ASSERT(env.scheduler.current()->sliceLeft() == TestSliceTicks);
    return SelfTests::TestResult::Success;
}

// A yields immediately, B runs its whole slice then yields: they alternate.
SelfTests::TestResult yieldAlternateTest() {
    TestEnv env(4);
    Task::Id const a(spawn(env));
    Task::Id const b(spawn(env));
    for (u64 round(0); round < 3; ++round) {
        TEST_ASSERT(runNext(env) == a);
        // A yields.
        TEST_ASSERT(runNext(env) == b);
        while (!env.scheduler.tick()) {}
    }
    TEST_ASSERT(runNext(env) == a);
    return SelfTests::TestResult::Success;
}

// An exited task is a Zombie with its status, out of the ready queue and never
// resumed.
SelfTests::TestResult exitTest() {
    TestEnv env(4);
    Task::Id const a(spawn(env));
    Task::Id const b(spawn(env));
    Task::Id const c(spawn(env));

    // Exit of the running task.
    TEST_ASSERT(runNext(env) == a);
    env.scheduler.exit(a, 7);
    Ptr<Task> const taskA(*env.registry.lookup(a));
    TEST_ASSERT(taskA->state() == Task::State::Zombie);
    TEST_ASSERT(taskA->exitStatus() == 7);
    // Its address space is not active anymore.
    TEST_ASSERT(!taskA->addrSpace()->isActive());

    // Exit of a queued task.
    env.scheduler.exit(c, -139);
    TEST_ASSERT(!env.scheduler.isQueued(c));
    TEST_ASSERT(env.scheduler.isQueued(b));

    for (u64 i(0); i < 4; ++i) {
        TEST_ASSERT(runNext(env) == b);
    }
    // Still there until reaped.
    TEST_ASSERT(env.registry.lookup(c).ok());
    TEST_ASSERT(!env.registry.reap(a));
    TEST_ASSERT(!env.registry.reap(c));
    TEST_ASSERT(runNext(env) == b);
    return SelfTests::TestResult::Success;
}

// Sleeping tasks are off the queue until their tick.
SelfTests::TestResult sleepWakeTest() {
    TestEnv env(4);
    Task::Id const a(spawn(env));
    Task::Id const b(spawn(env));
    TEST_ASSERT(runNext(env) == a);
    env.scheduler.block(a, Task::BlockReason::Sleep(10));
    TEST_ASSERT(runNext(env) == b);
    TEST_ASSERT(runNext(env) == b);

    env.scheduler.wakeSleepers(9);
    TEST_ASSERT(!env.scheduler.isQueued(a));
    env.scheduler.wakeSleepers(10);
    TEST_ASSERT(env.scheduler.isQueued(a));
    Ptr<Task> const taskA(*env.registry.lookup(a));
    TEST_ASSERT(taskA->state() == Task::State::Ready);
    TEST_ASSERT(taskA->blockReason().kind == Task::BlockReason::Kind::None);
    // Only Blocked tasks are woken up, the running task is never queued.
    env.scheduler.wakeSleepers(11);
    TEST_ASSERT(!env.scheduler.isQueued(b));
    TEST_ASSERT(runNext(env) == a);
    return SelfTests::TestResult::Success;
}

// A parent waiting on a child gets the status of the child when it exits, the
// child is reaped.
SelfTests::TestResult waitExitTest() {
    TestEnv env(4);
    Task::Id const parent(spawn(env));
    Task::Id const child(spawn(env, parent));
    Task::Id const other(spawn(env, parent));

    TEST_ASSERT(runNext(env) == parent);
    env.scheduler.block(parent,
                        Task::BlockReason::Wait(static_cast<i64>(child)));
    TEST_ASSERT(runNext(env) == child);

    // Not the child waited for: stays a zombie, parent still blocked.
    env.scheduler.exit(other, 1);
    Ptr<Task> const parentTask(*env.registry.lookup(parent));
    TEST_ASSERT(parentTask->state() == Task::State::Blocked);
    TEST_ASSERT(env.registry.lookup(other).ok());

    env.scheduler.exit(child, 42);
    TEST_ASSERT(parentTask->state() == Task::State::Ready);
    TEST_ASSERT(parentTask->frame().x[Reg::A0] == 42);
    TEST_ASSERT(!env.registry.lookup(child));
    TEST_ASSERT(runNext(env) == parent);
    return SelfTests::TestResult::Success;
}

// Living children of an exiting task lose their parent, its zombie children
// are reaped, a parentless zombie stays until reaped.
SelfTests::TestResult orphanTest() {
    TestEnv env(8);
    Task::Id const parent(spawn(env));
    Task::Id const living(spawn(env, parent));
    Task::Id const zombie(spawn(env, parent));
    env.scheduler.exit(zombie, 0);
    TEST_ASSERT(env.registry.lookup(zombie).ok());

    env.scheduler.exit(parent, 5);
    TEST_ASSERT(!env.registry.lookup(zombie));
    Ptr<Task> const livingTask(*env.registry.lookup(living));
    TEST_ASSERT(livingTask->parent() == Task::NoParent);
    Ptr<Task> const parentTask(*env.registry.lookup(parent));
    TEST_ASSERT(parentTask->state() == Task::State::Zombie);

    // Nobody waits for the orphan.
    env.scheduler.exit(living, 1);
    TEST_ASSERT(env.registry.lookup(living).ok());
    TEST_ASSERT(!env.registry.hasLiveTasks());
    return SelfTests::TestResult::Success;
}

// Run the scheduling tests.
void Test(SelfTests::TestRunner& runner) {
    RUN_TEST(runner, taskCreationTest);
    RUN_TEST(runner, taskForkTest);
    RUN_TEST(runner, registryTest);
    RUN_TEST(runner, idleWhenEmptyTest);
    RUN_TEST(runner, roundRobinTest);
    RUN_TEST(runner, timeSliceTest);
    RUN_TEST(runner, yieldAlternateTest);
    RUN_TEST(runner, exitTest);
    RUN_TEST(runner, sleepWakeTest);
    RUN_TEST(runner, waitExitTest);
    RUN_TEST(runner, orphanTest);
}
}
