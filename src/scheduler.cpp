/*

Blink

*/

#include <stdio.h>
#include <deque>
#include <map>
#include <vector>
#include "blink.hpp"
#include "execute.hpp"

// ---- Tasks ----

typedef struct
{
    ulong_t Id;
    BTaskState State;
    BValue Expression;
    BValue Environment;
    BEvalState * Resume;
    BValue Pending;
    BValue ResumeValue;
    BOneshot * Receiver;
    BValue Result;
    int Started;
    int Running;
    int CancelRequested;
} BTask;

struct _BScheduler
{
    OSExclusive Exclusive;
    std::map<ulong_t, BTask *> Tasks;
    std::map<ulong_t, BTaskState> Finished;
    std::deque<ulong_t> FinishedOrder;
    std::deque<ulong_t> Ready;
    ulong_t NextId;
    ulong_t Live;
};

static void VisitTasks(BRuntime * rt, BVisitFn visit, void * ctx, void * data)
{
    BScheduler * sch = (BScheduler *) data;
    BWithExclusive wx(&sch->Exclusive);

    for (std::map<ulong_t, BTask *>::iterator it = sch->Tasks.begin(); it != sch->Tasks.end();
            it++)
    {
        BTask * tsk = it->second;

        visit(&tsk->Expression, ctx);
        visit(&tsk->Environment, ctx);
        visit(&tsk->Pending, ctx);
        visit(&tsk->ResumeValue, ctx);
        visit(&tsk->Result, ctx);
    }
}

ulong_t SpawnTask(BRuntime * rt, BValue expr, BValue env)
{
    BScheduler * sch = rt->Scheduler;
    BValue fut = MakeFuture(rt, 0);
    BTask * tsk = new BTask;

    tsk->State = TaskReady;
    tsk->Expression = expr;
    tsk->Environment = env;
    tsk->Resume = 0;
    tsk->Pending = NilValue;
    tsk->ResumeValue = NilValue;
    tsk->Receiver = 0;
    tsk->Result = fut;
    tsk->Started = 0;
    tsk->Running = 0;
    tsk->CancelRequested = 0;

    BWithExclusive wx(&sch->Exclusive);

    tsk->Id = sch->NextId;
    sch->NextId += 1;
    sch->Tasks[tsk->Id] = tsk;
    sch->Ready.push_back(tsk->Id);
    sch->Live += 1;

    if (rt->Config.VerboseFlag)
        printf("scheduler: task " ULONG_FMT " spawned\n", tsk->Id);

    return(tsk->Id);
}

BValue TaskFuture(BRuntime * rt, ulong_t id)
{
    BScheduler * sch = rt->Scheduler;
    BWithExclusive wx(&sch->Exclusive);

    std::map<ulong_t, BTask *>::iterator it = sch->Tasks.find(id);
    if (it == sch->Tasks.end())
        return(NilValue);

    return(it->second->Result);
}

BTaskState TaskState(BRuntime * rt, ulong_t id)
{
    BScheduler * sch = rt->Scheduler;
    BWithExclusive wx(&sch->Exclusive);

    std::map<ulong_t, BTask *>::iterator it = sch->Tasks.find(id);
    if (it != sch->Tasks.end())
        return(it->second->State);

    std::map<ulong_t, BTaskState>::iterator fit = sch->Finished.find(id);
    if (fit != sch->Finished.end())
        return(fit->second);

    return(TaskUnknown);
}

ulong_t LiveTaskCount(BRuntime * rt)
{
    BScheduler * sch = rt->Scheduler;
    BWithExclusive wx(&sch->Exclusive);

    return(sch->Live);
}

// Must be called with the scheduler exclusive held.

static void FinishTask(BRuntime * rt, BScheduler * sch, BTask * tsk, BTaskState ts)
{
    if (tsk->Resume != 0)
        DropEvalState(rt, tsk->Resume);

    if (tsk->Receiver != 0)
        OneshotDropReceiver(tsk->Receiver);

    sch->Finished[tsk->Id] = ts;
    sch->FinishedOrder.push_back(tsk->Id);
    if (sch->FinishedOrder.size() > FINISHED_TASK_RECORDS)
    {
        sch->Finished.erase(sch->FinishedOrder.front());
        sch->FinishedOrder.pop_front();
    }
    sch->Tasks.erase(tsk->Id);

    BAssert(sch->Live > 0);

    sch->Live -= 1;
    delete tsk;
}

static void SettleTaskFuture(BRuntime * rt, BTask * tsk, BValue val)
{
    try
    {
        if (ErrorP(val))
            FutureFail(rt, tsk->Result, val);
        else
            FutureComplete(rt, tsk->Result, val);
    }
    catch (BValue err)
    {
        // The completion future was released or already settled.
        if (rt->Config.VerboseFlag)
            printf("scheduler: task " ULONG_FMT " result dropped: %s\n", tsk->Id,
                    FormatError(rt, err).c_str());
    }
}

int CancelTask(BRuntime * rt, ulong_t id)
{
    BScheduler * sch = rt->Scheduler;
    BWithExclusive wx(&sch->Exclusive);

    std::map<ulong_t, BTask *>::iterator it = sch->Tasks.find(id);
    if (it == sch->Tasks.end() || it->second->CancelRequested)
        return(0);

    BTask * tsk = it->second;

    SettleTaskFuture(rt, tsk, MakeEvalError(rt, "task cancelled"));

    if (rt->Config.VerboseFlag)
        printf("scheduler: task " ULONG_FMT " cancelled\n", id);

    if (tsk->Running)
        tsk->CancelRequested = 1;
    else
        FinishTask(rt, sch, tsk, TaskCancelled);

    return(1);
}

static BValue AwaitedValue(BRuntime * rt, BFutureState fs, BValue val)
{
    if (fs == FutureStale)
        return(MakeStaleHandleError(rt, "deref"));
    else if (fs == FutureFailed && ErrorP(val) == 0)
        return(MakeUserError(rt, val, NilValue));

    return(val);
}

static void MakeReady(BScheduler * sch, BTask * tsk, BValue val)
{
    tsk->ResumeValue = val;
    tsk->Pending = NilValue;
    tsk->State = TaskReady;
    sch->Ready.push_back(tsk->Id);
}

// Must be called with the scheduler exclusive held.

static void WakeBlockedTasks(BRuntime * rt, BScheduler * sch)
{
    for (std::map<ulong_t, BTask *>::iterator it = sch->Tasks.begin(); it != sch->Tasks.end();
            it++)
    {
        BTask * tsk = it->second;
        BValue val = NilValue;

        if (tsk->State == TaskSuspended)
        {
            BFutureState fs = FuturePoll(rt, tsk->Pending, &val);

            if (fs != FuturePending)
                MakeReady(sch, tsk, AwaitedValue(rt, fs, val));
        }
        else if (tsk->State == TaskWaiting)
        {
            int failed;

            if (OneshotTryReceive(tsk->Receiver, &val, &failed))
            {
                OneshotDropReceiver(tsk->Receiver);
                tsk->Receiver = 0;

                MakeReady(sch, tsk, AwaitedValue(rt, failed ? FutureFailed : FutureReady, val));
            }
            else if (FuturePoll(rt, tsk->Pending, &val) == FutureStale)
            {
                OneshotDropReceiver(tsk->Receiver);
                tsk->Receiver = 0;

                MakeReady(sch, tsk, AwaitedValue(rt, FutureStale, val));
            }
        }
    }
}

static void BlockTask(BRuntime * rt, BScheduler * sch, BTask * tsk, BEvalResult * er)
{
    BValue val = NilValue;
    BFutureState fs;

    tsk->Resume = er->Resume;
    tsk->Pending = er->Pending;

    if (FutureExternalP(rt, er->Pending))
    {
        BOneshot * os = MakeOneshot();

        fs = FutureAttachOneshot(rt, er->Pending, os, &val);
        if (fs == FuturePending)
        {
            tsk->Receiver = os;
            tsk->State = TaskWaiting;
            return;
        }

        OneshotDropSender(os);
        OneshotDropReceiver(os);
    }
    else
        fs = FuturePoll(rt, er->Pending, &val);

    if (fs == FuturePending)
        tsk->State = TaskSuspended;
    else
        MakeReady(sch, tsk, AwaitedValue(rt, fs, val));
}

static void RunTask(BRuntime * rt, BScheduler * sch, BTask * tsk)
{
    BEvalResult er;

    SetCurrentTask(tsk->Id);

    if (tsk->Started == 0)
        er = Evaluate(rt, tsk->Expression, tsk->Environment);
    else
    {
        BEvalState * es = tsk->Resume;
        BValue val = tsk->ResumeValue;

        tsk->Resume = 0;
        tsk->ResumeValue = NilValue;
        er = ResumeEval(rt, es, val);
    }

    SetCurrentTask(0);

    BWithExclusive wx(&sch->Exclusive);

    tsk->Running = 0;
    tsk->Started = 1;

    if (tsk->CancelRequested)
    {
        tsk->Resume = er.Suspended ? er.Resume : 0;
        FinishTask(rt, sch, tsk, TaskCancelled);
    }
    else if (er.Suspended == 0)
    {
        if (rt->Config.VerboseFlag)
            printf("scheduler: task " ULONG_FMT " completed\n", tsk->Id);

        SettleTaskFuture(rt, tsk, er.Value);
        FinishTask(rt, sch, tsk, TaskCompleted);
    }
    else
    {
        if (rt->Config.VerboseFlag)
            printf("scheduler: task " ULONG_FMT " suspended\n", tsk->Id);

        BlockTask(rt, sch, tsk, &er);
    }
}

ulong_t SchedulerStep(BRuntime * rt)
{
    BScheduler * sch = rt->Scheduler;
    ulong_t cnt;
    ulong_t prg = 0;

    SafePoint(rt);

    {
        BWithExclusive wx(&sch->Exclusive);

        WakeBlockedTasks(rt, sch);
        cnt = sch->Ready.size();
    }

    while (cnt > 0)
    {
        BTask * tsk = 0;

        {
            BWithExclusive wx(&sch->Exclusive);

            if (sch->Ready.size() == 0)
                break;

            ulong_t id = sch->Ready.front();
            sch->Ready.pop_front();

            std::map<ulong_t, BTask *>::iterator it = sch->Tasks.find(id);
            if (it != sch->Tasks.end() && it->second->State == TaskReady
                    && it->second->Running == 0)
            {
                tsk = it->second;
                tsk->Running = 1;
            }
        }

        cnt -= 1;
        if (tsk != 0)
        {
            RunTask(rt, sch, tsk);
            prg += 1;
        }
    }

    if (prg == 0)
    {
        EnterWait(rt);
        SleepMicroseconds(rt->Config.IdleMicroseconds);
        LeaveWait(rt);
    }

    return(prg);
}

void RunScheduler(BRuntime * rt)
{
    while (LiveTaskCount(rt) > 0)
        SchedulerStep(rt);
}

// ---- Async Bridge ----

typedef struct
{
    BBridgeFn Fn;
    void * Context;
    uint32_t Index;
    uint32_t Generation;
} BBridgeJob;

struct _BBridge
{
    BRuntime * Runtime;
    OSExclusive Exclusive;
    OSCondition Condition;
    std::deque<BBridgeJob> Jobs;
    std::vector<OSThreadHandle> Workers;
    ulong_t Started;
    int Stopping;
};

static void * BridgeWorker(void * arg)
{
    BBridge * br = (BBridge *) arg;
    BRuntime * rt = br->Runtime;
    ulong_t wdx;

    {
        BWithExclusive wx(&br->Exclusive);

        wdx = br->Started;
        br->Started += 1;
    }

    if (rt->Config.VerboseFlag)
        printf("bridge: worker " ULONG_FMT " started\n", wdx);

    for (;;)
    {
        BBridgeJob job;

        {
            BWithExclusive wx(&br->Exclusive);

            while (br->Jobs.size() == 0 && br->Stopping == 0)
                ConditionWait(&br->Condition, &br->Exclusive);

            if (br->Jobs.size() == 0)
                break;

            job = br->Jobs.front();
            br->Jobs.pop_front();
        }

        BValue val = job.Fn(job.Context);
        if (BridgeComplete(rt, job.Index, job.Generation, val, 0) == 0
                && rt->Config.VerboseFlag)
            printf("bridge: result for handle %u discarded\n", job.Index);
    }

    return(0);
}

BValue BridgeSubmit(BRuntime * rt, BBridgeFn fn, void * ctx)
{
    BBridge * br = rt->Bridge;
    BValue fut = MakeFuture(rt, FUTURE_EXTERNAL);
    BBridgeJob job;

    job.Fn = fn;
    job.Context = ctx;
    job.Index = AsHandle(fut)->Index;
    job.Generation = AsHandle(fut)->Generation;

    if (br->Workers.size() == 0)
    {
        BridgeComplete(rt, job.Index, job.Generation, fn(ctx), 0);
        return(fut);
    }

    BWithExclusive wx(&br->Exclusive);

    br->Jobs.push_back(job);
    WakeCondition(&br->Condition);

    return(fut);
}

static BValue SleepJob(void * ctx)
{
    SleepMicroseconds((ulong_t) ctx);
    return(NilValue);
}

DefineFlags("sleep", SleepPrimitive, NATIVE_AWAIT)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "sleep", argc);
    NonNegativeArgCheck(rt, "sleep", argv[0]);

    return(BridgeSubmit(rt, SleepJob, (void *) (ulong_t) (AsNumber(argv[0]) * 1000.0)));
}

// ---- Primitives ----

static BValue TaskStateKeyword(BRuntime * rt, BTaskState ts)
{
    switch (ts)
    {
    case TaskReady: return(StringCToKeyword(rt, "ready"));
    case TaskSuspended: return(StringCToKeyword(rt, "suspended"));
    case TaskWaiting: return(StringCToKeyword(rt, "waiting"));
    case TaskCompleted: return(StringCToKeyword(rt, "completed"));
    case TaskCancelled: return(StringCToKeyword(rt, "cancelled"));
    case TaskUnknown: break;
    }

    return(StringCToKeyword(rt, "unknown"));
}

static ulong_t TaskIdArg(BRuntime * rt, const char * who, BValue arg)
{
    NonNegativeArgCheck(rt, who, arg);

    return((ulong_t) AsNumber(arg));
}

Define("task-state", TaskStatePrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "task-state", argc);

    return(TaskStateKeyword(rt, TaskState(rt, TaskIdArg(rt, "task-state", argv[0]))));
}

Define("cancel!", CancelPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "cancel!", argc);

    return(CancelTask(rt, TaskIdArg(rt, "cancel!", argv[0])) ? TrueValue : FalseValue);
}

DefineFlags("spawn", SpawnPrimitive, NATIVE_ENV)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "spawn", argc);

    BValue env = CallerEnvironment();
    MarkEnvShared(env);

    return(MakeNumber((double) SpawnTask(rt, argv[0], env)));
}

Define("task-future", TaskFuturePrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "task-future", argc);

    return(TaskFuture(rt, TaskIdArg(rt, "task-future", argv[0])));
}

Define("live-tasks", LiveTasksPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    ZeroArgsCheck(rt, "live-tasks", argc);

    return(MakeNumber((double) LiveTaskCount(rt)));
}

static BNative * Primitives[] =
{
    SleepPrimitive,
    TaskStatePrimitive,
    CancelPrimitive,
    SpawnPrimitive,
    TaskFuturePrimitive,
    LiveTasksPrimitive
};

// ---- Setup ----

void SetupScheduler(BRuntime * rt)
{
    BScheduler * sch = new BScheduler;

    InitializeExclusive(&sch->Exclusive);
    sch->NextId = 1;
    sch->Live = 0;
    rt->Scheduler = sch;
    RegisterRootEnumerator(rt, VisitTasks, sch);

    BBridge * br = new BBridge;

    br->Runtime = rt;
    InitializeExclusive(&br->Exclusive);
    InitializeCondition(&br->Condition);
    br->Started = 0;
    br->Stopping = 0;
    rt->Bridge = br;

    for (ulong_t idx = 0; idx < rt->Config.BridgeThreads; idx++)
    {
        OSThreadHandle h;

        if (StartThread(&h, BridgeWorker, br) == 0)
            ErrorExitBlink("bridge", "unable to start worker thread");

        br->Workers.push_back(h);
    }
}

void DeleteScheduler(BRuntime * rt)
{
    BBridge * br = rt->Bridge;

    {
        BWithExclusive wx(&br->Exclusive);

        br->Stopping = 1;
        br->Jobs.clear();
        WakeAllCondition(&br->Condition);
    }

    for (ulong_t idx = 0; idx < br->Workers.size(); idx++)
        JoinThread(br->Workers[idx]);

    DeleteCondition(&br->Condition);
    DeleteExclusive(&br->Exclusive);
    delete br;
    rt->Bridge = 0;

    BScheduler * sch = rt->Scheduler;

    for (std::map<ulong_t, BTask *>::iterator it = sch->Tasks.begin(); it != sch->Tasks.end();
            it++)
    {
        BTask * tsk = it->second;

        if (tsk->Resume != 0)
            DropEvalState(rt, tsk->Resume);
        if (tsk->Receiver != 0)
            OneshotDropReceiver(tsk->Receiver);

        delete tsk;
    }

    DeleteExclusive(&sch->Exclusive);
    delete sch;
    rt->Scheduler = 0;
}

void SetupSchedulerNatives(BRuntime * rt)
{
    for (ulong_t idx = 0; idx < sizeof(Primitives) / sizeof(BNative *); idx++)
        DefineNative(rt, CoreModule, Primitives[idx]);
}
