/*

Blink

*/

#include "blinktest.hpp"

typedef BlinkTest SchedulerTest;

TEST_F(SchedulerTest, GoReturnsFuture)
{
    EXPECT_EQ(Num(3), Eval(Form({Sym("deref"), Form({Sym("go"), Form({Sym("+"), Num(1), Num(2)})})})));
    EXPECT_EQ(Kw("future"), Eval(Form({Sym("type-of"), Form({Sym("go"), Num(1)})})));
}

TEST_F(SchedulerTest, TaskLifecycle)
{
    ulong_t id = SpawnTask(rt, Form({Sym("*"), Num(6), Num(7)}), UserModule);
    BValue fut = TaskFuture(rt, id);
    BAlive al(rt, &fut);

    EXPECT_TRUE(FutureP(fut));
    EXPECT_EQ(TaskReady, TaskState(rt, id));
    EXPECT_EQ(1u, LiveTaskCount(rt));

    EXPECT_EQ(1u, SchedulerStep(rt));
    EXPECT_EQ(TaskCompleted, TaskState(rt, id));
    EXPECT_EQ(0u, LiveTaskCount(rt));
    EXPECT_EQ(NilValue, TaskFuture(rt, id));

    BValue v;
    EXPECT_EQ(FutureReady, FuturePoll(rt, fut, &v));
    EXPECT_EQ(Num(42), v);

    EXPECT_EQ(TaskUnknown, TaskState(rt, id + 100));
}

TEST_F(SchedulerTest, FinishedStatesAreBounded)
{
    ulong_t first = SpawnTask(rt, Num(0), UserModule);
    RunScheduler(rt);
    EXPECT_EQ(TaskCompleted, TaskState(rt, first));

    ulong_t last = first;
    for (ulong_t cnt = 0; cnt < FINISHED_TASK_RECORDS; cnt++)
    {
        last = SpawnTask(rt, Num(cnt), UserModule);
        SchedulerStep(rt);
    }

    RunScheduler(rt);

    EXPECT_EQ(0u, LiveTaskCount(rt));
    EXPECT_EQ(TaskUnknown, TaskState(rt, first));
    EXPECT_EQ(TaskCompleted, TaskState(rt, first + 1));
    EXPECT_EQ(TaskCompleted, TaskState(rt, last));
}

TEST_F(SchedulerTest, TasksRunInOrder)
{
    Eval(Form({Sym("def"), Sym("v"), Form({Sym("vector")})}));

    for (ulong_t idx = 1; idx <= 3; idx++)
        SpawnTask(rt, Form({Sym("push!"), Sym("v"), Num(idx)}), UserModule);

    EXPECT_EQ(3u, SchedulerStep(rt));
    EXPECT_EQ("[1 2 3]", Show(Eval(Sym("v"))));
}

TEST_F(SchedulerTest, TaskErrorsFailFuture)
{
    BValue err = Eval(Form({Sym("deref"), Form({Sym("go"), Form({Sym("car"), Num(1)})})}));

    EXPECT_EQ("car expects a list", Message(err));
}

TEST_F(SchedulerTest, SleepUsesBridge)
{
    EXPECT_EQ(NilValue, Eval(Form({Sym("sleep"), Num(1)})));

    BValue form = Form({Sym("deref"), Form({Sym("go"),
            Form({Sym("do"), Form({Sym("sleep"), Num(5)}), Kw("woke")})})});
    EXPECT_EQ(Kw("woke"), Eval(form));

    EXPECT_EQ("expected a non-negative integer",
            Message(Eval(Form({Sym("sleep"), Num(-1)}))));
}

static BValue Answer(void * ctx)
{
    return(MakeNumber(42));
}

TEST_F(SchedulerTest, BridgeSubmit)
{
    BValue fut = BridgeSubmit(rt, Answer, 0);
    BAlive al(rt, &fut);
    BValue v;

    for (ulong_t cnt = 0; cnt < 100000 && FuturePoll(rt, fut, &v) == FuturePending; cnt++)
        SchedulerStep(rt);

    EXPECT_EQ(FutureReady, FuturePoll(rt, fut, &v));
    EXPECT_EQ(Num(42), v);
}

class InlineBridgeTest : public BlinkTest
{
protected:

    virtual void Configure(BConfig * cfg)
    {
        cfg->BridgeThreads = 0;
    }
};

TEST_F(InlineBridgeTest, RunsJobsInline)
{
    BValue fut = BridgeSubmit(rt, Answer, 0);
    BValue v;

    EXPECT_EQ(FutureReady, FuturePoll(rt, fut, &v));
    EXPECT_EQ(Num(42), v);
    EXPECT_EQ(Kw("done"), Eval(Form({Sym("do"), Form({Sym("sleep"), Num(1)}), Kw("done")})));
}

TEST_F(SchedulerTest, ChannelPingPong)
{
    // (do (def c (chan))
    //     (go (do (send! c 1) (send! c 2) (close! c)))
    //     (list (recv c) (recv c) (recv c)))
    BValue form = Form({Sym("do"),
            Form({Sym("def"), Sym("c"), Form({Sym("chan")})}),
            Form({Sym("go"), Form({Sym("do"), Form({Sym("send!"), Sym("c"), Num(1)}),
                    Form({Sym("send!"), Sym("c"), Num(2)}), Form({Sym("close!"), Sym("c")})})}),
            Form({Sym("list"), Form({Sym("recv"), Sym("c")}), Form({Sym("recv"), Sym("c")}),
                    Form({Sym("recv"), Sym("c")})})});

    EXPECT_EQ("(1 2 nil)", Show(Eval(form)));
    EXPECT_EQ(0u, LiveTaskCount(rt));
}

TEST_F(SchedulerTest, TasksShareLocals)
{
    // (let [c (chan) n 20] (go (send! c (+ n 1))) (recv c))
    BValue form = Form({Sym("let"), Vec({Sym("c"), Form({Sym("chan")}), Sym("n"), Num(20)}),
            Form({Sym("go"), Form({Sym("send!"), Sym("c"), Form({Sym("+"), Sym("n"), Num(1)})})}),
            Form({Sym("recv"), Sym("c")})});

    EXPECT_EQ(Num(21), Eval(form));
}

TEST_F(SchedulerTest, CancelSuspendedTask)
{
    Eval(Form({Sym("def"), Sym("c"), Form({Sym("chan")})}));

    ulong_t id = SpawnTask(rt, Form({Sym("recv"), Sym("c")}), UserModule);
    BValue fut = TaskFuture(rt, id);
    BAlive al(rt, &fut);

    SchedulerStep(rt);
    EXPECT_EQ(TaskSuspended, TaskState(rt, id));

    EXPECT_TRUE(CancelTask(rt, id));
    EXPECT_FALSE(CancelTask(rt, id));
    EXPECT_EQ(TaskCancelled, TaskState(rt, id));
    EXPECT_EQ(0u, LiveTaskCount(rt));

    BValue v;
    EXPECT_EQ(FutureFailed, FuturePoll(rt, fut, &v));
    EXPECT_EQ("task cancelled", Message(v));
}

TEST_F(SchedulerTest, CancelWaitingTask)
{
    ulong_t id = SpawnTask(rt, Form({Sym("sleep"), Num(20)}), UserModule);
    BValue fut = TaskFuture(rt, id);
    BAlive al(rt, &fut);

    SchedulerStep(rt);
    EXPECT_EQ(TaskWaiting, TaskState(rt, id));

    EXPECT_TRUE(CancelTask(rt, id));
    EXPECT_EQ(TaskCancelled, TaskState(rt, id));

    BValue v;
    EXPECT_EQ(FutureFailed, FuturePoll(rt, fut, &v));
    EXPECT_EQ("task cancelled", Message(v));
}

TEST_F(SchedulerTest, Natives)
{
    BValue id = Eval(Form({Sym("spawn"), Quote(Form({Sym("+"), Num(1), Num(1)}))}));

    ASSERT_TRUE(NumberP(id));
    EXPECT_EQ(Num(1), Eval(Form({Sym("live-tasks")})));
    EXPECT_EQ(Kw("ready"), Eval(Form({Sym("task-state"), id})));
    EXPECT_TRUE(FutureP(Eval(Form({Sym("task-future"), id}))));

    RunScheduler(rt);

    EXPECT_EQ(Kw("completed"), Eval(Form({Sym("task-state"), id})));
    EXPECT_EQ(Num(0), Eval(Form({Sym("live-tasks")})));
    EXPECT_EQ(FalseValue, Eval(Form({Sym("cancel!"), id})));
    EXPECT_EQ(Kw("unknown"), Eval(Form({Sym("task-state"), Num(9999)})));
}

TEST_F(SchedulerTest, SpawnUsesCallerModule)
{
    Eval(Form({Sym("mod"), Sym("workers"),
            Form({Sym("def"), Sym("depth"), Num(7)}),
            Form({Sym("def"), Sym("job"),
                Form({Sym("task-future"), Form({Sym("spawn"), Quote(Sym("depth"))})})})}));

    EXPECT_EQ(NilValue, Eval(Form({Sym("imp"), Sym("workers"), Vec({Sym("job")})})));
    EXPECT_EQ(Num(7), Eval(Form({Sym("deref"), Sym("job")})));
    EXPECT_EQ(UserModule, CallerEnvironment());

    BValue err = Eval(Form({Sym("deref"),
            Form({Sym("task-future"), Form({Sym("spawn"), Quote(Sym("depth"))})})}));
    EXPECT_EQ("Undefined symbol: depth", Message(err));
}
