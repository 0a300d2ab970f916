/*

Blink

*/

#include <pthread.h>
#include "blinktest.hpp"
#include "syncthrd.hpp"

typedef BlinkTest GCTest;

static ulong_t LiveObjects(BRuntime * rt)
{
    BHeapStatistics hs;

    HeapStatistics(rt, &hs);
    return(hs.LiveObjects);
}

TEST_F(GCTest, ReclaimsGarbage)
{
    Collect(rt);
    ulong_t base = LiveObjects(rt);

    for (ulong_t idx = 0; idx < 1000; idx++)
        MakeStringC(rt, "garbage");

    EXPECT_GE(LiveObjects(rt), base + 1000);

    Collect(rt);
    EXPECT_EQ(base, LiveObjects(rt));

    BHeapStatistics hs;
    HeapStatistics(rt, &hs);
    EXPECT_GE(hs.Collections, 2u);
    EXPECT_EQ(0u, hs.CheckFailures);
}

TEST_F(GCTest, RootsSurvive)
{
    BValue lst = MakeList(rt);
    BValue map = MakeMap(rt);

    RegisterRoot(rt, &map, "test-map");
    BAlive al(rt, &lst);

    for (ulong_t idx = 0; idx < 100; idx++)
    {
        ListAppend(rt, lst, Num(idx));
        MapInsert(rt, map, Num(idx), MakeStringC(rt, "value"));
    }

    Collect(rt);
    Collect(rt);

    EXPECT_EQ(100u, ListLength(lst));
    EXPECT_EQ(Num(99), ListLast(rt, lst));
    EXPECT_EQ(100u, MapLength(map));
    EXPECT_TRUE(StringEqualP(MapGet(rt, map, Num(50), NilValue), Str("value")));

    UnregisterRoot(rt, &map);
}

TEST_F(GCTest, GlobalsSurvive)
{
    ModuleDefine(rt, UserModule, Sym("kept"), Form({Str("a"), Str("b")}));

    Collect(rt);

    EXPECT_EQ("(\"a\" \"b\")", Show(Eval(Sym("kept"))));
}

TEST_F(GCTest, SweepReleasesMonitors)
{
    ulong_t mcnt = ActiveMonitorCount(rt);

    {
        BValue vec = Vec({});

        ObjectIdentityHash(rt, vec);
        LockObject(rt, vec);
        UnlockObject(rt, vec);

        EXPECT_EQ(SyncInflated, LockState(vec));
        EXPECT_EQ(mcnt + 1, ActiveMonitorCount(rt));
    }

    Collect(rt);
    EXPECT_EQ(mcnt, ActiveMonitorCount(rt));
}

TEST_F(GCTest, SweepRetiresHandles)
{
    ulong_t hcnt = ActiveHandleCount(rt);
    BValue kept = MakeFuture(rt, 0);
    BAlive al(rt, &kept);

    MakeFuture(rt, 0);
    MakeChannel(rt, 1);
    EXPECT_EQ(hcnt + 3, ActiveHandleCount(rt));

    Collect(rt);
    EXPECT_EQ(hcnt + 1, ActiveHandleCount(rt));

    BValue v;
    EXPECT_EQ(FuturePending, FuturePoll(rt, kept, &v));
}

TEST_F(GCTest, CompletedValuesSurvive)
{
    BValue fut = MakeFuture(rt, 0);
    BAlive al(rt, &fut);

    FutureComplete(rt, fut, Form({Num(1), Num(2)}));
    Collect(rt);

    BValue v = NilValue;
    EXPECT_EQ(FutureReady, FuturePoll(rt, fut, &v));
    EXPECT_EQ("(1 2)", Show(v));
}

TEST_F(GCTest, WriteBarrierCounts)
{
    BHeapStatistics hs1;
    BHeapStatistics hs2;
    BValue vec = Vec({Num(1)});

    HeapStatistics(rt, &hs1);
    VectorSet(rt, vec, 0, Str("x"));
    HeapStatistics(rt, &hs2);

    EXPECT_GT(hs2.BarrierCount, hs1.BarrierCount);
}

class GCTriggerTest : public BlinkTest
{
protected:

    virtual void Configure(BConfig * cfg)
    {
        cfg->TriggerObjects = 256;
        cfg->CheckHeapFlag = 1;
    }
};

typedef struct
{
    BRuntime * Runtime;
    ulong_t Length;
    double Sum;
} AllocWorker;

static void FillList(BRuntime * rt, ulong_t cnt, ulong_t * len, double * sum)
{
    BValue lst = MakeList(rt);
    BAlive al(rt, &lst);

    for (ulong_t idx = 0; idx < cnt; idx++)
    {
        ListAppend(rt, lst, MakeNumber((double) idx));
        MakeStringC(rt, "garbage");
        SafePoint(rt);
    }

    *len = ListLength(lst);
    *sum = 0;

    BListCursor lc;
    for (ListCursorStart(rt, lst, &lc); ListCursorDoneP(&lc) == 0; ListCursorNext(&lc))
        *sum += AsNumber(ListCursorValue(&lc));
}

static void * AllocateOnThread(void * arg)
{
    AllocWorker * aw = (AllocWorker *) arg;

    FillList(aw->Runtime, 2000, &aw->Length, &aw->Sum);
    LeaveRuntime(aw->Runtime);

    return(0);
}

TEST_F(GCTriggerTest, ThreadsCollectTogether)
{
    AllocWorker aw = {rt, 0, 0};
    OSThreadHandle h;

    ASSERT_TRUE(StartThread(&h, AllocateOnThread, &aw));

    ulong_t len;
    double sum;
    FillList(rt, 2000, &len, &sum);

    EnterWait(rt);
    JoinThread(h);
    LeaveWait(rt);

    EXPECT_EQ(2000u, len);
    EXPECT_EQ(1999.0 * 2000.0 / 2, sum);
    EXPECT_EQ(2000u, aw.Length);
    EXPECT_EQ(1999.0 * 2000.0 / 2, aw.Sum);

    BHeapStatistics hs;
    HeapStatistics(rt, &hs);
    EXPECT_GT(hs.Collections, 0u);
    EXPECT_EQ(0u, hs.CheckFailures);
}
