/*

Blink

*/

#include <pthread.h>
#include "blinktest.hpp"
#include "syncthrd.hpp"

typedef BlinkTest SyncTest;

TEST_F(SyncTest, ThinLock)
{
    BValue vec = Vec({});

    EXPECT_EQ(SyncUnlocked, LockState(vec));

    LockObject(rt, vec);
    EXPECT_EQ(SyncThin, LockState(vec));
    EXPECT_EQ(CurrentOwnerId(), LockOwner(rt, vec));
    EXPECT_EQ(1u, LockRecursion(rt, vec));

    LockObject(rt, vec);
    EXPECT_EQ(2u, LockRecursion(rt, vec));
    EXPECT_TRUE(TryLockObject(rt, vec));
    EXPECT_EQ(3u, LockRecursion(rt, vec));

    UnlockObject(rt, vec);
    UnlockObject(rt, vec);
    UnlockObject(rt, vec);
    EXPECT_EQ(SyncUnlocked, LockState(vec));
    EXPECT_EQ(0u, LockOwner(rt, vec));
}

TEST_F(SyncTest, DeepRecursionInflates)
{
    BValue vec = Vec({});

    for (ulong_t idx = 0; idx < 255; idx++)
        LockObject(rt, vec);
    EXPECT_EQ(SyncThin, LockState(vec));
    EXPECT_EQ(255u, LockRecursion(rt, vec));

    LockObject(rt, vec);
    EXPECT_EQ(SyncInflated, LockState(vec));
    EXPECT_EQ(256u, LockRecursion(rt, vec));
    EXPECT_EQ(CurrentOwnerId(), LockOwner(rt, vec));

    for (ulong_t idx = 0; idx < 256; idx++)
        UnlockObject(rt, vec);

    EXPECT_EQ(SyncInflated, LockState(vec));
    EXPECT_EQ(0u, LockOwner(rt, vec));
    EXPECT_EQ(0u, LockRecursion(rt, vec));
}

TEST_F(SyncTest, HashSurvivesInflation)
{
    BValue vec = Vec({});
    ulong_t hsh = ObjectIdentityHash(rt, vec);

    EXPECT_EQ(SyncHashed, LockState(vec));
    EXPECT_EQ(hsh, ObjectIdentityHash(rt, vec));

    LockObject(rt, vec);
    EXPECT_EQ(SyncInflated, LockState(vec));
    EXPECT_EQ(hsh, ObjectIdentityHash(rt, vec));
    UnlockObject(rt, vec);

    EXPECT_EQ(hsh, ObjectIdentityHash(rt, vec));
}

TEST_F(SyncTest, ScopedLockOnlyForSharedObjects)
{
    BValue vec = Vec({});

    {
        BObjectLock ol(rt, vec);
        EXPECT_EQ(SyncUnlocked, LockState(vec));
    }

    MarkShared(vec);

    {
        BObjectLock ol(rt, vec);
        EXPECT_EQ(SyncThin, LockState(vec));
    }

    EXPECT_EQ(SyncUnlocked, LockState(vec));
}

TEST_F(SyncTest, TaskOwnership)
{
    BValue vec = Vec({});
    ulong_t thrd = CurrentOwnerId();

    SetCurrentTask(42);
    EXPECT_EQ(42u, CurrentOwnerId());
    LockObject(rt, vec);
    EXPECT_EQ(42u, LockOwner(rt, vec));

    SetCurrentTask(0);
    EXPECT_EQ(thrd, CurrentOwnerId());
    EXPECT_FALSE(TryLockObject(rt, vec));

    SetCurrentTask(42);
    UnlockObject(rt, vec);
    SetCurrentTask(0);
}

typedef struct
{
    BRuntime * Runtime;
    BValue Object;
    volatile int Acquired;
    ulong_t Owner;
} LockWaiter;

static void * WaitForLock(void * arg)
{
    LockWaiter * lw = (LockWaiter *) arg;

    LockObject(lw->Runtime, lw->Object);
    lw->Owner = LockOwner(lw->Runtime, lw->Object);
    lw->Acquired = 1;
    UnlockObject(lw->Runtime, lw->Object);

    return(0);
}

TEST_F(SyncTest, ContentionInflates)
{
    LockWaiter lw;

    lw.Runtime = rt;
    lw.Object = Vec({});
    lw.Acquired = 0;
    lw.Owner = 0;
    MarkShared(lw.Object);

    LockObject(rt, lw.Object);

    OSThreadHandle h;
    ASSERT_TRUE(StartThread(&h, WaitForLock, &lw));

    for (ulong_t cnt = 0; cnt < 10000 && LockState(lw.Object) != SyncInflated; cnt++)
        SleepMicroseconds(100);

    EXPECT_EQ(SyncInflated, LockState(lw.Object));
    EXPECT_EQ(CurrentOwnerId(), LockOwner(rt, lw.Object));
    EXPECT_EQ(0, lw.Acquired);

    UnlockObject(rt, lw.Object);
    JoinThread(h);

    EXPECT_EQ(1, lw.Acquired);
    EXPECT_NE(0u, lw.Owner);
    EXPECT_NE(CurrentOwnerId(), lw.Owner);
    EXPECT_EQ(1u, ActiveMonitorCount(rt));
}
