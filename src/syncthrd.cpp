/*

Blink

*/

#ifdef BLINK_UNIX
#include <pthread.h>
#include <unistd.h>
#include <errno.h>
#include <sys/time.h>
#endif // BLINK_UNIX

#include <stdio.h>
#include <stdlib.h>
#include <time.h>
#include <string.h>
#include <vector>
#include "blink.hpp"
#include "syncthrd.hpp"

// ---- Exclusives ----

#ifdef BLINK_UNIX
void InitializeExclusive(OSExclusive * ose)
{
    pthread_mutexattr_t mta;

    pthread_mutexattr_init(&mta);
    pthread_mutexattr_settype(&mta, PTHREAD_MUTEX_RECURSIVE);
    pthread_mutex_init(ose, &mta);
}

int ConditionWaitTimeout(OSCondition * osc, OSExclusive * ose, ulong_t us)
{
    struct timeval tv;
    struct timespec ts;

    gettimeofday(&tv, 0);
    ulong_t ns = (tv.tv_usec + us % 1000000) * 1000;
    ts.tv_sec = tv.tv_sec + us / 1000000 + ns / 1000000000;
    ts.tv_nsec = ns % 1000000000;

    return(pthread_cond_timedwait(osc, ose, &ts) == 0);
}

void SleepMicroseconds(ulong_t us)
{
    struct timespec ts;
    ts.tv_sec = us / 1000000;
    ts.tv_nsec = (us % 1000000) * 1000;

    while (nanosleep(&ts, &ts) != 0 && errno == EINTR)
        ;
}

int StartThread(OSThreadHandle * h, OSThreadFn fn, void * arg)
{
    return(pthread_create(h, 0, fn, arg) == 0);
}

void JoinThread(OSThreadHandle h)
{
    pthread_join(h, 0);
}
#endif // BLINK_UNIX

BWithExclusive::BWithExclusive(OSExclusive * ose)
{
    Exclusive = ose;
    EnterExclusive(Exclusive);
}

BWithExclusive::~BWithExclusive()
{
    LeaveExclusive(Exclusive);
}

// ---- Oneshot Channels ----

BOneshot * MakeOneshot()
{
    BOneshot * os = (BOneshot *) malloc(sizeof(BOneshot));
    if (os == 0)
        ErrorExitBlink("oneshot", "out of memory");

    InitializeExclusive(&os->Exclusive);
    os->References = 2;
    os->Sent = 0;
    os->ReceiverDropped = 0;
    os->Failed = 0;
    os->Value = NilValue;

    return(os);
}

static void OneshotRelease(BOneshot * os)
{
    EnterExclusive(&os->Exclusive);
    BAssert(os->References > 0);

    os->References -= 1;
    ulong_t refs = os->References;
    LeaveExclusive(&os->Exclusive);

    if (refs == 0)
    {
        DeleteExclusive(&os->Exclusive);
        free(os);
    }
}

int OneshotSend(BOneshot * os, BValue val, int failed)
{
    BWithExclusive wx(&os->Exclusive);

    if (os->Sent || os->ReceiverDropped)
        return(0);

    os->Value = val;
    os->Failed = failed;
    os->Sent = 1;
    return(1);
}

int OneshotTryReceive(BOneshot * os, BValue * pv, int * failed)
{
    BWithExclusive wx(&os->Exclusive);

    if (os->Sent == 0)
        return(0);

    *pv = os->Value;
    *failed = os->Failed;
    return(1);
}

void OneshotDropSender(BOneshot * os)
{
    OneshotRelease(os);
}

void OneshotDropReceiver(BOneshot * os)
{
    EnterExclusive(&os->Exclusive);
    os->ReceiverDropped = 1;
    os->Value = NilValue;
    LeaveExclusive(&os->Exclusive);

    OneshotRelease(os);
}

// ---- Owners ----
//
// The owner recorded in a thin lock is the running task when the scheduler is
// executing one, otherwise an ordinal for the thread.

#define THREAD_OWNER_BASE 0x80000000

static std::atomic<uint32_t> NextThreadOwner(THREAD_OWNER_BASE);
static thread_local uint32_t ThreadOwner = 0;
static thread_local uint32_t CurrentTask = 0;

ulong_t CurrentOwnerId()
{
    if (CurrentTask != 0)
        return(CurrentTask);

    if (ThreadOwner == 0)
        ThreadOwner = NextThreadOwner.fetch_add(1);
    return(ThreadOwner);
}

void SetCurrentTask(ulong_t id)
{
    BAssert(id < THREAD_OWNER_BASE);

    CurrentTask = (uint32_t) id;
}

// ---- Sync Words ----
//
// bits 0..15: state, bits 16..55: payload, bits 56..62: version

#define SYNC_STATE_MASK 0xFFFFULL
#define SYNC_PAYLOAD_SHIFT 16
#define SYNC_PAYLOAD_MASK 0xFFFFFFFFFFULL
#define SYNC_VERSION_SHIFT 56
#define SYNC_VERSION_MASK 0x7FULL

#define THIN_OWNER_MASK 0xFFFFFFFFULL
#define THIN_COUNT_SHIFT 32
#define THIN_MAXIMUM_COUNT 0xFF

inline ulong_t SyncState(uint64_t sw)
{
    return(sw & SYNC_STATE_MASK);
}

inline ulong_t SyncPayload(uint64_t sw)
{
    return((sw >> SYNC_PAYLOAD_SHIFT) & SYNC_PAYLOAD_MASK);
}

inline ulong_t SyncVersion(uint64_t sw)
{
    return((sw >> SYNC_VERSION_SHIFT) & SYNC_VERSION_MASK);
}

inline uint64_t MakeSyncWord(ulong_t st, ulong_t pay, uint64_t old)
{
    BAssert((pay & ~SYNC_PAYLOAD_MASK) == 0);

    return((((SyncVersion(old) + 1) & SYNC_VERSION_MASK) << SYNC_VERSION_SHIFT)
            | (pay << SYNC_PAYLOAD_SHIFT) | st);
}

inline ulong_t ThinPayload(ulong_t owner, ulong_t cnt)
{
    return((cnt << THIN_COUNT_SHIFT) | owner);
}

// ---- Monitors ----

typedef struct
{
    OSExclusive Exclusive;
    OSCondition Condition;
    void * Object;
    ulong_t Owner;
    ulong_t Recursion;
    ulong_t Waiting;
    ulong_t Hash;
    long_t NextFree;
} BMonitor;

struct _BMonitorTable
{
    OSExclusive Exclusive;
    std::vector<BMonitor *> Monitors;
    long_t FreeList;
    ulong_t Active;
};

void SetupMonitors(BRuntime * rt)
{
    BMonitorTable * mt = new BMonitorTable;

    InitializeExclusive(&mt->Exclusive);
    mt->FreeList = -1;
    mt->Active = 0;
    rt->Monitors = mt;
}

void DeleteMonitors(BRuntime * rt)
{
    BMonitorTable * mt = rt->Monitors;

    for (ulong_t idx = 0; idx < mt->Monitors.size(); idx++)
    {
        BMonitor * mon = mt->Monitors[idx];

        DeleteExclusive(&mon->Exclusive);
        DeleteCondition(&mon->Condition);
        free(mon);
    }

    DeleteExclusive(&mt->Exclusive);
    delete mt;
    rt->Monitors = 0;
}

static ulong_t AllocateMonitor(BRuntime * rt, void * obj, ulong_t owner, ulong_t cnt, ulong_t hsh)
{
    BMonitorTable * mt = rt->Monitors;
    BWithExclusive wx(&mt->Exclusive);
    BMonitor * mon;
    ulong_t idx;

    if (mt->FreeList >= 0)
    {
        idx = (ulong_t) mt->FreeList;
        mon = mt->Monitors[idx];
        mt->FreeList = mon->NextFree;
    }
    else
    {
        idx = mt->Monitors.size();
        if (idx > SYNC_PAYLOAD_MASK)
            ErrorExitBlink("inflate", "too many monitors");

        mon = (BMonitor *) malloc(sizeof(BMonitor));
        if (mon == 0)
            ErrorExitBlink("inflate", "out of memory");

        InitializeExclusive(&mon->Exclusive);
        InitializeCondition(&mon->Condition);
        mt->Monitors.push_back(mon);
    }

    mon->Object = obj;
    mon->Owner = owner;
    mon->Recursion = cnt;
    mon->Waiting = 0;
    mon->Hash = hsh;
    mon->NextFree = -1;
    mt->Active += 1;

    return(idx);
}

static BMonitor * MonitorAt(BRuntime * rt, ulong_t idx)
{
    BMonitorTable * mt = rt->Monitors;
    BWithExclusive wx(&mt->Exclusive);

    BMustBe(idx < mt->Monitors.size());

    return(mt->Monitors[idx]);
}

void ReleaseMonitor(BRuntime * rt, ulong_t idx, void * obj)
{
    BMonitorTable * mt = rt->Monitors;
    BWithExclusive wx(&mt->Exclusive);

    BMustBe(idx < mt->Monitors.size());

    BMonitor * mon = mt->Monitors[idx];

    BAssert(mon->Object == obj);
    BAssert(mon->Waiting == 0);

    mon->Object = 0;
    mon->Owner = 0;
    mon->Recursion = 0;
    mon->NextFree = mt->FreeList;
    mt->FreeList = (long_t) idx;
    mt->Active -= 1;
}

ulong_t ActiveMonitorCount(BRuntime * rt)
{
    BWithExclusive wx(&rt->Monitors->Exclusive);

    return(rt->Monitors->Active);
}

static void WaitOnMonitor(BRuntime * rt, BMonitor * mon)
{
    BAllocContext * ctx = CurrentAllocContext(rt);

    mon->Waiting += 1;
    if (ctx != 0)
        EnterWait(rt);
    ConditionWait(&mon->Condition, &mon->Exclusive);
    if (ctx != 0)
        LeaveWait(rt);
    mon->Waiting -= 1;
}

static void MonitorEnter(BRuntime * rt, BMonitor * mon, ulong_t owner)
{
    EnterExclusive(&mon->Exclusive);
    while (mon->Owner != 0 && mon->Owner != owner)
        WaitOnMonitor(rt, mon);

    if (mon->Owner == owner)
        mon->Recursion += 1;
    else
    {
        mon->Owner = owner;
        mon->Recursion = 1;
    }
    LeaveExclusive(&mon->Exclusive);
}

static int MonitorTryEnter(BMonitor * mon, ulong_t owner)
{
    BWithExclusive wx(&mon->Exclusive);

    if (mon->Owner == owner)
        mon->Recursion += 1;
    else if (mon->Owner == 0)
    {
        mon->Owner = owner;
        mon->Recursion = 1;
    }
    else
        return(0);
    return(1);
}

static void MonitorExit(BMonitor * mon, ulong_t owner)
{
    BWithExclusive wx(&mon->Exclusive);

    if (mon->Owner != owner)
        ErrorExitBlink("unlock", "object is locked by another owner");

    BAssert(mon->Recursion > 0);

    mon->Recursion -= 1;
    if (mon->Recursion == 0)
    {
        mon->Owner = 0;
        if (mon->Waiting > 0)
            WakeCondition(&mon->Condition);
    }
}

// Move the object to the Inflated state, carrying over the current thin owner
// and count or the installed hash.

static void InflateObject(BRuntime * rt, BObjHdr * oh, uint64_t sw)
{
    ulong_t owner = 0;
    ulong_t cnt = 0;
    ulong_t hsh = IdentityHash(oh + 1) & SYNC_PAYLOAD_MASK;

    if (SyncState(sw) == SyncThin)
    {
        owner = SyncPayload(sw) & THIN_OWNER_MASK;
        cnt = SyncPayload(sw) >> THIN_COUNT_SHIFT;
    }
    else if (SyncState(sw) == SyncHashed)
        hsh = SyncPayload(sw);

    ulong_t idx = AllocateMonitor(rt, oh + 1, owner, cnt, hsh);
    if (oh->SyncWord.compare_exchange_strong(sw, MakeSyncWord(SyncInflated, idx, sw)) == 0)
        ReleaseMonitor(rt, idx, oh + 1);
    else if (rt->Config.VerboseFlag)
        printf("inflate: object %p monitor " ULONG_FMT "\n", (void *) (oh + 1), idx);
}

// ---- Object Locks ----

void MarkShared(BValue obj)
{
    BAssert(ObjectP(obj));

    AsObjHdr(AsObject(obj))->GCWord |= OBJHDR_SHARED;
}

void LockObject(BRuntime * rt, BValue obj)
{
    BAssert(ObjectP(obj));

    BObjHdr * oh = AsObjHdr(AsObject(obj));
    ulong_t me = CurrentOwnerId();

    for (;;)
    {
        uint64_t sw = oh->SyncWord.load();

        switch (SyncState(sw))
        {
        case SyncUnlocked:
            if (oh->SyncWord.compare_exchange_weak(sw,
                    MakeSyncWord(SyncThin, ThinPayload(me, 1), sw)))
                return;
            break;

        case SyncThin:
        {
            ulong_t owner = SyncPayload(sw) & THIN_OWNER_MASK;
            ulong_t cnt = SyncPayload(sw) >> THIN_COUNT_SHIFT;

            if (owner == me && cnt < THIN_MAXIMUM_COUNT)
            {
                if (oh->SyncWord.compare_exchange_weak(sw,
                        MakeSyncWord(SyncThin, ThinPayload(me, cnt + 1), sw)))
                    return;
            }
            else
                InflateObject(rt, oh, sw);
            break;
        }

        case SyncHashed:
            InflateObject(rt, oh, sw);
            break;

        case SyncInflated:
            MonitorEnter(rt, MonitorAt(rt, SyncPayload(sw)), me);
            return;

        default:
            BMustBe(0);
        }
    }
}

int TryLockObject(BRuntime * rt, BValue obj)
{
    BAssert(ObjectP(obj));

    BObjHdr * oh = AsObjHdr(AsObject(obj));
    ulong_t me = CurrentOwnerId();

    for (;;)
    {
        uint64_t sw = oh->SyncWord.load();

        switch (SyncState(sw))
        {
        case SyncUnlocked:
            if (oh->SyncWord.compare_exchange_weak(sw,
                    MakeSyncWord(SyncThin, ThinPayload(me, 1), sw)))
                return(1);
            break;

        case SyncThin:
        {
            ulong_t owner = SyncPayload(sw) & THIN_OWNER_MASK;
            ulong_t cnt = SyncPayload(sw) >> THIN_COUNT_SHIFT;

            if (owner != me)
                return(0);

            if (cnt < THIN_MAXIMUM_COUNT)
            {
                if (oh->SyncWord.compare_exchange_weak(sw,
                        MakeSyncWord(SyncThin, ThinPayload(me, cnt + 1), sw)))
                    return(1);
            }
            else
                InflateObject(rt, oh, sw);
            break;
        }

        case SyncHashed:
            InflateObject(rt, oh, sw);
            break;

        case SyncInflated:
            return(MonitorTryEnter(MonitorAt(rt, SyncPayload(sw)), me));

        default:
            BMustBe(0);
        }
    }
}

void UnlockObject(BRuntime * rt, BValue obj)
{
    BAssert(ObjectP(obj));

    BObjHdr * oh = AsObjHdr(AsObject(obj));
    ulong_t me = CurrentOwnerId();

    for (;;)
    {
        uint64_t sw = oh->SyncWord.load();

        switch (SyncState(sw))
        {
        case SyncUnlocked:
        case SyncHashed:
            ErrorExitBlink("unlock", "object is not locked");
            return;

        case SyncThin:
        {
            ulong_t owner = SyncPayload(sw) & THIN_OWNER_MASK;
            ulong_t cnt = SyncPayload(sw) >> THIN_COUNT_SHIFT;

            if (owner != me)
                ErrorExitBlink("unlock", "object is locked by another owner");

            BAssert(cnt > 0);

            uint64_t nsw = cnt == 1 ? MakeSyncWord(SyncUnlocked, 0, sw)
                    : MakeSyncWord(SyncThin, ThinPayload(me, cnt - 1), sw);
            if (oh->SyncWord.compare_exchange_weak(sw, nsw))
                return;
            break;
        }

        case SyncInflated:
            MonitorExit(MonitorAt(rt, SyncPayload(sw)), me);
            return;

        default:
            BMustBe(0);
        }
    }
}

BSyncState LockState(BValue obj)
{
    BAssert(ObjectP(obj));

    return((BSyncState) SyncState(AsObjHdr(AsObject(obj))->SyncWord.load()));
}

ulong_t LockOwner(BRuntime * rt, BValue obj)
{
    uint64_t sw = AsObjHdr(AsObject(obj))->SyncWord.load();

    if (SyncState(sw) == SyncThin)
        return(SyncPayload(sw) & THIN_OWNER_MASK);
    else if (SyncState(sw) == SyncInflated)
    {
        BMonitor * mon = MonitorAt(rt, SyncPayload(sw));
        BWithExclusive wx(&mon->Exclusive);

        return(mon->Owner);
    }
    return(0);
}

ulong_t LockRecursion(BRuntime * rt, BValue obj)
{
    uint64_t sw = AsObjHdr(AsObject(obj))->SyncWord.load();

    if (SyncState(sw) == SyncThin)
        return(SyncPayload(sw) >> THIN_COUNT_SHIFT);
    else if (SyncState(sw) == SyncInflated)
    {
        BMonitor * mon = MonitorAt(rt, SyncPayload(sw));
        BWithExclusive wx(&mon->Exclusive);

        return(mon->Recursion);
    }
    return(0);
}

ulong_t ObjectIdentityHash(BRuntime * rt, BValue obj)
{
    BAssert(ObjectP(obj));

    BObjHdr * oh = AsObjHdr(AsObject(obj));

    for (;;)
    {
        uint64_t sw = oh->SyncWord.load();

        switch (SyncState(sw))
        {
        case SyncUnlocked:
        {
            ulong_t hsh = IdentityHash(oh + 1) & SYNC_PAYLOAD_MASK;
            if (oh->SyncWord.compare_exchange_weak(sw, MakeSyncWord(SyncHashed, hsh, sw)))
                return(hsh);
            break;
        }

        case SyncHashed:
            return(SyncPayload(sw));

        case SyncThin:
            return(IdentityHash(oh + 1) & SYNC_PAYLOAD_MASK);

        case SyncInflated:
        {
            BMonitor * mon = MonitorAt(rt, SyncPayload(sw));
            BWithExclusive wx(&mon->Exclusive);

            return(mon->Hash);
        }

        default:
            BMustBe(0);
        }
    }
}

// Sweeping calls this for every freed object.

void ReleaseObjectSync(BRuntime * rt, BObjHdr * oh)
{
    uint64_t sw = oh->SyncWord.load();

    if (SyncState(sw) == SyncInflated)
        ReleaseMonitor(rt, SyncPayload(sw), oh + 1);
    oh->SyncWord.store(0);
}

BObjectLock::BObjectLock(BRuntime * rt, BValue obj)
{
    Runtime = rt;
    Object = obj;
    Locked = SharedP(obj);

    if (Locked)
        LockObject(Runtime, Object);
}

BObjectLock::~BObjectLock()
{
    if (Locked)
        UnlockObject(Runtime, Object);
}
