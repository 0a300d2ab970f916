/*

Blink

*/

#include "blink.hpp"

#ifdef BLINK_UNIX
#include <pthread.h>
#include <sys/mman.h>
#endif // BLINK_UNIX

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <vector>
#include "syncthrd.hpp"

#define GC_PAGE_SIZE 4096

#define OBJECT_ALIGNMENT 8
const static ulong_t Align[8] = {0, 7, 6, 5, 4, 3, 2, 1};

#define MAXIMUM_TOTAL_LENGTH ((ulong_t) 0xFFFFFFF8)
#define MINIMUM_TOTAL_LENGTH (sizeof(BObjHdr) + OBJECT_ALIGNMENT)
#define MAXIMUM_SLOT_COUNT ((ulong_t) 0xFFFFFFFF)

#define FREE_LISTS 16

typedef struct
{
    void * Base;
    ulong_t BottomUsed;
    ulong_t MaximumSize;
} BMemRegion;

typedef struct
{
    BValue * Root;
    const char * Name;
} BRoot;

typedef struct
{
    BRootEnumFn EnumFn;
    void * Data;
} BRootEnumerator;

struct _BHeap
{
    pthread_key_t ContextKey;

    BMemRegion Region;
    ulong_t Used;
    BObjHdr * BigFree;
    BObjHdr * FreeLists[FREE_LISTS];

    OSExclusive GCExclusive;
    OSExclusive ContextsExclusive;
    OSCondition ReadyCondition;
    OSCondition DoneCondition;
    BAllocContext * Contexts;
    volatile ulong_t TotalContexts;
    volatile ulong_t ReadyContexts;
    volatile long_t Collecting;

    ulong_t BytesAllocated;
    ulong_t Collections;
    ulong_t CheckFailures;
    ulong_t RetiredBarrierCount;

    std::vector<BRoot> Roots;
    std::vector<BRootEnumerator> Enumerators;
};

// ---- Memory Regions ----

static inline ulong_t RoundToPageSize(ulong_t cnt)
{
    if (cnt % GC_PAGE_SIZE != 0)
    {
        cnt += GC_PAGE_SIZE - (cnt % GC_PAGE_SIZE);

        BAssert(cnt % GC_PAGE_SIZE == 0);
    }

    return(cnt);
}

static void * InitializeMemRegion(BMemRegion * mrgn, ulong_t max)
{
    mrgn->BottomUsed = 0;
    mrgn->MaximumSize = RoundToPageSize(max);
    mrgn->Base = mmap(0, mrgn->MaximumSize, PROT_NONE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (mrgn->Base == MAP_FAILED)
        mrgn->Base = 0;
    return(mrgn->Base);
}

static void DeleteMemRegion(BMemRegion * mrgn)
{
    BAssert(mrgn->Base != 0);
    BAssert(mrgn->MaximumSize % GC_PAGE_SIZE == 0);

    munmap(mrgn->Base, mrgn->MaximumSize);
    mrgn->Base = 0;
}

static int GrowMemRegionUp(BMemRegion * mrgn, ulong_t sz)
{
    BAssert(mrgn->Base != 0);
    BAssert(mrgn->BottomUsed % GC_PAGE_SIZE == 0);
    BAssert(mrgn->BottomUsed <= mrgn->MaximumSize);

    if (sz > mrgn->BottomUsed)
    {
        sz = RoundToPageSize(sz);
        if (sz > mrgn->MaximumSize)
            return(0);

        if (mprotect(((uint8_t *) mrgn->Base) + mrgn->BottomUsed, sz - mrgn->BottomUsed,
                PROT_READ | PROT_WRITE) != 0)
            return(0);

        mrgn->BottomUsed = sz;
    }

    return(1);
}

// ---- Object Headers ----

static inline void SetMark(BObjHdr * oh)
{
    oh->GCWord |= OBJHDR_MARK;
}

static inline void ClearMark(BObjHdr * oh)
{
    oh->GCWord &= ~((uint64_t) OBJHDR_MARK);
}

static inline int MarkP(BObjHdr * oh)
{
    return((oh->GCWord & OBJHDR_MARK) != 0);
}

static inline void SetCheckMark(BObjHdr * oh)
{
    oh->GCWord |= OBJHDR_CHECK_MARK;
}

static inline void ClearCheckMark(BObjHdr * oh)
{
    oh->GCWord &= ~((uint64_t) OBJHDR_CHECK_MARK);
}

static inline int CheckMarkP(BObjHdr * oh)
{
    return((oh->GCWord & OBJHDR_CHECK_MARK) != 0);
}

static inline BObjHdr * NextObjHdr(BObjHdr * oh)
{
    return((BObjHdr *) (((char *) oh) + oh->TotalSize));
}

static inline BObjHdr ** FreeNext(BObjHdr * oh)
{
    return((BObjHdr **) (oh + 1));
}

static void InitializeObjHdr(BObjHdr * oh, ulong_t tsz, ulong_t tag, ulong_t sc)
{
    BAssert(tsz >= MINIMUM_TOTAL_LENGTH);
    BAssert(tsz % OBJECT_ALIGNMENT == 0);
    BAssert(tsz <= MAXIMUM_TOTAL_LENGTH);

    oh->GCWord = ((uint64_t) sc) << 32;
    oh->Tag = (uint8_t) tag;
    oh->Pad[0] = 0;
    oh->Pad[1] = 0;
    oh->Pad[2] = 0;
    oh->TotalSize = (uint32_t) tsz;
    oh->SyncWord.store(0);

    BAssert(oh->SlotCount() == sc);
}

// ---- Allocation ----

static void AddFree(BHeap * hp, BObjHdr * oh, ulong_t tsz)
{
    ulong_t bkt = tsz / OBJECT_ALIGNMENT;

    InitializeObjHdr(oh, tsz, FreeTag, 0);
    if (bkt < FREE_LISTS)
    {
        *FreeNext(oh) = hp->FreeLists[bkt];
        hp->FreeLists[bkt] = oh;
    }
    else
    {
        *FreeNext(oh) = hp->BigFree;
        hp->BigFree = oh;
    }
}

static BObjHdr * AllocateObject(BHeap * hp, ulong_t tsz)
{
    ulong_t bkt = tsz / OBJECT_ALIGNMENT;
    BObjHdr * oh = 0;

    if (bkt < FREE_LISTS && hp->FreeLists[bkt] != 0)
    {
        oh = hp->FreeLists[bkt];
        hp->FreeLists[bkt] = *FreeNext(oh);

        BAssert(oh->TotalSize == tsz);
        BAssert(oh->Tag == FreeTag);
        return(oh);
    }

    BObjHdr * foh = hp->BigFree;
    BObjHdr ** pfoh = &hp->BigFree;
    while (foh != 0)
    {
        ulong_t ftsz = foh->TotalSize;

        BAssert(ftsz % OBJECT_ALIGNMENT == 0);
        BAssert(foh->Tag == FreeTag);

        if (ftsz == tsz)
        {
            *pfoh = *FreeNext(foh);
            return(foh);
        }
        else if (ftsz >= tsz + FREE_LISTS * OBJECT_ALIGNMENT)
        {
            // Take the end of the block; the front stays on the big free list.

            oh = (BObjHdr *) (((char *) foh) + ftsz - tsz);
            foh->TotalSize = (uint32_t) (ftsz - tsz);
            return(oh);
        }

        pfoh = FreeNext(foh);
        foh = *FreeNext(foh);
    }

    if (hp->Used + tsz > hp->Region.BottomUsed)
    {
        if (hp->Used + tsz > hp->Region.MaximumSize)
            return(0);

        ulong_t gsz = 1024 * 1024;
        if (tsz > gsz)
            gsz = tsz;
        if (gsz > hp->Region.MaximumSize - hp->Region.BottomUsed)
            gsz = hp->Region.MaximumSize - hp->Region.BottomUsed;
        if (GrowMemRegionUp(&hp->Region, hp->Region.BottomUsed + gsz) == 0)
            return(0);
    }

    oh = (BObjHdr *) (((char *) hp->Region.Base) + hp->Used);
    hp->Used += tsz;

    return(oh);
}

void * MakeObject(BRuntime * rt, ulong_t tag, ulong_t sz, ulong_t sc, const char * who)
{
    BHeap * hp = rt->Heap;
    BAllocContext * ctx = GetAllocContext(rt);
    ulong_t tsz = sz;

    tsz += Align[tsz % OBJECT_ALIGNMENT];
    if (tsz == 0)
        tsz = OBJECT_ALIGNMENT;
    tsz += sizeof(BObjHdr);

    BAssert(tsz % OBJECT_ALIGNMENT == 0);
    BAssert(tag > 0);
    BAssert(tag < BadDogTag);
    BAssert(tag != FreeTag);
    BAssert(sz >= sizeof(BValue) * sc);

    if (tsz > MAXIMUM_TOTAL_LENGTH)
        RaiseErrorC(rt, who, "object too big", NilValue);
    if (sc > MAXIMUM_SLOT_COUNT)
        RaiseErrorC(rt, who, "too many slots", NilValue);

    EnterExclusive(&hp->GCExclusive);
    BObjHdr * oh = AllocateObject(hp, tsz);
    if (oh != 0)
        hp->BytesAllocated += tsz;
    LeaveExclusive(&hp->GCExclusive);

    if (oh == 0)
        ErrorExitBlink(who, "heap exhausted; increase maximum-heap-size");

    InitializeObjHdr(oh, tsz, tag, sc);
    memset(oh + 1, 0, tsz - sizeof(BObjHdr));
    for (ulong_t sdx = 0; sdx < sc; sdx++)
        oh->Slots()[sdx] = NilValue;

    ctx->ObjectsSinceLast += 1;
    ctx->BytesSinceLast += tsz;

    if (rt->Config.CollectorType != NoCollector
            && (ctx->ObjectsSinceLast > rt->Config.TriggerObjects
            || ctx->BytesSinceLast > rt->Config.TriggerBytes))
        rt->GCRequired = 1;

    return(oh + 1);
}

// ---- Write Barrier ----

static int ValidObjectP(BHeap * hp, void * obj)
{
    char * p = (char *) obj;
    char * base = (char *) hp->Region.Base;

    if (p < base + sizeof(BObjHdr) || p >= base + hp->Used
            || ((ulong_t) p) % OBJECT_ALIGNMENT != 0)
        return(0);

    BObjHdr * oh = AsObjHdr(obj);
    return(oh->Tag > 0 && oh->Tag < BadDogTag && oh->Tag != FreeTag);
}

void WriteBarrier(BRuntime * rt, BValue obj, BValue val)
{
    BAllocContext * ctx = CurrentAllocContext(rt);
    if (ctx != 0)
        ctx->BarrierCount += 1;

    if (rt->Config.CheckHeapFlag && ObjectP(val) && ValidObjectP(rt->Heap, AsObject(val)) == 0)
    {
        printf("write-barrier: %p stored into %p is not a live object\n", AsObject(val),
                AsObject(obj));
        rt->Heap->CheckFailures += 1;
    }
}

void ModifyObject(BRuntime * rt, BValue obj, ulong_t idx, BValue val)
{
    BAssert(ObjectP(obj));
    BAssert(idx < AsObjHdr(AsObject(obj))->SlotCount());

    ((BValue *) AsObject(obj))[idx] = val;
    WriteBarrier(rt, obj, val);
}

// ---- Roots ----

void RegisterRoot(BRuntime * rt, BValue * root, const char * name)
{
    BRoot r = {root, name};

    BWithExclusive wx(&rt->Heap->GCExclusive);
    rt->Heap->Roots.push_back(r);
}

void UnregisterRoot(BRuntime * rt, BValue * root)
{
    BWithExclusive wx(&rt->Heap->GCExclusive);
    std::vector<BRoot> & roots = rt->Heap->Roots;

    for (ulong_t rdx = 0; rdx < roots.size(); rdx++)
        if (roots[rdx].Root == root)
        {
            roots.erase(roots.begin() + rdx);
            return;
        }
}

void RegisterRootEnumerator(BRuntime * rt, BRootEnumFn fn, void * data)
{
    BRootEnumerator re = {fn, data};

    BWithExclusive wx(&rt->Heap->GCExclusive);
    rt->Heap->Enumerators.push_back(re);
}

// ---- Check Heap ----

static ulong_t CheckFailed(BHeap * hp, const char * fn, int ln, const char * msg, void * obj)
{
    printf("CheckHeap: %s:%d: %s: %p\n", fn, ln, msg, obj);
    hp->CheckFailures += 1;
    return(1);
}

void CheckHeap(BRuntime * rt, const char * fn, int ln)
{
    BHeap * hp = rt->Heap;
    ulong_t cnt = 0;
    ulong_t fcnt = 0;

    BObjHdr * oh = (BObjHdr *) hp->Region.Base;
    while ((char *) oh < ((char *) hp->Region.Base) + hp->Used)
    {
        if (oh->TotalSize < MINIMUM_TOTAL_LENGTH || oh->TotalSize % OBJECT_ALIGNMENT != 0
                || (char *) NextObjHdr(oh) > ((char *) hp->Region.Base) + hp->Used)
        {
            CheckFailed(hp, fn, ln, "bad total size", oh + 1);
            return;
        }

        if (oh->Tag == 0 || oh->Tag >= BadDogTag)
            fcnt += CheckFailed(hp, fn, ln, "bad tag", oh + 1);
        else if (oh->Tag != FreeTag)
        {
            SetCheckMark(oh);
            cnt += 1;
        }

        oh = NextObjHdr(oh);
    }

    oh = (BObjHdr *) hp->Region.Base;
    while ((char *) oh < ((char *) hp->Region.Base) + hp->Used)
    {
        if (oh->Tag != FreeTag)
        {
            if (oh->SlotCount() * sizeof(BValue) > oh->ObjectSize())
                fcnt += CheckFailed(hp, fn, ln, "bad slot count", oh + 1);
            else
                for (ulong_t sdx = 0; sdx < oh->SlotCount(); sdx++)
                {
                    BValue v = oh->Slots()[sdx];
                    if (ObjectP(v) && (ValidObjectP(hp, AsObject(v)) == 0
                            || CheckMarkP(AsObjHdr(AsObject(v))) == 0))
                        fcnt += CheckFailed(hp, fn, ln, "bad reference", oh + 1);
                }
        }

        oh = NextObjHdr(oh);
    }

    for (ulong_t rdx = 0; rdx < hp->Roots.size(); rdx++)
    {
        BValue v = *hp->Roots[rdx].Root;
        if (ObjectP(v) && (ValidObjectP(hp, AsObject(v)) == 0
                || CheckMarkP(AsObjHdr(AsObject(v))) == 0))
            fcnt += CheckFailed(hp, fn, ln, hp->Roots[rdx].Name, AsObject(v));
    }

    oh = (BObjHdr *) hp->Region.Base;
    while ((char *) oh < ((char *) hp->Region.Base) + hp->Used)
    {
        ClearCheckMark(oh);
        oh = NextObjHdr(oh);
    }

    if (rt->Config.VerboseFlag)
        printf("CheckHeap: %s:%d: " ULONG_FMT " active objects, " ULONG_FMT " failures\n", fn,
                ln, cnt, fcnt);
}

// ---- Collection ----

static void ScanObject(BValue * pv);
static inline void LiveObject(BValue * pv)
{
    if (ObjectP(*pv))
        ScanObject(pv);
}

static void VisitRoot(BValue * pv, void * ctx)
{
    LiveObject(pv);
}

static void ScanObject(BValue * pv)
{
Again:
    BAssert(ObjectP(*pv));

    BObjHdr * oh = AsObjHdr(AsObject(*pv));

    BAssert(oh->Tag != FreeTag);

    if (MarkP(oh))
        return;
    SetMark(oh);

    ulong_t sc = oh->SlotCount();
    if (sc > 0)
    {
        ulong_t sdx = 0;
        while (sdx < sc - 1)
        {
            LiveObject(oh->Slots() + sdx);
            sdx += 1;
        }

        if (ObjectP(oh->Slots()[sdx]))
        {
            pv = oh->Slots() + sdx;
            goto Again;
        }
    }
}

static void CleanupObject(BRuntime * rt, BObjHdr * oh)
{
    if (oh->Tag == FreeTag)
        return;

    ReleaseObjectSync(rt, oh);

    if (oh->Tag == FutureTag || oh->Tag == ChannelTag)
    {
        BHandle * hdl = (BHandle *) (oh + 1);
        ReleaseHandleEntry(rt, hdl->Index, hdl->Generation);
    }
}

static void CollectGarbage(BRuntime * rt)
{
    BHeap * hp = rt->Heap;

    BAssert(rt->Config.CollectorType != NoCollector);

    if (rt->Config.VerboseFlag)
        printf("Garbage Collection...\n");

    if (rt->Config.CheckHeapFlag)
        CheckHeap(rt, __FILE__, __LINE__);

    BObjHdr * oh = (BObjHdr *) hp->Region.Base;
    while ((char *) oh < ((char *) hp->Region.Base) + hp->Used)
    {
        ClearMark(oh);
        oh = NextObjHdr(oh);
    }

    for (ulong_t rdx = 0; rdx < hp->Roots.size(); rdx++)
        LiveObject(hp->Roots[rdx].Root);

    BAllocContext * ctx = hp->Contexts;
    while (ctx != 0)
    {
        for (BAlive * ap = ctx->AliveList; ap != 0; ap = ap->Next)
            LiveObject(ap->Pointer);

        ctx->ObjectsSinceLast = 0;
        ctx->BytesSinceLast = 0;
        ctx = ctx->Next;
    }

    for (ulong_t edx = 0; edx < hp->Enumerators.size(); edx++)
        hp->Enumerators[edx].EnumFn(rt, VisitRoot, 0, hp->Enumerators[edx].Data);

    hp->BigFree = 0;
    for (ulong_t idx = 0; idx < FREE_LISTS; idx++)
        hp->FreeLists[idx] = 0;

    ulong_t fcnt = 0;
    oh = (BObjHdr *) hp->Region.Base;
    while ((char *) oh < ((char *) hp->Region.Base) + hp->Used)
    {
        ulong_t tsz = oh->TotalSize;
        if (MarkP(oh) == 0)
        {
            if (oh->Tag != FreeTag)
                fcnt += 1;
            CleanupObject(rt, oh);

            BObjHdr * noh = NextObjHdr(oh);
            while ((char *) noh < ((char *) hp->Region.Base) + hp->Used)
            {
                if (MarkP(noh)
                        || ((char *) noh - (char *) oh) + noh->TotalSize > MAXIMUM_TOTAL_LENGTH)
                    break;

                if (noh->Tag != FreeTag)
                    fcnt += 1;
                CleanupObject(rt, noh);
                noh = NextObjHdr(noh);
            }

            BAssert((ulong_t) ((char *) noh - (char *) oh) >= tsz);

            tsz = (char *) noh - (char *) oh;
            AddFree(hp, oh, tsz);
        }

        oh = (BObjHdr *) (((char *) oh) + tsz);
    }

    hp->Collections += 1;

    if (rt->Config.VerboseFlag)
        printf("Collection Done: " ULONG_FMT " objects freed\n", fcnt);

    if (rt->Config.CheckHeapFlag)
        CheckHeap(rt, __FILE__, __LINE__);
}

void EnterWait(BRuntime * rt)
{
    BHeap * hp = rt->Heap;

    EnterExclusive(&hp->ContextsExclusive);
    hp->ReadyContexts += 1;
    if (hp->Collecting && hp->ReadyContexts == hp->TotalContexts)
        WakeCondition(&hp->ReadyCondition);
    LeaveExclusive(&hp->ContextsExclusive);
}

void LeaveWait(BRuntime * rt)
{
    BHeap * hp = rt->Heap;

    EnterExclusive(&hp->ContextsExclusive);
    while (hp->Collecting)
        ConditionWait(&hp->DoneCondition, &hp->ContextsExclusive);

    BAssert(hp->ReadyContexts > 0);
    hp->ReadyContexts -= 1;
    LeaveExclusive(&hp->ContextsExclusive);
}

void ReadyForGC(BRuntime * rt)
{
    BHeap * hp = rt->Heap;

    GetAllocContext(rt);

    if (rt->Config.CollectorType == NoCollector)
    {
        rt->GCRequired = 0;
        return;
    }

    EnterExclusive(&hp->ContextsExclusive);
    if (hp->Collecting)
    {
        hp->ReadyContexts += 1;
        if (hp->ReadyContexts == hp->TotalContexts)
            WakeCondition(&hp->ReadyCondition);

        while (hp->Collecting)
            ConditionWait(&hp->DoneCondition, &hp->ContextsExclusive);

        BAssert(hp->ReadyContexts > 0);
        hp->ReadyContexts -= 1;
        LeaveExclusive(&hp->ContextsExclusive);
    }
    else
    {
        hp->Collecting = 1;
        hp->ReadyContexts += 1;

        while (hp->ReadyContexts < hp->TotalContexts)
            ConditionWait(&hp->ReadyCondition, &hp->ContextsExclusive);

        BAssert(hp->ReadyContexts == hp->TotalContexts);

        rt->GCRequired = 0;
        EnterExclusive(&hp->GCExclusive);
        CollectGarbage(rt);
        LeaveExclusive(&hp->GCExclusive);

        BAssert(hp->ReadyContexts > 0);
        hp->ReadyContexts -= 1;
        hp->Collecting = 0;
        LeaveExclusive(&hp->ContextsExclusive);

        WakeAllCondition(&hp->DoneCondition);
    }
}

void Collect(BRuntime * rt)
{
    rt->GCRequired = 1;
    ReadyForGC(rt);
}

void HeapStatistics(BRuntime * rt, BHeapStatistics * hs)
{
    BHeap * hp = rt->Heap;

    EnterExclusive(&hp->ContextsExclusive);
    hs->BarrierCount = hp->RetiredBarrierCount;
    for (BAllocContext * ctx = hp->Contexts; ctx != 0; ctx = ctx->Next)
        hs->BarrierCount += ctx->BarrierCount;
    LeaveExclusive(&hp->ContextsExclusive);

    BWithExclusive wx(&hp->GCExclusive);

    hs->Collections = hp->Collections;
    hs->LiveObjects = 0;
    hs->LiveBytes = 0;
    hs->BytesAllocated = hp->BytesAllocated;
    hs->CheckFailures = hp->CheckFailures;

    BObjHdr * oh = (BObjHdr *) hp->Region.Base;
    while ((char *) oh < ((char *) hp->Region.Base) + hp->Used)
    {
        if (oh->Tag != FreeTag)
        {
            hs->LiveObjects += 1;
            hs->LiveBytes += oh->TotalSize;
        }

        oh = NextObjHdr(oh);
    }
}

// ---- Alive ----

BAlive::BAlive(BRuntime * rt, BValue * ptr)
{
    Context = GetAllocContext(rt);

    Next = Context->AliveList;
    Context->AliveList = this;
    Pointer = ptr;
}

BAlive::~BAlive()
{
    BAssert(Context->AliveList == this);

    Context->AliveList = Next;
}

// ---- Allocation Contexts ----

BAllocContext * CurrentAllocContext(BRuntime * rt)
{
    return((BAllocContext *) pthread_getspecific(rt->Heap->ContextKey));
}

BAllocContext * GetAllocContext(BRuntime * rt)
{
    BHeap * hp = rt->Heap;
    BAllocContext * ctx = (BAllocContext *) pthread_getspecific(hp->ContextKey);

    if (ctx != 0)
        return(ctx);

    ctx = (BAllocContext *) malloc(sizeof(BAllocContext));
    if (ctx == 0)
        ErrorExitBlink("allocation-context", "out of memory");

    memset(ctx, 0, sizeof(BAllocContext));
    ctx->Runtime = rt;
    ctx->Thread = pthread_self();
    ctx->AliveList = 0;

    EnterExclusive(&hp->ContextsExclusive);
    while (hp->Collecting)
        ConditionWait(&hp->DoneCondition, &hp->ContextsExclusive);

    ctx->Previous = 0;
    ctx->Next = hp->Contexts;
    if (hp->Contexts != 0)
        hp->Contexts->Previous = ctx;
    hp->Contexts = ctx;
    hp->TotalContexts += 1;
    LeaveExclusive(&hp->ContextsExclusive);

    pthread_setspecific(hp->ContextKey, ctx);

    if (rt->Config.VerboseFlag)
        printf("allocation-context: thread %p entered\n", (void *) ctx);

    return(ctx);
}

static void UnlinkContext(BHeap * hp, BAllocContext * ctx)
{
    if (hp->Contexts == ctx)
    {
        hp->Contexts = ctx->Next;
        if (hp->Contexts != 0)
            hp->Contexts->Previous = 0;
    }
    else
    {
        BAssert(ctx->Previous != 0);

        ctx->Previous->Next = ctx->Next;
        if (ctx->Next != 0)
            ctx->Next->Previous = ctx->Previous;
    }

    BAssert(hp->TotalContexts > 0);

    hp->TotalContexts -= 1;
    hp->RetiredBarrierCount += ctx->BarrierCount;
}

void LeaveRuntime(BRuntime * rt)
{
    BHeap * hp = rt->Heap;
    BAllocContext * ctx = (BAllocContext *) pthread_getspecific(hp->ContextKey);

    if (ctx == 0)
        return;

    BAssert(ctx->AliveList == 0);

    pthread_setspecific(hp->ContextKey, 0);

    EnterExclusive(&hp->ContextsExclusive);
    UnlinkContext(hp, ctx);
    if (hp->Collecting && hp->ReadyContexts == hp->TotalContexts)
        WakeCondition(&hp->ReadyCondition);
    LeaveExclusive(&hp->ContextsExclusive);

    free(ctx);
}

// ---- Setup ----

void SetupCore(BRuntime * rt)
{
    BAssert(sizeof(BValue) == sizeof(double));
    BAssert(sizeof(BValue) == sizeof(void *));
    BAssert(sizeof(BObjHdr) % OBJECT_ALIGNMENT == 0);
    BAssert(sizeof(BList) % OBJECT_ALIGNMENT == 0);
    BAssert(sizeof(BMap) % OBJECT_ALIGNMENT == 0);
    BAssert(sizeof(BSet) % OBJECT_ALIGNMENT == 0);
    BAssert(sizeof(BError) % OBJECT_ALIGNMENT == 0);
    BAssert(BadDogTag <= 0xFF);

    BHeap * hp = new BHeap;

    if (InitializeMemRegion(&hp->Region, rt->Config.MaximumHeapSize) == 0)
        ErrorExitBlink("setup", "unable to reserve heap; decrease maximum-heap-size");
    if (GrowMemRegionUp(&hp->Region, GC_PAGE_SIZE * 8) == 0)
        ErrorExitBlink("setup", "unable to commit heap");

    hp->Used = 0;
    hp->BigFree = 0;
    for (ulong_t idx = 0; idx < FREE_LISTS; idx++)
        hp->FreeLists[idx] = 0;

    pthread_key_create(&hp->ContextKey, 0);

    InitializeExclusive(&hp->GCExclusive);
    InitializeExclusive(&hp->ContextsExclusive);
    InitializeCondition(&hp->ReadyCondition);
    InitializeCondition(&hp->DoneCondition);

    hp->Contexts = 0;
    hp->TotalContexts = 0;
    hp->ReadyContexts = 0;
    hp->Collecting = 0;
    hp->BytesAllocated = 0;
    hp->Collections = 0;
    hp->CheckFailures = 0;
    hp->RetiredBarrierCount = 0;

    rt->Heap = hp;
    rt->GCRequired = 0;

    GetAllocContext(rt);
}

void DeleteCore(BRuntime * rt)
{
    BHeap * hp = rt->Heap;

    pthread_setspecific(hp->ContextKey, 0);

    while (hp->Contexts != 0)
    {
        BAllocContext * ctx = hp->Contexts;
        UnlinkContext(hp, ctx);
        free(ctx);
    }

    pthread_key_delete(hp->ContextKey);

    DeleteExclusive(&hp->GCExclusive);
    DeleteExclusive(&hp->ContextsExclusive);
    DeleteCondition(&hp->ReadyCondition);
    DeleteCondition(&hp->DoneCondition);
    DeleteMemRegion(&hp->Region);

    delete hp;
    rt->Heap = 0;
}
