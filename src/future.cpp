/*

Blink

*/

#include <stdio.h>
#include <deque>
#include <vector>
#include "blink.hpp"
#include "execute.hpp"

// ---- Handle Table ----
//
// Futures and channels are small heap objects naming an entry in the handle
// table by index and generation. An entry is retired when its object is swept
// or explicitly released; retiring bumps the generation so that any handle
// still naming the old generation is stale.

typedef enum
{
    FutureEntry,
    ChannelEntry
} BEntryKind;

typedef struct
{
    BValue Future;
    BValue Value;
} BPendingSend;

typedef struct
{
    uint32_t Generation;
    uint8_t Kind;
    uint8_t State;
    uint8_t InUse;
    ulong_t Flags;
    BValue Result;
    std::vector<BOneshot *> Bridges;

    std::deque<BValue> Buffer;
    ulong_t Capacity;
    std::deque<BValue> Receivers;
    std::deque<BPendingSend> Senders;
    int Closed;

    ulong_t NextFree;
} BHandleEntry;

#define NO_FREE_ENTRY MAXIMUM_ULONG

struct _BHandleTable
{
    OSExclusive Exclusive;
    std::vector<BHandleEntry *> Entries;
    ulong_t FreeList;
    ulong_t Active;
};

static void VisitHandles(BRuntime * rt, BVisitFn visit, void * ctx, void * data)
{
    BHandleTable * ht = (BHandleTable *) data;
    BWithExclusive wx(&ht->Exclusive);

    for (ulong_t idx = 0; idx < ht->Entries.size(); idx++)
    {
        BHandleEntry * he = ht->Entries[idx];
        if (he->InUse == 0)
            continue;

        visit(&he->Result, ctx);
        for (ulong_t bdx = 0; bdx < he->Buffer.size(); bdx++)
            visit(&he->Buffer[bdx], ctx);
        for (ulong_t rdx = 0; rdx < he->Receivers.size(); rdx++)
            visit(&he->Receivers[rdx], ctx);
        for (ulong_t sdx = 0; sdx < he->Senders.size(); sdx++)
        {
            visit(&he->Senders[sdx].Future, ctx);
            visit(&he->Senders[sdx].Value, ctx);
        }
    }
}

static BValue MakeHandle(BRuntime * rt, BEntryKind knd, ulong_t flgs, ulong_t cap)
{
    BHandleTable * ht = rt->Handles;
    BHandleEntry * he;
    ulong_t idx;

    {
        BWithExclusive wx(&ht->Exclusive);

        if (ht->FreeList != NO_FREE_ENTRY)
        {
            idx = ht->FreeList;
            he = ht->Entries[idx];
            ht->FreeList = he->NextFree;
        }
        else
        {
            if (ht->Entries.size() >= 0xFFFFFFFF)
                RaiseErrorC(rt, knd == FutureEntry ? "future" : "chan", "too many handles",
                        NilValue);

            idx = ht->Entries.size();
            he = new BHandleEntry;
            he->Generation = 0;
            ht->Entries.push_back(he);
        }

        he->Kind = (uint8_t) knd;
        he->State = FuturePending;
        he->InUse = 1;
        he->Flags = flgs;
        he->Result = NilValue;
        he->Capacity = cap;
        he->Closed = 0;
        he->NextFree = NO_FREE_ENTRY;
        ht->Active += 1;
    }

    BHandle * hdl = (BHandle *) MakeObject(rt, knd == FutureEntry ? FutureTag : ChannelTag,
            sizeof(BHandle), 0, knd == FutureEntry ? "future" : "chan");
    hdl->Index = (uint32_t) idx;
    hdl->Generation = he->Generation;

    BValue hv = ObjectValue(hdl);
    MarkShared(hv);

    return(hv);
}

// The table exclusive must be held.

static BHandleEntry * FindEntry(BRuntime * rt, BValue hv)
{
    BAssert(FutureP(hv) || ChannelP(hv));

    BHandleTable * ht = rt->Handles;
    BHandle * hdl = AsHandle(hv);

    if (hdl->Index >= ht->Entries.size())
        return(0);

    BHandleEntry * he = ht->Entries[hdl->Index];
    if (he->InUse == 0 || he->Generation != hdl->Generation)
        return(0);

    return(he);
}

static BHandleEntry * LookupEntry(BRuntime * rt, BValue hv, const char * who)
{
    BHandleEntry * he = FindEntry(rt, hv);

    if (he == 0)
        Raise(MakeStaleHandleError(rt, who));

    return(he);
}

static void RetireEntry(BRuntime * rt, BHandleEntry * he, ulong_t idx)
{
    BHandleTable * ht = rt->Handles;

    for (ulong_t bdx = 0; bdx < he->Bridges.size(); bdx++)
        OneshotDropSender(he->Bridges[bdx]);

    he->Bridges.clear();
    he->Buffer.clear();
    he->Receivers.clear();
    he->Senders.clear();
    he->Result = NilValue;
    he->InUse = 0;
    he->Generation += 1;
    he->NextFree = ht->FreeList;
    ht->FreeList = idx;

    BAssert(ht->Active > 0);

    ht->Active -= 1;
}

void ReleaseHandleEntry(BRuntime * rt, ulong_t idx, ulong_t gen)
{
    BHandleTable * ht = rt->Handles;
    BWithExclusive wx(&ht->Exclusive);

    if (idx >= ht->Entries.size())
        return;

    BHandleEntry * he = ht->Entries[idx];
    if (he->InUse && he->Generation == gen)
        RetireEntry(rt, he, idx);
}

void ReleaseHandle(BRuntime * rt, BValue hv)
{
    BAssert(FutureP(hv) || ChannelP(hv));

    ReleaseHandleEntry(rt, AsHandle(hv)->Index, AsHandle(hv)->Generation);
}

// ---- Futures ----

BValue MakeFuture(BRuntime * rt, ulong_t flgs)
{
    return(MakeHandle(rt, FutureEntry, flgs, 0));
}

static void SettleEntry(BHandleEntry * he, BValue val, BFutureState fs)
{
    BAssert(he->State == FuturePending);

    he->Result = val;
    he->State = (uint8_t) fs;

    for (ulong_t bdx = 0; bdx < he->Bridges.size(); bdx++)
    {
        OneshotSend(he->Bridges[bdx], val, fs == FutureFailed);
        OneshotDropSender(he->Bridges[bdx]);
    }

    he->Bridges.clear();
}

static void SettleFuture(BRuntime * rt, BValue fut, BValue val, BFutureState fs,
    const char * who)
{
    FutureArgCheck(rt, who, fut);

    BWithExclusive wx(&rt->Handles->Exclusive);
    BHandleEntry * he = LookupEntry(rt, fut, who);

    if (he->State != FuturePending)
        RaiseErrorC(rt, who, "future already completed", fut);

    SettleEntry(he, val, fs);
}

BValue MakeCompletedFuture(BRuntime * rt, BValue val)
{
    BValue fut = MakeFuture(rt, 0);

    FutureComplete(rt, fut, val);
    return(fut);
}

void FutureComplete(BRuntime * rt, BValue fut, BValue val)
{
    SettleFuture(rt, fut, val, FutureReady, "complete");
}

void FutureFail(BRuntime * rt, BValue fut, BValue err)
{
    SettleFuture(rt, fut, err, FutureFailed, "fail");
}

BFutureState FuturePoll(BRuntime * rt, BValue fut, BValue * pv)
{
    BAssert(FutureP(fut));

    BWithExclusive wx(&rt->Handles->Exclusive);
    BHandleEntry * he = FindEntry(rt, fut);

    if (he == 0)
        return(FutureStale);

    if (he->State != FuturePending)
        *pv = he->Result;

    return((BFutureState) he->State);
}

int FutureDoneP(BRuntime * rt, BValue fut)
{
    BValue v;

    return(FuturePoll(rt, fut, &v) != FuturePending);
}

int FutureExternalP(BRuntime * rt, BValue fut)
{
    BAssert(FutureP(fut));

    BWithExclusive wx(&rt->Handles->Exclusive);
    BHandleEntry * he = FindEntry(rt, fut);

    return(he != 0 && (he->Flags & FUTURE_EXTERNAL) != 0);
}

BFutureState FutureAttachOneshot(BRuntime * rt, BValue fut, BOneshot * os, BValue * pv)
{
    BAssert(FutureP(fut));

    BWithExclusive wx(&rt->Handles->Exclusive);
    BHandleEntry * he = FindEntry(rt, fut);

    if (he == 0)
        return(FutureStale);

    if (he->State != FuturePending)
    {
        *pv = he->Result;
        return((BFutureState) he->State);
    }

    he->Bridges.push_back(os);
    return(FuturePending);
}

// Called by bridge workers: no allocation and no raising.

int BridgeComplete(BRuntime * rt, uint32_t idx, uint32_t gen, BValue val, int failed)
{
    BAssert(ObjectP(val) == 0);

    BHandleTable * ht = rt->Handles;
    BWithExclusive wx(&ht->Exclusive);

    if (idx >= ht->Entries.size())
        return(0);

    BHandleEntry * he = ht->Entries[idx];
    if (he->InUse == 0 || he->Generation != gen || he->State != FuturePending)
        return(0);

    SettleEntry(he, val, failed ? FutureFailed : FutureReady);
    return(1);
}

// ---- Channels ----

BValue MakeChannel(BRuntime * rt, ulong_t cap)
{
    return(MakeHandle(rt, ChannelEntry, 0, cap));
}

// A receiver or sender future may have been released while it waited.

static int SettleWaiter(BRuntime * rt, BValue fut, BValue val, BFutureState fs)
{
    BHandleEntry * he = FindEntry(rt, fut);

    if (he == 0 || he->State != FuturePending)
        return(0);

    SettleEntry(he, val, fs);
    return(1);
}

BValue ChannelSend(BRuntime * rt, BValue ch, BValue val)
{
    ChannelArgCheck(rt, "send!", ch);

    BWithExclusive wx(&rt->Handles->Exclusive);
    BHandleEntry * he = LookupEntry(rt, ch, "send!");

    if (he->Closed)
        RaiseErrorC(rt, "send!", "channel closed", ch);

    while (he->Receivers.size() > 0)
    {
        BValue rf = he->Receivers.front();
        he->Receivers.pop_front();

        if (SettleWaiter(rt, rf, val, FutureReady))
            return(MakeCompletedFuture(rt, NilValue));
    }

    if (he->Buffer.size() < he->Capacity)
    {
        he->Buffer.push_back(val);
        return(MakeCompletedFuture(rt, NilValue));
    }

    BValue fut = MakeFuture(rt, 0);
    BPendingSend ps = {fut, val};

    he->Senders.push_back(ps);

    return(fut);
}

BValue ChannelReceive(BRuntime * rt, BValue ch)
{
    ChannelArgCheck(rt, "recv", ch);

    BWithExclusive wx(&rt->Handles->Exclusive);
    BHandleEntry * he = LookupEntry(rt, ch, "recv");

    if (he->Buffer.size() > 0)
    {
        BValue val = he->Buffer.front();
        he->Buffer.pop_front();

        while (he->Senders.size() > 0 && he->Buffer.size() < he->Capacity)
        {
            BPendingSend ps = he->Senders.front();
            he->Senders.pop_front();

            if (SettleWaiter(rt, ps.Future, NilValue, FutureReady))
                he->Buffer.push_back(ps.Value);
        }

        return(MakeCompletedFuture(rt, val));
    }

    while (he->Senders.size() > 0)
    {
        BPendingSend ps = he->Senders.front();
        he->Senders.pop_front();

        if (SettleWaiter(rt, ps.Future, NilValue, FutureReady))
            return(MakeCompletedFuture(rt, ps.Value));
    }

    if (he->Closed)
        return(MakeCompletedFuture(rt, NilValue));

    BValue fut = MakeFuture(rt, 0);
    he->Receivers.push_back(fut);

    return(fut);
}

void ChannelClose(BRuntime * rt, BValue ch)
{
    ChannelArgCheck(rt, "close!", ch);

    BWithExclusive wx(&rt->Handles->Exclusive);
    BHandleEntry * he = LookupEntry(rt, ch, "close!");

    if (he->Closed)
        return;
    he->Closed = 1;

    while (he->Receivers.size() > 0)
    {
        BValue rf = he->Receivers.front();
        he->Receivers.pop_front();

        SettleWaiter(rt, rf, NilValue, FutureReady);
    }

    if (he->Senders.size() > 0)
    {
        BValue err = MakeEvalError(rt, "channel closed");

        while (he->Senders.size() > 0)
        {
            BPendingSend ps = he->Senders.front();
            he->Senders.pop_front();

            SettleWaiter(rt, ps.Future, err, FutureFailed);
        }
    }
}

// ---- Primitives ----

Define("future", FuturePrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    ZeroArgsCheck(rt, "future", argc);

    return(MakeFuture(rt, 0));
}

Define("complete", CompletePrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    TwoArgsCheck(rt, "complete", argc);
    FutureArgCheck(rt, "complete", argv[0]);

    FutureComplete(rt, argv[0], argv[1]);
    return(argv[0]);
}

Define("fail", FailPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    TwoArgsCheck(rt, "fail", argc);
    FutureArgCheck(rt, "fail", argv[0]);

    BValue err = argv[1];
    if (ErrorP(err) == 0)
        err = MakeUserError(rt, err, NilValue);

    FutureFail(rt, argv[0], err);
    return(argv[0]);
}

Define("future?", FuturePPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "future?", argc);

    return(MakeBoolean(FutureP(argv[0])));
}

Define("done?", DonePPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "done?", argc);
    FutureArgCheck(rt, "done?", argv[0]);

    return(MakeBoolean(FutureDoneP(rt, argv[0])));
}

Define("release!", ReleasePrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "release!", argc);

    if (FutureP(argv[0]) == 0 && ChannelP(argv[0]) == 0)
        RaiseErrorC(rt, "release!", "expected a future or channel", argv[0]);

    ReleaseHandle(rt, argv[0]);
    return(NilValue);
}

Define("chan", ChanPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    ZeroOrOneArgsCheck(rt, "chan", argc);

    ulong_t cap = 0;
    if (argc == 1)
    {
        NonNegativeArgCheck(rt, "chan", argv[0]);
        cap = (ulong_t) AsNumber(argv[0]);
    }

    return(MakeChannel(rt, cap));
}

DefineFlags("send!", SendPrimitive, NATIVE_AWAIT)(BRuntime * rt, long_t argc, BValue argv[])
{
    TwoArgsCheck(rt, "send!", argc);

    return(ChannelSend(rt, argv[0], argv[1]));
}

DefineFlags("recv", RecvPrimitive, NATIVE_AWAIT)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "recv", argc);

    return(ChannelReceive(rt, argv[0]));
}

Define("close!", ClosePrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "close!", argc);

    ChannelClose(rt, argv[0]);
    return(NilValue);
}

static BNative * Primitives[] =
{
    FuturePrimitive,
    CompletePrimitive,
    FailPrimitive,
    FuturePPrimitive,
    DonePPrimitive,
    ReleasePrimitive,
    ChanPrimitive,
    SendPrimitive,
    RecvPrimitive,
    ClosePrimitive
};

void SetupFutures(BRuntime * rt)
{
    for (ulong_t idx = 0; idx < sizeof(Primitives) / sizeof(BNative *); idx++)
        DefineNative(rt, CoreModule, Primitives[idx]);
}

void SetupHandles(BRuntime * rt)
{
    BHandleTable * ht = new BHandleTable;

    InitializeExclusive(&ht->Exclusive);
    ht->FreeList = NO_FREE_ENTRY;
    ht->Active = 0;

    rt->Handles = ht;
    RegisterRootEnumerator(rt, VisitHandles, ht);
}

void DeleteHandles(BRuntime * rt)
{
    BHandleTable * ht = rt->Handles;

    for (ulong_t idx = 0; idx < ht->Entries.size(); idx++)
    {
        BHandleEntry * he = ht->Entries[idx];

        for (ulong_t bdx = 0; bdx < he->Bridges.size(); bdx++)
            OneshotDropSender(he->Bridges[bdx]);
        delete he;
    }

    DeleteExclusive(&ht->Exclusive);
    delete ht;
    rt->Handles = 0;
}

ulong_t ActiveHandleCount(BRuntime * rt)
{
    BWithExclusive wx(&rt->Handles->Exclusive);

    return(rt->Handles->Active);
}
