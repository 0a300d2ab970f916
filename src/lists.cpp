/*

Blink

*/

#include "blink.hpp"

// ---- List Nodes ----

static BValue MakeListNode(BRuntime * rt, BValue val, BValue nxt, ulong_t flgs)
{
    BListNode * node = (BListNode *) MakeObject(rt, ListNodeTag, sizeof(BListNode), 2,
            "make-list-node");
    node->Value = val;
    node->Next = nxt;
    node->Flags = flgs;

    return(ObjectValue(node));
}

// ---- Lists ----

static void SetEmpty(BRuntime * rt, BValue lst)
{
    ModifyObject(rt, lst, 0, lst);
    ModifyObject(rt, lst, 1, lst);
    AsList(lst)->Length = 0;
    AsList(lst)->Flags = 0;
}

BValue MakeList(BRuntime * rt)
{
    BList * lh = (BList *) MakeObject(rt, ListTag, sizeof(BList), 2, "make-list");
    BValue lst = ObjectValue(lh);

    lh->Head = lst;
    lh->Tail = lst;
    lh->Length = 0;
    lh->Flags = 0;

    BAssert(ListP(lst));
    BAssert(AsList(lst) == lh);

    return(lst);
}

static BValue MakeListHeader(BRuntime * rt, BValue hd, BValue tl, ulong_t len)
{
    if (len == 0)
        return(MakeList(rt));

    BList * lh = (BList *) MakeObject(rt, ListTag, sizeof(BList), 2, "make-list");
    lh->Head = hd;
    lh->Tail = tl;
    lh->Length = (uint32_t) len;
    lh->Flags = LIST_HAS_HEAD | LIST_HAS_TAIL;

    return(ObjectValue(lh));
}

BValue MakeListFrom(BRuntime * rt, ulong_t argc, BValue * argv)
{
    BValue lst = MakeList(rt);

    for (ulong_t adx = 0; adx < argc; adx++)
        ListAppend(rt, lst, argv[adx]);

    return(lst);
}

void ListCursorStart(BRuntime * rt, BValue lst, BListCursor * lc)
{
    BAssert(ListP(lst));

    BObjectLock ol(rt, lst);

    lc->Remaining = AsList(lst)->Length;
    lc->Node = lc->Remaining > 0 ? AsList(lst)->Head : NilValue;
}

void ListPrepend(BRuntime * rt, BValue lst, BValue val)
{
    BAssert(ListP(lst));

    BObjectLock ol(rt, lst);
    BList * lh = AsList(lst);

    if (lh->Length == 0)
    {
        BValue node = MakeListNode(rt, val, NilValue, 0);
        ModifyObject(rt, lst, 0, node);
        ModifyObject(rt, lst, 1, node);
        lh->Flags = LIST_HAS_HEAD | LIST_HAS_TAIL;
    }
    else
        ModifyObject(rt, lst, 0, MakeListNode(rt, val, lh->Head, NODE_HAS_NEXT));

    lh->Length += 1;
}

static void CopyNodes(BRuntime * rt, BValue lst)
{
    BList * lh = AsList(lst);

    BAssert(lh->Length > 0);

    BValue node = lh->Head;
    BValue hd = MakeListNode(rt, AsListNode(node)->Value, NilValue, 0);
    BValue tl = hd;

    for (ulong_t idx = 1; idx < lh->Length; idx++)
    {
        node = AsListNode(node)->Next;

        BValue nn = MakeListNode(rt, AsListNode(node)->Value, NilValue, 0);
        AsListNode(tl)->Next = nn;
        AsListNode(tl)->Flags = NODE_HAS_NEXT;
        tl = nn;
    }

    ModifyObject(rt, lst, 0, hd);
    ModifyObject(rt, lst, 1, tl);
}

void ListAppend(BRuntime * rt, BValue lst, BValue val)
{
    BAssert(ListP(lst));

    BObjectLock ol(rt, lst);
    BList * lh = AsList(lst);

    if (lh->Length == 0)
    {
        BValue node = MakeListNode(rt, val, NilValue, 0);
        ModifyObject(rt, lst, 0, node);
        ModifyObject(rt, lst, 1, node);
        lh->Flags = LIST_HAS_HEAD | LIST_HAS_TAIL;
        lh->Length = 1;
        return;
    }

    // A tail that already has a successor belongs to a longer list too.
    if (AsListNode(lh->Tail)->Flags & NODE_HAS_NEXT)
        CopyNodes(rt, lst);

    BValue node = MakeListNode(rt, val, NilValue, 0);
    BValue tl = lh->Tail;

    ModifyObject(rt, tl, 1, node);
    AsListNode(tl)->Flags |= NODE_HAS_NEXT;
    ModifyObject(rt, lst, 1, node);
    lh->Length += 1;
}

BValue ListFirst(BRuntime * rt, BValue lst)
{
    BAssert(ListP(lst));

    BObjectLock ol(rt, lst);

    if (AsList(lst)->Length == 0)
        return(NilValue);
    return(AsListNode(AsList(lst)->Head)->Value);
}

BValue ListLast(BRuntime * rt, BValue lst)
{
    BAssert(ListP(lst));

    BObjectLock ol(rt, lst);

    if (AsList(lst)->Length == 0)
        return(NilValue);
    return(AsListNode(AsList(lst)->Tail)->Value);
}

BValue ListPopFront(BRuntime * rt, BValue lst)
{
    BAssert(ListP(lst));

    BObjectLock ol(rt, lst);
    BList * lh = AsList(lst);

    if (lh->Length == 0)
        RaiseErrorC(rt, "pop-front", "cannot pop an empty list", lst);

    BValue val = AsListNode(lh->Head)->Value;
    if (lh->Length == 1)
        SetEmpty(rt, lst);
    else
    {
        ModifyObject(rt, lst, 0, AsListNode(lh->Head)->Next);
        lh->Length -= 1;
    }

    return(val);
}

// Linear: nodes have no back links.

BValue ListPopBack(BRuntime * rt, BValue lst)
{
    BAssert(ListP(lst));

    BObjectLock ol(rt, lst);
    BList * lh = AsList(lst);

    if (lh->Length == 0)
        RaiseErrorC(rt, "pop-back", "cannot pop an empty list", lst);

    BValue val = AsListNode(lh->Tail)->Value;
    if (lh->Length == 1)
        SetEmpty(rt, lst);
    else
    {
        BValue node = lh->Head;
        for (ulong_t idx = 0; idx < lh->Length - 2; idx++)
            node = AsListNode(node)->Next;

        ModifyObject(rt, lst, 1, node);
        lh->Length -= 1;
    }

    return(val);
}

BValue ListDrop(BRuntime * rt, BValue lst, ulong_t cnt)
{
    BAssert(ListP(lst));

    BValue hd;
    BValue tl;
    ulong_t len;

    {
        BObjectLock ol(rt, lst);
        BList * lh = AsList(lst);

        if (cnt >= lh->Length)
            return(MakeList(rt));

        hd = lh->Head;
        for (ulong_t idx = 0; idx < cnt; idx++)
            hd = AsListNode(hd)->Next;
        tl = lh->Tail;
        len = lh->Length - cnt;
    }

    return(MakeListHeader(rt, hd, tl, len));
}

BValue ListRest(BRuntime * rt, BValue lst)
{
    return(ListDrop(rt, lst, 1));
}

BValue ListNth(BRuntime * rt, BValue lst, ulong_t idx)
{
    BAssert(ListP(lst));

    BObjectLock ol(rt, lst);
    BList * lh = AsList(lst);

    if (idx >= lh->Length)
        RaiseErrorC(rt, "nth", "index out of range", MakeNumber((double) idx));

    BValue node = lh->Head;
    while (idx > 0)
    {
        node = AsListNode(node)->Next;
        idx -= 1;
    }

    return(AsListNode(node)->Value);
}

BValue ListToVector(BRuntime * rt, BValue lst)
{
    BAssert(ListP(lst));

    BValue vec = MakeVector(rt, ListLength(lst), NilValue);
    BListCursor lc;
    ulong_t idx = 0;

    for (ListCursorStart(rt, lst, &lc); ListCursorDoneP(&lc) == 0; ListCursorNext(&lc))
    {
        if (idx >= VectorLength(vec))
            break;

        VectorSet(rt, vec, idx, ListCursorValue(&lc));
        idx += 1;
    }

    return(vec);
}

BValue ListConcat(BRuntime * rt, BValue lst1, BValue lst2)
{
    BAssert(ListP(lst1));
    BAssert(ListP(lst2));

    BValue ret = MakeList(rt);
    BListCursor lc;

    for (ListCursorStart(rt, lst1, &lc); ListCursorDoneP(&lc) == 0; ListCursorNext(&lc))
        ListAppend(rt, ret, ListCursorValue(&lc));
    for (ListCursorStart(rt, lst2, &lc); ListCursorDoneP(&lc) == 0; ListCursorNext(&lc))
        ListAppend(rt, ret, ListCursorValue(&lc));

    return(ret);
}

void ListClear(BRuntime * rt, BValue lst)
{
    BAssert(ListP(lst));

    BObjectLock ol(rt, lst);
    SetEmpty(rt, lst);
}

static BValue CopyListHeader(BRuntime * rt, BValue lst)
{
    BObjectLock ol(rt, lst);
    BList * lh = AsList(lst);

    return(MakeListHeader(rt, lh->Head, lh->Tail, lh->Length));
}

// ---- Primitives ----

Define("list", ListPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    return(MakeListFrom(rt, argc, argv));
}

Define("cons", ConsPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    TwoArgsCheck(rt, "cons", argc);
    ListArgCheck(rt, "cons", argv[1]);

    BValue lst = CopyListHeader(rt, argv[1]);
    ListPrepend(rt, lst, argv[0]);
    return(lst);
}

static BValue FirstOf(BRuntime * rt, const char * who, long_t argc, BValue argv[])
{
    OneArgCheck(rt, who, argc);

    if (ListP(argv[0]) == 0)
        Raise(MakeEvalError(rt, (std::string(who) + " expects a list").c_str()));
    if (ListEmptyP(argv[0]))
        Raise(MakeEvalError(rt, (std::string(who) + " on empty list").c_str()));

    return(ListFirst(rt, argv[0]));
}

Define("car", CarPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    return(FirstOf(rt, "car", argc, argv));
}

Define("first", FirstPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    return(FirstOf(rt, "first", argc, argv));
}

Define("cdr", CdrPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "cdr", argc);
    ListArgCheck(rt, "cdr", argv[0]);

    return(ListRest(rt, argv[0]));
}

Define("rest", RestPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "rest", argc);
    ListArgCheck(rt, "rest", argv[0]);

    return(ListRest(rt, argv[0]));
}

Define("last", LastPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "last", argc);
    ListArgCheck(rt, "last", argv[0]);

    return(ListLast(rt, argv[0]));
}

Define("count", CountPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "count", argc);

    if (ListP(argv[0]))
        return(MakeNumber((double) ListLength(argv[0])));
    else if (VectorP(argv[0]))
        return(MakeNumber((double) VectorLength(argv[0])));
    else if (MapP(argv[0]))
        return(MakeNumber((double) MapLength(argv[0])));
    else if (SetP(argv[0]))
        return(MakeNumber((double) SetLength(argv[0])));
    else if (StringP(argv[0]))
        return(MakeNumber((double) StringLength(argv[0])));
    else if (NilP(argv[0]))
        return(MakeNumber(0));

    RaiseErrorC(rt, "count", "expected a collection", argv[0]);
    return(NilValue);
}

Define("nth", NthPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    TwoArgsCheck(rt, "nth", argc);
    ListArgCheck(rt, "nth", argv[0]);
    IndexArgCheck(rt, "nth", argv[1], ListLength(argv[0]));

    return(ListNth(rt, argv[0], (ulong_t) AsNumber(argv[1])));
}

Define("conj", ConjPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    AtLeastOneArgCheck(rt, "conj", argc);
    ListArgCheck(rt, "conj", argv[0]);

    BValue lst = CopyListHeader(rt, argv[0]);
    for (long_t adx = 1; adx < argc; adx++)
        ListAppend(rt, lst, argv[adx]);

    return(lst);
}

Define("pop-front", PopFrontPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "pop-front", argc);
    ListArgCheck(rt, "pop-front", argv[0]);

    return(ListPopFront(rt, argv[0]));
}

Define("pop-back", PopBackPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "pop-back", argc);
    ListArgCheck(rt, "pop-back", argv[0]);

    return(ListPopBack(rt, argv[0]));
}

Define("concat", ConcatPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    BValue ret = MakeList(rt);

    for (long_t adx = 0; adx < argc; adx++)
    {
        if (ListP(argv[adx]))
        {
            BListCursor lc;

            for (ListCursorStart(rt, argv[adx], &lc); ListCursorDoneP(&lc) == 0;
                    ListCursorNext(&lc))
                ListAppend(rt, ret, ListCursorValue(&lc));
        }
        else if (VectorP(argv[adx]))
        {
            for (ulong_t idx = 0; idx < VectorLength(argv[adx]); idx++)
                ListAppend(rt, ret, VectorGet(rt, argv[adx], idx));
        }
        else if (NilP(argv[adx]) == 0)
            RaiseErrorC(rt, "concat", "expected a list or vector", argv[adx]);
    }

    return(ret);
}

Define("list->vector", ListToVectorPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "list->vector", argc);
    ListArgCheck(rt, "list->vector", argv[0]);

    return(ListToVector(rt, argv[0]));
}

static BNative * Primitives[] =
{
    ListPrimitive,
    ConsPrimitive,
    CarPrimitive,
    FirstPrimitive,
    CdrPrimitive,
    RestPrimitive,
    LastPrimitive,
    CountPrimitive,
    NthPrimitive,
    ConjPrimitive,
    PopFrontPrimitive,
    PopBackPrimitive,
    ConcatPrimitive,
    ListToVectorPrimitive
};

void SetupLists(BRuntime * rt)
{
    for (ulong_t idx = 0; idx < sizeof(Primitives) / sizeof(BNative *); idx++)
        DefineNative(rt, CoreModule, Primitives[idx]);
}
