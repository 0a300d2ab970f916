/*

Blink

*/

#include "blink.hpp"

// ---- Hashing ----

static inline ulong_t MixHash(ulong_t h)
{
    h += 0x9E3779B97F4A7C15ULL;
    h = (h ^ (h >> 30)) * 0xBF58476D1CE4E5B9ULL;
    h = (h ^ (h >> 27)) * 0x94D049BB133111EBULL;
    return(h ^ (h >> 31));
}

ulong_t IdentityHash(void * obj)
{
    return(MixHash((ulong_t) obj));
}

ulong_t HashValue(BValue key)
{
    if (NumberP(key))
    {
        // -0 and 0 are equal keys.
        if (AsNumber(key) == 0)
            key = MakeNumber(0);
        return(MixHash(key));
    }
    else if (StringP(key))
        return(StringHash(key));
    else if (ObjectP(key))
        return(IdentityHash(AsObject(key)));

    return(MixHash(key));
}

// ---- Equality ----

// NaN is canonical, so a NaN key matches itself.

int EqualKeysP(BValue key1, BValue key2)
{
    if (key1 == key2)
        return(1);

    if (NumberP(key1) && NumberP(key2))
        return(AsNumber(key1) == AsNumber(key2));

    if (StringP(key1) && StringP(key2))
        return(StringEqualP(key1, key2));

    return(0);
}

typedef struct
{
    BValue Other;
    int Equal;
} BEqualContext;

static void EqualMapEntry(BRuntime * rt, BValue key, BValue val, void * ctx)
{
    BEqualContext * ec = (BEqualContext *) ctx;

    if (ec->Equal == 0)
        return;

    BValue none = StringCToKeyword(rt, "%none");
    BValue oval = MapGet(rt, ec->Other, key, none);
    if (oval == none || EqualP(rt, val, oval) == 0)
        ec->Equal = 0;
}

static void EqualSetEntry(BRuntime * rt, BValue key, BValue val, void * ctx)
{
    BEqualContext * ec = (BEqualContext *) ctx;

    if (ec->Equal && SetContainsP(rt, ec->Other, key) == 0)
        ec->Equal = 0;
}

static int EqualCollectionsP(BRuntime * rt, BValue obj1, BValue obj2)
{
    if (ListP(obj1) && ListP(obj2))
    {
        if (ListLength(obj1) != ListLength(obj2))
            return(0);

        BListCursor lc1;
        BListCursor lc2;

        ListCursorStart(rt, obj1, &lc1);
        ListCursorStart(rt, obj2, &lc2);
        while (ListCursorDoneP(&lc1) == 0 && ListCursorDoneP(&lc2) == 0)
        {
            if (EqualP(rt, ListCursorValue(&lc1), ListCursorValue(&lc2)) == 0)
                return(0);

            ListCursorNext(&lc1);
            ListCursorNext(&lc2);
        }

        return(ListCursorDoneP(&lc1) && ListCursorDoneP(&lc2));
    }
    else if (VectorP(obj1) && VectorP(obj2))
    {
        if (VectorLength(obj1) != VectorLength(obj2))
            return(0);

        for (ulong_t idx = 0; idx < VectorLength(obj1); idx++)
            if (EqualP(rt, VectorGet(rt, obj1, idx), VectorGet(rt, obj2, idx)) == 0)
                return(0);

        return(1);
    }
    else if (MapP(obj1) && MapP(obj2))
    {
        if (MapLength(obj1) != MapLength(obj2))
            return(0);

        BEqualContext ec = {obj2, 1};
        MapVisit(rt, obj1, EqualMapEntry, &ec);
        return(ec.Equal);
    }
    else if (SetP(obj1) && SetP(obj2))
    {
        if (SetLength(obj1) != SetLength(obj2))
            return(0);

        BEqualContext ec = {obj2, 1};
        SetVisit(rt, obj1, EqualSetEntry, &ec);
        return(ec.Equal);
    }

    return(0);
}

int EqualP(BRuntime * rt, BValue obj1, BValue obj2)
{
    if (NumberP(obj1) && NumberP(obj2))
        return(AsNumber(obj1) == AsNumber(obj2));

    if (EqualKeysP(obj1, obj2))
        return(1);

    if (ObjectP(obj1) == 0 || ObjectP(obj2) == 0)
        return(0);

    return(EqualCollectionsP(rt, obj1, obj2));
}

// ---- Primitives ----

Define("=", EqualPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    AtLeastOneArgCheck(rt, "=", argc);

    for (long_t adx = 1; adx < argc; adx++)
        if (EqualP(rt, argv[adx - 1], argv[adx]) == 0)
            return(FalseValue);

    return(TrueValue);
}

Define("identical?", IdenticalPPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    TwoArgsCheck(rt, "identical?", argc);

    return(MakeBoolean(argv[0] == argv[1]));
}

Define("hash", HashPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "hash", argc);

    // Keep the hash within the integers a double holds exactly.
    return(MakeNumber((double) (HashValue(argv[0]) & 0x1FFFFFFFFFFFFFULL)));
}

static BNative * Primitives[] =
{
    EqualPrimitive,
    IdenticalPPrimitive,
    HashPrimitive
};

void SetupCompare(BRuntime * rt)
{
    for (ulong_t idx = 0; idx < sizeof(Primitives) / sizeof(BNative *); idx++)
        DefineNative(rt, CoreModule, Primitives[idx]);
}
