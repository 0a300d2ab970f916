/*

Blink

*/

#include "blink.hpp"

// ---- Hash Tables ----
//
// Maps and sets share one implementation. A header holds up to four entries
// inline (small mode); the fifth distinct key moves every entry into a separate
// open addressing table (large mode) laid out as
//
//     Keys[capacity] Values[capacity] Ctrl[capacity]
//
// with the values omitted for sets. A control byte is CTRL_EMPTY, CTRL_DELETED,
// or the low seven bits of the hash of a full slot.

#define KEYS_SLOT 1
#define VALUES_SLOT (KEYS_SLOT + HASH_SMALL_SLOTS)

typedef struct
{
    BValue Object;
    BValue * Table;
    BValue * Keys;
    BValue * Values;
    BHashInfo * Info;
    ulong_t TableTag;
    const char * Who;
} BHashView;

static void MapView(BValue map, BHashView * hv)
{
    BAssert(MapP(map));

    hv->Object = map;
    hv->Table = &AsMap(map)->Table;
    hv->Keys = AsMap(map)->Keys;
    hv->Values = AsMap(map)->Values;
    hv->Info = &AsMap(map)->Info;
    hv->TableTag = MapTableTag;
    hv->Who = "hash-map";
}

static void SetView(BValue set, BHashView * hv)
{
    BAssert(SetP(set));

    hv->Object = set;
    hv->Table = &AsSet(set)->Table;
    hv->Keys = AsSet(set)->Keys;
    hv->Values = 0;
    hv->Info = &AsSet(set)->Info;
    hv->TableTag = SetTableTag;
    hv->Who = "hash-set";
}

static inline ulong_t TableSlotCount(BHashView * hv, ulong_t cap)
{
    return(hv->Values != 0 ? cap * 2 : cap);
}

static inline BValue * TableKeys(BValue tbl)
{
    return((BValue *) AsObject(tbl));
}

static inline BValue * TableValues(BValue tbl, ulong_t cap)
{
    return(((BValue *) AsObject(tbl)) + cap);
}

static inline uint8_t * TableCtrl(BHashView * hv, BValue tbl, ulong_t cap)
{
    return((uint8_t *) (((BValue *) AsObject(tbl)) + TableSlotCount(hv, cap)));
}

static inline uint8_t CtrlHash(ulong_t h)
{
    return((uint8_t) (h & 0x7F));
}

static BValue MakeTable(BRuntime * rt, BHashView * hv, ulong_t cap)
{
    BAssert(cap >= HASH_MINIMUM_CAPACITY);
    BAssert((cap & (cap - 1)) == 0);

    ulong_t sc = TableSlotCount(hv, cap);
    BValue tbl = ObjectValue(MakeObject(rt, hv->TableTag, sc * sizeof(BValue) + cap, sc,
            hv->Who));

    memset(TableCtrl(hv, tbl, cap), CTRL_EMPTY, cap);
    return(tbl);
}

static long_t SmallFind(BHashView * hv, BValue key)
{
    for (ulong_t idx = 0; idx < HASH_SMALL_SLOTS; idx++)
        if (hv->Info->Occupied[idx] && EqualKeysP(hv->Keys[idx], key))
            return((long_t) idx);

    return(-1);
}

static long_t LargeFind(BHashView * hv, BValue key, ulong_t h)
{
    ulong_t cap = hv->Info->Capacity;
    ulong_t mask = cap - 1;
    BValue tbl = *hv->Table;
    uint8_t * ctrl = TableCtrl(hv, tbl, cap);
    ulong_t idx = h & mask;

    for (ulong_t cnt = 0; cnt < cap; cnt++)
    {
        if (ctrl[idx] == CTRL_EMPTY)
            return(-1);

        if (ctrl[idx] == CtrlHash(h) && EqualKeysP(TableKeys(tbl)[idx], key))
            return((long_t) idx);

        idx = (idx + 1) & mask;
    }

    return(-1);
}

// The key must not be present and a free slot must exist.

static ulong_t LargeFreeSlot(BHashView * hv, BValue tbl, ulong_t cap, ulong_t h)
{
    ulong_t mask = cap - 1;
    uint8_t * ctrl = TableCtrl(hv, tbl, cap);
    ulong_t idx = h & mask;

    while (ctrl[idx] != CTRL_EMPTY && ctrl[idx] != CTRL_DELETED)
        idx = (idx + 1) & mask;

    return(idx);
}

static void TableStore(BRuntime * rt, BHashView * hv, BValue tbl, ulong_t cap, ulong_t idx,
    BValue key, BValue val, ulong_t h)
{
    ModifyObject(rt, tbl, idx, key);
    if (hv->Values != 0)
        ModifyObject(rt, tbl, cap + idx, val);
    TableCtrl(hv, tbl, cap)[idx] = CtrlHash(h);
}

static void InstallTable(BRuntime * rt, BHashView * hv, BValue tbl, ulong_t cap)
{
    ModifyObject(rt, hv->Object, 0, tbl);
    hv->Info->Capacity = (uint32_t) cap;
    hv->Info->Deleted = 0;
    hv->Info->Mode = HASH_LARGE_MODE;
}

static void Promote(BRuntime * rt, BHashView * hv)
{
    BAssert(hv->Info->Mode == HASH_SMALL_MODE);

    BValue tbl = MakeTable(rt, hv, HASH_MINIMUM_CAPACITY);

    for (ulong_t sdx = 0; sdx < HASH_SMALL_SLOTS; sdx++)
        if (hv->Info->Occupied[sdx])
        {
            BValue key = hv->Keys[sdx];
            ulong_t h = HashValue(key);
            ulong_t idx = LargeFreeSlot(hv, tbl, HASH_MINIMUM_CAPACITY, h);

            TableStore(rt, hv, tbl, HASH_MINIMUM_CAPACITY, idx, key,
                    hv->Values != 0 ? hv->Values[sdx] : NilValue, h);

            hv->Info->Occupied[sdx] = 0;
            ModifyObject(rt, hv->Object, KEYS_SLOT + sdx, NilValue);
            if (hv->Values != 0)
                ModifyObject(rt, hv->Object, VALUES_SLOT + sdx, NilValue);
        }

    InstallTable(rt, hv, tbl, HASH_MINIMUM_CAPACITY);
}

static void Resize(BRuntime * rt, BHashView * hv)
{
    ulong_t len = hv->Info->Length;
    ulong_t ocap = hv->Info->Capacity;
    ulong_t cap = HASH_MINIMUM_CAPACITY;

    while ((len + 1) * 8 > cap * 7)
        cap *= 2;

    BValue otbl = *hv->Table;
    uint8_t * octrl = TableCtrl(hv, otbl, ocap);
    BValue tbl = MakeTable(rt, hv, cap);

    for (ulong_t odx = 0; odx < ocap; odx++)
        if (octrl[odx] != CTRL_EMPTY && octrl[odx] != CTRL_DELETED)
        {
            BValue key = TableKeys(otbl)[odx];
            ulong_t h = HashValue(key);
            ulong_t idx = LargeFreeSlot(hv, tbl, cap, h);

            TableStore(rt, hv, tbl, cap, idx, key,
                    hv->Values != 0 ? TableValues(otbl, ocap)[odx] : NilValue, h);
        }

    InstallTable(rt, hv, tbl, cap);
}

static BValue HashGet(BRuntime * rt, BHashView * hv, BValue key, BValue def, int * fnd)
{
    BObjectLock ol(rt, hv->Object);

    *fnd = 0;
    if (hv->Info->Mode == HASH_SMALL_MODE)
    {
        long_t idx = SmallFind(hv, key);
        if (idx < 0)
            return(def);

        *fnd = 1;
        return(hv->Values != 0 ? hv->Values[idx] : key);
    }

    long_t idx = LargeFind(hv, key, HashValue(key));
    if (idx < 0)
        return(def);

    *fnd = 1;
    return(hv->Values != 0 ? TableValues(*hv->Table, hv->Info->Capacity)[idx] : key);
}

static void HashInsert(BRuntime * rt, BHashView * hv, BValue key, BValue val)
{
    BObjectLock ol(rt, hv->Object);

    if (hv->Info->Mode == HASH_SMALL_MODE)
    {
        long_t idx = SmallFind(hv, key);
        if (idx >= 0)
        {
            if (hv->Values != 0)
                ModifyObject(rt, hv->Object, VALUES_SLOT + idx, val);
            return;
        }

        if (hv->Info->Length < HASH_SMALL_SLOTS)
        {
            for (ulong_t sdx = 0; sdx < HASH_SMALL_SLOTS; sdx++)
                if (hv->Info->Occupied[sdx] == 0)
                {
                    ModifyObject(rt, hv->Object, KEYS_SLOT + sdx, key);
                    if (hv->Values != 0)
                        ModifyObject(rt, hv->Object, VALUES_SLOT + sdx, val);
                    hv->Info->Occupied[sdx] = 1;
                    hv->Info->Length += 1;
                    return;
                }

            BAssert(0);
        }

        Promote(rt, hv);
    }

    ulong_t h = HashValue(key);
    long_t idx = LargeFind(hv, key, h);
    if (idx >= 0)
    {
        if (hv->Values != 0)
            ModifyObject(rt, *hv->Table, hv->Info->Capacity + idx, val);
        return;
    }

    if ((hv->Info->Length + hv->Info->Deleted + 1) * 8 > hv->Info->Capacity * 7)
        Resize(rt, hv);

    BValue tbl = *hv->Table;
    ulong_t cap = hv->Info->Capacity;
    ulong_t sdx = LargeFreeSlot(hv, tbl, cap, h);

    if (TableCtrl(hv, tbl, cap)[sdx] == CTRL_DELETED)
    {
        BAssert(hv->Info->Deleted > 0);

        hv->Info->Deleted -= 1;
    }

    TableStore(rt, hv, tbl, cap, sdx, key, val, h);
    hv->Info->Length += 1;

    BAssert(hv->Info->Length * 8 <= hv->Info->Capacity * 7);
}

static int HashRemove(BRuntime * rt, BHashView * hv, BValue key)
{
    BObjectLock ol(rt, hv->Object);

    if (hv->Info->Mode == HASH_SMALL_MODE)
    {
        long_t idx = SmallFind(hv, key);
        if (idx < 0)
            return(0);

        hv->Info->Occupied[idx] = 0;
        ModifyObject(rt, hv->Object, KEYS_SLOT + idx, NilValue);
        if (hv->Values != 0)
            ModifyObject(rt, hv->Object, VALUES_SLOT + idx, NilValue);
        hv->Info->Length -= 1;
        return(1);
    }

    long_t idx = LargeFind(hv, key, HashValue(key));
    if (idx < 0)
        return(0);

    BValue tbl = *hv->Table;
    ulong_t cap = hv->Info->Capacity;

    TableCtrl(hv, tbl, cap)[idx] = CTRL_DELETED;
    ModifyObject(rt, tbl, idx, NilValue);
    if (hv->Values != 0)
        ModifyObject(rt, tbl, cap + idx, NilValue);
    hv->Info->Length -= 1;
    hv->Info->Deleted += 1;

    return(1);
}

static void HashVisit(BRuntime * rt, BHashView * hv, BFoldFn fn, void * ctx)
{
    if (hv->Info->Mode == HASH_SMALL_MODE)
    {
        for (ulong_t idx = 0; idx < HASH_SMALL_SLOTS; idx++)
            if (hv->Info->Occupied[idx])
                fn(rt, hv->Keys[idx], hv->Values != 0 ? hv->Values[idx] : hv->Keys[idx], ctx);
        return;
    }

    BValue tbl = *hv->Table;
    ulong_t cap = hv->Info->Capacity;
    uint8_t * ctrl = TableCtrl(hv, tbl, cap);

    for (ulong_t idx = 0; idx < cap; idx++)
        if (ctrl[idx] != CTRL_EMPTY && ctrl[idx] != CTRL_DELETED)
            fn(rt, TableKeys(tbl)[idx],
                    hv->Values != 0 ? TableValues(tbl, cap)[idx] : TableKeys(tbl)[idx], ctx);
}

// ---- Maps ----

BValue MakeMap(BRuntime * rt)
{
    BMap * map = (BMap *) MakeObject(rt, MapTag, sizeof(BMap), 1 + HASH_SMALL_SLOTS * 2,
            "make-map");

    memset(&map->Info, 0, sizeof(BHashInfo));
    map->Info.Mode = HASH_SMALL_MODE;

    return(ObjectValue(map));
}

BValue MapGet(BRuntime * rt, BValue map, BValue key, BValue def)
{
    BHashView hv;
    int fnd;

    MapView(map, &hv);
    return(HashGet(rt, &hv, key, def, &fnd));
}

int MapContainsP(BRuntime * rt, BValue map, BValue key)
{
    BHashView hv;
    int fnd;

    MapView(map, &hv);
    HashGet(rt, &hv, key, NilValue, &fnd);
    return(fnd);
}

void MapInsert(BRuntime * rt, BValue map, BValue key, BValue val)
{
    BHashView hv;

    MapView(map, &hv);
    HashInsert(rt, &hv, key, val);
}

int MapRemove(BRuntime * rt, BValue map, BValue key)
{
    BHashView hv;

    MapView(map, &hv);
    return(HashRemove(rt, &hv, key));
}

ulong_t MapLength(BValue map)
{
    BAssert(MapP(map));

    return(AsMap(map)->Info.Length);
}

ulong_t MapCapacity(BValue map)
{
    BAssert(MapP(map));

    return(AsMap(map)->Info.Capacity);
}

ulong_t MapDeleted(BValue map)
{
    BAssert(MapP(map));

    return(AsMap(map)->Info.Deleted);
}

int MapLargeModeP(BValue map)
{
    BAssert(MapP(map));

    return(AsMap(map)->Info.Mode == HASH_LARGE_MODE);
}

void MapVisit(BRuntime * rt, BValue map, BFoldFn fn, void * ctx)
{
    BHashView hv;

    MapView(map, &hv);
    HashVisit(rt, &hv, fn, ctx);
}

// ---- Sets ----

BValue MakeSet(BRuntime * rt)
{
    BSet * set = (BSet *) MakeObject(rt, SetTag, sizeof(BSet), 1 + HASH_SMALL_SLOTS, "make-set");

    memset(&set->Info, 0, sizeof(BHashInfo));
    set->Info.Mode = HASH_SMALL_MODE;

    return(ObjectValue(set));
}

int SetContainsP(BRuntime * rt, BValue set, BValue key)
{
    BHashView hv;
    int fnd;

    SetView(set, &hv);
    HashGet(rt, &hv, key, NilValue, &fnd);
    return(fnd);
}

void SetInsert(BRuntime * rt, BValue set, BValue key)
{
    BHashView hv;

    SetView(set, &hv);
    HashInsert(rt, &hv, key, NilValue);
}

int SetRemove(BRuntime * rt, BValue set, BValue key)
{
    BHashView hv;

    SetView(set, &hv);
    return(HashRemove(rt, &hv, key));
}

ulong_t SetLength(BValue set)
{
    BAssert(SetP(set));

    return(AsSet(set)->Info.Length);
}

ulong_t SetCapacity(BValue set)
{
    BAssert(SetP(set));

    return(AsSet(set)->Info.Capacity);
}

int SetLargeModeP(BValue set)
{
    BAssert(SetP(set));

    return(AsSet(set)->Info.Mode == HASH_LARGE_MODE);
}

void SetVisit(BRuntime * rt, BValue set, BFoldFn fn, void * ctx)
{
    BHashView hv;

    SetView(set, &hv);
    HashVisit(rt, &hv, fn, ctx);
}

// ---- Primitives ----

Define("hash-map", HashMapPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    if (argc % 2 != 0)
        RaiseErrorC(rt, "hash-map", "expected an even number of arguments", NilValue);

    BValue map = MakeMap(rt);
    for (long_t adx = 0; adx < argc; adx += 2)
        MapInsert(rt, map, argv[adx], argv[adx + 1]);

    return(map);
}

Define("assoc!", AssocPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    AtLeastOneArgCheck(rt, "assoc!", argc);
    MapArgCheck(rt, "assoc!", argv[0]);

    if (argc % 2 != 1)
        RaiseErrorC(rt, "assoc!", "expected keys and values", NilValue);

    for (long_t adx = 1; adx < argc; adx += 2)
        MapInsert(rt, argv[0], argv[adx], argv[adx + 1]);

    return(argv[0]);
}

Define("dissoc!", DissocPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    AtLeastOneArgCheck(rt, "dissoc!", argc);
    MapArgCheck(rt, "dissoc!", argv[0]);

    for (long_t adx = 1; adx < argc; adx++)
        MapRemove(rt, argv[0], argv[adx]);

    return(argv[0]);
}

Define("contains?", ContainsPPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    TwoArgsCheck(rt, "contains?", argc);

    if (SetP(argv[0]))
        return(MakeBoolean(SetContainsP(rt, argv[0], argv[1])));

    MapArgCheck(rt, "contains?", argv[0]);
    return(MakeBoolean(MapContainsP(rt, argv[0], argv[1])));
}

static void AppendKey(BRuntime * rt, BValue key, BValue val, void * ctx)
{
    ListAppend(rt, *((BValue *) ctx), key);
}

Define("keys", KeysPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "keys", argc);

    BValue lst = MakeList(rt);
    if (SetP(argv[0]))
        SetVisit(rt, argv[0], AppendKey, &lst);
    else
    {
        MapArgCheck(rt, "keys", argv[0]);
        MapVisit(rt, argv[0], AppendKey, &lst);
    }

    return(lst);
}

Define("hash-set", HashSetPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    BValue set = MakeSet(rt);
    for (long_t adx = 0; adx < argc; adx++)
        SetInsert(rt, set, argv[adx]);

    return(set);
}

Define("conj!", SetConjPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    AtLeastOneArgCheck(rt, "conj!", argc);
    SetArgCheck(rt, "conj!", argv[0]);

    for (long_t adx = 1; adx < argc; adx++)
        SetInsert(rt, argv[0], argv[adx]);

    return(argv[0]);
}

Define("disj!", SetDisjPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    AtLeastOneArgCheck(rt, "disj!", argc);
    SetArgCheck(rt, "disj!", argv[0]);

    for (long_t adx = 1; adx < argc; adx++)
        SetRemove(rt, argv[0], argv[adx]);

    return(argv[0]);
}

static BNative * Primitives[] =
{
    HashMapPrimitive,
    AssocPrimitive,
    DissocPrimitive,
    ContainsPPrimitive,
    KeysPrimitive,
    HashSetPrimitive,
    SetConjPrimitive,
    SetDisjPrimitive
};

void SetupHashMaps(BRuntime * rt)
{
    for (ulong_t idx = 0; idx < sizeof(Primitives) / sizeof(BNative *); idx++)
        DefineNative(rt, CoreModule, Primitives[idx]);
}
