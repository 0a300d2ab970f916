/*

Blink

*/

#include "blink.hpp"

#define VECTOR_MINIMUM_CAPACITY 8
#define MAXIMUM_VECTOR_LENGTH ((ulong_t) 0xFFFFFFFF)

// ---- Vectors ----

static BValue MakeVectorData(BRuntime * rt, ulong_t cap, const char * who)
{
    if (cap == 0)
        return(NilValue);

    return(ObjectValue(MakeObject(rt, VectorDataTag, cap * sizeof(BValue), cap, who)));
}

BValue MakeVector(BRuntime * rt, ulong_t len, BValue fill)
{
    if (len > MAXIMUM_VECTOR_LENGTH)
        RaiseErrorC(rt, "make-vector", "vector too long", MakeNumber((double) len));

    BValue dat = MakeVectorData(rt, len, "make-vector");
    BVector * vh = (BVector *) MakeObject(rt, VectorTag, sizeof(BVector), 1, "make-vector");

    vh->Data = dat;
    vh->Length = (uint32_t) len;
    vh->Capacity = (uint32_t) len;

    for (ulong_t idx = 0; idx < len; idx++)
        AsVectorData(dat)[idx] = fill;

    return(ObjectValue(vh));
}

BValue MakeVectorFrom(BRuntime * rt, ulong_t argc, BValue * argv)
{
    BValue vec = MakeVector(rt, argc, NilValue);

    for (ulong_t adx = 0; adx < argc; adx++)
        AsVectorData(AsVector(vec)->Data)[adx] = argv[adx];

    return(vec);
}

BValue VectorGet(BRuntime * rt, BValue vec, ulong_t idx)
{
    BAssert(VectorP(vec));

    BObjectLock ol(rt, vec);

    if (idx >= AsVector(vec)->Length)
        RaiseErrorC(rt, "get", "index out of bounds", MakeNumber((double) idx));

    return(AsVectorData(AsVector(vec)->Data)[idx]);
}

void VectorSet(BRuntime * rt, BValue vec, ulong_t idx, BValue val)
{
    BAssert(VectorP(vec));

    BObjectLock ol(rt, vec);

    if (idx >= AsVector(vec)->Length)
        RaiseErrorC(rt, "set!", "index out of bounds", MakeNumber((double) idx));

    ModifyObject(rt, AsVector(vec)->Data, idx, val);
}

static void GrowVector(BRuntime * rt, BValue vec, ulong_t cap)
{
    BVector * vh = AsVector(vec);

    BAssert(cap > vh->Capacity);

    if (cap > MAXIMUM_VECTOR_LENGTH)
        RaiseErrorC(rt, "push!", "vector too long", vec);

    BValue dat = MakeVectorData(rt, cap, "push!");
    for (ulong_t idx = 0; idx < vh->Length; idx++)
        ModifyObject(rt, dat, idx, AsVectorData(vh->Data)[idx]);

    ModifyObject(rt, vec, 0, dat);
    vh->Capacity = (uint32_t) cap;
}

void VectorPush(BRuntime * rt, BValue vec, BValue val)
{
    BAssert(VectorP(vec));

    BObjectLock ol(rt, vec);
    BVector * vh = AsVector(vec);

    if (vh->Length == vh->Capacity)
    {
        ulong_t cap = vh->Capacity * 2;
        if (cap < VECTOR_MINIMUM_CAPACITY)
            cap = VECTOR_MINIMUM_CAPACITY;

        GrowVector(rt, vec, cap);
    }

    ModifyObject(rt, vh->Data, vh->Length, val);
    vh->Length += 1;
}

BValue VectorPop(BRuntime * rt, BValue vec)
{
    BAssert(VectorP(vec));

    BObjectLock ol(rt, vec);
    BVector * vh = AsVector(vec);

    if (vh->Length == 0)
        RaiseErrorC(rt, "pop!", "cannot pop an empty vector", vec);

    vh->Length -= 1;
    BValue val = AsVectorData(vh->Data)[vh->Length];
    AsVectorData(vh->Data)[vh->Length] = NilValue;

    return(val);
}

void VectorResize(BRuntime * rt, BValue vec, ulong_t len, BValue fill)
{
    BAssert(VectorP(vec));

    BObjectLock ol(rt, vec);
    BVector * vh = AsVector(vec);

    if (len > vh->Capacity)
        GrowVector(rt, vec, len);

    for (ulong_t idx = vh->Length; idx < len; idx++)
        ModifyObject(rt, vh->Data, idx, fill);
    for (ulong_t idx = len; idx < vh->Length; idx++)
        AsVectorData(vh->Data)[idx] = NilValue;

    vh->Length = (uint32_t) len;
}

BValue VectorToList(BRuntime * rt, BValue vec)
{
    BAssert(VectorP(vec));

    BValue lst = MakeList(rt);
    for (ulong_t idx = 0; idx < VectorLength(vec); idx++)
        ListAppend(rt, lst, VectorGet(rt, vec, idx));

    return(lst);
}

// ---- Primitives ----

Define("vector", VectorPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    return(MakeVectorFrom(rt, argc, argv));
}

Define("push!", PushPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    TwoArgsCheck(rt, "push!", argc);
    VectorArgCheck(rt, "push!", argv[0]);

    VectorPush(rt, argv[0], argv[1]);
    return(argv[0]);
}

Define("pop!", PopPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "pop!", argc);
    VectorArgCheck(rt, "pop!", argv[0]);

    return(VectorPop(rt, argv[0]));
}

Define("get", GetPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    TwoOrThreeArgsCheck(rt, "get", argc);

    if (MapP(argv[0]))
        return(MapGet(rt, argv[0], argv[1], argc == 3 ? argv[2] : NilValue));
    else if (SetP(argv[0]))
        return(SetContainsP(rt, argv[0], argv[1]) ? argv[1]
                : (argc == 3 ? argv[2] : NilValue));

    VectorArgCheck(rt, "get", argv[0]);

    if (argc == 3 && (NumberP(argv[1]) == 0 || AsNumber(argv[1]) < 0
            || AsNumber(argv[1]) >= (double) VectorLength(argv[0])))
        return(argv[2]);

    IndexArgCheck(rt, "get", argv[1], VectorLength(argv[0]));
    return(VectorGet(rt, argv[0], (ulong_t) AsNumber(argv[1])));
}

Define("set!", SetPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    ThreeArgsCheck(rt, "set!", argc);
    VectorArgCheck(rt, "set!", argv[0]);
    IndexArgCheck(rt, "set!", argv[1], VectorLength(argv[0]));

    VectorSet(rt, argv[0], (ulong_t) AsNumber(argv[1]), argv[2]);
    return(argv[0]);
}

Define("resize!", ResizePrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    TwoOrThreeArgsCheck(rt, "resize!", argc);
    VectorArgCheck(rt, "resize!", argv[0]);
    NonNegativeArgCheck(rt, "resize!", argv[1]);

    VectorResize(rt, argv[0], (ulong_t) AsNumber(argv[1]), argc == 3 ? argv[2] : NilValue);
    return(argv[0]);
}

Define("vector->list", VectorToListPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "vector->list", argc);
    VectorArgCheck(rt, "vector->list", argv[0]);

    return(VectorToList(rt, argv[0]));
}

static BNative * Primitives[] =
{
    VectorPrimitive,
    PushPrimitive,
    PopPrimitive,
    GetPrimitive,
    SetPrimitive,
    ResizePrimitive,
    VectorToListPrimitive
};

void SetupVectors(BRuntime * rt)
{
    for (ulong_t idx = 0; idx < sizeof(Primitives) / sizeof(BNative *); idx++)
        DefineNative(rt, CoreModule, Primitives[idx]);
}
