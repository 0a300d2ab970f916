/*

Blink

*/

#include <math.h>
#include "blinktest.hpp"

typedef BlinkTest HashMapTest;

TEST_F(HashMapTest, SmallMode)
{
    BValue map = MakeMap(rt);

    for (ulong_t idx = 0; idx < 4; idx++)
        MapInsert(rt, map, Num(idx), Num(idx * 10));

    EXPECT_FALSE(MapLargeModeP(map));
    EXPECT_EQ(4u, MapLength(map));
    EXPECT_EQ(Num(30), MapGet(rt, map, Num(3), NilValue));
    EXPECT_EQ(Kw("none"), MapGet(rt, map, Num(4), Kw("none")));

    MapInsert(rt, map, Num(3), Num(33));
    EXPECT_EQ(4u, MapLength(map));
    EXPECT_EQ(Num(33), MapGet(rt, map, Num(3), NilValue));

    EXPECT_TRUE(MapRemove(rt, map, Num(0)));
    EXPECT_FALSE(MapRemove(rt, map, Num(0)));
    EXPECT_EQ(3u, MapLength(map));

    MapInsert(rt, map, Num(7), Num(70));
    EXPECT_FALSE(MapLargeModeP(map));
}

TEST_F(HashMapTest, PromoteOnFifthKey)
{
    BValue map = MakeMap(rt);

    for (ulong_t idx = 0; idx < 5; idx++)
        MapInsert(rt, map, Num(idx), Num(idx * 10));

    EXPECT_TRUE(MapLargeModeP(map));
    EXPECT_EQ(8u, MapCapacity(map));
    EXPECT_EQ(5u, MapLength(map));

    for (ulong_t idx = 0; idx < 5; idx++)
        EXPECT_EQ(Num(idx * 10), MapGet(rt, map, Num(idx), NilValue));
}

TEST_F(HashMapTest, ResizeKeepsLoadFactor)
{
    BValue map = MakeMap(rt);

    for (ulong_t idx = 0; idx < 7; idx++)
        MapInsert(rt, map, Num(idx), Num(idx));
    EXPECT_EQ(8u, MapCapacity(map));

    MapInsert(rt, map, Num(7), Num(7));
    EXPECT_EQ(16u, MapCapacity(map));

    for (ulong_t idx = 8; idx < 100; idx++)
        MapInsert(rt, map, Num(idx), Num(idx));

    EXPECT_EQ(100u, MapLength(map));
    EXPECT_LE(MapLength(map) * 8, MapCapacity(map) * 7);

    for (ulong_t idx = 0; idx < 100; idx++)
        EXPECT_EQ(Num(idx), MapGet(rt, map, Num(idx), NilValue));
}

TEST_F(HashMapTest, TombstonesForceRehash)
{
    BValue map = MakeMap(rt);

    for (ulong_t idx = 0; idx < 7; idx++)
        MapInsert(rt, map, Num(idx), Num(idx));

    EXPECT_TRUE(MapRemove(rt, map, Num(1)));
    EXPECT_TRUE(MapRemove(rt, map, Num(2)));
    EXPECT_EQ(2u, MapDeleted(map));
    EXPECT_FALSE(MapContainsP(rt, map, Num(1)));

    MapInsert(rt, map, Num(50), Num(50));

    EXPECT_EQ(0u, MapDeleted(map));
    EXPECT_EQ(8u, MapCapacity(map));
    EXPECT_EQ(6u, MapLength(map));
    EXPECT_TRUE(MapContainsP(rt, map, Num(6)));
    EXPECT_TRUE(MapContainsP(rt, map, Num(50)));
}

TEST_F(HashMapTest, KeysCompareByValue)
{
    BValue map = MakeMap(rt);

    MapInsert(rt, map, Str("name"), Num(1));
    MapInsert(rt, map, Num(0.0), Num(2));

    EXPECT_EQ(Num(1), MapGet(rt, map, Str("name"), NilValue));
    EXPECT_EQ(Num(2), MapGet(rt, map, Num(-0.0), NilValue));

    BValue vec = Vec({});
    MapInsert(rt, map, vec, Num(3));
    EXPECT_FALSE(MapContainsP(rt, map, Vec({})));
    EXPECT_TRUE(MapContainsP(rt, map, vec));
}

static void SumValues(BRuntime * rt, BValue key, BValue val, void * ctx)
{
    *((double *) ctx) += AsNumber(val);
}

TEST_F(HashMapTest, NanKeys)
{
    BValue map = MakeMap(rt);

    MapInsert(rt, map, Num(nan("")), Num(1));
    MapInsert(rt, map, Num(-nan("")), Num(2));
    EXPECT_EQ(1u, MapLength(map));
    EXPECT_EQ(Num(2), MapGet(rt, map, Num(nan("")), NilValue));

    for (ulong_t idx = 0; idx < 8; idx++)
        MapInsert(rt, map, Num(idx), Num(idx));

    EXPECT_TRUE(MapLargeModeP(map));
    MapInsert(rt, map, Num(nan("")), Num(3));
    EXPECT_EQ(9u, MapLength(map));
    EXPECT_EQ(Num(3), MapGet(rt, map, Num(nan("")), NilValue));
    EXPECT_TRUE(MapRemove(rt, map, Num(nan(""))));
    EXPECT_FALSE(MapContainsP(rt, map, Num(nan(""))));

    BValue set = MakeSet(rt);
    SetInsert(rt, set, Num(nan("")));
    SetInsert(rt, set, Num(nan("")));
    EXPECT_EQ(1u, SetLength(set));

    EXPECT_FALSE(EqualP(rt, Num(nan("")), Num(nan(""))));
    EXPECT_EQ(FalseValue, Eval(Form({Sym("="), Num(nan("")), Num(nan(""))})));
}

TEST_F(HashMapTest, Visit)
{
    BValue map = MakeMap(rt);
    double sum = 0;

    for (ulong_t idx = 1; idx <= 10; idx++)
        MapInsert(rt, map, Num(idx), Num(idx));

    MapVisit(rt, map, SumValues, &sum);
    EXPECT_EQ(55, sum);
}

TEST_F(HashMapTest, Sets)
{
    BValue set = MakeSet(rt);

    for (ulong_t idx = 0; idx < 6; idx++)
        SetInsert(rt, set, Num(idx % 5));

    EXPECT_EQ(5u, SetLength(set));
    EXPECT_TRUE(SetLargeModeP(set));
    EXPECT_TRUE(SetContainsP(rt, set, Num(4)));
    EXPECT_TRUE(SetRemove(rt, set, Num(4)));
    EXPECT_FALSE(SetContainsP(rt, set, Num(4)));
    EXPECT_EQ(4u, SetLength(set));
}

TEST_F(HashMapTest, Natives)
{
    BValue map = Form({Sym("hash-map"), Kw("a"), Num(1), Kw("b"), Num(2)});

    EXPECT_EQ(Num(2), Eval(Form({Sym("get"), map, Kw("b")})));
    EXPECT_EQ(TrueValue, Eval(Form({Sym("contains?"), map, Kw("a")})));
    EXPECT_EQ(FalseValue, Eval(Form({Sym("contains?"), map, Kw("c")})));

    BValue err = Eval(Form({Sym("hash-map"), Kw("a")}));
    EXPECT_EQ("expected an even number of arguments", Message(err));

    EXPECT_EQ("#{1}", Show(Eval(Form({Sym("hash-set"), Num(1), Num(1)}))));
}
