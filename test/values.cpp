/*

Blink

*/

#include <math.h>
#include "blinktest.hpp"

typedef BlinkTest ValuesTest;

TEST_F(ValuesTest, NumbersRoundTrip)
{
    double vals[] = {0.0, -0.0, 1.5, -12345.678, 1e300, -1e-300, INFINITY, -INFINITY};

    for (ulong_t idx = 0; idx < sizeof(vals) / sizeof(double); idx++)
    {
        BValue v = MakeNumber(vals[idx]);

        EXPECT_TRUE(NumberP(v));
        EXPECT_EQ(vals[idx], AsNumber(v));
    }

    EXPECT_TRUE(signbit(AsNumber(MakeNumber(-0.0))));
}

TEST_F(ValuesTest, NanIsCanonical)
{
    BValue v = MakeNumber(nan(""));

    EXPECT_TRUE(NumberP(v));
    EXPECT_EQ(VALUE_QNAN, v);
    EXPECT_TRUE(isnan(AsNumber(v)));
    EXPECT_EQ(VALUE_QNAN, MakeNumber(-nan("")));
}

TEST_F(ValuesTest, TagsAreDistinct)
{
    BValue vals[] = {Num(1), TrueValue, Sym("x"), NilValue, Kw("x"), UserModule, Str("x")};

    EXPECT_TRUE(BooleanP(vals[1]));
    EXPECT_TRUE(SymbolP(vals[2]));
    EXPECT_TRUE(NilP(vals[3]));
    EXPECT_TRUE(KeywordP(vals[4]));
    EXPECT_TRUE(ModuleIdP(vals[5]));
    EXPECT_TRUE(ObjectP(vals[6]));

    for (ulong_t idx = 1; idx < 7; idx++)
    {
        EXPECT_FALSE(NumberP(vals[idx]));
        for (ulong_t jdx = 0; jdx < 7; jdx++)
            if (idx != jdx)
                EXPECT_NE(ValueTag(vals[idx]), ValueTag(vals[jdx]));
    }

    EXPECT_NE(Sym("x"), Kw("x"));
    EXPECT_EQ(AsSymbolId(Sym("x")), AsKeywordId(Kw("x")));
}

TEST_F(ValuesTest, PointersRoundTrip)
{
    BValue s = Str("hello");
    void * obj = AsObject(s);

    EXPECT_EQ(s, ObjectValue(obj));
    EXPECT_EQ((ulong_t) StringTag, ObjectTag(s));
    EXPECT_EQ(0u, ((ulong_t) obj) & 7);

    BValue nat;
    EXPECT_TRUE(ModuleLookup(rt, CoreModule, Sym("list"), &nat));
    EXPECT_TRUE(NativeP(nat));
    EXPECT_STREQ("list", AsNative(nat)->Name);
    EXPECT_EQ(nat, NativeValue(AsNative(nat)));
}

TEST_F(ValuesTest, Truthiness)
{
    EXPECT_FALSE(TruthyP(NilValue));
    EXPECT_FALSE(TruthyP(FalseValue));
    EXPECT_TRUE(TruthyP(TrueValue));
    EXPECT_TRUE(TruthyP(Num(0)));
    EXPECT_TRUE(TruthyP(MakeList(rt)));
}

TEST_F(ValuesTest, SymbolsIntern)
{
    EXPECT_EQ(Sym("alpha"), Sym("alpha"));
    EXPECT_NE(Sym("alpha"), Sym("beta"));
    EXPECT_STREQ("alpha", SymbolName(rt, Sym("alpha")));
    EXPECT_STREQ("beta", SymbolName(rt, Kw("beta")));
}

TEST_F(ValuesTest, Strings)
{
    BValue s1 = Str("abc");
    BValue s2 = MakeString(rt, "abcdef", 3);

    EXPECT_EQ(3u, StringLength(s1));
    EXPECT_TRUE(StringEqualP(s1, s2));
    EXPECT_EQ(StringHash(s1), StringHash(s2));
    EXPECT_FALSE(StringEqualP(s1, Str("abd")));
    EXPECT_EQ(0, AsString(s2)->String[3]);
}

TEST_F(ValuesTest, WriteValues)
{
    EXPECT_EQ("3", Show(Num(3)));
    EXPECT_EQ("0.1", Show(Num(0.1)));
    EXPECT_EQ("-2.5", Show(Num(-2.5)));
    EXPECT_EQ("inf", Show(Num(INFINITY)));
    EXPECT_EQ("nan", Show(Num(nan(""))));
    EXPECT_EQ("true", Show(TrueValue));
    EXPECT_EQ("nil", Show(NilValue));
    EXPECT_EQ(":key", Show(Kw("key")));
    EXPECT_EQ("\"a\\\"b\"", Show(Str("a\"b")));
    EXPECT_EQ("a\"b", ValueToString(rt, Str("a\"b"), 1));
    EXPECT_EQ("(1 (2 3) [4 5])", Show(Form({Num(1), Form({Num(2), Num(3)}), Vec({Num(4), Num(5)})})));
    EXPECT_EQ("()", Show(MakeList(rt)));
    EXPECT_EQ("#<native +>", Show(Eval(Sym("+"))));
}

TEST_F(ValuesTest, WriteMapsAndSets)
{
    BValue map = MakeMap(rt);
    MapInsert(rt, map, Kw("a"), Num(1));
    EXPECT_EQ("{:a 1}", Show(map));

    BValue set = MakeSet(rt);
    SetInsert(rt, set, Num(7));
    EXPECT_EQ("#{7}", Show(set));
    EXPECT_EQ("{}", Show(MakeMap(rt)));
}

TEST_F(ValuesTest, TypeOf)
{
    EXPECT_EQ(Kw("number"), TypeOf(rt, Num(1)));
    EXPECT_EQ(Kw("boolean"), TypeOf(rt, FalseValue));
    EXPECT_EQ(Kw("nil"), TypeOf(rt, NilValue));
    EXPECT_EQ(Kw("symbol"), TypeOf(rt, Sym("s")));
    EXPECT_EQ(Kw("keyword"), TypeOf(rt, Kw("k")));
    EXPECT_EQ(Kw("list"), TypeOf(rt, MakeList(rt)));
    EXPECT_EQ(Kw("vector"), TypeOf(rt, Vec({})));
    EXPECT_EQ(Kw("map"), TypeOf(rt, MakeMap(rt)));
    EXPECT_EQ(Kw("set"), TypeOf(rt, MakeSet(rt)));
    EXPECT_EQ(Kw("string"), TypeOf(rt, Str("")));
    EXPECT_EQ(Kw("future"), TypeOf(rt, MakeFuture(rt, 0)));
    EXPECT_EQ(Kw("native"), Eval(Form({Sym("type-of"), Sym("car")})));
}

TEST_F(ValuesTest, EqualityAndHashing)
{
    EXPECT_TRUE(EqualKeysP(Num(0.0), Num(-0.0)));
    EXPECT_EQ(HashValue(Num(0.0)), HashValue(Num(-0.0)));
    EXPECT_TRUE(EqualKeysP(Str("k"), Str("k")));
    EXPECT_EQ(HashValue(Str("k")), HashValue(Str("k")));
    EXPECT_FALSE(EqualKeysP(Vec({Num(1)}), Vec({Num(1)})));
    EXPECT_TRUE(EqualP(rt, Vec({Num(1), Str("a")}), Vec({Num(1), Str("a")})));
    EXPECT_TRUE(EqualP(rt, Form({Num(1), Num(2)}), Form({Num(1), Num(2)})));
    EXPECT_FALSE(EqualP(rt, Form({Num(1), Num(2)}), Form({Num(1)})));
}
