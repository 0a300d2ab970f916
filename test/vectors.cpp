/*

Blink

*/

#include "blinktest.hpp"

typedef BlinkTest VectorsTest;

TEST_F(VectorsTest, PushGrowsCapacity)
{
    BValue vec = Vec({});

    EXPECT_EQ(0u, VectorLength(vec));
    EXPECT_EQ(0u, VectorCapacity(vec));

    VectorPush(rt, vec, Num(0));
    EXPECT_EQ(8u, VectorCapacity(vec));

    for (ulong_t idx = 1; idx < 9; idx++)
        VectorPush(rt, vec, Num(idx));

    EXPECT_EQ(9u, VectorLength(vec));
    EXPECT_EQ(16u, VectorCapacity(vec));

    for (ulong_t idx = 0; idx < 9; idx++)
        EXPECT_EQ(Num(idx), VectorGet(rt, vec, idx));
}

TEST_F(VectorsTest, PopAndSet)
{
    BValue vec = Vec({Num(1), Num(2)});

    VectorSet(rt, vec, 0, Str("a"));
    EXPECT_EQ(Num(2), VectorPop(rt, vec));
    EXPECT_EQ(1u, VectorLength(vec));
    EXPECT_EQ("[\"a\"]", Show(vec));

    VectorPop(rt, vec);
    EXPECT_THROW(VectorPop(rt, vec), BValue);
}

TEST_F(VectorsTest, OutOfBounds)
{
    BValue vec = Vec({Num(1)});

    try
    {
        VectorGet(rt, vec, 1);
        FAIL() << "expected an error";
    }
    catch (BValue err)
    {
        EXPECT_EQ("index out of bounds", Message(err));
    }

    EXPECT_THROW(VectorSet(rt, vec, 5, NilValue), BValue);

    BValue err = Eval(Form({Sym("get"), Form({Sym("vector"), Num(1)}), Num(3)}));
    EXPECT_EQ("expected a valid index", Message(err));
    EXPECT_EQ(Kw("none"), Eval(Form({Sym("get"), Form({Sym("vector"), Num(1)}), Num(3), Kw("none")})));
}

TEST_F(VectorsTest, Resize)
{
    BValue vec = Vec({Num(1), Num(2), Num(3)});

    VectorResize(rt, vec, 5, Kw("x"));
    EXPECT_EQ("[1 2 3 :x :x]", Show(vec));

    VectorResize(rt, vec, 1, NilValue);
    EXPECT_EQ("[1]", Show(vec));

    VectorResize(rt, vec, 2, Num(0));
    EXPECT_EQ("[1 0]", Show(vec));
}

TEST_F(VectorsTest, Natives)
{
    BValue vec = Form({Sym("vector"), Num(1), Num(2)});

    EXPECT_EQ("[1 2]", Show(Eval(vec)));
    EXPECT_EQ("(1 2)", Show(Eval(Form({Sym("vector->list"), vec}))));
    EXPECT_EQ(Num(2), Eval(Form({Sym("get"), vec, Num(1)})));
    EXPECT_EQ(Num(2), Eval(Form({Sym("count"), vec})));
}
