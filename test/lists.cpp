/*

Blink

*/

#include "blinktest.hpp"

typedef BlinkTest ListsTest;

TEST_F(ListsTest, AppendAndPrepend)
{
    BValue lst = MakeList(rt);

    EXPECT_EQ(0u, ListLength(lst));
    EXPECT_EQ(NilValue, ListFirst(rt, lst));
    EXPECT_EQ(NilValue, ListLast(rt, lst));

    ListAppend(rt, lst, Num(2));
    ListAppend(rt, lst, Num(3));
    ListPrepend(rt, lst, Num(1));

    EXPECT_EQ(3u, ListLength(lst));
    EXPECT_EQ(Num(1), ListFirst(rt, lst));
    EXPECT_EQ(Num(3), ListLast(rt, lst));
    EXPECT_EQ("(1 2 3)", Show(lst));
}

TEST_F(ListsTest, PopFrontAndBack)
{
    BValue lst = Form({Num(1), Num(2), Num(3)});

    EXPECT_EQ(Num(3), ListPopBack(rt, lst));
    EXPECT_EQ(Num(2), ListLast(rt, lst));
    EXPECT_EQ(Num(1), ListPopFront(rt, lst));
    EXPECT_EQ(Num(2), ListPopFront(rt, lst));
    EXPECT_EQ(0u, ListLength(lst));

    // An emptied list accepts new elements.
    ListAppend(rt, lst, Num(9));
    EXPECT_EQ("(9)", Show(lst));
}

TEST_F(ListsTest, PopEmptyRaises)
{
    BValue lst = MakeList(rt);

    try
    {
        ListPopFront(rt, lst);
        FAIL() << "expected an error";
    }
    catch (BValue err)
    {
        EXPECT_EQ("cannot pop an empty list", Message(err));
    }

    try
    {
        ListPopBack(rt, lst);
        FAIL() << "expected an error";
    }
    catch (BValue err)
    {
        EXPECT_EQ("cannot pop an empty list", Message(err));
    }
}

TEST_F(ListsTest, Nth)
{
    BValue lst = Form({Kw("a"), Kw("b"), Kw("c")});

    EXPECT_EQ(Kw("a"), ListNth(rt, lst, 0));
    EXPECT_EQ(Kw("c"), ListNth(rt, lst, 2));
    EXPECT_THROW(ListNth(rt, lst, 3), BValue);
}

TEST_F(ListsTest, RestSharesStructure)
{
    BValue lst = Form({Num(1), Num(2), Num(3)});
    BValue rst = ListRest(rt, lst);

    EXPECT_EQ(2u, ListLength(rst));
    EXPECT_EQ("(2 3)", Show(rst));
    EXPECT_EQ(AsListNode(AsList(lst)->Head)->Next, AsList(rst)->Head);

    // Appending to either list leaves the other unchanged.
    ListAppend(rt, lst, Num(4));
    ListAppend(rt, rst, Num(5));

    EXPECT_EQ("(1 2 3 4)", Show(lst));
    EXPECT_EQ("(2 3 5)", Show(rst));

    EXPECT_EQ(0u, ListLength(ListRest(rt, MakeList(rt))));
    EXPECT_EQ(0u, ListLength(ListDrop(rt, lst, 10)));
}

TEST_F(ListsTest, ConcatAndConvert)
{
    BValue lst1 = Form({Num(1), Num(2)});
    BValue lst2 = Form({Num(3)});
    BValue cat = ListConcat(rt, lst1, lst2);

    EXPECT_EQ("(1 2 3)", Show(cat));
    EXPECT_EQ("(1 2)", Show(lst1));
    EXPECT_EQ("[1 2 3]", Show(ListToVector(rt, cat)));

    ListClear(rt, cat);
    EXPECT_EQ("()", Show(cat));
}

TEST_F(ListsTest, Natives)
{
    EXPECT_EQ("(1 2)", Show(Eval(Form({Sym("list"), Num(1), Num(2)}))));
    EXPECT_EQ("(0 1 2)",
            Show(Eval(Form({Sym("cons"), Num(0), Form({Sym("list"), Num(1), Num(2)})}))));
    EXPECT_EQ(Num(1), Eval(Form({Sym("car"), Form({Sym("list"), Num(1), Num(2)})})));
    EXPECT_EQ("(2)", Show(Eval(Form({Sym("cdr"), Form({Sym("list"), Num(1), Num(2)})}))));
    EXPECT_EQ(Num(2), Eval(Form({Sym("count"), Form({Sym("list"), Num(1), Num(2)})})));
    EXPECT_EQ("first on empty list", Message(Eval(Form({Sym("first"), Form({Sym("list")})}))));
    EXPECT_EQ("car expects a list", Message(Eval(Form({Sym("car"), Num(1)}))));

    BValue err = Eval(Form({Sym("pop-front"), Form({Sym("list")})}));
    EXPECT_EQ("cannot pop an empty list", Message(err));
}
