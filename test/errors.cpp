/*

Blink

*/

#include "blinktest.hpp"

typedef BlinkTest ErrorsTest;

TEST_F(ErrorsTest, Kinds)
{
    EXPECT_STREQ("tokenizer", ErrorKindName(TokenizerError));
    EXPECT_STREQ("undefined-symbol", ErrorKindName(UndefinedSymbolError));
    EXPECT_STREQ("arity-mismatch", ErrorKindName(ArityMismatchError));
    EXPECT_STREQ("user-defined", ErrorKindName(UserDefinedError));

    BValue err = MakeParseError(rt, UnclosedDelimiterParse, "unclosed (");
    EXPECT_EQ((uint32_t) ParseError, AsError(err)->Kind);
    EXPECT_EQ((uint32_t) UnclosedDelimiterParse, AsError(err)->SubKind);
    EXPECT_EQ("unclosed (", Message(err));
}

TEST_F(ErrorsTest, Arity)
{
    BValue err = MakeArityError(rt, "f", 2, 3);

    EXPECT_EQ("Wrong number of arguments: expected 2, got 3", Message(err));
    EXPECT_EQ(2u, AsError(err)->Expected);
    EXPECT_EQ(3u, AsError(err)->Got);
    EXPECT_TRUE(StringEqualP(Str("f"), AsError(err)->Name));
}

TEST_F(ErrorsTest, Format)
{
    BValue err = MakeUnexpectedTokenError(rt, ")");

    EXPECT_EQ("unexpected-token: Unexpected token: )", FormatError(rt, err));

    SetErrorPosition(err, 3, 7, 3, 8);
    EXPECT_EQ("unexpected-token: Unexpected token: ) at 3:7", FormatError(rt, err));
    EXPECT_EQ("#<error unexpected-token: Unexpected token: )>", Show(err));
}

TEST_F(ErrorsTest, UndefinedSymbol)
{
    BValue err = Eval(Sym("nowhere"));

    EXPECT_EQ((uint32_t) UndefinedSymbolError, AsError(err)->Kind);
    EXPECT_EQ("Undefined symbol: nowhere", Message(err));
    EXPECT_TRUE(StringEqualP(Str("nowhere"), AsError(err)->Name));
}

TEST_F(ErrorsTest, RaisedByNatives)
{
    try
    {
        RaiseErrorC(rt, "test", "went wrong", Num(5));
        FAIL() << "expected an error";
    }
    catch (BValue err)
    {
        EXPECT_EQ("went wrong", Message(err));
        EXPECT_EQ(Num(5), AsError(err)->Data);
        EXPECT_EQ((uint32_t) EvalError, AsError(err)->Kind);
    }

    BValue err = Eval(Form({Sym("car"), Num(1)}));
    EXPECT_EQ("car expects a list", Message(err));
}

TEST_F(ErrorsTest, ErrorsPropagate)
{
    BValue err = Eval(Form({Sym("+"), Num(1), Form({Sym("-"), Form({Sym("car"), Num(1)})})}));

    EXPECT_EQ("car expects a list", Message(err));
    EXPECT_EQ("+ expects numbers", Message(Eval(Form({Sym("+"), Num(1), Str("2")}))));
}

TEST_F(ErrorsTest, UserErrors)
{
    BValue err = Eval(Form({Sym("err"), Str("boom"), Num(42)}));

    EXPECT_EQ((uint32_t) UserDefinedError, AsError(err)->Kind);
    EXPECT_EQ("boom", Message(err));
    EXPECT_EQ(Num(42), AsError(err)->Data);

    EXPECT_EQ("5", Message(Eval(Form({Sym("err"), Num(5)}))));
}

TEST_F(ErrorsTest, InspectCaughtErrors)
{
    BValue catcher = Form({Sym("catch"), Sym("e"),
            Form({Sym("list"), Form({Sym("error?"), Sym("e")}), Form({Sym("error-kind"), Sym("e")}),
            Form({Sym("error-message"), Sym("e")}), Form({Sym("error-data"), Sym("e")})})});

    BValue ret = Eval(Form({Sym("try"), Form({Sym("err"), Str("boom"), Kw("why")}), catcher}));
    EXPECT_EQ("(true :user-defined \"boom\" :why)", Show(ret));

    ret = Eval(Form({Sym("try"), Form({Sym("car"), Num(1)}), catcher}));
    EXPECT_EQ("(true :eval \"car expects a list\" nil)", Show(ret));
}
