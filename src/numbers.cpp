/*

Blink

*/

#include "blink.hpp"

// ---- Arithmetic ----

static double NumberArg(BRuntime * rt, const char * who, BValue arg)
{
    if (NumberP(arg) == 0)
        Raise(MakeEvalError(rt, (std::string(who) + " expects numbers").c_str()));

    return(AsNumber(arg));
}

Define("+", AddPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    double d = 0;

    for (long_t adx = 0; adx < argc; adx++)
        d += NumberArg(rt, "+", argv[adx]);

    return(MakeNumber(d));
}

Define("*", MultiplyPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    double d = 1;

    for (long_t adx = 0; adx < argc; adx++)
        d *= NumberArg(rt, "*", argv[adx]);

    return(MakeNumber(d));
}

Define("-", SubtractPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    AtLeastOneArgCheck(rt, "-", argc);

    double d = NumberArg(rt, "-", argv[0]);
    if (argc == 1)
        return(MakeNumber(- d));

    for (long_t adx = 1; adx < argc; adx++)
        d -= NumberArg(rt, "-", argv[adx]);

    return(MakeNumber(d));
}

Define("/", DividePrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    AtLeastOneArgCheck(rt, "/", argc);

    double d = NumberArg(rt, "/", argv[0]);
    if (argc == 1)
        return(MakeNumber(1 / d));

    for (long_t adx = 1; adx < argc; adx++)
        d /= NumberArg(rt, "/", argv[adx]);

    return(MakeNumber(d));
}

// ---- Comparison ----

typedef int (*BCompareFn)(double d1, double d2);

static int LessP(double d1, double d2) {return(d1 < d2);}
static int GreaterP(double d1, double d2) {return(d1 > d2);}
static int LessEqualP(double d1, double d2) {return(d1 <= d2);}
static int GreaterEqualP(double d1, double d2) {return(d1 >= d2);}

static BValue CompareNumbers(BRuntime * rt, const char * who, BCompareFn cmp, long_t argc,
    BValue argv[])
{
    AtLeastOneArgCheck(rt, who, argc);

    double d = NumberArg(rt, who, argv[0]);
    int ret = 1;

    for (long_t adx = 1; adx < argc; adx++)
    {
        double nd = NumberArg(rt, who, argv[adx]);
        if (cmp(d, nd) == 0)
            ret = 0;
        d = nd;
    }

    return(MakeBoolean(ret));
}

Define("<", LessThanPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    return(CompareNumbers(rt, "<", LessP, argc, argv));
}

Define(">", GreaterThanPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    return(CompareNumbers(rt, ">", GreaterP, argc, argv));
}

Define("<=", LessThanEqualPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    return(CompareNumbers(rt, "<=", LessEqualP, argc, argv));
}

Define(">=", GreaterThanEqualPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    return(CompareNumbers(rt, ">=", GreaterEqualP, argc, argv));
}

Define("not", NotPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "not", argc);

    return(MakeBoolean(TruthyP(argv[0]) == 0));
}

Define("number?", NumberPPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "number?", argc);

    return(MakeBoolean(NumberP(argv[0])));
}

static BNative * Primitives[] =
{
    AddPrimitive,
    MultiplyPrimitive,
    SubtractPrimitive,
    DividePrimitive,
    LessThanPrimitive,
    GreaterThanPrimitive,
    LessThanEqualPrimitive,
    GreaterThanEqualPrimitive,
    NotPrimitive,
    NumberPPrimitive
};

void SetupNumbers(BRuntime * rt)
{
    for (ulong_t idx = 0; idx < sizeof(Primitives) / sizeof(BNative *); idx++)
        DefineNative(rt, CoreModule, Primitives[idx]);
}
