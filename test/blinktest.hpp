/*

Blink

*/

#ifndef __BLINKTEST_HPP__
#define __BLINKTEST_HPP__

#include <initializer_list>
#include <string>
#include <gtest/gtest.h>
#include "blink.hpp"

// A runtime per test. Forms are built directly since there is no reader.

class BlinkTest : public ::testing::Test
{
protected:

    virtual void Configure(BConfig * cfg) {}

    virtual void SetUp()
    {
        BConfig cfg;

        InitializeConfig(&cfg);
        cfg.IdleMicroseconds = 10;
        Configure(&cfg);

        rt = MakeRuntime(&cfg);
    }

    virtual void TearDown()
    {
        DeleteRuntime(rt);
    }

    BValue Sym(const char * s) {return(StringCToSymbol(rt, s));}
    BValue Kw(const char * s) {return(StringCToKeyword(rt, s));}
    BValue Num(double d) {return(MakeNumber(d));}
    BValue Str(const char * s) {return(MakeStringC(rt, s));}

    BValue Form(std::initializer_list<BValue> vals)
    {
        return(MakeListFrom(rt, vals.size(), const_cast<BValue *>(vals.begin())));
    }

    BValue Vec(std::initializer_list<BValue> vals)
    {
        return(MakeVectorFrom(rt, vals.size(), const_cast<BValue *>(vals.begin())));
    }

    BValue Quote(BValue v) {return(Form({Sym("quote"), v}));}

    BValue Eval(BValue expr) {return(EvaluateBlocking(rt, expr, UserModule));}
    std::string Show(BValue v) {return(ValueToString(rt, v, 0));}

    std::string Message(BValue err)
    {
        EXPECT_TRUE(ErrorP(err));
        if (ErrorP(err) == 0)
            return("");

        BValue msg = AsError(err)->Message;
        return(std::string(AsString(msg)->String, AsString(msg)->Length));
    }

    BRuntime * rt;
};

#endif // __BLINKTEST_HPP__
