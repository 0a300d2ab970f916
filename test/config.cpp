/*

Blink

*/

#include "blinktest.hpp"

static int Process(BConfig * cfg, BConfigWhen when, int argc, const char * argv[], int * pdx)
{
    return(ProcessOptions(cfg, when, argc, (char **) argv, pdx));
}

TEST(ConfigOptions, Defaults)
{
    BConfig cfg;

    InitializeConfig(&cfg);

    EXPECT_EQ(0u, cfg.VerboseFlag);
    EXPECT_EQ((ulong_t) MarkSweepCollector, cfg.CollectorType);
    EXPECT_EQ(16384u, cfg.TriggerObjects);
    EXPECT_EQ(2u, cfg.BridgeThreads);
}

TEST(ConfigOptions, EarlyAndLate)
{
    BConfig cfg;
    int pdx;
    const char * argv[] = {"blink", "--maximum-heap-size", "1000000", "--bridge-threads", "4",
            "--verbose", "script.blk", "--ignored"};

    InitializeConfig(&cfg);
    EXPECT_EQ(1, Process(&cfg, EarlyConfig, 8, argv, &pdx));
    EXPECT_EQ(6, pdx);
    EXPECT_EQ(1000000u, cfg.MaximumHeapSize);
    EXPECT_EQ(4u, cfg.BridgeThreads);
    EXPECT_EQ(1u, cfg.VerboseFlag);

    InitializeConfig(&cfg);
    EXPECT_EQ(1, Process(&cfg, LateConfig, 8, argv, &pdx));
    EXPECT_EQ(6, pdx);
    EXPECT_EQ(2u, cfg.BridgeThreads);
    EXPECT_EQ(1u, cfg.VerboseFlag);
}

TEST(ConfigOptions, EndOfOptions)
{
    BConfig cfg;
    int pdx;
    const char * argv[] = {"blink", "--no-collector", "--", "--verbose"};

    InitializeConfig(&cfg);
    EXPECT_EQ(1, Process(&cfg, EarlyConfig, 4, argv, &pdx));
    EXPECT_EQ(3, pdx);
    EXPECT_EQ((ulong_t) NoCollector, cfg.CollectorType);
    EXPECT_EQ(0u, cfg.VerboseFlag);
}

TEST(ConfigOptions, BadOptions)
{
    BConfig cfg;
    int pdx;
    const char * unknown[] = {"blink", "--frobnicate"};
    const char * missing[] = {"blink", "--trigger-bytes"};
    const char * bad[] = {"blink", "--trigger-bytes", "12x"};

    InitializeConfig(&cfg);
    EXPECT_EQ(0, Process(&cfg, EarlyConfig, 2, unknown, &pdx));
    EXPECT_EQ(0, Process(&cfg, EarlyConfig, 2, missing, &pdx));
    EXPECT_EQ(0, Process(&cfg, EarlyConfig, 3, bad, &pdx));
}

typedef BlinkTest ConfigTest;

TEST_F(ConfigTest, ReadConfig)
{
    BValue cfg = Form({Sym("config")});

    EXPECT_EQ(Num(16384), Eval(Form({Sym("get"), cfg, Quote(Sym("trigger-objects"))})));
    EXPECT_EQ(Sym("mark-sweep"), Eval(Form({Sym("get"), cfg, Quote(Sym("collector"))})));
    EXPECT_EQ(FalseValue, Eval(Form({Sym("get"), cfg, Quote(Sym("verbose"))})));
}

TEST_F(ConfigTest, SetConfig)
{
    EXPECT_EQ(NilValue, Eval(Form({Sym("set-config!"), Quote(Sym("idle-microseconds")), Num(50)})));
    EXPECT_EQ(50u, rt->Config.IdleMicroseconds);

    EXPECT_EQ("option may not be configured now",
            Message(Eval(Form({Sym("set-config!"), Quote(Sym("bridge-threads")), Num(1)}))));
    EXPECT_EQ("option may not be configured now",
            Message(Eval(Form({Sym("set-config!"), Quote(Sym("collector")), Num(1)}))));
    EXPECT_EQ("expected a config option",
            Message(Eval(Form({Sym("set-config!"), Quote(Sym("bogus")), Num(1)}))));
    EXPECT_EQ("expected a boolean",
            Message(Eval(Form({Sym("set-config!"), Quote(Sym("check-heap")), Num(1)}))));
    EXPECT_EQ("expected a non-negative integer",
            Message(Eval(Form({Sym("set-config!"), Quote(Sym("trigger-bytes")), Num(-5)}))));
}

class NoCollectorTest : public BlinkTest
{
protected:

    virtual void Configure(BConfig * cfg)
    {
        cfg->CollectorType = NoCollector;
    }
};

TEST_F(NoCollectorTest, CollectDoesNothing)
{
    BHeapStatistics hs;

    MakeStringC(rt, "kept");
    Collect(rt);
    HeapStatistics(rt, &hs);

    EXPECT_EQ(0u, hs.Collections);
    EXPECT_EQ(Sym("none"), Eval(Form({Sym("get"), Form({Sym("config")}), Quote(Sym("collector"))})));
}
