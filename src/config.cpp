/*

Blink

*/

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <stddef.h>
#include "blink.hpp"

// ---- Configuration ----

typedef enum
{
    ULongConfig,
    BoolConfig,
    GetConfig,
    ActionConfig
} BConfigType;

typedef BValue (*BGetConfigFn)(BRuntime * rt);
typedef int (*BActionConfigFn)(BConfig * cfg, BConfigWhen when);

typedef struct
{
    char ShortName;
    char AltShortName;
    const char * LongName;
    const char * AltLongName;
    const char * Argument;
    const char * Description;
    BConfigWhen When;
    BConfigType Type;

    ulong_t Offset;
    BGetConfigFn GetConfigFn;
    BActionConfigFn ActionConfigFn;
} BConfigOption;

#define ConfigField(cfg, opt) ((ulong_t *) (((char *) (cfg)) + (opt)->Offset))

static BValue GetCollector(BRuntime * rt)
{
    if (rt->Config.CollectorType == NoCollector)
        return(StringCToSymbol(rt, "none"));

    BAssert(rt->Config.CollectorType == MarkSweepCollector);

    return(StringCToSymbol(rt, "mark-sweep"));
}

static int SetNoCollector(BConfig * cfg, BConfigWhen when)
{
    cfg->CollectorType = NoCollector;
    return(1);
}

static int SetMarkSweep(BConfig * cfg, BConfigWhen when)
{
    cfg->CollectorType = MarkSweepCollector;
    return(1);
}

// Stops option processing.
static int UsageAction(BConfig * cfg, BConfigWhen when)
{
    ConfigUsage();
    return(0);
}

static int VersionAction(BConfig * cfg, BConfigWhen when)
{
#ifdef BLINK_DEBUG
    printf("Blink " BLINK_VERSION " (debug)\n");
#else // BLINK_DEBUG
    printf("Blink " BLINK_VERSION "\n");
#endif // BLINK_DEBUG

    printf("(c.type-bits (value %u) (pointer %u))\n", (unsigned int) sizeof(BValue) * 8,
            (unsigned int) sizeof(void *) * 8);
    return(1);
}

static BConfigOption ConfigOptions[] =
{
    {0, 0, "verbose", 0, 0,
"        Turn on verbose logging.",
        AnytimeConfig, BoolConfig, offsetof(BConfig, VerboseFlag), 0, 0},
    {'h', '?', "help", "usage", 0,
"        Prints out the usage information.",
        EarlyConfig, ActionConfig, 0, 0, UsageAction},
    {'v', 'V', "version", 0, 0,
"        Prints out version information.",
        EarlyConfig, ActionConfig, 0, 0, VersionAction},

    {0, 0, "collector", 0, 0, 0, NeverConfig, GetConfig, 0, GetCollector, 0},
    {0, 0, "no-collector", 0, 0,
"        No garbage collector.",
        EarlyConfig, ActionConfig, 0, 0, SetNoCollector},
    {0, 0, "mark-sweep", 0, 0,
"        Use the mark and sweep garbage collector.",
        EarlyConfig, ActionConfig, 0, 0, SetMarkSweep},
    {0, 0, "check-heap", 0, 0,
"        Check the heap before and after garbage collection.",
        AnytimeConfig, BoolConfig, offsetof(BConfig, CheckHeapFlag), 0, 0},

    {0, 0, "maximum-heap-size", 0, "number-of-bytes",
"        Use the specified number-of-bytes as the maximum size of the heap.",
        EarlyConfig, ULongConfig, offsetof(BConfig, MaximumHeapSize), 0, 0},
    {0, 0, "trigger-bytes", 0, "number-of-bytes",
"        Trigger garbage collection after at least the specified\n"
"        number-of-bytes have been allocated since the last collection",
        AnytimeConfig, ULongConfig, offsetof(BConfig, TriggerBytes), 0, 0},
    {0, 0, "trigger-objects", 0, "number-of-objects",
"        Trigger garbage collection after at least the specified\n"
"        number-of-objects have been allocated since the last collection",
        AnytimeConfig, ULongConfig, offsetof(BConfig, TriggerObjects), 0, 0},

    {0, 0, "bridge-threads", 0, "number-of-threads",
"        Use the specified number-of-threads for blocking work; zero runs\n"
"        bridge jobs on the submitting thread.",
        EarlyConfig, ULongConfig, offsetof(BConfig, BridgeThreads), 0, 0},
    {0, 0, "idle-microseconds", 0, "microseconds",
"        Sleep for the specified microseconds when no task is ready.",
        AnytimeConfig, ULongConfig, offsetof(BConfig, IdleMicroseconds), 0, 0}
};

void InitializeConfig(BConfig * cfg)
{
    cfg->VerboseFlag = 0;
    cfg->CheckHeapFlag = 0;
    cfg->CollectorType = MarkSweepCollector;
    cfg->MaximumHeapSize = 1024 * 1024 * 1024UL;
    cfg->TriggerObjects = 1024 * 16;
    cfg->TriggerBytes = cfg->TriggerObjects * 64;
    cfg->BridgeThreads = 2;
    cfg->IdleMicroseconds = 100;
}

void ConfigUsage()
{
    printf("Options:\n");

    for (ulong_t cdx = 0; cdx < sizeof(ConfigOptions) / sizeof(BConfigOption); cdx++)
    {
        BConfigOption * opt = ConfigOptions + cdx;

        if (opt->When == NeverConfig || opt->Type == GetConfig)
            continue;

        if (opt->ShortName != 0)
        {
            if (opt->Argument != 0)
                printf("    -%c <%s>\n", opt->ShortName, opt->Argument);
            else
                printf("    -%c\n", opt->ShortName);
        }
        if (opt->AltShortName != 0)
        {
            if (opt->Argument != 0)
                printf("    -%c <%s>\n", opt->AltShortName, opt->Argument);
            else
                printf("    -%c\n", opt->AltShortName);
        }

        if (opt->LongName != 0)
        {
            if (opt->Argument != 0)
                printf("    --%s <%s>\n", opt->LongName, opt->Argument);
            else
                printf("    --%s\n", opt->LongName);
        }
        if (opt->AltLongName != 0)
        {
            if (opt->Argument != 0)
                printf("    --%s <%s>\n", opt->AltLongName, opt->Argument);
            else
                printf("    --%s\n", opt->AltLongName);
        }

        if (opt->Description != 0)
            printf("%s\n", opt->Description);

        printf("\n");
    }

    printf("Notes:\n");
    printf("    Use -- to indicate the end of options.\n\n");
}

static BConfigOption * FindShortName(char sn)
{
    for (ulong_t cdx = 0; cdx < sizeof(ConfigOptions) / sizeof(BConfigOption); cdx++)
        if (ConfigOptions[cdx].When != NeverConfig && ConfigOptions[cdx].Type != GetConfig)
        {
            if (ConfigOptions[cdx].ShortName == sn || ConfigOptions[cdx].AltShortName == sn)
                return(ConfigOptions + cdx);
        }
    return(0);
}

static BConfigOption * FindLongName(const char * ln)
{
    for (ulong_t cdx = 0; cdx < sizeof(ConfigOptions) / sizeof(BConfigOption); cdx++)
        if (ConfigOptions[cdx].When != NeverConfig && ConfigOptions[cdx].Type != GetConfig)
        {
            if (ConfigOptions[cdx].LongName != 0
                    && strcmp(ln, ConfigOptions[cdx].LongName) == 0)
                return(ConfigOptions + cdx);
            else if (ConfigOptions[cdx].AltLongName != 0
                    && strcmp(ln, ConfigOptions[cdx].AltLongName) == 0)
                return(ConfigOptions + cdx);
        }
    return(0);
}

static int ParseULong(const char * s, ulong_t * val)
{
    char * end;

    if (*s < '0' || *s > '9')
        return(0);

    *val = strtoull(s, &end, 10);
    return(*end == 0);
}

int ProcessOptions(BConfig * cfg, BConfigWhen when, int argc, char * argv[], int * pdx)
{
    int adx = 1;

    *pdx = argc;
    while (adx < argc)
    {
        BConfigOption * opt = 0;

        if (argv[adx][0] == '-')
        {
            if (argv[adx][1] == '-')
            {
                if (argv[adx][2] == 0)
                {
                    *pdx = adx + 1;
                    break;
                }

                opt = FindLongName(argv[adx] + 2);
            }
            else if (argv[adx][1] != 0 && argv[adx][2] == 0)
                opt = FindShortName(argv[adx][1]);
        }
        else
        {
            *pdx = adx;
            break;
        }

        if (opt == 0)
        {
            ConfigUsage();
            printf("error: unknown option: %s\n", argv[adx]);
            return(0);
        }

        adx += 1;
        if (opt->Type == ULongConfig)
        {
            if (adx == argc)
            {
                printf("error: expected an argument following %s\n", argv[adx - 1]);
                return(0);
            }
            adx += 1;
        }

        if (opt->When == when || opt->When == AnytimeConfig)
        {
            switch (opt->Type)
            {
            case ULongConfig:
                if (ParseULong(argv[adx - 1], ConfigField(cfg, opt)) == 0)
                {
                    printf("error: expected a number following %s\n", argv[adx - 2]);
                    return(0);
                }
                break;

            case BoolConfig:
                *ConfigField(cfg, opt) = 1;
                break;

            case ActionConfig:
                if (opt->ActionConfigFn(cfg, when) == 0)
                    return(0);
                break;

            case GetConfig:
                BAssert(opt->When == NeverConfig);
                break;
            }
        }
    }

    return(1);
}

// ---- Primitives ----

Define("config", ConfigPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    ZeroArgsCheck(rt, "config", argc);

    BValue ret = MakeMap(rt);

    for (ulong_t idx = 0; idx < sizeof(ConfigOptions) / sizeof(BConfigOption); idx++)
    {
        BConfigOption * opt = ConfigOptions + idx;

        switch (opt->Type)
        {
        case ULongConfig:
            BAssert(opt->LongName != 0);

            MapInsert(rt, ret, StringCToSymbol(rt, opt->LongName),
                    MakeNumber((double) *ConfigField(&rt->Config, opt)));
            break;

        case BoolConfig:
            BAssert(opt->LongName != 0);

            MapInsert(rt, ret, StringCToSymbol(rt, opt->LongName),
                    *ConfigField(&rt->Config, opt) ? TrueValue : FalseValue);
            break;

        case GetConfig:
            BAssert(opt->LongName != 0);

            MapInsert(rt, ret, StringCToSymbol(rt, opt->LongName), opt->GetConfigFn(rt));
            break;

        case ActionConfig:
            break;
        }
    }

    return(ret);
}

Define("set-config!", SetConfigPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    TwoArgsCheck(rt, "set-config!", argc);
    SymbolArgCheck(rt, "set-config!", argv[0]);

    BConfigOption * opt = 0;
    for (ulong_t idx = 0; idx < sizeof(ConfigOptions) / sizeof(BConfigOption); idx++)
    {
        if (ConfigOptions[idx].LongName != 0
                && StringCToSymbol(rt, ConfigOptions[idx].LongName) == argv[0])
        {
            opt = ConfigOptions + idx;
            if (opt->Type != GetConfig)
                break;
        }
    }

    if (opt == 0)
        RaiseErrorC(rt, "set-config!", "expected a config option", argv[0]);

    if (opt->When != AnytimeConfig)
        RaiseErrorC(rt, "set-config!", "option may not be configured now", argv[0]);

    switch (opt->Type)
    {
    case ULongConfig:
        NonNegativeArgCheck(rt, "set-config!", argv[1]);
        *ConfigField(&rt->Config, opt) = (ulong_t) AsNumber(argv[1]);
        break;

    case BoolConfig:
        if (BooleanP(argv[1]) == 0)
            RaiseErrorC(rt, "set-config!", "expected a boolean", argv[1]);

        *ConfigField(&rt->Config, opt) = argv[1] == TrueValue ? 1 : 0;
        break;

    default:
        RaiseErrorC(rt, "set-config!", "option may not be configured now", argv[0]);
        break;
    }

    return(NilValue);
}

static BNative * Primitives[] =
{
    ConfigPrimitive,
    SetConfigPrimitive
};

void SetupConfig(BRuntime * rt)
{
    for (ulong_t idx = 0; idx < sizeof(Primitives) / sizeof(BNative *); idx++)
        DefineNative(rt, CoreModule, Primitives[idx]);
}
