/*

Blink

*/

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <deque>
#include <string>
#include <unordered_map>
#include "blink.hpp"
#include "syncthrd.hpp"

static char FailedMessage[512];

void ErrorExitBlink(const char * what, const char * msg)
{
    printf("\n%s: %s\n", what, msg);
    fflush(stdout);

    exit(1);
}

void BAssertFailed(const char * fn, long_t ln, const char * expr)
{
    snprintf(FailedMessage, sizeof(FailedMessage), "%s (%d)%s", expr, (int) ln, fn);
    ErrorExitBlink("assert", FailedMessage);
}

void BMustBeFailed(const char * fn, long_t ln, const char * expr)
{
    snprintf(FailedMessage, sizeof(FailedMessage), "%s (%d)%s", expr, (int) ln, fn);
    ErrorExitBlink("must-be", FailedMessage);
}

// ---- Symbols ----

struct _BSymbolTable
{
    OSExclusive Exclusive;
    std::unordered_map<std::string, ulong_t> Ids;
    std::deque<std::string> Names;
};

static ulong_t InternName(BRuntime * rt, const char * s)
{
    BSymbolTable * st = rt->Symbols;
    BWithExclusive wx(&st->Exclusive);

    std::unordered_map<std::string, ulong_t>::iterator it = st->Ids.find(s);
    if (it != st->Ids.end())
        return(it->second);

    ulong_t id = st->Names.size();
    st->Names.push_back(s);
    st->Ids[st->Names.back()] = id;

    return(id);
}

BValue StringCToSymbol(BRuntime * rt, const char * s)
{
    return(MakeSymbolValue(InternName(rt, s)));
}

BValue StringCToKeyword(BRuntime * rt, const char * s)
{
    return(MakeKeywordValue(InternName(rt, s)));
}

const char * SymbolName(BRuntime * rt, BValue sym)
{
    BAssert(SymbolP(sym) || KeywordP(sym));

    BSymbolTable * st = rt->Symbols;
    BWithExclusive wx(&st->Exclusive);

    BMustBe(AsPayload(sym) < st->Names.size());

    return(st->Names[AsPayload(sym)].c_str());
}

void SetupSymbols(BRuntime * rt)
{
    rt->Symbols = new BSymbolTable;
    InitializeExclusive(&rt->Symbols->Exclusive);
}

void DeleteSymbols(BRuntime * rt)
{
    DeleteExclusive(&rt->Symbols->Exclusive);
    delete rt->Symbols;
    rt->Symbols = 0;
}

// ---- Strings ----

BValue MakeString(BRuntime * rt, const char * s, ulong_t sl)
{
    BString * str = (BString *) MakeObject(rt, StringTag, sizeof(BString) + sl, 0, "make-string");

    str->Length = sl;
    if (sl > 0)
        memcpy(str->String, s, sl);
    str->String[sl] = 0;

    return(ObjectValue(str));
}

BValue MakeStringC(BRuntime * rt, const char * s)
{
    return(MakeString(rt, s, strlen(s)));
}

int StringEqualP(BValue str1, BValue str2)
{
    BAssert(StringP(str1));
    BAssert(StringP(str2));

    if (AsString(str1)->Length != AsString(str2)->Length)
        return(0);

    return(memcmp(AsString(str1)->String, AsString(str2)->String, AsString(str1)->Length) == 0);
}

ulong_t StringHash(BValue str)
{
    BAssert(StringP(str));

    ulong_t h = 14695981039346656037ULL;
    for (ulong_t idx = 0; idx < AsString(str)->Length; idx++)
    {
        h ^= (uint8_t) AsString(str)->String[idx];
        h *= 1099511628211ULL;
    }

    return(h);
}

// ---- Errors ----

static const char * ErrorKindNames[] =
{
    "tokenizer",
    "parse",
    "undefined-symbol",
    "eval",
    "arity-mismatch",
    "unexpected-token",
    "user-defined"
};

const char * ErrorKindName(ulong_t knd)
{
    BAssert(knd < sizeof(ErrorKindNames) / sizeof(char *));

    if (knd >= sizeof(ErrorKindNames) / sizeof(char *))
        return("unknown");
    return(ErrorKindNames[knd]);
}

static thread_local ulong_t ErrorDepth = 0;

BValue MakeError(BRuntime * rt, ulong_t knd, ulong_t sknd, BValue msg, BValue nam, BValue dat)
{
    BAssert(StringP(msg));
    BAssert(NilP(nam) || StringP(nam));

    if (ErrorDepth > 0)
        ErrorExitBlink("error", "recursive error");
    ErrorDepth += 1;

    BError * err = (BError *) MakeObject(rt, ErrorTag, sizeof(BError), 3, "make-error");
    err->Message = msg;
    err->Data = dat;
    err->Name = nam;
    err->Kind = (uint32_t) knd;
    err->SubKind = (uint32_t) sknd;
    err->Expected = 0;
    err->Got = 0;
    err->HasPosition = 0;

    ErrorDepth -= 1;
    return(ObjectValue(err));
}

BValue MakeTokenizerError(BRuntime * rt, const char * msg)
{
    return(MakeError(rt, TokenizerError, 0, MakeStringC(rt, msg), NilValue, NilValue));
}

BValue MakeParseError(BRuntime * rt, ulong_t sknd, const char * msg)
{
    BAssert(sknd <= InvalidStringParse);

    return(MakeError(rt, ParseError, sknd, MakeStringC(rt, msg), NilValue, NilValue));
}

BValue MakeUndefinedSymbolError(BRuntime * rt, BValue sym)
{
    const char * nam = SymbolName(rt, sym);
    std::string msg = "Undefined symbol: ";
    msg += nam;

    BValue s = MakeStringC(rt, nam);
    return(MakeError(rt, UndefinedSymbolError, 0, MakeStringC(rt, msg.c_str()), s, NilValue));
}

BValue MakeEvalError(BRuntime * rt, const char * msg)
{
    return(MakeError(rt, EvalError, 0, MakeStringC(rt, msg), NilValue, NilValue));
}

BValue MakeArityError(BRuntime * rt, const char * form, ulong_t expected, ulong_t got)
{
    char buf[128];

    snprintf(buf, sizeof(buf), "Wrong number of arguments: expected " ULONG_FMT ", got "
            ULONG_FMT, expected, got);

    BValue s = MakeStringC(rt, form);
    BValue err = MakeError(rt, ArityMismatchError, 0, MakeStringC(rt, buf), s, NilValue);
    AsError(err)->Expected = (uint32_t) expected;
    AsError(err)->Got = (uint32_t) got;

    return(err);
}

BValue MakeUnexpectedTokenError(BRuntime * rt, const char * tok)
{
    std::string msg = "Unexpected token: ";
    msg += tok;

    BValue s = MakeStringC(rt, tok);
    return(MakeError(rt, UnexpectedTokenError, 0, MakeStringC(rt, msg.c_str()), s, NilValue));
}

BValue MakeUserError(BRuntime * rt, BValue msg, BValue dat)
{
    if (StringP(msg) == 0)
        msg = MakeStringC(rt, ValueToString(rt, msg, 1).c_str());

    return(MakeError(rt, UserDefinedError, 0, msg, NilValue, dat));
}

void SetErrorPosition(BValue err, ulong_t sl, ulong_t sc, ulong_t el, ulong_t ec)
{
    BAssert(ErrorP(err));

    AsError(err)->HasPosition = 1;
    AsError(err)->StartLine = (uint32_t) sl;
    AsError(err)->StartColumn = (uint32_t) sc;
    AsError(err)->EndLine = (uint32_t) el;
    AsError(err)->EndColumn = (uint32_t) ec;
}

BValue MakeStaleHandleError(BRuntime * rt, const char * who)
{
    BValue s = MakeStringC(rt, who);
    return(MakeError(rt, EvalError, 0, MakeStringC(rt, "stale handle"), s, NilValue));
}

void Raise(BValue err)
{
    throw err;
}

void RaiseErrorC(BRuntime * rt, const char * who, const char * msg, BValue irritant)
{
    BValue s = MakeStringC(rt, who);
    Raise(MakeError(rt, EvalError, 0, MakeStringC(rt, msg), s, irritant));
}

void RaiseArityError(BRuntime * rt, const char * who, ulong_t expected, ulong_t got)
{
    Raise(MakeArityError(rt, who, expected, got));
}

Define("err", ErrPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneOrTwoArgsCheck(rt, "err", argc);

    return(MakeUserError(rt, argv[0], argc == 2 ? argv[1] : NilValue));
}

Define("error?", ErrorPPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "error?", argc);

    return(MakeBoolean(ErrorP(argv[0])));
}

Define("error-message", ErrorMessagePrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "error-message", argc);
    ErrorArgCheck(rt, "error-message", argv[0]);

    return(AsError(argv[0])->Message);
}

Define("error-kind", ErrorKindPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "error-kind", argc);
    ErrorArgCheck(rt, "error-kind", argv[0]);

    return(StringCToKeyword(rt, ErrorKindName(AsError(argv[0])->Kind)));
}

Define("error-data", ErrorDataPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "error-data", argc);
    ErrorArgCheck(rt, "error-data", argv[0]);

    return(AsError(argv[0])->Data);
}

Define("type-of", TypeOfPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    OneArgCheck(rt, "type-of", argc);

    return(TypeOf(rt, argv[0]));
}

Define("collect", CollectPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    ZeroArgsCheck(rt, "collect", argc);

    // The collection happens at the next safe point, never inside a native.
    rt->GCRequired = 1;
    return(NilValue);
}

static BNative * Primitives[] =
{
    ErrPrimitive,
    ErrorPPrimitive,
    ErrorMessagePrimitive,
    ErrorKindPrimitive,
    ErrorDataPrimitive,
    TypeOfPrimitive,
    CollectPrimitive
};

void SetupBlinkNatives(BRuntime * rt)
{
    for (ulong_t idx = 0; idx < sizeof(Primitives) / sizeof(BNative *); idx++)
        DefineNative(rt, CoreModule, Primitives[idx]);
}

// ---- Runtime ----

BRuntime * MakeRuntime(BConfig * cfg)
{
    BRuntime * rt = new BRuntime;

    memset(rt, 0, sizeof(BRuntime));
    rt->Config = *cfg;

    if (rt->Config.VerboseFlag)
        printf("blink: runtime starting\n");

    SetupCore(rt);
    SetupSymbols(rt);
    SetupMonitors(rt);
    SetupHandles(rt);
    SetupModules(rt);
    SetupEvaluator(rt);
    SetupScheduler(rt);

    SetupBlinkNatives(rt);
    SetupLists(rt);
    SetupVectors(rt);
    SetupHashMaps(rt);
    SetupCompare(rt);
    SetupNumbers(rt);
    SetupWrite(rt);
    SetupFutures(rt);
    SetupSchedulerNatives(rt);
    SetupConfig(rt);

    return(rt);
}

void DeleteRuntime(BRuntime * rt)
{
    if (rt->Config.VerboseFlag)
        printf("blink: runtime stopping\n");

    DeleteScheduler(rt);
    DeleteEvaluator(rt);
    DeleteModules(rt);
    DeleteHandles(rt);
    DeleteMonitors(rt);
    DeleteSymbols(rt);
    DeleteCore(rt);

    delete rt;
}
