/*

Blink

*/

#include <stdio.h>
#include <stdlib.h>
#include <math.h>
#include <string>
#include "blink.hpp"

// ---- Write Context ----

class BWriteContext
{
public:

    BWriteContext(BRuntime * rt, std::string & s, int df);

    void Write(BValue v);
    void WriteCh(char ch) {Output += ch;}
    void WriteStringC(const char * s) {Output += s;}
    void WriteString(const char * s, ulong_t sl) {Output.append(s, sl);}

    BRuntime * Runtime;
    std::string & Output;
    int DisplayFlag;
    int First;
};

BWriteContext::BWriteContext(BRuntime * rt, std::string & s, int df) : Output(s)
{
    Runtime = rt;
    DisplayFlag = df;
    First = 1;
}

// Shortest representation which reads back as the same double.

static void WriteNumber(BWriteContext * wctx, double d)
{
    if (isnan(d))
    {
        wctx->WriteStringC("nan");
        return;
    }
    else if (isinf(d))
    {
        wctx->WriteStringC(d < 0 ? "-inf" : "inf");
        return;
    }

    char s[64];
    for (int prec = 15; prec <= 17; prec++)
    {
        snprintf(s, sizeof(s), "%.*g", prec, d);
        if (strtod(s, 0) == d)
            break;
    }

    wctx->WriteStringC(s);
}

static void WriteStringValue(BWriteContext * wctx, BValue str)
{
    BString * s = AsString(str);

    if (wctx->DisplayFlag)
    {
        wctx->WriteString(s->String, s->Length);
        return;
    }

    wctx->WriteCh('"');
    for (ulong_t idx = 0; idx < s->Length; idx++)
    {
        char ch = s->String[idx];

        switch (ch)
        {
        case '"': wctx->WriteStringC("\\\""); break;
        case '\\': wctx->WriteStringC("\\\\"); break;
        case '\n': wctx->WriteStringC("\\n"); break;
        case '\t': wctx->WriteStringC("\\t"); break;
        case '\r': wctx->WriteStringC("\\r"); break;
        default: wctx->WriteCh(ch); break;
        }
    }
    wctx->WriteCh('"');
}

static void WriteMapEntry(BRuntime * rt, BValue key, BValue val, void * ctx)
{
    BWriteContext * wctx = (BWriteContext *) ctx;

    if (wctx->First == 0)
        wctx->WriteStringC(", ");
    wctx->First = 0;

    wctx->Write(key);
    wctx->WriteCh(' ');
    wctx->Write(val);
}

static void WriteSetEntry(BRuntime * rt, BValue key, BValue val, void * ctx)
{
    BWriteContext * wctx = (BWriteContext *) ctx;

    if (wctx->First == 0)
        wctx->WriteCh(' ');
    wctx->First = 0;

    wctx->Write(key);
}

static void WriteName(BWriteContext * wctx, const char * pfx, BValue nam, const char * anon)
{
    wctx->WriteStringC(pfx);
    if (StringP(nam))
        wctx->WriteString(AsString(nam)->String, AsString(nam)->Length);
    else
        wctx->WriteStringC(anon);
    wctx->WriteCh('>');
}

static void WriteObject(BWriteContext * wctx, BValue v)
{
    BRuntime * rt = wctx->Runtime;
    char s[32];

    switch (ObjectTag(v))
    {
    case ListTag:
    {
        BListCursor lc;

        wctx->WriteCh('(');
        for (ListCursorStart(rt, v, &lc); ListCursorDoneP(&lc) == 0; ListCursorNext(&lc))
        {
            wctx->Write(ListCursorValue(&lc));
            if (lc.Remaining > 1)
                wctx->WriteCh(' ');
        }
        wctx->WriteCh(')');
        break;
    }

    case VectorTag:
        wctx->WriteCh('[');
        for (ulong_t idx = 0; idx < VectorLength(v); idx++)
        {
            if (idx > 0)
                wctx->WriteCh(' ');
            wctx->Write(VectorGet(rt, v, idx));
        }
        wctx->WriteCh(']');
        break;

    case MapTag:
    {
        int fst = wctx->First;

        wctx->First = 1;
        wctx->WriteCh('{');
        MapVisit(rt, v, WriteMapEntry, wctx);
        wctx->WriteCh('}');
        wctx->First = fst;
        break;
    }

    case SetTag:
    {
        int fst = wctx->First;

        wctx->First = 1;
        wctx->WriteStringC("#{");
        SetVisit(rt, v, WriteSetEntry, wctx);
        wctx->WriteCh('}');
        wctx->First = fst;
        break;
    }

    case StringTag:
        WriteStringValue(wctx, v);
        break;

    case ErrorTag:
    {
        BError * err = AsError(v);

        wctx->WriteStringC("#<error ");
        wctx->WriteStringC(ErrorKindName(err->Kind));
        wctx->WriteStringC(": ");
        if (StringP(err->Message))
            wctx->WriteString(AsString(err->Message)->String, AsString(err->Message)->Length);
        wctx->WriteCh('>');
        break;
    }

    case FunctionTag:
        WriteName(wctx, "#<fn ", AsFunction(v)->Name, "anonymous");
        break;

    case MacroTag:
        WriteName(wctx, "#<macro ", AsFunction(v)->Name, "anonymous");
        break;

    case FutureTag:
        snprintf(s, sizeof(s), "#<future %u>", AsHandle(v)->Index);
        wctx->WriteStringC(s);
        break;

    case ChannelTag:
        snprintf(s, sizeof(s), "#<chan %u>", AsHandle(v)->Index);
        wctx->WriteStringC(s);
        break;

    case EnvTag:
        wctx->WriteStringC("#<env>");
        break;

    case ModuleTag:
        WriteName(wctx, "#<module ", AsModule(v)->Name, "?");
        break;

    default:
        snprintf(s, sizeof(s), "#<unknown: %u>", (unsigned int) ObjectTag(v));
        wctx->WriteStringC(s);
        break;
    }
}

void BWriteContext::Write(BValue v)
{
    if (NumberP(v))
        WriteNumber(this, AsNumber(v));
    else if (ObjectP(v))
        WriteObject(this, v);
    else
    {
        switch (ValueTag(v))
        {
        case BooleanTag:
            WriteStringC(v == TrueValue ? "true" : "false");
            break;

        case NilTag:
            WriteStringC("nil");
            break;

        case SymbolTag:
            WriteStringC(SymbolName(Runtime, v));
            break;

        case KeywordTag:
            WriteCh(':');
            WriteStringC(SymbolName(Runtime, v));
            break;

        case ModuleIdTag:
            WriteName(this, "#<module ", AsModule(ModuleObject(Runtime, v))->Name, "?");
            break;

        case NativeTag:
            WriteStringC("#<native ");
            WriteStringC(AsNative(v)->Name);
            WriteCh('>');
            break;

        default:
            BAssert(0);
        }
    }
}

void WriteValue(BRuntime * rt, std::string & s, BValue v, int df)
{
    BWriteContext wctx(rt, s, df);

    wctx.Write(v);
}

std::string ValueToString(BRuntime * rt, BValue v, int df)
{
    std::string s;

    WriteValue(rt, s, v, df);
    return(s);
}

std::string FormatError(BRuntime * rt, BValue err)
{
    BAssert(ErrorP(err));

    BError * e = AsError(err);
    std::string s = ErrorKindName(e->Kind);

    s += ": ";
    if (StringP(e->Message))
        s.append(AsString(e->Message)->String, AsString(e->Message)->Length);

    if (e->HasPosition)
    {
        char buf[64];

        snprintf(buf, sizeof(buf), " at %u:%u", e->StartLine, e->StartColumn);
        s += buf;
    }

    return(s);
}

BValue TypeOf(BRuntime * rt, BValue v)
{
    const char * nam;

    if (NumberP(v))
        nam = "number";
    else if (ObjectP(v))
    {
        switch (ObjectTag(v))
        {
        case ListTag: nam = "list"; break;
        case VectorTag: nam = "vector"; break;
        case MapTag: nam = "map"; break;
        case SetTag: nam = "set"; break;
        case StringTag: nam = "string"; break;
        case ErrorTag: nam = "error"; break;
        case FunctionTag: nam = "fn"; break;
        case MacroTag: nam = "macro"; break;
        case FutureTag: nam = "future"; break;
        case ChannelTag: nam = "channel"; break;
        case EnvTag: nam = "env"; break;
        case ModuleTag: nam = "module"; break;
        default: nam = "unknown"; break;
        }
    }
    else
    {
        switch (ValueTag(v))
        {
        case BooleanTag: nam = "boolean"; break;
        case NilTag: nam = "nil"; break;
        case SymbolTag: nam = "symbol"; break;
        case KeywordTag: nam = "keyword"; break;
        case ModuleIdTag: nam = "module"; break;
        case NativeTag: nam = "native"; break;
        default: nam = "unknown"; break;
        }
    }

    return(StringCToKeyword(rt, nam));
}

// ---- Primitives ----

static std::string ArgsToString(BRuntime * rt, long_t argc, BValue argv[], const char * sep)
{
    std::string s;

    for (long_t adx = 0; adx < argc; adx++)
    {
        if (adx > 0)
            s += sep;
        WriteValue(rt, s, argv[adx], 1);
    }

    return(s);
}

Define("print", PrintPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    std::string s = ArgsToString(rt, argc, argv, " ");

    fwrite(s.data(), 1, s.size(), stdout);
    return(NilValue);
}

Define("println", PrintlnPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    std::string s = ArgsToString(rt, argc, argv, " ");

    s += '\n';
    fwrite(s.data(), 1, s.size(), stdout);
    return(NilValue);
}

Define("str", StrPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    std::string s = ArgsToString(rt, argc, argv, "");

    return(MakeString(rt, s.data(), s.size()));
}

Define("pr-str", PrStrPrimitive)(BRuntime * rt, long_t argc, BValue argv[])
{
    std::string s;

    for (long_t adx = 0; adx < argc; adx++)
    {
        if (adx > 0)
            s += ' ';
        WriteValue(rt, s, argv[adx], 0);
    }

    return(MakeString(rt, s.data(), s.size()));
}

static BNative * Primitives[] =
{
    PrintPrimitive,
    PrintlnPrimitive,
    StrPrimitive,
    PrStrPrimitive
};

void SetupWrite(BRuntime * rt)
{
    for (ulong_t idx = 0; idx < sizeof(Primitives) / sizeof(BNative *); idx++)
        DefineNative(rt, CoreModule, Primitives[idx]);
}
