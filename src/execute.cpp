/*

Blink

*/

#include <stdio.h>
#include <vector>
#include "blink.hpp"
#include "execute.hpp"

struct _BEvaluator
{
    OSExclusive Exclusive;
    BEvalState * States;

    BValue QuoteSymbol;
    BValue IfSymbol;
    BValue DefSymbol;
    BValue FnSymbol;
    BValue MacroSymbol;
    BValue DoSymbol;
    BValue LetSymbol;
    BValue AndSymbol;
    BValue OrSymbol;
    BValue TrySymbol;
    BValue CatchSymbol;
    BValue ApplySymbol;
    BValue DerefSymbol;
    BValue GoSymbol;
    BValue QuasiquoteSymbol;
    BValue UnquoteSymbol;
    BValue UnquoteSplicingSymbol;
    BValue ModSymbol;
    BValue ImpSymbol;
    BValue AmpersandSymbol;
};

// ---- Functions ----

BValue MakeFunction(BRuntime * rt, ulong_t tag, BValue params, BValue body, BValue env,
    BValue nam, ulong_t flgs)
{
    BAssert(tag == FunctionTag || tag == MacroTag);
    BAssert(VectorP(params));
    BAssert(ListP(body));
    BAssert(NilP(nam) || StringP(nam));

    BFunction * fn = (BFunction *) MakeObject(rt, tag, sizeof(BFunction), 4,
            tag == FunctionTag ? "fn" : "macro");
    fn->Params = params;
    fn->Body = body;
    fn->Env = env;
    fn->Name = nam;
    fn->Flags = (uint32_t) flgs;
    fn->Arity = (uint32_t) (VectorLength(params) - ((flgs & FUNCTION_VARIADIC) ? 1 : 0));

    return(ObjectValue(fn));
}

// ---- Evaluation States ----

static void VisitEvalStates(BRuntime * rt, BVisitFn visit, void * ctx, void * data)
{
    BEvaluator * ev = (BEvaluator *) data;
    BWithExclusive wx(&ev->Exclusive);

    for (BEvalState * es = ev->States; es != 0; es = es->Next)
    {
        visit(&es->Expression, ctx);
        visit(&es->Environment, ctx);
        visit(&es->Value, ctx);
        visit(&es->Pending, ctx);

        for (ulong_t fdx = 0; fdx < es->Frames.size(); fdx++)
        {
            BFrame * fr = &es->Frames[fdx];

            visit(&fr->Form, ctx);
            visit(&fr->Env, ctx);
            visit(&fr->Values, ctx);
            visit(&fr->Extra, ctx);
            visit(&fr->Cursor.Node, ctx);
        }
    }
}

static BEvalState * MakeEvalState(BRuntime * rt, BValue expr, BValue env)
{
    BEvaluator * ev = rt->Evaluator;
    BEvalState * es = new BEvalState;

    es->Mode = EvalMode;
    es->Expression = expr;
    es->Environment = env;
    es->Value = NilValue;
    es->Pending = NilValue;

    BWithExclusive wx(&ev->Exclusive);

    es->Previous = 0;
    es->Next = ev->States;
    if (ev->States != 0)
        ev->States->Previous = es;
    ev->States = es;

    return(es);
}

static void FreeEvalState(BRuntime * rt, BEvalState * es)
{
    BEvaluator * ev = rt->Evaluator;

    {
        BWithExclusive wx(&ev->Exclusive);

        if (es->Previous != 0)
            es->Previous->Next = es->Next;
        else
        {
            BAssert(ev->States == es);

            ev->States = es->Next;
        }

        if (es->Next != 0)
            es->Next->Previous = es->Previous;
    }

    delete es;
}

static BFrame * PushFrame(BEvalState * es, BFrameKind knd, BValue form, BValue env)
{
    BFrame fr;

    fr.Kind = knd;
    fr.Form = form;
    fr.Env = env;
    fr.Values = NilValue;
    fr.Extra = NilValue;
    fr.Cursor.Node = NilValue;
    fr.Cursor.Remaining = 0;
    fr.Index = 0;

    es->Frames.push_back(fr);
    return(&es->Frames.back());
}

static inline void ReturnValue(BEvalState * es, BValue val)
{
    es->Mode = ReturnMode;
    es->Value = val;
}

static inline void EvalNext(BEvalState * es, BValue expr, BValue env)
{
    es->Mode = EvalMode;
    es->Expression = expr;
    es->Environment = env;
}

static void FormCursor(BRuntime * rt, BValue form, ulong_t skp, BListCursor * lc)
{
    ListCursorStart(rt, form, lc);
    while (skp > 0 && ListCursorDoneP(lc) == 0)
    {
        ListCursorNext(lc);
        skp -= 1;
    }
}

static inline BValue FormArg(BRuntime * rt, BValue form, ulong_t idx)
{
    return(ListNth(rt, form, idx + 1));
}

static inline ulong_t FormArgCount(BValue form)
{
    return(ListLength(form) - 1);
}

// The last form of a body runs without a frame.

static void StartBody(BEvalState * es, BValue form, BListCursor * lc, BValue env)
{
    if (ListCursorDoneP(lc))
    {
        ReturnValue(es, NilValue);
        return;
    }

    BValue expr = ListCursorValue(lc);
    ListCursorNext(lc);

    if (ListCursorDoneP(lc) == 0)
    {
        BFrame * fr = PushFrame(es, DoFrame, form, env);
        fr->Cursor = *lc;
    }

    EvalNext(es, expr, env);
}

void MarkEnvShared(BValue env)
{
    while (EnvP(env))
    {
        MarkShared(env);
        env = AsEnv(env)->Parent;
    }
}

// ---- Quasiquote ----

static BValue CoreNative(BRuntime * rt, const char * nam)
{
    BValue val;

    if (ModuleLookup(rt, CoreModule, StringCToSymbol(rt, nam), &val) == 0)
        Raise(MakeUndefinedSymbolError(rt, StringCToSymbol(rt, nam)));

    return(val);
}

static BValue ExpandQuasiquote(BRuntime * rt, BEvaluator * ev, BValue tpl)
{
    if (ListP(tpl) && ListEmptyP(tpl) == 0)
    {
        BValue hd = ListFirst(rt, tpl);

        if (hd == ev->UnquoteSymbol)
        {
            if (ListLength(tpl) != 2)
                Raise(MakeArityError(rt, "unquote", 1, ListLength(tpl) - 1));

            return(ListNth(rt, tpl, 1));
        }
        else if (hd == ev->UnquoteSplicingSymbol)
            Raise(MakeEvalError(rt, "unquote-splicing must be inside a list"));

        BValue cat = MakeList(rt);
        ListAppend(rt, cat, CoreNative(rt, "concat"));

        BListCursor lc;
        for (ListCursorStart(rt, tpl, &lc); ListCursorDoneP(&lc) == 0; ListCursorNext(&lc))
        {
            BValue elt = ListCursorValue(&lc);

            if (ListP(elt) && ListEmptyP(elt) == 0
                    && ListFirst(rt, elt) == ev->UnquoteSplicingSymbol)
            {
                if (ListLength(elt) != 2)
                    Raise(MakeArityError(rt, "unquote-splicing", 1, ListLength(elt) - 1));

                ListAppend(rt, cat, ListNth(rt, elt, 1));
            }
            else
            {
                BValue part = MakeList(rt);

                ListAppend(rt, part, CoreNative(rt, "list"));
                ListAppend(rt, part, ExpandQuasiquote(rt, ev, elt));
                ListAppend(rt, cat, part);
            }
        }

        return(cat);
    }
    else if (VectorP(tpl))
    {
        BValue app = MakeList(rt);

        ListAppend(rt, app, ev->ApplySymbol);
        ListAppend(rt, app, CoreNative(rt, "vector"));
        ListAppend(rt, app, ExpandQuasiquote(rt, ev, VectorToList(rt, tpl)));

        return(app);
    }
    else if (SymbolP(tpl))
    {
        BValue quo = MakeList(rt);

        ListAppend(rt, quo, ev->QuoteSymbol);
        ListAppend(rt, quo, tpl);

        return(quo);
    }

    return(tpl);
}

// ---- Special Forms ----

static BValue ParseParams(BRuntime * rt, BEvaluator * ev, const char * who, BValue params,
    ulong_t * flgs)
{
    if (VectorP(params) == 0)
        Raise(MakeEvalError(rt, (std::string(who) + " expects a parameter vector").c_str()));

    ulong_t len = VectorLength(params);
    BValue ret = MakeVector(rt, 0, NilValue);

    *flgs = 0;
    for (ulong_t idx = 0; idx < len; idx++)
    {
        BValue sym = VectorGet(rt, params, idx);

        if (sym == ev->AmpersandSymbol)
        {
            if (idx + 2 != len || SymbolP(VectorGet(rt, params, idx + 1)) == 0)
                Raise(MakeEvalError(rt, "& must be followed by exactly one parameter"));

            *flgs = FUNCTION_VARIADIC;
            continue;
        }

        if (SymbolP(sym) == 0)
            Raise(MakeEvalError(rt, (std::string(who) + " parameters must be symbols").c_str()));

        VectorPush(rt, ret, sym);
    }

    return(ret);
}

static void EvalFunction(BRuntime * rt, BEvaluator * ev, BEvalState * es, BValue form,
    BValue env, ulong_t tag)
{
    const char * who = tag == FunctionTag ? "fn" : "macro";
    ulong_t argc = FormArgCount(form);

    if (argc < 1 || (SymbolP(FormArg(rt, form, 0)) && argc < 2))
    {
        ReturnValue(es, MakeArityError(rt, who, 2, argc));
        return;
    }

    BValue nam = NilValue;
    ulong_t pdx = 0;
    if (SymbolP(FormArg(rt, form, 0)))
    {
        nam = MakeStringC(rt, SymbolName(rt, FormArg(rt, form, 0)));
        pdx = 1;
    }

    ulong_t flgs;
    BValue params = ParseParams(rt, ev, who, FormArg(rt, form, pdx), &flgs);
    BValue body = ListDrop(rt, form, pdx + 2);

    ReturnValue(es, MakeFunction(rt, tag, params, body, env, nam, flgs));
}

static void EvalLet(BRuntime * rt, BEvalState * es, BValue form, BValue env)
{
    if (FormArgCount(form) < 1)
    {
        ReturnValue(es, MakeArityError(rt, "let", 1, FormArgCount(form)));
        return;
    }

    BValue bnds = FormArg(rt, form, 0);
    if (VectorP(bnds) == 0)
    {
        ReturnValue(es, MakeEvalError(rt, "let expects a binding vector"));
        return;
    }

    if (VectorLength(bnds) % 2 != 0)
    {
        ReturnValue(es, MakeEvalError(rt, "let requires an even number of binding forms"));
        return;
    }

    for (ulong_t idx = 0; idx < VectorLength(bnds); idx += 2)
        if (SymbolP(VectorGet(rt, bnds, idx)) == 0)
        {
            ReturnValue(es, MakeEvalError(rt, "let binding names must be symbols"));
            return;
        }

    if (VectorLength(bnds) == 0)
    {
        BListCursor lc;

        FormCursor(rt, form, 2, &lc);
        StartBody(es, form, &lc, env);
        return;
    }

    BFrame * fr = PushFrame(es, LetFrame, form, env);
    fr->Extra = bnds;
    fr->Index = 0;

    EvalNext(es, VectorGet(rt, bnds, 1), env);
}

static void EvalImport(BRuntime * rt, BEvalState * es, BValue form, BValue env)
{
    ulong_t argc = FormArgCount(form);

    if (argc < 1 || argc > 2)
    {
        ReturnValue(es, MakeArityError(rt, "imp", 1, argc));
        return;
    }

    BValue nam = FormArg(rt, form, 0);
    if (SymbolP(nam) == 0)
    {
        ReturnValue(es, MakeEvalError(rt, "imp expects a module name"));
        return;
    }

    BValue from = FindModule(rt, SymbolName(rt, nam));
    if (NilP(from))
    {
        std::string msg = "Unknown module: ";
        msg += SymbolName(rt, nam);

        ReturnValue(es, MakeEvalError(rt, msg.c_str()));
        return;
    }

    BValue to = EnvModule(env);
    if (argc == 1)
    {
        ModuleImport(rt, to, from);
        ReturnValue(es, NilValue);
        return;
    }

    BValue syms = FormArg(rt, form, 1);
    if (VectorP(syms) == 0)
    {
        ReturnValue(es, MakeEvalError(rt, "imp expects a vector of symbols"));
        return;
    }

    for (ulong_t idx = 0; idx < VectorLength(syms); idx++)
    {
        BValue sym = VectorGet(rt, syms, idx);
        BValue val;

        if (SymbolP(sym) == 0)
        {
            ReturnValue(es, MakeEvalError(rt, "imp expects a vector of symbols"));
            return;
        }

        if (ModuleLookup(rt, from, sym, &val) == 0)
        {
            ReturnValue(es, MakeUndefinedSymbolError(rt, sym));
            return;
        }

        ModuleDefine(rt, to, sym, val);
    }

    ReturnValue(es, NilValue);
}

static int EvalSpecialForm(BRuntime * rt, BEvalState * es, BValue hd, BValue form, BValue env)
{
    BEvaluator * ev = rt->Evaluator;
    ulong_t argc = FormArgCount(form);
    BListCursor lc;

    if (hd == ev->QuoteSymbol)
    {
        if (argc != 1)
            ReturnValue(es, MakeArityError(rt, "quote", 1, argc));
        else
            ReturnValue(es, FormArg(rt, form, 0));
    }
    else if (hd == ev->IfSymbol)
    {
        if (argc < 2 || argc > 3)
            ReturnValue(es, MakeArityError(rt, "if", 2, argc));
        else
        {
            PushFrame(es, IfFrame, form, env);
            EvalNext(es, FormArg(rt, form, 0), env);
        }
    }
    else if (hd == ev->DefSymbol)
    {
        if (argc != 2)
            ReturnValue(es, MakeArityError(rt, "def", 2, argc));
        else if (SymbolP(FormArg(rt, form, 0)) == 0)
            ReturnValue(es, MakeEvalError(rt, "def expects a symbol"));
        else
        {
            BFrame * fr = PushFrame(es, DefFrame, form, env);
            fr->Extra = FormArg(rt, form, 0);

            EvalNext(es, FormArg(rt, form, 1), env);
        }
    }
    else if (hd == ev->FnSymbol)
        EvalFunction(rt, ev, es, form, env, FunctionTag);
    else if (hd == ev->MacroSymbol)
        EvalFunction(rt, ev, es, form, env, MacroTag);
    else if (hd == ev->DoSymbol)
    {
        FormCursor(rt, form, 1, &lc);
        StartBody(es, form, &lc, env);
    }
    else if (hd == ev->LetSymbol)
        EvalLet(rt, es, form, env);
    else if (hd == ev->AndSymbol || hd == ev->OrSymbol)
    {
        if (argc == 0)
            ReturnValue(es, hd == ev->AndSymbol ? TrueValue : NilValue);
        else
        {
            if (argc > 1)
            {
                BFrame * fr = PushFrame(es, hd == ev->AndSymbol ? AndFrame : OrFrame, form, env);
                FormCursor(rt, form, 2, &fr->Cursor);
            }

            EvalNext(es, FormArg(rt, form, 0), env);
        }
    }
    else if (hd == ev->TrySymbol)
    {
        if (argc != 2)
            ReturnValue(es, MakeArityError(rt, "try", 2, argc));
        else
        {
            BFrame * fr = PushFrame(es, TryFrame, form, env);
            fr->Extra = FormArg(rt, form, 1);

            EvalNext(es, FormArg(rt, form, 0), env);
        }
    }
    else if (hd == ev->ApplySymbol)
    {
        if (argc != 2)
            ReturnValue(es, MakeArityError(rt, "apply", 2, argc));
        else
        {
            BValue vals = MakeVector(rt, 0, NilValue);
            BFrame * fr = PushFrame(es, ArgsFrame, form, env);

            fr->Values = vals;
            fr->Extra = TrueValue;
            FormCursor(rt, form, 2, &fr->Cursor);

            EvalNext(es, FormArg(rt, form, 0), env);
        }
    }
    else if (hd == ev->DerefSymbol)
    {
        if (argc != 1)
            ReturnValue(es, MakeArityError(rt, "deref", 1, argc));
        else
        {
            PushFrame(es, DerefFrame, form, env);
            EvalNext(es, FormArg(rt, form, 0), env);
        }
    }
    else if (hd == ev->GoSymbol)
    {
        if (argc != 1)
            ReturnValue(es, MakeArityError(rt, "go", 1, argc));
        else
        {
            MarkEnvShared(env);

            ulong_t id = SpawnTask(rt, FormArg(rt, form, 0), env);
            ReturnValue(es, TaskFuture(rt, id));
        }
    }
    else if (hd == ev->QuasiquoteSymbol)
    {
        if (argc != 1)
            ReturnValue(es, MakeArityError(rt, "quasiquote", 1, argc));
        else
            EvalNext(es, ExpandQuasiquote(rt, ev, FormArg(rt, form, 0)), env);
    }
    else if (hd == ev->UnquoteSymbol || hd == ev->UnquoteSplicingSymbol)
        ReturnValue(es, MakeEvalError(rt, "unquote outside of quasiquote"));
    else if (hd == ev->ModSymbol)
    {
        if (argc < 1)
            ReturnValue(es, MakeArityError(rt, "mod", 1, argc));
        else if (SymbolP(FormArg(rt, form, 0)) == 0)
            ReturnValue(es, MakeEvalError(rt, "mod expects a module name"));
        else
        {
            BValue mod = FindOrMakeModule(rt, SymbolName(rt, FormArg(rt, form, 0)));

            FormCursor(rt, form, 2, &lc);
            StartBody(es, form, &lc, mod);
        }
    }
    else if (hd == ev->ImpSymbol)
        EvalImport(rt, es, form, env);
    else
        return(0);

    return(1);
}

// ---- Application ----

// Returns true when the evaluation must suspend on the future.

static int AwaitFuture(BRuntime * rt, BEvalState * es, BValue fut, BValue form, const char * who)
{
    if (FutureP(fut) == 0)
    {
        ReturnValue(es, MakeEvalError(rt, "deref can only be used on futures"));
        return(0);
    }

    BValue val = NilValue;
    switch (FuturePoll(rt, fut, &val))
    {
    case FutureReady:
        ReturnValue(es, val);
        return(0);

    case FutureFailed:
        ReturnValue(es, ErrorP(val) ? val : MakeUserError(rt, val, NilValue));
        return(0);

    case FutureStale:
        ReturnValue(es, MakeStaleHandleError(rt, who));
        return(0);

    case FuturePending:
        break;
    }

    BFrame * fr = PushFrame(es, AwaitFrame, form, NilValue);
    fr->Extra = fut;
    es->Pending = fut;

    return(1);
}

// Only valid while a NATIVE_ENV native is running on this thread.

static thread_local BValue CallerEnv = NilValue;

BValue CallerEnvironment()
{
    return(NilP(CallerEnv) ? UserModule : CallerEnv);
}

static int Invoke(BRuntime * rt, BEvalState * es, BValue fn, std::vector<BValue> & args,
    BValue form, BValue env)
{
    if (NativeP(fn))
    {
        BNative * nat = AsNative(fn);
        BValue prev = CallerEnv;
        BValue ret;

        if (nat->Flags & NATIVE_ENV)
            CallerEnv = env;

        try
        {
            ret = nat->Fn(rt, (long_t) args.size(), args.size() > 0 ? &args[0] : 0);
        }
        catch (BValue err)
        {
            ret = err;
        }

        CallerEnv = prev;

        if ((nat->Flags & NATIVE_AWAIT) && FutureP(ret))
            return(AwaitFuture(rt, es, ret, form, nat->Name));

        ReturnValue(es, ret);
        return(0);
    }
    else if (FunctionP(fn))
    {
        BFunction * f = AsFunction(fn);
        ulong_t argc = args.size();

        if ((f->Flags & FUNCTION_VARIADIC) ? argc < f->Arity : argc != f->Arity)
        {
            ReturnValue(es, MakeArityError(rt,
                    StringP(f->Name) ? AsString(f->Name)->String : "fn", f->Arity, argc));
            return(0);
        }

        ulong_t cnt = VectorLength(f->Params);
        BValue env = MakeEnv(rt, f->Env, cnt);

        for (ulong_t idx = 0; idx < f->Arity; idx++)
            EnvBind(rt, env, idx, VectorGet(rt, f->Params, idx), args[idx]);

        if (f->Flags & FUNCTION_VARIADIC)
        {
            BValue rst = MakeListFrom(rt, argc - f->Arity, argc > f->Arity ? &args[f->Arity] : 0);
            EnvBind(rt, env, f->Arity, VectorGet(rt, f->Params, f->Arity), rst);
        }

        BListCursor lc;
        ListCursorStart(rt, f->Body, &lc);
        StartBody(es, f->Body, &lc, env);
        return(0);
    }
    else if (MacroP(fn))
    {
        ReturnValue(es, MakeEvalError(rt, "a macro can not be applied"));
        return(0);
    }

    std::string msg = "Not callable: ";
    WriteValue(rt, msg, fn, 0);
    ReturnValue(es, MakeEvalError(rt, msg.c_str()));

    return(0);
}

static void ExpandMacro(BRuntime * rt, BEvalState * es, BValue mac)
{
    BFunction * m = AsFunction(mac);
    BFrame * fr = &es->Frames.back();
    BValue form = fr->Form;
    BValue raw = ListDrop(rt, form, 1);
    ulong_t argc = ListLength(raw);

    // The macro body runs above this frame; its result is evaluated in Env.
    fr->Kind = ExpandFrame;
    fr->Values = NilValue;
    fr->Cursor.Node = NilValue;
    fr->Cursor.Remaining = 0;

    if ((m->Flags & FUNCTION_VARIADIC) ? argc < m->Arity : argc != m->Arity)
    {
        ReturnValue(es, MakeArityError(rt,
                StringP(m->Name) ? AsString(m->Name)->String : "macro", m->Arity, argc));
        return;
    }

    BValue env = MakeEnv(rt, m->Env, VectorLength(m->Params));
    BListCursor lc;
    ulong_t idx = 0;

    for (ListCursorStart(rt, raw, &lc); idx < m->Arity; ListCursorNext(&lc))
    {
        EnvBind(rt, env, idx, VectorGet(rt, m->Params, idx), ListCursorValue(&lc));
        idx += 1;
    }

    if (m->Flags & FUNCTION_VARIADIC)
        EnvBind(rt, env, m->Arity, VectorGet(rt, m->Params, m->Arity),
                ListDrop(rt, raw, m->Arity));

    ListCursorStart(rt, m->Body, &lc);
    StartBody(es, m->Body, &lc, env);
}

static int ReturnArgs(BRuntime * rt, BEvalState * es)
{
    BFrame * fr = &es->Frames.back();

    VectorPush(rt, fr->Values, es->Value);

    if (fr->Extra != TrueValue && VectorLength(fr->Values) == 1 && MacroP(es->Value))
    {
        ExpandMacro(rt, es, es->Value);
        return(0);
    }

    if (ListCursorDoneP(&fr->Cursor) == 0)
    {
        BValue expr = ListCursorValue(&fr->Cursor);
        ListCursorNext(&fr->Cursor);

        EvalNext(es, expr, fr->Env);
        return(0);
    }

    BValue vals = fr->Values;
    BValue form = fr->Form;
    BValue env = fr->Env;
    int apl = fr->Extra == TrueValue;
    es->Frames.pop_back();

    BValue fn = VectorGet(rt, vals, 0);
    std::vector<BValue> args;

    if (apl)
    {
        BValue lst = VectorGet(rt, vals, 1);

        if (ListP(lst))
        {
            BListCursor lc;
            for (ListCursorStart(rt, lst, &lc); ListCursorDoneP(&lc) == 0; ListCursorNext(&lc))
                args.push_back(ListCursorValue(&lc));
        }
        else if (VectorP(lst))
        {
            for (ulong_t idx = 0; idx < VectorLength(lst); idx++)
                args.push_back(VectorGet(rt, lst, idx));
        }
        else if (NilP(lst) == 0)
        {
            ReturnValue(es, MakeEvalError(rt, "apply expects a list of arguments"));
            return(0);
        }
    }
    else
        for (ulong_t idx = 1; idx < VectorLength(vals); idx++)
            args.push_back(VectorGet(rt, vals, idx));

    return(Invoke(rt, es, fn, args, form, env));
}

static int ReturnStep(BRuntime * rt, BEvalState * es)
{
    BEvaluator * ev = rt->Evaluator;
    BFrame * fr = &es->Frames.back();

    if (ErrorP(es->Value) && fr->Kind != TryFrame)
    {
        es->Frames.pop_back();
        return(0);
    }

    switch (fr->Kind)
    {
    case ArgsFrame:
        return(ReturnArgs(rt, es));

    case IfFrame:
    {
        BValue form = fr->Form;
        BValue env = fr->Env;
        es->Frames.pop_back();

        if (TruthyP(es->Value))
            EvalNext(es, FormArg(rt, form, 1), env);
        else if (FormArgCount(form) == 3)
            EvalNext(es, FormArg(rt, form, 2), env);
        else
            ReturnValue(es, NilValue);
        break;
    }

    case DoFrame:
    {
        BValue expr = ListCursorValue(&fr->Cursor);
        BValue env = fr->Env;

        ListCursorNext(&fr->Cursor);
        if (ListCursorDoneP(&fr->Cursor))
            es->Frames.pop_back();

        EvalNext(es, expr, env);
        break;
    }

    case LetFrame:
    {
        BValue bnds = fr->Extra;
        BValue env = MakeEnv(rt, fr->Env, 1);

        EnvBind(rt, env, 0, VectorGet(rt, bnds, fr->Index), es->Value);
        fr->Env = env;
        fr->Index += 2;

        if (fr->Index < VectorLength(bnds))
            EvalNext(es, VectorGet(rt, bnds, fr->Index + 1), env);
        else
        {
            BValue form = fr->Form;
            BListCursor lc;

            es->Frames.pop_back();
            FormCursor(rt, form, 2, &lc);
            StartBody(es, form, &lc, env);
        }
        break;
    }

    case AndFrame:
    case OrFrame:
    {
        int done = fr->Kind == AndFrame ? TruthyP(es->Value) == 0 : TruthyP(es->Value);

        if (done || ListCursorDoneP(&fr->Cursor))
            es->Frames.pop_back();
        else
        {
            BValue expr = ListCursorValue(&fr->Cursor);
            BValue env = fr->Env;

            ListCursorNext(&fr->Cursor);
            if (ListCursorDoneP(&fr->Cursor))
                es->Frames.pop_back();

            EvalNext(es, expr, env);
        }
        break;
    }

    case TryFrame:
    {
        BValue hdlr = fr->Extra;
        BValue env = fr->Env;
        es->Frames.pop_back();

        if (ErrorP(es->Value) == 0)
            break;

        if (ListP(hdlr) && ListLength(hdlr) >= 2 && ListFirst(rt, hdlr) == ev->CatchSymbol)
        {
            BValue sym = ListNth(rt, hdlr, 1);
            if (SymbolP(sym) == 0)
            {
                ReturnValue(es, MakeEvalError(rt, "catch expects a symbol"));
                break;
            }

            BValue cenv = MakeEnv(rt, env, 1);
            BListCursor lc;

            EnvBind(rt, cenv, 0, sym, es->Value);
            FormCursor(rt, hdlr, 2, &lc);
            StartBody(es, hdlr, &lc, cenv);
        }
        else
            EvalNext(es, hdlr, env);
        break;
    }

    case DefFrame:
    {
        BValue sym = fr->Extra;
        BValue env = fr->Env;
        es->Frames.pop_back();

        if ((FunctionP(es->Value) || MacroP(es->Value)) && NilP(AsFunction(es->Value)->Name))
            ModifyObject(rt, es->Value, 3, MakeStringC(rt, SymbolName(rt, sym)));

        ModuleDefine(rt, EnvModule(env), sym, es->Value);
        break;
    }

    case DerefFrame:
    {
        BValue form = fr->Form;
        es->Frames.pop_back();

        return(AwaitFuture(rt, es, es->Value, form, "deref"));
    }

    case ExpandFrame:
    {
        BValue env = fr->Env;
        es->Frames.pop_back();

        EvalNext(es, es->Value, env);
        break;
    }

    case AwaitFrame:
        es->Frames.pop_back();
        break;
    }

    return(0);
}

static void EvalStep(BRuntime * rt, BEvalState * es)
{
    BValue expr = es->Expression;
    BValue env = es->Environment;

    if (SymbolP(expr))
    {
        BValue val;

        if (EnvLookup(rt, env, expr, &val))
            ReturnValue(es, val);
        else
            ReturnValue(es, MakeUndefinedSymbolError(rt, expr));
    }
    else if (ListP(expr) && ListEmptyP(expr) == 0)
    {
        BValue hd = ListFirst(rt, expr);

        if (SymbolP(hd) && EvalSpecialForm(rt, es, hd, expr, env))
            return;

        BValue vals = MakeVector(rt, 0, NilValue);
        BFrame * fr = PushFrame(es, ArgsFrame, expr, env);

        fr->Values = vals;
        FormCursor(rt, expr, 1, &fr->Cursor);

        EvalNext(es, hd, env);
    }
    else
        ReturnValue(es, expr);
}

static BEvalResult Run(BRuntime * rt, BEvalState * es)
{
    BEvalResult er;

    for (;;)
    {
        SafePoint(rt);

        if (es->Mode == ReturnMode && es->Frames.size() == 0)
        {
            er.Suspended = 0;
            er.Value = es->Value;
            er.Pending = NilValue;
            er.Resume = 0;

            FreeEvalState(rt, es);
            return(er);
        }

        try
        {
            if (es->Mode == EvalMode)
                EvalStep(rt, es);
            else if (ReturnStep(rt, es))
            {
                er.Suspended = 1;
                er.Value = NilValue;
                er.Pending = es->Pending;
                er.Resume = es;

                return(er);
            }
        }
        catch (BValue err)
        {
            ReturnValue(es, err);
        }
    }
}

BEvalResult Evaluate(BRuntime * rt, BValue expr, BValue env)
{
    BAssert(EnvP(env) || ModuleIdP(env));

    return(Run(rt, MakeEvalState(rt, expr, env)));
}

BEvalResult ResumeEval(BRuntime * rt, BEvalState * es, BValue val)
{
    BAssert(es->Frames.size() > 0);
    BAssert(es->Frames.back().Kind == AwaitFrame);

    es->Pending = NilValue;
    ReturnValue(es, val);

    return(Run(rt, es));
}

void DropEvalState(BRuntime * rt, BEvalState * es)
{
    FreeEvalState(rt, es);
}

BValue EvaluateBlocking(BRuntime * rt, BValue expr, BValue env)
{
    BEvalResult er = Evaluate(rt, expr, env);

    while (er.Suspended)
    {
        BValue val = NilValue;
        BFutureState fs;

        // The pending future stays rooted by the saved state.
        while ((fs = FuturePoll(rt, er.Pending, &val)) == FuturePending)
            SchedulerStep(rt);

        if (fs == FutureStale)
            val = MakeStaleHandleError(rt, "deref");
        else if (fs == FutureFailed && ErrorP(val) == 0)
            val = MakeUserError(rt, val, NilValue);

        er = ResumeEval(rt, er.Resume, val);
    }

    return(er.Value);
}

// ---- Setup ----

void SetupEvaluator(BRuntime * rt)
{
    BEvaluator * ev = new BEvaluator;

    InitializeExclusive(&ev->Exclusive);
    ev->States = 0;

    ev->QuoteSymbol = StringCToSymbol(rt, "quote");
    ev->IfSymbol = StringCToSymbol(rt, "if");
    ev->DefSymbol = StringCToSymbol(rt, "def");
    ev->FnSymbol = StringCToSymbol(rt, "fn");
    ev->MacroSymbol = StringCToSymbol(rt, "macro");
    ev->DoSymbol = StringCToSymbol(rt, "do");
    ev->LetSymbol = StringCToSymbol(rt, "let");
    ev->AndSymbol = StringCToSymbol(rt, "and");
    ev->OrSymbol = StringCToSymbol(rt, "or");
    ev->TrySymbol = StringCToSymbol(rt, "try");
    ev->CatchSymbol = StringCToSymbol(rt, "catch");
    ev->ApplySymbol = StringCToSymbol(rt, "apply");
    ev->DerefSymbol = StringCToSymbol(rt, "deref");
    ev->GoSymbol = StringCToSymbol(rt, "go");
    ev->QuasiquoteSymbol = StringCToSymbol(rt, "quasiquote");
    ev->UnquoteSymbol = StringCToSymbol(rt, "unquote");
    ev->UnquoteSplicingSymbol = StringCToSymbol(rt, "unquote-splicing");
    ev->ModSymbol = StringCToSymbol(rt, "mod");
    ev->ImpSymbol = StringCToSymbol(rt, "imp");
    ev->AmpersandSymbol = StringCToSymbol(rt, "&");

    rt->Evaluator = ev;
    RegisterRootEnumerator(rt, VisitEvalStates, ev);
}

void DeleteEvaluator(BRuntime * rt)
{
    BEvaluator * ev = rt->Evaluator;

    while (ev->States != 0)
    {
        BEvalState * es = ev->States;

        ev->States = es->Next;
        delete es;
    }

    DeleteExclusive(&ev->Exclusive);
    delete ev;
    rt->Evaluator = 0;
}
