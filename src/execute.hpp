/*

Blink

*/

#ifndef __EXECUTE_HPP__
#define __EXECUTE_HPP__

#include <vector>
#include "syncthrd.hpp"

// ---- Frames ----
//
// An evaluation is a stack of frames plus a mode. In EvalMode, Expression is
// evaluated in Environment; in ReturnMode, Value is handed to the top frame.
// Every frame is a point at which a suspended evaluation can be resumed.

typedef enum
{
    // Evaluating the elements of a call left to right; Values collects them.
    // Extra is true for (apply f lst).
    ArgsFrame,

    // (if test then else); the test is being evaluated.
    IfFrame,

    // Evaluating a body; Cursor holds the forms still to run.
    DoFrame,

    // (let [s1 e1 ...] body...); Index is the binding being evaluated, Env
    // grows by one frame per binding, and Extra is the binding vector.
    LetFrame,

    // (and ...) and (or ...); Cursor holds the remaining forms.
    AndFrame,
    OrFrame,

    // (try expr handler); Extra is the handler.
    TryFrame,

    // (def sym expr); Extra is the symbol.
    DefFrame,

    // (deref expr); the expression is being evaluated.
    DerefFrame,

    // A macro body is running; its result is evaluated in Env.
    ExpandFrame,

    // Waiting on the future in Extra; the resumed value passes through.
    AwaitFrame
} BFrameKind;

typedef struct
{
    BFrameKind Kind;
    BValue Form;
    BValue Env;
    BValue Values;
    BValue Extra;
    BListCursor Cursor;
    ulong_t Index;
} BFrame;

typedef enum
{
    EvalMode,
    ReturnMode
} BEvalMode;

struct _BEvalState
{
    BEvalState * Next;
    BEvalState * Previous;

    std::vector<BFrame> Frames;
    BEvalMode Mode;
    BValue Expression;
    BValue Environment;
    BValue Value;
    BValue Pending;
};

void MarkEnvShared(BValue env);

// ---- Handles ----

BFutureState FutureAttachOneshot(BRuntime * rt, BValue fut, BOneshot * os, BValue * pv);
int BridgeComplete(BRuntime * rt, uint32_t idx, uint32_t gen, BValue val, int failed);
int FutureDoneP(BRuntime * rt, BValue fut);

#endif // __EXECUTE_HPP__
