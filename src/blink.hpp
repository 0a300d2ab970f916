/*

Blink

*/

#ifndef __BLINK_HPP__
#define __BLINK_HPP__

#define BLINK_VERSION "0.1"

#include <stdint.h>
#include <string.h>
#include <atomic>
#include <string>

#ifdef BLINK_UNIX
#include <pthread.h>

#define BALIGN __attribute__ ((aligned(8)))
#endif // BLINK_UNIX

typedef int64_t long_t;
typedef uint64_t ulong_t;

#define MAXIMUM_ULONG ((ulong_t) 0xFFFFFFFFFFFFFFFF)

#define LONG_FMT "%ld"
#define ULONG_FMT "%lu"

#ifdef BLINK_DEBUG
void BAssertFailed(const char * fn, long_t ln, const char * expr);
#define BAssert(expr)\
    if (! (expr)) BAssertFailed( __FILE__, __LINE__, #expr)
#else // BLINK_DEBUG
#define BAssert(expr)
#endif // BLINK_DEBUG

void BMustBeFailed(const char * fn, long_t ln, const char * expr);
#define BMustBe(expr)\
    if (! (expr)) BMustBeFailed(__FILE__, __LINE__, #expr)

void ErrorExitBlink(const char * what, const char * msg);

//
// ---- Values ----
//
// A value is a NaN-boxed 64 bit word. Anything that is not a quiet NaN with a
// nonzero tag in the low three bits is a double.
//

typedef uint64_t BValue;

#define VALUE_QNAN ((BValue) 0x7FF8000000000000ULL)
#define VALUE_BOX_MASK ((BValue) 0xFFF8000000000000ULL)
#define VALUE_TAG_MASK ((BValue) 0x7)
#define VALUE_PAYLOAD_MASK ((BValue) 0x0007FFFFFFFFFFF8ULL)
#define VALUE_PAYLOAD_BITS 48

typedef enum
{
    NumberTag = 0,
    BooleanTag = 1,
    SymbolTag = 2,
    NilTag = 3,
    KeywordTag = 4,
    ModuleIdTag = 5,
    ObjectRefTag = 6,
    NativeTag = 7
} BValueTag;

#define ValueTag(v) ((ulong_t) ((v) & VALUE_TAG_MASK))
#define BoxedP(v) (((v) & VALUE_BOX_MASK) == VALUE_QNAN && ValueTag(v) != NumberTag)
#define ImmediateP(v, tag) (((v) & VALUE_BOX_MASK) == VALUE_QNAN && ValueTag(v) == (tag))
#define MakeImmediate(n, tag) (VALUE_QNAN | (((BValue) (n)) << 3) | (BValue) (tag))
#define AsPayload(v) ((ulong_t) (((v) & VALUE_PAYLOAD_MASK) >> 3))

inline int NumberP(BValue v)
{
    return(BoxedP(v) == 0);
}

inline BValue MakeNumber(double d)
{
    if (d != d)
        return(VALUE_QNAN);

    BValue v;
    memcpy(&v, &d, sizeof(BValue));
    return(v);
}

inline double AsNumber(BValue v)
{
    BAssert(NumberP(v));

    double d;
    memcpy(&d, &v, sizeof(double));
    return(d);
}

#define NilValue MakeImmediate(0, NilTag)
#define FalseValue MakeImmediate(0, BooleanTag)
#define TrueValue MakeImmediate(1, BooleanTag)

#define NilP(v) ((v) == NilValue)
#define BooleanP(v) ImmediateP(v, BooleanTag)
#define MakeBoolean(b) ((b) ? TrueValue : FalseValue)
#define TruthyP(v) ((v) != NilValue && (v) != FalseValue)

#define SymbolP(v) ImmediateP(v, SymbolTag)
#define MakeSymbolValue(id) MakeImmediate(id, SymbolTag)
#define AsSymbolId(v) AsPayload(v)

#define KeywordP(v) ImmediateP(v, KeywordTag)
#define MakeKeywordValue(id) MakeImmediate(id, KeywordTag)
#define AsKeywordId(v) AsPayload(v)

#define ModuleIdP(v) ImmediateP(v, ModuleIdTag)
#define MakeModuleValue(id) MakeImmediate(id, ModuleIdTag)
#define AsModuleId(v) AsPayload(v)

#define ObjectP(v) ImmediateP(v, ObjectRefTag)
#define AsObject(v) ((void *) ((v) & VALUE_PAYLOAD_MASK))

inline BValue ObjectValue(void * obj)
{
    BAssert(((ulong_t) obj & VALUE_TAG_MASK) == 0);
    BAssert(((ulong_t) obj & ~VALUE_PAYLOAD_MASK) == 0);

    return(VALUE_QNAN | (BValue) obj | ObjectRefTag);
}

//
// ---- Object Header ----
//

#define OBJHDR_MARK 0x01
#define OBJHDR_CHECK_MARK 0x02
#define OBJHDR_SHARED 0x04
#define OBJHDR_FLAGS_MASK 0xFFFFFFFF

typedef enum
{
    // Zero is not a valid tag.

    ListTag = 1,
    ListNodeTag,
    VectorTag,
    VectorDataTag,
    MapTag,
    MapTableTag,
    SetTag,
    SetTableTag,
    StringTag,
    ErrorTag,
    FunctionTag,
    MacroTag,
    FutureTag,
    ChannelTag,
    EnvTag,
    ModuleTag,
    FreeTag, // Only on objects in the free lists.
    BadDogTag // Invalid tag.
} BObjectTag;

typedef struct
{
    uint64_t GCWord;
    uint8_t Tag;
    uint8_t Pad[3];
    uint32_t TotalSize;
    std::atomic<uint64_t> SyncWord;

    ulong_t SlotCount() {return((ulong_t) (GCWord >> 32));}
    ulong_t ObjectSize() {return(TotalSize - sizeof(*this));}
    BValue * Slots() {return((BValue *) (this + 1));}
} BObjHdr;

#define AsObjHdr(obj) (((BObjHdr *) (obj)) - 1)

inline ulong_t ObjectTag(BValue v)
{
    if (ObjectP(v) == 0)
        return(0);
    return(AsObjHdr(AsObject(v))->Tag);
}

inline int SharedP(BValue v)
{
    return(ObjectP(v) && (AsObjHdr(AsObject(v))->GCWord & OBJHDR_SHARED) != 0);
}

//
// ---- Runtime ----
//

typedef enum
{
    NoCollector,
    MarkSweepCollector
} BCollectorType;

typedef struct
{
    ulong_t VerboseFlag;
    ulong_t CheckHeapFlag;
    ulong_t CollectorType;
    ulong_t MaximumHeapSize;
    ulong_t TriggerObjects;
    ulong_t TriggerBytes;
    ulong_t BridgeThreads;
    ulong_t IdleMicroseconds;
} BConfig;

typedef struct _BHeap BHeap;
typedef struct _BSymbolTable BSymbolTable;
typedef struct _BModuleTable BModuleTable;
typedef struct _BMonitorTable BMonitorTable;
typedef struct _BHandleTable BHandleTable;
typedef struct _BEvaluator BEvaluator;
typedef struct _BScheduler BScheduler;
typedef struct _BBridge BBridge;

typedef struct _BRuntime
{
    BConfig Config;

    volatile long_t GCRequired;

    BHeap * Heap;
    BSymbolTable * Symbols;
    BModuleTable * Modules;
    BMonitorTable * Monitors;
    BHandleTable * Handles;
    BEvaluator * Evaluator;
    BScheduler * Scheduler;
    BBridge * Bridge;
} BRuntime;

BRuntime * MakeRuntime(BConfig * cfg);
void DeleteRuntime(BRuntime * rt);

//
// ---- Memory Management ----
//

class BAlive;

typedef struct _BAllocContext
{
    struct _BAllocContext * Next;
    struct _BAllocContext * Previous;

    BRuntime * Runtime;
    pthread_t Thread;
    BAlive * AliveList;

    ulong_t ObjectsSinceLast;
    ulong_t BytesSinceLast;
    ulong_t BarrierCount;
} BAllocContext;

BAllocContext * GetAllocContext(BRuntime * rt);
BAllocContext * CurrentAllocContext(BRuntime * rt);
void LeaveRuntime(BRuntime * rt);

void * MakeObject(BRuntime * rt, ulong_t tag, ulong_t sz, ulong_t sc, const char * who);
void ModifyObject(BRuntime * rt, BValue obj, ulong_t idx, BValue val);
void WriteBarrier(BRuntime * rt, BValue obj, BValue val);

typedef void (*BVisitFn)(BValue * pv, void * ctx);
typedef void (*BRootEnumFn)(BRuntime * rt, BVisitFn visit, void * ctx, void * data);

void RegisterRoot(BRuntime * rt, BValue * root, const char * name);
void UnregisterRoot(BRuntime * rt, BValue * root);
void RegisterRootEnumerator(BRuntime * rt, BRootEnumFn fn, void * data);

void EnterWait(BRuntime * rt);
void LeaveWait(BRuntime * rt);
void ReadyForGC(BRuntime * rt);
void Collect(BRuntime * rt);
void CheckHeap(BRuntime * rt, const char * fn, int ln);

inline void SafePoint(BRuntime * rt)
{
    if (rt->GCRequired)
        ReadyForGC(rt);
}

typedef struct
{
    ulong_t Collections;
    ulong_t LiveObjects;
    ulong_t LiveBytes;
    ulong_t BytesAllocated;
    ulong_t BarrierCount;
    ulong_t CheckFailures;
} BHeapStatistics;

void HeapStatistics(BRuntime * rt, BHeapStatistics * hs);

class BAlive
{
public:

    BAlive(BRuntime * rt, BValue * ptr);
    ~BAlive();

    BAlive * Next;
    BValue * Pointer;

private:

    BAllocContext * Context;
};

//
// ---- Errors ----
//

typedef enum
{
    TokenizerError = 0,
    ParseError = 1,
    UndefinedSymbolError = 2,
    EvalError = 3,
    ArityMismatchError = 4,
    UnexpectedTokenError = 5,
    UserDefinedError = 6
} BErrorKind;

typedef enum
{
    UnexpectedEofParse = 0,
    UnclosedDelimiterParse = 1,
    UnexpectedTokenParse = 2,
    InvalidNumberParse = 3,
    InvalidStringParse = 4
} BParseKind;

#define ErrorP(v) (ObjectTag(v) == ErrorTag)
#define AsError(v) ((BError *) AsObject(v))

typedef struct
{
    BValue Message;
    BValue Data;
    BValue Name;
    uint32_t Kind;
    uint32_t SubKind;
    uint32_t Expected;
    uint32_t Got;
    uint32_t HasPosition;
    uint32_t StartLine;
    uint32_t StartColumn;
    uint32_t EndLine;
    uint32_t EndColumn;
    uint32_t Pad;
} BError;

BValue MakeError(BRuntime * rt, ulong_t knd, ulong_t sknd, BValue msg, BValue nam, BValue dat);
BValue MakeTokenizerError(BRuntime * rt, const char * msg);
BValue MakeParseError(BRuntime * rt, ulong_t sknd, const char * msg);
BValue MakeUndefinedSymbolError(BRuntime * rt, BValue sym);
BValue MakeEvalError(BRuntime * rt, const char * msg);
BValue MakeArityError(BRuntime * rt, const char * form, ulong_t expected, ulong_t got);
BValue MakeUnexpectedTokenError(BRuntime * rt, const char * tok);
BValue MakeUserError(BRuntime * rt, BValue msg, BValue dat);
void SetErrorPosition(BValue err, ulong_t sl, ulong_t sc, ulong_t el, ulong_t ec);
BValue MakeStaleHandleError(BRuntime * rt, const char * who);
const char * ErrorKindName(ulong_t knd);

void Raise(BValue err);
void RaiseErrorC(BRuntime * rt, const char * who, const char * msg, BValue irritant);
void RaiseArityError(BRuntime * rt, const char * who, ulong_t expected, ulong_t got);

//
// ---- Symbols ----
//

BValue StringCToSymbol(BRuntime * rt, const char * s);
BValue StringCToKeyword(BRuntime * rt, const char * s);
const char * SymbolName(BRuntime * rt, BValue sym);

//
// ---- Strings ----
//

#define StringP(v) (ObjectTag(v) == StringTag)
#define AsString(v) ((BString *) AsObject(v))

typedef struct
{
    ulong_t Length;
    char String[1];
} BString;

BValue MakeString(BRuntime * rt, const char * s, ulong_t sl);
BValue MakeStringC(BRuntime * rt, const char * s);
inline ulong_t StringLength(BValue str) {BAssert(StringP(str)); return(AsString(str)->Length);}
int StringEqualP(BValue str1, BValue str2);
ulong_t StringHash(BValue str);

//
// ---- Lists ----
//

#define LIST_HAS_HEAD 0x1
#define LIST_HAS_TAIL 0x2
#define NODE_HAS_NEXT 0x1

#define ListP(v) (ObjectTag(v) == ListTag)
#define AsList(v) ((BList *) AsObject(v))
#define ListNodeP(v) (ObjectTag(v) == ListNodeTag)
#define AsListNode(v) ((BListNode *) AsObject(v))

typedef struct
{
    BValue Head;
    BValue Tail;
    uint32_t Length;
    uint32_t Flags;
} BList;

typedef struct
{
    BValue Value;
    BValue Next;
    ulong_t Flags;
} BListNode;

BValue MakeList(BRuntime * rt);
BValue MakeListFrom(BRuntime * rt, ulong_t argc, BValue * argv);
void ListPrepend(BRuntime * rt, BValue lst, BValue val);
void ListAppend(BRuntime * rt, BValue lst, BValue val);
BValue ListFirst(BRuntime * rt, BValue lst);
BValue ListLast(BRuntime * rt, BValue lst);
BValue ListPopFront(BRuntime * rt, BValue lst);
BValue ListPopBack(BRuntime * rt, BValue lst);
BValue ListRest(BRuntime * rt, BValue lst);
BValue ListDrop(BRuntime * rt, BValue lst, ulong_t cnt);
BValue ListNth(BRuntime * rt, BValue lst, ulong_t idx);
BValue ListToVector(BRuntime * rt, BValue lst);
BValue ListConcat(BRuntime * rt, BValue lst1, BValue lst2);
void ListClear(BRuntime * rt, BValue lst);

inline ulong_t ListLength(BValue lst)
{
    BAssert(ListP(lst));

    return(AsList(lst)->Length);
}

inline int ListEmptyP(BValue lst)
{
    return(ListLength(lst) == 0);
}

// Walks at most Remaining nodes; the has-next flag is not consulted.

typedef struct
{
    BValue Node;
    ulong_t Remaining;
} BListCursor;

void ListCursorStart(BRuntime * rt, BValue lst, BListCursor * lc);

inline int ListCursorDoneP(BListCursor * lc)
{
    return(lc->Remaining == 0);
}

inline BValue ListCursorValue(BListCursor * lc)
{
    BAssert(lc->Remaining > 0);
    BAssert(ListNodeP(lc->Node));

    return(AsListNode(lc->Node)->Value);
}

inline void ListCursorNext(BListCursor * lc)
{
    BAssert(lc->Remaining > 0);

    lc->Remaining -= 1;
    if (lc->Remaining > 0)
        lc->Node = AsListNode(lc->Node)->Next;
    else
        lc->Node = NilValue;
}

//
// ---- Vectors ----
//

#define VectorP(v) (ObjectTag(v) == VectorTag)
#define AsVector(v) ((BVector *) AsObject(v))
#define AsVectorData(v) ((BValue *) AsObject(v))

typedef struct
{
    BValue Data;
    uint32_t Length;
    uint32_t Capacity;
} BVector;

BValue MakeVector(BRuntime * rt, ulong_t len, BValue fill);
BValue MakeVectorFrom(BRuntime * rt, ulong_t argc, BValue * argv);
BValue VectorGet(BRuntime * rt, BValue vec, ulong_t idx);
void VectorSet(BRuntime * rt, BValue vec, ulong_t idx, BValue val);
void VectorPush(BRuntime * rt, BValue vec, BValue val);
BValue VectorPop(BRuntime * rt, BValue vec);
void VectorResize(BRuntime * rt, BValue vec, ulong_t len, BValue fill);
BValue VectorToList(BRuntime * rt, BValue vec);

inline ulong_t VectorLength(BValue vec)
{
    BAssert(VectorP(vec));

    return(AsVector(vec)->Length);
}

inline ulong_t VectorCapacity(BValue vec)
{
    BAssert(VectorP(vec));

    return(AsVector(vec)->Capacity);
}

//
// ---- Hash Maps and Sets ----
//

#define HASH_SMALL_SLOTS 4
#define HASH_MINIMUM_CAPACITY 8

#define CTRL_EMPTY 0x80
#define CTRL_DELETED 0xFE

#define HASH_SMALL_MODE 0
#define HASH_LARGE_MODE 1

#define MapP(v) (ObjectTag(v) == MapTag)
#define AsMap(v) ((BMap *) AsObject(v))
#define SetP(v) (ObjectTag(v) == SetTag)
#define AsSet(v) ((BSet *) AsObject(v))

typedef struct
{
    uint32_t Length;
    uint32_t Capacity;
    uint32_t Deleted;
    uint8_t Mode;
    uint8_t Occupied[HASH_SMALL_SLOTS];
    uint8_t Pad[3];
} BHashInfo;

typedef struct
{
    BValue Table;
    BValue Keys[HASH_SMALL_SLOTS];
    BValue Values[HASH_SMALL_SLOTS];
    BHashInfo Info;
} BMap;

typedef struct
{
    BValue Table;
    BValue Keys[HASH_SMALL_SLOTS];
    BHashInfo Info;
} BSet;

BValue MakeMap(BRuntime * rt);
BValue MapGet(BRuntime * rt, BValue map, BValue key, BValue def);
int MapContainsP(BRuntime * rt, BValue map, BValue key);
void MapInsert(BRuntime * rt, BValue map, BValue key, BValue val);
int MapRemove(BRuntime * rt, BValue map, BValue key);
ulong_t MapLength(BValue map);
ulong_t MapCapacity(BValue map);
ulong_t MapDeleted(BValue map);
int MapLargeModeP(BValue map);

typedef void (*BFoldFn)(BRuntime * rt, BValue key, BValue val, void * ctx);
void MapVisit(BRuntime * rt, BValue map, BFoldFn fn, void * ctx);

BValue MakeSet(BRuntime * rt);
int SetContainsP(BRuntime * rt, BValue set, BValue key);
void SetInsert(BRuntime * rt, BValue set, BValue key);
int SetRemove(BRuntime * rt, BValue set, BValue key);
ulong_t SetLength(BValue set);
ulong_t SetCapacity(BValue set);
int SetLargeModeP(BValue set);
void SetVisit(BRuntime * rt, BValue set, BFoldFn fn, void * ctx);

//
// ---- Equality and Hashing ----
//

int EqualKeysP(BValue key1, BValue key2);
int EqualP(BRuntime * rt, BValue obj1, BValue obj2);
ulong_t HashValue(BValue key);
ulong_t IdentityHash(void * obj);

//
// ---- Object Synchronization ----
//

typedef enum
{
    SyncUnlocked = 0,
    SyncThin = 1,
    SyncInflated = 2,
    SyncHashed = 3
} BSyncState;

void MarkShared(BValue obj);
void LockObject(BRuntime * rt, BValue obj);
void UnlockObject(BRuntime * rt, BValue obj);
int TryLockObject(BRuntime * rt, BValue obj);
BSyncState LockState(BValue obj);
ulong_t LockOwner(BRuntime * rt, BValue obj);
ulong_t LockRecursion(BRuntime * rt, BValue obj);
ulong_t ObjectIdentityHash(BRuntime * rt, BValue obj);
ulong_t CurrentOwnerId();
void SetCurrentTask(ulong_t id);
ulong_t ActiveMonitorCount(BRuntime * rt);
void ReleaseObjectSync(BRuntime * rt, BObjHdr * oh);

class BObjectLock
{
public:

    BObjectLock(BRuntime * rt, BValue obj);
    ~BObjectLock();

private:

    BRuntime * Runtime;
    BValue Object;
    int Locked;
};

//
// ---- Functions, Macros, and Natives ----
//

#define FUNCTION_VARIADIC 0x1

#define FunctionP(v) (ObjectTag(v) == FunctionTag)
#define MacroP(v) (ObjectTag(v) == MacroTag)
#define AsFunction(v) ((BFunction *) AsObject(v))

typedef struct
{
    BValue Params;
    BValue Body;
    BValue Env;
    BValue Name;
    uint32_t Arity;
    uint32_t Flags;
} BFunction;

BValue MakeFunction(BRuntime * rt, ulong_t tag, BValue params, BValue body, BValue env,
    BValue nam, ulong_t flgs);

typedef BValue (*BNativeFn)(BRuntime * rt, long_t argc, BValue argv[]);

#define NATIVE_AWAIT 0x1
#define NATIVE_ENV 0x2

typedef struct BALIGN
{
    const char * Name;
    BNativeFn Fn;
    ulong_t Flags;
    const char * Filename;
    long_t LineNumber;
} BNative;

#define NativeP(v) ImmediateP(v, NativeTag)
#define AsNative(v) ((BNative *) ((v) & VALUE_PAYLOAD_MASK))

inline BValue NativeValue(BNative * nat)
{
    return(VALUE_QNAN | (BValue) nat | NativeTag);
}

#define DefineFlags(name, prim, flgs) \
    BValue prim ## Fn(BRuntime * rt, long_t argc, BValue argv[]);\
    static BNative prim ## Object = {name, prim ## Fn, flgs, __FILE__, __LINE__}; \
    static BNative * prim = &prim ## Object; \
    BValue prim ## Fn

#define Define(name, prim) DefineFlags(name, prim, 0)

void DefineNative(BRuntime * rt, BValue mod, BNative * nat);

// The environment of the form calling the running NATIVE_ENV native; the user
// module when called from the host.
BValue CallerEnvironment();

//
// ---- Environments and Modules ----
//

#define EnvP(v) (ObjectTag(v) == EnvTag)
#define AsEnv(v) ((BEnv *) AsObject(v))

typedef struct
{
    BValue Parent;
    BValue Values[1];
} BEnv;

BValue MakeEnv(BRuntime * rt, BValue parent, ulong_t cnt);
ulong_t EnvCount(BValue env);
void EnvBind(BRuntime * rt, BValue env, ulong_t idx, BValue sym, BValue val);
int EnvLookup(BRuntime * rt, BValue env, BValue sym, BValue * val);
BValue EnvModule(BValue env);

#define ModuleP(v) (ObjectTag(v) == ModuleTag)
#define AsModule(v) ((BModule *) AsObject(v))

typedef struct
{
    BValue Exports;
    BValue Imports;
    BValue Name;
    ulong_t Id;
} BModule;

#define CORE_MODULE_ID 0
#define USER_MODULE_ID 1

#define CoreModule MakeModuleValue(CORE_MODULE_ID)
#define UserModule MakeModuleValue(USER_MODULE_ID)

BValue FindOrMakeModule(BRuntime * rt, const char * nam);
BValue FindModule(BRuntime * rt, const char * nam);
BValue ModuleObject(BRuntime * rt, BValue mod);
void ModuleDefine(BRuntime * rt, BValue mod, BValue sym, BValue val);
int ModuleLookup(BRuntime * rt, BValue mod, BValue sym, BValue * val);
void ModuleImport(BRuntime * rt, BValue mod, BValue from);

//
// ---- Futures and Channels ----
//

#define FUTURE_EXTERNAL 0x1

typedef enum
{
    FuturePending = 0,
    FutureReady = 1,
    FutureFailed = 2,
    FutureStale = 3
} BFutureState;

#define FutureP(v) (ObjectTag(v) == FutureTag)
#define ChannelP(v) (ObjectTag(v) == ChannelTag)
#define AsHandle(v) ((BHandle *) AsObject(v))

typedef struct
{
    uint32_t Index;
    uint32_t Generation;
} BHandle;

BValue MakeFuture(BRuntime * rt, ulong_t flgs);
BValue MakeCompletedFuture(BRuntime * rt, BValue val);
void FutureComplete(BRuntime * rt, BValue fut, BValue val);
void FutureFail(BRuntime * rt, BValue fut, BValue err);
BFutureState FuturePoll(BRuntime * rt, BValue fut, BValue * pv);
int FutureExternalP(BRuntime * rt, BValue fut);
void ReleaseHandle(BRuntime * rt, BValue hdl);
ulong_t ActiveHandleCount(BRuntime * rt);

BValue MakeChannel(BRuntime * rt, ulong_t cap);
BValue ChannelSend(BRuntime * rt, BValue ch, BValue val);
BValue ChannelReceive(BRuntime * rt, BValue ch);
void ChannelClose(BRuntime * rt, BValue ch);

//
// ---- Evaluation ----
//

typedef struct _BEvalState BEvalState;

typedef struct
{
    int Suspended;
    BValue Value;
    BValue Pending;
    BEvalState * Resume;
} BEvalResult;

BEvalResult Evaluate(BRuntime * rt, BValue expr, BValue env);
BEvalResult ResumeEval(BRuntime * rt, BEvalState * es, BValue val);
void DropEvalState(BRuntime * rt, BEvalState * es);
BValue EvaluateBlocking(BRuntime * rt, BValue expr, BValue env);

//
// ---- Scheduler ----
//

typedef enum
{
    TaskReady,
    TaskSuspended,
    TaskWaiting,
    TaskCompleted,
    TaskCancelled,
    TaskUnknown
} BTaskState;

// The states of the most recently finished tasks are remembered; older ids
// report TaskUnknown.
#define FINISHED_TASK_RECORDS 1024

typedef BValue (*BBridgeFn)(void * ctx);

ulong_t SpawnTask(BRuntime * rt, BValue expr, BValue env);
BValue TaskFuture(BRuntime * rt, ulong_t id);
BTaskState TaskState(BRuntime * rt, ulong_t id);
int CancelTask(BRuntime * rt, ulong_t id);
ulong_t SchedulerStep(BRuntime * rt);
void RunScheduler(BRuntime * rt);
ulong_t LiveTaskCount(BRuntime * rt);
BValue BridgeSubmit(BRuntime * rt, BBridgeFn fn, void * ctx);

//
// ---- Writing ----
//

void WriteValue(BRuntime * rt, std::string & s, BValue v, int df);
std::string ValueToString(BRuntime * rt, BValue v, int df);
std::string FormatError(BRuntime * rt, BValue err);
BValue TypeOf(BRuntime * rt, BValue v);

//
// ---- Configuration ----
//

typedef enum
{
    NeverConfig,
    EarlyConfig,
    LateConfig,
    AnytimeConfig
} BConfigWhen;

void InitializeConfig(BConfig * cfg);
int ProcessOptions(BConfig * cfg, BConfigWhen when, int argc, char * argv[], int * pdx);
void ConfigUsage();

// ---- Argument Checking ----

inline void ZeroArgsCheck(BRuntime * rt, const char * who, long_t argc)
{
    if (argc != 0)
        RaiseArityError(rt, who, 0, argc);
}

inline void OneArgCheck(BRuntime * rt, const char * who, long_t argc)
{
    if (argc != 1)
        RaiseArityError(rt, who, 1, argc);
}

inline void TwoArgsCheck(BRuntime * rt, const char * who, long_t argc)
{
    if (argc != 2)
        RaiseArityError(rt, who, 2, argc);
}

inline void ThreeArgsCheck(BRuntime * rt, const char * who, long_t argc)
{
    if (argc != 3)
        RaiseArityError(rt, who, 3, argc);
}

inline void ZeroOrOneArgsCheck(BRuntime * rt, const char * who, long_t argc)
{
    if (argc > 1)
        RaiseErrorC(rt, who, "expected zero or one arguments", NilValue);
}

inline void OneOrTwoArgsCheck(BRuntime * rt, const char * who, long_t argc)
{
    if (argc < 1 || argc > 2)
        RaiseErrorC(rt, who, "expected one or two arguments", NilValue);
}

inline void TwoOrThreeArgsCheck(BRuntime * rt, const char * who, long_t argc)
{
    if (argc < 2 || argc > 3)
        RaiseErrorC(rt, who, "expected two or three arguments", NilValue);
}

inline void AtLeastOneArgCheck(BRuntime * rt, const char * who, long_t argc)
{
    if (argc < 1)
        RaiseErrorC(rt, who, "expected at least one argument", NilValue);
}

inline void NumberArgCheck(BRuntime * rt, const char * who, BValue arg)
{
    if (NumberP(arg) == 0)
        RaiseErrorC(rt, who, "expected a number", arg);
}

inline void IndexArgCheck(BRuntime * rt, const char * who, BValue arg, ulong_t len)
{
    if (NumberP(arg) == 0 || AsNumber(arg) < 0 || AsNumber(arg) >= (double) len
            || AsNumber(arg) != (double) (ulong_t) AsNumber(arg))
        RaiseErrorC(rt, who, "expected a valid index", arg);
}

inline void NonNegativeArgCheck(BRuntime * rt, const char * who, BValue arg)
{
    if (NumberP(arg) == 0 || AsNumber(arg) < 0 || AsNumber(arg) > 4294967295.0
            || AsNumber(arg) != (double) (ulong_t) AsNumber(arg))
        RaiseErrorC(rt, who, "expected a non-negative integer", arg);
}

inline void SymbolArgCheck(BRuntime * rt, const char * who, BValue arg)
{
    if (SymbolP(arg) == 0)
        RaiseErrorC(rt, who, "expected a symbol", arg);
}

inline void ListArgCheck(BRuntime * rt, const char * who, BValue arg)
{
    if (ListP(arg) == 0)
        RaiseErrorC(rt, who, "expected a list", arg);
}

inline void VectorArgCheck(BRuntime * rt, const char * who, BValue arg)
{
    if (VectorP(arg) == 0)
        RaiseErrorC(rt, who, "expected a vector", arg);
}

inline void MapArgCheck(BRuntime * rt, const char * who, BValue arg)
{
    if (MapP(arg) == 0)
        RaiseErrorC(rt, who, "expected a map", arg);
}

inline void SetArgCheck(BRuntime * rt, const char * who, BValue arg)
{
    if (SetP(arg) == 0)
        RaiseErrorC(rt, who, "expected a set", arg);
}

inline void FutureArgCheck(BRuntime * rt, const char * who, BValue arg)
{
    if (FutureP(arg) == 0)
        RaiseErrorC(rt, who, "expected a future", arg);
}

inline void ChannelArgCheck(BRuntime * rt, const char * who, BValue arg)
{
    if (ChannelP(arg) == 0)
        RaiseErrorC(rt, who, "expected a channel", arg);
}

inline void ErrorArgCheck(BRuntime * rt, const char * who, BValue arg)
{
    if (ErrorP(arg) == 0)
        RaiseErrorC(rt, who, "expected an error", arg);
}

// ---- Setup ----

void SetupCore(BRuntime * rt);
void DeleteCore(BRuntime * rt);
void SetupSymbols(BRuntime * rt);
void DeleteSymbols(BRuntime * rt);
void SetupModules(BRuntime * rt);
void DeleteModules(BRuntime * rt);
void SetupMonitors(BRuntime * rt);
void DeleteMonitors(BRuntime * rt);
void SetupHandles(BRuntime * rt);
void DeleteHandles(BRuntime * rt);
void SetupEvaluator(BRuntime * rt);
void DeleteEvaluator(BRuntime * rt);
void SetupScheduler(BRuntime * rt);
void DeleteScheduler(BRuntime * rt);
void SetupBlinkNatives(BRuntime * rt);
void SetupLists(BRuntime * rt);
void SetupVectors(BRuntime * rt);
void SetupHashMaps(BRuntime * rt);
void SetupCompare(BRuntime * rt);
void SetupNumbers(BRuntime * rt);
void SetupWrite(BRuntime * rt);
void SetupFutures(BRuntime * rt);
void SetupSchedulerNatives(BRuntime * rt);
void SetupConfig(BRuntime * rt);

void ReleaseMonitor(BRuntime * rt, ulong_t idx, void * obj);
void ReleaseHandleEntry(BRuntime * rt, ulong_t idx, ulong_t gen);

#endif // __BLINK_HPP__
