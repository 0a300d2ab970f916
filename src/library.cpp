/*

Blink

*/

#include <stdio.h>
#include <string>
#include <unordered_map>
#include <vector>
#include "blink.hpp"
#include "syncthrd.hpp"

// ---- Environments ----
//
// An environment frame is laid out as
//
//     Parent Values[count] Count Keys[count]
//
// where Parent is another frame or the module id at the root of the chain.

static inline ulong_t * EnvCountField(BValue env)
{
    return((ulong_t *) (AsEnv(env)->Values + (AsObjHdr(AsObject(env))->SlotCount() - 1)));
}

static inline BValue * EnvKeys(BValue env)
{
    return((BValue *) (EnvCountField(env) + 1));
}

BValue MakeEnv(BRuntime * rt, BValue parent, ulong_t cnt)
{
    BAssert(EnvP(parent) || ModuleIdP(parent));

    BEnv * env = (BEnv *) MakeObject(rt, EnvTag, sizeof(BValue) * (2 + cnt * 2), 1 + cnt,
            "make-env");
    BValue ev = ObjectValue(env);

    env->Parent = parent;
    *EnvCountField(ev) = cnt;
    for (ulong_t idx = 0; idx < cnt; idx++)
        EnvKeys(ev)[idx] = NilValue;

    return(ev);
}

ulong_t EnvCount(BValue env)
{
    BAssert(EnvP(env));

    return(*EnvCountField(env));
}

void EnvBind(BRuntime * rt, BValue env, ulong_t idx, BValue sym, BValue val)
{
    BAssert(EnvP(env));
    BAssert(SymbolP(sym));
    BAssert(idx < EnvCount(env));

    EnvKeys(env)[idx] = sym;
    ModifyObject(rt, env, 1 + idx, val);
}

int EnvLookup(BRuntime * rt, BValue env, BValue sym, BValue * val)
{
    while (EnvP(env))
    {
        ulong_t cnt = EnvCount(env);
        for (ulong_t idx = cnt; idx > 0; idx--)
            if (EnvKeys(env)[idx - 1] == sym)
            {
                *val = AsEnv(env)->Values[idx - 1];
                return(1);
            }

        env = AsEnv(env)->Parent;
    }

    BAssert(ModuleIdP(env));

    return(ModuleLookup(rt, env, sym, val));
}

BValue EnvModule(BValue env)
{
    while (EnvP(env))
        env = AsEnv(env)->Parent;

    BAssert(ModuleIdP(env));

    return(env);
}

// ---- Modules ----

struct _BModuleTable
{
    OSExclusive Exclusive;
    std::vector<BValue> Modules;
    std::unordered_map<std::string, ulong_t> Names;
};

static void VisitModules(BRuntime * rt, BVisitFn visit, void * ctx, void * data)
{
    BModuleTable * mt = (BModuleTable *) data;

    for (ulong_t idx = 0; idx < mt->Modules.size(); idx++)
        visit(&mt->Modules[idx], ctx);
}

static BValue MakeModule(BRuntime * rt, const char * nam, ulong_t id)
{
    BValue exp = MakeMap(rt);
    BValue imp = MakeVector(rt, 0, NilValue);
    BValue s = MakeStringC(rt, nam);

    BModule * mod = (BModule *) MakeObject(rt, ModuleTag, sizeof(BModule), 3, "make-module");
    mod->Exports = exp;
    mod->Imports = imp;
    mod->Name = s;
    mod->Id = id;

    BValue mv = ObjectValue(mod);

    // Every task may reach a module through its bindings.
    MarkShared(mv);
    MarkShared(exp);
    MarkShared(imp);

    return(mv);
}

BValue FindModule(BRuntime * rt, const char * nam)
{
    BModuleTable * mt = rt->Modules;
    BWithExclusive wx(&mt->Exclusive);

    std::unordered_map<std::string, ulong_t>::iterator it = mt->Names.find(nam);
    if (it == mt->Names.end())
        return(NilValue);

    return(MakeModuleValue(it->second));
}

BValue FindOrMakeModule(BRuntime * rt, const char * nam)
{
    BValue mod = FindModule(rt, nam);
    if (NilP(mod) == 0)
        return(mod);

    BModuleTable * mt = rt->Modules;
    BWithExclusive wx(&mt->Exclusive);

    std::unordered_map<std::string, ulong_t>::iterator it = mt->Names.find(nam);
    if (it != mt->Names.end())
        return(MakeModuleValue(it->second));

    ulong_t id = mt->Modules.size();
    mt->Modules.push_back(MakeModule(rt, nam, id));
    mt->Names[nam] = id;

    if (rt->Config.VerboseFlag)
        printf("module: %s is " ULONG_FMT "\n", nam, id);

    return(MakeModuleValue(id));
}

BValue ModuleObject(BRuntime * rt, BValue mod)
{
    BAssert(ModuleIdP(mod));

    BModuleTable * mt = rt->Modules;
    BWithExclusive wx(&mt->Exclusive);

    BMustBe(AsModuleId(mod) < mt->Modules.size());

    return(mt->Modules[AsModuleId(mod)]);
}

void ModuleDefine(BRuntime * rt, BValue mod, BValue sym, BValue val)
{
    BAssert(SymbolP(sym));

    MapInsert(rt, AsModule(ModuleObject(rt, mod))->Exports, sym, val);
}

static int ExportLookup(BRuntime * rt, BValue mod, BValue sym, BValue * val)
{
    BValue none = StringCToKeyword(rt, "%none");
    BValue v = MapGet(rt, AsModule(ModuleObject(rt, mod))->Exports, sym, none);

    if (v == none)
        return(0);

    *val = v;
    return(1);
}

int ModuleLookup(BRuntime * rt, BValue mod, BValue sym, BValue * val)
{
    BAssert(ModuleIdP(mod));

    if (ExportLookup(rt, mod, sym, val))
        return(1);

    BValue imps = AsModule(ModuleObject(rt, mod))->Imports;
    for (ulong_t idx = 0; idx < VectorLength(imps); idx++)
        if (ExportLookup(rt, VectorGet(rt, imps, idx), sym, val))
            return(1);

    if (mod != CoreModule)
        return(ExportLookup(rt, CoreModule, sym, val));

    return(0);
}

void ModuleImport(BRuntime * rt, BValue mod, BValue from)
{
    BAssert(ModuleIdP(mod));
    BAssert(ModuleIdP(from));

    if (mod == from)
        return;

    BValue imps = AsModule(ModuleObject(rt, mod))->Imports;
    for (ulong_t idx = 0; idx < VectorLength(imps); idx++)
        if (VectorGet(rt, imps, idx) == from)
            return;

    VectorPush(rt, imps, from);
}

void DefineNative(BRuntime * rt, BValue mod, BNative * nat)
{
    ModuleDefine(rt, mod, StringCToSymbol(rt, nat->Name), NativeValue(nat));
}

void SetupModules(BRuntime * rt)
{
    BModuleTable * mt = new BModuleTable;

    InitializeExclusive(&mt->Exclusive);
    rt->Modules = mt;
    RegisterRootEnumerator(rt, VisitModules, mt);

    BValue core = FindOrMakeModule(rt, "core");
    BValue user = FindOrMakeModule(rt, "user");

    BMustBe(core == CoreModule);
    BMustBe(user == UserModule);
}

void DeleteModules(BRuntime * rt)
{
    DeleteExclusive(&rt->Modules->Exclusive);
    delete rt->Modules;
    rt->Modules = 0;
}
