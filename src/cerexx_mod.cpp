///
/// @file
/// @brief cerexx - REQUIRE module loader
///
///====================================================================
#include <cstdlib>                     /// getenv, realpath
#include <climits>                     /// PATH_MAX
#include <dlfcn.h>                     /// dlopen, dlsym
#include <unistd.h>                    /// access
#include "cerexx.h"

using namespace std;

static const string REGISTRY = "registry:";

static bool is_path(const string &s) { return s.find('/') != string::npos; }
///
///> resolution: host resolvers, registry:, paths, search directories,
///> then the static table
///
bool Loader::resolve(const string &spec, Image &img) {
    for (Resolver *r : res) {
        if (r->resolve(spec, img)) return true;
    }
    if (spec.compare(0, REGISTRY.size(), REGISTRY) == 0) {
        auto t = table.find(spec.substr(REGISTRY.size()));
        if (t == table.end()) return false;
        img.id     = spec;
        img.origin = spec;
        img.detect = t->second;
        return true;
    }
    if (is_path(spec)) return open(spec, img);

    vector<string> dirs(rx.opt.path);
    if (const char *env = getenv(RX_PATH_ENV)) {
        string e(env);
        size_t i = 0;
        while (i <= e.size()) {
            size_t c = e.find(':', i);
            if (c == string::npos) c = e.size();
            if (c > i) dirs.push_back(e.substr(i, c - i));
            i = c + 1;
        }
    }
    for (const string &d : dirs) {
        for (const string &f : { spec, spec + ".so", "lib" + spec + ".so" }) {
            string p = d + "/" + f;
            if (access(p.c_str(), R_OK) == 0) return open(p, img);
        }
    }
    auto t = table.find(spec);
    if (t == table.end()) return false;
    img.id     = REGISTRY + spec;
    img.origin = spec;
    img.detect = t->second;
    return true;
}
///
///> shared object, identified by its real path, never unloaded
///
bool Loader::open(const string &path, Image &img) {
    char buf[PATH_MAX];
    if (!realpath(path.c_str(), buf)) throw ModuleError("module not found: " + path);

    void *h = dlopen(buf, RTLD_NOW | RTLD_LOCAL);
    if (!h) throw ModuleError(string("cannot load ") + buf + ": " + dlerror());

    const char *entry = RX_DETECT;
    if (void *m = dlsym(h, RX_META)) entry = (const char*)m;   /// * extern "C" const char[]
    img.id     = string("file:") + buf;
    img.origin = path;
    img.detect = reinterpret_cast<DetectFn>(dlsym(h, entry));
    if (!img.detect) throw ModuleError(path + ": no detection entry " + entry);
    return true;
}
///
///> load once per canonical identity
///
const Registration &Loader::load(const string &spec, const string &as) {
    Image img;
    if (!resolve(spec, img)) throw ModuleError("cannot resolve module '" + spec + "'");
    auto s = seen.find(img.id);
    if (s != seen.end()) return cache.at(s->second);
    if (!img.detect) throw ModuleError("module '" + spec + "' has no " RX_DETECT " entry");

    ModuleDecl d;
    try { img.detect(d); }
    catch (ModuleError &) { throw; }
    catch (exception &e) {
        throw ModuleError("module '" + spec + "' detection failed: " + e.what());
    }
    string id = d.id.size() ? d.id : img.id;
    auto   c  = cache.find(id);
    if (c != cache.end()) {            /// * same module by another route
        seen[img.id] = id;
        return c->second;
    }
    Registration reg;
    reg.id   = id;
    reg.spec = spec;
    reg.desc = d.desc;
    merge(d, id, as, reg);
    seen[img.id] = id;
    RX_LOG(&rx, "module %s: %d fns, %d ops%s%s", id.c_str(),
           (int)reg.fns.size(), (int)reg.ops.size(),
           reg.target.size() ? ", target " : "", reg.target.c_str());
    return cache[id] = reg;
}
const Registration *Loader::find(const string &id) const {
    auto i = cache.find(id);
    return i == cache.end() ? nullptr : &i->second;
}
///
///> merge declared provisions, all or nothing
///
void Loader::merge(ModuleDecl &d, const string &id, const string &as, Registration &reg) {
    size_t n = d.fns.size() + d.ops.size();
    if (d.target && n)  throw ModuleError("module " + id + " mixes an address target with functions");
    if (!d.target && !n) throw ModuleError("module " + id + " provides nothing");

    if (d.target) {
        string k = upper(as.size() ? as : d.target->name);
        rx.add_target(d.target, k, "", id);
        reg.target = k;
        return;
    }
    string pre = upper(as);
    size_t w   = pre.find("(.*)");
    if (w != string::npos) pre = pre.substr(0, w);

    for (FnDecl &f : d.fns) {
        auto i = rx.fns.find(pre + upper(f.name));
        if (i != rx.fns.end() && i->second.owner != id)
            throw ModuleError("function " + i->first + " already provided by " + i->second.owner);
    }
    for (OpDecl &o : d.ops) {
        auto i = rx.ops.find(upper(o.name));
        if (i != rx.ops.end() && i->second.owner != id)
            throw ModuleError("operation " + i->first + " already provided by " + i->second.owner);
    }
    for (FnDecl &f : d.fns) {
        string k = pre + upper(f.name);
        rx.fns[k] = { f.fn, id, f.desc, f.params };
        reg.fns.push_back(k);
    }
    for (OpDecl &o : d.ops) {
        string k = upper(o.name);
        rx.ops[k] = { o.op, id, o.desc, o.params };
        reg.ops.push_back(k);
    }
}
