///
/// @file
/// @brief cerexx - variable pools, simple variables and stems
///
///====================================================================
#include "cerexx.h"

using namespace std;
///
///> simple variables
///
bool Pool::get(const string &n, Value &v) const {
    auto i = var.find(n);
    if (i == var.end() || !i->second->set) return false;
    v = i->second->v;
    return true;
}
void Pool::set(const string &n, const Value &v) {
    VarP &p = var[n];
    if (!p) p = make_shared<Var>();
    p->v   = v;
    p->set = true;
}
void Pool::drop(const string &n) {             ///> unset, links survive
    auto i = var.find(n);
    if (i != var.end()) { i->second->set = false; i->second->v = Value(); }
}
///
///> stems: explicit tail first, then the stem default
///
Stem &Pool::stem_of(const string &st) {
    StemP &p = stem[st];
    if (!p) p = make_shared<Stem>();
    return *p;
}
bool Pool::get(const string &st, const string &tl, Value &v) const {
    auto i = stem.find(st);
    if (i == stem.end()) return false;
    const Stem &s = *i->second;
    auto t = s.tail.find(tl);
    if (t != s.tail.end()) { v = t->second; return true; }
    if (!s.has_dflt) return false;
    v = s.dflt;
    return true;
}
void Pool::set(const string &st, const string &tl, const Value &v) {
    stem_of(st).tail[tl] = v;
}
void Pool::drop(const string &st, const string &tl) {
    auto i = stem.find(st);
    if (i != stem.end()) i->second->tail.erase(tl);
}
bool Pool::get_stem(const string &st, Value &v) const {
    auto i = stem.find(st);
    if (i == stem.end() || !i->second->has_dflt) return false;
    v = i->second->dflt;
    return true;
}
void Pool::set_stem(const string &st, const Value &v) {
    Stem &s = stem_of(st);
    s.tail.clear();
    s.dflt     = v;
    s.has_dflt = true;
}
void Pool::drop_stem(const string &st) {
    auto i = stem.find(st);
    if (i == stem.end()) return;
    i->second->tail.clear();
    i->second->dflt     = Value();
    i->second->has_dflt = false;
}
///
///> PROCEDURE EXPOSE - share the caller's storage by reference
///
void Pool::expose(Pool &from, const string &n) {
    if (n.size() && n.back() == '.') {
        StemP &p = from.stem[n];
        if (!p) p = make_shared<Stem>();
        stem[n] = p;
        return;
    }
    size_t d = n.find('.');
    if (d != string::npos) {                   /// * compound, expose its stem
        expose(from, n.substr(0, d + 1));
        return;
    }
    VarP &p = from.var[n];
    if (!p) p = make_shared<Var>();
    var[n] = p;
}
