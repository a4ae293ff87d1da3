///
/// @file
/// @brief cerexx - expression evaluator, variable access and interpolation
///
///====================================================================
#include <cmath>
#include <cctype>
#include <cstring>
#include "cerexx.h"

using namespace std;
///
///> interpolation marker forms, selected by name
///
static const struct Pattern {
    const char *name, *open, *close;
} PATTERNS[] = {
    { "curly",        "{",  "}"  },
    { "handlebars",   "{{", "}}" },
    { "shell",        "${", "}"  },
    { "batch",        "%",  "%"  },
    { "doubledollar", "$$", "$$" }
};
bool valid_pattern(const string &n) {
    for (const Pattern &p : PATTERNS) if (n == p.name) return true;
    return false;
}
///====================================================================
///
///> variable names: simple, stem. or stem.tail.tail
///
static string tail_of(Pool &pl, const string &rest) {     ///> derived tail
    string tl;
    size_t i = 0;
    while (true) {
        size_t d = rest.find('.', i);
        string c = rest.substr(i, d == string::npos ? string::npos : d - i);
        Value  v;
        if (c.size() && !isdigit((U8)c[0]) && pl.get(c, v)) tl += v.str();
        else tl += c;
        if (d == string::npos) break;
        tl += '.';
        i = d + 1;
    }
    return tl;
}
bool Interp::peek(const string &n, Value &v, Pool *p) {
    Pool  &pl = p ? *p : top().pool;
    size_t d  = n.find('.');
    if (d == string::npos) return pl.get(n, v);
    if (d == 0) return false;
    string st   = n.substr(0, d + 1);
    string rest = n.substr(d + 1);
    if (rest.empty()) return pl.get_stem(st, v);
    return pl.get(st, tail_of(pl, rest), v);
}
Value Interp::fetch(const string &n, bool raise) {
    Value v;
    if (peek(n, v)) return v;
    if (n.empty() || n[0] == '.') return Value(n);     /// * constant symbol

    string dn(n);                                      ///< derived name
    size_t d = n.find('.');
    if (d != string::npos && d + 1 < n.size())
        dn = n.substr(0, d + 1) + tail_of(top().pool, n.substr(d + 1));
    if (raise && trapped("NOVALUE"))
        throw Condition("NOVALUE", 0, dn);
    if (raise && opt.novalue_fatal)
        throw Condition("NOVALUE", 0, "Uninitialized variable " + dn, false);
    return Value(dn);
}
void Interp::assign(const string &n, const Value &v, Pool *p) {
    Pool  &pl = p ? *p : top().pool;
    size_t d  = n.find('.');
    if (d == string::npos) { pl.set(n, v); return; }
    if (d == 0) throw Condition("SYNTAX", 31, "Name starts with number or '.': " + n);
    string st   = n.substr(0, d + 1);
    string rest = n.substr(d + 1);
    if (rest.empty()) pl.set_stem(st, v);
    else              pl.set(st, tail_of(pl, rest), v);
}
void Interp::drop(const string &n) {
    Pool  &pl = top().pool;
    size_t d  = n.find('.');
    if (d == string::npos) { pl.drop(n); return; }
    string st   = n.substr(0, d + 1);
    string rest = n.substr(d + 1);
    if (rest.empty()) pl.drop_stem(st);
    else              pl.drop(st, tail_of(pl, rest));
}
///====================================================================
///
///> {name} interpolation, unknown names stay as written
///
static bool marker_name(const string &s) {
    if (s.empty() || !(isalpha((U8)s[0]) || s[0] == '_')) return false;
    for (char c : s) if (!isalnum((U8)c) && !strchr("_.!?@#$", c)) return false;
    return true;
}
Value Interp::expand(const string &s) {
    const Pattern *pt = &PATTERNS[0];
    for (const Pattern &p : PATTERNS) if (opt.interp == p.name) pt = &p;
    size_t ol = strlen(pt->open), cl = strlen(pt->close);

    string r;
    size_t i = 0;
    while (true) {
        size_t a = s.find(pt->open, i);
        size_t b = a == string::npos ? a : s.find(pt->close, a + ol);
        if (b == string::npos) { r += s.substr(i); break; }
        string nm = s.substr(a + ol, b - a - ol);
        Value  v;
        if (marker_name(nm) && peek(upper(nm), v)) {
            r += s.substr(i, a - i) + v.str();
            i = b + cl;
        }
        else {
            r += s.substr(i, a - i + 1);
            i = a + 1;
        }
    }
    return Value(r);
}
///====================================================================
///
///> expression walker, variable reads and calls are memoized per clause
///
bool Interp::truth(const Value &v) {
    const string &s = v.str();
    if (s == "1") return true;
    if (s == "0") return false;
    double d;
    if (v.num(d) && (d == 0 || d == 1)) return d == 1;
    throw Condition("SYNTAX", 34, "Logical value not 0 or 1: '" + s + "'");
}
Value Interp::eval(Expr *x) {
    Frame &f = top();
    switch (x->kind) {
    case X_LIT: {
        Lit &l = (Lit&)*x;
        if (!l.mark) return Value(l.text);
        auto m = f.memo.find(x);
        if (m != f.memo.end()) return m->second;
        Value v = expand(l.text);
        f.memo[x] = v;
        return v;
    }
    case X_SYM: {
        auto m = f.memo.find(x);
        if (m != f.memo.end()) return m->second;
        Value v = fetch(((Sym&)*x).name);
        f.memo[x] = v;
        return v;
    }
    case X_CALL: return invoke((Call&)*x);
    case X_BIN:  return ((Bin*)x)->op == OP_PIPE ? pipe((Bin&)*x) : binary((Bin&)*x);
    case X_UNA: {
        Una  &u = (Una&)*x;
        Value a = eval(u.x);
        if (u.op == OP_NOT) return Value(truth(a) ? "0" : "1");
        double d;
        if (!a.num(d)) throw Condition("SYNTAX", 41, "Bad arithmetic conversion: '" + a.str() + "'");
        return Value(num_fmt(u.op == OP_NEG ? -d : d, opt.digits, opt.eng));
    }
    }
    throw logic_error("bad expression node");
}
static int str_cmp(const string &a, const string &b) {   ///> blank padded
    string x = strip(a), y = strip(b);
    size_t n = max(x.size(), y.size());
    x.resize(n, ' '); y.resize(n, ' ');
    int c = x.compare(y);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}
Value Interp::binary(Bin &b) {
    Value l = eval(b.l);
    Value r = eval(b.r);
    auto bl = [](bool t) { return Value(t ? "1" : "0"); };
    switch (b.op) {
    case OP_OR:   { bool x = truth(l), y = truth(r); return bl(x || y); }
    case OP_XOR:  { bool x = truth(l), y = truth(r); return bl(x != y); }
    case OP_AND:  { bool x = truth(l), y = truth(r); return bl(x && y); }
    case OP_CAT:  return Value(l.str() + r.str());
    case OP_BCAT: return Value(l.str() + " " + r.str());
    case OP_SEQ:  return bl(l.str() == r.str());
    case OP_SNE:  return bl(l.str() != r.str());
    case OP_SGT:  return bl(l.str() >  r.str());
    case OP_SLT:  return bl(l.str() <  r.str());
    case OP_SGE:  return bl(l.str() >= r.str());
    case OP_SLE:  return bl(l.str() <= r.str());
    default: break;
    }
    double x, y;
    bool   nx = l.num(x), ny = r.num(y);
    if (b.op >= OP_EQ && b.op <= OP_LE) {
        int c = (nx && ny) ? num_cmp(x, y, opt.digits - opt.fuzz) : str_cmp(l.str(), r.str());
        switch (b.op) {
        case OP_EQ: return bl(c == 0);
        case OP_NE: return bl(c != 0);
        case OP_GT: return bl(c >  0);
        case OP_LT: return bl(c <  0);
        case OP_GE: return bl(c >= 0);
        default:    return bl(c <= 0);
        }
    }
    if (!nx || !ny)
        throw Condition("SYNTAX", 41, "Bad arithmetic conversion: '" + (nx ? r : l).str() + "'");
    double v = 0;
    switch (b.op) {
    case OP_ADD: v = x + y; break;
    case OP_SUB: v = x - y; break;
    case OP_MUL: v = x * y; break;
    case OP_DIV:
    case OP_IDIV:
    case OP_REM:
        if (y == 0) throw Condition("SYNTAX", 42, "Arithmetic overflow: division by zero");
        v = b.op == OP_DIV ? x / y : (b.op == OP_IDIV ? trunc(x / y) : fmod(x, y));
        break;
    case OP_POW: {
        S64 n;
        if (!r.whole(n)) throw Condition("SYNTAX", 26, "Invalid whole number: exponent '" + r.str() + "'");
        v = std::pow(x, (double)n);
        break;
    }
    default: throw logic_error("bad operator");
    }
    if (!isfinite(v)) throw Condition("SYNTAX", 42, "Arithmetic overflow");
    return Value(num_fmt(v, opt.digits, opt.eng));
}
///
///> function call: internal routine, built-in, module function, target method
///
Value Interp::invoke(Call &c) {
    Frame &f = top();
    auto m = f.memo.find(&c);
    if (m != f.memo.end()) return m->second;

    Args a;
    for (Expr *x : c.args) a.push_back(eval(x));
    Value v;
    if (!call(&c, c.name, a, true, c.quoted, v))
        throw Condition("SYNTAX", 44, "Function did not return data: " + c.name);
    top().memo[&c] = v;
    return v;
}
///
///> value |> NAME, value |> NAME(args): the value goes in as the first
///> argument, or in place of each _ among the args
///
Value Interp::pipe(Bin &b) {
    Frame &f = top();
    auto m = f.memo.find(&b);
    if (m != f.memo.end()) return m->second;

    Value  l = eval(b.l);
    Args   a;
    string n;
    bool   q = false;
    if (b.r->kind == X_SYM) {
        n = ((Sym&)*b.r).name;
        a.push_back(l);
    }
    else {
        Call &c = (Call&)*b.r;
        bool hole = false;
        n = c.name;
        q = c.quoted;
        for (Expr *x : c.args) {
            if (x->kind == X_SYM && ((Sym&)*x).name == "_") { a.push_back(l); hole = true; }
            else a.push_back(eval(x));
        }
        if (!hole) a.insert(a.begin(), l);
    }
    Value v;
    if (!call(&b, n, a, true, q, v))
        throw Condition("SYNTAX", 44, "Function did not return data: " + n);
    top().memo[&b] = v;
    return v;
}
bool Interp::trapped(const string &cond) {
    for (int i = (int)rs.size() - 1; i >= 0; i--) {
        if (find_trap(*rs[i], cond)) return true;
    }
    return false;
}
///
///> trap taking a condition in a frame, ERROR also covers SYNTAX and FAILURE
///
Trap *find_trap(Frame &f, const string &cond) {
    auto t = f.trap.find(cond);
    if (t != f.trap.end() && t->second.on) return &t->second;
    if (cond != "SYNTAX" && cond != "FAILURE") return nullptr;
    auto e = f.trap.find("ERROR");
    return (e != f.trap.end() && e->second.on) ? &e->second : nullptr;
}
