///
/// @file
/// @brief cerexx - control-flow engine, one clause per step
///
///====================================================================
#include <cmath>
#include "cerexx.h"

using namespace std;

U32 Interp::next_id = 0;
///
///> interpreter instance
///
Interp::Interp(Channel *c, shared_ptr<Targets> tgts)
    : id(next_id++), targets(tgts ? tgts : make_shared<Targets>()),
      loader(*this), ch(c ? c : &own) {
    default_io(*this);
    rs.push(new Frame());              /// * main frame, never popped
}
Interp::~Interp() {
    ch->forget(*this);
    for (Program *p : frag) delete p;
    frag.clear();
    delete prog;
}
///
///> host interface
///
void Interp::load(const string &src, const string &fname, const Args &args) {
    Program *pg = parse(src, fname);   /// * SyntaxError goes to the host, nothing runs
    if (state == HOLD) ch->forget(*this);
    delete prog;
    prog = pg;
    for (Program *p : frag) delete p;
    frag.clear();
    while (rs.size() > 1) delete rs.pop();

    Frame &m = *rs[0];
    m.cs.clear();
    m.memo.clear();
    m.reply.clear();
    m.trap.clear();
    m.steps = 0;
    m.args  = args;
    m.cs.push(Cursor(&prog->body, prog));

    hold      = Hold();
    halted    = false;
    no_interp = false;
    exit_code = 0;
    result    = Value();
    error.clear();
    state     = QUERY;
    RX_LOG(this, "load %s, %d clauses", fname.c_str(), (int)prog->body.size());
}
vm_state Interp::run(const string &src, const string &fname) {
    load(src, fname);
    return run();
}
///
///> outer loop, runs clauses until STOP or HOLD
///
vm_state Interp::run() {
    while (state == QUERY) {
        Frame *fp = &top();
        try {
            if (halted) {
                halted = false;
                throw Condition("HALT", 4, "Program interrupted");
            }
            step(*fp);
            if (rs[-1] == fp) {        /// * clause done, forget its replay data
                fp->memo.clear();
                fp->reply.clear();
                fp->steps++;
            }
        }
        catch (Yield &) {}             /// * frame pushed or checkpoint posted
        catch (Condition &c) { raise(c); }
        catch (SyntaxError &e) {       /// * from INTERPRET
            Condition c("SYNTAX", 35, e.what());
            raise(c);
        }
        catch (ModuleError &e) {
            fatal(Condition("SYNTAX", 40, string("REQUIRE failed: ") + e.what(), false));
        }
    }
    return state;
}
///
///> one clause, or one loop control phase
///
void Interp::step(Frame &f) {
    if (f.cs.empty()) { state = STOP; return; }
    Cursor &c = f.cs[-1];
    if (c.loop && c.ph != L_BODY) { loop_step(f, c); return; }
    if (c.pc >= (int)c.blk->size()) { end_block(f); return; }

    Stmt *s = (*c.blk)[c.pc];
    line = c.pg->at ? c.pg->at : s->pos.line;   /// * fragments report their INTERPRET
    if (opt.trace && f.memo.empty() && f.reply.empty()) trace(s, c.pg);
    exec(f, s);
}
void Interp::end_block(Frame &f) {
    Cursor &c = f.cs[-1];
    if (c.loop) { c.ph = L_UNTIL; return; }           /// * body done
    if (f.cs.size() > 1) { f.cs.pop(); return; }
    if (rs.size() > 1) { ret(f, nullptr); return; }   /// * fell off the end of a routine
    f.cs.pop();
    state = STOP;
}
///
///> DO loop phases: UNTIL, STEP, TEST then the body
///
bool Interp::loop_step(Frame &f, Cursor &c) {
    Do *d = c.loop;
    switch (c.ph) {
    case L_UNTIL:
        if (d->utl && truth(eval(d->utl))) { f.cs.pop(); return false; }
        c.ph = L_STEP;
        /* fall through */
    case L_STEP:
        if (d->over.size()) c.oi++;
        else if (d->var.size() && d->from) {
            Value  v = fetch(d->var);
            double x;
            if (!v.num(x)) throw Condition("SYNTAX", 41, "Bad arithmetic conversion: control variable " + d->var);
            assign(d->var, num_fmt(x + c.by, opt.digits, opt.eng));
        }
        if (c.left > 0) c.left--;
        c.ph = L_TEST;
        /* fall through */
    case L_TEST:
        if (c.left == 0) { f.cs.pop(); return false; }
        if (d->over.size()) {
            if (c.oi >= (int)c.over.size()) { f.cs.pop(); return false; }
            assign(d->var, c.over[c.oi]);
        }
        else if (d->var.size() && d->to) {
            Value  v = fetch(d->var);
            double x;
            if (!v.num(x)) throw Condition("SYNTAX", 41, "Bad arithmetic conversion: control variable " + d->var);
            if (c.by >= 0 ? x > c.to : x < c.to) { f.cs.pop(); return false; }
        }
        if (d->whl && !truth(eval(d->whl))) { f.cs.pop(); return false; }
        c.ph = L_BODY;
        c.pc = 0;
        return true;
    default: break;
    }
    return true;
}
///
///> LEAVE and ITERATE, innermost or named loop
///
void Interp::leave(Frame &f, const string &var, bool iterate) {
    for (int i = (int)f.cs.size() - 1; i >= 0; i--) {
        Cursor &c = f.cs[i];
        if (!c.loop || (var.size() && c.loop->var != var)) continue;
        f.cs.erase(f.cs.begin() + i + 1, f.cs.end());
        if (iterate) f.cs[-1].ph = L_UNTIL;
        else         f.cs.pop();
        return;
    }
    throw Condition("SYNTAX", 28, "Invalid LEAVE or ITERATE" + (var.size() ? ": " + var : string()));
}
void Interp::jump(Frame &f, const string &label) {
    auto i = prog->label.find(label);
    if (i == prog->label.end()) throw Condition("SYNTAX", 16, "Label not found: " + label);
    f.cs.clear();
    Cursor c(&prog->body, prog);
    c.pc = i->second + 1;
    f.cs.push(c);
    RX_LOG(this, "jump %s", label.c_str());
}
///
///> RETURN, hands the value to the caller's waiting site
///
void Interp::ret(Frame &f, const Value *v) {
    if (rs.size() == 1) {              /// * RETURN from the main program
        S64 n;
        result    = v ? *v : Value();
        exit_code = (v && v->whole(n)) ? (int)n : 0;
        f.cs.clear();
        state = STOP;
        return;
    }
    const void *site = f.site;
    bool        fn   = f.fn;
    delete rs.pop();
    Frame &p = top();
    RX_LOG(this, "return depth=%d", (int)rs.size());
    if (fn) {
        if (!v) throw Condition("SYNTAX", 44, "Function did not return data");
        p.memo[site] = *v;
        return;
    }
    if (v) p.pool.set("RESULT", *v);
    else   p.pool.drop("RESULT");
    p.memo[site] = v ? *v : Value();
}
///
///> routine resolution: built-in, module function, internal label,
///> then a method of the active target
///
bool Interp::call(const void *site, const string &n, Args &a, bool fn, bool quoted, Value &v) {
    Frame &f = top();
    if (const Bif *b = find_bif(n)) {
        int na = (int)a.size();
        if (na < b->lo || (b->hi >= 0 && na > b->hi))
            throw Condition("SYNTAX", 40, "Incorrect call to routine " + n);
        try { v = b->fn(*this, a); }
        catch (Condition &) { throw; }
        catch (exception &e) {
            throw Condition("SYNTAX", 40, "Incorrect call to routine " + n + ": " + e.what());
        }
        return true;
    }
    auto fi = fns.find(n);
    if (fi != fns.end()) {
        try { v = fi->second.fn(*this, a); }
        catch (Condition &) { throw; }
        catch (exception &e) {
            throw Condition("SYNTAX", 40, "Incorrect call to routine " + n + ": " + e.what());
        }
        return true;
    }
    auto li = prog->label.find(n);
    if (!quoted && li != prog->label.end()) {
        if ((int)rs.size() >= RX_MAX_DEPTH) throw Condition("SYNTAX", 11, "Control stack full");
        Frame *nf = new Frame();
        nf->addr = f.addr;
        nf->args = a;
        nf->site = site;
        nf->fn   = fn;
        Cursor c(&prog->body, prog);
        c.pc = li->second + 1;
        nf->cs.push(c);
        nf->pool.set("SIGL", to_string(line));
        rs.push(nf);
        RX_LOG(this, "call %s depth=%d", n.c_str(), (int)rs.size());
        throw Yield();
    }
    Binding *b = binding(f.addr);
    if (b && b->tgt->has(n)) {
        Params p;
        for (size_t i = 0; i < a.size(); i++) p.push_back({ to_string(i + 1), a[i] });
        Result r = dispatch(site, f.addr, n, p, true);
        failed(r);
        v = r.output;
        return true;
    }
    throw Condition("SYNTAX", 43, "Routine not found: " + n);
}
///
///> conditions: unwind to the nearest frame with an armed trap
///
void Interp::raise(Condition &c) {
    if (!c.line) c.line = line;
    if (c.trap) {
        for (int i = (int)rs.size() - 1; i >= 0; i--) {
            Trap *t = find_trap(*rs[i], c.name);
            if (!t) continue;
            while ((int)rs.size() > i + 1) delete rs.pop();
            Frame &f = top();
            t->on = false;             /// * must be re-armed
            cinfo.name  = c.name;
            cinfo.desc  = c.what();
            cinfo.instr = "SIGNAL";
            f.memo.clear();
            f.reply.clear();
            f.pool.set("SIGL", to_string(c.line));
            f.pool.set("ERRORTEXT", c.what());
            if (c.name == "SYNTAX") f.pool.set("RC", to_string(c.code));
            RX_LOG(this, "%s trapped at line %d => %s", c.name.c_str(), c.line, t->label.c_str());
            try { jump(f, t->label); }
            catch (Condition &e) { e.line = c.line; fatal(e); }
            return;
        }
    }
    fatal(c);
}
void Interp::fatal(const Condition &c) {
    int    ln  = c.line ? c.line : line;
    string src = (prog && prog->fname.size()) ? prog->fname : "<script>";
    if (prog && ln > 0 && ln <= (int)prog->lines.size())
        diag("%6d +++ %s\n", ln, prog->lines[ln - 1].c_str());
    error = c.name + " " + to_string(c.code) + " running " + src
          + ", line " + to_string(ln) + ": " + c.what();
    diag("%s\n", error.c_str());

    exit_code = c.code > 0 ? c.code : 1;
    while (rs.size() > 1) delete rs.pop();
    Frame &m = *rs[0];
    m.cs.clear();
    m.memo.clear();
    m.reply.clear();
    state = STOP;
}
///
///> dispatch failure: ERROR or FAILURE, only when a trap takes it
///
void Interp::failed(const Result &r) {
    if (r.success) return;
    const char *cond = r.status < 0 ? "FAILURE" : "ERROR";
    if (trapped(cond)) throw Condition(cond, r.status ? r.status : 1, r.error);
}
///====================================================================
///
///> clause execution, evaluate first, then advance, then mutate
///
void Interp::exec(Frame &f, Stmt *s) {
    switch (s->kind) {
    case S_NOP:
    case S_LABEL: next(f); break;
    case S_ASSIGN: {
        Assign &a = (Assign&)*s;
        Value  v  = eval(a.x);
        next(f);
        assign(a.name, v);
    } break;
    case S_SAY: {
        Xst  &x = (Xst&)*s;
        Value v = x.x ? eval(x.x) : Value();
        next(f);
        say(v.str());
    } break;
    case S_IF: {
        If  &i = (If&)*s;
        bool t = truth(eval(i.cond));
        const Program *pg = f.cs[-1].pg;
        next(f);
        Block &b = t ? i.then : i.els;
        if (b.size()) f.cs.push(Cursor(&b, pg));
    } break;
    case S_DO: {
        Do &d = (Do&)*s;
        const Program *pg = f.cs[-1].pg;
        if (!d.loop) { next(f); f.cs.push(Cursor(&d.body, pg)); break; }
        Cursor c(&d.body, pg);
        c.loop = &d;
        c.ph   = L_TEST;
        auto count = [this](Expr *x) {
            Value v = eval(x);
            S64   n;
            if (!v.whole(n) || n < 0) throw Condition("SYNTAX", 26, "Invalid whole number: '" + v.str() + "'");
            return n;
        };
        auto number = [this](Expr *x) {
            Value  v = eval(x);
            double n;
            if (!v.num(n)) throw Condition("SYNTAX", 41, "Bad arithmetic conversion: '" + v.str() + "'");
            return n;
        };
        double from = 0;
        if (d.rep)  c.left = count(d.rep);
        if (d.from) from   = number(d.from);
        if (d.to)   c.to   = number(d.to);
        if (d.by)   c.by   = number(d.by);
        if (d.cnt)  c.left = count(d.cnt);
        if (d.over.size()) {
            auto st = f.pool.stem.find(d.over);
            if (st != f.pool.stem.end())
                for (auto &t : st->second->tail) c.over.push(t.first);
        }
        next(f);
        if (d.from) assign(d.var, num_fmt(from, opt.digits, opt.eng));
        f.cs.push(c);
    } break;
    case S_SELECT: {
        Select &sl = (Select&)*s;
        const Program *pg = f.cs[-1].pg;
        for (When *w : sl.when) {
            if (!truth(eval(w->cond))) continue;
            next(f);
            if (w->body.size()) f.cs.push(Cursor(&w->body, pg));
            return;
        }
        if (!sl.has_other) throw Condition("SYNTAX", 7, "WHEN or OTHERWISE expected");
        next(f);
        if (sl.other.size()) f.cs.push(Cursor(&sl.other, pg));
    } break;
    case S_CALL: {
        CallSt &c = (CallSt&)*s;
        if (!f.memo.count(s)) {        /// * a returning routine fills the memo
            Args a;
            for (Expr *x : c.args) a.push_back(eval(x));
            Value v;
            if (call(s, c.name, a, false, false, v)) f.pool.set("RESULT", v);
            else                                     f.pool.drop("RESULT");
        }
        next(f);
    } break;
    case S_SIGNAL: {
        Signal &g = (Signal&)*s;
        if (g.mode == 1)      { f.trap[g.cond] = { g.label, true }; next(f); }
        else if (g.mode == 2) { f.trap[g.cond].on = false; next(f); }
        else jump(f, g.x ? upper(eval(g.x).str()) : g.label);
    } break;
    case S_UNLESS: {
        Unless &u = (Unless&)*s;
        if (truth(eval(u.cond))) { next(f); break; }
        Value m = eval(u.msg);
        diag("%s\n", m.c_str());
    } /* fall through */
    case S_EXIT: {
        Xst  &x = (Xst&)*s;
        Value v = x.x ? eval(x.x) : Value();
        S64   n;
        while (rs.size() > 1) delete rs.pop();
        rs[0]->cs.clear();
        result    = v;
        exit_code = (x.x && v.whole(n)) ? (int)n : 0;
        state     = STOP;
    } break;
    case S_RETURN: {
        Xst &x = (Xst&)*s;
        if (x.x) { Value v = eval(x.x); ret(f, &v); }
        else ret(f, nullptr);
    } break;
    case S_PARSE:    do_parse(f, (Parse&)*s);    break;
    case S_ADDRESS:  do_address(f, (Address&)*s); break;
    case S_COMMAND: {
        Xst     &x = (Xst&)*s;
        Binding *b = binding(f.addr);
        string  cmd;
        if (b && !b->tgt->interp && x.x->kind == X_LIT) cmd = ((Lit*)x.x)->text;
        else cmd = eval(x.x).str();
        if (!b) {                                 /// * default target prints
            next(f);
            say(cmd);
            publish(f.pool, Result());
            break;
        }
        Result r = dispatch(s, f.addr, cmd, Params(), false);
        next(f);
        failed(r);
    } break;
    case S_REQUIRE: {
        Require &q = (Require&)*s;
        Value   sp = eval(q.spec);
        next(f);
        RX_LOG(this, "require %s", sp.c_str());
        loader.load(sp.str(), q.as);
    } break;
    case S_PROC: {
        Names &n = (Names&)*s;
        if (f.steps != 0 || rs.size() < 2)
            throw Condition("SYNTAX", 17, "Unexpected PROCEDURE");
        Pool &caller = rs[-2]->pool;
        for (const string &v : n.names) f.pool.expose(caller, v);
        next(f);
    } break;
    case S_LEAVE:
    case S_ITERATE: leave(f, ((Nst&)*s).name, s->kind == S_ITERATE); break;
    case S_DROP:
        for (const string &v : ((Names&)*s).names) drop(v);
        next(f);
        break;
    case S_NUMERIC: do_numeric((Numeric&)*s); next(f); break;
    case S_PUSH:
    case S_QUEUE: {
        Xst  &x = (Xst&)*s;
        Value v = x.x ? eval(x.x) : Value();
        next(f);
        if (s->kind == S_PUSH) queue.push_front(v);
        else                   queue.push_back(v);
    } break;
    case S_INTERPRET: {
        if (no_interp)
            throw Condition("SYNTAX", 35, "INTERPRET is blocked by NO-INTERPRET", false);
        Value    v  = eval(((Xst&)*s).x);
        Program *pg = parse(v.str(), prog->fname);
        if (pg->label.size()) {
            delete pg;
            throw Condition("SYNTAX", 47, "Unexpected label in INTERPRET data");
        }
        pg->at = line;
        next(f);
        sweep();
        frag.push(pg);
        if (pg->body.size()) f.cs.push(Cursor(&pg->body, pg));
    } break;
    case S_NOINTERP: no_interp = true; next(f); break;
    case S_TRACE: {
        const string &o = ((Nst&)*s).name;
        opt.trace = !(o == "O" || o == "N" || o == "OFF");
        next(f);
    } break;
    case S_CLAUSE: do_clause(f, (Clause&)*s); break;
    }
}
///
///> INTERPRET programs live while a cursor of any frame still runs in them
///
void Interp::sweep() {
    std::set<const Program*> live;
    for (Frame *fp : rs) {
        for (Cursor &c : fp->cs) live.insert(c.pg);
    }
    for (auto i = frag.begin(); i != frag.end();) {
        if (live.count(*i)) { i++; continue; }
        delete *i;
        i = frag.erase(i);
    }
}
///
///> NAME k=v ..., NAME(args), NAME: operation, routine or target method
///
void Interp::do_clause(Frame &f, Clause &c) {
    if (f.memo.count(&c)) { next(f); return; }
    if (c.keys.size() || c.args.empty()) {
        Params p;
        for (size_t i = 0; i < c.keys.size(); i++) p.push_back({ c.keys[i], eval(c.args[i]) });
        auto o = ops.find(c.name);
        if (o != ops.end()) {
            Value v;
            try { v = o->second.op(*this, p); }
            catch (Condition &) { throw; }
            catch (exception &e) {
                throw Condition("SYNTAX", 40, "Operation " + c.name + " failed: " + e.what());
            }
            next(f);
            f.pool.set("RESULT", v);
            return;
        }
        Binding *b = binding(f.addr);
        if (c.keys.size()) {
            if (!b || !b->tgt->has(c.name))
                throw Condition("SYNTAX", 43, "Operation not found: " + c.name);
            Result r = dispatch(&c, f.addr, c.name, p, true);
            next(f);
            failed(r);
            return;
        }
    }
    Args a;
    for (Expr *x : c.args) a.push_back(eval(x));
    Value v;
    if (call(&c, c.name, a, false, false, v)) f.pool.set("RESULT", v);
    next(f);
}
///====================================================================
///
///> PARSE templates
///
static void words(Interp &rx, string s, const Template &t, int i, int j) {
    for (int k = i; k < j; k++) {
        string v;
        if (k == j - 1) v = s;         /// * last one takes the rest as is
        else {
            size_t a = s.find_first_not_of(' ');
            if (a == string::npos) s.clear();
            else {
                size_t b = s.find(' ', a);
                v = s.substr(a, b == string::npos ? string::npos : b - a);
                s = b == string::npos ? "" : s.substr(b + 1);
            }
        }
        if (t[k].kind == TP_VAR) rx.assign(t[k].s, v);
    }
}
void Interp::parse_tpl(const string &src, const Template &t) {
    size_t L = src.size(), pos = 0, mpos = 0;
    int    n = (int)t.size(), i = 0;
    while (i <= n) {
        int j = i;
        while (j < n && (t[j].kind == TP_VAR || t[j].kind == TP_DOT)) j++;
        size_t end = L, nxt = L, nm = L;
        if (j < n) {
            const Piece &pc = t[j];
            if (pc.kind == TP_LIT || pc.kind == TP_VREF) {
                string pat = pc.kind == TP_LIT ? pc.s : fetch(pc.s).str();
                size_t k   = pat.empty() ? string::npos : src.find(pat, pos);
                if (k != string::npos) { end = k; nxt = k + pat.size(); nm = k; }
            }
            else {
                long col = pc.kind == TP_ABS ? (long)pc.n - 1 : (long)mpos + pc.n;
                if (col < 0) col = 0;
                if (col > (long)L) col = (long)L;
                end  = (size_t)col > pos ? (size_t)col : L;
                nxt  = nm = (size_t)col;
            }
        }
        words(*this, src.substr(pos, end - pos), t, i, j);
        if (j >= n) break;
        pos  = nxt;
        mpos = nm;
        i    = j + 1;
    }
}
void Interp::do_parse(Frame &f, Parse &p) {
    vector<string> src;
    switch (p.src) {
    case P_ARG:     for (const Value &a : f.args) src.push_back(a.str()); break;
    case P_VAR:     src.push_back(fetch(p.var).str());                    break;
    case P_VALUE:   src.push_back(p.x ? eval(p.x).str() : "");           break;
    case P_PULL:    { string s; pull(s); src.push_back(s); }             break;
    case P_SOURCE:
        src.push_back(string("LINUX ") + (rs.size() > 1 ? "SUBROUTINE " : "COMMAND ")
                      + (prog->fname.size() ? prog->fname : "<script>"));
        break;
    case P_VERSION: src.push_back(RX_VERSION);                            break;
    }
    next(f);
    for (size_t i = 0; i < p.tpl.size(); i++) {
        string s = i < src.size() ? src[i] : "";
        if (p.xform == 1) s = upper(s);
        if (p.xform == 2) s = lower(s);
        parse_tpl(s, p.tpl[i]);
    }
}
void Interp::do_numeric(Numeric &n) {
    if (n.what == 2) { opt.eng = n.form == "ENGINEERING"; return; }
    S64 v = n.what == 0 ? RX_DIGITS : RX_FUZZ;
    if (n.x) {
        Value x = eval(n.x);
        if (!x.whole(v)) throw Condition("SYNTAX", 26, "Invalid whole number: '" + x.str() + "'");
    }
    if (n.what == 0) {
        if (v < 1 || v > RX_MAX_DIGITS || v <= opt.fuzz)
            throw Condition("SYNTAX", 33, "Invalid NUMERIC DIGITS " + to_string(v));
        opt.digits = (int)v;
    }
    else {
        if (v < 0 || v >= opt.digits)
            throw Condition("SYNTAX", 33, "Invalid NUMERIC FUZZ " + to_string(v));
        opt.fuzz = (int)v;
    }
}
///====================================================================
///
///> host access to the main pool and the registries
///
void Interp::set(const string &n, const Value &v) {
    assign(upper(n), v, &rs[0]->pool);
}
Value Interp::get(const string &n) {
    Value v;
    peek(upper(n), v, &rs[0]->pool);
    return v;
}
bool Interp::has(const string &n) {
    Value v;
    return peek(upper(n), v, &rs[0]->pool);
}
void Interp::add_function(const string &n, Fn fn, const string &owner) {
    string k = upper(n);
    auto   i = fns.find(k);
    if (i != fns.end() && i->second.owner != owner)
        throw ModuleError("function " + k + " already provided by " + i->second.owner);
    fns[k] = { fn, owner, "", {} };
}
void Interp::add_operation(const string &n, Op op, const string &owner) {
    string k = upper(n);
    auto   i = ops.find(k);
    if (i != ops.end() && i->second.owner != owner)
        throw ModuleError("operation " + k + " already provided by " + i->second.owner);
    ops[k] = { op, owner, "", {} };
}
