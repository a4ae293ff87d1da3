///
/// @file
/// @brief cerexx - parser, token stream to syntax tree
///
///====================================================================
#include <cstring>
#include <sstream>
#include <memory>                          /// unique_ptr
#include "cerexx_ast.h"

using namespace std;

typedef initializer_list<const char*> Words;

struct Parser {
    FV<Token>          tk;
    Program            *prog;
    int                p       = 0;
    int                depth   = 0;        ///< block nesting, labels at 0 only
    int                else_ok = 0;        ///< ELSE ends a clause
    vector<const char*> stop;              ///< words ending an expression

    Parser(const string &src, Program *pg) : tk(lex(src)), prog(pg) {}
    ///
    ///> token access
    ///
    Token &cur()       { return tk[p]; }
    Token &peek(int k=1) {
        int i = p + k;
        return tk[i < (int)tk.size() ? i : (int)tk.size() - 1];
    }
    SyntaxError err(const string &m) { return SyntaxError(m, cur().pos); }
    static bool name_tok(const Token &t) { return t.kind == T_SYM || t.kind == T_KEY; }
    static bool op_tok(const Token &t, const char *o) { return t.kind == T_OP && t.text == o; }

    bool is_op(const char *o)   { return op_tok(cur(), o); }
    bool is_word(const char *w) { return name_tok(cur()) && cur().text == w; }
    bool is_kw(const char *w) {            ///> keyword, not an assignment or label
        return cur().kind == T_KEY && cur().text == w
            && !op_tok(peek(), "=") && !op_tok(peek(), ":");
    }
    bool is_end(Words ends) {
        for (const char *w : ends) if (is_kw(w)) return true;
        return false;
    }
    bool eoc() {
        Token &t = cur();
        return t.kind == T_EOC || t.kind == T_EOF
            || (else_ok && t.kind == T_KEY && t.text == "ELSE");
    }
    void skip_eoc() { while (cur().kind == T_EOC) p++; }
    void expect_op(const char *o) {
        if (!is_op(o)) throw err(string("'") + o + "' expected");
        p++;
    }
    string name(const char *what) {        ///> symbol or literal used as a name
        Token &t = cur();
        if (!name_tok(t) && t.kind != T_STR) throw err(string(what) + " expected");
        p++;
        if (t.kind != T_STR) return t.text;
        string s(t.text);
        for (char &c : s) c = toupper((U8)c);
        return s;
    }
    int number() {
        Token &t = cur();
        if (t.kind != T_NUM || t.text.find_first_not_of("0123456789") != string::npos)
            throw err("whole number expected");
        p++;
        return atoi(t.text.c_str());
    }
    ///
    ///> expressions, lowest precedence first
    ///
    bool is_stop() {
        Token &t = cur();
        if (!name_tok(t)) return false;
        if (else_ok && t.kind == T_KEY && t.text == "ELSE") return true;
        for (const char *w : stop) if (t.text == w) return true;
        return false;
    }
    bool at_end() {
        return eoc() || is_stop() || is_op(")") || is_op(",");
    }
    bool term_start() {
        Token &t = cur();
        if (t.kind == T_NUM || t.kind == T_STR || t.kind == T_HEREDOC) return true;
        if (name_tok(t)) return !is_stop();
        return op_tok(t, "(");
    }
    Expr *expr(Words w) {                  ///> expression ending at words w
        int n = (int)stop.size();
        for (const char *s : w) stop.push_back(s);
        Expr *x = expr();
        stop.resize(n);
        return x;
    }
    Expr *expr() {
        if (at_end()) throw err("expression expected");
        return pipe();
    }
    typedef Expr *(Parser::*Level)();
    Expr *bin(op_kind o, Expr *l, Level rhs, Pos ps) {   ///> l owned until attached
        unique_ptr<Expr> a(l);
        unique_ptr<Expr> b((this->*rhs)());
        Expr *x = new Bin(o, a.get(), b.get(), ps);
        a.release(); b.release();
        return x;
    }
    Expr *pipe() {                         ///> value |> NAME or NAME(args, _ ...)
        Expr *l = lor();
        while (is_op("|>")) {
            Pos ps = cur().pos; p++;
            l = bin(OP_PIPE, l, &Parser::pipe_fn, ps);
        }
        return l;
    }
    Expr *pipe_fn() {
        if (!name_tok(cur()) || is_stop()) throw err("function name expected after |>");
        return primary();
    }
    Expr *lor() {
        Expr *l = land();
        while (is_op("|") || is_op("&&")) {
            Pos ps = cur().pos;
            op_kind o = is_op("|") ? OP_OR : OP_XOR;
            p++;
            l = bin(o, l, &Parser::land, ps);
        }
        return l;
    }
    Expr *land() {
        Expr *l = cmp();
        while (is_op("&")) {
            Pos ps = cur().pos; p++;
            l = bin(OP_AND, l, &Parser::cmp, ps);
        }
        return l;
    }
    Expr *cmp() {
        static const struct { const char *s; op_kind o; } CMP[] = {
            { "=",  OP_EQ  }, { "\\=", OP_NE  }, { "<>", OP_NE  }, { "><", OP_NE },
            { "!=", OP_NE  }, { ">",   OP_GT  }, { "<",  OP_LT  }, { ">=", OP_GE },
            { "\\<", OP_GE }, { "<=",  OP_LE  }, { "\\>", OP_LE }, { "==", OP_SEQ },
            { "\\==", OP_SNE }, { ">>", OP_SGT }, { "<<", OP_SLT },
            { ">>=", OP_SGE }, { "<<=", OP_SLE }
        };
        Expr *l = cat();
        while (cur().kind == T_OP) {
            int i = 0, n = (int)(sizeof(CMP) / sizeof(CMP[0]));
            for (; i < n; i++) if (is_op(CMP[i].s)) break;
            if (i == n) break;
            Pos ps = cur().pos; p++;
            l = bin(CMP[i].o, l, &Parser::cat, ps);
        }
        return l;
    }
    Expr *cat() {
        Expr *l = add();
        while (true) {
            Pos ps = cur().pos;
            if (is_op("||"))  { p++; l = bin(OP_CAT, l, &Parser::add, ps); }
            else if (term_start()) {
                op_kind o = cur().blank ? OP_BCAT : OP_CAT;
                l = bin(o, l, &Parser::add, ps);
            }
            else break;
        }
        return l;
    }
    Expr *add() {
        Expr *l = mul();
        while (is_op("+") || is_op("-")) {
            Pos ps = cur().pos;
            op_kind o = is_op("+") ? OP_ADD : OP_SUB;
            p++;
            l = bin(o, l, &Parser::mul, ps);
        }
        return l;
    }
    Expr *mul() {
        Expr *l = pow();
        while (true) {
            op_kind o;
            if      (is_op("*"))  o = OP_MUL;
            else if (is_op("/"))  o = OP_DIV;
            else if (is_op("%"))  o = OP_IDIV;
            else if (is_op("//")) o = OP_REM;
            else break;
            Pos ps = cur().pos; p++;
            l = bin(o, l, &Parser::pow, ps);
        }
        return l;
    }
    Expr *pow() {
        Expr *l = pre();
        while (is_op("**")) {
            Pos ps = cur().pos; p++;
            l = bin(OP_POW, l, &Parser::pre, ps);
        }
        return l;
    }
    Expr *pre() {
        Pos ps = cur().pos;
        if (is_op("-"))                { p++; return new Una(OP_NEG,  pre(), ps); }
        if (is_op("+"))                { p++; return new Una(OP_PLUS, pre(), ps); }
        if (is_op("\\") || is_op("!")) { p++; return new Una(OP_NOT,  pre(), ps); }
        return primary();
    }
    void args(FV<Expr*> &a) {              ///> ( expr, expr ... )
        expect_op("(");
        vector<const char*> sv; sv.swap(stop);
        int el = else_ok; else_ok = 0;
        if (!is_op(")")) {
            while (true) {
                a.push(expr());
                if (!is_op(",")) break;
                p++;
            }
        }
        expect_op(")");
        stop.swap(sv); else_ok = el;
    }
    Expr *primary() {
        Token &t = cur();
        Pos ps = t.pos;
        switch (t.kind) {
        case T_NUM: p++; return new Lit(t.text, Q_NONE, ps);
        case T_STR:
        case T_HEREDOC:
            p++;
            if (is_op("(") && !cur().blank) {
                unique_ptr<Call> c(new Call(t.text, true, ps));
                args(c->args);
                return c.release();
            }
            return new Lit(t.text, t.q, ps);
        case T_SYM:
        case T_KEY:
            if (is_stop()) break;
            p++;
            if (is_op("(") && !cur().blank) {
                unique_ptr<Call> c(new Call(t.text, false, ps));
                args(c->args);
                return c.release();
            }
            return new Sym(t.text, ps);
        case T_OP:
            if (t.text != "(") break;
            {
                p++;
                vector<const char*> sv; sv.swap(stop);
                int el = else_ok; else_ok = 0;
                Expr *x = expr();
                stop.swap(sv); else_ok = el;
                expect_op(")");
                return x;
            }
        default: break;
        }
        throw err("unexpected '" + (t.raw.size() ? t.raw : t.text) + "' in expression");
    }
    ///
    ///> clauses
    ///
    void block(Block &b, Words ends) {
        int el = else_ok; else_ok = 0;
        depth++;
        while (true) {
            skip_eoc();
            if (cur().kind == T_EOF || is_end(ends)) break;
            Stmt *s = stmt();
            b.push(s);
            if (s->kind == S_LABEL) continue;
            if (!eoc()) throw err("unexpected '" + cur().raw + "'");
        }
        depth--;
        else_ok = el;
    }
    void expect_kw(const char *w) {
        if (!is_kw(w)) throw err(string(w) + " expected");
        p++;
    }
    Stmt *stmt() {
        Token &t = cur();
        Pos ps = t.pos;
        if (name_tok(t) && op_tok(peek(), ":")) {          /// * label
            if (depth) throw err("label " + t.text + " inside a block");
            p += 2;
            return new Nst(S_LABEL, t.text, ps);
        }
        if (name_tok(t) && op_tok(peek(), "=")) {          /// * assignment
            p += 2;
            return new Assign(t.text, expr(), ps);
        }
        if (t.kind == T_STR || t.kind == T_HEREDOC)        /// * bare command literal
            return new Xst(S_COMMAND, expr(), ps);
        if (no_interpret()) return new Nst(S_NOINTERP, "", ps);
        if (t.kind == T_SYM) return clause();
        if (t.kind != T_KEY) return new Xst(S_COMMAND, expr(), ps);

        const string &k = t.text;
        if (k == "SAY")       { p++; return new Xst(S_SAY, eoc() ? nullptr : expr(), ps); }
        if (k == "LET")       {
            p++;
            if (!name_tok(cur())) throw err("variable expected");
            string n = cur().text; p++;
            expect_op("=");
            return new Assign(n, expr(), ps);
        }
        if (k == "IF")        return if_();
        if (k == "DO")        return do_();
        if (k == "SELECT")    return select_();
        if (k == "CALL")      {
            p++;
            if (is_word("ON") || is_word("OFF")) throw err("CALL ON/OFF is not supported");
            unique_ptr<CallSt> c(new CallSt(name("routine name"), ps));
            while (!eoc()) {
                c->args.push(expr({}));
                if (!is_op(",")) break;
                p++;
            }
            return c.release();
        }
        if (k == "SIGNAL")    return signal_();
        if (k == "EXIT")      return exit_();
        if (k == "RETURN")    { p++; return new Xst(S_RETURN, eoc() ? nullptr : expr(), ps); }
        if (k == "PARSE")     return parse_();
        if (k == "ARG" || k == "PULL") {
            p++;
            unique_ptr<Parse> s(new Parse(k == "ARG" ? P_ARG : P_PULL, ps));
            s->xform = 1;
            tpl(s.get());
            return s.release();
        }
        if (k == "PUSH")      { p++; return new Xst(S_PUSH,  eoc() ? nullptr : expr(), ps); }
        if (k == "QUEUE")     { p++; return new Xst(S_QUEUE, eoc() ? nullptr : expr(), ps); }
        if (k == "ADDRESS")   return address_();
        if (k == "REQUIRE")   {
            p++;
            unique_ptr<Require> r(new Require(expr({ "AS" }), ps));
            if (is_word("AS")) { p++; r->as = name("AS name"); }
            return r.release();
        }
        if (k == "LEAVE" || k == "ITERATE") {
            p++;
            string v;
            if (name_tok(cur()) && !eoc()) { v = cur().text; p++; }
            return new Nst(k == "LEAVE" ? S_LEAVE : S_ITERATE, v, ps);
        }
        if (k == "NOP")       { p++; return new Nst(S_NOP, "", ps); }
        if (k == "PROCEDURE" || k == "DROP") {
            bool proc = k == "PROCEDURE";
            p++;
            unique_ptr<Names> s(new Names(proc ? S_PROC : S_DROP, ps));
            if (proc && !eoc()) {
                if (!is_word("EXPOSE")) throw err("EXPOSE expected");
                p++;
            }
            while (!eoc()) {
                if (!name_tok(cur())) throw err("variable name expected");
                s->names.push(cur().text); p++;
            }
            return s.release();
        }
        if (k == "NUMERIC")   {
            p++;
            unique_ptr<Numeric> n(new Numeric(ps));
            if      (is_word("DIGITS")) n->what = 0;
            else if (is_word("FUZZ"))   n->what = 1;
            else if (is_word("FORM"))   n->what = 2;
            else throw err("DIGITS, FUZZ or FORM expected");
            p++;
            if (n->what == 2) {
                n->form = eoc() ? "SCIENTIFIC" : name("FORM");
                if (n->form != "SCIENTIFIC" && n->form != "ENGINEERING")
                    throw err("SCIENTIFIC or ENGINEERING expected");
            }
            else if (!eoc()) n->x = expr();
            return n.release();
        }
        if (k == "INTERPRET") { p++; return new Xst(S_INTERPRET, expr(), ps); }
        if (k == "TRACE")     {
            p++;
            string o = eoc() ? "N" : name("trace option");
            return new Nst(S_TRACE, o, ps);
        }
        throw err("unexpected " + k);
    }
    bool no_interpret() {                  ///> NO-INTERPRET or NO_INTERPRET alone
        Token &t = cur();
        if (t.kind != T_SYM) return false;
        int n = 0;
        if (t.text == "NO_INTERPRET") n = 1;
        else if (t.text == "NO" && op_tok(peek(), "-") && !peek().blank
                 && peek(2).kind == T_KEY && peek(2).text == "INTERPRET" && !peek(2).blank) n = 3;
        if (!n) return false;
        tok_kind k = peek(n).kind;
        if (k != T_EOC && k != T_EOF) return false;
        p += n;
        return true;
    }
    Stmt *exit_() {                        ///> EXIT [expr] or EXIT [code] UNLESS cond, message
        Pos ps = cur().pos;
        p++;
        if (eoc()) return new Xst(S_EXIT, nullptr, ps);
        unique_ptr<Expr> code(is_word("UNLESS") ? nullptr : expr({ "UNLESS" }));
        if (!is_word("UNLESS")) return new Xst(S_EXIT, code.release(), ps);
        p++;
        unique_ptr<Expr> cond(expr({}));
        if (!is_op(",")) throw err("',' expected between the UNLESS condition and its message");
        p++;
        unique_ptr<Expr> msg(expr());
        Stmt *s = new Unless(code.get(), cond.get(), msg.get(), ps);
        code.release(); cond.release(); msg.release();
        return s;
    }
    Stmt *clause() {                       ///> NAME, NAME(args), NAME k=v ..., or command
        Token &t = cur();
        Pos ps = t.pos;
        int p0 = p;
        p++;
        if (eoc()) return new Clause(t.text, ps);
        if (name_tok(cur()) && op_tok(peek(), "=")) {
            unique_ptr<Clause> c(new Clause(t.text, ps));
            while (!eoc()) {
                if (!name_tok(cur())) throw err("parameter name expected");
                c->keys.push(cur().text); p++;
                expect_op("=");
                c->args.push(pre());
            }
            return c.release();
        }
        if (is_op("(") && !cur().blank) {
            FV<Expr*> a;
            args(a);
            if (eoc()) {
                Clause *c = new Clause(t.text, ps);
                c->args.swap(a);
                return c;
            }
        }
        p = p0;
        return new Xst(S_COMMAND, expr(), ps);
    }
    bool block_if() {                      ///> does an ENDIF close the IF just opened
        int open = 1, dp = 0;
        bool bol = true, chain = false;
        for (int i = p; i < (int)tk.size(); i++) {
            Token &t = tk[i];
            if (t.kind == T_EOF) return false;
            if (t.kind == T_EOC) { bol = true; chain = false; continue; }
            if (t.kind == T_KEY && (t.text == "DO" || t.text == "SELECT")) dp++;
            else if (bol && t.kind == T_KEY) {
                if (t.text == "END" && --dp < 0) return false;
                else if (t.text == "ENDIF" && --open == 0) return true;
                else if (t.text == "ELSE" && i + 1 < (int)tk.size()
                         && tk[i + 1].kind == T_KEY && tk[i + 1].text == "IF") chain = true;
            }
            if (t.kind == T_KEY && t.text == "THEN" && i + 1 < (int)tk.size()
                && tk[i + 1].kind == T_EOC && !chain) open++;
            bol = false;
        }
        return false;
    }
    Stmt *if_() {
        Pos ps = cur().pos;
        p++;
        unique_ptr<If> s(new If(expr({ "THEN" }), ps));
        skip_eoc();
        expect_kw("THEN");
        if (cur().kind == T_EOC && block_if()) {            /// * IF..THEN..ELSE..ENDIF
            block(s->then, { "ELSE", "ENDIF" });
            if (is_kw("ELSE")) {
                p++;
                if (is_kw("IF")) {                          /// * ELSE IF shares ENDIF
                    s->els.push(if_());
                    return s.release();
                }
                block(s->els, { "ENDIF" });
            }
            expect_kw("ENDIF");
            return s.release();
        }
        skip_eoc();
        else_ok++;
        s->then.push(stmt());
        else_ok--;
        int p0 = p;
        skip_eoc();
        if (!is_kw("ELSE")) { p = p0; return s.release(); }
        p++;
        skip_eoc();
        s->els.push(stmt());
        return s.release();
    }
    Stmt *do_() {
        unique_ptr<Do> d(new Do(cur().pos));
        p++;
        Words ctl = { "TO", "BY", "FOR", "WHILE", "UNTIL" };
        if (!eoc()) {
            d->loop = true;
            if (is_word("FOREVER")) { p++; d->forever = true; }
            else if (name_tok(cur()) && op_tok(peek(), "=")) {
                d->var = cur().text; p += 2;
                d->from = expr(ctl);
                while (is_word("TO") || is_word("BY") || is_word("FOR")) {
                    string w = cur().text; p++;
                    Expr *&x = w == "TO" ? d->to : (w == "BY" ? d->by : d->cnt);
                    if (x) throw err("duplicate " + w);
                    x = expr(ctl);
                }
            }
            else if (name_tok(cur()) && name_tok(peek()) && peek().text == "OVER") {
                d->var = cur().text; p += 2;
                if (!name_tok(cur()) || cur().text.back() != '.') throw err("stem expected after OVER");
                d->over = cur().text; p++;
            }
            else if (!is_word("WHILE") && !is_word("UNTIL")) d->rep = expr({ "WHILE", "UNTIL" });
            if (is_word("WHILE"))      { p++; d->whl = expr(); }
            else if (is_word("UNTIL")) { p++; d->utl = expr(); }
            if (!eoc()) throw err("unexpected '" + cur().raw + "' in DO");
        }
        block(d->body, { "END" });
        expect_kw("END");
        if (name_tok(cur()) && !eoc()) {
            if (cur().text != d->var) throw err("END " + cur().text + " does not match DO");
            p++;
        }
        return d.release();
    }
    Stmt *select_() {
        unique_ptr<Select> s(new Select(cur().pos));
        p++;
        while (true) {
            skip_eoc();
            if (is_kw("WHEN")) {
                p++;
                s->when.push(new When(expr({ "THEN" })));
                When *w = s->when[-1];
                skip_eoc();
                expect_kw("THEN");
                if (cur().kind == T_EOC) block(w->body, { "WHEN", "OTHERWISE", "END" });
                else w->body.push(stmt());
            }
            else if (is_kw("OTHERWISE")) {
                p++;
                s->has_other = true;
                block(s->other, { "END" });
            }
            else if (is_kw("END")) { p++; break; }
            else throw err("WHEN, OTHERWISE or END expected");
        }
        if (s->when.empty()) throw SyntaxError("SELECT without WHEN", s->pos);
        return s.release();
    }
    Stmt *signal_() {
        unique_ptr<Signal> s(new Signal(cur().pos));
        p++;
        if ((is_word("ON") || is_word("OFF")) && name_tok(peek())) {
            s->mode = is_word("ON") ? 1 : 2;
            p++;
            s->cond = cur().text; p++;
            const char *ok[] = { "ERROR", "FAILURE", "HALT", "NOVALUE", "SYNTAX" };
            bool found = false;
            for (const char *c : ok) if (s->cond == c) found = true;
            if (!found) throw SyntaxError("unknown condition " + s->cond, s->pos);
            s->label = s->cond;
            if (s->mode == 1 && is_word("NAME")) { p++; s->label = name("label"); }
        }
        else if (is_word("VALUE")) { p++; s->x = expr(); }
        else s->label = name("label");
        return s.release();
    }
    Stmt *parse_() {
        Pos ps = cur().pos;
        p++;
        int xf = 0;
        if (is_word("UPPER"))      { xf = 1; p++; }
        else if (is_word("LOWER")) { xf = 2; p++; }
        unique_ptr<Parse> s;
        if      (is_word("ARG"))     { p++; s.reset(new Parse(P_ARG, ps)); }
        else if (is_word("PULL"))    { p++; s.reset(new Parse(P_PULL, ps)); }
        else if (is_word("SOURCE"))  { p++; s.reset(new Parse(P_SOURCE, ps)); }
        else if (is_word("VERSION")) { p++; s.reset(new Parse(P_VERSION, ps)); }
        else if (is_word("VAR"))     {
            p++;
            s.reset(new Parse(P_VAR, ps));
            if (!name_tok(cur())) throw err("variable expected");
            s->var = cur().text; p++;
        }
        else if (is_word("VALUE"))   {
            p++;
            s.reset(new Parse(P_VALUE, ps));
            if (!is_word("WITH")) s->x = expr({ "WITH" });
            if (!is_word("WITH")) throw err("WITH expected");
            p++;
        }
        else throw err("ARG, PULL, VAR, VALUE, SOURCE or VERSION expected");
        s->xform = xf;
        tpl(s.get());
        return s.release();
    }
    void tpl(Parse *s) {                   ///> PARSE template list
        s->tpl.push(Template());
        while (!eoc()) {
            Piece pc;
            Token &t = cur();
            if (op_tok(t, ",")) { p++; s->tpl.push(Template()); continue; }
            if (name_tok(t)) {
                pc.kind = t.text == "." ? TP_DOT : TP_VAR;
                pc.s = t.text; p++;
            }
            else if (t.kind == T_STR) { pc.kind = TP_LIT; pc.s = t.text; p++; }
            else if (op_tok(t, "(")) {
                p++;
                if (!name_tok(cur())) throw err("variable expected in pattern");
                pc.kind = TP_VREF; pc.s = cur().text; p++;
                expect_op(")");
            }
            else if (t.kind == T_NUM) { pc.kind = TP_ABS; pc.n = number(); }
            else if (op_tok(t, "+") || op_tok(t, "-")) {
                int sg = t.text == "-" ? -1 : 1; p++;
                pc.kind = TP_REL; pc.n = sg * number();
            }
            else if (op_tok(t, "=")) { p++; pc.kind = TP_ABS; pc.n = number(); }
            else throw err("unexpected '" + t.raw + "' in template");
            s->tpl[-1].push(pc);
        }
    }
    Stmt *address_() {
        unique_ptr<Address> a(new Address(cur().pos));
        p++;
        if (eoc()) return a.release();
        a->name = name("target name");
        while (true) {
            if (is_word("AUTH"))    { p++; a->auth = pre(); }
            else if (is_word("AS")) { p++; a->alias = name("alias"); }
            else break;
        }
        if (!eoc()) a->cmd = expr();
        return a.release();
    }
    void program() {
        while (true) {
            skip_eoc();
            if (cur().kind == T_EOF) break;
            Stmt *s = stmt();
            if (s->kind == S_LABEL) {
                const string &n = ((Nst*)s)->name;
                if (!prog->label.count(n)) prog->label[n] = (int)prog->body.size();
                prog->body.push(s);
                continue;
            }
            prog->body.push(s);
            if (!eoc()) throw err("unexpected '" + cur().raw + "'");
        }
    }
};

Program *parse(const string &src, const string &fname) {
    Program *pg = new Program();
    pg->fname = fname;
    istringstream in(src);
    string ln;
    while (getline(in, ln)) pg->lines.push(ln);
    try {
        Parser ps(src, pg);
        ps.program();
    }
    catch (SyntaxError &) {
        delete pg;
        throw;
    }
    return pg;
}
