///
/// @file
/// @brief cerexx - tokens, syntax tree and parser interface
///
///====================================================================
#ifndef __CEREXX_SRC_CEREXX_AST_H
#define __CEREXX_SRC_CEREXX_AST_H
#include <string>
#include <vector>
#include <map>
#include <stdexcept>
#include "config.h"

using namespace std;

template<typename T>
struct FV : public vector<T> {      ///< our super-vector class
    ~FV() {                         ///< free pointed elements
        if constexpr(is_pointer<T>::value) {
            for (T t : *this) if (t != nullptr) { delete t; t = nullptr; }
        }
    }
    void push(T n) { this->push_back(n); }
    T    pop()     { T n = this->back(); this->pop_back(); return n; }
    T    &operator[](int i) {
#if CC_DEBUG
        return this->at(i < 0 ? (this->size() + i) : i); // with range checked
#else  // !CC_DEBUG
        return vector<T>::operator[](i < 0 ? (this->size() + i) : i);
#endif // CC_DEBUG
    }
    const T &operator[](int i) const {
        return this->at(i < 0 ? (this->size() + i) : i);
    }
};
///====================================================================
///
///> Lexer
///
typedef enum { T_EOC=0, T_EOF, T_SYM, T_KEY, T_NUM, T_STR, T_HEREDOC, T_OP } tok_kind;
typedef enum { Q_NONE=0, Q_DOUBLE, Q_SINGLE, Q_BACK, Q_HEREDOC } quote_kind;

struct Pos {
    int line = 0;                  ///< 1-based source line
    int col  = 0;                  ///< 1-based column
};
struct Token {
    tok_kind   kind  = T_EOC;
    quote_kind q     = Q_NONE;     ///< quote form of a literal
    string     text;               ///< symbol (upper case), operator or literal body
    string     raw;                ///< as written in source
    Pos        pos;
    bool       blank = false;      ///< preceded by blanks
};
///
///> syntax errors are never trappable, they stop the parse
///
struct SyntaxError : runtime_error {
    Pos pos;
    SyntaxError(const string &m, Pos p) : runtime_error(m), pos(p) {}
};

FV<Token> lex(const string &src);            ///< tokenize source, throws SyntaxError
bool      is_keyword(const string &s);       ///< instruction keyword check
///====================================================================
///
///> Expressions
///
typedef enum { X_LIT=0, X_SYM, X_CALL, X_BIN, X_UNA } ex_kind;
typedef enum {
    OP_OR=0, OP_XOR, OP_AND,                                   ///< logical
    OP_EQ, OP_NE, OP_GT, OP_LT, OP_GE, OP_LE,                  ///< normal compare
    OP_SEQ, OP_SNE, OP_SGT, OP_SLT, OP_SGE, OP_SLE,            ///< strict compare
    OP_CAT, OP_BCAT,                                           ///< abuttal, blank
    OP_ADD, OP_SUB, OP_MUL, OP_DIV, OP_IDIV, OP_REM, OP_POW,   ///< arithmetic
    OP_NOT, OP_NEG, OP_PLUS,                                   ///< prefix
    OP_PIPE                                                    ///< value |> function
} op_kind;

struct Expr {
    ex_kind kind;
    Pos     pos;
    Expr(ex_kind k, Pos p) : kind(k), pos(p) {}
    virtual ~Expr() {}
};
///
///> polymorphic constructors
///
struct Lit : Expr {                ///< string or number literal
    string     text;
    quote_kind q;                  ///< Q_NONE for numbers and constant symbols
    bool       mark;               ///< may hold interpolation markers
    Lit(const string &s, quote_kind k, Pos p)
        : Expr(X_LIT, p), text(s), q(k), mark(k != Q_NONE && s.find_first_of("{%$") != string::npos) {}
};
struct Sym : Expr {                ///< simple, stem or compound variable
    string name;
    Sym(const string &s, Pos p) : Expr(X_SYM, p), name(s) {}
};
struct Call : Expr {               ///< name(args)
    string     name;
    FV<Expr*>  args;
    bool       quoted;             ///< "NAME"(...) skips internal labels
    Call(const string &s, bool q, Pos p) : Expr(X_CALL, p), name(s), quoted(q) {}
};
struct Bin : Expr {
    op_kind op;
    Expr    *l, *r;
    Bin(op_kind o, Expr *a, Expr *b, Pos p) : Expr(X_BIN, p), op(o), l(a), r(b) {}
    ~Bin() { delete l; delete r; }
};
struct Una : Expr {
    op_kind op;
    Expr    *x;
    Una(op_kind o, Expr *a, Pos p) : Expr(X_UNA, p), op(o), x(a) {}
    ~Una() { delete x; }
};
///====================================================================
///
///> Statements
///
typedef enum {
    S_NOP=0, S_ASSIGN, S_SAY, S_IF, S_DO, S_SELECT, S_CALL, S_SIGNAL,
    S_EXIT, S_RETURN, S_PARSE, S_ADDRESS, S_COMMAND, S_REQUIRE, S_LABEL,
    S_PROC, S_LEAVE, S_ITERATE, S_DROP, S_NUMERIC, S_PUSH, S_QUEUE,
    S_INTERPRET, S_TRACE, S_CLAUSE, S_NOINTERP, S_UNLESS
} st_kind;

struct Stmt {
    st_kind kind;
    Pos     pos;
    Stmt(st_kind k, Pos p) : kind(k), pos(p) {}
    virtual ~Stmt() {}
};
typedef FV<Stmt*> Block;

struct Xst : Stmt {                ///< SAY, EXIT, RETURN, PUSH, QUEUE, INTERPRET, command
    Expr *x;                       ///< may be NULL
    Xst(st_kind k, Expr *e, Pos p) : Stmt(k, p), x(e) {}
    ~Xst() { delete x; }
};
struct Unless : Xst {              ///< EXIT [code] UNLESS cond, message
    Expr *cond, *msg;
    Unless(Expr *code, Expr *c, Expr *m, Pos p) : Xst(S_UNLESS, code, p), cond(c), msg(m) {}
    ~Unless() { delete cond; delete msg; }
};
struct Nst : Stmt {                ///< NOP, LABEL, LEAVE, ITERATE, TRACE, NO-INTERPRET
    string name;
    Nst(st_kind k, const string &s, Pos p) : Stmt(k, p), name(s) {}
};
struct Assign : Stmt {
    string name;
    Expr   *x;
    Assign(const string &s, Expr *e, Pos p) : Stmt(S_ASSIGN, p), name(s), x(e) {}
    ~Assign() { delete x; }
};
struct If : Stmt {
    Expr  *cond;
    Block then, els;
    If(Expr *c, Pos p) : Stmt(S_IF, p), cond(c) {}
    ~If() { delete cond; }
};
struct Do : Stmt {
    bool   loop    = false;        ///< false for a plain DO...END group
    bool   forever = false;
    string var;                    ///< control variable
    string over;                   ///< DO v OVER stem.
    Expr   *from = nullptr, *to = nullptr, *by = nullptr, *cnt = nullptr;
    Expr   *rep  = nullptr;        ///< DO n
    Expr   *whl  = nullptr, *utl = nullptr;
    Block  body;
    Do(Pos p) : Stmt(S_DO, p) {}
    ~Do() { delete from; delete to; delete by; delete cnt; delete rep; delete whl; delete utl; }
};
struct When {
    Expr  *cond;
    Block body;
    When(Expr *c) : cond(c) {}
    ~When() { delete cond; }
};
struct Select : Stmt {
    FV<When*> when;
    Block     other;
    bool      has_other = false;
    Select(Pos p) : Stmt(S_SELECT, p) {}
};
struct CallSt : Stmt {             ///< CALL name args
    string    name;
    FV<Expr*> args;
    CallSt(const string &s, Pos p) : Stmt(S_CALL, p), name(s) {}
};
struct Clause : Stmt {             ///< NAME k=v ..., NAME(args), NAME
    string     name;
    FV<string> keys;               ///< empty for positional arguments
    FV<Expr*>  args;
    Clause(const string &s, Pos p) : Stmt(S_CLAUSE, p), name(s) {}
};
struct Signal : Stmt {
    string label;                  ///< target, or trap label for ON
    string cond;                   ///< condition name for ON/OFF
    int    mode = 0;               ///< 0 jump, 1 ON, 2 OFF
    Expr   *x   = nullptr;         ///< SIGNAL VALUE expr
    Signal(Pos p) : Stmt(S_SIGNAL, p) {}
    ~Signal() { delete x; }
};
///
///> PARSE template pieces
///
typedef enum { TP_VAR=0, TP_DOT, TP_LIT, TP_VREF, TP_ABS, TP_REL } tp_kind;
struct Piece {
    tp_kind kind;
    string  s;                     ///< variable name or literal pattern
    int     n = 0;                 ///< column or offset
};
typedef FV<Piece> Template;
typedef enum { P_ARG=0, P_VAR, P_VALUE, P_PULL, P_SOURCE, P_VERSION } parse_src;

struct Parse : Stmt {
    parse_src    src;
    int          xform = 0;        ///< 0 as is, 1 upper, 2 lower
    string       var;              ///< PARSE VAR name
    Expr         *x = nullptr;     ///< PARSE VALUE expr WITH
    FV<Template> tpl;              ///< comma separated templates
    Parse(parse_src s, Pos p) : Stmt(S_PARSE, p), src(s) {}
    ~Parse() { delete x; }
};
struct Address : Stmt {
    string name;                   ///< empty resets to the default target
    Expr   *auth = nullptr;        ///< AUTH token
    string alias;                  ///< AS alias
    Expr   *cmd  = nullptr;        ///< command to send after switching
    Address(Pos p) : Stmt(S_ADDRESS, p) {}
    ~Address() { delete auth; delete cmd; }
};
struct Require : Stmt {
    Expr   *spec;
    string as;                     ///< AS prefix or alias
    Require(Expr *s, Pos p) : Stmt(S_REQUIRE, p), spec(s) {}
    ~Require() { delete spec; }
};
struct Names : Stmt {              ///< PROCEDURE EXPOSE, DROP
    FV<string> names;
    Names(st_kind k, Pos p) : Stmt(k, p) {}
};
struct Numeric : Stmt {
    int    what = 0;               ///< 0 DIGITS, 1 FUZZ, 2 FORM
    Expr   *x   = nullptr;
    string form;
    Numeric(Pos p) : Stmt(S_NUMERIC, p) {}
    ~Numeric() { delete x; }
};
///====================================================================
///
///> Program - one parsed source unit
///
struct Program {
    string           fname;        ///< source name for diagnostics
    FV<string>       lines;        ///< source lines for TRACE
    Block            body;
    map<string, int> label;        ///< label name => index in body
    int              at = 0;       ///< INTERPRET clause line, 0 for a source file
};

Program *parse(const string &src, const string &fname="");  ///< throws SyntaxError
#endif  // __CEREXX_SRC_CEREXX_AST_H
