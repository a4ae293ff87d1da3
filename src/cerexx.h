///
/// @file
/// @brief cerexx header - REXX dialect interpreter with ADDRESS routing
///
///====================================================================
#ifndef __CEREXX_SRC_CEREXX_H
#define __CEREXX_SRC_CEREXX_H
#include <iostream>                    /// cin, cout
#include <string>
#include <vector>
#include <map>
#include <set>
#include <deque>
#include <memory>                      /// shared_ptr
#include <functional>                  /// function
#include "config.h"
#include "cerexx_ast.h"

using namespace std;

struct Interp;
///====================================================================
///
///> Value - string primary, numeric view computed on demand
///
struct Value {
    Value() {}
    Value(const string &v) : s(v) {}
    Value(string &&v)      : s(move(v)) {}
    Value(const char *v)   : s(v) {}

    const string &str()   const { return s; }
    const char   *c_str() const { return s.c_str(); }
    bool   empty()        const { return s.empty(); }
    bool   num(double &d) const;       ///< numeric view, false if not a number
    bool   whole(S64 &n)  const;       ///< integral numeric view
    bool   is_num()       const { double d; return num(d); }

private:
    string         s;
    mutable S8     nf = -1;            ///< -1 unknown, 0 not a number, 1 number
    mutable double nv = 0;             ///< cached numeric view
};
typedef vector<Value> Args;

string num_fmt(double v, int digits, bool eng=false);  ///< REXX number formatting
bool   num_parse(const string &s, double &d);         ///< REXX number syntax
int    num_cmp(double a, double b, int digits);        ///< compare under precision
string upper(const string &s);
string lower(const string &s);
string strip(const string &s, char c=' ');
///====================================================================
///
///> Variable pool - simple variables and stems
///
struct Var {
    Value v;
    bool  set = false;
};
struct Stem {
    Value             dflt;            ///< value of stem.
    bool              has_dflt = false;
    map<string, Value> tail;           ///< explicit tails
};
typedef shared_ptr<Var>  VarP;
typedef shared_ptr<Stem> StemP;

struct Pool {
    map<string, VarP>  var;            ///< simple variables
    map<string, StemP> stem;           ///< stems, keyed with trailing dot

    bool get(const string &n, Value &v) const;
    void set(const string &n, const Value &v);
    void drop(const string &n);
    bool get(const string &st, const string &tl, Value &v) const;  ///< explicit tail, then default
    void set(const string &st, const string &tl, const Value &v);
    void drop(const string &st, const string &tl);
    bool get_stem(const string &st, Value &v) const;
    void set_stem(const string &st, const Value &v);    ///< new default, clears tails
    void drop_stem(const string &st);
    Stem &stem_of(const string &st);
    void expose(Pool &from, const string &n);           ///< share by reference
};
///====================================================================
///
///> Conditions - trappable runtime events
///
struct Condition : runtime_error {
    string name;                       ///< SYNTAX, NOVALUE, ERROR, FAILURE, HALT
    int    code;                       ///< error number or return code
    bool   trap;                       ///< false when SIGNAL ON cannot intercept
    int    line = 0;                   ///< clause raising the condition
    Condition(const string &n, int c, const string &m, bool t=true)
        : runtime_error(m), name(n), code(c), trap(t) {}
};
struct ModuleError : runtime_error {
    ModuleError(const string &m) : runtime_error(m) {}
};
struct Yield {};                       ///< unwind a clause, replay it later
///====================================================================
///
///> ADDRESS target contract
///
typedef vector<pair<string, Value>> Params;

struct Result {
    bool   success = true;
    string output;                     ///< becomes RESULT
    int    status  = 0;                ///< becomes RC on failure
    string error;                      ///< becomes ERRORTEXT on failure
};
struct Checkpoint {
    string operation;
    Params params;
    U32    timeout_ms = 0;             ///< 0 uses the interpreter default
};
struct Reply {                         ///< immediate result or pending checkpoint
    bool       pending = false;
    Result     result;
    Checkpoint ckpt;

    static Reply done(const string &out);
    static Reply fail(const string &err, int status=1);
    static Reply wait(const string &op, const Params &p, U32 ms=0);
};
struct Context {
    Interp       &rx;
    const string &auth;                ///< auth token bound to the target name
    int          line;                 ///< source line of the dispatch
    bool         method;               ///< method call, not a command string
};
struct Target {
    string      name;
    bool        cmd_ok;                ///< accepts bare command strings
    bool        meth_ok;               ///< accepts method calls
    bool        interp  = true;        ///< interpolate command strings first
    set<string> methods;               ///< method table, empty accepts any

    Target(const string &n, bool cmd=true, bool meth=false)
        : name(n), cmd_ok(cmd), meth_ok(meth) {}
    virtual ~Target() {}
    virtual bool  has(const string &m) const {
        return meth_ok && (methods.empty() || methods.count(m));
    }
    virtual Reply handle(const string &cmd, const Params &p, Context &ctx) = 0;
};
typedef shared_ptr<Target> TargetP;
typedef function<Reply(const string&, const Params&, Context&)> Handler;

struct FnTarget : Target {             ///< target from a plain handler
    Handler fn;
    FnTarget(const string &n, Handler h, bool cmd=true, bool meth=false)
        : Target(n, cmd, meth), fn(h) {}
    Reply handle(const string &cmd, const Params &p, Context &ctx) override {
        return fn(cmd, p, ctx);
    }
};
struct Binding {                       ///< registry entry
    TargetP tgt;
    string  auth;
    string  owner;                     ///< canonical id of the provider
};
typedef map<string, Binding> Targets;
///====================================================================
///
///> Checkpoint channel - host boundary
///
typedef enum { STOP=0, HOLD, QUERY } vm_state;

struct Request {
    U32    id;
    string operation;
    Params params;
};
struct Response {
    U32    id;
    bool   done = true;                ///< "done" or "error"
    Value  result;
    string error;
    int    rc   = 0;                   ///< status override, -1 for cancel
};
struct Channel {
    U32  post(Interp &rx, const Checkpoint &ck, U32 dflt_ms);
    bool take(Request &rq);            ///< next outbound request for the host
    bool deliver(const Response &rs);  ///< route by id and resume the owner
    bool cancel(U32 id, const string &why);
    int  expire(U64 now=millis());     ///< cancel overdue requests
    void forget(Interp &rx);           ///< withdraw requests of a dying interpreter
    bool withdraw(U32 id);             ///< drop a request answered outside the channel
    size_t outstanding() const { return wait.size(); }

private:
    struct Wait { Interp *rx; U64 deadline; };
    U32             next_id = 1;
    map<U32, Wait>  wait;              ///< outstanding, by correlation id
    deque<Request>  out;               ///< posted, not yet taken
};
///====================================================================
///
///> Functions, operations and modules
///
typedef function<Value(Interp&, Args&)>   Fn;
typedef function<Value(Interp&, Params&)> Op;

struct FnDecl { string name; Fn fn; string desc; vector<string> params; };
struct OpDecl { string name; Op op; string desc; vector<string> params; };
struct ModuleDecl {                    ///< filled by a module's detection entry
    string         id;                 ///< canonical id, defaults to the resolved source
    string         desc;
    vector<FnDecl> fns;
    vector<OpDecl> ops;
    TargetP        target;             ///< or exactly one address target

    ModuleDecl &fn(const string &n, Fn f, const string &d="", vector<string> p={}) {
        fns.push_back({ n, f, d, p }); return *this;
    }
    ModuleDecl &op(const string &n, Op o, const string &d="", vector<string> p={}) {
        ops.push_back({ n, o, d, p }); return *this;
    }
};
typedef void (*DetectFn)(ModuleDecl &m);

struct Image {                         ///< a resolved, not yet registered module
    string   id;                       ///< canonical identity
    string   origin;
    DetectFn detect = nullptr;
};
struct Resolver {
    virtual ~Resolver() {}
    virtual bool resolve(const string &spec, Image &img) = 0;
};
struct Registration {
    string         id, spec, desc;
    vector<string> fns, ops;
    string         target;
};
struct Loader {
    Loader(Interp &rx) : rx(rx) {}

    const Registration &load(const string &spec, const string &as="");
    void add(Resolver *r) { res.push(r); }                      ///< host resolver, owned
    void enroll(const string &n, DetectFn fn) { table[n] = fn; } ///< registry: module
    const Registration *find(const string &id) const;
    const map<string, Registration> &modules() const { return cache; }

private:
    Interp                    &rx;
    FV<Resolver*>             res;     ///< host resolvers, tried first
    map<string, DetectFn>     table;   ///< static registry
    map<string, Registration> cache;   ///< by canonical id
    map<string, string>       seen;    ///< resolved source id => canonical id

    bool resolve(const string &spec, Image &img);
    bool open(const string &path, Image &img);   ///< shared object
    void merge(ModuleDecl &d, const string &id, const string &as, Registration &reg);
};
///====================================================================
///
///> Engine state
///
struct Options {
    int            digits     = RX_DIGITS;
    int            fuzz       = RX_FUZZ;
    bool           eng        = false;          ///< NUMERIC FORM ENGINEERING
    U32            timeout_ms = RX_TIMEOUT_MS;  ///< checkpoint default
    vector<string> path;                        ///< module directories
    string         interp     = "curly";        ///< interpolation pattern
    bool           novalue_fatal = false;
    bool           trace      = false;
};
typedef enum { L_NONE=0, L_TEST, L_BODY, L_UNTIL, L_STEP } loop_phase;

struct Cursor {                        ///< one active block of a frame
    const Block   *blk;
    const Program *pg;                 ///< source unit owning the block
    int         pc    = 0;             ///< next statement
    Do          *loop = nullptr;       ///< owning DO when looping
    loop_phase  ph    = L_NONE;
    double      to = 0, by = 1;        ///< controlled loop limits
    S64         left  = -1;            ///< iterations left, -1 unbounded
    FV<string>  over;                  ///< DO OVER tails
    int         oi    = 0;
    Cursor(const Block *b, const Program *p) : blk(b), pg(p) {}
};
struct Trap {
    string label;
    bool   on = false;
};
struct Frame {
    Pool                      pool;
    string                    addr;    ///< active ADDRESS target, empty for default
    Args                      args;
    FV<Cursor>                cs;      ///< block cursor stack
    map<string, Trap>         trap;    ///< SIGNAL ON traps
    const void                *site = nullptr;  ///< caller site awaiting RETURN
    bool                      fn    = false;    ///< called as a function
    int                       steps = 0;        ///< clauses completed
    map<const void*, Value>   memo;    ///< evaluated sites of the current clause
    map<const void*, Result>  reply;   ///< completed dispatches of the current clause
};
struct FnEntry { Fn fn; string owner, desc; vector<string> params; };
struct OpEntry { Op op; string owner, desc; vector<string> params; };
///====================================================================
///
///> Interpreter instance - owns its registries, frames and output
///
struct Interp {
    U32        id;                     ///< instance id for logging
    vm_state   state = STOP;
    Options    opt;
    int        exit_code = 0;
    Value      result;                 ///< EXIT or RETURN value of the program
    string     error;                  ///< fatal condition report
    deque<Value> queue;                ///< external data queue

    map<string, FnEntry>  fns;         ///< module and host functions
    map<string, OpEntry>  ops;         ///< module and host operations
    shared_ptr<Targets>   targets;     ///< may be shared between instances
    Loader                loader;

    function<void(int, const char*)> fout_cb;   ///< script output
    function<void(int, const char*)> ferr_cb;   ///< errors and trace
    function<bool(string&)>          fin_cb;    ///< PULL from an empty queue

    Interp(Channel *ch=nullptr, shared_ptr<Targets> tgts=nullptr);
    Interp(const Interp&) = delete;                  ///< owns its frames and programs
    Interp &operator=(const Interp&) = delete;
    ~Interp();
    ///
    /// host interface
    ///
    void     load(const string &src, const string &fname="", const Args &args={});
    vm_state run();                                  ///< run until STOP or HOLD
    vm_state run(const string &src, const string &fname="");
    vm_state resume(const Response &rs);             ///< channel delivery
    void     halt() { halted = true; }
    U32      pending() const { return hold.id; }
    size_t   fragments() const { return frag.size(); }   ///< live INTERPRET programs
    Channel  &channel() { return *ch; }

    void     add_function(const string &n, Fn fn, const string &owner="host");
    void     add_operation(const string &n, Op op, const string &owner="host");
    void     add_target(TargetP t, const string &as="", const string &auth="",
                        const string &owner="host");

    void     set(const string &n, const Value &v);   ///< main pool access
    Value    get(const string &n);
    bool     has(const string &n);
    ///
    /// engine internals
    ///
    Frame    &top() { return *rs[-1]; }
    Value    eval(Expr *x);
    Value    fetch(const string &n, bool raise=true);
    bool     peek(const string &n, Value &v, Pool *pl=nullptr);   ///< read without NOVALUE
    void     assign(const string &n, const Value &v, Pool *pl=nullptr);
    void     drop(const string &n);
    bool     truth(const Value &v);
    bool     trapped(const string &cond);
    Value    expand(const string &s);                ///< interpolation
    Result   dispatch(const void *site, const string &tgt, const string &cmd,
                      const Params &p, bool method);
    void     publish(Pool &pool, const Result &r);
    void     switch_target(Frame &f, const string &n, const string &auth="",
                           const string &alias="");
    Binding  *binding(const string &n);
    string   target_name(Frame &f) const { return f.addr.empty() ? "DEFAULT" : f.addr; }
    void     say(const string &s);                   ///< script output
    void     diag(const char *fmt, ...);             ///< diagnostics
    bool     pull(string &s);                        ///< queue or input

    struct CondInfo { string name, desc, instr; } cinfo;  ///< CONDITION() data
    int      line = 0;                               ///< clause being executed

private:
    Channel          *ch;
    Channel          own;              ///< used when no channel is shared
    Program          *prog = nullptr;
    FV<Program*>     frag;             ///< INTERPRET fragments
    FV<Frame*>       rs;               ///< frame stack
    struct Hold { U32 id = 0; const void *site = nullptr; size_t depth = 0; } hold;
    bool             halted = false;
    bool             no_interp = false;  ///< NO-INTERPRET seen
    static U32       next_id;

    void   step(Frame &f);
    void   exec(Frame &f, Stmt *s);
    bool   loop_step(Frame &f, Cursor &c);
    void   end_block(Frame &f);
    void   next(Frame &f) { f.cs[-1].pc++; }
    void   jump(Frame &f, const string &label);
    void   ret(Frame &f, const Value *v);
    void   leave(Frame &f, const string &var, bool iterate);
    bool   call(const void *site, const string &n, Args &a, bool fn, bool quoted, Value &v);
    void   raise(Condition &c);
    void   fatal(const Condition &c);
    void   failed(const Result &r);
    void   trace(Stmt *s, const Program *pg);
    void   sweep();                    ///< free fragments no cursor runs in
    void   parse_tpl(const string &s, const Template &t);
    void   do_parse(Frame &f, Parse &p);
    void   do_address(Frame &f, Address &a);
    void   do_numeric(Numeric &n);
    void   do_clause(Frame &f, Clause &c);
    Value  invoke(Call &c);
    Value  binary(Bin &b);
    Value  pipe(Bin &b);
    void   complete(Frame &f, const void *site, Result &r);
};
///
///> Built-in functions
///
typedef Value (*BifFn)(Interp &rx, Args &a);
struct Bif {
    const char *name;
    BifFn      fn;
    S8         lo, hi;                 ///< argument count range, -1 unbounded
};
const Bif *find_bif(const string &n);
Trap      *find_trap(Frame &f, const string &cond);   ///< trap taking cond in f
bool      valid_pattern(const string &n);             ///< interpolation pattern name
///
///> System interface
///
void default_io(Interp &rx);            ///< stdout, stderr and stdin hooks
bool read_file(const string &fn, string &src);
#endif  // __CEREXX_SRC_CEREXX_H
