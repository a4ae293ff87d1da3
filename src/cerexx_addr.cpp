///
/// @file
/// @brief cerexx - ADDRESS dispatcher and checkpoint channel
///
///====================================================================
#include "cerexx.h"

using namespace std;
///
///> checkpoint channel, requests out to the host, responses back by id
///
U32 Channel::post(Interp &rx, const Checkpoint &ck, U32 dflt_ms) {
    while (!next_id || wait.count(next_id)) next_id++;  /// * never reuse an outstanding id
    U32 id = next_id++;
    U32 ms = ck.timeout_ms ? ck.timeout_ms : dflt_ms;
    wait[id] = { &rx, ms ? millis() + ms : 0 };
    out.push_back({ id, ck.operation, ck.params });
    RX_LOG(&rx, "post #%u %s", id, ck.operation.c_str());
    return id;
}
bool Channel::take(Request &rq) {
    if (out.empty()) return false;
    rq = out.front();
    out.pop_front();
    return true;
}
bool Channel::deliver(const Response &r) {
    auto i = wait.find(r.id);
    if (i == wait.end()) return false;             /// * unknown or already answered
    Interp *rx = i->second.rx;
    withdraw(r.id);
    rx->resume(r);                                 /// * runs to the next STOP or HOLD
    return true;
}
bool Channel::withdraw(U32 id) {
    if (!wait.erase(id)) return false;
    for (auto q = out.begin(); q != out.end(); q++) {
        if (q->id == id) { out.erase(q); break; }
    }
    return true;
}
bool Channel::cancel(U32 id, const string &why) {
    if (!wait.count(id)) return false;
    Response r;
    r.id    = id;
    r.done  = false;
    r.error = "checkpoint cancelled: " + why;
    r.rc    = -1;
    return deliver(r);
}
int Channel::expire(U64 now) {
    vector<U32> due;
    for (auto &w : wait) {
        if (w.second.deadline && w.second.deadline <= now) due.push_back(w.first);
    }
    int n = 0;
    for (U32 id : due) if (cancel(id, "timeout")) n++;
    return n;
}
void Channel::forget(Interp &rx) {
    vector<U32> mine;
    for (auto &w : wait) if (w.second.rx == &rx) mine.push_back(w.first);
    for (U32 id : mine) withdraw(id);
}
///====================================================================
///
///> target registry
///
Binding *Interp::binding(const string &n) {
    if (n.empty()) return nullptr;
    auto i = targets->find(n);
    return i == targets->end() ? nullptr : &i->second;
}
void Interp::add_target(TargetP t, const string &as, const string &auth, const string &owner) {
    string k = upper(as.size() ? as : t->name);
    auto   i = targets->find(k);
    if (i != targets->end() && i->second.owner != owner)
        throw ModuleError("address target " + k + " already provided by " + i->second.owner);
    (*targets)[k] = { t, auth, owner };
}
void Interp::switch_target(Frame &f, const string &n, const string &auth, const string &alias) {
    string k = upper(n);
    if (k.empty() || k == "DEFAULT") { f.addr.clear(); return; }
    Binding *b = binding(k);
    if (!b) throw Condition("SYNTAX", 43, "ADDRESS target not found: " + k);
    if (alias.size()) {                            /// * same handler, own auth context
        string   a = upper(alias);
        Binding *e = binding(a);
        if (e && e->tgt != b->tgt)
            throw Condition("SYNTAX", 43, "ADDRESS alias " + a + " names another target");
        Binding nb = *b;
        nb.auth = auth;
        (*targets)[a] = nb;
        k = a;
    }
    else if (auth.size()) b->auth = auth;
    f.addr = k;
}
///
///> RC, RESULT and ERRORTEXT after a dispatch
///
void Interp::publish(Pool &pool, const Result &r) {
    pool.set("RC", r.success ? "0" : to_string(r.status ? r.status : 1));
    pool.set("RESULT", r.output);
    if (r.success) pool.drop("ERRORTEXT");
    else           pool.set("ERRORTEXT", r.error);
}
void Interp::complete(Frame &f, const void *site, Result &r) {
    if (!r.success && !r.status) r.status = 1;
    f.reply[site] = r;
    publish(f.pool, r);
}
///
///> send a command or method call to a target, suspend on a checkpoint
///
Result Interp::dispatch(const void *site, const string &tn, const string &cmd,
                        const Params &p, bool method) {
    Frame &f = top();
    auto   d = f.reply.find(site);
    if (d != f.reply.end()) return d->second;      /// * completed on an earlier pass

    Binding *b = binding(tn);
    if (!b) throw Condition("SYNTAX", 43, "ADDRESS target not found: " + tn);
    Target &t = *b->tgt;
    Reply  rp;
    if (method ? !t.has(cmd) : !t.cmd_ok) {
        rp = Reply::fail("target " + tn + (method ? " has no method " + cmd : " accepts no commands"));
    }
    else {
        try {
            Context ctx { *this, b->auth, line, method };
            rp = t.handle(cmd, p, ctx);
        }
        catch (exception &e) { rp = Reply::fail(e.what()); }
    }
    if (rp.pending) {
        hold.id    = ch->post(*this, rp.ckpt, opt.timeout_ms);
        hold.site  = site;
        hold.depth = rs.size();
        state      = HOLD;
        RX_LOG(this, "hold #%u at line %d", hold.id, line);
        throw Yield();
    }
    complete(f, site, rp.result);
    return rp.result;
}
///
///> host delivery, completes the held clause and runs on
///
vm_state Interp::resume(const Response &r) {
    if (state != HOLD || r.id != hold.id)
        throw logic_error("no checkpoint #" + to_string(r.id) + " pending");
    ch->withdraw(r.id);                            /// * one response per request
    Result res;
    res.success = r.done;
    res.output  = r.result.str();
    res.error   = r.done ? "" : r.error;
    res.status  = r.rc ? r.rc : (r.done ? 0 : 1);
    complete(*rs[(int)hold.depth - 1], hold.site, res);
    RX_LOG(this, "resume #%u rc=%d", hold.id, res.status);
    hold  = Hold();
    state = QUERY;
    return run();
}
///
///> ADDRESS [name [AUTH x] [AS alias] [command]]
///
void Interp::do_address(Frame &f, Address &a) {
    if (a.name.empty()) { next(f); f.addr.clear(); return; }
    Value auth = a.auth ? eval(a.auth) : Value();
    switch_target(f, a.name, auth.str(), a.alias);  /// * idempotent on replay
    if (!a.cmd) { next(f); return; }

    Binding *b = binding(f.addr);
    string  cmd;
    if (b && !b->tgt->interp && a.cmd->kind == X_LIT) cmd = ((Lit*)a.cmd)->text;
    else cmd = eval(a.cmd).str();
    if (!b) { next(f); say(cmd); publish(f.pool, Result()); return; }
    Result r = dispatch(&a, f.addr, cmd, Params(), false);
    next(f);
    failed(r);
}
