#include "rx_test.h"

///
///> a target answering every command with a checkpoint
///
struct Async : Target {
    int calls = 0;
    Async() : Target("svc") {}
    Reply handle(const string &cmd, const Params &, Context &) override {
        calls++;
        U32 ms = cmd == "quick" ? 5 : 0;
        return Reply::wait(cmd, { { "cmd", Value(cmd) } }, ms);
    }
};

static Response answer(U32 id, const string &out) {
    Response r;
    r.id     = id;
    r.result = Value(out);
    return r;
}

static void test_out_of_order_delivery() {
    Channel ch;
    auto reg = make_shared<Targets>();
    auto svc = make_shared<Async>();
    Script a(&ch, reg), b(&ch, reg);
    a.rx.add_target(svc);                           /// * b sees it through the shared registry

    assert(a.run("address svc\nx = 'first'\n\"get {x}\"\nsay 'A' rc result\n") == HOLD);
    assert(b.run("address svc\n\"fetch\"\nsay 'B' rc result\n") == HOLD);
    U32 ia = a.rx.pending(), ib = b.rx.pending();
    assert(ia && ib && ia != ib);
    assert(ch.outstanding() == 2);

    Request r1, r2;
    assert(ch.take(r1) && ch.take(r2));
    assert(r1.id == ia && r1.operation == "get first");
    assert(r1.params.size() == 1 && r1.params[0].second.str() == "get first");
    assert(r2.id == ib && r2.operation == "fetch");
    assert(!ch.take(r1));

    assert(ch.deliver(answer(ib, "bval")));         /// * second one first
    assert(b.rx.state == STOP && b.out == "B 0 bval\n");
    assert(a.rx.state == HOLD && a.out.empty());

    assert(ch.deliver(answer(ia, "aval")));
    assert(a.rx.state == STOP && a.out == "A 0 aval\n");
    assert(!ch.deliver(answer(ia, "again")));       /// * already answered
    assert(ch.outstanding() == 0);
}

static void test_replay_runs_once() {
    Channel ch;
    Script s(&ch);
    auto svc = make_shared<Async>();
    int  ticks = 0;
    s.rx.add_target(svc);
    s.rx.add_function("tick", [&ticks](Interp &, Args &) {
        ticks++;
        return Value(to_string(ticks));
    });
    assert(s.run("say 'before'\n"
                 "address svc\n"
                 "\"run\" tick()\n"
                 "say 'after' result\n") == HOLD);
    assert(s.out == "before\n");
    Request rq;
    assert(ch.take(rq) && rq.operation == "run 1");

    assert(s.rx.resume(answer(rq.id, "done")) == STOP);
    assert(s.out == "before\nafter done\n");
    assert(ticks == 1);
    assert(svc->calls == 1);
}

static void test_direct_resume() {
    Channel ch;
    Script s(&ch);
    s.rx.add_target(make_shared<Async>());
    assert(s.run("address svc\n\"run\"\nsay rc result\n") == HOLD);
    U32 id = s.rx.pending();
    assert(ch.outstanding() == 1);

    assert(s.rx.resume(answer(id, "ok")) == STOP);  /// * host answers without the channel
    assert(s.out == "0 ok\n");
    assert(ch.outstanding() == 0);
    Request rq;
    assert(!ch.take(rq));
    assert(ch.expire(millis() + 60000) == 0);
    assert(!ch.cancel(id, "late"));
    assert(!ch.deliver(answer(id, "again")));
    assert(s.out == "0 ok\n");
}

static void test_checkpoint_in_routine() {
    Channel ch;
    Script s(&ch);
    s.rx.add_target(make_shared<Async>());
    assert(s.run("address svc\n"
                 "say fetch(2) + 1\n"
                 "exit\n"
                 "fetch: procedure\n"
                 "  \"value\" arg(1)\n"
                 "  return result * 10\n") == HOLD);
    Request rq;
    assert(ch.take(rq) && rq.operation == "value 2");
    ch.deliver(answer(rq.id, "4"));
    assert(s.rx.state == STOP);
    assert(s.out == "41\n");
}

static void test_cancel() {
    Channel ch;
    Script s(&ch);
    s.rx.add_target(make_shared<Async>());
    s.run("address svc\n\"slow\"\nsay rc errortext\n");
    assert(ch.cancel(s.rx.pending(), "user abort"));
    assert(s.out == "-1 checkpoint cancelled: user abort\n");

    Script t(&ch);
    t.rx.add_target(make_shared<Async>());
    t.run("signal on failure\n"
          "address svc\n"
          "\"slow\"\n"
          "say 'no'\n"
          "failure:\n"
          "say 'failed' rc errortext\n");
    assert(ch.cancel(t.rx.pending(), "user abort"));
    assert(t.out == "failed -1 checkpoint cancelled: user abort\n");
}

static void test_timeout() {
    Channel ch;
    Script s(&ch);
    s.rx.add_target(make_shared<Async>());
    s.run("address svc\n\"quick\"\nsay rc errortext\n");
    assert(ch.expire(millis() - 1000) == 0);        /// * not yet due
    assert(ch.expire(millis() + 60000) == 1);
    assert(s.out == "-1 checkpoint cancelled: timeout\n");

    Script d(&ch);
    d.rx.opt.timeout_ms = 0;                        /// * no default, waits for ever
    d.rx.add_target(make_shared<Async>());
    d.run("address svc\n\"slow\"\n");
    assert(ch.expire(millis() + 60000) == 0);
    assert(d.rx.state == HOLD);
}

static void test_forget_on_destroy() {
    Channel ch;
    {
        Script s(&ch);
        s.rx.add_target(make_shared<Async>());
        assert(s.run("address svc\n\"slow\"\n") == HOLD);
        assert(ch.outstanding() == 1);
    }
    Request rq;
    assert(ch.outstanding() == 0);
    assert(!ch.take(rq));
}

static void test_wrong_resume() {
    Channel ch;
    Script s(&ch);
    s.rx.add_target(make_shared<Async>());
    s.run("address svc\n\"slow\"\n");
    bool threw = false;
    try { s.rx.resume(answer(s.rx.pending() + 100, "x")); }
    catch (logic_error &) { threw = true; }
    assert(threw);
    assert(s.rx.state == HOLD);
}

int main() {
    test_out_of_order_delivery();
    test_replay_runs_once();
    test_direct_resume();
    test_checkpoint_in_routine();
    test_cancel();
    test_timeout();
    test_forget_on_destroy();
    test_wrong_resume();
    printf("checkpoint_tests: ok\n");
    return 0;
}
