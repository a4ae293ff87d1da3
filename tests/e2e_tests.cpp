#include "rx_test.h"

///
///> an in-memory SQL stand-in keeping the statements it ran
///
struct Sql : Target {
    vector<string> log;
    Sql() : Target("sql", true, true) { methods = { "COUNT" }; }
    Reply handle(const string &cmd, const Params &p, Context &ctx) override {
        if (ctx.method) return Reply::done(to_string(log.size()));
        (void)p;
        if (cmd.find("DROP") == 0) return Reply::fail("DROP not allowed", 3);
        log.push_back(cmd);
        return Reply::done("1 row");
    }
};
static void detect_text(ModuleDecl &m) {
    m.id = "text";
    m.fn("quote", [](Interp &, Args &a) { return Value("'" + a[0].str() + "'"); });
}

static void test_migration_script() {
    Channel ch;
    Script  s(&ch);
    auto    sql = make_shared<Sql>();
    s.rx.add_target(sql);
    s.rx.add_target(make_shared<FnTarget>("ask", [](const string &q, const Params &, Context &) {
        return Reply::wait("confirm", { { "question", Value(q) } });
    }));
    s.rx.loader.enroll("text", detect_text);

    vm_state st = s.run(
        "require 'registry:text'\n"
        "LET t = \"x\"\n"
        "address sql\n"
        "\"CREATE TABLE {t}_a (id INTEGER)\"\n"
        "names.1 = 'ann'; names.2 = 'bob'; names.0 = 2\n"
        "do i = 1 to names.0\n"
        "  n = quote(names.i)\n"
        "  \"INSERT INTO {t}_a VALUES ({i}, {n})\"\n"
        "end\n"
        "signal on error\n"
        "address ask \"drop old tables?\"\n"
        "if result = 'yes' then address sql \"DROP TABLE old\"\n"
        "say 'unreachable'\n"
        "error:\n"
        "say 'refused' rc errortext\n"
        "address sql\n"
        "say count() 'statements'\n"
        "q = <<SQL\n"
        "SELECT *\n"
        "  FROM {t}_a\n"
        "SQL\n"
        "address sql q\n"
        "exit 0\n");
    assert(st == HOLD);
    assert(sql->log.size() == 3);
    assert(sql->log[0] == "CREATE TABLE x_a (id INTEGER)");
    assert(sql->log[1] == "INSERT INTO x_a VALUES (1, 'ann')");
    assert(sql->log[2] == "INSERT INTO x_a VALUES (2, 'bob')");

    Request rq;
    assert(ch.take(rq) && rq.operation == "confirm");
    assert(rq.params[0].second.str() == "drop old tables?");
    Response r;
    r.id     = rq.id;
    r.result = Value("yes");
    assert(ch.deliver(r));

    assert(s.rx.state == STOP);
    assert(s.rx.exit_code == 0);
    assert(s.out == "refused 3 DROP not allowed\n3 statements\n");
    assert(sql->log.size() == 4);
    assert(sql->log[3] == "SELECT *\n  FROM x_a");
}

static void test_independent_instances() {
    Script a, b;
    a.run("x = 1\nsay x\n");
    b.run("say x\n");
    assert(a.out == "1\n");
    assert(b.out == "X\n");                         /// * pools are private
}

int main() {
    test_migration_script();
    test_independent_instances();
    printf("e2e_tests: ok\n");
    return 0;
}
