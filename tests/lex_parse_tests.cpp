#include "rx_test.h"

static Expr *expr_of(Stmt *s) {
    if (s->kind == S_ASSIGN) return ((Assign*)s)->x;
    return ((Xst*)s)->x;
}

static void test_quote_forms() {
    FV<Token> tk = lex("say \"a\"\"b\" 'it''s' `x\"y'z`");
    assert(tk[0].kind == T_KEY && tk[0].text == "SAY");
    assert(tk[1].kind == T_STR && tk[1].q == Q_DOUBLE && tk[1].text == "a\"b");
    assert(tk[2].kind == T_STR && tk[2].q == Q_SINGLE && tk[2].text == "it's");
    assert(tk[3].kind == T_STR && tk[3].q == Q_BACK   && tk[3].text == "x\"y'z");
    assert(tk[3].blank);
    assert(tk[4].kind == T_EOC);
    assert(tk[5].kind == T_EOF);
}

static void test_empty_literals() {
    Program *pg = parse("\"\"\n''\n``\n");
    assert(pg->body.size() == 3);
    for (Stmt *s : pg->body) {
        assert(s->kind == S_COMMAND);
        Lit *l = (Lit*)expr_of(s);
        assert(l->kind == X_LIT && l->text.empty());
    }
    delete pg;
}

static void test_heredoc_verbatim() {
    const string body = "  line \"one\n\n'two' `\n  EOT2";
    const string src  = "x = <<EOT\n" + body + "\nEOT\nsay x\n";
    Program *pg = parse(src);
    assert(pg->body.size() == 2);
    Lit *l = (Lit*)expr_of(pg->body[0]);
    assert(l->q == Q_HEREDOC);
    assert(l->text == body);
    delete pg;

    /// re-serialize the raw token and parse again
    FV<Token> tk = lex(src);
    string again = "x = " + tk[2].raw + "\nsay x\n";
    Program *p2 = parse(again);
    assert(((Lit*)expr_of(p2->body[0]))->text == body);
    delete p2;
}

static void test_heredoc_errors() {
    bool threw = false;
    try { delete parse("say 1\nx = <<END\nabc\n"); }
    catch (SyntaxError &e) {
        threw = true;
        assert(e.pos.line == 2);
    }
    assert(threw);

    Program *pg = parse("x = 'a' << 'b'\n");   /// * not last on its line
    Bin *b = (Bin*)expr_of(pg->body[0]);
    assert(b->kind == X_BIN && b->op == OP_SLT);
    delete pg;
}

static void test_syntax_error_position() {
    bool threw = false;
    try { delete parse("say 1\nsay (1 +\n"); }
    catch (SyntaxError &e) {
        threw = true;
        assert(e.pos.line == 2);
        assert(e.pos.col > 0);
    }
    assert(threw);

    threw = false;
    try { delete parse("do\nfoo:\nend\n"); }
    catch (SyntaxError &) { threw = true; }
    assert(threw);
}

static void test_keywords_by_position() {
    Program *pg = parse("say = 1\nif = 2\nsay say\n");
    assert(pg->body[0]->kind == S_ASSIGN && ((Assign*)pg->body[0])->name == "SAY");
    assert(pg->body[1]->kind == S_ASSIGN && ((Assign*)pg->body[1])->name == "IF");
    assert(pg->body[2]->kind == S_SAY);
    delete pg;
}

static void test_comments_and_continuation() {
    Program *pg = parse("/* a /* nested */ b */ say 1 -- trailing\nsay 1,\n  2\n");
    assert(pg->body.size() == 2);
    Bin *b = (Bin*)expr_of(pg->body[1]);
    assert(b->kind == X_BIN && b->op == OP_BCAT);
    delete pg;
}

static void test_if_forms() {
    Program *pg = parse("if 1 then\n  say 'a'\n  say 'b'\nelse\n  say 'c'\nendif\n"
                        "if 0 then say 'x'\nelse say 'y'\n");
    assert(pg->body.size() == 2);
    If *a = (If*)pg->body[0];
    assert(a->then.size() == 2 && a->els.size() == 1);
    If *c = (If*)pg->body[1];
    assert(c->then.size() == 1 && c->els.size() == 1);
    delete pg;
}

static void test_clauses() {
    Program *pg = parse("store name='bob' age=3\nlookup(1, 2)\nrefresh\n\"cmd\" x\n");
    Clause *c = (Clause*)pg->body[0];
    assert(c->kind == S_CLAUSE && c->name == "STORE");
    assert(c->keys.size() == 2 && c->keys[0] == "NAME" && c->keys[1] == "AGE");
    Clause *d = (Clause*)pg->body[1];
    assert(d->kind == S_CLAUSE && d->keys.empty() && d->args.size() == 2);
    assert(pg->body[2]->kind == S_CLAUSE);
    assert(pg->body[3]->kind == S_COMMAND);
    delete pg;
}

static void test_address_and_require() {
    Program *pg = parse("address db auth 'tok' as db2 \"select\"\nrequire 'registry:m' as m_\n");
    Address *a = (Address*)pg->body[0];
    assert(a->name == "DB" && a->alias == "DB2" && a->auth && a->cmd);
    Require *r = (Require*)pg->body[1];
    assert(r->as == "M_");
    delete pg;
}

static void test_pipe() {
    Program *pg = parse("x = 'a b' |> upper |> substr(_, 2)\n"
                        "y = 3\n"
                        "  |> abs\n"
                        "say y\n");
    assert(pg->body.size() == 3);
    Bin *b = (Bin*)expr_of(pg->body[0]);
    assert(b->kind == X_BIN && b->op == OP_PIPE && b->r->kind == X_CALL);
    Bin *l = (Bin*)b->l;
    assert(l->kind == X_BIN && l->op == OP_PIPE && l->r->kind == X_SYM);
    Bin *c = (Bin*)expr_of(pg->body[1]);                /// * next line starts with |>
    assert(c->kind == X_BIN && c->op == OP_PIPE);
    delete pg;

    bool threw = false;
    try { delete parse("say 'a' |> 5\n"); }
    catch (SyntaxError &) { threw = true; }
    assert(threw);
}

static void test_exit_unless_and_no_interpret() {
    Program *pg = parse("exit 2 unless ok, 'not ok'\n"
                        "exit unless ok, 'm'\n"
                        "exit 3\n"
                        "no-interpret\n"
                        "NO_INTERPRET\n"
                        "no = 1\n");
    assert(pg->body.size() == 6);
    Unless *u = (Unless*)pg->body[0];
    assert(u->kind == S_UNLESS && u->x && u->cond && u->msg);
    Unless *v = (Unless*)pg->body[1];
    assert(v->kind == S_UNLESS && !v->x);
    assert(pg->body[2]->kind == S_EXIT);
    assert(pg->body[3]->kind == S_NOINTERP);
    assert(pg->body[4]->kind == S_NOINTERP);
    assert(pg->body[5]->kind == S_ASSIGN);
    delete pg;
}

static void test_errors_inside_constructs() {
    const char *bad[] = {
        "if a = 1 then do\n  x = (1 +\nend\n",
        "do i = 1 to 3\n  say substr('a', 1\nend\n",
        "select\n  when 1 then say 'a' 'b' (\nend\n",
        "x = 1 + 2 * (3 - \n",
        "parse var\n",
        "address db auth 'x' as\n",
        "call f 1, (2\n",
        "store a=1 b\n",
        "signal on nothing\n",
        "exit 1 unless ok 'no comma'\n",
        "numeric digits (\n",
        "require 'm' as\n",
    };
    for (const char *src : bad) {
        bool threw = false;
        try { delete parse(src); }
        catch (SyntaxError &) { threw = true; }
        assert(threw);
    }
}

int main() {
    test_quote_forms();
    test_empty_literals();
    test_heredoc_verbatim();
    test_heredoc_errors();
    test_syntax_error_position();
    test_keywords_by_position();
    test_comments_and_continuation();
    test_if_forms();
    test_clauses();
    test_address_and_require();
    test_pipe();
    test_exit_unless_and_no_interpret();
    test_errors_inside_constructs();
    printf("lex_parse_tests: ok\n");
    return 0;
}
