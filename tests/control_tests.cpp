#include "rx_test.h"

static void test_expressions() {
    string out = output_of(
        "say 1 + 2\n"
        "say 'a' || 'b'\n"
        "say 'a' 'b'\n"
        "say 7 % 2 7 // 2\n"
        "say 2 ** 10\n"
        "say 10 / 4\n"
        "say (1 = 1.0) (' a' = 'a ') ('a' == ' a') (3 > 12) ('abc' < 'abd')\n"
        "say \\0 (1 & 0) (1 | 0)\n");
    assert(out == "3\nab\na b\n3 1\n1024\n2.5\n1 1 0 0 1\n1 0 1\n");
}

static void test_do_loops() {
    string out = output_of(
        "do i = 1 to 3\n"
        "  say i\n"
        "end\n"
        "do 2\n"
        "  say 'x'\n"
        "end\n"
        "j = 0\n"
        "do while j < 2\n"
        "  j = j + 1\n"
        "end\n"
        "say j\n"
        "do k = 10 to 1 by -4\n"
        "  say k\n"
        "end\n"
        "do n = 1 for 2\n"
        "  say 'n' n\n"
        "end\n"
        "do until j > 4\n"
        "  j = j + 1\n"
        "end\n"
        "say j\n");
    assert(out == "1\n2\n3\nx\nx\n2\n10\n6\n2\nn 1\nn 2\n5\n");
}

static void test_leave_iterate() {
    string out = output_of(
        "do i = 1 to 5\n"
        "  if i = 2 then iterate\n"
        "  if i = 4 then leave\n"
        "  say i\n"
        "end\n"
        "say 'done' i\n"
        "do a = 1 to 2\n"
        "  do b = 1 to 3\n"
        "    if b = 2 then iterate a\n"
        "    say a b\n"
        "  end\n"
        "end\n");
    assert(out == "1\n3\ndone 4\n1 1\n2 1\n");
}

static void test_do_over_and_select() {
    string out = output_of(
        "s.b = 2\n"
        "s.a = 1\n"
        "do k over s.\n"
        "  say k s.k\n"
        "end\n"
        "x = 2\n"
        "select\n"
        "  when x = 1 then say 'one'\n"
        "  when x = 2 then say 'two'\n"
        "  otherwise say 'many'\n"
        "end\n");
    assert(out == "A 1\nB 2\ntwo\n");

    Script s;
    s.run("x = 9\nselect\n  when x = 1 then nop\nend\n");
    assert(s.rx.exit_code == 7);
}

static void test_if_blocks() {
    string out = output_of(
        "x = 5\n"
        "if x > 3 then\n"
        "  say 'big'\n"
        "  say 'yes'\n"
        "else\n"
        "  say 'small'\n"
        "endif\n"
        "if x < 3 then say 'lt'\n"
        "else say 'ge'\n");
    assert(out == "big\nyes\nge\n");
}

static void test_call_procedure_expose() {
    string out = output_of(
        "a = 1\n"
        "b = 5\n"
        "call bump 10\n"
        "say a b result\n"
        "exit\n"
        "bump: procedure expose a\n"
        "  arg n\n"
        "  a = a + n\n"
        "  b = 99\n"
        "  return a * 2\n");
    assert(out == "11 5 22\n");
}

static void test_function_calls() {
    string out = output_of(
        "say double(4) + 1\n"
        "say 'main' noisy()\n"
        "say length('abc')\n"               /// * built-in wins over the label
        "exit\n"
        "double: procedure\n"
        "  return arg(1) * 2\n"
        "noisy:\n"
        "  say 'in noisy'\n"
        "  return 'r'\n"
        "length:\n"
        "  return 'mine'\n");
    assert(out == "9\nin noisy\nmain r\n3\n");
}

static void test_recursion() {
    string out = output_of(
        "say fact(6)\n"
        "exit\n"
        "fact: procedure\n"
        "  parse arg n\n"
        "  if n <= 1 then return 1\n"
        "  return n * fact(n - 1)\n");
    assert(out == "720\n");
}

static void test_function_without_value() {
    Script s;
    s.run("x = f()\nexit\nf: return\n");
    assert(s.rx.exit_code == 44);
    assert(s.rx.error.find("SYNTAX 44") != string::npos);
}

static void test_signal_on_error_in_loop() {
    string out = output_of(
        "signal on error\n"
        "do i = 1 to 5\n"
        "  say i\n"
        "  if i = 2 then x = 1 / 0\n"
        "end\n"
        "say 'not reached'\n"
        "error:\n"
        "say 'trapped' rc sigl\n"
        "say 'after'\n");
    assert(out == "1\n2\ntrapped 42 4\nafter\n");
}

static void test_signal_on_syntax_in_routine() {
    string out = output_of(
        "signal on syntax\n"
        "call deep\n"
        "say 'no'\n"
        "syntax:\n"
        "say 'caught' rc condition('C')\n"
        "exit\n"
        "deep:\n"
        "  return 'a' + 1\n");
    assert(out == "caught 41 SYNTAX\n");
}

static void test_untrapped_syntax() {
    Script s;
    s.run("say 'ok'\nsay 'a' + 1\nsay 'never'\n");
    assert(s.out == "ok\n");
    assert(s.rx.exit_code == 41);
    assert(s.rx.error.find("SYNTAX 41") != string::npos);
    assert(s.rx.error.find("line 2") != string::npos);
    assert(s.has_err("+++ say 'a' + 1"));
}

static void test_novalue() {
    string out = output_of(
        "say foo\n"
        "signal on novalue\n"
        "say bar\n"
        "say 'skipped'\n"
        "novalue:\n"
        "say 'novalue' condition('D') sigl\n");
    assert(out == "FOO\nnovalue BAR 3\n");

    Script s;
    s.rx.opt.novalue_fatal = true;
    s.rx.load("say bar\nsay 'no'\n");
    s.rx.run();
    assert(s.out.empty());
    assert(s.rx.error.find("NOVALUE") != string::npos);
}

static void test_signal_and_exit() {
    string out = output_of("signal skip\nsay 'no'\nskip: say 'yes'\n");
    assert(out == "yes\n");

    Script s;
    assert(s.run("say 'a'\nexit 3\nsay 'b'\n") == STOP);
    assert(s.out == "a\n");
    assert(s.rx.exit_code == 3);
    assert(s.rx.result.str() == "3");

    Script m;
    m.run("signal nowhere\n");
    assert(m.rx.exit_code == 16);
}

static void test_leave_outside_loop() {
    Script s;
    s.run("leave\n");
    assert(s.rx.exit_code == 28);
}

static void test_halt() {
    Script s;
    s.rx.load("say 'x'\n");
    s.rx.halt();
    s.rx.run();
    assert(s.out.empty());
    assert(s.rx.exit_code == 4);

    Script t;
    t.rx.add_function("stop", [](Interp &rx, Args &) { rx.halt(); return Value(); });
    t.run("signal on halt\ncall stop\nsay 'x'\nhalt: say 'halted'\n");
    assert(t.out == "halted\n");
    assert(t.rx.exit_code == 0);
}

static void test_parse() {
    string out = output_of(
        "parse value 'John Smith 42' with first last age\n"
        "say last first age\n"
        "s = 'key=value;rest'\n"
        "parse var s k '=' v ';' r\n"
        "say k v r\n"
        "parse value 'abcdef' with 3 x +2 y\n"
        "say x y\n"
        "parse upper value 'a b' with p .\n"
        "say p\n"
        "sep = ','\n"
        "parse value 'l,r' with lf (sep) rt\n"
        "say lf rt\n");
    assert(out == "Smith John 42\nkey value rest\ncd ef\nA\nl r\n");

    Script s;
    s.rx.load("parse arg a b\nsay b a\nparse version v\nsay v\n", "t.rx", { Value("one two") });
    s.rx.run();
    assert(s.out == "two one\n" RX_VERSION "\n");
}

static void test_queue() {
    string out = output_of(
        "queue 'a'\n"
        "push 'b'\n"
        "say queued()\n"
        "pull x\n"
        "say x\n"
        "parse pull y\n"
        "say y\n");
    assert(out == "2\nB\na\n");
}

static void test_interpret() {
    string out = output_of(
        "interpret 'say 1+1'\n"
        "x = 'y = 5'\n"
        "interpret x\n"
        "say y\n");
    assert(out == "2\n5\n");

    Script s;
    s.run("interpret 'say (' \n");
    assert(s.rx.exit_code == 35);
}

static void test_numeric() {
    string out = output_of(
        "numeric digits 4\n"
        "say 2 / 3 digits()\n"
        "numeric fuzz 1\n"
        "say (1000 = 1001) fuzz()\n");
    assert(out == "0.6667 4\n1 1\n");

    Script s;
    s.run("numeric digits 99\n");
    assert(s.rx.exit_code == 33);
}

static void test_interpolation() {
    string out = output_of(
        "name = 'World'\n"
        "say \"Hello {name}!\"\n"
        "say 'keep {missing}'\n"
        "call interpolation 'shell'\n"
        "say result \"${name} {name}\"\n");
    assert(out == "Hello World!\nkeep {missing}\ncurly World {name}\n");
}

static void test_heredoc_run() {
    string out = output_of(
        "t = 'users'\n"
        "q = <<SQL\n"
        "SELECT *\n"
        "  FROM {t}\n"
        "SQL\n"
        "say q\n");
    assert(out == "SELECT *\n  FROM users\n");
}

static void test_builtins() {
    string out = output_of(
        "say length('abc') substr('hello', 2, 3) word('a b c', 2) words('a b c')\n"
        "say pos('c', 'abc') left('ab', 4, '.') right('abc', 2) strip('  x  ')\n"
        "say reverse('abc') copies('ab', 2) translate('abc') max(1, 5, 3) abs(-2)\n"
        "say d2x(255) x2d('FF') datatype('12') datatype('x', 'N')\n"
        "say changestr('a', 'banana', 'o') countstr('a', 'banana') center('ab', 6, '*')\n"
        "say trunc(3.789, 1) subword('a b c d', 2, 2) delstr('abcdef', 2, 3)\n"
        "say insert('X', 'abc', 1) lastpos('a', 'banana') wordpos('c d', 'a b c d')\n"
        "say compare('abc', 'abd') sign(-3) min(4, 2) symbol('Q') symbol('NOPE')\n"
        "say value('Q') value('Q', 'new') q\n");
    assert(out ==
        "3 ell b 3\n"
        "3 ab.. bc x\n"
        "cba abab ABC 5 2\n"
        "FF 255 NUM 0\n"
        "bonono 3 **ab**\n"
        "3.7 b c aef\n"
        "aXbc 6 3\n"
        "3 -1 2 LIT LIT\n"
        "Q Q new\n");

    Script s;
    s.run("say length()\n");
    assert(s.rx.exit_code == 40);
}

static void test_trace() {
    Script s;
    s.run("trace r\nsay 1\n");
    assert(s.out == "1\n");
    assert(s.has_err("*-* say 1"));
}

static void test_same_body_each_quote_form() {
    string out = output_of(
        "t = 'x'\n"
        "say `a {t} b`\n"
        "say 'a {t} b'\n"
        "say \"a {t} b\"\n"
        "say <<E\n"
        "a {t} b\n"
        "E\n");
    assert(out == "a x b\na x b\na x b\na x b\n");
}

static void test_interpret_fragments() {
    Script s;
    s.run("do i = 1 to 500\n"
          "  interpret 'x = i + 1; y = x * 2'\n"
          "end\n"
          "interpret 'do j = 1 to 3; interpret ''k = j''; end'\n"
          "say x y k\n");
    assert(s.rx.exit_code == 0);
    assert(s.out == "501 1002 3\n");
    assert(s.rx.fragments() <= 2);                  /// * finished ones are freed

    Script t;
    t.run("n = 0\n"
          "again:\n"
          "signal on syntax\n"
          "n = n + 1\n"
          "if n <= 3 then interpret 'if 1 then do; x = (1 +; end'\n"
          "say 'done' n rc\n"
          "exit\n"
          "syntax:\n"
          "signal again\n");
    assert(t.out == "done 4 35\n");
}

static void test_interpret_lines() {
    Script s;
    s.run("x = 1\ninterpret 'y = 2; z = ''a'' + 1'\n");
    assert(s.rx.exit_code == 41);
    assert(s.rx.error.find("line 2") != string::npos);
    assert(s.has_err("+++ interpret"));

    Script t;
    t.run("trace r\nx = 1\ninterpret 'say 7'\n");
    assert(t.out == "7\n");
    assert(t.has_err("     3 *-* say 7"));
}

static void test_no_interpret() {
    Script s;
    s.run("interpret 'works = 1'\n"
          "no-interpret\n"
          "signal on syntax\n"
          "interpret 'blocked = 1'\n"
          "say 'no'\n"
          "syntax: say 'trapped'\n");
    assert(s.out.empty());
    assert(s.rx.exit_code == 35);
    assert(s.rx.error.find("blocked by NO-INTERPRET") != string::npos);
    assert(s.rx.get("works").str() == "1");
    assert(!s.rx.has("blocked"));

    Script u;
    u.run("NO_INTERPRET\ninterpret 'x = 1'\n");
    assert(u.rx.exit_code == 35);
    u.run("interpret 'x = 1'\nsay x\n");          /// * a new load starts unblocked
    assert(u.rx.exit_code == 0);
    assert(u.out == "1\n");
}

static void test_pipe() {
    string out = output_of(
        "say 'hello' |> upper\n"
        "say '  hello world  ' |> strip |> upper |> length\n"
        "say 'Hello World' |> substr(7, 5)\n"
        "say 5 |> substr('hello world', 1, _)\n"
        "say 5 + 3 |> abs\n"
        "x = 'abc' |> reverse\n"
        "say x\n"
        "n = -3\n"
        "  |> abs\n"
        "  |> double\n"
        "say n\n"
        "exit\n"
        "double: procedure\n"
        "  return arg(1) * 2\n");
    assert(out == "HELLO\n11\nWorld\nhello\n8\ncba\n6\n");

    Script s;
    s.run("say 'a' |> nosuch\n");
    assert(s.rx.exit_code == 43);
}

static void test_exit_unless() {
    Script s;
    s.run("status = 200\n"
          "exit 1 unless status = 200, 'bad status' status\n"
          "say 'reached'\n"
          "exit 2 unless status > 300, 'Status not above 300: ' || status\n"
          "say 'never'\n");
    assert(s.out == "reached\n");
    assert(s.rx.exit_code == 2);
    assert(s.has_err("Status not above 300: 200"));
    assert(!s.has_err("bad status"));

    Script d;
    d.run("exit unless 0, 'stop here'\nsay 'no'\n");
    assert(d.out.empty());
    assert(d.rx.exit_code == 0);
    assert(d.has_err("stop here"));

    Script e;
    e.run("exit 1 unless 'maybe', 'm'\n");
    assert(e.rx.exit_code == 34);
}

int main() {
    test_expressions();
    test_do_loops();
    test_leave_iterate();
    test_do_over_and_select();
    test_if_blocks();
    test_call_procedure_expose();
    test_function_calls();
    test_recursion();
    test_function_without_value();
    test_signal_on_error_in_loop();
    test_signal_on_syntax_in_routine();
    test_untrapped_syntax();
    test_novalue();
    test_signal_and_exit();
    test_leave_outside_loop();
    test_halt();
    test_parse();
    test_queue();
    test_interpret();
    test_numeric();
    test_interpolation();
    test_heredoc_run();
    test_builtins();
    test_trace();
    test_same_body_each_quote_form();
    test_interpret_fragments();
    test_interpret_lines();
    test_no_interpret();
    test_pipe();
    test_exit_unless();
    printf("control_tests: ok\n");
    return 0;
}
