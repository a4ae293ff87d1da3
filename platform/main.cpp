///
/// @file
/// @brief cerexx main program, runs a script file on Desktop PC (Linux)
///
#include <iostream>      // cin, cout
#include <cstring>
#include "../src/cerexx.h"

using namespace std;

const char* APP_VERSION = RX_VERSION;
///====================================================================
///
///> usage
///
void usage(const char *app) {
    cerr << "usage: " << app << " [-I dir]... [-t] [-d digits] [-v] script|- [args...]" << endl;
}
///
///> run to completion, no host answers checkpoints here so they time out
///
int outer(Interp &rx) {
    vm_state st = rx.run();
    while (st == HOLD) {
        delay(10);
        rx.channel().expire();
        st = rx.state;
    }
    return rx.exit_code;
}
///====================================================================
///
/// main program
///
int main(int ac, char* av[]) {
    Options opt;
    int     i = 1;
    for (; i < ac && av[i][0] == '-' && av[i][1]; i++) {
        const char *a = av[i];
        if (!strcmp(a, "-I") && i + 1 < ac)      opt.path.push_back(av[++i]);
        else if (!strncmp(a, "-I", 2))           opt.path.push_back(a + 2);
        else if (!strcmp(a, "-t"))               opt.trace = true;
        else if (!strcmp(a, "-d") && i + 1 < ac) opt.digits = atoi(av[++i]);
        else if (!strcmp(a, "-v"))               { cout << APP_VERSION << endl; return 0; }
        else { usage(av[0]); return 2; }
    }
    if (i >= ac) { usage(av[0]); return 2; }
    if (opt.digits < 1 || opt.digits > RX_MAX_DIGITS) {
        cerr << "digits must be 1.." << RX_MAX_DIGITS << endl;
        return 2;
    }
    string fn(av[i++]), src;
    if (!read_file(fn, src)) {
        cerr << "file " << fn << " open failed!" << endl;
        return 2;
    }
    string arg;                         ///< one argument string, the REXX way
    for (; i < ac; i++) arg += (arg.size() ? " " : "") + string(av[i]);

    Interp rx;
    rx.opt = opt;
    try {
        rx.load(src, fn == "-" ? "<stdin>" : fn, { Value(arg) });
    }
    catch (SyntaxError &e) {
        cerr << fn << ":" << e.pos.line << ":" << e.pos.col << ": syntax error: " << e.what() << endl;
        return 1;
    }
    return outer(rx);
}
///====================================================================
