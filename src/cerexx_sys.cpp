///
/// @file
/// @brief cerexx - system interface, output hooks, trace and diagnostics
///
///====================================================================
#include <fstream>                     /// ifstream
#include <sstream>                     /// stringstream
#include <cstdarg>                     /// va_list
#include "cerexx.h"

using namespace std;
///
///> default hooks: stdout for SAY, stderr for errors and trace, stdin for PULL
///
void default_io(Interp &rx) {
    rx.fout_cb = [](int, const char *s) { printf("%s", s); fflush(stdout); };
    rx.ferr_cb = [](int, const char *s) { fprintf(stderr, "%s", s); };
    rx.fin_cb  = [](string &s) { return (bool)getline(cin, s); };
}
///====================================================================
///
///> IO functions
///
void Interp::say(const string &s) {
    string ln = s + "\n";
    if (fout_cb) fout_cb((int)ln.size(), ln.c_str());
}
void Interp::diag(const char *fmt, ...) {
    char    buf[512];
    va_list ap;
    va_start(ap, fmt);
    int n = vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    if (n < 0) return;
    string s(buf, n < (int)sizeof(buf) ? n : (int)sizeof(buf) - 1);
    if ((size_t)n >= sizeof(buf)) {    /// * long source line, format again
        vector<char> big(n + 1);
        va_start(ap, fmt);
        vsnprintf(big.data(), big.size(), fmt, ap);
        va_end(ap);
        s.assign(big.data(), n);
    }
    if (ferr_cb) ferr_cb((int)s.size(), s.c_str());
}
bool Interp::pull(string &s) {         ///> data queue first, then the input hook
    if (queue.size()) {
        s = queue.front().str();
        queue.pop_front();
        return true;
    }
    s.clear();
    return fin_cb ? fin_cb(s) : false;
}
///
///> TRACE, source line of each clause as it starts, INTERPRET
///> data under the line of its INTERPRET clause
///
void Interp::trace(Stmt *s, const Program *pg) {
    int ln = s->pos.line;
    if (!pg || ln < 1 || ln > (int)pg->lines.size()) return;
    diag("%6d *-* %s\n", pg->at ? pg->at : ln, pg->lines[ln - 1].c_str());
}
///
///> script file, "-" for stdin
///
bool read_file(const string &fn, string &src) {
    stringstream ss;
    if (fn == "-") ss << cin.rdbuf();
    else {
        ifstream in(fn);
        if (!in.is_open()) return false;
        ss << in.rdbuf();
    }
    src = ss.str();
    return true;
}
