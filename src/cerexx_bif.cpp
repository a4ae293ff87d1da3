///
/// @file
/// @brief cerexx - built-in functions dictionary
///
///====================================================================
#include <cmath>
#include <cstring>
#include <ctime>
#include <random>
#include <sys/time.h>                  /// gettimeofday
#include "cerexx.h"

using namespace std;
///
///> argument helpers, any misuse is SYNTAX 40
///
static Condition bad(const char *fn, const string &why) {
    return Condition("SYNTAX", 40, string("Incorrect call to routine ") + fn + ": " + why);
}
static S64 int_arg(Args &a, int i, const char *fn, S64 dflt=0) {
    if (i >= (int)a.size()) return dflt;
    S64 n;
    if (!a[i].whole(n)) throw bad(fn, "argument " + to_string(i + 1) + " must be a whole number");
    return n;
}
static S64 len_arg(Args &a, int i, const char *fn, S64 dflt=0) {  ///> non-negative
    S64 n = int_arg(a, i, fn, dflt);
    if (n < 0) throw bad(fn, "argument " + to_string(i + 1) + " must be zero or positive");
    return n;
}
static S64 pos_arg(Args &a, int i, const char *fn, S64 dflt=1) {  ///> positive
    S64 n = int_arg(a, i, fn, dflt);
    if (n < 1) throw bad(fn, "argument " + to_string(i + 1) + " must be positive");
    return n;
}
static double number(Args &a, int i, const char *fn) {
    double d;
    if (!a[i].num(d)) throw bad(fn, "argument " + to_string(i + 1) + " must be a number");
    return d;
}
static char pad(Args &a, int i, const char *fn) {
    if (i >= (int)a.size()) return ' ';
    if (a[i].str().size() != 1) throw bad(fn, "pad must be a single character");
    return a[i].str()[0];
}
static char option(Args &a, int i, const char *fn, char dflt, const char *ok) {
    if (i >= (int)a.size() || a[i].empty()) return dflt;
    char c = (char)toupper((U8)a[i].str()[0]);
    if (!strchr(ok, c)) throw bad(fn, string("option must be one of ") + ok);
    return c;
}
static Value num(Interp &rx, double v) { return Value(num_fmt(v, rx.opt.digits, rx.opt.eng)); }
static Value flag(bool t)              { return Value(t ? "1" : "0"); }
///
///> blank delimited words as (start, length)
///
static vector<pair<size_t, size_t>> spans(const string &s) {
    vector<pair<size_t, size_t>> w;
    size_t i = 0;
    while (true) {
        size_t b = s.find_first_not_of(' ', i);
        if (b == string::npos) break;
        size_t e = s.find(' ', b);
        if (e == string::npos) e = s.size();
        w.push_back({ b, e - b });
        i = e;
    }
    return w;
}
static bool is_symbol(const string &s) {
    if (s.empty()) return false;
    for (char c : s) if (!isalnum((U8)c) && !strchr("_.!?@#$", c)) return false;
    return true;
}
static string datatype(const string &s, char t) {
    double d;
    S64    n;
    Value  v(s);
    auto all = [&s](int (*f)(int)) {
        if (s.empty()) return false;
        for (char c : s) if (!f((U8)c)) return false;
        return true;
    };
    switch (t) {
    case 'A': return all(isalnum) ? "1" : "0";
    case 'B': return (s.size() && s.find_first_not_of("01") == string::npos) ? "1" : "0";
    case 'L': return all(islower) ? "1" : "0";
    case 'M': return all(isalpha) ? "1" : "0";
    case 'N': return v.num(d) ? "1" : "0";
    case 'S': return is_symbol(s) ? "1" : "0";
    case 'U': return all(isupper) ? "1" : "0";
    case 'W': return v.whole(n) ? "1" : "0";
    case 'X': return (s.size() && all(isxdigit)) ? "1" : "0";
    default:  return v.num(d) ? "NUM" : "CHAR";
    }
}
static string trunc_to(double x, int d) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.*f", d + 6, x);
    string s(buf);
    size_t p = s.find('.');
    s = d ? s.substr(0, p + 1 + d) : s.substr(0, p);
    if (s == "-0" || s.find_first_not_of("-0.") == string::npos) {
        if (s[0] == '-') s.erase(0, 1);
    }
    return s;
}
static mt19937 &rng() {
    static mt19937 g((U32)time(NULL));
    return g;
}
///
///> macros to reduce verbosity, a degenerated lambda becomes a function pointer
///
#define BIF(s, lo, hi, ...)                                                   \
    { s, [](Interp &rx, Args &a) -> Value {                                    \
        const char *fn = s; (void)fn; (void)rx; __VA_ARGS__; }, lo, hi }
#define S(i)              (a[i].str())
#define LEN()             ((int)a.size())
///
///> Built-in dictionary, sorted by name
///
static const Bif rom[] = {
    BIF("ABS",       1, 1, return num(rx, fabs(number(a, 0, fn)))),
    BIF("ADDRESS",   0, 0, return Value(rx.target_name(rx.top()))),
    BIF("ARG",       0, 2,
        Args &g = rx.top().args;
        if (!LEN()) return Value(to_string(g.size()));
        S64  n = pos_arg(a, 0, fn);
        bool has = n <= (S64)g.size();
        if (LEN() == 1) return has ? g[n - 1] : Value();
        char o = option(a, 1, fn, 'E', "EO");
        return flag(o == 'E' ? has : !has)),
    BIF("CENTER",    2, 3,
        S64    n = len_arg(a, 1, fn);
        char   p = pad(a, 2, fn);
        string s = S(0);
        if ((S64)s.size() >= n) {
            size_t l = (s.size() - n) / 2;
            return Value(s.substr(l, n));
        }
        size_t l = (n - s.size()) / 2;
        return Value(string(l, p) + s + string(n - s.size() - l, p))),
    BIF("CHANGESTR", 3, 3,
        const string &o = S(0);
        const string &s = S(1);
        if (o.empty()) return a[1];
        string r;
        size_t i = 0, k;
        while ((k = s.find(o, i)) != string::npos) { r += s.substr(i, k - i) + S(2); i = k + o.size(); }
        return Value(r + s.substr(i))),
    BIF("COMPARE",   2, 3,
        char   p = pad(a, 2, fn);
        string x = S(0), y = S(1);
        size_t n = max(x.size(), y.size());
        x.resize(n, p); y.resize(n, p);
        for (size_t i = 0; i < n; i++) if (x[i] != y[i]) return Value(to_string(i + 1));
        return Value("0")),
    BIF("CONDITION", 0, 1,
        char o = option(a, 0, fn, 'I', "CDIS");
        switch (o) {
        case 'C': return Value(rx.cinfo.name);
        case 'D': return Value(rx.cinfo.desc);
        case 'S': return Value(rx.cinfo.name.size() ? "OFF" : "");
        default:  return Value(rx.cinfo.instr);
        }),
    BIF("COPIES",    2, 2,
        S64    n = len_arg(a, 1, fn);
        string r;
        for (S64 i = 0; i < n; i++) r += S(0);
        return Value(r)),
    BIF("COUNTSTR",  2, 2,
        const string &o = S(0);
        if (o.empty()) return Value("0");
        int    n = 0;
        size_t i = 0;
        while ((i = S(1).find(o, i)) != string::npos) { n++; i += o.size(); }
        return Value(to_string(n))),
    BIF("D2X",       1, 2,
        S64 n = int_arg(a, 0, fn);
        if (n < 0 && LEN() < 2) throw bad(fn, "negative number needs a length");
        char buf[24];
        snprintf(buf, sizeof(buf), "%llX", (unsigned long long)n);
        string s(buf);
        if (LEN() == 2) {
            size_t l = (size_t)len_arg(a, 1, fn);
            if (s.size() > l) s = s.substr(s.size() - l);
            else s = string(l - s.size(), n < 0 ? 'F' : '0') + s;
        }
        return Value(s)),
    BIF("DATATYPE",  1, 2,
        if (LEN() == 1) return Value(datatype(S(0), 0));
        return Value(datatype(S(0), option(a, 1, fn, 'N', "ABLMNSUWX")))),
    BIF("DATE",      0, 1,
        static const char *MON[] = { "Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                     "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" };
        static const char *MONTH[] = { "January", "February", "March", "April", "May", "June", "July",
                                       "August", "September", "October", "November", "December" };
        static const char *DAY[] = { "Sunday", "Monday", "Tuesday", "Wednesday",
                                     "Thursday", "Friday", "Saturday" };
        char   o = option(a, 0, fn, 'N', "BDEMNOSUW");
        time_t t = time(NULL);
        struct tm tm;
        localtime_r(&t, &tm);
        char buf[64];
        switch (o) {
        case 'B': snprintf(buf, sizeof(buf), "%ld", (long)(t / 86400) + 719162L); break;
        case 'D': snprintf(buf, sizeof(buf), "%d", tm.tm_yday + 1);                break;
        case 'E': strftime(buf, sizeof(buf), "%d/%m/%y", &tm);                     break;
        case 'M': snprintf(buf, sizeof(buf), "%s", MONTH[tm.tm_mon]);              break;
        case 'O': strftime(buf, sizeof(buf), "%y/%m/%d", &tm);                     break;
        case 'S': strftime(buf, sizeof(buf), "%Y%m%d", &tm);                       break;
        case 'U': strftime(buf, sizeof(buf), "%m/%d/%y", &tm);                     break;
        case 'W': snprintf(buf, sizeof(buf), "%s", DAY[tm.tm_wday]);               break;
        default:
            snprintf(buf, sizeof(buf), "%d %s %d", tm.tm_mday, MON[tm.tm_mon], tm.tm_year + 1900);
            break;
        }
        return Value(buf)),
    BIF("DELSTR",    2, 3,
        size_t n = (size_t)pos_arg(a, 1, fn);
        string s = S(0);
        if (n > s.size()) return a[0];
        size_t l = LEN() == 3 ? (size_t)len_arg(a, 2, fn) : string::npos;
        return Value(s.erase(n - 1, l))),
    BIF("DELWORD",   2, 3,
        size_t n = (size_t)pos_arg(a, 1, fn);
        string s = S(0);
        auto   w = spans(s);
        if (n > w.size()) return a[0];
        size_t l = LEN() == 3 ? (size_t)len_arg(a, 2, fn) : w.size();
        if (!l) return a[0];
        size_t b = w[n - 1].first;
        size_t e = n - 1 + l < w.size() ? w[n - 1 + l].first : s.size();
        return Value(s.erase(b, e - b))),
    BIF("DIGITS",    0, 0, return Value(to_string(rx.opt.digits))),
    BIF("FUZZ",      0, 0, return Value(to_string(rx.opt.fuzz))),
    BIF("INSERT",    2, 5,
        size_t n = (size_t)len_arg(a, 2, fn);
        string t = S(1);
        string s = S(0);
        char   p = pad(a, 4, fn);
        if (LEN() > 3) {
            size_t l = (size_t)len_arg(a, 3, fn);
            s.resize(l, p);
        }
        if (t.size() < n) t.resize(n, p);
        return Value(t.insert(n, s))),
    BIF("INTERPOLATION", 0, 1,
        Value old(rx.opt.interp);
        if (LEN()) {
            string n = lower(S(0));
            if (!valid_pattern(n)) throw bad(fn, "unknown pattern '" + S(0) + "'");
            rx.opt.interp = n;
        }
        return old),
    BIF("LASTPOS",   2, 3,
        const string &o = S(0);
        const string &s = S(1);
        size_t st = LEN() == 3 ? (size_t)pos_arg(a, 2, fn) : s.size();
        if (o.empty() || o.size() > s.size()) return Value("0");
        size_t from = min(st, s.size()) >= o.size() ? min(st, s.size()) - o.size() : 0;
        size_t k = s.rfind(o, from);
        return Value(k == string::npos ? "0" : to_string(k + 1))),
    BIF("LEFT",      2, 3,
        size_t n = (size_t)len_arg(a, 1, fn);
        string s = S(0);
        s.resize(n, pad(a, 2, fn));
        return Value(s)),
    BIF("LENGTH",    1, 1, return Value(to_string(S(0).size()))),
    BIF("LOWER",     1, 1, return Value(lower(S(0)))),
    BIF("MAX",       1, -1,
        double m = number(a, 0, fn);
        for (int i = 1; i < LEN(); i++) m = max(m, number(a, i, fn));
        return num(rx, m)),
    BIF("MIN",       1, -1,
        double m = number(a, 0, fn);
        for (int i = 1; i < LEN(); i++) m = min(m, number(a, i, fn));
        return num(rx, m)),
    BIF("POS",       2, 3,
        const string &o = S(0);
        size_t st = (size_t)pos_arg(a, 2, fn);
        if (o.empty()) return Value("0");
        size_t k = S(1).find(o, st - 1);
        return Value(k == string::npos ? "0" : to_string(k + 1))),
    BIF("QUEUED",    0, 0, return Value(to_string(rx.queue.size()))),
    BIF("RANDOM",    0, 3,
        S64 lo = 0, hi = 999;
        if (LEN() == 1) hi = len_arg(a, 0, fn);
        if (LEN() >= 2) { lo = int_arg(a, 0, fn); hi = int_arg(a, 1, fn); }
        if (LEN() == 3) rng().seed((U32)int_arg(a, 2, fn));
        if (hi < lo) throw bad(fn, "maximum is less than minimum");
        uniform_int_distribution<S64> u(lo, hi);
        return Value(to_string(u(rng())))),
    BIF("REVERSE",   1, 1, return Value(string(S(0).rbegin(), S(0).rend()))),
    BIF("RIGHT",     2, 3,
        size_t n = (size_t)len_arg(a, 1, fn);
        const string &s = S(0);
        if (s.size() >= n) return Value(s.substr(s.size() - n));
        return Value(string(n - s.size(), pad(a, 2, fn)) + s)),
    BIF("SIGN",      1, 1,
        double d = number(a, 0, fn);
        return Value(d > 0 ? "1" : (d < 0 ? "-1" : "0"))),
    BIF("SPACE",     1, 3,
        size_t n = (size_t)len_arg(a, 1, fn, 1);
        string g(n, pad(a, 2, fn)), r;
        for (auto &w : spans(S(0))) r += (r.size() ? g : "") + S(0).substr(w.first, w.second);
        return Value(r)),
    BIF("STRIP",     1, 3,
        char o = option(a, 1, fn, 'B', "BLT");
        char c = pad(a, 2, fn);
        string s = S(0);
        size_t b = o == 'T' ? 0 : s.find_first_not_of(c);
        if (b == string::npos) return Value("");
        size_t e = o == 'L' ? s.size() : s.find_last_not_of(c) + 1;
        return Value(s.substr(b, e - b))),
    BIF("SUBSTR",    2, 4,
        size_t n = (size_t)pos_arg(a, 1, fn);
        const string &s = S(0);
        string r = n <= s.size() ? s.substr(n - 1) : "";
        if (LEN() > 2) r.resize((size_t)len_arg(a, 2, fn), pad(a, 3, fn));
        return Value(r)),
    BIF("SUBWORD",   2, 3,
        size_t n = (size_t)pos_arg(a, 1, fn);
        const string &s = S(0);
        auto   w = spans(s);
        if (n > w.size()) return Value("");
        size_t l = LEN() == 3 ? (size_t)len_arg(a, 2, fn) : w.size();
        if (!l) return Value("");
        size_t last = min(w.size(), n - 1 + l) - 1;
        size_t b = w[n - 1].first;
        return Value(s.substr(b, w[last].first + w[last].second - b))),
    BIF("SYMBOL",    1, 1,
        string n = upper(S(0));
        if (!is_symbol(n)) return Value("BAD");
        Value v;
        return Value(rx.peek(n, v) ? "VAR" : "LIT")),
    BIF("TIME",      0, 1,
        char   o = option(a, 0, fn, 'N', "CHLMNS");
        struct timeval tv;
        gettimeofday(&tv, NULL);
        struct tm tm;
        localtime_r(&tv.tv_sec, &tm);
        char buf[64];
        int  sec = tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec;
        switch (o) {
        case 'C':
            snprintf(buf, sizeof(buf), "%d:%02d%s", tm.tm_hour % 12 ? tm.tm_hour % 12 : 12,
                     tm.tm_min, tm.tm_hour < 12 ? "am" : "pm");
            break;
        case 'H': snprintf(buf, sizeof(buf), "%d", tm.tm_hour);  break;
        case 'M': snprintf(buf, sizeof(buf), "%d", sec / 60);    break;
        case 'S': snprintf(buf, sizeof(buf), "%d", sec);         break;
        case 'L':
            snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%06ld",
                     tm.tm_hour, tm.tm_min, tm.tm_sec, (long)tv.tv_usec);
            break;
        default: strftime(buf, sizeof(buf), "%H:%M:%S", &tm);    break;
        }
        return Value(buf)),
    BIF("TRANSLATE", 1, 4,
        if (LEN() == 1) return Value(upper(S(0)));
        string out = S(1);
        string in  = LEN() > 2 ? S(2) : "";
        char   p   = pad(a, 3, fn);
        string r   = S(0);
        for (char &c : r) {
            size_t k;
            if (LEN() > 2) k = in.find(c);
            else           k = (U8)c;          /// * no input table, identity order
            if (k == string::npos) continue;
            c = k < out.size() ? out[k] : p;
        }
        return Value(r)),
    BIF("TRUNC",     1, 2,
        double d = number(a, 0, fn);
        int    n = (int)len_arg(a, 1, fn, 0);
        if (n > RX_MAX_DIGITS) throw bad(fn, "too many decimal places");
        return Value(trunc_to(d, n))),
    BIF("UPPER",     1, 1, return Value(upper(S(0)))),
    BIF("VALUE",     1, 2,
        string n = upper(S(0));
        if (!is_symbol(n)) throw bad(fn, "'" + S(0) + "' is not a symbol");
        Value old = rx.fetch(n, false);
        if (LEN() == 2) rx.assign(n, a[1]);
        return old),
    BIF("WORD",      2, 2,
        size_t n = (size_t)pos_arg(a, 1, fn);
        auto   w = spans(S(0));
        return Value(n > w.size() ? "" : S(0).substr(w[n - 1].first, w[n - 1].second))),
    BIF("WORDINDEX", 2, 2,
        size_t n = (size_t)pos_arg(a, 1, fn);
        auto   w = spans(S(0));
        return Value(n > w.size() ? "0" : to_string(w[n - 1].first + 1))),
    BIF("WORDPOS",   2, 3,
        auto   p = spans(S(0));
        auto   w = spans(S(1));
        size_t st = (size_t)pos_arg(a, 2, fn);
        if (p.empty()) return Value("0");
        for (size_t i = st - 1; i + p.size() <= w.size(); i++) {
            bool ok = true;
            for (size_t j = 0; ok && j < p.size(); j++) {
                ok = S(0).compare(p[j].first, p[j].second,
                                  S(1), w[i + j].first, w[i + j].second) == 0;
            }
            if (ok) return Value(to_string(i + 1));
        }
        return Value("0")),
    BIF("WORDS",     1, 1, return Value(to_string(spans(S(0)).size()))),
    BIF("X2D",       1, 1,
        const string &s = S(0);
        if (s.empty()) return Value("0");
        if (s.size() > 15 || s.find_first_not_of("0123456789abcdefABCDEF") != string::npos)
            throw bad(fn, "'" + s + "' is not a hexadecimal string");
        return Value(to_string(strtoull(s.c_str(), NULL, 16))))
};

const Bif *find_bif(const string &n) {
    for (const Bif &b : rom) if (n == b.name) return &b;
    return nullptr;
}
