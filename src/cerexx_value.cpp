///
/// @file
/// @brief cerexx - value model, REXX numeric rules
///
///====================================================================
#include <cmath>
#include <cstring>
#include <cctype>
#include "cerexx.h"

using namespace std;
///
///> numeric view of a string, parsed once and cached
///
bool Value::num(double &d) const {
    if (nf < 0) nf = num_parse(s, nv) ? 1 : 0;
    d = nv;
    return nf == 1;
}
bool Value::whole(S64 &n) const {
    double d;
    if (!num(d) || d != floor(d) || fabs(d) > 9.0e18) return false;
    n = (S64)d;
    return true;
}
///
///> [blanks][sign][blanks]digits[.digits][E[sign]digits][blanks]
///
bool num_parse(const string &s, double &d) {
    size_t i = 0, n = s.size();
    string t;
    while (i < n && s[i] == ' ') i++;
    if (i < n && (s[i] == '+' || s[i] == '-')) {
        if (s[i] == '-') t += '-';
        i++;
        while (i < n && s[i] == ' ') i++;
    }
    int dig = 0;
    while (i < n && isdigit((U8)s[i])) { t += s[i++]; dig++; }
    if (i < n && s[i] == '.') {
        t += s[i++];
        while (i < n && isdigit((U8)s[i])) { t += s[i++]; dig++; }
    }
    if (!dig) return false;
    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        t += 'e'; i++;
        if (i < n && (s[i] == '+' || s[i] == '-')) t += s[i++];
        int ed = 0;
        while (i < n && isdigit((U8)s[i])) { t += s[i++]; ed++; }
        if (!ed) return false;
    }
    while (i < n && s[i] == ' ') i++;
    if (i != n) return false;
    d = strtod(t.c_str(), NULL);
    return isfinite(d);
}
///
///> format under NUMERIC DIGITS, integers without a point,
///> exponent form once the integer part outgrows the digits
///
string num_fmt(double v, int digits, bool eng) {
    if (v == 0 || !isfinite(v)) return "0";
    char buf[64];
    snprintf(buf, sizeof(buf), "%.*e", digits - 1, v);

    const char *q = buf;
    bool   neg = *q == '-';
    if (neg) q++;
    string m;                              ///< mantissa digits
    for (; *q && *q != 'e'; q++) if (isdigit((U8)*q)) m += *q;
    int e = atoi(q + 1);
    while (m.size() > 1 && m.back() == '0') m.pop_back();
    if (m == "0") return "0";

    int    nd = (int)m.size();
    string r;
    if ((e >= 0 && e < digits) || (e < 0 && nd - 1 - e <= 2 * digits)) {
        if (e >= 0) {
            if (nd <= e + 1) r = m + string(e + 1 - nd, '0');
            else             r = m.substr(0, e + 1) + "." + m.substr(e + 1);
        }
        else r = "0." + string(-e - 1, '0') + m;
    }
    else {
        int k = 1;                         ///< digits before the point
        if (eng) { int sh = ((e % 3) + 3) % 3; e -= sh; k += sh; }
        string in = nd >= k ? m.substr(0, k) : m + string(k - nd, '0');
        string fr = nd > k ? m.substr(k) : "";
        r = in + (fr.size() ? "." + fr : "") + "E" + (e < 0 ? "-" : "+") + to_string(abs(e));
    }
    return neg ? "-" + r : r;
}
///
///> compare a and b carrying digits significant digits
///
int num_cmp(double a, double b, int digits) {
    if (a == b) return 0;
    double m = max(fabs(a), fabs(b));
    double tol = 0.5 * pow(10.0, floor(log10(m)) - digits + 1);
    if (fabs(a - b) < tol) return 0;
    return a < b ? -1 : 1;
}
///
///> string helpers
///
string upper(const string &s) {
    string r(s);
    for (char &c : r) c = toupper((U8)c);
    return r;
}
string lower(const string &s) {
    string r(s);
    for (char &c : r) c = tolower((U8)c);
    return r;
}
string strip(const string &s, char c) {
    size_t a = s.find_first_not_of(c);
    if (a == string::npos) return "";
    size_t b = s.find_last_not_of(c);
    return s.substr(a, b - a + 1);
}
///
///> handler reply shortcuts
///
Reply Reply::done(const string &out) {
    Reply r;
    r.result.output = out;
    return r;
}
Reply Reply::fail(const string &err, int status) {
    Reply r;
    r.result.success = false;
    r.result.status  = status;
    r.result.error   = err;
    return r;
}
Reply Reply::wait(const string &op, const Params &p, U32 ms) {
    Reply r;
    r.pending         = true;
    r.ckpt.operation  = op;
    r.ckpt.params     = p;
    r.ckpt.timeout_ms = ms;
    return r;
}
