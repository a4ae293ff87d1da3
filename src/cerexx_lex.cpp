///
/// @file
/// @brief cerexx - lexer, source text to token stream
///
///====================================================================
#include <cstring>
#include <cctype>
#include "cerexx_ast.h"

using namespace std;
///
///> instruction keywords, recognized by position only
///
static const char *KEYWORDS[] = {
    "ADDRESS", "ARG", "CALL", "DO", "DROP", "ELSE", "END", "ENDIF",
    "EXIT", "IF", "INTERPRET", "ITERATE", "LEAVE", "LET", "NOP",
    "NUMERIC", "OTHERWISE", "PARSE", "PROCEDURE", "PULL", "PUSH",
    "QUEUE", "REQUIRE", "RETURN", "SAY", "SELECT", "SIGNAL", "THEN",
    "TRACE", "WHEN"
};
///
///> operators, longest first
///
static const char *OPS[] = {
    "\\==", ">>=", "<<=",
    "**", "||", "|>", "&&", "==", "\\=", "!=", "<>", "><", ">=", "<=",
    ">>", "<<", "\\>", "\\<", "//",
    "=", "<", ">", "+", "-", "*", "/", "%", "|", "&", "\\", "!",
    "(", ")", ",", ":"
};

bool is_keyword(const string &s) {
    for (const char *k : KEYWORDS) if (s == k) return true;
    return false;
}

static bool is_sym(char c)  {
    return isalnum((U8)c) || (c && strchr("_.?@#$", c));
}

struct Lexer {
    const string &src;
    size_t    i    = 0;
    int       line = 1;
    size_t    bol  = 0;                    ///< index of beginning of line
    bool      blank = false;
    FV<Token> out;
    struct Here { int tok; string label; Pos pos; };
    FV<Here>  here;                        ///< heredocs opened on this line

    Lexer(const string &s) : src(s) {}

    Pos  pos() { Pos p; p.line = line; p.col = (int)(i - bol) + 1; return p; }
    char at(size_t k=0) { return (i + k < src.size()) ? src[i + k] : '\0'; }
    void emit(tok_kind k, const string &text, const string &raw, Pos p, quote_kind q=Q_NONE) {
        Token t;
        t.kind = k; t.q = q; t.text = text; t.raw = raw; t.pos = p; t.blank = blank;
        out.push(t);
        blank = false;
    }
    void newline() {                       ///> end of a source line
        Pos p = pos();
        i++; line++; bol = i;
        for (Here &h : here) heredoc(h);
        here.clear();
        if (out.size() && out[-1].kind == T_OP && out[-1].text == ",") {
            out.pop();                     /// * continuation, clause goes on
            blank = true;
        }
        else if (pipe_next()) blank = true;
        else emit(T_EOC, "\n", "\n", p);
    }
    bool pipe_next() {                     ///> next line starts with |>
        size_t k = i;
        while (k < src.size() && (src[k] == ' ' || src[k] == '\t')) k++;
        return src.compare(k, 2, "|>") == 0;
    }
    void heredoc(Here &h) {                ///> collect lines up to the label
        string body;
        bool   first = true;
        while (true) {
            if (i >= src.size()) throw SyntaxError("unterminated heredoc <<" + h.label, h.pos);
            size_t e  = src.find('\n', i);
            string ln = src.substr(i, e == string::npos ? string::npos : e - i);
            if (ln.size() && ln.back() == '\r') ln.pop_back();
            i = (e == string::npos) ? src.size() : e + 1;
            line++; bol = i;
            size_t a = ln.find_first_not_of(" \t");
            size_t b = ln.find_last_not_of(" \t");
            if (a != string::npos && ln.substr(a, b - a + 1) == h.label) break;
            if (!first) body += '\n';
            body += ln;
            first = false;
        }
        out[h.tok].text = body;
        out[h.tok].raw += "\n" + body + "\n" + h.label;
    }
    void comment() {                       ///> nestable /* */
        Pos p = pos();
        int dp = 0;
        do {
            if (i >= src.size()) throw SyntaxError("unterminated comment", p);
            if (at() == '/' && at(1) == '*')      { dp++; i += 2; }
            else if (at() == '*' && at(1) == '/') { dp--; i += 2; }
            else {
                if (at() == '\n') { line++; bol = i + 1; }
                i++;
            }
        } while (dp > 0);
        blank = true;
    }
    void quoted(char qc) {                 ///> "..", '..', `..` with doubled quotes
        Pos    p = pos();
        size_t i0 = i++;
        string s;
        while (true) {
            if (i >= src.size() || at() == '\n')
                throw SyntaxError(string("unterminated string ") + qc, p);
            if (at() == qc) {
                if (at(1) == qc) { s += qc; i += 2; continue; }
                i++; break;
            }
            s += src[i++];
        }
        quote_kind q = qc == '"' ? Q_DOUBLE : (qc == '\'' ? Q_SINGLE : Q_BACK);
        emit(T_STR, s, src.substr(i0, i - i0), p, q);
    }
    bool heredoc_open() {                  ///> <<LABEL as the last token of a line
        if (!isalpha((U8)at(2)) && at(2) != '_') return false;
        size_t k = i + 2;
        while (k < src.size() && (isalnum((U8)src[k]) || src[k] == '_')) k++;
        size_t e = k;
        while (e < src.size() && (src[e] == ' ' || src[e] == '\t' || src[e] == '\r')) e++;
        if (e < src.size() && src[e] != '\n') {
            if (!(src[e] == '-' && e + 1 < src.size() && src[e + 1] == '-')) return false;
        }
        Pos    p = pos();
        string label = src.substr(i + 2, k - i - 2);
        here.push({ (int)out.size(), label, p });
        emit(T_HEREDOC, "", src.substr(i, k - i), p, Q_HEREDOC);
        i = k;
        return true;
    }
    void number() {
        Pos    p  = pos();
        size_t i0 = i;
        while (is_sym(at())) {
            char c = at();
            i++;
            if ((c == 'e' || c == 'E') && (at() == '+' || at() == '-') && isdigit((U8)at(1))) {
                bool dig = true;           /// * exponent only after a plain mantissa
                for (size_t k = i0; k < i - 1; k++)
                    if (!isdigit((U8)src[k]) && src[k] != '.') dig = false;
                if (dig) i++;
            }
        }
        string raw = src.substr(i0, i - i0);
        string up(raw);
        for (char &c : up) c = toupper((U8)c);
        emit(T_NUM, up, raw, p);
    }
    void symbol() {
        Pos    p  = pos();
        size_t i0 = i;
        while (is_sym(at())) i++;
        string raw = src.substr(i0, i - i0);
        string up(raw);
        for (char &c : up) c = toupper((U8)c);
        emit(is_keyword(up) ? T_KEY : T_SYM, up, raw, p);
    }
    void op() {
        Pos p = pos();
        for (const char *o : OPS) {
            size_t n = strlen(o);
            if (src.compare(i, n, o) == 0) {
                i += n;
                emit(T_OP, o, o, p);
                return;
            }
        }
        throw SyntaxError(string("invalid character '") + at() + "'", p);
    }
    void run() {
        while (i < src.size()) {
            char c = at();
            if (c == '\n')                       { newline(); continue; }
            if (c == ' ' || c == '\t' || c == '\r') { i++; blank = true; continue; }
            if (c == '/' && at(1) == '*')        { comment(); continue; }
            if (c == '-' && at(1) == '-') {      /// * line comment
                while (i < src.size() && at() != '\n') i++;
                continue;
            }
            if (c == ';') { emit(T_EOC, ";", ";", pos()); i++; continue; }
            if (c == '"' || c == '\'' || c == '`') { quoted(c); continue; }
            if (c == '<' && at(1) == '<' && heredoc_open()) continue;
            if (isdigit((U8)c) || (c == '.' && isdigit((U8)at(1)))) { number(); continue; }
            if (is_sym(c))                       { symbol(); continue; }
            op();
        }
        if (here.size()) throw SyntaxError("unterminated heredoc <<" + here[0].label, here[0].pos);
        Pos p = pos();
        emit(T_EOC, "\n", "", p);
        emit(T_EOF, "", "", p);
    }
};

FV<Token> lex(const string &src) {
    Lexer lx(src);
    lx.run();
    return lx.out;
}
