///
/// @file
/// @brief cerexx sample module, loaded with REQUIRE as a shared object
///
#include <cctype>
#include "cerexx.h"

extern "C" {
extern const char cerexx_meta[];
const char cerexx_meta[] = "sample_detect";     ///< names the detection entry below

void sample_detect(ModuleDecl &m) {
    m.id   = "sample";
    m.desc = "sample greeting module";
    m.fn("greet", [](Interp &, Args &a) {
        return Value("hello " + (a.size() ? a[0].str() : string("world")));
    }, "greet someone", { "name" });
    m.op("shout", [](Interp &, Params &p) {
        string s;
        for (auto &kv : p) s += kv.second.str();
        for (char &c : s) c = (char)toupper((unsigned char)c);
        return Value(s);
    }, "upper case the values");
}
} // extern "C"
