// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <cctype>
#include <set>
#include "sanitizer.hpp"

static const char *const keyword_list[] = {
    "always", "assign", "begin", "case", "default", "else", "end",
    "endcase", "endmodule", "for", "function", "if", "initial", "inout",
    "input", "integer", "logic", "module", "output", "parameter", "reg",
    "signed", "task", "wire", 0
};

static bool is_keyword(const string &name) {
    static set<string> keywords;
    if (keywords.empty()) {
        for (const char *const *k = keyword_list; *k; ++k) {
            keywords.insert(*k);
        }
    }
    return keywords.find(name) != keywords.end();
}

static bool is_ident_char(char c) {
    return isalnum(static_cast<unsigned char>(c)) || c == '_';
}

string sanitize(const string &name) {
    string result;
    result.reserve(name.size() + 1);
    for (string::const_iterator ci = name.begin(); ci != name.end(); ++ci) {
        result.push_back(is_ident_char(*ci) ? *ci : '_');
    }
    if (result.empty() || isdigit(static_cast<unsigned char>(result[0]))) {
        result.insert(result.begin(), '_');
    }
    if (is_keyword(result)) result.push_back('_');
    return result;
}

bool is_sanitary(const string &name) {
    return sanitize(name) == name;
}
