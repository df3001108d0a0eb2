// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <iomanip>
#include "error.hpp"

err::err() throw() { }
err::~err() throw() { }
ostream &operator<<(ostream &out, const err &e) {
    e.show_to(out);
    return out;
}

err_panic::err_panic(const string &new_msg) throw() : msg(new_msg) { }
err_panic::err_panic(const char *new_msg) throw() : msg(new_msg) { }
err_panic::~err_panic() throw() { }
void err_panic::show_to(ostream &out) const {
    out << "PANIC: " << msg;
}

err_not_built::err_not_built(const string &m) throw() : module(m) { }
err_not_built::~err_not_built() throw() { }
void err_not_built::show_to(ostream &out) const {
    out << "module " << module
        << " must be built before a wave dumper is attached";
}

err_already_built::err_already_built(const string &m) throw() : module(m) { }
err_already_built::~err_already_built() throw() { }
void err_already_built::show_to(ostream &out) const {
    out << "module " << module << " is already built";
}

err_name_conflict::err_name_conflict(const string &n) throw() : name(n) { }
err_name_conflict::~err_name_conflict() throw() { }
void err_name_conflict::show_to(ostream &out) const {
    out << "reserved name \"" << name << "\" is already taken in this scope";
}

err_io::err_io(const string &f, const string &w) throw() : file(f), what(w) { }
err_io::~err_io() throw() { }
void err_io::show_to(ostream &out) const {
    if (file.empty()) {
        out << what;
    } else {
        out << file << ": " << what;
    }
}

err_time_regression::err_time_regression(uint64_t n, uint64_t r) throw()
    : now(n), requested(r) { }
err_time_regression::~err_time_regression() throw() { }
void err_time_regression::show_to(ostream &out) const {
    out << "time " << dec << requested
        << " is before the current time " << now;
}

err_bad_width::err_bad_width(const string &s, unsigned e, unsigned g) throw()
    : signal(s), expected(e), got(g) { }
err_bad_width::~err_bad_width() throw() { }
void err_bad_width::show_to(ostream &out) const {
    out << "signal " << signal << " is " << dec << expected
        << " bits wide but was given a " << got << "-bit value";
}

err_const_write::err_const_write(const string &s) throw() : signal(s) { }
err_const_write::~err_const_write() throw() { }
void err_const_write::show_to(ostream &out) const {
    out << "signal " << signal << " is constant";
}

err_bad_value::err_bad_value(const string &t) throw() : text(t) { }
err_bad_value::~err_bad_value() throw() { }
void err_bad_value::show_to(ostream &out) const {
    out << "invalid logic value: \"" << text << "\"";
}

err_untracked_signal::err_untracked_signal(const string &s) throw()
    : signal(s) { }
err_untracked_signal::~err_untracked_signal() throw() { }
void err_untracked_signal::show_to(ostream &out) const {
    out << "signal " << signal << " has no marker";
}

err_parse::err_parse(const string &f, const string &m) throw()
    : file(f), line(0), msg(m) { }
err_parse::err_parse(const string &f, unsigned l, const string &m) throw()
    : file(f), line(l), msg(m) { }

err_parse::~err_parse() throw() { }
void err_parse::show_to(ostream &out) const {
    if (file == "" && line == 0) {
        out << "unknown position";
    } else if (file == "") {
        out << "line " << dec << noshowpos << line;
    } else if (line == 0) {
        out << file;
    } else {
        out << file << ":" << dec << noshowpos << line;
    }
    out << ": " << msg;
}
