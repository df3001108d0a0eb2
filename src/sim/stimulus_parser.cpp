// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <cassert>
#include <cstdlib>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <boost/bind/bind.hpp>
#include "stimulus_parser.hpp"

const unsigned stimulus_parser::max_signal_width;

static vector<string> split_path(const string &path) {
    vector<string> parts;
    string::size_type start = 0;
    for (;;) {
        string::size_type dot = path.find('.', start);
        parts.push_back(path.substr(start, dot - start));
        if (dot == string::npos) break;
        start = dot + 1;
    }
    return parts;
}

static void put_value(logic_signal *s, const logic_value &v) throw(err) {
    s->put(v);
}

stimulus_parser::stimulus_parser(const string &file) throw(err)
    : design(), events(), end_time(0), line(), pos(file, 0) {
    ifstream input(file.c_str());
    if (input.fail()) throw err_parse(file, "cannot open file");
    parse(input);
}

stimulus_parser::stimulus_parser(istream &input, const string &input_name)
    throw(err) : design(), events(), end_time(0), line(), pos(input_name, 0) {
    parse(input);
}

void stimulus_parser::parse(istream &input) throw(err) {
    for (pos.get<1>() = 1; input.good(); pos.get<1>()++) {
        string l;
        getline(input, l);
        line = std::shared_ptr<istream>(new istringstream(l));
        p_line();
    }
    if (!design) throw err_parse(pos.get<0>(), "no module declared");
    design->build();
}

void stimulus_parser::fail(const string &msg) const throw(err) {
    throw err_parse(pos.get<0>(), pos.get<1>(), msg);
}

string stimulus_parser::p_word(const char *what) throw(err) {
    string w;
    *line >> w;
    if (w.empty() || w[0] == '#') {
        ostringstream msg;
        msg << "found " << (w.empty() ? "end of line" : "a comment")
            << " while expecting " << what;
        fail(msg.str());
    }
    return w;
}

uint64_t stimulus_parser::to_nat(const string &s, uint64_t low,
                                 uint64_t high) throw(err) {
    string digits = s;
    int base = 10;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        digits = s.substr(2);
        base = 16;
    } else if (s.size() > 2 && s[0] == '0' && (s[1] == 'b' || s[1] == 'B')) {
        digits = s.substr(2);
        base = 2;
    }
    const char *allowed = (base == 16 ? "0123456789abcdefABCDEF"
                           : base == 2 ? "01" : "0123456789");
    // strtoull would also take a sign, blanks or a second 0x prefix
    if (digits.empty() || digits.find_first_not_of(allowed) != string::npos) {
        ostringstream msg;
        msg << "invalid number: \"" << s << "\"";
        fail(msg.str());
    }
    errno = 0;
    uint64_t n = strtoull(digits.c_str(), 0, base);
    if (errno == ERANGE) {
        ostringstream msg;
        msg << "number out of range: " << s;
        fail(msg.str());
    }
    if (n < low) {
        ostringstream msg;
        msg << "number must be at least " << dec << low << ": " << s;
        fail(msg.str());
    }
    if (n > high) {
        ostringstream msg;
        msg << "number must be at most " << dec << high << ": " << s;
        fail(msg.str());
    }
    return n;
}

uint64_t stimulus_parser::p_nat(uint64_t low, uint64_t high) throw(err) {
    return to_nat(p_word("a number"), low, high);
}

string stimulus_parser::p_kw(const set<string> &kws, bool empty_ok)
    throw(err) {
    assert(kws.size() > 0);
    string w;
    *line >> w;
    if (empty_ok && (w == "" || w[0] == '#')) return "";
    if (w == "" || w[0] == '#' || kws.find(w) == kws.end()) {
        ostringstream msg;
        if (w == "" || w[0] == '#') {
            msg << "found " << (w.size() == 0 ? "end of line" : "a comment");
        } else {
            msg << "found \"" << w << "\"";
        }
        msg << " while expecting " << (kws.size() > 1 ? "one of " : "");
        for (set<string>::const_iterator i = kws.begin(); i != kws.end(); ++i) {
            if (i != kws.begin()) msg << " or ";
            msg << "\"" << *i << "\"";
        }
        fail(msg.str());
    }
    return w;
}

string stimulus_parser::p_kw(const string &kw1, bool empty_ok) throw(err) {
    set<string> kws; kws.insert(kw1);
    return p_kw(kws, empty_ok);
}

void stimulus_parser::p_end_of_line() throw(err) {
    string w;
    *line >> w;
    if (!w.empty() && w[0] != '#') {
        fail("unexpected \"" + w + "\" at end of line");
    }
}

module_node &stimulus_parser::p_module_path() throw(err) {
    string path = p_word("a module path");
    if (!design) fail("no root module declared before " + path);
    vector<string> parts = split_path(path);
    if (parts[0] != design->get_name()) {
        fail("module path " + path + " does not start at root module "
             + design->get_name());
    }
    module_node *m = design.get();
    for (vector<string>::const_iterator pi = parts.begin() + 1;
         pi != parts.end(); ++pi) {
        m = m->find_submodule(*pi);
        if (!m) fail("no such module: " + path);
    }
    return *m;
}

logic_signal &stimulus_parser::p_signal_path() throw(err) {
    string path = p_word("a signal path");
    if (!design) fail("no root module declared before " + path);
    vector<string> parts = split_path(path);
    if (parts.size() < 2 || parts[0] != design->get_name()) {
        fail("signal path " + path + " does not start at root module "
             + design->get_name());
    }
    module_node *m = design.get();
    for (vector<string>::const_iterator pi = parts.begin() + 1;
         pi + 1 != parts.end(); ++pi) {
        m = m->find_submodule(*pi);
        if (!m) fail("no such module in signal path: " + path);
    }
    logic_signal *s = m->find_signal(parts.back());
    if (!s) fail("no such signal: " + path);
    return *s;
}

logic_value stimulus_parser::p_value(unsigned width) throw(err) {
    string s = p_word("a value");
    if (s.size() > 1 && s[0] == '\'') {
        logic_value v;
        try {
            v = logic_value::from_string(s.substr(1));
        } catch (const err_bad_value &e) {
            ostringstream msg;
            msg << e;
            fail(msg.str());
        }
        if (v.width() != width) {
            ostringstream msg;
            msg << "value " << s << " is " << dec << v.width()
                << " bits wide but the signal has " << width;
            fail(msg.str());
        }
        return v;
    }
    uint64_t n = to_nat(s, 0, UINT64_MAX);
    if (width < 64 && (n >> width) != 0) {
        ostringstream msg;
        msg << "value " << s << " does not fit in " << dec << width << " bits";
        fail(msg.str());
    }
    return logic_value::from_uint(width, n);
}

void stimulus_parser::p_module() throw(err) {
    string path = p_word("a module path");
    bool opaque = p_kw("opaque", true) == "opaque";
    if (opaque) p_end_of_line();
    vector<string> parts = split_path(path);
    for (vector<string>::const_iterator pi = parts.begin();
         pi != parts.end(); ++pi) {
        if (pi->empty()) fail("empty name in module path " + path);
    }
    if (parts.size() == 1) {
        if (design) fail("root module " + design->get_name()
                         + " already declared");
        design = std::shared_ptr<module_node>(new module_node(path, opaque));
        return;
    }
    if (!design) fail("no root module declared before " + path);
    if (parts[0] != design->get_name()) {
        fail("module path " + path + " does not start at root module "
             + design->get_name());
    }
    module_node *parent = design.get();
    for (vector<string>::const_iterator pi = parts.begin() + 1;
         pi + 1 != parts.end(); ++pi) {
        parent = parent->find_submodule(*pi);
        if (!parent) fail("no parent module for " + path);
    }
    if (parent->find_submodule(parts.back())) {
        fail("module " + path + " already declared");
    }
    parent->add_submodule(parts.back(), opaque);
}

void stimulus_parser::p_signal(logic_signal::kind_t kind) throw(err) {
    module_node &m = p_module_path();
    string name = p_word("a signal name");
    if (name.find('.') != string::npos) {
        fail("signal name " + name + " contains '.'");
    }
    if (m.find_signal(name)) {
        fail("signal " + m.get_path() + "." + name + " already declared");
    }
    unsigned width = p_nat(1, max_signal_width);
    switch (kind) {
    case logic_signal::SK_INTERNAL: m.add_signal(name, width); break;
    case logic_signal::SK_PORT: m.add_port(name, width); break;
    case logic_signal::SK_CONSTANT: m.add_constant(name, p_value(width)); break;
    }
    p_end_of_line();
}

void stimulus_parser::p_set() throw(err) {
    uint64_t time = p_nat();
    logic_signal &s = p_signal_path();
    if (s.is_constant()) fail("signal " + s.get_path() + " is constant");
    logic_value v = p_value(s.get_width());
    p_end_of_line();
    events.push_back(event_t(time, &s, v));
}

void stimulus_parser::p_end() throw(err) {
    if (end_time != 0) fail("end time already given");
    end_time = p_nat(1);
    p_end_of_line();
}

void stimulus_parser::p_line() throw(err) {
    set<string> kws;
    kws.insert("module"); kws.insert("port"); kws.insert("signal");
    kws.insert("const"); kws.insert("set"); kws.insert("end");
    string kw = p_kw(kws, true);
    if (kw == "") {
        return;
    } else if (kw == "module") {
        p_module();
    } else if (kw == "port") {
        p_signal(logic_signal::SK_PORT);
    } else if (kw == "signal") {
        p_signal(logic_signal::SK_INTERNAL);
    } else if (kw == "const") {
        p_signal(logic_signal::SK_CONSTANT);
    } else if (kw == "set") {
        p_set();
    } else if (kw == "end") {
        p_end();
    } else {
        assert(false);
    }
}

std::shared_ptr<module_node> stimulus_parser::get_design() const throw() {
    return design;
}

const stimulus_parser::events_t &stimulus_parser::get_events() const throw() {
    return events;
}

uint64_t stimulus_parser::get_end_time() const throw() {
    return end_time;
}

void stimulus_parser::schedule(simulator &sim) const throw(err) {
    for (events_t::const_iterator ei = events.begin(); ei != events.end();
         ++ei) {
        sim.register_action(ei->get<0>(),
                            boost::bind(&put_value, ei->get<1>(),
                                        ei->get<2>()));
    }
}
