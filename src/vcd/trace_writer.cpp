// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <cassert>
#include <sstream>
#include <map>
#include "sanitizer.hpp"
#include "name_uniquifier.hpp"
#include "trace_writer.hpp"

trace_writer::trace_writer(std::shared_ptr<ostream> new_out,
                           const string &new_out_name)
    : out(new_out), out_name(new_out_name) {
    assert(out);
}

void trace_writer::check(const char *what) throw(err) {
    out->flush();
    if (out->fail()) {
        throw err_io(out_name, string("failed to write ") + what);
    }
}

void trace_writer::write_header(const string &date, const string &tool,
                                const string &version, const string &comment,
                                const string &timescale) throw(err) {
    *out << "$date\n"
         << "  " << date << '\n'
         << "$end\n"
         << "$version\n"
         << "  " << tool << ' ' << version << '\n'
         << "$end\n"
         << "$comment\n"
         << "  " << comment << '\n'
         << "$end\n"
         << "$timescale " << timescale << " $end\n";
    check("VCD header");
}

string trace_writer::scope_body(const module_node &m,
                                const signal_registry &registry,
                                unsigned indent) throw(err) {
    const string padding(2 * indent, ' ');
    const module_node::signals_t &sigs = m.get_signals();
    // ports claim their names before any internal signal can take them
    name_uniquifier signal_names;
    map<const logic_signal *, string> names;
    for (module_node::signals_t::const_iterator si = sigs.begin();
         si != sigs.end(); ++si) {
        if (!(*si)->is_port() || !registry.is_tracked(**si)) continue;
        names[si->get()] =
            signal_names.get_unique_name(sanitize((*si)->get_name()), true);
    }
    ostringstream body;
    for (module_node::signals_t::const_iterator si = sigs.begin();
         si != sigs.end(); ++si) {
        const logic_signal &s = **si;
        if (!registry.is_tracked(s)) continue;
        string name;
        if (s.is_port()) {
            name = names[&s];
        } else {
            name = signal_names.get_unique_name(sanitize(s.get_name()));
        }
        body << padding << "  $var wire " << dec << s.get_width() << ' '
             << registry.get_marker(s) << ' ' << name << " $end\n";
    }
    // only scopes that are actually emitted take a name
    name_uniquifier scope_names;
    const module_node::submodules_t &subs = m.get_submodules();
    for (module_node::submodules_t::const_iterator mi = subs.begin();
         mi != subs.end(); ++mi) {
        string sub_body = scope_body(**mi, registry, indent + 1);
        if (sub_body.empty()) continue;
        string sub_name =
            scope_names.get_unique_name(sanitize((*mi)->get_name()));
        body << scope_string(sub_name, sub_body, indent + 1);
    }
    return body.str();
}

string trace_writer::scope_string(const string &scope_name,
                                  const string &body, unsigned indent) {
    const string padding(2 * indent, ' ');
    return padding + "$scope module " + scope_name + " $end\n"
        + body
        + padding + "$upscope $end\n";
}

string trace_writer::definitions(const module_node &root,
                                 const signal_registry &registry) throw(err) {
    string body = scope_body(root, registry, 0);
    string defs;
    if (!body.empty()) defs = scope_string(sanitize(root.get_name()), body, 0);
    return defs + "$enddefinitions $end\n";
}

void trace_writer::write_definitions(const string &defs) throw(err) {
    *out << defs;
    check("VCD definitions");
}

void trace_writer::write_scope(const module_node &root,
                               const signal_registry &registry) throw(err) {
    write_definitions(definitions(root, registry));
}

string trace_writer::encode_value(const logic_value &value,
                                  const string &marker) {
    if (value.width() == 1) {
        return string(1, logic_bit_char(value.get(0))) + marker;
    }
    // to_string() already reverses into most-significant-first order
    return "b" + value.to_string() + " " + marker;
}

void trace_writer::write_value(const logic_signal &s,
                               const signal_registry &registry) throw(err) {
    *out << encode_value(s.get_value(), registry.get_marker(s)) << '\n';
}

void trace_writer::write_initial_values(const signal_registry &registry)
    throw(err) {
    *out << "$dumpvars\n";
    const signal_registry::signals_t &sigs = registry.get_tracked_signals();
    for (signal_registry::signals_t::const_iterator si = sigs.begin();
         si != sigs.end(); ++si) {
        write_value(**si, registry);
    }
    *out << "$end\n";
    check("initial values");
}

void trace_writer::write_timestamp(uint64_t time,
                                   const change_tracker::changes_t &changed,
                                   const signal_registry &registry)
    throw(err) {
    *out << '#' << dec << time << '\n';
    for (change_tracker::changes_t::const_iterator ci = changed.begin();
         ci != changed.end(); ++ci) {
        write_value(**ci, registry);
    }
    check("timestamp block");
}
