// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __TRACE_WRITER_HPP__
#define __TRACE_WRITER_HPP__

#include <string>
#include <iostream>
#include <memory>
#include <stdint.h>
#include "error.hpp"
#include "logic.hpp"
#include "module.hpp"
#include "signal_registry.hpp"
#include "change_tracker.hpp"

using namespace std;

// Appends VCD text to a sink it exclusively owns.  Every block is
// flushed and checked; a failed sink raises err_io.
class trace_writer {
public:
    trace_writer(std::shared_ptr<ostream> out, const string &out_name);
    void write_header(const string &date, const string &tool,
                      const string &version, const string &comment,
                      const string &timescale) throw(err);
    // scope declarations followed by $enddefinitions
    void write_scope(const module_node &root,
                     const signal_registry &registry) throw(err);
    // renders what write_scope() writes without touching any sink
    static string definitions(const module_node &root,
                              const signal_registry &registry) throw(err);
    void write_definitions(const string &defs) throw(err);
    // the $dumpvars block, one value per tracked signal in marker order
    void write_initial_values(const signal_registry &registry) throw(err);
    void write_timestamp(uint64_t time,
                         const change_tracker::changes_t &changed,
                         const signal_registry &registry) throw(err);
    static string encode_value(const logic_value &value,
                               const string &marker);
private:
    // empty if nothing observable is below m
    static string scope_body(const module_node &m,
                             const signal_registry &registry,
                             unsigned indent) throw(err);
    static string scope_string(const string &scope_name, const string &body,
                               unsigned indent);
    void write_value(const logic_signal &s,
                     const signal_registry &registry) throw(err);
    void check(const char *what) throw(err);
private:
    std::shared_ptr<ostream> out;
    const string out_name;
private:
    trace_writer(const trace_writer &); // not defined
};

#endif // __TRACE_WRITER_HPP__
