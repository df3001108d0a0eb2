// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <fstream>
#include <boost/bind/bind.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "wave_dumper.hpp"

using namespace boost::placeholders;
using namespace boost::posix_time;

wave_dumper::wave_dumper(module_node &root, simulator &sim,
                         const dump_options &new_opts, logger &l) throw(err)
    : opts(new_opts), tracker(), registry(), writer(), scheduler(), log(l) {
    // everything that can be rejected is checked before the file is touched
    registry = std::shared_ptr<signal_registry>(new signal_registry(root));
    string defs = trace_writer::definitions(root, *registry);
    std::shared_ptr<ofstream> f(new ofstream(opts.output_path.c_str(),
                                             ios::out | ios::trunc));
    if (f->fail()) throw err_io(opts.output_path, "cannot open for writing");
    attach(root, sim, f, defs);
}

wave_dumper::wave_dumper(module_node &root, simulator &sim,
                         const dump_options &new_opts,
                         std::shared_ptr<ostream> out, logger &l) throw(err)
    : opts(new_opts), tracker(), registry(), writer(), scheduler(), log(l) {
    if (!out) throw err_panic("wave dumper needs an output stream");
    registry = std::shared_ptr<signal_registry>(new signal_registry(root));
    string defs = trace_writer::definitions(root, *registry);
    attach(root, sim, out, defs);
}

void wave_dumper::attach(module_node &root, simulator &sim,
                         std::shared_ptr<ostream> out,
                         const string &defs) throw(err) {
    writer = std::shared_ptr<trace_writer>(new trace_writer(out,
                                                            opts.output_path));
    ptime now = second_clock::local_time();
    writer->write_header(to_iso_extended_string(now), opts.tool, opts.version,
                         opts.comment, opts.timescale);
    writer->write_definitions(defs);
    writer->write_initial_values(*registry);
    tracker = std::shared_ptr<change_tracker>(new change_tracker());
    registry->subscribe(tracker);
    scheduler = std::shared_ptr<timestamp_scheduler>(
        new timestamp_scheduler(sim.get_time(), tracker, writer, registry,
                                log));
    sim.on_pre_tick(boost::bind(&timestamp_scheduler::on_pre_tick,
                                scheduler, _1));
    sim.on_simulation_end(boost::bind(&timestamp_scheduler::on_simulation_end,
                                      scheduler, _1));
    LOG(log,1) << "[vcd] tracking " << dec << registry->size()
               << " signal" << (registry->size() == 1 ? "" : "s")
               << " of " << root.get_path() << " in " << opts.output_path
               << endl;
}

const string &wave_dumper::get_output_path() const throw() {
    return opts.output_path;
}

const signal_registry &wave_dumper::get_registry() const throw() {
    return *registry;
}

const timestamp_scheduler &wave_dumper::get_scheduler() const throw() {
    return *scheduler;
}
