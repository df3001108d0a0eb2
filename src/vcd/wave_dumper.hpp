// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __WAVE_DUMPER_HPP__
#define __WAVE_DUMPER_HPP__

#include <string>
#include <iostream>
#include <memory>
#include "error.hpp"
#include "logger.hpp"
#include "module.hpp"
#include "simulator.hpp"
#include "dump_options.hpp"
#include "change_tracker.hpp"
#include "signal_registry.hpp"
#include "trace_writer.hpp"
#include "timestamp_scheduler.hpp"

using namespace std;

// Attaches to a built design and a simulator and dumps every value change
// in VCD format.  Construction writes the header, scope and initial
// values; a rejected design (unbuilt, or with colliding port names)
// leaves both the design and the output untouched.  Afterwards the simulator's notifications drive the dump.  The
// simulator subscriptions keep the sink open even if this object goes
// away before the simulation ends.
class wave_dumper {
public:
    // creates or truncates opts.output_path
    wave_dumper(module_node &root, simulator &sim, const dump_options &opts,
                logger &log) throw(err);
    wave_dumper(module_node &root, simulator &sim, const dump_options &opts,
                std::shared_ptr<ostream> out, logger &log) throw(err);
    const string &get_output_path() const throw();
    const signal_registry &get_registry() const throw();
    const timestamp_scheduler &get_scheduler() const throw();
private:
    // defs is the rendered scope section; the design is only subscribed
    // to once it has been written
    void attach(module_node &root, simulator &sim,
                std::shared_ptr<ostream> out, const string &defs) throw(err);
private:
    const dump_options opts;
    std::shared_ptr<change_tracker> tracker;
    std::shared_ptr<signal_registry> registry;
    std::shared_ptr<trace_writer> writer;
    std::shared_ptr<timestamp_scheduler> scheduler;
    logger &log;
private:
    wave_dumper(const wave_dumper &); // not defined
};

#endif // __WAVE_DUMPER_HPP__
