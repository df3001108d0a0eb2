// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <cstdlib>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <memory>
#include <stdint.h>
#include <boost/program_options.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "version.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "simulator.hpp"
#include "stimulus_parser.hpp"
#include "dump_options.hpp"
#include "wave_dumper.hpp"

using namespace std;
using namespace boost::posix_time;
namespace po = boost::program_options;

static logger syslog;

int main(int argc, char **argv) {
    po::options_description opts_desc("Options");
    po::options_description hidden_opts_desc("Hidden options");
    po::positional_options_description args_desc;
    po::options_description all_opts_desc;
    opts_desc.add_options()
        ("cycles", po::value<uint64_t>(),
         "simulate until time arg (default: 0 = until drained)")
        ("vcd-file", po::value<string>(),
         "write trace in VCD format to file arg (default: waves.vcd)")
        ("timescale", po::value<string>(),
         "VCD timescale (default: 1ps)")
        ("log-file", po::value<vector<string> >()->composing(),
         "write a log to file arg")
        ("verbosity", po::value<int>(), "set console verbosity")
        ("log-verbosity", po::value<int>(), "set log verbosity")
        ("version", po::value<vector<bool> >()->zero_tokens()->composing(),
         "show program version and exit")
        ("help,h", po::value<vector<bool> >()->zero_tokens()->composing(),
         "show this help message and exit");
    hidden_opts_desc.add_options()
        ("stimulus", po::value<vector<string> >(), "stimulus file");
    args_desc.add("stimulus", -1);
    po::variables_map opts;
    all_opts_desc.add(opts_desc).add(hidden_opts_desc);
    try {
        po::store(po::command_line_parser(argc, argv).options(all_opts_desc).
                  positional(args_desc).run(), opts);
        po::notify(opts);
    } catch (po::error &e) {
        cerr << e.what() << endl;
        exit(1);
    }
    if (opts.count("help")) {
        cout << "Usage: wavetap STIMULUS_FILE" << endl;
        cout << opts_desc;
    }
    if (opts.count("version")) cout << wavetap_full_version << endl;
    if (opts.count("version") || opts.count("help")) exit(0);
    if (opts.count("stimulus") < 1) {
        cerr << "not enough arguments; try -h" << endl;
        exit(1);
    }
    vector<string> stimuli = opts["stimulus"].as<vector<string> >();
    if (stimuli.size() > 1) {
        cerr << "too many arguments; try -h" << endl;
        exit(1);
    }
    int verb = (opts.count("verbosity") ?
                     opts["verbosity"].as<int>() : 0);
    syslog.add(cout, verb);
    if (opts.count("log-file")) {
        int log_verb = (opts.count("log-verbosity") ?
                             opts["log-verbosity"].as<int>() : verb);
        vector<string> fns = opts["log-file"].as<vector<string> >();
        for (vector<string>::const_iterator fn = fns.begin();
             fn != fns.end(); ++fn) {
            std::shared_ptr<ofstream> f(new ofstream(fn->c_str()));
            if (f->fail()) {
                cerr << "ERROR: failed to write log: " << *fn << endl;
                exit(1);
            }
            syslog.add(f, log_verb);
        }
    }
    dump_options dump_opts;
    if (opts.count("vcd-file")) {
        dump_opts.output_path = opts["vcd-file"].as<string>();
    }
    if (opts.count("timescale")) {
        dump_opts.timescale = opts["timescale"].as<string>();
    }
    uint64_t num_cycles = 0;
    if (opts.count("cycles")) {
        num_cycles = opts["cycles"].as<uint64_t>();
    }
    LOG(syslog,0) << wavetap_full_version << endl << endl;
    simulator sim(syslog);
    std::shared_ptr<stimulus_parser> stimulus;
    std::shared_ptr<wave_dumper> dumper;
    try {
        stimulus = std::shared_ptr<stimulus_parser>(
            new stimulus_parser(stimuli.front()));
        if (num_cycles == 0) num_cycles = stimulus->get_end_time();
        stimulus->schedule(sim);
        dumper = std::shared_ptr<wave_dumper>(
            new wave_dumper(*stimulus->get_design(), sim, dump_opts, syslog));
    } catch (const err_parse &e) {
        cerr << e << endl;
        exit(1);
    } catch (const err &e) {
        cerr << "ERROR: " << e << endl;
        exit(1);
    }
    try {
        ptime sim_start_time = microsec_clock::local_time();
        sim.run(num_cycles);
        ptime sim_end_time = microsec_clock::local_time();
        LOG(syslog,0) << "simulation ended successfully" << endl;
        time_duration sim_time = sim_end_time - sim_start_time;
        LOG(syslog,0) << endl;
        LOG(syslog,0) << "total simulation time:   "
            << dec << sim_time << endl
            << "total simulation cycles: "
            << dec << sim.get_time() << endl
            << "timestamps dumped:       "
            << dec << dumper->get_scheduler().get_num_blocks()
            << " (to " << dumper->get_output_path() << ")" << endl;
    } catch (const err &e) {
        cerr << "ERROR: " << e << endl;
        exit(2);
    }
    return 0;
}
