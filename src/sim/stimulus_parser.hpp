// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __STIMULUS_PARSER_HPP__
#define __STIMULUS_PARSER_HPP__

#include <string>
#include <vector>
#include <set>
#include <iostream>
#include <memory>
#include <boost/tuple/tuple.hpp>
#include "error.hpp"
#include "logic.hpp"
#include "module.hpp"
#include "simulator.hpp"

using namespace std;

// Reads a design hierarchy and a list of timed signal assignments:
//
//   module top                 first module line names the root
//   module top.alu opaque
//   port top clk 1
//   signal top.alu acc 8
//   const top vdd 1 1
//   set 5 top.clk 1
//   end 100
//
// Values are decimal, 0x.., 0b.., or ' followed by 4-state bits written
// most significant bit first.  The design is built once parsing is done.
class stimulus_parser {
public:
    typedef boost::tuple<uint64_t, logic_signal *, logic_value> event_t;
    typedef vector<event_t> events_t;
public:
    // widest signal a declaration may ask for
    static const unsigned max_signal_width = 65536;
public:
    explicit stimulus_parser(const string &file) throw(err);
    stimulus_parser(istream &input, const string &input_name) throw(err);
    std::shared_ptr<module_node> get_design() const throw();
    const events_t &get_events() const throw();
    uint64_t get_end_time() const throw(); // 0 if not given
    void schedule(simulator &sim) const throw(err);
private:
    typedef boost::tuple<string, unsigned> pos_t;
    void parse(istream &input) throw(err);
    void p_line() throw(err);
    uint64_t to_nat(const string &s, uint64_t low, uint64_t high) throw(err);
    uint64_t p_nat(uint64_t low = 0, uint64_t high = UINT64_MAX) throw(err);
    string p_word(const char *what) throw(err);
    string p_kw(const set<string> &kws, bool empty_ok) throw(err);
    string p_kw(const string &kw1, bool empty_ok) throw(err);
    void p_end_of_line() throw(err);
    module_node &p_module_path() throw(err);
    logic_signal &p_signal_path() throw(err);
    logic_value p_value(unsigned width) throw(err);
    void p_module() throw(err);
    void p_signal(logic_signal::kind_t kind) throw(err);
    void p_set() throw(err);
    void p_end() throw(err);
    void fail(const string &msg) const throw(err);
private:
    std::shared_ptr<module_node> design;
    events_t events;
    uint64_t end_time;
    std::shared_ptr<istream> line;
    pos_t pos;
};

#endif // __STIMULUS_PARSER_HPP__
