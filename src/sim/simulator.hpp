// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __SIMULATOR_HPP__
#define __SIMULATOR_HPP__

#include <map>
#include <vector>
#include <boost/function.hpp>
#include <stdint.h>
#include "error.hpp"
#include "logger.hpp"

using namespace std;

// Single-threaded discrete-event host.  Each distinct time is processed
// as one tick: pre-tick listeners see the new time first, then every
// action registered for that time runs in registration order (including
// actions registered for the same time while the tick is running).
class simulator {
public:
    typedef boost::function<void ()> action_t;
    typedef boost::function<void (uint64_t)> time_listener_t;
public:
    explicit simulator(logger &log);
    uint64_t get_time() const throw();
    void register_action(uint64_t time, const action_t &action) throw(err);
    void on_pre_tick(const time_listener_t &listener);
    void on_simulation_end(const time_listener_t &listener);
    // max_time == 0 runs until no actions remain
    void run(uint64_t max_time = 0) throw(err);
    // stops after the current tick
    void end_simulation() throw();
    bool has_ended() const throw();
    bool is_drained() const throw();
private:
    typedef multimap<uint64_t, action_t> actions_t;
    typedef vector<time_listener_t> time_listeners_t;
private:
    void notify(const time_listeners_t &listeners) throw(err);
private:
    uint64_t time;
    actions_t actions;
    time_listeners_t pre_tick_listeners;
    time_listeners_t end_listeners;
    bool running;
    bool end_requested;
    bool ended;
    logger &log;
private:
    simulator(const simulator &); // not defined
};

#endif // __SIMULATOR_HPP__
