// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include "simulator.hpp"

simulator::simulator(logger &l)
    : time(0), actions(), pre_tick_listeners(), end_listeners(),
      running(false), end_requested(false), ended(false), log(l) { }

uint64_t simulator::get_time() const throw() {
    return time;
}

void simulator::register_action(uint64_t t, const action_t &action)
    throw(err) {
    if (ended) throw err_panic("action registered after simulation ended");
    if (t < time) throw err_time_regression(time, t);
    // multimap inserts equal keys after the existing ones
    actions.insert(make_pair(t, action));
}

void simulator::on_pre_tick(const time_listener_t &listener) {
    pre_tick_listeners.push_back(listener);
}

void simulator::on_simulation_end(const time_listener_t &listener) {
    end_listeners.push_back(listener);
}

void simulator::notify(const time_listeners_t &listeners) throw(err) {
    for (time_listeners_t::size_type i = 0; i < listeners.size(); ++i) {
        listeners[i](time);
    }
}

void simulator::run(uint64_t max_time) throw(err) {
    if (running || ended) throw err_panic("simulator can only run once");
    running = true;
    while (!end_requested && !actions.empty()) {
        uint64_t next_time = actions.begin()->first;
        if (max_time != 0 && next_time > max_time) break;
        time = next_time;
        LOG(log,3) << "[sim] tick " << dec << time << endl;
        notify(pre_tick_listeners);
        while (!actions.empty() && actions.begin()->first == time) {
            action_t action = actions.begin()->second;
            actions.erase(actions.begin());
            action();
        }
    }
    running = false;
    ended = true;
    LOG(log,3) << "[sim] ended at " << dec << time << endl;
    notify(end_listeners);
}

void simulator::end_simulation() throw() {
    end_requested = true;
}

bool simulator::has_ended() const throw() {
    return ended;
}

bool simulator::is_drained() const throw() {
    return actions.empty();
}
