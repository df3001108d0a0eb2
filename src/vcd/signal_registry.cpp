// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <cassert>
#include <deque>
#include <sstream>
#include <boost/bind/bind.hpp>
#include "signal_registry.hpp"

using namespace boost::placeholders;

signal_registry::signal_registry(module_node &root) throw(err)
    : tracker(), markers(), order(), targets() {
    collect(root);
}

signal_registry::signal_registry(module_node &root,
                                 std::shared_ptr<change_tracker> new_tracker)
    throw(err) : tracker(), markers(), order(), targets() {
    collect(root);
    subscribe(new_tracker);
}

void signal_registry::collect(module_node &root) throw(err) {
    if (!root.has_built()) throw err_not_built(root.get_path());
    // breadth-first; a module's signals get markers when it is dequeued
    deque<module_node *> to_visit(1, &root);
    while (!to_visit.empty()) {
        module_node *m = to_visit.front();
        to_visit.pop_front();
        const module_node::signals_t &sigs = m->get_signals();
        for (module_node::signals_t::const_iterator si = sigs.begin();
             si != sigs.end(); ++si) {
            if ((*si)->is_constant()) continue;
            track(**si);
        }
        const module_node::submodules_t &subs = m->get_submodules();
        for (module_node::submodules_t::const_iterator mi = subs.begin();
             mi != subs.end(); ++mi) {
            if ((*mi)->is_opaque()) continue;
            to_visit.push_back(mi->get());
        }
    }
}

void signal_registry::track(logic_signal &s) {
    assert(markers.find(&s) == markers.end());
    ostringstream marker;
    marker << 's' << dec << order.size();
    markers[&s] = marker.str();
    order.push_back(&s);
    targets.push_back(&s);
}

void signal_registry::subscribe(std::shared_ptr<change_tracker> new_tracker)
    throw(err) {
    if (!new_tracker) throw err_panic("signal registry needs a tracker");
    if (tracker) throw err_panic("signal registry already subscribed");
    tracker = new_tracker;
    for (vector<logic_signal *>::iterator si = targets.begin();
         si != targets.end(); ++si) {
        (*si)->subscribe(boost::bind(&change_tracker::on_change, tracker, _1));
    }
}

bool signal_registry::is_subscribed() const throw() {
    return static_cast<bool>(tracker);
}

bool signal_registry::is_tracked(const logic_signal &s) const throw() {
    return markers.find(&s) != markers.end();
}

const string &signal_registry::get_marker(const logic_signal &s) const
    throw(err) {
    markers_t::const_iterator mi = markers.find(&s);
    if (mi == markers.end()) throw err_untracked_signal(s.get_path());
    return mi->second;
}

const signal_registry::signals_t &signal_registry::get_tracked_signals() const
    throw() {
    return order;
}

unsigned signal_registry::size() const throw() {
    return order.size();
}
