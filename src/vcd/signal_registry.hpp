// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __SIGNAL_REGISTRY_HPP__
#define __SIGNAL_REGISTRY_HPP__

#include <string>
#include <vector>
#include <map>
#include <memory>
#include "error.hpp"
#include "module.hpp"
#include "change_tracker.hpp"

using namespace std;

// Assigns a marker (s0, s1, ...) to every observable signal under the
// root and subscribes a change tracker to each of them.  Constants and
// anything inside an opaque submodule are not observable.  Subscribing
// is the only step that modifies the design.
class signal_registry {
public:
    typedef vector<const logic_signal *> signals_t;
public:
    // assigns markers only
    explicit signal_registry(module_node &root) throw(err);
    signal_registry(module_node &root,
                    std::shared_ptr<change_tracker> tracker) throw(err);
    // at most once per registry
    void subscribe(std::shared_ptr<change_tracker> tracker) throw(err);
    bool is_subscribed() const throw();
    bool is_tracked(const logic_signal &s) const throw();
    const string &get_marker(const logic_signal &s) const throw(err);
    // in marker order
    const signals_t &get_tracked_signals() const throw();
    unsigned size() const throw();
private:
    void collect(module_node &root) throw(err);
    void track(logic_signal &s);
private:
    typedef map<const logic_signal *, string> markers_t;
private:
    std::shared_ptr<change_tracker> tracker;
    markers_t markers;
    signals_t order;
    vector<logic_signal *> targets;
private:
    signal_registry(const signal_registry &); // not defined
};

#endif // __SIGNAL_REGISTRY_HPP__
