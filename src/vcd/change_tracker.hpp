// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __CHANGE_TRACKER_HPP__
#define __CHANGE_TRACKER_HPP__

#include <vector>
#include <set>
#include "signal.hpp"

using namespace std;

// signals changed since the last flush, in first-change order
class change_tracker {
public:
    typedef vector<const logic_signal *> changes_t;
public:
    change_tracker();
    void on_change(const logic_signal &s);
    // returns the pending changes and leaves the tracker empty
    changes_t drain();
    bool empty() const throw();
    unsigned size() const throw();
private:
    changes_t pending;
    set<const logic_signal *> members;
};

#endif // __CHANGE_TRACKER_HPP__
