// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include "change_tracker.hpp"

change_tracker::change_tracker() : pending(), members() { }

void change_tracker::on_change(const logic_signal &s) {
    if (members.insert(&s).second) pending.push_back(&s);
}

change_tracker::changes_t change_tracker::drain() {
    changes_t drained;
    drained.swap(pending);
    members.clear();
    return drained;
}

bool change_tracker::empty() const throw() {
    return pending.empty();
}

unsigned change_tracker::size() const throw() {
    return pending.size();
}
