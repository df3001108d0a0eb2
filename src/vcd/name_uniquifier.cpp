// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <sstream>
#include "name_uniquifier.hpp"

name_uniquifier::name_uniquifier() : taken() { }

string name_uniquifier::get_unique_name(const string &initial_name,
                                        bool reserved) throw(err) {
    if (reserved) {
        if (!is_available(initial_name)) {
            throw err_name_conflict(initial_name);
        }
        taken.insert(initial_name);
        return initial_name;
    }
    string name = initial_name;
    for (unsigned suffix = 0; !is_available(name); ++suffix) {
        ostringstream candidate;
        candidate << initial_name << '_' << dec << suffix;
        name = candidate.str();
    }
    taken.insert(name);
    return name;
}

bool name_uniquifier::is_available(const string &name) const throw() {
    return taken.find(name) == taken.end();
}
