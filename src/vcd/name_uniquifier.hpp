// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __NAME_UNIQUIFIER_HPP__
#define __NAME_UNIQUIFIER_HPP__

#include <string>
#include <set>
#include "error.hpp"

using namespace std;

// Hands out names that are unique within one scope.  Reserved names are
// granted verbatim or not at all; other names get a numeric suffix
// until they no longer collide.
class name_uniquifier {
public:
    name_uniquifier();
    string get_unique_name(const string &initial_name,
                           bool reserved = false) throw(err);
    bool is_available(const string &name) const throw();
private:
    set<string> taken;
};

#endif // __NAME_UNIQUIFIER_HPP__
