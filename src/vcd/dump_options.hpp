// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __DUMP_OPTIONS_HPP__
#define __DUMP_OPTIONS_HPP__

#include <string>

using namespace std;

class dump_options {
public:
    dump_options();
public:
    string output_path;
    string timescale;
    string tool;
    string version;
    string comment;
};

#endif // __DUMP_OPTIONS_HPP__
