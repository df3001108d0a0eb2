// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __SANITIZER_HPP__
#define __SANITIZER_HPP__

#include <string>

using namespace std;

// maps an arbitrary name onto a legal VCD/Verilog identifier:
// characters outside [A-Za-z0-9_] become '_', a leading digit gets a
// '_' prefix, and Verilog keywords get a '_' suffix
string sanitize(const string &name);

bool is_sanitary(const string &name);

#endif // __SANITIZER_HPP__
