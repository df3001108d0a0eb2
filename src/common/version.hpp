// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __VERSION_HPP__
#define __VERSION_HPP__

#include <string>
#include "config.hpp"

extern const std::string wavetap_name;
extern const std::string wavetap_version;
extern const std::string wavetap_release;
extern const std::string wavetap_full_version;

#endif // __VERSION_HPP__
