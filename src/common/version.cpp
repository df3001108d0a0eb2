// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include "version.hpp"

const std::string wavetap_name = PACKAGE_NAME;
const std::string wavetap_version = PACKAGE_VERSION;
const std::string wavetap_release = PACKAGE_RELEASE_NAME;
const std::string wavetap_full_version =
    wavetap_name + " version " + wavetap_version + " (" + wavetap_release + ")";
