// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include "version.hpp"
#include "dump_options.hpp"

dump_options::dump_options()
    : output_path("waves.vcd"), timescale("1ps"), tool(wavetap_name),
      version(wavetap_version), comment("Generated by " + wavetap_name) { }
