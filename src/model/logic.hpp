// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __LOGIC_HPP__
#define __LOGIC_HPP__

#include <string>
#include <vector>
#include <iostream>
#include <stdint.h>
#include "error.hpp"

using namespace std;

typedef enum { LV_0 = 0, LV_1 = 1, LV_X = 2, LV_Z = 3 } logic_bit_t;

char logic_bit_char(logic_bit_t b) throw();

// 4-state bit vector; bit 0 is the least significant bit
class logic_value {
public:
    logic_value() throw();
    explicit logic_value(unsigned width, logic_bit_t init = LV_X);
    static logic_value from_uint(unsigned width, uint64_t val);
    // text is written most significant bit first, e.g. "10xz"
    static logic_value from_string(const string &text) throw(err);
    unsigned width() const throw();
    logic_bit_t get(unsigned idx) const;
    void set(unsigned idx, logic_bit_t b);
    bool is_valid() const throw(); // no x or z bits
    string to_string() const; // most significant bit first
    bool operator==(const logic_value &) const throw();
    bool operator!=(const logic_value &) const throw();
private:
    vector<logic_bit_t> bits;
};

ostream &operator<<(ostream &, const logic_value &);

#endif // __LOGIC_HPP__
