// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <cassert>
#include "logic.hpp"

char logic_bit_char(logic_bit_t b) throw() {
    switch (b) {
    case LV_0: return '0';
    case LV_1: return '1';
    case LV_X: return 'x';
    case LV_Z: return 'z';
    }
    return 'x';
}

logic_value::logic_value() throw() : bits() { }

logic_value::logic_value(unsigned width, logic_bit_t init)
    : bits(width, init) { }

logic_value logic_value::from_uint(unsigned width, uint64_t val) {
    logic_value v(width, LV_0);
    for (unsigned i = 0; i < width && i < 64; ++i) {
        if ((val >> i) & 1) v.bits[i] = LV_1;
    }
    return v;
}

logic_value logic_value::from_string(const string &text) throw(err) {
    if (text.empty()) throw err_bad_value(text);
    logic_value v(text.size(), LV_X);
    for (unsigned i = 0; i < text.size(); ++i) {
        logic_bit_t b;
        switch (text[text.size() - 1 - i]) {
        case '0': b = LV_0; break;
        case '1': b = LV_1; break;
        case 'x': case 'X': b = LV_X; break;
        case 'z': case 'Z': b = LV_Z; break;
        default: throw err_bad_value(text);
        }
        v.bits[i] = b;
    }
    return v;
}

unsigned logic_value::width() const throw() {
    return bits.size();
}

logic_bit_t logic_value::get(unsigned idx) const {
    assert(idx < bits.size());
    return bits[idx];
}

void logic_value::set(unsigned idx, logic_bit_t b) {
    assert(idx < bits.size());
    bits[idx] = b;
}

bool logic_value::is_valid() const throw() {
    for (vector<logic_bit_t>::const_iterator bi = bits.begin();
         bi != bits.end(); ++bi) {
        if (*bi != LV_0 && *bi != LV_1) return false;
    }
    return true;
}

string logic_value::to_string() const {
    string s;
    s.reserve(bits.size());
    for (vector<logic_bit_t>::const_reverse_iterator bi = bits.rbegin();
         bi != bits.rend(); ++bi) {
        s.push_back(logic_bit_char(*bi));
    }
    return s;
}

bool logic_value::operator==(const logic_value &o) const throw() {
    return bits == o.bits;
}

bool logic_value::operator!=(const logic_value &o) const throw() {
    return bits != o.bits;
}

ostream &operator<<(ostream &out, const logic_value &v) {
    return out << v.to_string();
}
