// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include "module.hpp"
#include "signal.hpp"

logic_signal::logic_signal(module_node *new_parent, const string &new_name,
                           kind_t new_kind, const logic_value &init) throw(err)
    : parent(new_parent), name(new_name), kind(new_kind), value(init),
      listeners() {
    if (init.width() == 0) throw err_bad_width(name, 1, 0);
}

const string &logic_signal::get_name() const throw() {
    return name;
}

string logic_signal::get_path() const {
    return parent ? parent->get_path() + "." + name : name;
}

unsigned logic_signal::get_width() const throw() {
    return value.width();
}

const logic_value &logic_signal::get_value() const throw() {
    return value;
}

logic_signal::kind_t logic_signal::get_kind() const throw() {
    return kind;
}

bool logic_signal::is_port() const throw() {
    return kind == SK_PORT;
}

bool logic_signal::is_constant() const throw() {
    return kind == SK_CONSTANT;
}

module_node *logic_signal::get_parent() const throw() {
    return parent;
}

void logic_signal::subscribe(const listener_t &listener) {
    listeners.push_back(listener);
}

unsigned logic_signal::get_num_subscribers() const throw() {
    return listeners.size();
}

void logic_signal::put(const logic_value &new_value) throw(err) {
    if (kind == SK_CONSTANT) throw err_const_write(get_path());
    if (new_value.width() != value.width()) {
        throw err_bad_width(get_path(), value.width(), new_value.width());
    }
    if (new_value == value) return;
    value = new_value;
    // indexed: a listener may subscribe further listeners
    for (listeners_t::size_type i = 0; i < listeners.size(); ++i) {
        listeners[i](*this);
    }
}

void logic_signal::put(uint64_t new_value) throw(err) {
    put(logic_value::from_uint(value.width(), new_value));
}
