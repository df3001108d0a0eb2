// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include "module.hpp"

module_node::module_node(const string &new_name, bool new_opaque)
    : parent(0), name(new_name), opaque(new_opaque), built(false),
      signals(), submodules() { }

module_node::module_node(module_node *new_parent, const string &new_name,
                         bool new_opaque)
    : parent(new_parent), name(new_name), opaque(new_opaque), built(false),
      signals(), submodules() { }

const string &module_node::get_name() const throw() {
    return name;
}

string module_node::get_path() const {
    return parent ? parent->get_path() + "." + name : name;
}

module_node *module_node::get_parent() const throw() {
    return parent;
}

bool module_node::is_opaque() const throw() {
    return opaque;
}

module_node &module_node::add_submodule(const string &sub_name,
                                        bool sub_opaque) throw(err) {
    if (built) throw err_already_built(get_path());
    std::shared_ptr<module_node> m(new module_node(this, sub_name,
                                                   sub_opaque));
    submodules.push_back(m);
    return *m;
}

logic_signal &module_node::add(const string &sig_name,
                               logic_signal::kind_t kind,
                               const logic_value &init) throw(err) {
    if (built) throw err_already_built(get_path());
    std::shared_ptr<logic_signal> s(new logic_signal(this, sig_name,
                                                     kind, init));
    signals.push_back(s);
    return *s;
}

logic_signal &module_node::add_signal(const string &sig_name,
                                      unsigned width) throw(err) {
    return add(sig_name, logic_signal::SK_INTERNAL, logic_value(width));
}

logic_signal &module_node::add_signal(const string &sig_name,
                                      const logic_value &init) throw(err) {
    return add(sig_name, logic_signal::SK_INTERNAL, init);
}

logic_signal &module_node::add_port(const string &sig_name,
                                    unsigned width) throw(err) {
    return add(sig_name, logic_signal::SK_PORT, logic_value(width));
}

logic_signal &module_node::add_port(const string &sig_name,
                                    const logic_value &init) throw(err) {
    return add(sig_name, logic_signal::SK_PORT, init);
}

logic_signal &module_node::add_constant(const string &sig_name,
                                        const logic_value &value) throw(err) {
    return add(sig_name, logic_signal::SK_CONSTANT, value);
}

const module_node::signals_t &module_node::get_signals() const throw() {
    return signals;
}

const module_node::submodules_t &module_node::get_submodules() const throw() {
    return submodules;
}

logic_signal *module_node::find_signal(const string &sig_name) const throw() {
    for (signals_t::const_iterator si = signals.begin();
         si != signals.end(); ++si) {
        if ((*si)->get_name() == sig_name) return si->get();
    }
    return 0;
}

module_node *module_node::find_submodule(const string &sub_name) const
    throw() {
    for (submodules_t::const_iterator mi = submodules.begin();
         mi != submodules.end(); ++mi) {
        if ((*mi)->get_name() == sub_name) return mi->get();
    }
    return 0;
}

void module_node::build() throw(err) {
    for (submodules_t::iterator mi = submodules.begin();
         mi != submodules.end(); ++mi) {
        (*mi)->build();
    }
    built = true;
}

bool module_node::has_built() const throw() {
    return built;
}
