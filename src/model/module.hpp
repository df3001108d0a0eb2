// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __MODULE_HPP__
#define __MODULE_HPP__

#include <string>
#include <vector>
#include <memory>
#include "error.hpp"
#include "logic.hpp"
#include "signal.hpp"

using namespace std;

// one node of the design hierarchy; owns its signals and submodules,
// both kept in declaration order
class module_node {
public:
    typedef vector<std::shared_ptr<logic_signal> > signals_t;
    typedef vector<std::shared_ptr<module_node> > submodules_t;
public:
    explicit module_node(const string &name, bool opaque = false);
    const string &get_name() const throw();
    string get_path() const;
    module_node *get_parent() const throw();
    bool is_opaque() const throw();
    module_node &add_submodule(const string &name,
                               bool opaque = false) throw(err);
    logic_signal &add_signal(const string &name, unsigned width) throw(err);
    logic_signal &add_signal(const string &name,
                             const logic_value &init) throw(err);
    logic_signal &add_port(const string &name, unsigned width) throw(err);
    logic_signal &add_port(const string &name,
                           const logic_value &init) throw(err);
    logic_signal &add_constant(const string &name,
                               const logic_value &value) throw(err);
    const signals_t &get_signals() const throw();
    const submodules_t &get_submodules() const throw();
    logic_signal *find_signal(const string &name) const throw();
    module_node *find_submodule(const string &name) const throw();
    // freezes this module and all its submodules
    void build() throw(err);
    bool has_built() const throw();
private:
    module_node(module_node *parent, const string &name, bool opaque);
    logic_signal &add(const string &name, logic_signal::kind_t kind,
                      const logic_value &init) throw(err);
private:
    module_node *parent;
    const string name;
    const bool opaque;
    bool built;
    signals_t signals;
    submodules_t submodules;
private:
    module_node(const module_node &); // not defined
    module_node &operator=(const module_node &); // not defined
};

#endif // __MODULE_HPP__
