// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __SIGNAL_HPP__
#define __SIGNAL_HPP__

#include <string>
#include <vector>
#include <boost/function.hpp>
#include "error.hpp"
#include "logic.hpp"

using namespace std;

class module_node;

class logic_signal {
public:
    typedef enum { SK_INTERNAL, SK_PORT, SK_CONSTANT } kind_t;
    typedef boost::function<void (const logic_signal &)> listener_t;
public:
    logic_signal(module_node *parent, const string &name, kind_t kind,
                 const logic_value &init) throw(err);
    const string &get_name() const throw();
    string get_path() const;
    unsigned get_width() const throw();
    const logic_value &get_value() const throw();
    kind_t get_kind() const throw();
    bool is_port() const throw();
    bool is_constant() const throw();
    module_node *get_parent() const throw();
    // listeners run synchronously, in subscription order, whenever
    // put() changes the value
    void subscribe(const listener_t &listener);
    unsigned get_num_subscribers() const throw();
    void put(const logic_value &new_value) throw(err);
    void put(uint64_t new_value) throw(err);
private:
    typedef vector<listener_t> listeners_t;
private:
    module_node *parent;
    const string name;
    const kind_t kind;
    logic_value value;
    listeners_t listeners;
private:
    logic_signal(const logic_signal &); // not defined
    logic_signal &operator=(const logic_signal &); // not defined
};

#endif // __SIGNAL_HPP__
