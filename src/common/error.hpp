// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __ERROR_HPP__
#define __ERROR_HPP__

#include <string>
#include <iostream>
#include <stdint.h>

using namespace std;

class err {
protected:
    err() throw();
    virtual ~err() throw();
    friend ostream &operator<<(ostream &, const err &);
private:
    virtual void show_to(ostream &out) const = 0;
};

class err_panic : public err {
public:
    explicit err_panic(const string &message) throw();
    explicit err_panic(const char *message) throw();
    virtual ~err_panic() throw();
private:
    virtual void show_to(ostream &out) const;
protected:
    string msg;
};

// dumper attached before the hierarchy was built
class err_not_built : public err {
public:
    explicit err_not_built(const string &module_name) throw();
    virtual ~err_not_built() throw();
private:
    virtual void show_to(ostream &out) const;
private:
    const string module;
};

class err_already_built : public err {
public:
    explicit err_already_built(const string &module_name) throw();
    virtual ~err_already_built() throw();
private:
    virtual void show_to(ostream &out) const;
private:
    const string module;
};

// two reserved (port) names collide in one scope
class err_name_conflict : public err {
public:
    explicit err_name_conflict(const string &name) throw();
    virtual ~err_name_conflict() throw();
private:
    virtual void show_to(ostream &out) const;
private:
    const string name;
};

class err_io : public err {
public:
    explicit err_io(const string &file, const string &what) throw();
    virtual ~err_io() throw();
private:
    virtual void show_to(ostream &out) const;
private:
    const string file;
    const string what;
};

class err_time_regression : public err {
public:
    explicit err_time_regression(uint64_t now, uint64_t requested) throw();
    virtual ~err_time_regression() throw();
private:
    virtual void show_to(ostream &out) const;
private:
    const uint64_t now;
    const uint64_t requested;
};

class err_bad_width : public err {
public:
    explicit err_bad_width(const string &signal, unsigned expected,
                           unsigned got) throw();
    virtual ~err_bad_width() throw();
private:
    virtual void show_to(ostream &out) const;
private:
    const string signal;
    const unsigned expected;
    const unsigned got;
};

class err_const_write : public err {
public:
    explicit err_const_write(const string &signal) throw();
    virtual ~err_const_write() throw();
private:
    virtual void show_to(ostream &out) const;
private:
    const string signal;
};

class err_bad_value : public err {
public:
    explicit err_bad_value(const string &text) throw();
    virtual ~err_bad_value() throw();
private:
    virtual void show_to(ostream &out) const;
private:
    const string text;
};

class err_untracked_signal : public err {
public:
    explicit err_untracked_signal(const string &signal) throw();
    virtual ~err_untracked_signal() throw();
private:
    virtual void show_to(ostream &out) const;
private:
    const string signal;
};

class err_parse : public err {
public:
    err_parse(const string &file,
              const string &msg = string("parse error")) throw();
    err_parse(const string &file, unsigned line,
              const string &msg = string("parse error")) throw();
    virtual ~err_parse() throw();
private:
    const string file;
    const unsigned line;
    const string msg;
    virtual void show_to(ostream &out) const;
};

ostream &operator<<(ostream &, const err &);

#endif // __ERROR_HPP__
