// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __LOGGER_HPP__
#define __LOGGER_HPP__

#include <vector>
#include <iostream>
#include <memory>

using namespace std;

// fans every character out to all sinks whose verbosity threshold
// admits the verbosity of the message being written
class logstreambuf : public streambuf {
public:
    logstreambuf();
    virtual ~logstreambuf();
    void add(streambuf *, int verbosity);
    void set_message_verbosity(int verbosity);
protected:
    virtual int overflow(int);
    virtual int sync();
private:
    typedef struct {
        int verbosity;
        streambuf *buf;
    } sink_t;
    typedef vector<sink_t> sinks_t;
    sinks_t sinks;
    int msg_verb; // current message verbosity
};

class logger : public ostream {
public:
    logger();
    virtual ~logger();
    void add(ostream &, int);
    void add(std::shared_ptr<ostream>, int);
    void set_message_verbosity(int);
    int get_max_verbosity() const;
private:
    int max_verbosity;
    logstreambuf buf;
    vector<std::shared_ptr<ostream> > owned_streams;
private:
    logger(const logger &); // not defined
};

inline int logstreambuf::overflow(int ch) {
    if (ch == traits_type::eof()) return traits_type::not_eof(ch);
    for (sinks_t::iterator si = sinks.begin(); si != sinks.end(); ++si) {
        if (msg_verb <= si->verbosity) si->buf->sputc(ch);
    }
    return ch;
}

inline void logstreambuf::set_message_verbosity(int v) {
    msg_verb = v;
}

inline void logger::set_message_verbosity(int verb) {
    buf.set_message_verbosity(verb);
}

inline int logger::get_max_verbosity() const {
    return max_verbosity;
}

#define LOG(l,v) if ((v) <= ((l)).get_max_verbosity()) (l).set_message_verbosity((v)), (l)

#endif // __LOGGER_HPP__
