// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include "logger.hpp"

logstreambuf::logstreambuf() : sinks(), msg_verb(0) { }
logstreambuf::~logstreambuf() { }

void logstreambuf::add(streambuf *s, int v) {
    sink_t sink = { v, s };
    sinks.push_back(sink);
}

int logstreambuf::sync() {
    int result = 0;
    for (sinks_t::iterator si = sinks.begin(); si != sinks.end(); ++si) {
        if (si->buf->pubsync() != 0) result = -1;
    }
    return result;
}

// max_verbosity starts below every real verbosity so that a logger
// without sinks formats nothing
logger::logger()
    : ostream(&buf), max_verbosity(-1), buf(), owned_streams() { }

logger::~logger() {
    flush();
}

void logger::add(ostream &s, int v) {
    if (v > max_verbosity) max_verbosity = v;
    buf.add(s.rdbuf(), v);
}

void logger::add(const std::shared_ptr<ostream> s, int v) {
    if (v > max_verbosity) max_verbosity = v;
    owned_streams.push_back(s);
    buf.add(s->rdbuf(), v);
}
