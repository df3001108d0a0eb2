// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#ifndef __TIMESTAMP_SCHEDULER_HPP__
#define __TIMESTAMP_SCHEDULER_HPP__

#include <memory>
#include <stdint.h>
#include "error.hpp"
#include "logger.hpp"
#include "change_tracker.hpp"
#include "signal_registry.hpp"
#include "trace_writer.hpp"

using namespace std;

// Collects changes for one timestamp at a time and writes them out only
// once simulation time moves on, so that any number of changes within
// one instant end up in a single block.
class timestamp_scheduler {
public:
    timestamp_scheduler(uint64_t start_time,
                        std::shared_ptr<change_tracker> tracker,
                        std::shared_ptr<trace_writer> writer,
                        std::shared_ptr<signal_registry> registry,
                        logger &log);
    // call before simulation advances to a new time
    void on_pre_tick(uint64_t now) throw(err);
    // final flush; always writes a block for the end time
    void on_simulation_end(uint64_t now) throw(err);
    uint64_t get_current_timestamp() const throw();
    bool has_ended() const throw();
    uint64_t get_num_blocks() const throw();
private:
    void advance(uint64_t now) throw(err);
    void flush(uint64_t time) throw(err);
private:
    uint64_t current_timestamp;
    std::shared_ptr<change_tracker> tracker;
    std::shared_ptr<trace_writer> writer;
    std::shared_ptr<signal_registry> registry;
    bool ended;
    uint64_t num_blocks;
    logger &log;
private:
    timestamp_scheduler(const timestamp_scheduler &); // not defined
};

#endif // __TIMESTAMP_SCHEDULER_HPP__
