// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <cassert>
#include "timestamp_scheduler.hpp"

timestamp_scheduler::timestamp_scheduler(
    uint64_t start_time, std::shared_ptr<change_tracker> new_tracker,
    std::shared_ptr<trace_writer> new_writer,
    std::shared_ptr<signal_registry> new_registry, logger &l)
    : current_timestamp(start_time), tracker(new_tracker),
      writer(new_writer), registry(new_registry), ended(false),
      num_blocks(0), log(l) {
    assert(tracker);
    assert(writer);
    assert(registry);
}

void timestamp_scheduler::flush(uint64_t time) throw(err) {
    change_tracker::changes_t changed = tracker->drain();
    LOG(log,2) << "[vcd] #" << dec << time << ": " << changed.size()
               << " change" << (changed.size() == 1 ? "" : "s") << endl;
    writer->write_timestamp(time, changed, *registry);
    ++num_blocks;
}

void timestamp_scheduler::advance(uint64_t now) throw(err) {
    if (now < current_timestamp) {
        throw err_time_regression(current_timestamp, now);
    }
    if (now == current_timestamp) return; // same instant
    if (!tracker->empty()) flush(current_timestamp);
    current_timestamp = now;
}

void timestamp_scheduler::on_pre_tick(uint64_t now) throw(err) {
    if (ended) return;
    advance(now);
}

void timestamp_scheduler::on_simulation_end(uint64_t now) throw(err) {
    if (ended) return;
    advance(now);
    flush(current_timestamp);
    ended = true;
}

uint64_t timestamp_scheduler::get_current_timestamp() const throw() {
    return current_timestamp;
}

bool timestamp_scheduler::has_ended() const throw() {
    return ended;
}

uint64_t timestamp_scheduler::get_num_blocks() const throw() {
    return num_blocks;
}
