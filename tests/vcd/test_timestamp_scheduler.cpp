// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <sstream>
#include <gtest/gtest.h>
#include "module.hpp"
#include "timestamp_scheduler.hpp"

namespace {

class scheduler_test : public ::testing::Test {
protected:
    scheduler_test()
        : top("top"), a(top.add_signal("a", logic_value::from_uint(1, 0))),
          b(top.add_signal("b", logic_value::from_uint(1, 0))),
          sink(new ostringstream()), tracker(new change_tracker()) {
        top.build();
        registry = std::shared_ptr<signal_registry>(
            new signal_registry(top, tracker));
        writer = std::shared_ptr<trace_writer>(new trace_writer(sink, "mem"));
    }
    std::shared_ptr<timestamp_scheduler> make(uint64_t start) {
        return std::shared_ptr<timestamp_scheduler>(
            new timestamp_scheduler(start, tracker, writer, registry, log));
    }
    module_node top;
    logic_signal &a;
    logic_signal &b;
    std::shared_ptr<ostringstream> sink;
    std::shared_ptr<change_tracker> tracker;
    std::shared_ptr<signal_registry> registry;
    std::shared_ptr<trace_writer> writer;
    logger log;
};

}

TEST_F(scheduler_test, coalesces_changes_within_one_instant) {
    std::shared_ptr<timestamp_scheduler> s = make(0);
    s->on_pre_tick(3);
    a.put(1);
    b.put(1);
    a.put(0);
    a.put(1);
    s->on_pre_tick(3);
    EXPECT_EQ("", sink->str());
    s->on_pre_tick(4);
    EXPECT_EQ("#3\n1s0\n1s1\n", sink->str());
    EXPECT_EQ(4u, s->get_current_timestamp());
    EXPECT_EQ(1u, s->get_num_blocks());
}

TEST_F(scheduler_test, skips_quiet_timestamps) {
    std::shared_ptr<timestamp_scheduler> s = make(0);
    s->on_pre_tick(1);
    s->on_pre_tick(2);
    a.put(1);
    s->on_pre_tick(3);
    s->on_pre_tick(4);
    s->on_pre_tick(5);
    EXPECT_EQ("#2\n1s0\n", sink->str());
}

TEST_F(scheduler_test, changes_before_first_tick_belong_to_start_time) {
    std::shared_ptr<timestamp_scheduler> s = make(10);
    b.put(1);
    s->on_pre_tick(10);
    s->on_pre_tick(11);
    EXPECT_EQ("#10\n1s1\n", sink->str());
}

TEST_F(scheduler_test, end_forces_a_final_block) {
    std::shared_ptr<timestamp_scheduler> s = make(0);
    s->on_pre_tick(8);
    a.put(1);
    s->on_simulation_end(8);
    EXPECT_EQ("#8\n1s0\n", sink->str());
    EXPECT_TRUE(s->has_ended());
}

TEST_F(scheduler_test, end_writes_marker_even_when_quiet) {
    std::shared_ptr<timestamp_scheduler> s = make(0);
    s->on_pre_tick(2);
    s->on_simulation_end(2);
    EXPECT_EQ("#2\n", sink->str());
}

TEST_F(scheduler_test, end_at_later_time_keeps_pending_changes_apart) {
    std::shared_ptr<timestamp_scheduler> s = make(0);
    s->on_pre_tick(2);
    a.put(1);
    s->on_simulation_end(6);
    EXPECT_EQ("#2\n1s0\n#6\n", sink->str());
}

TEST_F(scheduler_test, inert_after_end) {
    std::shared_ptr<timestamp_scheduler> s = make(0);
    s->on_simulation_end(0);
    a.put(1);
    s->on_pre_tick(9);
    s->on_simulation_end(9);
    EXPECT_EQ("#0\n", sink->str());
    EXPECT_EQ(1u, s->get_num_blocks());
}

TEST_F(scheduler_test, time_going_backwards_is_reported) {
    std::shared_ptr<timestamp_scheduler> s = make(5);
    EXPECT_THROW(s->on_pre_tick(4), err_time_regression);
}
