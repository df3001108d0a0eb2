// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <string>
#include <vector>
#include <sstream>
#include <boost/bind/bind.hpp>
#include <gtest/gtest.h>
#include "simulator.hpp"

using namespace boost::placeholders;

namespace {

class journal {
public:
    void note(const string &what) { entries.push_back(what); }
    void tick(uint64_t t) {
        ostringstream e; e << "tick " << t; entries.push_back(e.str());
    }
    void end(uint64_t t) {
        ostringstream e; e << "end " << t; entries.push_back(e.str());
    }
    vector<string> entries;
};

void noop() { }

void schedule_in_past(simulator *sim) {
    sim->register_action(sim->get_time() - 1, &noop);
}

void schedule_more(simulator *sim, journal *j) {
    j->note("first");
    sim->register_action(sim->get_time(), boost::bind(&journal::note, j,
                                                      string("same tick")));
    sim->register_action(sim->get_time() + 3,
                         boost::bind(&journal::note, j, string("later")));
}

}

TEST(simulator, runs_ticks_in_time_order) {
    logger log;
    simulator sim(log);
    journal j;
    sim.on_pre_tick(boost::bind(&journal::tick, &j, _1));
    sim.on_simulation_end(boost::bind(&journal::end, &j, _1));
    sim.register_action(7, boost::bind(&journal::note, &j, string("b")));
    sim.register_action(2, boost::bind(&journal::note, &j, string("a")));
    sim.register_action(7, boost::bind(&journal::note, &j, string("c")));
    sim.run();
    const char *expected[] = { "tick 2", "a", "tick 7", "b", "c", "end 7" };
    ASSERT_EQ(6u, j.entries.size());
    for (unsigned i = 0; i < 6; ++i) EXPECT_EQ(expected[i], j.entries[i]);
    EXPECT_TRUE(sim.has_ended());
    EXPECT_EQ(7u, sim.get_time());
}

TEST(simulator, actions_may_schedule_into_current_tick) {
    logger log;
    simulator sim(log);
    journal j;
    sim.on_pre_tick(boost::bind(&journal::tick, &j, _1));
    sim.register_action(1, boost::bind(&schedule_more, &sim, &j));
    sim.run();
    const char *expected[] = { "tick 1", "first", "same tick",
                               "tick 4", "later" };
    ASSERT_EQ(5u, j.entries.size());
    for (unsigned i = 0; i < 5; ++i) EXPECT_EQ(expected[i], j.entries[i]);
}

TEST(simulator, stops_at_max_time) {
    logger log;
    simulator sim(log);
    journal j;
    sim.on_simulation_end(boost::bind(&journal::end, &j, _1));
    sim.register_action(5, boost::bind(&journal::note, &j, string("in")));
    sim.register_action(50, boost::bind(&journal::note, &j, string("out")));
    sim.run(10);
    ASSERT_EQ(2u, j.entries.size());
    EXPECT_EQ("in", j.entries[0]);
    EXPECT_EQ("end 5", j.entries[1]);
    EXPECT_FALSE(sim.is_drained());
}

TEST(simulator, end_simulation_stops_after_current_tick) {
    logger log;
    simulator sim(log);
    journal j;
    sim.register_action(1, boost::bind(&simulator::end_simulation, &sim));
    sim.register_action(1, boost::bind(&journal::note, &j, string("same")));
    sim.register_action(2, boost::bind(&journal::note, &j, string("never")));
    sim.run();
    ASSERT_EQ(1u, j.entries.size());
    EXPECT_EQ("same", j.entries[0]);
}

TEST(simulator, rejects_time_going_backwards) {
    logger log;
    simulator sim(log);
    sim.register_action(5, boost::bind(&schedule_in_past, &sim));
    EXPECT_THROW(sim.run(), err_time_regression);
}

TEST(simulator, runs_only_once) {
    logger log;
    simulator sim(log);
    sim.register_action(4, &noop);
    sim.run();
    EXPECT_THROW(sim.run(), err_panic);
    EXPECT_THROW(sim.register_action(9, &noop), err_panic);
}
