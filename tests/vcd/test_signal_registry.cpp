// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <set>
#include <gtest/gtest.h>
#include "module.hpp"
#include "signal_registry.hpp"

namespace {

// top
//   clk (port), vdd (const), u0.x, u0.deep.y, prim (opaque).z, u1.w
class registry_test : public ::testing::Test {
protected:
    registry_test()
        : top("top"), tracker(new change_tracker()),
          clk(top.add_port("clk", 1)),
          vdd(top.add_constant("vdd", logic_value::from_uint(1, 1))),
          u0(top.add_submodule("u0")),
          prim(top.add_submodule("prim", true)),
          u1(top.add_submodule("u1")),
          x(u0.add_signal("x", 8)),
          deep(u0.add_submodule("deep")),
          y(deep.add_signal("y", 2)),
          z(prim.add_signal("z", 1)),
          w(u1.add_signal("w", 1)) { }
    module_node top;
    std::shared_ptr<change_tracker> tracker;
    logic_signal &clk;
    logic_signal &vdd;
    module_node &u0;
    module_node &prim;
    module_node &u1;
    logic_signal &x;
    module_node &deep;
    logic_signal &y;
    logic_signal &z;
    logic_signal &w;
};

}

TEST_F(registry_test, refuses_unbuilt_hierarchy) {
    EXPECT_THROW({ signal_registry r(top, tracker); }, err_not_built);
    EXPECT_EQ(0u, clk.get_num_subscribers());
}

TEST_F(registry_test, assigns_markers_breadth_first) {
    top.build();
    signal_registry r(top, tracker);
    ASSERT_EQ(4u, r.size());
    const signal_registry::signals_t &order = r.get_tracked_signals();
    EXPECT_EQ(&clk, order[0]);
    EXPECT_EQ(&x, order[1]);
    EXPECT_EQ(&w, order[2]);
    EXPECT_EQ(&y, order[3]);
    EXPECT_EQ("s0", r.get_marker(clk));
    EXPECT_EQ("s1", r.get_marker(x));
    EXPECT_EQ("s2", r.get_marker(w));
    EXPECT_EQ("s3", r.get_marker(y));
}

TEST_F(registry_test, markers_are_unique) {
    top.build();
    signal_registry r(top, tracker);
    set<string> seen;
    const signal_registry::signals_t &order = r.get_tracked_signals();
    for (signal_registry::signals_t::const_iterator si = order.begin();
         si != order.end(); ++si) {
        EXPECT_TRUE(seen.insert(r.get_marker(**si)).second);
    }
}

TEST_F(registry_test, skips_constants_and_opaque_modules) {
    top.build();
    signal_registry r(top, tracker);
    EXPECT_FALSE(r.is_tracked(vdd));
    EXPECT_FALSE(r.is_tracked(z));
    EXPECT_THROW(r.get_marker(z), err_untracked_signal);
    EXPECT_EQ(0u, z.get_num_subscribers());
}

TEST_F(registry_test, changes_reach_the_tracker) {
    top.build();
    signal_registry r(top, tracker);
    y.put(2);
    clk.put(1);
    y.put(1);
    z.put(1);
    change_tracker::changes_t changes = tracker->drain();
    ASSERT_EQ(2u, changes.size());
    EXPECT_EQ(&y, changes[0]);
    EXPECT_EQ(&clk, changes[1]);
}

TEST_F(registry_test, markers_alone_leave_the_design_untouched) {
    top.build();
    signal_registry r(top);
    EXPECT_EQ(4u, r.size());
    EXPECT_FALSE(r.is_subscribed());
    EXPECT_EQ(0u, clk.get_num_subscribers());
    EXPECT_EQ(0u, y.get_num_subscribers());
    r.subscribe(tracker);
    EXPECT_TRUE(r.is_subscribed());
    EXPECT_EQ(1u, clk.get_num_subscribers());
    y.put(3);
    EXPECT_EQ(1u, tracker->size());
    EXPECT_THROW(r.subscribe(tracker), err_panic);
    EXPECT_EQ(1u, clk.get_num_subscribers());
}
