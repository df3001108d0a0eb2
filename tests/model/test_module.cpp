// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <vector>
#include <boost/bind/bind.hpp>
#include <gtest/gtest.h>
#include "module.hpp"

using namespace boost::placeholders;

namespace {

class change_log {
public:
    void on_change(const logic_signal &s) { seen.push_back(&s); }
    vector<const logic_signal *> seen;
};

void record(vector<int> *order, int id, const logic_signal &) {
    order->push_back(id);
}

}

TEST(module_node, keeps_declaration_order) {
    module_node top("top");
    top.add_port("clk", 1);
    top.add_signal("count", 4);
    top.add_submodule("u0");
    top.add_submodule("u1", true);
    ASSERT_EQ(2u, top.get_signals().size());
    EXPECT_EQ("clk", top.get_signals()[0]->get_name());
    EXPECT_EQ("count", top.get_signals()[1]->get_name());
    ASSERT_EQ(2u, top.get_submodules().size());
    EXPECT_FALSE(top.get_submodules()[0]->is_opaque());
    EXPECT_TRUE(top.get_submodules()[1]->is_opaque());
    EXPECT_EQ("top.u1", top.get_submodules()[1]->get_path());
}

TEST(module_node, build_freezes_hierarchy) {
    module_node top("top");
    module_node &sub = top.add_submodule("sub");
    EXPECT_FALSE(top.has_built());
    top.build();
    EXPECT_TRUE(top.has_built());
    EXPECT_TRUE(sub.has_built());
    EXPECT_THROW(top.add_signal("late", 1), err_already_built);
    EXPECT_THROW(sub.add_submodule("late"), err_already_built);
}

TEST(module_node, finds_children_by_name) {
    module_node top("top");
    logic_signal &a = top.add_signal("a", 2);
    module_node &sub = top.add_submodule("sub");
    EXPECT_EQ(&a, top.find_signal("a"));
    EXPECT_EQ(&sub, top.find_submodule("sub"));
    EXPECT_TRUE(top.find_signal("b") == 0);
    EXPECT_TRUE(top.find_submodule("a") == 0);
}

TEST(logic_signal, notifies_only_on_change_in_subscription_order) {
    module_node top("top");
    logic_signal &s = top.add_signal("s", logic_value::from_uint(2, 0));
    vector<int> order;
    s.subscribe(boost::bind(&record, &order, 1, _1));
    s.subscribe(boost::bind(&record, &order, 2, _1));
    s.put(0);
    EXPECT_TRUE(order.empty());
    s.put(3);
    ASSERT_EQ(2u, order.size());
    EXPECT_EQ(1, order[0]);
    EXPECT_EQ(2, order[1]);
    EXPECT_EQ("11", s.get_value().to_string());
}

TEST(logic_signal, passes_itself_to_listeners) {
    module_node top("top");
    logic_signal &s = top.add_port("p", 1);
    change_log changes;
    s.subscribe(boost::bind(&change_log::on_change, &changes, _1));
    s.put(1);
    ASSERT_EQ(1u, changes.seen.size());
    EXPECT_EQ(&s, changes.seen[0]);
    EXPECT_EQ("top.p", s.get_path());
    EXPECT_TRUE(s.is_port());
    EXPECT_EQ(&top, s.get_parent());
}

TEST(logic_signal, rejects_bad_writes) {
    module_node top("top");
    logic_signal &c = top.add_constant("one", logic_value::from_uint(1, 1));
    logic_signal &s = top.add_signal("s", 4);
    EXPECT_TRUE(c.is_constant());
    EXPECT_THROW(c.put(0), err_const_write);
    EXPECT_THROW(s.put(logic_value::from_uint(3, 1)), err_bad_width);
    EXPECT_THROW(top.add_signal("empty", 0), err_bad_width);
}
