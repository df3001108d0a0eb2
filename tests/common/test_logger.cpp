// -*- mode:c++; c-style:k&r; c-basic-offset:4; indent-tabs-mode: nil; -*-
// vi:set et cin sw=4 cino=>se0n0f0{0}0^0\:0=sl1g0hspst0+sc3C0/0(0u0U0w0m0:

#include <sstream>
#include <memory>
#include <gtest/gtest.h>
#include "logger.hpp"

TEST(logger, filters_by_sink_verbosity) {
    ostringstream quiet, chatty;
    logger log;
    log.add(quiet, 0);
    log.add(chatty, 2);
    LOG(log,0) << "banner" << endl;
    LOG(log,2) << "detail" << endl;
    LOG(log,3) << "noise" << endl;
    EXPECT_EQ("banner\n", quiet.str());
    EXPECT_EQ("banner\ndetail\n", chatty.str());
    EXPECT_EQ(2, log.get_max_verbosity());
}

TEST(logger, without_sinks_writes_nothing) {
    logger log;
    EXPECT_LT(log.get_max_verbosity(), 0);
    LOG(log,0) << "dropped" << endl;
    EXPECT_TRUE(log.good());
}

TEST(logger, owns_shared_sinks) {
    std::shared_ptr<ostringstream> s(new ostringstream());
    {
        logger log;
        log.add(s, 1);
        LOG(log,1) << "kept" << endl;
    }
    EXPECT_EQ("kept\n", s->str());
}
