/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "genie/common/tools/utils.hpp"

using namespace testing;
using namespace genie;

TEST(UtilsTest, Split)
{
    EXPECT_EQ(utils::Split("bridge,macvlan", ','), std::vector<std::string>({"bridge", "macvlan"}));
    EXPECT_EQ(utils::Split("bridge,,macvlan,", ','), std::vector<std::string>({"bridge", "", "macvlan", ""}));
    EXPECT_EQ(utils::Split("", ','), std::vector<std::string>({""}));
}

TEST(UtilsTest, JoinStrings)
{
    EXPECT_EQ(utils::JoinStrings({"/opt/cni/bin", "/usr/libexec/cni"}, ":"), "/opt/cni/bin:/usr/libexec/cni");
    EXPECT_EQ(utils::JoinStrings({"single"}, ":"), "single");
    EXPECT_EQ(utils::JoinStrings({}, ":"), "");
}

TEST(UtilsTest, TrimSpace)
{
    EXPECT_EQ(utils::TrimSpace("  weave \t\n"), "weave");
    EXPECT_EQ(utils::TrimSpace(" \t "), "");
    EXPECT_EQ(utils::TrimSpace("bridge"), "bridge");
}

TEST(UtilsTest, PrefixSuffix)
{
    EXPECT_TRUE(utils::HasPrefix("CNI_IFNAME=eth0", "CNI_"));
    EXPECT_FALSE(utils::HasPrefix("CN", "CNI_"));
    EXPECT_TRUE(utils::HasSuffix("10-bridge.conflist", ".conflist"));
    EXPECT_FALSE(utils::HasSuffix("10-bridge.conf", ".conflist"));
}
