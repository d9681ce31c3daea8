/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "genie/resultmerger.hpp"

#include "genie/test/log.hpp"

using namespace testing;
using namespace genie;
using namespace genie::cni;
using namespace genie::resultmerger;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ResultMergerTest : public Test {
protected:
    void SetUp() override { genie::test::InitLog(); }

    Result CreateResult(const std::string& ifName, const std::string& address, const std::string& gateway)
    {
        Result result;

        result.mVersion = "0.3.1";
        result.mInterfaces.push_back({ifName, "36:69:cc:de:ba:35", "/var/run/netns/test"});
        result.mIPs.push_back({"4", 0, address, gateway});

        return result;
    }

    ResultMerger mMerger;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ResultMergerTest, RepairBackfillsGateway)
{
    Result result = CreateResult("eth0", "10.10.0.5/16", "10.10.0.1");

    result.mIPs.insert(result.mIPs.begin(), IPs {"6", 0, "fd00::5/64", ""});
    result.mRoutes.push_back({"0.0.0.0/0", ""});
    result.mRoutes.push_back({"10.96.0.0/12", "10.10.0.254"});

    ASSERT_TRUE(mMerger.Repair(result).IsNone());

    EXPECT_EQ(result.mRoutes[0].mGW, "10.10.0.1");
    EXPECT_EQ(result.mRoutes[1].mGW, "10.10.0.254");
}

TEST_F(ResultMergerTest, RepairWithoutGateway)
{
    Result result = CreateResult("eth0", "10.10.0.5/16", "");

    result.mRoutes.push_back({"0.0.0.0/0", ""});

    EXPECT_TRUE(mMerger.Repair(result).Is(ErrorEnum::eInconsistentResult));
}

TEST_F(ResultMergerTest, RepairDetachesIPsWithoutInterfaces)
{
    Result result;

    result.mIPs.push_back({"4", 0, "10.32.0.5/12", "10.32.0.1"});
    result.mIPs.push_back({"4", -1, "10.32.0.6/12", ""});
    result.mIPs.push_back({"4", 3, "10.32.0.7/12", ""});

    ASSERT_TRUE(mMerger.Repair(result).IsNone());

    for (const auto& ip : result.mIPs) {
        EXPECT_EQ(ip.mInterface, -1) << ip.mAddress;
    }

    // Results with interfaces are left untouched.
    result = CreateResult("eth0", "10.10.0.5/16", "10.10.0.1");
    result.mIPs[0].mInterface = 5;

    ASSERT_TRUE(mMerger.Repair(result).IsNone());
    EXPECT_EQ(result.mIPs[0].mInterface, 5);
}

TEST_F(ResultMergerTest, MergeIntoEmpty)
{
    auto   src = CreateResult("eth0", "10.10.0.5/16", "10.10.0.1");
    Result dst;

    ASSERT_TRUE(mMerger.Merge(src, dst).IsNone());

    EXPECT_EQ(dst.mVersion, src.mVersion);
    EXPECT_EQ(dst.mInterfaces, src.mInterfaces);
    EXPECT_EQ(dst.mIPs, src.mIPs);
}

TEST_F(ResultMergerTest, MergeRebasesInterfaceIndices)
{
    Result dst;

    ASSERT_TRUE(mMerger.Merge(CreateResult("eth0", "10.10.0.5/16", "10.10.0.1"), dst).IsNone());

    auto src = CreateResult("eth1", "10.20.0.5/16", "");

    src.mIPs.push_back({"4", -1, "10.20.0.6/16", ""});

    ASSERT_TRUE(mMerger.Merge(src, dst).IsNone());
    ASSERT_TRUE(mMerger.Merge(CreateResult("eth2", "10.30.0.5/16", ""), dst).IsNone());

    ASSERT_EQ(dst.mInterfaces.size(), 3);
    EXPECT_EQ(dst.mInterfaces[0].mName, "eth0");
    EXPECT_EQ(dst.mInterfaces[1].mName, "eth1");
    EXPECT_EQ(dst.mInterfaces[2].mName, "eth2");

    ASSERT_EQ(dst.mIPs.size(), 4);
    EXPECT_EQ(dst.mIPs[0].mInterface, 0);
    EXPECT_EQ(dst.mIPs[1].mInterface, 1);
    EXPECT_EQ(dst.mIPs[2].mInterface, -1);
    EXPECT_EQ(dst.mIPs[3].mInterface, 2);

    for (const auto& ip : dst.mIPs) {
        EXPECT_LT(ip.mInterface, static_cast<int>(dst.mInterfaces.size()));
    }
}

TEST_F(ResultMergerTest, MergeRoutesAndDNS)
{
    auto dst = CreateResult("eth0", "10.10.0.5/16", "10.10.0.1");

    dst.mRoutes.push_back({"0.0.0.0/0", "10.10.0.1"});
    dst.mDNS.mNameservers = {"10.10.0.1"};
    dst.mDNS.mSearch      = {"default.svc"};

    auto src = CreateResult("eth1", "10.20.0.5/16", "10.20.0.1");

    src.mVersion = "0.4.0";
    src.mRoutes.push_back({"10.20.0.0/16", "10.20.0.1"});
    src.mDNS.mNameservers = {"10.10.0.1", "10.20.0.1"};
    src.mDNS.mDomain      = "cluster.local";
    src.mDNS.mOptions     = {"ndots:5"};

    ASSERT_TRUE(mMerger.Merge(src, dst).IsNone());

    EXPECT_EQ(dst.mVersion, "0.3.1");
    ASSERT_EQ(dst.mRoutes.size(), 2);
    EXPECT_EQ(dst.mRoutes[1], (Route {"10.20.0.0/16", "10.20.0.1"}));
    EXPECT_EQ(dst.mDNS.mNameservers, std::vector<std::string>({"10.10.0.1", "10.10.0.1", "10.20.0.1"}));
    EXPECT_EQ(dst.mDNS.mSearch, std::vector<std::string>({"default.svc"}));
    EXPECT_EQ(dst.mDNS.mOptions, std::vector<std::string>({"ndots:5"}));
    EXPECT_EQ(dst.mDNS.mDomain, "cluster.local");

    auto other = CreateResult("eth2", "10.30.0.5/16", "");

    other.mDNS.mDomain = "other.local";

    ASSERT_TRUE(mMerger.Merge(other, dst).IsNone());
    EXPECT_EQ(dst.mDNS.mDomain, "cluster.local");
}
