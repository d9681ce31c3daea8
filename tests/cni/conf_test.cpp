/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "genie/cni/conf.hpp"

#include "genie/test/log.hpp"

using namespace testing;
using namespace genie;
using namespace genie::cni;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class CNIConfTest : public Test {
protected:
    void SetUp() override
    {
        genie::test::InitLog();

        std::filesystem::remove_all(mTestDir);
        std::filesystem::create_directories(mTestDir);
    }

    void TearDown() override { std::filesystem::remove_all(mTestDir); }

    std::string CreateFile(const std::string& name, const std::string& content)
    {
        auto path = (mTestDir / name).string();

        std::ofstream file(path);

        file << content;

        return path;
    }

    std::filesystem::path mTestDir = std::filesystem::current_path() / "cni_conf_test";
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(CNIConfTest, ParseNetworkConfig)
{
    NetworkConfig conf;

    ASSERT_TRUE(ParseNetworkConfig(R"({"cniVersion": "0.3.1", "name": "mynet", "type": "bridge"})", conf).IsNone());

    EXPECT_EQ(conf.GetType(), "bridge");
    EXPECT_EQ(conf.GetName(), "mynet");

    auto list = ConfListFromConf(conf);

    EXPECT_EQ(list.mVersion, "0.3.1");
    EXPECT_EQ(list.mName, "mynet");
    EXPECT_EQ(list.GetType(), "bridge");
    ASSERT_EQ(list.mPlugins.size(), 1);
}

TEST_F(CNIConfTest, ParseNetworkConfigWithoutType)
{
    NetworkConfig conf;

    auto err = ParseNetworkConfig(R"({"cniVersion": "0.3.1", "name": "mynet", "plugins": []})", conf);

    EXPECT_TRUE(err.Is(ErrorEnum::eInvalidArgument));
    EXPECT_NE(err.Message().find("conflist"), std::string::npos);

    EXPECT_FALSE(ParseNetworkConfig("not json", conf).IsNone());
    EXPECT_FALSE(ParseNetworkConfig("[]", conf).IsNone());
}

TEST_F(CNIConfTest, ParseNetworkConfigList)
{
    NetworkConfigList list;

    ASSERT_TRUE(ParseNetworkConfigList(R"({"cniVersion": "0.4.0", "name": "calico", "plugins": [
        {"type": "calico", "ipam": {"type": "calico-ipam"}}, {"type": "portmap"}]})",
        list)
                    .IsNone());

    EXPECT_EQ(list.mVersion, "0.4.0");
    EXPECT_EQ(list.mName, "calico");
    ASSERT_EQ(list.mPlugins.size(), 2);
    EXPECT_EQ(list.GetType(), "calico");
    EXPECT_EQ(list.mPlugins[1].GetType(), "portmap");
}

TEST_F(CNIConfTest, ParseInvalidNetworkConfigList)
{
    NetworkConfigList list;

    EXPECT_TRUE(ParseNetworkConfigList(R"({"name": "empty", "plugins": []})", list).Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(ParseNetworkConfigList(R"({"name": "noplugins"})", list).Is(ErrorEnum::eInvalidArgument));
    EXPECT_TRUE(ParseNetworkConfigList(R"({"name": "notype", "plugins": [{"ipam": {}}]})", list)
                    .Is(ErrorEnum::eInvalidArgument));
}

TEST_F(CNIConfTest, LoadNetworkConfigList)
{
    auto confPath     = CreateFile("10-bridge.conf", R"({"cniVersion": "0.3.1", "name": "br", "type": "bridge"})");
    auto conflistPath = CreateFile("20-flannel.conflist",
        R"({"cniVersion": "0.3.1", "name": "flannel", "plugins": [{"type": "flannel"}, {"type": "portmap"}]})");

    NetworkConfigList list;

    ASSERT_TRUE(LoadNetworkConfigList(confPath, list).IsNone());
    EXPECT_EQ(list.mName, "br");
    EXPECT_EQ(list.GetType(), "bridge");
    EXPECT_EQ(list.mSourcePath, confPath);

    ASSERT_TRUE(LoadNetworkConfigList(conflistPath, list).IsNone());
    EXPECT_EQ(list.mName, "flannel");
    EXPECT_EQ(list.mPlugins.size(), 2);
    EXPECT_EQ(list.mSourcePath, conflistPath);

    EXPECT_FALSE(LoadNetworkConfigList((mTestDir / "missing.conf").string(), list).IsNone());
}

TEST_F(CNIConfTest, SetIPAMSubnet)
{
    NetworkConfig conf;

    ASSERT_TRUE(
        ParseNetworkConfig(R"({"type": "bridge", "ipam": {"type": "host-local", "subnet": "10.10.0.0/16"}})", conf)
            .IsNone());
    ASSERT_TRUE(conf.SetIPAMSubnet("192.168.10.0/24").IsNone());

    EXPECT_EQ(conf.mRaw["ipam"]["subnet"].asString(), "192.168.10.0/24");
    EXPECT_EQ(conf.mRaw["ipam"]["type"].asString(), "host-local");
}

TEST_F(CNIConfTest, SetIPAMSubnetCreatesIPAM)
{
    NetworkConfig conf;

    ASSERT_TRUE(ParseNetworkConfig(R"({"type": "macvlan"})", conf).IsNone());
    ASSERT_TRUE(conf.SetIPAMSubnet("10.20.1.0/24").IsNone());

    EXPECT_EQ(conf.mRaw["ipam"]["subnet"].asString(), "10.20.1.0/24");
}

TEST_F(CNIConfTest, SetIPAMSubnetInvalidIPAM)
{
    NetworkConfig conf;

    ASSERT_TRUE(ParseNetworkConfig(R"({"type": "macvlan", "ipam": "host-local"})", conf).IsNone());

    EXPECT_TRUE(conf.SetIPAMSubnet("10.20.1.0/24").Is(ErrorEnum::eInvalidArgument));
    EXPECT_EQ(conf.mRaw["ipam"].asString(), "host-local");
}
