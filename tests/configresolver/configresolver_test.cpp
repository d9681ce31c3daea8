/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "genie/configresolver.hpp"
#include "genie/common/tools/fs.hpp"
#include "genie/common/utils/json.hpp"

#include "genie/test/log.hpp"

using namespace testing;
using namespace genie;
using namespace genie::configresolver;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class ConfigResolverTest : public Test {
protected:
    void SetUp() override
    {
        genie::test::InitLog();

        std::filesystem::remove_all(mTestDir);
        std::filesystem::create_directories(mConfDir);
        std::filesystem::create_directories(mBinDir);

        ASSERT_TRUE(mResolver.Init(mConfDir.string(), {mBinDir.string()}).IsNone());
    }

    void TearDown() override { std::filesystem::remove_all(mTestDir); }

    void CreateConf(const std::string& name, const std::string& content)
    {
        std::ofstream(mConfDir / name) << content;
    }

    void CreateBinary(const std::string& name)
    {
        auto path = mBinDir / name;

        std::ofstream(path) << "#!/bin/sh\n";

        std::filesystem::permissions(path, std::filesystem::perms(0755));
    }

    std::string ReadConf(const std::string& name)
    {
        std::string content;

        EXPECT_TRUE(fs::ReadFileToString((mConfDir / name).string(), content).IsNone());

        return content;
    }

    std::filesystem::path mTestDir = std::filesystem::current_path() / "configresolver_test";
    std::filesystem::path mConfDir = mTestDir / "net.d";
    std::filesystem::path mBinDir  = mTestDir / "bin";
    ConfigResolver        mResolver;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(ConfigResolverTest, FindExistingConfig)
{
    CreateConf("05-weave.conflist",
        R"({"cniVersion": "0.3.1", "name": "weave", "plugins": [{"type": "weave-net"}, {"type": "portmap"}]})");
    CreateConf("10-mybridge.conf", R"({"cniVersion": "0.3.1", "name": "mybridge", "type": "bridge"})");

    cni::NetworkConfigList config;

    ASSERT_TRUE(mResolver.Resolve("weave", "", config).IsNone());

    EXPECT_EQ(config.mName, "weave");
    EXPECT_EQ(config.GetType(), "weave-net");
    EXPECT_EQ(config.mPlugins.size(), 2);
    EXPECT_EQ(config.mSourcePath, (mConfDir / "05-weave.conflist").string());

    ASSERT_TRUE(mResolver.Resolve("mybridge", "", config).IsNone());
    EXPECT_EQ(config.GetType(), "bridge");
}

TEST_F(ConfigResolverTest, MatchByNetworkName)
{
    CreateConf("87-podman.conflist",
        R"({"cniVersion": "0.4.0", "name": "flannel", "plugins": [{"type": "flannel"}]})");

    cni::NetworkConfigList config;

    ASSERT_TRUE(mResolver.Resolve("flannel", "", config).IsNone());
    EXPECT_EQ(config.GetType(), "flannel");
}

TEST_F(ConfigResolverTest, NoSubstringMatch)
{
    CreateConf("10-calico-bridge.conf", R"({"cniVersion": "0.3.1", "name": "calico-bridge", "type": "bridge"})");

    cni::NetworkConfigList config;

    auto err = mResolver.Resolve("calico", "", config);

    EXPECT_TRUE(err.Is(ErrorEnum::eNotSupported));
    EXPECT_NE(err.Message().find("romana, weave, canal, calico, flannel, bridge, macvlan, sriov"), std::string::npos);
}

TEST_F(ConfigResolverTest, SkipMalformedAndOwnConfigs)
{
    CreateConf("00-genie.conf", R"({"cniVersion": "0.3.1", "name": "macvlan", "type": "genie"})");
    CreateConf("05-macvlan.conf", R"({"cniVersion": "0.3.1", "name": "macvlan", "type": )");
    CreateConf("06-macvlan.conf", R"({"cniVersion": "0.3.1", "name": "macvlan", "plugins": []})");
    CreateConf("20-macvlan.conf", R"({"cniVersion": "0.3.1", "name": "macvlan", "type": "macvlan"})");

    cni::NetworkConfigList config;

    ASSERT_TRUE(mResolver.Resolve("macvlan", "", config).IsNone());
    EXPECT_EQ(config.GetType(), "macvlan");
    EXPECT_EQ(config.mSourcePath, (mConfDir / "20-macvlan.conf").string());
}

TEST_F(ConfigResolverTest, SynthesizeDefaultConfig)
{
    CreateBinary("bridge");

    cni::NetworkConfigList config;

    ASSERT_TRUE(mResolver.Resolve("bridge", "", config).IsNone());

    EXPECT_EQ(config.GetType(), "bridge");
    EXPECT_EQ(config.mVersion, "0.3.1");
    EXPECT_EQ(config.mSourcePath, (mConfDir / "10-bridge.conf").string());

    const auto& plugin = config.mPlugins.front().mRaw;

    EXPECT_EQ(plugin["bridge"].asString(), "cni0");
    EXPECT_TRUE(plugin["isGateway"].asBool());
    EXPECT_TRUE(plugin["ipMasq"].asBool());
    EXPECT_EQ(plugin["ipam"]["type"].asString(), "host-local");
    EXPECT_EQ(plugin["ipam"]["subnet"].asString(), "10.10.0.0/16");
    EXPECT_EQ(plugin["ipam"]["routes"][0]["dst"].asString(), "0.0.0.0/0");

    EXPECT_EQ(std::filesystem::status(mConfDir / "10-bridge.conf").permissions(), std::filesystem::perms(0644));

    auto [written, err] = common::utils::ParseJson(ReadConf("10-bridge.conf"));

    ASSERT_TRUE(err.IsNone());
    EXPECT_EQ(written, plugin);
}

TEST_F(ConfigResolverTest, SynthesizeIsIdempotent)
{
    CreateBinary("macvlan");

    cni::NetworkConfigList first, second;

    ASSERT_TRUE(mResolver.Resolve("macvlan", "", first).IsNone());

    auto content = ReadConf("10-macvlan.conf");

    ASSERT_TRUE(mResolver.Resolve("macvlan", "", second).IsNone());

    EXPECT_EQ(ReadConf("10-macvlan.conf"), content);
    EXPECT_EQ(first.mPlugins.front().mRaw, second.mPlugins.front().mRaw);
    EXPECT_EQ(second.mPlugins.front().mRaw["master"].asString(), "eth0");

    std::vector<std::string> files;

    ASSERT_TRUE(fs::ListFiles(mConfDir.string(), files).IsNone());
    EXPECT_EQ(files, std::vector<std::string>({"10-macvlan.conf"}));
}

TEST_F(ConfigResolverTest, SubnetOverride)
{
    CreateBinary("sriov");

    cni::NetworkConfigList config;

    ASSERT_TRUE(mResolver.Resolve("sriov", "192.168.50.0/24", config).IsNone());

    EXPECT_EQ(config.mPlugins.front().mRaw["master"].asString(), "eth1");
    EXPECT_EQ(config.mPlugins.front().mRaw["ipam"]["subnet"].asString(), "192.168.50.0/24");

    // Override does not modify stored config.
    auto [written, err] = common::utils::ParseJson(ReadConf("10-sriov.conf"));

    ASSERT_TRUE(err.IsNone());
    EXPECT_EQ(written["ipam"]["subnet"].asString(), "10.30.0.0/16");
}

TEST_F(ConfigResolverTest, SubnetOverrideInvalidIPAM)
{
    CreateConf("10-bridge.conf", R"({"cniVersion": "0.3.1", "name": "bridge", "type": "bridge", "ipam": []})");

    cni::NetworkConfigList config;

    EXPECT_TRUE(mResolver.Resolve("bridge", "10.1.0.0/24", config).Is(ErrorEnum::eInvalidArgument));
}

TEST_F(ConfigResolverTest, BinaryWithoutDefaultConfig)
{
    CreateBinary("weave-net");

    cni::NetworkConfigList config;

    EXPECT_TRUE(mResolver.Resolve("weave", "", config).Is(ErrorEnum::eNotSupported));
    EXPECT_FALSE(std::filesystem::exists(mConfDir / "10-weave.conf"));
}

TEST_F(ConfigResolverTest, UnknownBackend)
{
    cni::NetworkConfigList config;

    EXPECT_TRUE(mResolver.Resolve("foo", "", config).Is(ErrorEnum::eNotSupported));
    EXPECT_TRUE(mResolver.Resolve("", "", config).Is(ErrorEnum::eNotSupported));
}

TEST_F(ConfigResolverTest, MissingDirectories)
{
    cni::NetworkConfigList config;
    ConfigResolver         resolver;

    ASSERT_TRUE(resolver.Init((mTestDir / "missing").string(), {mBinDir.string()}).IsNone());
    EXPECT_TRUE(resolver.Resolve("bridge", "", config).Is(ErrorEnum::eNotFound));

    ASSERT_TRUE(resolver.Init(mConfDir.string(), {(mTestDir / "missing").string()}).IsNone());
    EXPECT_TRUE(resolver.Resolve("bridge", "", config).Is(ErrorEnum::eNotFound));
}

TEST_F(ConfigResolverTest, CustomRegistry)
{
    BackendRegistry registry;

    registry.Register("ipvlan",
        {"ipvlan", R"({"cniVersion": "0.3.1", "name": "ipvlan", "type": "ipvlan", "master": "eth2"})"});

    ASSERT_TRUE(mResolver.Init(mConfDir.string(), {mBinDir.string()}, registry).IsNone());

    CreateBinary("ipvlan");

    cni::NetworkConfigList config;

    ASSERT_TRUE(mResolver.Resolve("ipvlan", "", config).IsNone());
    EXPECT_EQ(config.mPlugins.front().mRaw["master"].asString(), "eth2");
    EXPECT_EQ(registry.BinaryName("weave"), "weave-net");
    EXPECT_EQ(registry.BinaryName("unknown"), "unknown");
}
