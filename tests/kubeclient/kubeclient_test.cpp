/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "genie/common/utils/json.hpp"
#include "genie/kubeclient.hpp"

#include "genie/test/log.hpp"

#include "mocks/httpclientmock.hpp"

using namespace testing;
using namespace genie;
using namespace genie::common::utils;
using namespace genie::kubeclient;

namespace {

bool HasHeader(const HTTPRequest& request, const std::string& header)
{
    return std::find(request.mHeaders.begin(), request.mHeaders.end(), header) != request.mHeaders.end();
}

} // namespace

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class KubeClientTest : public Test {
protected:
    void SetUp() override
    {
        genie::test::InitLog();

        std::filesystem::remove_all(mServiceAccountDir);
        std::filesystem::create_directories(mServiceAccountDir);

        mConf.mKubernetes.mK8sAPIRoot = "https://10.0.0.1:6443";
    }

    void TearDown() override { std::filesystem::remove_all(mServiceAccountDir); }

    void InitClient() { ASSERT_TRUE(mClient.Init(mConf, mHTTPClient, mServiceAccountDir.string()).IsNone()); }

    std::filesystem::path      mServiceAccountDir = std::filesystem::current_path() / "kubeclient_test";
    netconf::NetConf           mConf;
    StrictMock<HTTPClientMock> mHTTPClient;
    KubeClient                 mClient;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(KubeClientTest, APIRoot)
{
    mConf.mKubernetes.mK8sAPIRoot.clear();
    mConf.mPolicy.mK8sAPIRoot = "https://10.0.0.2:6443/api/v1/";

    InitClient();
    EXPECT_EQ(mClient.GetAPIRoot(), "https://10.0.0.2:6443");

    mConf.mKubernetes.mK8sAPIRoot = "https://10.0.0.1:6443/";

    InitClient();
    EXPECT_EQ(mClient.GetAPIRoot(), "https://10.0.0.1:6443");
}

TEST_F(KubeClientTest, ServiceAccountCredentials)
{
    std::ofstream(mServiceAccountDir / "token") << "sa-token\n";
    std::ofstream(mServiceAccountDir / "ca.crt") << "ca";

    InitClient();

    EXPECT_CALL(mHTTPClient, Do(_, _)).WillOnce(Invoke([&](const HTTPRequest& request, HTTPResponse& response) {
        EXPECT_EQ(request.mBearerToken, "sa-token");
        EXPECT_EQ(request.mCAFile, (mServiceAccountDir / "ca.crt").string());

        response.mStatus = 200;
        response.mBody   = R"({"metadata": {"name": "nginx"}})";

        return ErrorEnum::eNone;
    }));

    Annotations annotations {{"stale", "value"}};

    ASSERT_TRUE(mClient.GetPodAnnotations("default", "nginx", annotations).IsNone());
    EXPECT_TRUE(annotations.empty());
}

TEST_F(KubeClientTest, GetPodAnnotations)
{
    mConf.mPolicy.mK8sAuthToken = "policy-token";

    InitClient();

    EXPECT_CALL(mHTTPClient, Do(_, _)).WillOnce(Invoke([](const HTTPRequest& request, HTTPResponse& response) {
        EXPECT_EQ(request.mMethod, "GET");
        EXPECT_EQ(request.mURL, "https://10.0.0.1:6443/api/v1/namespaces/default/pods/nginx");
        EXPECT_EQ(request.mBearerToken, "policy-token");
        EXPECT_TRUE(HasHeader(request, "Accept: application/json"));

        response.mStatus = 200;
        response.mBody = R"({"metadata": {"name": "nginx", "annotations": {"cni": "bridge,macvlan", "count": "2"}}})";

        return ErrorEnum::eNone;
    }));

    Annotations annotations;

    ASSERT_TRUE(mClient.GetPodAnnotations("default", "nginx", annotations).IsNone());
    EXPECT_EQ(annotations, (Annotations {{"cni", "bridge,macvlan"}, {"count", "2"}}));
}

TEST_F(KubeClientTest, GetPodAnnotationsNotFound)
{
    InitClient();

    EXPECT_CALL(mHTTPClient, Do(_, _)).WillOnce(Invoke([](const HTTPRequest&, HTTPResponse& response) {
        response.mStatus = 404;
        response.mBody   = R"({"kind": "Status", "message": "pods \"nginx\" not found"})";

        return ErrorEnum::eNone;
    }));

    Annotations annotations;

    auto err = mClient.GetPodAnnotations("default", "nginx", annotations);

    EXPECT_TRUE(err.Is(ErrorEnum::eNotFound));
    EXPECT_NE(err.Message().find("not found"), std::string::npos);
}

TEST_F(KubeClientTest, PatchPodAnnotations)
{
    InitClient();

    EXPECT_CALL(mHTTPClient, Do(_, _)).WillOnce(Invoke([](const HTTPRequest& request, HTTPResponse& response) {
        EXPECT_EQ(request.mMethod, "PATCH");
        EXPECT_EQ(request.mURL, "https://10.0.0.1:6443/api/v1/namespaces/default/pods/nginx");
        EXPECT_TRUE(HasHeader(request, "Content-Type: application/merge-patch+json"));

        auto [body, err] = ParseJson(request.mBody);

        EXPECT_TRUE(err.IsNone());
        EXPECT_EQ(body["metadata"]["annotations"]["cni"].asString(), "weave");

        response.mStatus = 200;

        return ErrorEnum::eNone;
    }));

    EXPECT_TRUE(mClient.PatchPodAnnotations("default", "nginx", {{"cni", "weave"}}).IsNone());
}

TEST_F(KubeClientTest, PatchPodAnnotationsFailure)
{
    InitClient();

    EXPECT_CALL(mHTTPClient, Do(_, _))
        .WillOnce(Invoke([](const HTTPRequest&, HTTPResponse& response) {
            response.mStatus = 403;

            return ErrorEnum::eNone;
        }))
        .WillOnce(Return(Error(ErrorEnum::eTimeout, "timeout")));

    const Annotations annotations {{"cni", "weave"}};

    EXPECT_TRUE(mClient.PatchPodAnnotations("default", "nginx", annotations).Is(ErrorEnum::eMetadataPatchFailure));
    EXPECT_TRUE(mClient.PatchPodAnnotations("default", "nginx", annotations).Is(ErrorEnum::eMetadataPatchFailure));
}

TEST_F(KubeClientTest, GetLogicalNetwork)
{
    InitClient();

    EXPECT_CALL(mHTTPClient, Do(_, _)).WillOnce(Invoke([](const HTTPRequest& request, HTTPResponse& response) {
        EXPECT_EQ(request.mURL,
            "https://10.0.0.1:6443/apis/alpha.network.k8s.io/v1/namespaces/default/logicalnetworks/net-a");

        response.mStatus = 200;
        response.mBody
            = R"({"metadata": {"name": "net-a"}, "spec": {"physicalNet": "bridge", "sub_subnet": "10.10.1.0/24"}})";

        return ErrorEnum::eNone;
    }));

    clusterclient::LogicalNetwork network;

    ASSERT_TRUE(mClient.GetLogicalNetwork("default", "net-a", network).IsNone());

    EXPECT_EQ(network.mName, "net-a");
    EXPECT_EQ(network.mPhysicalNet, "bridge");
    EXPECT_EQ(network.mSubnet, "10.10.1.0/24");
}
