/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <unistd.h>

#include <cstdlib>

#include "genie/common/tools/fs.hpp"
#include "genie/common/tools/utils.hpp"
#include "genie/common/utils/exception.hpp"
#include "genie/common/utils/json.hpp"
#include "genie/kubeclient.hpp"

#include "log.hpp"

namespace genie::kubeclient {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

std::string StripAPIPath(const std::string& root)
{
    auto result = root.substr(0, root.find("/api/"));

    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }

    return result;
}

std::string InClusterAPIRoot()
{
    const char* host = std::getenv("KUBERNETES_SERVICE_HOST");
    const char* port = std::getenv("KUBERNETES_SERVICE_PORT");

    if (host == nullptr || port == nullptr || *host == '\0' || *port == '\0') {
        return GENIE_CONFIG_K8S_API_ROOT;
    }

    return std::string("https://") + host + ":" + port;
}

Error StatusToError(long status, const std::string& body, ErrorEnum defaultErr)
{
    auto message = "unexpected status " + std::to_string(status);

    if (!body.empty()) {
        auto [json, err] = common::utils::ParseJson(body);

        if (err.IsNone()) {
            if (auto reason = common::utils::GetString(json, "message"); !reason.empty()) {
                message.append(": ").append(reason);
            }
        }
    }

    return Error(status == 404 ? ErrorEnum::eNotFound : defaultErr, message);
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error KubeClient::Init(
    const netconf::NetConf& conf, common::utils::HTTPClientItf& httpClient, const std::string& serviceAccountDir)
{
    mHTTPClient = &httpClient;

    mAPIRoot = StripAPIPath(conf.mPolicy.mK8sAPIRoot);

    if (!conf.mKubernetes.mK8sAPIRoot.empty()) {
        mAPIRoot = StripAPIPath(conf.mKubernetes.mK8sAPIRoot);
    }

    if (mAPIRoot.empty()) {
        mAPIRoot = InClusterAPIRoot();
    }

    if (!conf.mKubernetes.mKubeconfig.empty()) {
        LOG_WRN() << "Kubeconfig file is not supported, using explicit settings"
                  << Log::Field("kubeconfig", conf.mKubernetes.mKubeconfig);
    }

    mToken    = conf.mPolicy.mK8sAuthToken;
    mCAFile   = conf.mPolicy.mK8sCertificateAuthority;
    mCertFile = conf.mPolicy.mK8sClientCertificate;
    mKeyFile  = conf.mPolicy.mK8sClientKey;

    if (mToken.empty() && mCertFile.empty()) {
        std::string token;

        if (auto err = fs::ReadFileToString(fs::JoinPath(serviceAccountDir, "token"), token); err.IsNone()) {
            mToken = utils::TrimSpace(token);
        }
    }

    if (mCAFile.empty()) {
        auto caFile = fs::JoinPath(serviceAccountDir, "ca.crt");

        if (access(caFile.c_str(), R_OK) == 0) {
            mCAFile = caFile;
        }
    }

    LOG_DBG() << "Init kube client" << Log::Field("apiRoot", mAPIRoot) << Log::Field("ca", mCAFile)
              << Log::Field("cert", mCertFile) << Log::Field("token", mToken.empty() ? "none" : "set");

    return ErrorEnum::eNone;
}

Error KubeClient::GetPodAnnotations(const std::string& ns, const std::string& name, Annotations& annotations)
{
    LOG_DBG() << "Get pod annotations" << Log::Field("namespace", ns) << Log::Field("name", name);

    std::string body;

    if (auto err = DoGet("/api/v1/namespaces/" + ns + "/pods/" + name, body); !err.IsNone()) {
        return GENIE_ERROR_WRAP(err);
    }

    try {
        auto [json, err] = common::utils::ParseJson(body);
        GENIE_ERROR_CHECK_AND_THROW("can't parse pod", err);

        annotations.clear();

        const auto& items = json["metadata"]["annotations"];

        if (!items.isObject()) {
            return ErrorEnum::eNone;
        }

        for (const auto& key : items.getMemberNames()) {
            if (items[key].isString()) {
                annotations[key] = items[key].asString();
            }
        }
    } catch (const std::exception& e) {
        return GENIE_ERROR_WRAP(common::utils::ToGenieError(e));
    }

    return ErrorEnum::eNone;
}

Error KubeClient::PatchPodAnnotations(const std::string& ns, const std::string& name, const Annotations& annotations)
{
    LOG_DBG() << "Patch pod annotations" << Log::Field("namespace", ns) << Log::Field("name", name);

    Json::Value patch(Json::objectValue);
    auto&       items = patch["metadata"]["annotations"] = Json::Value(Json::objectValue);

    for (const auto& [key, value] : annotations) {
        items[key] = value;
    }

    auto request = CreateRequest("PATCH", "/api/v1/namespaces/" + ns + "/pods/" + name);

    request.mBody = common::utils::WriteJson(patch);
    request.mHeaders.push_back("Content-Type: application/merge-patch+json");

    common::utils::HTTPResponse response;

    if (auto err = mHTTPClient->Do(request, response); !err.IsNone()) {
        return GENIE_ERROR_WRAP(Error(ErrorEnum::eMetadataPatchFailure, "can't patch pod: " + err.Message()));
    }

    if (!response.IsSuccess()) {
        auto err = StatusToError(response.mStatus, response.mBody, ErrorEnum::eMetadataPatchFailure);

        return GENIE_ERROR_WRAP(Error(ErrorEnum::eMetadataPatchFailure, "can't patch pod: " + err.Message()));
    }

    return ErrorEnum::eNone;
}

Error KubeClient::GetLogicalNetwork(
    const std::string& ns, const std::string& name, clusterclient::LogicalNetwork& network)
{
    LOG_DBG() << "Get logical network" << Log::Field("namespace", ns) << Log::Field("name", name);

    std::string body;

    if (auto err = DoGet(std::string(cLogicalNetworkAPI) + "/namespaces/" + ns + "/logicalnetworks/" + name, body);
        !err.IsNone()) {
        return GENIE_ERROR_WRAP(err);
    }

    auto [json, err] = common::utils::ParseJson(body);
    if (!err.IsNone()) {
        return GENIE_ERROR_WRAP(Error(err.Value(), "can't parse logical network " + name + ": " + err.Message()));
    }

    if (!json.isObject()) {
        return GENIE_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "logical network " + name + " is not an object"));
    }

    const auto& spec = json["spec"];

    network.mName        = common::utils::GetString(json["metadata"], "name", name);
    network.mPhysicalNet = common::utils::GetString(spec, "physicalNet");
    network.mSubnet      = common::utils::GetString(spec, "sub_subnet", common::utils::GetString(spec, "subnet"));

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

common::utils::HTTPRequest KubeClient::CreateRequest(const std::string& method, const std::string& path) const
{
    common::utils::HTTPRequest request;

    request.mMethod      = method;
    request.mURL         = mAPIRoot + path;
    request.mBearerToken = mToken;
    request.mCAFile      = mCAFile;
    request.mCertFile    = mCertFile;
    request.mKeyFile     = mKeyFile;
    request.mTimeoutSec  = GENIE_CONFIG_HTTP_TIMEOUT_SEC;

    request.mHeaders.push_back("Accept: application/json");

    return request;
}

Error KubeClient::DoGet(const std::string& path, std::string& body)
{
    common::utils::HTTPResponse response;

    if (auto err = mHTTPClient->Do(CreateRequest("GET", path), response); !err.IsNone()) {
        return err;
    }

    if (!response.IsSuccess()) {
        return StatusToError(response.mStatus, response.mBody, ErrorEnum::eFailed);
    }

    body = std::move(response.mBody);

    return ErrorEnum::eNone;
}

} // namespace genie::kubeclient
