/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include "genie/common/tools/utils.hpp"
#include "genie/common/utils/json.hpp"
#include "genie/config.hpp"
#include "genie/netconf.hpp"

#include "log.hpp"

namespace genie::netconf {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

RetWithError<bool> ParseBool(const std::string& value)
{
    if (value == "1" || value == "true" || value == "True" || value == "TRUE") {
        return true;
    }

    if (value == "0" || value == "false" || value == "False" || value == "FALSE") {
        return false;
    }

    return {false, Error(ErrorEnum::eInvalidArgument, "boolean unmarshal error: invalid input " + value)};
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error ParseNetConf(const std::string& data, NetConf& conf)
{
    auto [json, err] = common::utils::ParseJson(data);
    if (!err.IsNone()) {
        return GENIE_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "failed to load netconf: " + err.Message()));
    }

    if (!json.isObject()) {
        return GENIE_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "failed to load netconf: not an object"));
    }

    conf.mCNIVersion    = common::utils::GetString(json, "cniVersion");
    conf.mName          = common::utils::GetString(json, "name");
    conf.mType          = common::utils::GetString(json, "type");
    conf.mDefaultPlugin = common::utils::GetString(json, "default_plugin");
    conf.mLogLevel      = common::utils::GetString(json, "log_level");
    conf.mConfDir       = common::utils::GetString(json, "conf_dir");
    conf.mBinDir        = common::utils::GetString(json, "bin_dir");
    conf.mRankingURL    = common::utils::GetString(json, "ranking_url");

    if (json.isMember("kubernetes") && json["kubernetes"].isObject()) {
        const auto& kubernetes = json["kubernetes"];

        conf.mKubernetes.mK8sAPIRoot = common::utils::GetString(kubernetes, "k8s_api_root");
        conf.mKubernetes.mKubeconfig = common::utils::GetString(kubernetes, "kubeconfig");
    }

    if (json.isMember("policy") && json["policy"].isObject()) {
        const auto& policy = json["policy"];

        conf.mPolicy.mK8sAPIRoot              = common::utils::GetString(policy, "k8s_api_root");
        conf.mPolicy.mK8sAuthToken            = common::utils::GetString(policy, "k8s_auth_token");
        conf.mPolicy.mK8sClientCertificate    = common::utils::GetString(policy, "k8s_client_certificate");
        conf.mPolicy.mK8sClientKey            = common::utils::GetString(policy, "k8s_client_key");
        conf.mPolicy.mK8sCertificateAuthority = common::utils::GetString(policy, "k8s_certificate_authority");
    }

    return ErrorEnum::eNone;
}

Error ParseK8sArgs(const std::string& args, K8sArgs& k8sArgs)
{
    k8sArgs = K8sArgs();

    if (args.empty()) {
        return ErrorEnum::eNone;
    }

    std::vector<std::pair<std::string, std::string>> pairs;

    for (const auto& pair : utils::Split(args, ';')) {
        auto kv = utils::Split(pair, '=');
        if (kv.size() != 2) {
            return GENIE_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "ARGS: invalid pair \"" + pair + "\""));
        }

        pairs.emplace_back(kv[0], kv[1]);
    }

    // IgnoreUnknown affects parsing of the whole string, so it is processed first.
    auto ignoreUnknown = std::find_if(
        pairs.begin(), pairs.end(), [](const auto& pair) { return pair.first == "IgnoreUnknown"; });

    if (ignoreUnknown != pairs.end()) {
        auto [value, err] = ParseBool(ignoreUnknown->second);
        if (!err.IsNone()) {
            return GENIE_ERROR_WRAP(err);
        }

        k8sArgs.mIgnoreUnknown = value;
    }

    for (const auto& [key, value] : pairs) {
        if (key == "IgnoreUnknown") {
            continue;
        } else if (key == "K8S_POD_NAMESPACE") {
            k8sArgs.mPodNamespace = value;
        } else if (key == "K8S_POD_NAME") {
            k8sArgs.mPodName = value;
        } else if (key == "K8S_POD_INFRA_CONTAINER_ID") {
            k8sArgs.mPodInfraContainerID = value;
        } else if (key == "K8S_ANNOT") {
            k8sArgs.mAnnotations = value;
        } else if (!k8sArgs.mIgnoreUnknown) {
            return GENIE_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "ARGS: unknown args \"" + key + "\""));
        }
    }

    return ErrorEnum::eNone;
}

WorkloadIdentity CreateWorkloadIdentity(const CNIArgs& args, const K8sArgs& k8sArgs)
{
    WorkloadIdentity identity;

    identity.mContainerID      = args.mContainerID;
    identity.mNetNS            = args.mNetNS;
    identity.mIfName           = args.mIfName;
    identity.mIgnoreUnknown    = k8sArgs.mIgnoreUnknown;
    identity.mInfraContainerID = k8sArgs.mPodInfraContainerID;

    if (!k8sArgs.mPodNamespace.empty() && !k8sArgs.mPodName.empty()) {
        identity.mNamespace = k8sArgs.mPodNamespace;
        identity.mName      = k8sArgs.mPodName;

        LOG_DBG() << "Orchestrated workload" << Log::Field("id", identity.mNamespace + "." + identity.mName);

        return identity;
    }

    if (!k8sArgs.mPodNamespace.empty() || !k8sArgs.mPodName.empty()) {
        LOG_WRN() << "Partial pod identity, handle as standalone container"
                  << Log::Field("namespace", k8sArgs.mPodNamespace) << Log::Field("name", k8sArgs.mPodName);
    }

    LOG_DBG() << "Standalone workload" << Log::Field("id", identity.mContainerID);

    return identity;
}

std::vector<std::string> GetBinDirs(const NetConf& conf, const CNIArgs& args)
{
    std::vector<std::string> dirs {conf.mBinDir.empty() ? GENIE_CONFIG_CNI_BIN_DIR : conf.mBinDir};

    for (const auto& dir : utils::Split(args.mPath, ':')) {
        if (!dir.empty() && std::find(dirs.begin(), dirs.end(), dir) == dirs.end()) {
            dirs.push_back(dir);
        }
    }

    return dirs;
}

std::string GetConfDir(const NetConf& conf)
{
    return conf.mConfDir.empty() ? GENIE_CONFIG_CNI_CONF_DIR : conf.mConfDir;
}

} // namespace genie::netconf
