/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_NETCONF_HPP_
#define GENIE_NETCONF_HPP_

#include <string>
#include <vector>

#include "genie/common/tools/error.hpp"
#include "genie/common/types.hpp"

namespace genie::netconf {

/**
 * Kubernetes block of plugin configuration.
 */
struct KubernetesConf {
    std::string mK8sAPIRoot;
    std::string mKubeconfig;
};

/**
 * Policy block of plugin configuration.
 */
struct PolicyConf {
    std::string mK8sAPIRoot;
    std::string mK8sAuthToken;
    std::string mK8sClientCertificate;
    std::string mK8sClientKey;
    std::string mK8sCertificateAuthority;
};

/**
 * Plugin network configuration received on stdin.
 */
struct NetConf {
    std::string    mCNIVersion;
    std::string    mName;
    std::string    mType;
    std::string    mDefaultPlugin;
    std::string    mLogLevel;
    std::string    mConfDir;
    std::string    mBinDir;
    std::string    mRankingURL;
    KubernetesConf mKubernetes;
    PolicyConf     mPolicy;
};

/**
 * Plugin command arguments received from the runtime.
 */
struct CNIArgs {
    std::string mContainerID;
    std::string mNetNS;
    std::string mIfName;
    std::string mArgs;
    std::string mPath;
};

/**
 * Orchestrator arguments carried in CNI_ARGS.
 */
struct K8sArgs {
    bool        mIgnoreUnknown = false;
    std::string mPodNamespace;
    std::string mPodName;
    std::string mPodInfraContainerID;
    std::string mAnnotations;
};

/**
 * Parses plugin network configuration.
 *
 * @param data json data.
 * @param[out] conf configuration.
 * @return Error.
 */
Error ParseNetConf(const std::string& data, NetConf& conf);

/**
 * Parses CNI_ARGS value. Unknown keys are rejected unless IgnoreUnknown is set.
 *
 * @param args semicolon separated KEY=VALUE pairs.
 * @param[out] k8sArgs parsed arguments.
 * @return Error.
 */
Error ParseK8sArgs(const std::string& args, K8sArgs& k8sArgs);

/**
 * Builds workload identity. Partially set namespace and name are dropped.
 *
 * @param args plugin command arguments.
 * @param k8sArgs orchestrator arguments.
 * @return WorkloadIdentity.
 */
WorkloadIdentity CreateWorkloadIdentity(const CNIArgs& args, const K8sArgs& k8sArgs);

/**
 * Returns plugin binary search path: configured binary directory followed by CNI_PATH entries.
 *
 * @param conf plugin configuration.
 * @param args plugin command arguments.
 * @return std::vector<std::string>.
 */
std::vector<std::string> GetBinDirs(const NetConf& conf, const CNIArgs& args);

/**
 * Returns backend configuration directory.
 *
 * @param conf plugin configuration.
 * @return std::string.
 */
std::string GetConfDir(const NetConf& conf);

} // namespace genie::netconf

#endif
