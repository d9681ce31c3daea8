/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_KUBECLIENT_HPP_
#define GENIE_KUBECLIENT_HPP_

#include <string>

#include "genie/clusterclient.hpp"
#include "genie/common/utils/http.hpp"
#include "genie/config.hpp"
#include "genie/netconf.hpp"

namespace genie::kubeclient {

/**
 * Kubernetes REST client.
 */
class KubeClient : public clusterclient::ClusterClientItf {
public:
    /**
     * Initializes client.
     *
     * API root, credentials and CA are taken from policy block, API root from kubernetes block overrides policy one.
     * In-cluster service account token and CA are used when not configured.
     *
     * @param conf plugin configuration.
     * @param httpClient HTTP client.
     * @param serviceAccountDir service account directory.
     * @return Error.
     */
    Error Init(const netconf::NetConf& conf, common::utils::HTTPClientItf& httpClient,
        const std::string& serviceAccountDir = GENIE_CONFIG_K8S_SERVICE_ACCOUNT_DIR);

    /**
     * Returns pod annotations.
     *
     * @param ns pod namespace.
     * @param name pod name.
     * @param[out] annotations pod annotations.
     * @return Error.
     */
    Error GetPodAnnotations(const std::string& ns, const std::string& name, Annotations& annotations) override;

    /**
     * Updates pod annotations using merge patch.
     *
     * @param ns pod namespace.
     * @param name pod name.
     * @param annotations annotations to set.
     * @return Error.
     */
    Error PatchPodAnnotations(const std::string& ns, const std::string& name, const Annotations& annotations) override;

    /**
     * Returns logical network object.
     *
     * @param ns network namespace.
     * @param name network name.
     * @param[out] network logical network.
     * @return Error.
     */
    Error GetLogicalNetwork(const std::string& ns, const std::string& name,
        clusterclient::LogicalNetwork& network) override;

    /**
     * Returns API root in use.
     *
     * @return const std::string&.
     */
    const std::string& GetAPIRoot() const { return mAPIRoot; }

private:
    static constexpr auto cLogicalNetworkAPI = "/apis/alpha.network.k8s.io/v1";

    common::utils::HTTPRequest CreateRequest(const std::string& method, const std::string& path) const;
    Error                      DoGet(const std::string& path, std::string& body);

    common::utils::HTTPClientItf* mHTTPClient {};
    std::string                   mAPIRoot;
    std::string                   mToken;
    std::string                   mCAFile;
    std::string                   mCertFile;
    std::string                   mKeyFile;
};

} // namespace genie::kubeclient

#endif
