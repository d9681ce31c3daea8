/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_CONTROLLER_HPP_
#define GENIE_CONTROLLER_HPP_

#include <string>

#include "genie/backendselector.hpp"
#include "genie/clusterclient.hpp"
#include "genie/cni/cni.hpp"
#include "genie/common/tools/error.hpp"
#include "genie/configresolver.hpp"
#include "genie/netconf.hpp"
#include "genie/ranking.hpp"
#include "genie/resultmerger.hpp"

namespace genie::controller {

/**
 * Attaches workloads to the selected backends.
 */
class Controller {
public:
    /**
     * Initializes controller.
     *
     * @param resolver backend config resolver.
     * @param cni backend invoker.
     * @param selector backend selector.
     * @param cluster cluster state client.
     * @param ranking backend ranking client.
     * @return Error.
     */
    Error Init(configresolver::ConfigResolverItf& resolver, cni::CNIItf& cni,
        backendselector::BackendSelectorItf& selector, clusterclient::ClusterClientItf& cluster,
        ranking::RankingClientItf& ranking);

    /**
     * Attaches workload to all selected backends and merges their results.
     *
     * All selected backends are attempted. If any of them fails, the call fails and result is left untouched.
     *
     * @param args CNI arguments.
     * @param conf plugin configuration.
     * @param[out] result merged result.
     * @return Error.
     */
    Error AddPodNetwork(const netconf::CNIArgs& args, const netconf::NetConf& conf, cni::Result& result);

    /**
     * Detaches workload from all selected backends.
     *
     * @param args CNI arguments.
     * @param conf plugin configuration.
     * @return Error last detach error.
     */
    Error DeletePodNetwork(const netconf::CNIArgs& args, const netconf::NetConf& conf);

private:
    static constexpr auto cDefaultIfPrefix = "eth";

    Error            PrepareSelection(const netconf::CNIArgs& args, const netconf::NetConf& conf,
                   WorkloadIdentity& identity, backendselector::SelectionResult& selection);
    void             FetchAnnotations(const WorkloadIdentity& identity, const netconf::K8sArgs& k8sArgs,
                    backendselector::SelectionContext& ctx);
    void             PersistAnnotations(const WorkloadIdentity& identity, const Annotations& annotations);
    Error            UpdateMultiIPPreferences(const WorkloadIdentity& identity, const MultiIPRecord& record);
    cni::RuntimeConf CreateRuntimeConf(const WorkloadIdentity& identity, const std::string& ifName) const;
    std::string      GetIfName(const BackendSelection& selection, size_t index) const;

    configresolver::ConfigResolverItf*   mResolver {};
    cni::CNIItf*                         mCNI {};
    backendselector::BackendSelectorItf* mSelector {};
    clusterclient::ClusterClientItf*     mCluster {};
    ranking::RankingClientItf*           mRanking {};
    resultmerger::ResultMerger           mMerger;
};

} // namespace genie::controller

#endif
