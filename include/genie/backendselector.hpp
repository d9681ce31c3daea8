/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_BACKENDSELECTOR_HPP_
#define GENIE_BACKENDSELECTOR_HPP_

#include <string>
#include <vector>

#include "genie/clusterclient.hpp"
#include "genie/common/tools/error.hpp"
#include "genie/common/types.hpp"
#include "genie/ranking.hpp"

namespace genie::backendselector {

/**
 * Selection input.
 */
struct SelectionContext {
    WorkloadIdentity                 mIdentity;
    bool                             mMetadataAvailable = false;
    Annotations                      mAnnotations;
    std::string                      mDefaultPlugin;
    ranking::RankingClientItf*       mRanking {};
    clusterclient::ClusterClientItf* mCluster {};
};

/**
 * Selection output.
 */
struct SelectionResult {
    std::vector<BackendSelection> mSelections;
    Annotations                   mAnnotationUpdates;
};

/**
 * Backend selector interface.
 */
class BackendSelectorItf {
public:
    /**
     * Destructor.
     */
    virtual ~BackendSelectorItf() = default;

    /**
     * Selects backends for workload.
     *
     * @param ctx selection context.
     * @param[out] result ordered selections and annotation updates to persist.
     * @return Error.
     */
    virtual Error Select(const SelectionContext& ctx, SelectionResult& result) = 0;
};

/**
 * Selects backends by workload annotations, ranking service or configured defaults.
 */
class BackendSelector : public BackendSelectorItf {
public:
    /**
     * Selects backends for workload.
     *
     * Precedence: cni annotation, networks annotation, ranking service, default plugins. Ranking and defaults are
     * used only when the previous sources are absent.
     *
     * @param ctx selection context.
     * @param[out] result ordered selections and annotation updates to persist.
     * @return Error eSelectionFailure if no usable selection is produced.
     */
    Error Select(const SelectionContext& ctx, SelectionResult& result) override;

private:
    static constexpr auto cDefaultNamespace = "default";

    struct NetworkEntry {
        std::string mName;
        std::string mIfName;
        std::string mSubnet;
    };

    Error SelectFromCNI(const std::string& annotation, SelectionResult& result) const;
    Error SelectFromNetworks(const SelectionContext& ctx, const std::string& annotation, SelectionResult& result) const;
    Error SelectFromRanking(const SelectionContext& ctx, SelectionResult& result) const;
    Error SelectDefault(const SelectionContext& ctx, SelectionResult& result) const;
    Error ParseNetworks(const std::string& annotation, std::vector<NetworkEntry>& entries) const;
};

} // namespace genie::backendselector

#endif
