/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "genie/backendselector.hpp"
#include "genie/common/tools/utils.hpp"
#include "genie/common/utils/exception.hpp"
#include "genie/common/utils/json.hpp"
#include "genie/config.hpp"

#include "log.hpp"

namespace genie::backendselector {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

std::string GetAnnotation(const Annotations& annotations, const std::string& key)
{
    auto it = annotations.find(key);
    if (it == annotations.end()) {
        return "";
    }

    return it->second;
}

Error SelectionError(const std::string& message, const Error& err = ErrorEnum::eNone)
{
    if (err.IsNone()) {
        return Error(ErrorEnum::eSelectionFailure, message);
    }

    return Error(ErrorEnum::eSelectionFailure, message + ": " + err.Message());
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error BackendSelector::Select(const SelectionContext& ctx, SelectionResult& result)
{
    result = SelectionResult();

    if (ctx.mMetadataAvailable) {
        if (auto cni = GetAnnotation(ctx.mAnnotations, cCNIAnnotation); !utils::TrimSpace(cni).empty()) {
            LOG_DBG() << "Select backends from annotation" << Log::Field("cni", cni);

            return SelectFromCNI(cni, result);
        }

        if (auto networks = GetAnnotation(ctx.mAnnotations, cNetworksAnnotation); !utils::TrimSpace(networks).empty()) {
            LOG_DBG() << "Select backends from networks" << Log::Field("networks", networks);

            return SelectFromNetworks(ctx, networks, result);
        }

        LOG_DBG() << "No backends declared, ask ranking service";

        return SelectFromRanking(ctx, result);
    }

    LOG_DBG() << "Workload metadata unavailable, use default backends";

    return SelectDefault(ctx, result);
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

Error BackendSelector::SelectFromCNI(const std::string& annotation, SelectionResult& result) const
{
    for (const auto& name : utils::Split(annotation, ',')) {
        result.mSelections.push_back({utils::TrimSpace(name), "", ""});
    }

    return ErrorEnum::eNone;
}

Error BackendSelector::SelectFromNetworks(
    const SelectionContext& ctx, const std::string& annotation, SelectionResult& result) const
{
    if (ctx.mCluster == nullptr) {
        return GENIE_ERROR_WRAP(SelectionError("cluster client is not available"));
    }

    std::vector<NetworkEntry> entries;

    if (auto err = ParseNetworks(annotation, entries); !err.IsNone()) {
        return GENIE_ERROR_WRAP(SelectionError("can't parse networks annotation", err));
    }

    // Annotations from arguments may come without workload namespace.
    auto ns = ctx.mIdentity.mNamespace.empty() ? std::string(cDefaultNamespace) : ctx.mIdentity.mNamespace;

    for (const auto& entry : entries) {
        clusterclient::LogicalNetwork network;

        if (auto err = ctx.mCluster->GetLogicalNetwork(ns, entry.mName, network); !err.IsNone()) {
            return GENIE_ERROR_WRAP(SelectionError("can't get logical network " + entry.mName, err));
        }

        if (network.mPhysicalNet.empty()) {
            return GENIE_ERROR_WRAP(SelectionError("logical network " + entry.mName + " has no physical network"));
        }

        BackendSelection selection {network.mPhysicalNet, entry.mIfName, entry.mSubnet};

        if (selection.mSubnet.empty()) {
            selection.mSubnet = network.mSubnet;
        }

        LOG_DBG() << "Network selected" << Log::Field("network", entry.mName)
                  << Log::Field("backend", selection.mName) << Log::Field("subnet", selection.mSubnet);

        result.mSelections.push_back(selection);
    }

    return ErrorEnum::eNone;
}

Error BackendSelector::SelectFromRanking(const SelectionContext& ctx, SelectionResult& result) const
{
    if (ctx.mRanking == nullptr) {
        return GENIE_ERROR_WRAP(SelectionError("ranking service is not available"));
    }

    std::string name;

    if (auto err = ctx.mRanking->GetBestBackend(name); !err.IsNone()) {
        return GENIE_ERROR_WRAP(SelectionError("can't rank backends", err));
    }

    result.mSelections.push_back({name, "", ""});
    result.mAnnotationUpdates[cCNIAnnotation] = name;

    return ErrorEnum::eNone;
}

Error BackendSelector::SelectDefault(const SelectionContext& ctx, SelectionResult& result) const
{
    auto plugins = utils::TrimSpace(ctx.mDefaultPlugin);

    if (plugins.empty()) {
        plugins = GENIE_CONFIG_DEFAULT_PLUGIN;
    }

    for (const auto& name : utils::Split(plugins, ',')) {
        result.mSelections.push_back({utils::TrimSpace(name), "", ""});
    }

    return ErrorEnum::eNone;
}

Error BackendSelector::ParseNetworks(const std::string& annotation, std::vector<NetworkEntry>& entries) const
{
    auto value = utils::TrimSpace(annotation);

    if (!utils::HasPrefix(value, "[")) {
        for (const auto& name : utils::Split(value, ',')) {
            if (auto trimmed = utils::TrimSpace(name); !trimmed.empty()) {
                entries.push_back({trimmed, "", ""});
            }
        }

        return ErrorEnum::eNone;
    }

    try {
        auto [json, err] = common::utils::ParseJson(value);
        GENIE_ERROR_CHECK_AND_THROW("invalid JSON", err);

        if (!json.isArray()) {
            GENIE_ERROR_CHECK_AND_THROW("array expected", ErrorEnum::eInvalidArgument);
        }

        for (const auto& item : json) {
            NetworkEntry entry {common::utils::GetString(item, "name"), common::utils::GetString(item, "interface"),
                common::utils::GetString(item, "subnet")};

            if (entry.mName.empty()) {
                GENIE_ERROR_CHECK_AND_THROW("network without name", ErrorEnum::eInvalidArgument);
            }

            entries.push_back(entry);
        }
    } catch (const std::exception& e) {
        return GENIE_ERROR_WRAP(common::utils::ToGenieError(e, ErrorEnum::eInvalidArgument));
    }

    return ErrorEnum::eNone;
}

} // namespace genie::backendselector
