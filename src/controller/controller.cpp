/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "genie/common/tools/utils.hpp"
#include "genie/common/utils/exception.hpp"
#include "genie/common/utils/json.hpp"
#include "genie/controller.hpp"

#include "log.hpp"

namespace genie::controller {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

std::string StripPrefixLength(const std::string& address)
{
    return address.substr(0, address.find('/'));
}

Error ParseAnnotations(const std::string& data, Annotations& annotations)
{
    try {
        auto [json, err] = common::utils::ParseJson(data);
        GENIE_ERROR_CHECK_AND_THROW("invalid JSON", err);

        if (!json.isObject()) {
            GENIE_ERROR_CHECK_AND_THROW("object expected", ErrorEnum::eInvalidArgument);
        }

        for (const auto& key : json.getMemberNames()) {
            if (!json[key].isString()) {
                GENIE_ERROR_CHECK_AND_THROW("annotation " + key + " is not a string", ErrorEnum::eInvalidArgument);
            }

            annotations[key] = json[key].asString();
        }
    } catch (const std::exception& e) {
        return GENIE_ERROR_WRAP(common::utils::ToGenieError(e, ErrorEnum::eInvalidArgument));
    }

    return ErrorEnum::eNone;
}

std::string MultiIPRecordToJSON(const MultiIPRecord& record)
{
    Json::Value json(Json::objectValue);

    json["multi_entry"] = record.mMultiEntry;
    json["ips"]         = Json::Value(Json::objectValue);

    for (const auto& [key, entry] : record.mIPs) {
        json["ips"][key]["ip"]        = entry.mIP;
        json["ips"][key]["interface"] = entry.mInterface;
    }

    return common::utils::WriteJson(json);
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error Controller::Init(configresolver::ConfigResolverItf& resolver, cni::CNIItf& cni,
    backendselector::BackendSelectorItf& selector, clusterclient::ClusterClientItf& cluster,
    ranking::RankingClientItf& ranking)
{
    LOG_DBG() << "Init controller";

    mResolver = &resolver;
    mCNI      = &cni;
    mSelector = &selector;
    mCluster  = &cluster;
    mRanking  = &ranking;

    return ErrorEnum::eNone;
}

Error Controller::AddPodNetwork(const netconf::CNIArgs& args, const netconf::NetConf& conf, cni::Result& result)
{
    LOG_INF() << "Add pod network" << Log::Field("containerID", args.mContainerID)
              << Log::Field("netns", args.mNetNS);

    WorkloadIdentity                 identity;
    backendselector::SelectionResult selection;

    if (auto err = PrepareSelection(args, conf, identity, selection); !err.IsNone()) {
        return err;
    }

    PersistAnnotations(identity, selection.mAnnotationUpdates);

    cni::Result   merged;
    MultiIPRecord multiIP;
    Error         backendErr;

    for (size_t i = 0; i < selection.mSelections.size(); i++) {
        const auto& backend = selection.mSelections[i];
        auto        ifName  = GetIfName(backend, i);

        LOG_DBG() << "Attach backend" << Log::Field("backend", backend.mName) << Log::Field("ifName", ifName)
                  << Log::Field("subnet", backend.mSubnet);

        cni::NetworkConfigList config;

        if (auto err = mResolver->Resolve(backend.mName, backend.mSubnet, config); !err.IsNone()) {
            return GENIE_ERROR_WRAP(err);
        }

        cni::Result backendResult;

        if (auto err = mCNI->AddNetworkList(config, CreateRuntimeConf(identity, ifName), backendResult);
            !err.IsNone()) {
            LOG_ERR() << "Can't attach backend" << Log::Field("backend", backend.mName) << Log::Field(err);

            backendErr = Error(ErrorEnum::eInvocationFailure, "backend " + backend.mName + ": " + err.Message());

            continue;
        }

        if (auto err = mMerger.Repair(backendResult); !err.IsNone()) {
            return GENIE_ERROR_WRAP(err);
        }

        if (auto err = mMerger.Merge(backendResult, merged); !err.IsNone()) {
            return GENIE_ERROR_WRAP(err);
        }

        if (!backendResult.mIPs.empty()) {
            multiIP.Add(static_cast<int>(i) + 1, StripPrefixLength(backendResult.mIPs[0].mAddress), ifName);
        }
    }

    if (merged.mInterfaces.size() > 1 && identity.IsOrchestrated()) {
        if (auto err = UpdateMultiIPPreferences(identity, multiIP); !err.IsNone()) {
            return GENIE_ERROR_WRAP(err);
        }
    }

    if (!backendErr.IsNone()) {
        return GENIE_ERROR_WRAP(backendErr);
    }

    LOG_INF() << "Pod network added" << Log::Field("interfaces", merged.mInterfaces.size())
              << Log::Field("ips", merged.mIPs.size());

    result = merged;

    return ErrorEnum::eNone;
}

Error Controller::DeletePodNetwork(const netconf::CNIArgs& args, const netconf::NetConf& conf)
{
    LOG_INF() << "Delete pod network" << Log::Field("containerID", args.mContainerID)
              << Log::Field("netns", args.mNetNS);

    WorkloadIdentity                 identity;
    backendselector::SelectionResult selection;

    if (auto err = PrepareSelection(args, conf, identity, selection); !err.IsNone()) {
        return err;
    }

    Error resultErr;

    for (size_t i = 0; i < selection.mSelections.size(); i++) {
        const auto& backend = selection.mSelections[i];
        auto        ifName  = GetIfName(backend, i);

        LOG_DBG() << "Detach backend" << Log::Field("backend", backend.mName) << Log::Field("ifName", ifName);

        cni::NetworkConfigList config;

        if (auto err = mResolver->Resolve(backend.mName, backend.mSubnet, config); !err.IsNone()) {
            LOG_ERR() << "Can't resolve backend config" << Log::Field("backend", backend.mName) << Log::Field(err);

            resultErr = GENIE_ERROR_WRAP(err);

            continue;
        }

        if (auto err = mCNI->DeleteNetworkList(config, CreateRuntimeConf(identity, ifName)); !err.IsNone()) {
            LOG_ERR() << "Can't detach backend" << Log::Field("backend", backend.mName) << Log::Field(err);

            resultErr = GENIE_ERROR_WRAP(err);
        }
    }

    return resultErr;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

Error Controller::PrepareSelection(const netconf::CNIArgs& args, const netconf::NetConf& conf,
    WorkloadIdentity& identity, backendselector::SelectionResult& selection)
{
    netconf::K8sArgs k8sArgs;

    if (auto err = netconf::ParseK8sArgs(args.mArgs, k8sArgs); !err.IsNone()) {
        return GENIE_ERROR_WRAP(err);
    }

    identity = netconf::CreateWorkloadIdentity(args, k8sArgs);

    backendselector::SelectionContext ctx;

    ctx.mIdentity      = identity;
    ctx.mDefaultPlugin = conf.mDefaultPlugin;
    ctx.mRanking       = mRanking;
    ctx.mCluster       = mCluster;

    FetchAnnotations(identity, k8sArgs, ctx);

    if (auto err = mSelector->Select(ctx, selection); !err.IsNone()) {
        return GENIE_ERROR_WRAP(err);
    }

    if (selection.mSelections.empty()) {
        return GENIE_ERROR_WRAP(Error(ErrorEnum::eSelectionFailure, "no backends selected"));
    }

    return ErrorEnum::eNone;
}

void Controller::FetchAnnotations(
    const WorkloadIdentity& identity, const netconf::K8sArgs& k8sArgs, backendselector::SelectionContext& ctx)
{
    if (identity.IsOrchestrated()) {
        auto err = mCluster->GetPodAnnotations(identity.mNamespace, identity.mName, ctx.mAnnotations);
        if (err.IsNone()) {
            ctx.mMetadataAvailable = true;

            return;
        }

        LOG_WRN() << "Can't get pod annotations" << Log::Field("namespace", identity.mNamespace)
                  << Log::Field("name", identity.mName) << Log::Field(err);
    }

    if (k8sArgs.mAnnotations.empty()) {
        return;
    }

    Annotations annotations;

    if (auto err = ParseAnnotations(k8sArgs.mAnnotations, annotations); !err.IsNone()) {
        LOG_WRN() << "Can't parse annotations from arguments" << Log::Field(err);

        return;
    }

    LOG_DBG() << "Use annotations from arguments";

    ctx.mAnnotations       = annotations;
    ctx.mMetadataAvailable = true;
}

void Controller::PersistAnnotations(const WorkloadIdentity& identity, const Annotations& annotations)
{
    if (annotations.empty()) {
        return;
    }

    if (!identity.IsOrchestrated()) {
        LOG_WRN() << "Can't persist annotations of standalone workload";

        return;
    }

    if (auto err = mCluster->PatchPodAnnotations(identity.mNamespace, identity.mName, annotations); !err.IsNone()) {
        LOG_WRN() << "Can't persist pod annotations" << Log::Field(err);
    }
}

Error Controller::UpdateMultiIPPreferences(const WorkloadIdentity& identity, const MultiIPRecord& record)
{
    auto value = MultiIPRecordToJSON(record);

    LOG_DBG() << "Update multi IP preferences" << Log::Field("value", value);

    if (auto err = mCluster->PatchPodAnnotations(
            identity.mNamespace, identity.mName, {{cMultiIPPreferencesAnnotation, value}});
        !err.IsNone()) {
        return Error(ErrorEnum::eMetadataPatchFailure, "can't update multi IP preferences: " + err.Message());
    }

    return ErrorEnum::eNone;
}

cni::RuntimeConf Controller::CreateRuntimeConf(const WorkloadIdentity& identity, const std::string& ifName) const
{
    cni::RuntimeConf rt {identity.mContainerID, identity.mNetNS, ifName, {}};

    if (identity.mIgnoreUnknown) {
        rt.mArgs.push_back({"IgnoreUnknown", "1"});
    }

    if (identity.IsOrchestrated()) {
        rt.mArgs.push_back({"K8S_POD_NAMESPACE", identity.mNamespace});
        rt.mArgs.push_back({"K8S_POD_NAME", identity.mName});
        rt.mArgs.push_back({"K8S_POD_INFRA_CONTAINER_ID", identity.mInfraContainerID});
    }

    return rt;
}

std::string Controller::GetIfName(const BackendSelection& selection, size_t index) const
{
    if (!selection.mIfName.empty()) {
        return selection.mIfName;
    }

    return cDefaultIfPrefix + std::to_string(index);
}

} // namespace genie::controller
