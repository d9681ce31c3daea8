/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <unistd.h>

#include "genie/cni/cni.hpp"
#include "genie/cni/result.hpp"
#include "genie/common/tools/fs.hpp"
#include "genie/common/tools/utils.hpp"
#include "genie/common/utils/exception.hpp"
#include "genie/common/utils/json.hpp"

#include "log.hpp"

extern char** environ;

namespace genie::cni {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error CNI::Init(ExecItf& exec, const std::vector<std::string>& binDirs)
{
    LOG_DBG() << "Init CNI" << Log::Field("binDirs", utils::JoinStrings(binDirs, ":"));

    mExec    = &exec;
    mBinDirs = binDirs;

    return ErrorEnum::eNone;
}

Error CNI::AddNetworkList(const NetworkConfigList& net, const RuntimeConf& rt, Result& result)
{
    LOG_DBG() << "Add network list" << Log::Field("name", net.mName) << Log::Field("ifName", rt.mIfName);

    if (net.mPlugins.empty()) {
        return GENIE_ERROR_WRAP(Error(ErrorEnum::eInvalidArgument, "network list has no plugins"));
    }

    try {
        Json::Value prevResult;

        for (const auto& plugin : net.mPlugins) {
            auto [output, err] = ExecutePlugin(net, plugin, rt, prevResult, ActionEnum::eAdd);
            GENIE_ERROR_CHECK_AND_THROW("failed to execute plugin", err);

            auto [json, parseErr] = common::utils::ParseJson(output);
            if (!parseErr.IsNone()) {
                return GENIE_ERROR_WRAP(Error(
                    ErrorEnum::eInvocationFailure, "plugin " + plugin.GetType() + " returned malformed result"));
            }

            prevResult = json;
        }

        Result parsed;

        if (auto err = ParseResult(prevResult, parsed); !err.IsNone()) {
            return GENIE_ERROR_WRAP(Error(ErrorEnum::eInvocationFailure,
                "plugin " + net.mPlugins.back().GetType() + " returned malformed result: " + err.Message()));
        }

        result = std::move(parsed);
    } catch (const std::exception& e) {
        return GENIE_ERROR_WRAP(common::utils::ToGenieError(e, ErrorEnum::eInvocationFailure));
    }

    return ErrorEnum::eNone;
}

Error CNI::DeleteNetworkList(const NetworkConfigList& net, const RuntimeConf& rt)
{
    LOG_DBG() << "Delete network list" << Log::Field("name", net.mName) << Log::Field("ifName", rt.mIfName);

    Error resultErr;

    for (auto it = net.mPlugins.rbegin(); it != net.mPlugins.rend(); ++it) {
        try {
            auto err = ExecutePlugin(net, *it, rt, Json::Value(), ActionEnum::eDel).mError;
            GENIE_ERROR_CHECK_AND_THROW("failed to execute plugin", err);
        } catch (const std::exception& e) {
            resultErr = common::utils::ToGenieError(e, ErrorEnum::eInvocationFailure);

            LOG_ERR() << "Failed to delete network" << Log::Field("plugin", it->GetType()) << Log::Field(resultErr);
        }
    }

    return resultErr;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<std::string> CNI::ExecutePlugin(const NetworkConfigList& net, const NetworkConfig& plugin,
    const RuntimeConf& rt, const Json::Value& prevResult, Action action)
{
    auto type = plugin.GetType();

    LOG_DBG() << "Execute plugin" << Log::Field("type", type) << Log::Field("action", action);

    auto [pluginPath, err] = FindPlugin(type);
    if (!err.IsNone()) {
        return {"", err};
    }

    auto [output, execErr]
        = mExec->ExecPlugin(AddCNIData(net, plugin, prevResult), pluginPath, CreateEnv(rt, action));

    if (auto [json, parseErr] = common::utils::ParseJson(output); parseErr.IsNone()) {
        int         code = 0;
        std::string message;

        if (ParseErrorObject(json, code, message)) {
            return {output,
                Error(ErrorEnum::eInvocationFailure,
                    "plugin " + type + " failed: " + message + " (code " + std::to_string(code) + ")")};
        }
    }

    if (!execErr.IsNone()) {
        return {output, Error(ErrorEnum::eInvocationFailure, "plugin " + type + " failed: " + execErr.Message())};
    }

    return output;
}

RetWithError<std::string> CNI::FindPlugin(const std::string& type) const
{
    if (type.empty()) {
        return {"", Error(ErrorEnum::eInvalidArgument, "plugin type is empty")};
    }

    for (const auto& dir : mBinDirs) {
        auto path = fs::JoinPath(dir, type);

        if (fs::IsExecutable(path)) {
            return path;
        }
    }

    return {"", Error(ErrorEnum::eNotFound,
                    "failed to find plugin " + type + " in path [" + utils::JoinStrings(mBinDirs, ":") + "]")};
}

std::string CNI::AddCNIData(
    const NetworkConfigList& net, const NetworkConfig& plugin, const Json::Value& prevResult) const
{
    auto config = plugin.mRaw;

    config["cniVersion"] = net.mVersion;
    config["name"]       = net.mName;

    if (!prevResult.isNull()) {
        config["prevResult"] = prevResult;
    }

    return common::utils::WriteJson(config);
}

std::vector<std::string> CNI::CreateEnv(const RuntimeConf& rt, Action action) const
{
    std::vector<std::string> envs;

    // Inherited CNI_* variables belong to the parent invocation.
    for (auto env = environ; env != nullptr && *env != nullptr; env++) {
        std::string item(*env);

        if (!utils::HasPrefix(item, "CNI_")) {
            envs.push_back(std::move(item));
        }
    }

    envs.push_back("CNI_COMMAND=" + action.ToString());
    envs.push_back("CNI_CONTAINERID=" + rt.mContainerID);
    envs.push_back("CNI_NETNS=" + rt.mNetNS);
    envs.push_back("CNI_IFNAME=" + rt.mIfName);
    envs.push_back("CNI_ARGS=" + ArgsAsString(rt));
    envs.push_back("CNI_PATH=" + utils::JoinStrings(mBinDirs, ":"));

    return envs;
}

std::string CNI::ArgsAsString(const RuntimeConf& rt) const
{
    std::vector<std::string> args;

    for (const auto& arg : rt.mArgs) {
        if (!arg.mName.empty()) {
            args.push_back(arg.mName + "=" + arg.mValue);
        }
    }

    return utils::JoinStrings(args, ";");
}

} // namespace genie::cni
