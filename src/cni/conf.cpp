/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "genie/cni/conf.hpp"
#include "genie/common/tools/fs.hpp"
#include "genie/common/tools/utils.hpp"
#include "genie/common/utils/json.hpp"

#include "log.hpp"

namespace genie::cni {

/***********************************************************************************************************************
 * NetworkConfig
 **********************************************************************************************************************/

std::string NetworkConfig::GetType() const
{
    return common::utils::GetString(mRaw, "type");
}

std::string NetworkConfig::GetName() const
{
    return common::utils::GetString(mRaw, "name");
}

Error NetworkConfig::SetIPAMSubnet(const std::string& subnet)
{
    if (!mRaw.isObject()) {
        return Error(ErrorEnum::eInvalidArgument, "plugin configuration is not an object");
    }

    if (!mRaw.isMember("ipam") || mRaw["ipam"].isNull()) {
        mRaw["ipam"] = Json::Value(Json::objectValue);
    }

    if (!mRaw["ipam"].isObject()) {
        return Error(ErrorEnum::eInvalidArgument, "ipam is not an object");
    }

    mRaw["ipam"]["subnet"] = subnet;

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error ParseNetworkConfig(const std::string& data, NetworkConfig& conf)
{
    auto [json, err] = common::utils::ParseJson(data);
    if (!err.IsNone()) {
        return err;
    }

    if (!json.isObject()) {
        return Error(ErrorEnum::eInvalidArgument, "network configuration is not an object");
    }

    conf.mRaw = json;

    // A .conf without type may be a misnamed list.
    if (conf.GetType().empty()) {
        return Error(ErrorEnum::eInvalidArgument, "no 'type'; perhaps this is a .conflist?");
    }

    return ErrorEnum::eNone;
}

Error ParseNetworkConfigList(const std::string& data, NetworkConfigList& list)
{
    auto [json, err] = common::utils::ParseJson(data);
    if (!err.IsNone()) {
        return err;
    }

    if (!json.isObject()) {
        return Error(ErrorEnum::eInvalidArgument, "network configuration list is not an object");
    }

    if (!json.isMember("plugins") || !json["plugins"].isArray()) {
        return Error(ErrorEnum::eInvalidArgument, "no 'plugins' key");
    }

    list.mVersion = common::utils::GetString(json, "cniVersion");
    list.mName    = common::utils::GetString(json, "name");
    list.mPlugins.clear();

    for (const auto& plugin : json["plugins"]) {
        if (!plugin.isObject()) {
            return Error(ErrorEnum::eInvalidArgument, "plugin configuration is not an object");
        }

        NetworkConfig conf;

        conf.mRaw = plugin;

        if (conf.GetType().empty()) {
            return Error(ErrorEnum::eInvalidArgument, "plugin without 'type'");
        }

        list.mPlugins.push_back(std::move(conf));
    }

    if (list.mPlugins.empty()) {
        return Error(ErrorEnum::eInvalidArgument, "configuration list has no networks");
    }

    return ErrorEnum::eNone;
}

NetworkConfigList ConfListFromConf(const NetworkConfig& conf)
{
    NetworkConfigList list;

    list.mVersion = common::utils::GetString(conf.mRaw, "cniVersion");
    list.mName    = conf.GetName();
    list.mPlugins.push_back(conf);

    return list;
}

Error LoadNetworkConfigList(const std::string& path, NetworkConfigList& list)
{
    LOG_DBG() << "Load network configuration" << Log::Field("path", path);

    std::string data;

    if (auto err = fs::ReadFileToString(path, data); !err.IsNone()) {
        return err;
    }

    if (utils::HasSuffix(path, ".conflist")) {
        if (auto err = ParseNetworkConfigList(data, list); !err.IsNone()) {
            return err;
        }
    } else {
        NetworkConfig conf;

        if (auto err = ParseNetworkConfig(data, conf); !err.IsNone()) {
            return err;
        }

        list = ConfListFromConf(conf);
    }

    list.mSourcePath = path;

    return ErrorEnum::eNone;
}

} // namespace genie::cni
