/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cctype>

#include "genie/cni/conf.hpp"
#include "genie/common/tools/fs.hpp"
#include "genie/common/tools/utils.hpp"
#include "genie/common/utils/json.hpp"
#include "genie/config.hpp"
#include "genie/configresolver.hpp"

#include "log.hpp"

namespace genie::configresolver {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

const std::vector<std::string> cConfExtensions = {".conf", ".conflist", ".json"};

std::string CreateDefaultConfig(const std::string& type, const std::string& extra, const std::string& subnet)
{
    return R"({"cniVersion":")" GENIE_CONFIG_DEFAULT_CNI_VERSION R"(","name":")" + type + R"(","type":")" + type
        + R"(",)" + extra + R"("ipam":{"type":"host-local","subnet":")" + subnet
        + R"(","routes":[{"dst":"0.0.0.0/0"}]}})";
}

bool HasConfExtension(const std::string& fileName)
{
    return std::any_of(cConfExtensions.begin(), cConfExtensions.end(),
        [&fileName](const std::string& ext) { return utils::HasSuffix(fileName, ext); });
}

std::string ConfStem(const std::string& fileName)
{
    auto stem = fileName;

    for (const auto& ext : cConfExtensions) {
        if (utils::HasSuffix(stem, ext)) {
            stem.resize(stem.size() - ext.size());

            break;
        }
    }

    // Strip numeric priority prefix, e.g. 10-bridge.
    auto pos = stem.find('-');
    if (pos != std::string::npos && pos > 0
        && std::all_of(stem.begin(), stem.begin() + pos, [](unsigned char c) { return std::isdigit(c); })) {
        stem.erase(0, pos + 1);
    }

    return stem;
}

} // namespace

/***********************************************************************************************************************
 * BackendRegistry
 **********************************************************************************************************************/

BackendRegistry::BackendRegistry()
{
    Register("romana", {"romana", ""});
    Register("weave", {"weave-net", ""});
    Register("canal", {"calico", ""});
    Register("calico", {"calico", ""});
    Register("flannel", {"flannel", ""});
    Register("bridge",
        {"bridge",
            CreateDefaultConfig("bridge", R"("bridge":"cni0","isGateway":true,"ipMasq":true,)", "10.10.0.0/16")});
    Register("macvlan", {"macvlan", CreateDefaultConfig("macvlan", R"("master":"eth0",)", "10.20.0.0/16")});
    Register("sriov", {"sriov", CreateDefaultConfig("sriov", R"("master":"eth1",)", "10.30.0.0/16")});
}

void BackendRegistry::Register(const std::string& name, const BackendInfo& info)
{
    auto it = std::find_if(
        mBackends.begin(), mBackends.end(), [&name](const auto& backend) { return backend.first == name; });

    if (it != mBackends.end()) {
        it->second = info;

        return;
    }

    mBackends.emplace_back(name, info);
}

std::string BackendRegistry::BinaryName(const std::string& name) const
{
    auto it = std::find_if(
        mBackends.begin(), mBackends.end(), [&name](const auto& backend) { return backend.first == name; });

    if (it == mBackends.end() || it->second.mBinary.empty()) {
        return name;
    }

    return it->second.mBinary;
}

Error BackendRegistry::GetDefaultConfig(const std::string& name, cni::NetworkConfig& conf) const
{
    auto it = std::find_if(
        mBackends.begin(), mBackends.end(), [&name](const auto& backend) { return backend.first == name; });

    if (it == mBackends.end() || it->second.mDefaultConfig.empty()) {
        return Error(ErrorEnum::eNotSupported, "no default configuration for " + name);
    }

    return cni::ParseNetworkConfig(it->second.mDefaultConfig, conf);
}

bool BackendRegistry::Matches(
    const std::string& name, const std::string& fileName, const cni::NetworkConfigList& list) const
{
    if (name.empty()) {
        return false;
    }

    return ConfStem(fileName) == name || list.mName == name;
}

std::vector<std::string> BackendRegistry::GetKnownBackends() const
{
    std::vector<std::string> names;

    for (const auto& backend : mBackends) {
        names.push_back(backend.first);
    }

    return names;
}

/***********************************************************************************************************************
 * ConfigResolver
 **********************************************************************************************************************/

Error ConfigResolver::Init(
    const std::string& confDir, const std::vector<std::string>& binDirs, const BackendRegistry& registry)
{
    LOG_DBG() << "Init config resolver" << Log::Field("confDir", confDir)
              << Log::Field("binDirs", utils::JoinStrings(binDirs, ":"));

    mConfDir  = confDir;
    mBinDirs  = binDirs;
    mRegistry = registry;

    return ErrorEnum::eNone;
}

Error ConfigResolver::Resolve(const std::string& name, const std::string& subnet, cni::NetworkConfigList& config)
{
    LOG_DBG() << "Resolve backend config" << Log::Field("name", name) << Log::Field("subnet", subnet);

    if (name.empty()) {
        return GENIE_ERROR_WRAP(UnsupportedError(name));
    }

    cni::NetworkConfigList resolved;

    auto [found, err] = FindConfig(name, resolved);
    if (!err.IsNone()) {
        return GENIE_ERROR_WRAP(err);
    }

    if (!found) {
        if (err = CheckBinary(name); !err.IsNone()) {
            return GENIE_ERROR_WRAP(err);
        }

        if (err = CreateConfig(name, resolved); !err.IsNone()) {
            return GENIE_ERROR_WRAP(err);
        }
    }

    if (!subnet.empty()) {
        if (err = resolved.mPlugins.front().SetIPAMSubnet(subnet); !err.IsNone()) {
            return GENIE_ERROR_WRAP(Error(
                err.Value(), "can't set subnet for " + name + " (" + resolved.mSourcePath + "): " + err.Message()));
        }
    }

    LOG_DBG() << "Backend config resolved" << Log::Field("name", name) << Log::Field("type", resolved.GetType())
              << Log::Field("path", resolved.mSourcePath);

    config = std::move(resolved);

    return ErrorEnum::eNone;
}

/***********************************************************************************************************************
 * Private
 **********************************************************************************************************************/

RetWithError<bool> ConfigResolver::FindConfig(const std::string& name, cni::NetworkConfigList& config) const
{
    auto [exist, err] = fs::DirExist(mConfDir);
    if (!err.IsNone()) {
        return {false, err};
    }

    if (!exist) {
        return {false, Error(ErrorEnum::eNotFound, "config directory " + mConfDir + " not found")};
    }

    std::vector<std::string> files;

    if (err = fs::ListFiles(mConfDir, files); !err.IsNone()) {
        return {false, err};
    }

    for (const auto& file : files) {
        if (!HasConfExtension(file)) {
            continue;
        }

        auto                   path = fs::JoinPath(mConfDir, file);
        cni::NetworkConfigList list;

        if (err = cni::LoadNetworkConfigList(path, list); !err.IsNone()) {
            if (ConfStem(file) == name) {
                LOG_WRN() << "Skip malformed config" << Log::Field("path", path) << Log::Field(err);
            }

            continue;
        }

        if (!mRegistry.Matches(name, file, list)) {
            continue;
        }

        if (list.GetType() == cGenieType) {
            LOG_DBG() << "Skip own config" << Log::Field("path", path);

            continue;
        }

        config = std::move(list);

        return true;
    }

    return false;
}

Error ConfigResolver::CheckBinary(const std::string& name) const
{
    auto binary  = mRegistry.BinaryName(name);
    bool dirSeen = false;

    for (const auto& dir : mBinDirs) {
        auto [exist, err] = fs::DirExist(dir);
        if (!err.IsNone() || !exist) {
            continue;
        }

        dirSeen = true;

        if (fs::IsExecutable(fs::JoinPath(dir, binary))) {
            return ErrorEnum::eNone;
        }
    }

    if (!dirSeen) {
        return Error(ErrorEnum::eNotFound, "binary directory [" + utils::JoinStrings(mBinDirs, ":") + "] not found");
    }

    return UnsupportedError(name);
}

Error ConfigResolver::CreateConfig(const std::string& name, cni::NetworkConfigList& config) const
{
    cni::NetworkConfig conf;

    if (auto err = mRegistry.GetDefaultConfig(name, conf); !err.IsNone()) {
        if (err.Is(ErrorEnum::eNotSupported)) {
            return UnsupportedError(name);
        }

        return err;
    }

    auto path = fs::JoinPath(mConfDir, "10-" + name + ".conf");
    auto err  = fs::CreateFileExclusive(path, common::utils::WriteJson(conf.mRaw, "  "), GENIE_CONFIG_CNI_CONF_PERM);

    if (err.Is(ErrorEnum::eAlreadyExist)) {
        LOG_DBG() << "Default config already created" << Log::Field("path", path);

        if (err = cni::LoadNetworkConfigList(path, config); !err.IsNone()) {
            return Error(err.Value(), "invalid config " + path + ": " + err.Message());
        }

        return ErrorEnum::eNone;
    }

    if (!err.IsNone()) {
        return Error(err.Value(), "can't write default config " + path + ": " + err.Message());
    }

    LOG_INF() << "Default config placed" << Log::Field("name", name) << Log::Field("path", path);

    config             = cni::ConfListFromConf(conf);
    config.mSourcePath = path;

    return ErrorEnum::eNone;
}

Error ConfigResolver::UnsupportedError(const std::string& name) const
{
    auto known = utils::JoinStrings(mRegistry.GetKnownBackends(), ", ");

    return Error(ErrorEnum::eNotSupported, "unsupported plugin type " + name + ", only supported are (" + known + ")");
}

} // namespace genie::configresolver
