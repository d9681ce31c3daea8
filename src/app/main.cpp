/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <mutex>

#include "genie/backendselector.hpp"
#include "genie/cni/cni.hpp"
#include "genie/cni/exec.hpp"
#include "genie/cni/result.hpp"
#include "genie/common/utils/http.hpp"
#include "genie/common/utils/json.hpp"
#include "genie/config.hpp"
#include "genie/configresolver.hpp"
#include "genie/controller.hpp"
#include "genie/kubeclient.hpp"
#include "genie/netconf.hpp"
#include "genie/ranking.hpp"

#include "log.hpp"

namespace {

/***********************************************************************************************************************
 * Consts
 **********************************************************************************************************************/

constexpr const char* cSupportedVersions[] = {"0.1.0", "0.2.0", "0.3.0", "0.3.1", "0.4.0", "1.0.0"};

constexpr auto cErrCodeInvalidEnv      = 4;
constexpr auto cErrCodeDecodingFailure = 6;
constexpr auto cErrCodeInvalidConfig   = 7;
constexpr auto cErrCodeGeneric         = 999;

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

struct CNIError {
    int          mCode;
    genie::Error mError;
};

genie::LogLevel sLogLevel = genie::LogLevelEnum::eInfo;

void InitLog()
{
    static std::mutex sLogMutex;

    genie::Log::SetCallback([](genie::LogModule module, genie::LogLevel level, const std::string& message) {
        if (level.GetValue() < sLogLevel.GetValue()) {
            return;
        }

        std::lock_guard lock {sLogMutex};

        std::cerr << "genie " << level << " [" << module << "] " << message << std::endl;
    });
}

std::string GetEnv(const char* name)
{
    const char* value = std::getenv(name);

    return value ? value : "";
}

int ExitWithError(const std::string& version, const CNIError& cniErr)
{
    LOG_ERR() << "Command failed" << genie::Log::Field("code", cniErr.mCode) << genie::Log::Field(cniErr.mError);

    std::cout << genie::common::utils::WriteJson(
        genie::cni::ErrorToJSON(version, cniErr.mCode, cniErr.mError.Message()), "  ")
              << std::endl;

    return EXIT_FAILURE;
}

CNIError InvalidEnvError(const std::string& message)
{
    return CNIError {cErrCodeInvalidEnv, genie::Error(genie::ErrorEnum::eInvalidArgument, message)};
}

int ToCNICode(const genie::Error& err)
{
    if (err.Is(genie::ErrorEnum::eNotSupported) || err.Is(genie::ErrorEnum::eNotFound)) {
        return cErrCodeInvalidConfig;
    }

    return cErrCodeGeneric;
}

int CmdVersion(const std::string& data)
{
    genie::netconf::NetConf conf;

    // VERSION may come without configuration.
    if (auto err = genie::netconf::ParseNetConf(data, conf); !err.IsNone()) {
        conf.mCNIVersion = GENIE_CONFIG_DEFAULT_CNI_VERSION;
    }

    Json::Value json(Json::objectValue);

    json["cniVersion"] = conf.mCNIVersion.empty() ? GENIE_CONFIG_DEFAULT_CNI_VERSION : conf.mCNIVersion;
    json["supportedVersions"] = Json::Value(Json::arrayValue);

    for (const auto& version : cSupportedVersions) {
        json["supportedVersions"].append(version);
    }

    std::cout << genie::common::utils::WriteJson(json, "  ") << std::endl;

    return EXIT_SUCCESS;
}

int CmdAddDel(const std::string& command, const std::string& data)
{
    genie::netconf::NetConf conf;

    if (auto err = genie::netconf::ParseNetConf(data, conf); !err.IsNone()) {
        return ExitWithError(GENIE_CONFIG_DEFAULT_CNI_VERSION, CNIError {cErrCodeDecodingFailure, err});
    }

    if (!conf.mLogLevel.empty() && !sLogLevel.FromString(conf.mLogLevel)) {
        LOG_WRN() << "Unknown log level" << genie::Log::Field("level", conf.mLogLevel);
    }

    genie::netconf::CNIArgs args {GetEnv("CNI_CONTAINERID"), GetEnv("CNI_NETNS"), GetEnv("CNI_IFNAME"),
        GetEnv("CNI_ARGS"), GetEnv("CNI_PATH")};

    if (args.mContainerID.empty()) {
        return ExitWithError(conf.mCNIVersion, InvalidEnvError("CNI_CONTAINERID not set"));
    }

    if (command == "ADD" && args.mNetNS.empty()) {
        return ExitWithError(conf.mCNIVersion, InvalidEnvError("CNI_NETNS not set"));
    }

    auto binDirs = genie::netconf::GetBinDirs(conf, args);

    genie::common::utils::CurlHTTPClient    httpClient;
    genie::cni::Exec                        exec;
    genie::cni::CNI                         cni;
    genie::configresolver::ConfigResolver   resolver;
    genie::kubeclient::KubeClient           kubeClient;
    genie::ranking::BandwidthRanking        ranking;
    genie::backendselector::BackendSelector selector;
    genie::controller::Controller           controller;

    auto err = cni.Init(exec, binDirs);

    if (err.IsNone()) {
        err = resolver.Init(genie::netconf::GetConfDir(conf), binDirs);
    }

    if (err.IsNone()) {
        err = kubeClient.Init(conf, httpClient);
    }

    if (err.IsNone()) {
        err = ranking.Init(conf.mRankingURL, httpClient);
    }

    if (err.IsNone()) {
        err = controller.Init(resolver, cni, selector, kubeClient, ranking);
    }

    if (!err.IsNone()) {
        return ExitWithError(conf.mCNIVersion, CNIError {cErrCodeGeneric, err});
    }

    if (command == "DEL") {
        if (err = controller.DeletePodNetwork(args, conf); !err.IsNone()) {
            return ExitWithError(conf.mCNIVersion, CNIError {ToCNICode(err), err});
        }

        return EXIT_SUCCESS;
    }

    genie::cni::Result result;

    if (err = controller.AddPodNetwork(args, conf, result); !err.IsNone()) {
        return ExitWithError(conf.mCNIVersion, CNIError {ToCNICode(err), err});
    }

    auto version = conf.mCNIVersion.empty() ? GENIE_CONFIG_DEFAULT_CNI_VERSION : conf.mCNIVersion;

    std::cout << genie::common::utils::WriteJson(genie::cni::ResultToJSON(result, version), "  ") << std::endl;

    return EXIT_SUCCESS;
}

} // namespace

/***********************************************************************************************************************
 * Main
 **********************************************************************************************************************/

int main()
{
    std::signal(SIGPIPE, SIG_IGN);

    InitLog();

    auto command = GetEnv("CNI_COMMAND");

    std::string data {std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};

    LOG_DBG() << "Run command" << genie::Log::Field("command", command);

    if (command == "VERSION") {
        return CmdVersion(data);
    }

    if (command == "ADD" || command == "DEL") {
        return CmdAddDel(command, data);
    }

    return ExitWithError(GENIE_CONFIG_DEFAULT_CNI_VERSION, InvalidEnvError("unknown CNI_COMMAND: " + command));
}
