/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_CNI_CNI_HPP_
#define GENIE_CNI_CNI_HPP_

#include <string>
#include <vector>

#include <json/json.h>

#include "genie/cni/exec.hpp"
#include "genie/common/tools/enum.hpp"
#include "genie/common/tools/error.hpp"

namespace genie::cni {

/**
 * Latest supported CNI version.
 */
constexpr auto cVersion = "1.0.0";

/**
 * Network route.
 */
struct Route {
    std::string mDst;
    std::string mGW;

    bool operator==(const Route& other) const { return mDst == other.mDst && mGW == other.mGW; }
};

/**
 * IP assignment.
 */
struct IPs {
    std::string mVersion;
    int         mInterface = -1;
    std::string mAddress;
    std::string mGateway;

    bool operator==(const IPs& other) const
    {
        return mVersion == other.mVersion && mInterface == other.mInterface && mAddress == other.mAddress
            && mGateway == other.mGateway;
    }
};

/**
 * Interface information.
 */
struct Interface {
    std::string mName;
    std::string mMac;
    std::string mSandbox;

    bool operator==(const Interface& other) const
    {
        return mName == other.mName && mMac == other.mMac && mSandbox == other.mSandbox;
    }
};

/**
 * DNS configuration.
 */
struct DNS {
    std::vector<std::string> mNameservers;
    std::string              mDomain;
    std::vector<std::string> mSearch;
    std::vector<std::string> mOptions;
};

/**
 * Result of a CNI operation.
 */
struct Result {
    std::string            mVersion;
    std::vector<Interface> mInterfaces;
    std::vector<IPs>       mIPs;
    std::vector<Route>     mRoutes;
    DNS                    mDNS;

    /**
     * Checks if result has no version and no entries.
     *
     * @return bool.
     */
    bool IsEmpty() const
    {
        return mVersion.empty() && mInterfaces.empty() && mIPs.empty() && mRoutes.empty()
            && mDNS.mNameservers.empty() && mDNS.mDomain.empty() && mDNS.mSearch.empty() && mDNS.mOptions.empty();
    }
};

/**
 * Runtime argument.
 */
struct Arg {
    std::string mName;
    std::string mValue;

    bool operator==(const Arg& other) const { return mName == other.mName && mValue == other.mValue; }
};

/**
 * Runtime configuration parameters.
 */
struct RuntimeConf {
    std::string      mContainerID;
    std::string      mNetNS;
    std::string      mIfName;
    std::vector<Arg> mArgs;
};

/**
 * Single plugin configuration fragment.
 */
struct NetworkConfig {
    Json::Value mRaw {Json::objectValue};

    /**
     * Returns plugin type.
     *
     * @return std::string.
     */
    std::string GetType() const;

    /**
     * Returns network name.
     *
     * @return std::string.
     */
    std::string GetName() const;

    /**
     * Sets IPAM subnet creating ipam object if absent.
     *
     * @param subnet subnet.
     * @return Error eInvalidArgument if ipam exists and is not an object.
     */
    Error SetIPAMSubnet(const std::string& subnet);
};

/**
 * Ordered chain of plugin configurations of one network.
 */
struct NetworkConfigList {
    std::string                mVersion;
    std::string                mName;
    std::vector<NetworkConfig> mPlugins;
    std::string                mSourcePath;

    /**
     * Returns type of the first plugin.
     *
     * @return std::string.
     */
    std::string GetType() const { return mPlugins.empty() ? std::string() : mPlugins.front().GetType(); }
};

/**
 * CNI interface.
 */
class CNIItf {
public:
    /**
     * Destructor.
     */
    virtual ~CNIItf() = default;

    /**
     * Executes a sequence of plugins with the ADD command.
     *
     * @param net list of network configurations.
     * @param rt runtime configuration parameters.
     * @param[out] result result of the operation.
     * @return Error.
     */
    virtual Error AddNetworkList(const NetworkConfigList& net, const RuntimeConf& rt, Result& result) = 0;

    /**
     * Executes a sequence of plugins with the DEL command.
     *
     * @param net list of network configurations.
     * @param rt runtime configuration parameters.
     * @return Error.
     */
    virtual Error DeleteNetworkList(const NetworkConfigList& net, const RuntimeConf& rt) = 0;
};

/**
 * CNI plugin protocol driver.
 */
class CNI : public CNIItf {
public:
    /**
     * Initializes CNI.
     *
     * @param exec exec interface.
     * @param binDirs plugin binary search path.
     * @return Error.
     */
    Error Init(ExecItf& exec, const std::vector<std::string>& binDirs);

    /**
     * Executes a sequence of plugins with the ADD command.
     *
     * @param net list of network configurations.
     * @param rt runtime configuration parameters.
     * @param[out] result result of the operation.
     * @return Error.
     */
    Error AddNetworkList(const NetworkConfigList& net, const RuntimeConf& rt, Result& result) override;

    /**
     * Executes a sequence of plugins with the DEL command.
     *
     * @param net list of network configurations.
     * @param rt runtime configuration parameters.
     * @return Error.
     */
    Error DeleteNetworkList(const NetworkConfigList& net, const RuntimeConf& rt) override;

private:
    class ActionType {
    public:
        enum class Enum { eAdd, eDel };

        static const std::vector<std::string>& GetStrings()
        {
            static const std::vector<std::string> sActionStrings = {"ADD", "DEL"};

            return sActionStrings;
        };
    };

    using ActionEnum = ActionType::Enum;
    using Action     = EnumStringer<ActionType>;

    RetWithError<std::string> ExecutePlugin(const NetworkConfigList& net, const NetworkConfig& plugin,
        const RuntimeConf& rt, const Json::Value& prevResult, Action action);
    RetWithError<std::string> FindPlugin(const std::string& type) const;
    std::string               AddCNIData(const NetworkConfigList& net, const NetworkConfig& plugin,
                      const Json::Value& prevResult) const;
    std::vector<std::string>  CreateEnv(const RuntimeConf& rt, Action action) const;
    std::string               ArgsAsString(const RuntimeConf& rt) const;

    ExecItf*                 mExec {};
    std::vector<std::string> mBinDirs;
};

} // namespace genie::cni

#endif
