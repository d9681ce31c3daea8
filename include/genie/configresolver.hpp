/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_CONFIGRESOLVER_HPP_
#define GENIE_CONFIGRESOLVER_HPP_

#include <string>
#include <vector>

#include "genie/cni/cni.hpp"
#include "genie/common/tools/error.hpp"

namespace genie::configresolver {

/**
 * Known backends with their binaries and default configurations.
 */
class BackendRegistry {
public:
    /**
     * Backend description.
     */
    struct BackendInfo {
        std::string mBinary;
        std::string mDefaultConfig;
    };

    /**
     * Creates registry with recognized backends.
     */
    BackendRegistry();

    /**
     * Registers backend.
     *
     * @param name backend name.
     * @param info backend description, empty default config means backend can't be synthesized.
     */
    void Register(const std::string& name, const BackendInfo& info);

    /**
     * Returns binary name of backend. Unknown backends use their own name.
     *
     * @param name backend name.
     * @return std::string.
     */
    std::string BinaryName(const std::string& name) const;

    /**
     * Creates default configuration of backend.
     *
     * @param name backend name.
     * @param[out] conf default configuration.
     * @return Error eNotSupported if backend can't be synthesized.
     */
    Error GetDefaultConfig(const std::string& name, cni::NetworkConfig& conf) const;

    /**
     * Checks if configuration file belongs to backend.
     *
     * @param name backend name.
     * @param fileName configuration file name.
     * @param list parsed configuration.
     * @return bool.
     */
    bool Matches(const std::string& name, const std::string& fileName, const cni::NetworkConfigList& list) const;

    /**
     * Returns recognized backend names.
     *
     * @return std::vector<std::string>.
     */
    std::vector<std::string> GetKnownBackends() const;

private:
    std::vector<std::pair<std::string, BackendInfo>> mBackends;
};

/**
 * Config resolver interface.
 */
class ConfigResolverItf {
public:
    /**
     * Destructor.
     */
    virtual ~ConfigResolverItf() = default;

    /**
     * Locates or synthesizes backend configuration.
     *
     * @param name backend name.
     * @param subnet subnet override, empty for none.
     * @param[out] config backend configuration.
     * @return Error.
     */
    virtual Error Resolve(const std::string& name, const std::string& subnet, cni::NetworkConfigList& config) = 0;
};

/**
 * Config resolver.
 */
class ConfigResolver : public ConfigResolverItf {
public:
    /**
     * Initializes config resolver.
     *
     * @param confDir backend configuration directory.
     * @param binDirs backend binary directories.
     * @param registry backend registry.
     * @return Error.
     */
    Error Init(const std::string& confDir, const std::vector<std::string>& binDirs,
        const BackendRegistry& registry = BackendRegistry());

    /**
     * Locates or synthesizes backend configuration.
     *
     * @param name backend name.
     * @param subnet subnet override, empty for none.
     * @param[out] config backend configuration.
     * @return Error.
     */
    Error Resolve(const std::string& name, const std::string& subnet, cni::NetworkConfigList& config) override;

private:
    static constexpr auto cGenieType = "genie";

    RetWithError<bool> FindConfig(const std::string& name, cni::NetworkConfigList& config) const;
    Error              CheckBinary(const std::string& name) const;
    Error              CreateConfig(const std::string& name, cni::NetworkConfigList& config) const;
    Error              UnsupportedError(const std::string& name) const;

    std::string              mConfDir;
    std::vector<std::string> mBinDirs;
    BackendRegistry          mRegistry;
};

} // namespace genie::configresolver

#endif
