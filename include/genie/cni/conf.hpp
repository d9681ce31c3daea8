/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_CNI_CONF_HPP_
#define GENIE_CNI_CONF_HPP_

#include <string>

#include "genie/cni/cni.hpp"

namespace genie::cni {

/**
 * Parses single plugin configuration. Type is mandatory.
 *
 * @param data json data.
 * @param[out] conf plugin configuration.
 * @return Error.
 */
Error ParseNetworkConfig(const std::string& data, NetworkConfig& conf);

/**
 * Parses configuration list. At least one plugin is mandatory.
 *
 * @param data json data.
 * @param[out] list configuration list.
 * @return Error.
 */
Error ParseNetworkConfigList(const std::string& data, NetworkConfigList& list);

/**
 * Converts single plugin configuration to configuration list.
 *
 * @param conf plugin configuration.
 * @return NetworkConfigList.
 */
NetworkConfigList ConfListFromConf(const NetworkConfig& conf);

/**
 * Loads configuration list from file. Files with .conflist suffix are parsed as lists, others as single
 * configurations.
 *
 * @param path file path.
 * @param[out] list configuration list.
 * @return Error.
 */
Error LoadNetworkConfigList(const std::string& path, NetworkConfigList& list);

} // namespace genie::cni

#endif
