/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_CONFIGRESOLVER_MOCK_HPP_
#define GENIE_CONFIGRESOLVER_MOCK_HPP_

#include <gmock/gmock.h>

#include "genie/configresolver.hpp"

namespace genie::configresolver {

class ConfigResolverMock : public ConfigResolverItf {
public:
    MOCK_METHOD(Error, Resolve, (const std::string& name, const std::string& subnet, cni::NetworkConfigList& config),
        (override));
};

} // namespace genie::configresolver

#endif
