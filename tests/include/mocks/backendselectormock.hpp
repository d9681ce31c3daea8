/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_BACKENDSELECTOR_MOCK_HPP_
#define GENIE_BACKENDSELECTOR_MOCK_HPP_

#include <gmock/gmock.h>

#include "genie/backendselector.hpp"

namespace genie::backendselector {

class BackendSelectorMock : public BackendSelectorItf {
public:
    MOCK_METHOD(Error, Select, (const SelectionContext& ctx, SelectionResult& result), (override));
};

} // namespace genie::backendselector

#endif
