/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_CONFIGRESOLVER_LOG_HPP_
#define GENIE_CONFIGRESOLVER_LOG_HPP_

#include "genie/common/tools/log.hpp"

#define LOG_DBG() LOG_MODULE_DBG(genie::LogModuleEnum::eConfigResolver)
#define LOG_INF() LOG_MODULE_INF(genie::LogModuleEnum::eConfigResolver)
#define LOG_WRN() LOG_MODULE_WRN(genie::LogModuleEnum::eConfigResolver)
#define LOG_ERR() LOG_MODULE_ERR(genie::LogModuleEnum::eConfigResolver)

#endif
