/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_RANKING_LOG_HPP_
#define GENIE_RANKING_LOG_HPP_

#include "genie/common/tools/log.hpp"

#define LOG_DBG() LOG_MODULE_DBG(genie::LogModuleEnum::eRanking)
#define LOG_INF() LOG_MODULE_INF(genie::LogModuleEnum::eRanking)
#define LOG_WRN() LOG_MODULE_WRN(genie::LogModuleEnum::eRanking)
#define LOG_ERR() LOG_MODULE_ERR(genie::LogModuleEnum::eRanking)

#endif
