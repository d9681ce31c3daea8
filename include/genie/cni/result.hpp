/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_CNI_RESULT_HPP_
#define GENIE_CNI_RESULT_HPP_

#include <string>

#include <json/json.h>

#include "genie/cni/cni.hpp"

namespace genie::cni {

/**
 * Parses plugin result. Legacy ip4/ip6 results are converted to the current layout.
 *
 * @param json parsed json.
 * @param[out] result result.
 * @return Error.
 */
Error ParseResult(const Json::Value& json, Result& result);

/**
 * Parses plugin result.
 *
 * @param data json data.
 * @param[out] result result.
 * @return Error.
 */
Error ParseResult(const std::string& data, Result& result);

/**
 * Converts result to json.
 *
 * IP entries carry the version field only for cniVersion below 1.0.0.
 *
 * @param result result.
 * @param version cniVersion to report, result version is used if empty.
 * @return Json::Value.
 */
Json::Value ResultToJSON(const Result& result, const std::string& version = "");

/**
 * Checks if json is a CNI error object and converts it.
 *
 * @param json parsed json.
 * @param[out] code error code.
 * @param[out] message error message including details.
 * @return bool.
 */
bool ParseErrorObject(const Json::Value& json, int& code, std::string& message);

/**
 * Creates CNI error object.
 *
 * @param version cniVersion.
 * @param code error code.
 * @param message error message.
 * @return Json::Value.
 */
Json::Value ErrorToJSON(const std::string& version, int code, const std::string& message);

} // namespace genie::cni

#endif
