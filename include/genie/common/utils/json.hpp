/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_COMMON_UTILS_JSON_HPP_
#define GENIE_COMMON_UTILS_JSON_HPP_

#include <functional>
#include <string>
#include <vector>

#include <json/json.h>

#include "genie/common/tools/error.hpp"

namespace genie::common::utils {

/**
 * Parses json string.
 *
 * @param json json string.
 * @return RetWithError<Json::Value>.
 */
RetWithError<Json::Value> ParseJson(const std::string& json);

/**
 * Serializes json value.
 *
 * @param value json value.
 * @param indent indentation string, empty for compact output.
 * @return std::string.
 */
std::string WriteJson(const Json::Value& value, const std::string& indent = "");

/**
 * Returns string member of json object or default value if member is absent or not a string.
 *
 * @param object json object.
 * @param key member key.
 * @param defaultValue default value.
 * @return std::string.
 */
std::string GetString(const Json::Value& object, const char* key, const std::string& defaultValue = "");

/**
 * Returns int member of json object or default value if member is absent or not an int.
 *
 * @param object json object.
 * @param key member key.
 * @param defaultValue default value.
 * @return int.
 */
int GetInt(const Json::Value& object, const char* key, int defaultValue = 0);

/**
 * Returns array of strings stored under key. Non string items are skipped.
 *
 * @param object json object.
 * @param key member key.
 * @return std::vector<std::string>.
 */
std::vector<std::string> GetStringArray(const Json::Value& object, const char* key);

/**
 * Converts array stored under key using converter.
 *
 * @param object json object.
 * @param key member key.
 * @param converter item converter.
 * @return std::vector<T>.
 */
template <typename T>
std::vector<T> GetArrayValue(
    const Json::Value& object, const char* key, const std::function<T(const Json::Value&)>& converter)
{
    std::vector<T> result;

    if (!object.isObject() || !object.isMember(key) || !object[key].isArray()) {
        return result;
    }

    for (const auto& item : object[key]) {
        result.push_back(converter(item));
    }

    return result;
}

/**
 * Converts string vector to json array.
 *
 * @param items items.
 * @return Json::Value.
 */
Json::Value ToJsonArray(const std::vector<std::string>& items);

} // namespace genie::common::utils

#endif
