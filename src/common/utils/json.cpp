/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <memory>
#include <sstream>

#include "genie/common/utils/json.hpp"

namespace genie::common::utils {

RetWithError<Json::Value> ParseJson(const std::string& json)
{
    Json::CharReaderBuilder builder;
    Json::Value             root;
    std::string             errs;

    builder["collectComments"] = false;

    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errs)) {
        return {Json::Value(), Error(ErrorEnum::eInvalidArgument, "can't parse json: " + errs)};
    }

    return root;
}

std::string WriteJson(const Json::Value& value, const std::string& indent)
{
    Json::StreamWriterBuilder builder;

    builder["indentation"] = indent;

    return Json::writeString(builder, value);
}

std::string GetString(const Json::Value& object, const char* key, const std::string& defaultValue)
{
    if (!object.isObject() || !object.isMember(key) || !object[key].isString()) {
        return defaultValue;
    }

    return object[key].asString();
}

int GetInt(const Json::Value& object, const char* key, int defaultValue)
{
    if (!object.isObject() || !object.isMember(key) || !object[key].isInt()) {
        return defaultValue;
    }

    return object[key].asInt();
}

std::vector<std::string> GetStringArray(const Json::Value& object, const char* key)
{
    std::vector<std::string> result;

    if (!object.isObject() || !object.isMember(key) || !object[key].isArray()) {
        return result;
    }

    for (const auto& item : object[key]) {
        if (item.isString()) {
            result.push_back(item.asString());
        }
    }

    return result;
}

Json::Value ToJsonArray(const std::vector<std::string>& items)
{
    Json::Value array(Json::arrayValue);

    for (const auto& item : items) {
        array.append(item);
    }

    return array;
}

} // namespace genie::common::utils
