/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <cctype>

#include "genie/common/tools/utils.hpp"
#include "genie/common/utils/exception.hpp"
#include "genie/common/utils/json.hpp"
#include "genie/config.hpp"
#include "genie/ranking.hpp"

#include "log.hpp"

namespace genie::ranking {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

bool IsValidName(const std::string& name)
{
    return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.';
    });
}

std::string ParseRankedList(const Json::Value& json)
{
    std::string best;
    double      bestBandwidth = 0;

    for (const auto& item : json) {
        auto backend = common::utils::GetString(item, "name");

        if (!IsValidName(backend) || !item["bandwidth"].isNumeric()) {
            GENIE_ERROR_CHECK_AND_THROW("invalid entry", ErrorEnum::eInvalidArgument);
        }

        auto bandwidth = item["bandwidth"].asDouble();

        LOG_DBG() << "Backend rank" << Log::Field("name", backend) << Log::Field("bandwidth", bandwidth);

        if (best.empty() || bandwidth > bestBandwidth) {
            best          = backend;
            bestBandwidth = bandwidth;
        }
    }

    if (best.empty()) {
        GENIE_ERROR_CHECK_AND_THROW("no backends", ErrorEnum::eNotFound);
    }

    return best;
}

// Body is a plain backend name, a JSON string or a JSON array of {"name", "bandwidth"} entries.
Error ParseResponse(const std::string& body, std::string& name)
{
    if (body.empty()) {
        return Error(ErrorEnum::eInvalidArgument, "empty body");
    }

    if (body.front() != '"' && body.front() != '[') {
        if (!IsValidName(body)) {
            return Error(ErrorEnum::eInvalidArgument, "invalid backend name");
        }

        name = body;

        return ErrorEnum::eNone;
    }

    try {
        auto [json, err] = common::utils::ParseJson(body);
        GENIE_ERROR_CHECK_AND_THROW("can't parse json", err);

        if (json.isArray()) {
            name = ParseRankedList(json);

            return ErrorEnum::eNone;
        }

        auto value = utils::TrimSpace(json.asString());

        if (!IsValidName(value)) {
            GENIE_ERROR_CHECK_AND_THROW("invalid backend name", ErrorEnum::eInvalidArgument);
        }

        name = value;
    } catch (const std::exception& e) {
        return common::utils::ToGenieError(e, ErrorEnum::eInvalidArgument);
    }

    return ErrorEnum::eNone;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error BandwidthRanking::Init(const std::string& url, common::utils::HTTPClientItf& httpClient)
{
    mURL        = url.empty() ? GENIE_CONFIG_RANKING_URL : url;
    mHTTPClient = &httpClient;

    while (!mURL.empty() && mURL.back() == '/') {
        mURL.pop_back();
    }

    LOG_DBG() << "Init bandwidth ranking" << Log::Field("url", mURL);

    return ErrorEnum::eNone;
}

Error BandwidthRanking::GetBestBackend(std::string& name)
{
    common::utils::HTTPRequest  request;
    common::utils::HTTPResponse response;

    request.mURL        = mURL + cBackendsPath;
    request.mTimeoutSec = GENIE_CONFIG_HTTP_TIMEOUT_SEC;
    request.mHeaders.push_back("Accept: text/plain, application/json");

    if (auto err = mHTTPClient->Do(request, response); !err.IsNone()) {
        return GENIE_ERROR_WRAP(Error(err.Value(), "can't query ranking service: " + err.Message()));
    }

    if (!response.IsSuccess()) {
        return GENIE_ERROR_WRAP(
            Error(ErrorEnum::eFailed, "ranking service returned status " + std::to_string(response.mStatus)));
    }

    std::string best;

    if (auto err = ParseResponse(utils::TrimSpace(response.mBody), best); !err.IsNone()) {
        return GENIE_ERROR_WRAP(Error(err.Value(), "malformed ranking response: " + err.Message()));
    }

    name = best;

    LOG_INF() << "Best ranked backend" << Log::Field("name", name);

    return ErrorEnum::eNone;
}

} // namespace genie::ranking
