/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <curl/curl.h>

#include "genie/common/tools/utils.hpp"
#include "genie/common/utils/http.hpp"

namespace genie::common::utils {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

size_t WriteCallback(char* data, size_t size, size_t count, void* userData)
{
    auto body = static_cast<std::string*>(userData);

    body->append(data, size * count);

    return size * count;
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

CurlHTTPClient::CurlHTTPClient()
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHTTPClient::~CurlHTTPClient()
{
    curl_global_cleanup();
}

Error CurlHTTPClient::Do(const HTTPRequest& request, HTTPResponse& response)
{
    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        return Error(ErrorEnum::eFailed, "can't init curl");
    }

    struct curl_slist* headers = nullptr;

    DeferRelease release([&]() {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
    });

    for (const auto& header : request.mHeaders) {
        headers = curl_slist_append(headers, header.c_str());
    }

    std::string authHeader;

    if (!request.mBearerToken.empty()) {
        authHeader = "Authorization: Bearer " + request.mBearerToken;
        headers    = curl_slist_append(headers, authHeader.c_str());
    }

    response.mBody.clear();

    curl_easy_setopt(curl, CURLOPT_URL, request.mURL.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.mMethod.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.mBody);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (!request.mBody.empty()) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.mBody.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.mBody.size()));
    }

    if (request.mTimeoutSec > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, request.mTimeoutSec);
    }

    if (!request.mCAFile.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, request.mCAFile.c_str());
    }

    if (!request.mCertFile.empty()) {
        curl_easy_setopt(curl, CURLOPT_SSLCERT, request.mCertFile.c_str());
    }

    if (!request.mKeyFile.empty()) {
        curl_easy_setopt(curl, CURLOPT_SSLKEY, request.mKeyFile.c_str());
    }

    if (auto res = curl_easy_perform(curl); res != CURLE_OK) {
        auto errorEnum = res == CURLE_OPERATION_TIMEDOUT ? ErrorEnum::eTimeout : ErrorEnum::eFailed;

        return Error(errorEnum, request.mMethod + " " + request.mURL + ": " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.mStatus);

    return ErrorEnum::eNone;
}

} // namespace genie::common::utils
