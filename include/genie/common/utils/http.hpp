/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_COMMON_UTILS_HTTP_HPP_
#define GENIE_COMMON_UTILS_HTTP_HPP_

#include <string>
#include <vector>

#include "genie/common/tools/error.hpp"

namespace genie::common::utils {

/**
 * HTTP request.
 */
struct HTTPRequest {
    std::string              mMethod = "GET";
    std::string              mURL;
    std::vector<std::string> mHeaders;
    std::string              mBody;
    std::string              mCAFile;
    std::string              mCertFile;
    std::string              mKeyFile;
    std::string              mBearerToken;
    long                     mTimeoutSec = 0;
};

/**
 * HTTP response.
 */
struct HTTPResponse {
    long        mStatus = 0;
    std::string mBody;

    /**
     * Checks if status is 2xx.
     *
     * @return bool.
     */
    bool IsSuccess() const { return mStatus >= 200 && mStatus < 300; }
};

/**
 * HTTP client interface.
 */
class HTTPClientItf {
public:
    /**
     * Destructor.
     */
    virtual ~HTTPClientItf() = default;

    /**
     * Performs HTTP request. Non 2xx status is not an error of this call.
     *
     * @param request request.
     * @param[out] response response.
     * @return Error.
     */
    virtual Error Do(const HTTPRequest& request, HTTPResponse& response) = 0;
};

/**
 * libcurl based HTTP client.
 */
class CurlHTTPClient : public HTTPClientItf {
public:
    /**
     * Constructor.
     */
    CurlHTTPClient();

    /**
     * Destructor.
     */
    ~CurlHTTPClient();

    CurlHTTPClient(const CurlHTTPClient&)            = delete;
    CurlHTTPClient& operator=(const CurlHTTPClient&) = delete;

    /**
     * Performs HTTP request.
     *
     * @param request request.
     * @param[out] response response.
     * @return Error.
     */
    Error Do(const HTTPRequest& request, HTTPResponse& response) override;
};

} // namespace genie::common::utils

#endif
