/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_RANKING_HPP_
#define GENIE_RANKING_HPP_

#include <string>

#include "genie/common/tools/error.hpp"
#include "genie/common/utils/http.hpp"

namespace genie::ranking {

/**
 * Backend ranking interface.
 */
class RankingClientItf {
public:
    /**
     * Destructor.
     */
    virtual ~RankingClientItf() = default;

    /**
     * Returns best ranked backend.
     *
     * @param[out] name backend name.
     * @return Error.
     */
    virtual Error GetBestBackend(std::string& name) = 0;
};

/**
 * Ranks backends by observed network bandwidth.
 */
class BandwidthRanking : public RankingClientItf {
public:
    /**
     * Initializes ranking client.
     *
     * @param url ranking service URL.
     * @param httpClient HTTP client.
     * @return Error.
     */
    Error Init(const std::string& url, common::utils::HTTPClientItf& httpClient);

    /**
     * Returns backend ranked best by the service.
     *
     * The service answers with a plain backend name, a JSON string or a JSON list of {"name", "bandwidth"}
     * entries. For a list the highest bandwidth wins.
     *
     * @param[out] name backend name.
     * @return Error.
     */
    Error GetBestBackend(std::string& name) override;

private:
    static constexpr auto cBackendsPath = "/api/v1/cns";

    std::string                   mURL;
    common::utils::HTTPClientItf* mHTTPClient {};
};

} // namespace genie::ranking

#endif
