/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>

#include "genie/resultmerger.hpp"

#include "log.hpp"

namespace genie::resultmerger {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

template <typename T>
void Append(const std::vector<T>& src, std::vector<T>& dst)
{
    dst.insert(dst.end(), src.begin(), src.end());
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

Error ResultMerger::Repair(cni::Result& result) const
{
    if (!result.mRoutes.empty()) {
        auto gwIt = std::find_if(
            result.mIPs.begin(), result.mIPs.end(), [](const cni::IPs& ip) { return !ip.mGateway.empty(); });

        for (auto& route : result.mRoutes) {
            if (!route.mGW.empty()) {
                continue;
            }

            if (gwIt == result.mIPs.end()) {
                return GENIE_ERROR_WRAP(
                    Error(ErrorEnum::eInconsistentResult, "couldn't find gateway for route " + route.mDst));
            }

            LOG_DBG() << "Set route gateway" << Log::Field("dst", route.mDst) << Log::Field("gw", gwIt->mGateway);

            route.mGW = gwIt->mGateway;
        }
    }

    // Some backends report owned IPs at index 0 without reporting the interface.
    if (result.mInterfaces.empty()) {
        for (auto& ip : result.mIPs) {
            if (ip.mInterface != -1) {
                LOG_DBG() << "Detach IP from missing interface" << Log::Field("address", ip.mAddress)
                          << Log::Field("interface", ip.mInterface);

                ip.mInterface = -1;
            }
        }
    }

    return ErrorEnum::eNone;
}

Error ResultMerger::Merge(const cni::Result& src, cni::Result& dst) const
{
    if (dst.IsEmpty()) {
        dst = src;

        return ErrorEnum::eNone;
    }

    auto ifacesLength = static_cast<int>(dst.mInterfaces.size());

    LOG_DBG() << "Merge result" << Log::Field("interfaces", src.mInterfaces.size())
              << Log::Field("offset", ifacesLength);

    Append(src.mInterfaces, dst.mInterfaces);

    for (auto ip : src.mIPs) {
        if (ip.mInterface != -1) {
            ip.mInterface += ifacesLength;
        }

        dst.mIPs.push_back(ip);
    }

    Append(src.mRoutes, dst.mRoutes);
    Append(src.mDNS.mNameservers, dst.mDNS.mNameservers);
    Append(src.mDNS.mSearch, dst.mDNS.mSearch);
    Append(src.mDNS.mOptions, dst.mDNS.mOptions);

    if (dst.mDNS.mDomain.empty()) {
        dst.mDNS.mDomain = src.mDNS.mDomain;
    }

    if (dst.mVersion.empty()) {
        dst.mVersion = src.mVersion;
    }

    return ErrorEnum::eNone;
}

} // namespace genie::resultmerger
