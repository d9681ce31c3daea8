/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_COMMON_TYPES_HPP_
#define GENIE_COMMON_TYPES_HPP_

#include <map>
#include <string>
#include <vector>

#include "genie/common/tools/error.hpp"

namespace genie {

/**
 * Annotation with explicit comma separated backend list.
 */
constexpr auto cCNIAnnotation = "cni";

/**
 * Annotation with structured per-network list.
 */
constexpr auto cNetworksAnnotation = "networks";

/**
 * Annotation with multi IP record.
 */
constexpr auto cMultiIPPreferencesAnnotation = "multi-ip-preferences";

/**
 * Workload annotations.
 */
using Annotations = std::map<std::string, std::string>;

/**
 * Identity of the workload being attached.
 *
 * Orchestrated mode: namespace and name are set. Standalone mode: only container ID is set.
 */
struct WorkloadIdentity {
    std::string mNamespace;
    std::string mName;
    std::string mContainerID;
    std::string mNetNS;
    std::string mIfName;
    std::string mInfraContainerID;
    bool        mIgnoreUnknown = false;

    /**
     * Checks if workload is managed by orchestrator.
     *
     * @return bool.
     */
    bool IsOrchestrated() const { return !mNamespace.empty() && !mName.empty(); }
};

/**
 * Chosen backend with its parameters.
 */
struct BackendSelection {
    std::string mName;
    std::string mIfName;
    std::string mSubnet;

    bool operator==(const BackendSelection& other) const
    {
        return mName == other.mName && mIfName == other.mIfName && mSubnet == other.mSubnet;
    }

    bool operator!=(const BackendSelection& other) const { return !operator==(other); }
};

/**
 * Single multi IP record entry.
 */
struct MultiIPEntry {
    std::string mIP;
    std::string mInterface;
};

/**
 * Per-interface IP bookkeeping written to the workload annotations.
 */
struct MultiIPRecord {
    int                                 mMultiEntry = 0;
    std::map<std::string, MultiIPEntry> mIPs;

    /**
     * Adds entry with key ip<index>.
     *
     * @param index entry index.
     * @param ip IP address.
     * @param ifName interface name.
     */
    void Add(int index, const std::string& ip, const std::string& ifName)
    {
        mMultiEntry++;
        mIPs["ip" + std::to_string(index)] = {ip, ifName};
    }
};

} // namespace genie

#endif
