/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_CLUSTERCLIENT_HPP_
#define GENIE_CLUSTERCLIENT_HPP_

#include <string>

#include "genie/common/tools/error.hpp"
#include "genie/common/types.hpp"

namespace genie::clusterclient {

/**
 * Cluster logical network object.
 */
struct LogicalNetwork {
    std::string mName;
    std::string mPhysicalNet;
    std::string mSubnet;
};

/**
 * Cluster state access interface.
 */
class ClusterClientItf {
public:
    /**
     * Destructor.
     */
    virtual ~ClusterClientItf() = default;

    /**
     * Returns workload annotations.
     *
     * @param ns workload namespace.
     * @param name workload name.
     * @param[out] annotations workload annotations.
     * @return Error.
     */
    virtual Error GetPodAnnotations(const std::string& ns, const std::string& name, Annotations& annotations) = 0;

    /**
     * Updates workload annotations using merge patch. Other annotations are kept.
     *
     * @param ns workload namespace.
     * @param name workload name.
     * @param annotations annotations to set.
     * @return Error.
     */
    virtual Error PatchPodAnnotations(const std::string& ns, const std::string& name, const Annotations& annotations)
        = 0;

    /**
     * Returns logical network object.
     *
     * @param ns network namespace.
     * @param name network name.
     * @param[out] network logical network.
     * @return Error.
     */
    virtual Error GetLogicalNetwork(const std::string& ns, const std::string& name, LogicalNetwork& network) = 0;
};

} // namespace genie::clusterclient

#endif
