/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_RESULTMERGER_HPP_
#define GENIE_RESULTMERGER_HPP_

#include "genie/cni/cni.hpp"
#include "genie/common/tools/error.hpp"

namespace genie::resultmerger {

/**
 * Combines results of several backend invocations.
 */
class ResultMerger {
public:
    /**
     * Repairs result of non-conformant backend.
     *
     * Routes without gateway get the first gateway found among IPs. If result has no interfaces, IPs pointing to an
     * interface are detached.
     *
     * @param result result to repair.
     * @return Error eInconsistentResult if route gateway can't be reconciled.
     */
    Error Repair(cni::Result& result) const;

    /**
     * Merges source result into accumulator.
     *
     * @param src repaired source result.
     * @param dst accumulator.
     * @return Error.
     */
    Error Merge(const cni::Result& src, cni::Result& dst) const;
};

} // namespace genie::resultmerger

#endif
