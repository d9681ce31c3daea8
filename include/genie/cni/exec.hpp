/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_CNI_EXEC_HPP_
#define GENIE_CNI_EXEC_HPP_

#include <string>
#include <vector>

#include "genie/common/tools/error.hpp"

namespace genie::cni {

/**
 * Plugin executor interface.
 */
class ExecItf {
public:
    /**
     * Destructor.
     */
    virtual ~ExecItf() = default;

    /**
     * Executes plugin binary.
     *
     * The plugin receives payload on stdin and env as its whole environment. Stdout is returned also when the plugin
     * exits with non zero status.
     *
     * @param payload plugin stdin.
     * @param pluginPath plugin binary path.
     * @param env environment in NAME=VALUE form.
     * @return RetWithError<std::string>.
     */
    virtual RetWithError<std::string> ExecPlugin(
        const std::string& payload, const std::string& pluginPath, const std::vector<std::string>& env)
        = 0;
};

/**
 * Executes plugins as child processes.
 */
class Exec : public ExecItf {
public:
    /**
     * Executes plugin binary.
     *
     * @param payload plugin stdin.
     * @param pluginPath plugin binary path.
     * @param env environment in NAME=VALUE form.
     * @return RetWithError<std::string>.
     */
    RetWithError<std::string> ExecPlugin(
        const std::string& payload, const std::string& pluginPath, const std::vector<std::string>& env) override;
};

} // namespace genie::cni

#endif
