/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>

#include "genie/cni/exec.hpp"

#include "log.hpp"

namespace genie::cni {

/***********************************************************************************************************************
 * Static
 **********************************************************************************************************************/

namespace {

Error WriteAll(int fd, const std::string& data)
{
    size_t pos = 0;

    while (pos < data.size()) {
        auto count = write(fd, data.data() + pos, data.size() - pos);
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }

            return Error(errno);
        }

        pos += count;
    }

    return ErrorEnum::eNone;
}

Error ReadAll(int fd, std::string& data)
{
    char buffer[4096];

    while (true) {
        auto count = read(fd, buffer, sizeof(buffer));
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }

            return Error(errno);
        }

        if (count == 0) {
            return ErrorEnum::eNone;
        }

        data.append(buffer, count);
    }
}

} // namespace

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<std::string> Exec::ExecPlugin(
    const std::string& payload, const std::string& pluginPath, const std::vector<std::string>& env)
{
    LOG_DBG() << "Exec plugin" << Log::Field("path", pluginPath);

    int stdinPipe[2];
    int stdoutPipe[2];

    if (pipe(stdinPipe) != 0) {
        return {"", Error(errno, "can't create pipe")};
    }

    if (pipe(stdoutPipe) != 0) {
        auto err = Error(errno, "can't create pipe");

        close(stdinPipe[0]);
        close(stdinPipe[1]);

        return {"", err};
    }

    std::vector<char*> argv {const_cast<char*>(pluginPath.c_str()), nullptr};
    std::vector<char*> envp;

    for (const auto& item : env) {
        envp.push_back(const_cast<char*>(item.c_str()));
    }

    envp.push_back(nullptr);

    auto pid = fork();
    if (pid < 0) {
        auto err = Error(errno, "can't fork");

        for (auto fd : {stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1]}) {
            close(fd);
        }

        return {"", err};
    }

    if (pid == 0) {
        dup2(stdinPipe[0], STDIN_FILENO);
        dup2(stdoutPipe[1], STDOUT_FILENO);

        for (auto fd : {stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1]}) {
            close(fd);
        }

        execve(pluginPath.c_str(), argv.data(), envp.data());

        _exit(127);
    }

    close(stdinPipe[0]);
    close(stdoutPipe[1]);

    auto writeErr = WriteAll(stdinPipe[1], payload);

    close(stdinPipe[1]);

    std::string output;

    auto readErr = ReadAll(stdoutPipe[0], output);

    close(stdoutPipe[0]);

    int status = 0;

    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return {output, Error(errno, "can't wait plugin")};
        }
    }

    if (!readErr.IsNone()) {
        return {output, readErr};
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        if (!writeErr.IsNone()) {
            LOG_WRN() << "Plugin didn't consume configuration" << Log::Field("path", pluginPath)
                      << Log::Field(writeErr);
        }

        return output;
    }

    if (WIFSIGNALED(status)) {
        return {output, Error(ErrorEnum::eFailed, "killed by signal " + std::to_string(WTERMSIG(status)))};
    }

    return {output, Error(ErrorEnum::eFailed, "exit status " + std::to_string(WEXITSTATUS(status)))};
}

} // namespace genie::cni
