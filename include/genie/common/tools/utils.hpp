/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_UTILS_HPP_
#define GENIE_UTILS_HPP_

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace genie {

/**
 * Calls function on scope exit.
 */
class DeferRelease {
public:
    /**
     * Constructor.
     *
     * @param release release function.
     */
    explicit DeferRelease(std::function<void()> release)
        : mRelease(std::move(release))
    {
    }

    /**
     * Destructor.
     */
    ~DeferRelease()
    {
        if (mRelease) {
            mRelease();
        }
    }

    DeferRelease(const DeferRelease&)            = delete;
    DeferRelease& operator=(const DeferRelease&) = delete;

    /**
     * Cancels release function call.
     */
    void Cancel() { mRelease = nullptr; }

private:
    std::function<void()> mRelease;
};

namespace utils {

/**
 * Splits string by delimiter. Empty items, including leading and trailing ones, are preserved.
 *
 * @param str string to split.
 * @param delimiter delimiter.
 * @return std::vector<std::string>.
 */
std::vector<std::string> Split(const std::string& str, char delimiter);

/**
 * Joins strings with separator.
 *
 * @param items strings to join.
 * @param sep separator.
 * @return std::string.
 */
std::string JoinStrings(const std::vector<std::string>& items, const std::string& sep);

/**
 * Removes leading and trailing whitespaces.
 *
 * @param str string to trim.
 * @return std::string.
 */
std::string TrimSpace(const std::string& str);

/**
 * Checks if string starts with prefix.
 *
 * @param str string.
 * @param prefix prefix.
 * @return bool.
 */
bool HasPrefix(const std::string& str, const std::string& prefix);

/**
 * Checks if string ends with suffix.
 *
 * @param str string.
 * @param suffix suffix.
 * @return bool.
 */
bool HasSuffix(const std::string& str, const std::string& suffix);

} // namespace utils

} // namespace genie

#endif
