/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cctype>
#include <numeric>

#include "genie/common/tools/utils.hpp"

namespace genie::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

std::vector<std::string> Split(const std::string& str, char delimiter)
{
    std::vector<std::string> items;
    size_t                   start = 0;

    while (true) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            items.push_back(str.substr(start));

            break;
        }

        items.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }

    return items;
}

std::string JoinStrings(const std::vector<std::string>& items, const std::string& sep)
{
    return std::accumulate(items.begin(), items.end(), std::string {},
        [&sep, first = true](const std::string& acc, const std::string& item) mutable {
            if (first) {
                first = false;

                return item;
            }

            return acc + sep + item;
        });
}

std::string TrimSpace(const std::string& str)
{
    auto begin = str.begin();
    auto end   = str.end();

    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
        begin++;
    }

    while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        end--;
    }

    return std::string(begin, end);
}

bool HasPrefix(const std::string& str, const std::string& prefix)
{
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool HasSuffix(const std::string& str, const std::string& suffix)
{
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace genie::utils
