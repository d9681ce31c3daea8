/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_COMMON_UTILS_EXCEPTION_HPP_
#define GENIE_COMMON_UTILS_EXCEPTION_HPP_

#include <exception>
#include <string>

#include "genie/common/tools/error.hpp"

/**
 * Throws GenieException if err is not none.
 */
#define GENIE_ERROR_CHECK_AND_THROW(message, err)                                                                      \
    do {                                                                                                               \
        const genie::Error _genieErr = (err);                                                                          \
        if (!_genieErr.IsNone()) {                                                                                     \
            throw genie::common::utils::GenieException(message, GENIE_ERROR_WRAP(_genieErr));                          \
        }                                                                                                              \
    } while (0)

namespace genie::common::utils {

/**
 * Exception carrying genie error.
 */
class GenieException : public std::exception {
public:
    /**
     * Constructor.
     *
     * @param message exception message.
     * @param err error.
     */
    explicit GenieException(const std::string& message, const Error& err = ErrorEnum::eFailed)
        : mError(err)
    {
        mMessage = message;

        if (!err.Message().empty() && err.Message() != message) {
            mMessage.append(": ").append(err.Message());
        }
    }

    /**
     * Returns exception message.
     *
     * @return const char*.
     */
    const char* what() const noexcept override { return mMessage.c_str(); }

    /**
     * Returns genie error.
     *
     * @return const Error&.
     */
    const Error& GetError() const { return mError; }

private:
    std::string mMessage;
    Error       mError;
};

/**
 * Converts exception to genie error.
 *
 * @param e exception.
 * @param err error type used for non genie exceptions.
 * @return Error.
 */
inline Error ToGenieError(const std::exception& e, ErrorEnum err = ErrorEnum::eFailed)
{
    if (const auto* genieException = dynamic_cast<const GenieException*>(&e); genieException != nullptr) {
        return Error(genieException->GetError().Value(), genieException->what());
    }

    return Error(err, e.what());
}

} // namespace genie::common::utils

#endif
