/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_ERROR_HPP_
#define GENIE_ERROR_HPP_

#include <cstring>
#include <ostream>
#include <string>
#include <vector>

#include "genie/common/tools/enum.hpp"

namespace genie {

/**
 * Strips directory part from source file name.
 */
#define GENIE_FILE_NAME (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

/**
 * Wraps error with file name and line number.
 */
#define GENIE_ERROR_WRAP(err) genie::Error(err, GENIE_FILE_NAME, __LINE__)

/**
 * Error types.
 */
class ErrorType {
public:
    enum class Enum {
        eNone,
        eFailed,
        eRuntime,
        eNoMemory,
        eOutOfRange,
        eNotFound,
        eInvalidArgument,
        eTimeout,
        eAlreadyExist,
        eWrongState,
        eNotSupported,
        eSelectionFailure,
        eInvocationFailure,
        eInconsistentResult,
        eMetadataPatchFailure,
        eNumErrors
    };

    static const std::vector<std::string>& GetStrings()
    {
        static const std::vector<std::string> sErrorTypeStrings = {"none", "failed", "runtime error",
            "not enough memory", "out of range", "not found", "invalid argument", "timeout", "already exist",
            "wrong state", "not supported", "selection failure", "invocation failure", "inconsistent result",
            "metadata patch failure"};

        return sErrorTypeStrings;
    };
};

using ErrorEnum = ErrorType::Enum;

/**
 * Error.
 */
class Error {
public:
    /**
     * Constructs error from enum.
     *
     * @param err error enum.
     * @param message error message.
     */
    // cppcheck-suppress noExplicitConstructor
    Error(ErrorEnum err = ErrorEnum::eNone, const char* message = nullptr)
        : mErr(err)
        , mMessage(message ? message : "")
    {
    }

    /**
     * Constructs error from enum and message.
     *
     * @param err error enum.
     * @param message error message.
     */
    Error(ErrorEnum err, const std::string& message)
        : mErr(err)
        , mMessage(message)
    {
    }

    /**
     * Constructs error from errno.
     *
     * @param errNo errno.
     * @param message error message.
     */
    // cppcheck-suppress noExplicitConstructor
    Error(int errNo, const char* message = nullptr)
        : mErr(errNo == 0 ? ErrorEnum::eNone : ErrorEnum::eRuntime)
        , mErrno(errNo)
        , mMessage(message ? message : "")
    {
    }

    /**
     * Wraps existing error with source location.
     *
     * @param err error to wrap.
     * @param fileName source file name.
     * @param lineNumber source line number.
     */
    Error(const Error& err, const char* fileName, int lineNumber)
        : Error(err)
    {
        if (mFileName == nullptr) {
            mFileName   = fileName;
            mLineNumber = lineNumber;
        }
    }

    Error(const Error& err)            = default;
    Error& operator=(const Error& err) = default;

    /**
     * Checks if error is none.
     *
     * @return bool.
     */
    bool IsNone() const { return mErr == ErrorEnum::eNone; }

    /**
     * Checks if error has specified type.
     *
     * @param err error to compare.
     * @return bool.
     */
    bool Is(const Error& err) const { return mErr == err.mErr; }

    /**
     * Returns error enum value.
     *
     * @return ErrorEnum.
     */
    ErrorEnum Value() const { return mErr; }

    /**
     * Returns errno.
     *
     * @return int.
     */
    int Errno() const { return mErrno; }

    /**
     * Returns error message.
     *
     * @return std::string.
     */
    std::string Message() const
    {
        if (!mMessage.empty()) {
            return mMessage;
        }

        if (mErrno != 0) {
            return strerror(mErrno);
        }

        return EnumStringer<ErrorType>(mErr).ToString();
    }

    /**
     * Returns source file name where error was wrapped.
     *
     * @return const char*.
     */
    const char* FileName() const { return mFileName; }

    /**
     * Returns source line number where error was wrapped.
     *
     * @return int.
     */
    int LineNumber() const { return mLineNumber; }

    bool operator==(const Error& err) const { return mErr == err.mErr; }
    bool operator!=(const Error& err) const { return mErr != err.mErr; }
    bool operator==(ErrorEnum err) const { return mErr == err; }
    bool operator!=(ErrorEnum err) const { return mErr != err; }

    /**
     * Outputs error to stream.
     */
    friend std::ostream& operator<<(std::ostream& os, const Error& err)
    {
        os << err.Message();

        if (err.mFileName) {
            os << " (" << err.mFileName << ":" << err.mLineNumber << ")";
        }

        return os;
    }

private:
    ErrorEnum   mErr;
    int         mErrno = 0;
    std::string mMessage;
    const char* mFileName   = nullptr;
    int         mLineNumber = 0;
};

/**
 * Return value with error.
 *
 * @tparam T value type.
 */
template <typename T>
struct RetWithError {
    /**
     * Constructor.
     *
     * @param value return value.
     * @param error return error.
     */
    // cppcheck-suppress noExplicitConstructor
    RetWithError(const T& value, const Error& error = ErrorEnum::eNone)
        : mValue(value)
        , mError(error)
    {
    }

    T     mValue;
    Error mError;
};

} // namespace genie

#endif
