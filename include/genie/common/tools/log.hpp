/*
 * Copyright (C) 2024 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef GENIE_LOG_HPP_
#define GENIE_LOG_HPP_

#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include "genie/common/tools/enum.hpp"
#include "genie/common/tools/error.hpp"

/**
 * Logs debug message for module.
 */
#define LOG_MODULE_DBG(module) genie::Log(module, genie::LogLevelEnum::eDebug)

/**
 * Logs info message for module.
 */
#define LOG_MODULE_INF(module) genie::Log(module, genie::LogLevelEnum::eInfo)

/**
 * Logs warning message for module.
 */
#define LOG_MODULE_WRN(module) genie::Log(module, genie::LogLevelEnum::eWarning)

/**
 * Logs error message for module.
 */
#define LOG_MODULE_ERR(module) genie::Log(module, genie::LogLevelEnum::eError)

namespace genie {

/**
 * Log level types.
 */
class LogLevelType {
public:
    enum class Enum { eDebug, eInfo, eWarning, eError };

    static const std::vector<std::string>& GetStrings()
    {
        static const std::vector<std::string> sLogLevelStrings = {"debug", "info", "warning", "error"};

        return sLogLevelStrings;
    };
};

using LogLevelEnum = LogLevelType::Enum;
using LogLevel     = EnumStringer<LogLevelType>;

/**
 * Log module types.
 */
class LogModuleType {
public:
    enum class Enum {
        eDefault,
        eCNI,
        eNetConf,
        eConfigResolver,
        eResultMerger,
        eBackendSelector,
        eKubeClient,
        eRanking,
        eController,
        eApp
    };

    static const std::vector<std::string>& GetStrings()
    {
        static const std::vector<std::string> sLogModuleStrings = {"default", "cni", "netconf",
            "configresolver", "resultmerger", "backendselector", "kubeclient", "ranking", "controller", "app"};

        return sLogModuleStrings;
    };
};

using LogModuleEnum = LogModuleType::Enum;
using LogModule     = EnumStringer<LogModuleType>;

/**
 * Log line builder.
 *
 * The message is passed to the log callback when the object is destroyed.
 */
class Log {
public:
    /**
     * Log callback.
     */
    using Callback = std::function<void(LogModule module, LogLevel level, const std::string& message)>;

    /**
     * Log field.
     */
    struct Field {
        /**
         * Constructs named field.
         *
         * @param name field name.
         * @param value field value.
         */
        template <typename T>
        Field(const char* name, const T& value)
            : mName(name)
        {
            std::ostringstream os;

            os << value;

            mValue = os.str();
        }

        /**
         * Constructs error field.
         *
         * @param err error.
         */
        explicit Field(const Error& err)
            : Field("err", err)
        {
        }

        std::string mName;
        std::string mValue;
    };

    /**
     * Constructor.
     *
     * @param module log module.
     * @param level log level.
     */
    Log(LogModule module, LogLevel level)
        : mModule(module)
        , mLevel(level)
    {
    }

    /**
     * Destructor.
     */
    ~Log()
    {
        const auto& callback = GetCallback();

        if (callback) {
            callback(mModule, mLevel, mStream.str());
        }
    }

    Log(const Log&)            = delete;
    Log& operator=(const Log&) = delete;

    /**
     * Appends value to log line.
     *
     * @param value value to append.
     * @return Log&.
     */
    template <typename T>
    Log& operator<<(const T& value)
    {
        mStream << value;

        return *this;
    }

    /**
     * Appends field to log line.
     *
     * @param field field to append.
     * @return Log&.
     */
    Log& operator<<(const Field& field)
    {
        mStream << (mNumFields == 0 ? ": " : ", ") << field.mName << "=" << field.mValue;
        mNumFields++;

        return *this;
    }

    /**
     * Sets log callback.
     *
     * @param callback log callback.
     */
    static void SetCallback(Callback callback) { GetCallback() = std::move(callback); }

private:
    static Callback& GetCallback()
    {
        static Callback sCallback;

        return sCallback;
    }

    LogModule          mModule;
    LogLevel           mLevel;
    std::ostringstream mStream;
    int                mNumFields = 0;
};

} // namespace genie

#endif
