/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libferry_Error_hpp
#define libferry_Error_hpp

#include <cassert>
#include <type_traits>
#include <exception>
#include <string>
#include <vector>
#include <cstring>

#include <boost/filesystem.hpp>

#include "libferry/LogLevel.hpp"

namespace libferry {

/**
 * This class encapsulates error trace information to be propagated as an exception.
 *
 * An error trace entry encapsulates information about file, line and function name
 * where the error trace entry was created.
 *
 * The first error trace entry is created by the macro FERRY_THROW_ERROR.
 * Additional error trace entries are created by the macro FERRY_RETHROW_ERROR.
 *
 * Errors that carry additional data for the caller (e.g. the exit code of a failed
 * container) derive from this class and are thrown with FERRY_ERROR_TRACE_ENTRY as
 * first constructor argument. FERRY_RETHROW_ERROR preserves their dynamic type.
 *
 * Note: this class should be instantiated and thrown through the FERRY_THROW_ERROR macro.
 * Caught instances of this class should be rethrown through the FERRY_RETHROW_ERROR macro.
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        boost::filesystem::path fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry)
        : logLevel{ logLevel }
        , errorTrace{ entry }
    {}

    virtual ~Error() = default;

    const char* what() const noexcept override {
        // Return the 'what()' of the original exception that generated this error trace
        // as if the original exception was propagated directly up to the current
        // stack frame, i.e. without intermediate catch-rethrows.
        return errorTrace.front().errorMessage.c_str();
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) {
        errorTrace.push_back(entry);
    }

    const std::vector<ErrorTraceEntry>& getErrorTrace() const {
        return errorTrace;
    }

    LogLevel getLogLevel() const {
        return logLevel;
    }

    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

private:
    LogLevel logLevel = LogLevel::ERROR;
    std::vector<ErrorTraceEntry> errorTrace;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

inline bool operator!=(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string getExceptionTypeString(const std::exception& e);

}


#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define FERRY_ERROR_TRACE_ENTRY(errorMessage) \
    libferry::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}


// FERRY_THROW_ERROR macros
#define FERRY_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define FERRY_THROW_ERROR_2(errorMessage, logLevel) { \
    auto stackTraceEntry = FERRY_ERROR_TRACE_ENTRY(errorMessage); \
    throw libferry::Error{logLevel, stackTraceEntry}; \
}

#define FERRY_THROW_ERROR_1(errorMessage) FERRY_THROW_ERROR_2(errorMessage, libferry::LogLevel::ERROR)

#define FERRY_THROW_ERROR(...) FERRY_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, FERRY_THROW_ERROR_2, FERRY_THROW_ERROR_1)(__VA_ARGS__)


// FERRY_RETHROW_ERROR macros
#define FERRY_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define FERRY_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto errorTraceEntry = FERRY_ERROR_TRACE_ENTRY(errorMessage); \
    const auto* cp = dynamic_cast<const libferry::Error*>(&exception); \
    if(cp) { /* check if dynamic type is libferry::Error */ \
        assert(!std::is_const<decltype(exception)>{}); /* a libferry::Error object must be caught as non-const reference because we need to modify its internal error trace */ \
        auto* p = const_cast<libferry::Error*>(cp); \
        p->setLogLevel(logLevel); \
        p->appendErrorTraceEntry(errorTraceEntry); \
        throw; \
    } \
    else { \
        auto previousErrorTraceEntry = libferry::Error::ErrorTraceEntry{exception.what(), "unspecified location", -1, \
                                                                        libferry::getExceptionTypeString(exception)}; \
        auto error = libferry::Error{logLevel, previousErrorTraceEntry}; \
        error.appendErrorTraceEntry(errorTraceEntry); \
        throw error; \
    } \
}

#define FERRY_RETHROW_ERROR_2(exception, errorMessage) { \
    const auto* cp = dynamic_cast<const libferry::Error*>(&exception); \
    if(cp) { \
        /* get log level if dynamic type is libferry::Error */ \
        FERRY_RETHROW_ERROR_3(exception, errorMessage, cp->getLogLevel()) \
    } \
    else { \
        FERRY_RETHROW_ERROR_3(exception, errorMessage, libferry::LogLevel::ERROR) \
    } \
}

#define FERRY_RETHROW_ERROR(...) FERRY_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, FERRY_RETHROW_ERROR_3, FERRY_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
