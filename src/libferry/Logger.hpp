/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libferry_Logger_hpp
#define libferry_Logger_hpp

#include <string>
#include <iostream>
#include <mutex>

#include <boost/format.hpp>

#include "libferry/LogLevel.hpp"
#include "libferry/Error.hpp"

namespace libferry {

class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& sysName, const libferry::LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, const libferry::LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void logErrorTrace(const libferry::Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);
    void setLevel(libferry::LogLevel logLevel) { level = logLevel; };
    libferry::LogLevel getLevel() { return level; };

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makeSubmessageWithTimestamp(libferry::LogLevel logLevel) const;
    std::string makeSubmessageWithFerryInstanceID(libferry::LogLevel logLevel) const;
    std::string makeSubmessageWithSystemName(   libferry::LogLevel logLevel,
                                                const std::string& systemName) const;
    std::string makeSubmessageWithLogLevel(libferry::LogLevel logLevel) const;

private:
    libferry::LogLevel level;
    std::mutex streamMutex; // concurrent invocations share the output streams
};

}

#endif
