/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLIArguments.hpp"

#include <cstdlib>
#include <iterator>
#include <sstream>
#include <boost/format.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>

#include "libferry/Error.hpp"

namespace libferry {

CLIArguments::CLIArguments() {
    args.push_back(nullptr); // array is null-terminated
}

CLIArguments::CLIArguments(const CLIArguments& rhs) : CLIArguments() {
    for(int i=0; i<rhs.argc(); ++i) {
        push_back(rhs.argv()[i]);
    }
}

CLIArguments::CLIArguments(CLIArguments&& rhs) : CLIArguments() {
    std::swap(args, rhs.args);
}

CLIArguments::CLIArguments(int argc, char* argv[]) : CLIArguments() {
    for(int i=0; i<argc; ++i) {
        push_back(argv[i]);
    }
}

CLIArguments::CLIArguments(std::initializer_list<std::string> args) : CLIArguments() {
    for(const auto& arg : args) {
        push_back(arg);
    }
}

CLIArguments::~CLIArguments() {
    clear();
}

CLIArguments& CLIArguments::operator=(const CLIArguments& rhs) {
    if(this == &rhs) {
        return *this;
    }
    clear();
    for(auto* ptr : rhs) {
        push_back(ptr);
    }
    return *this;
}

CLIArguments& CLIArguments::operator=(CLIArguments&& rhs) {
    std::swap(args, rhs.args);
    return *this;
}

void CLIArguments::push_back(const std::string& arg) {
    args.pop_back();
    args.push_back(strdup(arg.c_str()));
    args.push_back(nullptr);
}

int CLIArguments::argc() const {
    return args.size() - 1;
}

char** CLIArguments::argv() const {
    return const_cast<char**>(args.data());
}

CLIArguments::const_iterator CLIArguments::begin() const {
    return args.cbegin();
}

CLIArguments::const_iterator CLIArguments::end() const {
    return args.cend() - 1;
}

CLIArguments& CLIArguments::operator+=(const CLIArguments& rhs) {
    auto rhsCopy = rhs.strings(); // rhs could be *this
    for(const auto& arg : rhsCopy) {
        push_back(arg);
    }
    return *this;
}

bool CLIArguments::empty() const {
    return begin() == end();
}

void CLIArguments::clear() {
    for(auto* ptr : args) {
        free(ptr);
    }
    args = { nullptr };
}

std::string CLIArguments::string() const {
    return boost::algorithm::join(strings(), " ");
}

/**
 * Joins the arguments into a single string that a POSIX shell would split
 * back into the same arguments. Used to display command lines in diagnostics.
 */
std::string CLIArguments::shellQuoted() const {
    static const auto safeCharacters = std::string{"@%+=:,./-_"};

    auto quoted = std::vector<std::string>{};
    for(const auto& arg : strings()) {
        bool isSafe = !arg.empty();
        for(auto c : arg) {
            if(!isalnum(static_cast<unsigned char>(c)) && safeCharacters.find(c) == std::string::npos) {
                isSafe = false;
                break;
            }
        }

        if(isSafe) {
            quoted.push_back(arg);
        }
        else {
            quoted.push_back("'" + boost::algorithm::replace_all_copy(arg, "'", "'\"'\"'") + "'");
        }
    }
    return boost::algorithm::join(quoted, " ");
}

std::vector<std::string> CLIArguments::strings() const {
    return std::vector<std::string>{this->begin(), this->end()};
}

bool operator==(const CLIArguments& lhs, const CLIArguments& rhs) {
    if(lhs.argc() != rhs.argc()) {
        return false;
    }

    for(int i=0; i<lhs.argc(); ++i) {
        auto lhsString = lhs.argv()[i];
        auto rhsString = rhs.argv()[i];
        if(strcmp(lhsString, rhsString) != 0) {
            return false;
        }
    }

    return true;
}

bool operator!=(const CLIArguments& lhs, const CLIArguments& rhs) {
    return !(lhs == rhs);
}

const CLIArguments operator+(const CLIArguments& lhs, const CLIArguments& rhs) {
    auto result = lhs;
    result += rhs;
    return result;
}

std::ostream& operator<<(std::ostream& os, const CLIArguments& args) {
    os << "[";
    bool isFirstArg = true;
    for(const auto& arg : args) {
        if(!isFirstArg) {
            os << ", ";
        }
        else {
            isFirstArg = false;
        }
        os << "\"" << arg << "\"";
    }
    os << "]";
    return os;
}

}
