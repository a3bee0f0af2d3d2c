/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libferry_CLIArguments_hpp
#define libferry_CLIArguments_hpp

#include <initializer_list>
#include <vector>
#include <string>
#include <cstring>
#include <ostream>

namespace libferry {

/**
 * Utility class that wraps and manages the lifetime of the CLI arguments
 * to be passed to program (the char* argv[] parameter)
 */
class CLIArguments {
public:
    using const_iterator = typename std::vector<char*>::const_iterator;

public:
    CLIArguments();
    CLIArguments(const CLIArguments& rhs);
    CLIArguments(CLIArguments&& rhs);
    CLIArguments(int argc, char* argv[]);
    CLIArguments(std::initializer_list<std::string> args);
    template<class InputIter>
    CLIArguments(InputIter begin, InputIter end) : CLIArguments() {
        for(InputIter arg=begin; arg!=end; ++arg) {
            push_back(*arg);
        }
    };

    ~CLIArguments();

    CLIArguments& operator=(const CLIArguments& rhs);
    CLIArguments& operator=(CLIArguments&& rhs);
    void push_back(const std::string& arg);

    int argc() const;
    char** argv() const;

    const_iterator begin() const;
    const_iterator end() const;

    CLIArguments& operator+=(const CLIArguments& rhs);

    bool empty() const;
    void clear();
    std::string string() const;
    std::string shellQuoted() const;
    std::vector<std::string> strings() const;

private:
    std::vector<char*> args;
};

bool operator==(const CLIArguments&, const CLIArguments&);
bool operator!=(const CLIArguments&, const CLIArguments&);
const CLIArguments operator+(const CLIArguments&, const CLIArguments&);
std::ostream& operator<<(std::ostream&, const CLIArguments&);

}

#endif
