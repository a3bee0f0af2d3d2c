/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libferry_LogLevel_hpp
#define libferry_LogLevel_hpp

namespace libferry {

enum class LogLevel {DEBUG, INFO, WARN, ERROR, GENERAL};

}

#endif
