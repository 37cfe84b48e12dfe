//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements gateway version helpers.
//==========================================================================================================
#include "mcpgw/version.h"

#include <sstream>

namespace mcpgw {

VersionInfo getVersion() {
    return VersionInfo{0, 3, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

} // namespace mcpgw
