//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers
//==========================================================================================================
#include "cdev/version.h"

#include <sstream>

namespace cdev {

VersionInfo getVersion() {
    return VersionInfo{0, 3, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

} // namespace cdev
