//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version (reported by the CLI and sent in the User-Agent header)
//==========================================================================================================
#pragma once

#include <string>

namespace cdev {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

} // namespace cdev
