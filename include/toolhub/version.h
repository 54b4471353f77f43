//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version reported as clientInfo during the provider handshake.
//==========================================================================================================
#pragma once

#include <string>

namespace toolhub {

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

} // namespace toolhub
