//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning semantic version string.
//==========================================================================================================
#include "toolhub/version.h"

#include <fmt/format.h>

namespace toolhub {

VersionInfo getVersion() {
    return VersionInfo{0, 3, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace toolhub
