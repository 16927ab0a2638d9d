//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers
//==========================================================================================================
#include "wsio/version.h"

#include <fmt/format.h>

namespace wsio {

VersionInfo getVersion() {
    return VersionInfo{0, 2, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace wsio
