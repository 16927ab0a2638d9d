//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read wsio environment overrides (log settings, queue and timeout defaults).
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <string>
#include <cctype>
#include <stdexcept>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnvUnsignedOrDefault
// Purpose: Reads a non-negative integer override; malformed values fall back to the default.
//==========================================================================================================
inline unsigned long long GetEnvUnsignedOrDefault(const char* name, unsigned long long defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty() || !std::isdigit(static_cast<unsigned char>(v.front()))) {
        return defaultValue;
    }
    try {
        return std::stoull(v);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

// "1", "true", "yes", "on" (any case) are true.
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    for (auto& c : v) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}
