//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: KeyValueConfig.hpp
// Purpose: Parser for the "key=value;key=value" configuration strings accepted by options and factories
//==========================================================================================================
#pragma once

#include <string>
#include <utility>
#include <vector>

namespace wsio {
namespace config {

inline std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

//==========================================================================================================
// ParseKeyValues
// Purpose: Splits a semicolon-delimited list of key=value pairs. Entries without '=' are skipped;
//          whitespace around keys and values is trimmed.
//==========================================================================================================
inline std::vector<std::pair<std::string, std::string>> ParseKeyValues(const std::string& text) {
    std::vector<std::pair<std::string, std::string>> out;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t sep = text.find(';', start);
        if (sep == std::string::npos) { sep = text.size(); }
        std::string kv = trim(text.substr(start, sep - start));
        if (!kv.empty()) {
            std::size_t eq = kv.find('=');
            if (eq != std::string::npos) {
                out.emplace_back(trim(kv.substr(0, eq)), trim(kv.substr(eq + 1)));
            }
        }
        start = sep + 1;
    }
    return out;
}

// Parses an unsigned decimal; leaves out untouched and returns false on malformed input.
inline bool ParseUnsigned(const std::string& text, unsigned long long& out) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    try {
        out = std::stoull(text);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace config
} // namespace wsio
