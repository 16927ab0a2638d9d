//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectOptions.cpp
// Purpose: Environment and key=value parsing for ConnectOptions
//==========================================================================================================

#include "wsio/ConnectOptions.hpp"

#include <algorithm>
#include <limits>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "KeyValueConfig.hpp"

namespace wsio {

ConnectOptions ConnectOptions::FromEnv() {
    ConnectOptions opts;
    opts.queueCapacity = static_cast<std::size_t>(
        std::max<unsigned long long>(1, GetEnvUnsignedOrDefault("WSIO_QUEUE_CAPACITY", opts.queueCapacity)));
    const auto timeout = GetEnvUnsignedOrDefault("WSIO_OPEN_TIMEOUT_MS", opts.openTimeoutMs);
    opts.openTimeoutMs = static_cast<unsigned int>(
        std::min<unsigned long long>(timeout, std::numeric_limits<unsigned int>::max()));
    const std::string policy = GetEnvOrDefault("WSIO_OVERFLOW_POLICY", "");
    if (!policy.empty() && !ParseOverflowPolicy(policy, opts.overflowPolicy)) {
        LOG_WARN("ConnectOptions: ignoring WSIO_OVERFLOW_POLICY={}", policy);
    }
    return opts;
}

ConnectOptions ConnectOptions::FromConfig(const std::string& cfg) {
    ConnectOptions opts = FromEnv();
    std::string passthrough;
    for (const auto& [key, value] : config::ParseKeyValues(cfg)) {
        unsigned long long n = 0;
        if (key == "queueCapacity") {
            if (config::ParseUnsigned(value, n) && n > 0) {
                opts.queueCapacity = static_cast<std::size_t>(n);
            }
        } else if (key == "openTimeoutMs") {
            if (config::ParseUnsigned(value, n) && n <= std::numeric_limits<unsigned int>::max()) {
                opts.openTimeoutMs = static_cast<unsigned int>(n);
            }
        } else if (key == "overflow" || key == "overflowPolicy") {
            if (!ParseOverflowPolicy(value, opts.overflowPolicy)) {
                LOG_WARN("ConnectOptions: unknown overflow policy '{}'", value);
            }
        } else {
            if (!passthrough.empty()) { passthrough += ';'; }
            passthrough += key + "=" + value;
        }
    }
    opts.transportConfig = passthrough;
    return opts;
}

} // namespace wsio
