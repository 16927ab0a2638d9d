//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectOptions.hpp
// Purpose: Connection bootstrap settings (queue sizing, overflow policy, open timeout)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <string>

#include "wsio/ChunkQueue.hpp"

namespace wsio {

//==========================================================================================================
// ConnectOptions
// Purpose: Settings applied by Connection::Open.
// Fields:
//   queueCapacity: Chunks buffered between the transport and the reader (default 4, minimum 1).
//   overflowPolicy: What the transport's event thread does when the queue is full (default Block).
//   openTimeoutMs: Time to wait for the open event before failing with errc::connect_timeout.
//                  0 disables the timer; error and close events still end the wait.
//   transportConfig: "key=value;..." string handed to the transport factory.
// Environment overrides (read by FromEnv):
//   WSIO_QUEUE_CAPACITY, WSIO_OVERFLOW_POLICY (block|drop-newest), WSIO_OPEN_TIMEOUT_MS
//==========================================================================================================
struct ConnectOptions {
    std::size_t queueCapacity{ChunkQueue::DefaultCapacity};
    OverflowPolicy overflowPolicy{OverflowPolicy::Block};
    unsigned int openTimeoutMs{10000};
    std::string transportConfig;

    // Built-in defaults with environment overrides applied.
    static ConnectOptions FromEnv();

    //==========================================================================================================
    // FromConfig
    // Purpose: FromEnv() defaults overridden by "queueCapacity=..;overflow=..;openTimeoutMs=..". Keys that are
    //          not connection settings are collected into transportConfig. Malformed values are ignored.
    //==========================================================================================================
    static ConnectOptions FromConfig(const std::string& config);
};

} // namespace wsio
