//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportLease.cpp
// Purpose: Shared transport ownership and close-once semantics
//==========================================================================================================

#include <exception>
#include <utility>

#include "logging/Logger.h"
#include "wsio/TransportLease.hpp"

namespace wsio {

TransportLease::TransportLease(std::unique_ptr<IMessageTransport> transport) : transport_(std::move(transport)) {}

TransportLease::~TransportLease() {
    if (Close()) {
        LOG_DEBUG("TransportLease: last owner released; transport {} closed", transport_->GetSessionId());
    }
}

bool TransportLease::Close() {
    if (closed_.exchange(true)) {
        return false;
    }
    try {
        transport_->Close();
    } catch (const std::exception& e) {
        // Close is best effort from the caller's point of view.
        LOG_WARN("TransportLease: transport close reported: {}", e.what());
    }
    return true;
}

} // namespace wsio
