//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ReadHalf.cpp
// Purpose: Read half lifetime and synchronous buffered-read helpers
//==========================================================================================================

#include <stdexcept>
#include <utility>

#include "logging/Logger.h"
#include "wsio/ReadHalf.hpp"

namespace wsio {

ReadHalf::ReadHalf(executor_type ex, std::shared_ptr<InboundBridge> bridge, std::shared_ptr<TransportLease> lease)
    : ex_(std::move(ex)), bridge_(std::move(bridge)), lease_(std::move(lease)) {}

ReadHalf::~ReadHalf() {
    release();
}

ReadHalf& ReadHalf::operator=(ReadHalf&& other) noexcept {
    if (this != &other) {
        release();
        ex_ = std::move(other.ex_);
        bridge_ = std::move(other.bridge_);
        lease_ = std::move(other.lease_);
    }
    return *this;
}

void ReadHalf::release() {
    if (bridge_) {
        bridge_->Shutdown();
        bridge_.reset();
    }
    // Dropping our share may close the transport when the write half is already gone.
    lease_.reset();
}

void ReadHalf::consume(std::size_t n) {
    if (!bridge_) {
        throw std::logic_error("ReadHalf::consume on a moved-from reader");
    }
    bridge_->Consume(n);
}

std::size_t ReadHalf::buffered() const {
    return bridge_ ? bridge_->Buffered() : 0;
}

std::uint64_t ReadHalf::dropped_chunks() const {
    return bridge_ ? bridge_->Queue()->DroppedCount() : 0;
}

} // namespace wsio
