//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WriteHalf.cpp
// Purpose: Write half send and close implementation
//==========================================================================================================

#include <utility>

#include "logging/Logger.h"
#include "wsio/WriteHalf.hpp"
#include "wsio/errors/Errors.h"

namespace wsio {

WriteHalf::WriteHalf(executor_type ex, std::shared_ptr<TransportLease> lease)
    : ex_(std::move(ex)), lease_(std::move(lease)) {}

// Releasing our share closes the transport only when the read half is gone too.
WriteHalf::~WriteHalf() = default;

boost::system::error_code WriteHalf::Write(boost::asio::const_buffer buffer, std::size_t& bytes_written) {
    bytes_written = 0;
    if (!lease_) {
        return boost::asio::error::bad_descriptor;
    }
    if (buffer.size() == 0) {
        return {};
    }
    if (lease_->IsClosed()) {
        return make_error_code(errc::not_open);
    }
    auto ec = lease_->Transport().Send(static_cast<const std::uint8_t*>(buffer.data()), buffer.size());
    if (ec) {
        LOG_DEBUG("WriteHalf: send of {} bytes failed: {}", buffer.size(), ec.message());
        return ec;
    }
    bytes_written = buffer.size();
    return {};
}

void WriteHalf::Close() {
    if (lease_ && lease_->Close()) {
        LOG_INFO("WriteHalf: closing transport {}", lease_->Transport().GetSessionId());
    }
}

} // namespace wsio
