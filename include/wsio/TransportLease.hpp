//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportLease.hpp
// Purpose: Shared ownership of one transport between the read half and the write half
//==========================================================================================================
#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "wsio/Transport.h"

namespace wsio {

//==========================================================================================================
// TransportLease
// Purpose: Holds the transport for every half that references it (via shared_ptr). Close is a one-way,
//          idempotent transition; the last owner to go away closes the transport if nobody did.
//==========================================================================================================
class TransportLease {
public:
    explicit TransportLease(std::unique_ptr<IMessageTransport> transport);
    ~TransportLease();

    TransportLease(const TransportLease&) = delete;
    TransportLease& operator=(const TransportLease&) = delete;

    IMessageTransport& Transport() { return *transport_; }
    const IMessageTransport& Transport() const { return *transport_; }

    // Returns true for the call that actually initiated the close.
    bool Close();
    bool IsClosed() const { return closed_.load(); }

private:
    std::unique_ptr<IMessageTransport> transport_;
    std::atomic<bool> closed_{false};
};

} // namespace wsio
