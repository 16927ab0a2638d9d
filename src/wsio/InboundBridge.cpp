//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InboundBridge.cpp
// Purpose: Carry-over buffer and chunk queue consumer implementation
//==========================================================================================================

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/error.hpp>

#include "logging/Logger.h"
#include "wsio/InboundBridge.hpp"

namespace wsio {

InboundBridge::InboundBridge(std::shared_ptr<ChunkQueue> queue) : queue_(std::move(queue)) {}

bool InboundBridge::refill(ChunkQueue::Waker& waker, bool& pending, boost::system::error_code& ec) {
    for (;;) {
        auto r = queue_->TryPop(waker);
        switch (r.status) {
            case ChunkQueue::PopResult::Status::Chunk:
                if (r.chunk.empty()) {
                    continue;
                }
                carry_ = std::move(r.chunk);
                carryPos_ = 0;
                return true;
            case ChunkQueue::PopResult::Status::Pending:
                pending = true;
                return false;
            case ChunkQueue::PopResult::Status::EndOfStream:
                ec = shutdown_.load() ? boost::system::error_code(boost::asio::error::operation_aborted)
                                      : boost::system::error_code(boost::asio::error::eof);
                return false;
            case ChunkQueue::PopResult::Status::Failed:
                ec = r.error;
                return false;
        }
    }
}

InboundBridge::ReadOutcome InboundBridge::TryRead(boost::asio::mutable_buffer buf, ChunkQueue::Waker waker) {
    ReadOutcome out;
    if (shutdown_.load()) {
        out.ec = boost::asio::error::operation_aborted;
        return out;
    }
    if (buf.size() == 0) {
        return out;
    }
    if (Buffered() == 0) {
        carry_.clear();
        carryPos_ = 0;
        if (!refill(waker, out.pending, out.ec)) {
            return out;
        }
    }

    const std::size_t n = std::min(Buffered(), buf.size());
    std::memcpy(buf.data(), carry_.data() + carryPos_, n);
    carryPos_ += n;
    if (carryPos_ == carry_.size()) {
        carry_.clear();
        carryPos_ = 0;
    }
    out.bytes = n;
    return out;
}

InboundBridge::FillOutcome InboundBridge::TryFill(ChunkQueue::Waker waker) {
    FillOutcome out;
    if (shutdown_.load()) {
        out.ec = boost::asio::error::operation_aborted;
        return out;
    }
    if (Buffered() == 0) {
        carry_.clear();
        carryPos_ = 0;
        if (!refill(waker, out.pending, out.ec)) {
            return out;
        }
    }
    out.view = boost::asio::const_buffer(carry_.data() + carryPos_, Buffered());
    return out;
}

void InboundBridge::Consume(std::size_t n) {
    if (n > Buffered()) {
        throw std::out_of_range("InboundBridge::Consume: " + std::to_string(n) + " exceeds " +
                                std::to_string(Buffered()) + " buffered bytes");
    }
    carryPos_ += n;
    if (carryPos_ == carry_.size()) {
        carry_.clear();
        carryPos_ = 0;
    }
}

bool InboundBridge::BeginOperation() {
    bool expected = false;
    return busy_.compare_exchange_strong(expected, true);
}

void InboundBridge::EndOperation() {
    busy_.store(false);
}

void InboundBridge::Shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    LOG_DEBUG("InboundBridge: shutdown with {} buffered bytes discarded", Buffered());
    queue_->Shutdown();
}

} // namespace wsio
