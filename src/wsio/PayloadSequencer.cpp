//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PayloadSequencer.cpp
// Purpose: In-order, capacity-bounded release of (possibly deferred) message payloads into the chunk queue
//==========================================================================================================

#include <exception>
#include <utility>

#include <boost/asio/post.hpp>

#include "logging/Logger.h"
#include "wsio/PayloadSequencer.hpp"

namespace wsio {

PayloadSequencer::PayloadSequencer(std::shared_ptr<ChunkQueue> queue) : queue_(std::move(queue)) {}

PayloadSequencer::~PayloadSequencer() {
    if (decodePool_) {
        decodePool_->join();
    }
}

void PayloadSequencer::Submit(IncomingMessage message) {
    if (message.type != MessageType::Binary) {
        LOG_DEBUG("PayloadSequencer: skipping non-binary message");
        std::lock_guard<std::mutex> lock(mtx_);
        ++skipped_;
        return;
    }

    std::uint64_t ticket = 0;
    {
        std::unique_lock<std::mutex> lock(mtx_);
        if (finished_) {
            LOG_DEBUG("PayloadSequencer: message after end of stream ignored");
            return;
        }
        const std::size_t limit = queue_->Capacity();
        if (inFlightLocked() >= limit) {
            if (queue_->Policy() == OverflowPolicy::DropNewest) {
                lock.unlock();
                queue_->RecordDrop();
                return;
            }
            LOG_DEBUG("PayloadSequencer: {} payloads in flight; producer waiting", inFlightLocked());
            slotCv_.wait(lock, [this, limit]() { return inFlightLocked() < limit; });
        }
        ticket = nextTicket_++;
        if (!message.payload.IsReady() && !decodePool_) {
            decodePool_ = std::make_unique<boost::asio::thread_pool>(DecodeThreads);
        }
    }

    if (message.payload.IsReady()) {
        Entry e;
        e.kind = Entry::Kind::Data;
        e.bytes = message.payload.Take();
        complete(ticket, std::move(e));
        return;
    }

    // Decode off the event thread so later events keep flowing; the ticket keeps the order.
    boost::asio::post(*decodePool_, [this, ticket, payload = std::move(message.payload)]() mutable {
        Entry e;
        try {
            e.bytes = payload.Take();
            e.kind = Entry::Kind::Data;
        } catch (const std::exception& ex) {
            LOG_WARN("PayloadSequencer: payload decode failed (ticket={}): {}", ticket, ex.what());
            e.kind = Entry::Kind::Skip;
        }
        complete(ticket, std::move(e));
    });
}

void PayloadSequencer::Finish(const boost::system::error_code& ec) {
    Entry e;
    e.kind = ec ? Entry::Kind::Fail : Entry::Kind::Close;
    e.error = ec;
    std::uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (finished_) {
            return;
        }
        finished_ = true;
        ticket = nextTicket_++;
    }
    complete(ticket, std::move(e));
}

void PayloadSequencer::complete(std::uint64_t ticket, Entry entry) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        completed_.emplace(ticket, std::move(entry));
        if (releasing_) {
            return;
        }
        releasing_ = true;
    }

    // Single releaser at a time; Push() may block under OverflowPolicy::Block, which is the backpressure point.
    // A ticket stays in flight until its Push() returns.
    for (;;) {
        Entry next;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = completed_.find(nextRelease_);
            if (it == completed_.end()) {
                releasing_ = false;
                return;
            }
            next = std::move(it->second);
            completed_.erase(it);
        }

        bool skipped = false;
        switch (next.kind) {
            case Entry::Kind::Data:
                if (next.bytes.empty()) {
                    skipped = true;
                    break;
                }
                if (queue_->Push(std::move(next.bytes)) == ChunkQueue::PushResult::Rejected) {
                    LOG_DEBUG("PayloadSequencer: queue no longer accepting; chunk discarded");
                }
                break;
            case Entry::Kind::Skip:
                skipped = true;
                break;
            case Entry::Kind::Close:
                queue_->Close();
                break;
            case Entry::Kind::Fail:
                queue_->Fail(next.error);
                break;
        }

        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (skipped) {
                ++skipped_;
            }
            ++nextRelease_;
        }
        slotCv_.notify_all();
    }
}

std::uint64_t PayloadSequencer::SkippedCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return skipped_;
}

std::size_t PayloadSequencer::InFlight() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return inFlightLocked();
}

} // namespace wsio
