//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChunkQueue.cpp
// Purpose: Bounded chunk queue implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <utility>

#include "logging/Logger.h"
#include "wsio/ChunkQueue.hpp"

namespace wsio {

const char* OverflowPolicyString(OverflowPolicy p) {
    switch (p) {
        case OverflowPolicy::Block: return "block";
        case OverflowPolicy::DropNewest: return "drop-newest";
        default: return "unknown";
    }
}

bool ParseOverflowPolicy(const std::string& s, OverflowPolicy& out) {
    std::string v; v.reserve(s.size());
    for (char c : s) v.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (v == "block") {
        out = OverflowPolicy::Block;
        return true;
    }
    if (v == "drop" || v == "drop-newest" || v == "dropnewest") {
        out = OverflowPolicy::DropNewest;
        return true;
    }
    return false;
}

ChunkQueue::ChunkQueue(std::size_t capacity, OverflowPolicy policy)
    : capacity_(std::max<std::size_t>(capacity, 1)), policy_(policy) {}

ChunkQueue::~ChunkQueue() {
    Shutdown();
}

ChunkQueue::Waker ChunkQueue::takeWakerLocked() {
    Waker w = std::move(waker_);
    waker_ = nullptr;
    return w;
}

ChunkQueue::PushResult ChunkQueue::Push(Bytes chunk) {
    Waker w;
    {
        std::unique_lock<std::mutex> lock(mtx_);
        if (state_ != State::Open) {
            return PushResult::Rejected;
        }
        if (chunks_.size() >= capacity_) {
            if (policy_ == OverflowPolicy::DropNewest) {
                ++dropped_;
                LOG_WARN("ChunkQueue: full (capacity={}); dropped {} byte chunk (dropped total={})",
                         capacity_, chunk.size(), dropped_);
                return PushResult::Dropped;
            }
            LOG_DEBUG("ChunkQueue: full (capacity={}); producer waiting", capacity_);
            spaceCv_.wait(lock, [this]() { return chunks_.size() < capacity_ || state_ != State::Open; });
            if (state_ != State::Open) {
                return PushResult::Rejected;
            }
        }
        chunks_.push_back(std::move(chunk));
        w = takeWakerLocked();
    }
    if (w) {
        w();
    }
    return PushResult::Queued;
}

void ChunkQueue::RecordDrop() {
    std::lock_guard<std::mutex> lock(mtx_);
    ++dropped_;
    LOG_WARN("ChunkQueue: producer over capacity (capacity={}); dropped a pending payload (dropped total={})",
             capacity_, dropped_);
}

void ChunkQueue::Close() {
    Waker w;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != State::Open) {
            return;
        }
        state_ = State::Closed;
        w = takeWakerLocked();
    }
    spaceCv_.notify_all();
    if (w) {
        w();
    }
}

void ChunkQueue::Fail(const boost::system::error_code& ec) {
    Waker w;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != State::Open) {
            return;
        }
        state_ = State::Failed;
        failure_ = ec;
        w = takeWakerLocked();
    }
    spaceCv_.notify_all();
    if (w) {
        w();
    }
}

void ChunkQueue::Shutdown() {
    Waker w;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ == State::Shutdown) {
            return;
        }
        state_ = State::Shutdown;
        chunks_.clear();
        w = takeWakerLocked();
    }
    spaceCv_.notify_all();
    if (w) {
        w();
    }
}

ChunkQueue::PopResult ChunkQueue::TryPop(Waker waker) {
    PopResult out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!chunks_.empty()) {
            out.status = PopResult::Status::Chunk;
            out.chunk = std::move(chunks_.front());
            chunks_.pop_front();
        } else if (state_ == State::Open) {
            waker_ = std::move(waker);
            out.status = PopResult::Status::Pending;
            return out;
        } else if (state_ == State::Failed) {
            out.status = PopResult::Status::Failed;
            out.error = failure_;
            return out;
        } else {
            // Closed or Shutdown
            out.status = PopResult::Status::EndOfStream;
            return out;
        }
    }
    spaceCv_.notify_one();
    return out;
}

std::size_t ChunkQueue::Size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return chunks_.size();
}

ChunkQueue::State ChunkQueue::GetState() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

std::uint64_t ChunkQueue::DroppedCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_;
}

} // namespace wsio
