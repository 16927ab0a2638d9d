//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChunkQueue.hpp
// Purpose: Bounded FIFO of received chunks between a transport thread (producer) and one reader (consumer)
//==========================================================================================================
#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

#include <boost/system/error_code.hpp>

#include "wsio/Transport.h"

namespace wsio {

// What a producer does when the queue is full.
enum class OverflowPolicy {
    Block,      // wait until the reader frees a slot (no loss)
    DropNewest  // discard the incoming chunk and count it
};

const char* OverflowPolicyString(OverflowPolicy p);
bool ParseOverflowPolicy(const std::string& s, OverflowPolicy& out);

//==========================================================================================================
// ChunkQueue
// Purpose: Capacity-limited chunk queue with an explicit state tag so that "nothing yet", "finished" and
//          "failed" are distinct outcomes for the reader.
// Notes:
//   - Any number of producer threads; exactly one consumer.
//   - The consumer never blocks: TryPop() either yields an outcome or parks a waker that the next state
//     change invokes exactly once (from the producer's thread, outside the lock).
//==========================================================================================================
class ChunkQueue {
public:
    static constexpr std::size_t DefaultCapacity = 4;

    enum class State {
        Open,     // accepting chunks
        Closed,   // producer finished; drains to end-of-stream
        Failed,   // producer failed; drains to the stored error
        Shutdown  // consumer gone; everything is discarded
    };

    enum class PushResult {
        Queued,
        Dropped,   // full under DropNewest
        Rejected   // not accepting (closed, failed or shut down)
    };

    struct PopResult {
        enum class Status { Chunk, Pending, EndOfStream, Failed };
        Status status{Status::Pending};
        Bytes chunk;
        boost::system::error_code error;
    };

    using Waker = std::function<void()>;

    explicit ChunkQueue(std::size_t capacity = DefaultCapacity, OverflowPolicy policy = OverflowPolicy::Block);
    ~ChunkQueue();

    ChunkQueue(const ChunkQueue&) = delete;
    ChunkQueue& operator=(const ChunkQueue&) = delete;

    ////////////////////////////////////////// Producer side //////////////////////////////////////////
    //==========================================================================================================
    // Push
    // Purpose: Appends a chunk. Under OverflowPolicy::Block a full queue makes the calling thread wait until
    //          the consumer pops or the queue stops accepting.
    //==========================================================================================================
    PushResult Push(Bytes chunk);

    // Counts a payload the producer discarded before it reached the queue (DropNewest upstream of Push).
    void RecordDrop();

    // Producer finished cleanly. Buffered chunks stay readable.
    void Close();

    // Producer failed. Buffered chunks stay readable, then the reader observes ec.
    void Fail(const boost::system::error_code& ec);

    ////////////////////////////////////////// Consumer side //////////////////////////////////////////
    //==========================================================================================================
    // TryPop
    // Purpose: Takes the oldest chunk. When nothing is available and the queue is still open, stores waker
    //          (replacing any previous one) and returns Pending.
    //==========================================================================================================
    PopResult TryPop(Waker waker);

    // Consumer is going away: discard chunks, release blocked producers, wake a parked waker.
    void Shutdown();

    ////////////////////////////////////////// Introspection //////////////////////////////////////////
    std::size_t Capacity() const { return capacity_; }
    OverflowPolicy Policy() const { return policy_; }
    std::size_t Size() const;
    State GetState() const;
    std::uint64_t DroppedCount() const;

private:
    Waker takeWakerLocked();

    const std::size_t capacity_;
    const OverflowPolicy policy_;

    mutable std::mutex mtx_;
    std::condition_variable spaceCv_;
    std::deque<Bytes> chunks_;
    State state_{State::Open};
    boost::system::error_code failure_;
    Waker waker_;
    std::uint64_t dropped_{0};
};

} // namespace wsio
