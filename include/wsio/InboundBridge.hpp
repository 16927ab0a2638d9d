//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InboundBridge.hpp
// Purpose: Byte-oriented read, peek and consume over a queue of variable-sized chunks
//==========================================================================================================
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>

#include "wsio/ChunkQueue.hpp"

namespace wsio {

//==========================================================================================================
// InboundBridge
// Purpose: Consumer side of a ChunkQueue plus the carry-over buffer holding the unread tail of the last
//          dequeued chunk. The carry-over is always drained before another chunk is taken.
// Notes:
//   - Not thread-safe: one reader drives it. Only the wakers it parks on the queue cross threads.
//   - Try* calls never block. A pending outcome means the waker was parked on the queue.
//==========================================================================================================
class InboundBridge {
public:
    struct ReadOutcome {
        bool pending{false};
        boost::system::error_code ec;
        std::size_t bytes{0};
    };

    struct FillOutcome {
        bool pending{false};
        boost::system::error_code ec;
        boost::asio::const_buffer view;
    };

    explicit InboundBridge(std::shared_ptr<ChunkQueue> queue);

    InboundBridge(const InboundBridge&) = delete;
    InboundBridge& operator=(const InboundBridge&) = delete;

    //==========================================================================================================
    // TryRead
    // Purpose: Copies up to buf.size() bytes. Serves the carry-over first; otherwise takes exactly one chunk,
    //          copying what fits and stashing the rest. Never spans two chunks, so a short read marks a chunk
    //          boundary.
    // Returns:
    //   pending when nothing is available yet (waker parked); eof when the producer finished and everything
    //   was read; the producer's error when it failed; operation_aborted after Shutdown().
    //==========================================================================================================
    ReadOutcome TryRead(boost::asio::mutable_buffer buf, ChunkQueue::Waker waker);

    //==========================================================================================================
    // TryFill
    // Purpose: Returns a view of all buffered, unconsumed bytes, refilling from the next chunk when empty.
    //          The view stays valid until the next Consume() or TryRead().
    //==========================================================================================================
    FillOutcome TryFill(ChunkQueue::Waker waker);

    //==========================================================================================================
    // Consume
    // Purpose: Discards the first n buffered bytes.
    // Throws:
    //   std::out_of_range when n exceeds Buffered().
    //==========================================================================================================
    void Consume(std::size_t n);

    std::size_t Buffered() const { return carry_.size() - carryPos_; }

    // One outstanding asynchronous operation at a time.
    bool BeginOperation();
    void EndOperation();

    // Reader is gone: stop the queue, fail further reads with operation_aborted.
    void Shutdown();
    bool IsShutdown() const { return shutdown_.load(); }

    const std::shared_ptr<ChunkQueue>& Queue() const { return queue_; }

private:
    // Pops until a non-empty chunk or a terminal/pending outcome. Returns true when carry_ was refilled.
    bool refill(ChunkQueue::Waker& waker, bool& pending, boost::system::error_code& ec);

    std::shared_ptr<ChunkQueue> queue_;
    Bytes carry_;
    std::size_t carryPos_{0};
    std::atomic<bool> busy_{false};
    std::atomic<bool> shutdown_{false};
};

} // namespace wsio
