//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PayloadSequencer.hpp
// Purpose: Feeds message payloads into a ChunkQueue in delivery order while deferred decodes run in parallel
//==========================================================================================================
#pragma once

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include <boost/asio/thread_pool.hpp>
#include <boost/system/error_code.hpp>

#include "wsio/ChunkQueue.hpp"
#include "wsio/Transport.h"

namespace wsio {

//==========================================================================================================
// PayloadSequencer
// Purpose: Message-event sink. Every accepted event takes a ticket; entries are released to the queue in
//          ticket order no matter which decode finishes first. End-of-stream and failure are ticketed too, so
//          they never overtake payloads delivered before them.
// Notes:
//   - Submit()/Finish() must be called in delivery order (the transport's event thread guarantees this).
//   - Text messages, empty payloads and failed decodes are skipped.
//   - At most queue->Capacity() payloads are in flight (decoding, parked or being pushed). Beyond that
//     Submit() waits under OverflowPolicy::Block and drops the payload under OverflowPolicy::DropNewest.
//   - Deferred decodes run on a small pool owned by the sequencer; the destructor joins it.
//==========================================================================================================
class PayloadSequencer {
public:
    static constexpr std::size_t DecodeThreads = 2;

    explicit PayloadSequencer(std::shared_ptr<ChunkQueue> queue);
    ~PayloadSequencer();

    PayloadSequencer(const PayloadSequencer&) = delete;
    PayloadSequencer& operator=(const PayloadSequencer&) = delete;

    //==========================================================================================================
    // Submit
    // Purpose: Accepts one message event. Blocks the calling (event) thread while the in-flight limit is
    //          reached under OverflowPolicy::Block.
    //==========================================================================================================
    void Submit(IncomingMessage message);

    // Ends the stream after everything submitted so far: clean end when ec is success, failure otherwise.
    void Finish(const boost::system::error_code& ec);

    std::uint64_t SkippedCount() const;

    // Payloads accepted but not yet handed to the queue.
    std::size_t InFlight() const;

private:
    struct Entry {
        enum class Kind { Data, Skip, Close, Fail };
        Kind kind{Kind::Skip};
        Bytes bytes;
        boost::system::error_code error;
    };

    std::size_t inFlightLocked() const { return static_cast<std::size_t>(nextTicket_ - nextRelease_); }
    void complete(std::uint64_t ticket, Entry entry);

    std::shared_ptr<ChunkQueue> queue_;
    std::unique_ptr<boost::asio::thread_pool> decodePool_;

    mutable std::mutex mtx_;
    std::condition_variable slotCv_;
    std::uint64_t nextTicket_{0};
    std::uint64_t nextRelease_{0};
    std::map<std::uint64_t, Entry> completed_;
    bool releasing_{false};
    bool finished_{false};
    std::uint64_t skipped_{0};
};

} // namespace wsio
