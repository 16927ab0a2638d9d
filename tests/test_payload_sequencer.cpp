//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_payload_sequencer.cpp
// Purpose: Delivery-order release of ready and deferred payloads
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

#include "wsio/PayloadSequencer.hpp"
#include "wsio/errors/Errors.h"
#include "support/TestSupport.hpp"

using namespace wsio;
using wsio::test::B;
using Status = ChunkQueue::PopResult::Status;

namespace {

IncomingMessage binary(Bytes b) {
    IncomingMessage m;
    m.type = MessageType::Binary;
    m.payload = Payload::Ready(std::move(b));
    return m;
}

IncomingMessage deferred(std::future<Bytes> f) {
    IncomingMessage m;
    m.type = MessageType::Binary;
    m.payload = Payload::Deferred(std::move(f));
    return m;
}

// Pops with a deadline so deferred decodes have time to land.
ChunkQueue::PopResult popWithin(ChunkQueue& q, std::chrono::milliseconds limit = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    for (;;) {
        auto r = q.TryPop(nullptr);
        if (r.status != Status::Pending || std::chrono::steady_clock::now() > deadline) {
            return r;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

} // namespace

TEST(PayloadSequencer, DeferredDecodesKeepDeliveryOrder) {
    auto q = std::make_shared<ChunkQueue>(8);
    auto seq = std::make_shared<PayloadSequencer>(q);

    std::promise<Bytes> slow;
    seq->Submit(deferred(slow.get_future()));
    seq->Submit(binary(B({2})));
    std::promise<Bytes> fast;
    seq->Submit(deferred(fast.get_future()));
    fast.set_value(B({3}));

    // Nothing may overtake the first, still-decoding payload.
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(q->Size(), 0u);

    slow.set_value(B({1}));
    EXPECT_EQ(popWithin(*q).chunk, B({1}));
    EXPECT_EQ(popWithin(*q).chunk, B({2}));
    EXPECT_EQ(popWithin(*q).chunk, B({3}));
}

TEST(PayloadSequencer, SkipsTextEmptyAndFailedDecodes) {
    auto q = std::make_shared<ChunkQueue>(8);
    auto seq = std::make_shared<PayloadSequencer>(q);

    IncomingMessage text;
    text.type = MessageType::Text;
    text.payload = Payload::Ready(B({'h', 'i'}));
    seq->Submit(std::move(text));
    seq->Submit(binary(Bytes{}));
    std::promise<Bytes> broken;
    seq->Submit(deferred(broken.get_future()));
    broken.set_exception(std::make_exception_ptr(std::runtime_error("unreadable blob")));
    seq->Submit(binary(B({9})));
    seq->Finish({});

    EXPECT_EQ(popWithin(*q).chunk, B({9}));
    EXPECT_EQ(popWithin(*q).status, Status::EndOfStream);
    EXPECT_EQ(seq->SkippedCount(), 3u);
}

TEST(PayloadSequencer, FailureWaitsForEarlierPayloads) {
    auto q = std::make_shared<ChunkQueue>(8);
    auto seq = std::make_shared<PayloadSequencer>(q);

    std::promise<Bytes> pending;
    seq->Submit(deferred(pending.get_future()));
    seq->Finish(make_error_code(errc::transport_error));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(q->GetState(), ChunkQueue::State::Open);

    pending.set_value(B({5, 5}));
    EXPECT_EQ(popWithin(*q).chunk, B({5, 5}));
    auto end = popWithin(*q);
    EXPECT_EQ(end.status, Status::Failed);
    EXPECT_EQ(end.error, make_error_code(errc::transport_error));
}

TEST(PayloadSequencer, MessagesAfterFinishAreIgnored) {
    auto q = std::make_shared<ChunkQueue>(8);
    auto seq = std::make_shared<PayloadSequencer>(q);
    seq->Finish({});
    seq->Submit(binary(B({1})));
    seq->Finish(make_error_code(errc::transport_error));
    EXPECT_EQ(popWithin(*q).status, Status::EndOfStream);
}

TEST(PayloadSequencer, BlockPolicySuspendsProducerAtCapacity) {
    auto q = std::make_shared<ChunkQueue>(1, OverflowPolicy::Block);
    auto seq = std::make_shared<PayloadSequencer>(q);
    constexpr int kMessages = 200;

    std::atomic<int> submitted{0};
    std::thread producer([&]() {
        for (int i = 0; i < kMessages; ++i) {
            std::promise<Bytes> p;
            p.set_value(Bytes(1024, static_cast<std::uint8_t>(i)));
            seq->Submit(deferred(p.get_future()));
            ++submitted;
        }
    });

    // No reader: the producer must stall with one chunk queued and at most one payload in flight.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_LT(submitted.load(), kMessages);
    EXPECT_EQ(q->Size(), 1u);
    EXPECT_LE(seq->InFlight(), 1u);

    for (int i = 0; i < kMessages; ++i) {
        auto r = popWithin(*q);
        ASSERT_EQ(r.status, Status::Chunk) << "chunk " << i;
        ASSERT_EQ(r.chunk.size(), 1024u);
        EXPECT_EQ(r.chunk.front(), static_cast<std::uint8_t>(i));
        EXPECT_LE(q->Size() + seq->InFlight(), 2u);
    }
    producer.join();
    EXPECT_EQ(submitted.load(), kMessages);
    EXPECT_EQ(q->DroppedCount(), 0u);
}

TEST(PayloadSequencer, DropNewestDiscardsBeyondCapacity) {
    auto q = std::make_shared<ChunkQueue>(1, OverflowPolicy::DropNewest);
    auto seq = std::make_shared<PayloadSequencer>(q);

    std::promise<Bytes> first;
    seq->Submit(deferred(first.get_future()));
    for (int i = 0; i < 3; ++i) {
        std::promise<Bytes> p;
        p.set_value(B({9}));
        seq->Submit(deferred(p.get_future()));
    }
    EXPECT_EQ(q->DroppedCount(), 3u);
    EXPECT_EQ(seq->InFlight(), 1u);

    first.set_value(B({1}));
    EXPECT_EQ(popWithin(*q).chunk, B({1}));
    seq->Finish({});
    EXPECT_EQ(popWithin(*q).status, Status::EndOfStream);
}
