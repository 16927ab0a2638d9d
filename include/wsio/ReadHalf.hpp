//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ReadHalf.hpp
// Purpose: Read half of a split connection, usable as a Boost.Asio AsyncReadStream
//==========================================================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/execution/outstanding_work.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/system/error_code.hpp>

#include "wsio/InboundBridge.hpp"
#include "wsio/TransportLease.hpp"
#include "wsio/errors/Errors.h"

namespace wsio {

namespace detail {

// One read_some attempt into the first non-empty buffer.
struct ReadSomeAttempt {
    using result_type = std::tuple<boost::system::error_code, std::size_t>;

    boost::asio::mutable_buffer buffer;

    std::optional<result_type> operator()(InboundBridge& bridge, ChunkQueue::Waker waker) const {
        auto r = bridge.TryRead(buffer, std::move(waker));
        if (r.pending) {
            return std::nullopt;
        }
        return result_type{r.ec, r.bytes};
    }

    static result_type Failed(const boost::system::error_code& ec) { return result_type{ec, 0}; }
};

// One fill_buffer attempt.
struct FillAttempt {
    using result_type = std::tuple<boost::system::error_code, boost::asio::const_buffer>;

    std::optional<result_type> operator()(InboundBridge& bridge, ChunkQueue::Waker waker) const {
        auto r = bridge.TryFill(std::move(waker));
        if (r.pending) {
            return std::nullopt;
        }
        return result_type{r.ec, r.view};
    }

    static result_type Failed(const boost::system::error_code& ec) {
        return result_type{ec, boost::asio::const_buffer()};
    }
};

//==========================================================================================================
// BridgeOp
// Purpose: Asynchronous operation over an InboundBridge. Retries its attempt on the reader's executor each
//          time the queue wakes it, then posts the result to the handler's associated executor.
//          Holds outstanding work on the reader's executor while parked.
//==========================================================================================================
template <typename Handler, typename Attempt>
class BridgeOp : public std::enable_shared_from_this<BridgeOp<Handler, Attempt>> {
public:
    BridgeOp(Handler handler, const boost::asio::any_io_executor& ex, std::shared_ptr<InboundBridge> bridge,
             Attempt attempt)
        : handler_(std::move(handler)),
          work_(boost::asio::prefer(ex, boost::asio::execution::outstanding_work.tracked)),
          bridge_(std::move(bridge)),
          attempt_(std::move(attempt)) {}

    void Start() {
        if (!bridge_) {
            complete(Attempt::Failed(boost::asio::error::bad_descriptor));
            return;
        }
        if (!bridge_->BeginOperation()) {
            complete(Attempt::Failed(make_error_code(errc::read_in_progress)));
            return;
        }
        step();
    }

private:
    void step() {
        auto self = this->shared_from_this();
        ChunkQueue::Waker waker = [self]() {
            boost::asio::post(self->work_, [self]() { self->step(); });
        };
        auto result = attempt_(*bridge_, std::move(waker));
        if (!result) {
            return;
        }
        bridge_->EndOperation();
        complete(std::move(*result));
    }

    void complete(typename Attempt::result_type result) {
        auto ex = boost::asio::get_associated_executor(handler_, work_);
        boost::asio::post(ex, [h = std::move(handler_), r = std::move(result)]() mutable {
            std::apply(std::move(h), std::move(r));
        });
    }

    Handler handler_;
    boost::asio::any_io_executor work_;
    std::shared_ptr<InboundBridge> bridge_;
    Attempt attempt_;
};

template <typename MutableBufferSequence>
boost::asio::mutable_buffer firstNonEmpty(const MutableBufferSequence& buffers) {
    auto it = boost::asio::buffer_sequence_begin(buffers);
    auto end = boost::asio::buffer_sequence_end(buffers);
    for (; it != end; ++it) {
        boost::asio::mutable_buffer b(*it);
        if (b.size() != 0) {
            return b;
        }
    }
    return boost::asio::mutable_buffer();
}

} // namespace detail

//==========================================================================================================
// ReadHalf
// Purpose: Pull-based byte reader over the inbound chunk queue of one connection.
// Notes:
//   - Models AsyncReadStream, so boost::asio::async_read / async_read_until work on it.
//   - One operation may be outstanding at a time; a second one fails with errc::read_in_progress.
//   - End of stream is boost::asio::error::eof; a transport failure after open is errc::transport_error and
//     is reported only after every byte received before it has been read.
//   - Destroying the half aborts a pending operation (operation_aborted) and stops the queue. The transport
//     stays open while the write half lives.
//==========================================================================================================
class ReadHalf {
public:
    using executor_type = boost::asio::any_io_executor;

    ReadHalf(executor_type ex, std::shared_ptr<InboundBridge> bridge, std::shared_ptr<TransportLease> lease);
    ~ReadHalf();

    ReadHalf(ReadHalf&& other) noexcept = default;
    ReadHalf& operator=(ReadHalf&& other) noexcept;
    ReadHalf(const ReadHalf&) = delete;
    ReadHalf& operator=(const ReadHalf&) = delete;

    executor_type get_executor() const noexcept { return ex_; }

    //==========================================================================================================
    // async_read_some
    // Purpose: Reads up to buffer_size(buffers) bytes (into the first non-empty buffer). Completes with fewer
    //          bytes at a chunk boundary. Suspends only when nothing is buffered and nothing is queued.
    // Completion signature:
    //   void(boost::system::error_code, std::size_t)
    //==========================================================================================================
    template <typename MutableBufferSequence, typename ReadToken>
    auto async_read_some(const MutableBufferSequence& buffers, ReadToken&& token) {
        return boost::asio::async_initiate<ReadToken, void(boost::system::error_code, std::size_t)>(
            [this](auto handler, const MutableBufferSequence& bufs) {
                start(std::move(handler), detail::ReadSomeAttempt{detail::firstNonEmpty(bufs)});
            },
            token, buffers);
    }

    //==========================================================================================================
    // async_fill_buffer
    // Purpose: Completes with a view of the buffered, unconsumed bytes, refilling from the queue when empty.
    //          Calling it again without consume() yields the same view.
    // Completion signature:
    //   void(boost::system::error_code, boost::asio::const_buffer)
    //==========================================================================================================
    template <typename FillToken>
    auto async_fill_buffer(FillToken&& token) {
        return boost::asio::async_initiate<FillToken, void(boost::system::error_code, boost::asio::const_buffer)>(
            [this](auto handler) { start(std::move(handler), detail::FillAttempt{}); }, token);
    }

    //==========================================================================================================
    // consume
    // Purpose: Marks n bytes of the last fill view as used.
    // Throws:
    //   std::out_of_range when n > buffered().
    //==========================================================================================================
    void consume(std::size_t n);

    std::size_t buffered() const;

    // Chunks discarded by OverflowPolicy::DropNewest.
    std::uint64_t dropped_chunks() const;

private:
    template <typename Handler, typename Attempt>
    void start(Handler handler, Attempt attempt) {
        using Op = detail::BridgeOp<Handler, Attempt>;
        auto op = std::make_shared<Op>(std::move(handler), ex_, bridge_, std::move(attempt));
        op->Start();
    }

    void release();

    executor_type ex_;
    std::shared_ptr<InboundBridge> bridge_;
    std::shared_ptr<TransportLease> lease_;
};

} // namespace wsio
