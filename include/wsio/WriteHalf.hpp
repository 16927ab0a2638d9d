//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WriteHalf.hpp
// Purpose: Write half of a split connection, usable as a Boost.Asio AsyncWriteStream
//==========================================================================================================
#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>

#include "wsio/TransportLease.hpp"
#include "wsio/Transport.h"

namespace wsio {

//==========================================================================================================
// WriteHalf
// Purpose: Non-buffering writer. Each write hands the whole buffer sequence to the transport as one message
//          and completes with its full length, or fails without partial progress.
// Notes:
//   - Never suspends on the transport; completions are posted to the handler's executor.
//   - Errors: errc::not_open (connecting/closed transport), errc::send_failed.
//==========================================================================================================
class WriteHalf {
public:
    using executor_type = boost::asio::any_io_executor;

    WriteHalf(executor_type ex, std::shared_ptr<TransportLease> lease);
    ~WriteHalf();

    WriteHalf(WriteHalf&&) noexcept = default;
    WriteHalf& operator=(WriteHalf&&) noexcept = default;
    WriteHalf(const WriteHalf&) = delete;
    WriteHalf& operator=(const WriteHalf&) = delete;

    executor_type get_executor() const noexcept { return ex_; }

    //==========================================================================================================
    // async_write_some
    // Completion signature:
    //   void(boost::system::error_code, std::size_t) with the full buffer_size(buffers) on success.
    //==========================================================================================================
    template <typename ConstBufferSequence, typename WriteToken>
    auto async_write_some(const ConstBufferSequence& buffers, WriteToken&& token) {
        return boost::asio::async_initiate<WriteToken, void(boost::system::error_code, std::size_t)>(
            [this](auto handler, const ConstBufferSequence& bufs) {
                std::size_t written = 0;
                boost::system::error_code ec = sendBuffers(bufs, written);
                postCompletion(std::move(handler), ec, written);
            },
            token, buffers);
    }

    // Completion signature: void(boost::system::error_code). Always succeeds; nothing is buffered here.
    template <typename FlushToken>
    auto async_flush(FlushToken&& token) {
        return boost::asio::async_initiate<FlushToken, void(boost::system::error_code)>(
            [this](auto handler) { postCompletion(std::move(handler), boost::system::error_code()); }, token);
    }

    // Completion signature: void(boost::system::error_code). Best effort; always succeeds.
    template <typename CloseToken>
    auto async_close(CloseToken&& token) {
        return boost::asio::async_initiate<CloseToken, void(boost::system::error_code)>(
            [this](auto handler) {
                Close();
                postCompletion(std::move(handler), boost::system::error_code());
            },
            token);
    }

    //==========================================================================================================
    // Write
    // Purpose: Synchronous form of async_write_some for one contiguous buffer.
    // Returns:
    //   Success, or the send error; bytes_written is buffer.size() on success, 0 otherwise.
    //==========================================================================================================
    boost::system::error_code Write(boost::asio::const_buffer buffer, std::size_t& bytes_written);

    // Initiates transport teardown. Idempotent.
    void Close();

private:
    template <typename ConstBufferSequence>
    boost::system::error_code sendBuffers(const ConstBufferSequence& buffers, std::size_t& written) {
        written = 0;
        const std::size_t total = boost::asio::buffer_size(buffers);
        if (total == 0) {
            return {};
        }
        auto first = boost::asio::buffer_sequence_begin(buffers);
        if (std::next(first) == boost::asio::buffer_sequence_end(buffers)) {
            return Write(boost::asio::const_buffer(*first), written);
        }
        // Gather a multi-buffer write into one message.
        Bytes joined(total);
        boost::asio::buffer_copy(boost::asio::buffer(joined), buffers);
        return Write(boost::asio::buffer(joined), written);
    }

    template <typename Handler, typename... Args>
    void postCompletion(Handler handler, Args... args) {
        auto ex = boost::asio::get_associated_executor(handler, ex_);
        boost::asio::post(ex, [h = std::move(handler), args...]() mutable { h(args...); });
    }

    executor_type ex_;
    std::shared_ptr<TransportLease> lease_;
};

} // namespace wsio
