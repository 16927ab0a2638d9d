//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ReadinessSignal.hpp
// Purpose: One-shot "connection is open" signal awaited by the connection bootstrap
//==========================================================================================================
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace wsio {

//==========================================================================================================
// ReadinessSignal
// Purpose: Thread-safe one-shot latch. The first Set() or Fail() decides the outcome; later calls are
//          ignored. One coroutine may Wait() for it.
//==========================================================================================================
class ReadinessSignal : public std::enable_shared_from_this<ReadinessSignal> {
public:
    enum class State { Pending, Fired, Failed };

    // Returns true when this call fired the signal.
    bool Set();

    // Returns true when this call failed the signal.
    bool Fail(const boost::system::error_code& ec);

    State GetState() const;

    //==========================================================================================================
    // Wait
    // Purpose: Suspends the calling coroutine until the signal leaves Pending or the timeout elapses.
    //          A timeout fails the signal with errc::connect_timeout, so a late Set() is ignored.
    // Args:
    //   timeout: Zero waits without a deadline.
    // Returns:
    //   Success when fired; the failure code otherwise.
    // Notes:
    //   The calling coroutine's executor must not run handlers concurrently (io_context with one thread,
    //   or a strand).
    //==========================================================================================================
    boost::asio::awaitable<boost::system::error_code> Wait(std::chrono::milliseconds timeout);

private:
    bool transition(State to, const boost::system::error_code& ec);
    boost::system::error_code resultLocked() const;

    mutable std::mutex mtx_;
    State state_{State::Pending};
    boost::system::error_code error_;
    std::function<void()> waiter_;
};

} // namespace wsio
