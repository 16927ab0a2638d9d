//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ReadinessSignal.cpp
// Purpose: One-shot open signal implementation (timer-based wait)
//==========================================================================================================

#include "wsio/ReadinessSignal.hpp"

#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "wsio/errors/Errors.h"

namespace wsio {
namespace net = boost::asio;

bool ReadinessSignal::Set() {
    return transition(State::Fired, {});
}

bool ReadinessSignal::Fail(const boost::system::error_code& ec) {
    return transition(State::Failed, ec ? ec : make_error_code(errc::connection_failed));
}

ReadinessSignal::State ReadinessSignal::GetState() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

bool ReadinessSignal::transition(State to, const boost::system::error_code& ec) {
    std::function<void()> waiter;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != State::Pending) {
            return false;
        }
        state_ = to;
        error_ = ec;
        waiter = std::move(waiter_);
        waiter_ = nullptr;
    }
    if (waiter) {
        waiter();
    }
    return true;
}

boost::system::error_code ReadinessSignal::resultLocked() const {
    return state_ == State::Fired ? boost::system::error_code() : error_;
}

net::awaitable<boost::system::error_code> ReadinessSignal::Wait(std::chrono::milliseconds timeout) {
    auto ex = co_await net::this_coro::executor;
    auto timer = std::make_shared<net::steady_timer>(ex);
    if (timeout.count() > 0) {
        timer->expires_after(timeout);
    } else {
        timer->expires_at(net::steady_timer::time_point::max());
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != State::Pending) {
            co_return resultLocked();
        }
        // Moving the expiry into the past completes the wait even if it has not been started yet.
        waiter_ = [timer, ex]() {
            net::post(ex, [timer]() { timer->expires_at(net::steady_timer::time_point::min()); });
        };
    }

    boost::system::error_code waitEc;
    co_await timer->async_wait(net::redirect_error(net::use_awaitable, waitEc));

    if (transition(State::Failed, make_error_code(errc::connect_timeout))) {
        LOG_WARN("ReadinessSignal: no open event within {} ms", timeout.count());
    }
    std::lock_guard<std::mutex> lock(mtx_);
    waiter_ = nullptr;
    co_return resultLocked();
}

} // namespace wsio
