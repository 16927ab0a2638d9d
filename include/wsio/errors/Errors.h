//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: wsio error codes, their boost::system category and the Connection/Send/Transport classification
//==========================================================================================================

#pragma once

#include <string>
#include <type_traits>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace wsio {

// Error codes produced by wsio. Zero is reserved for success.
enum class errc {
    connection_failed = 1,
    connect_timeout,
    connection_closed_before_open,
    invalid_url,
    not_open,
    send_failed,
    transport_error,
    read_in_progress
};

namespace errors {

// Coarse classification used by callers that only care which stage failed.
enum class ErrorKind {
    None,
    Connection,
    Send,
    Transport,
    Usage,
    Unknown
};

class StreamErrorCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "wsio.stream"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::connection_failed: return "connection failed";
            case errc::connect_timeout: return "timed out waiting for the connection to open";
            case errc::connection_closed_before_open: return "connection closed before it opened";
            case errc::invalid_url: return "invalid url";
            case errc::not_open: return "transport is not open";
            case errc::send_failed: return "send failed";
            case errc::transport_error: return "transport error";
            case errc::read_in_progress: return "a read operation is already in progress";
            default: return "unknown wsio error";
        }
    }
};

inline const boost::system::error_category& streamCategory() {
    static const StreamErrorCategory category;
    return category;
}

//==========================================================================================================
// errorKindFromCode
// Purpose: Maps an error_code to its ErrorKind.
// Args:
//   ec: Any error_code; codes outside the wsio category map to Unknown (or None when ec is success).
// Returns:
//   ErrorKind for the code.
//==========================================================================================================
inline ErrorKind errorKindFromCode(const boost::system::error_code& ec) {
    if (!ec) {
        return ErrorKind::None;
    }
    if (ec.category() != streamCategory()) {
        return ErrorKind::Unknown;
    }
    switch (static_cast<errc>(ec.value())) {
        case errc::connection_failed:
        case errc::connect_timeout:
        case errc::connection_closed_before_open:
        case errc::invalid_url:
            return ErrorKind::Connection;
        case errc::not_open:
        case errc::send_failed:
            return ErrorKind::Send;
        case errc::transport_error:
            return ErrorKind::Transport;
        case errc::read_in_progress:
            return ErrorKind::Usage;
        default:
            return ErrorKind::Unknown;
    }
}

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Connection: return "ConnectionError";
        case ErrorKind::Send: return "SendError";
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::Usage: return "UsageError";
        default: return "unknown";
    }
}

} // namespace errors

inline boost::system::error_code make_error_code(errc e) {
    return boost::system::error_code(static_cast<int>(e), errors::streamCategory());
}

} // namespace wsio

namespace boost {
namespace system {
template <>
struct is_error_code_enum<wsio::errc> : std::true_type {};
} // namespace system
} // namespace boost
