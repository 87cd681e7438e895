// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace page_stream {

/// Error codes for page fetches, stream stages and configuration.
enum class ErrorCode {
    // Connection
    ConnectionFailed,      ///< TCP connect or write failed
    ConnectionClosed,      ///< Peer closed before the response completed
    DnsResolutionFailed,   ///< Hostname could not be resolved
    Timeout,               ///< Page request did not finish in time

    // TLS
    TlsHandshakeFailed,    ///< TLS handshake or certificate verification failed

    // Protocol
    ParseError,            ///< HTTP response or JSON body could not be parsed
    BufferOverflow,        ///< Response exceeded size limit

    // HTTP
    HttpError,             ///< Unexpected HTTP status

    // API errors
    Unauthorized,          ///< HTTP 401/403
    NotFound,              ///< HTTP 404
    RateLimited,           ///< HTTP 429
    ServerError,           ///< HTTP 5xx

    // Stream
    InvalidState,          ///< Pull issued while another pull is in flight
    PageLimitExceeded,     ///< Upstream never returned an empty page

    // Config
    InvalidConfig,         ///< Configuration value could not be parsed
};

/// Error payload carried by every failed pull.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
};

/// Return a short category string for an error code (e.g. "connection", "api").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionClosed:
        case ErrorCode::DnsResolutionFailed:
        case ErrorCode::Timeout:
            return "connection";
        case ErrorCode::TlsHandshakeFailed:
            return "tls";
        case ErrorCode::ParseError:
        case ErrorCode::BufferOverflow:
            return "protocol";
        case ErrorCode::HttpError:
            return "http";
        case ErrorCode::Unauthorized:
        case ErrorCode::NotFound:
        case ErrorCode::RateLimited:
        case ErrorCode::ServerError:
            return "api";
        case ErrorCode::InvalidState:
        case ErrorCode::PageLimitExceeded:
            return "stream";
        case ErrorCode::InvalidConfig:
            return "config";
    }
    return "unknown";
}

}  // namespace page_stream
