// SPDX-License-Identifier: MIT

// tests/error_test.cpp
#include <cerrno>

#include <gtest/gtest.h>

#include "lib/stream/error.hpp"

using namespace page_stream;

TEST(ErrorTest, Construction) {
    Error err{ErrorCode::ServerError, "HTTP 503"};
    EXPECT_EQ(err.code, ErrorCode::ServerError);
    EXPECT_EQ(err.message, "HTTP 503");
    EXPECT_EQ(err.os_errno, 0);
}

TEST(ErrorTest, WithErrno) {
    Error err{ErrorCode::ConnectionFailed, "connection refused", ECONNREFUSED};
    EXPECT_EQ(err.code, ErrorCode::ConnectionFailed);
    EXPECT_EQ(err.os_errno, ECONNREFUSED);
}

TEST(ErrorTest, CategoryString) {
    EXPECT_EQ(error_category(ErrorCode::ConnectionFailed), "connection");
    EXPECT_EQ(error_category(ErrorCode::ConnectionClosed), "connection");
    EXPECT_EQ(error_category(ErrorCode::DnsResolutionFailed), "connection");
    EXPECT_EQ(error_category(ErrorCode::Timeout), "connection");

    EXPECT_EQ(error_category(ErrorCode::TlsHandshakeFailed), "tls");

    EXPECT_EQ(error_category(ErrorCode::ParseError), "protocol");
    EXPECT_EQ(error_category(ErrorCode::BufferOverflow), "protocol");

    EXPECT_EQ(error_category(ErrorCode::HttpError), "http");

    EXPECT_EQ(error_category(ErrorCode::Unauthorized), "api");
    EXPECT_EQ(error_category(ErrorCode::NotFound), "api");
    EXPECT_EQ(error_category(ErrorCode::RateLimited), "api");
    EXPECT_EQ(error_category(ErrorCode::ServerError), "api");

    EXPECT_EQ(error_category(ErrorCode::InvalidState), "stream");
    EXPECT_EQ(error_category(ErrorCode::PageLimitExceeded), "stream");

    EXPECT_EQ(error_category(ErrorCode::InvalidConfig), "config");
}

TEST(ErrorTest, CategoryIsConstexpr) {
    static_assert(error_category(ErrorCode::Timeout) == "connection");
    static_assert(error_category(ErrorCode::PageLimitExceeded) == "stream");
    SUCCEED();
}
