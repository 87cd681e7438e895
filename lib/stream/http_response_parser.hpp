// SPDX-License-Identifier: MIT

// lib/stream/http_response_parser.hpp
#pragma once

#include <llhttp.h>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"

namespace page_stream {

// HttpResponseParser accumulates a single HTTP/1.1 response using llhttp.
//
// Feed bytes with OnData() as they arrive; call OnDone() when the peer
// closes so close-delimited bodies can complete. TakeBody() yields the
// body of a successful (< 300) response or the mapped error.
//
// Not copyable or movable: llhttp keeps a back pointer to this object.
class HttpResponseParser {
public:
    HttpResponseParser();

    HttpResponseParser(const HttpResponseParser&) = delete;
    HttpResponseParser& operator=(const HttpResponseParser&) = delete;

    std::expected<void, Error> OnData(std::string_view data);
    std::expected<void, Error> OnDone();

    bool IsMessageComplete() const { return message_complete_; }
    int StatusCode() const { return status_code_; }
    const std::string& ContentType() const { return content_type_; }

    // True for application/json, any +json media type, or no Content-Type.
    bool IsJsonContentType() const;

    std::expected<std::string, Error> TakeBody();

    static ErrorCode StatusToErrorCode(int status);

    static constexpr size_t kMaxBody = 16 * 1024 * 1024;  // 16MB
    static constexpr size_t kMaxErrorBodySize = 4096;

private:
    static int OnStatus(llhttp_t* parser, const char* at, size_t len);
    static int OnHeaderField(llhttp_t* parser, const char* at, size_t len);
    static int OnHeaderValue(llhttp_t* parser, const char* at, size_t len);
    static int OnHeadersComplete(llhttp_t* parser);
    static int OnBody(llhttp_t* parser, const char* at, size_t len);
    static int OnMessageComplete(llhttp_t* parser);

    void ProcessHeader();
    std::expected<void, Error> CheckErrno(llhttp_errno_t err);

    llhttp_t parser_;
    llhttp_settings_t settings_;

    int status_code_ = 0;
    bool message_complete_ = false;
    bool overflow_ = false;

    // llhttp may split a header across callbacks
    enum class HeaderState { None, Field, Value };
    HeaderState header_state_ = HeaderState::None;
    std::string current_header_field_;
    std::string current_header_value_;
    std::string content_type_;

    std::string body_;
};

}  // namespace page_stream
