// SPDX-License-Identifier: MIT

// lib/stream/http_response_parser.cpp
#include "lib/stream/http_response_parser.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>

namespace page_stream {

HttpResponseParser::HttpResponseParser() {
    llhttp_settings_init(&settings_);
    settings_.on_status = OnStatus;
    settings_.on_header_field = OnHeaderField;
    settings_.on_header_value = OnHeaderValue;
    settings_.on_headers_complete = OnHeadersComplete;
    settings_.on_body = OnBody;
    settings_.on_message_complete = OnMessageComplete;

    llhttp_init(&parser_, HTTP_RESPONSE, &settings_);
    parser_.data = this;
}

std::expected<void, Error> HttpResponseParser::OnData(std::string_view data) {
    if (message_complete_ || data.empty()) return {};
    return CheckErrno(llhttp_execute(&parser_, data.data(), data.size()));
}

std::expected<void, Error> HttpResponseParser::OnDone() {
    if (message_complete_) return {};
    // Completes close-delimited bodies; fails on truncated ones
    return CheckErrno(llhttp_finish(&parser_));
}

std::expected<std::string, Error> HttpResponseParser::TakeBody() {
    if (!message_complete_) {
        return std::unexpected(Error{ErrorCode::ConnectionClosed,
            "Connection closed before HTTP response completed"});
    }
    if (status_code_ >= 300) {
        std::string msg = "HTTP " + std::to_string(status_code_);
        if (!body_.empty()) {
            msg += ": " + body_;
        }
        return std::unexpected(Error{StatusToErrorCode(status_code_), std::move(msg)});
    }
    return std::move(body_);
}

ErrorCode HttpResponseParser::StatusToErrorCode(int status) {
    if (status == 401 || status == 403) return ErrorCode::Unauthorized;
    if (status == 404) return ErrorCode::NotFound;
    if (status == 429) return ErrorCode::RateLimited;
    if (status >= 500) return ErrorCode::ServerError;
    return ErrorCode::HttpError;
}

bool HttpResponseParser::IsJsonContentType() const {
    std::string_view media(content_type_);
    media = media.substr(0, media.find(';'));
    while (!media.empty() && (media.back() == ' ' || media.back() == '\t')) {
        media.remove_suffix(1);
    }
    if (media.empty()) return true;

    std::string lower(media);
    for (char& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower == "application/json" || lower.ends_with("+json");
}

std::expected<void, Error> HttpResponseParser::CheckErrno(llhttp_errno_t err) {
    if (err == HPE_OK) return {};
    if (overflow_) {
        return std::unexpected(Error{ErrorCode::BufferOverflow,
            "HTTP body exceeds maximum size (" +
                std::to_string(kMaxBody / (1024 * 1024)) + "MB)"});
    }
    std::string msg = llhttp_errno_name(err);
    if (const char* reason = llhttp_get_error_reason(&parser_)) {
        msg += ": ";
        msg += reason;
    }
    return std::unexpected(Error{ErrorCode::ParseError, std::move(msg)});
}

void HttpResponseParser::ProcessHeader() {
    if (current_header_field_ == "content-type") {
        content_type_ = current_header_value_;
    }
    current_header_field_.clear();
    current_header_value_.clear();
}

int HttpResponseParser::OnStatus(llhttp_t* parser, const char*, size_t) {
    auto* self = static_cast<HttpResponseParser*>(parser->data);
    self->status_code_ = static_cast<int>(parser->status_code);
    return 0;
}

int HttpResponseParser::OnHeaderField(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpResponseParser*>(parser->data);

    if (self->header_state_ == HeaderState::Value) {
        self->ProcessHeader();
    }
    if (self->header_state_ == HeaderState::Field) {
        self->current_header_field_.append(at, len);
    } else {
        self->current_header_field_.assign(at, len);
    }
    self->header_state_ = HeaderState::Field;

    for (char& c : self->current_header_field_) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return 0;
}

int HttpResponseParser::OnHeaderValue(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpResponseParser*>(parser->data);
    if (self->header_state_ == HeaderState::Value) {
        self->current_header_value_.append(at, len);
    } else {
        self->current_header_value_.assign(at, len);
    }
    self->header_state_ = HeaderState::Value;
    return 0;
}

int HttpResponseParser::OnHeadersComplete(llhttp_t* parser) {
    auto* self = static_cast<HttpResponseParser*>(parser->data);
    if (self->header_state_ == HeaderState::Value) {
        self->ProcessHeader();
    }
    self->header_state_ = HeaderState::None;
    return 0;
}

int HttpResponseParser::OnBody(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpResponseParser*>(parser->data);

    // Error bodies are only kept as a message excerpt
    if (self->status_code_ >= 300) {
        size_t remaining = kMaxErrorBodySize - self->body_.size();
        self->body_.append(at, std::min(len, remaining));
        return 0;
    }

    if (len > kMaxBody - self->body_.size()) {
        self->overflow_ = true;
        return HPE_USER;
    }
    self->body_.append(at, len);
    return 0;
}

int HttpResponseParser::OnMessageComplete(llhttp_t* parser) {
    auto* self = static_cast<HttpResponseParser*>(parser->data);
    self->message_complete_ = true;
    return 0;
}

}  // namespace page_stream
