// SPDX-License-Identifier: MIT

// lib/stream/http_request_builder.hpp
#pragma once

#include <concepts>
#include <iterator>
#include <string_view>

#include <fmt/format.h>

#include "lib/stream/url_encode.hpp"

namespace page_stream {

// HttpRequestBuilder - writes an HTTP/1.1 request head to an output iterator
//
// Calls must follow request-line order: Method, Path, QueryParam...,
// then headers. The first header implicitly ends the request line. A path
// that already carries a query string is extended with '&'.
//
// Usage:
//   std::string out;
//   HttpRequestBuilder(std::back_inserter(out))
//       .Method("GET")
//       .Path("/v2/beers")
//       .QueryParam("page", 3)
//       .Host("api.punkapi.com")
//       .Header("Accept", "application/json")
//       .Finish();
template<typename OutputIt>
class HttpRequestBuilder {
public:
    explicit HttpRequestBuilder(OutputIt out) : out_(out) {}

    HttpRequestBuilder& Method(std::string_view method) {
        out_ = fmt::format_to(out_, "{}", method);
        return *this;
    }

    HttpRequestBuilder& Path(std::string_view path) {
        out_ = fmt::format_to(out_, " {}", path.empty() ? std::string_view{"/"} : path);
        first_param_ = path.find('?') == std::string_view::npos;
        return *this;
    }

    // Append a URL-encoded query parameter
    HttpRequestBuilder& QueryParam(std::string_view key, std::string_view value) {
        StartParam(key);
        *out_++ = '=';
        out_ = UrlEncode(out_, value);
        return *this;
    }

    template<typename T>
        requires std::integral<T> || std::floating_point<T>
    HttpRequestBuilder& QueryParam(std::string_view key, T value) {
        StartParam(key);
        out_ = fmt::format_to(out_, "={}", value);
        return *this;
    }

    HttpRequestBuilder& Host(std::string_view host) {
        return Header("Host", host);
    }

    HttpRequestBuilder& Header(std::string_view name, std::string_view value) {
        EndRequestLine();
        out_ = fmt::format_to(out_, "{}: {}\r\n", name, value);
        return *this;
    }

    // Terminate the header block. A GET carries no body.
    void Finish() {
        EndRequestLine();
        out_ = fmt::format_to(out_, "\r\n");
    }

    OutputIt GetIterator() const { return out_; }

private:
    void StartParam(std::string_view key) {
        *out_++ = first_param_ ? '?' : '&';
        first_param_ = false;
        out_ = UrlEncode(out_, key);
    }

    void EndRequestLine() {
        if (request_line_done_) return;
        out_ = fmt::format_to(out_, " HTTP/1.1\r\n");
        request_line_done_ = true;
    }

    OutputIt out_;
    bool first_param_ = true;
    bool request_line_done_ = false;
};

template<typename OutputIt>
HttpRequestBuilder(OutputIt) -> HttpRequestBuilder<OutputIt>;

}  // namespace page_stream
