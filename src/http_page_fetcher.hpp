// SPDX-License-Identifier: MIT

// src/http_page_fetcher.hpp
#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <asio.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/ssl.hpp>
#include <fmt/format.h>
#include <openssl/ssl.h>

#include "lib/stream/error.hpp"
#include "lib/stream/http_request_builder.hpp"
#include "lib/stream/http_response_parser.hpp"
#include "lib/stream/json_parser.hpp"
#include "lib/stream/pull_source.hpp"
#include "src/config.hpp"

namespace page_stream {

// HttpPageFetcher - requests one listing page over HTTP(S) and decodes it
//
// Chains: resolve -> connect -> [TLS handshake] -> GET -> HttpResponseParser
// -> JsonParser<Builder>. Each Fetch() opens its own connection
// (Connection: close) and is bounded by FetcherConfig::timeout.
//
// Usage:
//   HttpPageFetcher<BeerPageBuilder> fetcher(config.fetcher);
//   PaginatedStream<Beer> stream(fetcher.AsPageFetcher(), AbvAbove(15.0));
//
// Template parameter Builder must satisfy JsonBuilder and build a Page.
template<JsonBuilder Builder>
class HttpPageFetcher {
public:
    using Result = typename Builder::Result;
    using ItemType = typename Result::value_type;
    static_assert(std::same_as<Result, Page<ItemType>>, "Builder must produce a Page");

    explicit HttpPageFetcher(FetcherConfig config)
        : config_(std::move(config)),
          ssl_ctx_(asio::ssl::context::tls_client) {
        if (config_.use_tls) ConfigureTls();
    }

    HttpPageFetcher(const HttpPageFetcher&) = delete;
    HttpPageFetcher& operator=(const HttpPageFetcher&) = delete;

    asio::awaitable<std::expected<Result, Error>> Fetch(uint32_t page_index) {
        using namespace asio::experimental::awaitable_operators;

        asio::steady_timer deadline(co_await asio::this_coro::executor, config_.timeout);
        auto outcome = co_await (
            Exchange(BuildRequest(page_index)) ||
            deadline.async_wait(asio::as_tuple(asio::use_awaitable)));

        if (outcome.index() == 1) {
            co_return std::unexpected(Error{ErrorCode::Timeout,
                fmt::format("page {}: no response within {}ms", page_index,
                            config_.timeout.count())});
        }

        auto body = std::get<0>(std::move(outcome));
        if (!body) co_return std::unexpected(WithPage(page_index, std::move(body.error())));

        Builder builder;
        auto page = ParseJson(builder, *body);
        if (!page) co_return std::unexpected(WithPage(page_index, std::move(page.error())));
        co_return std::move(*page);
    }

    // The returned fetcher refers to this object.
    PageFetcher<ItemType> AsPageFetcher() {
        return [this](uint32_t page_index) { return Fetch(page_index); };
    }

    std::string BuildRequest(uint32_t page_index) const {
        std::string out;
        HttpRequestBuilder builder(std::back_inserter(out));
        builder.Method("GET")
            .Path(config_.path)
            .QueryParam(config_.page_param, page_index);
        if (config_.per_page) {
            builder.QueryParam("per_page", *config_.per_page);
        }
        builder.Host(HostHeader())
            .Header("Accept", "application/json")
            .Header("User-Agent", config_.user_agent)
            .Header("Connection", "close")
            .Finish();
        return out;
    }

    const FetcherConfig& config() const { return config_; }

private:
    void ConfigureTls() {
        asio::error_code ec;
        ssl_ctx_.set_options(asio::ssl::context::default_workarounds |
                             asio::ssl::context::no_compression, ec);
        if (!ec) ssl_ctx_.set_default_verify_paths(ec);
        if (!ec) ssl_ctx_.set_verify_mode(asio::ssl::verify_peer, ec);
        if (ec) {
            throw std::runtime_error("Failed to configure TLS context: " + ec.message());
        }
        SSL_CTX_set_min_proto_version(ssl_ctx_.native_handle(), TLS1_2_VERSION);
    }

    std::string HostHeader() const {
        uint16_t default_port = config_.use_tls ? 443 : 80;
        if (config_.port == default_port) return config_.host;
        return fmt::format("{}:{}", config_.host, config_.port);
    }

    static Error WithPage(uint32_t page_index, Error error) {
        error.message = fmt::format("page {}: {}", page_index, error.message);
        return error;
    }

    asio::awaitable<std::expected<std::string, Error>> Exchange(std::string request) {
        auto executor = co_await asio::this_coro::executor;

        asio::ip::tcp::resolver resolver(executor);
        auto [resolve_ec, endpoints] = co_await resolver.async_resolve(
            config_.host, std::to_string(config_.port),
            asio::as_tuple(asio::use_awaitable));
        if (resolve_ec) {
            co_return std::unexpected(Error{ErrorCode::DnsResolutionFailed,
                "Failed to resolve hostname: " + config_.host + ": " + resolve_ec.message()});
        }

        asio::ip::tcp::socket socket(executor);
        auto [connect_ec, endpoint] = co_await asio::async_connect(
            socket, endpoints, asio::as_tuple(asio::use_awaitable));
        if (connect_ec) {
            co_return std::unexpected(Error{ErrorCode::ConnectionFailed,
                fmt::format("Failed to connect to {}:{}: {}", config_.host, config_.port,
                            connect_ec.message()),
                connect_ec.value()});
        }

        if (!config_.use_tls) {
            co_return co_await RoundTrip(socket, request);
        }

        asio::ssl::stream<asio::ip::tcp::socket> tls(std::move(socket), ssl_ctx_);
        // SNI and host name verification
        if (SSL_set_tlsext_host_name(tls.native_handle(), config_.host.c_str()) != 1 ||
            SSL_set1_host(tls.native_handle(), config_.host.c_str()) != 1) {
            co_return std::unexpected(Error{ErrorCode::TlsHandshakeFailed,
                "Failed to set TLS host name: " + config_.host});
        }
        auto [handshake_ec] = co_await tls.async_handshake(
            asio::ssl::stream_base::client, asio::as_tuple(asio::use_awaitable));
        if (handshake_ec) {
            co_return std::unexpected(Error{ErrorCode::TlsHandshakeFailed,
                "TLS handshake failed: " + handshake_ec.message()});
        }

        co_return co_await RoundTrip(tls, request);
    }

    template<typename Stream>
    static asio::awaitable<std::expected<std::string, Error>> RoundTrip(
        Stream& stream, const std::string& request) {
        auto [write_ec, written] = co_await asio::async_write(
            stream, asio::buffer(request), asio::as_tuple(asio::use_awaitable));
        if (write_ec) {
            co_return std::unexpected(Error{ErrorCode::ConnectionFailed,
                "Failed to send request: " + write_ec.message(), write_ec.value()});
        }

        HttpResponseParser parser;
        std::array<char, 16 * 1024> buf;
        while (!parser.IsMessageComplete()) {
            auto [read_ec, n] = co_await stream.async_read_some(
                asio::buffer(buf), asio::as_tuple(asio::use_awaitable));
            if (n > 0) {
                auto fed = parser.OnData(std::string_view(buf.data(), n));
                if (!fed) co_return std::unexpected(std::move(fed.error()));
            }
            if (read_ec == asio::error::eof || read_ec == asio::ssl::error::stream_truncated) {
                auto done = parser.OnDone();
                if (!done) co_return std::unexpected(std::move(done.error()));
                break;
            }
            if (read_ec) {
                co_return std::unexpected(Error{ErrorCode::ConnectionClosed,
                    "Failed to read response: " + read_ec.message(), read_ec.value()});
            }
        }
        auto body = parser.TakeBody();
        if (body && !parser.IsJsonContentType()) {
            co_return std::unexpected(Error{ErrorCode::ParseError,
                "Unexpected Content-Type: " + parser.ContentType()});
        }
        co_return body;
    }

    FetcherConfig config_;
    asio::ssl::context ssl_ctx_;
};

}  // namespace page_stream
