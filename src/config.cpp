// SPDX-License-Identifier: MIT

// src/config.cpp
#include "src/config.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

namespace page_stream {

namespace {

Error InvalidValue(const char* name, std::string_view value, std::string_view expected) {
    return Error{ErrorCode::InvalidConfig,
        fmt::format("{}='{}': expected {}", name, value, expected)};
}

template<typename T>
std::expected<T, Error> ParseNumber(const char* name, std::string_view value, T min, T max) {
    T out{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc{} || ptr != value.data() + value.size() || out < min || out > max) {
        return std::unexpected(InvalidValue(name, value, fmt::format("a number in [{}, {}]", min, max)));
    }
    return out;
}

std::expected<bool, Error> ParseBool(const char* name, std::string_view value) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return std::unexpected(InvalidValue(name, value, "a boolean"));
}

}  // namespace

std::expected<StreamConfig, Error> StreamConfig::FromEnv(const Lookup& lookup) {
    StreamConfig config;
    auto& fetcher = config.fetcher;

    auto get = [&lookup](const char* name) -> std::optional<std::string_view> {
        const char* value = lookup(name);
        if (value == nullptr || *value == '\0') return std::nullopt;
        return std::string_view(value);
    };

    if (auto v = get("PAGE_STREAM_HOST")) fetcher.host = *v;
    if (auto v = get("PAGE_STREAM_PATH")) {
        if (v->front() != '/' || v->find_first_of("# \r\n") != std::string_view::npos) {
            return std::unexpected(InvalidValue("PAGE_STREAM_PATH", *v,
                "an absolute path with an optional query"));
        }
        fetcher.path = *v;
    }
    if (auto v = get("PAGE_STREAM_PAGE_PARAM")) fetcher.page_param = *v;

    if (auto v = get("PAGE_STREAM_TLS")) {
        auto tls = ParseBool("PAGE_STREAM_TLS", *v);
        if (!tls) return std::unexpected(tls.error());
        fetcher.use_tls = *tls;
        // Follow the scheme unless a port is given explicitly
        fetcher.port = fetcher.use_tls ? 443 : 80;
    }
    if (auto v = get("PAGE_STREAM_PORT")) {
        auto port = ParseNumber<uint16_t>("PAGE_STREAM_PORT", *v, 1,
                                          std::numeric_limits<uint16_t>::max());
        if (!port) return std::unexpected(port.error());
        fetcher.port = *port;
    }
    if (auto v = get("PAGE_STREAM_PER_PAGE")) {
        auto per_page = ParseNumber<uint32_t>("PAGE_STREAM_PER_PAGE", *v, 1,
                                              std::numeric_limits<uint32_t>::max());
        if (!per_page) return std::unexpected(per_page.error());
        fetcher.per_page = *per_page;
    }
    if (auto v = get("PAGE_STREAM_TIMEOUT_MS")) {
        auto ms = ParseNumber<uint32_t>("PAGE_STREAM_TIMEOUT_MS", *v, 1,
                                        std::numeric_limits<uint32_t>::max());
        if (!ms) return std::unexpected(ms.error());
        fetcher.timeout = std::chrono::milliseconds(*ms);
    }
    if (auto v = get("PAGE_STREAM_MIN_ABV")) {
        auto abv = ParseNumber<double>("PAGE_STREAM_MIN_ABV", *v, 0.0, 100.0);
        if (!abv) return std::unexpected(abv.error());
        config.min_abv = *abv;
    }
    if (auto v = get("PAGE_STREAM_MAX_PAGES")) {
        auto max_pages = ParseNumber<uint32_t>("PAGE_STREAM_MAX_PAGES", *v, 0,
                                               std::numeric_limits<uint32_t>::max());
        if (!max_pages) return std::unexpected(max_pages.error());
        config.sequencer.max_pages = *max_pages;
    }

    return config;
}

std::expected<StreamConfig, Error> StreamConfig::FromEnv() {
    return FromEnv([](const char* name) { return std::getenv(name); });
}

}  // namespace page_stream
