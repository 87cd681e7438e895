// SPDX-License-Identifier: MIT

// src/config.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>

#include "lib/stream/error.hpp"
#include "lib/stream/page_sequencer.hpp"

namespace page_stream {

/// Where and how pages are requested.
struct FetcherConfig {
    std::string host = "api.punkapi.com";
    uint16_t port = 443;
    bool use_tls = true;
    std::string path = "/v2/beers";
    std::string page_param = "page";          ///< 1-based page query parameter
    std::optional<uint32_t> per_page;         ///< Sent as per_page when set
    std::chrono::milliseconds timeout{10000}; ///< Per page request, connect included
    std::string user_agent = "page-stream/1.0";
};

struct StreamConfig {
    FetcherConfig fetcher;
    SequencerConfig sequencer;
    double min_abv = 15.0;

    using Lookup = std::function<const char*(const char*)>;

    /// Build from PAGE_STREAM_* variables; unset variables keep defaults.
    static std::expected<StreamConfig, Error> FromEnv(const Lookup& lookup);
    static std::expected<StreamConfig, Error> FromEnv();
};

}  // namespace page_stream
