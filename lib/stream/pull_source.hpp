// SPDX-License-Identifier: MIT

// lib/stream/pull_source.hpp
#pragma once

#include <concepts>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include <asio/awaitable.hpp>

#include "lib/stream/error.hpp"

namespace page_stream {

// One pull from a stage: an item, std::nullopt at end of stream, or an error.
template<typename T>
using PullResult = std::expected<std::optional<T>, Error>;

template<typename T>
using Page = std::vector<T>;

template<typename T>
using PageResult = std::expected<Page<T>, Error>;

// Fetch collaborator: issues one request for a 1-based page index.
// An empty page means the listing is exhausted.
template<typename T>
using PageFetcher = std::function<asio::awaitable<PageResult<T>>(uint32_t page_index)>;

// Polled before and after each upstream request; true means the consumer is
// gone and the stream should end without further requests.
using StopCondition = std::function<bool()>;

// PullSource - a stage that produces items on demand
//
// Next() suspends until the next item is available. Close() stops the
// stage: later pulls end the stream and no new upstream work starts.
// At most one Next() may be outstanding at a time. SetStopCondition()
// reaches the stage that issues requests, so a stop is seen even while a
// downstream stage keeps pulling internally.
template<typename S>
concept PullSource = requires(S& s, StopCondition stop) {
    typename S::ValueType;
    { s.Next() } -> std::same_as<asio::awaitable<PullResult<typename S::ValueType>>>;
    { s.Close() } -> std::same_as<void>;
    { s.SetStopCondition(std::move(stop)) } -> std::same_as<void>;
};

}  // namespace page_stream
