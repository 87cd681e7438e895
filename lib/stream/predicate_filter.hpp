// SPDX-License-Identifier: MIT

// lib/stream/predicate_filter.hpp
#pragma once

#include <functional>
#include <utility>

#include <asio/awaitable.hpp>

#include "lib/stream/pull_source.hpp"

namespace page_stream {

// PredicateFilter<Source> - yields only upstream items matching a predicate
template<PullSource Source>
class PredicateFilter {
public:
    using ValueType = typename Source::ValueType;
    using Predicate = std::function<bool(const ValueType&)>;

    PredicateFilter(Source upstream, Predicate predicate)
        : upstream_(std::move(upstream)), predicate_(std::move(predicate)) {}

    PredicateFilter(PredicateFilter&&) = default;
    PredicateFilter& operator=(PredicateFilter&&) = default;

    asio::awaitable<PullResult<ValueType>> Next() {
        for (;;) {
            auto item = co_await upstream_.Next();
            if (!item || !*item || predicate_(**item)) co_return std::move(item);
        }
    }

    void Close() { upstream_.Close(); }

    void SetStopCondition(StopCondition stop) { upstream_.SetStopCondition(std::move(stop)); }

    Source& upstream() { return upstream_; }
    const Source& upstream() const { return upstream_; }

private:
    Source upstream_;
    Predicate predicate_;
};

}  // namespace page_stream
