// SPDX-License-Identifier: MIT

// lib/stream/flattener.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include <asio/awaitable.hpp>

#include "lib/stream/pull_source.hpp"

namespace page_stream {

// Flattener<Source> - turns a stream of pages into a stream of their items
//
// Holds at most one page. The next page is pulled only after every item
// of the current one has been handed out. An empty page ends the stream
// and is never yielded. Upstream errors pass through unchanged.
template<PullSource Source>
class Flattener {
public:
    using PageType = typename Source::ValueType;
    using ValueType = typename PageType::value_type;

    explicit Flattener(Source upstream) : upstream_(std::move(upstream)) {}

    Flattener(Flattener&&) = default;
    Flattener& operator=(Flattener&&) = default;

    asio::awaitable<PullResult<ValueType>> Next() {
        while (pos_ >= page_.size()) {
            if (done_) co_return std::nullopt;

            auto page = co_await upstream_.Next();
            if (!page) co_return std::unexpected(std::move(page.error()));

            if (!*page || (*page)->empty()) {
                done_ = true;
                page_ = PageType{};
                pos_ = 0;
                co_return std::nullopt;
            }
            page_ = std::move(**page);
            pos_ = 0;
        }
        co_return std::optional<ValueType>{std::move(page_[pos_++])};
    }

    void Close() {
        done_ = true;
        page_ = PageType{};
        pos_ = 0;
        upstream_.Close();
    }

    void SetStopCondition(StopCondition stop) { upstream_.SetStopCondition(std::move(stop)); }

    Source& upstream() { return upstream_; }
    const Source& upstream() const { return upstream_; }

private:
    Source upstream_;
    PageType page_;
    size_t pos_ = 0;
    bool done_ = false;
};

}  // namespace page_stream
