// SPDX-License-Identifier: MIT

// lib/stream/page_sequencer.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <asio/awaitable.hpp>

#include "lib/stream/error.hpp"
#include "lib/stream/pull_source.hpp"

namespace page_stream {

struct SequencerConfig {
    uint32_t first_page = 1;
    uint32_t max_pages = 0;  // 0 = no limit
};

// PageSequencer<T> - pulls successive pages from a PageFetcher
//
// Each Next() fetches the page at next_page(), then advances the index by
// one. The terminal empty page is yielded like any other; downstream
// treats it as end of stream.
//
// State machine:
//   Running -> Exhausted   (empty page fetched, or Close())
//   Running -> Failed      (fetch error or page limit)
//
// Exhausted pulls return std::nullopt and Failed pulls return the stored
// error; neither fetches again. A stop condition that reports true before a
// fetch closes the sequencer; one that reports true while a fetch is in
// flight discards that fetch's result.
template<typename T>
class PageSequencer {
public:
    using ValueType = Page<T>;

    enum class State {
        Running,
        Exhausted,
        Failed
    };

    explicit PageSequencer(PageFetcher<T> fetch, SequencerConfig config = {})
        : fetch_(std::move(fetch)),
          config_(config),
          next_page_(config.first_page) {}

    PageSequencer(PageSequencer&&) = default;
    PageSequencer& operator=(PageSequencer&&) = default;

    asio::awaitable<PullResult<Page<T>>> Next() {
        if (fetching_) {
            co_return std::unexpected(Error{ErrorCode::InvalidState,
                "Page " + std::to_string(next_page_) + " requested while a fetch is in flight"});
        }
        if (state_ == State::Exhausted) co_return std::nullopt;
        if (state_ == State::Failed) co_return std::unexpected(*error_);

        if (StopRequested()) {
            Close();
            co_return std::nullopt;
        }

        if (config_.max_pages > 0 && pages_fetched_ >= config_.max_pages) {
            co_return Fail(Error{ErrorCode::PageLimitExceeded,
                "No empty page after " + std::to_string(pages_fetched_) + " pages"});
        }

        uint32_t index = next_page_;
        PageResult<T> page;
        {
            // Cleared on exception or frame destruction too
            struct FetchingGuard {
                bool& flag;
                ~FetchingGuard() { flag = false; }
            } guard{fetching_};
            fetching_ = true;
            page = co_await fetch_(index);
        }

        ++pages_fetched_;
        ++next_page_;

        // Close() or stop during the fetch: result is discarded
        if (StopRequested()) Close();
        if (state_ != State::Running) co_return std::nullopt;

        if (!page) co_return Fail(std::move(page.error()));

        if (page->empty()) state_ = State::Exhausted;
        co_return std::optional<Page<T>>{std::move(*page)};
    }

    void Close() {
        if (state_ == State::Running) state_ = State::Exhausted;
    }

    void SetStopCondition(StopCondition stop) { stop_ = std::move(stop); }

    State state() const { return state_; }
    uint32_t next_page() const { return next_page_; }
    uint32_t pages_fetched() const { return pages_fetched_; }

private:
    bool StopRequested() const { return stop_ && stop_(); }

    PullResult<Page<T>> Fail(Error error) {
        state_ = State::Failed;
        error_ = error;
        return std::unexpected(std::move(error));
    }

    PageFetcher<T> fetch_;
    StopCondition stop_;
    SequencerConfig config_;
    uint32_t next_page_;
    uint32_t pages_fetched_ = 0;
    State state_ = State::Running;
    std::optional<Error> error_;
    bool fetching_ = false;
};

}  // namespace page_stream
