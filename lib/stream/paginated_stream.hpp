// SPDX-License-Identifier: MIT

// lib/stream/paginated_stream.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <utility>
#include <vector>

#include <asio/awaitable.hpp>

#include "lib/stream/error.hpp"
#include "lib/stream/flattener.hpp"
#include "lib/stream/page_sequencer.hpp"
#include "lib/stream/predicate_filter.hpp"
#include "lib/stream/pull_source.hpp"
#include "lib/stream/sink.hpp"

namespace page_stream {

// PaginatedStream<T> - PageSequencer -> Flattener -> PredicateFilter
//
// Lazily fetches pages as items are pulled. Nothing is fetched until the
// first Next(), and page n+1 is fetched only once page n is drained.
//
// Usage:
//   PaginatedStream<Beer> stream(fetcher.AsPageFetcher(), AbvAbove(15.0));
//   while (true) {
//       auto item = co_await stream.Next();
//       if (!item) { /* item.error() */ break; }
//       if (!*item) break;  // end of stream
//       Use(**item);
//   }
//
// Coroutines returned by Next() refer to this object; it must outlive them
// and must not be moved once pulling has started.
template<typename T>
class PaginatedStream {
public:
    using ValueType = T;
    using Predicate = std::function<bool(const T&)>;
    using Chain = PredicateFilter<Flattener<PageSequencer<T>>>;

    PaginatedStream(PageFetcher<T> fetch, Predicate predicate, SequencerConfig config = {})
        : chain_(Flattener<PageSequencer<T>>(PageSequencer<T>(std::move(fetch), config)),
                 std::move(predicate)) {}

    asio::awaitable<PullResult<T>> Next() { return chain_.Next(); }

    void Close() { chain_.Close(); }

    void SetStopCondition(StopCondition stop) { chain_.SetStopCondition(std::move(stop)); }

    const PageSequencer<T>& sequencer() const { return chain_.upstream().upstream(); }
    uint32_t pages_fetched() const { return sequencer().pages_fetched(); }

private:
    Chain chain_;
};

static_assert(PullSource<PageSequencer<int>>);
static_assert(PullSource<Flattener<PageSequencer<int>>>);
static_assert(PullSource<PaginatedStream<int>>);

// Drive a source into a sink until end of stream, error, or invalidation.
//
// Exactly one of OnComplete / OnError ends a run that was not invalidated.
// The sink's validity is installed as the source's stop condition for the
// duration of the run, so invalidation is seen before the next fetch even
// while a filter is discarding items. When the sink is invalidated the
// source is closed before returning; an item pulled concurrently with
// invalidation is dropped.
template<PullSource Source, typename Sink>
    requires ItemSink<Sink, typename Source::ValueType>
asio::awaitable<void> Drain(Source& source, Sink& sink) {
    struct StopGuard {
        Source& source;
        ~StopGuard() { source.SetStopCondition(nullptr); }
    } guard{source};
    source.SetStopCondition([&sink] { return !sink.IsValid(); });

    while (sink.IsValid()) {
        auto item = co_await source.Next();
        if (!sink.IsValid()) break;
        if (!item) {
            sink.OnError(item.error());
            co_return;
        }
        if (!*item) {
            sink.OnComplete();
            co_return;
        }
        sink.OnData(std::move(**item));
    }
    source.Close();
}

// Pull everything into memory. Meant for tests and small listings.
template<PullSource Source>
asio::awaitable<std::expected<std::vector<typename Source::ValueType>, Error>> Collect(
    Source& source) {
    std::vector<typename Source::ValueType> items;
    for (;;) {
        auto item = co_await source.Next();
        if (!item) co_return std::unexpected(std::move(item.error()));
        if (!*item) co_return std::move(items);
        items.push_back(std::move(**item));
    }
}

}  // namespace page_stream
