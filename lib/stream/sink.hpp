// SPDX-License-Identifier: MIT

// lib/stream/sink.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <functional>
#include <utility>

#include "lib/stream/error.hpp"

namespace page_stream {

/// Concept for the minimal sink lifecycle: error, completion, and invalidation.
template<typename S>
concept BasicSink = requires(S& s, const S& cs, const Error& e) {
    { s.OnError(e) } -> std::same_as<void>;
    { s.OnComplete() } -> std::same_as<void>;
    { s.Invalidate() } -> std::same_as<void>;
    { cs.IsValid() } -> std::same_as<bool>;
};

/// Concept for a sink that receives stream items one at a time.
///
/// IsValid() turning false means the consumer is gone: the driver stops
/// pulling and closes the source.
template<typename S, typename T>
concept ItemSink = BasicSink<S> && requires(S& s, T&& item) {
    { s.OnData(std::move(item)) } -> std::same_as<void>;
};

/// Item sink that dispatches through user-provided callbacks.
///
/// All callbacks are guarded by an atomic validity flag: once Invalidate()
/// is called, subsequent OnData / OnError / OnComplete calls are dropped.
/// Invalidate() may be called from any thread.
template<typename T>
class StreamItemSink {
public:
    StreamItemSink(
        std::function<void(T&&)> on_data,
        std::function<void(const Error&)> on_error,
        std::function<void()> on_complete
    ) : on_data_(std::move(on_data)),
        on_error_(std::move(on_error)),
        on_complete_(std::move(on_complete)) {}

    void OnData(T&& item) {
        if (IsValid()) on_data_(std::move(item));
    }

    void OnError(const Error& e) {
        if (IsValid()) on_error_(e);
    }

    void OnComplete() {
        if (IsValid()) on_complete_();
    }

    void Invalidate() { valid_.store(false, std::memory_order_release); }

    bool IsValid() const { return valid_.load(std::memory_order_acquire); }

private:
    std::function<void(T&&)> on_data_;
    std::function<void(const Error&)> on_error_;
    std::function<void()> on_complete_;
    std::atomic<bool> valid_{true};
};

}  // namespace page_stream
