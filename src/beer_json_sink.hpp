// SPDX-License-Identifier: MIT

// src/beer_json_sink.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <ostream>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include "lib/stream/error.hpp"
#include "lib/stream/sink.hpp"
#include "src/beer.hpp"

namespace page_stream {

// BeerJsonSink - streams beers to an ostream as a JSON array
//
// Writes "[" lazily, one {"name","tagline","abv"} object per OnData, and
// "]" on completion. On error the array is still closed so the delivered
// prefix stays well-formed; error() reports why the stream ended early.
// Invalidate() (consumer gone) stops all further output, including "]".
class BeerJsonSink {
public:
    explicit BeerJsonSink(std::ostream& out)
        : out_(out), stream_(out), writer_(stream_) {}

    BeerJsonSink(const BeerJsonSink&) = delete;
    BeerJsonSink& operator=(const BeerJsonSink&) = delete;

    void OnData(Beer&& beer) {
        if (!IsValid() || finished_) return;
        OpenArray();
        writer_.StartObject();
        writer_.Key("name");
        writer_.String(beer.name.data(), static_cast<rapidjson::SizeType>(beer.name.size()));
        writer_.Key("tagline");
        writer_.String(beer.tagline.data(),
                       static_cast<rapidjson::SizeType>(beer.tagline.size()));
        writer_.Key("abv");
        writer_.Double(beer.abv);
        writer_.EndObject();
        stream_.Flush();
        out_.flush();
        ++count_;
    }

    void OnError(const Error& e) {
        if (!IsValid() || finished_) return;
        error_ = e;
        CloseArray();
    }

    void OnComplete() {
        if (!IsValid() || finished_) return;
        CloseArray();
    }

    void Invalidate() { valid_.store(false, std::memory_order_release); }

    bool IsValid() const { return valid_.load(std::memory_order_acquire); }

    bool finished() const { return finished_; }
    size_t count() const { return count_; }
    const std::optional<Error>& error() const { return error_; }

private:
    void OpenArray() {
        if (opened_) return;
        opened_ = true;
        writer_.StartArray();
    }

    void CloseArray() {
        OpenArray();
        writer_.EndArray();
        finished_ = true;
        stream_.Flush();
        out_ << '\n';
        out_.flush();
    }

    std::ostream& out_;
    rapidjson::OStreamWrapper stream_;
    rapidjson::Writer<rapidjson::OStreamWrapper> writer_;
    std::atomic<bool> valid_{true};
    bool opened_ = false;
    bool finished_ = false;
    size_t count_ = 0;
    std::optional<Error> error_;
};

static_assert(ItemSink<BeerJsonSink, Beer>);

}  // namespace page_stream
