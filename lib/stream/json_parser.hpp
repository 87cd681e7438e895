// SPDX-License-Identifier: MIT

// lib/stream/json_parser.hpp
#pragma once

#include <concepts>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/error/en.h>
#include <rapidjson/reader.h>

#include "lib/stream/error.hpp"

namespace page_stream {

// Builder concept - types that can incrementally build a result from JSON events
template <typename B>
concept JsonBuilder = requires(B& b, std::string_view sv, int64_t i, uint64_t u,
                               double d, bool bl) {
    typename B::Result;
    { b.OnKey(sv) } -> std::same_as<void>;
    { b.OnString(sv) } -> std::same_as<void>;
    { b.OnInt(i) } -> std::same_as<void>;
    { b.OnUint(u) } -> std::same_as<void>;
    { b.OnDouble(d) } -> std::same_as<void>;
    { b.OnBool(bl) } -> std::same_as<void>;
    { b.OnNull() } -> std::same_as<void>;
    { b.OnStartObject() } -> std::same_as<void>;
    { b.OnEndObject() } -> std::same_as<void>;
    { b.OnStartArray() } -> std::same_as<void>;
    { b.OnEndArray() } -> std::same_as<void>;
    { b.Build() } -> std::same_as<std::expected<typename B::Result, std::string>>;
};

// SAX-style JSON parser that feeds events to a Builder
//
// Supports:
// - Chunked input via OnData()
// - Callback-based completion with std::expected<Result, Error>, invoked once
//
// Thread safety: Not thread-safe.
template <JsonBuilder Builder>
class JsonParser : public std::enable_shared_from_this<JsonParser<Builder>> {
public:
    using Result = typename Builder::Result;
    using Callback = std::function<void(std::expected<Result, Error>)>;

    static std::shared_ptr<JsonParser> Create(Builder& builder, Callback on_complete) {
        return std::shared_ptr<JsonParser>(new JsonParser(builder, std::move(on_complete)));
    }

    void OnData(std::string_view data) {
        if (completed_) return;

        if (data.size() > kMaxBufferSize - buffer_.size()) {
            Complete(std::unexpected(Error{
                ErrorCode::BufferOverflow,
                "JSON document exceeds maximum buffer size (" +
                    std::to_string(kMaxBufferSize / (1024 * 1024)) + "MB)"}));
            return;
        }
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    void OnDone() {
        if (completed_) return;

        auto result = TryParse();
        if (result) {
            Complete(std::move(*result));
        } else {
            Complete(std::unexpected(Error{
                ErrorCode::ParseError,
                "JSON parse failed: " + result.error()}));
        }
    }

private:
    JsonParser(Builder& builder, Callback on_complete)
        : builder_(builder), on_complete_(std::move(on_complete)) {}

    // RapidJSON SAX handler that forwards to Builder
    struct SaxHandler : public rapidjson::BaseReaderHandler<rapidjson::UTF8<>, SaxHandler> {
        Builder& builder;

        explicit SaxHandler(Builder& b) : builder(b) {}

        bool Null() {
            builder.OnNull();
            return true;
        }
        bool Bool(bool b) {
            builder.OnBool(b);
            return true;
        }
        bool Int(int i) {
            builder.OnInt(static_cast<int64_t>(i));
            return true;
        }
        bool Uint(unsigned u) {
            builder.OnUint(static_cast<uint64_t>(u));
            return true;
        }
        bool Int64(int64_t i) {
            builder.OnInt(i);
            return true;
        }
        bool Uint64(uint64_t u) {
            builder.OnUint(u);
            return true;
        }
        bool Double(double d) {
            builder.OnDouble(d);
            return true;
        }
        bool String(const char* str, rapidjson::SizeType length, bool /*copy*/) {
            builder.OnString(std::string_view(str, length));
            return true;
        }
        bool Key(const char* str, rapidjson::SizeType length, bool /*copy*/) {
            builder.OnKey(std::string_view(str, length));
            return true;
        }
        bool StartObject() {
            builder.OnStartObject();
            return true;
        }
        bool EndObject(rapidjson::SizeType /*memberCount*/) {
            builder.OnEndObject();
            return true;
        }
        bool StartArray() {
            builder.OnStartArray();
            return true;
        }
        bool EndArray(rapidjson::SizeType /*elementCount*/) {
            builder.OnEndArray();
            return true;
        }
    };

    std::expected<Result, std::string> TryParse() {
        if (buffer_.empty()) {
            return builder_.Build();
        }

        // rapidjson::StringStream needs a terminator
        buffer_.push_back('\0');

        SaxHandler handler(builder_);
        rapidjson::Reader reader;
        rapidjson::StringStream stream(buffer_.data());
        auto result = reader.Parse(stream, handler);

        buffer_.pop_back();

        if (result.IsError()) {
            return std::unexpected(std::string("Parse error at offset ") +
                                   std::to_string(result.Offset()) + ": " +
                                   rapidjson::GetParseError_En(result.Code()));
        }
        return builder_.Build();
    }

    void Complete(std::expected<Result, Error> result) {
        if (completed_) return;
        completed_ = true;
        if (on_complete_) {
            on_complete_(std::move(result));
        }
    }

    // Matches HttpResponseParser::kMaxBody
    static constexpr size_t kMaxBufferSize = 16 * 1024 * 1024;  // 16MB

    Builder& builder_;
    Callback on_complete_;
    std::vector<char> buffer_;
    bool completed_ = false;
};

// Parse a complete document in one call.
template <JsonBuilder Builder>
std::expected<typename Builder::Result, Error> ParseJson(Builder& builder,
                                                         std::string_view document) {
    std::expected<typename Builder::Result, Error> out = std::unexpected(
        Error{ErrorCode::ParseError, "JSON parser did not complete"});
    auto parser = JsonParser<Builder>::Create(
        builder, [&out](std::expected<typename Builder::Result, Error> r) {
            out = std::move(r);
        });
    parser->OnData(document);
    parser->OnDone();
    return out;
}

}  // namespace page_stream
