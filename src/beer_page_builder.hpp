// SPDX-License-Identifier: MIT

// src/beer_page_builder.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lib/stream/json_parser.hpp"
#include "src/beer.hpp"

namespace page_stream {

// BeerPageBuilder - decodes one listing page: a JSON array of beer objects
//
// Only the top-level "name", "tagline" and "abv" members of each element
// are read; nested objects and arrays are skipped. "name" and "abv" are
// required, "tagline" defaults to empty.
class BeerPageBuilder {
public:
    using Result = std::vector<Beer>;

    void OnKey(std::string_view key) {
        if (depth_ == kItemDepth) key_ = key;
    }

    void OnString(std::string_view v) {
        if (depth_ == kItemDepth - 1) {
            SetError("element " + std::to_string(items_.size()) + " is not an object");
            return;
        }
        if (!AtItemValue()) return;
        if (key_ == "name") {
            current_.name = v;
            has_name_ = true;
        } else if (key_ == "tagline") {
            current_.tagline = v;
        } else if (key_ == "abv") {
            SetError("'abv' is not a number");
        }
    }

    void OnInt(int64_t v) { OnNumber(static_cast<double>(v)); }
    void OnUint(uint64_t v) { OnNumber(static_cast<double>(v)); }
    void OnDouble(double v) { OnNumber(v); }

    void OnBool(bool) {}
    void OnNull() {}

    void OnStartObject() {
        if (depth_ == 0) {
            SetError("expected a JSON array, got an object");
        } else if (depth_ == kItemDepth - 1) {
            current_ = Beer{};
            has_name_ = false;
            has_abv_ = false;
            key_.clear();
        }
        ++depth_;
    }

    void OnEndObject() {
        --depth_;
        if (depth_ == kItemDepth - 1) FinishItem();
    }

    void OnStartArray() {
        if (depth_ == 0) {
            root_array_ = true;
        } else if (depth_ == kItemDepth - 1) {
            SetError("element " + std::to_string(items_.size()) + " is not an object");
        }
        ++depth_;
    }

    void OnEndArray() { --depth_; }

    std::expected<Result, std::string> Build() {
        if (error_) return std::unexpected(*error_);
        if (!root_array_) return std::unexpected("expected a JSON array of beers");
        return std::move(items_);
    }

private:
    // root array = 1, element object = 2
    static constexpr int kItemDepth = 2;

    bool AtItemValue() const { return depth_ == kItemDepth && !key_.empty(); }

    void OnNumber(double v) {
        if (depth_ == kItemDepth - 1) {
            SetError("element " + std::to_string(items_.size()) + " is not an object");
            return;
        }
        if (AtItemValue() && key_ == "abv") {
            current_.abv = v;
            has_abv_ = true;
        }
    }

    void FinishItem() {
        if (!has_name_) {
            SetError("beer " + std::to_string(items_.size()) + " missing 'name'");
        } else if (!has_abv_) {
            SetError("beer " + std::to_string(items_.size()) + " missing 'abv'");
        }
        items_.push_back(std::move(current_));
        current_ = Beer{};
    }

    // First error wins
    void SetError(std::string message) {
        if (!error_) error_ = std::move(message);
    }

    std::vector<Beer> items_;
    Beer current_;
    std::string key_;
    int depth_ = 0;
    bool root_array_ = false;
    bool has_name_ = false;
    bool has_abv_ = false;
    std::optional<std::string> error_;
};

static_assert(JsonBuilder<BeerPageBuilder>);

}  // namespace page_stream
