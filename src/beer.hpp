// SPDX-License-Identifier: MIT

// src/beer.hpp
#pragma once

#include <functional>
#include <ostream>
#include <string>

namespace page_stream {

/// One decoded listing entry.
struct Beer {
    std::string name;
    std::string tagline;
    double abv = 0.0;  ///< Alcohol by volume, percent

    bool operator==(const Beer&) const = default;
};

/// Predicate matching beers stronger than `min_abv` (exclusive).
inline std::function<bool(const Beer&)> AbvAbove(double min_abv) {
    return [min_abv](const Beer& beer) { return beer.abv > min_abv; };
}

// For gtest failure output
inline std::ostream& operator<<(std::ostream& os, const Beer& beer) {
    return os << "Beer{" << beer.name << ", " << beer.tagline << ", " << beer.abv << "}";
}

}  // namespace page_stream
