// SPDX-License-Identifier: MIT

// lib/stream/url_encode.hpp
#pragma once

#include <cctype>
#include <iterator>
#include <string_view>

#include <fmt/format.h>

namespace page_stream {

// Percent-encodes a query component into an output iterator.
// Unreserved characters (alphanumeric and -_.~) pass through.
template<typename OutputIt>
OutputIt UrlEncode(OutputIt out, std::string_view value) {
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            *out++ = c;
            continue;
        }
        out = fmt::format_to(out, "%{:02X}", uc);
    }
    return out;
}

}  // namespace page_stream
