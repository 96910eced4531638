#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string_view>

namespace TS::Serve {

inline constexpr std::size_t kMaxTabIdLength = 128;

// Letters, digits, '_', '-' and '.'; never "." or "..".
inline bool is_identifier(std::string_view value) {
    if (value.empty() || value == "." || value == "..") {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '_' || ch == '-' || ch == '.';
    });
}

inline bool is_tab_id(std::string_view value) {
    return value.size() <= kMaxTabIdLength && is_identifier(value);
}

} // namespace TS::Serve
