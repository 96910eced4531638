#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace TS::Shell {

// Levenshtein distance over bytes, case-sensitive.
auto edit_distance(std::string_view lhs, std::string_view rhs) -> std::size_t;

// 1.0 for identical strings, 0.0 when nothing lines up.
auto similarity_ratio(std::string_view lhs, std::string_view rhs) -> double;

// Candidates scoring at least `cutoff` against `word`, best first; ties keep
// candidate order. Comparison is case-insensitive.
auto close_matches(std::string_view                word,
                   std::vector<std::string> const& candidates,
                   std::size_t                     limit,
                   double                          cutoff) -> std::vector<std::string>;

auto to_lower_copy(std::string_view text) -> std::string;

} // namespace TS::Shell
