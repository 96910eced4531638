#include <tabshell/shell/Similarity.hpp>

#include <algorithm>
#include <cctype>
#include <numeric>

namespace TS::Shell {

auto to_lower_copy(std::string_view text) -> std::string {
    std::string lowered;
    lowered.reserve(text.size());
    for (unsigned char ch : text) {
        lowered.push_back(static_cast<char>(std::tolower(ch)));
    }
    return lowered;
}

auto edit_distance(std::string_view lhs, std::string_view rhs) -> std::size_t {
    if (lhs.empty()) {
        return rhs.size();
    }
    if (rhs.empty()) {
        return lhs.size();
    }
    std::vector<std::size_t> previous(rhs.size() + 1);
    std::vector<std::size_t> current(rhs.size() + 1);
    std::iota(previous.begin(), previous.end(), std::size_t{0});
    for (std::size_t i = 1; i <= lhs.size(); ++i) {
        current[0] = i;
        for (std::size_t j = 1; j <= rhs.size(); ++j) {
            auto const substitution = previous[j - 1] + (lhs[i - 1] == rhs[j - 1] ? 0U : 1U);
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
        }
        std::swap(previous, current);
    }
    return previous[rhs.size()];
}

auto similarity_ratio(std::string_view lhs, std::string_view rhs) -> double {
    auto const longest = std::max(lhs.size(), rhs.size());
    if (longest == 0) {
        return 1.0;
    }
    auto const distance = edit_distance(lhs, rhs);
    return 1.0 - static_cast<double>(distance) / static_cast<double>(longest);
}

auto close_matches(std::string_view                word,
                   std::vector<std::string> const& candidates,
                   std::size_t                     limit,
                   double                          cutoff) -> std::vector<std::string> {
    struct Scored {
        double      score;
        std::size_t index;
    };
    auto const          needle = to_lower_copy(word);
    std::vector<Scored> scored;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        auto score = similarity_ratio(needle, to_lower_copy(candidates[i]));
        if (score >= cutoff) {
            scored.push_back(Scored{score, i});
        }
    }
    std::stable_sort(scored.begin(), scored.end(), [](Scored const& a, Scored const& b) {
        return a.score > b.score;
    });
    std::vector<std::string> matches;
    for (auto const& entry : scored) {
        if (matches.size() >= limit) {
            break;
        }
        if (std::find(matches.begin(), matches.end(), candidates[entry.index]) == matches.end()) {
            matches.push_back(candidates[entry.index]);
        }
    }
    return matches;
}

} // namespace TS::Shell
