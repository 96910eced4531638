#pragma once

#include <tabshell/core/Error.hpp>

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace TS::Shell {

struct ResolvedCommand {
    std::string              name;
    std::vector<std::string> args;
    bool                     is_natural_language{false};

    // Empty input resolves to a command with no name; the dispatcher emits nothing for it.
    auto is_noop() const -> bool { return name.empty(); }
    // Canonical single-line rendering, e.g. `mkdir logs`.
    auto render() const -> std::string;
};

struct IntentExample {
    std::string phrase;
    std::string description;
};

// Maps raw input text to a command. Pure: holds only immutable rule tables and
// the vocabulary used for "did you mean" suggestions.
class CommandResolver {
public:
    static constexpr char        kShorthandMarker = '!';
    // Longer requests are refused before any rule runs; std::regex recursion
    // grows with the length of the matched text.
    static constexpr std::size_t kMaxRequestLength = 4096;

    explicit CommandResolver(std::vector<std::string> vocabulary);

    auto resolve(std::string_view raw) const -> Expected<ResolvedCommand>;

    auto examples() const -> std::vector<IntentExample> const& { return examples_; }

    // Quote-aware split: "a b" and 'a b' group, backslash escapes outside single quotes.
    static auto tokenize(std::string_view text) -> Expected<std::vector<std::string>>;

private:
    struct IntentRule {
        std::regex               pattern;
        std::vector<std::string> command_template;
    };

    auto interpret(std::string_view text) const -> Expected<ResolvedCommand>;
    auto suggest(std::string_view text) const -> std::vector<std::string>;

    std::vector<IntentRule>    rules_;
    std::vector<IntentExample> examples_;
    std::vector<std::string>   vocabulary_;
};

} // namespace TS::Shell
