#include <tabshell/shell/Autocomplete.hpp>

#include <tabshell/shell/Similarity.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace TS::Shell {

namespace fs = std::filesystem;

namespace {

auto split_words(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> words;
    std::size_t                   index = 0;
    while (index < text.size()) {
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index]))) {
            ++index;
        }
        auto const start = index;
        while (index < text.size() && !std::isspace(static_cast<unsigned char>(text[index]))) {
            ++index;
        }
        if (index > start) {
            words.push_back(text.substr(start, index - start));
        }
    }
    return words;
}

void sort_unique(std::vector<std::string>& values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
}

} // namespace

Autocompleter::Autocompleter(CommandCatalog const& catalog, FilesystemNavigator const& navigator)
    : catalog_{catalog}
    , navigator_{navigator} {}

auto Autocompleter::suggest(std::string_view partial, std::string const& cwd) const -> std::vector<std::string> {
    auto const words = split_words(partial);
    if (words.empty()) {
        return catalog_.names();
    }

    bool const trailing_space = std::isspace(static_cast<unsigned char>(partial.back())) != 0;
    if (words.size() == 1 && !trailing_space) {
        return complete_command(words.front(), cwd);
    }

    auto const* entry = catalog_.find(words.front());
    if (entry == nullptr) {
        return {};
    }
    std::string_view const token = trailing_space ? std::string_view{} : words.back();

    std::vector<std::string> suggestions;
    if (token.starts_with('-')) {
        for (auto flag : entry->flags) {
            if (flag.starts_with(token)) {
                suggestions.emplace_back(flag);
            }
        }
        sort_unique(suggestions);
        return suggestions;
    }
    if (!entry->takes_paths) {
        return {};
    }
    return complete_path(token, cwd, entry->kind == CommandKind::ChangeDirectory);
}

auto Autocompleter::complete_command(std::string_view token, std::string const& cwd) const
    -> std::vector<std::string> {
    auto const               prefix = to_lower_copy(token);
    auto const               names  = catalog_.names();
    std::vector<std::string> vocabulary;
    for (auto const& name : names) {
        if (name.starts_with(prefix)) {
            vocabulary.push_back(name);
        }
    }
    if (vocabulary.empty() && token.find('/') == std::string_view::npos) {
        vocabulary = close_matches(prefix, names, 5, 0.5);
    }
    sort_unique(vocabulary);

    // A leading path such as ./build/ completes against the filesystem.
    if (token.find('/') != std::string_view::npos) {
        auto paths = complete_path(token, cwd, false);
        vocabulary.insert(vocabulary.end(), paths.begin(), paths.end());
    }
    if (vocabulary.size() > kMaxSuggestions) {
        vocabulary.resize(kMaxSuggestions);
    }
    return vocabulary;
}

auto Autocompleter::complete_path(std::string_view token, std::string const& cwd, bool directories_only) const
    -> std::vector<std::string> {
    auto const        slash     = token.rfind('/');
    std::string const directory = slash == std::string_view::npos ? std::string{} : std::string{token.substr(0, slash + 1)};
    std::string const prefix    = slash == std::string_view::npos ? std::string{token} : std::string{token.substr(slash + 1)};

    auto const base = navigator_.resolve_path(cwd, directory);
    if (!navigator_.is_within_sandbox(base)) {
        return {};
    }

    std::vector<std::string> suggestions;
    std::error_code          ec;
    for (fs::directory_iterator it{base, ec}, end; !ec && it != end; it.increment(ec)) {
        auto const name = it->path().filename().string();
        if (!name.starts_with(prefix)) {
            continue;
        }
        // Dotfiles only when the user started typing one.
        if (name.starts_with('.') && !prefix.starts_with('.')) {
            continue;
        }
        std::error_code type_ec;
        bool const      is_directory = it->is_directory(type_ec);
        if (directories_only && !is_directory) {
            continue;
        }
        suggestions.push_back(directory + name + (is_directory ? "/" : ""));
        if (suggestions.size() >= kMaxSuggestions) {
            break;
        }
    }
    sort_unique(suggestions);
    return suggestions;
}

} // namespace TS::Shell
