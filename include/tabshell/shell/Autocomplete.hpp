#pragma once

#include <tabshell/shell/CommandCatalog.hpp>
#include <tabshell/shell/FilesystemNavigator.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace TS::Shell {

// Suggestions for the last token of a partially typed command line.
// Vocabulary matches come first, then path matches; each group is sorted.
class Autocompleter {
public:
    static constexpr std::size_t kMaxSuggestions = 200;

    Autocompleter(CommandCatalog const& catalog, FilesystemNavigator const& navigator);

    auto suggest(std::string_view partial, std::string const& cwd) const -> std::vector<std::string>;

private:
    auto complete_command(std::string_view token, std::string const& cwd) const -> std::vector<std::string>;
    auto complete_path(std::string_view token, std::string const& cwd, bool directories_only) const
        -> std::vector<std::string>;

    CommandCatalog const&      catalog_;
    FilesystemNavigator const& navigator_;
};

} // namespace TS::Shell
