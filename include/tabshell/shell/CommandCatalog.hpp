#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace TS::Shell {

enum class CommandKind {
    List,
    ChangeDirectory,
    PrintDirectory,
    MakeDirectory,
    RemoveDirectory,
    Remove,
    Copy,
    Move,
    ReadFile,
    Touch,
    Echo,
    Clear,
    History,
    Help,
    Exit,
    CpuReport,
    MemoryReport,
    ProcessReport,
    TopReport,
    External,
};

struct CommandEntry {
    std::string_view                  name;
    CommandKind                       kind;
    std::string_view                  description;
    bool                              takes_paths{false};
    std::span<std::string_view const> flags{};
};

// Closed registry of the commands the dispatcher knows by name. Entries with
// CommandKind::External are routed to the process primitive on purpose.
class CommandCatalog {
public:
    explicit CommandCatalog(std::vector<CommandEntry> entries);

    static auto Default() -> CommandCatalog const&;

    // Case-insensitive lookup.
    auto find(std::string_view name) const -> CommandEntry const*;
    auto entries() const -> std::vector<CommandEntry> const& { return entries_; }

    // Sorted command names.
    auto names() const -> std::vector<std::string>;

    auto render_help() const -> std::string;
    auto render_help(std::string_view topic) const -> std::string;

private:
    std::vector<CommandEntry> entries_;
};

} // namespace TS::Shell
