#include <tabshell/shell/CommandCatalog.hpp>

#include <tabshell/shell/Similarity.hpp>

#include <algorithm>
#include <array>

namespace TS::Shell {

namespace {

constexpr std::array<std::string_view, 4> kListFlags{"-a", "-l", "-la", "-al"};
constexpr std::array<std::string_view, 3> kRemoveFlags{"-r", "-f", "-rf"};
constexpr std::array<std::string_view, 2> kCopyFlags{"-r", "-R"};
constexpr std::array<std::string_view, 1> kMakeDirectoryFlags{"-p"};
constexpr std::array<std::string_view, 4> kGrepFlags{"-i", "-r", "-v", "-n"};
constexpr std::array<std::string_view, 3> kFindFlags{"-name", "-type", "-size"};
constexpr std::array<std::string_view, 1> kHistoryFlags{"-c"};

auto make_default_entries() -> std::vector<CommandEntry> {
    return {
        {"ls", CommandKind::List, "List directory contents", true, kListFlags},
        {"dir", CommandKind::List, "List directory contents", true, kListFlags},
        {"cd", CommandKind::ChangeDirectory, "Change directory", true},
        {"pwd", CommandKind::PrintDirectory, "Print working directory"},
        {"mkdir", CommandKind::MakeDirectory, "Make directory", true, kMakeDirectoryFlags},
        {"rmdir", CommandKind::RemoveDirectory, "Remove directory", true},
        {"rm", CommandKind::Remove, "Remove file or directory", true, kRemoveFlags},
        {"cp", CommandKind::Copy, "Copy file or directory", true, kCopyFlags},
        {"mv", CommandKind::Move, "Move file or directory", true},
        {"cat", CommandKind::ReadFile, "Display file contents", true},
        {"touch", CommandKind::Touch, "Create an empty file", true},
        {"echo", CommandKind::Echo, "Display a line of text"},
        {"clear", CommandKind::Clear, "Clear the terminal screen"},
        {"history", CommandKind::History, "Show command history", false, kHistoryFlags},
        {"help", CommandKind::Help, "Display help information"},
        {"exit", CommandKind::Exit, "Exit the terminal"},
        {"cpu", CommandKind::CpuReport, "Display CPU information"},
        {"memory", CommandKind::MemoryReport, "Display memory information"},
        {"processes", CommandKind::ProcessReport, "List running processes"},
        {"top", CommandKind::TopReport, "Display system processes"},
        {"grep", CommandKind::External, "Search for patterns in files", true, kGrepFlags},
        {"find", CommandKind::External, "Search for files", true, kFindFlags},
        {"ps", CommandKind::External, "Report process status"},
    };
}

} // namespace

CommandCatalog::CommandCatalog(std::vector<CommandEntry> entries)
    : entries_{std::move(entries)} {}

auto CommandCatalog::Default() -> CommandCatalog const& {
    static CommandCatalog const catalog{make_default_entries()};
    return catalog;
}

auto CommandCatalog::find(std::string_view name) const -> CommandEntry const* {
    auto const lowered = to_lower_copy(name);
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](CommandEntry const& entry) {
        return entry.name == lowered;
    });
    return it == entries_.end() ? nullptr : &*it;
}

auto CommandCatalog::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (auto const& entry : entries_) {
        result.emplace_back(entry.name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

auto CommandCatalog::render_help() const -> std::string {
    std::vector<CommandEntry const*> sorted;
    sorted.reserve(entries_.size());
    for (auto const& entry : entries_) {
        sorted.push_back(&entry);
    }
    std::sort(sorted.begin(), sorted.end(), [](CommandEntry const* a, CommandEntry const* b) {
        return a->name < b->name;
    });

    std::string text = "Available commands:";
    for (auto const* entry : sorted) {
        std::string name{entry->name};
        if (name.size() < 10) {
            name.append(10 - name.size(), ' ');
        }
        text.append("\n  ");
        text.append(name);
        text.append(" - ");
        text.append(entry->description);
    }
    text.append("\n\nPrefix a request with '!' to use plain English (try 'help examples').");
    return text;
}

auto CommandCatalog::render_help(std::string_view topic) const -> std::string {
    auto const* entry = find(topic);
    if (entry == nullptr) {
        return {};
    }
    std::string text{entry->name};
    text.append(" - ");
    text.append(entry->description);
    if (!entry->flags.empty()) {
        text.append("\n  flags:");
        for (auto flag : entry->flags) {
            text.push_back(' ');
            text.append(flag);
        }
    }
    return text;
}

} // namespace TS::Shell
