#pragma once

#include <tabshell/core/Error.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS::Shell {

struct NavigatorResult {
    std::string                output;
    // Set when the operation moved the caller's working directory.
    std::optional<std::string> new_directory;
};

struct NavigatorConfig {
    // Target of `cd` with no argument and of `~`.
    std::string                home_directory;
    // When set, no operation may touch a path outside this directory.
    std::optional<std::string> sandbox_root;
    std::size_t                max_read_bytes{1024 * 1024};
};

// Directory-mutating primitives evaluated against a caller-supplied working
// directory. Holds no per-session state; every operation normalizes its paths
// before touching the filesystem and reports failures as typed errors.
class FilesystemNavigator {
public:
    explicit FilesystemNavigator(NavigatorConfig config);

    auto list(std::string const& cwd, std::vector<std::string> const& args) const -> Expected<NavigatorResult>;
    auto change_directory(std::string const& cwd, std::vector<std::string> const& args) const
        -> Expected<NavigatorResult>;
    auto make_directory(std::string const& cwd, std::vector<std::string> const& args) const
        -> Expected<NavigatorResult>;
    auto remove_directory(std::string const& cwd, std::vector<std::string> const& args) const
        -> Expected<NavigatorResult>;
    auto remove(std::string const& cwd, std::vector<std::string> const& args) const -> Expected<NavigatorResult>;
    auto copy(std::string const& cwd, std::vector<std::string> const& args) const -> Expected<NavigatorResult>;
    auto move(std::string const& cwd, std::vector<std::string> const& args) const -> Expected<NavigatorResult>;
    auto read_files(std::string const& cwd, std::vector<std::string> const& args) const
        -> Expected<NavigatorResult>;
    auto touch(std::string const& cwd, std::vector<std::string> const& args) const -> Expected<NavigatorResult>;

    // Absolute, lexically normalized form of `target` relative to `cwd`.
    auto resolve_path(std::string const& cwd, std::string_view target) const -> std::filesystem::path;
    auto is_within_sandbox(std::filesystem::path const& path) const -> bool;
    // Nearest existing directory at or above `path`, never leaving the sandbox.
    auto nearest_existing_directory(std::filesystem::path const& path) const -> std::string;

    auto home_directory() const -> std::string const& { return config_.home_directory; }
    auto sandbox_root() const -> std::optional<std::string> const& { return config_.sandbox_root; }

private:
    auto is_protected(std::filesystem::path const& path) const -> bool;
    auto relocate_if_affected(std::string const& cwd,
                              std::filesystem::path const& removed,
                              std::optional<std::filesystem::path> const& replacement) const
        -> std::optional<std::string>;

    NavigatorConfig                      config_;
    std::optional<std::filesystem::path> canonical_sandbox_;
};

} // namespace TS::Shell
