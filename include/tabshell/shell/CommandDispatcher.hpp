#pragma once

#include <tabshell/core/Error.hpp>
#include <tabshell/shell/CommandCatalog.hpp>
#include <tabshell/shell/CommandResolver.hpp>
#include <tabshell/shell/FilesystemNavigator.hpp>
#include <tabshell/shell/MetricsSampler.hpp>
#include <tabshell/shell/ProcessRunner.hpp>
#include <tabshell/shell/SessionStore.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS::Shell {

struct OutputEvent {
    enum class Kind {
        Output,
        Error,
        DirectoryChange,
        Clear,
    };

    Kind                       kind{Kind::Output};
    std::string                tab_id;
    // Output text, error text, or the new directory.
    std::string                text;
    std::optional<Error::Code> code;

    auto is_error() const -> bool { return kind == Kind::Error; }
    auto event_name() const -> std::string_view;
    auto to_json() const -> nlohmann::json;
};

struct DispatcherOptions {
    // When false, names outside the catalogue are rejected instead of executed.
    bool                     allow_unregistered_commands{true};
    // Exact program names; a trailing '*' matches any suffix.
    std::vector<std::string> blocked_programs{"dd", "mkfs", "mkfs.*", "format"};
};

class CommandDispatcher {
public:
    static constexpr std::string_view kNoOutputMessage = "(Command executed successfully with no output)";

    CommandDispatcher(CommandCatalog const&      catalog,
                      CommandResolver const&     resolver,
                      FilesystemNavigator const& navigator,
                      SessionStore&              store,
                      ProcessRunner&             runner,
                      MetricsSampler&            sampler,
                      DispatcherOptions          options = {});

    // Resolves and runs one raw input line for a session. Never throws for
    // command failures; they come back as Error events.
    auto handle(std::string const& session_id, std::string_view raw_input) -> std::vector<OutputEvent>;

private:
    struct Outcome {
        std::string                output;
        std::optional<std::string> new_directory;
        bool                       clear_screen{false};
        bool                       skip_history{false};
    };

    auto execute(std::string const& session_id, ResolvedCommand const& command, std::string const& cwd)
        -> Expected<Outcome>;
    auto run_builtin(CommandEntry const&    entry,
                     std::string const&     session_id,
                     ResolvedCommand const& command,
                     std::string const&     cwd) -> Expected<Outcome>;
    auto run_external(ResolvedCommand const& command, std::string const& cwd) -> Expected<Outcome>;
    auto is_blocked(std::string_view program) const -> bool;
    auto unknown_command(std::string const& name, std::string message) const -> Error;
    auto snapshot() -> MetricsSnapshot;

    CommandCatalog const&      catalog_;
    CommandResolver const&     resolver_;
    FilesystemNavigator const& navigator_;
    SessionStore&              store_;
    ProcessRunner&             runner_;
    MetricsSampler&            sampler_;
    DispatcherOptions          options_;
};

} // namespace TS::Shell
