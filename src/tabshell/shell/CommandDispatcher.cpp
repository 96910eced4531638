#include <tabshell/shell/CommandDispatcher.hpp>

#include <tabshell/shell/Similarity.hpp>

#include "utils/TaggedLogger.hpp"

#include <filesystem>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>

namespace TS::Shell {

namespace {

using json = nlohmann::json;

auto trim_trailing_newlines(std::string text) -> std::string {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

auto join(std::vector<std::string> const& parts, std::string_view separator) -> std::string {
    std::string joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined.append(separator);
        }
        joined.append(parts[i]);
    }
    return joined;
}

auto message_of(Error const& error) -> std::string {
    if (error.message && !error.message->empty()) {
        return *error.message;
    }
    return std::string{errorCodeToString(error.code)};
}

auto make_event(OutputEvent::Kind kind, std::string const& tab_id, std::string text,
                std::optional<Error::Code> code = std::nullopt) -> OutputEvent {
    return OutputEvent{.kind = kind, .tab_id = tab_id, .text = std::move(text), .code = code};
}

} // namespace

auto OutputEvent::event_name() const -> std::string_view {
    switch (kind) {
    case Kind::Output:
    case Kind::Error:
        return "output";
    case Kind::DirectoryChange:
        return "directory_change";
    case Kind::Clear:
        return "clear";
    }
    return "output";
}

auto OutputEvent::to_json() const -> json {
    switch (kind) {
    case Kind::DirectoryChange:
        return json{{"tab_id", tab_id}, {"directory", text}};
    case Kind::Clear:
        return json{{"tab_id", tab_id}};
    case Kind::Error: {
        json payload{{"tab_id", tab_id}, {"output", text}, {"type", "error"}};
        if (code) {
            payload["code"] = errorCodeToString(*code);
        }
        return payload;
    }
    case Kind::Output:
        break;
    }
    return json{{"tab_id", tab_id}, {"output", text}, {"type", "output"}};
}

CommandDispatcher::CommandDispatcher(CommandCatalog const&      catalog,
                                     CommandResolver const&     resolver,
                                     FilesystemNavigator const& navigator,
                                     SessionStore&              store,
                                     ProcessRunner&             runner,
                                     MetricsSampler&            sampler,
                                     DispatcherOptions          options)
    : catalog_{catalog}
    , resolver_{resolver}
    , navigator_{navigator}
    , store_{store}
    , runner_{runner}
    , sampler_{sampler}
    , options_{std::move(options)} {}

auto CommandDispatcher::handle(std::string const& session_id, std::string_view raw_input)
    -> std::vector<OutputEvent> {
    std::vector<OutputEvent> events;
    auto                     session = store_.get_or_create(session_id);
    std::string const        raw{raw_input};

    auto resolved = resolver_.resolve(raw_input);
    if (!resolved) {
        auto text = message_of(resolved.error());
        (void)store_.record_output(session_id, raw, text, true);
        events.push_back(make_event(OutputEvent::Kind::Error, session_id, std::move(text), resolved.error().code));
        return events;
    }
    if (resolved->is_noop()) {
        return events;
    }

    // Commands for one session never overlap, whichever lane or thread runs them.
    std::lock_guard const execution{session->execution_mutex()};
    auto const            cwd = session->current_directory();
    ts_log("Dispatch [" + session_id + "] " + resolved->render() + " in " + cwd, "Dispatcher");

    if (resolved->is_natural_language) {
        events.push_back(
            make_event(OutputEvent::Kind::Output, session_id, "(interpreted as: " + resolved->render() + ")"));
    }

    auto outcome = execute(session_id, *resolved, cwd);
    if (!outcome || !outcome->skip_history) {
        (void)store_.append_history(session_id, raw);
    }

    if (outcome) {
        if (outcome->clear_screen) {
            events.push_back(make_event(OutputEvent::Kind::Clear, session_id, {}));
        }
        if (!outcome->output.empty()) {
            events.push_back(make_event(OutputEvent::Kind::Output, session_id, outcome->output));
        }
        if (!outcome->skip_history) {
            (void)store_.record_output(session_id, raw, outcome->output, false);
        }
        if (outcome->new_directory && *outcome->new_directory != cwd) {
            (void)store_.update_directory(session_id, *outcome->new_directory);
            events.push_back(make_event(OutputEvent::Kind::DirectoryChange, session_id, *outcome->new_directory));
        }
    } else {
        auto text = message_of(outcome.error());
        (void)store_.record_output(session_id, raw, text, true);
        events.push_back(make_event(OutputEvent::Kind::Error, session_id, std::move(text), outcome.error().code));
    }

    // Another session (or an external process) may have removed our directory.
    auto const      current = session->current_directory();
    std::error_code ec;
    if (!std::filesystem::is_directory(current, ec)) {
        auto fallback = navigator_.nearest_existing_directory(current);
        if (fallback != current) {
            (void)store_.update_directory(session_id, fallback);
            events.push_back(make_event(OutputEvent::Kind::DirectoryChange, session_id, std::move(fallback)));
        }
    }
    return events;
}

auto CommandDispatcher::execute(std::string const& session_id, ResolvedCommand const& command, std::string const& cwd)
    -> Expected<Outcome> {
    if (auto const* entry = catalog_.find(command.name); entry != nullptr && entry->kind != CommandKind::External) {
        return run_builtin(*entry, session_id, command, cwd);
    }
    if (is_blocked(command.name)) {
        return std::unexpected(Error{Error::Code::Forbidden,
                                     "Error: Potentially dangerous command '" + command.render()
                                         + "' blocked for safety reasons."});
    }
    if (!options_.allow_unregistered_commands && catalog_.find(command.name) == nullptr) {
        return std::unexpected(unknown_command(command.name, "Command '" + command.name + "' not found."));
    }
    return run_external(command, cwd);
}

auto CommandDispatcher::run_builtin(CommandEntry const&    entry,
                                    std::string const&     session_id,
                                    ResolvedCommand const& command,
                                    std::string const&     cwd) -> Expected<Outcome> {
    auto const from_navigator = [](Expected<NavigatorResult> result) -> Expected<Outcome> {
        if (!result) {
            return std::unexpected(result.error());
        }
        return Outcome{.output = std::move(result->output), .new_directory = std::move(result->new_directory)};
    };
    auto const& args = command.args;

    switch (entry.kind) {
    case CommandKind::List:
        return from_navigator(navigator_.list(cwd, args));
    case CommandKind::ChangeDirectory:
        return from_navigator(navigator_.change_directory(cwd, args));
    case CommandKind::PrintDirectory:
        return Outcome{.output = cwd};
    case CommandKind::MakeDirectory:
        return from_navigator(navigator_.make_directory(cwd, args));
    case CommandKind::RemoveDirectory:
        return from_navigator(navigator_.remove_directory(cwd, args));
    case CommandKind::Remove:
        return from_navigator(navigator_.remove(cwd, args));
    case CommandKind::Copy:
        return from_navigator(navigator_.copy(cwd, args));
    case CommandKind::Move:
        return from_navigator(navigator_.move(cwd, args));
    case CommandKind::ReadFile:
        return from_navigator(navigator_.read_files(cwd, args));
    case CommandKind::Touch:
        return from_navigator(navigator_.touch(cwd, args));
    case CommandKind::Echo:
        return Outcome{.output = join(args, " ")};
    case CommandKind::Clear:
        return Outcome{.clear_screen = true};
    case CommandKind::Exit:
        return Outcome{.output = "Exiting terminal..."};
    case CommandKind::History: {
        if (!args.empty() && args.front() == "-c") {
            if (auto cleared = store_.clear_history(session_id); !cleared) {
                return std::unexpected(cleared.error());
            }
            return Outcome{.output = "History cleared", .skip_history = true};
        }
        if (!args.empty()) {
            return std::unexpected(Error{Error::Code::InvalidArguments, "history: invalid option '" + args.front() + "'"});
        }
        auto const entries = store_.history(session_id);
        if (entries.empty()) {
            return Outcome{.output = "(no history)"};
        }
        std::ostringstream out;
        for (std::size_t i = 0; i < entries.size(); ++i) {
            if (i > 0) {
                out << '\n';
            }
            out << std::setw(5) << (i + 1) << "  " << entries[i];
        }
        return Outcome{.output = out.str()};
    }
    case CommandKind::Help: {
        if (args.empty()) {
            return Outcome{.output = catalog_.render_help()};
        }
        if (to_lower_copy(args.front()) == "examples") {
            std::ostringstream out;
            out << "Natural-language examples (prefix with '!'):";
            for (auto const& example : resolver_.examples()) {
                out << "\n  !" << example.phrase << " - " << example.description;
            }
            return Outcome{.output = out.str()};
        }
        auto text = catalog_.render_help(args.front());
        if (text.empty()) {
            return std::unexpected(
                Error{Error::Code::InvalidArguments, "help: no help topics match '" + args.front() + "'."});
        }
        return Outcome{.output = std::move(text)};
    }
    case CommandKind::CpuReport:
        return Outcome{.output = render_cpu_report(snapshot())};
    case CommandKind::MemoryReport:
        return Outcome{.output = render_memory_report(snapshot())};
    case CommandKind::ProcessReport:
        return Outcome{.output = render_process_report(snapshot())};
    case CommandKind::TopReport:
        return Outcome{.output = render_top_report(snapshot())};
    case CommandKind::External:
        break;
    }
    return run_external(command, cwd);
}

auto CommandDispatcher::run_external(ResolvedCommand const& command, std::string const& cwd) -> Expected<Outcome> {
    auto result = runner_.execute(command.name, command.args, cwd);
    if (!result) {
        if (result.error().code == Error::Code::UnknownCommand) {
            return std::unexpected(unknown_command(command.name, "Command '" + command.name + "' not found."));
        }
        return std::unexpected(result.error());
    }

    std::string output = trim_trailing_newlines(std::move(result->stdout_data));
    auto        errors = trim_trailing_newlines(std::move(result->stderr_data));
    if (!errors.empty()) {
        if (!output.empty()) {
            output.push_back('\n');
        }
        output.append(errors);
    }
    if (result->truncated) {
        output.append(output.empty() ? "[output truncated]" : "\n[output truncated]");
    }
    if (result->exit_code != 0) {
        if (output.empty()) {
            output = command.name + ": exited with status " + std::to_string(result->exit_code);
        }
        return std::unexpected(Error{Error::Code::ExecutionFailed, std::move(output)});
    }
    if (output.empty()) {
        output = std::string{kNoOutputMessage};
    }
    return Outcome{.output = std::move(output)};
}

auto CommandDispatcher::is_blocked(std::string_view program) const -> bool {
    auto const name = to_lower_copy(program);
    for (auto const& blocked : options_.blocked_programs) {
        if (!blocked.empty() && blocked.back() == '*') {
            if (name.starts_with(std::string_view{blocked}.substr(0, blocked.size() - 1))) {
                return true;
            }
        } else if (name == blocked) {
            return true;
        }
    }
    return false;
}

auto CommandDispatcher::unknown_command(std::string const& name, std::string message) const -> Error {
    auto suggestions = close_matches(name, catalog_.names(), 3, 0.6);
    if (!suggestions.empty()) {
        message = "Command '" + name + "' not found. Did you mean: " + join(suggestions, ", ") + "?";
    }
    return Error{Error::Code::UnknownCommand, std::move(message)};
}

auto CommandDispatcher::snapshot() -> MetricsSnapshot {
    if (!sampler_.has_sample()) {
        return sampler_.sample();
    }
    return sampler_.latest();
}

} // namespace TS::Shell
