#pragma once

#include <tabshell/core/Error.hpp>
#include <tabshell/core/LogHooks.hpp>
#include <tabshell/shell/Autocomplete.hpp>
#include <tabshell/shell/BroadcastHub.hpp>
#include <tabshell/shell/CommandCatalog.hpp>
#include <tabshell/shell/CommandDispatcher.hpp>
#include <tabshell/shell/CommandResolver.hpp>
#include <tabshell/shell/FilesystemNavigator.hpp>
#include <tabshell/shell/MetricsSampler.hpp>
#include <tabshell/shell/ProcessRunner.hpp>
#include <tabshell/shell/SessionScheduler.hpp>
#include <tabshell/shell/SessionStore.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace TS {
class TaskPool;
}

namespace TS::Shell {

struct EngineConfig {
    NavigatorConfig             navigator;
    SessionConfig               session;
    DispatcherOptions           dispatcher;
    PosixProcessRunner::Options process;
    MetricsSampler::Options     sampler;
    std::size_t                 min_workers{std::max(std::thread::hardware_concurrency(), 1u)};
    std::size_t                 max_workers{64};
    std::string                 proc_root{"/proc"};
};

// Wires the engine components together and owns their lifetimes.
class ShellEngine {
public:
    using Completion = std::function<void(std::vector<OutputEvent> const&)>;

    explicit ShellEngine(EngineConfig config, LogHooks hooks = {});
    // Injection point for tests: a fake process primitive and host probe.
    ShellEngine(EngineConfig                   config,
                LogHooks                       hooks,
                std::unique_ptr<ProcessRunner> runner,
                std::unique_ptr<HostProbe>     probe);
    ~ShellEngine();

    ShellEngine(ShellEngine const&)                    = delete;
    auto operator=(ShellEngine const&) -> ShellEngine& = delete;

    // Starts the metrics tick. Idempotent.
    auto start() -> void;
    // Stops the sampler, then the lanes, then the worker pool.
    auto stop() -> void;

    // Creates or resumes a session; an empty id gets a generated one.
    auto open_session(std::string const& session_id) -> SessionStore::SessionPtr;
    // Drops queued commands, closes channels and forgets the session.
    auto close_session(std::string const& session_id) -> bool;

    // Queues a command on the session's lane. Events go to the session's
    // channels and then to `on_complete`, if set.
    auto submit(std::string const& session_id, std::string raw_input, Completion on_complete = {})
        -> Expected<void>;
    // Queues a command and blocks until its events are available.
    auto submit_and_wait(std::string const& session_id,
                         std::string       raw_input,
                         std::chrono::milliseconds timeout) -> Expected<std::vector<OutputEvent>>;

    auto autocomplete(std::string const& session_id, std::string_view partial) -> std::vector<std::string>;

    auto connect(std::shared_ptr<EventChannel> channel) -> BroadcastHub::ChannelId;
    auto disconnect(BroadcastHub::ChannelId id) -> bool;

    // One sampler tick: broadcast the snapshot and reap expired sessions.
    auto on_metrics_tick(MetricsSnapshot const& snapshot) -> void;

    auto store() -> SessionStore& { return store_; }
    auto hub() -> BroadcastHub& { return hub_; }
    auto sampler() -> MetricsSampler& { return sampler_; }
    auto scheduler() -> SessionScheduler& { return *scheduler_; }
    auto dispatcher() -> CommandDispatcher& { return dispatcher_; }
    auto catalog() const -> CommandCatalog const& { return catalog_; }
    auto resolver() const -> CommandResolver const& { return resolver_; }
    auto config() const -> EngineConfig const& { return config_; }

private:
    auto publish(std::string const& session_id, std::vector<OutputEvent> const& events) -> void;

    EngineConfig                      config_;
    LogHooks                          hooks_;
    CommandCatalog const&             catalog_;
    CommandResolver                   resolver_;
    FilesystemNavigator               navigator_;
    SessionStore                      store_;
    std::unique_ptr<ProcessRunner>    runner_;
    MetricsSampler                    sampler_;
    BroadcastHub                      hub_;
    CommandDispatcher                 dispatcher_;
    Autocompleter                     autocompleter_;
    std::unique_ptr<TaskPool>         pool_;
    std::unique_ptr<SessionScheduler> scheduler_;
    bool                              started_{false};
    bool                              stopped_{false};
};

} // namespace TS::Shell
