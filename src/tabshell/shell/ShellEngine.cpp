#include <tabshell/shell/ShellEngine.hpp>

#include "taskpool/TaskPool.hpp"
#include "utils/TaggedLogger.hpp"

#include <cstdlib>
#include <filesystem>
#include <future>
#include <system_error>

namespace TS::Shell {

namespace {

auto normalize(EngineConfig config) -> EngineConfig {
    if (config.navigator.home_directory.empty()) {
        if (char const* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
            config.navigator.home_directory = home;
        } else {
            std::error_code ec;
            config.navigator.home_directory = std::filesystem::current_path(ec).string();
        }
    }
    if (config.session.default_directory.empty()) {
        config.session.default_directory = config.navigator.home_directory;
    }
    config.min_workers = std::max<std::size_t>(config.min_workers, 1);
    config.max_workers = std::max(config.max_workers, config.min_workers);
    return config;
}

} // namespace

ShellEngine::ShellEngine(EngineConfig config, LogHooks hooks)
    : ShellEngine(config,
                  hooks,
                  std::make_unique<PosixProcessRunner>(config.process),
                  std::make_unique<ProcHostProbe>(config.proc_root)) {}

ShellEngine::ShellEngine(EngineConfig                   config,
                         LogHooks                       hooks,
                         std::unique_ptr<ProcessRunner> runner,
                         std::unique_ptr<HostProbe>     probe)
    : config_{normalize(std::move(config))}
    , hooks_{std::move(hooks)}
    , catalog_{CommandCatalog::Default()}
    , resolver_{catalog_.names()}
    , navigator_{config_.navigator}
    , store_{config_.session}
    , runner_{std::move(runner)}
    , sampler_{std::move(probe), config_.sampler, hooks_}
    , hub_{hooks_}
    , dispatcher_{catalog_, resolver_, navigator_, store_, *runner_, sampler_, config_.dispatcher}
    , autocompleter_{catalog_, navigator_}
    , pool_{std::make_unique<TaskPool>(config_.min_workers, config_.max_workers)}
    , scheduler_{std::make_unique<SessionScheduler>(*pool_)} {
    hub_.set_release_callback([this](std::string const& session_id) {
        if (store_.release(session_id)) {
            scheduler_->drop(session_id);
        }
    });
}

ShellEngine::~ShellEngine() {
    stop();
}

auto ShellEngine::start() -> void {
    if (started_ || stopped_) {
        return;
    }
    started_ = true;
    sampler_.start([this](MetricsSnapshot const& snapshot) { on_metrics_tick(snapshot); });
}

auto ShellEngine::stop() -> void {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    sampler_.stop();
    scheduler_->shutdown();
    pool_->shutdown();
}

auto ShellEngine::open_session(std::string const& session_id) -> SessionStore::SessionPtr {
    auto id = session_id.empty() ? SessionStore::generate_session_id() : session_id;
    return store_.get_or_create(id);
}

auto ShellEngine::close_session(std::string const& session_id) -> bool {
    scheduler_->drop(session_id);
    hub_.disconnect_session(session_id);
    return store_.remove(session_id);
}

auto ShellEngine::submit(std::string const& session_id, std::string raw_input, Completion on_complete)
    -> Expected<void> {
    store_.begin_command(session_id);
    auto queued = scheduler_->submit(session_id,
                                     [this, session_id, raw = std::move(raw_input), done = std::move(on_complete)] {
                                         auto events = dispatcher_.handle(session_id, raw);
                                         publish(session_id, events);
                                         store_.finish_command(session_id);
                                         if (done) {
                                             done(events);
                                         }
                                     });
    if (!queued) {
        store_.finish_command(session_id);
    }
    return queued;
}

auto ShellEngine::submit_and_wait(std::string const& session_id,
                                  std::string       raw_input,
                                  std::chrono::milliseconds timeout) -> Expected<std::vector<OutputEvent>> {
    auto promise = std::make_shared<std::promise<std::vector<OutputEvent>>>();
    auto future  = promise->get_future();
    auto queued  = submit(session_id, std::move(raw_input), [promise](std::vector<OutputEvent> const& events) {
        promise->set_value(events);
    });
    if (!queued) {
        return std::unexpected(queued.error());
    }
    if (future.wait_for(timeout) != std::future_status::ready) {
        return std::unexpected(Error{Error::Code::Timeout, "command still running after "
                                                               + std::to_string(timeout.count()) + " ms"});
    }
    try {
        return future.get();
    } catch (std::future_error const&) {
        // The lane dropped the job before it ran.
        return std::unexpected(Error{Error::Code::ChannelClosed, "command was discarded before it ran"});
    }
}

auto ShellEngine::autocomplete(std::string const& session_id, std::string_view partial)
    -> std::vector<std::string> {
    // Completion never creates a session.
    auto session = store_.find(session_id);
    return autocompleter_.suggest(partial,
                                  session ? session->current_directory() : config_.session.default_directory);
}

auto ShellEngine::connect(std::shared_ptr<EventChannel> channel) -> BroadcastHub::ChannelId {
    store_.attach(channel->session_id());
    return hub_.connect(std::move(channel));
}

auto ShellEngine::disconnect(BroadcastHub::ChannelId id) -> bool {
    return hub_.disconnect(id);
}

auto ShellEngine::on_metrics_tick(MetricsSnapshot const& snapshot) -> void {
    hub_.broadcast_metrics(snapshot);
    for (auto const& session_id : store_.reap_expired()) {
        auto const dropped = scheduler_->drop(session_id);
        log_info(hooks_, "[tabshell] reaped idle session " + session_id + " (" + std::to_string(dropped)
                             + " queued command(s) dropped)");
    }
}

auto ShellEngine::publish(std::string const& session_id, std::vector<OutputEvent> const& events) -> void {
    for (auto const& event : events) {
        auto sent = hub_.send(session_id, event.event_name(), event.to_json());
        if (!sent) {
            // REST-only clients have no channel; the events still reach the completion.
            ts_log("No channel for " + session_id + ": " + describeError(sent.error()), "Delivery");
            break;
        }
    }
}

} // namespace TS::Shell
