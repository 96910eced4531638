#include <tabshell/web/ShellServer.hpp>

#include <tabshell/web/ShellController.hpp>

#include <httplib.h>

#include <chrono>
#include <cstdlib>
#include <string>
#include <utility>

namespace TS::Serve {

static std::atomic<bool> g_should_stop{false};

namespace {

auto scheme_for(bool tls) -> std::string {
    return tls ? "https://" : "http://";
}

} // namespace

auto MakeEngineConfig(ShellServerOptions const& options) -> Shell::EngineConfig {
    Shell::EngineConfig config;
    config.navigator.home_directory = options.root_directory;
    if (!options.sandbox_root.empty()) {
        config.navigator.sandbox_root = options.sandbox_root;
    }
    config.session.default_directory   = options.root_directory;
    config.session.history_limit       = static_cast<std::size_t>(options.history_limit);
    config.session.collapse_duplicates = options.collapse_duplicate_history;
    config.session.transcript_limit    = static_cast<std::size_t>(options.transcript_limit);
    config.session.liveness_window     = std::chrono::seconds{options.liveness_window_seconds};
    config.dispatcher.allow_unregistered_commands = options.allow_unregistered_commands;
    config.process.timeout   = std::chrono::milliseconds{options.command_timeout_ms};
    config.sampler.interval  = std::chrono::milliseconds{options.metrics_interval_ms};
    config.min_workers       = static_cast<std::size_t>(options.min_workers);
    config.max_workers       = static_cast<std::size_t>(options.max_workers);
    return config;
}

ShellHttpServer::ShellHttpServer(Shell::ShellEngine&       engine,
                                 ShellServerOptions const& options,
                                 std::atomic<bool>&        should_stop,
                                 LogHooks                  hooks)
    : options_{options}
    , hooks_{std::move(hooks)}
    , ip_rate_limiter_{options_.ip_rate_limit_per_minute, options_.ip_rate_limit_burst}
    , tab_rate_limiter_{options_.tab_rate_limit_per_minute, options_.tab_rate_limit_burst}
    , context_{
          .engine           = engine,
          .options          = options_,
          .metrics          = metrics_,
          .ip_rate_limiter  = ip_rate_limiter_,
          .tab_rate_limiter = tab_rate_limiter_,
          .should_stop      = should_stop,
      }
    , controller_{ShellController::Create(context_)} {}

ShellHttpServer::~ShellHttpServer() {
    stop();
}

auto ShellHttpServer::make_server() -> Expected<std::unique_ptr<httplib::Server>> {
    if (options_.tls_cert.empty()) {
        tls_ = false;
        return std::make_unique<httplib::Server>();
    }
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    auto server = std::make_unique<httplib::SSLServer>(options_.tls_cert.c_str(), options_.tls_key.c_str());
    if (!server->is_valid()) {
        return std::unexpected(Error{Error::Code::InvalidArguments,
                                     "could not load TLS certificate '" + options_.tls_cert + "' or key '"
                                         + options_.tls_key + "'"});
    }
    tls_ = true;
    return std::unique_ptr<httplib::Server>{std::move(server)};
#else
    return std::unexpected(Error{Error::Code::InvalidArguments, "built without TLS support"});
#endif
}

auto ShellHttpServer::start() -> Expected<void> {
    std::unique_lock lock(mutex_);
    if (server_) {
        return std::unexpected(Error{Error::Code::InvalidError, "shell server already running"});
    }

    auto created = make_server();
    if (!created) {
        return std::unexpected(created.error());
    }
    server_ = std::move(*created);

    auto const threads      = static_cast<std::size_t>(options_.http_threads);
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    server_->set_payload_max_length(kMaxRequestBodyBytes * 4);
    controller_->register_routes(*server_);

    int bound_port = options_.port < 0 ? 0 : options_.port;
    if (bound_port == 0) {
        bound_port = server_->bind_to_any_port(options_.host);
        if (bound_port < 0) {
            server_.reset();
            return std::unexpected(Error{Error::Code::UnknownError, "failed to bind " + options_.host});
        }
    } else if (!server_->bind_to_port(options_.host, bound_port)) {
        server_.reset();
        return std::unexpected(Error{Error::Code::UnknownError,
                                     "failed to bind " + options_.host + ":" + std::to_string(bound_port)});
    }

    bound_port_ = static_cast<std::uint16_t>(bound_port);
    running_.store(true);

    server_thread_ = std::thread([this]() {
        if (server_) {
            server_->listen_after_bind();
        }
        running_.store(false);
    });

    lock.unlock();
    server_->wait_until_ready();
    lock.lock();
    if (!server_->is_running()) {
        server_->stop();
        lock.unlock();
        join();
        lock.lock();
        server_.reset();
        bound_port_ = 0;
        running_.store(false);
        return std::unexpected(Error{Error::Code::UnknownError, "shell server failed to start listening"});
    }

    log_info(hooks_,
             "[tabshell] Listening on " + scheme_for(tls_) + options_.host + ":" + std::to_string(bound_port_));
    return {};
}

auto ShellHttpServer::stop() -> void {
    std::unique_lock lock(mutex_);
    if (!server_) {
        return;
    }
    server_->stop();
    lock.unlock();
    join();
    lock.lock();
    server_.reset();
    bound_port_ = 0;
    running_.store(false);
}

auto ShellHttpServer::join() -> void {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

auto ShellHttpServer::is_running() const -> bool {
    return running_.load();
}

auto ShellHttpServer::port() const -> std::uint16_t {
    std::lock_guard const lock(mutex_);
    return bound_port_;
}

void RequestShellServerStop() {
    g_should_stop.store(true);
}

void ResetShellServerStopFlag() {
    g_should_stop.store(false);
}

int RunShellServerWithStopFlag(ShellServerOptions const&            options,
                               std::atomic<bool>&                   should_stop,
                               LogHooks const&                      log_hooks,
                               std::function<void(Expected<void>)> on_listen) {
    std::atomic<bool> listen_reported{false};
    auto report_listen_status = [&](Expected<void> status) {
        if (!on_listen) {
            return;
        }
        bool expected = false;
        if (!listen_reported.compare_exchange_strong(expected, true)) {
            return;
        }
        on_listen(std::move(status));
    };

    Shell::ShellEngine engine{MakeEngineConfig(options), log_hooks};
    engine.start();

    ShellHttpServer server{engine, options, should_stop, log_hooks};
    auto            started = server.start();
    if (!started) {
        log_error(log_hooks,
                  "[tabshell] Failed to bind " + options.host + ":" + std::to_string(options.port) + ": "
                      + describeError(started.error()));
        report_listen_status(std::unexpected(started.error()));
        engine.stop();
        return EXIT_FAILURE;
    }
    report_listen_status({});

    bool listener_died = false;
    while (!should_stop.load(std::memory_order_acquire)) {
        if (!server.is_running()) {
            listener_died = true;
            log_error(log_hooks, "[tabshell] HTTP listener exited unexpectedly");
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    log_info(log_hooks, "[tabshell] Shutting down");
    server.stop();
    engine.stop();
    return listener_died ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunShellServer(ShellServerOptions const& options) {
    return RunShellServerWithStopFlag(options, g_should_stop, {}, {});
}

} // namespace TS::Serve
