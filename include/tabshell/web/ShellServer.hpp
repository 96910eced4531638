#pragma once

#include <tabshell/core/Error.hpp>
#include <tabshell/core/LogHooks.hpp>
#include <tabshell/shell/ShellEngine.hpp>
#include <tabshell/web/HttpHelpers.hpp>
#include <tabshell/web/Metrics.hpp>
#include <tabshell/web/ShellServerOptions.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace httplib {
class Server;
}

namespace TS::Serve {

class ShellController;

// Translates the parsed command line into engine settings.
auto MakeEngineConfig(ShellServerOptions const& options) -> Shell::EngineConfig;

// HTTP front end bound to one engine. Port 0 binds an ephemeral port.
class ShellHttpServer {
public:
    ShellHttpServer(Shell::ShellEngine&       engine,
                    ShellServerOptions const& options,
                    std::atomic<bool>&        should_stop,
                    LogHooks                  hooks = {});
    ~ShellHttpServer();

    ShellHttpServer(ShellHttpServer const&)                    = delete;
    auto operator=(ShellHttpServer const&) -> ShellHttpServer& = delete;

    auto start() -> Expected<void>;
    auto stop() -> void;
    auto join() -> void;
    auto is_running() const -> bool;
    auto port() const -> std::uint16_t;
    auto is_tls() const -> bool { return tls_; }

    auto metrics() -> MetricsCollector& { return metrics_; }

private:
    auto make_server() -> Expected<std::unique_ptr<httplib::Server>>;

    ShellServerOptions               options_;
    LogHooks                         hooks_;
    MetricsCollector                 metrics_;
    TokenBucketRateLimiter           ip_rate_limiter_;
    TokenBucketRateLimiter           tab_rate_limiter_;
    HttpRequestContext               context_;
    std::unique_ptr<ShellController> controller_;
    std::unique_ptr<httplib::Server> server_;
    std::thread                      server_thread_;
    mutable std::mutex               mutex_;
    std::atomic<bool>                running_{false};
    std::uint16_t                    bound_port_{0};
    bool                             tls_{false};
};

int RunShellServer(ShellServerOptions const& options);

int RunShellServerWithStopFlag(ShellServerOptions const&            options,
                               std::atomic<bool>&                   should_stop,
                               LogHooks const&                      log_hooks = {},
                               std::function<void(Expected<void>)> on_listen = {});

void RequestShellServerStop();
void ResetShellServerStopFlag();

} // namespace TS::Serve
