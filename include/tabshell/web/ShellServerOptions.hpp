#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace TS::Serve {

struct ShellServerOptions {
    std::string  host{"127.0.0.1"};
    int          port{8080};
    // Empty until parsing resolves it to $HOME or the process cwd.
    std::string  root_directory;
    std::string  sandbox_root;
    std::int64_t history_limit{500};
    bool         collapse_duplicate_history{true};
    std::int64_t transcript_limit{2000};
    std::int64_t metrics_interval_ms{2000};
    std::int64_t command_timeout_ms{10000};
    std::int64_t liveness_window_seconds{30};
    std::int64_t min_workers{DefaultWorkerCount()};
    std::int64_t max_workers{64};
    std::int64_t http_threads{32};
    std::int64_t ip_rate_limit_per_minute{600};
    std::int64_t ip_rate_limit_burst{120};
    std::int64_t tab_rate_limit_per_minute{300};
    std::int64_t tab_rate_limit_burst{60};
    bool         allow_unregistered_commands{true};
    std::string  tls_cert;
    std::string  tls_key;
    bool         show_help{false};

    static auto DefaultWorkerCount() -> std::int64_t;
};

auto ParseShellServerArguments(int argc, char** argv) -> std::optional<ShellServerOptions>;

void PrintShellServerUsage();

bool ApplyShellServerEnvOverrides(ShellServerOptions& options);

auto ValidateShellServerOptions(ShellServerOptions const& options) -> std::optional<std::string>;

bool IsValidShellServerPort(int port);

} // namespace TS::Serve
