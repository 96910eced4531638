#include <tabshell/web/ShellServerOptions.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

namespace TS::Serve {

namespace {

constexpr std::int64_t kUnbounded = std::numeric_limits<std::int64_t>::max();

std::string normalize_directory(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

bool is_absolute_path(std::string_view value) {
    return !value.empty() && value.front() == '/';
}

bool is_within(std::string_view path, std::string_view root) {
    if (root == "/") {
        return true;
    }
    return path == root || (path.starts_with(root) && path.size() > root.size() && path[root.size()] == '/');
}

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

// Numeric settings share one parsing path for flags and environment.
struct IntegerSetting {
    std::string_view                 flag;
    char const*                      env;
    std::int64_t                     min;
    std::int64_t                     max;
    std::int64_t ShellServerOptions::*member;
    std::string_view                 requirement;
};

constexpr std::array<IntegerSetting, 12> kIntegerSettings{{
    {"--history-limit", "TABSHELL_SERVE_HISTORY_LIMIT", 1, kUnbounded,
     &ShellServerOptions::history_limit, "must be >= 1"},
    {"--transcript-limit", "TABSHELL_SERVE_TRANSCRIPT_LIMIT", 1, kUnbounded,
     &ShellServerOptions::transcript_limit, "must be >= 1"},
    {"--metrics-interval-ms", "TABSHELL_SERVE_METRICS_INTERVAL_MS", 1, kUnbounded,
     &ShellServerOptions::metrics_interval_ms, "must be >= 1"},
    {"--command-timeout-ms", "TABSHELL_SERVE_COMMAND_TIMEOUT_MS", 0, kUnbounded,
     &ShellServerOptions::command_timeout_ms, "must be >= 0"},
    {"--liveness-window", "TABSHELL_SERVE_LIVENESS_WINDOW", 0, kUnbounded,
     &ShellServerOptions::liveness_window_seconds, "must be >= 0"},
    {"--workers", "TABSHELL_SERVE_WORKERS", 1, 4096, &ShellServerOptions::min_workers, "must be within 1-4096"},
    {"--max-workers", "TABSHELL_SERVE_MAX_WORKERS", 1, 4096, &ShellServerOptions::max_workers,
     "must be within 1-4096"},
    {"--http-threads", "TABSHELL_SERVE_HTTP_THREADS", 1, 4096, &ShellServerOptions::http_threads,
     "must be within 1-4096"},
    {"--rate-limit-ip-per-minute", "TABSHELL_SERVE_RATE_LIMIT_IP_PER_MINUTE", 0, kUnbounded,
     &ShellServerOptions::ip_rate_limit_per_minute, "must be >= 0"},
    {"--rate-limit-ip-burst", "TABSHELL_SERVE_RATE_LIMIT_IP_BURST", 0, kUnbounded,
     &ShellServerOptions::ip_rate_limit_burst, "must be >= 0"},
    {"--rate-limit-tab-per-minute", "TABSHELL_SERVE_RATE_LIMIT_TAB_PER_MINUTE", 0, kUnbounded,
     &ShellServerOptions::tab_rate_limit_per_minute, "must be >= 0"},
    {"--rate-limit-tab-burst", "TABSHELL_SERVE_RATE_LIMIT_TAB_BURST", 0, kUnbounded,
     &ShellServerOptions::tab_rate_limit_burst, "must be >= 0"},
}};

bool apply_integer(IntegerSetting const& setting, std::string_view label, std::string_view value,
                   ShellServerOptions& options) {
    std::int64_t parsed = options.*setting.member;
    if (!parse_integer_in_range<std::int64_t>(value, setting.min, setting.max, parsed)) {
        std::cerr << label << ' ' << setting.requirement << "\n";
        return false;
    }
    options.*setting.member = parsed;
    return true;
}

bool apply_absolute_path(std::string_view label, std::string_view value, std::string& target) {
    if (!value.empty() && !is_absolute_path(value)) {
        std::cerr << label << " must be an absolute path\n";
        return false;
    }
    target = normalize_directory(std::string{value});
    return true;
}

std::string default_root_directory() {
    if (char const* home = std::getenv("HOME"); home != nullptr && is_absolute_path(home)) {
        return normalize_directory(home);
    }
    std::error_code ec;
    auto            cwd = std::filesystem::current_path(ec);
    return ec ? std::string{"/"} : cwd.string();
}

} // namespace

auto ShellServerOptions::DefaultWorkerCount() -> std::int64_t {
    return std::clamp<std::int64_t>(std::thread::hardware_concurrency(), 1, 64);
}

bool IsValidShellServerPort(int port) {
    return port > 0 && port <= 65535;
}

auto ValidateShellServerOptions(ShellServerOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidShellServerPort(options.port)) {
        return std::string{"--port must be within 1-65535"};
    }
    if (!is_absolute_path(options.root_directory)) {
        return std::string{"--root must be an absolute path"};
    }
    if (!options.sandbox_root.empty()) {
        if (!is_absolute_path(options.sandbox_root)) {
            return std::string{"--sandbox must be an absolute path"};
        }
        if (!is_within(options.root_directory, options.sandbox_root)) {
            return std::string{"--root must lie within --sandbox"};
        }
    }
    for (auto const& setting : kIntegerSettings) {
        auto const value = options.*setting.member;
        if (value < setting.min || value > setting.max) {
            return std::string{setting.flag} + " " + std::string{setting.requirement};
        }
    }
    if (options.min_workers > options.max_workers) {
        return std::string{"--workers must not exceed --max-workers"};
    }
    if (options.tls_cert.empty() != options.tls_key.empty()) {
        return std::string{"--tls-cert and --tls-key must be given together"};
    }
    return std::nullopt;
}

bool ApplyShellServerEnvOverrides(ShellServerOptions& options) {
    if (!apply_env("TABSHELL_SERVE_HOST", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "TABSHELL_SERVE_HOST must not be empty\n";
                return false;
            }
            options.host = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("TABSHELL_SERVE_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 1, 65535, parsed)) {
                std::cerr << "TABSHELL_SERVE_PORT must be within 1-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("TABSHELL_SERVE_ROOT", [&](std::string_view value) {
            return apply_absolute_path("TABSHELL_SERVE_ROOT", value, options.root_directory);
        })) {
        return false;
    }

    if (!apply_env("TABSHELL_SERVE_SANDBOX", [&](std::string_view value) {
            return apply_absolute_path("TABSHELL_SERVE_SANDBOX", value, options.sandbox_root);
        })) {
        return false;
    }

    for (auto const& setting : kIntegerSettings) {
        if (!apply_env(setting.env, [&](std::string_view value) {
                return apply_integer(setting, setting.env, value, options);
            })) {
            return false;
        }
    }

    auto apply_flag = [](char const* key, bool& target) {
        return apply_env(key, [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << key << " must be a boolean (1/0, true/false, yes/no, on/off)\n";
                return false;
            }
            target = *parsed;
            return true;
        });
    };
    if (!apply_flag("TABSHELL_SERVE_COLLAPSE_DUPLICATES", options.collapse_duplicate_history)) {
        return false;
    }
    if (!apply_flag("TABSHELL_SERVE_ALLOW_UNREGISTERED", options.allow_unregistered_commands)) {
        return false;
    }

    if (!apply_env("TABSHELL_SERVE_TLS_CERT", [&](std::string_view value) {
            options.tls_cert = std::string{value};
            return true;
        })) {
        return false;
    }
    if (!apply_env("TABSHELL_SERVE_TLS_KEY", [&](std::string_view value) {
            options.tls_key = std::string{value};
            return true;
        })) {
        return false;
    }
    return true;
}

void PrintShellServerUsage() {
    std::cout << "Usage: tabshell_serve [options]\n"
              << "  --host <host>           Bind address (default 127.0.0.1)\n"
              << "  --port <port>           Bind port (default 8080)\n"
              << "  --root <path>           Initial directory for new tabs (default $HOME)\n"
              << "  --sandbox <path>        Confine filesystem commands to this directory\n"
              << "  --history-limit <n>     Commands kept per tab (default 500)\n"
              << "  --keep-duplicate-history Record repeated commands individually\n"
              << "  --transcript-limit <n>  Transcript entries kept per tab (default 2000)\n"
              << "  --metrics-interval-ms <ms> System metrics broadcast period (default 2000)\n"
              << "  --command-timeout-ms <ms> Kill external commands after this long, 0 disables (default 10000)\n"
              << "  --liveness-window <sec> Keep a disconnected tab this long (default 30)\n"
              << "  --workers <n>           Initial command worker threads (default: hardware concurrency)\n"
              << "  --max-workers <n>       Upper bound on command worker threads (default 64)\n"
              << "  --http-threads <n>      HTTP connection threads (default 32)\n"
              << "  --rate-limit-ip-per-minute <n> Requests per minute per client IP (default 600)\n"
              << "  --rate-limit-ip-burst <n> Burst capacity per client IP (default 120)\n"
              << "  --rate-limit-tab-per-minute <n> Requests per minute per tab (default 300)\n"
              << "  --rate-limit-tab-burst <n> Burst capacity per tab (default 60)\n"
              << "  --registered-only       Reject commands outside the built-in catalogue\n"
              << "  --tls-cert <path>       PEM certificate (enables HTTPS with --tls-key)\n"
              << "  --tls-key <path>        PEM private key\n"
              << "  --help                  Show this help\n";
}

std::optional<ShellServerOptions> ParseShellServerArguments(int argc, char** argv) {
    ShellServerOptions options{};
    if (!ApplyShellServerEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        auto const       integer = std::find_if(kIntegerSettings.begin(), kIntegerSettings.end(),
                                                [&](IntegerSetting const& setting) { return setting.flag == arg; });
        if (integer != kIntegerSettings.end()) {
            auto value = require_value(i, arg);
            if (!value || !apply_integer(*integer, arg, *value, options)) {
                return std::nullopt;
            }
        } else if (arg == "--host") {
            if (auto value = require_value(i, "--host")) {
                if (value->empty()) {
                    std::cerr << "--host must not be empty\n";
                    return std::nullopt;
                }
                options.host = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 1, 65535, parsed)) {
                    std::cerr << "--port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--root") {
            auto value = require_value(i, "--root");
            if (!value || value->empty() || !apply_absolute_path("--root", *value, options.root_directory)) {
                if (value && value->empty()) {
                    std::cerr << "--root must be an absolute path\n";
                }
                return std::nullopt;
            }
        } else if (arg == "--sandbox") {
            auto value = require_value(i, "--sandbox");
            if (!value || !apply_absolute_path("--sandbox", *value, options.sandbox_root)) {
                return std::nullopt;
            }
        } else if (arg == "--tls-cert") {
            if (auto value = require_value(i, "--tls-cert")) {
                options.tls_cert = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--tls-key") {
            if (auto value = require_value(i, "--tls-key")) {
                options.tls_key = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--keep-duplicate-history") {
            options.collapse_duplicate_history = false;
        } else if (arg == "--registered-only") {
            options.allow_unregistered_commands = false;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (options.show_help) {
        return options;
    }
    if (options.root_directory.empty()) {
        options.root_directory = options.sandbox_root.empty() ? default_root_directory() : options.sandbox_root;
    }

    if (auto error = ValidateShellServerOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

} // namespace TS::Serve
