#include <doctest/doctest.h>
#include <tabshell/web/ShellServerOptions.hpp>

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

struct ArgvBuilder {
    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.reserve(args.size());
        for (auto value : args) {
            storage.emplace_back(value);
        }
        pointers.reserve(storage.size());
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

auto parse(std::initializer_list<const char*> args) -> std::optional<TS::Serve::ShellServerOptions> {
    ArgvBuilder argv{args};
    return TS::Serve::ParseShellServerArguments(argv.argc(), argv.argv());
}

} // namespace

TEST_CASE("ShellServerOptions port validation") {
    CHECK(TS::Serve::IsValidShellServerPort(80));
    CHECK(TS::Serve::IsValidShellServerPort(65535));
    CHECK_FALSE(TS::Serve::IsValidShellServerPort(0));
    CHECK_FALSE(TS::Serve::IsValidShellServerPort(70000));
}

TEST_CASE("ShellServerOptions defaults resolve the root to HOME") {
    EnvGuard home{"HOME", "/home/tester"};
    auto     parsed = parse({"tabshell_serve"});
    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "127.0.0.1");
    CHECK(parsed->port == 8080);
    CHECK(parsed->root_directory == "/home/tester");
    CHECK(parsed->sandbox_root.empty());
    CHECK(parsed->history_limit == 500);
    CHECK(parsed->command_timeout_ms == 10000);
    CHECK(parsed->liveness_window_seconds == 30);
    CHECK(parsed->collapse_duplicate_history);
    CHECK(parsed->allow_unregistered_commands);
    CHECK(parsed->min_workers >= 1);
}

TEST_CASE("ShellServerOptions command line flags") {
    auto parsed = parse({"tabshell_serve", "--host", "0.0.0.0", "--port", "9000", "--root", "/srv/tabs/",
                         "--history-limit", "10", "--command-timeout-ms", "0", "--workers", "2", "--max-workers",
                         "8", "--keep-duplicate-history", "--registered-only"});
    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "0.0.0.0");
    CHECK(parsed->port == 9000);
    CHECK(parsed->root_directory == "/srv/tabs");
    CHECK(parsed->history_limit == 10);
    CHECK(parsed->command_timeout_ms == 0);
    CHECK(parsed->min_workers == 2);
    CHECK(parsed->max_workers == 8);
    CHECK_FALSE(parsed->collapse_duplicate_history);
    CHECK_FALSE(parsed->allow_unregistered_commands);
}

TEST_CASE("ShellServerOptions root defaults to the sandbox") {
    auto parsed = parse({"tabshell_serve", "--sandbox", "/srv/sandbox"});
    REQUIRE(parsed.has_value());
    CHECK(parsed->sandbox_root == "/srv/sandbox");
    CHECK(parsed->root_directory == "/srv/sandbox");
}

TEST_CASE("ShellServerOptions rejects bad command lines") {
    CHECK_FALSE(parse({"tabshell_serve", "--port"}).has_value());
    CHECK_FALSE(parse({"tabshell_serve", "--port", "abc"}).has_value());
    CHECK_FALSE(parse({"tabshell_serve", "--history-limit", "0"}).has_value());
    CHECK_FALSE(parse({"tabshell_serve", "--root", "relative/dir"}).has_value());
    CHECK_FALSE(parse({"tabshell_serve", "--root", "/elsewhere", "--sandbox", "/srv/sandbox"}).has_value());
    CHECK_FALSE(parse({"tabshell_serve", "--workers", "8", "--max-workers", "2"}).has_value());
    CHECK_FALSE(parse({"tabshell_serve", "--tls-cert", "/tmp/cert.pem"}).has_value());
    CHECK_FALSE(parse({"tabshell_serve", "--bogus"}).has_value());
}

TEST_CASE("ShellServerOptions help short-circuits validation") {
    auto parsed = parse({"tabshell_serve", "--help", "--port", "abc"});
    REQUIRE(parsed.has_value());
    CHECK(parsed->show_help);
}

TEST_CASE("ShellServerOptions Validate reports the offending flag") {
    TS::Serve::ShellServerOptions options{};
    options.root_directory = "/srv";

    CHECK_FALSE(TS::Serve::ValidateShellServerOptions(options).has_value());

    options.port = 70000;
    auto error   = TS::Serve::ValidateShellServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--port") != std::string::npos);

    options.port          = 8080;
    options.sandbox_root  = "/srv/inner";
    error                 = TS::Serve::ValidateShellServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--sandbox") != std::string::npos);

    options.sandbox_root  = "/srv";
    options.http_threads  = 0;
    error                 = TS::Serve::ValidateShellServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--http-threads") != std::string::npos);
}

TEST_CASE("Environment overrides apply to CLI defaults") {
    EnvGuard host{"TABSHELL_SERVE_HOST", "0.0.0.0"};
    EnvGuard port{"TABSHELL_SERVE_PORT", "9090"};
    EnvGuard root{"TABSHELL_SERVE_ROOT", "/data"};
    EnvGuard limit{"TABSHELL_SERVE_HISTORY_LIMIT", "25"};
    EnvGuard collapse{"TABSHELL_SERVE_COLLAPSE_DUPLICATES", "off"};

    auto parsed = parse({"tabshell_serve"});
    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "0.0.0.0");
    CHECK(parsed->port == 9090);
    CHECK(parsed->root_directory == "/data");
    CHECK(parsed->history_limit == 25);
    CHECK_FALSE(parsed->collapse_duplicate_history);
}

TEST_CASE("Command line flags win over the environment") {
    EnvGuard port{"TABSHELL_SERVE_PORT", "9090"};
    auto     parsed = parse({"tabshell_serve", "--port", "9191", "--root", "/data"});
    REQUIRE(parsed.has_value());
    CHECK(parsed->port == 9191);
}

TEST_CASE("Invalid environment override fails early") {
    SUBCASE("Port out of range") {
        EnvGuard port{"TABSHELL_SERVE_PORT", "70000"};
        CHECK_FALSE(parse({"tabshell_serve"}).has_value());
    }
    SUBCASE("Boolean that is not one") {
        EnvGuard flag{"TABSHELL_SERVE_ALLOW_UNREGISTERED", "maybe"};
        CHECK_FALSE(parse({"tabshell_serve"}).has_value());
    }
    SUBCASE("Relative sandbox") {
        EnvGuard sandbox{"TABSHELL_SERVE_SANDBOX", "sandbox"};
        CHECK_FALSE(parse({"tabshell_serve"}).has_value());
    }
}
