#pragma once

#include <tabshell/core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace TS::Shell {

struct ProcessResult {
    std::string stdout_data;
    std::string stderr_data;
    int         exit_code{0};
    // Set when either stream exceeded the capture limit.
    bool        truncated{false};
};

// Generic host process invocation. Implementations block until the program
// exits or the configured timeout elapses.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual auto execute(std::string const&              name,
                         std::vector<std::string> const& args,
                         std::string const&              cwd) -> Expected<ProcessResult> = 0;
};

// fork/execvp without a shell. The child runs in its own process group so a
// timeout can kill everything it spawned.
class PosixProcessRunner final : public ProcessRunner {
public:
    struct Options {
        // Zero disables the timeout.
        std::chrono::milliseconds timeout{std::chrono::seconds{10}};
        std::size_t               max_output_bytes{1024 * 1024};
    };

    PosixProcessRunner();
    explicit PosixProcessRunner(Options options);

    auto execute(std::string const&              name,
                 std::vector<std::string> const& args,
                 std::string const&              cwd) -> Expected<ProcessResult> override;

    auto options() const -> Options const& { return options_; }

private:
    Options options_;
};

} // namespace TS::Shell
