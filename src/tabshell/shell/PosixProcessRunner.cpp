#include <tabshell/shell/ProcessRunner.hpp>

#include "utils/TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace TS::Shell {

namespace {

enum class ChildStage : int {
    ChangeDirectory = 1,
    Exec            = 2,
};

struct ChildFailure {
    int stage{0};
    int error{0};
};

// Owns one descriptor; closes it on scope exit.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd)
        : fd_{fd} {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(FileDescriptor const&)                    = delete;
    auto operator=(FileDescriptor const&) -> FileDescriptor& = delete;

    auto get() const -> int { return fd_; }
    auto valid() const -> bool { return fd_ >= 0; }
    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

auto make_pipe(FileDescriptor& read_end, FileDescriptor& write_end) -> bool {
    std::array<int, 2> fds{-1, -1};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

[[noreturn]] void fail_child(int error_fd, ChildStage stage) {
    ChildFailure failure{static_cast<int>(stage), errno};
    auto         written = ::write(error_fd, &failure, sizeof(failure));
    (void)written;
    ::_exit(127);
}

auto exit_status(int status) -> int {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

auto wait_for_child(pid_t pid, int& status) -> bool {
    while (true) {
        auto const rc = ::waitpid(pid, &status, 0);
        if (rc == pid) {
            return true;
        }
        if (rc < 0 && errno != EINTR) {
            return false;
        }
    }
}

void kill_group(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0) {
        ::kill(pid, SIGKILL);
    }
    int status = 0;
    (void)wait_for_child(pid, status);
}

auto append_capped(std::string& buffer, char const* data, std::size_t size, std::size_t cap) -> bool {
    if (buffer.size() >= cap) {
        return size > 0;
    }
    auto const room = cap - buffer.size();
    buffer.append(data, std::min(room, size));
    return size > room;
}

} // namespace

PosixProcessRunner::PosixProcessRunner()
    : PosixProcessRunner(Options{}) {}

PosixProcessRunner::PosixProcessRunner(Options options)
    : options_{options} {}

auto PosixProcessRunner::execute(std::string const&              name,
                                 std::vector<std::string> const& args,
                                 std::string const&              cwd) -> Expected<ProcessResult> {
    if (name.empty()) {
        return std::unexpected(Error{Error::Code::InvalidArguments, "empty program name"});
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(name.c_str()));
    for (auto const& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    FileDescriptor out_read, out_write, err_read, err_write, fail_read, fail_write;
    if (!make_pipe(out_read, out_write) || !make_pipe(err_read, err_write) || !make_pipe(fail_read, fail_write)) {
        return std::unexpected(Error{Error::Code::ExecutionFailed,
                                     std::string{"pipe failed: "} + std::strerror(errno)});
    }

    pid_t const pid = ::fork();
    if (pid < 0) {
        return std::unexpected(Error{Error::Code::ExecutionFailed,
                                     std::string{"fork failed: "} + std::strerror(errno)});
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int const null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            ::close(null_fd);
        }
        ::dup2(out_write.get(), STDOUT_FILENO);
        ::dup2(err_write.get(), STDERR_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            fail_child(fail_write.get(), ChildStage::ChangeDirectory);
        }
        ::execvp(argv[0], argv.data());
        fail_child(fail_write.get(), ChildStage::Exec);
    }

    ::setpgid(pid, pid);
    out_write.reset();
    err_write.reset();
    fail_write.reset();

    ChildFailure failure{};
    ssize_t      failure_bytes = 0;
    do {
        failure_bytes = ::read(fail_read.get(), &failure, sizeof(failure));
    } while (failure_bytes < 0 && errno == EINTR);
    if (failure_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        (void)wait_for_child(pid, status);
        if (failure.stage == static_cast<int>(ChildStage::ChangeDirectory)) {
            return std::unexpected(Error{Error::Code::NotFound,
                                         name + ": cannot enter '" + cwd + "': " + std::strerror(failure.error)});
        }
        if (failure.error == ENOENT) {
            return std::unexpected(Error{Error::Code::UnknownCommand, name + ": command not found"});
        }
        if (failure.error == EACCES) {
            return std::unexpected(Error{Error::Code::PermissionDenied, name + ": Permission denied"});
        }
        return std::unexpected(Error{Error::Code::ExecutionFailed, name + ": " + std::strerror(failure.error)});
    }
    ts_log("Started " + name + " as pid " + std::to_string(pid), "Process");

    using Clock           = std::chrono::steady_clock;
    bool const has_limit  = options_.timeout.count() > 0;
    auto const deadline   = Clock::now() + options_.timeout;
    auto const remaining  = [&]() -> int {
        if (!has_limit) {
            return 200;
        }
        auto const left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        return static_cast<int>(std::clamp<long long>(left, 0, 200));
    };
    auto const expired = [&] { return has_limit && Clock::now() >= deadline; };
    auto const timed_out = [&]() -> Expected<ProcessResult> {
        kill_group(pid);
        ts_log("Killed " + name + " after timeout", "Process");
        return std::unexpected(Error{Error::Code::Timeout,
                                     name + ": timed out after " + std::to_string(options_.timeout.count())
                                         + " ms"});
    };

    ProcessResult         result;
    std::array<char, 4096> buffer{};
    std::array<pollfd, 2>  fds{pollfd{out_read.get(), POLLIN, 0}, pollfd{err_read.get(), POLLIN, 0}};
    std::array<std::string*, 2> sinks{&result.stdout_data, &result.stderr_data};

    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        if (expired()) {
            return timed_out();
        }
        auto const ready = ::poll(fds.data(), fds.size(), remaining());
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            int const poll_error = errno;
            kill_group(pid);
            return std::unexpected(Error{Error::Code::ExecutionFailed,
                                         std::string{"poll failed: "} + std::strerror(poll_error)});
        }
        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            auto const count = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (count > 0) {
                if (append_capped(*sinks[i], buffer.data(), static_cast<std::size_t>(count), options_.max_output_bytes)) {
                    result.truncated = true;
                }
                continue;
            }
            if (count < 0 && errno == EINTR) {
                continue;
            }
            fds[i].fd = -1;
        }
    }

    // Both streams closed; the child may still be running if it detached them.
    int status = 0;
    while (true) {
        auto const rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            break;
        }
        if (rc < 0 && errno != EINTR) {
            return std::unexpected(Error{Error::Code::ExecutionFailed,
                                         std::string{"waitpid failed: "} + std::strerror(errno)});
        }
        if (expired()) {
            return timed_out();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    result.exit_code = exit_status(status);
    return result;
}

} // namespace TS::Shell
