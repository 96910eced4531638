#pragma once

#include <tabshell/core/Error.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace TS {
class TaskPool;
}

namespace TS::Shell {

// Per-session strands over a shared TaskPool. Jobs queued for the same session
// run one at a time in submission order; different sessions run in parallel.
class SessionScheduler {
public:
    using Job = std::function<void()>;

    explicit SessionScheduler(TaskPool& pool);
    ~SessionScheduler();

    SessionScheduler(SessionScheduler const&)                    = delete;
    auto operator=(SessionScheduler const&) -> SessionScheduler& = delete;

    auto submit(std::string const& session_id, Job job) -> Expected<void>;
    // Discards jobs that have not started yet. Returns how many were dropped.
    auto drop(std::string const& session_id) -> std::size_t;
    // Queued plus running jobs for the session.
    auto pending(std::string const& session_id) const -> std::size_t;
    auto lane_count() const -> std::size_t;
    auto wait_idle(std::chrono::milliseconds timeout) -> bool;
    // Rejects further submissions and waits for running jobs.
    auto shutdown(std::chrono::milliseconds timeout = std::chrono::seconds{5}) -> void;

private:
    struct Lane {
        std::deque<Job> jobs;
        bool            running{false};
    };

    auto schedule_locked(std::string const& session_id, Lane& lane) -> Expected<void>;
    auto run_next(std::string session_id) -> void;

    TaskPool&                             pool_;
    mutable std::mutex                    mutex_;
    std::condition_variable               idle_cv_;
    std::unordered_map<std::string, Lane> lanes_;
    bool                                  closed_{false};
};

} // namespace TS::Shell
