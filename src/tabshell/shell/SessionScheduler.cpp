#include <tabshell/shell/SessionScheduler.hpp>

#include "taskpool/TaskPool.hpp"
#include "utils/TaggedLogger.hpp"

#include <exception>

namespace TS::Shell {

SessionScheduler::SessionScheduler(TaskPool& pool)
    : pool_{pool} {}

SessionScheduler::~SessionScheduler() {
    shutdown();
}

auto SessionScheduler::submit(std::string const& session_id, Job job) -> Expected<void> {
    if (!job) {
        return std::unexpected(Error{Error::Code::InvalidArguments, "empty job"});
    }
    std::lock_guard const lock{mutex_};
    if (closed_) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "scheduler is shutting down"});
    }
    auto& lane = lanes_[session_id];
    lane.jobs.push_back(std::move(job));
    if (lane.running) {
        ts_log("Lane " + session_id + " queued behind running job", "Lane");
        return {};
    }
    auto scheduled = schedule_locked(session_id, lane);
    if (!scheduled) {
        lanes_.erase(session_id);
    }
    return scheduled;
}

auto SessionScheduler::schedule_locked(std::string const& session_id, Lane& lane) -> Expected<void> {
    lane.running = true;
    if (auto error = pool_.addTask([this, session_id] { run_next(session_id); })) {
        lane.running = false;
        return std::unexpected(*error);
    }
    return {};
}

auto SessionScheduler::run_next(std::string session_id) -> void {
    Job job;
    {
        std::lock_guard const lock{mutex_};
        auto                  it = lanes_.find(session_id);
        if (it == lanes_.end()) {
            idle_cv_.notify_all();
            return;
        }
        if (it->second.jobs.empty()) {
            lanes_.erase(it);
            idle_cv_.notify_all();
            return;
        }
        job = std::move(it->second.jobs.front());
        it->second.jobs.pop_front();
    }

    try {
        job();
    } catch (std::exception const& ex) {
        ts_log("Lane " + session_id + " job threw: " + ex.what(), "Error", "Lane");
    }

    std::lock_guard const lock{mutex_};
    auto                  it = lanes_.find(session_id);
    if (it == lanes_.end()) {
        idle_cv_.notify_all();
        return;
    }
    if (it->second.jobs.empty() || closed_) {
        lanes_.erase(it);
        idle_cv_.notify_all();
        return;
    }
    // Re-queue instead of looping so one busy session cannot pin a worker.
    if (!schedule_locked(session_id, it->second)) {
        lanes_.erase(it);
        idle_cv_.notify_all();
    }
}

auto SessionScheduler::drop(std::string const& session_id) -> std::size_t {
    std::lock_guard const lock{mutex_};
    auto                  it = lanes_.find(session_id);
    if (it == lanes_.end()) {
        return 0;
    }
    auto const dropped = it->second.jobs.size();
    it->second.jobs.clear();
    if (!it->second.running) {
        lanes_.erase(it);
        idle_cv_.notify_all();
    }
    return dropped;
}

auto SessionScheduler::pending(std::string const& session_id) const -> std::size_t {
    std::lock_guard const lock{mutex_};
    auto                  it = lanes_.find(session_id);
    if (it == lanes_.end()) {
        return 0;
    }
    return it->second.jobs.size() + (it->second.running ? 1 : 0);
}

auto SessionScheduler::lane_count() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return lanes_.size();
}

auto SessionScheduler::wait_idle(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock{mutex_};
    return idle_cv_.wait_for(lock, timeout, [this] { return lanes_.empty(); });
}

auto SessionScheduler::shutdown(std::chrono::milliseconds timeout) -> void {
    std::unique_lock lock{mutex_};
    closed_ = true;
    for (auto& [_, lane] : lanes_) {
        lane.jobs.clear();
    }
    std::erase_if(lanes_, [](auto const& item) { return !item.second.running; });
    idle_cv_.wait_for(lock, timeout, [this] { return lanes_.empty(); });
}

} // namespace TS::Shell
