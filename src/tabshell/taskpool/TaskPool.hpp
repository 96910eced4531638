#pragma once
#include <tabshell/core/Error.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace TS {

// Worker pool that starts with `threadCount` threads and adds one whenever a
// task arrives while every worker is busy, up to `maxThreadCount`.
class TaskPool {
public:
    using Job = std::function<void()>;

    explicit TaskPool(size_t threadCount = std::thread::hardware_concurrency(), size_t maxThreadCount = 0);
    ~TaskPool();

    TaskPool(TaskPool const&) = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto addTask(Job&& job) -> std::optional<Error>;
    auto shutdown() -> void;
    auto size() const -> size_t;
    auto maxSize() const -> size_t;
    auto pending() const -> size_t;

private:
    auto workerFunction() -> void;
    auto spawnWorkerLocked() -> void;

    std::vector<std::jthread> workers;
    std::queue<Job>           tasks;
    mutable std::mutex        mutex;
    std::condition_variable   taskCV;
    size_t                    maxWorkers{0};
    size_t                    idleWorkers{0};
    std::atomic<bool>         shuttingDown{false};
    std::atomic<size_t>       activeWorkers{0};
};

} // namespace TS
