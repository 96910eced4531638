#include "taskpool/TaskPool.hpp"
#include "utils/TaggedLogger.hpp"

#include <algorithm>
#include <exception>

namespace TS {

TaskPool::TaskPool(size_t threadCount, size_t maxThreadCount) {
    threadCount      = std::max<size_t>(threadCount, 1);
    this->maxWorkers = std::max(threadCount, maxThreadCount);
    std::lock_guard<std::mutex> lock(this->mutex);
    for (size_t i = 0; i < threadCount; ++i) {
        this->spawnWorkerLocked();
    }
}

TaskPool::~TaskPool() {
    shutdown();
}

auto TaskPool::addTask(Job&& job) -> std::optional<Error> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->shuttingDown) {
        return Error{Error::Code::ChannelClosed, "task pool is shutting down"};
    }
    this->tasks.push(std::move(job));
    if (this->idleWorkers < this->tasks.size() && this->workers.size() < this->maxWorkers) {
        ts_log("Growing task pool to " + std::to_string(this->workers.size() + 1), "TaskPool");
        this->spawnWorkerLocked();
    }
    this->taskCV.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    // Signal shutdown
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            return;
        }
        this->shuttingDown = true;
        this->taskCV.notify_all();
    }

    // Workers drain the queue before exiting; jthread joins on clear.
    std::vector<std::jthread> joining;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        joining.swap(this->workers);
    }
    joining.clear();
}

auto TaskPool::size() const -> size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->workers.size();
}

auto TaskPool::maxSize() const -> size_t {
    return this->maxWorkers;
}

auto TaskPool::pending() const -> size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->tasks.size();
}

auto TaskPool::spawnWorkerLocked() -> void {
    ++this->activeWorkers;
    this->workers.emplace_back(&TaskPool::workerFunction, this);
}

auto TaskPool::workerFunction() -> void {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            ++this->idleWorkers;
            this->taskCV.wait(lock, [this] { return this->shuttingDown || !this->tasks.empty(); });
            --this->idleWorkers;

            if (this->shuttingDown && this->tasks.empty()) {
                break;
            }

            job = std::move(this->tasks.front());
            this->tasks.pop();
        }

        if (job) {
            try {
                job();
            } catch (std::exception const& ex) {
                ts_log(std::string{"Exception in pooled job: "} + ex.what(), "Error", "TaskPool");
            }
        }
    }

    --this->activeWorkers;
}

} // namespace TS
