#pragma once

#include <tabshell/core/Error.hpp>
#include <tabshell/core/LogHooks.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace TS::Shell {

// Cumulative jiffies as read from the kernel; busy excludes idle and iowait.
struct CpuTimes {
    std::uint64_t busy{0};
    std::uint64_t total{0};
};

struct CpuSample {
    CpuTimes              aggregate;
    std::vector<CpuTimes> cores;
};

struct MemoryInfo {
    std::uint64_t total{0};
    std::uint64_t available{0};
    std::uint64_t used{0};
    std::uint64_t free{0};
    double        percent{0.0};
    std::uint64_t swap_total{0};
    std::uint64_t swap_used{0};
    std::uint64_t swap_free{0};
    double        swap_percent{0.0};
};

struct ProcessInfo {
    int           pid{0};
    std::string   status;
    std::string   user;
    std::string   command;
    std::uint64_t rss_bytes{0};
};

struct MetricsSnapshot {
    double                                cpu_percent{0.0};
    std::vector<double>                   per_core;
    MemoryInfo                            memory;
    std::size_t                           process_count{0};
    // Sorted by pid.
    std::vector<ProcessInfo>              processes;
    std::chrono::system_clock::time_point timestamp{};
    // Some part of this snapshot repeats an earlier reading because the host read failed.
    bool                                  stale{false};

    auto memory_percent() const -> double { return memory.percent; }
};

// Source of raw host readings.
class HostProbe {
public:
    virtual ~HostProbe() = default;

    virtual auto read_cpu() -> Expected<CpuSample>                      = 0;
    virtual auto read_memory() -> Expected<MemoryInfo>                  = 0;
    virtual auto read_processes() -> Expected<std::vector<ProcessInfo>> = 0;
};

// Reads stat, meminfo and the numeric pid directories under a procfs root.
class ProcHostProbe final : public HostProbe {
public:
    explicit ProcHostProbe(std::filesystem::path proc_root = "/proc");

    auto read_cpu() -> Expected<CpuSample> override;
    auto read_memory() -> Expected<MemoryInfo> override;
    auto read_processes() -> Expected<std::vector<ProcessInfo>> override;

private:
    std::filesystem::path proc_root_;
};

// Owns the latest snapshot and the background tick thread.
class MetricsSampler {
public:
    using TickCallback = std::function<void(MetricsSnapshot const&)>;

    struct Options {
        std::chrono::milliseconds interval{std::chrono::seconds{2}};
    };

    MetricsSampler(std::unique_ptr<HostProbe> probe, Options options, LogHooks hooks = {});
    ~MetricsSampler();

    MetricsSampler(MetricsSampler const&)                    = delete;
    auto operator=(MetricsSampler const&) -> MetricsSampler& = delete;

    // Takes one reading now and stores it as the latest snapshot.
    auto sample() -> MetricsSnapshot;
    auto latest() const -> MetricsSnapshot;
    auto has_sample() const -> bool;

    auto start(TickCallback on_tick) -> void;
    auto stop() -> void;
    auto running() const -> bool { return running_.load(std::memory_order_acquire); }

private:
    auto run(TickCallback on_tick) -> void;

    std::unique_ptr<HostProbe> probe_;
    Options                    options_;
    LogHooks                   hooks_;

    std::mutex                 probe_mutex_;
    std::optional<CpuSample>   previous_cpu_;

    mutable std::mutex         snapshot_mutex_;
    MetricsSnapshot            snapshot_;
    bool                       has_sample_{false};

    std::mutex                 wake_mutex_;
    std::condition_variable    wake_cv_;
    std::atomic<bool>          running_{false};
    std::atomic<bool>          stop_requested_{false};
    std::thread                thread_;
};

// Text bodies for the cpu, memory, processes and top builtins.
auto render_cpu_report(MetricsSnapshot const& snapshot) -> std::string;
auto render_memory_report(MetricsSnapshot const& snapshot) -> std::string;
auto render_process_report(MetricsSnapshot const& snapshot, std::size_t limit = 20) -> std::string;
auto render_top_report(MetricsSnapshot const& snapshot, std::size_t limit = 10) -> std::string;

} // namespace TS::Shell
