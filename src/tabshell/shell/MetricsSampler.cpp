#include <tabshell/shell/MetricsSampler.hpp>

#include "utils/TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <exception>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <system_error>
#include <unordered_map>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace TS::Shell {

namespace fs = std::filesystem;

namespace {

constexpr std::uint64_t kBytesPerMegabyte = 1024 * 1024;

auto read_file(fs::path const& path) -> std::optional<std::string> {
    std::ifstream input{path};
    if (!input) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

auto parse_u64(std::string_view text, std::uint64_t& value) -> bool {
    auto const* begin  = text.data();
    auto const* end    = text.data() + text.size();
    auto [ptr, ec]     = std::from_chars(begin, end, value);
    return ec == std::errc{} && ptr == end;
}

auto parse_cpu_line(std::string const& line) -> std::optional<CpuTimes> {
    std::istringstream stream{line};
    std::string        label;
    stream >> label;
    // user nice system idle iowait irq softirq steal; guest time is already part of user.
    std::array<std::uint64_t, 8> fields{};
    std::size_t                  parsed = 0;
    for (auto& field : fields) {
        if (!(stream >> field)) {
            break;
        }
        ++parsed;
    }
    if (parsed < 4) {
        return std::nullopt;
    }
    CpuTimes times;
    for (auto field : fields) {
        times.total += field;
    }
    auto const idle = fields[3] + fields[4];
    times.busy      = times.total - std::min(idle, times.total);
    return times;
}

auto busy_percent(CpuTimes const& now, std::optional<CpuTimes> const& before) -> double {
    auto busy  = now.busy;
    auto total = now.total;
    if (before && now.total >= before->total && now.busy >= before->busy) {
        busy  = now.busy - before->busy;
        total = now.total - before->total;
    }
    if (total == 0) {
        return 0.0;
    }
    return std::clamp(100.0 * static_cast<double>(busy) / static_cast<double>(total), 0.0, 100.0);
}

auto percent_of(std::uint64_t part, std::uint64_t whole) -> double {
    if (whole == 0) {
        return 0.0;
    }
    return std::clamp(100.0 * static_cast<double>(part) / static_cast<double>(whole), 0.0, 100.0);
}

auto state_name(char state) -> std::string {
    switch (state) {
    case 'R':
        return "running";
    case 'S':
        return "sleeping";
    case 'D':
        return "disk-sleep";
    case 'Z':
        return "zombie";
    case 'T':
        return "stopped";
    case 't':
        return "tracing-stop";
    case 'X':
    case 'x':
        return "dead";
    case 'I':
        return "idle";
    case 'W':
        return "waking";
    case 'P':
        return "parked";
    default:
        break;
    }
    return std::string(1, state);
}

auto user_name(uid_t uid) -> std::string {
    std::array<char, 1024> buffer{};
    passwd                 entry{};
    passwd*                result = nullptr;
    if (::getpwuid_r(uid, &entry, buffer.data(), buffer.size(), &result) == 0 && result != nullptr) {
        return result->pw_name;
    }
    return std::to_string(uid);
}

auto read_process(fs::path const& directory, int pid, std::unordered_map<uid_t, std::string>& users)
    -> std::optional<ProcessInfo> {
    auto stat_text = read_file(directory / "stat");
    if (!stat_text) {
        return std::nullopt;
    }
    // "<pid> (<comm>) <state> ..." where comm may itself contain parentheses.
    auto const open  = stat_text->find('(');
    auto const close = stat_text->rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    ProcessInfo info;
    info.pid     = pid;
    info.command = stat_text->substr(open + 1, close - open - 1);

    std::istringstream       rest{stat_text->substr(close + 1)};
    std::vector<std::string> fields;
    for (std::string field; rest >> field;) {
        fields.push_back(std::move(field));
    }
    if (fields.empty() || fields.front().empty()) {
        return std::nullopt;
    }
    info.status = state_name(fields.front().front());
    // Field 24 of the full line is rss in pages; fields[0] here is field 3.
    std::uint64_t rss_pages = 0;
    if (fields.size() > 21 && parse_u64(fields[21], rss_pages)) {
        static auto const page_size = static_cast<std::uint64_t>(std::max(::sysconf(_SC_PAGESIZE), 1L));
        info.rss_bytes              = rss_pages * page_size;
    }

    struct stat owner {};
    if (::stat(directory.c_str(), &owner) == 0) {
        auto cached = users.find(owner.st_uid);
        if (cached == users.end()) {
            cached = users.emplace(owner.st_uid, user_name(owner.st_uid)).first;
        }
        info.user = cached->second;
    } else {
        info.user = "N/A";
    }
    return info;
}

auto to_megabytes(std::uint64_t bytes) -> std::uint64_t {
    return bytes / kBytesPerMegabyte;
}

} // namespace

ProcHostProbe::ProcHostProbe(fs::path proc_root)
    : proc_root_{std::move(proc_root)} {}

auto ProcHostProbe::read_cpu() -> Expected<CpuSample> {
    auto const path = proc_root_ / "stat";
    auto       text = read_file(path);
    if (!text) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot read " + path.string()});
    }
    CpuSample          sample;
    bool               saw_aggregate = false;
    std::istringstream lines{*text};
    for (std::string line; std::getline(lines, line);) {
        if (!line.starts_with("cpu")) {
            continue;
        }
        auto times = parse_cpu_line(line);
        if (!times) {
            return std::unexpected(Error{Error::Code::MalformedInput, "malformed cpu line in " + path.string()});
        }
        if (line.starts_with("cpu ")) {
            sample.aggregate = *times;
            saw_aggregate    = true;
        } else {
            sample.cores.push_back(*times);
        }
    }
    if (!saw_aggregate) {
        return std::unexpected(Error{Error::Code::MalformedInput, "no aggregate cpu line in " + path.string()});
    }
    return sample;
}

auto ProcHostProbe::read_memory() -> Expected<MemoryInfo> {
    auto const path = proc_root_ / "meminfo";
    auto       text = read_file(path);
    if (!text) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot read " + path.string()});
    }
    std::unordered_map<std::string, std::uint64_t> values;
    std::istringstream                             lines{*text};
    for (std::string line; std::getline(lines, line);) {
        auto const colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::istringstream rest{line.substr(colon + 1)};
        std::uint64_t      kilobytes = 0;
        if (rest >> kilobytes) {
            values[line.substr(0, colon)] = kilobytes * 1024;
        }
    }
    auto const value = [&](char const* key) -> std::uint64_t {
        auto it = values.find(key);
        return it == values.end() ? 0 : it->second;
    };
    if (!values.contains("MemTotal")) {
        return std::unexpected(Error{Error::Code::MalformedInput, "MemTotal missing from " + path.string()});
    }

    MemoryInfo info;
    info.total = value("MemTotal");
    info.free  = value("MemFree");
    info.available = values.contains("MemAvailable") ? value("MemAvailable")
                                                     : info.free + value("Buffers") + value("Cached");
    info.available    = std::min(info.available, info.total);
    info.used         = info.total - info.available;
    info.percent      = percent_of(info.used, info.total);
    info.swap_total   = value("SwapTotal");
    info.swap_free    = std::min(value("SwapFree"), info.swap_total);
    info.swap_used    = info.swap_total - info.swap_free;
    info.swap_percent = percent_of(info.swap_used, info.swap_total);
    return info;
}

auto ProcHostProbe::read_processes() -> Expected<std::vector<ProcessInfo>> {
    std::error_code ec;
    fs::directory_iterator it{proc_root_, ec};
    if (ec) {
        return std::unexpected(Error{Error::Code::NotFound,
                                     "cannot list " + proc_root_.string() + ": " + ec.message()});
    }

    std::vector<ProcessInfo>               processes;
    std::unordered_map<uid_t, std::string> users;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(Error{Error::Code::UnknownError,
                                         "cannot list " + proc_root_.string() + ": " + ec.message()});
        }
        auto const name = it->path().filename().string();
        int        pid  = 0;
        auto [ptr, parse_ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (parse_ec != std::errc{} || ptr != name.data() + name.size()) {
            continue;
        }
        // A process may exit between listing and reading; skip it.
        if (auto info = read_process(it->path(), pid, users)) {
            processes.push_back(std::move(*info));
        }
    }
    std::sort(processes.begin(), processes.end(), [](auto const& a, auto const& b) { return a.pid < b.pid; });
    return processes;
}

MetricsSampler::MetricsSampler(std::unique_ptr<HostProbe> probe, Options options, LogHooks hooks)
    : probe_{std::move(probe)}
    , options_{options}
    , hooks_{std::move(hooks)} {}

MetricsSampler::~MetricsSampler() {
    stop();
}

auto MetricsSampler::sample() -> MetricsSnapshot {
    MetricsSnapshot next;
    {
        std::lock_guard const lock{snapshot_mutex_};
        next = snapshot_;
    }
    next.stale     = false;
    next.timestamp = std::chrono::system_clock::now();

    std::lock_guard const probe_lock{probe_mutex_};
    auto const            report = [&](std::string_view what, Error const& error) {
        next.stale = true;
        log_error(hooks_, "[tabshell] " + std::string{what} + " sample failed: " + describeError(error));
    };

    if (auto cpu = probe_->read_cpu()) {
        next.cpu_percent = busy_percent(cpu->aggregate,
                                        previous_cpu_ ? std::optional<CpuTimes>{previous_cpu_->aggregate}
                                                      : std::nullopt);
        next.per_core.clear();
        for (std::size_t i = 0; i < cpu->cores.size(); ++i) {
            std::optional<CpuTimes> before;
            if (previous_cpu_ && i < previous_cpu_->cores.size()) {
                before = previous_cpu_->cores[i];
            }
            next.per_core.push_back(busy_percent(cpu->cores[i], before));
        }
        previous_cpu_ = std::move(*cpu);
    } else {
        report("cpu", cpu.error());
    }

    if (auto memory = probe_->read_memory()) {
        next.memory = *memory;
    } else {
        report("memory", memory.error());
    }

    if (auto processes = probe_->read_processes()) {
        next.process_count = processes->size();
        next.processes     = std::move(*processes);
    } else {
        report("process", processes.error());
    }

    {
        std::lock_guard const lock{snapshot_mutex_};
        snapshot_   = next;
        has_sample_ = true;
    }
    ts_log("Sampled cpu " + std::to_string(next.cpu_percent) + "% mem " + std::to_string(next.memory.percent) + "%",
           "Sampler");
    return next;
}

auto MetricsSampler::latest() const -> MetricsSnapshot {
    std::lock_guard const lock{snapshot_mutex_};
    return snapshot_;
}

auto MetricsSampler::has_sample() const -> bool {
    std::lock_guard const lock{snapshot_mutex_};
    return has_sample_;
}

auto MetricsSampler::start(TickCallback on_tick) -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    stop_requested_.store(false, std::memory_order_release);
    thread_ = std::thread([this, callback = std::move(on_tick)]() mutable { run(std::move(callback)); });
}

auto MetricsSampler::stop() -> void {
    {
        std::lock_guard const lock{wake_mutex_};
        stop_requested_.store(true, std::memory_order_release);
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false, std::memory_order_release);
}

auto MetricsSampler::run(TickCallback on_tick) -> void {
    while (!stop_requested_.load(std::memory_order_acquire)) {
        auto snapshot = sample();
        if (on_tick) {
            try {
                on_tick(snapshot);
            } catch (std::exception const& ex) {
                log_error(hooks_, std::string{"[tabshell] metrics tick failed: "} + ex.what());
            }
        }

        auto const     deadline = std::chrono::steady_clock::now() + options_.interval;
        std::unique_lock lock{wake_mutex_};
        while (!stop_requested_.load(std::memory_order_acquire)
               && std::chrono::steady_clock::now() < deadline) {
            auto const slice = std::min<std::chrono::steady_clock::duration>(
                deadline - std::chrono::steady_clock::now(), std::chrono::milliseconds{200});
            wake_cv_.wait_for(lock, slice);
        }
    }
}

auto render_cpu_report(MetricsSnapshot const& snapshot) -> std::string {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << "Logical cores: " << snapshot.per_core.size() << '\n';
    out << "CPU Usage Per Core:";
    if (snapshot.per_core.empty()) {
        out << "\n  Unable to get CPU usage information";
    }
    for (std::size_t i = 0; i < snapshot.per_core.size(); ++i) {
        out << "\n  Core " << i << ": " << snapshot.per_core[i] << '%';
    }
    out << "\nTotal CPU Usage: " << snapshot.cpu_percent << '%';
    return out.str();
}

auto render_memory_report(MetricsSnapshot const& snapshot) -> std::string {
    auto const&        memory = snapshot.memory;
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << "Memory Information:\n"
        << "  Total: " << to_megabytes(memory.total) << " MB\n"
        << "  Available: " << to_megabytes(memory.available) << " MB\n"
        << "  Used: " << to_megabytes(memory.used) << " MB (" << memory.percent << "%)\n"
        << "  Free: " << to_megabytes(memory.free) << " MB";
    if (memory.swap_total > 0) {
        out << "\n\nSwap Information:\n"
            << "  Total: " << to_megabytes(memory.swap_total) << " MB\n"
            << "  Used: " << to_megabytes(memory.swap_used) << " MB (" << memory.swap_percent << "%)\n"
            << "  Free: " << to_megabytes(memory.swap_free) << " MB";
    }
    return out.str();
}

auto render_process_report(MetricsSnapshot const& snapshot, std::size_t limit) -> std::string {
    if (snapshot.processes.empty()) {
        return "No processes found";
    }
    std::ostringstream out;
    out << "PID\tSTATUS\tUSER\tCOMMAND";
    auto const count = std::min(limit, snapshot.processes.size());
    for (std::size_t i = 0; i < count; ++i) {
        auto const& process = snapshot.processes[i];
        out << '\n' << process.pid << '\t' << process.status << '\t' << process.user << '\t' << process.command;
    }
    return out.str();
}

auto render_top_report(MetricsSnapshot const& snapshot, std::size_t limit) -> std::string {
    std::vector<ProcessInfo const*> ranked;
    ranked.reserve(snapshot.processes.size());
    for (auto const& process : snapshot.processes) {
        ranked.push_back(&process);
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](auto const* a, auto const* b) {
        return a->rss_bytes > b->rss_bytes;
    });

    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    out << "CPU Usage: " << snapshot.cpu_percent << "%\n"
        << "Memory: " << snapshot.memory.percent << "% used (" << to_megabytes(snapshot.memory.used) << " MB / "
        << to_megabytes(snapshot.memory.total) << " MB)\n"
        << "Processes: " << snapshot.process_count << "\n\n"
        << "PID\tMEM%\tRSS(MB)\tUSER\tCOMMAND";
    auto const count = std::min(limit, ranked.size());
    for (std::size_t i = 0; i < count; ++i) {
        auto const* process = ranked[i];
        out << '\n'
            << process->pid << '\t' << percent_of(process->rss_bytes, snapshot.memory.total) << '\t'
            << static_cast<double>(process->rss_bytes) / static_cast<double>(kBytesPerMegabyte) << '\t'
            << process->user << '\t' << process->command;
    }
    return out.str();
}

} // namespace TS::Shell
