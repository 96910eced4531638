#pragma once

#include <tabshell/core/Error.hpp>
#include <tabshell/shell/BroadcastHub.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>

namespace httplib {
class DataSink;
}

namespace TS::Serve {

class MetricsCollector;

// Server-Sent Events rendition of one tab channel. The hub pushes events from
// worker threads; the HTTP connection thread drains them in pump().
class SseEventChannel final : public Shell::EventChannel {
public:
    static constexpr std::size_t kMaxQueuedEvents   = 256;
    static constexpr auto        kKeepAliveInterval = std::chrono::milliseconds(5000);
    static constexpr auto        kWaitTimeout       = std::chrono::milliseconds(200);

    SseEventChannel(std::string        tab_id,
                    nlohmann::json     ready_payload,
                    MetricsCollector*  metrics,
                    std::atomic<bool>& should_stop);

    auto session_id() const -> std::string const& override { return tab_id_; }
    // Fails with ChannelClosed once closed and with CapacityExceeded when the
    // client has fallen too far behind; either way the channel is finished.
    auto deliver(std::string_view event, nlohmann::json const& payload) -> Expected<void> override;
    auto close() -> void override;

    // Writes whatever is queued. Returns false once the stream should end.
    auto pump(httplib::DataSink& sink) -> bool;

    auto closed() const -> bool { return closed_.load(std::memory_order_acquire); }
    auto queued() const -> std::size_t;

private:
    struct QueuedEvent {
        std::string name;
        std::string data;
    };

    auto write_event(httplib::DataSink& sink, std::string_view name, std::string const& data) -> bool;
    auto finished() const -> bool;

    std::string const                     tab_id_;
    nlohmann::json                        ready_payload_;
    MetricsCollector*                     metrics_{nullptr};
    std::atomic<bool>&                    should_stop_;
    mutable std::mutex                    mutex_;
    std::condition_variable               cv_;
    std::deque<QueuedEvent>               queue_;
    std::atomic<bool>                     closed_{false};
    bool                                  started_{false};
    std::chrono::steady_clock::time_point last_write_{std::chrono::steady_clock::now()};
};

} // namespace TS::Serve
