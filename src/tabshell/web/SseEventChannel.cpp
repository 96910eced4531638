#include <tabshell/web/SseEventChannel.hpp>

#include <tabshell/web/Metrics.hpp>

#include "utils/TaggedLogger.hpp"

#include <httplib.h>

#include <utility>

namespace TS::Serve {

namespace {

auto render_sse_event(std::string_view event_name, std::string const& payload) -> std::string {
    std::string block;
    block.reserve(payload.size() + 64);
    block.append("event: ");
    block.append(event_name);
    block.append("\n");
    std::size_t start = 0U;
    do {
        auto end = payload.find('\n', start);
        auto len = (end == std::string::npos ? payload.size() : end) - start;
        block.append("data: ");
        block.append(payload.data() + start, len);
        block.append("\n");
        start = end == std::string::npos ? payload.size() : end + 1;
    } while (start < payload.size());
    block.append("\n");
    return block;
}

auto write_block(httplib::DataSink& sink, std::string const& block) -> bool {
    return sink.write(block.data(), block.size());
}

} // namespace

SseEventChannel::SseEventChannel(std::string        tab_id,
                                 nlohmann::json     ready_payload,
                                 MetricsCollector*  metrics,
                                 std::atomic<bool>& should_stop)
    : tab_id_{std::move(tab_id)}
    , ready_payload_{std::move(ready_payload)}
    , metrics_{metrics}
    , should_stop_{should_stop} {}

auto SseEventChannel::deliver(std::string_view event, nlohmann::json const& payload) -> Expected<void> {
    {
        std::lock_guard const lock{mutex_};
        if (closed_.load(std::memory_order_acquire)) {
            return std::unexpected(Error{Error::Code::ChannelClosed, "event stream for " + tab_id_ + " is closed"});
        }
        if (queue_.size() >= kMaxQueuedEvents) {
            closed_.store(true, std::memory_order_release);
            cv_.notify_all();
            return std::unexpected(Error{Error::Code::CapacityExceeded,
                                         "event stream for " + tab_id_ + " fell behind"});
        }
        queue_.push_back(QueuedEvent{std::string{event}, payload.dump()});
    }
    cv_.notify_one();
    return {};
}

auto SseEventChannel::close() -> void {
    {
        std::lock_guard const lock{mutex_};
        closed_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

auto SseEventChannel::queued() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return queue_.size();
}

auto SseEventChannel::finished() const -> bool {
    return closed_.load(std::memory_order_acquire) || should_stop_.load(std::memory_order_acquire);
}

auto SseEventChannel::pump(httplib::DataSink& sink) -> bool {
    if (finished()) {
        return false;
    }
    if (sink.is_writable && !sink.is_writable()) {
        close();
        return false;
    }

    if (!started_) {
        started_ = true;
        if (!write_block(sink, "retry: 2000\n\n") || !write_event(sink, "ready", ready_payload_.dump())) {
            close();
            return false;
        }
    }

    std::deque<QueuedEvent> pending;
    {
        std::unique_lock lock{mutex_};
        cv_.wait_for(lock, kWaitTimeout, [this] { return !queue_.empty() || finished(); });
        pending.swap(queue_);
    }

    for (auto const& event : pending) {
        if (!write_event(sink, event.name, event.data)) {
            close();
            return false;
        }
    }

    auto const now = std::chrono::steady_clock::now();
    if (now - last_write_ >= kKeepAliveInterval) {
        if (!write_block(sink, ": keepalive\n\n")) {
            close();
            return false;
        }
        last_write_ = now;
    }
    return !finished();
}

auto SseEventChannel::write_event(httplib::DataSink& sink, std::string_view name, std::string const& data) -> bool {
    if (!write_block(sink, render_sse_event(name, data))) {
        ts_log("SSE write failed for " + tab_id_, "Delivery");
        return false;
    }
    last_write_ = std::chrono::steady_clock::now();
    if (metrics_ != nullptr) {
        metrics_->record_sse_event(name);
    }
    return true;
}

} // namespace TS::Serve
