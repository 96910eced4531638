#pragma once

#include <tabshell/core/Error.hpp>
#include <tabshell/core/LogHooks.hpp>
#include <tabshell/shell/MetricsSampler.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TS::Shell {

// One connected client. deliver() may be called from any thread; a failure
// means the client is gone.
class EventChannel {
public:
    virtual ~EventChannel() = default;

    virtual auto session_id() const -> std::string const&                                      = 0;
    virtual auto deliver(std::string_view event, nlohmann::json const& payload) -> Expected<void> = 0;
    virtual auto close() -> void                                                               = 0;
};

class BroadcastHub {
public:
    using ChannelId        = std::uint64_t;
    // Invoked with the session id each time one of its channels goes away on
    // the client side (disconnect or failed delivery).
    using ReleaseCallback = std::function<void(std::string const&)>;

    explicit BroadcastHub(LogHooks hooks = {});

    auto set_release_callback(ReleaseCallback callback) -> void;

    auto connect(std::shared_ptr<EventChannel> channel) -> ChannelId;
    // Client-initiated close. Runs the release callback.
    auto disconnect(ChannelId id) -> bool;
    // Server-initiated close of every channel for a session; no release callback.
    auto disconnect_session(std::string const& session_id) -> std::size_t;

    // Returns the number of channels that accepted the event.
    auto broadcast(std::string_view event, nlohmann::json const& payload) -> std::size_t;
    auto broadcast_metrics(MetricsSnapshot const& snapshot) -> std::size_t;
    auto send(std::string const& session_id, std::string_view event, nlohmann::json const& payload)
        -> Expected<std::size_t>;

    auto channel_count() const -> std::size_t;
    auto has_channel(std::string const& session_id) const -> bool;

    static auto metrics_payload(MetricsSnapshot const& snapshot) -> nlohmann::json;

private:
    using Entry = std::pair<ChannelId, std::shared_ptr<EventChannel>>;

    auto deliver_all(std::vector<Entry> const& targets, std::string_view event, nlohmann::json const& payload)
        -> std::size_t;
    auto drop_failed(ChannelId id, Error const& error) -> void;
    auto session_has_channel_locked(std::string const& session_id) const -> bool;

    LogHooks                                           hooks_;
    mutable std::mutex                                 mutex_;
    std::map<ChannelId, std::shared_ptr<EventChannel>> channels_;
    ChannelId                                          next_id_{1};
    ReleaseCallback                                    on_release_;
};

} // namespace TS::Shell
