#include <tabshell/shell/BroadcastHub.hpp>

#include <tabshell/core/TimeUtils.hpp>

#include "utils/TaggedLogger.hpp"

#include <vector>

namespace TS::Shell {

using json = nlohmann::json;

BroadcastHub::BroadcastHub(LogHooks hooks)
    : hooks_{std::move(hooks)} {}

auto BroadcastHub::set_release_callback(ReleaseCallback callback) -> void {
    std::lock_guard const lock{mutex_};
    on_release_ = std::move(callback);
}

auto BroadcastHub::connect(std::shared_ptr<EventChannel> channel) -> ChannelId {
    std::lock_guard const lock{mutex_};
    auto const            id = next_id_++;
    ts_log("Hub connected channel " + std::to_string(id) + " for " + channel->session_id(), "Hub");
    channels_.emplace(id, std::move(channel));
    return id;
}

auto BroadcastHub::disconnect(ChannelId id) -> bool {
    std::shared_ptr<EventChannel> channel;
    ReleaseCallback               release;
    {
        std::lock_guard const lock{mutex_};
        auto                  it = channels_.find(id);
        if (it == channels_.end()) {
            return false;
        }
        channel = std::move(it->second);
        channels_.erase(it);
        release = on_release_;
    }
    channel->close();
    if (release) {
        release(channel->session_id());
    }
    return true;
}

auto BroadcastHub::disconnect_session(std::string const& session_id) -> std::size_t {
    std::vector<std::shared_ptr<EventChannel>> closing;
    {
        std::lock_guard const lock{mutex_};
        for (auto it = channels_.begin(); it != channels_.end();) {
            if (it->second->session_id() == session_id) {
                closing.push_back(std::move(it->second));
                it = channels_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto const& channel : closing) {
        channel->close();
    }
    return closing.size();
}

auto BroadcastHub::broadcast(std::string_view event, json const& payload) -> std::size_t {
    std::vector<Entry> targets;
    {
        std::lock_guard const lock{mutex_};
        targets.assign(channels_.begin(), channels_.end());
    }
    return deliver_all(targets, event, payload);
}

auto BroadcastHub::broadcast_metrics(MetricsSnapshot const& snapshot) -> std::size_t {
    return broadcast("system_info", metrics_payload(snapshot));
}

auto BroadcastHub::send(std::string const& session_id, std::string_view event, json const& payload)
    -> Expected<std::size_t> {
    std::vector<Entry> targets;
    {
        std::lock_guard const lock{mutex_};
        for (auto const& entry : channels_) {
            if (entry.second->session_id() == session_id) {
                targets.push_back(entry);
            }
        }
    }
    if (targets.empty()) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "no channel for session '" + session_id + "'"});
    }
    auto const delivered = deliver_all(targets, event, payload);
    if (delivered == 0) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "every channel for '" + session_id + "' failed"});
    }
    return delivered;
}

auto BroadcastHub::deliver_all(std::vector<Entry> const& targets, std::string_view event, json const& payload)
    -> std::size_t {
    std::size_t delivered = 0;
    for (auto const& [id, channel] : targets) {
        auto result = channel->deliver(event, payload);
        if (result) {
            ++delivered;
            continue;
        }
        drop_failed(id, result.error());
    }
    ts_log("Hub delivered " + std::string{event} + " to " + std::to_string(delivered) + " channel(s)", "Delivery");
    return delivered;
}

auto BroadcastHub::drop_failed(ChannelId id, Error const& error) -> void {
    std::shared_ptr<EventChannel> channel;
    ReleaseCallback               release;
    {
        std::lock_guard const lock{mutex_};
        auto                  it = channels_.find(id);
        if (it == channels_.end()) {
            // Already removed by a concurrent disconnect.
            return;
        }
        channel = std::move(it->second);
        channels_.erase(it);
        release = on_release_;
    }
    log_info(hooks_, "[tabshell] dropping channel for session " + channel->session_id() + ": "
                         + describeError(error));
    channel->close();
    if (release) {
        release(channel->session_id());
    }
}

auto BroadcastHub::channel_count() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return channels_.size();
}

auto BroadcastHub::has_channel(std::string const& session_id) const -> bool {
    std::lock_guard const lock{mutex_};
    return session_has_channel_locked(session_id);
}

auto BroadcastHub::session_has_channel_locked(std::string const& session_id) const -> bool {
    for (auto const& [_, channel] : channels_) {
        if (channel->session_id() == session_id) {
            return true;
        }
    }
    return false;
}

auto BroadcastHub::metrics_payload(MetricsSnapshot const& snapshot) -> json {
    return json{
        {"cpu", {{"percent", snapshot.cpu_percent}, {"per_core", snapshot.per_core}}},
        {"memory",
         {{"percent", snapshot.memory.percent},
          {"total", snapshot.memory.total},
          {"available", snapshot.memory.available},
          {"used", snapshot.memory.used}}},
        {"process_count", snapshot.process_count},
        {"timestamp", format_timestamp(snapshot.timestamp)},
        {"stale", snapshot.stale},
    };
}

} // namespace TS::Shell
