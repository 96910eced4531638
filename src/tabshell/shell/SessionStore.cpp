#include <tabshell/shell/SessionStore.hpp>

#include <tabshell/shell/Similarity.hpp>

#include "utils/TaggedLogger.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace TS::Shell {

namespace {

auto not_found(std::string const& id) -> Error {
    return Error{Error::Code::NotFound, "no session '" + id + "'"};
}

template <typename T>
void trim_front(std::deque<T>& items, std::size_t limit) {
    while (items.size() > limit) {
        items.pop_front();
    }
}

} // namespace

Session::Session(std::string id, std::string directory)
    : id_{std::move(id)}
    , directory_{std::move(directory)}
    , last_active_{SteadyClock::now()} {}

auto Session::current_directory() const -> std::string {
    std::lock_guard const lock{mutex_};
    return directory_;
}

auto Session::history() const -> std::vector<std::string> {
    std::lock_guard const lock{mutex_};
    return {history_.begin(), history_.end()};
}

auto Session::transcript() const -> std::vector<TranscriptEntry> {
    std::lock_guard const lock{mutex_};
    return {transcript_.begin(), transcript_.end()};
}

auto Session::attached() const -> bool {
    return channel_count() > 0;
}

auto Session::channel_count() const -> std::size_t {
    std::lock_guard const lock{mutex_};
    return channels_;
}

SessionStore::SessionStore(SessionConfig config)
    : config_{std::move(config)} {}

auto SessionStore::get_or_create(std::string const& id) -> SessionPtr {
    {
        std::shared_lock const lock{mutex_};
        if (auto it = sessions_.find(id); it != sessions_.end()) {
            return it->second;
        }
    }
    std::unique_lock const lock{mutex_};
    return find_or_insert_locked(id);
}

auto SessionStore::find(std::string const& id) const -> SessionPtr {
    std::shared_lock const lock{mutex_};
    auto                   it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

auto SessionStore::contains(std::string const& id) const -> bool {
    return find(id) != nullptr;
}

auto SessionStore::lookup(std::string const& id) const -> Expected<SessionPtr> {
    auto session = find(id);
    if (!session) {
        return std::unexpected(not_found(id));
    }
    return session;
}

auto SessionStore::append_history(std::string const& id, std::string raw_command) -> Expected<void> {
    auto session = lookup(id);
    if (!session) {
        return std::unexpected(session.error());
    }
    auto&                 record = **session;
    std::lock_guard const lock{record.mutex_};
    if (config_.collapse_duplicates && !record.history_.empty() && record.history_.back() == raw_command) {
        return {};
    }
    record.history_.push_back(std::move(raw_command));
    trim_front(record.history_, config_.history_limit);
    return {};
}

auto SessionStore::update_directory(std::string const& id, std::string directory) -> Expected<void> {
    auto session = lookup(id);
    if (!session) {
        return std::unexpected(session.error());
    }
    auto&                 record = **session;
    std::lock_guard const lock{record.mutex_};
    record.directory_ = std::move(directory);
    return {};
}

auto SessionStore::record_output(std::string const& id, std::string command, std::string output, bool is_error)
    -> Expected<void> {
    auto session = lookup(id);
    if (!session) {
        return std::unexpected(session.error());
    }
    auto&                 record = **session;
    std::lock_guard const lock{record.mutex_};
    record.transcript_.push_back(TranscriptEntry{
        .timestamp = std::chrono::system_clock::now(),
        .tab_id    = id,
        .command   = std::move(command),
        .output    = std::move(output),
        .is_error  = is_error,
    });
    trim_front(record.transcript_, config_.transcript_limit);
    return {};
}

auto SessionStore::history(std::string const& id) const -> std::vector<std::string> {
    auto session = find(id);
    return session ? session->history() : std::vector<std::string>{};
}

auto SessionStore::clear_history(std::string const& id) -> Expected<void> {
    auto session = lookup(id);
    if (!session) {
        return std::unexpected(session.error());
    }
    auto&                 record = **session;
    std::lock_guard const lock{record.mutex_};
    record.history_.clear();
    record.transcript_.clear();
    return {};
}

auto SessionStore::transcript(std::string const& id) const -> std::vector<TranscriptEntry> {
    auto session = find(id);
    return session ? session->transcript() : std::vector<TranscriptEntry>{};
}

auto SessionStore::all_transcripts() const -> std::vector<TranscriptEntry> {
    std::vector<SessionPtr> sessions;
    {
        std::shared_lock const lock{mutex_};
        sessions.reserve(sessions_.size());
        for (auto const& [_, session] : sessions_) {
            sessions.push_back(session);
        }
    }
    std::vector<TranscriptEntry> merged;
    for (auto const& session : sessions) {
        auto entries = session->transcript();
        merged.insert(merged.end(),
                      std::make_move_iterator(entries.begin()),
                      std::make_move_iterator(entries.end()));
    }
    std::stable_sort(merged.begin(), merged.end(), [](auto const& lhs, auto const& rhs) {
        return lhs.timestamp < rhs.timestamp;
    });
    return merged;
}

auto SessionStore::search_transcript(std::string const& id, std::string_view query) const
    -> std::vector<TranscriptEntry> {
    auto entries = transcript(id);
    if (query.empty()) {
        return entries;
    }
    auto const needle = to_lower_copy(query);
    std::erase_if(entries, [&](TranscriptEntry const& entry) {
        return to_lower_copy(entry.command).find(needle) == std::string::npos
               && to_lower_copy(entry.output).find(needle) == std::string::npos;
    });
    return entries;
}

auto SessionStore::remove(std::string const& id) -> bool {
    std::unique_lock const lock{mutex_};
    auto const             erased = sessions_.erase(id) > 0;
    if (erased) {
        ts_log("SessionStore removed session " + id, "SessionStore");
    }
    return erased;
}

auto SessionStore::find_or_insert_locked(std::string const& id) -> SessionPtr {
    auto [it, inserted] = sessions_.try_emplace(id, nullptr);
    if (inserted) {
        it->second = std::make_shared<Session>(id, config_.default_directory);
        ts_log("SessionStore created session " + id, "SessionStore");
    }
    return it->second;
}

auto SessionStore::attach(std::string const& id) -> SessionPtr {
    std::unique_lock const lock{mutex_};
    auto                   session = find_or_insert_locked(id);
    std::lock_guard const  record_lock{session->mutex_};
    ++session->channels_;
    session->last_active_ = Session::SteadyClock::now();
    return session;
}

auto SessionStore::release(std::string const& id) -> bool {
    std::unique_lock const lock{mutex_};
    auto                   it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    {
        std::lock_guard const record_lock{it->second->mutex_};
        auto&                 record = *it->second;
        if (record.channels_ > 0) {
            --record.channels_;
        }
        if (record.channels_ > 0) {
            return false;
        }
        record.last_active_ = Session::SteadyClock::now();
    }
    if (config_.liveness_window.count() == 0) {
        sessions_.erase(it);
        ts_log("SessionStore removed session " + id, "SessionStore");
        return true;
    }
    return false;
}

auto SessionStore::begin_command(std::string const& id) -> SessionPtr {
    std::unique_lock const lock{mutex_};
    auto                   session = find_or_insert_locked(id);
    std::lock_guard const  record_lock{session->mutex_};
    ++session->running_commands_;
    session->last_active_ = Session::SteadyClock::now();
    return session;
}

auto SessionStore::finish_command(std::string const& id) -> void {
    auto session = find(id);
    if (!session) {
        return;
    }
    std::lock_guard const lock{session->mutex_};
    if (session->running_commands_ > 0) {
        --session->running_commands_;
    }
    session->last_active_ = Session::SteadyClock::now();
}

auto SessionStore::reap_expired(std::chrono::steady_clock::time_point now) -> std::vector<std::string> {
    std::vector<std::string> reaped;
    std::unique_lock const   lock{mutex_};
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        bool expired = false;
        {
            std::lock_guard const record_lock{it->second->mutex_};
            auto const&           record = *it->second;
            expired = record.channels_ == 0 && record.running_commands_ == 0
                      && now - record.last_active_ >= config_.liveness_window;
        }
        if (expired) {
            reaped.push_back(it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return reaped;
}

auto SessionStore::size() const -> std::size_t {
    std::shared_lock const lock{mutex_};
    return sessions_.size();
}

auto SessionStore::ids() const -> std::vector<std::string> {
    std::vector<std::string> result;
    {
        std::shared_lock const lock{mutex_};
        result.reserve(sessions_.size());
        for (auto const& [id, _] : sessions_) {
            result.push_back(id);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

auto SessionStore::generate_session_id() -> std::string {
    std::array<unsigned char, 32> buffer{};
    std::random_device            device;
    for (auto& byte : buffer) {
        byte = static_cast<unsigned char>(device());
    }

    std::ostringstream stream;
    stream << std::hex << std::setfill('0');
    for (auto byte : buffer) {
        stream << std::setw(2) << static_cast<int>(byte);
    }
    return stream.str();
}

} // namespace TS::Shell
