#pragma once

#include <tabshell/core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace TS::Shell {

struct SessionConfig {
    std::string          default_directory;
    std::size_t          history_limit{500};
    bool                 collapse_duplicates{true};
    std::size_t          transcript_limit{2000};
    // How long a session with no channel and no running command survives
    // its last activity before reap_expired() drops it.
    std::chrono::seconds liveness_window{std::chrono::seconds{30}};
};

struct TranscriptEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string                           tab_id;
    std::string                           command;
    std::string                           output;
    bool                                  is_error{false};
};

// One tab's state. Fields are guarded by the record's own mutex; the store's
// map lock is never held while a record is being modified.
class Session {
public:
    Session(std::string id, std::string directory);

    Session(Session const&)                    = delete;
    auto operator=(Session const&) -> Session& = delete;

    auto id() const -> std::string const& { return id_; }
    auto current_directory() const -> std::string;
    auto history() const -> std::vector<std::string>;
    auto transcript() const -> std::vector<TranscriptEntry>;
    // True while at least one client channel is open.
    auto attached() const -> bool;
    auto channel_count() const -> std::size_t;

    // Held by the dispatcher for the full duration of one command.
    auto execution_mutex() -> std::mutex& { return execution_mutex_; }

private:
    friend class SessionStore;
    using SteadyClock = std::chrono::steady_clock;

    std::string const                       id_;
    mutable std::mutex                      mutex_;
    std::mutex                              execution_mutex_;
    std::string                             directory_;
    std::deque<std::string>                 history_;
    std::deque<TranscriptEntry>             transcript_;
    std::size_t                             channels_{0};
    std::size_t                             running_commands_{0};
    SteadyClock::time_point                 last_active_;
};

class SessionStore {
public:
    using SessionPtr = std::shared_ptr<Session>;

    explicit SessionStore(SessionConfig config);

    auto get_or_create(std::string const& id) -> SessionPtr;
    auto find(std::string const& id) const -> SessionPtr;
    auto contains(std::string const& id) const -> bool;

    auto append_history(std::string const& id, std::string raw_command) -> Expected<void>;
    auto update_directory(std::string const& id, std::string directory) -> Expected<void>;
    auto record_output(std::string const& id, std::string command, std::string output, bool is_error)
        -> Expected<void>;

    // Oldest first; empty for an unknown id.
    auto history(std::string const& id) const -> std::vector<std::string>;
    auto clear_history(std::string const& id) -> Expected<void>;
    auto transcript(std::string const& id) const -> std::vector<TranscriptEntry>;
    // Every session's transcript merged by timestamp.
    auto all_transcripts() const -> std::vector<TranscriptEntry>;
    auto search_transcript(std::string const& id, std::string_view query) const -> std::vector<TranscriptEntry>;

    auto remove(std::string const& id) -> bool;

    // Channel bookkeeping for the liveness window. Every attach is paired
    // with one release.
    auto attach(std::string const& id) -> SessionPtr;
    // Returns true when this was the last channel and the session was removed right away.
    auto release(std::string const& id) -> bool;
    // Brackets one command; a session is never reaped while a command runs.
    auto begin_command(std::string const& id) -> SessionPtr;
    auto finish_command(std::string const& id) -> void;
    auto reap_expired(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now())
        -> std::vector<std::string>;

    auto size() const -> std::size_t;
    auto ids() const -> std::vector<std::string>;
    auto config() const -> SessionConfig const& { return config_; }

    static auto generate_session_id() -> std::string;

private:
    auto lookup(std::string const& id) const -> Expected<SessionPtr>;
    auto find_or_insert_locked(std::string const& id) -> SessionPtr;

    SessionConfig                               config_;
    mutable std::shared_mutex                   mutex_;
    std::unordered_map<std::string, SessionPtr> sessions_;
};

} // namespace TS::Shell
