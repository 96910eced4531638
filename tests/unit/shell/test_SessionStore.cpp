#include <tabshell/shell/SessionStore.hpp>

#include <doctest/doctest.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace TS;
using namespace TS::Shell;
using namespace std::chrono_literals;

namespace {

auto make_config() -> SessionConfig {
    SessionConfig config;
    config.default_directory = "/work";
    config.history_limit     = 3;
    config.transcript_limit  = 4;
    return config;
}

} // namespace

TEST_SUITE("shell.session") {
    TEST_CASE("Sessions start in the default directory") {
        SessionStore store{make_config()};
        CHECK(store.size() == 0);
        CHECK_FALSE(store.contains("tab-1"));
        CHECK(store.find("tab-1") == nullptr);

        auto session = store.get_or_create("tab-1");
        REQUIRE(session != nullptr);
        CHECK(session->id() == "tab-1");
        CHECK(session->current_directory() == "/work");
        CHECK(session->history().empty());
        CHECK_FALSE(session->attached());

        CHECK(store.get_or_create("tab-1") == session);
        CHECK(store.size() == 1);

        store.get_or_create("tab-0");
        CHECK(store.ids() == std::vector<std::string>{"tab-0", "tab-1"});
    }

    TEST_CASE("Unknown sessions report not found") {
        SessionStore store{make_config()};
        auto         appended = store.append_history("ghost", "ls");
        REQUIRE_FALSE(appended.has_value());
        CHECK(appended.error().code == Error::Code::NotFound);
        CHECK_FALSE(store.update_directory("ghost", "/tmp").has_value());
        CHECK_FALSE(store.record_output("ghost", "ls", "", false).has_value());
        CHECK_FALSE(store.clear_history("ghost").has_value());
        CHECK(store.history("ghost").empty());
        CHECK(store.transcript("ghost").empty());
        CHECK_FALSE(store.remove("ghost"));
    }

    TEST_CASE("History is bounded and collapses consecutive duplicates") {
        SessionStore store{make_config()};
        store.get_or_create("t");
        for (auto command : {"ls", "ls", "pwd", "ls", "cd docs", "cat a"}) {
            REQUIRE(store.append_history("t", command).has_value());
        }
        CHECK(store.history("t") == std::vector<std::string>{"ls", "cd docs", "cat a"});
    }

    TEST_CASE("Duplicates are kept when collapsing is off") {
        auto config                = make_config();
        config.collapse_duplicates = false;
        SessionStore store{config};
        store.get_or_create("t");
        REQUIRE(store.append_history("t", "ls").has_value());
        REQUIRE(store.append_history("t", "ls").has_value());
        CHECK(store.history("t") == std::vector<std::string>{"ls", "ls"});
    }

    TEST_CASE("Directory updates are per session") {
        SessionStore store{make_config()};
        auto         a = store.get_or_create("a");
        auto         b = store.get_or_create("b");
        REQUIRE(store.update_directory("a", "/work/docs").has_value());
        CHECK(a->current_directory() == "/work/docs");
        CHECK(b->current_directory() == "/work");
    }

    TEST_CASE("Transcript records and trims output") {
        SessionStore store{make_config()};
        store.get_or_create("t");
        for (int i = 0; i < 6; ++i) {
            REQUIRE(store.record_output("t", "echo " + std::to_string(i), std::to_string(i), i == 5).has_value());
        }
        auto entries = store.transcript("t");
        REQUIRE(entries.size() == 4);
        CHECK(entries.front().command == "echo 2");
        CHECK(entries.back().command == "echo 5");
        CHECK(entries.back().is_error);
        CHECK(entries.back().tab_id == "t");
        CHECK(std::is_sorted(entries.begin(), entries.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.timestamp < rhs.timestamp;
        }));
    }

    TEST_CASE("Transcript search matches command or output, ignoring case") {
        SessionStore store{make_config()};
        store.get_or_create("t");
        REQUIRE(store.record_output("t", "cat README", "Hello World", false).has_value());
        REQUIRE(store.record_output("t", "ls", "src  docs", false).has_value());
        REQUIRE(store.record_output("t", "pwd", "/work", false).has_value());

        auto hello = store.search_transcript("t", "hello");
        REQUIRE(hello.size() == 1);
        CHECK(hello.front().command == "cat README");

        auto readme = store.search_transcript("t", "readme");
        CHECK(readme.size() == 1);

        CHECK(store.search_transcript("t", "").size() == 3);
        CHECK(store.search_transcript("t", "nothing").empty());
    }

    TEST_CASE("Clearing history also clears the transcript") {
        SessionStore store{make_config()};
        store.get_or_create("t");
        REQUIRE(store.append_history("t", "ls").has_value());
        REQUIRE(store.record_output("t", "ls", "a", false).has_value());
        REQUIRE(store.clear_history("t").has_value());
        CHECK(store.history("t").empty());
        CHECK(store.transcript("t").empty());
    }

    TEST_CASE("all_transcripts merges sessions by time") {
        SessionStore store{make_config()};
        store.get_or_create("a");
        store.get_or_create("b");
        REQUIRE(store.record_output("a", "first", "", false).has_value());
        std::this_thread::sleep_for(2ms);
        REQUIRE(store.record_output("b", "second", "", false).has_value());
        std::this_thread::sleep_for(2ms);
        REQUIRE(store.record_output("a", "third", "", false).has_value());

        auto merged = store.all_transcripts();
        REQUIRE(merged.size() == 3);
        CHECK(merged[0].command == "first");
        CHECK(merged[1].command == "second");
        CHECK(merged[1].tab_id == "b");
        CHECK(merged[2].command == "third");
    }

    TEST_CASE("Released sessions survive the liveness window") {
        SessionStore store{make_config()};
        auto         session = store.attach("t");
        CHECK(session->attached());

        CHECK_FALSE(store.release("t"));
        CHECK_FALSE(session->attached());
        CHECK(store.contains("t"));

        auto const now = std::chrono::steady_clock::now();
        CHECK(store.reap_expired(now + 5s).empty());
        CHECK(store.reap_expired(now + 31s) == std::vector<std::string>{"t"});
        CHECK_FALSE(store.contains("t"));
    }

    TEST_CASE("Reattaching cancels expiry") {
        SessionStore store{make_config()};
        store.attach("t");
        store.release("t");
        store.attach("t");
        CHECK(store.reap_expired(std::chrono::steady_clock::now() + 1h).empty());
        CHECK(store.contains("t"));
    }

    TEST_CASE("Sessions that were never attached expire after inactivity") {
        SessionStore store{make_config()};
        auto const   created = std::chrono::steady_clock::now();
        store.get_or_create("api-only");

        CHECK(store.reap_expired(created + 5s).empty());
        CHECK(store.reap_expired(created + 31s) == std::vector<std::string>{"api-only"});
        CHECK_FALSE(store.contains("api-only"));
    }

    TEST_CASE("Commands keep a session alive") {
        SessionStore store{make_config()};
        store.begin_command("busy");
        CHECK(store.contains("busy"));

        // Never reaped while its command runs, however long that takes.
        CHECK(store.reap_expired(std::chrono::steady_clock::now() + 24h).empty());

        store.finish_command("busy");
        auto const finished = std::chrono::steady_clock::now();
        CHECK(store.reap_expired(finished + 5s).empty());
        CHECK(store.reap_expired(finished + 31s) == std::vector<std::string>{"busy"});

        store.finish_command("busy");
        CHECK_FALSE(store.contains("busy"));
    }

    TEST_CASE("Each attach is paired with one release") {
        SessionStore store{make_config()};
        auto         session = store.attach("t");
        store.attach("t");
        CHECK(session->channel_count() == 2);

        CHECK_FALSE(store.release("t"));
        CHECK(session->attached());
        CHECK(store.reap_expired(std::chrono::steady_clock::now() + 1h).empty());

        CHECK_FALSE(store.release("t"));
        CHECK_FALSE(session->attached());
        CHECK_FALSE(store.release("t"));
        CHECK(session->channel_count() == 0);
    }

    TEST_CASE("A late release does not detach a newer channel") {
        auto config            = make_config();
        config.liveness_window = 0s;
        SessionStore store{config};
        store.attach("t");

        // A new channel attaches before the old one's release lands.
        store.attach("t");
        CHECK_FALSE(store.release("t"));
        CHECK(store.contains("t"));
        CHECK(store.find("t")->attached());

        CHECK(store.release("t"));
        CHECK_FALSE(store.contains("t"));
    }

    TEST_CASE("Concurrent attach and release keep the count balanced") {
        SessionStore             store{make_config()};
        auto                     session = store.attach("t");
        std::vector<std::thread> workers;
        for (int w = 0; w < 4; ++w) {
            workers.emplace_back([&store] {
                for (int i = 0; i < 500; ++i) {
                    store.attach("t");
                    store.release("t");
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        CHECK(session->channel_count() == 1);
        CHECK(store.reap_expired(std::chrono::steady_clock::now() + 1h).empty());
    }

    TEST_CASE("A zero liveness window drops sessions on release") {
        auto config            = make_config();
        config.liveness_window = 0s;
        SessionStore store{config};
        store.attach("t");
        CHECK(store.release("t"));
        CHECK_FALSE(store.contains("t"));
        CHECK_FALSE(store.release("t"));
    }

    TEST_CASE("Generated session ids are long random hex") {
        std::set<std::string> seen;
        for (int i = 0; i < 32; ++i) {
            auto id = SessionStore::generate_session_id();
            CHECK(id.size() == 64);
            CHECK(std::all_of(id.begin(), id.end(), [](unsigned char ch) { return std::isxdigit(ch) != 0; }));
            seen.insert(id);
        }
        CHECK(seen.size() == 32);
    }

    TEST_CASE("Concurrent writers on different sessions") {
        auto config          = make_config();
        config.history_limit = 1000;
        config.collapse_duplicates = false;
        SessionStore             store{config};
        std::vector<std::thread> writers;
        for (int w = 0; w < 4; ++w) {
            writers.emplace_back([&store, w] {
                auto const id = "tab-" + std::to_string(w);
                store.get_or_create(id);
                for (int i = 0; i < 200; ++i) {
                    (void)store.append_history(id, "echo " + std::to_string(i));
                }
            });
        }
        for (auto& writer : writers) {
            writer.join();
        }
        CHECK(store.size() == 4);
        for (int w = 0; w < 4; ++w) {
            CHECK(store.history("tab-" + std::to_string(w)).size() == 200);
        }
    }
}
