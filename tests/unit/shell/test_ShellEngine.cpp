#include <tabshell/shell/ShellEngine.hpp>

#include "unit/TabShellTestHelper.hpp"

#include <doctest/doctest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace TS;
using namespace TS::Shell;
using namespace std::chrono_literals;

namespace {

auto make_config(Test::TempDir const& root) -> EngineConfig {
    EngineConfig config;
    config.navigator.home_directory = root.str();
    config.navigator.sandbox_root   = root.str();
    config.min_workers              = 2;
    config.max_workers              = 4;
    config.sampler.interval         = 20ms;
    return config;
}

auto make_engine(EngineConfig config, LogHooks hooks = {}, std::unique_ptr<Test::FakeProcessRunner> runner = {})
    -> std::unique_ptr<ShellEngine> {
    if (!runner) {
        runner = std::make_unique<Test::FakeProcessRunner>();
    }
    return std::make_unique<ShellEngine>(std::move(config),
                                         std::move(hooks),
                                         std::move(runner),
                                         std::make_unique<Test::FakeHostProbe>());
}

// Holds a fake process invocation until the test lets it go.
class Gate {
public:
    auto wait() -> void {
        std::unique_lock lock{mutex_};
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
    }

    auto wait_entered(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock lock{mutex_};
        return cv_.wait_for(lock, timeout, [this] { return entered_; });
    }

    auto open() -> void {
        std::lock_guard lock{mutex_};
        open_ = true;
        cv_.notify_all();
    }

private:
    std::mutex              mutex_;
    std::condition_variable cv_;
    bool                    entered_{false};
    bool                    open_{false};
};

} // namespace

TEST_SUITE("shell.engine") {
    TEST_CASE("Sessions start in the home directory") {
        Test::TempDir root;
        auto          engine = make_engine(make_config(root));
        auto          events = engine->submit_and_wait("tab", "pwd", 5s);
        REQUIRE(events.has_value());
        REQUIRE(events->size() == 1);
        CHECK(events->front().text == root.str());
        CHECK(engine->store().contains("tab"));
    }

    TEST_CASE("Opening sessions") {
        Test::TempDir root;
        auto          engine = make_engine(make_config(root));

        auto named = engine->open_session("tab");
        CHECK(named->id() == "tab");
        CHECK(engine->open_session("tab") == named);

        auto generated = engine->open_session("");
        CHECK(generated->id().size() == 64);
        CHECK(engine->store().size() == 2);
    }

    TEST_CASE("Events reach the session's channels") {
        Test::TempDir root;
        auto          engine  = make_engine(make_config(root));
        auto          channel = std::make_shared<Test::RecordingChannel>("tab");
        auto          other   = std::make_shared<Test::RecordingChannel>("elsewhere");
        engine->connect(channel);
        engine->connect(other);

        root.mkdir("docs");
        REQUIRE(engine->submit_and_wait("tab", "echo hi", 5s).has_value());
        REQUIRE(engine->submit_and_wait("tab", "cd docs", 5s).has_value());

        auto outputs = channel->events_named("output");
        REQUIRE(outputs.size() == 1);
        CHECK(outputs.front().payload["output"] == "hi");
        CHECK(outputs.front().payload["tab_id"] == "tab");

        auto changes = channel->events_named("directory_change");
        REQUIRE(changes.size() == 1);
        CHECK(changes.front().payload["directory"] == (root / "docs").string());
        CHECK(other->events().empty());
    }

    TEST_CASE("Commands for one session complete in order") {
        Test::TempDir root;
        auto          engine = make_engine(make_config(root));

        std::mutex               mutex;
        std::vector<std::string> seen;
        for (int i = 0; i < 20; ++i) {
            auto queued = engine->submit("tab", "echo " + std::to_string(i), [&](std::vector<OutputEvent> const& events) {
                std::lock_guard lock{mutex};
                seen.push_back(events.empty() ? std::string{} : events.front().text);
            });
            REQUIRE(queued.has_value());
        }
        REQUIRE(engine->scheduler().wait_idle(5s));
        std::lock_guard lock{mutex};
        REQUIRE(seen.size() == 20);
        for (int i = 0; i < 20; ++i) {
            CHECK(seen[static_cast<std::size_t>(i)] == std::to_string(i));
        }
    }

    TEST_CASE("A queued cd is visible to the next queued command") {
        Test::TempDir root;
        root.mkdir("sub");
        auto engine = make_engine(make_config(root));

        std::mutex  mutex;
        std::string pwd_output;
        REQUIRE(engine->submit("tab", "cd sub").has_value());
        REQUIRE(engine->submit("tab", "pwd", [&](std::vector<OutputEvent> const& events) {
                          std::lock_guard lock{mutex};
                          pwd_output = events.empty() ? std::string{} : events.back().text;
                      })
                    .has_value());
        REQUIRE(engine->scheduler().wait_idle(5s));

        std::lock_guard lock{mutex};
        CHECK(pwd_output == (root / "sub").string());
        CHECK(engine->store().history("tab") == std::vector<std::string>{"cd sub", "pwd"});
    }

    TEST_CASE("Sessions changing directory concurrently stay independent") {
        Test::TempDir root;
        root.mkdir("alpha");
        root.mkdir("beta");
        auto engine = make_engine(make_config(root));

        std::atomic<int> mismatches{0};
        std::atomic<int> failures{0};
        auto             walk = [&](std::string const& tab, std::string const& dir) {
            auto const expected = (root / dir).string();
            for (int i = 0; i < 25; ++i) {
                auto entered = engine->submit_and_wait(tab, "cd " + expected, 5s);
                auto where   = engine->submit_and_wait(tab, "pwd", 5s);
                auto left    = engine->submit_and_wait(tab, "cd ..", 5s);
                if (!entered || !where || !left || where->empty()) {
                    ++failures;
                    continue;
                }
                if (where->back().text != expected) {
                    ++mismatches;
                }
            }
        };

        std::thread first{walk, "a", "alpha"};
        std::thread second{walk, "b", "beta"};
        first.join();
        second.join();

        CHECK(failures == 0);
        CHECK(mismatches == 0);
        CHECK(engine->store().find("a")->current_directory() == root.str());
        CHECK(engine->store().find("b")->current_directory() == root.str());
    }

    TEST_CASE("A channel closed mid-command misses later broadcasts") {
        Test::TempDir root;
        root.mkdir("docs");
        Gate gate;
        auto runner     = std::make_unique<Test::FakeProcessRunner>();
        runner->respond = [&](Test::ProcessCall const& call) -> Expected<ProcessResult> {
            if (call.name == "block") {
                gate.wait();
            }
            ProcessResult result;
            result.stdout_data = call.name + "\n";
            return result;
        };
        auto engine = make_engine(make_config(root), {}, std::move(runner));

        auto leaving    = std::make_shared<Test::RecordingChannel>("a");
        auto watching   = std::make_shared<Test::RecordingChannel>("b");
        auto leaving_id = engine->connect(leaving);
        engine->connect(watching);
        REQUIRE(engine->submit_and_wait("b", "cd docs", 5s).has_value());
        auto const b_history = engine->store().history("b");

        REQUIRE(engine->submit("a", "block").has_value());
        REQUIRE(gate.wait_entered(5s));
        CHECK(engine->disconnect(leaving_id));
        CHECK(leaving->closed());

        engine->on_metrics_tick(engine->sampler().sample());
        gate.open();
        REQUIRE(engine->scheduler().wait_idle(5s));

        CHECK(leaving->events_named("system_info").empty());
        CHECK(leaving->events_named("output").empty());
        CHECK(watching->events_named("system_info").size() == 1);

        // The running command still finished and was recorded for its session.
        REQUIRE(engine->store().contains("a"));
        CHECK(engine->store().history("a") == std::vector<std::string>{"block"});

        CHECK(engine->store().find("b")->current_directory() == (root / "docs").string());
        CHECK(engine->store().history("b") == b_history);
        CHECK(engine->store().find("b")->attached());
    }

    TEST_CASE("Sessions without a channel expire once idle") {
        Test::TempDir root;
        root.write("notes.txt", "x");
        auto config                    = make_config(root);
        config.session.liveness_window = 1s;
        auto engine                    = make_engine(config);

        REQUIRE(engine->submit_and_wait("rest", "pwd", 5s).has_value());
        CHECK(engine->store().contains("rest"));

        // Completion alone never creates a session.
        CHECK(engine->autocomplete("ghost", "cat n") == std::vector<std::string>{"notes.txt"});
        CHECK_FALSE(engine->store().contains("ghost"));

        engine->on_metrics_tick(engine->sampler().sample());
        CHECK(engine->store().contains("rest"));

        std::this_thread::sleep_for(1100ms);
        engine->on_metrics_tick(engine->sampler().sample());
        CHECK_FALSE(engine->store().contains("rest"));
    }

    TEST_CASE("A channel opening during a release keeps its session attached") {
        Test::TempDir root;
        auto          config           = make_config(root);
        config.session.liveness_window = 0s;
        auto engine                    = make_engine(config);

        auto old_channel = engine->connect(std::make_shared<Test::RecordingChannel>("tab"));
        auto new_channel = engine->connect(std::make_shared<Test::RecordingChannel>("tab"));
        CHECK(engine->disconnect(old_channel));
        REQUIRE(engine->store().contains("tab"));
        CHECK(engine->store().find("tab")->attached());

        engine->on_metrics_tick(engine->sampler().sample());
        CHECK(engine->store().contains("tab"));
        CHECK(engine->disconnect(new_channel));
        CHECK_FALSE(engine->store().contains("tab"));
    }

    TEST_CASE("Autocomplete follows the session directory") {
        Test::TempDir root;
        root.write("docs/readme.md", "x");
        root.write("notes.txt", "x");
        auto engine = make_engine(make_config(root));

        CHECK(engine->autocomplete("tab", "cat n") == std::vector<std::string>{"notes.txt"});
        REQUIRE(engine->submit_and_wait("tab", "cd docs", 5s).has_value());
        CHECK(engine->autocomplete("tab", "cat r") == std::vector<std::string>{"readme.md"});
        CHECK(engine->autocomplete("tab", "cat n").empty());
    }

    TEST_CASE("Closing a session closes its channels and forgets it") {
        Test::TempDir root;
        auto          engine  = make_engine(make_config(root));
        auto          channel = std::make_shared<Test::RecordingChannel>("tab");
        engine->connect(channel);
        REQUIRE(engine->submit_and_wait("tab", "pwd", 5s).has_value());

        CHECK(engine->close_session("tab"));
        CHECK(channel->closed());
        CHECK_FALSE(engine->store().contains("tab"));
        CHECK_FALSE(engine->hub().has_channel("tab"));
        CHECK_FALSE(engine->close_session("tab"));
    }

    TEST_CASE("The last disconnect releases the session") {
        Test::TempDir root;
        auto          config            = make_config(root);
        config.session.liveness_window  = 0s;
        auto          engine            = make_engine(config);

        auto first  = engine->connect(std::make_shared<Test::RecordingChannel>("tab"));
        auto second = engine->connect(std::make_shared<Test::RecordingChannel>("tab"));
        CHECK(engine->store().find("tab")->attached());

        CHECK(engine->disconnect(first));
        CHECK(engine->store().contains("tab"));
        CHECK(engine->disconnect(second));
        CHECK_FALSE(engine->store().contains("tab"));
    }

    TEST_CASE("A failing channel tears its session down") {
        Test::TempDir root;
        auto          config           = make_config(root);
        config.session.liveness_window = 0s;
        auto          engine           = make_engine(config);
        auto          channel          = std::make_shared<Test::RecordingChannel>("tab");
        channel->fail_after            = 0;
        engine->connect(channel);

        auto events = engine->submit_and_wait("tab", "pwd", 5s);
        REQUIRE(events.has_value());
        CHECK(events->size() == 1);
        CHECK(channel->closed());
        CHECK_FALSE(engine->store().contains("tab"));
    }

    TEST_CASE("Metrics ticks broadcast and reap idle sessions") {
        Test::TempDir root;
        auto          config           = make_config(root);
        config.session.liveness_window = 1s;

        std::mutex  log_mutex;
        std::string logged;
        LogHooks    hooks;
        hooks.info = [&](std::string_view message) {
            std::lock_guard lock{log_mutex};
            logged.append(message);
        };
        auto engine = make_engine(config, hooks);

        auto watcher = std::make_shared<Test::RecordingChannel>("watcher");
        engine->connect(watcher);
        auto idle = engine->connect(std::make_shared<Test::RecordingChannel>("idle"));
        CHECK(engine->disconnect(idle));
        CHECK(engine->store().contains("idle"));

        std::this_thread::sleep_for(1100ms);
        engine->on_metrics_tick(engine->sampler().sample());

        auto metrics = watcher->events_named("system_info");
        REQUIRE(metrics.size() == 1);
        CHECK(metrics.front().payload["process_count"] == 3);
        CHECK_FALSE(engine->store().contains("idle"));
        CHECK(engine->store().contains("watcher"));
        std::lock_guard lock{log_mutex};
        CHECK(logged.find("reaped idle session idle") != std::string::npos);
    }

    TEST_CASE("Started engines push metrics on their own") {
        Test::TempDir root;
        auto          engine  = make_engine(make_config(root));
        auto          channel = std::make_shared<Test::RecordingChannel>("tab");
        engine->connect(channel);
        engine->start();
        engine->start();
        CHECK(Test::wait_until([&] { return channel->events_named("system_info").size() >= 2; }));
        engine->stop();
    }

    TEST_CASE("A stopped engine refuses work") {
        Test::TempDir root;
        auto          engine = make_engine(make_config(root));
        engine->stop();
        auto queued = engine->submit("tab", "pwd");
        REQUIRE_FALSE(queued.has_value());
        CHECK(queued.error().code == Error::Code::ChannelClosed);

        auto waited = engine->submit_and_wait("tab", "pwd", 1s);
        REQUIRE_FALSE(waited.has_value());
        CHECK(waited.error().code == Error::Code::ChannelClosed);
    }
}
