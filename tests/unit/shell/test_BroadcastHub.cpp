#include <tabshell/shell/BroadcastHub.hpp>

#include "unit/TabShellTestHelper.hpp"

#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <vector>

using namespace TS;
using namespace TS::Shell;

TEST_SUITE("shell.hub") {
    TEST_CASE("Channels get increasing ids") {
        BroadcastHub hub;
        auto         first  = hub.connect(std::make_shared<Test::RecordingChannel>("a"));
        auto         second = hub.connect(std::make_shared<Test::RecordingChannel>("a"));
        CHECK(first == 1);
        CHECK(second == 2);
        CHECK(hub.channel_count() == 2);
        CHECK(hub.has_channel("a"));
        CHECK_FALSE(hub.has_channel("b"));
    }

    TEST_CASE("Broadcast reaches every channel") {
        BroadcastHub hub;
        auto         a = std::make_shared<Test::RecordingChannel>("a");
        auto         b = std::make_shared<Test::RecordingChannel>("b");
        hub.connect(a);
        hub.connect(b);

        CHECK(hub.broadcast("ping", nlohmann::json{{"n", 1}}) == 2);
        REQUIRE(a->events().size() == 1);
        CHECK(a->events().front().name == "ping");
        CHECK(a->events().front().payload["n"] == 1);
        CHECK(b->events().size() == 1);
    }

    TEST_CASE("Send targets one session") {
        BroadcastHub hub;
        auto         a = std::make_shared<Test::RecordingChannel>("a");
        auto         b = std::make_shared<Test::RecordingChannel>("b");
        hub.connect(a);
        hub.connect(b);

        auto sent = hub.send("a", "command_output", nlohmann::json{{"output", "hi"}});
        REQUIRE(sent.has_value());
        CHECK(*sent == 1);
        CHECK(a->events().size() == 1);
        CHECK(b->events().empty());

        auto missing = hub.send("nobody", "command_output", nlohmann::json::object());
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::ChannelClosed);
    }

    TEST_CASE("Failed delivery drops the channel and releases it") {
        std::string logged;
        LogHooks    hooks;
        hooks.info = [&](std::string_view message) { logged.append(message); };
        BroadcastHub hub{hooks};

        std::vector<std::string> released;
        hub.set_release_callback([&](std::string const& session) { released.push_back(session); });

        auto healthy = std::make_shared<Test::RecordingChannel>("ok");
        auto broken  = std::make_shared<Test::RecordingChannel>("gone");
        broken->fail_after = 0;
        hub.connect(healthy);
        hub.connect(broken);

        CHECK(hub.broadcast("ping", nlohmann::json::object()) == 1);
        CHECK(hub.channel_count() == 1);
        CHECK(broken->closed());
        CHECK_FALSE(healthy->closed());
        CHECK(released == std::vector<std::string>{"gone"});
        CHECK(logged.find("dropping channel for session gone") != std::string::npos);

        auto sent = hub.send("gone", "ping", nlohmann::json::object());
        REQUIRE_FALSE(sent.has_value());
        CHECK(sent.error().code == Error::Code::ChannelClosed);
    }

    TEST_CASE("Send fails when every channel of the session fails") {
        BroadcastHub hub;
        auto         broken = std::make_shared<Test::RecordingChannel>("t");
        broken->fail_after  = 0;
        hub.connect(broken);
        auto sent = hub.send("t", "ping", nlohmann::json::object());
        REQUIRE_FALSE(sent.has_value());
        CHECK(sent.error().code == Error::Code::ChannelClosed);
        CHECK(hub.channel_count() == 0);
    }

    TEST_CASE("Every client-side close releases its channel once") {
        BroadcastHub             hub;
        std::vector<std::string> released;
        hub.set_release_callback([&](std::string const& session) { released.push_back(session); });

        auto first  = hub.connect(std::make_shared<Test::RecordingChannel>("t"));
        auto second = hub.connect(std::make_shared<Test::RecordingChannel>("t"));

        CHECK(hub.disconnect(first));
        CHECK(released == std::vector<std::string>{"t"});
        CHECK(hub.has_channel("t"));

        CHECK(hub.disconnect(second));
        CHECK(released == std::vector<std::string>{"t", "t"});
        CHECK_FALSE(hub.has_channel("t"));
        CHECK_FALSE(hub.disconnect(second));
        CHECK_FALSE(hub.disconnect(1234));
        CHECK(released.size() == 2);
    }

    TEST_CASE("Server-side session disconnect closes channels without releasing them") {
        BroadcastHub hub;
        int          releases = 0;
        hub.set_release_callback([&](std::string const&) { ++releases; });

        auto one   = std::make_shared<Test::RecordingChannel>("t");
        auto two   = std::make_shared<Test::RecordingChannel>("t");
        auto other = std::make_shared<Test::RecordingChannel>("u");
        hub.connect(one);
        hub.connect(two);
        hub.connect(other);

        CHECK(hub.disconnect_session("t") == 2);
        CHECK(one->closed());
        CHECK(two->closed());
        CHECK_FALSE(other->closed());
        CHECK(hub.channel_count() == 1);
        CHECK(releases == 0);
        CHECK(hub.disconnect_session("t") == 0);
    }

    TEST_CASE("Metrics are broadcast as system_info") {
        MetricsSampler sampler{std::make_unique<Test::FakeHostProbe>(), {}};
        auto const     snapshot = sampler.sample();

        auto const payload = BroadcastHub::metrics_payload(snapshot);
        CHECK(payload["cpu"]["percent"].get<double>() == doctest::Approx(25.0));
        CHECK(payload["cpu"]["per_core"].size() == 2);
        CHECK(payload["memory"]["percent"].get<double>() == doctest::Approx(25.0));
        CHECK(payload["memory"]["total"].get<std::uint64_t>() == 8ULL * 1024 * 1024 * 1024);
        CHECK(payload["process_count"] == 3);
        CHECK(payload["stale"] == false);
        CHECK(payload["timestamp"].get<std::string>().ends_with("Z"));

        BroadcastHub hub;
        auto         channel = std::make_shared<Test::RecordingChannel>("t");
        hub.connect(channel);
        CHECK(hub.broadcast_metrics(snapshot) == 1);
        auto events = channel->events_named("system_info");
        REQUIRE(events.size() == 1);
        CHECK(events.front().payload == payload);
    }
}
