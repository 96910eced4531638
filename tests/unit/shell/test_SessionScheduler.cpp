#include <tabshell/shell/SessionScheduler.hpp>

#include "taskpool/TaskPool.hpp"
#include "unit/TabShellTestHelper.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace TS;
using namespace TS::Shell;
using namespace std::chrono_literals;

namespace {

// Blocks jobs until released.
struct Gate {
    void wait() {
        std::unique_lock lock{mutex};
        cv.wait(lock, [this] { return open; });
    }
    void release() {
        {
            std::lock_guard lock{mutex};
            open = true;
        }
        cv.notify_all();
    }

    std::mutex              mutex;
    std::condition_variable cv;
    bool                    open = false;
};

} // namespace

TEST_SUITE("shell.scheduler") {
    TEST_CASE("Jobs for one session run in submission order, one at a time") {
        TaskPool         pool(4, 8);
        SessionScheduler scheduler{pool};

        std::mutex       order_mutex;
        std::vector<int> order;
        std::atomic<int> in_flight{0};
        std::atomic<int> max_in_flight{0};

        for (int i = 0; i < 50; ++i) {
            auto submitted = scheduler.submit("tab", [&, i] {
                auto now = ++in_flight;
                int  seen = max_in_flight.load();
                while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
                }
                {
                    std::lock_guard lock{order_mutex};
                    order.push_back(i);
                }
                --in_flight;
            });
            REQUIRE(submitted.has_value());
        }

        REQUIRE(scheduler.wait_idle(5s));
        REQUIRE(order.size() == 50);
        for (int i = 0; i < 50; ++i) {
            CHECK(order[static_cast<std::size_t>(i)] == i);
        }
        CHECK(max_in_flight == 1);
        CHECK(scheduler.lane_count() == 0);
    }

    TEST_CASE("Different sessions run in parallel") {
        TaskPool         pool(2, 4);
        SessionScheduler scheduler{pool};
        Gate             gate;
        std::atomic<int> started{0};

        REQUIRE(scheduler.submit("a", [&] {
            ++started;
            gate.wait();
        }).has_value());
        REQUIRE(scheduler.submit("b", [&] {
            ++started;
            gate.wait();
        }).has_value());

        CHECK(Test::wait_until([&] { return started.load() == 2; }));
        CHECK(scheduler.lane_count() == 2);
        CHECK(scheduler.pending("a") == 1);
        gate.release();
        CHECK(scheduler.wait_idle(5s));
    }

    TEST_CASE("A blocked session does not delay other sessions") {
        TaskPool         pool(1, 4);
        SessionScheduler scheduler{pool};
        Gate             gate;
        std::atomic<bool> other_ran{false};

        REQUIRE(scheduler.submit("slow", [&] { gate.wait(); }).has_value());
        REQUIRE(scheduler.submit("slow", [] {}).has_value());
        REQUIRE(scheduler.submit("fast", [&] { other_ran = true; }).has_value());

        CHECK(Test::wait_until([&] { return other_ran.load(); }));
        CHECK(scheduler.pending("slow") == 2);
        gate.release();
        CHECK(scheduler.wait_idle(5s));
    }

    TEST_CASE("drop discards jobs that have not started") {
        TaskPool         pool(2);
        SessionScheduler scheduler{pool};
        Gate             gate;
        std::atomic<int> ran{0};
        std::atomic<bool> first_started{false};

        REQUIRE(scheduler.submit("tab", [&] {
            first_started = true;
            gate.wait();
            ++ran;
        }).has_value());
        REQUIRE(Test::wait_until([&] { return first_started.load(); }));
        for (int i = 0; i < 3; ++i) {
            REQUIRE(scheduler.submit("tab", [&] { ++ran; }).has_value());
        }

        CHECK(scheduler.pending("tab") == 4);
        CHECK(scheduler.drop("tab") == 3);
        CHECK(scheduler.drop("unknown") == 0);
        gate.release();
        CHECK(scheduler.wait_idle(5s));
        CHECK(ran == 1);
        CHECK(scheduler.pending("tab") == 0);
    }

    TEST_CASE("Throwing jobs do not stall the lane") {
        TaskPool          pool(1);
        SessionScheduler  scheduler{pool};
        std::atomic<bool> after{false};
        REQUIRE(scheduler.submit("tab", [] { throw std::runtime_error("bad command"); }).has_value());
        REQUIRE(scheduler.submit("tab", [&] { after = true; }).has_value());
        CHECK(scheduler.wait_idle(5s));
        CHECK(after);
    }

    TEST_CASE("Rejected submissions") {
        TaskPool         pool(1);
        SessionScheduler scheduler{pool};

        auto empty = scheduler.submit("tab", {});
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code == Error::Code::InvalidArguments);

        scheduler.shutdown(1s);
        auto closed = scheduler.submit("tab", [] {});
        REQUIRE_FALSE(closed.has_value());
        CHECK(closed.error().code == Error::Code::ChannelClosed);
    }

    TEST_CASE("A closed pool surfaces as a closed channel") {
        TaskPool pool(1);
        pool.shutdown();
        SessionScheduler scheduler{pool};
        auto             submitted = scheduler.submit("tab", [] {});
        REQUIRE_FALSE(submitted.has_value());
        CHECK(submitted.error().code == Error::Code::ChannelClosed);
        CHECK(scheduler.lane_count() == 0);
    }
}
