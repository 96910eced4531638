#include "taskpool/TaskPool.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace TS;
using namespace std::chrono_literals;

// Reusable synchronization primitive for tests
class TestSync {
public:
    void wait() {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [this] { return completed; });
    }

    bool wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx);
        return cv.wait_for(lock, timeout, [this] { return completed; });
    }

    void notify() {
        std::lock_guard<std::mutex> lock(mtx);
        completed = true;
        cv.notify_all();
    }

private:
    std::mutex              mtx;
    std::condition_variable cv;
    bool                    completed = false;
};

TEST_SUITE("taskpool") {
TEST_CASE("Task TaskPool Suite") {
    SUBCASE("Basic task execution") {
        std::atomic<int> counter{0};
        TestSync         sync;
        TaskPool         pool(2);

        auto error = pool.addTask([&] {
            counter++;
            sync.notify();
        });
        CHECK_FALSE(error.has_value());
        CHECK(sync.wait_for(2s));
        CHECK(counter == 1);
    }

    SUBCASE("Shutdown drains queued tasks") {
        std::atomic<int> counter{0};
        {
            TaskPool pool(1);
            for (int i = 0; i < 50; ++i) {
                REQUIRE_FALSE(pool.addTask([&] {
                    std::this_thread::sleep_for(1ms);
                    counter++;
                }).has_value());
            }
            pool.shutdown();
        }
        CHECK(counter == 50);
    }

    SUBCASE("Tasks after shutdown are rejected") {
        TaskPool pool(1);
        pool.shutdown();
        auto error = pool.addTask([] {});
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::ChannelClosed);
        // Shutting down twice is harmless.
        pool.shutdown();
    }

    SUBCASE("Pool grows while every worker is busy") {
        std::mutex              gate_mutex;
        std::condition_variable gate_cv;
        bool                    open = false;
        std::atomic<int>        started{0};
        std::atomic<int>        finished{0};

        TaskPool pool(1, 4);
        CHECK(pool.size() == 1);
        CHECK(pool.maxSize() == 4);

        for (int i = 0; i < 4; ++i) {
            REQUIRE_FALSE(pool.addTask([&] {
                started++;
                std::unique_lock lock(gate_mutex);
                gate_cv.wait(lock, [&] { return open; });
                finished++;
            }).has_value());
        }

        auto const deadline = std::chrono::steady_clock::now() + 2s;
        while (started.load() < 4 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        CHECK(started == 4);
        CHECK(pool.size() == 4);

        {
            std::lock_guard lock(gate_mutex);
            open = true;
        }
        gate_cv.notify_all();
        pool.shutdown();
        CHECK(finished == 4);
    }

    SUBCASE("Pool never exceeds its cap") {
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        std::atomic<int> done{0};
        TaskPool         pool(1, 2);
        for (int i = 0; i < 20; ++i) {
            REQUIRE_FALSE(pool.addTask([&] {
                auto now = ++running;
                int  seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(2ms);
                --running;
                ++done;
            }).has_value());
        }
        pool.shutdown();
        CHECK(done == 20);
        CHECK(pool.size() == 0);
        CHECK(peak <= 2);
    }

    SUBCASE("A throwing job does not kill the worker") {
        TestSync sync;
        TaskPool pool(1);
        REQUIRE_FALSE(pool.addTask([] { throw std::runtime_error("boom"); }).has_value());
        REQUIRE_FALSE(pool.addTask([&] { sync.notify(); }).has_value());
        CHECK(sync.wait_for(2s));
    }

    SUBCASE("Many producers") {
        std::atomic<int>         counter{0};
        TaskPool                 pool(4, 8);
        std::vector<std::thread> producers;
        for (int p = 0; p < 4; ++p) {
            producers.emplace_back([&] {
                for (int i = 0; i < 100; ++i) {
                    (void)pool.addTask([&] { counter++; });
                }
            });
        }
        for (auto& producer : producers) {
            producer.join();
        }
        pool.shutdown();
        CHECK(counter == 400);
        CHECK(pool.pending() == 0);
    }
}
}
