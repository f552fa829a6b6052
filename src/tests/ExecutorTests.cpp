// SPDX-License-Identifier: Apache-2.0
#include <core/EventLoop.hpp>
#include <core/ThreadPool.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace scribe;
using namespace std::chrono_literals;

TEST_CASE("EventLoop runs tasks in posting order on the polling thread", "[executor]")
{
    auto loop = EventLoop();
    auto order = std::vector<int> {};
    auto threads = std::vector<std::thread::id> {};

    for (auto i = 0; i < 5; ++i)
        loop.post([&order, &threads, i] {
            order.push_back(i);
            threads.push_back(std::this_thread::get_id());
        });

    CHECK(loop.poll() == 5);
    CHECK(order == std::vector<int> { 0, 1, 2, 3, 4 });
    for (auto const& id: threads)
        CHECK(id == std::this_thread::get_id());

    CHECK(loop.poll() == 0);
}

TEST_CASE("EventLoop::run returns after stop and can be run again", "[executor]")
{
    auto loop = EventLoop();
    auto count = 0;

    loop.post([&count] { ++count; });
    loop.post([&loop] { loop.stop(); });
    loop.run();
    CHECK(count == 1);

    loop.post([&count] { ++count; });
    loop.post([&loop] { loop.stop(); });
    loop.run();
    CHECK(count == 2);
}

TEST_CASE("EventLoop::runOne waits for work posted from another thread", "[executor]")
{
    auto loop = EventLoop();
    auto ran = false;

    auto producer = std::jthread([&loop, &ran] {
        std::this_thread::sleep_for(20ms);
        loop.post([&ran] { ran = true; });
    });

    CHECK(loop.runOne(5s));
    CHECK(ran);
    CHECK(!loop.runOne(0ms));
}

TEST_CASE("ThreadPool runs every posted task off the calling thread", "[executor]")
{
    auto constexpr TaskCount = 50;
    auto remaining = std::atomic<int> { TaskCount };
    auto onCallingThread = std::atomic<bool> { false };
    auto done = std::promise<void>();
    auto const caller = std::this_thread::get_id();

    // Declared last so its workers are joined before the state above goes away.
    auto pool = ThreadPool(3);
    CHECK(pool.size() == 3);

    for (auto i = 0; i < TaskCount; ++i)
        pool.post([&] {
            if (std::this_thread::get_id() == caller)
                onCallingThread = true;
            if (--remaining == 0)
                done.set_value();
        });

    REQUIRE(done.get_future().wait_for(5s) == std::future_status::ready);
    CHECK(!onCallingThread);
}

TEST_CASE("ThreadPool with one worker is a serial queue", "[executor]")
{
    auto mutex = std::mutex {};
    auto order = std::vector<int> {};
    auto done = std::promise<void>();
    auto pool = ThreadPool(1);

    for (auto i = 0; i < 10; ++i)
        pool.post([&, i] {
            auto lock = std::lock_guard(mutex);
            order.push_back(i);
            if (i == 9)
                done.set_value();
        });

    REQUIRE(done.get_future().wait_for(5s) == std::future_status::ready);
    auto lock = std::lock_guard(mutex);
    CHECK(order == std::vector<int> { 0, 1, 2, 3, 4, 5, 6, 7, 8, 9 });
}

TEST_CASE("ThreadPool clamps the worker count to at least one", "[executor]")
{
    auto pool = ThreadPool(0);
    CHECK(pool.size() == 1);
}
