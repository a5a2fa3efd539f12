#include <catch2/catch_test_macros.hpp>

#include "call_core/peek/connectivity.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using call_core::peek::ConnectivityMonitor;

TEST_CASE("online monitor does not block") {
    ConnectivityMonitor monitor;
    REQUIRE(monitor.is_online());
    REQUIRE(monitor.wait_online());
}

TEST_CASE("waiters resume when the network comes back") {
    ConnectivityMonitor monitor(false);
    std::atomic<bool> result{false};

    std::thread waiter([&]() { result = monitor.wait_online(); });
    monitor.set_online(true);
    waiter.join();

    REQUIRE(result);
    REQUIRE(monitor.is_online());
}

TEST_CASE("shutdown releases waiters without going online") {
    ConnectivityMonitor monitor(false);
    std::atomic<bool> result{true};

    std::thread waiter([&]() { result = monitor.wait_online(); });
    monitor.shutdown();
    waiter.join();

    REQUIRE_FALSE(result);
    REQUIRE(monitor.is_shutdown());
    REQUIRE_FALSE(monitor.is_online());
}

TEST_CASE("shutdown cuts a sleep short") {
    ConnectivityMonitor monitor;
    REQUIRE(monitor.sleep_for(std::chrono::milliseconds(1)));

    std::atomic<bool> result{true};
    const auto started = std::chrono::steady_clock::now();
    std::thread sleeper([&]() { result = monitor.sleep_for(std::chrono::seconds(30)); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    monitor.shutdown();
    sleeper.join();

    REQUIRE_FALSE(result);
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    REQUIRE_FALSE(monitor.sleep_for(std::chrono::seconds(30)));
}
