#include <catch2/catch_test_macros.hpp>

#include "call_core/peek/latest_queue.hpp"
#include "fakes.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using call_core::peek::LatestQueue;
using call_core::testing::ManualExecutor;

TEST_CASE("latest queue runs a single task once") {
    ManualExecutor executor;
    auto queue = std::make_shared<LatestQueue>(executor.executor());
    int runs = 0;

    REQUIRE(queue->add([&runs]() { ++runs; }));
    REQUIRE_FALSE(queue->idle());
    executor.run_all();

    REQUIRE(runs == 1);
    REQUIRE(queue->idle());
}

TEST_CASE("adds during a run collapse into one trailing run") {
    ManualExecutor executor;
    auto queue = std::make_shared<LatestQueue>(executor.executor());
    std::vector<std::string> order;

    queue->add([&]() {
        order.push_back("first");
        queue->add([&]() { order.push_back("second"); });
        queue->add([&]() { order.push_back("third"); });
        queue->add([&]() { order.push_back("latest"); });
    });
    executor.run_all();

    REQUIRE(order == std::vector<std::string>{"first", "latest"});
}

TEST_CASE("only one drain is submitted while work is pending") {
    ManualExecutor executor;
    auto queue = std::make_shared<LatestQueue>(executor.executor());
    int runs = 0;

    queue->add([&runs]() { ++runs; });
    queue->add([&runs]() { ++runs; });
    queue->add([&runs]() { ++runs; });

    REQUIRE(executor.pending() == 1);
    executor.run_all();
    REQUIRE(runs == 1);
}

TEST_CASE("idle callback fires after each drain") {
    ManualExecutor executor;
    auto queue = std::make_shared<LatestQueue>(executor.executor());
    int idle_calls = 0;
    queue->set_idle_callback([&idle_calls]() { ++idle_calls; });

    queue->add([]() {});
    executor.run_all();
    REQUIRE(idle_calls == 1);

    queue->add([]() {});
    executor.run_all();
    REQUIRE(idle_calls == 2);
}

TEST_CASE("a failing task does not stop the queue") {
    ManualExecutor executor;
    auto queue = std::make_shared<LatestQueue>(executor.executor());
    bool ran_after = false;

    queue->add([&]() {
        queue->add([&ran_after]() { ran_after = true; });
        throw std::runtime_error("boom");
    });
    executor.run_all();

    REQUIRE(ran_after);
    REQUIRE(queue->idle());
}

TEST_CASE("retired queue rejects new work") {
    ManualExecutor executor;
    auto queue = std::make_shared<LatestQueue>(executor.executor());

    queue->add([]() {});
    REQUIRE_FALSE(queue->try_retire());
    executor.run_all();

    REQUIRE(queue->try_retire());
    REQUIRE(queue->retired());
    REQUIRE_FALSE(queue->add([]() {}));
    REQUIRE(executor.pending() == 0);
}
