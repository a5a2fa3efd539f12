#include <catch2/catch_test_macros.hpp>

#include "call_core/metrics.hpp"
#include "call_core/peek/peek_coordinator.hpp"
#include "fakes.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace call_core;
using call_core::peek::ConnectivityMonitor;
using call_core::peek::PeekCoordinator;
using call_core::testing::FakeCallingService;
using call_core::testing::ManualExecutor;
using call_core::testing::make_peek;
using call_core::testing::no_sleep;

namespace {

struct Fixture {
    CallStore store;
    FakeCallingService service;
    InMemoryConversationDirectory directory;
    ConnectivityMonitor connectivity;
    ManualExecutor executor;
    PeekCoordinator peeks{store, service, directory, connectivity,
                          executor.executor(), no_sleep(), std::chrono::milliseconds(0)};

    explicit Fixture(bool online = true) : connectivity(online) {
        Metrics::instance().reset();
        directory.upsert(ConversationInfo{"g1", CallMode::Group, 4, false, false});
        directory.upsert(ConversationInfo{"d1", CallMode::Direct, 2, false, false});
    }
};

GroupCallStateChange connecting(const ConversationId& id) {
    GroupCallStateChange event;
    event.conversation_id = id;
    event.connection_state = GroupConnectionState::Connecting;
    event.join_state = GroupJoinState::Joining;
    return event;
}

}

TEST_CASE("a peek updates the store and call history") {
    Fixture f;
    f.service.on_peek = [](const ConversationId&) { return make_peek({"a", "b"}); };

    REQUIRE(f.peeks.request("g1"));
    f.executor.run_all();

    REQUIRE(f.service.peeks == 1);
    REQUIRE(f.service.count("history:g1") == 1);
    REQUIRE_FALSE(f.service.last_history_join_state.has_value());
    const auto* call = find_group_call(*f.store.snapshot(), "g1");
    REQUIRE(call);
    REQUIRE(call->peek_info == make_peek({"a", "b"}));
    REQUIRE(f.peeks.pending_queues() == 0);
}

TEST_CASE("requests before the peek runs collapse into one") {
    Fixture f;
    f.peeks.request("g1");
    f.peeks.request("g1");
    f.peeks.request("g1");

    REQUIRE(f.peeks.pending_queues() == 1);
    f.executor.run_all();

    REQUIRE(f.service.peeks == 1);
    REQUIRE(Metrics::instance().peek_issued_total() == 1);
}

TEST_CASE("requests during a peek produce exactly one trailing peek") {
    Fixture f;
    f.service.on_peek = [&f](const ConversationId& id) {
        if (f.service.peeks == 1) {
            f.peeks.request(id);
            f.peeks.request(id);
            f.peeks.request(id);
        }
        return make_peek({"a"});
    };

    f.peeks.request("g1");
    f.executor.run_all();

    REQUIRE(f.service.peeks == 2);
    REQUIRE(f.peeks.pending_queues() == 0);
}

TEST_CASE("conversations are peeked independently") {
    Fixture f;
    f.directory.upsert(ConversationInfo{"g2", CallMode::Group, 3, false, false});

    f.peeks.request("g1");
    f.peeks.request("g2");
    REQUIRE(f.peeks.pending_queues() == 2);
    f.executor.run_all();

    REQUIRE(f.service.count("peek:g1") == 1);
    REQUIRE(f.service.count("peek:g2") == 1);
}

TEST_CASE("non-group conversations are not peeked") {
    Fixture f;
    REQUIRE_FALSE(f.peeks.request("d1"));
    REQUIRE_FALSE(f.peeks.request("unknown"));
    REQUIRE(f.executor.pending() == 0);
}

TEST_CASE("a group known only to the store can be peeked") {
    Fixture f;
    f.store.dispatch(PeekGroupCallFulfilled{"g9", make_peek({})});
    REQUIRE(f.peeks.request("g9"));
    f.executor.run_all();
    REQUIRE(f.service.count("peek:g9") == 1);
}

TEST_CASE("connected calls are not peeked") {
    Fixture f;
    f.store.dispatch(connecting("g1"));

    REQUIRE(peek::should_skip_peek(*f.store.snapshot(), "g1"));
    f.peeks.request("g1");
    f.executor.run_all();

    REQUIRE(f.service.peeks == 0);
    REQUIRE(f.peeks.pending_queues() == 0);
}

TEST_CASE("a call that connects during the debounce is not peeked") {
    CallStore store;
    FakeCallingService service;
    InMemoryConversationDirectory directory;
    directory.upsert(ConversationInfo{"g1", CallMode::Group, 4, false, false});
    ConnectivityMonitor connectivity;
    ManualExecutor executor;
    PeekCoordinator peeks(store, service, directory, connectivity, executor.executor(),
                          [&store](std::chrono::milliseconds) { store.dispatch(connecting("g1")); },
                          std::chrono::milliseconds(10));

    peeks.request("g1");
    executor.run_all();

    REQUIRE(service.peeks == 0);
}

TEST_CASE("a failed peek leaves the store untouched") {
    Fixture f;
    f.service.fail_next = true;
    const auto before = f.store.snapshot();

    f.peeks.request("g1");
    f.executor.run_all();

    REQUIRE(f.service.peeks == 1);
    REQUIRE(f.service.count("history:") == 0);
    REQUIRE(f.store.snapshot() == before);
    REQUIRE(f.peeks.pending_queues() == 0);

    f.peeks.request("g1");
    f.executor.run_all();
    REQUIRE(f.service.peeks == 2);
    REQUIRE(find_group_call(*f.store.snapshot(), "g1"));
}

TEST_CASE("a failed history update still applies the peek") {
    Fixture f;
    f.service.on_peek = [&f](const ConversationId&) {
        f.service.fail_next = true;
        return make_peek({"a"});
    };

    f.peeks.request("g1");
    f.executor.run_all();

    const auto* call = find_group_call(*f.store.snapshot(), "g1");
    REQUIRE(call);
    REQUIRE(call->peek_info == make_peek({"a"}));
}

TEST_CASE("scheduled refresh requests a peek after the delay") {
    Fixture f;
    f.peeks.schedule_refresh("g1", std::chrono::milliseconds(1000));
    REQUIRE(f.executor.pending() == 1);
    REQUIRE(f.service.peeks == 0);

    f.executor.run_all();
    REQUIRE(f.service.peeks == 1);
}

TEST_CASE("stopped coordinator issues no peeks") {
    Fixture f;
    f.peeks.request("g1");
    f.peeks.schedule_refresh("g1", std::chrono::milliseconds(0));
    f.peeks.stop();
    f.executor.run_all();

    REQUIRE(f.service.peeks == 0);
    REQUIRE(f.connectivity.is_shutdown());
}

TEST_CASE("first-time peek only runs when nothing is known") {
    Fixture f;
    REQUIRE(f.peeks.peek_for_the_first_time("g1"));
    f.executor.run_all();
    REQUIRE(f.service.peeks == 1);

    REQUIRE_FALSE(f.peeks.peek_for_the_first_time("g1"));
    f.executor.run_all();
    REQUIRE(f.service.peeks == 1);
}

TEST_CASE("member peek only runs when others are in a call we have not joined") {
    Fixture f;
    REQUIRE_FALSE(f.peeks.peek_if_it_has_members("g1"));

    f.store.dispatch(PeekGroupCallFulfilled{"g1", make_peek({})});
    REQUIRE_FALSE(f.peeks.peek_if_it_has_members("g1"));

    f.store.dispatch(PeekGroupCallFulfilled{"g1", make_peek({"a"})});
    REQUIRE(f.peeks.peek_if_it_has_members("g1"));
    f.executor.run_all();
    REQUIRE(f.service.peeks == 1);
}

TEST_CASE("peeks wait for the network to come back") {
    Fixture f(false);
    f.peeks.request("g1");

    std::thread runner([&f]() { f.executor.run_all(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(f.service.peeks == 0);

    f.connectivity.set_online(true);
    runner.join();
    REQUIRE(f.service.peeks == 1);
    REQUIRE(find_group_call(*f.store.snapshot(), "g1"));
}

TEST_CASE("stop waits for a peek that is already running") {
    CallStore store;
    FakeCallingService service;
    InMemoryConversationDirectory directory;
    directory.upsert(ConversationInfo{"g1", CallMode::Group, 4, false, false});
    ConnectivityMonitor connectivity;
    std::promise<void> entered;
    std::promise<void> release;
    auto released = release.get_future().share();
    service.on_peek = [&entered, released](const ConversationId&) {
        entered.set_value();
        released.wait();
        return make_peek({"a"});
    };
    PeekCoordinator peeks(store, service, directory, connectivity, utils::detached_executor(),
                          no_sleep(), std::chrono::milliseconds(0));

    peeks.request("g1");
    entered.get_future().wait();

    std::atomic<bool> stopped{false};
    std::thread stopper([&]() {
        peeks.stop();
        stopped = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE_FALSE(stopped);

    release.set_value();
    stopper.join();
    REQUIRE(stopped);
    REQUIRE(service.peeks == 1);
}

TEST_CASE("destroying a stopped coordinator with a pending refresh is safe") {
    CallStore store;
    FakeCallingService service;
    InMemoryConversationDirectory directory;
    directory.upsert(ConversationInfo{"g1", CallMode::Group, 4, false, false});
    ConnectivityMonitor connectivity;
    auto peeks = std::make_unique<PeekCoordinator>(store, service, directory, connectivity,
                                                   utils::detached_executor(),
                                                   connectivity.sleeper(),
                                                   std::chrono::milliseconds(100));

    peeks->schedule_refresh("g1", std::chrono::milliseconds(10000));
    peeks->request("g1");

    const auto started = std::chrono::steady_clock::now();
    peeks->stop();
    peeks.reset();
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    REQUIRE(service.peeks == 0);
}
