#include <catch2/catch_test_macros.hpp>

#include "call_core/server/rest_server.hpp"
#include "fakes.hpp"

#include <chrono>

using namespace call_core;
using call_core::peek::ConnectivityMonitor;
using call_core::peek::PeekCoordinator;
using call_core::testing::FakeCallingService;
using call_core::testing::ManualExecutor;
using call_core::testing::no_sleep;

namespace {

struct Fixture {
    Config config;
    CallStore store;
    FakeCallingService service;
    InMemoryConversationDirectory directory;
    ConnectivityMonitor connectivity;
    ManualExecutor executor;
    PeekCoordinator peeks{store, service, directory, connectivity,
                          executor.executor(), no_sleep(), std::chrono::milliseconds(0)};
    CallingCommands commands{store, service, peeks, directory, connectivity,
                             CommandOptions{"aci-me"}};
    RestServer server{config, store, commands, peeks};

    Fixture() {
        directory.upsert(ConversationInfo{"g1", CallMode::Group, 4, false, false});
    }
};

}

TEST_CASE("health reports the call count") {
    Fixture f;
    const auto response = f.server.health();
    REQUIRE(response.status == 200);
    REQUIRE(response.body["status"] == "ok");
    REQUIRE(response.body["calls"] == 0);
    REQUIRE(response.body["active_conversation_id"].is_null());
}

TEST_CASE("events are accepted and show up in the call list") {
    Fixture f;
    const auto accepted = f.server.handle_event(
        R"({"type":"incoming_group_call","conversation_id":"g1","ring_id":7,"ringer_aci":"r"})");
    REQUIRE(accepted.status == 202);

    const auto calls = f.server.list_calls();
    REQUIRE(calls.body["calls_by_conversation"]["g1"]["ring"]["ring_id"] == "7");

    const auto call = f.server.get_call("g1");
    REQUIRE(call.status == 200);
    REQUIRE(call.body["call"]["call_mode"] == "group");
    REQUIRE(f.server.get_call("missing").status == 404);
}

TEST_CASE("bad events are client errors") {
    Fixture f;
    REQUIRE(f.server.handle_event("{not json").status == 400);
    REQUIRE(f.server.handle_event(R"({"type":"mystery"})").status == 400);
    REQUIRE(f.server.handle_event(R"({"type":"incoming_group_call","conversation_id":"g1",)"
                                  R"("ring_id":"abc","ringer_aci":"r"})")
                .status == 400);
}

TEST_CASE("command outcomes map to status codes") {
    Fixture f;
    REQUIRE(f.server.handle_command("toggle_pip", "").status == 409);
    REQUIRE(f.server.handle_command("start_calling_lobby", R"({"conversation_id":"nope"})")
                .status == 409);
    REQUIRE(f.server.handle_command("no_such_command", "").status == 400);

    f.service.lobby = LobbyData{};
    f.service.lobby->call_mode = CallMode::Group;
    REQUIRE(f.server.handle_command("start_calling_lobby", R"({"conversation_id":"g1"})")
                .status == 200);
    REQUIRE(f.server.health().body["active_conversation_id"] == "g1");

    f.service.fail_next = true;
    REQUIRE(f.server.handle_command("hang_up", "").status == 502);
}
