#include <catch2/catch_test_macros.hpp>

#include "call_core/commands/json_router.hpp"
#include "fakes.hpp"

#include <chrono>
#include <cstdint>
#include <variant>

using namespace call_core;
using call_core::peek::ConnectivityMonitor;
using call_core::peek::PeekCoordinator;
using call_core::testing::FakeCallingService;
using call_core::testing::ManualExecutor;
using call_core::testing::no_sleep;
using nlohmann::json;

namespace {

struct Fixture {
    CallStore store;
    FakeCallingService service;
    InMemoryConversationDirectory directory;
    ConnectivityMonitor connectivity;
    ManualExecutor executor;
    PeekCoordinator peeks{store, service, directory, connectivity,
                          executor.executor(), no_sleep(), std::chrono::milliseconds(0)};
    CallingCommands commands{store, service, peeks, directory, connectivity,
                             CommandOptions{"aci-me"}};

    Fixture() {
        directory.upsert(ConversationInfo{"g1", CallMode::Group, 4, false, false});
    }
};

}

TEST_CASE("incoming group ring accepts a string ring id") {
    Fixture f;
    route_event(f.commands, json{{"type", "incoming_group_call"},
                                 {"conversation_id", "g1"},
                                 {"ring_id", "9223372036854775807"},
                                 {"ringer_aci", "aci-ringer"}});

    const auto call = f.store.find_call("g1");
    REQUIRE(call);
    const auto& ring = std::get<GroupCall>(*call).ring;
    REQUIRE(ring);
    REQUIRE(ring->ring_id == INT64_MAX);
    REQUIRE(ring->ringer_aci == "aci-ringer");
}

TEST_CASE("direct call events flow through to the store") {
    Fixture f;
    route_event(f.commands, json{{"type", "incoming_direct_call"},
                                 {"conversation_id", "d1"},
                                 {"is_video_call", true}});
    route_event(f.commands, json{{"type", "call_state_change"},
                                 {"conversation_id", "d1"},
                                 {"call_state", "ringing"}});

    auto call = std::get<DirectCall>(*f.store.find_call("d1"));
    REQUIRE(call.call_state == DirectCallState::Ringing);
    REQUIRE(call.is_video_call);

    route_event(f.commands, json{{"type", "call_state_change"},
                                 {"conversation_id", "d1"},
                                 {"call_state", "ended"},
                                 {"call_ended_reason", "remote_hangup"}});
    REQUIRE_FALSE(f.store.find_call("d1"));
}

TEST_CASE("membership changes request a peek") {
    Fixture f;
    route_event(f.commands, json{{"type", "group_call_membership_changed"},
                                 {"conversation_id", "g1"}});
    f.executor.run_all();
    REQUIRE(f.service.count("peek:g1") == 1);
}

TEST_CASE("conversation events update the directory") {
    Fixture f;
    route_event(f.commands,
                json{{"type", "conversation_changed"},
                     {"conversation", {{"id", "g2"}, {"call_mode", "group"}, {"member_count", 3}}}});
    REQUIRE(f.directory.find("g2"));

    route_event(f.commands, json{{"type", "conversation_removed"}, {"conversation_id", "g2"}});
    REQUIRE_FALSE(f.directory.find("g2"));

    route_event(f.commands, json{{"type", "network_status"}, {"online", false}});
    REQUIRE_FALSE(f.connectivity.is_online());
}

TEST_CASE("unknown events and commands are rejected") {
    Fixture f;
    REQUIRE_THROWS_AS(route_event(f.commands, json{{"type", "nope"}}), UnknownMessageError);
    REQUIRE_THROWS_AS(route_event(f.commands, json::array()), UnknownMessageError);
    REQUIRE_THROWS_AS(route_command(f.commands, "nope", json::object()), UnknownMessageError);
    REQUIRE_THROWS_AS(route_command(f.commands, "toggle_pip", json::array()),
                      UnknownMessageError);
}

TEST_CASE("malformed payloads raise json errors") {
    Fixture f;
    REQUIRE_THROWS_AS(route_event(f.commands, json{{"type", "incoming_direct_call"}}),
                      json::exception);
    REQUIRE_THROWS_AS(route_command(f.commands, "set_local_audio", json::object()),
                      json::exception);
}

TEST_CASE("commands return whether they applied") {
    Fixture f;
    REQUIRE_FALSE(route_command(f.commands, "toggle_pip", json()));

    f.directory.upsert(ConversationInfo{"d1", CallMode::Direct, 2, false, false});
    LobbyData lobby;
    lobby.call_mode = CallMode::Direct;
    f.service.lobby = lobby;
    REQUIRE_THROWS_AS(route_command(f.commands, "start_calling_lobby",
                                    json{{"conversation_id", "unknown"}}),
                      CommandError);
    REQUIRE(route_command(f.commands, "start_calling_lobby", json{{"conversation_id", "d1"}}));
    REQUIRE(route_command(f.commands, "toggle_pip", json::object()));
    REQUIRE(f.store.active_call_state()->pip);

    REQUIRE(route_command(f.commands, "set_presenting",
                          json{{"source", {{"id", "screen:1"}, {"name", "Screen"}}}}));
    REQUIRE(f.store.active_call_state()->presenting_source->id == "screen:1");

    REQUIRE(route_command(f.commands, "hang_up", json::object()));
    REQUIRE(f.service.count("hangup:d1") == 1);
    REQUIRE_FALSE(f.store.active_call_state());
}
