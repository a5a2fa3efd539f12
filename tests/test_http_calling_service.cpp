#include <catch2/catch_test_macros.hpp>

#include "call_core/model/json.hpp"
#include "call_core/service/http_calling_service.hpp"

using namespace call_core;
using nlohmann::json;

TEST_CASE("peek responses decode peek info") {
    const auto decoded = decode_peek_response(
        json{{"peek_info", {{"acis", {"a", "b"}}, {"era_id", "era"}, {"device_count", 3}}}});
    REQUIRE(decoded);
    REQUIRE(decoded->acis.size() == 2);
    REQUIRE(decoded->era_id == "era");
    REQUIRE(decoded->device_count == 3);
    REQUIRE(decoded->max_devices == kUnlimitedDevices);
}

TEST_CASE("peek responses without peek info decode to nothing") {
    REQUIRE_FALSE(decode_peek_response(json::object()));
    REQUIRE_FALSE(decode_peek_response(json{{"peek_info", nullptr}}));
}

TEST_CASE("malformed peek responses raise a service error") {
    REQUIRE_THROWS_AS(decode_peek_response(json{{"peek_info", "oops"}}), CallingServiceError);
    REQUIRE_THROWS_AS(decode_peek_response(json{{"peek_info", {{"acis", 5}}}}),
                      CallingServiceError);
    REQUIRE_THROWS_AS(decode_peek_response(json{{"peek_info", {{"device_count", -1}}}}),
                      CallingServiceError);
    REQUIRE_THROWS_AS(decode_peek_response(json::array()), CallingServiceError);
}

TEST_CASE("lobby responses decode lobby data") {
    REQUIRE_FALSE(decode_lobby_response(json::object()));
    REQUIRE_FALSE(decode_lobby_response(json()));

    const auto decoded = decode_lobby_response(
        json{{"call_mode", "group"},
             {"has_local_audio", true},
             {"join_state", "not_joined"},
             {"peek_info", {{"acis", {"a"}}}},
             {"remote_participants", {{{"aci", "a"}, {"demux_id", 7}}}}});
    REQUIRE(decoded);
    REQUIRE(decoded->call_mode == CallMode::Group);
    REQUIRE(decoded->has_local_audio);
    REQUIRE(decoded->peek_info);
    REQUIRE(decoded->peek_info->device_count == 1);
    REQUIRE(decoded->remote_participants.size() == 1);
    REQUIRE(decoded->remote_participants[0].demux_id == 7);
}

TEST_CASE("malformed lobby responses raise a service error") {
    REQUIRE_THROWS_AS(decode_lobby_response(json{{"remote_participants", "x"}}),
                      CallingServiceError);
    REQUIRE_THROWS_AS(decode_lobby_response(json::array({1, 2})), CallingServiceError);
}
