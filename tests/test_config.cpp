#include <catch2/catch_test_macros.hpp>

#include "call_core/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace {

void clear_config_env() {
    for (const char* name : {"CALLING_SERVICE_URL", "OUR_ACI", "AUTHORIZATION_TOKEN",
                             "REST_API_PORT", "PEEK_DEBOUNCE_MS", "HANGUP_PEEK_DELAY_MS",
                             "MAX_GROUP_CALL_RING_SIZE", "GROUP_CALL_OUTBOUND_RING",
                             "LOBBY_AUDIO_DEVICE_LIMIT", "START_ONLINE", "CONVERSATIONS",
                             "LOG_LEVEL", "LOG_NAME", "LOG_FILENAME", "LOGS_DIR"}) {
        unsetenv(name);
    }
}

}

TEST_CASE("config loads defaults from the required variables") {
    clear_config_env();
    setenv("CALLING_SERVICE_URL", "http://localhost:9000", 1);
    setenv("OUR_ACI", "our-aci", 1);

    const auto config = call_core::Config::load();
    REQUIRE(config.calling_service_url == "http://localhost:9000");
    REQUIRE(config.our_aci == "our-aci");
    REQUIRE_FALSE(config.authorization_token);
    REQUIRE(config.rest_api_port == 8000);
    REQUIRE(config.peek_debounce_ms == 1000);
    REQUIRE(config.max_group_call_ring_size == 16);
    REQUIRE(config.group_call_outbound_ring);
    REQUIRE(config.lobby_audio_device_limit == 8);
    REQUIRE(config.conversations.empty());
    REQUIRE_NOTHROW(config.validate());
    clear_config_env();
}

TEST_CASE("config reads overrides and seeded conversations") {
    clear_config_env();
    setenv("CALLING_SERVICE_URL", "http://localhost:9000", 1);
    setenv("OUR_ACI", "our-aci", 1);
    setenv("GROUP_CALL_OUTBOUND_RING", "false", 1);
    setenv("MAX_GROUP_CALL_RING_SIZE", "4", 1);
    setenv("CONVERSATIONS",
           R"([{"id":"g1","call_mode":"group","member_count":3},{"id":"d1","call_mode":"direct"}])",
           1);

    const auto config = call_core::Config::load();
    REQUIRE_FALSE(config.group_call_outbound_ring);
    REQUIRE(config.max_group_call_ring_size == 4);
    REQUIRE(config.conversations.size() == 2);
    REQUIRE(config.conversations[0].call_mode == call_core::CallMode::Group);
    REQUIRE(config.conversations[0].member_count == 3);
    clear_config_env();
}

TEST_CASE("config stamps the log file name into the logs directory") {
    clear_config_env();
    setenv("CALLING_SERVICE_URL", "http://localhost:9000", 1);
    setenv("OUR_ACI", "our-aci", 1);
    setenv("LOG_FILENAME", "call.log", 1);
    setenv("LOGS_DIR", "/tmp/call_core_logs", 1);

    const auto config = call_core::Config::load();
    REQUIRE(config.log_filename);
    const auto& name = *config.log_filename;
    REQUIRE(name.rfind("/tmp/call_core_logs/call_", 0) == 0);
    REQUIRE(name.size() > 4);
    REQUIRE(name.compare(name.size() - 4, 4, ".log") == 0);
    clear_config_env();
}

TEST_CASE("config requires the calling service url") {
    clear_config_env();
    setenv("OUR_ACI", "our-aci", 1);
    REQUIRE_THROWS_AS(call_core::Config::load(), std::runtime_error);
    clear_config_env();
}

TEST_CASE("config rejects a conversations value that is not an array") {
    clear_config_env();
    setenv("CALLING_SERVICE_URL", "http://localhost:9000", 1);
    setenv("OUR_ACI", "our-aci", 1);
    setenv("CONVERSATIONS", R"({"id":"g1"})", 1);
    REQUIRE_THROWS_AS(call_core::Config::load(), std::runtime_error);
    clear_config_env();
}

TEST_CASE("validate rejects out of range values") {
    call_core::Config config;
    config.calling_service_url = "http://localhost:9000";
    config.our_aci = "our-aci";
    REQUIRE_NOTHROW(config.validate());

    auto bad_port = config;
    bad_port.rest_api_port = 0;
    REQUIRE_THROWS_AS(bad_port.validate(), std::runtime_error);

    auto bad_ring = config;
    bad_ring.max_group_call_ring_size = 0;
    REQUIRE_THROWS_AS(bad_ring.validate(), std::runtime_error);

    auto bad_conversation = config;
    bad_conversation.conversations.push_back(call_core::ConversationInfo{});
    REQUIRE_THROWS_AS(bad_conversation.validate(), std::runtime_error);
}
