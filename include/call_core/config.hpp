#pragma once

#include <optional>
#include <string>
#include <vector>

#include "call_core/conversation/directory.hpp"

namespace call_core {

struct Config {
    std::string calling_service_url;
    std::string our_aci;
    std::optional<std::string> authorization_token;
    double calling_service_request_timeout = 30.0;
    double calling_service_connect_timeout = 30.0;
    double calling_service_read_timeout = 30.0;
    int rest_api_port = 8000;
    int peek_debounce_ms = 1000;
    int hangup_peek_delay_ms = 1000;
    int max_group_call_ring_size = 16;
    bool group_call_outbound_ring = true;
    int lobby_audio_device_limit = 8;
    bool start_online = true;
    std::vector<ConversationInfo> conversations;
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::string log_name = "call_core";

    static Config load();
    void validate() const;
};

}
