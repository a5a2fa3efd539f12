#include "call_core/service/http_calling_service.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "call_core/logging.hpp"
#include "call_core/model/json.hpp"
#include "call_core/utils/http.hpp"

namespace call_core {

namespace {

template <typename Fn>
auto decode_response(const char* what, Fn&& decode) -> decltype(decode()) {
    try {
        return decode();
    } catch (const nlohmann::json::exception& ex) {
        throw CallingServiceError(std::string("Malformed ") + what + " response: " + ex.what());
    } catch (const std::invalid_argument& ex) {
        throw CallingServiceError(std::string("Malformed ") + what + " response: " + ex.what());
    }
}

}

std::optional<PeekInfo> decode_peek_response(const nlohmann::json& response) {
    return decode_response("peek", [&response]() -> std::optional<PeekInfo> {
        if (!response.is_object()) {
            throw CallingServiceError("Malformed peek response: not an object");
        }
        const auto peek = response.find("peek_info");
        if (peek == response.end() || peek->is_null()) {
            return std::nullopt;
        }
        return peek->get<PeekInfo>();
    });
}

std::optional<LobbyData> decode_lobby_response(const nlohmann::json& response) {
    return decode_response("lobby", [&response]() -> std::optional<LobbyData> {
        if (response.is_null() || (response.is_object() && response.empty())) {
            return std::nullopt;
        }
        if (!response.is_object()) {
            throw CallingServiceError("Malformed lobby response: not an object");
        }
        LobbyData data;
        data.call_mode = response.value("call_mode", CallMode::Direct);
        data.has_local_audio = response.value("has_local_audio", false);
        data.has_local_video = response.value("has_local_video", false);
        data.connection_state =
            response.value("connection_state", GroupConnectionState::NotConnected);
        data.join_state = response.value("join_state", GroupJoinState::NotJoined);
        const auto peek = response.find("peek_info");
        if (peek != response.end() && !peek->is_null()) {
            data.peek_info = peek->get<PeekInfo>();
        }
        data.remote_participants =
            response.value("remote_participants", std::vector<GroupCallParticipant>{});
        return data;
    });
}

HttpCallingService::HttpCallingService(std::string base_url,
                                       std::optional<std::string> authorization_token,
                                       CallingServiceRequestOptions options)
    : authorization_token_(std::move(authorization_token)),
      options_(options) {
    utils::parse_url(base_url, scheme_, host_, port_, base_path_);

    if (scheme_ == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client_https_ = std::make_unique<httplib::SSLClient>(host_, port_);
        client_https_->enable_server_certificate_verification(false);
#else
        throw CallingServiceError("HTTPS calling service requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    } else {
        client_http_ = std::make_unique<httplib::Client>(host_, port_);
    }
    apply_timeouts();
    logging::info("Calling service client ready",
                  {kv("url", utils::build_url(scheme_, host_, port_, base_path_))});
}

std::optional<PeekInfo> HttpCallingService::peek_group_call(
    const ConversationId& conversation_id) {
    return decode_peek_response(
        post_operation(conversation_id, "peek", nlohmann::json::object()));
}

void HttpCallingService::join_group_call(const ConversationId& conversation_id,
                                         bool has_local_audio,
                                         bool has_local_video,
                                         bool should_ring) {
    post_operation(conversation_id, "join",
                   {{"has_local_audio", has_local_audio},
                    {"has_local_video", has_local_video},
                    {"should_ring", should_ring}});
}

void HttpCallingService::accept_direct_call(const ConversationId& conversation_id,
                                            bool as_video_call) {
    post_operation(conversation_id, "accept", {{"as_video_call", as_video_call}});
}

void HttpCallingService::decline_direct_call(const ConversationId& conversation_id) {
    post_operation(conversation_id, "decline", nlohmann::json::object());
}

void HttpCallingService::decline_group_call(const ConversationId& conversation_id,
                                            RingId ring_id) {
    post_operation(conversation_id, "decline_group",
                   {{"ring_id", std::to_string(ring_id)}});
}

void HttpCallingService::hangup(const ConversationId& conversation_id,
                                const std::string& reason) {
    post_operation(conversation_id, "hangup", {{"reason", reason}});
}

void HttpCallingService::start_outgoing_direct_call(const ConversationId& conversation_id,
                                                    bool has_local_audio,
                                                    bool has_local_video) {
    post_operation(conversation_id, "outgoing",
                   {{"has_local_audio", has_local_audio}, {"has_local_video", has_local_video}});
}

void HttpCallingService::set_outgoing_audio(const ConversationId& conversation_id,
                                            bool enabled) {
    post_operation(conversation_id, "outgoing_audio", {{"enabled", enabled}});
}

void HttpCallingService::set_outgoing_video(const ConversationId& conversation_id,
                                            bool enabled) {
    post_operation(conversation_id, "outgoing_video", {{"enabled", enabled}});
}

void HttpCallingService::set_presenting(const ConversationId& conversation_id,
                                        bool has_local_video,
                                        const std::optional<PresentedSource>& source) {
    nlohmann::json body{{"has_local_video", has_local_video}};
    body["source"] = source ? nlohmann::json(*source) : nlohmann::json(nullptr);
    post_operation(conversation_id, "presenting", body);
}

void HttpCallingService::set_group_call_video_request(const ConversationId& conversation_id,
                                                      const std::vector<VideoRequest>& requests,
                                                      int speaker_height) {
    auto resolutions = nlohmann::json::array();
    for (const auto& request : requests) {
        resolutions.push_back({{"demux_id", request.demux_id},
                               {"width", request.width},
                               {"height", request.height}});
    }
    post_operation(conversation_id, "video_request",
                   {{"resolutions", resolutions}, {"speaker_height", speaker_height}});
}

void HttpCallingService::update_call_history_for_group_call(
    const ConversationId& conversation_id,
    std::optional<GroupJoinState> join_state,
    const PeekInfo& peek_info) {
    nlohmann::json body{{"peek_info", peek_info}};
    body["join_state"] = join_state ? nlohmann::json(*join_state) : nlohmann::json(nullptr);
    post_operation(conversation_id, "call_history", body);
}

std::optional<LobbyData> HttpCallingService::start_calling_lobby(const LobbyRequest& request) {
    const auto response = post_operation(request.conversation_id, "lobby",
                                         {{"call_mode", request.call_mode},
                                          {"has_local_audio", request.has_local_audio},
                                          {"has_local_video", request.has_local_video}});
    return decode_lobby_response(response);
}

void HttpCallingService::stop_calling_lobby(const ConversationId& conversation_id) {
    post_operation(conversation_id, "stop_lobby", nlohmann::json::object());
}

void HttpCallingService::resend_group_call_media_keys(const ConversationId& conversation_id) {
    post_operation(conversation_id, "resend_media_keys", nlohmann::json::object());
}

nlohmann::json HttpCallingService::post_operation(const ConversationId& conversation_id,
                                                  const std::string& operation,
                                                  const nlohmann::json& body) {
    const auto path = "/v1/conversations/" + utils::url_encode(conversation_id) + "/" + operation;
    logging::debug("Calling service request",
                   {kv("conversation_id", conversation_id), kv("operation", operation)});
    return post_json(path, body);
}

nlohmann::json HttpCallingService::post_json(const std::string& path,
                                             const nlohmann::json& body) {
    auto headers = httplib::Headers{{"Accept", "application/json"}};
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    const auto full_path = utils::join_path(base_path_, path);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    auto response = client_https_
                        ? client_https_->Post(full_path.c_str(), headers, body.dump(),
                                              "application/json")
                        : client_http_->Post(full_path.c_str(), headers, body.dump(),
                                             "application/json");
#else
    auto response = client_http_->Post(full_path.c_str(), headers, body.dump(),
                                       "application/json");
#endif
    if (!response) {
        throw CallingServiceError("Calling service request failed: " +
                                  httplib::to_string(response.error()));
    }
    if (response->status == 403) {
        throw CallingServicePermissionError(response->body);
    }
    if (response->status < 200 || response->status >= 300) {
        throw CallingServiceError("Calling service returned " +
                                  std::to_string(response->status) + ": " + response->body);
    }
    if (response->body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::parse_error& ex) {
        throw CallingServiceError(std::string("Malformed calling service response: ") +
                                  ex.what());
    }
}

void HttpCallingService::apply_timeouts() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (client_https_) {
        client_https_->set_connection_timeout(options_.connect_timeout.count(), 0);
        client_https_->set_read_timeout(options_.sock_read_timeout.count(), 0);
        client_https_->set_write_timeout(options_.request_timeout.count(), 0);
        return;
    }
#endif
    if (client_http_) {
        client_http_->set_connection_timeout(options_.connect_timeout.count(), 0);
        client_http_->set_read_timeout(options_.sock_read_timeout.count(), 0);
        client_http_->set_write_timeout(options_.request_timeout.count(), 0);
    }
}

}
