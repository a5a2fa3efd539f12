#pragma once

#include <chrono>
#include <httplib.h>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "call_core/service/calling_service.hpp"

namespace call_core {

struct CallingServiceRequestOptions {
    std::chrono::seconds request_timeout{30};
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds sock_read_timeout{30};
};

// Sidecar response decoders. A body of the wrong shape raises
// CallingServiceError.
std::optional<PeekInfo> decode_peek_response(const nlohmann::json& response);
std::optional<LobbyData> decode_lobby_response(const nlohmann::json& response);

// Talks JSON to a calling-service sidecar: every operation is a
// POST /v1/conversations/{id}/<operation>.
class HttpCallingService : public CallingService {
public:
    HttpCallingService(std::string base_url,
                       std::optional<std::string> authorization_token,
                       CallingServiceRequestOptions options);

    std::optional<PeekInfo> peek_group_call(const ConversationId& conversation_id) override;
    void join_group_call(const ConversationId& conversation_id,
                         bool has_local_audio,
                         bool has_local_video,
                         bool should_ring) override;
    void accept_direct_call(const ConversationId& conversation_id, bool as_video_call) override;
    void decline_direct_call(const ConversationId& conversation_id) override;
    void decline_group_call(const ConversationId& conversation_id, RingId ring_id) override;
    void hangup(const ConversationId& conversation_id, const std::string& reason) override;
    void start_outgoing_direct_call(const ConversationId& conversation_id,
                                    bool has_local_audio,
                                    bool has_local_video) override;
    void set_outgoing_audio(const ConversationId& conversation_id, bool enabled) override;
    void set_outgoing_video(const ConversationId& conversation_id, bool enabled) override;
    void set_presenting(const ConversationId& conversation_id,
                        bool has_local_video,
                        const std::optional<PresentedSource>& source) override;
    void set_group_call_video_request(const ConversationId& conversation_id,
                                      const std::vector<VideoRequest>& requests,
                                      int speaker_height) override;
    void update_call_history_for_group_call(const ConversationId& conversation_id,
                                            std::optional<GroupJoinState> join_state,
                                            const PeekInfo& peek_info) override;
    std::optional<LobbyData> start_calling_lobby(const LobbyRequest& request) override;
    void stop_calling_lobby(const ConversationId& conversation_id) override;
    void resend_group_call_media_keys(const ConversationId& conversation_id) override;

private:
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);
    nlohmann::json post_operation(const ConversationId& conversation_id,
                                  const std::string& operation,
                                  const nlohmann::json& body);
    void apply_timeouts();

    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    std::optional<std::string> authorization_token_;
    CallingServiceRequestOptions options_;
    std::unique_ptr<httplib::Client> client_http_;
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    std::unique_ptr<httplib::SSLClient> client_https_;
#endif
};

}
