#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "call_core/model/call_record.hpp"

namespace call_core {

class CallingServiceError : public std::runtime_error {
public:
    explicit CallingServiceError(const std::string& message) : std::runtime_error(message) {}
};

class CallingServicePermissionError : public CallingServiceError {
public:
    explicit CallingServicePermissionError(const std::string& message)
        : CallingServiceError(message) {}
};

struct LobbyRequest {
    ConversationId conversation_id;
    CallMode call_mode = CallMode::Direct;
    bool has_local_audio = true;
    bool has_local_video = false;
};

// What the media layer reports once a lobby is open.
struct LobbyData {
    CallMode call_mode = CallMode::Direct;
    bool has_local_audio = false;
    bool has_local_video = false;
    GroupConnectionState connection_state = GroupConnectionState::NotConnected;
    GroupJoinState join_state = GroupJoinState::NotJoined;
    std::optional<PeekInfo> peek_info;
    std::vector<GroupCallParticipant> remote_participants;
};

struct VideoRequest {
    DemuxId demux_id = 0;
    int width = 0;
    int height = 0;
};

// Media and signaling layer. Every call may block until the remote side
// answers; failures are reported as CallingServiceError.
class CallingService {
public:
    virtual ~CallingService() = default;

    // nullopt when the service has nothing to report for the conversation.
    virtual std::optional<PeekInfo> peek_group_call(const ConversationId& conversation_id) = 0;
    virtual void join_group_call(const ConversationId& conversation_id,
                                 bool has_local_audio,
                                 bool has_local_video,
                                 bool should_ring) = 0;
    virtual void accept_direct_call(const ConversationId& conversation_id, bool as_video_call) = 0;
    virtual void decline_direct_call(const ConversationId& conversation_id) = 0;
    virtual void decline_group_call(const ConversationId& conversation_id, RingId ring_id) = 0;
    virtual void hangup(const ConversationId& conversation_id, const std::string& reason) = 0;
    virtual void start_outgoing_direct_call(const ConversationId& conversation_id,
                                            bool has_local_audio,
                                            bool has_local_video) = 0;
    virtual void set_outgoing_audio(const ConversationId& conversation_id, bool enabled) = 0;
    virtual void set_outgoing_video(const ConversationId& conversation_id, bool enabled) = 0;
    virtual void set_presenting(const ConversationId& conversation_id,
                                bool has_local_video,
                                const std::optional<PresentedSource>& source) = 0;
    virtual void set_group_call_video_request(const ConversationId& conversation_id,
                                              const std::vector<VideoRequest>& requests,
                                              int speaker_height) = 0;
    virtual void update_call_history_for_group_call(
        const ConversationId& conversation_id,
        std::optional<GroupJoinState> join_state,
        const PeekInfo& peek_info) = 0;
    // nullopt when the lobby could not be opened.
    virtual std::optional<LobbyData> start_calling_lobby(const LobbyRequest& request) = 0;
    virtual void stop_calling_lobby(const ConversationId& conversation_id) = 0;
    virtual void resend_group_call_media_keys(const ConversationId& conversation_id) = 0;
};

}
