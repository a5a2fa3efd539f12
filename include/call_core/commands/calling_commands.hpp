#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "call_core/conversation/directory.hpp"
#include "call_core/peek/connectivity.hpp"
#include "call_core/peek/peek_coordinator.hpp"
#include "call_core/service/calling_service.hpp"
#include "call_core/store/call_store.hpp"
#include "call_core/store/transitions.hpp"

namespace call_core {

// Raised when a caller asks for something that can never be valid, such as
// a lobby for an unknown conversation.
class CommandError : public std::runtime_error {
public:
    explicit CommandError(const std::string& message) : std::runtime_error(message) {}
};

struct CommandOptions {
    Aci our_aci;
    int max_group_call_ring_size = 16;
    bool group_call_outbound_ring = true;
    int lobby_audio_device_limit = 8;
    std::chrono::milliseconds hangup_peek_delay{1000};
};

// Entry point for user commands and inbound notifications. Commands check
// the current state, call the calling service and only then transition the
// store. Service failures propagate as CallingServiceError. A false return
// means the command did not apply to the current state.
class CallingCommands {
public:
    CallingCommands(CallStore& store,
                    CallingService& service,
                    peek::PeekCoordinator& peeks,
                    InMemoryConversationDirectory& directory,
                    peek::ConnectivityMonitor& connectivity,
                    CommandOptions options);

    bool accept_call(const ConversationId& conversation_id, bool as_video_call);
    bool decline_call(const ConversationId& conversation_id);
    bool hang_up_active_call(const std::string& reason);
    bool cancel_call(const ConversationId& conversation_id);
    bool close_need_permission_screen();
    bool start_calling_lobby(const ConversationId& conversation_id, bool is_video_call);
    bool start_call(const ConversationId& conversation_id,
                    CallMode call_mode,
                    bool has_local_audio,
                    bool has_local_video);
    bool set_local_audio(bool enabled);
    bool set_local_video(bool enabled);
    bool set_presenting(const std::optional<PresentedSource>& source);
    bool set_outgoing_ring(bool enabled);
    bool set_group_call_video_request(const ConversationId& conversation_id,
                                      const std::vector<VideoRequest>& requests,
                                      int speaker_height);
    bool change_view(ViewAction action);

    // Safety number of `aci` changed: distrust the active group call if they
    // are in it.
    bool key_changed(const Aci& aci);
    bool key_change_ok(const ConversationId& conversation_id);

    void receive_incoming_direct_call(const IncomingDirectCall& event);
    void receive_incoming_group_call(const IncomingGroupCall& event);
    void cancel_incoming_group_call_ring(const CancelIncomingGroupCallRing& event);
    void call_state_change(const CallStateChange& event);
    void group_call_state_change(GroupCallStateChange event);
    void group_call_audio_levels_change(const GroupCallAudioLevelsChange& event);
    void peek_group_call_fulfilled(const PeekGroupCallFulfilled& event);
    void remote_video_change(const RemoteVideoChange& event);
    void remote_sharing_screen_change(const RemoteSharingScreenChange& event);
    void conversation_changed(const ConversationInfo& info);
    void conversation_removed(const ConversationId& conversation_id);
    void network_status_change(bool online);

    bool peek_not_connected_group_call(const ConversationId& conversation_id);
    bool peek_group_call_for_the_first_time(const ConversationId& conversation_id);
    bool peek_group_call_if_it_has_members(const ConversationId& conversation_id);

    const CommandOptions& options() const { return options_; }

private:
    void apply(const StoreEvent& event);
    void run_effect(const Effect& effect);

    CallStore& store_;
    CallingService& service_;
    peek::PeekCoordinator& peeks_;
    InMemoryConversationDirectory& directory_;
    peek::ConnectivityMonitor& connectivity_;
    CommandOptions options_;
};

}
