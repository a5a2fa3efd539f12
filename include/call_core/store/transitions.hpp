#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "call_core/model/call_record.hpp"

namespace call_core {

struct StartCallingLobby {
    ConversationId conversation_id;
    CallMode call_mode = CallMode::Direct;
    bool has_local_audio = false;
    bool has_local_video = false;
    GroupConnectionState connection_state = GroupConnectionState::NotConnected;
    GroupJoinState join_state = GroupJoinState::NotJoined;
    std::optional<PeekInfo> peek_info;
    std::vector<GroupCallParticipant> remote_participants;
    bool is_conversation_too_big_to_ring = false;
    bool outbound_ring_enabled = true;
};

// Outgoing direct call placed either from the lobby or directly.
struct StartDirectCall {
    ConversationId conversation_id;
    bool has_local_audio = false;
    bool has_local_video = false;
};

struct AcceptCallPending {
    ConversationId conversation_id;
    bool as_video_call = false;
};

enum class EndReason {
    Cancel,
    HangUp,
    CloseNeedPermission
};

struct EndActiveCall {
    EndReason reason = EndReason::HangUp;
};

struct CancelIncomingGroupCallRing {
    ConversationId conversation_id;
    RingId ring_id = 0;
};

struct ConversationChanged {
    ConversationId conversation_id;
    bool too_big_to_ring = false;
};

struct ConversationRemoved {
    ConversationId conversation_id;
};

struct DeclineDirectCall {
    ConversationId conversation_id;
};

struct IncomingDirectCall {
    ConversationId conversation_id;
    bool is_video_call = false;
};

struct IncomingGroupCall {
    ConversationId conversation_id;
    RingId ring_id = 0;
    Aci ringer_aci;
};

struct CallStateChange {
    ConversationId conversation_id;
    DirectCallState call_state = DirectCallState::Prering;
    std::optional<CallEndedReason> call_ended_reason;
    std::optional<std::int64_t> accepted_time;
};

struct RemoteDeviceAudioLevel {
    DemuxId demux_id = 0;
    std::optional<double> audio_level;
};

struct GroupCallAudioLevelsChange {
    ConversationId conversation_id;
    double local_audio_level = 0.0;
    std::vector<RemoteDeviceAudioLevel> remote_device_states;
};

struct GroupCallStateChange {
    ConversationId conversation_id;
    GroupConnectionState connection_state = GroupConnectionState::NotConnected;
    GroupJoinState join_state = GroupJoinState::NotJoined;
    bool has_local_audio = false;
    bool has_local_video = false;
    std::optional<PeekInfo> peek_info;
    std::vector<GroupCallParticipant> remote_participants;
    Aci our_aci;
};

struct PeekGroupCallFulfilled {
    ConversationId conversation_id;
    PeekInfo peek_info;
};

struct RemoteVideoChange {
    ConversationId conversation_id;
    bool has_video = false;
};

struct RemoteSharingScreenChange {
    ConversationId conversation_id;
    bool is_sharing_screen = false;
};

enum class ViewAction {
    TogglePip,
    ToggleSettings,
    ToggleParticipants,
    ToggleSpeakerView,
    SwitchToPresentation,
    SwitchFromPresentation,
    ToggleScreenRecordingWarning,
    ReturnToActiveCall
};

struct ViewChange {
    ViewAction action = ViewAction::TogglePip;
};

struct SetLocalAudioFulfilled {
    bool enabled = false;
};

struct SetLocalVideoFulfilled {
    bool enabled = false;
};

struct SetPresenting {
    std::optional<PresentedSource> source;
};

struct SetOutgoingRing {
    bool enabled = false;
};

struct MarkCallUntrusted {
    std::vector<Aci> safety_number_changed_acis;
};

struct MarkCallTrusted {};

using StoreEvent = std::variant<StartCallingLobby,
                                StartDirectCall,
                                AcceptCallPending,
                                EndActiveCall,
                                CancelIncomingGroupCallRing,
                                ConversationChanged,
                                ConversationRemoved,
                                DeclineDirectCall,
                                IncomingDirectCall,
                                IncomingGroupCall,
                                CallStateChange,
                                GroupCallAudioLevelsChange,
                                GroupCallStateChange,
                                PeekGroupCallFulfilled,
                                RemoteVideoChange,
                                RemoteSharingScreenChange,
                                ViewChange,
                                SetLocalAudioFulfilled,
                                SetLocalVideoFulfilled,
                                SetPresenting,
                                SetOutgoingRing,
                                MarkCallUntrusted,
                                MarkCallTrusted>;

// Side effects the store asks its caller to perform after a transition.
struct Effect {
    enum class Kind {
        StopCallingLobby,
        RefreshPeek
    };

    Kind kind = Kind::RefreshPeek;
    ConversationId conversation_id;
};

bool operator==(const Effect& lhs, const Effect& rhs);

struct Transition {
    // Empty when the event left the state untouched.
    std::optional<CallingState> next;
    std::vector<Effect> effects;
    // Set when the event referenced a missing call, a call of the wrong
    // mode, or no active call.
    bool stale = false;

    bool changed() const { return next.has_value(); }
};

Transition reduce(const CallingState& state, const StoreEvent& event);

const char* event_name(const StoreEvent& event);
const char* to_string(EndReason reason);
const char* to_string(ViewAction action);
const char* to_string(Effect::Kind kind);

}
