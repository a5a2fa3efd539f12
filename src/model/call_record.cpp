#include "call_core/model/call_record.hpp"

#include <algorithm>
#include <cassert>
#include <tuple>

#include "call_core/logging.hpp"

namespace call_core {

bool operator==(const PeekInfo& lhs, const PeekInfo& rhs) {
    return std::tie(lhs.acis, lhs.creator_aci, lhs.era_id, lhs.max_devices, lhs.device_count) ==
           std::tie(rhs.acis, rhs.creator_aci, rhs.era_id, rhs.max_devices, rhs.device_count);
}

bool operator!=(const PeekInfo& lhs, const PeekInfo& rhs) {
    return !(lhs == rhs);
}

bool operator==(const GroupCallParticipant& lhs, const GroupCallParticipant& rhs) {
    return std::tie(lhs.aci, lhs.demux_id, lhs.has_remote_audio, lhs.has_remote_video,
                    lhs.presenting, lhs.sharing_screen, lhs.speaker_time,
                    lhs.video_aspect_ratio) ==
           std::tie(rhs.aci, rhs.demux_id, rhs.has_remote_audio, rhs.has_remote_video,
                    rhs.presenting, rhs.sharing_screen, rhs.speaker_time,
                    rhs.video_aspect_ratio);
}

bool operator==(const RingState& lhs, const RingState& rhs) {
    return lhs.ring_id == rhs.ring_id && lhs.ringer_aci == rhs.ringer_aci;
}

bool operator==(const DirectCall& lhs, const DirectCall& rhs) {
    return std::tie(lhs.conversation_id, lhs.call_state, lhs.call_ended_reason, lhs.is_incoming,
                    lhs.is_video_call, lhs.has_remote_video, lhs.is_sharing_screen) ==
           std::tie(rhs.conversation_id, rhs.call_state, rhs.call_ended_reason, rhs.is_incoming,
                    rhs.is_video_call, rhs.has_remote_video, rhs.is_sharing_screen);
}

bool operator==(const GroupCall& lhs, const GroupCall& rhs) {
    return std::tie(lhs.conversation_id, lhs.connection_state, lhs.join_state, lhs.peek_info,
                    lhs.remote_participants, lhs.remote_audio_levels, lhs.ring) ==
           std::tie(rhs.conversation_id, rhs.connection_state, rhs.join_state, rhs.peek_info,
                    rhs.remote_participants, rhs.remote_audio_levels, rhs.ring);
}

bool operator==(const PresentedSource& lhs, const PresentedSource& rhs) {
    return lhs.id == rhs.id && lhs.name == rhs.name;
}

bool operator==(const ActiveCallState& lhs, const ActiveCallState& rhs) {
    return std::tie(lhs.conversation_id, lhs.has_local_audio, lhs.has_local_video,
                    lhs.local_audio_level, lhs.view_mode, lhs.joined_at, lhs.outgoing_ring,
                    lhs.pip, lhs.presenting_source, lhs.safety_number_changed_acis,
                    lhs.settings_dialog_open,
                    lhs.show_needs_screen_recording_permissions_warning,
                    lhs.show_participants_list) ==
           std::tie(rhs.conversation_id, rhs.has_local_audio, rhs.has_local_video,
                    rhs.local_audio_level, rhs.view_mode, rhs.joined_at, rhs.outgoing_ring,
                    rhs.pip, rhs.presenting_source, rhs.safety_number_changed_acis,
                    rhs.settings_dialog_open,
                    rhs.show_needs_screen_recording_permissions_warning,
                    rhs.show_participants_list);
}

bool operator==(const CallingState& lhs, const CallingState& rhs) {
    return lhs.calls_by_conversation == rhs.calls_by_conversation &&
           lhs.active_call_state == rhs.active_call_state;
}

bool operator!=(const CallingState& lhs, const CallingState& rhs) {
    return !(lhs == rhs);
}

CallMode call_mode_of(const CallRecord& record) {
    return std::holds_alternative<DirectCall>(record) ? CallMode::Direct : CallMode::Group;
}

const ConversationId& conversation_id_of(const CallRecord& record) {
    return std::visit(
        [](const auto& call) -> const ConversationId& { return call.conversation_id; }, record);
}

const CallRecord* find_call(const CallingState& state, const ConversationId& id) {
    const auto it = state.calls_by_conversation.find(id);
    if (it == state.calls_by_conversation.end()) {
        return nullptr;
    }
    return &it->second;
}

const GroupCall* find_group_call(const CallingState& state, const ConversationId& id) {
    const auto* record = find_call(state, id);
    return record ? std::get_if<GroupCall>(record) : nullptr;
}

const DirectCall* find_direct_call(const CallingState& state, const ConversationId& id) {
    const auto* record = find_call(state, id);
    return record ? std::get_if<DirectCall>(record) : nullptr;
}

const CallRecord* get_active_call(const CallingState& state) {
    if (!state.active_call_state) {
        return nullptr;
    }
    const auto* record = find_call(state, state.active_call_state->conversation_id);
    if (!record) {
        logging::error(
            "Active call state references a conversation without a call",
            {kv("conversation_id", state.active_call_state->conversation_id)});
        assert(record && "active call state without a call record");
    }
    return record;
}

bool is_anybody_else_in_group_call(const PeekInfo& peek_info, const Aci& our_aci) {
    return std::any_of(peek_info.acis.begin(), peek_info.acis.end(),
                       [&our_aci](const Aci& aci) { return aci != our_aci; });
}

PeekInfo synthesize_peek_info(const std::vector<GroupCallParticipant>& participants) {
    PeekInfo info;
    info.acis.reserve(participants.size());
    for (const auto& participant : participants) {
        info.acis.push_back(participant.aci);
    }
    info.max_devices = kUnlimitedDevices;
    info.device_count = static_cast<std::uint32_t>(participants.size());
    return info;
}

GroupCall make_not_connected_group_call(const ConversationId& id) {
    GroupCall call;
    call.conversation_id = id;
    call.connection_state = GroupConnectionState::NotConnected;
    call.join_state = GroupJoinState::NotJoined;
    call.peek_info = PeekInfo{};
    return call;
}

const char* to_string(CallMode mode) {
    switch (mode) {
        case CallMode::None: return "none";
        case CallMode::Direct: return "direct";
        case CallMode::Group: return "group";
        case CallMode::Adhoc: return "adhoc";
    }
    return "unknown";
}

const char* to_string(DirectCallState state) {
    switch (state) {
        case DirectCallState::Prering: return "prering";
        case DirectCallState::Ringing: return "ringing";
        case DirectCallState::Accepted: return "accepted";
        case DirectCallState::Reconnecting: return "reconnecting";
        case DirectCallState::Ended: return "ended";
    }
    return "unknown";
}

const char* to_string(CallEndedReason reason) {
    switch (reason) {
        case CallEndedReason::LocalHangup: return "local_hangup";
        case CallEndedReason::RemoteHangup: return "remote_hangup";
        case CallEndedReason::RemoteHangupNeedPermission: return "remote_hangup_need_permission";
        case CallEndedReason::Declined: return "declined";
        case CallEndedReason::Busy: return "busy";
        case CallEndedReason::Glare: return "glare";
        case CallEndedReason::ReceivedOfferExpired: return "received_offer_expired";
        case CallEndedReason::ReceivedOfferWhileActive: return "received_offer_while_active";
        case CallEndedReason::SignalingFailure: return "signaling_failure";
        case CallEndedReason::ConnectionFailure: return "connection_failure";
        case CallEndedReason::InternalFailure: return "internal_failure";
        case CallEndedReason::Timeout: return "timeout";
        case CallEndedReason::AcceptedOnAnotherDevice: return "accepted_on_another_device";
        case CallEndedReason::DeclinedOnAnotherDevice: return "declined_on_another_device";
        case CallEndedReason::BusyOnAnotherDevice: return "busy_on_another_device";
    }
    return "unknown";
}

const char* to_string(GroupConnectionState state) {
    switch (state) {
        case GroupConnectionState::NotConnected: return "not_connected";
        case GroupConnectionState::Connecting: return "connecting";
        case GroupConnectionState::Connected: return "connected";
        case GroupConnectionState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

const char* to_string(GroupJoinState state) {
    switch (state) {
        case GroupJoinState::NotJoined: return "not_joined";
        case GroupJoinState::Joining: return "joining";
        case GroupJoinState::Joined: return "joined";
    }
    return "unknown";
}

const char* to_string(CallViewMode mode) {
    switch (mode) {
        case CallViewMode::Grid: return "grid";
        case CallViewMode::Speaker: return "speaker";
        case CallViewMode::Presentation: return "presentation";
    }
    return "unknown";
}

}
