#include "call_core/store/transitions.hpp"

#include <map>
#include <type_traits>

#include "call_core/logging.hpp"
#include "call_core/model/audio_level.hpp"

namespace call_core {

namespace {

Transition unchanged() {
    return Transition{};
}

Transition stale(const std::string& message, const ConversationId& conversation_id = {}) {
    if (conversation_id.empty()) {
        logging::warn(message);
    } else {
        logging::warn(message, {kv("conversation_id", conversation_id)});
    }
    Transition transition;
    transition.stale = true;
    return transition;
}

Transition changed(CallingState next, std::vector<Effect> effects = {}) {
    Transition transition;
    transition.next = std::move(next);
    transition.effects = std::move(effects);
    return transition;
}

ActiveCallState make_active_call_state(const ConversationId& conversation_id,
                                       bool has_local_audio,
                                       bool has_local_video,
                                       bool outgoing_ring) {
    ActiveCallState active;
    active.conversation_id = conversation_id;
    active.has_local_audio = has_local_audio;
    active.has_local_video = has_local_video;
    active.local_audio_level = 0.0;
    active.view_mode = CallViewMode::Grid;
    active.pip = false;
    active.settings_dialog_open = false;
    active.show_participants_list = false;
    active.outgoing_ring = outgoing_ring;
    return active;
}

DirectCall make_outgoing_direct_call(const ConversationId& conversation_id, bool is_video_call) {
    DirectCall call;
    call.conversation_id = conversation_id;
    call.call_state = DirectCallState::Prering;
    call.is_incoming = false;
    call.is_video_call = is_video_call;
    return call;
}

// Returns nullopt when nothing referenced the conversation.
std::optional<CallingState> remove_conversation(const CallingState& state,
                                                const ConversationId& conversation_id) {
    const bool has_record = state.calls_by_conversation.count(conversation_id) > 0;
    const bool is_active = state.active_call_state &&
                           state.active_call_state->conversation_id == conversation_id;
    if (!has_record && !is_active) {
        return std::nullopt;
    }
    CallingState next = state;
    next.calls_by_conversation.erase(conversation_id);
    if (is_active) {
        next.active_call_state.reset();
    }
    return next;
}

// Applies `mutate` to a copy of the active call state.
template <typename Fn>
Transition update_active(const CallingState& state, const char* what, Fn&& mutate) {
    if (!state.active_call_state) {
        return stale(std::string("Cannot ") + what + " when there is no active call");
    }
    CallingState next = state;
    mutate(*next.active_call_state);
    return changed(std::move(next));
}

class Reducer {
public:
    explicit Reducer(const CallingState& state) : state_(state) {}

    Transition operator()(const StartCallingLobby& event) const {
        CallingState next = state_;
        bool outgoing_ring = false;
        switch (event.call_mode) {
            case CallMode::Direct: {
                DirectCall call;
                call.conversation_id = event.conversation_id;
                call.is_incoming = false;
                call.is_video_call = event.has_local_video;
                next.calls_by_conversation[event.conversation_id] = call;
                outgoing_ring = true;
                break;
            }
            case CallMode::Group: {
                const auto* existing = find_group_call(state_, event.conversation_id);
                GroupCall call;
                call.conversation_id = event.conversation_id;
                call.connection_state = event.connection_state;
                call.join_state = event.join_state;
                if (event.peek_info) {
                    call.peek_info = event.peek_info;
                } else if (existing && existing->peek_info) {
                    call.peek_info = existing->peek_info;
                } else {
                    call.peek_info = synthesize_peek_info(event.remote_participants);
                }
                call.remote_participants = event.remote_participants;
                if (existing && event.join_state == GroupJoinState::NotJoined) {
                    call.ring = existing->ring;
                }
                outgoing_ring = event.outbound_ring_enabled &&
                                !call.ring &&
                                call.peek_info->acis.empty() &&
                                call.remote_participants.empty() &&
                                !event.is_conversation_too_big_to_ring;
                next.calls_by_conversation[event.conversation_id] = call;
                break;
            }
            case CallMode::None:
            case CallMode::Adhoc:
                return stale(std::string("Cannot start a lobby for call mode ") +
                                 to_string(event.call_mode),
                             event.conversation_id);
        }
        next.active_call_state = make_active_call_state(
            event.conversation_id, event.has_local_audio, event.has_local_video, outgoing_ring);
        return changed(std::move(next));
    }

    Transition operator()(const StartDirectCall& event) const {
        CallingState next = state_;
        next.calls_by_conversation[event.conversation_id] =
            make_outgoing_direct_call(event.conversation_id, event.has_local_video);
        next.active_call_state = make_active_call_state(
            event.conversation_id, event.has_local_audio, event.has_local_video, true);
        return changed(std::move(next));
    }

    Transition operator()(const AcceptCallPending& event) const {
        if (!find_call(state_, event.conversation_id)) {
            return stale("Unable to accept a non-existent call", event.conversation_id);
        }
        CallingState next = state_;
        next.active_call_state =
            make_active_call_state(event.conversation_id, true, event.as_video_call, false);
        return changed(std::move(next));
    }

    Transition operator()(const EndActiveCall& event) const {
        const auto* active = get_active_call(state_);
        if (!active) {
            return stale("No active call to remove");
        }
        const auto conversation_id = conversation_id_of(*active);
        if (std::holds_alternative<DirectCall>(*active)) {
            return changed(*remove_conversation(state_, conversation_id));
        }
        // Group records stay so the conversation can still be peeked.
        CallingState next = state_;
        next.active_call_state.reset();
        std::vector<Effect> effects;
        if (event.reason == EndReason::HangUp) {
            effects.push_back(Effect{Effect::Kind::RefreshPeek, conversation_id});
        }
        return changed(std::move(next), std::move(effects));
    }

    Transition operator()(const CancelIncomingGroupCallRing& event) const {
        const auto* call = find_group_call(state_, event.conversation_id);
        if (!call) {
            return stale("Cannot cancel a ring for a missing group call", event.conversation_id);
        }
        if (!call->ring || call->ring->ring_id != event.ring_id) {
            logging::debug("Ignoring cancel for a ring that is not current",
                           {kv("conversation_id", event.conversation_id),
                            kv("ring_id", event.ring_id)});
            return unchanged();
        }
        CallingState next = state_;
        std::get<GroupCall>(next.calls_by_conversation.at(event.conversation_id)).ring.reset();
        return changed(std::move(next));
    }

    Transition operator()(const ConversationChanged& event) const {
        const auto& active_state = state_.active_call_state;
        if (!active_state || !active_state->outgoing_ring ||
            active_state->conversation_id != event.conversation_id || !event.too_big_to_ring) {
            return unchanged();
        }
        const auto* call = find_group_call(state_, event.conversation_id);
        if (!call || call->join_state != GroupJoinState::NotJoined) {
            return unchanged();
        }
        CallingState next = state_;
        next.active_call_state->outgoing_ring = false;
        return changed(std::move(next));
    }

    Transition operator()(const ConversationRemoved& event) const {
        auto next = remove_conversation(state_, event.conversation_id);
        if (!next) {
            return unchanged();
        }
        return changed(std::move(*next));
    }

    Transition operator()(const DeclineDirectCall& event) const {
        auto next = remove_conversation(state_, event.conversation_id);
        if (!next) {
            return stale("Cannot decline a missing call", event.conversation_id);
        }
        return changed(std::move(*next));
    }

    Transition operator()(const IncomingDirectCall& event) const {
        std::vector<Effect> effects;
        if (state_.active_call_state &&
            state_.active_call_state->conversation_id == event.conversation_id) {
            effects.push_back(Effect{Effect::Kind::StopCallingLobby, event.conversation_id});
        }
        CallingState next = state_;
        DirectCall call;
        call.conversation_id = event.conversation_id;
        call.call_state = DirectCallState::Prering;
        call.is_incoming = true;
        call.is_video_call = event.is_video_call;
        next.calls_by_conversation[event.conversation_id] = call;
        return changed(std::move(next), std::move(effects));
    }

    Transition operator()(const IncomingGroupCall& event) const {
        const auto* record = find_call(state_, event.conversation_id);
        GroupCall call;
        if (record) {
            const auto* existing = std::get_if<GroupCall>(record);
            if (!existing) {
                return stale("Got a group ring for a direct call", event.conversation_id);
            }
            if (existing->ring) {
                logging::info("Group call was already ringing",
                              {kv("conversation_id", event.conversation_id)});
                return unchanged();
            }
            if (existing->join_state != GroupJoinState::NotJoined) {
                logging::info("Got a ring for a call we're already in",
                              {kv("conversation_id", event.conversation_id)});
                return unchanged();
            }
            call = *existing;
        } else {
            call = make_not_connected_group_call(event.conversation_id);
        }
        call.ring = RingState{event.ring_id, event.ringer_aci};

        CallingState next = state_;
        next.calls_by_conversation[event.conversation_id] = call;
        return changed(std::move(next));
    }

    Transition operator()(const CallStateChange& event) const {
        const auto* record = find_call(state_, event.conversation_id);
        if (record && !std::holds_alternative<DirectCall>(*record)) {
            return stale("Cannot update state for a non-direct call", event.conversation_id);
        }

        // Calls that ended with a message request stay around for the
        // needs-permission screen.
        if (event.call_state == DirectCallState::Ended &&
            event.call_ended_reason != CallEndedReason::RemoteHangupNeedPermission) {
            auto next = remove_conversation(state_, event.conversation_id);
            if (!next) {
                return stale("Cannot end a missing direct call", event.conversation_id);
            }
            return changed(std::move(*next));
        }

        if (!record) {
            return stale("Cannot update state for a missing direct call", event.conversation_id);
        }

        CallingState next = state_;
        auto& call = std::get<DirectCall>(next.calls_by_conversation.at(event.conversation_id));
        call.call_state = event.call_state;
        call.call_ended_reason = event.call_ended_reason;
        if (next.active_call_state &&
            next.active_call_state->conversation_id == event.conversation_id) {
            next.active_call_state->joined_at = event.accepted_time;
        }
        return changed(std::move(next));
    }

    Transition operator()(const GroupCallAudioLevelsChange& event) const {
        const auto& active_state = state_.active_call_state;
        const auto* existing = find_group_call(state_, event.conversation_id);
        // Levels are not shown while minimized.
        if (!active_state || active_state->pip || !existing) {
            return unchanged();
        }

        const double local_audio_level = truncate_audio_level(event.local_audio_level);
        std::map<DemuxId, double> remote_audio_levels;
        for (const auto& device : event.remote_device_states) {
            if (!device.audio_level) {
                continue;
            }
            const double graded = truncate_audio_level(*device.audio_level);
            if (graded > 0) {
                remote_audio_levels[device.demux_id] = graded;
            }
        }

        if (active_state->local_audio_level == local_audio_level &&
            existing->remote_audio_levels &&
            *existing->remote_audio_levels == remote_audio_levels) {
            return unchanged();
        }

        CallingState next = state_;
        next.active_call_state->local_audio_level = local_audio_level;
        std::get<GroupCall>(next.calls_by_conversation.at(event.conversation_id))
            .remote_audio_levels = std::move(remote_audio_levels);
        return changed(std::move(next));
    }

    Transition operator()(const GroupCallStateChange& event) const {
        const auto* record = find_call(state_, event.conversation_id);
        const GroupCall* existing = nullptr;
        if (record) {
            existing = std::get_if<GroupCall>(record);
            if (!existing) {
                return stale("Cannot apply a group state change to a direct call",
                             event.conversation_id);
            }
        }

        PeekInfo peek_info;
        if (event.peek_info) {
            peek_info = *event.peek_info;
        } else if (existing && existing->peek_info) {
            peek_info = *existing->peek_info;
        } else {
            peek_info = synthesize_peek_info(event.remote_participants);
        }

        CallingState next = state_;
        auto& active_state = next.active_call_state;
        if (active_state && active_state->conversation_id == event.conversation_id) {
            if (event.connection_state == GroupConnectionState::NotConnected) {
                active_state.reset();
            } else {
                active_state->has_local_audio = event.has_local_audio;
                active_state->has_local_video = event.has_local_video;
                if (active_state->outgoing_ring &&
                    is_anybody_else_in_group_call(peek_info, event.our_aci)) {
                    active_state->outgoing_ring = false;
                }
            }
        }

        GroupCall call;
        call.conversation_id = event.conversation_id;
        call.connection_state = event.connection_state;
        call.join_state = event.join_state;
        call.peek_info = std::move(peek_info);
        call.remote_participants = event.remote_participants;
        if (existing && event.join_state == GroupJoinState::NotJoined) {
            call.ring = existing->ring;
        }
        next.calls_by_conversation[event.conversation_id] = std::move(call);
        return changed(std::move(next));
    }

    Transition operator()(const PeekGroupCallFulfilled& event) const {
        const auto* record = find_call(state_, event.conversation_id);
        GroupCall call;
        if (record) {
            const auto* existing = std::get_if<GroupCall>(record);
            if (!existing) {
                return stale("Cannot apply a peek to a direct call", event.conversation_id);
            }
            call = *existing;
        } else {
            call = make_not_connected_group_call(event.conversation_id);
        }

        // A peek issued before the call connected can resolve after it did.
        if (call.connection_state != GroupConnectionState::NotConnected) {
            logging::debug("Dropping peek result for a connected call",
                           {kv("conversation_id", event.conversation_id),
                            kv("connection_state", to_string(call.connection_state))});
            return unchanged();
        }

        call.peek_info = event.peek_info;
        CallingState next = state_;
        next.calls_by_conversation[event.conversation_id] = std::move(call);
        return changed(std::move(next));
    }

    Transition operator()(const RemoteVideoChange& event) const {
        if (!find_direct_call(state_, event.conversation_id)) {
            return stale("Cannot update remote video for a non-direct call",
                         event.conversation_id);
        }
        CallingState next = state_;
        std::get<DirectCall>(next.calls_by_conversation.at(event.conversation_id))
            .has_remote_video = event.has_video;
        return changed(std::move(next));
    }

    Transition operator()(const RemoteSharingScreenChange& event) const {
        if (!find_direct_call(state_, event.conversation_id)) {
            return stale("Cannot update remote screen share for a non-direct call",
                         event.conversation_id);
        }
        CallingState next = state_;
        std::get<DirectCall>(next.calls_by_conversation.at(event.conversation_id))
            .is_sharing_screen = event.is_sharing_screen;
        return changed(std::move(next));
    }

    Transition operator()(const ViewChange& event) const {
        switch (event.action) {
            case ViewAction::TogglePip:
                return update_active(state_, "toggle PiP",
                                     [](ActiveCallState& active) { active.pip = !active.pip; });
            case ViewAction::ToggleSettings:
                return update_active(state_, "toggle settings", [](ActiveCallState& active) {
                    active.settings_dialog_open = !active.settings_dialog_open;
                });
            case ViewAction::ToggleParticipants:
                return update_active(state_, "toggle participants list",
                                     [](ActiveCallState& active) {
                                         active.show_participants_list =
                                             !active.show_participants_list;
                                     });
            case ViewAction::ToggleSpeakerView:
                return update_active(state_, "toggle speaker view", [](ActiveCallState& active) {
                    active.view_mode = active.view_mode == CallViewMode::Grid
                                           ? CallViewMode::Speaker
                                           : CallViewMode::Grid;
                });
            case ViewAction::SwitchToPresentation:
                // Speaker view is kept; presentation falls back to grid later.
                if (state_.active_call_state &&
                    state_.active_call_state->view_mode == CallViewMode::Speaker) {
                    return unchanged();
                }
                return update_active(state_, "switch to presentation view",
                                     [](ActiveCallState& active) {
                                         active.view_mode = CallViewMode::Presentation;
                                     });
            case ViewAction::SwitchFromPresentation:
                if (state_.active_call_state &&
                    state_.active_call_state->view_mode != CallViewMode::Presentation) {
                    return unchanged();
                }
                return update_active(state_, "switch from presentation view",
                                     [](ActiveCallState& active) {
                                         active.view_mode = CallViewMode::Grid;
                                     });
            case ViewAction::ToggleScreenRecordingWarning:
                return update_active(state_, "toggle the screen recording warning",
                                     [](ActiveCallState& active) {
                                         active.show_needs_screen_recording_permissions_warning =
                                             !active.show_needs_screen_recording_permissions_warning;
                                     });
            case ViewAction::ReturnToActiveCall:
                return update_active(state_, "return to active call",
                                     [](ActiveCallState& active) { active.pip = false; });
        }
        return unchanged();
    }

    Transition operator()(const SetLocalAudioFulfilled& event) const {
        return update_active(state_, "set local audio", [&event](ActiveCallState& active) {
            active.has_local_audio = event.enabled;
        });
    }

    Transition operator()(const SetLocalVideoFulfilled& event) const {
        return update_active(state_, "set local video", [&event](ActiveCallState& active) {
            active.has_local_video = event.enabled;
        });
    }

    Transition operator()(const SetPresenting& event) const {
        return update_active(state_, "toggle presenting", [&event](ActiveCallState& active) {
            active.presenting_source = event.source;
        });
    }

    Transition operator()(const SetOutgoingRing& event) const {
        return update_active(state_, "set outgoing ring", [&event](ActiveCallState& active) {
            active.outgoing_ring = event.enabled;
        });
    }

    Transition operator()(const MarkCallUntrusted& event) const {
        return update_active(state_, "mark call as untrusted", [&event](ActiveCallState& active) {
            active.pip = false;
            active.safety_number_changed_acis = event.safety_number_changed_acis;
            active.settings_dialog_open = false;
            active.show_participants_list = false;
        });
    }

    Transition operator()(const MarkCallTrusted&) const {
        return update_active(state_, "mark call as trusted", [](ActiveCallState& active) {
            active.safety_number_changed_acis.clear();
        });
    }

private:
    const CallingState& state_;
};

}

bool operator==(const Effect& lhs, const Effect& rhs) {
    return lhs.kind == rhs.kind && lhs.conversation_id == rhs.conversation_id;
}

Transition reduce(const CallingState& state, const StoreEvent& event) {
    auto transition = std::visit(Reducer(state), event);
    // Collapse transitions that rebuilt an identical state so callers can
    // keep their snapshot.
    if (transition.next && *transition.next == state) {
        transition.next.reset();
    }
    return transition;
}

const char* event_name(const StoreEvent& event) {
    return std::visit(
        [](const auto& value) -> const char* {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, StartCallingLobby>) return "start_calling_lobby";
            else if constexpr (std::is_same_v<T, StartDirectCall>) return "start_direct_call";
            else if constexpr (std::is_same_v<T, AcceptCallPending>) return "accept_call_pending";
            else if constexpr (std::is_same_v<T, EndActiveCall>) return "end_active_call";
            else if constexpr (std::is_same_v<T, CancelIncomingGroupCallRing>)
                return "cancel_incoming_group_call_ring";
            else if constexpr (std::is_same_v<T, ConversationChanged>) return "conversation_changed";
            else if constexpr (std::is_same_v<T, ConversationRemoved>) return "conversation_removed";
            else if constexpr (std::is_same_v<T, DeclineDirectCall>) return "decline_direct_call";
            else if constexpr (std::is_same_v<T, IncomingDirectCall>) return "incoming_direct_call";
            else if constexpr (std::is_same_v<T, IncomingGroupCall>) return "incoming_group_call";
            else if constexpr (std::is_same_v<T, CallStateChange>) return "call_state_change";
            else if constexpr (std::is_same_v<T, GroupCallAudioLevelsChange>)
                return "group_call_audio_levels_change";
            else if constexpr (std::is_same_v<T, GroupCallStateChange>)
                return "group_call_state_change";
            else if constexpr (std::is_same_v<T, PeekGroupCallFulfilled>)
                return "peek_group_call_fulfilled";
            else if constexpr (std::is_same_v<T, RemoteVideoChange>) return "remote_video_change";
            else if constexpr (std::is_same_v<T, RemoteSharingScreenChange>)
                return "remote_sharing_screen_change";
            else if constexpr (std::is_same_v<T, ViewChange>) return "view_change";
            else if constexpr (std::is_same_v<T, SetLocalAudioFulfilled>) return "set_local_audio";
            else if constexpr (std::is_same_v<T, SetLocalVideoFulfilled>) return "set_local_video";
            else if constexpr (std::is_same_v<T, SetPresenting>) return "set_presenting";
            else if constexpr (std::is_same_v<T, SetOutgoingRing>) return "set_outgoing_ring";
            else if constexpr (std::is_same_v<T, MarkCallUntrusted>) return "mark_call_untrusted";
            else return "mark_call_trusted";
        },
        event);
}

const char* to_string(EndReason reason) {
    switch (reason) {
        case EndReason::Cancel: return "cancel";
        case EndReason::HangUp: return "hang_up";
        case EndReason::CloseNeedPermission: return "close_need_permission";
    }
    return "unknown";
}

const char* to_string(ViewAction action) {
    switch (action) {
        case ViewAction::TogglePip: return "toggle_pip";
        case ViewAction::ToggleSettings: return "toggle_settings";
        case ViewAction::ToggleParticipants: return "toggle_participants";
        case ViewAction::ToggleSpeakerView: return "toggle_speaker_view";
        case ViewAction::SwitchToPresentation: return "switch_to_presentation";
        case ViewAction::SwitchFromPresentation: return "switch_from_presentation";
        case ViewAction::ToggleScreenRecordingWarning: return "toggle_screen_recording_warning";
        case ViewAction::ReturnToActiveCall: return "return_to_active_call";
    }
    return "unknown";
}

const char* to_string(Effect::Kind kind) {
    switch (kind) {
        case Effect::Kind::StopCallingLobby: return "stop_calling_lobby";
        case Effect::Kind::RefreshPeek: return "refresh_peek";
    }
    return "unknown";
}

}
