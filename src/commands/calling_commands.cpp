#include "call_core/commands/calling_commands.hpp"

#include <algorithm>
#include <utility>

#include "call_core/logging.hpp"

namespace call_core {

CallingCommands::CallingCommands(CallStore& store,
                                 CallingService& service,
                                 peek::PeekCoordinator& peeks,
                                 InMemoryConversationDirectory& directory,
                                 peek::ConnectivityMonitor& connectivity,
                                 CommandOptions options)
    : store_(store),
      service_(service),
      peeks_(peeks),
      directory_(directory),
      connectivity_(connectivity),
      options_(std::move(options)) {}

bool CallingCommands::accept_call(const ConversationId& conversation_id, bool as_video_call) {
    const auto call = store_.find_call(conversation_id);
    if (!call) {
        logging::error("Trying to accept a non-existent call",
                       {kv("conversation_id", conversation_id)});
        return false;
    }
    if (std::holds_alternative<DirectCall>(*call)) {
        service_.accept_direct_call(conversation_id, as_video_call);
    } else {
        service_.join_group_call(conversation_id, true, as_video_call, false);
    }
    apply(AcceptCallPending{conversation_id, as_video_call});
    return true;
}

bool CallingCommands::decline_call(const ConversationId& conversation_id) {
    const auto call = store_.find_call(conversation_id);
    if (!call) {
        logging::error("Trying to decline a non-existent call",
                       {kv("conversation_id", conversation_id)});
        return false;
    }
    if (std::holds_alternative<DirectCall>(*call)) {
        service_.decline_direct_call(conversation_id);
        apply(DeclineDirectCall{conversation_id});
        return true;
    }
    const auto& group = std::get<GroupCall>(*call);
    if (!group.ring) {
        logging::error("Trying to decline a group call without a ring",
                       {kv("conversation_id", conversation_id)});
        return false;
    }
    service_.decline_group_call(conversation_id, group.ring->ring_id);
    apply(CancelIncomingGroupCallRing{conversation_id, group.ring->ring_id});
    return true;
}

bool CallingCommands::hang_up_active_call(const std::string& reason) {
    const auto state = store_.snapshot();
    const auto* active = get_active_call(*state);
    if (!active) {
        logging::warn("No active call to hang up");
        return false;
    }
    const auto conversation_id = conversation_id_of(*active);
    logging::info("Hanging up", {kv("conversation_id", conversation_id), kv("reason", reason)});
    service_.hangup(conversation_id, reason);
    apply(EndActiveCall{EndReason::HangUp});
    return true;
}

bool CallingCommands::cancel_call(const ConversationId& conversation_id) {
    service_.stop_calling_lobby(conversation_id);
    const auto active = store_.active_call_state();
    if (!active) {
        logging::warn("No active call to cancel", {kv("conversation_id", conversation_id)});
        return false;
    }
    apply(EndActiveCall{EndReason::Cancel});
    return true;
}

bool CallingCommands::close_need_permission_screen() {
    if (!store_.active_call_state()) {
        logging::warn("No needs-permission screen to close");
        return false;
    }
    apply(EndActiveCall{EndReason::CloseNeedPermission});
    return true;
}

bool CallingCommands::start_calling_lobby(const ConversationId& conversation_id,
                                          bool is_video_call) {
    const auto conversation = directory_.find(conversation_id);
    if (!conversation) {
        throw CommandError("can't start lobby without a conversation: " + conversation_id);
    }
    const auto state = store_.snapshot();
    if (state->active_call_state) {
        throw CommandError("can't start lobby if a call is active");
    }
    if (conversation->call_mode != CallMode::Direct && conversation->call_mode != CallMode::Group) {
        logging::warn("Conversation does not support calls",
                      {kv("conversation_id", conversation_id),
                       kv("call_mode", to_string(conversation->call_mode))});
        return false;
    }

    const auto* group = find_group_call(*state, conversation_id);

    // Announcement-only groups can only be joined once an admin started the call.
    if (conversation->announcements_only && !conversation->are_we_admin) {
        const bool is_ongoing = group && group->peek_info &&
                                is_anybody_else_in_group_call(*group->peek_info, options_.our_aci);
        if (!is_ongoing) {
            logging::info("Cannot start a call in an announcements-only group",
                          {kv("conversation_id", conversation_id)});
            return false;
        }
    }

    // Devices already in the call; a direct call counts as empty.
    std::uint32_t device_count = 0;
    if (group) {
        if (group->peek_info && group->peek_info->device_count > 0) {
            device_count = group->peek_info->device_count;
        } else {
            device_count = static_cast<std::uint32_t>(group->remote_participants.size());
        }
    }

    LobbyRequest request;
    request.conversation_id = conversation_id;
    request.call_mode = conversation->call_mode;
    request.has_local_audio =
        device_count < static_cast<std::uint32_t>(options_.lobby_audio_device_limit);
    request.has_local_video = is_video_call;
    const auto lobby = service_.start_calling_lobby(request);
    if (!lobby) {
        logging::info("Calling service did not open a lobby",
                      {kv("conversation_id", conversation_id)});
        return false;
    }

    StartCallingLobby event;
    event.conversation_id = conversation_id;
    event.call_mode = conversation->call_mode;
    event.has_local_audio = lobby->has_local_audio;
    event.has_local_video = lobby->has_local_video;
    event.connection_state = lobby->connection_state;
    event.join_state = lobby->join_state;
    event.peek_info = lobby->peek_info;
    event.remote_participants = lobby->remote_participants;
    event.is_conversation_too_big_to_ring =
        is_too_big_to_ring(*conversation, options_.max_group_call_ring_size);
    event.outbound_ring_enabled = options_.group_call_outbound_ring;
    apply(event);
    return true;
}

bool CallingCommands::start_call(const ConversationId& conversation_id,
                                 CallMode call_mode,
                                 bool has_local_audio,
                                 bool has_local_video) {
    switch (call_mode) {
        case CallMode::Direct:
            service_.start_outgoing_direct_call(conversation_id, has_local_audio, has_local_video);
            apply(StartDirectCall{conversation_id, has_local_audio, has_local_video});
            return true;
        case CallMode::Group: {
            bool outgoing_ring = false;
            const auto active = store_.active_call_state();
            if (options_.group_call_outbound_ring && active && active->outgoing_ring) {
                const auto conversation = directory_.find(active->conversation_id);
                outgoing_ring = conversation &&
                                !is_too_big_to_ring(*conversation,
                                                    options_.max_group_call_ring_size);
            }
            // Group state flows back through group_call_state_change.
            service_.join_group_call(conversation_id, has_local_audio, has_local_video,
                                     outgoing_ring);
            return true;
        }
        case CallMode::None:
        case CallMode::Adhoc:
            break;
    }
    logging::warn("Unsupported call mode", {kv("conversation_id", conversation_id),
                                            kv("call_mode", to_string(call_mode))});
    return false;
}

bool CallingCommands::set_local_audio(bool enabled) {
    const auto active = store_.active_call_state();
    if (!active) {
        logging::warn("Trying to set local audio when no call is active");
        return false;
    }
    service_.set_outgoing_audio(active->conversation_id, enabled);
    apply(SetLocalAudioFulfilled{enabled});
    return true;
}

bool CallingCommands::set_local_video(bool enabled) {
    const auto state = store_.snapshot();
    const auto* active = get_active_call(*state);
    if (!active) {
        logging::warn("Trying to set local video when no call is active");
        return false;
    }
    const auto* direct = std::get_if<DirectCall>(active);
    // A direct call still in the lobby has no outgoing stream yet.
    if (!direct || direct->call_state) {
        service_.set_outgoing_video(conversation_id_of(*active), enabled);
    }
    apply(SetLocalVideoFulfilled{enabled});
    return true;
}

bool CallingCommands::set_presenting(const std::optional<PresentedSource>& source) {
    const auto active = store_.active_call_state();
    if (!active) {
        logging::warn("Trying to present when no call is active");
        return false;
    }
    service_.set_presenting(active->conversation_id, active->has_local_video, source);
    apply(SetPresenting{source});
    return true;
}

bool CallingCommands::set_outgoing_ring(bool enabled) {
    if (!store_.active_call_state()) {
        logging::warn("Cannot set outgoing ring when there is no active call");
        return false;
    }
    apply(SetOutgoingRing{enabled});
    return true;
}

bool CallingCommands::set_group_call_video_request(const ConversationId& conversation_id,
                                                   const std::vector<VideoRequest>& requests,
                                                   int speaker_height) {
    if (!store_.find_call(conversation_id)) {
        logging::warn("Video request for a missing call", {kv("conversation_id", conversation_id)});
        return false;
    }
    service_.set_group_call_video_request(conversation_id, requests, speaker_height);
    return true;
}

bool CallingCommands::change_view(ViewAction action) {
    if (!store_.active_call_state()) {
        logging::warn("View change with no active call", {kv("action", to_string(action))});
        return false;
    }
    apply(ViewChange{action});
    return true;
}

bool CallingCommands::key_changed(const Aci& aci) {
    const auto state = store_.snapshot();
    const auto* active = get_active_call(*state);
    if (!active || !state->active_call_state) {
        return false;
    }
    const auto* group = std::get_if<GroupCall>(active);
    if (!group) {
        return false;
    }

    auto changed = state->active_call_state->safety_number_changed_acis;
    for (const auto& participant : group->remote_participants) {
        if (participant.aci == aci &&
            std::find(changed.begin(), changed.end(), aci) == changed.end()) {
            changed.push_back(aci);
        }
    }
    if (changed.empty()) {
        return false;
    }
    logging::info("Safety number changed in active call",
                  {kv("conversation_id", group->conversation_id), kv("aci", aci)});
    apply(MarkCallUntrusted{std::move(changed)});
    return true;
}

bool CallingCommands::key_change_ok(const ConversationId& conversation_id) {
    service_.resend_group_call_media_keys(conversation_id);
    if (!store_.active_call_state()) {
        logging::warn("Cannot mark call as trusted when there is no active call",
                      {kv("conversation_id", conversation_id)});
        return false;
    }
    apply(MarkCallTrusted{});
    return true;
}

void CallingCommands::receive_incoming_direct_call(const IncomingDirectCall& event) {
    logging::info("Incoming direct call", {kv("conversation_id", event.conversation_id),
                                           kv("video", event.is_video_call)});
    apply(event);
}

void CallingCommands::receive_incoming_group_call(const IncomingGroupCall& event) {
    logging::info("Incoming group call ring", {kv("conversation_id", event.conversation_id),
                                               kv("ring_id", event.ring_id),
                                               kv("ringer_aci", event.ringer_aci)});
    apply(event);
}

void CallingCommands::cancel_incoming_group_call_ring(const CancelIncomingGroupCallRing& event) {
    apply(event);
}

void CallingCommands::call_state_change(const CallStateChange& event) {
    logging::info("Direct call state changed",
                  {kv("conversation_id", event.conversation_id),
                   kv("call_state", to_string(event.call_state)),
                   kv("accepted_time", event.accepted_time)});
    apply(event);
}

void CallingCommands::group_call_state_change(GroupCallStateChange event) {
    if (event.our_aci.empty()) {
        event.our_aci = options_.our_aci;
    }
    logging::debug("Group call state changed",
                   {kv("conversation_id", event.conversation_id),
                    kv("connection_state", to_string(event.connection_state)),
                    kv("join_state", to_string(event.join_state))});
    apply(event);
}

void CallingCommands::group_call_audio_levels_change(const GroupCallAudioLevelsChange& event) {
    apply(event);
}

void CallingCommands::peek_group_call_fulfilled(const PeekGroupCallFulfilled& event) {
    apply(event);
}

void CallingCommands::remote_video_change(const RemoteVideoChange& event) {
    apply(event);
}

void CallingCommands::remote_sharing_screen_change(const RemoteSharingScreenChange& event) {
    apply(event);
}

void CallingCommands::conversation_changed(const ConversationInfo& info) {
    directory_.upsert(info);
    apply(ConversationChanged{info.id,
                              is_too_big_to_ring(info, options_.max_group_call_ring_size)});
}

void CallingCommands::conversation_removed(const ConversationId& conversation_id) {
    directory_.remove(conversation_id);
    apply(ConversationRemoved{conversation_id});
}

void CallingCommands::network_status_change(bool online) {
    connectivity_.set_online(online);
}

bool CallingCommands::peek_not_connected_group_call(const ConversationId& conversation_id) {
    return peeks_.request(conversation_id);
}

bool CallingCommands::peek_group_call_for_the_first_time(const ConversationId& conversation_id) {
    return peeks_.peek_for_the_first_time(conversation_id);
}

bool CallingCommands::peek_group_call_if_it_has_members(const ConversationId& conversation_id) {
    return peeks_.peek_if_it_has_members(conversation_id);
}

void CallingCommands::apply(const StoreEvent& event) {
    for (const auto& effect : store_.dispatch(event)) {
        run_effect(effect);
    }
}

void CallingCommands::run_effect(const Effect& effect) {
    logging::debug("Running store effect", {kv("effect", to_string(effect.kind)),
                                            kv("conversation_id", effect.conversation_id)});
    switch (effect.kind) {
        case Effect::Kind::StopCallingLobby:
            try {
                service_.stop_calling_lobby(effect.conversation_id);
            } catch (const CallingServiceError& ex) {
                logging::warn("Failed to stop calling lobby",
                              {kv("conversation_id", effect.conversation_id),
                               kv("error", ex.what())});
            }
            break;
        case Effect::Kind::RefreshPeek:
            peeks_.schedule_refresh(effect.conversation_id, options_.hangup_peek_delay);
            break;
    }
}

}
