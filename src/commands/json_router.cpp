#include "call_core/commands/json_router.hpp"

#include <functional>
#include <map>

#include "call_core/logging.hpp"
#include "call_core/model/json.hpp"

namespace call_core {

namespace {

using json = nlohmann::json;

ConversationId conversation_id_from(const json& body) {
    return body.at("conversation_id").get<ConversationId>();
}

template <typename T>
std::optional<T> optional_field(const json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

CallStateChange parse_call_state_change(const json& body) {
    CallStateChange event;
    event.conversation_id = conversation_id_from(body);
    event.call_state = body.at("call_state").get<DirectCallState>();
    event.call_ended_reason = optional_field<CallEndedReason>(body, "call_ended_reason");
    event.accepted_time = optional_field<std::int64_t>(body, "accepted_time");
    return event;
}

GroupCallStateChange parse_group_call_state_change(const json& body) {
    GroupCallStateChange event;
    event.conversation_id = conversation_id_from(body);
    event.connection_state = body.at("connection_state").get<GroupConnectionState>();
    event.join_state = body.at("join_state").get<GroupJoinState>();
    event.has_local_audio = body.value("has_local_audio", false);
    event.has_local_video = body.value("has_local_video", false);
    event.peek_info = optional_field<PeekInfo>(body, "peek_info");
    event.remote_participants =
        body.value("remote_participants", std::vector<GroupCallParticipant>{});
    event.our_aci = body.value("our_aci", std::string{});
    return event;
}

GroupCallAudioLevelsChange parse_audio_levels(const json& body) {
    GroupCallAudioLevelsChange event;
    event.conversation_id = conversation_id_from(body);
    event.local_audio_level = body.value("local_audio_level", 0.0);
    for (const auto& device : body.value("remote_device_states", json::array())) {
        RemoteDeviceAudioLevel level;
        level.demux_id = device.at("demux_id").get<DemuxId>();
        const auto audio = device.find("audio_level");
        if (audio != device.end() && audio->is_number()) {
            level.audio_level = audio->get<double>();
        }
        event.remote_device_states.push_back(level);
    }
    return event;
}

std::vector<VideoRequest> parse_video_requests(const json& body) {
    std::vector<VideoRequest> requests;
    for (const auto& item : body.value("resolutions", json::array())) {
        VideoRequest request;
        request.demux_id = item.at("demux_id").get<DemuxId>();
        request.width = item.value("width", 0);
        request.height = item.value("height", 0);
        requests.push_back(request);
    }
    return requests;
}

using EventHandler = std::function<void(CallingCommands&, const json&)>;
using CommandHandler = std::function<bool(CallingCommands&, const json&)>;

const std::map<std::string, EventHandler>& event_handlers() {
    static const std::map<std::string, EventHandler> handlers = {
        {"incoming_direct_call",
         [](CallingCommands& commands, const json& body) {
             commands.receive_incoming_direct_call(
                 IncomingDirectCall{conversation_id_from(body), body.value("is_video_call", false)});
         }},
        {"incoming_group_call",
         [](CallingCommands& commands, const json& body) {
             commands.receive_incoming_group_call(
                 IncomingGroupCall{conversation_id_from(body), parse_ring_id(body.at("ring_id")),
                                   body.at("ringer_aci").get<Aci>()});
         }},
        {"cancel_incoming_group_call_ring",
         [](CallingCommands& commands, const json& body) {
             commands.cancel_incoming_group_call_ring(CancelIncomingGroupCallRing{
                 conversation_id_from(body), parse_ring_id(body.at("ring_id"))});
         }},
        {"call_state_change",
         [](CallingCommands& commands, const json& body) {
             commands.call_state_change(parse_call_state_change(body));
         }},
        {"group_call_state_change",
         [](CallingCommands& commands, const json& body) {
             commands.group_call_state_change(parse_group_call_state_change(body));
         }},
        {"group_call_audio_levels_change",
         [](CallingCommands& commands, const json& body) {
             commands.group_call_audio_levels_change(parse_audio_levels(body));
         }},
        {"peek_group_call_fulfilled",
         [](CallingCommands& commands, const json& body) {
             commands.peek_group_call_fulfilled(PeekGroupCallFulfilled{
                 conversation_id_from(body), body.at("peek_info").get<PeekInfo>()});
         }},
        {"group_call_membership_changed",
         [](CallingCommands& commands, const json& body) {
             commands.peek_not_connected_group_call(conversation_id_from(body));
         }},
        {"remote_video_change",
         [](CallingCommands& commands, const json& body) {
             commands.remote_video_change(
                 RemoteVideoChange{conversation_id_from(body), body.at("has_video").get<bool>()});
         }},
        {"remote_sharing_screen_change",
         [](CallingCommands& commands, const json& body) {
             commands.remote_sharing_screen_change(RemoteSharingScreenChange{
                 conversation_id_from(body), body.at("is_sharing_screen").get<bool>()});
         }},
        {"safety_number_changed",
         [](CallingCommands& commands, const json& body) {
             commands.key_changed(body.at("aci").get<Aci>());
         }},
        {"safety_number_confirmed",
         [](CallingCommands& commands, const json& body) {
             commands.key_change_ok(conversation_id_from(body));
         }},
        {"conversation_changed",
         [](CallingCommands& commands, const json& body) {
             commands.conversation_changed(body.at("conversation").get<ConversationInfo>());
         }},
        {"conversation_removed",
         [](CallingCommands& commands, const json& body) {
             commands.conversation_removed(conversation_id_from(body));
         }},
        {"network_status",
         [](CallingCommands& commands, const json& body) {
             commands.network_status_change(body.at("online").get<bool>());
         }},
    };
    return handlers;
}

CommandHandler view_command(ViewAction action) {
    return [action](CallingCommands& commands, const json&) { return commands.change_view(action); };
}

const std::map<std::string, CommandHandler>& command_handlers() {
    static const std::map<std::string, CommandHandler> handlers = {
        {"accept_call",
         [](CallingCommands& commands, const json& body) {
             return commands.accept_call(conversation_id_from(body),
                                         body.value("as_video_call", false));
         }},
        {"decline_call",
         [](CallingCommands& commands, const json& body) {
             return commands.decline_call(conversation_id_from(body));
         }},
        {"hang_up",
         [](CallingCommands& commands, const json& body) {
             return commands.hang_up_active_call(body.value("reason", std::string("user")));
         }},
        {"cancel_call",
         [](CallingCommands& commands, const json& body) {
             return commands.cancel_call(conversation_id_from(body));
         }},
        {"close_need_permission_screen",
         [](CallingCommands& commands, const json&) {
             return commands.close_need_permission_screen();
         }},
        {"start_calling_lobby",
         [](CallingCommands& commands, const json& body) {
             return commands.start_calling_lobby(conversation_id_from(body),
                                                 body.value("is_video_call", false));
         }},
        {"start_call",
         [](CallingCommands& commands, const json& body) {
             return commands.start_call(conversation_id_from(body),
                                        body.at("call_mode").get<CallMode>(),
                                        body.value("has_local_audio", true),
                                        body.value("has_local_video", false));
         }},
        {"set_local_audio",
         [](CallingCommands& commands, const json& body) {
             return commands.set_local_audio(body.at("enabled").get<bool>());
         }},
        {"set_local_video",
         [](CallingCommands& commands, const json& body) {
             return commands.set_local_video(body.at("enabled").get<bool>());
         }},
        {"set_presenting",
         [](CallingCommands& commands, const json& body) {
             return commands.set_presenting(optional_field<PresentedSource>(body, "source"));
         }},
        {"set_outgoing_ring",
         [](CallingCommands& commands, const json& body) {
             return commands.set_outgoing_ring(body.at("enabled").get<bool>());
         }},
        {"set_group_call_video_request",
         [](CallingCommands& commands, const json& body) {
             return commands.set_group_call_video_request(conversation_id_from(body),
                                                          parse_video_requests(body),
                                                          body.value("speaker_height", 0));
         }},
        {"peek",
         [](CallingCommands& commands, const json& body) {
             return commands.peek_not_connected_group_call(conversation_id_from(body));
         }},
        {"peek_for_the_first_time",
         [](CallingCommands& commands, const json& body) {
             return commands.peek_group_call_for_the_first_time(conversation_id_from(body));
         }},
        {"peek_if_it_has_members",
         [](CallingCommands& commands, const json& body) {
             return commands.peek_group_call_if_it_has_members(conversation_id_from(body));
         }},
        {"toggle_pip", view_command(ViewAction::TogglePip)},
        {"toggle_settings", view_command(ViewAction::ToggleSettings)},
        {"toggle_participants", view_command(ViewAction::ToggleParticipants)},
        {"toggle_speaker_view", view_command(ViewAction::ToggleSpeakerView)},
        {"switch_to_presentation_view", view_command(ViewAction::SwitchToPresentation)},
        {"switch_from_presentation_view", view_command(ViewAction::SwitchFromPresentation)},
        {"toggle_screen_recording_permissions_dialog",
         view_command(ViewAction::ToggleScreenRecordingWarning)},
        {"return_to_active_call", view_command(ViewAction::ReturnToActiveCall)},
    };
    return handlers;
}

}

void route_event(CallingCommands& commands, const nlohmann::json& event) {
    if (!event.is_object()) {
        throw UnknownMessageError("event must be a JSON object");
    }
    const auto type = event.value("type", std::string{});
    const auto& handlers = event_handlers();
    const auto it = handlers.find(type);
    if (it == handlers.end()) {
        throw UnknownMessageError("unknown event type: " + type);
    }
    logging::debug("Routing event", {kv("type", type)});
    it->second(commands, event);
}

bool route_command(CallingCommands& commands, const std::string& name, const nlohmann::json& body) {
    const auto& handlers = command_handlers();
    const auto it = handlers.find(name);
    if (it == handlers.end()) {
        throw UnknownMessageError("unknown command: " + name);
    }
    const auto payload = body.is_null() ? nlohmann::json::object() : body;
    if (!payload.is_object()) {
        throw UnknownMessageError("command body must be a JSON object");
    }
    logging::debug("Routing command", {kv("command", name)});
    return it->second(commands, payload);
}

}
