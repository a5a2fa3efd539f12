#include "call_core/model/json.hpp"

#include <stdexcept>
#include <string>

namespace call_core {

namespace {

template <typename T>
void put_optional(nlohmann::json& json, const char* key, const std::optional<T>& value) {
    if (value) {
        json[key] = *value;
    } else {
        json[key] = nullptr;
    }
}

template <typename T>
std::optional<T> get_optional(const nlohmann::json& json, const char* key) {
    const auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

// Device counts are unsigned; a negative value would wrap instead of failing.
std::optional<std::uint32_t> get_count(const nlohmann::json& json, const char* key) {
    const auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    const auto value = it->get<std::int64_t>();
    if (value < 0 || value > static_cast<std::int64_t>(kUnlimitedDevices)) {
        throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(value));
    }
    return static_cast<std::uint32_t>(value);
}

}

void to_json(nlohmann::json& json, const PeekInfo& info) {
    json = nlohmann::json::object();
    json["acis"] = info.acis;
    put_optional(json, "creator_aci", info.creator_aci);
    put_optional(json, "era_id", info.era_id);
    if (info.max_devices == kUnlimitedDevices) {
        json["max_devices"] = nullptr;
    } else {
        json["max_devices"] = info.max_devices;
    }
    json["device_count"] = info.device_count;
}

void from_json(const nlohmann::json& json, PeekInfo& info) {
    info.acis = json.value("acis", std::vector<Aci>{});
    info.creator_aci = get_optional<Aci>(json, "creator_aci");
    info.era_id = get_optional<std::string>(json, "era_id");
    info.max_devices = get_count(json, "max_devices").value_or(kUnlimitedDevices);
    info.device_count =
        get_count(json, "device_count").value_or(static_cast<std::uint32_t>(info.acis.size()));
}

void to_json(nlohmann::json& json, const GroupCallParticipant& participant) {
    json = nlohmann::json{{"aci", participant.aci},
                          {"demux_id", participant.demux_id},
                          {"has_remote_audio", participant.has_remote_audio},
                          {"has_remote_video", participant.has_remote_video},
                          {"presenting", participant.presenting},
                          {"sharing_screen", participant.sharing_screen},
                          {"video_aspect_ratio", participant.video_aspect_ratio}};
    put_optional(json, "speaker_time", participant.speaker_time);
}

void from_json(const nlohmann::json& json, GroupCallParticipant& participant) {
    participant.aci = json.at("aci").get<Aci>();
    participant.demux_id = json.at("demux_id").get<DemuxId>();
    participant.has_remote_audio = json.value("has_remote_audio", false);
    participant.has_remote_video = json.value("has_remote_video", false);
    participant.presenting = json.value("presenting", false);
    participant.sharing_screen = json.value("sharing_screen", false);
    participant.speaker_time = get_optional<std::int64_t>(json, "speaker_time");
    participant.video_aspect_ratio = json.value("video_aspect_ratio", 0.0);
}

void to_json(nlohmann::json& json, const RingState& ring) {
    json = nlohmann::json{{"ring_id", std::to_string(ring.ring_id)},
                          {"ringer_aci", ring.ringer_aci}};
}

void to_json(nlohmann::json& json, const PresentedSource& source) {
    json = nlohmann::json{{"id", source.id}, {"name", source.name}};
}

void from_json(const nlohmann::json& json, PresentedSource& source) {
    source.id = json.at("id").get<std::string>();
    source.name = json.value("name", "");
}

void to_json(nlohmann::json& json, const DirectCall& call) {
    json = nlohmann::json{{"call_mode", CallMode::Direct},
                          {"conversation_id", call.conversation_id},
                          {"is_incoming", call.is_incoming},
                          {"is_video_call", call.is_video_call},
                          {"has_remote_video", call.has_remote_video},
                          {"is_sharing_screen", call.is_sharing_screen}};
    put_optional(json, "call_state", call.call_state);
    put_optional(json, "call_ended_reason", call.call_ended_reason);
}

void to_json(nlohmann::json& json, const GroupCall& call) {
    json = nlohmann::json{{"call_mode", CallMode::Group},
                          {"conversation_id", call.conversation_id},
                          {"connection_state", call.connection_state},
                          {"join_state", call.join_state},
                          {"remote_participants", call.remote_participants}};
    put_optional(json, "peek_info", call.peek_info);
    put_optional(json, "ring", call.ring);
    if (call.remote_audio_levels) {
        auto levels = nlohmann::json::object();
        for (const auto& entry : *call.remote_audio_levels) {
            levels[std::to_string(entry.first)] = entry.second;
        }
        json["remote_audio_levels"] = levels;
    } else {
        json["remote_audio_levels"] = nullptr;
    }
}

void to_json(nlohmann::json& json, const CallRecord& record) {
    std::visit([&json](const auto& call) { to_json(json, call); }, record);
}

void to_json(nlohmann::json& json, const ActiveCallState& active) {
    json = nlohmann::json{{"conversation_id", active.conversation_id},
                          {"has_local_audio", active.has_local_audio},
                          {"has_local_video", active.has_local_video},
                          {"local_audio_level", active.local_audio_level},
                          {"view_mode", active.view_mode},
                          {"outgoing_ring", active.outgoing_ring},
                          {"pip", active.pip},
                          {"safety_number_changed_acis", active.safety_number_changed_acis},
                          {"settings_dialog_open", active.settings_dialog_open},
                          {"show_needs_screen_recording_permissions_warning",
                           active.show_needs_screen_recording_permissions_warning},
                          {"show_participants_list", active.show_participants_list}};
    put_optional(json, "joined_at", active.joined_at);
    put_optional(json, "presenting_source", active.presenting_source);
}

void to_json(nlohmann::json& json, const CallingState& state) {
    auto calls = nlohmann::json::object();
    for (const auto& entry : state.calls_by_conversation) {
        calls[entry.first] = entry.second;
    }
    json = nlohmann::json{{"calls_by_conversation", calls}};
    put_optional(json, "active_call_state", state.active_call_state);
}

void to_json(nlohmann::json& json, const ConversationInfo& info) {
    json = nlohmann::json{{"id", info.id},
                          {"call_mode", info.call_mode},
                          {"member_count", info.member_count},
                          {"announcements_only", info.announcements_only},
                          {"are_we_admin", info.are_we_admin}};
}

void from_json(const nlohmann::json& json, ConversationInfo& info) {
    info.id = json.at("id").get<ConversationId>();
    info.call_mode = json.value("call_mode", CallMode::None);
    info.member_count = json.value("member_count", 0);
    info.announcements_only = json.value("announcements_only", false);
    info.are_we_admin = json.value("are_we_admin", false);
}

RingId parse_ring_id(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return value.get<RingId>();
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        size_t consumed = 0;
        const auto parsed = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument("ring_id is not a decimal integer: " + text);
        }
        return static_cast<RingId>(parsed);
    }
    throw std::invalid_argument("ring_id must be a number or a decimal string");
}

}
