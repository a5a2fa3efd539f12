#pragma once

#include <nlohmann/json.hpp>

#include "call_core/conversation/directory.hpp"
#include "call_core/model/call_record.hpp"

namespace call_core {

NLOHMANN_JSON_SERIALIZE_ENUM(CallMode, {
    {CallMode::None, "none"},
    {CallMode::Direct, "direct"},
    {CallMode::Group, "group"},
    {CallMode::Adhoc, "adhoc"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(DirectCallState, {
    {DirectCallState::Prering, "prering"},
    {DirectCallState::Ringing, "ringing"},
    {DirectCallState::Accepted, "accepted"},
    {DirectCallState::Reconnecting, "reconnecting"},
    {DirectCallState::Ended, "ended"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(CallEndedReason, {
    {CallEndedReason::LocalHangup, "local_hangup"},
    {CallEndedReason::RemoteHangup, "remote_hangup"},
    {CallEndedReason::RemoteHangupNeedPermission, "remote_hangup_need_permission"},
    {CallEndedReason::Declined, "declined"},
    {CallEndedReason::Busy, "busy"},
    {CallEndedReason::Glare, "glare"},
    {CallEndedReason::ReceivedOfferExpired, "received_offer_expired"},
    {CallEndedReason::ReceivedOfferWhileActive, "received_offer_while_active"},
    {CallEndedReason::SignalingFailure, "signaling_failure"},
    {CallEndedReason::ConnectionFailure, "connection_failure"},
    {CallEndedReason::InternalFailure, "internal_failure"},
    {CallEndedReason::Timeout, "timeout"},
    {CallEndedReason::AcceptedOnAnotherDevice, "accepted_on_another_device"},
    {CallEndedReason::DeclinedOnAnotherDevice, "declined_on_another_device"},
    {CallEndedReason::BusyOnAnotherDevice, "busy_on_another_device"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(GroupConnectionState, {
    {GroupConnectionState::NotConnected, "not_connected"},
    {GroupConnectionState::Connecting, "connecting"},
    {GroupConnectionState::Connected, "connected"},
    {GroupConnectionState::Reconnecting, "reconnecting"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(GroupJoinState, {
    {GroupJoinState::NotJoined, "not_joined"},
    {GroupJoinState::Joining, "joining"},
    {GroupJoinState::Joined, "joined"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(CallViewMode, {
    {CallViewMode::Grid, "grid"},
    {CallViewMode::Speaker, "speaker"},
    {CallViewMode::Presentation, "presentation"},
})

void to_json(nlohmann::json& json, const PeekInfo& info);
void from_json(const nlohmann::json& json, PeekInfo& info);

void to_json(nlohmann::json& json, const GroupCallParticipant& participant);
void from_json(const nlohmann::json& json, GroupCallParticipant& participant);

void to_json(nlohmann::json& json, const RingState& ring);

void to_json(nlohmann::json& json, const PresentedSource& source);
void from_json(const nlohmann::json& json, PresentedSource& source);

void to_json(nlohmann::json& json, const DirectCall& call);
void to_json(nlohmann::json& json, const GroupCall& call);
void to_json(nlohmann::json& json, const CallRecord& record);
void to_json(nlohmann::json& json, const ActiveCallState& active);
void to_json(nlohmann::json& json, const CallingState& state);

void to_json(nlohmann::json& json, const ConversationInfo& info);
void from_json(const nlohmann::json& json, ConversationInfo& info);

// Ring ids are 64-bit and arrive either as numbers or as decimal strings.
RingId parse_ring_id(const nlohmann::json& value);

}
