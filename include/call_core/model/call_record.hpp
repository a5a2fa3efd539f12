#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace call_core {

using ConversationId = std::string;
using Aci = std::string;
using RingId = std::int64_t;
using DemuxId = std::uint32_t;

enum class CallMode {
    None,
    Direct,
    Group,
    Adhoc
};

enum class DirectCallState {
    Prering,
    Ringing,
    Accepted,
    Reconnecting,
    Ended
};

enum class CallEndedReason {
    LocalHangup,
    RemoteHangup,
    RemoteHangupNeedPermission,
    Declined,
    Busy,
    Glare,
    ReceivedOfferExpired,
    ReceivedOfferWhileActive,
    SignalingFailure,
    ConnectionFailure,
    InternalFailure,
    Timeout,
    AcceptedOnAnotherDevice,
    DeclinedOnAnotherDevice,
    BusyOnAnotherDevice
};

enum class GroupConnectionState {
    NotConnected,
    Connecting,
    Connected,
    Reconnecting
};

enum class GroupJoinState {
    NotJoined,
    Joining,
    Joined
};

enum class CallViewMode {
    Grid,
    Speaker,
    Presentation
};

constexpr std::uint32_t kUnlimitedDevices = std::numeric_limits<std::uint32_t>::max();

// Membership snapshot returned by a peek. Replaced wholesale, never merged.
struct PeekInfo {
    std::vector<Aci> acis;
    std::optional<Aci> creator_aci;
    std::optional<std::string> era_id;
    std::uint32_t max_devices = kUnlimitedDevices;
    std::uint32_t device_count = 0;
};

struct GroupCallParticipant {
    Aci aci;
    DemuxId demux_id = 0;
    bool has_remote_audio = false;
    bool has_remote_video = false;
    bool presenting = false;
    bool sharing_screen = false;
    std::optional<std::int64_t> speaker_time;
    double video_aspect_ratio = 0.0;
};

struct RingState {
    RingId ring_id = 0;
    Aci ringer_aci;
};

struct DirectCall {
    ConversationId conversation_id;
    std::optional<DirectCallState> call_state;
    std::optional<CallEndedReason> call_ended_reason;
    bool is_incoming = false;
    bool is_video_call = false;
    bool has_remote_video = false;
    bool is_sharing_screen = false;
};

struct GroupCall {
    ConversationId conversation_id;
    GroupConnectionState connection_state = GroupConnectionState::NotConnected;
    GroupJoinState join_state = GroupJoinState::NotJoined;
    std::optional<PeekInfo> peek_info;
    std::vector<GroupCallParticipant> remote_participants;
    std::optional<std::map<DemuxId, double>> remote_audio_levels;
    std::optional<RingState> ring;
};

using CallRecord = std::variant<DirectCall, GroupCall>;

struct PresentedSource {
    std::string id;
    std::string name;
};

struct ActiveCallState {
    ConversationId conversation_id;
    bool has_local_audio = false;
    bool has_local_video = false;
    double local_audio_level = 0.0;
    CallViewMode view_mode = CallViewMode::Grid;
    std::optional<std::int64_t> joined_at;
    bool outgoing_ring = false;
    bool pip = false;
    std::optional<PresentedSource> presenting_source;
    std::vector<Aci> safety_number_changed_acis;
    bool settings_dialog_open = false;
    bool show_needs_screen_recording_permissions_warning = false;
    bool show_participants_list = false;
};

struct CallingState {
    std::map<ConversationId, CallRecord> calls_by_conversation;
    std::optional<ActiveCallState> active_call_state;
};

bool operator==(const PeekInfo& lhs, const PeekInfo& rhs);
bool operator!=(const PeekInfo& lhs, const PeekInfo& rhs);
bool operator==(const GroupCallParticipant& lhs, const GroupCallParticipant& rhs);
bool operator==(const RingState& lhs, const RingState& rhs);
bool operator==(const DirectCall& lhs, const DirectCall& rhs);
bool operator==(const GroupCall& lhs, const GroupCall& rhs);
bool operator==(const PresentedSource& lhs, const PresentedSource& rhs);
bool operator==(const ActiveCallState& lhs, const ActiveCallState& rhs);
bool operator==(const CallingState& lhs, const CallingState& rhs);
bool operator!=(const CallingState& lhs, const CallingState& rhs);

CallMode call_mode_of(const CallRecord& record);
const ConversationId& conversation_id_of(const CallRecord& record);

const CallRecord* find_call(const CallingState& state, const ConversationId& id);
const GroupCall* find_group_call(const CallingState& state, const ConversationId& id);
const DirectCall* find_direct_call(const CallingState& state, const ConversationId& id);

// Record the active call state points at. An active call state without a
// record is an invariant violation: asserts in debug, nullptr in release.
const CallRecord* get_active_call(const CallingState& state);

bool is_anybody_else_in_group_call(const PeekInfo& peek_info, const Aci& our_aci);

// Stand-in snapshot built from a roster when no peek has resolved yet.
PeekInfo synthesize_peek_info(const std::vector<GroupCallParticipant>& participants);

GroupCall make_not_connected_group_call(const ConversationId& id);

const char* to_string(CallMode mode);
const char* to_string(DirectCallState state);
const char* to_string(CallEndedReason reason);
const char* to_string(GroupConnectionState state);
const char* to_string(GroupJoinState state);
const char* to_string(CallViewMode mode);

}
