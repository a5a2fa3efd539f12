#pragma once

#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "call_core/service/calling_service.hpp"
#include "call_core/utils/async.hpp"

namespace call_core::testing {

// Collects submitted tasks and runs them only when asked.
class ManualExecutor {
public:
    utils::Executor executor() {
        return [this](utils::Task task) { tasks_.push_back(std::move(task)); };
    }

    size_t pending() const { return tasks_.size(); }

    // Runs tasks, including ones submitted while running, until none remain.
    size_t run_all() {
        size_t ran = 0;
        while (!tasks_.empty()) {
            auto task = std::move(tasks_.front());
            tasks_.pop_front();
            task();
            ++ran;
        }
        return ran;
    }

private:
    std::deque<utils::Task> tasks_;
};

class FakeCallingService : public CallingService {
public:
    std::vector<std::string> calls;
    std::function<std::optional<PeekInfo>(const ConversationId&)> on_peek;
    std::optional<LobbyData> lobby;
    std::optional<LobbyRequest> last_lobby_request;
    std::optional<bool> last_should_ring;
    std::optional<GroupJoinState> last_history_join_state;
    bool fail_next = false;
    int peeks = 0;

    std::optional<PeekInfo> peek_group_call(const ConversationId& conversation_id) override {
        record("peek:" + conversation_id);
        ++peeks;
        if (on_peek) {
            return on_peek(conversation_id);
        }
        return PeekInfo{};
    }

    void join_group_call(const ConversationId& conversation_id, bool, bool,
                         bool should_ring) override {
        record("join:" + conversation_id);
        last_should_ring = should_ring;
    }

    void accept_direct_call(const ConversationId& conversation_id, bool) override {
        record("accept:" + conversation_id);
    }

    void decline_direct_call(const ConversationId& conversation_id) override {
        record("decline:" + conversation_id);
    }

    void decline_group_call(const ConversationId& conversation_id, RingId ring_id) override {
        record("decline_group:" + conversation_id + ":" + std::to_string(ring_id));
    }

    void hangup(const ConversationId& conversation_id, const std::string&) override {
        record("hangup:" + conversation_id);
    }

    void start_outgoing_direct_call(const ConversationId& conversation_id, bool, bool) override {
        record("outgoing:" + conversation_id);
    }

    void set_outgoing_audio(const ConversationId& conversation_id, bool) override {
        record("audio:" + conversation_id);
    }

    void set_outgoing_video(const ConversationId& conversation_id, bool) override {
        record("video:" + conversation_id);
    }

    void set_presenting(const ConversationId& conversation_id, bool,
                        const std::optional<PresentedSource>&) override {
        record("presenting:" + conversation_id);
    }

    void set_group_call_video_request(const ConversationId& conversation_id,
                                      const std::vector<VideoRequest>&, int) override {
        record("video_request:" + conversation_id);
    }

    void update_call_history_for_group_call(const ConversationId& conversation_id,
                                            std::optional<GroupJoinState> join_state,
                                            const PeekInfo&) override {
        record("history:" + conversation_id);
        last_history_join_state = join_state;
    }

    std::optional<LobbyData> start_calling_lobby(const LobbyRequest& request) override {
        record("lobby:" + request.conversation_id);
        last_lobby_request = request;
        return lobby;
    }

    void stop_calling_lobby(const ConversationId& conversation_id) override {
        record("stop_lobby:" + conversation_id);
    }

    void resend_group_call_media_keys(const ConversationId& conversation_id) override {
        record("resend_keys:" + conversation_id);
    }

    size_t count(const std::string& prefix) const {
        size_t total = 0;
        for (const auto& call : calls) {
            if (call.rfind(prefix, 0) == 0) {
                ++total;
            }
        }
        return total;
    }

private:
    void record(const std::string& call) {
        calls.push_back(call);
        if (fail_next) {
            fail_next = false;
            throw CallingServiceError("injected failure: " + call);
        }
    }
};

inline utils::Sleeper no_sleep() {
    return [](std::chrono::milliseconds) {};
}

inline PeekInfo make_peek(std::vector<Aci> acis) {
    PeekInfo info;
    info.device_count = static_cast<std::uint32_t>(acis.size());
    info.acis = std::move(acis);
    return info;
}

inline GroupCallParticipant make_participant(const Aci& aci, DemuxId demux_id) {
    GroupCallParticipant participant;
    participant.aci = aci;
    participant.demux_id = demux_id;
    return participant;
}

}
