#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "call_core/model/call_record.hpp"

namespace call_core {

struct ConversationInfo {
    ConversationId id;
    CallMode call_mode = CallMode::None;
    int member_count = 0;
    bool announcements_only = false;
    bool are_we_admin = false;
};

bool is_too_big_to_ring(const ConversationInfo& info, int max_ring_size);

// Read side of the conversation list the calling core consults before it
// peeks or starts a lobby.
class ConversationDirectory {
public:
    virtual ~ConversationDirectory() = default;

    virtual std::optional<ConversationInfo> find(const ConversationId& id) const = 0;
};

class InMemoryConversationDirectory : public ConversationDirectory {
public:
    std::optional<ConversationInfo> find(const ConversationId& id) const override;

    void upsert(ConversationInfo info);
    bool remove(const ConversationId& id);
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ConversationId, ConversationInfo> conversations_;
};

}
