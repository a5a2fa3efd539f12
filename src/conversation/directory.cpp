#include "call_core/conversation/directory.hpp"

namespace call_core {

bool is_too_big_to_ring(const ConversationInfo& info, int max_ring_size) {
    return info.member_count > max_ring_size;
}

std::optional<ConversationInfo> InMemoryConversationDirectory::find(
    const ConversationId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = conversations_.find(id);
    if (it == conversations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryConversationDirectory::upsert(ConversationInfo info) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = info.id;
    conversations_[id] = std::move(info);
}

bool InMemoryConversationDirectory::remove(const ConversationId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversations_.erase(id) > 0;
}

size_t InMemoryConversationDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversations_.size();
}

}
