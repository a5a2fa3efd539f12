#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "call_core/model/call_record.hpp"
#include "call_core/store/transitions.hpp"

namespace call_core {

// Owns the calling state. Events are applied one at a time in arrival order
// and readers get an immutable snapshot that stays valid after later events.
class CallStore {
public:
    CallStore();
    explicit CallStore(CallingState initial);

    // Applies the event and returns the effects it produced.
    std::vector<Effect> dispatch(const StoreEvent& event);

    std::shared_ptr<const CallingState> snapshot() const;
    std::optional<CallRecord> find_call(const ConversationId& conversation_id) const;
    std::optional<ActiveCallState> active_call_state() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const CallingState> state_;
};

}
