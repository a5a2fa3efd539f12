#include "call_core/store/call_store.hpp"

#include "call_core/logging.hpp"
#include "call_core/metrics.hpp"

namespace call_core {

CallStore::CallStore() : state_(std::make_shared<const CallingState>()) {}

CallStore::CallStore(CallingState initial)
    : state_(std::make_shared<const CallingState>(std::move(initial))) {}

std::vector<Effect> CallStore::dispatch(const StoreEvent& event) {
    const char* name = event_name(event);
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transition = reduce(*state_, event);
        if (transition.next) {
            state_ = std::make_shared<const CallingState>(std::move(*transition.next));
        }
    }

    Metrics::instance().increment_transition(name, transition.changed());
    if (transition.stale) {
        Metrics::instance().increment_stale_event(name);
    }
    logging::trace("Store event applied",
                   {kv("event", name), kv("changed", transition.changed()),
                    kv("effects", transition.effects.size())});
    return std::move(transition.effects);
}

std::shared_ptr<const CallingState> CallStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<CallRecord> CallStore::find_call(const ConversationId& conversation_id) const {
    const auto state = snapshot();
    const auto* record = call_core::find_call(*state, conversation_id);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

std::optional<ActiveCallState> CallStore::active_call_state() const {
    return snapshot()->active_call_state;
}

}
