#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>

#include "call_core/conversation/directory.hpp"
#include "call_core/model/call_record.hpp"
#include "call_core/peek/connectivity.hpp"
#include "call_core/peek/latest_queue.hpp"
#include "call_core/service/calling_service.hpp"
#include "call_core/store/call_store.hpp"
#include "call_core/utils/async.hpp"

namespace call_core {
namespace peek {

// True when the stored call has started connecting, in which case a peek
// would only report what the roster already shows.
bool should_skip_peek(const CallingState& state, const ConversationId& conversation_id);

// Schedules group-call membership refreshes. Each conversation gets its own
// LatestQueue so at most one peek per conversation is in flight, bursts of
// requests collapse into one trailing peek, and queues are dropped once they
// drain.
class PeekCoordinator {
public:
    PeekCoordinator(CallStore& store,
                    CallingService& service,
                    const ConversationDirectory& directory,
                    ConnectivityMonitor& connectivity,
                    utils::Executor executor,
                    utils::Sleeper sleeper,
                    std::chrono::milliseconds debounce);
    ~PeekCoordinator();

    PeekCoordinator(const PeekCoordinator&) = delete;
    PeekCoordinator& operator=(const PeekCoordinator&) = delete;

    // Returns false when the conversation is not a group conversation.
    bool request(const ConversationId& conversation_id);

    // Peeks when nothing is known about the call yet.
    bool peek_for_the_first_time(const ConversationId& conversation_id);

    // Peeks when the last snapshot showed devices in a call we have not joined.
    bool peek_if_it_has_members(const ConversationId& conversation_id);

    // Requests a peek after `delay`, giving the call time to disconnect.
    void schedule_refresh(const ConversationId& conversation_id, std::chrono::milliseconds delay);

    size_t pending_queues() const;

    // Pending peeks finish without calling the service. Blocks until every
    // task already running on the executor has returned; tasks that start
    // later return at once. Must not be called from an executor task.
    void stop();

private:
    struct Workers {
        std::mutex mutex;
        std::condition_variable idle;
        size_t running = 0;
        bool stopped = false;
    };

    static utils::Executor track(utils::Executor executor, std::shared_ptr<Workers> workers);

    bool is_group_conversation(const ConversationId& conversation_id) const;
    void run_peek(const ConversationId& conversation_id);
    void on_queue_idle(const ConversationId& conversation_id,
                       const std::shared_ptr<LatestQueue>& queue);

    std::shared_ptr<Workers> workers_;
    CallStore& store_;
    CallingService& service_;
    const ConversationDirectory& directory_;
    ConnectivityMonitor& connectivity_;
    utils::Executor executor_;
    utils::Sleeper sleeper_;
    std::chrono::milliseconds debounce_;
    std::atomic<bool> stopped_{false};

    mutable std::mutex mutex_;
    std::map<ConversationId, std::shared_ptr<LatestQueue>> queues_;
};

}
}
