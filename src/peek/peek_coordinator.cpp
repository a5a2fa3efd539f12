#include "call_core/peek/peek_coordinator.hpp"

#include <utility>

#include "call_core/logging.hpp"
#include "call_core/metrics.hpp"

namespace call_core::peek {

bool should_skip_peek(const CallingState& state, const ConversationId& conversation_id) {
    const auto* call = find_group_call(state, conversation_id);
    return call && call->connection_state != GroupConnectionState::NotConnected;
}

PeekCoordinator::PeekCoordinator(CallStore& store,
                                 CallingService& service,
                                 const ConversationDirectory& directory,
                                 ConnectivityMonitor& connectivity,
                                 utils::Executor executor,
                                 utils::Sleeper sleeper,
                                 std::chrono::milliseconds debounce)
    : workers_(std::make_shared<Workers>()),
      store_(store),
      service_(service),
      directory_(directory),
      connectivity_(connectivity),
      executor_(track(std::move(executor), workers_)),
      sleeper_(std::move(sleeper)),
      debounce_(debounce) {}

PeekCoordinator::~PeekCoordinator() {
    stop();
}

utils::Executor PeekCoordinator::track(utils::Executor executor,
                                       std::shared_ptr<Workers> workers) {
    // Tasks hold the worker state, not the coordinator, until they are
    // admitted, so a task that starts after stop() never touches it.
    return [executor = std::move(executor), workers](utils::Task task) {
        executor([workers, task = std::move(task)]() {
            {
                std::lock_guard<std::mutex> lock(workers->mutex);
                if (workers->stopped) {
                    return;
                }
                ++workers->running;
            }
            struct Release {
                Workers& workers;
                ~Release() {
                    std::lock_guard<std::mutex> lock(workers.mutex);
                    --workers.running;
                    workers.idle.notify_all();
                }
            } release{*workers};
            task();
        });
    };
}

bool PeekCoordinator::request(const ConversationId& conversation_id) {
    if (!is_group_conversation(conversation_id)) {
        logging::debug("Not peeking a non-group conversation",
                       {kv("conversation_id", conversation_id)});
        return false;
    }
    Metrics::instance().increment_peek_request();

    while (true) {
        std::shared_ptr<LatestQueue> queue;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = queues_.find(conversation_id);
            if (it == queues_.end()) {
                queue = std::make_shared<LatestQueue>(executor_);
                std::weak_ptr<LatestQueue> weak = queue;
                queue->set_idle_callback([this, conversation_id, weak]() {
                    if (auto owned = weak.lock()) {
                        on_queue_idle(conversation_id, owned);
                    }
                });
                queues_.emplace(conversation_id, queue);
            } else {
                queue = it->second;
            }
        }
        // A queue retired between the lookup and here has already been
        // erased, so the next pass creates a fresh one.
        if (queue->add([this, conversation_id]() { run_peek(conversation_id); })) {
            return true;
        }
    }
}

bool PeekCoordinator::peek_for_the_first_time(const ConversationId& conversation_id) {
    const auto state = store_.snapshot();
    const auto* record = find_call(*state, conversation_id);
    const auto* group = find_group_call(*state, conversation_id);
    if (record && !(group && !group->peek_info)) {
        return false;
    }
    return request(conversation_id);
}

bool PeekCoordinator::peek_if_it_has_members(const ConversationId& conversation_id) {
    const auto state = store_.snapshot();
    const auto* group = find_group_call(*state, conversation_id);
    if (!group || group->join_state != GroupJoinState::NotJoined || !group->peek_info ||
        group->peek_info->device_count == 0) {
        return false;
    }
    return request(conversation_id);
}

void PeekCoordinator::schedule_refresh(const ConversationId& conversation_id,
                                       std::chrono::milliseconds delay) {
    executor_([this, conversation_id, delay]() {
        sleeper_(delay);
        if (stopped_) {
            return;
        }
        request(conversation_id);
    });
}

size_t PeekCoordinator::pending_queues() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queues_.size();
}

void PeekCoordinator::stop() {
    stopped_ = true;
    connectivity_.shutdown();
    std::unique_lock<std::mutex> lock(workers_->mutex);
    workers_->stopped = true;
    workers_->idle.wait(lock, [this]() { return workers_->running == 0; });
}

bool PeekCoordinator::is_group_conversation(const ConversationId& conversation_id) const {
    if (const auto info = directory_.find(conversation_id)) {
        return info->call_mode == CallMode::Group;
    }
    // Unknown to the directory: trust what the store already holds.
    return find_group_call(*store_.snapshot(), conversation_id) != nullptr;
}

void PeekCoordinator::run_peek(const ConversationId& conversation_id) {
    if (should_skip_peek(*store_.snapshot(), conversation_id)) {
        Metrics::instance().increment_peek_discarded();
        return;
    }

    // Peeking right after a membership change can return the old roster.
    sleeper_(debounce_);
    if (stopped_ || !connectivity_.wait_online()) {
        logging::debug("Peek abandoned on shutdown", {kv("conversation_id", conversation_id)});
        return;
    }

    const auto state = store_.snapshot();
    if (should_skip_peek(*state, conversation_id)) {
        logging::debug("Call connected before peek, skipping",
                       {kv("conversation_id", conversation_id)});
        Metrics::instance().increment_peek_discarded();
        return;
    }
    std::optional<GroupJoinState> join_state;
    if (const auto* call = find_group_call(*state, conversation_id)) {
        join_state = call->join_state;
    }

    Metrics::instance().increment_peek_issued();
    const auto started = std::chrono::steady_clock::now();
    std::optional<PeekInfo> peek_info;
    try {
        peek_info = service_.peek_group_call(conversation_id);
    } catch (const CallingServiceError& ex) {
        Metrics::instance().increment_peek_failure();
        logging::error("Group call peeking failed",
                       {kv("conversation_id", conversation_id), kv("error", ex.what())});
        return;
    }
    Metrics::instance().observe_peek_latency(
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    if (!peek_info) {
        return;
    }
    logging::info("Group call peeked", {kv("conversation_id", conversation_id),
                                        kv("device_count", peek_info->device_count)});

    try {
        service_.update_call_history_for_group_call(conversation_id, join_state, *peek_info);
    } catch (const CallingServiceError& ex) {
        logging::warn("Failed to update call history",
                      {kv("conversation_id", conversation_id), kv("error", ex.what())});
    }

    store_.dispatch(PeekGroupCallFulfilled{conversation_id, *peek_info});
}

void PeekCoordinator::on_queue_idle(const ConversationId& conversation_id,
                                    const std::shared_ptr<LatestQueue>& queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(conversation_id);
    if (it == queues_.end() || it->second != queue) {
        return;
    }
    if (queue->try_retire()) {
        queues_.erase(it);
    }
}

}
