#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "call_core/utils/async.hpp"

namespace call_core {
namespace peek {

// Runs at most one task at a time. A task added while another runs replaces
// any task still waiting, so after the running task finishes exactly one
// more run happens no matter how many adds arrived in between.
class LatestQueue : public std::enable_shared_from_this<LatestQueue> {
public:
    explicit LatestQueue(utils::Executor executor);

    // Returns false once the queue has been retired.
    bool add(utils::Task task);

    // Called every time the queue drains.
    void set_idle_callback(std::function<void()> callback);

    // Retires the queue if nothing is running or waiting.
    bool try_retire();

    bool idle() const;
    bool retired() const;

private:
    void drain();

    utils::Executor executor_;
    mutable std::mutex mutex_;
    bool running_ = false;
    bool retired_ = false;
    std::optional<utils::Task> queued_;
    std::function<void()> idle_callback_;
};

}
}
