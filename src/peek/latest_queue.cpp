#include "call_core/peek/latest_queue.hpp"

#include <exception>
#include <utility>

#include "call_core/logging.hpp"

namespace call_core::peek {

LatestQueue::LatestQueue(utils::Executor executor) : executor_(std::move(executor)) {}

bool LatestQueue::add(utils::Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (retired_) {
            return false;
        }
        queued_ = std::move(task);
        if (running_) {
            return true;
        }
        running_ = true;
    }
    auto self = shared_from_this();
    executor_([self]() { self->drain(); });
    return true;
}

void LatestQueue::set_idle_callback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_callback_ = std::move(callback);
}

bool LatestQueue::try_retire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ || queued_) {
        return false;
    }
    retired_ = true;
    return true;
}

bool LatestQueue::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !running_ && !queued_;
}

bool LatestQueue::retired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retired_;
}

void LatestQueue::drain() {
    while (true) {
        std::optional<utils::Task> task;
        std::function<void()> on_idle;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!queued_) {
                running_ = false;
                on_idle = idle_callback_;
            } else {
                task = std::move(queued_);
                queued_.reset();
            }
        }
        if (!task) {
            if (on_idle) {
                on_idle();
            }
            return;
        }
        if (!*task) {
            continue;
        }
        try {
            (*task)();
        } catch (const std::exception& ex) {
            logging::error("Queued task failed", {kv("error", ex.what())});
        }
    }
}

}
