#include "call_core/peek/connectivity.hpp"

#include "call_core/logging.hpp"

namespace call_core::peek {

ConnectivityMonitor::ConnectivityMonitor(bool online) : online_(online) {}

void ConnectivityMonitor::set_online(bool online) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (online_ == online) {
            return;
        }
        online_ = online;
    }
    logging::info(online ? "Network online" : "Network offline");
    cv_.notify_all();
}

bool ConnectivityMonitor::is_online() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return online_;
}

bool ConnectivityMonitor::wait_online() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return online_ || shutdown_; });
    return !shutdown_;
}

bool ConnectivityMonitor::sleep_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (delay.count() > 0) {
        cv_.wait_for(lock, delay, [this]() { return shutdown_; });
    }
    return !shutdown_;
}

utils::Sleeper ConnectivityMonitor::sleeper() {
    return [this](std::chrono::milliseconds delay) { sleep_for(delay); };
}

void ConnectivityMonitor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    cv_.notify_all();
}

bool ConnectivityMonitor::is_shutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

}
