#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

#include "call_core/utils/async.hpp"

namespace call_core {
namespace peek {

class ConnectivityMonitor {
public:
    explicit ConnectivityMonitor(bool online = true);

    void set_online(bool online);
    bool is_online() const;

    // Blocks until the network is online. Returns false if the monitor was
    // shut down while waiting.
    bool wait_online();

    // Sleeps for `delay` unless shut down first. Returns false on shutdown.
    bool sleep_for(std::chrono::milliseconds delay);

    // Sleeper that shutdown() cuts short.
    utils::Sleeper sleeper();

    void shutdown();
    bool is_shutdown() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool online_;
    bool shutdown_ = false;
};

}
}
