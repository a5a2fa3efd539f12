#pragma once

#include <atomic>
#include <memory>

#include "call_core/commands/calling_commands.hpp"
#include "call_core/config.hpp"
#include "call_core/conversation/directory.hpp"
#include "call_core/peek/connectivity.hpp"
#include "call_core/peek/peek_coordinator.hpp"
#include "call_core/server/rest_server.hpp"
#include "call_core/service/http_calling_service.hpp"
#include "call_core/store/call_store.hpp"

namespace call_core {

class CallCoreApp {
public:
    explicit CallCoreApp(Config config);

    void init();
    // Blocks until stop() is called or `quit` becomes true.
    void run(const std::atomic<bool>& quit);
    void stop();

    const Config& config() const;

private:
    Config config_;
    InMemoryConversationDirectory directory_;
    CallStore store_;
    peek::ConnectivityMonitor connectivity_;
    HttpCallingService service_;
    peek::PeekCoordinator peeks_;
    CallingCommands commands_;
    std::unique_ptr<RestServer> rest_server_;
    std::atomic<bool> quitting_{false};
};

}
