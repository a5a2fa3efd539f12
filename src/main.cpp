#include "call_core/app.hpp"
#include "call_core/config.hpp"
#include "call_core/logging.hpp"

#include <atomic>
#include <csignal>
#include <string>

namespace {

std::atomic<bool> g_quit{false};

void handle_signal(int) {
    g_quit = true;
}

}

int main() {
    try {
        const auto config = call_core::Config::load();
        config.validate();
        call_core::logging::init(config);
        call_core::info(
            "Starting call-core",
            {call_core::kv("calling_service_url", config.calling_service_url),
             call_core::kv("rest_port", config.rest_api_port),
             call_core::kv("peek_debounce_ms", config.peek_debounce_ms),
             call_core::kv("outbound_ring", config.group_call_outbound_ring)});

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        call_core::CallCoreApp app(config);
        app.init();
        app.run(g_quit);
        app.stop();
    } catch (const std::exception& ex) {
        call_core::error(
            "Startup failed",
            {call_core::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
