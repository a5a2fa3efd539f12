#include "call_core/app.hpp"

#include <chrono>
#include <thread>

#include "call_core/logging.hpp"
#include "call_core/utils/async.hpp"

namespace call_core {

namespace {

CallingServiceRequestOptions request_options(const Config& config) {
    return {std::chrono::seconds(static_cast<int>(config.calling_service_request_timeout)),
            std::chrono::seconds(static_cast<int>(config.calling_service_connect_timeout)),
            std::chrono::seconds(static_cast<int>(config.calling_service_read_timeout))};
}

CommandOptions command_options(const Config& config) {
    CommandOptions options;
    options.our_aci = config.our_aci;
    options.max_group_call_ring_size = config.max_group_call_ring_size;
    options.group_call_outbound_ring = config.group_call_outbound_ring;
    options.lobby_audio_device_limit = config.lobby_audio_device_limit;
    options.hangup_peek_delay = std::chrono::milliseconds(config.hangup_peek_delay_ms);
    return options;
}

}

CallCoreApp::CallCoreApp(Config config)
    : config_(std::move(config)),
      connectivity_(config_.start_online),
      service_(config_.calling_service_url, config_.authorization_token,
               request_options(config_)),
      peeks_(store_, service_, directory_, connectivity_, utils::detached_executor(),
             connectivity_.sleeper(), std::chrono::milliseconds(config_.peek_debounce_ms)),
      commands_(store_, service_, peeks_, directory_, connectivity_, command_options(config_)) {}

void CallCoreApp::init() {
    for (const auto& conversation : config_.conversations) {
        directory_.upsert(conversation);
    }
    logging::info("Conversation directory seeded", {kv("conversations", directory_.size())});

    rest_server_ = std::make_unique<RestServer>(config_, store_, commands_, peeks_);
    rest_server_->start();
}

void CallCoreApp::run(const std::atomic<bool>& quit) {
    while (!quitting_ && !quit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void CallCoreApp::stop() {
    if (quitting_.exchange(true)) {
        return;
    }
    logging::info("Stopping call core");
    if (rest_server_) {
        rest_server_->stop();
    }
    peeks_.stop();
}

const Config& CallCoreApp::config() const {
    return config_;
}

}
