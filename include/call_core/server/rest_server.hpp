#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "call_core/commands/calling_commands.hpp"
#include "call_core/config.hpp"
#include "call_core/peek/peek_coordinator.hpp"
#include "call_core/store/call_store.hpp"

namespace call_core {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

class RestServer {
public:
    RestServer(const Config& config,
               const CallStore& store,
               CallingCommands& commands,
               const peek::PeekCoordinator& peeks);

    void start();
    void stop();

    RestResponse health() const;
    RestResponse list_calls() const;
    RestResponse get_call(const std::string& conversation_id) const;
    RestResponse handle_event(const std::string& body);
    RestResponse handle_command(const std::string& name, const std::string& body);

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    const CallStore& store_;
    CallingCommands& commands_;
    const peek::PeekCoordinator& peeks_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
