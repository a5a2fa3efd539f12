#include "call_core/server/rest_server.hpp"

#include <stdexcept>

#include "call_core/commands/json_router.hpp"
#include "call_core/logging.hpp"
#include "call_core/metrics.hpp"
#include "call_core/model/json.hpp"

namespace call_core {

namespace {

RestResponse message(int status, const std::string& text) {
    return RestResponse{status, nlohmann::json{{"message", text}}};
}

nlohmann::json parse_body(const std::string& body) {
    if (body.empty()) {
        return nlohmann::json::object();
    }
    return nlohmann::json::parse(body);
}

}

RestServer::RestServer(const Config& config,
                       const CallStore& store,
                       CallingCommands& commands,
                       const peek::PeekCoordinator& peeks)
    : config_(config),
      store_(store),
      commands_(commands),
      peeks_(peeks) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        write_json(res, health());
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Get("/calls", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        write_json(res, list_calls());
    });

    server_->Get(R"(/calls/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        write_json(res, get_call(req.matches[1].str()));
    });

    server_->Post("/events", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        write_json(res, handle_event(req.body));
    });

    server_->Post(R"(/commands/([A-Za-z0-9_]+))",
                  [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        write_json(res, handle_command(req.matches[1].str(), req.body));
    });

    server_thread_ = std::thread([this]() {
        logging::info("REST server listening", {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::error("REST server failed to listen", {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

RestResponse RestServer::health() const {
    const auto state = store_.snapshot();
    nlohmann::json payload{{"status", "ok"},
                           {"calls", state->calls_by_conversation.size()},
                           {"pending_peek_queues", peeks_.pending_queues()}};
    if (state->active_call_state) {
        payload["active_conversation_id"] = state->active_call_state->conversation_id;
    } else {
        payload["active_conversation_id"] = nullptr;
    }
    return RestResponse{200, payload};
}

RestResponse RestServer::list_calls() const {
    return RestResponse{200, nlohmann::json(*store_.snapshot())};
}

RestResponse RestServer::get_call(const std::string& conversation_id) const {
    const auto state = store_.snapshot();
    const auto* record = find_call(*state, conversation_id);
    if (!record) {
        return message(404, "no call for conversation");
    }
    nlohmann::json payload{{"call", *record}};
    if (state->active_call_state && state->active_call_state->conversation_id == conversation_id) {
        payload["active_call_state"] = *state->active_call_state;
    }
    return RestResponse{200, payload};
}

RestResponse RestServer::handle_event(const std::string& body) {
    try {
        route_event(commands_, parse_body(body));
        return RestResponse{202, nlohmann::json{{"status", "accepted"}}};
    } catch (const nlohmann::json::exception& ex) {
        logging::error("Malformed event", {kv("error", ex.what())});
        return message(400, "invalid request body");
    } catch (const UnknownMessageError& ex) {
        logging::warn("Rejected event", {kv("error", ex.what())});
        return message(400, ex.what());
    } catch (const std::invalid_argument& ex) {
        logging::error("Malformed event", {kv("error", ex.what())});
        return message(400, ex.what());
    } catch (const std::out_of_range& ex) {
        logging::error("Malformed event", {kv("error", ex.what())});
        return message(400, ex.what());
    } catch (const CallingServiceError& ex) {
        logging::error("Calling service failed while handling event", {kv("error", ex.what())});
        return message(502, ex.what());
    }
}

RestResponse RestServer::handle_command(const std::string& name, const std::string& body) {
    try {
        const bool applied = route_command(commands_, name, parse_body(body));
        if (!applied) {
            return RestResponse{409, nlohmann::json{{"applied", false}}};
        }
        return RestResponse{200, nlohmann::json{{"applied", true}}};
    } catch (const nlohmann::json::exception& ex) {
        logging::error("Malformed command", {kv("command", name), kv("error", ex.what())});
        return message(400, "invalid request body");
    } catch (const UnknownMessageError& ex) {
        logging::warn("Rejected command", {kv("command", name), kv("error", ex.what())});
        return message(400, ex.what());
    } catch (const std::invalid_argument& ex) {
        logging::error("Malformed command", {kv("command", name), kv("error", ex.what())});
        return message(400, ex.what());
    } catch (const std::out_of_range& ex) {
        logging::error("Malformed command", {kv("command", name), kv("error", ex.what())});
        return message(400, ex.what());
    } catch (const CommandError& ex) {
        logging::error("Command rejected", {kv("command", name), kv("error", ex.what())});
        return message(409, ex.what());
    } catch (const CallingServiceError& ex) {
        logging::error("Calling service failed", {kv("command", name), kv("error", ex.what())});
        return message(502, ex.what());
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
