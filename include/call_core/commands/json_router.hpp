#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "call_core/commands/calling_commands.hpp"

namespace call_core {

class UnknownMessageError : public std::invalid_argument {
public:
    explicit UnknownMessageError(const std::string& message) : std::invalid_argument(message) {}
};

// Decodes an inbound notification ({"type": ..., ...}) and hands it to the
// command layer. Throws UnknownMessageError for unknown types and
// nlohmann::json::exception for malformed payloads.
void route_event(CallingCommands& commands, const nlohmann::json& event);

// Runs the named user command. Returns the command's result.
bool route_command(CallingCommands& commands, const std::string& name, const nlohmann::json& body);

}
