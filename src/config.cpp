#include "call_core/config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

#include "call_core/model/json.hpp"

namespace call_core {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::vector<ConversationInfo> parse_conversations(const std::string& raw) {
    if (raw.empty()) {
        return {};
    }
    auto json = nlohmann::json::parse(raw);
    if (!json.is_array()) {
        throw std::runtime_error("CONVERSATIONS must be a JSON array");
    }
    std::vector<ConversationInfo> result;
    result.reserve(json.size());
    for (const auto& item : json) {
        result.push_back(item.get<ConversationInfo>());
    }
    return result;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
#if defined(_WIN32)
    localtime_s(&tm_value, &time_t);
#else
    localtime_r(&time_t, &tm_value);
#endif
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

void set_env_value(const std::string& key, const std::string& value) {
#if defined(_WIN32)
    _putenv_s(key.c_str(), value.c_str());
#else
    setenv(key.c_str(), value.c_str(), 1);
#endif
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        value = strip_quotes(value);
        set_env_value(key, value);
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.calling_service_url = get_env_required("CALLING_SERVICE_URL");
    config.our_aci = get_env_required("OUR_ACI");
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.calling_service_request_timeout =
        get_env_double("CALLING_SERVICE_REQUEST_TIMEOUT", 30.0);
    config.calling_service_connect_timeout =
        get_env_double("CALLING_SERVICE_CONNECT_TIMEOUT", 30.0);
    config.calling_service_read_timeout = get_env_double("CALLING_SERVICE_READ_TIMEOUT", 30.0);
    config.rest_api_port = get_env_int("REST_API_PORT", 8000);

    config.peek_debounce_ms = get_env_int("PEEK_DEBOUNCE_MS", 1000);
    config.hangup_peek_delay_ms = get_env_int("HANGUP_PEEK_DELAY_MS", 1000);
    config.max_group_call_ring_size = get_env_int("MAX_GROUP_CALL_RING_SIZE", 16);
    config.group_call_outbound_ring = get_env_bool("GROUP_CALL_OUTBOUND_RING", true);
    config.lobby_audio_device_limit = get_env_int("LOBBY_AUDIO_DEVICE_LIMIT", 8);
    config.start_online = get_env_bool("START_ONLINE", true);
    config.conversations = parse_conversations(get_env_str("CONVERSATIONS", ""));

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "call_core");

    return config;
}

void Config::validate() const {
    if (calling_service_url.empty()) {
        throw std::runtime_error("CALLING_SERVICE_URL is required");
    }
    if (our_aci.empty()) {
        throw std::runtime_error("OUR_ACI is required");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (peek_debounce_ms < 0) {
        throw std::runtime_error("PEEK_DEBOUNCE_MS must be zero or positive");
    }
    if (hangup_peek_delay_ms < 0) {
        throw std::runtime_error("HANGUP_PEEK_DELAY_MS must be zero or positive");
    }
    if (max_group_call_ring_size <= 0) {
        throw std::runtime_error("MAX_GROUP_CALL_RING_SIZE must be positive");
    }
    if (lobby_audio_device_limit <= 0) {
        throw std::runtime_error("LOBBY_AUDIO_DEVICE_LIMIT must be positive");
    }
    for (const auto& conversation : conversations) {
        if (conversation.id.empty()) {
            throw std::runtime_error("CONVERSATIONS entries need a non-empty id");
        }
    }
}

}
