#include "common/config.hpp"
#include "common/logger.hpp"
#include <boost/json.hpp>
#include <fstream>
#include <sstream>

namespace json = boost::json;

// Safe JSON field accessors with defaults
namespace {

std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return def;
}

bool jbool(const json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

int64_t jint(const json::object& obj, std::string_view key, int64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_int64()) return it->value().as_int64();
        if (it->value().is_uint64()) return static_cast<int64_t>(it->value().as_uint64());
    }
    return def;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

}  // anonymous namespace

namespace riglink {

namespace {
auto& log() { return Logger::get("common.config"); }
}  // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

const std::string& ClientConfig::effective_station_name() const {
    static const std::string fallback = DEFAULT_STATION_NAME;
    return station_name.empty() ? fallback : station_name;
}

LogConfig ClientConfig::to_log_config() const {
    LogConfig config;
    config.global_level = log_level_from_string(log_level);
    config.file_path = log_file;
    for (const auto& [module, level] : module_log_levels) {
        config.module_levels[module] = log_level_from_string(level);
    }
    return config;
}

std::expected<ClientConfig, ConfigError> ClientConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::expected<ClientConfig, ConfigError> ClientConfig::parse(const std::string& json_content) {
    try {
        auto jv = json::parse(json_content);
        if (!jv.is_object()) {
            log().error("Config root must be an object");
            return std::unexpected(ConfigError::PARSE_ERROR);
        }
        auto& root = jv.as_object();

        ClientConfig config;

        // client section
        if (auto* client = jsection(root, "client")) {
            config.app_name = jstr(*client, "app_name", config.app_name);
            config.platform = jstr(*client, "platform", config.platform);
            config.station_name = jstr(*client, "station_name", config.station_name);
            config.state_dir = jstr(*client, "state_dir", config.state_dir);
        }

        // auth section
        if (auto* auth = jsection(root, "auth")) {
            config.auth.domain = jstr(*auth, "domain", config.auth.domain);
            config.auth.client_id = jstr(*auth, "client_id", config.auth.client_id);
            config.auth.authenticate_url = jstr(*auth, "authenticate_url", config.auth.authenticate_url);
            config.auth.delegation_url = jstr(*auth, "delegation_url", config.auth.delegation_url);
            config.auth.connection = jstr(*auth, "connection", config.auth.connection);
            config.auth.device = jstr(*auth, "device", config.auth.device);
            config.auth.scope = jstr(*auth, "scope", config.auth.scope);
            config.auth.ssl_verify = jbool(*auth, "ssl_verify", config.auth.ssl_verify);
            config.auth.ssl_ca_file = jstr(*auth, "ssl_ca_file", config.auth.ssl_ca_file);

            auto timeout = jint(*auth, "timeout_seconds", config.auth.request_timeout.count());
            if (timeout <= 0) {
                log().error("auth.timeout_seconds must be positive, got {}", timeout);
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            config.auth.request_timeout = std::chrono::seconds(timeout);
        }

        if (config.auth.client_id.empty() || config.auth.domain.empty()) {
            log().error("auth.client_id and auth.domain are required");
            return std::unexpected(ConfigError::MISSING_REQUIRED);
        }

        // log section
        if (auto* log_sec = jsection(root, "log")) {
            config.log_level = jstr(*log_sec, "level", config.log_level);
            config.log_file = jstr(*log_sec, "file", config.log_file);
            if (auto* modules = jsection(*log_sec, "modules")) {
                for (const auto& [name, value] : *modules) {
                    if (value.is_string()) {
                        config.module_log_levels[std::string(name)] = std::string(value.as_string());
                    }
                }
            }
        }

        return config;

    } catch (const boost::system::system_error& e) {
        log().error("JSON parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    } catch (const std::exception& e) {
        log().error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
}

} // namespace riglink
