#pragma once

#include "common/logger.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <unordered_map>

namespace riglink {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
    MISSING_REQUIRED,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Auth Configuration (Auth0 compatible identity provider)
// ============================================================================

struct AuthConfig {
    std::string domain = "https://frtest.auth0.com/";       // expected "iss"
    std::string client_id = "4Y9fEIIsVYyQo5u6jr7yBWc4lV5ugC2m";  // expected "aud"
    std::string authenticate_url = "https://frtest.auth0.com/oauth/ro";
    std::string delegation_url = "https://frtest.auth0.com/delegation";
    std::string connection = "Username-Password-Authentication";
    std::string device = "any";
    std::string scope = "openid offline_access email picture";
    std::chrono::seconds request_timeout{10};

    // SSL/TLS settings
    bool ssl_verify = true;
    std::string ssl_ca_file;  // empty = system default
};

// ============================================================================
// Client Configuration
// ============================================================================

struct ClientConfig {
    // Identity announced to devices and to the relay service
    std::string app_name = "RigLink";
    std::string platform = "Linux";
    std::string station_name;  // empty = DEFAULT_STATION_NAME

    // State directory for prefs.json, empty = platform default
    std::string state_dir;

    AuthConfig auth;

    // Logging
    std::string log_level = "info";
    std::string log_file;
    std::unordered_map<std::string, std::string> module_log_levels;

    static constexpr const char* DEFAULT_STATION_NAME = "Linux";

    const std::string& effective_station_name() const;

    LogConfig to_log_config() const;

    // Load from JSON file
    static std::expected<ClientConfig, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<ClientConfig, ConfigError> parse(const std::string& json_content);
};

} // namespace riglink
