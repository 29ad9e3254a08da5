#include "client/auth_session.hpp"
#include "common/logger.hpp"

#include <boost/asio/post.hpp>
#include <boost/json.hpp>
#include <jwt-cpp/jwt.h>

#include <chrono>

namespace json = boost::json;

namespace riglink::client {

namespace {
auto& log() { return Logger::get("client.auth"); }

constexpr const char* GRANT_PASSWORD = "password";
constexpr const char* GRANT_REFRESH = "urn:ietf:params:oauth:grant-type:jwt-bearer";

// String payload claim, empty when absent or not a string
template<typename Decoded>
std::string string_claim(const Decoded& decoded, const std::string& name) {
    if (!decoded.has_payload_claim(name)) {
        return {};
    }
    auto claim = decoded.get_payload_claim(name);
    if (claim.get_type() != jwt::json::type::string) {
        return {};
    }
    return claim.as_string();
}

std::optional<std::string> json_string(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string()) {
        return std::string(it->value().as_string());
    }
    return std::nullopt;
}

} // anonymous namespace

std::string auth_error_message(AuthError error) {
    switch (error) {
        case AuthError::NO_ACCOUNT: return "No account";
        case AuthError::NO_REFRESH_TOKEN: return "No stored refresh token";
        case AuthError::NETWORK: return "Authentication server unreachable";
        case AuthError::BAD_RESPONSE: return "Malformed authentication response";
        case AuthError::MISSING_TOKEN: return "Authentication response carried no token";
        case AuthError::INVALID_TOKEN: return "Invalid identity token";
        default: return "Unknown authentication error";
    }
}

AuthSessionManager::AuthSessionManager(const AuthConfig& config, CredentialStore& store, HttpClient& http)
    : config_(config)
    , store_(store)
    , http_(http) {
}

void AuthSessionManager::set_claims_handler(boost::asio::any_io_executor executor, ClaimsHandler handler) {
    claims_executor_ = std::move(executor);
    claims_handler_ = std::move(handler);
}

// ============================================================================
// Token acquisition
// ============================================================================

std::optional<std::string> AuthSessionManager::get_existing_token() {
    if (cached_token_ && is_valid(*cached_token_)) {
        publish_claims(*cached_token_);
        return cached_token_;
    }
    cached_token_.reset();

    if (account_.empty()) {
        log().debug("No account, cannot refresh");
        return std::nullopt;
    }

    auto stored = store_.get(account_);
    if (!stored) {
        log().debug("No refresh token stored for {}", account_);
        return std::nullopt;
    }

    auto token = refresh(*stored);
    if (token) {
        return *token;
    }

    // Only a refresh token the server has actually rejected is discarded
    if (token.error() == AuthError::MISSING_TOKEN || token.error() == AuthError::INVALID_TOKEN) {
        log().info("Stored refresh token for {} rejected ({}), removing it",
                   account_, auth_error_message(token.error()));
        store_.remove(account_);
    }
    return std::nullopt;
}

std::optional<std::string> AuthSessionManager::request_tokens(const std::string& user, const std::string& password) {
    auto response = post_grant(config_.authenticate_url, password_body(user, password));
    if (!response) {
        log().warn("Password login for {} failed: {}", user, auth_error_message(response.error()));
        return std::nullopt;
    }
    if (!response->refresh_token) {
        log().warn("Password login for {} returned no refresh token", user);
        return std::nullopt;
    }
    if (!is_valid(response->id_token)) {
        log().warn("Password login for {} returned an invalid token", user);
        cached_token_.reset();
        return std::nullopt;
    }

    adopt(response->id_token, *response->refresh_token, user);
    log().info("Logged in as {}", account_);
    return response->id_token;
}

std::optional<std::string> AuthSessionManager::request_token_from_refresh(const std::string& refresh_token) {
    auto token = refresh(refresh_token);
    if (!token) {
        return std::nullopt;
    }
    return *token;
}

std::expected<std::string, AuthError> AuthSessionManager::refresh(const std::string& refresh_token) {
    auto response = post_grant(config_.delegation_url, refresh_body(refresh_token));
    if (!response) {
        log().warn("Token refresh failed: {}", auth_error_message(response.error()));
        return std::unexpected(response.error());
    }
    if (!is_valid(response->id_token)) {
        log().warn("Token refresh returned an invalid token");
        cached_token_.reset();
        return std::unexpected(AuthError::INVALID_TOKEN);
    }

    adopt(response->id_token, refresh_token, account_);
    log().debug("Refreshed identity token for {}", account_);
    return response->id_token;
}

void AuthSessionManager::adopt(const std::string& id_token, const std::string& refresh_token,
                               const std::string& fallback_account) {
    auto claims = decode_claims(id_token);
    std::string email = (claims && !claims->email.empty()) ? claims->email : fallback_account;
    if (!email.empty()) {
        account_ = email;
    }

    if (!store_.set(account_, refresh_token)) {
        log().warn("Refresh token for {} not persisted", account_);
    }
    cached_token_ = id_token;
    publish_claims(id_token);
}

void AuthSessionManager::force_new_login() {
    cached_token_.reset();
    if (!account_.empty()) {
        store_.remove(account_);
        log().info("Forgot stored credentials for {}", account_);
    }
}

void AuthSessionManager::clear_session() {
    if (cached_token_) {
        log().debug("Session for {} ended", account_);
    }
    cached_token_.reset();
}

// ============================================================================
// Validation
// ============================================================================

bool AuthSessionManager::is_valid(const std::string& token) const {
    if (token.empty()) {
        return false;
    }
    try {
        auto decoded = jwt::decode(token);

        if (!decoded.has_issuer() || decoded.get_issuer() != config_.domain) {
            log().debug("Token issuer mismatch");
            return false;
        }
        if (!decoded.has_audience() || decoded.get_audience().count(config_.client_id) == 0) {
            log().debug("Token audience mismatch");
            return false;
        }
        if (!decoded.has_expires_at() || decoded.get_expires_at() <= std::chrono::system_clock::now()) {
            log().debug("Token expired");
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        log().debug("Token not decodable: {}", e.what());
        return false;
    }
}

std::optional<SessionClaims> AuthSessionManager::decode_claims(const std::string& token) const {
    try {
        auto decoded = jwt::decode(token);
        SessionClaims claims;
        claims.email = string_claim(decoded, "email");
        claims.name = string_claim(decoded, "name");
        claims.callsign = string_claim(decoded, "callsign");
        claims.picture = string_claim(decoded, "picture");
        return claims;
    } catch (const std::exception& e) {
        log().debug("Claims not decodable: {}", e.what());
        return std::nullopt;
    }
}

void AuthSessionManager::publish_claims(const std::string& token) {
    if (!claims_handler_ || !claims_executor_) {
        return;
    }
    auto claims = decode_claims(token);
    if (!claims) {
        return;
    }
    boost::asio::post(*claims_executor_, [handler = claims_handler_, claims = std::move(*claims)] {
        handler(claims);
    });
}

// ============================================================================
// Requests
// ============================================================================

std::expected<AuthSessionManager::TokenResponse, AuthError>
AuthSessionManager::post_grant(const std::string& url, const std::string& body) {
    auto response = http_.post_json(url, body, config_.request_timeout);
    if (!response) {
        log().debug("POST {} failed: {}", url, http_error_message(response.error()));
        return std::unexpected(AuthError::NETWORK);
    }

    try {
        auto jv = json::parse(response->body);
        if (!jv.is_object()) {
            return std::unexpected(AuthError::BAD_RESPONSE);
        }
        auto& obj = jv.as_object();

        auto id_token = json_string(obj, "id_token");
        if (!id_token || id_token->empty()) {
            if (auto err = json_string(obj, "error_description")) {
                log().info("Authentication server: {}", *err);
            }
            return std::unexpected(AuthError::MISSING_TOKEN);
        }

        TokenResponse result;
        result.id_token = std::move(*id_token);
        result.refresh_token = json_string(obj, "refresh_token");
        return result;
    } catch (const boost::system::system_error& e) {
        log().debug("Response parse error (HTTP {}): {}", response->status, e.what());
        return std::unexpected(AuthError::BAD_RESPONSE);
    }
}

std::string AuthSessionManager::password_body(const std::string& user, const std::string& password) const {
    json::object body;
    body["client_id"] = config_.client_id;
    body["connection"] = config_.connection;
    body["device"] = config_.device;
    body["grant_type"] = GRANT_PASSWORD;
    body["password"] = password;
    body["scope"] = config_.scope;
    body["username"] = user;
    return json::serialize(body);
}

std::string AuthSessionManager::refresh_body(const std::string& refresh_token) const {
    json::object body;
    body["client_id"] = config_.client_id;
    body["grant_type"] = GRANT_REFRESH;
    body["refresh_token"] = refresh_token;
    body["target"] = config_.client_id;
    body["scope"] = config_.scope;
    return json::serialize(body);
}

} // namespace riglink::client
