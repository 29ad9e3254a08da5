#pragma once

#include "client/credential_store.hpp"
#include "client/http_client.hpp"
#include "common/config.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <expected>
#include <functional>
#include <optional>
#include <string>

namespace riglink::client {

// ============================================================================
// Auth Errors
// ============================================================================

enum class AuthError {
    NO_ACCOUNT,         // no account email to look up a refresh token
    NO_REFRESH_TOKEN,   // nothing stored for the account
    NETWORK,            // request never got an answer
    BAD_RESPONSE,       // answer was not a JSON object
    MISSING_TOKEN,      // answer carried no id_token (or no refresh_token for a password grant)
    INVALID_TOKEN,      // id_token failed validation
};

std::string auth_error_message(AuthError error);

// Identity claims carried by the id token
struct SessionClaims {
    std::string email;
    std::string name;
    std::string callsign;
    std::string picture;   // avatar URL
};

// ============================================================================
// Auth Session Manager
// ============================================================================
//
// Owns the relay session: the cached identity token and the refresh token
// persisted in the CredentialStore under the account email.
//
// Not thread-safe. All calls are made from one strand (the orchestrator's
// auth strand); the blocking HTTP calls happen inline on it.

class AuthSessionManager {
public:
    using ClaimsHandler = std::function<void(const SessionClaims&)>;

    AuthSessionManager(const AuthConfig& config, CredentialStore& store, HttpClient& http);

    AuthSessionManager(const AuthSessionManager&) = delete;
    AuthSessionManager& operator=(const AuthSessionManager&) = delete;

    // Claims updates are posted to `executor`, never called inline
    void set_claims_handler(boost::asio::any_io_executor executor, ClaimsHandler handler);

    // Account email used to find the stored refresh token
    void set_account(const std::string& email) { account_ = email; }
    const std::string& account() const { return account_; }

    // Cached token if still valid, otherwise one obtained from the stored
    // refresh token. A refresh token the server rejects is deleted.
    std::optional<std::string> get_existing_token();

    // Password grant
    std::optional<std::string> request_tokens(const std::string& user, const std::string& password);

    // Refresh grant
    std::optional<std::string> request_token_from_refresh(const std::string& refresh_token);

    // Issuer, audience and expiry check. The signature is not verified.
    bool is_valid(const std::string& token) const;

    std::optional<SessionClaims> decode_claims(const std::string& token) const;

    // Drop the cached token and the stored refresh token for the account
    void force_new_login();

    // Drop the cached token only; the stored refresh token stays
    void clear_session();

    bool has_cached_token() const { return cached_token_.has_value(); }

private:
    struct TokenResponse {
        std::string id_token;
        std::optional<std::string> refresh_token;
    };

    std::expected<TokenResponse, AuthError> post_grant(const std::string& url, const std::string& body);
    std::expected<std::string, AuthError> refresh(const std::string& refresh_token);

    // Cache the token, persist the refresh token and publish claims
    void adopt(const std::string& id_token, const std::string& refresh_token,
               const std::string& fallback_account);

    void publish_claims(const std::string& token);

    std::string password_body(const std::string& user, const std::string& password) const;
    std::string refresh_body(const std::string& refresh_token) const;

    AuthConfig config_;
    CredentialStore& store_;
    HttpClient& http_;

    std::optional<std::string> cached_token_;
    std::string account_;

    std::optional<boost::asio::any_io_executor> claims_executor_;
    ClaimsHandler claims_handler_;
};

} // namespace riglink::client
