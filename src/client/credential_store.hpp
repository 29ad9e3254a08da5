#pragma once

#include <optional>
#include <string>

namespace riglink::client {

/// Secret storage keyed by account (the relay account email).
/// The backing mechanism (keyring, keychain, ...) lives outside this library;
/// implementations override the do_* hooks.
///
/// Every operation fails without touching the backend when the account is
/// absent or empty.
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    bool set(const std::optional<std::string>& account, const std::string& secret);
    std::optional<std::string> get(const std::optional<std::string>& account) const;
    bool remove(const std::optional<std::string>& account);

protected:
    virtual bool do_set(const std::string& account, const std::string& secret) = 0;
    virtual std::optional<std::string> do_get(const std::string& account) const = 0;
    virtual bool do_remove(const std::string& account) = 0;
};

} // namespace riglink::client
