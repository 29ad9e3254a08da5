#include "client/credential_store.hpp"
#include "common/logger.hpp"

namespace riglink::client {

namespace {
auto& log() { return Logger::get("client.credentials"); }

bool has_account(const std::optional<std::string>& account) {
    return account.has_value() && !account->empty();
}
} // anonymous namespace

bool CredentialStore::set(const std::optional<std::string>& account, const std::string& secret) {
    if (!has_account(account)) {
        log().debug("set: no account, ignored");
        return false;
    }
    bool ok = do_set(*account, secret);
    if (!ok) {
        log().warn("Failed to store credential for {}", *account);
    }
    return ok;
}

std::optional<std::string> CredentialStore::get(const std::optional<std::string>& account) const {
    if (!has_account(account)) {
        return std::nullopt;
    }
    return do_get(*account);
}

bool CredentialStore::remove(const std::optional<std::string>& account) {
    if (!has_account(account)) {
        log().debug("remove: no account, ignored");
        return false;
    }
    return do_remove(*account);
}

} // namespace riglink::client
