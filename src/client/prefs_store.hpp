#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace riglink::client {

/// Persistent connection preferences
struct ConnectionPreferences {
    bool gui_enabled = false;
    std::string client_id;                  // generated once, stable across restarts
    std::string default_gui_connection;     // "<kind>.<serial>", empty = no default
    std::string default_non_gui_connection; // "<kind>.<serial>.<station>", empty = no default
    bool connect_to_first = false;

    bool relay_enabled = false;
    std::string relay_email;
    std::string relay_name;
    std::string relay_callsign;

    // Default for the given mode
    const std::string& default_connection(bool gui) const {
        return gui ? default_gui_connection : default_non_gui_connection;
    }
};

/// Runtime preference storage (prefs.json)
/// Written by the orchestrator as the user changes defaults, mode or relay account.
class PrefsStore {
public:
    explicit PrefsStore(const std::filesystem::path& state_dir);
    ~PrefsStore() = default;

    PrefsStore(const PrefsStore&) = delete;
    PrefsStore& operator=(const PrefsStore&) = delete;

    /// Load prefs.json; a missing file keeps the defaults and succeeds
    bool load();

    /// Atomically write prefs.json (temp file + rename)
    bool save();

    const std::filesystem::path& path() const { return prefs_path_; }

    bool exists() const;

    const std::string& last_error() const { return last_error_; }

    /// Copy of the current values
    ConnectionPreferences snapshot() const;

    // ========== Connection ==========

    void set_gui_enabled(bool value);
    void set_default_connection(bool gui, const std::string& connection);
    void set_connect_to_first(bool value);

    /// Returns the client id, generating a random one first if none is stored
    std::string ensure_client_id();

    // ========== Relay ==========

    void set_relay_enabled(bool value);
    void set_relay_email(const std::string& email);
    void set_relay_identity(const std::string& name, const std::string& callsign);

private:
    std::filesystem::path prefs_path_;
    std::string last_error_;
    mutable std::mutex mutex_;
    ConnectionPreferences prefs_;

    bool ensure_directory();

    std::string generate_json() const;
};

/// Platform specific state directory
/// - Windows: %LOCALAPPDATA%/RigLink
/// - Linux: ~/.local/share/riglink/
/// - macOS: ~/Library/Application Support/RigLink/
std::filesystem::path get_state_dir();

/// `configured` when set (client.state_dir), otherwise get_state_dir()
std::filesystem::path resolve_state_dir(const std::string& configured);

} // namespace riglink::client
