#pragma once

#include "client/auth_session.hpp"
#include "client/conflict_resolver.hpp"
#include "client/events.hpp"
#include "client/picker.hpp"
#include "client/prefs_store.hpp"
#include "client/services.hpp"
#include "common/config.hpp"
#include "common/connection_string.hpp"
#include "common/event_bus.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace asio = boost::asio;

namespace riglink::client {

// Collaborators the orchestrator drives; all outlive it
struct OrchestratorServices {
    DeviceDiscoveryFeed& discovery;
    RelayClient& relay;
    DeviceLinkClient& link;
    AuthSessionManager& auth;
    PrefsStore& prefs;
    EventBus& events;
};

// ============================================================================
// Connection Orchestrator
// ============================================================================
//
// Decides which device to connect to and how: picker list, stored defaults,
// conflict prompts when a device already has clients, and the relay login
// needed before reaching devices outside the local network.
//
// Threading: every public entry point may be called from any thread and is
// posted onto the owner strand, which holds all orchestrator state.
// Discovery, relay and link callbacks are marshalled onto the same strand.
// Session work (token refresh, password login, relay login) runs on a
// second strand over the blocking executor; results are posted back.
// The query accessors read owner state and must be called on the owner strand.

class ConnectionOrchestrator : public std::enable_shared_from_this<ConnectionOrchestrator> {
public:
    static constexpr const char* USER_INITIATED = "User initiated";

    ConnectionOrchestrator(asio::any_io_executor owner, asio::any_io_executor blocking,
                           const ClientConfig& config, OrchestratorServices services,
                           ConnectionHooks hooks = {});

    ConnectionOrchestrator(const ConnectionOrchestrator&) = delete;
    ConnectionOrchestrator& operator=(const ConnectionOrchestrator&) = delete;

    // Install collaborator callbacks, take the first discovery snapshot and
    // log in to the relay when it is enabled. Call once, after make_shared.
    void start();

    // ========================================================================
    // Connection
    // ========================================================================

    // Default for the current mode, else (connect-to-first) the first entry, else the picker
    void connect();

    void connect_using(std::string connection);

    // Connect to a picker row, or disconnect if a connection is active or in flight
    void connect_at(size_t picker_index);

    void disconnect(std::string reason = USER_INITIATED);

    void send_command(std::string command);

    // ========================================================================
    // Picker and defaults
    // ========================================================================

    void select(std::optional<size_t> picker_index);

    // Persist the row's connection string as the default for the current mode
    void set_default(std::optional<size_t> picker_index);
    void clear_default();

    // Alert listing every row as a choice, plus Clear and Cancel
    void choose_default();

    void set_gui_mode(bool gui);

    // ========================================================================
    // Relay
    // ========================================================================

    void toggle_relay_enabled();
    void force_new_relay_login();
    void login_to_relay(bool show_picker = true);
    void authenticate_to_relay(std::string user, std::string password);
    void logout_from_relay();
    void test_relay_path();

    // ========================================================================
    // Owner strand queries
    // ========================================================================

    bool is_connected() const { return connected_; }
    bool relay_logged_in() const { return relay_logged_in_; }
    bool can_test_relay_path() const;

    const std::vector<PickerEntry>& picker_entries() const { return entries_; }
    const std::vector<DevicePacket>& devices() const { return devices_; }
    std::optional<size_t> selection() const { return selection_; }
    const std::optional<SerialNumber>& pending_relay_serial() const { return pending_relay_; }
    const std::optional<ConnectionTarget>& active_target() const { return active_; }

    const asio::strand<asio::any_io_executor>& strand() const { return strand_; }

private:
    // Post `fn` onto the owner strand
    template<typename Fn>
    void dispatch_owner(Fn&& fn);

    void install_callbacks();

    // ---- connection workflow (owner strand) ----
    void do_connect();
    void do_connect_using(const std::string& connection);
    void do_connect_at(size_t picker_index);
    void do_disconnect(const std::string& reason);

    void open_device(size_t device_index);
    void on_conflict_choice(uint64_t prompt, ConnectionKind kind, const SerialNumber& serial,
                            const ConflictChoice& choice);
    void open_link(size_t device_index, const PendingDisconnect& pending);

    std::optional<size_t> find_device(ConnectionKind kind, const SerialNumber& serial) const;

    // ---- picker ----
    void refresh_devices();
    void rebuild_entries();
    void show_picker(std::vector<std::string> messages);
    void publish_picker_update();
    std::string picker_heading() const;

    void do_set_default(std::optional<size_t> picker_index);
    void store_entry_default(bool gui, const PickerEntry& entry);
    void store_default(bool gui, const std::string& connection);
    void do_choose_default();

    // ---- external events ----
    void on_link_connected();
    void on_link_disconnected(const std::string& reason);
    void on_client_updated(const ClientInfo& client);
    void on_relay_ready(const std::string& handle, const SerialNumber& serial);
    void on_relay_test_results(const RelayTestResults& results);
    void on_relay_settings(const std::string& name, const std::string& callsign);
    void on_session_claims(const SessionClaims& claims);

    // ---- relay / session ----
    void do_login_to_relay(bool open_picker);
    void on_relay_login_finished(bool logged_in, bool open_picker, const std::string& account,
                                 const std::string& failure);
    void do_logout_from_relay();
    void publish_connection_state(bool connected);
    void publish_relay_status();

    void raise_alert(events::Alert alert);
    void save_prefs();
    void fire(const std::function<void()>& hook);

    asio::strand<asio::any_io_executor> strand_;
    asio::strand<asio::any_io_executor> auth_strand_;

    ClientConfig config_;
    OrchestratorServices services_;
    ConnectionHooks hooks_;

    // Owner strand state
    std::vector<DevicePacket> devices_;
    std::vector<PickerEntry> entries_;
    std::optional<size_t> selection_;
    std::optional<ConnectionTarget> active_;          // link opened for this device
    bool connected_ = false;                          // link reported connected
    std::optional<SerialNumber> pending_relay_;       // relay handshake in flight
    std::optional<std::string> auto_bind_station_;    // non-gui: bind to this station's client
    uint64_t prompt_generation_ = 0;                  // conflict prompt currently on screen
    bool relay_logged_in_ = false;
    bool relay_login_pending_ = false;
};

} // namespace riglink::client
