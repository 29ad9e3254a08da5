#include "client/connection_orchestrator.hpp"
#include "client/relay_diagnostics.hpp"
#include "common/logger.hpp"

#include <boost/asio/post.hpp>

#include <tuple>
#include <variant>

namespace riglink::client {

namespace {
auto& log() { return Logger::get("client.orchestrator"); }

constexpr const char* ICON_DISCONNECTED = "multiply.octagon";
constexpr const char* ICON_WARNING = "exclamationmark.triangle";
constexpr const char* ICON_INFO = "info.circle";
} // anonymous namespace

ConnectionOrchestrator::ConnectionOrchestrator(asio::any_io_executor owner, asio::any_io_executor blocking,
                                               const ClientConfig& config, OrchestratorServices services,
                                               ConnectionHooks hooks)
    : strand_(asio::make_strand(owner))
    , auth_strand_(asio::make_strand(blocking))
    , config_(config)
    , services_(services)
    , hooks_(std::move(hooks)) {
}

template<typename Fn>
void ConnectionOrchestrator::dispatch_owner(Fn&& fn) {
    asio::post(strand_, [self = shared_from_this(), fn = std::forward<Fn>(fn)]() mutable {
        fn(*self);
    });
}

// ============================================================================
// Start-up
// ============================================================================

void ConnectionOrchestrator::start() {
    install_callbacks();

    dispatch_owner([](ConnectionOrchestrator& self) {
        auto prefs = self.services_.prefs.snapshot();
        if (!prefs.gui_enabled && prefs.client_id.empty()) {
            self.services_.prefs.ensure_client_id();
            self.save_prefs();
        }

        self.refresh_devices();
        self.publish_relay_status();

        log().info("Started: {} mode, {} device(s), relay {}",
                   prefs.gui_enabled ? "gui" : "non-gui", self.devices_.size(),
                   prefs.relay_enabled ? "enabled" : "disabled");

        if (prefs.relay_enabled && !self.relay_logged_in_) {
            self.do_login_to_relay(false);
        }
    });
}

void ConnectionOrchestrator::install_callbacks() {
    std::weak_ptr<ConnectionOrchestrator> weak = weak_from_this();
    auto strand = strand_;

    // Wrap a member call so it runs on the owner strand, if we are still alive
    auto marshal = [weak, strand](auto member) {
        return [weak, strand, member](auto&&... args) {
            asio::post(strand, [weak, member, packed = std::make_tuple(std::decay_t<decltype(args)>(args)...)]() {
                if (auto self = weak.lock()) {
                    std::apply([&](const auto&... a) { ((*self).*member)(a...); }, packed);
                }
            });
        };
    };

    auto refresh = [weak, strand](auto&&...) {
        asio::post(strand, [weak] {
            if (auto self = weak.lock()) {
                self->refresh_devices();
                self->publish_picker_update();
            }
        });
    };

    DiscoveryCallbacks discovery;
    discovery.on_device_added = refresh;
    discovery.on_device_removed = refresh;
    discovery.on_device_updated = refresh;
    discovery.on_clients_updated = refresh;
    services_.discovery.set_callbacks(std::move(discovery));

    RelayCallbacks relay;
    relay.on_connect_ready = marshal(&ConnectionOrchestrator::on_relay_ready);
    relay.on_test_results = marshal(&ConnectionOrchestrator::on_relay_test_results);
    relay.on_settings = marshal(&ConnectionOrchestrator::on_relay_settings);
    services_.relay.set_callbacks(std::move(relay));

    LinkCallbacks link;
    link.on_connected = marshal(&ConnectionOrchestrator::on_link_connected);
    link.on_disconnected = marshal(&ConnectionOrchestrator::on_link_disconnected);
    link.on_client_updated = marshal(&ConnectionOrchestrator::on_client_updated);
    services_.link.set_callbacks(std::move(link));

    // Session state belongs to the auth strand
    asio::post(auth_strand_, [weak, strand, &auth = services_.auth] {
        auth.set_claims_handler(strand, [weak](const SessionClaims& claims) {
            if (auto self = weak.lock()) {
                self->on_session_claims(claims);
            }
        });
    });
}

// ============================================================================
// Public entry points
// ============================================================================

void ConnectionOrchestrator::connect() {
    dispatch_owner([](ConnectionOrchestrator& self) { self.do_connect(); });
}

void ConnectionOrchestrator::connect_using(std::string connection) {
    dispatch_owner([connection = std::move(connection)](ConnectionOrchestrator& self) {
        self.do_connect_using(connection);
    });
}

void ConnectionOrchestrator::connect_at(size_t picker_index) {
    dispatch_owner([picker_index](ConnectionOrchestrator& self) { self.do_connect_at(picker_index); });
}

void ConnectionOrchestrator::disconnect(std::string reason) {
    dispatch_owner([reason = std::move(reason)](ConnectionOrchestrator& self) { self.do_disconnect(reason); });
}

void ConnectionOrchestrator::send_command(std::string command) {
    dispatch_owner([command = std::move(command)](ConnectionOrchestrator& self) {
        if (command.empty()) {
            return;
        }
        self.services_.link.send(command);
    });
}

void ConnectionOrchestrator::select(std::optional<size_t> picker_index) {
    dispatch_owner([picker_index](ConnectionOrchestrator& self) {
        if (picker_index && *picker_index >= self.entries_.size()) {
            log().warn("select: index {} out of range", *picker_index);
            self.selection_.reset();
            return;
        }
        self.selection_ = picker_index;
    });
}

void ConnectionOrchestrator::set_default(std::optional<size_t> picker_index) {
    dispatch_owner([picker_index](ConnectionOrchestrator& self) { self.do_set_default(picker_index); });
}

void ConnectionOrchestrator::clear_default() {
    dispatch_owner([](ConnectionOrchestrator& self) { self.do_set_default(std::nullopt); });
}

void ConnectionOrchestrator::choose_default() {
    dispatch_owner([](ConnectionOrchestrator& self) { self.do_choose_default(); });
}

void ConnectionOrchestrator::set_gui_mode(bool gui) {
    dispatch_owner([gui](ConnectionOrchestrator& self) {
        self.services_.prefs.set_gui_enabled(gui);
        if (!gui) {
            self.services_.prefs.ensure_client_id();
        }
        self.save_prefs();
        log().info("Switched to {} mode", gui ? "gui" : "non-gui");
        self.selection_.reset();
        self.rebuild_entries();
        self.publish_picker_update();
    });
}

void ConnectionOrchestrator::toggle_relay_enabled() {
    dispatch_owner([](ConnectionOrchestrator& self) {
        bool enabled = self.services_.prefs.snapshot().relay_enabled;
        if (enabled && self.relay_logged_in_) {
            self.do_logout_from_relay();
        }
        self.services_.prefs.set_relay_enabled(!enabled);
        self.save_prefs();
        log().info("Relay {}", enabled ? "disabled" : "enabled");
        self.publish_relay_status();
    });
}

void ConnectionOrchestrator::force_new_relay_login() {
    dispatch_owner([](ConnectionOrchestrator& self) {
        auto email = self.services_.prefs.snapshot().relay_email;

        // Forget the session for the account before the account itself
        asio::post(self.auth_strand_, [email, &auth = self.services_.auth] {
            auth.set_account(email);
            auth.force_new_login();
        });

        self.services_.prefs.set_relay_email("");
        self.save_prefs();
        self.do_logout_from_relay();
    });
}

void ConnectionOrchestrator::login_to_relay(bool show_picker) {
    dispatch_owner([show_picker](ConnectionOrchestrator& self) { self.do_login_to_relay(show_picker); });
}

void ConnectionOrchestrator::authenticate_to_relay(std::string user, std::string password) {
    dispatch_owner([user = std::move(user), password = std::move(password)](ConnectionOrchestrator& self) {
        if (self.relay_login_pending_) {
            log().debug("Relay login already in progress");
            return;
        }
        self.relay_login_pending_ = true;

        asio::post(self.auth_strand_, [self = self.shared_from_this(), user, password] {
            auto& auth = self->services_.auth;
            bool logged_in = false;
            std::string failure;

            auto token = auth.request_tokens(user, password);
            if (!token) {
                failure = "Login failed";
            } else if (!self->services_.relay.connect(self->config_.app_name, self->config_.platform, *token)) {
                failure = "Relay service refused the login";
            } else {
                logged_in = true;
            }
            auto account = auth.account();

            asio::post(self->strand_, [self, logged_in, account, failure] {
                self->on_relay_login_finished(logged_in, true, account, failure);
            });
        });
    });
}

void ConnectionOrchestrator::logout_from_relay() {
    dispatch_owner([](ConnectionOrchestrator& self) { self.do_logout_from_relay(); });
}

void ConnectionOrchestrator::test_relay_path() {
    dispatch_owner([](ConnectionOrchestrator& self) {
        if (!self.can_test_relay_path()) {
            log().debug("Relay path test not available");
            return;
        }
        const auto& entry = self.entries_[*self.selection_];
        log().info("Testing relay path to {}", entry.serial);
        self.services_.relay.test(entry.serial);
    });
}

bool ConnectionOrchestrator::can_test_relay_path() const {
    return services_.prefs.snapshot().relay_enabled && relay_logged_in_ && selection_ &&
           *selection_ < entries_.size() && entries_[*selection_].kind == ConnectionKind::RELAY;
}

// ============================================================================
// Connection workflow
// ============================================================================

void ConnectionOrchestrator::do_connect() {
    fire(hooks_.will_connect);

    auto prefs = services_.prefs.snapshot();
    const auto& def = prefs.default_connection(prefs.gui_enabled);
    if (!def.empty()) {
        log().info("Connecting to {} default: {}", prefs.gui_enabled ? "gui" : "non-gui", def);
        do_connect_using(def);
        return;
    }

    if (prefs.connect_to_first) {
        rebuild_entries();
        if (!entries_.empty()) {
            log().info("Connecting to first device: {}", entries_.front().connection_string());
            do_connect_at(0);
            return;
        }
    }

    show_picker({});
}

void ConnectionOrchestrator::do_connect_using(const std::string& connection) {
    auto target = parse_connection_string(connection);
    if (!target) {
        log().warn("Invalid connection string '{}': {}", connection,
                   connection_string_error_message(target.error()));
        show_picker({connection + " is an invalid connection"});
        return;
    }

    rebuild_entries();
    auto index = find_matching_entry(entries_, *target, services_.prefs.snapshot().gui_enabled);
    if (!index) {
        log().info("No match found for {}", connection);
        show_picker({"No match found for: " + connection});
        return;
    }
    do_connect_at(*index);
}

void ConnectionOrchestrator::do_connect_at(size_t picker_index) {
    if (active_ || connected_ || pending_relay_) {
        do_disconnect(USER_INITIATED);
        return;
    }
    if (picker_index >= entries_.size()) {
        log().warn("connect_at: index {} out of range ({} entries)", picker_index, entries_.size());
        return;
    }

    const auto& entry = entries_[picker_index];
    if (entry.device_index >= devices_.size()) {
        log().warn("connect_at: stale picker entry for {}", entry.serial);
        return;
    }

    bool gui = services_.prefs.snapshot().gui_enabled;
    auto_bind_station_ = gui ? std::nullopt : std::optional<std::string>(entry.stations);

    const auto& device = devices_[entry.device_index];
    if (device.kind == ConnectionKind::RELAY) {
        log().info("Requesting relay handshake with {}", device.serial);
        pending_relay_ = device.serial;
        services_.relay.connect_to(device.serial, device.hole_punch_port);
        return;
    }
    open_device(entry.device_index);
}

void ConnectionOrchestrator::do_disconnect(const std::string& reason) {
    log().info("Disconnect: {}", reason);

    fire(hooks_.will_disconnect);
    services_.link.close(reason);

    if (pending_relay_) {
        log().debug("Abandoning relay handshake with {}", *pending_relay_);
        services_.relay.disconnect_from(*pending_relay_);
    }

    bool was_connected = connected_;
    connected_ = false;
    active_.reset();
    pending_relay_.reset();
    ++prompt_generation_;
    auto_bind_station_.reset();
    if (was_connected) {
        publish_connection_state(false);
    }

    if (reason != USER_INITIATED) {
        events::Alert alert;
        alert.style = events::AlertStyle::CRITICAL;
        alert.title = "Device was disconnected";
        alert.message = reason;
        alert.icon = ICON_DISCONNECTED;
        alert.buttons.push_back(events::AlertButton{"Ok", [] {}, false});
        raise_alert(std::move(alert));
    }
}

void ConnectionOrchestrator::open_device(size_t device_index) {
    if (!services_.prefs.snapshot().gui_enabled) {
        open_link(device_index, NoDisconnect{});
        return;
    }

    const auto& device = devices_[device_index];
    auto resolution = resolve_conflict(device);

    if (auto* now = std::get_if<ConnectNow>(&resolution)) {
        open_link(device_index, now->pending);
        return;
    }

    if (auto* blocked = std::get_if<ConnectBlocked>(&resolution)) {
        log().info("{} is in use with no closable client", device.serial);
        auto_bind_station_.reset();
        events::Alert alert;
        alert.style = events::AlertStyle::WARNING;
        alert.title = blocked->title;
        alert.message = blocked->message;
        alert.icon = blocked->icon;
        alert.buttons.push_back(events::AlertButton{"Ok", [] {}, false});
        raise_alert(std::move(alert));
        return;
    }

    const auto& prompt = std::get<ConflictPrompt>(resolution);
    log().info("{} has {} client(s), asking the user", device.serial, device.clients.size());

    events::Alert alert;
    alert.style = events::AlertStyle::WARNING;
    alert.title = prompt.title;
    alert.message = prompt.message;
    alert.icon = prompt.icon;

    // Choices from an earlier prompt are ignored
    auto generation = ++prompt_generation_;
    std::weak_ptr<ConnectionOrchestrator> weak = weak_from_this();
    for (const auto& choice : prompt.choices) {
        auto action = [weak, strand = strand_, generation, kind = device.kind, serial = device.serial, choice] {
            asio::post(strand, [weak, generation, kind, serial, choice] {
                if (auto self = weak.lock()) {
                    self->on_conflict_choice(generation, kind, serial, choice);
                }
            });
        };
        alert.buttons.push_back(events::AlertButton{choice.label, std::move(action), false});
    }
    raise_alert(std::move(alert));
}

void ConnectionOrchestrator::on_conflict_choice(uint64_t prompt, ConnectionKind kind, const SerialNumber& serial,
                                                const ConflictChoice& choice) {
    if (prompt != prompt_generation_) {
        log().debug("Ignoring stale conflict choice for {}", serial);
        return;
    }
    ++prompt_generation_;

    if (choice.kind == ChoiceKind::CANCEL) {
        log().debug("Connection to {} cancelled", serial);
        auto_bind_station_.reset();
        return;
    }
    if (active_) {
        log().warn("Ignoring conflict choice for {}: already connected", serial);
        return;
    }

    // The device list may have changed while the prompt was up
    auto index = find_device(kind, serial);
    if (!index) {
        show_picker({"No match found for: " + make_connection_string(kind, serial)});
        return;
    }
    open_link(*index, choice.pending);
}

void ConnectionOrchestrator::open_link(size_t device_index, const PendingDisconnect& pending) {
    const auto& device = devices_[device_index];
    auto prefs = services_.prefs.snapshot();

    ConnectionParams params;
    params.device_index = device_index;
    params.serial = device.serial;
    params.kind = device.kind;
    params.station = config_.effective_station_name();
    params.program = config_.app_name;
    if (prefs.gui_enabled && !prefs.client_id.empty()) {
        params.client_id = prefs.client_id;
    }
    params.is_gui = prefs.gui_enabled;
    params.relay_handle = device.relay_handle;
    params.pending_disconnect = pending;

    log().info("Opening {} (pending disconnect: {})", device.connection_string(),
               pending_disconnect_to_string(pending));

    if (services_.link.open(params)) {
        active_ = ConnectionTarget{device.kind, device.serial, prefs.gui_enabled ? std::string{} : auto_bind_station_.value_or("")};
        fire(hooks_.did_connect);
    } else {
        log().warn("Failed to open {}", device.connection_string());
        active_.reset();
        auto_bind_station_.reset();
        fire(hooks_.did_fail_to_connect);
    }
}

std::optional<size_t> ConnectionOrchestrator::find_device(ConnectionKind kind, const SerialNumber& serial) const {
    for (size_t i = 0; i < devices_.size(); ++i) {
        if (devices_[i].kind == kind && devices_[i].serial == serial) {
            return i;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Picker and defaults
// ============================================================================

void ConnectionOrchestrator::refresh_devices() {
    auto fresh = services_.discovery.devices();

    // Relay handles arrive late; keep them across a refresh of the same device
    for (auto& device : fresh) {
        if (device.kind != ConnectionKind::RELAY || device.relay_handle) {
            continue;
        }
        for (const auto& old : devices_) {
            if (old.kind == ConnectionKind::RELAY && old.serial == device.serial) {
                device.relay_handle = old.relay_handle;
                break;
            }
        }
    }

    devices_ = std::move(fresh);
    rebuild_entries();
}

void ConnectionOrchestrator::rebuild_entries() {
    auto prefs = services_.prefs.snapshot();
    entries_ = build_picker_entries(devices_, prefs.gui_enabled, prefs.default_connection(prefs.gui_enabled));
    if (selection_ && *selection_ >= entries_.size()) {
        selection_.reset();
    }
}

std::string ConnectionOrchestrator::picker_heading() const {
    return services_.prefs.snapshot().gui_enabled ? "Select a Device" : "Select a Station";
}

void ConnectionOrchestrator::show_picker(std::vector<std::string> messages) {
    rebuild_entries();
    selection_.reset();

    events::PickerShown event;
    event.heading = picker_heading();
    event.messages = std::move(messages);
    event.entries = entries_;
    services_.events.publish(event);
}

void ConnectionOrchestrator::publish_picker_update() {
    events::PickerUpdated event;
    event.entries = entries_;
    services_.events.publish(event);
}

void ConnectionOrchestrator::do_set_default(std::optional<size_t> picker_index) {
    bool gui = services_.prefs.snapshot().gui_enabled;
    if (!picker_index) {
        store_default(gui, {});
        return;
    }
    if (*picker_index >= entries_.size()) {
        log().warn("set_default: index {} out of range", *picker_index);
        return;
    }
    store_entry_default(gui, entries_[*picker_index]);
}

void ConnectionOrchestrator::store_entry_default(bool gui, const PickerEntry& entry) {
    if (!is_encodable(entry.serial, gui ? std::string{} : entry.stations)) {
        log().warn("Cannot store {} as a default: '.' in serial or station", entry.default_connection(gui));
        return;
    }
    store_default(gui, entry.default_connection(gui));
}

void ConnectionOrchestrator::store_default(bool gui, const std::string& connection) {
    services_.prefs.set_default_connection(gui, connection);
    save_prefs();
    if (connection.empty()) {
        log().info("Cleared {} default", gui ? "gui" : "non-gui");
    } else {
        log().info("Default {} connection: {}", gui ? "gui" : "non-gui", connection);
    }
    rebuild_entries();
    publish_picker_update();
}

void ConnectionOrchestrator::do_choose_default() {
    rebuild_entries();
    bool gui = services_.prefs.snapshot().gui_enabled;

    events::Alert alert;
    alert.style = events::AlertStyle::INFORMATIONAL;
    alert.title = picker_heading();
    if (entries_.empty()) {
        alert.message = gui ? "No Devices found" : "No Stations found";
        alert.icon = ICON_WARNING;
    } else {
        alert.message = "current default highlighted (if any)";
        alert.icon = ICON_INFO;
    }

    std::weak_ptr<ConnectionOrchestrator> weak = weak_from_this();
    auto strand = strand_;

    for (const auto& entry : entries_) {
        std::string label = entry.nickname + " - " + connection_kind_name(entry.kind);
        if (!gui) {
            label += " - " + entry.stations;
        }
        auto action = [weak, strand, gui, entry] {
            asio::post(strand, [weak, gui, entry] {
                if (auto self = weak.lock()) {
                    self->store_entry_default(gui, entry);
                }
            });
        };
        alert.buttons.push_back(events::AlertButton{std::move(label), std::move(action), entry.is_default});
    }

    alert.buttons.push_back(events::AlertButton{"Clear", [weak, strand, gui] {
        asio::post(strand, [weak, gui] {
            if (auto self = weak.lock()) {
                self->store_default(gui, {});
            }
        });
    }, false});
    alert.buttons.push_back(events::AlertButton{"Cancel", [] {}, false});

    raise_alert(std::move(alert));
}

// ============================================================================
// External events
// ============================================================================

void ConnectionOrchestrator::on_link_connected() {
    log().info("Link connected");
    connected_ = true;
    publish_connection_state(true);
}

void ConnectionOrchestrator::on_link_disconnected(const std::string& reason) {
    bool was_active = connected_ || active_.has_value();

    connected_ = false;
    active_.reset();
    pending_relay_.reset();
    auto_bind_station_.reset();

    if (!was_active) {
        // Already torn down by disconnect()
        return;
    }

    log().info("Link disconnected: {}", reason);
    publish_connection_state(false);

    if (reason != USER_INITIATED) {
        events::Alert alert;
        alert.style = events::AlertStyle::CRITICAL;
        alert.title = "Device was disconnected";
        alert.message = reason;
        alert.icon = ICON_DISCONNECTED;
        alert.buttons.push_back(events::AlertButton{"Ok", [] {}, false});
        raise_alert(std::move(alert));
    }
}

void ConnectionOrchestrator::on_client_updated(const ClientInfo& client) {
    refresh_devices();
    publish_picker_update();

    if (auto_bind_station_ && client.station == *auto_bind_station_ && client.client_id) {
        log().info("Binding to client {} of station {}", *client.client_id, client.station);
        services_.link.bind_client_id(*client.client_id);
        auto_bind_station_.reset();
    }
}

void ConnectionOrchestrator::on_relay_ready(const std::string& handle, const SerialNumber& serial) {
    if (!pending_relay_ || *pending_relay_ != serial) {
        log().debug("Ignoring relay ready for {} (not pending)", serial);
        return;
    }

    refresh_devices();
    auto index = find_device(ConnectionKind::RELAY, serial);
    if (!index) {
        log().debug("Ignoring relay ready for {} (device unknown)", serial);
        return;
    }

    pending_relay_.reset();
    devices_[*index].relay_handle = handle;
    log().info("Relay handshake with {} complete", serial);
    open_device(*index);
}

void ConnectionOrchestrator::on_relay_test_results(const RelayTestResults& results) {
    events::RelayTestCompleted event;
    event.success = relay_test_passed(results);
    event.summary = relay_test_summary(results);
    log().info("Relay path test {}", event.success ? "passed" : "failed");
    services_.events.publish(event);
}

void ConnectionOrchestrator::on_relay_settings(const std::string& name, const std::string& callsign) {
    services_.prefs.set_relay_identity(name, callsign);
    save_prefs();
    publish_relay_status();
}

void ConnectionOrchestrator::on_session_claims(const SessionClaims& claims) {
    if (!claims.email.empty() && claims.email != services_.prefs.snapshot().relay_email) {
        services_.prefs.set_relay_email(claims.email);
        save_prefs();
    }
    events::SessionClaimsUpdated event;
    event.claims = claims;
    services_.events.publish(event);
}

// ============================================================================
// Relay / session
// ============================================================================

void ConnectionOrchestrator::do_login_to_relay(bool open_picker) {
    if (relay_login_pending_) {
        log().debug("Relay login already in progress");
        return;
    }
    relay_login_pending_ = true;

    auto email = services_.prefs.snapshot().relay_email;
    asio::post(auth_strand_, [self = shared_from_this(), email, open_picker] {
        auto& auth = self->services_.auth;
        auth.set_account(email);

        bool logged_in = false;
        std::string failure;
        if (auto token = auth.get_existing_token()) {
            logged_in = self->services_.relay.connect(self->config_.app_name, self->config_.platform, *token);
            if (!logged_in) {
                failure = "Relay service refused the login";
            }
        } else {
            log().debug("No usable stored session");
        }
        auto account = auth.account();

        asio::post(self->strand_, [self, logged_in, open_picker, account, failure] {
            self->on_relay_login_finished(logged_in, open_picker, account, failure);
        });
    });
}

void ConnectionOrchestrator::on_relay_login_finished(bool logged_in, bool open_picker,
                                                     const std::string& account, const std::string& failure) {
    relay_login_pending_ = false;

    if (!logged_in) {
        log().info("Relay login needs credentials{}{}", failure.empty() ? "" : ": ", failure);
        events::CredentialsRequested event;
        event.message = failure;
        services_.events.publish(event);
        return;
    }

    relay_logged_in_ = true;
    if (!account.empty()) {
        services_.prefs.set_relay_email(account);
        save_prefs();
    }
    log().info("Logged in to relay as {}", account);
    publish_relay_status();

    if (open_picker) {
        show_picker({});
    }
}

void ConnectionOrchestrator::do_logout_from_relay() {
    log().info("Logging out of relay");

    services_.discovery.remove_relay_devices();
    services_.relay.disconnect_all();
    asio::post(auth_strand_, [&auth = services_.auth] { auth.clear_session(); });

    relay_logged_in_ = false;
    if (pending_relay_) {
        pending_relay_.reset();
        auto_bind_station_.reset();
    }
    services_.prefs.set_relay_identity("", "");
    save_prefs();

    publish_relay_status();
    services_.events.publish(events::SessionClaimsUpdated{});

    refresh_devices();
    publish_picker_update();
}

void ConnectionOrchestrator::publish_connection_state(bool connected) {
    events::ConnectionStateChanged event;
    event.connected = connected;
    services_.events.publish(event);
}

void ConnectionOrchestrator::publish_relay_status() {
    auto prefs = services_.prefs.snapshot();
    events::RelayStatusChanged event;
    event.enabled = prefs.relay_enabled;
    event.logged_in = relay_logged_in_;
    event.name = prefs.relay_name;
    event.callsign = prefs.relay_callsign;
    services_.events.publish(event);
}

// ============================================================================
// Helpers
// ============================================================================

void ConnectionOrchestrator::raise_alert(events::Alert alert) {
    events::AlertRaised event;
    event.alert = std::move(alert);
    services_.events.publish(event);
}

void ConnectionOrchestrator::save_prefs() {
    if (!services_.prefs.save()) {
        log().warn("Preferences not saved: {}", services_.prefs.last_error());
    }
}

void ConnectionOrchestrator::fire(const std::function<void()>& hook) {
    if (hook) {
        hook();
    }
}

} // namespace riglink::client
