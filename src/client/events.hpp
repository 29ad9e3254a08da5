// Typed notifications from the connection orchestrator to the presentation layer.
// All of them are published on the orchestrator's strand through the EventBus.

#pragma once

#include "client/auth_session.hpp"
#include "client/picker.hpp"
#include "common/event_bus.hpp"

#include <functional>
#include <string>
#include <vector>

namespace riglink::client::events {

// ============================================================================
// Alerts
// ============================================================================

enum class AlertStyle {
    INFORMATIONAL,
    WARNING,
    CRITICAL,
};

// `action` may be invoked from any thread
struct AlertButton {
    std::string label;
    std::function<void()> action;
    bool highlighted = false;
};

struct Alert {
    AlertStyle style = AlertStyle::INFORMATIONAL;
    std::string title;
    std::string message;
    std::string icon;
    std::vector<AlertButton> buttons;
};

struct AlertRaised : TypedEvent<AlertRaised> {
    Alert alert;
};

// ============================================================================
// Picker
// ============================================================================

// The picker should be shown (connect without a usable default, bad input...)
struct PickerShown : TypedEvent<PickerShown> {
    std::string heading;                 // "Select a Device" / "Select a Station"
    std::vector<std::string> messages;
    std::vector<PickerEntry> entries;
};

// Device list changed while the picker may be visible
struct PickerUpdated : TypedEvent<PickerUpdated> {
    std::vector<PickerEntry> entries;
};

// ============================================================================
// Connection
// ============================================================================

struct ConnectionStateChanged : TypedEvent<ConnectionStateChanged> {
    bool connected = false;
};

// ============================================================================
// Relay / session
// ============================================================================

// Stored credentials did not produce a session; ask the user to log in
struct CredentialsRequested : TypedEvent<CredentialsRequested> {
    std::string message;
};

struct RelayStatusChanged : TypedEvent<RelayStatusChanged> {
    bool enabled = false;
    bool logged_in = false;
    std::string name;
    std::string callsign;
};

struct SessionClaimsUpdated : TypedEvent<SessionClaimsUpdated> {
    SessionClaims claims;
};

struct RelayTestCompleted : TypedEvent<RelayTestCompleted> {
    bool success = false;
    std::string summary;
};

} // namespace riglink::client::events
