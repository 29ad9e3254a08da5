#pragma once

#include "common/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace riglink::client {

// ============================================================================
// External collaborators
// ============================================================================
//
// The orchestrator only talks to the discovery publisher, the relay protocol
// client and the device protocol client through these interfaces. Callbacks
// may fire on any thread; the orchestrator marshals them onto its strand.

// ----------------------------------------------------------------------------
// Discovery
// ----------------------------------------------------------------------------

struct DiscoveryCallbacks {
    std::function<void(const DevicePacket&)> on_device_added;
    std::function<void(const SerialNumber&)> on_device_removed;
    std::function<void(const DevicePacket&)> on_device_updated;
    std::function<void(const SerialNumber&)> on_clients_updated;
};

class DeviceDiscoveryFeed {
public:
    virtual ~DeviceDiscoveryFeed() = default;

    // Snapshot of the live device list; must be safe to call from any thread
    virtual std::vector<DevicePacket> devices() const = 0;

    virtual void set_callbacks(DiscoveryCallbacks callbacks) = 0;

    // Drop every relay-reached device (relay logout)
    virtual void remove_relay_devices() = 0;
};

// ----------------------------------------------------------------------------
// Relay
// ----------------------------------------------------------------------------

struct RelayCallbacks {
    // Handshake finished, the device is addressable through `handle`
    std::function<void(const std::string& handle, const SerialNumber& serial)> on_connect_ready;
    std::function<void(const RelayTestResults&)> on_test_results;
    // Account settings pushed by the relay service after login
    std::function<void(const std::string& name, const std::string& callsign)> on_settings;
};

class RelayClient {
public:
    virtual ~RelayClient() = default;

    // Blocking login to the relay service with an identity token
    virtual bool connect(const std::string& app_name, const std::string& platform,
                         const std::string& id_token) = 0;
    virtual void connect_to(const SerialNumber& serial, uint16_t hole_punch_port) = 0;
    virtual void disconnect_from(const SerialNumber& serial) = 0;
    virtual void disconnect_all() = 0;
    virtual void test(const SerialNumber& serial) = 0;

    virtual void set_callbacks(RelayCallbacks callbacks) = 0;
};

// ----------------------------------------------------------------------------
// Device link
// ----------------------------------------------------------------------------

struct ConnectionParams {
    size_t device_index = 0;
    SerialNumber serial;
    ConnectionKind kind = ConnectionKind::LOCAL;
    std::string station;
    std::string program;
    std::optional<std::string> client_id;   // gui only
    bool is_gui = true;
    std::optional<std::string> relay_handle;
    PendingDisconnect pending_disconnect = NoDisconnect{};
};

struct LinkCallbacks {
    std::function<void()> on_connected;
    std::function<void(const std::string& reason)> on_disconnected;
    std::function<void(const ClientInfo&)> on_client_updated;
};

class DeviceLinkClient {
public:
    virtual ~DeviceLinkClient() = default;

    virtual bool open(const ConnectionParams& params) = 0;
    virtual void close(const std::string& reason) = 0;
    virtual void request_foreign_client_close(ClientHandle handle) = 0;
    virtual void bind_client_id(const std::string& client_id) = 0;
    virtual void send(const std::string& command) = 0;

    virtual void set_callbacks(LinkCallbacks callbacks) = 0;
};

// ============================================================================
// Hooks into the embedding application
// ============================================================================

struct ConnectionHooks {
    std::function<void()> will_connect;
    std::function<void()> did_connect;
    std::function<void()> did_fail_to_connect;
    std::function<void()> will_disconnect;
};

} // namespace riglink::client
