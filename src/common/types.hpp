#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace riglink {

// ============================================================================
// Basic Types
// ============================================================================

using ClientHandle = uint32_t;
using SerialNumber = std::string;

// How a device is reached
enum class ConnectionKind : uint8_t {
    LOCAL = 0,   // same network
    RELAY = 1,   // through the cloud relay (requires a session token)
};

const char* connection_kind_name(ConnectionKind kind);
std::optional<ConnectionKind> connection_kind_from_string(std::string_view str);

enum class DeviceStatus : uint8_t {
    AVAILABLE = 0,
    IN_USE = 1,
};

const char* device_status_name(DeviceStatus status);

// Unknown status strings count as in_use
DeviceStatus device_status_from_string(std::string_view str);

// Protocol generation reported by the device firmware
enum class ProtocolClass : uint8_t {
    LEGACY = 0,   // firmware major < 3, single client only
    CURRENT = 1,  // multi-client capable
};

const char* protocol_class_name(ProtocolClass cls);
ProtocolClass classify_version(std::string_view version);

// ============================================================================
// Device Model
// ============================================================================

// A client already attached to a device
struct ClientInfo {
    ClientHandle handle = 0;
    std::string station;
    std::optional<std::string> client_id;   // populated once the client has bound
};

// Discovered device summary, replaced wholesale on every discovery change
struct DevicePacket {
    SerialNumber serial;
    ConnectionKind kind = ConnectionKind::LOCAL;
    std::string nickname;
    DeviceStatus status = DeviceStatus::AVAILABLE;
    std::vector<ClientInfo> clients;
    std::string version;                       // firmware version, e.g. "3.2.31.1234"
    std::optional<std::string> relay_handle;   // set when the relay handshake completes
    uint16_t hole_punch_port = 0;

    ProtocolClass protocol_class() const { return classify_version(version); }

    // "<kind>.<serial>"
    std::string connection_string() const;

    // Comma separated station names of the attached clients
    std::string stations() const;
};

// ============================================================================
// Pending Disconnect
// ============================================================================

// Existing clients to close as a side effect of opening a new connection
struct NoDisconnect {
    bool operator==(const NoDisconnect&) const = default;
};

struct CloseOne {
    ClientHandle handle = 0;
    bool operator==(const CloseOne&) const = default;
};

struct CloseTwo {
    ClientHandle first = 0;
    ClientHandle second = 0;
    bool operator==(const CloseTwo&) const = default;
};

using PendingDisconnect = std::variant<NoDisconnect, CloseOne, CloseTwo>;

std::string pending_disconnect_to_string(const PendingDisconnect& pending);

// ============================================================================
// Relay Connectivity Test
// ============================================================================

struct RelayTestResults {
    bool forward_tcp_port_working = false;
    bool forward_udp_port_working = false;
    bool upnp_tcp_port_working = false;
    bool upnp_udp_port_working = false;
    bool nat_supports_hole_punch = false;
};

// ============================================================================
// Helpers
// ============================================================================

std::string to_lower(std::string_view str);

} // namespace riglink
