#include "common/types.hpp"

#include <cctype>
#include <charconv>

namespace riglink {

const char* connection_kind_name(ConnectionKind kind) {
    switch (kind) {
        case ConnectionKind::LOCAL: return "local";
        case ConnectionKind::RELAY: return "relay";
        default: return "unknown";
    }
}

std::optional<ConnectionKind> connection_kind_from_string(std::string_view str) {
    if (str == "local") return ConnectionKind::LOCAL;
    // "wan" is what older releases wrote into prefs
    if (str == "relay" || str == "wan") return ConnectionKind::RELAY;
    return std::nullopt;
}

const char* device_status_name(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::AVAILABLE: return "available";
        case DeviceStatus::IN_USE: return "in_use";
        default: return "unknown";
    }
}

DeviceStatus device_status_from_string(std::string_view str) {
    return to_lower(str) == "available" ? DeviceStatus::AVAILABLE : DeviceStatus::IN_USE;
}

const char* protocol_class_name(ProtocolClass cls) {
    switch (cls) {
        case ProtocolClass::LEGACY: return "legacy";
        case ProtocolClass::CURRENT: return "current";
        default: return "unknown";
    }
}

ProtocolClass classify_version(std::string_view version) {
    int major = 0;
    auto dot = version.find('.');
    auto head = version.substr(0, dot);
    auto [ptr, ec] = std::from_chars(head.data(), head.data() + head.size(), major);
    if (ec != std::errc{} || ptr != head.data() + head.size()) {
        // Unparseable version: assume a current firmware
        return ProtocolClass::CURRENT;
    }
    return major < 3 ? ProtocolClass::LEGACY : ProtocolClass::CURRENT;
}

std::string DevicePacket::connection_string() const {
    return std::string(connection_kind_name(kind)) + "." + serial;
}

std::string DevicePacket::stations() const {
    std::string result;
    for (const auto& client : clients) {
        if (!result.empty()) result += ",";
        result += client.station;
    }
    return result;
}

std::string pending_disconnect_to_string(const PendingDisconnect& pending) {
    if (auto one = std::get_if<CloseOne>(&pending)) {
        return "close(" + std::to_string(one->handle) + ")";
    }
    if (auto two = std::get_if<CloseTwo>(&pending)) {
        return "close(" + std::to_string(two->first) + "," + std::to_string(two->second) + ")";
    }
    return "none";
}

std::string to_lower(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lower;
}

} // namespace riglink
