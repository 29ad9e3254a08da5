#include "client/conflict_resolver.hpp"

namespace riglink::client {

namespace {

constexpr const char* ICON_WARNING = "exclamationmark.triangle";

ConflictChoice cancel_choice() {
    return ConflictChoice{"Cancel", ChoiceKind::CANCEL, NoDisconnect{}};
}

// One "Close <station>" choice per attached client
void add_close_choices(const DevicePacket& device, std::vector<ConflictChoice>& choices) {
    for (const auto& client : device.clients) {
        choices.push_back(ConflictChoice{"Close " + client.station, ChoiceKind::CLOSE, CloseOne{client.handle}});
    }
}

ConflictResolution resolve_legacy(const DevicePacket& device) {
    if (device.status == DeviceStatus::AVAILABLE) {
        return ConnectNow{};
    }

    // Single-client firmware: the only way in is to close whoever holds it.
    // Handle 0 asks the device to drop its current owner.
    PendingDisconnect pending = CloseOne{0};
    if (device.clients.size() == 1) {
        pending = CloseOne{device.clients[0].handle};
    } else if (device.clients.size() >= 2) {
        pending = CloseTwo{device.clients[0].handle, device.clients[1].handle};
    }

    ConflictPrompt prompt;
    prompt.title = "Device is in use";
    prompt.message = device.stations();
    prompt.icon = ICON_WARNING;
    prompt.choices.push_back(ConflictChoice{"Close existing client", ChoiceKind::CLOSE, pending});
    prompt.choices.push_back(cancel_choice());
    return prompt;
}

ConflictResolution resolve_current(const DevicePacket& device) {
    if (device.status == DeviceStatus::AVAILABLE) {
        if (device.clients.empty()) {
            return ConnectNow{};
        }

        ConflictPrompt prompt;
        prompt.title = "Device is connected to Station";
        prompt.message = device.stations();
        prompt.icon = ICON_WARNING;
        add_close_choices(device, prompt.choices);
        prompt.choices.push_back(ConflictChoice{"Multiflex Connect", ChoiceKind::MULTIFLEX, NoDisconnect{}});
        prompt.choices.push_back(cancel_choice());
        return prompt;
    }

    if (device.clients.empty()) {
        return ConnectBlocked{"Device is in use", "No station can be closed", ICON_WARNING};
    }

    ConflictPrompt prompt;
    prompt.title = device.clients.size() > 1 ? "Device is connected to multiple Stations"
                                             : "Device is connected to Station";
    prompt.message = device.clients.size() > 1 ? "" : device.stations();
    prompt.icon = ICON_WARNING;
    add_close_choices(device, prompt.choices);
    prompt.choices.push_back(cancel_choice());
    return prompt;
}

} // anonymous namespace

ConflictResolution resolve_conflict(const DevicePacket& device) {
    if (device.protocol_class() == ProtocolClass::LEGACY) {
        return resolve_legacy(device);
    }
    return resolve_current(device);
}

} // namespace riglink::client
