#include "client/picker.hpp"

#include <algorithm>
#include <tuple>

namespace riglink::client {

std::string PickerEntry::connection_string() const {
    return make_connection_string(kind, serial);
}

std::string PickerEntry::default_connection(bool gui) const {
    return gui ? make_connection_string(kind, serial) : make_connection_string(kind, serial, stations);
}

bool PickerEntry::operator<(const PickerEntry& other) const {
    return std::make_tuple(kind, to_lower(nickname), to_lower(stations)) <
           std::make_tuple(other.kind, to_lower(other.nickname), to_lower(other.stations));
}

namespace {

bool is_default_for(const std::optional<ConnectionTarget>& def, const DevicePacket& device,
                    const std::string* station) {
    if (!def || def->kind != device.kind || def->serial != device.serial) {
        return false;
    }
    return station == nullptr || def->station == *station;
}

} // anonymous namespace

std::vector<PickerEntry> build_picker_entries(const std::vector<DevicePacket>& devices,
                                              bool gui, const std::string& default_connection) {
    std::optional<ConnectionTarget> def;
    if (!default_connection.empty()) {
        if (auto parsed = parse_connection_string(default_connection)) {
            def = *parsed;
        }
    }

    std::vector<PickerEntry> entries;
    size_t id = 0;
    for (size_t i = 0; i < devices.size(); ++i) {
        const auto& device = devices[i];

        auto make_entry = [&](std::string stations, bool is_default) {
            PickerEntry entry;
            entry.id = id++;
            entry.device_index = i;
            entry.kind = device.kind;
            entry.nickname = device.nickname;
            entry.status = device.status;
            entry.stations = std::move(stations);
            entry.serial = device.serial;
            entry.is_default = is_default;
            return entry;
        };

        if (gui) {
            entries.push_back(make_entry(device.stations(), is_default_for(def, device, nullptr)));
        } else {
            for (const auto& client : device.clients) {
                entries.push_back(make_entry(client.station, is_default_for(def, device, &client.station)));
            }
        }
    }

    std::stable_sort(entries.begin(), entries.end());
    return entries;
}

std::optional<size_t> find_matching_entry(const std::vector<PickerEntry>& entries,
                                          const ConnectionTarget& target, bool gui) {
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (entry.kind != target.kind || entry.serial != target.serial) {
            continue;
        }
        if (gui || entry.stations == target.station) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace riglink::client
