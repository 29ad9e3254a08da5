#pragma once

#include "common/connection_string.hpp"
#include "common/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace riglink::client {

// ============================================================================
// Picker Entry
// ============================================================================

// One selectable row: a device in gui mode, an attached station in non-gui mode
struct PickerEntry {
    size_t id = 0;              // ordinal before sorting
    size_t device_index = 0;    // index into the discovery snapshot
    ConnectionKind kind = ConnectionKind::LOCAL;
    std::string nickname;
    DeviceStatus status = DeviceStatus::AVAILABLE;
    std::string stations;       // gui: all stations comma-joined, non-gui: this station
    SerialNumber serial;
    bool is_default = false;

    // "<kind>.<serial>"
    std::string connection_string() const;

    // What set_default() persists for this row in the given mode
    std::string default_connection(bool gui) const;

    // kind, then name and station case-insensitively; local sorts before relay
    bool operator<(const PickerEntry& other) const;
};

// Build the sorted picker list for the current mode.
// `default_connection` is the stored default for that mode (may be empty).
std::vector<PickerEntry> build_picker_entries(const std::vector<DevicePacket>& devices,
                                              bool gui, const std::string& default_connection);

// Position in `entries` matching the target: (kind, serial), plus station in non-gui mode
std::optional<size_t> find_matching_entry(const std::vector<PickerEntry>& entries,
                                          const ConnectionTarget& target, bool gui);

} // namespace riglink::client
