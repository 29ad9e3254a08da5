#pragma once

#include "common/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace riglink::client {

// ============================================================================
// Connection conflict resolution (gui mode)
// ============================================================================
//
// | protocol | status    | clients | outcome                                   |
// |----------|-----------|---------|-------------------------------------------|
// | legacy   | available | any     | connect                                   |
// | legacy   | in_use    | any     | prompt: close existing client / cancel    |
// | current  | available | 0       | connect                                   |
// | current  | available | >= 1    | prompt: close <station>.. / multiflex / cancel |
// | current  | in_use    | >= 1    | prompt: close <station>.. / cancel        |
// | current  | in_use    | 0       | blocked                                   |

enum class ChoiceKind {
    CLOSE,       // close the listed client(s), then connect
    MULTIFLEX,   // connect alongside the existing clients
    CANCEL,
};

struct ConflictChoice {
    std::string label;
    ChoiceKind kind = ChoiceKind::CANCEL;
    PendingDisconnect pending = NoDisconnect{};
};

struct ConnectNow {
    PendingDisconnect pending = NoDisconnect{};
};

struct ConflictPrompt {
    std::string title;
    std::string message;
    std::string icon;
    std::vector<ConflictChoice> choices;   // last one is always Cancel
};

// Nothing the user can choose: the device is busy and reports no client to close
struct ConnectBlocked {
    std::string title;
    std::string message;
    std::string icon;
};

using ConflictResolution = std::variant<ConnectNow, ConflictPrompt, ConnectBlocked>;

ConflictResolution resolve_conflict(const DevicePacket& device);

} // namespace riglink::client
