#pragma once

#include "common/types.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace riglink {

// ============================================================================
// Connection String
// ============================================================================
//
// The only persisted representation of "which device to connect to":
//
//   "<kind>.<serial>"            e.g. "relay.1234-5678-9012-3456"
//   "<kind>.<serial>.<station>"  station only used by non-gui defaults
//   "<serial>"                   kind defaults to local
//
// <kind> is "local" or "relay" ("wan" is read as relay).

enum class ConnectionStringError {
    EMPTY,
    TOO_MANY_PARTS,
    UNKNOWN_KIND,
    EMPTY_SERIAL,
};

std::string connection_string_error_message(ConnectionStringError error);

struct ConnectionTarget {
    ConnectionKind kind = ConnectionKind::LOCAL;
    SerialNumber serial;
    std::string station;

    bool operator==(const ConnectionTarget&) const = default;

    std::string to_string() const;
};

std::expected<ConnectionTarget, ConnectionStringError> parse_connection_string(std::string_view str);

// '.' separates the parts, so a serial or station containing one does not
// parse back to the same target. Check with is_encodable() before persisting.
std::string make_connection_string(ConnectionKind kind, std::string_view serial,
                                   std::string_view station = {});

bool is_encodable(std::string_view serial, std::string_view station = {});

} // namespace riglink
