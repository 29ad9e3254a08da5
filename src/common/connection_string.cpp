#include "common/connection_string.hpp"

#include <vector>

namespace riglink {

std::string connection_string_error_message(ConnectionStringError error) {
    switch (error) {
        case ConnectionStringError::EMPTY: return "Connection string is empty";
        case ConnectionStringError::TOO_MANY_PARTS: return "Connection string has too many parts";
        case ConnectionStringError::UNKNOWN_KIND: return "Unknown connection kind";
        case ConnectionStringError::EMPTY_SERIAL: return "Serial number is empty";
        default: return "Invalid connection string";
    }
}

std::string ConnectionTarget::to_string() const {
    return make_connection_string(kind, serial, station);
}

std::expected<ConnectionTarget, ConnectionStringError> parse_connection_string(std::string_view str) {
    if (str.empty()) {
        return std::unexpected(ConnectionStringError::EMPTY);
    }

    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        auto dot = str.find('.', start);
        parts.push_back(str.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start));
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }

    if (parts.size() > 3) {
        return std::unexpected(ConnectionStringError::TOO_MANY_PARTS);
    }

    ConnectionTarget target;
    if (parts.size() == 1) {
        // bare serial number
        target.kind = ConnectionKind::LOCAL;
        target.serial = std::string(parts[0]);
    } else {
        auto kind = connection_kind_from_string(parts[0]);
        if (!kind) {
            return std::unexpected(ConnectionStringError::UNKNOWN_KIND);
        }
        target.kind = *kind;
        target.serial = std::string(parts[1]);
        if (parts.size() == 3) {
            target.station = std::string(parts[2]);
        }
    }

    if (target.serial.empty()) {
        return std::unexpected(ConnectionStringError::EMPTY_SERIAL);
    }
    return target;
}

std::string make_connection_string(ConnectionKind kind, std::string_view serial,
                                   std::string_view station) {
    std::string result = connection_kind_name(kind);
    result += ".";
    result += serial;
    if (!station.empty()) {
        result += ".";
        result += station;
    }
    return result;
}

bool is_encodable(std::string_view serial, std::string_view station) {
    return !serial.empty() && serial.find('.') == std::string_view::npos &&
           station.find('.') == std::string_view::npos;
}

} // namespace riglink
