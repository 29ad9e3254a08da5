#include <gtest/gtest.h>
#include "common/connection_string.hpp"
#include "common/types.hpp"

using namespace riglink;

TEST(ConnectionStringTest, ParseKindAndSerial) {
    auto target = parse_connection_string("relay.123-456");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->kind, ConnectionKind::RELAY);
    EXPECT_EQ(target->serial, "123-456");
    EXPECT_EQ(target->station, "");
}

TEST(ConnectionStringTest, ParseBareSerialIsLocal) {
    auto target = parse_connection_string("123-456");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->kind, ConnectionKind::LOCAL);
    EXPECT_EQ(target->serial, "123-456");
    EXPECT_EQ(target->station, "");
}

TEST(ConnectionStringTest, ParseWithStation) {
    auto target = parse_connection_string("local.1234-5678.Windows");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->kind, ConnectionKind::LOCAL);
    EXPECT_EQ(target->serial, "1234-5678");
    EXPECT_EQ(target->station, "Windows");
}

TEST(ConnectionStringTest, WanIsRelay) {
    auto target = parse_connection_string("wan.1234");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->kind, ConnectionKind::RELAY);
}

TEST(ConnectionStringTest, TooManyParts) {
    auto target = parse_connection_string("a.b.c.d");
    ASSERT_FALSE(target.has_value());
    EXPECT_EQ(target.error(), ConnectionStringError::TOO_MANY_PARTS);
}

TEST(ConnectionStringTest, Empty) {
    auto target = parse_connection_string("");
    ASSERT_FALSE(target.has_value());
    EXPECT_EQ(target.error(), ConnectionStringError::EMPTY);
}

TEST(ConnectionStringTest, UnknownKind) {
    auto target = parse_connection_string("serial.1234");
    ASSERT_FALSE(target.has_value());
    EXPECT_EQ(target.error(), ConnectionStringError::UNKNOWN_KIND);
}

TEST(ConnectionStringTest, EmptySerial) {
    EXPECT_EQ(parse_connection_string("local.").error(), ConnectionStringError::EMPTY_SERIAL);
    EXPECT_EQ(parse_connection_string("relay..Mac").error(), ConnectionStringError::EMPTY_SERIAL);
}

TEST(ConnectionStringTest, DevicePacketConnectionStringParsesBack) {
    DevicePacket device;
    device.serial = "1715-4055-6500-9722";
    device.kind = ConnectionKind::RELAY;

    EXPECT_EQ(device.connection_string(), "relay.1715-4055-6500-9722");

    auto target = parse_connection_string(device.connection_string());
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->kind, device.kind);
    EXPECT_EQ(target->serial, device.serial);
}

TEST(ConnectionStringTest, MakeWithStation) {
    EXPECT_EQ(make_connection_string(ConnectionKind::LOCAL, "1234", "Mac"), "local.1234.Mac");
    EXPECT_EQ(make_connection_string(ConnectionKind::LOCAL, "1234"), "local.1234");

    ConnectionTarget target{ConnectionKind::RELAY, "1234", "iPad"};
    EXPECT_EQ(target.to_string(), "relay.1234.iPad");
}

TEST(ConnectionStringTest, DotInPartIsNotEncodable) {
    EXPECT_TRUE(is_encodable("1234-5678"));
    EXPECT_TRUE(is_encodable("1234-5678", "Bench"));
    EXPECT_FALSE(is_encodable("12.34"));
    EXPECT_FALSE(is_encodable("1234", "Shack.2"));
    EXPECT_FALSE(is_encodable(""));

    // What an unencodable serial would turn into
    auto target = parse_connection_string(make_connection_string(ConnectionKind::LOCAL, "12.34"));
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->serial, "12");
    EXPECT_EQ(target->station, "34");
}

// ============================================================================
// Device model
// ============================================================================

TEST(DeviceModelTest, UnknownStatusIsInUse) {
    EXPECT_EQ(device_status_from_string("available"), DeviceStatus::AVAILABLE);
    EXPECT_EQ(device_status_from_string("Available"), DeviceStatus::AVAILABLE);
    EXPECT_EQ(device_status_from_string("in_use"), DeviceStatus::IN_USE);
    EXPECT_EQ(device_status_from_string("update"), DeviceStatus::IN_USE);
    EXPECT_EQ(device_status_from_string(""), DeviceStatus::IN_USE);
}

TEST(DeviceModelTest, ClassifyVersion) {
    EXPECT_EQ(classify_version("2.4.9.2"), ProtocolClass::LEGACY);
    EXPECT_EQ(classify_version("1.0"), ProtocolClass::LEGACY);
    EXPECT_EQ(classify_version("3.2.31.1234"), ProtocolClass::CURRENT);
    EXPECT_EQ(classify_version("4"), ProtocolClass::CURRENT);
    EXPECT_EQ(classify_version(""), ProtocolClass::CURRENT);
    EXPECT_EQ(classify_version("v2.x"), ProtocolClass::CURRENT);
}

TEST(DeviceModelTest, StationsAreCommaJoined) {
    DevicePacket device;
    EXPECT_EQ(device.stations(), "");

    device.clients.push_back(ClientInfo{1, "Mac", std::nullopt});
    device.clients.push_back(ClientInfo{2, "iPad", std::string("abc")});
    EXPECT_EQ(device.stations(), "Mac,iPad");
}

TEST(DeviceModelTest, PendingDisconnectToString) {
    EXPECT_EQ(pending_disconnect_to_string(NoDisconnect{}), "none");
    EXPECT_EQ(pending_disconnect_to_string(CloseOne{7}), "close(7)");
    EXPECT_EQ(pending_disconnect_to_string(CloseTwo{1, 2}), "close(1,2)");
}
