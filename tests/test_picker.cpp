#include <gtest/gtest.h>
#include "client/picker.hpp"

#include <algorithm>

using namespace riglink;
using namespace riglink::client;

namespace {

DevicePacket make_device(ConnectionKind kind, const std::string& serial, const std::string& nickname,
                         std::vector<ClientInfo> clients = {}) {
    DevicePacket device;
    device.kind = kind;
    device.serial = serial;
    device.nickname = nickname;
    device.clients = std::move(clients);
    device.version = "3.2.31";
    return device;
}

PickerEntry make_entry(ConnectionKind kind, const std::string& nickname, const std::string& stations) {
    PickerEntry entry;
    entry.kind = kind;
    entry.nickname = nickname;
    entry.stations = stations;
    return entry;
}

} // anonymous namespace

TEST(PickerTest, SortByKindNameStation) {
    std::vector<PickerEntry> entries = {
        make_entry(ConnectionKind::RELAY, "Zeta", ""),
        make_entry(ConnectionKind::LOCAL, "alpha", "b"),
        make_entry(ConnectionKind::LOCAL, "alpha", ""),
    };
    std::sort(entries.begin(), entries.end());

    EXPECT_EQ(entries[0].kind, ConnectionKind::LOCAL);
    EXPECT_EQ(entries[0].stations, "");
    EXPECT_EQ(entries[1].kind, ConnectionKind::LOCAL);
    EXPECT_EQ(entries[1].stations, "b");
    EXPECT_EQ(entries[2].kind, ConnectionKind::RELAY);
    EXPECT_EQ(entries[2].nickname, "Zeta");
}

TEST(PickerTest, NameComparisonIgnoresCase) {
    auto upper = make_entry(ConnectionKind::LOCAL, "Bravo", "");
    auto lower = make_entry(ConnectionKind::LOCAL, "alpha", "");
    EXPECT_TRUE(lower < upper);
    EXPECT_FALSE(upper < lower);
}

TEST(PickerTest, GuiModeOneEntryPerDevice) {
    std::vector<DevicePacket> devices = {
        make_device(ConnectionKind::RELAY, "2222", "Remote"),
        make_device(ConnectionKind::LOCAL, "1111", "Shack",
                    {ClientInfo{1, "Mac", std::nullopt}, ClientInfo{2, "iPad", std::nullopt}}),
    };

    auto entries = build_picker_entries(devices, true, "relay.2222");
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].serial, "1111");
    EXPECT_EQ(entries[0].device_index, 1u);
    EXPECT_EQ(entries[0].stations, "Mac,iPad");
    EXPECT_FALSE(entries[0].is_default);

    EXPECT_EQ(entries[1].serial, "2222");
    EXPECT_EQ(entries[1].device_index, 0u);
    EXPECT_TRUE(entries[1].is_default);
}

TEST(PickerTest, NonGuiModeOneEntryPerClient) {
    std::vector<DevicePacket> devices = {
        make_device(ConnectionKind::LOCAL, "1111", "Shack",
                    {ClientInfo{1, "iPad", std::nullopt}, ClientInfo{2, "Mac", std::nullopt}}),
        make_device(ConnectionKind::LOCAL, "3333", "Portable"),
    };

    auto entries = build_picker_entries(devices, false, "local.1111.Mac");
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].stations, "iPad");
    EXPECT_FALSE(entries[0].is_default);
    EXPECT_EQ(entries[1].stations, "Mac");
    EXPECT_TRUE(entries[1].is_default);
    EXPECT_EQ(entries[1].device_index, 0u);
}

TEST(PickerTest, LegacyWanDefaultMarksRelayEntry) {
    std::vector<DevicePacket> devices = {make_device(ConnectionKind::RELAY, "2222", "Remote")};
    auto entries = build_picker_entries(devices, true, "wan.2222");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].is_default);
}

TEST(PickerTest, DefaultConnectionPerMode) {
    auto entry = make_entry(ConnectionKind::LOCAL, "Shack", "Mac");
    entry.serial = "1111";
    EXPECT_EQ(entry.default_connection(true), "local.1111");
    EXPECT_EQ(entry.default_connection(false), "local.1111.Mac");
}

TEST(PickerTest, MatchGuiIgnoresStation) {
    std::vector<DevicePacket> devices = {
        make_device(ConnectionKind::LOCAL, "1111", "Shack", {ClientInfo{1, "Mac", std::nullopt}}),
        make_device(ConnectionKind::RELAY, "1111", "Shack"),
    };
    auto entries = build_picker_entries(devices, true, "");

    auto index = find_matching_entry(entries, ConnectionTarget{ConnectionKind::RELAY, "1111", "Other"}, true);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(entries[*index].kind, ConnectionKind::RELAY);

    EXPECT_FALSE(find_matching_entry(entries, ConnectionTarget{ConnectionKind::LOCAL, "9999", ""}, true));
}

TEST(PickerTest, MatchNonGuiRequiresStation) {
    std::vector<DevicePacket> devices = {
        make_device(ConnectionKind::LOCAL, "1111", "Shack",
                    {ClientInfo{1, "Mac", std::nullopt}, ClientInfo{2, "iPad", std::nullopt}}),
    };
    auto entries = build_picker_entries(devices, false, "");

    auto index = find_matching_entry(entries, ConnectionTarget{ConnectionKind::LOCAL, "1111", "iPad"}, false);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(entries[*index].stations, "iPad");

    EXPECT_FALSE(find_matching_entry(entries, ConnectionTarget{ConnectionKind::LOCAL, "1111", "Windows"}, false));
}
