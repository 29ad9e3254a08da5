#include <gtest/gtest.h>
#include "client/conflict_resolver.hpp"

#include <algorithm>

using namespace riglink;
using namespace riglink::client;

namespace {

DevicePacket make_device(const std::string& version, DeviceStatus status, size_t clients) {
    DevicePacket device;
    device.serial = "1234-5678";
    device.version = version;
    device.status = status;
    const char* stations[] = {"Mac", "iPad", "Windows"};
    for (size_t i = 0; i < clients; ++i) {
        device.clients.push_back(ClientInfo{static_cast<ClientHandle>(0x100 + i), stations[i % 3], std::nullopt});
    }
    return device;
}

size_t count_kind(const ConflictPrompt& prompt, ChoiceKind kind) {
    return static_cast<size_t>(std::count_if(prompt.choices.begin(), prompt.choices.end(),
                                             [kind](const ConflictChoice& c) { return c.kind == kind; }));
}

} // anonymous namespace

TEST(ConflictResolverTest, LegacyAvailableConnects) {
    for (size_t clients : {0u, 1u, 2u}) {
        auto result = resolve_conflict(make_device("2.4.9", DeviceStatus::AVAILABLE, clients));
        ASSERT_TRUE(std::holds_alternative<ConnectNow>(result));
        EXPECT_EQ(std::get<ConnectNow>(result).pending, PendingDisconnect{NoDisconnect{}});
    }
}

TEST(ConflictResolverTest, LegacyInUseOffersOneClose) {
    auto result = resolve_conflict(make_device("2.4.9", DeviceStatus::IN_USE, 1));
    ASSERT_TRUE(std::holds_alternative<ConflictPrompt>(result));

    const auto& prompt = std::get<ConflictPrompt>(result);
    ASSERT_EQ(prompt.choices.size(), 2u);
    EXPECT_EQ(prompt.choices[0].kind, ChoiceKind::CLOSE);
    EXPECT_EQ(prompt.choices[0].pending, PendingDisconnect{CloseOne{0x100}});
    EXPECT_EQ(prompt.choices[1].kind, ChoiceKind::CANCEL);
}

TEST(ConflictResolverTest, LegacyInUseWithoutClientListClosesOwner) {
    auto result = resolve_conflict(make_device("1.9", DeviceStatus::IN_USE, 0));
    ASSERT_TRUE(std::holds_alternative<ConflictPrompt>(result));
    const auto& prompt = std::get<ConflictPrompt>(result);
    EXPECT_EQ(count_kind(prompt, ChoiceKind::CLOSE), 1u);
    EXPECT_EQ(prompt.choices[0].pending, PendingDisconnect{CloseOne{0}});
}

TEST(ConflictResolverTest, LegacyInUseWithTwoClientsClosesBoth) {
    auto result = resolve_conflict(make_device("2.0", DeviceStatus::IN_USE, 2));
    const auto& prompt = std::get<ConflictPrompt>(result);
    EXPECT_EQ(count_kind(prompt, ChoiceKind::CLOSE), 1u);
    EXPECT_EQ(prompt.choices[0].pending, (PendingDisconnect{CloseTwo{0x100, 0x101}}));
}

TEST(ConflictResolverTest, CurrentAvailableNoClientsConnects) {
    auto result = resolve_conflict(make_device("3.2.31", DeviceStatus::AVAILABLE, 0));
    EXPECT_TRUE(std::holds_alternative<ConnectNow>(result));
}

TEST(ConflictResolverTest, CurrentAvailableWithClientOffersMultiflex) {
    auto result = resolve_conflict(make_device("3.2.31", DeviceStatus::AVAILABLE, 1));
    ASSERT_TRUE(std::holds_alternative<ConflictPrompt>(result));

    const auto& prompt = std::get<ConflictPrompt>(result);
    EXPECT_EQ(prompt.title, "Device is connected to Station");
    EXPECT_EQ(prompt.message, "Mac");
    ASSERT_EQ(prompt.choices.size(), 3u);
    EXPECT_EQ(prompt.choices[0].label, "Close Mac");
    EXPECT_EQ(prompt.choices[0].pending, PendingDisconnect{CloseOne{0x100}});
    EXPECT_EQ(prompt.choices[1].label, "Multiflex Connect");
    EXPECT_EQ(prompt.choices[1].kind, ChoiceKind::MULTIFLEX);
    EXPECT_EQ(prompt.choices[1].pending, PendingDisconnect{NoDisconnect{}});
    EXPECT_EQ(prompt.choices[2].kind, ChoiceKind::CANCEL);
}

TEST(ConflictResolverTest, CurrentInUseTwoClientsOffersBothCloses) {
    auto result = resolve_conflict(make_device("3.2.31", DeviceStatus::IN_USE, 2));
    ASSERT_TRUE(std::holds_alternative<ConflictPrompt>(result));

    const auto& prompt = std::get<ConflictPrompt>(result);
    EXPECT_EQ(prompt.title, "Device is connected to multiple Stations");
    ASSERT_EQ(prompt.choices.size(), 3u);
    EXPECT_EQ(count_kind(prompt, ChoiceKind::CLOSE), 2u);
    EXPECT_EQ(count_kind(prompt, ChoiceKind::MULTIFLEX), 0u);
    EXPECT_EQ(prompt.choices[0].label, "Close Mac");
    EXPECT_EQ(prompt.choices[0].pending, PendingDisconnect{CloseOne{0x100}});
    EXPECT_EQ(prompt.choices[1].label, "Close iPad");
    EXPECT_EQ(prompt.choices[1].pending, PendingDisconnect{CloseOne{0x101}});
    EXPECT_EQ(prompt.choices.back().kind, ChoiceKind::CANCEL);
}

TEST(ConflictResolverTest, CurrentInUseNoClientsBlocked) {
    auto result = resolve_conflict(make_device("3.2.31", DeviceStatus::IN_USE, 0));
    ASSERT_TRUE(std::holds_alternative<ConnectBlocked>(result));
    EXPECT_EQ(std::get<ConnectBlocked>(result).title, "Device is in use");
}
