#include <gtest/gtest.h>
#include "client/prefs_store.hpp"

#include <filesystem>
#include <fstream>

using namespace riglink::client;

class PrefsStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("riglink_prefs_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(PrefsStoreTest, MissingFileKeepsDefaults) {
    PrefsStore store(dir_);
    EXPECT_FALSE(store.exists());
    EXPECT_TRUE(store.load());

    auto prefs = store.snapshot();
    EXPECT_FALSE(prefs.gui_enabled);
    EXPECT_FALSE(prefs.relay_enabled);
    EXPECT_FALSE(prefs.connect_to_first);
    EXPECT_TRUE(prefs.client_id.empty());
    EXPECT_TRUE(prefs.default_connection(true).empty());
}

TEST_F(PrefsStoreTest, SavedValuesSurviveReload) {
    {
        PrefsStore store(dir_);
        store.set_gui_enabled(true);
        store.set_default_connection(true, "local.1111");
        store.set_default_connection(false, "relay.2222.Mac");
        store.set_connect_to_first(true);
        store.set_relay_enabled(true);
        store.set_relay_email("op@example.com");
        store.set_relay_identity("Pat", "K1ABC");
        ASSERT_TRUE(store.save());
        EXPECT_EQ(store.path().string(), (dir_ / "prefs.json").string());
    }

    PrefsStore store(dir_);
    ASSERT_TRUE(store.load());
    auto prefs = store.snapshot();
    EXPECT_TRUE(prefs.gui_enabled);
    EXPECT_EQ(prefs.default_connection(true), "local.1111");
    EXPECT_EQ(prefs.default_connection(false), "relay.2222.Mac");
    EXPECT_TRUE(prefs.connect_to_first);
    EXPECT_TRUE(prefs.relay_enabled);
    EXPECT_EQ(prefs.relay_email, "op@example.com");
    EXPECT_EQ(prefs.relay_name, "Pat");
    EXPECT_EQ(prefs.relay_callsign, "K1ABC");
}

TEST_F(PrefsStoreTest, ClientIdGeneratedOnce) {
    std::string id;
    {
        PrefsStore store(dir_);
        id = store.ensure_client_id();
        EXPECT_EQ(id.size(), 36u);
        EXPECT_EQ(store.ensure_client_id(), id);
        ASSERT_TRUE(store.save());
    }

    PrefsStore store(dir_);
    ASSERT_TRUE(store.load());
    EXPECT_EQ(store.ensure_client_id(), id);
}

TEST_F(PrefsStoreTest, SaveLeavesNoTempFile) {
    PrefsStore store(dir_);
    ASSERT_TRUE(store.save());
    for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
        EXPECT_EQ(entry.path().filename().string(), "prefs.json");
    }
}

TEST_F(PrefsStoreTest, CorruptFileFailsToLoad) {
    std::filesystem::create_directories(dir_);
    {
        std::ofstream ofs(dir_ / "prefs.json");
        ofs << "{ not json";
    }
    PrefsStore store(dir_);
    EXPECT_FALSE(store.load());
    EXPECT_FALSE(store.last_error().empty());
    EXPECT_FALSE(store.snapshot().gui_enabled);
}

TEST(StateDirTest, ConfiguredDirectoryWins) {
    EXPECT_EQ(resolve_state_dir("/var/lib/riglink").string(), "/var/lib/riglink");
}

TEST(StateDirTest, EmptyFallsBackToPlatformDirectory) {
    auto dir = resolve_state_dir("");
    EXPECT_EQ(dir.string(), get_state_dir().string());
    EXPECT_FALSE(dir.empty());
}
