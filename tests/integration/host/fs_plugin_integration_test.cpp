#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "fixture_plugins.hpp"
#include "wph/host/engine_bridge.hpp"
#include "wph/host/shared_plugin_manager.hpp"

using namespace wph::host;
using namespace wph::test;
using nlohmann::json;
using wph::foundation::ErrorCode;

class FsPluginIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                (std::string("wph_fs_integration_") +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
        EngineBridge::Install(EngineBridge::RootedResolver(root_));

        auto loaded = manager_.LoadPlugin(kFsPlugin);
        ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
    }

    void TearDown() override {
        manager_.UnloadAll();
        EngineBridge::Uninstall();
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
    SharedPluginManager manager_{EngineBridge::Callbacks()};
};

TEST_F(FsPluginIntegrationTest, RegistersFsCommands) {
    auto info = manager_.GetPluginInfo("fs");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->commands.size(), 9u);
    EXPECT_EQ(manager_.FindPluginForCommand("read_file"), std::optional<std::string>("fs"));
}

TEST_F(FsPluginIntegrationTest, WidgetsAreIsolated) {
    auto written = manager_.CallCommand("write_file", "clock",
                                        json{{"path", "state.json"}, {"content", "{\"t\":1}"}});
    ASSERT_TRUE(written.hasValue()) << written.error().message();
    EXPECT_TRUE(std::filesystem::exists(root_ / "clock" / "state.json"));

    auto ownView = manager_.CallCommand("exists", "clock", json{{"path", "state.json"}});
    ASSERT_TRUE(ownView.hasValue());
    EXPECT_TRUE(ownView.value()["exists"].get<bool>());

    auto otherView = manager_.CallCommand("exists", "weather", json{{"path", "state.json"}});
    ASSERT_TRUE(otherView.hasValue());
    EXPECT_FALSE(otherView.value()["exists"].get<bool>());

    auto read = manager_.CallCommand("read_file", "clock", json{{"path", "state.json"}});
    ASSERT_TRUE(read.hasValue());
    EXPECT_EQ(read.value()["content"].get<std::string>(), "{\"t\":1}");
}

TEST_F(FsPluginIntegrationTest, EscapingWidgetDirFails) {
    std::ofstream(root_ / "secret.txt") << "top secret";

    auto read = manager_.CallCommand("read_file", "clock", json{{"path", "../secret.txt"}});
    ASSERT_TRUE(read.hasError());
    EXPECT_EQ(read.error().code(), ErrorCode::CommandFailed);

    auto badWidget = manager_.CallCommand("read_file", "..", json{{"path", "secret.txt"}});
    ASSERT_TRUE(badWidget.hasError());
    EXPECT_EQ(badWidget.error().code(), ErrorCode::CommandFailed);
}

TEST_F(FsPluginIntegrationTest, DirectoryLifecycle) {
    ASSERT_TRUE(manager_.CallCommand("create_dir", "notes",
                                     json{{"path", "2024/06"}, {"recursive", true}})
                    .hasValue());
    auto isDir = manager_.CallCommand("is_dir", "notes", json{{"path", "2024/06"}});
    ASSERT_TRUE(isDir.hasValue());
    EXPECT_TRUE(isDir.value()["is_dir"].get<bool>());

    ASSERT_TRUE(manager_.CallCommand("remove_dir", "notes", json{{"path", "2024"}}).hasValue());
    EXPECT_FALSE(std::filesystem::exists(root_ / "notes" / "2024"));
}

TEST_F(FsPluginIntegrationTest, ReadingDirectoryFailsCleanly) {
    std::filesystem::create_directories(root_ / "clock" / "sub");

    auto read = manager_.CallCommand("read_file", "clock", json{{"path", "sub"}});
    ASSERT_TRUE(read.hasError());
    EXPECT_EQ(read.error().code(), ErrorCode::CommandFailed);

    EXPECT_EQ(manager_.PluginCount(), 1u);
    auto isDir = manager_.CallCommand("is_dir", "clock", json{{"path", "sub"}});
    ASSERT_TRUE(isDir.hasValue());
    EXPECT_TRUE(isDir.value()["is_dir"].get<bool>());
}
