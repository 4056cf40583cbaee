#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>

#include <kcenon/common/interfaces/global_logger_registry.h>

#include "wph/foundation/host_logger.hpp"
#include "wph/host/console_logger.hpp"
#include "wph/host/engine_bridge.hpp"
#include "wph/plugin/engine_interface.hpp"

using namespace wph::host;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::log_level;
using wph::foundation::ErrorCode;
using wph::foundation::HostError;
using wph::foundation::HostLogger;
using wph::foundation::HostResult;
using wph::foundation::LogCategory;
using wph::foundation::LogLevel;
using wph::plugin::EngineInterface;

class EngineBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        console_ = std::make_shared<ConsoleLogger>(output_);
        registry.set_default_logger(console_);
        HostLogger::instance().setCategoryLevel(LogCategory::Plugin, LogLevel::Trace);
        EngineBridge::Uninstall();
    }

    void TearDown() override {
        EngineBridge::Uninstall();
        HostLogger::instance().setCategoryLevel(LogCategory::Plugin, LogLevel::Info);
        GlobalLoggerRegistry::instance().clear();
    }

    std::ostringstream output_;
    std::shared_ptr<ConsoleLogger> console_;
};

// ---------------------------------------------------------------------------
// widget_dir
// ---------------------------------------------------------------------------

TEST_F(EngineBridgeTest, WidgetDirFailsWithoutResolver) {
    EXPECT_FALSE(EngineBridge::IsInstalled());
    EngineInterface engine(EngineBridge::Callbacks());

    auto dir = engine.WidgetDir("clock");
    ASSERT_TRUE(dir.hasError());
    EXPECT_EQ(dir.error().code(), ErrorCode::CallbackFailed);
}

TEST_F(EngineBridgeTest, WidgetDirUsesInstalledResolver) {
    EngineBridge::Install([](std::string_view id) {
        return HostResult<std::filesystem::path>::ok(std::filesystem::path("/srv/widgets") /
                                                     std::string(id));
    });
    EXPECT_TRUE(EngineBridge::IsInstalled());

    EngineInterface engine(EngineBridge::Callbacks());
    auto dir = engine.WidgetDir("clock");
    ASSERT_TRUE(dir.hasValue());
    EXPECT_EQ(dir.value().string(), "/srv/widgets/clock");
}

TEST_F(EngineBridgeTest, ResolverErrorBecomesStatusError) {
    EngineBridge::Install([](std::string_view) {
        return HostResult<std::filesystem::path>::err(
            HostError(ErrorCode::InvalidWidgetId, "no such widget"));
    });

    auto callbacks = EngineBridge::Callbacks();
    char* out = nullptr;
    EXPECT_EQ(callbacks.widget_dir("clock", &out), WPH_STATUS_ERROR);
    EXPECT_EQ(out, nullptr);
}

TEST_F(EngineBridgeTest, WidgetDirRejectsNullArguments) {
    auto callbacks = EngineBridge::Callbacks();
    char* out = nullptr;
    EXPECT_EQ(callbacks.widget_dir(nullptr, &out), WPH_STATUS_INVALID_ARGUMENT);
    EXPECT_EQ(callbacks.widget_dir("clock", nullptr), WPH_STATUS_INVALID_ARGUMENT);
}

TEST_F(EngineBridgeTest, WidgetDirStringIsMallocOwned) {
    EngineBridge::Install(EngineBridge::RootedResolver("/tmp/widgets"));

    auto callbacks = EngineBridge::Callbacks();
    char* out = nullptr;
    ASSERT_EQ(callbacks.widget_dir("clock", &out), WPH_STATUS_OK);
    ASSERT_NE(out, nullptr);
    EXPECT_STREQ(out, "/tmp/widgets/clock");
    std::free(out);
}

TEST_F(EngineBridgeTest, UninstallRemovesResolver) {
    EngineBridge::Install(EngineBridge::RootedResolver("/tmp/widgets"));
    EngineBridge::Uninstall();
    EXPECT_FALSE(EngineBridge::IsInstalled());

    EngineInterface engine(EngineBridge::Callbacks());
    EXPECT_TRUE(engine.WidgetDir("clock").hasError());
}

// ---------------------------------------------------------------------------
// log
// ---------------------------------------------------------------------------

TEST_F(EngineBridgeTest, LogRoutesToPluginCategory) {
    EngineInterface engine(EngineBridge::Callbacks());
    engine.LogWarn("disk almost full");
    engine.LogDebug("tick");

    EXPECT_EQ(output_.str(), "WARN [Plugin] disk almost full\nDEBUG [Plugin] tick\n");
}

TEST_F(EngineBridgeTest, UnknownLevelLogsAsInfo) {
    auto callbacks = EngineBridge::Callbacks();
    callbacks.log(42, "odd level");
    callbacks.log(WPH_LOG_LEVEL_ERROR, nullptr);

    EXPECT_EQ(output_.str(), "INFO [Plugin] odd level\n");
}

TEST_F(EngineBridgeTest, PluginCategoryLevelFilters) {
    HostLogger::instance().setCategoryLevel(LogCategory::Plugin, LogLevel::Error);
    EngineInterface engine(EngineBridge::Callbacks());
    engine.LogInfo("quiet");
    engine.LogError("loud");

    EXPECT_EQ(output_.str(), "ERROR [Plugin] loud\n");
}

// ---------------------------------------------------------------------------
// RootedResolver
// ---------------------------------------------------------------------------

TEST(RootedResolverTest, JoinsRootAndId) {
    auto resolver = EngineBridge::RootedResolver("/data/widgets/");
    auto dir = resolver("weather");
    ASSERT_TRUE(dir.hasValue());
    EXPECT_EQ(dir.value().string(), "/data/widgets/weather");
}

TEST(RootedResolverTest, RelativeRootBecomesAbsolute) {
    auto resolver = EngineBridge::RootedResolver("widgets");
    auto dir = resolver("clock");
    ASSERT_TRUE(dir.hasValue());
    EXPECT_TRUE(dir.value().is_absolute());
    EXPECT_EQ(dir.value().filename().string(), "clock");
}

TEST(RootedResolverTest, RejectsIdsThatAreNotOneComponent) {
    auto resolver = EngineBridge::RootedResolver("/data/widgets");
    for (const char* id : {"", ".", "..", "a/b", "../etc", "a\\b"}) {
        auto dir = resolver(id);
        ASSERT_TRUE(dir.hasError()) << id;
        EXPECT_EQ(dir.error().code(), ErrorCode::InvalidWidgetId) << id;
    }
}

// ---------------------------------------------------------------------------
// ConsoleLogger
// ---------------------------------------------------------------------------

TEST(ConsoleLoggerTest, WritesLevelTaggedLines) {
    std::ostringstream out;
    ConsoleLogger logger(out);
    EXPECT_TRUE(logger.log(log_level::info, std::string("hello")).is_ok());
    EXPECT_TRUE(logger.log(log_level::critical, std::string("boom")).is_ok());
    EXPECT_EQ(out.str(), "INFO hello\nCRIT boom\n");
}

TEST(ConsoleLoggerTest, LevelFilterDropsLowerEntries) {
    std::ostringstream out;
    ConsoleLogger logger(out);
    EXPECT_TRUE(logger.set_level(log_level::warning).is_ok());
    EXPECT_EQ(logger.get_level(), log_level::warning);
    EXPECT_FALSE(logger.is_enabled(log_level::info));

    logger.log(log_level::info, std::string("ignored"));
    logger.log(log_level::error, std::string("kept"));
    EXPECT_EQ(out.str(), "ERROR kept\n");
}
