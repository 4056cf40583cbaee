#include <gtest/gtest.h>

#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "wph/plugin/engine_interface.hpp"

using namespace wph::plugin;
using wph::foundation::ErrorCode;

// ---------------------------------------------------------------------------
// C callback stubs
// ---------------------------------------------------------------------------

namespace {

std::string gLastWidgetId;
std::vector<std::pair<int32_t, std::string>> gLogRecords;

char* mallocCopy(const char* text) {
    auto len = std::strlen(text);
    auto* out = static_cast<char*>(std::malloc(len + 1));
    std::memcpy(out, text, len + 1);
    return out;
}

int32_t widgetDirOk(const char* widgetId, char** out) {
    gLastWidgetId = widgetId;
    *out = mallocCopy(("/widgets/" + std::string(widgetId)).c_str());
    return WPH_STATUS_OK;
}

int32_t widgetDirFails(const char* /*widgetId*/, char** /*out*/) {
    return WPH_STATUS_ERROR;
}

int32_t widgetDirReturnsNull(const char* /*widgetId*/, char** out) {
    *out = nullptr;
    return WPH_STATUS_OK;
}

int32_t widgetDirReturnsInvalidUtf8(const char* /*widgetId*/, char** out) {
    *out = mallocCopy("/widgets/\xFF");
    return WPH_STATUS_OK;
}

void recordLog(int32_t level, const char* message) {
    gLogRecords.emplace_back(level, message);
}

}  // namespace

class EngineInterfaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        gLastWidgetId.clear();
        gLogRecords.clear();
    }
};

// ---------------------------------------------------------------------------
// Log levels
// ---------------------------------------------------------------------------

TEST(EngineLogLevelTest, FromIntMapsKnownValues) {
    EXPECT_EQ(EngineLogLevelFromInt(0), EngineLogLevel::Error);
    EXPECT_EQ(EngineLogLevelFromInt(1), EngineLogLevel::Warn);
    EXPECT_EQ(EngineLogLevelFromInt(2), EngineLogLevel::Info);
    EXPECT_EQ(EngineLogLevelFromInt(3), EngineLogLevel::Debug);
    EXPECT_EQ(EngineLogLevelFromInt(4), EngineLogLevel::Trace);
}

TEST(EngineLogLevelTest, OutOfRangeIsInfo) {
    EXPECT_EQ(EngineLogLevelFromInt(-1), EngineLogLevel::Info);
    EXPECT_EQ(EngineLogLevelFromInt(5), EngineLogLevel::Info);
    EXPECT_EQ(EngineLogLevelFromInt(1000), EngineLogLevel::Info);
}

// ---------------------------------------------------------------------------
// WidgetDir
// ---------------------------------------------------------------------------

TEST_F(EngineInterfaceTest, WidgetDirReturnsHostPath) {
    EngineInterface engine(WphEngineCallbacks{&widgetDirOk, &recordLog});
    auto dir = engine.WidgetDir("clock");
    ASSERT_TRUE(dir.hasValue());
    EXPECT_EQ(dir.value(), std::filesystem::path("/widgets/clock"));
    EXPECT_EQ(gLastWidgetId, "clock");
}

TEST_F(EngineInterfaceTest, WidgetDirRejectsInteriorNul) {
    EngineInterface engine(WphEngineCallbacks{&widgetDirOk, &recordLog});
    auto dir = engine.WidgetDir(std::string("clo\0ck", 6));
    ASSERT_TRUE(dir.hasError());
    EXPECT_TRUE(wph::foundation::isCallbackError(dir.error().code()));
    EXPECT_TRUE(gLastWidgetId.empty());
}

TEST_F(EngineInterfaceTest, WidgetDirHostFailure) {
    EngineInterface engine(WphEngineCallbacks{&widgetDirFails, &recordLog});
    auto dir = engine.WidgetDir("clock");
    ASSERT_TRUE(dir.hasError());
    EXPECT_EQ(dir.error().code(), ErrorCode::CallbackFailed);
}

TEST_F(EngineInterfaceTest, WidgetDirNullOutput) {
    EngineInterface engine(WphEngineCallbacks{&widgetDirReturnsNull, &recordLog});
    auto dir = engine.WidgetDir("clock");
    ASSERT_TRUE(dir.hasError());
    EXPECT_EQ(dir.error().code(), ErrorCode::CallbackFailed);
}

TEST_F(EngineInterfaceTest, WidgetDirInvalidUtf8) {
    EngineInterface engine(WphEngineCallbacks{&widgetDirReturnsInvalidUtf8, &recordLog});
    auto dir = engine.WidgetDir("clock");
    ASSERT_TRUE(dir.hasError());
    EXPECT_EQ(dir.error().code(), ErrorCode::CallbackFailed);
}

TEST_F(EngineInterfaceTest, WidgetDirWithoutCallback) {
    EngineInterface engine;
    auto dir = engine.WidgetDir("clock");
    ASSERT_TRUE(dir.hasError());
    EXPECT_EQ(dir.error().code(), ErrorCode::CallbackFailed);
}

// ---------------------------------------------------------------------------
// Log
// ---------------------------------------------------------------------------

TEST_F(EngineInterfaceTest, LogForwardsLevelAndMessage) {
    EngineInterface engine(WphEngineCallbacks{&widgetDirOk, &recordLog});
    engine.LogWarn("disk almost full");
    engine.LogTrace("tick");

    ASSERT_EQ(gLogRecords.size(), 2u);
    EXPECT_EQ(gLogRecords[0].first, WPH_LOG_LEVEL_WARN);
    EXPECT_EQ(gLogRecords[0].second, "disk almost full");
    EXPECT_EQ(gLogRecords[1].first, WPH_LOG_LEVEL_TRACE);
}

TEST_F(EngineInterfaceTest, UnrepresentableMessagesAreDropped) {
    EngineInterface engine(WphEngineCallbacks{&widgetDirOk, &recordLog});
    engine.LogInfo(std::string("a\0b", 3));
    engine.LogInfo("\xC3");
    EXPECT_TRUE(gLogRecords.empty());
}

TEST_F(EngineInterfaceTest, LogWithoutCallbackIsNoOp) {
    EngineInterface engine;
    engine.LogError("nobody listens");
    EXPECT_TRUE(gLogRecords.empty());
}
