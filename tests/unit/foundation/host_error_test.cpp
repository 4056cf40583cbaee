#include <gtest/gtest.h>

#include <string>

#include "wph/foundation/error_code.hpp"
#include "wph/foundation/host_error.hpp"
#include "wph/foundation/host_result.hpp"

using namespace wph::foundation;

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::NotImplemented), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::PluginConflict), "Plugin");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::UnknownCommand), "Dispatch");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidWidgetId), "Callback");
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0xFF00)), "Unknown");
}

TEST(ErrorCodeTest, LoadErrorClassification) {
    EXPECT_TRUE(isLoadError(ErrorCode::PluginLoadFailed));
    EXPECT_TRUE(isLoadError(ErrorCode::PluginInitFailed));
    EXPECT_TRUE(isLoadError(ErrorCode::PluginVersionMismatch));
    EXPECT_FALSE(isLoadError(ErrorCode::PluginConflict));
    EXPECT_FALSE(isLoadError(ErrorCode::PluginNotFound));
}

TEST(ErrorCodeTest, ConflictAndDispatchClassification) {
    EXPECT_TRUE(isConflictError(ErrorCode::PluginConflict));
    EXPECT_FALSE(isConflictError(ErrorCode::PluginLoadFailed));

    EXPECT_TRUE(isDispatchError(ErrorCode::DispatchFailed));
    EXPECT_TRUE(isDispatchError(ErrorCode::UnknownCommand));
    EXPECT_TRUE(isDispatchError(ErrorCode::InvalidPayload));
    EXPECT_TRUE(isDispatchError(ErrorCode::InvalidResult));
    EXPECT_TRUE(isDispatchError(ErrorCode::CommandFailed));
    EXPECT_FALSE(isDispatchError(ErrorCode::CallbackFailed));

    EXPECT_TRUE(isCallbackError(ErrorCode::CallbackFailed));
    EXPECT_TRUE(isCallbackError(ErrorCode::InvalidWidgetId));
    EXPECT_FALSE(isCallbackError(ErrorCode::UnknownCommand));
}

TEST(HostErrorTest, CodeMessageAndSubsystem) {
    HostError err(ErrorCode::PluginNotFound, "Plugin not found: fs");
    EXPECT_EQ(err.code(), ErrorCode::PluginNotFound);
    EXPECT_EQ(err.message(), "Plugin not found: fs");
    EXPECT_EQ(err.subsystem(), "Plugin");
    EXPECT_FALSE(err.isSuccess());
    EXPECT_FALSE(err.hasContext());
}

TEST(HostErrorTest, TypedContext) {
    HostError err(ErrorCode::CommandFailed, "failed", std::string("libecho.so"));
    ASSERT_TRUE(err.hasContext());
    ASSERT_NE(err.context<std::string>(), nullptr);
    EXPECT_EQ(*err.context<std::string>(), "libecho.so");
    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(HostResultTest, CarriesHostError) {
    auto result = HostResult<int>::err(HostError(ErrorCode::UnknownCommand, "Unknown command: x"));
    ASSERT_TRUE(result.hasError());
    EXPECT_TRUE(isDispatchError(result.error().code()));
    EXPECT_EQ(result.error().message(), "Unknown command: x");
}
