#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "wph/host/host_config.hpp"

using namespace wph::host;
using wph::foundation::ConfigManager;
using wph::foundation::ErrorCode;
using wph::foundation::HostLogger;
using wph::foundation::LogCategory;
using wph::foundation::LogLevel;

// ---------------------------------------------------------------------------
// LoadHostConfig
// ---------------------------------------------------------------------------

TEST(HostConfigTest, EmptyConfigKeepsDefaults) {
    ConfigManager config;
    auto result = LoadHostConfig(config);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().pluginDirectory.string(), "plugins");
    EXPECT_EQ(result.value().widgetsRoot.string(), "widgets");
    EXPECT_TRUE(result.value().logLevels.empty());
}

TEST(HostConfigTest, ReadsDirectoriesAndLogLevels) {
    ConfigManager config;
    ASSERT_TRUE(config
                    .loadFromString(R"(
plugins:
  directory: /opt/wph/plugins
widgets:
  root: /var/lib/wph/widgets
logging:
  loader: trace
  Plugin: warn
)")
                    .hasValue());

    auto result = LoadHostConfig(config);
    ASSERT_TRUE(result.hasValue());
    const auto& cfg = result.value();
    EXPECT_EQ(cfg.pluginDirectory.string(), "/opt/wph/plugins");
    EXPECT_EQ(cfg.widgetsRoot.string(), "/var/lib/wph/widgets");

    ASSERT_EQ(cfg.logLevels.size(), 2u);
    // keysUnder() is sorted: "Plugin" < "loader"
    EXPECT_EQ(cfg.logLevels[0].first, LogCategory::Plugin);
    EXPECT_EQ(cfg.logLevels[0].second, LogLevel::Warning);
    EXPECT_EQ(cfg.logLevels[1].first, LogCategory::Loader);
    EXPECT_EQ(cfg.logLevels[1].second, LogLevel::Trace);
}

TEST(HostConfigTest, UnknownCategoryIsRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("logging:\n  network: debug\n").hasValue());

    auto result = LoadHostConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(HostConfigTest, UnknownLevelIsRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("logging:\n  core: chatty\n").hasValue());

    auto result = LoadHostConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(HostConfigTest, NonScalarDirectoryIsTypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("plugins:\n  directory: [a, b]\n").hasValue());

    auto result = LoadHostConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(HostConfigTest, ApplyLogLevelsUpdatesLogger) {
    HostConfig cfg;
    cfg.logLevels.emplace_back(LogCategory::Engine, LogLevel::Error);

    HostLogger logger;
    ApplyLogLevels(cfg, logger);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Engine), LogLevel::Error);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

TEST(HostArgsTest, ParseArgValue) {
    char prog[] = "wph_host";
    char flag[] = "--config";
    char value[] = "custom.yaml";
    char* argv[] = {prog, flag, value};

    EXPECT_EQ(ParseArgValue(3, argv, "--config"), std::optional<std::string_view>("custom.yaml"));
    EXPECT_FALSE(ParseArgValue(3, argv, "--call").has_value());
    // A trailing flag has no value.
    EXPECT_FALSE(ParseArgValue(2, argv, "--config").has_value());
}

TEST(HostArgsTest, ResolveConfigPathPrecedence) {
    char prog[] = "wph_host";
    char flag[] = "--config";
    char value[] = "from_args.yaml";
    char* withFlag[] = {prog, flag, value};
    char* withoutFlag[] = {prog};

    ::unsetenv(kConfigPathEnv);
    EXPECT_EQ(ResolveConfigPath(1, withoutFlag).string(), kDefaultConfigPath);

    ::setenv(kConfigPathEnv, "from_env.yaml", 1);
    EXPECT_EQ(ResolveConfigPath(1, withoutFlag).string(), "from_env.yaml");
    EXPECT_EQ(ResolveConfigPath(3, withFlag).string(), "from_args.yaml");

    ::setenv(kConfigPathEnv, "", 1);
    EXPECT_EQ(ResolveConfigPath(1, withoutFlag).string(), kDefaultConfigPath);
    ::unsetenv(kConfigPathEnv);
}

TEST(HostArgsTest, EmptyEnvPathIsNotExplicit) {
    char prog[] = "wph_host";
    char flag[] = "--config";
    char value[] = "from_args.yaml";
    char* withFlag[] = {prog, flag, value};
    char* withoutFlag[] = {prog};

    ::unsetenv(kConfigPathEnv);
    EXPECT_FALSE(HasExplicitConfigPath(1, withoutFlag));
    EXPECT_TRUE(HasExplicitConfigPath(3, withFlag));

    ::setenv(kConfigPathEnv, "", 1);
    EXPECT_FALSE(HasExplicitConfigPath(1, withoutFlag));

    ::setenv(kConfigPathEnv, "from_env.yaml", 1);
    EXPECT_TRUE(HasExplicitConfigPath(1, withoutFlag));
    ::unsetenv(kConfigPathEnv);
}
