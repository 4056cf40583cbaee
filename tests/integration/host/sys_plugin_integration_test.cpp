#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include "fixture_plugins.hpp"
#include "wph/host/engine_bridge.hpp"
#include "wph/host/shared_plugin_manager.hpp"

using namespace wph::host;
using namespace wph::test;
using nlohmann::json;

class SysPluginIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto loaded = manager_.LoadPlugin(kSysPlugin);
        ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
    }

    void TearDown() override { manager_.UnloadAll(); }

    SharedPluginManager manager_{EngineBridge::Callbacks()};
};

TEST_F(SysPluginIntegrationTest, RegistersGetSystemInfo) {
    auto info = manager_.GetPluginInfo("sys");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->commands, (std::vector<std::string>{"get_system_info"}));
}

TEST_F(SysPluginIntegrationTest, SnapshotCrossesTheLibraryBoundary) {
    for (int i = 0; i < 2; ++i) {
        auto result = manager_.CallCommand("get_system_info", "clock", json(nullptr));
        ASSERT_TRUE(result.hasValue()) << result.error().message();
        const auto& info = result.value();

        for (const char* field : {"totalSwap", "usedSwap", "systemName", "kernelVersion",
                                  "osVersion", "hostName", "cpuCount", "cpuInfo", "disks",
                                  "networks", "totalMemory", "usedMemory"}) {
            EXPECT_TRUE(info.contains(field)) << field;
        }
        ASSERT_TRUE(info["cpuInfo"].is_array());
        EXPECT_EQ(info["cpuInfo"].size(), info["cpuCount"].get<std::size_t>());
        for (const auto& cpu : info["cpuInfo"]) {
            EXPECT_TRUE(cpu.contains("vendorId"));
            EXPECT_TRUE(cpu.contains("brand"));
            EXPECT_TRUE(cpu.contains("frequency"));
            EXPECT_TRUE(cpu.contains("totalCpuUsage"));
        }
        EXPECT_TRUE(info["disks"].is_array());
        EXPECT_TRUE(info["networks"].is_array());
    }
}
