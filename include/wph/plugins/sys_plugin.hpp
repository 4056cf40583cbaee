#pragma once

/// @file sys_plugin.hpp
/// @brief The bundled "sys" plugin: a snapshot of the host machine.
///
/// `get_system_info` takes no input and reports memory, swap, OS identity,
/// per-CPU details, mounted disks and network interfaces. Sizes are in
/// bytes, CPU frequency in MHz, CPU usage in percent. Values the machine
/// does not expose are reported as zero, an empty list or `null`.

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "wph/foundation/host_result.hpp"
#include "wph/plugin/command.hpp"
#include "wph/plugin/engine_interface.hpp"
#include "wph/plugin/iplugin.hpp"

namespace wph::plugins::sys {

// ── Snapshot types ──────────────────────────────────────────────────────

struct CpuInfo {
    std::string vendorId;
    std::string brand;
    uint64_t frequency = 0;
    double totalCpuUsage = 0.0;
};

struct DiskInfo {
    std::string name;
    std::string mountPoint;
    std::string fileSystem;
    uint64_t totalSpace = 0;
    uint64_t availableSpace = 0;
};

struct NetworkInfo {
    std::string interfaceName;
    uint64_t totalReceived = 0;
    uint64_t totalTransmitted = 0;
};

struct SystemInfo {
    uint64_t totalSwap = 0;
    uint64_t usedSwap = 0;
    std::optional<std::string> systemName;
    std::optional<std::string> kernelVersion;
    std::optional<std::string> osVersion;
    std::optional<std::string> hostName;
    std::size_t cpuCount = 0;
    std::vector<CpuInfo> cpuInfo;
    std::vector<DiskInfo> disks;
    std::vector<NetworkInfo> networks;
    uint64_t totalMemory = 0;
    uint64_t usedMemory = 0;
};

void to_json(nlohmann::json& j, const CpuInfo& cpu);
void to_json(nlohmann::json& j, const DiskInfo& disk);
void to_json(nlohmann::json& j, const NetworkInfo& network);
void to_json(nlohmann::json& j, const SystemInfo& info);

// ── procfs parsers ──────────────────────────────────────────────────────

/// Memory figures from /proc/meminfo, in bytes.
struct MemoryInfo {
    uint64_t totalMemory = 0;
    uint64_t availableMemory = 0;
    uint64_t totalSwap = 0;
    uint64_t freeSwap = 0;
};

/// Cumulative jiffies of one CPU from /proc/stat.
struct CpuTimes {
    uint64_t busy = 0;
    uint64_t total = 0;
};

/// One line of /proc/mounts.
struct MountEntry {
    std::string device;
    std::string mountPoint;
    std::string fileSystem;
};

[[nodiscard]] MemoryInfo ParseMemInfo(std::istream& in);

/// One entry per `processor` block, in file order.
[[nodiscard]] std::vector<CpuInfo> ParseCpuInfo(std::istream& in);

/// Per-CPU lines (`cpu0`, `cpu1`, ...); the aggregate `cpu` line is skipped.
[[nodiscard]] std::vector<CpuTimes> ParseCpuTimes(std::istream& in);

[[nodiscard]] std::vector<NetworkInfo> ParseNetDev(std::istream& in);

/// Mounts backed by a device node (`/dev/...`); pseudo filesystems are
/// dropped. Octal escapes such as `\040` are decoded.
[[nodiscard]] std::vector<MountEntry> ParseMounts(std::istream& in);

/// KEY=value pairs of an os-release file with quotes removed.
[[nodiscard]] std::map<std::string, std::string> ParseOsRelease(std::istream& in);

/// Busy share of @p now relative to @p before, in percent.
[[nodiscard]] double CpuUsagePercent(const CpuTimes& before, const CpuTimes& now);

// ── Commands ────────────────────────────────────────────────────────────

/// Collect a SystemInfo snapshot.
///
/// CPU usage is measured between consecutive calls on the same command
/// object, so the first call reports 0 for every CPU. Safe to call from
/// several threads.
class GetSystemInfo : public plugin::TypedCommand<plugin::NoInput, SystemInfo> {
public:
    GetSystemInfo() = default;

    /// Read procfs and os-release below @p root instead of `/`.
    explicit GetSystemInfo(std::filesystem::path root) : root_(std::move(root)) {}

    [[nodiscard]] std::string_view Name() const override { return "get_system_info"; }
    [[nodiscard]] foundation::HostResult<SystemInfo>
    RunTyped(std::string_view widgetId, const plugin::EngineInterface& engine,
             plugin::NoInput input) const override;

private:
    std::filesystem::path root_{"/"};
    mutable std::mutex mutex_;
    mutable std::vector<CpuTimes> lastTimes_;
};

// ── Plugin ──────────────────────────────────────────────────────────────

class SysPlugin : public plugin::IPlugin {
public:
    [[nodiscard]] std::string_view Name() const override { return "sys"; }

    [[nodiscard]] plugin::CommandList Commands() const override {
        return plugin::MakeCommands<GetSystemInfo>();
    }
};

}  // namespace wph::plugins::sys
