/// @file sys_commands.cpp
/// @brief Commands of the "sys" plugin.

#include "wph/plugins/sys_plugin.hpp"

#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <cmath>
#include <fstream>
#include <sstream>

using wph::foundation::HostResult;
using wph::plugin::EngineInterface;
using wph::plugin::NoInput;

namespace wph::plugins::sys {

namespace stdfs = std::filesystem;

// ── JSON conversion ─────────────────────────────────────────────────────

namespace {

nlohmann::json optionalText(const std::optional<std::string>& text) {
    return text ? nlohmann::json(*text) : nlohmann::json(nullptr);
}

}  // namespace

void to_json(nlohmann::json& j, const CpuInfo& cpu) {
    j = nlohmann::json{{"vendorId", cpu.vendorId},
                       {"brand", cpu.brand},
                       {"frequency", cpu.frequency},
                       {"totalCpuUsage", cpu.totalCpuUsage}};
}

void to_json(nlohmann::json& j, const DiskInfo& disk) {
    j = nlohmann::json{{"name", disk.name},
                       {"mountPoint", disk.mountPoint},
                       {"fileSystem", disk.fileSystem},
                       {"totalSpace", disk.totalSpace},
                       {"availableSpace", disk.availableSpace}};
}

void to_json(nlohmann::json& j, const NetworkInfo& network) {
    j = nlohmann::json{{"interfaceName", network.interfaceName},
                       {"totalReceived", network.totalReceived},
                       {"totalTransmitted", network.totalTransmitted}};
}

void to_json(nlohmann::json& j, const SystemInfo& info) {
    j = nlohmann::json{{"totalSwap", info.totalSwap},
                       {"usedSwap", info.usedSwap},
                       {"systemName", optionalText(info.systemName)},
                       {"kernelVersion", optionalText(info.kernelVersion)},
                       {"osVersion", optionalText(info.osVersion)},
                       {"hostName", optionalText(info.hostName)},
                       {"cpuCount", info.cpuCount},
                       {"cpuInfo", info.cpuInfo},
                       {"disks", info.disks},
                       {"networks", info.networks},
                       {"totalMemory", info.totalMemory},
                       {"usedMemory", info.usedMemory}};
}

// ── procfs parsers ──────────────────────────────────────────────────────

namespace {

std::string trim(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n";
    auto first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(kSpace);
    return std::string(text.substr(first, last - first + 1));
}

/// Split `key : value`; false if the line has no colon.
bool splitField(const std::string& line, std::string& key, std::string& value) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    key = trim(std::string_view(line).substr(0, colon));
    value = trim(std::string_view(line).substr(colon + 1));
    return true;
}

uint64_t toUnsigned(const std::string& text) {
    std::istringstream in(text);
    uint64_t value = 0;
    in >> value;
    return in.fail() ? 0 : value;
}

std::string decodeOctalEscapes(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 3 < text.size()) {
            auto isOctal = [](char c) { return c >= '0' && c <= '7'; };
            if (isOctal(text[i + 1]) && isOctal(text[i + 2]) && isOctal(text[i + 3])) {
                decoded.push_back(static_cast<char>(((text[i + 1] - '0') << 6) |
                                                    ((text[i + 2] - '0') << 3) |
                                                    (text[i + 3] - '0')));
                i += 3;
                continue;
            }
        }
        decoded.push_back(text[i]);
    }
    return decoded;
}

}  // namespace

MemoryInfo ParseMemInfo(std::istream& in) {
    constexpr uint64_t kKiB = 1024;
    MemoryInfo memory;
    std::string line;
    std::string key;
    std::string value;
    while (std::getline(in, line)) {
        if (!splitField(line, key, value)) {
            continue;
        }
        uint64_t bytes = toUnsigned(value) * kKiB;
        if (key == "MemTotal") {
            memory.totalMemory = bytes;
        } else if (key == "MemAvailable") {
            memory.availableMemory = bytes;
        } else if (key == "SwapTotal") {
            memory.totalSwap = bytes;
        } else if (key == "SwapFree") {
            memory.freeSwap = bytes;
        }
    }
    return memory;
}

std::vector<CpuInfo> ParseCpuInfo(std::istream& in) {
    std::vector<CpuInfo> cpus;
    std::string line;
    std::string key;
    std::string value;
    while (std::getline(in, line)) {
        if (!splitField(line, key, value)) {
            continue;
        }
        if (key == "processor") {
            cpus.emplace_back();
            continue;
        }
        if (cpus.empty()) {
            continue;
        }
        auto& cpu = cpus.back();
        if (key == "vendor_id") {
            cpu.vendorId = value;
        } else if (key == "model name") {
            cpu.brand = value;
        } else if (key == "cpu MHz") {
            std::istringstream mhz(value);
            double frequency = 0.0;
            if (mhz >> frequency && frequency > 0.0) {
                cpu.frequency = static_cast<uint64_t>(std::llround(frequency));
            }
        }
    }
    return cpus;
}

std::vector<CpuTimes> ParseCpuTimes(std::istream& in) {
    std::vector<CpuTimes> times;
    std::string line;
    while (std::getline(in, line)) {
        if (line.size() < 4 || line.compare(0, 3, "cpu") != 0 || line[3] == ' ') {
            continue;
        }
        std::istringstream fields(line);
        std::string label;
        fields >> label;

        // user nice system idle iowait irq softirq steal
        uint64_t values[8] = {};
        for (auto& v : values) {
            if (!(fields >> v)) {
                v = 0;
                break;
            }
        }
        CpuTimes cpu;
        for (auto v : values) {
            cpu.total += v;
        }
        uint64_t idle = values[3] + values[4];
        cpu.busy = cpu.total - idle;
        times.push_back(cpu);
    }
    return times;
}

std::vector<NetworkInfo> ParseNetDev(std::istream& in) {
    std::vector<NetworkInfo> networks;
    std::string line;
    while (std::getline(in, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos || line.find('|') != std::string::npos) {
            continue;
        }
        NetworkInfo network;
        network.interfaceName = trim(std::string_view(line).substr(0, colon));
        if (network.interfaceName.empty()) {
            continue;
        }

        // Receive: bytes packets errs drop fifo frame compressed multicast,
        // then Transmit starting with bytes.
        std::istringstream fields(line.substr(colon + 1));
        uint64_t values[9] = {};
        for (auto& v : values) {
            if (!(fields >> v)) {
                v = 0;
                break;
            }
        }
        network.totalReceived = values[0];
        network.totalTransmitted = values[8];
        networks.push_back(std::move(network));
    }
    return networks;
}

std::vector<MountEntry> ParseMounts(std::istream& in) {
    std::vector<MountEntry> mounts;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        MountEntry entry;
        if (!(fields >> entry.device >> entry.mountPoint >> entry.fileSystem)) {
            continue;
        }
        if (entry.device.compare(0, 5, "/dev/") != 0) {
            continue;
        }
        entry.device = decodeOctalEscapes(entry.device);
        entry.mountPoint = decodeOctalEscapes(entry.mountPoint);
        mounts.push_back(std::move(entry));
    }
    return mounts;
}

std::map<std::string, std::string> ParseOsRelease(std::istream& in) {
    std::map<std::string, std::string> fields;
    std::string line;
    while (std::getline(in, line)) {
        auto text = trim(line);
        if (text.empty() || text[0] == '#') {
            continue;
        }
        auto eq = text.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        auto value = text.substr(eq + 1);
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        fields[text.substr(0, eq)] = value;
    }
    return fields;
}

double CpuUsagePercent(const CpuTimes& before, const CpuTimes& now) {
    if (now.total <= before.total || now.busy < before.busy) {
        return 0.0;
    }
    auto busy = static_cast<double>(now.busy - before.busy);
    auto total = static_cast<double>(now.total - before.total);
    return busy > total ? 100.0 : busy * 100.0 / total;
}

// ── Commands ────────────────────────────────────────────────────────────

namespace {

std::optional<std::string> nonEmpty(std::string text) {
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

void readOsIdentity(const stdfs::path& root, SystemInfo& info) {
    std::ifstream release(root / "etc/os-release");
    if (!release) {
        release.open(root / "usr/lib/os-release");
    }
    if (release) {
        auto fields = ParseOsRelease(release);
        info.systemName = nonEmpty(fields["NAME"]);
        info.osVersion = nonEmpty(fields["VERSION_ID"]);
    }

    struct utsname uts {};
    if (uname(&uts) == 0) {
        info.kernelVersion = nonEmpty(uts.release);
        info.hostName = nonEmpty(uts.nodename);
    }
}

std::vector<DiskInfo> readDisks(const std::vector<MountEntry>& mounts) {
    std::vector<DiskInfo> disks;
    for (const auto& mount : mounts) {
        struct statvfs stats {};
        if (statvfs(mount.mountPoint.c_str(), &stats) != 0) {
            continue;
        }
        DiskInfo disk;
        disk.name = mount.device;
        disk.mountPoint = mount.mountPoint;
        disk.fileSystem = mount.fileSystem;
        disk.totalSpace = static_cast<uint64_t>(stats.f_blocks) * stats.f_frsize;
        disk.availableSpace = static_cast<uint64_t>(stats.f_bavail) * stats.f_frsize;
        disks.push_back(std::move(disk));
    }
    return disks;
}

}  // namespace

HostResult<SystemInfo> GetSystemInfo::RunTyped(std::string_view /*widgetId*/,
                                               const EngineInterface& engine,
                                               NoInput /*input*/) const {
    SystemInfo info;
    const auto proc = root_ / "proc";

    if (std::ifstream meminfo(proc / "meminfo"); meminfo) {
        auto memory = ParseMemInfo(meminfo);
        info.totalMemory = memory.totalMemory;
        info.usedMemory = memory.totalMemory > memory.availableMemory
                              ? memory.totalMemory - memory.availableMemory
                              : 0;
        info.totalSwap = memory.totalSwap;
        info.usedSwap = memory.totalSwap > memory.freeSwap ? memory.totalSwap - memory.freeSwap : 0;
    } else {
        engine.LogDebug("sys: " + (proc / "meminfo").string() + " is not readable");
    }

    readOsIdentity(root_, info);

    if (std::ifstream cpuinfo(proc / "cpuinfo"); cpuinfo) {
        info.cpuInfo = ParseCpuInfo(cpuinfo);
    }

    std::vector<CpuTimes> times;
    if (std::ifstream stat(proc / "stat"); stat) {
        times = ParseCpuTimes(stat);
    }
    if (info.cpuInfo.empty()) {
        auto online = times.empty() ? sysconf(_SC_NPROCESSORS_ONLN)
                                    : static_cast<long>(times.size());
        info.cpuInfo.resize(online > 0 ? static_cast<std::size_t>(online) : 0);
    }
    info.cpuCount = info.cpuInfo.size();

    {
        std::lock_guard lock(mutex_);
        if (lastTimes_.size() == times.size()) {
            for (std::size_t i = 0; i < times.size() && i < info.cpuInfo.size(); ++i) {
                info.cpuInfo[i].totalCpuUsage = CpuUsagePercent(lastTimes_[i], times[i]);
            }
        }
        lastTimes_ = std::move(times);
    }

    if (std::ifstream mounts(proc / "mounts"); mounts) {
        info.disks = readDisks(ParseMounts(mounts));
    }

    if (std::ifstream netdev(proc / "net/dev"); netdev) {
        info.networks = ParseNetDev(netdev);
    }

    return HostResult<SystemInfo>::ok(std::move(info));
}

}  // namespace wph::plugins::sys
