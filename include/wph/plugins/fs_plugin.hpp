#pragma once

/// @file fs_plugin.hpp
/// @brief The bundled "fs" plugin: file operations inside a widget's directory.
///
/// Every command takes a `path` relative to the calling widget's directory.
/// Absolute paths and paths that leave the directory through `..` are
/// rejected with InvalidArgument.

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "wph/foundation/host_result.hpp"
#include "wph/plugin/command.hpp"
#include "wph/plugin/engine_interface.hpp"
#include "wph/plugin/iplugin.hpp"

namespace wph::plugins::fs {

// ── Payloads ────────────────────────────────────────────────────────────

struct PathInput {
    std::string path;
};

struct ContentInput {
    std::string path;
    std::string content;
};

struct CreateDirInput {
    std::string path;
    bool recursive = false;
};

struct SuccessOutput {
    bool success = true;
};

struct ExistsOutput {
    bool exists = false;
};

struct IsDirOutput {
    bool is_dir = false;
};

struct IsFileOutput {
    bool is_file = false;
};

struct ReadFileOutput {
    std::string content;
};

void from_json(const nlohmann::json& j, PathInput& in);
void from_json(const nlohmann::json& j, ContentInput& in);
void from_json(const nlohmann::json& j, CreateDirInput& in);
void to_json(nlohmann::json& j, const SuccessOutput& out);
void to_json(nlohmann::json& j, const ExistsOutput& out);
void to_json(nlohmann::json& j, const IsDirOutput& out);
void to_json(nlohmann::json& j, const IsFileOutput& out);
void to_json(nlohmann::json& j, const ReadFileOutput& out);

/// Resolve @p relative against the widget's directory.
[[nodiscard]] foundation::HostResult<std::filesystem::path>
ResolveInWidgetDir(const plugin::EngineInterface& engine, std::string_view widgetId,
                   std::string_view relative);

// ── Commands ────────────────────────────────────────────────────────────

/// Append text to a file, creating the file and its parents if needed.
class AppendFile : public plugin::TypedCommand<ContentInput, SuccessOutput> {
public:
    [[nodiscard]] std::string_view Name() const override { return "append_file"; }
    [[nodiscard]] foundation::HostResult<SuccessOutput>
    RunTyped(std::string_view widgetId, const plugin::EngineInterface& engine,
             ContentInput input) const override;
};

/// Create a directory; `recursive` also creates missing parents.
class CreateDir : public plugin::TypedCommand<CreateDirInput, SuccessOutput> {
public:
    [[nodiscard]] std::string_view Name() const override { return "create_dir"; }
    [[nodiscard]] foundation::HostResult<SuccessOutput>
    RunTyped(std::string_view widgetId, const plugin::EngineInterface& engine,
             CreateDirInput input) const override;
};

class Exists : public plugin::TypedCommand<PathInput, ExistsOutput> {
public:
    [[nodiscard]] std::string_view Name() const override { return "exists"; }
    [[nodiscard]] foundation::HostResult<ExistsOutput>
    RunTyped(std::string_view widgetId, const plugin::EngineInterface& engine,
             PathInput input) const override;
};

class IsDir : public plugin::TypedCommand<PathInput, IsDirOutput> {
public:
    [[nodiscard]] std::string_view Name() const override { return "is_dir"; }
    [[nodiscard]] foundation::HostResult<IsDirOutput>
    RunTyped(std::string_view widgetId, const plugin::EngineInterface& engine,
             PathInput input) const override;
};

class IsFile : public plugin::TypedCommand<PathInput, IsFileOutput> {
public:
    [[nodiscard]] std::string_view Name() const override { return "is_file"; }
    [[nodiscard]] foundation::HostResult<IsFileOutput>
    RunTyped(std::string_view widgetId, const plugin::EngineInterface& engine,
             PathInput input) const override;
};

/// Read a whole file as UTF-8 text.
class ReadFile : public plugin::TypedCommand<PathInput, ReadFileOutput> {
public:
    [[nodiscard]] std::string_view Name() const override { return "read_file"; }
    [[nodiscard]] foundation::HostResult<ReadFileOutput>
    RunTyped(std::string_view widgetId, const plugin::EngineInterface& engine,
             PathInput input) const override;
};

/// Remove a directory and everything below it.
class RemoveDir : public plugin::TypedCommand<PathInput, plugin::NoOutput> {
public:
    [[nodiscard]] std::string_view Name() const override { return "remove_dir"; }
    [[nodiscard]] foundation::HostResult<plugin::NoOutput>
    RunTyped(std::string_view widgetId, const plugin::EngineInterface& engine,
             PathInput input) const override;
};

class RemoveFile : public plugin::TypedCommand<PathInput, plugin::NoOutput> {
public:
    [[nodiscard]] std::string_view Name() const override { return "remove_file"; }
    [[nodiscard]] foundation::HostResult<plugin::NoOutput>
    RunTyped(std::string_view widgetId, const plugin::EngineInterface& engine,
             PathInput input) const override;
};

/// Replace a file's content, creating the file and its parents if needed.
class WriteFile : public plugin::TypedCommand<ContentInput, SuccessOutput> {
public:
    [[nodiscard]] std::string_view Name() const override { return "write_file"; }
    [[nodiscard]] foundation::HostResult<SuccessOutput>
    RunTyped(std::string_view widgetId, const plugin::EngineInterface& engine,
             ContentInput input) const override;
};

// ── Plugin ──────────────────────────────────────────────────────────────

class FsPlugin : public plugin::IPlugin {
public:
    [[nodiscard]] std::string_view Name() const override { return "fs"; }

    [[nodiscard]] plugin::CommandList Commands() const override {
        return plugin::MakeCommands<AppendFile, CreateDir, Exists, IsDir, IsFile, ReadFile,
                                    RemoveDir, RemoveFile, WriteFile>();
    }
};

}  // namespace wph::plugins::fs
