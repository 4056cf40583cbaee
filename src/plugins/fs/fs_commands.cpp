/// @file fs_commands.cpp
/// @brief Commands of the "fs" plugin.

#include "wph/plugins/fs_plugin.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include "wph/foundation/text_validator.hpp"

using wph::foundation::ErrorCode;
using wph::foundation::HostError;
using wph::foundation::HostResult;
using wph::foundation::TextValidator;
using wph::plugin::EngineInterface;
using wph::plugin::NoOutput;

namespace wph::plugins::fs {

namespace stdfs = std::filesystem;

// ── JSON conversion ─────────────────────────────────────────────────────

void from_json(const nlohmann::json& j, PathInput& in) {
    j.at("path").get_to(in.path);
}

void from_json(const nlohmann::json& j, ContentInput& in) {
    j.at("path").get_to(in.path);
    j.at("content").get_to(in.content);
}

void from_json(const nlohmann::json& j, CreateDirInput& in) {
    j.at("path").get_to(in.path);
    auto recursive = j.find("recursive");
    in.recursive = recursive != j.end() && !recursive->is_null() && recursive->get<bool>();
}

void to_json(nlohmann::json& j, const SuccessOutput& out) {
    j = nlohmann::json{{"success", out.success}};
}

void to_json(nlohmann::json& j, const ExistsOutput& out) {
    j = nlohmann::json{{"exists", out.exists}};
}

void to_json(nlohmann::json& j, const IsDirOutput& out) {
    j = nlohmann::json{{"is_dir", out.is_dir}};
}

void to_json(nlohmann::json& j, const IsFileOutput& out) {
    j = nlohmann::json{{"is_file", out.is_file}};
}

void to_json(nlohmann::json& j, const ReadFileOutput& out) {
    j = nlohmann::json{{"content", out.content}};
}

// ── Path resolution ─────────────────────────────────────────────────────

HostResult<stdfs::path> ResolveInWidgetDir(const EngineInterface& engine,
                                           std::string_view widgetId,
                                           std::string_view relative) {
    using PathResult = HostResult<stdfs::path>;

    if (relative.empty()) {
        return PathResult::err(HostError(ErrorCode::InvalidArgument, "path must not be empty"));
    }
    stdfs::path rel{std::string(relative)};
    if (rel.has_root_path()) {
        return PathResult::err(HostError(ErrorCode::InvalidArgument,
                                         "path must be relative: " + std::string(relative)));
    }
    auto normalized = rel.lexically_normal();
    if (!normalized.empty() && normalized.begin()->string() == "..") {
        return PathResult::err(HostError(
            ErrorCode::InvalidArgument,
            "path leaves the widget directory: " + std::string(relative)));
    }

    auto widgetDir = engine.WidgetDir(widgetId);
    if (widgetDir.hasError()) {
        return PathResult::err(widgetDir.error());
    }
    return PathResult::ok(widgetDir.value() / normalized);
}

namespace {

HostError ioError(std::string_view action, const stdfs::path& path, const std::error_code& ec) {
    return HostError(ErrorCode::CommandFailed,
                     "Failed to " + std::string(action) + " " + path.string() + ": " + ec.message());
}

HostResult<void> createParents(const stdfs::path& file) {
    auto parent = file.parent_path();
    if (parent.empty()) {
        return HostResult<void>::ok();
    }
    std::error_code ec;
    stdfs::create_directories(parent, ec);
    if (ec) {
        return HostResult<void>::err(ioError("create directory", parent, ec));
    }
    return HostResult<void>::ok();
}

HostResult<SuccessOutput> writeContent(const stdfs::path& file, const std::string& content,
                                       std::ios::openmode mode) {
    auto parents = createParents(file);
    if (parents.hasError()) {
        return HostResult<SuccessOutput>::err(parents.error());
    }

    std::ofstream out(file, std::ios::binary | mode);
    if (!out) {
        return HostResult<SuccessOutput>::err(HostError(
            ErrorCode::CommandFailed, "Failed to open " + file.string() + " for writing"));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        return HostResult<SuccessOutput>::err(
            HostError(ErrorCode::CommandFailed, "Failed to write " + file.string()));
    }
    return HostResult<SuccessOutput>::ok(SuccessOutput{true});
}

}  // namespace

// ── Commands ────────────────────────────────────────────────────────────

HostResult<SuccessOutput> AppendFile::RunTyped(std::string_view widgetId,
                                               const EngineInterface& engine,
                                               ContentInput input) const {
    auto file = ResolveInWidgetDir(engine, widgetId, input.path);
    if (file.hasError()) {
        return HostResult<SuccessOutput>::err(file.error());
    }
    return writeContent(file.value(), input.content, std::ios::app);
}

HostResult<SuccessOutput> WriteFile::RunTyped(std::string_view widgetId,
                                              const EngineInterface& engine,
                                              ContentInput input) const {
    auto file = ResolveInWidgetDir(engine, widgetId, input.path);
    if (file.hasError()) {
        return HostResult<SuccessOutput>::err(file.error());
    }
    return writeContent(file.value(), input.content, std::ios::trunc);
}

HostResult<SuccessOutput> CreateDir::RunTyped(std::string_view widgetId,
                                              const EngineInterface& engine,
                                              CreateDirInput input) const {
    auto dir = ResolveInWidgetDir(engine, widgetId, input.path);
    if (dir.hasError()) {
        return HostResult<SuccessOutput>::err(dir.error());
    }

    std::error_code ec;
    if (input.recursive) {
        stdfs::create_directories(dir.value(), ec);
    } else if (!stdfs::create_directory(dir.value(), ec) && !ec) {
        // create_directory reports an existing directory as "not created".
        ec = std::make_error_code(std::errc::file_exists);
    }
    if (ec) {
        return HostResult<SuccessOutput>::err(ioError("create directory", dir.value(), ec));
    }
    return HostResult<SuccessOutput>::ok(SuccessOutput{true});
}

HostResult<ExistsOutput> Exists::RunTyped(std::string_view widgetId,
                                          const EngineInterface& engine,
                                          PathInput input) const {
    auto target = ResolveInWidgetDir(engine, widgetId, input.path);
    if (target.hasError()) {
        return HostResult<ExistsOutput>::err(target.error());
    }
    std::error_code ec;
    return HostResult<ExistsOutput>::ok(ExistsOutput{stdfs::exists(target.value(), ec)});
}

HostResult<IsDirOutput> IsDir::RunTyped(std::string_view widgetId,
                                        const EngineInterface& engine,
                                        PathInput input) const {
    auto target = ResolveInWidgetDir(engine, widgetId, input.path);
    if (target.hasError()) {
        return HostResult<IsDirOutput>::err(target.error());
    }
    std::error_code ec;
    return HostResult<IsDirOutput>::ok(IsDirOutput{stdfs::is_directory(target.value(), ec)});
}

HostResult<IsFileOutput> IsFile::RunTyped(std::string_view widgetId,
                                          const EngineInterface& engine,
                                          PathInput input) const {
    auto target = ResolveInWidgetDir(engine, widgetId, input.path);
    if (target.hasError()) {
        return HostResult<IsFileOutput>::err(target.error());
    }
    std::error_code ec;
    return HostResult<IsFileOutput>::ok(IsFileOutput{stdfs::is_regular_file(target.value(), ec)});
}

HostResult<ReadFileOutput> ReadFile::RunTyped(std::string_view widgetId,
                                              const EngineInterface& engine,
                                              PathInput input) const {
    auto file = ResolveInWidgetDir(engine, widgetId, input.path);
    if (file.hasError()) {
        return HostResult<ReadFileOutput>::err(file.error());
    }

    std::error_code ec;
    if (stdfs::exists(file.value(), ec) && !stdfs::is_regular_file(file.value(), ec)) {
        return HostResult<ReadFileOutput>::err(HostError(
            ErrorCode::CommandFailed, "Not a regular file: " + file.value().string()));
    }

    std::ifstream in(file.value(), std::ios::binary);
    if (!in) {
        return HostResult<ReadFileOutput>::err(HostError(
            ErrorCode::CommandFailed, "Failed to open " + file.value().string() + " for reading"));
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return HostResult<ReadFileOutput>::err(
            HostError(ErrorCode::CommandFailed, "Failed to read " + file.value().string()));
    }
    if (!TextValidator::isValidUtf8(content)) {
        return HostResult<ReadFileOutput>::err(HostError(
            ErrorCode::CommandFailed, file.value().string() + " is not valid UTF-8"));
    }
    return HostResult<ReadFileOutput>::ok(ReadFileOutput{std::move(content)});
}

HostResult<NoOutput> RemoveDir::RunTyped(std::string_view widgetId,
                                         const EngineInterface& engine,
                                         PathInput input) const {
    auto dir = ResolveInWidgetDir(engine, widgetId, input.path);
    if (dir.hasError()) {
        return HostResult<NoOutput>::err(dir.error());
    }
    std::error_code ec;
    if (!stdfs::is_directory(dir.value(), ec)) {
        return HostResult<NoOutput>::err(HostError(
            ErrorCode::CommandFailed, "Not a directory: " + dir.value().string()));
    }
    stdfs::remove_all(dir.value(), ec);
    if (ec) {
        return HostResult<NoOutput>::err(ioError("remove directory", dir.value(), ec));
    }
    return HostResult<NoOutput>::ok(NoOutput{});
}

HostResult<NoOutput> RemoveFile::RunTyped(std::string_view widgetId,
                                          const EngineInterface& engine,
                                          PathInput input) const {
    auto file = ResolveInWidgetDir(engine, widgetId, input.path);
    if (file.hasError()) {
        return HostResult<NoOutput>::err(file.error());
    }
    std::error_code ec;
    if (!stdfs::is_regular_file(file.value(), ec)) {
        return HostResult<NoOutput>::err(HostError(
            ErrorCode::CommandFailed, "Not a file: " + file.value().string()));
    }
    stdfs::remove(file.value(), ec);
    if (ec) {
        return HostResult<NoOutput>::err(ioError("remove file", file.value(), ec));
    }
    return HostResult<NoOutput>::ok(NoOutput{});
}

}  // namespace wph::plugins::fs
