#pragma once

/// @file shared_library.hpp
/// @brief SharedLibrary: RAII owner of one dynamic library handle.

#include <filesystem>
#include <string_view>

#include "wph/foundation/host_result.hpp"

namespace wph::host {

/// Owns a handle returned by dlopen / LoadLibraryW and closes it on
/// destruction. Move-only.
class SharedLibrary {
public:
    SharedLibrary() = default;
    ~SharedLibrary();

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;
    SharedLibrary(SharedLibrary&& other) noexcept;
    SharedLibrary& operator=(SharedLibrary&& other) noexcept;

    /// Open a library with immediate symbol binding and local visibility.
    /// @return The open library or PluginLoadFailed carrying the OS message.
    [[nodiscard]] static foundation::HostResult<SharedLibrary>
    Open(const std::filesystem::path& path);

    /// Look up an exported symbol (nullptr if absent).
    [[nodiscard]] void* Symbol(std::string_view name) const;

    /// Look up an exported function and cast it to @p Fn.
    template <typename Fn>
    [[nodiscard]] Fn Function(std::string_view name) const {
        return reinterpret_cast<Fn>(Symbol(name));
    }

    /// Close the library now. Idempotent.
    void Close() noexcept;

    [[nodiscard]] bool IsOpen() const noexcept { return handle_ != nullptr; }

private:
    explicit SharedLibrary(void* handle) noexcept : handle_(handle) {}

    void* handle_ = nullptr;
};

}  // namespace wph::host
