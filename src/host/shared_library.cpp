/// @file shared_library.cpp
/// @brief SharedLibrary implementation for POSIX and Windows.

#include "wph/host/shared_library.hpp"

#include <string>
#include <utility>

// Platform-specific dynamic library loading.
#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <dlfcn.h>
#endif

using wph::foundation::ErrorCode;
using wph::foundation::HostError;
using wph::foundation::HostResult;

namespace wph::host {

SharedLibrary::~SharedLibrary() {
    Close();
}

SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept
    : handle_(std::exchange(other.handle_, nullptr)) {}

SharedLibrary& SharedLibrary::operator=(SharedLibrary&& other) noexcept {
    if (this != &other) {
        Close();
        handle_ = std::exchange(other.handle_, nullptr);
    }
    return *this;
}

HostResult<SharedLibrary> SharedLibrary::Open(const std::filesystem::path& path) {
#if defined(_WIN32)
    void* handle = static_cast<void*>(LoadLibraryW(path.c_str()));
#else
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
#endif

    if (handle == nullptr) {
#if defined(_WIN32)
        auto errorMsg = "LoadLibrary failed for: " + path.string() +
                        " (error " + std::to_string(GetLastError()) + ")";
#else
        const char* reason = dlerror();
        auto errorMsg = reason != nullptr ? std::string(reason)
                                          : "dlopen failed for: " + path.string();
#endif
        return HostResult<SharedLibrary>::err(
            HostError(ErrorCode::PluginLoadFailed, std::move(errorMsg)));
    }
    return HostResult<SharedLibrary>::ok(SharedLibrary(handle));
}

void* SharedLibrary::Symbol(std::string_view name) const {
    if (handle_ == nullptr) {
        return nullptr;
    }
    std::string symbol(name);
#if defined(_WIN32)
    return reinterpret_cast<void*>(GetProcAddress(static_cast<HMODULE>(handle_), symbol.c_str()));
#else
    return dlsym(handle_, symbol.c_str());
#endif
}

void SharedLibrary::Close() noexcept {
    if (handle_ == nullptr) {
        return;
    }
#if defined(_WIN32)
    FreeLibrary(static_cast<HMODULE>(handle_));
#else
    dlclose(handle_);
#endif
    handle_ = nullptr;
}

}  // namespace wph::host
