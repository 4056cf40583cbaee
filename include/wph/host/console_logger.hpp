#pragma once

/// @file console_logger.hpp
/// @brief ConsoleLogger: kcenon ILogger sink writing lines to a stream.

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace wph::host {

/// Minimal ILogger used by the wph_host runner as the default logger.
///
/// Each entry becomes one line `LEVEL message` on the target stream.
class ConsoleLogger : public kcenon::common::interfaces::ILogger {
public:
    explicit ConsoleLogger(std::ostream& out);

    kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
                                   const std::string& message) override;

    kcenon::common::VoidResult log(
        kcenon::common::interfaces::log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(kcenon::common::interfaces::log_level level) const override;

    kcenon::common::VoidResult set_level(kcenon::common::interfaces::log_level level) override;

    kcenon::common::interfaces::log_level get_level() const override;

    kcenon::common::VoidResult flush() override;

private:
    std::ostream& out_;
    std::mutex mutex_;
    std::atomic<kcenon::common::interfaces::log_level> minLevel_{
        kcenon::common::interfaces::log_level::trace};
};

}  // namespace wph::host
