#pragma once

/// @file text_validator.hpp
/// @brief Text checks applied to every string that crosses the plugin ABI.
///
/// Strings are marshaled as null-terminated UTF-8, so a value is only
/// representable when it is valid UTF-8 and contains no interior NUL.

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace wph::foundation {

/// Stateless text validation utilities. All functions are thread-safe.
class TextValidator {
public:
    /// Validate a byte sequence as well-formed UTF-8 (RFC 3629).
    ///
    /// Rejects overlong encodings, surrogate code points and values above
    /// U+10FFFF.
    [[nodiscard]] static inline bool isValidUtf8(std::string_view text) noexcept {
        std::size_t i = 0;
        const std::size_t n = text.size();
        while (i < n) {
            auto c = static_cast<uint8_t>(text[i]);
            if (c < 0x80) {
                ++i;
                continue;
            }

            std::size_t len = 0;
            uint32_t cp = 0;
            uint32_t minCp = 0;
            if ((c & 0xE0) == 0xC0) {
                len = 2;
                cp = c & 0x1F;
                minCp = 0x80;
            } else if ((c & 0xF0) == 0xE0) {
                len = 3;
                cp = c & 0x0F;
                minCp = 0x800;
            } else if ((c & 0xF8) == 0xF0) {
                len = 4;
                cp = c & 0x07;
                minCp = 0x10000;
            } else {
                return false;
            }

            if (i + len > n) {
                return false;
            }
            for (std::size_t k = 1; k < len; ++k) {
                auto cc = static_cast<uint8_t>(text[i + k]);
                if ((cc & 0xC0) != 0x80) {
                    return false;
                }
                cp = (cp << 6) | (cc & 0x3F);
            }

            if (cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return false;
            }
            i += len;
        }
        return true;
    }

    /// True if the text contains a NUL byte before its end.
    [[nodiscard]] static inline bool hasInteriorNul(std::string_view text) noexcept {
        return text.find('\0') != std::string_view::npos;
    }

    /// True if the text is empty or contains only ASCII whitespace.
    [[nodiscard]] static inline bool isBlank(std::string_view text) noexcept {
        for (char ch : text) {
            if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r' &&
                ch != '\f' && ch != '\v') {
                return false;
            }
        }
        return true;
    }
};

} // namespace wph::foundation
