#pragma once

/// @file utf8.hpp
/// @author Aleksandr Loshkarev
/// @brief UTF-8 helpers used by the string lexer.
///
///   - Encoding a code point produced by a \uXXXX escape
///   - Validating the raw bytes of a string token

#include <cstdint>

namespace sjson::detail::utf8 {

/// @brief Encode a code point into a fixed buffer.
/// @return Number of bytes written (1-4), or 0 for an invalid code point.
inline unsigned encode(uint32_t cp, char* buf) noexcept {
    if (cp < 0x80) {
        buf[0] = static_cast<char>(cp);
        return 1;
    }
    if (cp < 0x800) {
        buf[0] = static_cast<char>(0xC0 | (cp >> 6));
        buf[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000) {
        buf[0] = static_cast<char>(0xE0 | (cp >> 12));
        buf[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buf[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    }
    if (cp <= 0x10FFFF) {
        buf[0] = static_cast<char>(0xF0 | (cp >> 18));
        buf[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        buf[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buf[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }
    return 0;
}

/// @brief UTF-8 sequence length from the leading byte; 0 if invalid.
inline unsigned sequence_length(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

/// @brief Length of the valid UTF-8 sequence at ptr, or 0 if it is
/// malformed, overlong, a surrogate or beyond U+10FFFF.
inline unsigned valid_sequence(const char* ptr, const char* end) noexcept {
    auto lead = static_cast<unsigned char>(*ptr);
    unsigned len = sequence_length(lead);
    if (len <= 1) return len;
    if (end - ptr < static_cast<long>(len)) return 0;

    uint32_t cp = lead & (0x7Fu >> len);
    for (unsigned i = 1; i < len; ++i) {
        auto byte = static_cast<unsigned char>(ptr[i]);
        if ((byte & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (byte & 0x3F);
    }
    if ((len == 2 && cp < 0x80) ||
        (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000)) {
        return 0;
    }
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
    if (cp > 0x10FFFF) return 0;
    return len;
}

} // namespace sjson::detail::utf8
