#pragma once

/// @file parse_options.hpp
/// @author Aleksandr Loshkarev
/// @brief Stream configuration: non-standard extensions and resource limits.
///
/// Available extensions:
///   - Trailing commas in arrays and objects
///   - NaN and Infinity literals
///   - Control characters in strings

#include "config.hpp"

#include <cstddef>

namespace sjson {

/// @brief Tokenizer configuration for standard and non-standard JSON.
struct ParseOptions {
    // ─── Non-standard extensions (all disabled by default) ──────────────

    /// Allow trailing commas: [1,2,3,] and {"a":1,"b":2,}
    bool allow_trailing_commas  = false;

    /// Allow NaN, Infinity, -Infinity as numeric literals
    bool allow_nan_inf          = false;

    /// Allow control characters (< 0x20) in strings without escaping
    bool allow_control_chars    = false;

    // ─── Limits ──────────────────────────────────────────────────────────

    /// Maximum nesting depth (0 = SJSON_MAX_DEPTH)
    size_t max_depth = 0;

    /// Maximum bytes of one token buffered across chunks (0 = SJSON_MAX_TOKEN_SIZE)
    size_t max_token_size = 0;

    [[nodiscard]] size_t effective_max_depth() const noexcept {
        return max_depth > 0 ? max_depth : static_cast<size_t>(SJSON_MAX_DEPTH);
    }

    [[nodiscard]] size_t effective_max_token_size() const noexcept {
        return max_token_size > 0 ? max_token_size : static_cast<size_t>(SJSON_MAX_TOKEN_SIZE);
    }

    // ─── Factory methods ─────────────────────────────────────────────────

    /// Strict JSON (RFC 8259): all extensions disabled.
    static constexpr ParseOptions strict() noexcept {
        return {};
    }

    /// Lenient mode: every extension enabled.
    static constexpr ParseOptions lenient() noexcept {
        ParseOptions opts;
        opts.allow_trailing_commas = true;
        opts.allow_nan_inf         = true;
        opts.allow_control_chars   = true;
        return opts;
    }
};

} // namespace sjson
