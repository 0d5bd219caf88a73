#pragma once

/// @file error.hpp
/// @author Aleksandr Loshkarev
/// @brief Error types for sjson: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ParseError, TypeError, OutOfRangeError, DecodeError
///   - Via error_code: sjson::errc enum + json_category()
///
/// Streaming parsers never throw out of feed(): a failed step is reported as
/// an Outcome carrying a Failure (location + message + error_code).

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace sjson {

// =====================================================================
// Source position for parse errors
// =====================================================================

/// @brief Position in the input stream, accumulated across chunks.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning of the stream
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief sjson error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Syntax errors (1-49)
    unexpected_end_of_input = 1,
    unexpected_character    = 2,
    invalid_escape          = 3,
    invalid_unicode_escape  = 4,
    invalid_number          = 5,
    unterminated_string     = 6,
    max_depth_exceeded      = 10,
    invalid_literal         = 11,
    invalid_utf8            = 13,
    token_too_large         = 15,

    // Stream discipline (50-69)
    continuation_consumed   = 50,
    frame_mismatch          = 51,
    io_error                = 52,
    user_failure            = 53,

    // Value access and decoding (70-89)
    type_mismatch           = 70,
    out_of_range            = 71,
    key_not_found           = 72,
    integer_overflow        = 73,
    decode_failed           = 74,

    // Navigation (90-99)
    navigation_absent         = 90,
    navigation_type_mismatch  = 91,
    invalid_path              = 92,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class json_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "sjson";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                       return "success";
            case errc::unexpected_end_of_input:  return "unexpected end of input";
            case errc::unexpected_character:     return "unexpected character";
            case errc::invalid_escape:           return "invalid escape sequence";
            case errc::invalid_unicode_escape:   return "invalid unicode escape";
            case errc::invalid_number:           return "invalid number";
            case errc::unterminated_string:      return "unterminated string";
            case errc::max_depth_exceeded:       return "maximum nesting depth exceeded";
            case errc::invalid_literal:          return "invalid literal";
            case errc::invalid_utf8:             return "invalid UTF-8 encoding";
            case errc::token_too_large:          return "token exceeds buffer limit";
            case errc::continuation_consumed:    return "continuation already consumed";
            case errc::frame_mismatch:           return "continuation used at the wrong nesting frame";
            case errc::io_error:                 return "input error";
            case errc::user_failure:             return "parser failed";
            case errc::type_mismatch:            return "type mismatch";
            case errc::out_of_range:             return "index out of range";
            case errc::key_not_found:            return "key not found";
            case errc::integer_overflow:         return "integer overflow";
            case errc::decode_failed:            return "value does not decode to the target type";
            case errc::navigation_absent:        return "path component not present";
            case errc::navigation_type_mismatch: return "path component applied to the wrong kind of value";
            case errc::invalid_path:             return "invalid path expression";
            default:                             return "unknown sjson error";
        }
    }
};

} // namespace detail

/// @brief Get the sjson error category singleton.
inline const std::error_category& json_category() noexcept {
    static const detail::json_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from sjson::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), json_category()};
}

/// @brief Create an error_condition from sjson::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), json_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief JSON syntax error with source position information.
class ParseError : public std::system_error {
public:
    ParseError(const std::string& message, SourceLocation loc,
               errc code = errc::unexpected_character)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc)
        , detail_(message) {}

    /// @brief Error position in the input stream.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

    /// @brief The message without the location prefix.
    [[nodiscard]] const std::string& detail() const noexcept {
        return detail_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "JSON parse error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) + ": " + msg;
    }

    SourceLocation location_;
    std::string detail_;
};

/// @brief Type mismatch error when accessing a value or a parse result.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg, errc code = errc::type_mismatch)
        : std::system_error(make_error_code(code), msg) {}
};

/// @brief Out-of-range error (array index or missing key).
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg, errc code = errc::out_of_range)
        : std::system_error(make_error_code(code), msg) {}
};

/// @brief A materialized value does not fit the requested C++ type.
class DecodeError : public std::system_error {
public:
    explicit DecodeError(const std::string& msg)
        : std::system_error(make_error_code(errc::decode_failed), msg) {}
};

// =====================================================================
// Failure payload of a terminated parse
// =====================================================================

/// @brief Why a streaming parse stopped. Terminal: the stream cannot resume.
struct Failure {
    SourceLocation location;
    std::string message;
    std::error_code code;

    /// @brief Human-readable form including the position.
    [[nodiscard]] std::string to_string() const {
        return "line " + std::to_string(location.line) + ", column " +
               std::to_string(location.column) + ": " + message;
    }
};

// =====================================================================
// Result type for exception-free decoding
// =====================================================================

/// @brief Outcome of a typed decode: value + error_code + message.
/// Usage: auto [val, ec, msg] = ...;
template <typename T>
struct decode_result {
    T value{};
    std::error_code ec;
    std::string message;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace sjson

// Register sjson::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<sjson::errc> : true_type {};
} // namespace std
