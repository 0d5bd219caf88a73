#pragma once

/// @file path_parser.hpp
/// @author Aleksandr Loshkarev
/// @brief Text forms of navigation paths.
///
/// Two notations are accepted by parse_path():
///
///   "a.b[2]"           -> field a, field b, offset 2
///   ".a[\"x y\"][0]"   -> field a, field "x y", offset 0
///   "/a/b/2"           -> JSON Pointer (RFC 6901): field a, field b, offset 2
///   ""                 -> the empty path (the value itself)
///
/// In pointer form a token made of decimal digits without a leading zero
/// selects an array item by offset or an object member by that name,
/// depending on the value it is applied to; everything else is a field name
/// (~0 = ~, ~1 = /).
///
/// Malformed input throws ParseError with errc::invalid_path; the location
/// column is the 1-based position in the path text.

#include "error.hpp"
#include "parse_options.hpp"
#include "path.hpp"
#include "detail/lexer.hpp"

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>

namespace sjson {

namespace detail {

class PathParser {
public:
    explicit PathParser(std::string_view text) noexcept : text_(text) {}

    Path parse() {
        Path out;
        if (text_.empty()) return out;
        if (text_[0] == '/') return parse_pointer();

        if (text_[0] != '.' && text_[0] != '[') out.push_back(PathComponent::field(bare_name()));
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == '.') {
                ++pos_;
                out.push_back(PathComponent::field(bare_name()));
            } else if (c == '[') {
                ++pos_;
                out.push_back(bracket());
            } else {
                error(std::string("unexpected character '") + c + "'");
            }
        }
        return out;
    }

private:
    [[noreturn]] void error(const std::string& msg) const {
        SourceLocation loc;
        loc.column = pos_ + 1;
        loc.offset = pos_;
        throw ParseError("invalid path: " + msg, loc, errc::invalid_path);
    }

    std::string bare_name() {
        size_t start = pos_;
        while (pos_ < text_.size() && text_[pos_] != '.' && text_[pos_] != '[') ++pos_;
        if (SJSON_UNLIKELY(pos_ == start)) error("empty field name");
        return std::string(text_.substr(start, pos_ - start));
    }

    PathComponent bracket() {
        if (SJSON_UNLIKELY(pos_ >= text_.size())) error("unterminated '['");
        PathComponent c;
        if (text_[pos_] == '"') {
            c = PathComponent::field(quoted());
        } else {
            size_t start = pos_;
            while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') ++pos_;
            if (SJSON_UNLIKELY(pos_ == start)) error("expected an offset or a quoted field name");
            size_t index = 0;
            auto [p, ec] = std::from_chars(text_.data() + start, text_.data() + pos_, index);
            if (SJSON_UNLIKELY(ec != std::errc{})) error("offset out of range");
            c = PathComponent::offset(index);
        }
        if (SJSON_UNLIKELY(pos_ >= text_.size() || text_[pos_] != ']')) error("expected ']'");
        ++pos_;
        return c;
    }

    // A JSON string literal; escapes are decoded by the token lexer.
    std::string quoted() {
        size_t start = pos_++;
        bool escape = false;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (escape) escape = false;
            else if (c == '\\') escape = true;
            else if (c == '"') {
                SourceLocation loc;
                loc.column = start + 1;
                loc.offset = start;
                std::string_view token = text_.substr(start, pos_ - start);
                ParseOptions opts;
                try {
                    return Lexer(token, loc, opts).lex_string();
                } catch (const ParseError& e) {
                    throw ParseError("invalid path: " + e.detail(), e.location(), errc::invalid_path);
                }
            }
        }
        error("unterminated quoted field name");
    }

    Path parse_pointer() {
        Path out;
        std::string_view rest = text_.substr(1);
        pos_ = 1;
        for (;;) {
            size_t slash = rest.find('/');
            std::string_view token = rest.substr(0, slash);
            out.push_back(pointer_component(token));
            if (slash == std::string_view::npos) break;
            rest.remove_prefix(slash + 1);
            pos_ += slash + 1;
        }
        return out;
    }

    PathComponent pointer_component(std::string_view token) {
        bool digits = !token.empty() && (token.size() == 1 || token[0] != '0');
        for (char c : token)
            if (c < '0' || c > '9') { digits = false; break; }
        if (digits) {
            size_t index = 0;
            auto [p, ec] = std::from_chars(token.data(), token.data() + token.size(), index);
            if (ec == std::errc{}) return PathComponent::pointer_index(index);
        }
        std::string name;
        name.reserve(token.size());
        for (size_t i = 0; i < token.size(); ++i) {
            if (token[i] != '~') {
                name += token[i];
                continue;
            }
            if (i + 1 < token.size() && token[i + 1] == '0') name += '~';
            else if (i + 1 < token.size() && token[i + 1] == '1') name += '/';
            else {
                pos_ += i;
                error("invalid '~' escape in pointer");
            }
            ++i;
        }
        return PathComponent::field(std::move(name));
    }

    std::string_view text_;
    size_t pos_ = 0;
};

} // namespace detail

/// @brief Parse a path expression (dotted, bracketed or JSON Pointer form).
[[nodiscard]] inline Path parse_path(std::string_view text) {
    return detail::PathParser(text).parse();
}

} // namespace sjson
