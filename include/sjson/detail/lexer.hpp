#pragma once

/// @file lexer.hpp
/// @author Aleksandr Loshkarev
/// @brief Lexing of one complete atom token (string, number, literal).
///
/// The tokenizer finds token boundaries incrementally; once a token is
/// complete its bytes are handed here in one contiguous span. Errors are
/// thrown as ParseError with the position of the offending byte.

#include "../config.hpp"
#include "../error.hpp"
#include "../parse_options.hpp"
#include "../value.hpp"
#include "utf8.hpp"

#include <charconv>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>

namespace sjson::detail {

class Lexer {
public:
    Lexer(std::string_view token, SourceLocation start, const ParseOptions& opts) noexcept
        : begin_(token.data())
        , ptr_(token.data())
        , end_(token.data() + token.size())
        , start_(start)
        , opts_(opts) {}

    /// @brief Decode a quoted string token (quotes included).
    std::string lex_string() {
        expect('"');
        std::string out;
        out.reserve(static_cast<size_t>(end_ - ptr_));
        const char* run = ptr_;
        for (;;) {
            if (SJSON_UNLIKELY(ptr_ >= end_))
                error("unterminated string", errc::unterminated_string);
            auto c = static_cast<unsigned char>(*ptr_);
            if (c == '"') {
                out.append(run, static_cast<size_t>(ptr_ - run));
                ++ptr_;
                break;
            }
            if (c == '\\') {
                out.append(run, static_cast<size_t>(ptr_ - run));
                ++ptr_;
                lex_escape(out);
                run = ptr_;
                continue;
            }
            if (SJSON_UNLIKELY(c < 0x20 && !opts_.allow_control_chars))
                error("unescaped control character in string");
            if (c >= 0x80) {
                unsigned n = utf8::valid_sequence(ptr_, end_);
                if (SJSON_UNLIKELY(n == 0)) error("invalid UTF-8 in string", errc::invalid_utf8);
                ptr_ += n;
                continue;
            }
            ++ptr_;
        }
        expect_end(errc::unexpected_character);
        return out;
    }

    /// @brief Lex a number token into an integer, unsigned or float Value.
    Value lex_number() {
        const char* start = ptr_;
        bool negative = false;

        if (*ptr_ == '-') {
            negative = true;
            ++ptr_;
            if (SJSON_UNLIKELY(ptr_ >= end_))
                error("invalid number", errc::invalid_number);
            if (opts_.allow_nan_inf && *ptr_ == 'I') {
                expect_word("Infinity", errc::invalid_number);
                return Value(-std::numeric_limits<double>::infinity());
            }
        }

        if (SJSON_UNLIKELY(static_cast<unsigned>(*ptr_ - '0') > 9u))
            error("invalid number", errc::invalid_number);

        uint64_t int_val = 0;
        bool int_overflow = false;
        int int_digits = 0;

        if (*ptr_ == '0') {
            ++ptr_;
        } else {
            constexpr uint64_t kOverflowThreshold = UINT64_MAX / 10;
            constexpr uint64_t kOverflowLastDigit = UINT64_MAX % 10;
            while (ptr_ < end_ && static_cast<unsigned>(*ptr_ - '0') <= 9u) {
                auto digit = static_cast<uint64_t>(*ptr_ - '0');
                if (SJSON_UNLIKELY(int_val > kOverflowThreshold ||
                                   (int_val == kOverflowThreshold && digit > kOverflowLastDigit))) {
                    int_overflow = true;
                    while (ptr_ < end_ && static_cast<unsigned>(*ptr_ - '0') <= 9u) ++ptr_;
                    break;
                }
                int_val = int_val * 10 + digit;
                ++ptr_;
                ++int_digits;
            }
        }

        bool is_float = false;
        uint64_t mantissa = int_val;
        int32_t frac_digits = 0;
        int32_t explicit_exp = 0;
        bool mantissa_overflow = int_overflow;
        constexpr int kMaxMantissaDigits = 19;
        int total_digits = int_digits;

        if (ptr_ < end_ && *ptr_ == '.') {
            is_float = true;
            ++ptr_;
            if (SJSON_UNLIKELY(ptr_ >= end_ || static_cast<unsigned>(*ptr_ - '0') > 9u))
                error("expected digit after decimal point", errc::invalid_number);
            while (ptr_ < end_ && static_cast<unsigned>(*ptr_ - '0') <= 9u) {
                if (total_digits < kMaxMantissaDigits) {
                    mantissa = mantissa * 10 + static_cast<uint64_t>(*ptr_ - '0');
                    ++frac_digits;
                    ++total_digits;
                } else {
                    mantissa_overflow = true;
                }
                ++ptr_;
            }
        }

        if (ptr_ < end_ && (*ptr_ == 'e' || *ptr_ == 'E')) {
            is_float = true;
            ++ptr_;
            bool neg_exp = false;
            if (ptr_ < end_ && (*ptr_ == '+' || *ptr_ == '-')) {
                neg_exp = (*ptr_ == '-');
                ++ptr_;
            }
            if (SJSON_UNLIKELY(ptr_ >= end_ || static_cast<unsigned>(*ptr_ - '0') > 9u))
                error("expected digit in exponent", errc::invalid_number);
            while (ptr_ < end_ && static_cast<unsigned>(*ptr_ - '0') <= 9u) {
                explicit_exp = explicit_exp * 10 + (*ptr_ - '0');
                if (explicit_exp > 400) explicit_exp = 400;
                ++ptr_;
            }
            if (neg_exp) explicit_exp = -explicit_exp;
        }

        // Anything left over ("01", "1x", "1-2") is not a number.
        expect_end(errc::invalid_number);

        if (SJSON_LIKELY(!is_float && !int_overflow)) {
            if (negative) {
                constexpr uint64_t kMaxNeg =
                    static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;
                if (SJSON_LIKELY(int_val < kMaxNeg))
                    return Value(-static_cast<int64_t>(int_val));
                if (int_val == kMaxNeg)
                    return Value(std::numeric_limits<int64_t>::min());
            } else {
                return Value(int_val);
            }
        }

        if (SJSON_LIKELY(!mantissa_overflow)) {
            int32_t exp10 = explicit_exp - frac_digits;
            if (exp10 >= -22 && exp10 <= 22) {
                static constexpr double kPow10[] = {
                    1e0,  1e1,  1e2,  1e3,  1e4,  1e5,  1e6,  1e7,  1e8,  1e9,
                    1e10, 1e11, 1e12, 1e13, 1e14, 1e15, 1e16, 1e17, 1e18, 1e19,
                    1e20, 1e21, 1e22
                };
                double d = exp10 >= 0 ? static_cast<double>(mantissa) * kPow10[exp10]
                                      : static_cast<double>(mantissa) / kPow10[-exp10];
                return Value(negative ? -d : d);
            }
        }

        return lex_float_slow(start);
    }

    /// @brief Lex true / false / null (and NaN / Infinity when enabled).
    Value lex_literal() {
        std::string_view word(begin_, static_cast<size_t>(end_ - begin_));
        if (word == "true")  return Value(true);
        if (word == "false") return Value(false);
        if (word == "null")  return Value(nullptr);
        if (opts_.allow_nan_inf) {
            if (word == "NaN")      return Value(std::numeric_limits<double>::quiet_NaN());
            if (word == "Infinity") return Value(std::numeric_limits<double>::infinity());
        }
        error("invalid literal '" + std::string(word) + "'", errc::invalid_literal);
    }

private:
    [[nodiscard]] SourceLocation current_location() const noexcept {
        SourceLocation loc = start_;
        loc.offset += static_cast<size_t>(ptr_ - begin_);
        for (const char* p = begin_; p < ptr_; ++p) {
            if (*p == '\n') { ++loc.line; loc.column = 1; }
            else { ++loc.column; }
        }
        return loc;
    }

    [[noreturn]] SJSON_NOINLINE void error(const std::string& msg,
                                           errc code = errc::unexpected_character) const {
        throw ParseError(msg, current_location(), code);
    }

    void expect(char c) {
        if (SJSON_UNLIKELY(ptr_ >= end_ || *ptr_ != c))
            error(std::string("expected '") + c + "'");
        ++ptr_;
    }

    void expect_end(errc code) const {
        if (SJSON_UNLIKELY(ptr_ != end_))
            error(std::string("unexpected character '") + *ptr_ + "'", code);
    }

    void expect_word(std::string_view word, errc code) {
        if (SJSON_UNLIKELY(static_cast<size_t>(end_ - ptr_) != word.size() ||
                           std::memcmp(ptr_, word.data(), word.size()) != 0))
            error("invalid literal", code);
        ptr_ = end_;
    }

    void lex_escape(std::string& out) {
        if (SJSON_UNLIKELY(ptr_ >= end_))
            error("unterminated escape sequence", errc::invalid_escape);
        char c = *ptr_++;
        switch (c) {
            case '"':  out.push_back('"');  return;
            case '\\': out.push_back('\\'); return;
            case '/':  out.push_back('/');  return;
            case 'b':  out.push_back('\b'); return;
            case 'f':  out.push_back('\f'); return;
            case 'n':  out.push_back('\n'); return;
            case 'r':  out.push_back('\r'); return;
            case 't':  out.push_back('\t'); return;
            case 'u':  lex_unicode_escape(out); return;
            default:
                --ptr_;
                error(std::string("invalid escape '\\") + c + "'", errc::invalid_escape);
        }
    }

    static uint8_t hex_value(char h) noexcept {
        if (h >= '0' && h <= '9') return static_cast<uint8_t>(h - '0');
        if (h >= 'a' && h <= 'f') return static_cast<uint8_t>(h - 'a' + 10);
        if (h >= 'A' && h <= 'F') return static_cast<uint8_t>(h - 'A' + 10);
        return 0xFF;
    }

    uint32_t lex_hex4() {
        if (SJSON_UNLIKELY(end_ - ptr_ < 4))
            error("incomplete unicode escape", errc::invalid_unicode_escape);
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            uint8_t nib = hex_value(ptr_[i]);
            if (SJSON_UNLIKELY(nib > 15))
                error("invalid hex digit in unicode escape", errc::invalid_unicode_escape);
            val = (val << 4) | nib;
        }
        ptr_ += 4;
        return val;
    }

    void lex_unicode_escape(std::string& out) {
        uint32_t cp = lex_hex4();

        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (SJSON_UNLIKELY(end_ - ptr_ < 2 || ptr_[0] != '\\' || ptr_[1] != 'u'))
                error("missing low surrogate", errc::invalid_unicode_escape);
            ptr_ += 2;
            uint32_t low = lex_hex4();
            if (SJSON_UNLIKELY(low < 0xDC00 || low > 0xDFFF))
                error("invalid low surrogate value", errc::invalid_unicode_escape);
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
        } else if (SJSON_UNLIKELY(cp >= 0xDC00 && cp <= 0xDFFF)) {
            error("unexpected low surrogate", errc::invalid_unicode_escape);
        }

        char buf[4];
        unsigned n = utf8::encode(cp, buf);
        out.append(buf, n);
    }

    SJSON_NOINLINE Value lex_float_slow(const char* start) {
        double d = 0.0;
        auto [p, ec] = std::from_chars(start, end_, d);
        if (SJSON_LIKELY(ec == std::errc{} && p == end_)) return Value(d);
        if (ec == std::errc::result_out_of_range && p == end_) {
            std::string_view text(start, static_cast<size_t>(end_ - start));
            bool tiny = text.find("e-") != std::string_view::npos ||
                        text.find("E-") != std::string_view::npos;
            double mag = tiny ? 0.0 : std::numeric_limits<double>::infinity();
            return Value(*start == '-' ? -mag : mag);
        }
        error("invalid number", errc::invalid_number);
    }

    const char* begin_;
    const char* ptr_;
    const char* end_;
    SourceLocation start_;
    const ParseOptions& opts_;
};

} // namespace sjson::detail
