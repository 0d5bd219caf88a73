#pragma once

/// @file tokenizer.hpp
/// @author Aleksandr Loshkarev
/// @brief Chunk-resumable structural tokenizer.
///
/// One Tokenizer exists per byte stream. It hands out one step at a time:
/// the top-level value, then for each open compound the next element
/// (an item with its value, or the end marker). Structural bytes are
/// consumed directly from the caller's chunk; only the bytes of an atom
/// token split across chunks are copied into the token buffer, and the
/// token is lexed from its first byte once its end has been seen.
///
/// Steps are single-use. Every step program records the stream generation
/// it was created at; starting a step bumps the generation, so any other
/// outstanding step program of the same stream is detected as stale.

#include "../config.hpp"
#include "../engine.hpp"
#include "../error.hpp"
#include "../parse_options.hpp"
#include "../path.hpp"
#include "../value.hpp"
#include "lexer.hpp"

#include <algorithm>
#include <any>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sjson::detail {

/// @brief Untyped parse result as produced by the tokenizer.
struct RawResult {
    ResultKind kind = ResultKind::Null;
    Value atom;                ///< Bool / Number / String payload
    ProgramPtr continuation;   ///< Compounds: element parser. Atoms: next parser (null at the root)
};

/// @brief Untyped element of an open compound.
struct RawElement {
    bool end = false;
    PathComponent index;       ///< Item only
    RawResult value;           ///< Item only
    ProgramPtr next;           ///< End only: the parent's next parser (null at the root)
};

class Tokenizer final : public StreamSource,
                        public std::enable_shared_from_this<Tokenizer> {
public:
    explicit Tokenizer(const ParseOptions& opts)
        : opts_(opts)
        , max_depth_(opts.effective_max_depth())
        , max_token_(opts.effective_max_token_size()) {}

    static std::shared_ptr<Tokenizer> create(const ParseOptions& opts) {
        return std::make_shared<Tokenizer>(opts);
    }

    /// @brief Program yielding the top-level RawResult of a fresh stream.
    ProgramPtr value_program() {
        auto self = shared_from_this();
        return make_prim([self, gen = generation_](Input& in) {
            return self->start(in, false, gen);
        }, self);
    }

    /// @brief Program yielding the next RawElement of the innermost open compound.
    ProgramPtr element_program() {
        auto self = shared_from_this();
        return make_prim([self, gen = generation_](Input& in) {
            return self->start(in, true, gen);
        }, self);
    }

    [[nodiscard]] StreamStats stats() const override {
        StreamStats s;
        s.buffered_bytes = token_.size();
        s.peak_buffered_bytes = peak_buffered_;
        s.depth = frames_.size();
        s.bytes_consumed = loc_.offset;
        return s;
    }

    [[nodiscard]] SourceLocation location() const override { return loc_; }

    [[nodiscard]] size_t depth() const noexcept { return frames_.size(); }

private:
    enum class Stage : uint8_t {
        Idle, Separator, AfterComma, BeforeKey, Key, BeforeColon, BeforeValue, Token
    };
    enum class TokenKind : uint8_t { String, Number, Literal };
    enum class Scan : uint8_t { Complete, Incomplete, TooLarge };

    struct Frame {
        Compound kind;
        size_t count;
    };

    // Token buffers larger than this are released once the token is lexed.
    static constexpr size_t kRetainedTokenCapacity = 64 * 1024;

    // ─── Step entry points ──────────────────────────────────────────────

    // Only the most recently created step program carries the current
    // generation, so it always belongs to the innermost open frame.
    PrimStep start(Input& in, bool element, uint64_t gen) {
        if (SJSON_UNLIKELY(failed_))
            return fail_stale("stream has already failed");
        if (SJSON_UNLIKELY(gen != generation_ || stage_ != Stage::Idle))
            return fail_stale("continuation already consumed");
        if (SJSON_UNLIKELY(!element && started_))
            return fail_stale("continuation already consumed");
        ++generation_;
        started_ = true;
        element_step_ = element;
        stage_ = element ? Stage::Separator : Stage::BeforeValue;
        return guarded(in);
    }

    PrimStep resume(Input& in, uint64_t step) {
        if (SJSON_UNLIKELY(failed_))
            return fail_stale("stream has already failed");
        if (SJSON_UNLIKELY(step != generation_ || stage_ == Stage::Idle))
            return fail_stale("continuation already consumed");
        return guarded(in);
    }

    PrimStep guarded(Input& in) {
        try {
            return step(in);
        } catch (const ParseError& e) {
            failed_ = true;
            stage_ = Stage::Idle;
            return PrimStep::failed(Failure{e.location(), e.detail(), e.code()});
        }
    }

    // ─── The state machine ──────────────────────────────────────────────

    PrimStep step(Input& in) {
        for (;;) {
            switch (stage_) {
                case Stage::Separator: {
                    if (!skip_whitespace(in)) return suspend(in);
                    Frame& f = frames_.back();
                    char c = in.data.front();
                    if (c == closer(f.kind)) {
                        advance(in, 1);
                        return finish_end();
                    }
                    if (f.count > 0) {
                        if (SJSON_UNLIKELY(c != ','))
                            return fail_here(std::string("expected ',' or '") + closer(f.kind) +
                                             "' in " + compound_name(f.kind),
                                             errc::unexpected_character);
                        advance(in, 1);
                        stage_ = Stage::AfterComma;
                        break;
                    }
                    begin_item();
                    break;
                }

                case Stage::AfterComma: {
                    if (!skip_whitespace(in)) return suspend(in);
                    Frame& f = frames_.back();
                    if (in.data.front() == closer(f.kind)) {
                        if (SJSON_UNLIKELY(!opts_.allow_trailing_commas))
                            return fail_here("trailing comma", errc::unexpected_character);
                        advance(in, 1);
                        return finish_end();
                    }
                    begin_item();
                    break;
                }

                case Stage::BeforeKey: {
                    if (!skip_whitespace(in)) return suspend(in);
                    if (SJSON_UNLIKELY(in.data.front() != '"'))
                        return fail_here("expected string key", errc::unexpected_character);
                    begin_token(TokenKind::String);
                    stage_ = Stage::Key;
                    break;
                }

                case Stage::Key: {
                    Scan s = scan_token(in);
                    if (s != Scan::Complete) return token_pending(in, s);
                    std::string key = Lexer(token_view_, token_loc_, opts_).lex_string();
                    release_token();
                    index_ = PathComponent::field(std::move(key));
                    stage_ = Stage::BeforeColon;
                    break;
                }

                case Stage::BeforeColon: {
                    if (!skip_whitespace(in)) return suspend(in);
                    if (SJSON_UNLIKELY(in.data.front() != ':'))
                        return fail_here("expected ':' after object key", errc::unexpected_character);
                    advance(in, 1);
                    stage_ = Stage::BeforeValue;
                    break;
                }

                case Stage::BeforeValue: {
                    if (!skip_whitespace(in)) return suspend(in);
                    char c = in.data.front();
                    if (c == '[' || c == '{') {
                        if (SJSON_UNLIKELY(frames_.size() >= max_depth_))
                            return fail_here("maximum nesting depth exceeded",
                                             errc::max_depth_exceeded);
                        advance(in, 1);
                        Compound kind = c == '[' ? Compound::Array : Compound::Object;
                        frames_.push_back(Frame{kind, 0});
                        RawResult r;
                        r.kind = kind == Compound::Array ? ResultKind::ArrayStart
                                                         : ResultKind::ObjectStart;
                        r.continuation = element_program();
                        return finish_item(std::move(r));
                    }
                    if (c == '"') {
                        begin_token(TokenKind::String);
                    } else if (c == '-' || (c >= '0' && c <= '9')) {
                        begin_token(TokenKind::Number);
                    } else if (is_alpha(c)) {
                        begin_token(TokenKind::Literal);
                    } else {
                        return fail_here(std::string("unexpected character '") + c + "'",
                                         errc::unexpected_character);
                    }
                    stage_ = Stage::Token;
                    break;
                }

                case Stage::Token: {
                    Scan s = scan_token(in);
                    if (s != Scan::Complete) return token_pending(in, s);
                    RawResult r = lex_atom();
                    release_token();
                    r.continuation = frames_.empty() ? nullptr : element_program();
                    return finish_item(std::move(r));
                }

                case Stage::Idle:
                    return fail_here("tokenizer has no step in progress", errc::frame_mismatch);
            }
        }
    }

    RawResult lex_atom() {
        Lexer lexer(token_view_, token_loc_, opts_);
        RawResult r;
        switch (token_kind_) {
            case TokenKind::String:
                r.kind = ResultKind::String;
                r.atom = Value(lexer.lex_string());
                break;
            case TokenKind::Number:
                r.kind = ResultKind::Number;
                r.atom = lexer.lex_number();
                break;
            case TokenKind::Literal:
                r.atom = lexer.lex_literal();
                r.kind = r.atom.is_null() ? ResultKind::Null
                       : r.atom.is_bool() ? ResultKind::Bool
                                          : ResultKind::Number;
                break;
        }
        return r;
    }

    void begin_item() {
        Frame& f = frames_.back();
        if (f.kind == Compound::Array) {
            index_ = PathComponent::offset(f.count);
            stage_ = Stage::BeforeValue;
        } else {
            stage_ = Stage::BeforeKey;
        }
        ++f.count;
    }

    PrimStep finish_item(RawResult r) {
        stage_ = Stage::Idle;
        if (!element_step_) return PrimStep::done(std::any(std::move(r)));
        RawElement e;
        e.index = std::move(index_);
        e.value = std::move(r);
        return PrimStep::done(std::any(std::move(e)));
    }

    PrimStep finish_end() {
        frames_.pop_back();
        stage_ = Stage::Idle;
        RawElement e;
        e.end = true;
        e.next = frames_.empty() ? nullptr : element_program();
        return PrimStep::done(std::any(std::move(e)));
    }

    // ─── Suspension and failure ─────────────────────────────────────────

    PrimStep suspend(const Input& in) {
        if (in.eof) return fail_here("unexpected end of input", errc::unexpected_end_of_input);
        auto self = shared_from_this();
        return PrimStep::need_more([self, id = generation_](Input& next) {
            return self->resume(next, id);
        });
    }

    PrimStep token_pending(const Input& in, Scan s) {
        if (s == Scan::TooLarge)
            return fail_here("token exceeds " + std::to_string(max_token_) + " buffered bytes",
                             errc::token_too_large);
        if (in.eof && token_kind_ == TokenKind::String) {
            failed_ = true;
            stage_ = Stage::Idle;
            return PrimStep::failed(Failure{token_loc_, "unterminated string",
                                            make_error_code(errc::unterminated_string)});
        }
        return suspend(in);
    }

    PrimStep fail_here(std::string message, errc code) {
        failed_ = true;
        stage_ = Stage::Idle;
        return PrimStep::failed(Failure{loc_, std::move(message), make_error_code(code)});
    }

    // A stale continuation fails on its own without disturbing the live one.
    PrimStep fail_stale(std::string message) const {
        return PrimStep::failed(Failure{loc_, std::move(message),
                                        make_error_code(errc::continuation_consumed)});
    }

    // ─── Byte-level helpers ─────────────────────────────────────────────

    static char closer(Compound kind) noexcept { return kind == Compound::Array ? ']' : '}'; }

    static bool is_alpha(char c) noexcept {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    bool is_number_char(char c) const noexcept {
        return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' ||
               c == 'E' || (opts_.allow_nan_inf && is_alpha(c));
    }

    void advance(Input& in, size_t n) noexcept {
        for (size_t i = 0; i < n; ++i) {
            if (in.data[i] == '\n') { ++loc_.line; loc_.column = 1; }
            else { ++loc_.column; }
        }
        loc_.offset += n;
        in.data.remove_prefix(n);
    }

    /// @return true if a non-whitespace byte is available.
    bool skip_whitespace(Input& in) noexcept {
        size_t n = 0;
        while (n < in.data.size()) {
            char c = in.data[n];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++n;
        }
        advance(in, n);
        return !in.data.empty();
    }

    void begin_token(TokenKind kind) noexcept {
        token_kind_ = kind;
        token_started_ = false;
        escape_ = false;
        token_loc_ = loc_;
        token_.clear();
    }

    /// Find the end of the current token in this chunk. A string ends at its
    /// closing quote; numbers and literals end at the first byte that cannot
    /// belong to them or at end of input.
    Scan scan_token(Input& in) {
        const std::string_view d = in.data;
        size_t i = 0;
        bool complete = false;
        if (!token_started_) {
            token_started_ = true;
            if (token_kind_ == TokenKind::String) i = 1;
        }
        switch (token_kind_) {
            case TokenKind::String:
                for (; i < d.size(); ++i) {
                    char c = d[i];
                    if (escape_) {
                        escape_ = false;
                    } else if (c == '\\') {
                        escape_ = true;
                    } else if (c == '"') {
                        ++i;
                        complete = true;
                        break;
                    }
                }
                break;
            case TokenKind::Number:
                while (i < d.size() && is_number_char(d[i])) ++i;
                complete = i < d.size() || in.eof;
                break;
            case TokenKind::Literal:
                while (i < d.size() && is_alpha(d[i])) ++i;
                complete = i < d.size() || in.eof;
                break;
        }

        if (complete && token_.empty()) {
            token_view_ = d.substr(0, i);
        } else {
            if (SJSON_UNLIKELY(token_.size() + i > max_token_)) return Scan::TooLarge;
            token_.append(d.data(), i);
            peak_buffered_ = std::max(peak_buffered_, token_.size());
            if (complete) token_view_ = token_;
        }
        advance(in, i);
        return complete ? Scan::Complete : Scan::Incomplete;
    }

    void release_token() {
        token_view_ = {};
        token_.clear();
        if (token_.capacity() > kRetainedTokenCapacity) std::string().swap(token_);
    }

    // ─── State ──────────────────────────────────────────────────────────

    ParseOptions opts_;
    size_t max_depth_;
    size_t max_token_;

    std::vector<Frame> frames_;
    SourceLocation loc_;

    uint64_t generation_ = 0;
    bool started_ = false;
    bool failed_ = false;
    bool element_step_ = false;
    Stage stage_ = Stage::Idle;
    PathComponent index_;

    TokenKind token_kind_ = TokenKind::Literal;
    bool token_started_ = false;
    bool escape_ = false;
    SourceLocation token_loc_;
    std::string token_;
    std::string_view token_view_;
    size_t peak_buffered_ = 0;
};

} // namespace sjson::detail
