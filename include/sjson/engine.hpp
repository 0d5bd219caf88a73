#pragma once

/// @file engine.hpp
/// @author Aleksandr Loshkarev
/// @brief Resumable parser core: Parser<T>, Outcome<T>, pure(), fail().
///
/// A Parser<T> is an immutable program that consumes bytes chunk by chunk and
/// eventually yields a T. Feeding a chunk produces an Outcome<T>:
///   - Done(value, leftover)  : leftover is a suffix of the chunk just fed
///   - NeedMore(continuation) : feed the next chunk to the continuation
///   - Failed(failure)        : terminal
///
/// An empty chunk marks the end of input. Programs are run by a trampoline
/// that keeps pending continuations on a heap stack, so neither long bind
/// chains nor deeply nested documents grow the C++ call stack.
///
/// @code
///   auto p = sjson::pure(20).map([](int x) { return x + 1; });
///   auto out = p.feed("ignored");
///   assert(out.done() && out.value() == 21 && out.leftover() == "ignored");
/// @endcode

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace sjson {

/// @brief Instrumentation snapshot of the byte stream a parser is bound to.
struct StreamStats {
    size_t buffered_bytes      = 0;  ///< Bytes of the incomplete token held right now
    size_t peak_buffered_bytes = 0;  ///< Largest token buffer seen so far
    size_t depth               = 0;  ///< Currently open compounds
    size_t bytes_consumed      = 0;  ///< Bytes consumed from all chunks so far
};

namespace detail {

/// @brief The window of the current chunk that a primitive may consume.
struct Input {
    std::string_view data;
    bool eof = false;  ///< The chunk is the empty end-of-input marker
};

/// @brief Something that owns stream state: the tokenizer.
class StreamSource {
public:
    virtual ~StreamSource() = default;
    [[nodiscard]] virtual StreamStats stats() const = 0;
    [[nodiscard]] virtual SourceLocation location() const = 0;
};

using SourcePtr = std::shared_ptr<StreamSource>;

class Program;
using ProgramPtr = std::shared_ptr<Program>;
using Continuation = std::function<ProgramPtr(std::any)>;

/// @brief Result of invoking a primitive once.
struct PrimStep;
using Primitive = std::function<PrimStep(Input&)>;

struct PrimStep {
    enum class Kind : uint8_t { Done, NeedMore, Failed };

    Kind kind = Kind::NeedMore;
    std::any value;
    Failure failure;
    Primitive resume;  ///< NeedMore: what to invoke with the next chunk (default: the same primitive)

    static PrimStep done(std::any v) {
        PrimStep s;
        s.kind = Kind::Done;
        s.value = std::move(v);
        return s;
    }
    static PrimStep need_more(Primitive resume = {}) {
        PrimStep s;
        s.kind = Kind::NeedMore;
        s.resume = std::move(resume);
        return s;
    }
    static PrimStep failed(Failure f) {
        PrimStep s;
        s.kind = Kind::Failed;
        s.failure = std::move(f);
        return s;
    }
};

/// @brief One node of a parser program.
class Program {
public:
    enum class Kind : uint8_t { Pure, Prim, Bind, Fail, Suspended };

    explicit Program(Kind k) noexcept : kind(k) {}

    Program(const Program&) = delete;
    Program& operator=(const Program&) = delete;

    // Left-nested binds form long `inner` chains; unlink them iteratively.
    ~Program() {
        ProgramPtr p = std::move(inner);
        while (p && p.use_count() == 1) {
            ProgramPtr below = std::move(p->inner);
            p = std::move(below);
        }
    }

    Kind kind;
    std::any value;                    ///< Pure; Suspended with a pending value
    Primitive prim;                    ///< Prim; Suspended primitive to resume
    SourcePtr source;                  ///< Prim / Suspended: stream the primitive reads
    ProgramPtr inner;                  ///< Bind
    Continuation next;                 ///< Bind
    Failure failure;                   ///< Fail
    bool locate = false;               ///< Fail: stamp the stream position when it fires
    std::vector<Continuation> frames;  ///< Suspended: pending continuations, innermost last
    bool pending = false;              ///< Suspended: value waits for a fresh chunk
    bool consumed = false;             ///< Suspended: already resumed once
};

inline ProgramPtr make_pure(std::any v) {
    auto p = std::make_shared<Program>(Program::Kind::Pure);
    p->value = std::move(v);
    return p;
}

inline ProgramPtr make_prim(Primitive prim, SourcePtr source = nullptr) {
    auto p = std::make_shared<Program>(Program::Kind::Prim);
    p->prim = std::move(prim);
    p->source = std::move(source);
    return p;
}

inline ProgramPtr make_bind(ProgramPtr inner, Continuation next) {
    auto p = std::make_shared<Program>(Program::Kind::Bind);
    p->inner = std::move(inner);
    p->next = std::move(next);
    return p;
}

inline ProgramPtr make_fail(std::string message, errc code, bool locate = true) {
    auto p = std::make_shared<Program>(Program::Kind::Fail);
    p->failure.message = std::move(message);
    p->failure.code = make_error_code(code);
    p->locate = locate;
    return p;
}

inline ProgramPtr make_suspended(Primitive prim, SourcePtr source,
                                 std::vector<Continuation> frames) {
    auto p = std::make_shared<Program>(Program::Kind::Suspended);
    p->prim = std::move(prim);
    p->source = std::move(source);
    p->frames = std::move(frames);
    return p;
}

/// @brief What one call of run() produced.
struct RunResult {
    PrimStep::Kind kind = PrimStep::Kind::Failed;
    std::any value;
    std::string_view leftover;
    ProgramPtr resume;
    Failure failure;
    SourcePtr source;  ///< Last stream touched, for stats and failure positions
};

inline SourceLocation location_of(const SourcePtr& source) {
    return source ? source->location() : SourceLocation{};
}

/// @brief Find the stream a program reads first, if any.
inline SourcePtr source_of(ProgramPtr p) {
    while (p) {
        if (p->source) return p->source;
        if (p->kind != Program::Kind::Bind) return nullptr;
        p = p->inner;
    }
    return nullptr;
}

/// @brief The trampoline: run a program against one chunk.
///
/// Pending continuations live on a heap vector (innermost last). When a
/// value is produced with the chunk exhausted but not at end of input, the
/// machine suspends before invoking the next continuation: zero leftover at
/// a chunk boundary never stands for end of input.
inline RunResult run(const ProgramPtr& program, std::string_view chunk) {
    Input in{chunk, chunk.empty()};
    std::vector<Continuation> stack;
    std::any value;
    bool have_value = false;
    ProgramPtr cur = program;
    RunResult out;

    auto failed = [&](Failure f) {
        out.kind = PrimStep::Kind::Failed;
        out.failure = std::move(f);
        return std::move(out);
    };
    auto stream_failure = [&](errc code, std::string message) {
        return Failure{location_of(out.source), std::move(message), make_error_code(code)};
    };

    if (SJSON_UNLIKELY(!cur))
        return failed(stream_failure(errc::user_failure, "empty parser"));

    for (;;) {
        if (have_value) {
            if (stack.empty()) {
                out.kind = PrimStep::Kind::Done;
                out.value = std::move(value);
                out.leftover = in.data;
                return out;
            }
            if (in.data.empty() && !in.eof) {
                auto s = make_suspended({}, out.source, std::move(stack));
                s->value = std::move(value);
                s->pending = true;
                out.kind = PrimStep::Kind::NeedMore;
                out.resume = std::move(s);
                return out;
            }
            Continuation k = std::move(stack.back());
            stack.pop_back();
            have_value = false;
            try {
                cur = k(std::move(value));
            } catch (const ParseError& e) {
                return failed(Failure{e.location(), e.detail(), e.code()});
            } catch (const std::system_error& e) {
                return failed(Failure{location_of(out.source), e.what(), e.code()});
            }
            if (SJSON_UNLIKELY(!cur))
                return failed(stream_failure(errc::user_failure, "continuation produced an empty parser"));
            continue;
        }

        switch (cur->kind) {
            case Program::Kind::Pure:
                // A node produced by a continuation is held only here.
                if (cur.use_count() == 1) value = std::move(cur->value);
                else value = cur->value;
                have_value = true;
                break;

            case Program::Kind::Bind:
                stack.push_back(cur->next);
                cur = cur->inner;
                break;

            case Program::Kind::Fail: {
                Failure f = cur->failure;
                if (cur->locate) f.location = location_of(out.source);
                return failed(std::move(f));
            }

            case Program::Kind::Prim: {
                if (cur->source) out.source = cur->source;
                PrimStep step = cur->prim(in);
                switch (step.kind) {
                    case PrimStep::Kind::Done:
                        value = std::move(step.value);
                        have_value = true;
                        break;
                    case PrimStep::Kind::NeedMore:
                        if (in.eof)
                            return failed(stream_failure(errc::unexpected_end_of_input,
                                                         "unexpected end of input"));
                        out.kind = PrimStep::Kind::NeedMore;
                        out.resume = make_suspended(step.resume ? std::move(step.resume) : cur->prim,
                                                    cur->source, std::move(stack));
                        return out;
                    case PrimStep::Kind::Failed:
                        return failed(std::move(step.failure));
                }
                break;
            }

            case Program::Kind::Suspended: {
                if (cur->source) out.source = cur->source;
                if (SJSON_UNLIKELY(cur->consumed))
                    return failed(stream_failure(errc::continuation_consumed,
                                                 "continuation already consumed"));
                cur->consumed = true;
                for (auto& k : cur->frames) stack.push_back(std::move(k));
                cur->frames.clear();
                if (cur->pending) {
                    value = std::move(cur->value);
                    have_value = true;
                } else {
                    cur = make_prim(std::move(cur->prim), cur->source);
                }
                break;
            }
        }
    }
}

// ─── Boxing: how a T travels through std::any ────────────────────────────
// Views over raw stream values (ParseResult<P>, Element<C, P>) declare a
// raw_type and travel as that type, so typed and untyped parsers can share
// one program.

template <typename T, typename = void>
struct Boxing {
    static std::any box(T v) { return std::any(std::move(v)); }
    static T unbox(std::any&& a) { return std::any_cast<T>(std::move(a)); }
};

template <typename T>
struct Boxing<T, std::void_t<typename T::raw_type>> {
    static std::any box(T v) { return std::any(typename T::raw_type(v.raw())); }
    static T unbox(std::any&& a) {
        return T(std::any_cast<typename T::raw_type>(std::move(a)));
    }
};

template <typename T> struct is_parser : std::false_type {};
template <typename T> struct is_parser<Parser<T>> : std::true_type {};

} // namespace detail

// =====================================================================
// Outcome<T>
// =====================================================================

/// @brief What one feed() produced.
template <typename T>
class Outcome {
public:
    enum class Status : uint8_t { Done, NeedMore, Failed };

    [[nodiscard]] Status status() const noexcept { return status_; }
    [[nodiscard]] bool done() const noexcept { return status_ == Status::Done; }
    [[nodiscard]] bool need_more() const noexcept { return status_ == Status::NeedMore; }
    [[nodiscard]] bool failed() const noexcept { return status_ == Status::Failed; }

    /// @brief The parsed value. Throws TypeError unless done().
    T& value() {
        if (SJSON_UNLIKELY(!done())) state_error("a value");
        return *value_;
    }
    const T& value() const {
        if (SJSON_UNLIKELY(!done())) state_error("a value");
        return *value_;
    }

    /// @brief Unconsumed suffix of the chunk that completed the parse.
    [[nodiscard]] std::string_view leftover() const noexcept { return leftover_; }

    /// @brief Where to feed the next chunk. Throws TypeError unless need_more().
    [[nodiscard]] Parser<T> continuation() const {
        if (SJSON_UNLIKELY(!need_more())) state_error("a continuation");
        return Parser<T>(resume_);
    }

    /// @brief Shorthand for continuation().feed(chunk).
    [[nodiscard]] Outcome feed(std::string_view chunk) const {
        return continuation().feed(chunk);
    }

    /// @brief Why the parse stopped. Throws TypeError unless failed().
    [[nodiscard]] const Failure& failure() const {
        if (SJSON_UNLIKELY(!failed())) state_error("a failure");
        return failure_;
    }

    /// @brief Instrumentation of the stream this outcome came from.
    [[nodiscard]] StreamStats stats() const {
        return source_ ? source_->stats() : StreamStats{};
    }

    /// @brief Copy whose leftover no longer refers to the chunk it came from.
    [[nodiscard]] Outcome detached() const {
        Outcome o = *this;
        o.leftover_ = {};
        return o;
    }

    /// @brief A failed outcome raised outside the engine (e.g. by a reader).
    static Outcome failed_with(Failure f) {
        Outcome o;
        o.status_ = Status::Failed;
        o.failure_ = std::move(f);
        return o;
    }

    static Outcome from_run(detail::RunResult r) {
        Outcome o;
        o.source_ = std::move(r.source);
        switch (r.kind) {
            case detail::PrimStep::Kind::Done:
                o.status_ = Status::Done;
                o.value_.emplace(detail::Boxing<T>::unbox(std::move(r.value)));
                o.leftover_ = r.leftover;
                break;
            case detail::PrimStep::Kind::NeedMore:
                o.status_ = Status::NeedMore;
                o.resume_ = std::move(r.resume);
                break;
            case detail::PrimStep::Kind::Failed:
                o.status_ = Status::Failed;
                o.failure_ = std::move(r.failure);
                break;
        }
        return o;
    }

private:
    Outcome() = default;

    [[noreturn]] void state_error(const char* wanted) const {
        static constexpr const char* kNames[] = {"done", "need more", "failed"};
        throw TypeError(std::string("outcome has no ") + wanted + " (status: " +
                        kNames[static_cast<int>(status_)] + ")");
    }

    Status status_ = Status::Failed;
    std::optional<T> value_;
    std::string_view leftover_;
    detail::ProgramPtr resume_;
    Failure failure_;
    detail::SourcePtr source_;
};

// =====================================================================
// Parser<T>
// =====================================================================

/// @brief A resumable, non-backtracking parser producing a T.
///
/// Parsers derived from a stream (element parsers, continuations) are
/// single-use: once a successor has been derived, running the old one fails
/// with errc::continuation_consumed.
template <typename T>
class Parser {
public:
    using value_type = T;

    Parser() = default;
    explicit Parser(detail::ProgramPtr program) noexcept : program_(std::move(program)) {}

    /// @brief Drive one step with the next chunk; an empty chunk ends the input.
    [[nodiscard]] Outcome<T> feed(std::string_view chunk) const {
        return Outcome<T>::from_run(detail::run(program_, chunk));
    }

    /// @brief Sequence: run this parser, then f(value). f must return a Parser<U>.
    template <typename F>
    [[nodiscard]] auto bind(F f) const {
        using Next = std::decay_t<std::invoke_result_t<F&, T>>;
        static_assert(detail::is_parser<Next>::value,
                      "bind(): the continuation must return a Parser");
        return Next(detail::make_bind(program_, [f = std::move(f)](std::any v) mutable {
            return f(detail::Boxing<T>::unbox(std::move(v))).program();
        }));
    }

    /// @brief Transform the result with a plain function.
    template <typename F>
    [[nodiscard]] auto map(F f) const {
        using U = std::decay_t<std::invoke_result_t<F&, T>>;
        return Parser<U>(detail::make_bind(program_, [f = std::move(f)](std::any v) mutable {
            return detail::make_pure(detail::Boxing<U>::box(f(detail::Boxing<T>::unbox(std::move(v)))));
        }));
    }

    [[nodiscard]] const detail::ProgramPtr& program() const noexcept { return program_; }
    [[nodiscard]] bool valid() const noexcept { return program_ != nullptr; }

    /// @brief Instrumentation of the stream this parser reads, if bound to one.
    [[nodiscard]] StreamStats stats() const {
        auto source = detail::source_of(program_);
        return source ? source->stats() : StreamStats{};
    }

private:
    detail::ProgramPtr program_;
};

/// @brief A parser that is already done with v and consumes nothing.
template <typename T>
[[nodiscard]] Parser<std::decay_t<T>> pure(T&& v) {
    using U = std::decay_t<T>;
    return Parser<U>(detail::make_pure(detail::Boxing<U>::box(U(std::forward<T>(v)))));
}

/// @brief A parser that fails terminally at the current stream position.
template <typename T>
[[nodiscard]] Parser<T> fail(std::string message, errc code = errc::user_failure) {
    return Parser<T>(detail::make_fail(std::move(message), code));
}

} // namespace sjson
