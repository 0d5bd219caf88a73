#pragma once

/// @file result.hpp
/// @author Aleksandr Loshkarev
/// @brief Parse results, elements and their depth-erased handles.
///
/// ParseResult<P> is "what the stream revealed" at position P:
///
///   ArrayStart  -> array()  : Parser<Element<Compound::Array, P>>
///   ObjectStart -> object() : Parser<Element<Compound::Object, P>>
///   Null / Bool / Number / String -> payload plus next() : NextParser<P>
///
/// Element<C, P> is one step inside an open compound: an item with its
/// index() and value() (a ParseResult<In<C, P>>), or the end marker whose
/// next() continues the parent.
///
/// @code
///   auto out = sjson::parse_all(sjson::root(), "[1, 2]");
///   auto arr = out.value().array();          // Parser<Element<Array, Root>>
/// @endcode
///
/// Both types are views over the untyped tokenizer output; every value and
/// continuation is single-use.

#include "engine.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "parse_options.hpp"
#include "path.hpp"
#include "value.hpp"
#include "detail/tokenizer.hpp"

#include <optional>
#include <string_view>
#include <string>
#include <utility>
#include <vector>

namespace sjson {

namespace detail {

[[noreturn]] inline void result_kind_error(const char* wanted, ResultKind actual) {
    throw TypeError(std::string("parse result is ") + result_kind_name(actual) +
                    ", not " + wanted);
}

inline void require_kind(const RawResult& r, ResultKind k) {
    if (SJSON_UNLIKELY(r.kind != k)) result_kind_error(result_kind_name(k), r.kind);
}

inline void require_atom(const RawResult& r) {
    if (SJSON_UNLIKELY(r.kind == ResultKind::ArrayStart || r.kind == ResultKind::ObjectStart))
        result_kind_error("an atom", r.kind);
}

inline ResultKind start_kind(Compound c) noexcept {
    return c == Compound::Array ? ResultKind::ArrayStart : ResultKind::ObjectStart;
}

/// Shared read-only accessors of typed and erased results.
template <typename Derived>
class ResultAccess {
public:
    [[nodiscard]] ResultKind kind() const noexcept { return raw().kind; }
    [[nodiscard]] bool is_array() const noexcept { return kind() == ResultKind::ArrayStart; }
    [[nodiscard]] bool is_object() const noexcept { return kind() == ResultKind::ObjectStart; }
    [[nodiscard]] bool is_compound() const noexcept { return is_array() || is_object(); }
    [[nodiscard]] bool is_atom() const noexcept { return !is_compound(); }
    [[nodiscard]] bool is_null() const noexcept { return kind() == ResultKind::Null; }
    [[nodiscard]] bool is_bool() const noexcept { return kind() == ResultKind::Bool; }
    [[nodiscard]] bool is_number() const noexcept { return kind() == ResultKind::Number; }
    [[nodiscard]] bool is_string() const noexcept { return kind() == ResultKind::String; }

    [[nodiscard]] bool as_bool() const {
        require_kind(raw(), ResultKind::Bool);
        return raw().atom.as_bool();
    }
    [[nodiscard]] const std::string& as_string() const {
        require_kind(raw(), ResultKind::String);
        return raw().atom.as_string();
    }
    /// @brief The numeric payload (integer, unsigned or float Value).
    [[nodiscard]] const Value& number() const {
        require_kind(raw(), ResultKind::Number);
        return raw().atom;
    }
    /// @brief The payload of an atom as a tree value.
    [[nodiscard]] const Value& atom_value() const {
        require_atom(raw());
        return raw().atom;
    }

private:
    const RawResult& raw() const noexcept { return static_cast<const Derived&>(*this).raw(); }
};

} // namespace detail

// =====================================================================
// Typed views
// =====================================================================

template <typename P>
class ParseResult : public detail::ResultAccess<ParseResult<P>> {
public:
    using raw_type = detail::RawResult;
    using path_type = P;

    explicit ParseResult(raw_type raw) noexcept : raw_(std::move(raw)) {}

    /// @brief Element parser of an array. Throws TypeError otherwise.
    [[nodiscard]] Parser<Element<Compound::Array, P>> array() const {
        detail::require_kind(raw_, ResultKind::ArrayStart);
        return Parser<Element<Compound::Array, P>>(raw_.continuation);
    }

    /// @brief Element parser of an object. Throws TypeError otherwise.
    [[nodiscard]] Parser<Element<Compound::Object, P>> object() const {
        detail::require_kind(raw_, ResultKind::ObjectStart);
        return Parser<Element<Compound::Object, P>>(raw_.continuation);
    }

    /// @brief What follows an atom. Throws TypeError for compounds.
    [[nodiscard]] NextParser<P> next() const {
        detail::require_atom(raw_);
        return detail::NextOf<P>::make(raw_.continuation);
    }

    /// @brief The atom view: continuation plus payload, empty for compounds.
    [[nodiscard]] std::optional<std::pair<NextParser<P>, Value>> atom() const {
        if (this->is_compound()) return std::nullopt;
        return std::make_pair(detail::NextOf<P>::make(raw_.continuation), raw_.atom);
    }

    [[nodiscard]] const raw_type& raw() const noexcept { return raw_; }

private:
    raw_type raw_;
};

template <Compound C, typename P>
class Element {
public:
    using raw_type = detail::RawElement;
    using path_type = P;
    static constexpr Compound compound = C;

    explicit Element(raw_type raw) noexcept : raw_(std::move(raw)) {}

    [[nodiscard]] bool is_item() const noexcept { return !raw_.end; }
    [[nodiscard]] bool is_end() const noexcept { return raw_.end; }

    /// @brief Offset (arrays) or field name (objects) of an item.
    [[nodiscard]] Index<C> index() const {
        require_item();
        if constexpr (C == Compound::Array) {
            return raw_.index.index();
        } else {
            return raw_.index.name();
        }
    }

    [[nodiscard]] const PathComponent& component() const {
        require_item();
        return raw_.index;
    }

    [[nodiscard]] ParseResult<In<C, P>> value() const {
        require_item();
        return ParseResult<In<C, P>>(raw_.value);
    }

    /// @brief The parent's continuation after the end marker.
    [[nodiscard]] NextParser<P> next() const {
        if (SJSON_UNLIKELY(!raw_.end)) throw TypeError("element is an item, not the end marker");
        return detail::NextOf<P>::make(raw_.next);
    }

    [[nodiscard]] const raw_type& raw() const noexcept { return raw_; }

private:
    void require_item() const {
        if (SJSON_UNLIKELY(raw_.end)) throw TypeError("element is the end marker, not an item");
    }

    raw_type raw_;
};

// =====================================================================
// Depth-erased handles
// =====================================================================
// Each handle keeps the untyped value plus the chain of open compounds
// (outermost first). as<P>() recovers the typed view after checking the
// chain against P.

namespace detail {

/// Frame check for recovering a typed view; a mismatch is errc::frame_mismatch.
template <typename P>
void require_frames(const std::vector<Compound>& frames, const char* what) {
    if (SJSON_UNLIKELY(frames.size() != PathTraits<P>::depth ||
                       !PathTraits<P>::matches(frames, frames.size())))
        throw TypeError(std::string(what) + " is not at the requested nesting path",
                        errc::frame_mismatch);
}

inline std::vector<Compound> pushed(std::vector<Compound> frames, Compound c) {
    frames.push_back(c);
    return frames;
}

} // namespace detail

class SomeElement;

/// @brief Element parser of a compound whose nesting path is only known at runtime.
template <Compound C>
class SomeElementParser {
public:
    static constexpr Compound compound = C;

    SomeElementParser(detail::ProgramPtr program, std::vector<Compound> parent) noexcept
        : program_(std::move(program)), parent_(std::move(parent)) {}

    template <typename P>
    SomeElementParser(const Parser<Element<C, P>>& p)
        : program_(p.program()), parent_(detail::frames_of<P>()) {}

    /// @brief The next element, with its nesting path attached.
    [[nodiscard]] Parser<SomeElement> parser() const;

    [[nodiscard]] Outcome<SomeElement> feed(std::string_view chunk) const;

    template <typename P>
    [[nodiscard]] bool is() const noexcept {
        return parent_.size() == detail::PathTraits<P>::depth &&
               detail::PathTraits<P>::matches(parent_, parent_.size());
    }

    template <typename P>
    [[nodiscard]] Parser<Element<C, P>> as() const {
        detail::require_frames<P>(parent_, "element parser");
        return Parser<Element<C, P>>(program_);
    }

    /// Open compounds around the compound itself, outermost first.
    [[nodiscard]] const std::vector<Compound>& parent_frames() const noexcept { return parent_; }
    [[nodiscard]] const detail::ProgramPtr& program() const noexcept { return program_; }

private:
    detail::ProgramPtr program_;
    std::vector<Compound> parent_;
};

using SomeArrayParser  = SomeElementParser<Compound::Array>;
using SomeObjectParser = SomeElementParser<Compound::Object>;

/// @brief What follows a value at an erased position: nothing at the root,
/// otherwise the enclosing compound's element parser.
class SomeNextParser {
public:
    SomeNextParser() = default;
    SomeNextParser(detail::ProgramPtr program, std::vector<Compound> frames) noexcept
        : program_(std::move(program)), frames_(std::move(frames)) {}

    SomeNextParser(Unit) noexcept {}

    template <Compound C, typename P>
    SomeNextParser(const Parser<Element<C, P>>& p)
        : program_(p.program()), frames_(detail::frames_of<In<C, P>>()) {}

    [[nodiscard]] bool is_root() const noexcept { return frames_.empty(); }
    [[nodiscard]] size_t depth() const noexcept { return frames_.size(); }
    [[nodiscard]] const std::vector<Compound>& frames() const noexcept { return frames_; }

    template <typename P>
    [[nodiscard]] bool is() const noexcept {
        return frames_.size() == detail::PathTraits<P>::depth &&
               detail::PathTraits<P>::matches(frames_, frames_.size());
    }

    template <typename P>
    [[nodiscard]] NextParser<P> as() const {
        detail::require_frames<P>(frames_, "continuation");
        return detail::NextOf<P>::make(program_);
    }

    /// @brief The next element of the enclosing compound. Throws TypeError at the root.
    [[nodiscard]] Parser<SomeElement> parser() const;

    [[nodiscard]] const detail::ProgramPtr& program() const noexcept { return program_; }

private:
    detail::ProgramPtr program_;
    std::vector<Compound> frames_;
};

/// @brief A parse result whose nesting path is only known at runtime.
class SomeParseResult : public detail::ResultAccess<SomeParseResult> {
public:
    SomeParseResult(detail::RawResult raw, std::vector<Compound> frames) noexcept
        : raw_(std::move(raw)), frames_(std::move(frames)) {}

    template <typename P>
    SomeParseResult(const ParseResult<P>& r)
        : raw_(r.raw()), frames_(detail::frames_of<P>()) {}

    [[nodiscard]] size_t depth() const noexcept { return frames_.size(); }
    [[nodiscard]] const std::vector<Compound>& frames() const noexcept { return frames_; }

    template <typename P>
    [[nodiscard]] bool is() const noexcept {
        return frames_.size() == detail::PathTraits<P>::depth &&
               detail::PathTraits<P>::matches(frames_, frames_.size());
    }

    template <typename P>
    [[nodiscard]] ParseResult<P> as() const {
        detail::require_frames<P>(frames_, "parse result");
        return ParseResult<P>(raw_);
    }

    [[nodiscard]] SomeArrayParser array() const {
        detail::require_kind(raw_, ResultKind::ArrayStart);
        return SomeArrayParser(raw_.continuation, frames_);
    }

    [[nodiscard]] SomeObjectParser object() const {
        detail::require_kind(raw_, ResultKind::ObjectStart);
        return SomeObjectParser(raw_.continuation, frames_);
    }

    /// @brief Element parser of either compound kind. Throws TypeError for atoms.
    [[nodiscard]] Parser<SomeElement> elements() const {
        if (is_array()) return array().parser();
        return object().parser();
    }

    [[nodiscard]] SomeNextParser next() const {
        detail::require_atom(raw_);
        return SomeNextParser(raw_.continuation, frames_);
    }

    [[nodiscard]] const detail::RawResult& raw() const noexcept { return raw_; }

private:
    detail::RawResult raw_;
    std::vector<Compound> frames_;
};

/// @brief An element of a compound whose nesting path is only known at runtime.
class SomeElement {
public:
    SomeElement(detail::RawElement raw, Compound kind, std::vector<Compound> parent) noexcept
        : raw_(std::move(raw)), kind_(kind), parent_(std::move(parent)) {}

    template <Compound C, typename P>
    SomeElement(const Element<C, P>& e)
        : raw_(e.raw()), kind_(C), parent_(detail::frames_of<P>()) {}

    [[nodiscard]] Compound compound() const noexcept { return kind_; }
    [[nodiscard]] bool is_item() const noexcept { return !raw_.end; }
    [[nodiscard]] bool is_end() const noexcept { return raw_.end; }

    [[nodiscard]] const PathComponent& index() const {
        if (SJSON_UNLIKELY(raw_.end)) throw TypeError("element is the end marker, not an item");
        return raw_.index;
    }

    [[nodiscard]] SomeParseResult value() const {
        if (SJSON_UNLIKELY(raw_.end)) throw TypeError("element is the end marker, not an item");
        return SomeParseResult(raw_.value, detail::pushed(parent_, kind_));
    }

    [[nodiscard]] SomeNextParser next() const {
        if (SJSON_UNLIKELY(!raw_.end)) throw TypeError("element is an item, not the end marker");
        return SomeNextParser(raw_.next, parent_);
    }

    template <Compound C, typename P>
    [[nodiscard]] Element<C, P> as() const {
        if (SJSON_UNLIKELY(kind_ != C)) throw TypeError("element belongs to another compound kind");
        detail::require_frames<P>(parent_, "element");
        return Element<C, P>(raw_);
    }

    [[nodiscard]] const std::vector<Compound>& parent_frames() const noexcept { return parent_; }
    [[nodiscard]] const detail::RawElement& raw() const noexcept { return raw_; }

private:
    detail::RawElement raw_;
    Compound kind_;
    std::vector<Compound> parent_;
};

namespace detail {

inline Parser<SomeElement> some_elements(ProgramPtr program, Compound kind,
                                         std::vector<Compound> parent) {
    return Parser<RawElement>(std::move(program))
        .map([kind, parent = std::move(parent)](RawElement e) {
            return SomeElement(std::move(e), kind, parent);
        });
}

} // namespace detail

template <Compound C>
Parser<SomeElement> SomeElementParser<C>::parser() const {
    return detail::some_elements(program_, C, parent_);
}

template <Compound C>
Outcome<SomeElement> SomeElementParser<C>::feed(std::string_view chunk) const {
    return parser().feed(chunk);
}

inline Parser<SomeElement> SomeNextParser::parser() const {
    if (SJSON_UNLIKELY(frames_.empty()))
        throw TypeError("the top-level value has no following element");
    std::vector<Compound> parent(frames_.begin(), frames_.end() - 1);
    return detail::some_elements(program_, frames_.back(), std::move(parent));
}

// =====================================================================
// Entry point
// =====================================================================

/// @brief Parser of the top-level value. Every run starts an independent stream.
[[nodiscard]] inline Parser<ParseResult<Root>> root(const ParseOptions& opts = {}) {
    return Parser<ParseResult<Root>>(detail::make_bind(
        detail::make_pure(std::any(Unit{})),
        [opts](std::any) { return detail::Tokenizer::create(opts)->value_program(); }));
}

} // namespace sjson
