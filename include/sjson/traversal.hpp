#pragma once

/// @file traversal.hpp
/// @author Aleksandr Loshkarev
/// @brief Skipping, materializing and decoding streamed values.
///
///   skip_value(r)              -> Parser<NextParser<P>>
///   skip_rest_of_compound(ep)  -> Parser<NextParser<P>>
///   parse_value(r)             -> Parser<pair<NextParser<P>, Value>>
///   decode_value<T>(r)         -> Parser<pair<NextParser<P>, decode_result<T>>>
///   decode_value_or_fail<T>(r) -> Parser<pair<NextParser<P>, T>>
///   parse_rest_of_array(ep)    -> Parser<pair<NextParser<P>, Array>>
///   parse_rest_of_object(ep)   -> Parser<pair<NextParser<P>, Object>>
///
/// Each has an overload for the depth-erased handles, whose continuation is
/// a SomeNextParser. Nested compounds are walked through the engine's
/// continuation stack, never through C++ recursion.

#include "conversion.hpp"
#include "engine.hpp"
#include "error.hpp"
#include "path.hpp"
#include "result.hpp"
#include "value.hpp"

#include <any>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sjson {

namespace detail {

/// A fully read value and the continuation that follows it.
struct Materialized {
    ProgramPtr next;
    Value value;
};

inline bool is_compound(const RawResult& r) noexcept {
    return r.kind == ResultKind::ArrayStart || r.kind == ResultKind::ObjectStart;
}

/// Drive an element stream to its end; yields the parent's next program.
inline ProgramPtr skip_elements(ProgramPtr elements) {
    return make_bind(std::move(elements), [](std::any a) -> ProgramPtr {
        auto e = std::any_cast<RawElement>(std::move(a));
        if (e.end) return make_pure(std::any(std::move(e.next)));
        if (is_compound(e.value)) {
            return make_bind(skip_elements(std::move(e.value.continuation)), [](std::any next) {
                return skip_elements(std::any_cast<ProgramPtr>(std::move(next)));
            });
        }
        return skip_elements(std::move(e.value.continuation));
    });
}

/// Yields the program that follows the value (null at the root).
inline ProgramPtr skip_raw(RawResult r) {
    if (!is_compound(r)) return make_pure(std::any(std::move(r.continuation)));
    return skip_elements(std::move(r.continuation));
}

inline ProgramPtr materialize(RawResult r);

inline ProgramPtr collect_array(ProgramPtr elements, std::shared_ptr<Array> acc) {
    return make_bind(std::move(elements), [acc](std::any a) -> ProgramPtr {
        auto e = std::any_cast<RawElement>(std::move(a));
        if (e.end)
            return make_pure(std::any(Materialized{std::move(e.next), Value(std::move(*acc))}));
        if (is_compound(e.value)) {
            return make_bind(materialize(std::move(e.value)), [acc](std::any m) {
                auto item = std::any_cast<Materialized>(std::move(m));
                acc->push_back(std::move(item.value));
                return collect_array(std::move(item.next), acc);
            });
        }
        acc->push_back(std::move(e.value.atom));
        return collect_array(std::move(e.value.continuation), acc);
    });
}

/// Members are appended as they arrive; duplicates resolve at the end, last one wins.
inline ProgramPtr collect_object(ProgramPtr elements, std::shared_ptr<Object> acc) {
    return make_bind(std::move(elements), [acc](std::any a) -> ProgramPtr {
        auto e = std::any_cast<RawElement>(std::move(a));
        if (e.end) {
            acc->finalize();
            return make_pure(std::any(Materialized{std::move(e.next), Value(std::move(*acc))}));
        }
        std::string key = e.index.name();
        if (is_compound(e.value)) {
            return make_bind(materialize(std::move(e.value)),
                             [acc, key = std::move(key)](std::any m) mutable {
                auto item = std::any_cast<Materialized>(std::move(m));
                acc->append(std::move(key), std::move(item.value));
                return collect_object(std::move(item.next), acc);
            });
        }
        acc->append(std::move(key), std::move(e.value.atom));
        return collect_object(std::move(e.value.continuation), acc);
    });
}

/// Yields a Materialized.
inline ProgramPtr materialize(RawResult r) {
    switch (r.kind) {
        case ResultKind::ArrayStart:
            return collect_array(std::move(r.continuation), std::make_shared<Array>());
        case ResultKind::ObjectStart:
            return collect_object(std::move(r.continuation), std::make_shared<Object>());
        default:
            return make_pure(std::any(Materialized{std::move(r.continuation), std::move(r.atom)}));
    }
}

template <typename T>
Parser<std::pair<ProgramPtr, decode_result<T>>> decode_raw(RawResult r) {
    return Parser<Materialized>(materialize(std::move(r))).map([](Materialized m) {
        return std::make_pair(std::move(m.next), try_from_value<T>(m.value));
    });
}

template <typename T>
Parser<std::pair<ProgramPtr, T>> decode_or_fail_raw(RawResult r) {
    return decode_raw<T>(std::move(r)).bind([](std::pair<ProgramPtr, decode_result<T>> d) {
        if (SJSON_UNLIKELY(!d.second))
            return fail<std::pair<ProgramPtr, T>>(d.second.message, errc::decode_failed);
        return pure(std::make_pair(std::move(d.first), std::move(d.second.value)));
    });
}

template <typename P>
struct Wrap {
    static NextParser<P> next(ProgramPtr p) { return NextOf<P>::make(std::move(p)); }
};

} // namespace detail

// =====================================================================
// Typed
// =====================================================================

/// @brief Discard the value; a compound is read through to its end.
template <typename P>
[[nodiscard]] Parser<NextParser<P>> skip_value(const ParseResult<P>& r) {
    return Parser<detail::ProgramPtr>(detail::skip_raw(r.raw())).map(&detail::Wrap<P>::next);
}

/// @brief Drive an open element stream to its end, skipping every remaining item.
template <Compound C, typename P>
[[nodiscard]] Parser<NextParser<P>> skip_rest_of_compound(const Parser<Element<C, P>>& elements) {
    return Parser<detail::ProgramPtr>(detail::skip_elements(elements.program()))
        .map(&detail::Wrap<P>::next);
}

/// @brief Read the whole value into a tree. Atoms pass through without consuming input.
template <typename P>
[[nodiscard]] Parser<std::pair<NextParser<P>, Value>> parse_value(const ParseResult<P>& r) {
    return Parser<detail::Materialized>(detail::materialize(r.raw()))
        .map([](detail::Materialized m) {
            return std::make_pair(detail::NextOf<P>::make(std::move(m.next)), std::move(m.value));
        });
}

/// @brief Read the value and decode it; a mismatch is reported as data and the
/// returned continuation stays usable.
template <typename T, typename P>
[[nodiscard]] Parser<std::pair<NextParser<P>, decode_result<T>>>
decode_value(const ParseResult<P>& r) {
    return detail::decode_raw<T>(r.raw())
        .map([](std::pair<detail::ProgramPtr, decode_result<T>> d) {
            return std::make_pair(detail::NextOf<P>::make(std::move(d.first)), std::move(d.second));
        });
}

/// @brief Read the value and decode it; a mismatch fails the parse with errc::decode_failed.
template <typename T, typename P>
[[nodiscard]] Parser<std::pair<NextParser<P>, T>> decode_value_or_fail(const ParseResult<P>& r) {
    return detail::decode_or_fail_raw<T>(r.raw())
        .map([](std::pair<detail::ProgramPtr, T> d) {
            return std::make_pair(detail::NextOf<P>::make(std::move(d.first)), std::move(d.second));
        });
}

/// @brief Materialize the remaining items of an array, in order.
template <typename P>
[[nodiscard]] Parser<std::pair<NextParser<P>, Array>>
parse_rest_of_array(const Parser<Element<Compound::Array, P>>& elements) {
    return Parser<detail::Materialized>(
               detail::collect_array(elements.program(), std::make_shared<Array>()))
        .map([](detail::Materialized m) {
            return std::make_pair(detail::NextOf<P>::make(std::move(m.next)),
                                  std::move(m.value.as_array()));
        });
}

/// @brief Materialize the remaining members of an object; the last duplicate key wins.
template <typename P>
[[nodiscard]] Parser<std::pair<NextParser<P>, Object>>
parse_rest_of_object(const Parser<Element<Compound::Object, P>>& elements) {
    return Parser<detail::Materialized>(
               detail::collect_object(elements.program(), std::make_shared<Object>()))
        .map([](detail::Materialized m) {
            return std::make_pair(detail::NextOf<P>::make(std::move(m.next)),
                                  std::move(m.value.as_object()));
        });
}

// =====================================================================
// Depth-erased
// =====================================================================

[[nodiscard]] inline Parser<SomeNextParser> skip_value(const SomeParseResult& r) {
    return Parser<detail::ProgramPtr>(detail::skip_raw(r.raw()))
        .map([frames = r.frames()](detail::ProgramPtr p) {
            return SomeNextParser(std::move(p), frames);
        });
}

template <Compound C>
[[nodiscard]] Parser<SomeNextParser> skip_rest_of_compound(const SomeElementParser<C>& elements) {
    return Parser<detail::ProgramPtr>(detail::skip_elements(elements.program()))
        .map([frames = elements.parent_frames()](detail::ProgramPtr p) {
            return SomeNextParser(std::move(p), frames);
        });
}

[[nodiscard]] inline Parser<std::pair<SomeNextParser, Value>> parse_value(const SomeParseResult& r) {
    return Parser<detail::Materialized>(detail::materialize(r.raw()))
        .map([frames = r.frames()](detail::Materialized m) {
            return std::make_pair(SomeNextParser(std::move(m.next), frames), std::move(m.value));
        });
}

template <typename T>
[[nodiscard]] Parser<std::pair<SomeNextParser, decode_result<T>>>
decode_value(const SomeParseResult& r) {
    return detail::decode_raw<T>(r.raw())
        .map([frames = r.frames()](std::pair<detail::ProgramPtr, decode_result<T>> d) {
            return std::make_pair(SomeNextParser(std::move(d.first), frames), std::move(d.second));
        });
}

template <typename T>
[[nodiscard]] Parser<std::pair<SomeNextParser, T>> decode_value_or_fail(const SomeParseResult& r) {
    return detail::decode_or_fail_raw<T>(r.raw())
        .map([frames = r.frames()](std::pair<detail::ProgramPtr, T> d) {
            return std::make_pair(SomeNextParser(std::move(d.first), frames), std::move(d.second));
        });
}

[[nodiscard]] inline Parser<std::pair<SomeNextParser, Array>>
parse_rest_of_array(const SomeArrayParser& elements) {
    return Parser<detail::Materialized>(
               detail::collect_array(elements.program(), std::make_shared<Array>()))
        .map([frames = elements.parent_frames()](detail::Materialized m) {
            return std::make_pair(SomeNextParser(std::move(m.next), frames),
                                  std::move(m.value.as_array()));
        });
}

[[nodiscard]] inline Parser<std::pair<SomeNextParser, Object>>
parse_rest_of_object(const SomeObjectParser& elements) {
    return Parser<detail::Materialized>(
               detail::collect_object(elements.program(), std::make_shared<Object>()))
        .map([frames = elements.parent_frames()](detail::Materialized m) {
            return std::make_pair(SomeNextParser(std::move(m.next), frames),
                                  std::move(m.value.as_object()));
        });
}

} // namespace sjson
