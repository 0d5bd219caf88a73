#pragma once

/// @file navigation.hpp
/// @author Aleksandr Loshkarev
/// @brief Forward-only search for elements and paths in a stream.
///
/// find_element() scans an open compound for an index, skipping every
/// non-matching item; it stops on the match, leaving its value unconsumed,
/// or reports the parent's continuation when the compound ends first.
///
/// navigate_from_to() applies a runtime path one component at a time:
///
/// @code
///   auto nav = sjson::parse_all(sjson::navigate_to(sjson::parse_path("a[0]")), doc);
///   if (nav.value().found()) { ... nav.value().result() ... }
///   else if (nav.value().type_mismatch()) { ... nav.value().mismatch() ... }
/// @endcode
///
/// Absence and shape mismatch are returned as data; the *_or_fail variants
/// turn them into terminal parse failures.

#include "engine.hpp"
#include "error.hpp"
#include "parse_options.hpp"
#include "path.hpp"
#include "result.hpp"
#include "traversal.hpp"

#include <any>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sjson {

// =====================================================================
// Found<C, P>
// =====================================================================

/// @brief Result of find_element(): the positioned value, or the parent's
/// continuation when the index is absent.
template <Compound C, typename P>
class Found {
public:
    using result_type = ParseResult<In<C, P>>;

    static Found present(result_type r) { return Found(std::move(r)); }
    static Found absent(NextParser<P> next) { return Found(std::move(next)); }

    [[nodiscard]] bool found() const noexcept { return result_.has_value(); }
    explicit operator bool() const noexcept { return found(); }

    /// @brief The unconsumed value at the index. Throws TypeError if absent.
    [[nodiscard]] const result_type& result() const {
        if (SJSON_UNLIKELY(!result_)) throw TypeError("element not found");
        return *result_;
    }

    /// @brief What follows the compound. Throws TypeError if found.
    [[nodiscard]] const NextParser<P>& next() const {
        if (SJSON_UNLIKELY(!next_)) throw TypeError("element was found; the compound has not ended");
        return *next_;
    }

private:
    explicit Found(result_type r) : result_(std::move(r)) {}
    explicit Found(NextParser<P> next) : next_(std::move(next)) {}

    std::optional<result_type> result_;
    std::optional<NextParser<P>> next_;
};

// =====================================================================
// Navigation
// =====================================================================

/// @brief Result of navigate_from_to().
class Navigation {
public:
    enum class Status : uint8_t { Found, Absent, TypeMismatch };

    static Navigation success(SomeParseResult r) {
        Navigation n(Status::Found);
        n.result_ = std::move(r);
        return n;
    }
    static Navigation absent(Path prefix, SomeNextParser rest) {
        Navigation n(Status::Absent);
        n.prefix_ = std::move(prefix);
        n.rest_ = std::move(rest);
        return n;
    }
    static Navigation type_mismatch(Path prefix, SomeParseResult found) {
        Navigation n(Status::TypeMismatch);
        n.prefix_ = std::move(prefix);
        n.result_ = std::move(found);
        return n;
    }

    [[nodiscard]] Status status() const noexcept { return status_; }
    [[nodiscard]] bool found() const noexcept { return status_ == Status::Found; }
    [[nodiscard]] bool absent() const noexcept { return status_ == Status::Absent; }
    [[nodiscard]] bool type_mismatch() const noexcept { return status_ == Status::TypeMismatch; }
    explicit operator bool() const noexcept { return found(); }

    /// @brief The value at the end of the path. Throws TypeError unless found().
    [[nodiscard]] const SomeParseResult& result() const {
        if (SJSON_UNLIKELY(!found())) throw TypeError("navigation failed at " + to_string(prefix_));
        return *result_;
    }

    /// @brief Path components consumed up to and including the failing one.
    [[nodiscard]] const Path& failed_prefix() const noexcept { return prefix_; }

    /// @brief The value whose shape did not fit; empty when the component was absent.
    [[nodiscard]] std::optional<SomeParseResult> mismatch() const {
        if (status_ == Status::TypeMismatch) return result_;
        return std::nullopt;
    }

    /// @brief After absence: the continuation following the searched compound.
    [[nodiscard]] const std::optional<SomeNextParser>& rest() const noexcept { return rest_; }

private:
    explicit Navigation(Status s) noexcept : status_(s) {}

    Status status_;
    std::optional<SomeParseResult> result_;
    Path prefix_;
    std::optional<SomeNextParser> rest_;
};

namespace detail {

struct RawFound {
    bool found = false;
    RawResult result;
    ProgramPtr next;
};

inline ProgramPtr find_raw(PathComponent target, ProgramPtr elements);

inline ProgramPtr find_from(PathComponent target, RawElement e) {
    if (e.end) return make_pure(std::any(RawFound{false, RawResult{}, std::move(e.next)}));
    if (e.index == target) return make_pure(std::any(RawFound{true, std::move(e.value), nullptr}));
    return make_bind(skip_raw(std::move(e.value)),
                     [target = std::move(target)](std::any next) mutable {
        return find_raw(std::move(target), std::any_cast<ProgramPtr>(std::move(next)));
    });
}

/// Yields a RawFound.
inline ProgramPtr find_raw(PathComponent target, ProgramPtr elements) {
    return make_bind(std::move(elements), [target = std::move(target)](std::any a) mutable {
        return find_from(std::move(target), std::any_cast<RawElement>(std::move(a)));
    });
}

template <Compound C, typename P>
Parser<Found<C, P>> found_of(ProgramPtr program) {
    return Parser<RawFound>(std::move(program)).map([](RawFound f) {
        if (f.found) return Found<C, P>::present(ParseResult<In<C, P>>(std::move(f.result)));
        return Found<C, P>::absent(NextOf<P>::make(std::move(f.next)));
    });
}

inline Path prefix_of(const Path& path, size_t n) {
    return Path(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(n));
}

/// Yields a Navigation.
inline ProgramPtr navigate_raw(std::shared_ptr<const Path> path, size_t i, RawResult cur,
                               std::vector<Compound> frames) {
    if (i == path->size())
        return make_pure(std::any(Navigation::success(SomeParseResult(std::move(cur), std::move(frames)))));

    const Compound found = cur.kind == ResultKind::ObjectStart ? Compound::Object : Compound::Array;
    PathComponent component = (*path)[i].resolved_for(found);
    const Compound want = component.applies_to();
    if (cur.kind != start_kind(want)) {
        return make_pure(std::any(Navigation::type_mismatch(
            prefix_of(*path, i + 1), SomeParseResult(std::move(cur), std::move(frames)))));
    }

    ProgramPtr elements = std::move(cur.continuation);
    return make_bind(find_raw(std::move(component), std::move(elements)),
                     [path, i, frames = std::move(frames), want](std::any a) mutable {
        auto f = std::any_cast<RawFound>(std::move(a));
        if (!f.found) {
            return make_pure(std::any(Navigation::absent(
                prefix_of(*path, i + 1), SomeNextParser(std::move(f.next), std::move(frames)))));
        }
        return navigate_raw(path, i + 1, std::move(f.result), pushed(std::move(frames), want));
    });
}

inline std::string describe_mismatch(const Navigation& n) {
    const Path& prefix = n.failed_prefix();
    std::string msg = "path " + to_string(prefix) + ": expected " +
                      compound_name(prefix.back().applies_to());
    if (auto r = n.mismatch()) msg += std::string(" but found ") + result_kind_name(r->kind());
    return msg;
}

inline Parser<SomeParseResult> or_fail(Parser<Navigation> nav) {
    return nav.bind([](Navigation n) {
        if (n.found()) return pure(n.result());
        if (n.absent())
            return fail<SomeParseResult>("path " + to_string(n.failed_prefix()) + " is not present",
                                         errc::navigation_absent);
        return fail<SomeParseResult>(describe_mismatch(n), errc::navigation_type_mismatch);
    });
}

} // namespace detail

// =====================================================================
// find_element
// =====================================================================

/// @brief Scan forward for the item at `target`, skipping every other item.
template <Compound C, typename P>
[[nodiscard]] Parser<Found<C, P>> find_element(const Index<C>& target,
                                               const Parser<Element<C, P>>& elements) {
    return detail::found_of<C, P>(
        detail::find_raw(detail::component_of(target), elements.program()));
}

/// @brief Same, starting from an element that has already been read.
template <Compound C, typename P>
[[nodiscard]] Parser<Found<C, P>> find_element(const Index<C>& target,
                                               const Element<C, P>& element) {
    return detail::found_of<C, P>(
        detail::find_from(detail::component_of(target), element.raw()));
}

/// @brief Scan for `target`; its absence fails the parse with errc::navigation_absent.
namespace detail {

template <Compound C, typename P>
Parser<ParseResult<In<C, P>>> present_or_fail(const Index<C>& target, Parser<Found<C, P>> found) {
    auto component = component_of(target);
    return found.bind([component](Found<C, P> f) {
        if (f) return pure(f.result());
        return fail<ParseResult<In<C, P>>>(
            "no element " + component.to_string() + " in " + compound_name(C),
            errc::navigation_absent);
    });
}

} // namespace detail

template <Compound C, typename P>
[[nodiscard]] Parser<ParseResult<In<C, P>>> find_element_or_fail(const Index<C>& target,
                                                                 const Parser<Element<C, P>>& elements) {
    return detail::present_or_fail<C, P>(target, find_element<C, P>(target, elements));
}

/// @brief Same, starting from an element that has already been read.
template <Compound C, typename P>
[[nodiscard]] Parser<ParseResult<In<C, P>>> find_element_or_fail(const Index<C>& target,
                                                                 const Element<C, P>& element) {
    return detail::present_or_fail<C, P>(target, find_element<C, P>(target, element));
}

// =====================================================================
// navigate
// =====================================================================

/// @brief Follow `path` from `start`, consuming only what lies before the target.
[[nodiscard]] inline Parser<Navigation> navigate_from_to(Path path, const SomeParseResult& start) {
    auto shared = std::make_shared<const Path>(std::move(path));
    return Parser<Navigation>(detail::navigate_raw(shared, 0, start.raw(), start.frames()));
}

/// @brief Follow `path`; absence or a shape mismatch fails the parse.
[[nodiscard]] inline Parser<SomeParseResult> navigate_from_to_or_fail(Path path,
                                                                      const SomeParseResult& start) {
    return detail::or_fail(navigate_from_to(std::move(path), start));
}

/// @brief Follow `path` from the top-level value of a new stream.
[[nodiscard]] inline Parser<Navigation> navigate_to(Path path, const ParseOptions& opts = {}) {
    return root(opts).bind([path = std::move(path)](ParseResult<Root> r) {
        return navigate_from_to(path, SomeParseResult(r));
    });
}

[[nodiscard]] inline Parser<SomeParseResult> navigate_to_or_fail(Path path,
                                                                 const ParseOptions& opts = {}) {
    return detail::or_fail(navigate_to(std::move(path), opts));
}

} // namespace sjson
