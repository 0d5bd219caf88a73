#pragma once

/// @file path.hpp
/// @author Aleksandr Loshkarev
/// @brief Nesting-context type state and runtime path components.
///
/// Every typed parse position carries its chain of open compounds as a type:
///
///   Root                                    : top level
///   In<Compound::Array, Root>               : inside the top-level array
///   In<Compound::Object, In<Compound::Array, Root>>
///                                           : inside an object inside an array
///
/// The chain is innermost first. Entering a compound pushes a frame; its End
/// element yields NextParser of the parent, so nesting cannot be broken by
/// construction.
///
/// PathComponent is the runtime counterpart used for navigation:
/// PathComponent::field("name") or PathComponent::offset(3).

#include "engine.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace sjson {

/// Kind of an open compound.
enum class Compound : uint8_t { Array = 0, Object = 1 };

inline const char* compound_name(Compound c) noexcept {
    return c == Compound::Array ? "array" : "object";
}

// ─── Compile-time path ──────────────────────────────────────────────────

/// The empty chain: not inside any compound.
struct Root {};

/// Inside a compound of kind C whose own position is P.
template <Compound C, typename P>
struct In {
    static constexpr Compound kind = C;
    using parent = P;
};

template <typename P> using InArray  = In<Compound::Array, P>;
template <typename P> using InObject = In<Compound::Object, P>;

/// Element index: an offset inside arrays, a field name inside objects.
template <Compound C>
using Index = std::conditional_t<C == Compound::Array, std::size_t, std::string>;

template <Compound C, typename P> class Element;

namespace detail {

template <typename P> struct PathTraits;

template <>
struct PathTraits<Root> {
    static constexpr size_t depth = 0;

    static bool matches(const std::vector<Compound>&, size_t n) noexcept {
        return n == 0;
    }
    static void append_to(std::vector<Compound>&) {}
};

template <Compound C, typename P>
struct PathTraits<In<C, P>> {
    static constexpr size_t depth = PathTraits<P>::depth + 1;

    /// frames is outermost first; n is how many of them belong to the path.
    static bool matches(const std::vector<Compound>& frames, size_t n) noexcept {
        return n > 0 && n <= frames.size() && frames[n - 1] == C &&
               PathTraits<P>::matches(frames, n - 1);
    }
    static void append_to(std::vector<Compound>& out) {
        PathTraits<P>::append_to(out);
        out.push_back(C);
    }
};

/// @brief The open-frame chain of P, outermost first.
template <typename P>
std::vector<Compound> frames_of() {
    std::vector<Compound> out;
    out.reserve(PathTraits<P>::depth);
    PathTraits<P>::append_to(out);
    return out;
}

/// @brief What comes after a complete value at position P.
template <typename P> struct NextOf;

template <>
struct NextOf<Root> {
    using type = Unit;
    static type make(const ProgramPtr&) noexcept { return Unit{}; }
    static ProgramPtr program(const type&) noexcept { return nullptr; }
};

template <Compound C, typename P>
struct NextOf<In<C, P>> {
    using type = Parser<Element<C, P>>;
    static type make(ProgramPtr p) noexcept { return type(std::move(p)); }
    static ProgramPtr program(const type& t) { return t.program(); }
};

} // namespace detail

/// NextParser<Root> is Unit; NextParser<In<C, P>> is Parser<Element<C, P>>.
template <typename P>
using NextParser = typename detail::NextOf<P>::type;

template <typename P>
inline constexpr size_t path_depth = detail::PathTraits<P>::depth;

// ─── Runtime path component ─────────────────────────────────────────────

/// @brief One navigation step: a field name or an array offset.
class PathComponent {
public:
    enum class Kind : uint8_t { Field, Offset };

    PathComponent() = default;
    PathComponent(const char* name) : kind_(Kind::Field), name_(name ? name : "") {}
    PathComponent(std::string name) : kind_(Kind::Field), name_(std::move(name)) {}
    PathComponent(std::string_view name) : kind_(Kind::Field), name_(name) {}

    template <typename I,
              std::enable_if_t<std::is_integral_v<I> && !std::is_same_v<I, bool>, int> = 0>
    PathComponent(I offset) : kind_(Kind::Offset) {
        if constexpr (std::is_signed_v<I>) {
            if (SJSON_UNLIKELY(offset < 0))
                throw OutOfRangeError("negative array offset in path", errc::invalid_path);
        }
        offset_ = static_cast<size_t>(offset);
    }

    static PathComponent field(std::string name) { return PathComponent(std::move(name)); }
    static PathComponent offset(size_t i) { return PathComponent(i); }

    /// @brief A JSON Pointer token made of digits: an offset in arrays, the
    /// member named by the same digits in objects.
    static PathComponent pointer_index(size_t i) {
        PathComponent c(i);
        c.pointer_token_ = true;
        return c;
    }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_field() const noexcept { return kind_ == Kind::Field; }
    [[nodiscard]] bool is_offset() const noexcept { return kind_ == Kind::Offset; }

    /// The compound kind this component can be applied to.
    [[nodiscard]] Compound applies_to() const noexcept {
        return is_field() ? Compound::Object : Compound::Array;
    }

    [[nodiscard]] bool is_pointer_index() const noexcept { return pointer_token_; }

    /// @brief This component as it applies to a compound of kind `c`.
    [[nodiscard]] PathComponent resolved_for(Compound c) const {
        if (pointer_token_ && c == Compound::Object) return field(std::to_string(offset_));
        return *this;
    }

    [[nodiscard]] const std::string& name() const {
        if (SJSON_UNLIKELY(!is_field())) throw TypeError("path component is an offset, not a field");
        return name_;
    }
    [[nodiscard]] size_t index() const {
        if (SJSON_UNLIKELY(!is_offset())) throw TypeError("path component is a field, not an offset");
        return offset_;
    }

    bool operator==(const PathComponent& o) const noexcept {
        if (kind_ != o.kind_) return false;
        return is_field() ? name_ == o.name_ : offset_ == o.offset_;
    }
    bool operator!=(const PathComponent& o) const noexcept { return !(*this == o); }

    /// Renders as `.name`, `["quoted name"]` or `[3]`.
    [[nodiscard]] std::string to_string() const;

private:
    Kind kind_ = Kind::Offset;
    std::string name_;
    size_t offset_ = 0;
    bool pointer_token_ = false;
};

using Path = std::vector<PathComponent>;

namespace detail {

inline bool is_ident_start(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
}

inline bool is_ident_char(char c) noexcept {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

inline bool is_identifier(std::string_view s) noexcept {
    if (s.empty() || !is_ident_start(s.front())) return false;
    for (char c : s)
        if (!is_ident_char(c)) return false;
    return true;
}

inline void append_quoted(std::string& out, std::string_view s) {
    static constexpr char kHex[] = "0123456789abcdef";
    out += '"';
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out += kHex[c >> 4];
                    out += kHex[c & 0xF];
                } else {
                    out += ch;
                }
        }
    }
    out += '"';
}

inline PathComponent component_of(size_t i) { return PathComponent::offset(i); }
inline PathComponent component_of(const std::string& name) { return PathComponent::field(name); }

} // namespace detail

inline std::string PathComponent::to_string() const {
    std::string out;
    if (is_offset()) {
        out += '[';
        out += std::to_string(offset_);
        out += ']';
    } else if (detail::is_identifier(name_)) {
        out += '.';
        out += name_;
    } else {
        out += '[';
        detail::append_quoted(out, name_);
        out += ']';
    }
    return out;
}

/// @brief Render a path; the empty path renders as "<root>".
inline std::string to_string(const Path& path) {
    if (path.empty()) return "<root>";
    std::string out;
    for (const auto& c : path) out += c.to_string();
    return out;
}

} // namespace sjson
