#pragma once

/// @file fwd.hpp
/// @author Aleksandr Loshkarev
/// @brief Forward declarations and core vocabulary types for sjson.

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sjson {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;
template <typename T> class Parser;
template <typename T> class Outcome;

/// Value types of the in-memory tree.
enum class Type : uint8_t {
    Null     = 0,
    Bool     = 1,
    Integer  = 2,
    Float    = 3,
    String   = 4,
    Array    = 5,
    Object   = 6,
    UInteger = 7
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:     return "null";
        case Type::Bool:     return "bool";
        case Type::Integer:  return "integer";
        case Type::Float:    return "float";
        case Type::String:   return "string";
        case Type::Array:    return "array";
        case Type::Object:   return "object";
        case Type::UInteger: return "uinteger";
    }
    return "unknown";
}

/// Discriminant of a streamed parse result.
enum class ResultKind : uint8_t {
    ArrayStart  = 0,
    ObjectStart = 1,
    Null        = 2,
    Bool        = 3,
    Number      = 4,
    String      = 5
};

inline const char* result_kind_name(ResultKind k) noexcept {
    switch (k) {
        case ResultKind::ArrayStart:  return "array start";
        case ResultKind::ObjectStart: return "object start";
        case ResultKind::Null:        return "null";
        case ResultKind::Bool:        return "bool";
        case ResultKind::Number:      return "number";
        case ResultKind::String:      return "string";
    }
    return "unknown";
}

/// @brief The empty result: what a parser positioned after the top-level
/// value has left to produce.
struct Unit {
    bool operator==(const Unit&) const noexcept { return true; }
    bool operator!=(const Unit&) const noexcept { return false; }
};

// ─── Tree containers ────────────────────────────────────────────────────

/// JSON array: ordered collection of values.
using Array = std::vector<Value>;

/// @brief JSON object: key-value pairs in insertion order with a lazy hash
/// index for large objects.
///
/// Keys are unique once the object is built through insert() or finalize();
/// append() allows duplicates until finalize() resolves them (last wins).
struct Object {
    using storage_type = std::vector<std::pair<std::string, Value>>;
    using size_type = size_t;
    /// Index keys are views into entries[].first; rebuilt after mutation.
    using index_type = std::unordered_map<std::string_view, size_type>;

    storage_type entries;

    /// Created only when the object grows to kIndexThreshold entries.
    mutable std::unique_ptr<index_type> index_;

    Object() = default;
    ~Object();
    Object(const Object&);
    Object(Object&&) noexcept;
    Object& operator=(const Object&);
    Object& operator=(Object&&) noexcept;

    /// Initializer-list constructor: {{"key", value}, ...}. Last duplicate wins.
    Object(std::initializer_list<std::pair<std::string, Value>> init);

    // ─── Capacity ────────────────────────────────────────────────────────
    bool empty() const noexcept { return entries.empty(); }
    size_type size() const noexcept { return entries.size(); }
    void reserve(size_type n) { entries.reserve(n); }

    // ─── Iterators ──────────────────────────────────────────────────────
    auto begin() noexcept { return entries.begin(); }
    auto end()   noexcept { return entries.end(); }
    auto begin()  const noexcept { return entries.begin(); }
    auto end()    const noexcept { return entries.end(); }

    // ─── Methods (defined after Value in value.hpp) ─────────────────────

    Value* find(std::string_view key) noexcept;
    const Value* find(std::string_view key) const noexcept;
    bool contains(std::string_view key) const noexcept;

    /// Const access by key. Throws OutOfRangeError if not found.
    const Value& at(std::string_view key) const;

    /// Insert or replace.
    void insert(std::string key, Value value);

    /// Append without a duplicate check. Call finalize() afterwards.
    void append(std::string key, Value value);

    /// Drop earlier duplicates so that the last occurrence of every key wins.
    void finalize();

    bool erase(std::string_view key);

    void clear() noexcept {
        entries.clear();
        index_.reset();
    }

    /// Key order does not matter for comparison.
    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

private:
    static constexpr size_type kIndexThreshold = 16;

    bool use_index() const noexcept { return entries.size() >= kIndexThreshold; }
    void rebuild_index() const;
};

} // namespace sjson
