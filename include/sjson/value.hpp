#pragma once

/// @file value.hpp
/// @author Aleksandr Loshkarev
/// @brief The in-memory tree: Value, a tagged union over all JSON types.
///
/// Materializing operations (parse_value, parse_rest_of_array, ...) build
/// Values; typed decoding (conversion.hpp) reads them.
///
/// Implementation:
///   - 16-byte tagged union, heap payload for strings, arrays and objects
///   - Manual resource management (copy/move/destroy)
///   - Integers keep their signedness: int64_t, uint64_t above INT64_MAX
///   - Objects keep insertion order; O(1) key lookup via a lazy hash index

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace sjson {

class Value {
public:
    Value() noexcept : kind_(Type::Null) { u_.i = 0; }
    Value(std::nullptr_t) noexcept : kind_(Type::Null) { u_.i = 0; }
    Value(bool v) noexcept : kind_(Type::Bool) { u_.i = 0; u_.b = v; }
    Value(int v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    Value(long v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    Value(long long v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    Value(unsigned v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    Value(unsigned long v) noexcept : kind_(Type::Integer) { init_unsigned(v); }
    Value(unsigned long long v) noexcept : kind_(Type::Integer) { init_unsigned(v); }
    Value(double v) noexcept : kind_(Type::Float) { u_.d = v; }
    Value(const char* v) : kind_(Type::String) { u_.str = new std::string(v ? v : ""); }
    Value(std::string_view v) : kind_(Type::String) { u_.str = new std::string(v); }
    Value(const std::string& v) : kind_(Type::String) { u_.str = new std::string(v); }
    Value(std::string&& v) : kind_(Type::String) { u_.str = new std::string(std::move(v)); }
    Value(const Array& v) : kind_(Type::Array) { u_.arr = new Array(v); }
    Value(Array&& v) : kind_(Type::Array) { u_.arr = new Array(std::move(v)); }
    Value(const Object& v) : kind_(Type::Object) { u_.obj = new Object(v); }
    Value(Object&& v) : kind_(Type::Object) { u_.obj = new Object(std::move(v)); }

    Value(const Value& o) : kind_(o.kind_) { copy_payload(o); }
    Value(Value&& o) noexcept : kind_(o.kind_), u_(o.u_) {
        o.kind_ = Type::Null;  // Only this is needed for destroy() to be a no-op
    }
    Value& operator=(const Value& o) {
        if (this != &o) { Value tmp(o); swap(tmp); }
        return *this;
    }
    Value& operator=(Value&& o) noexcept {
        if (this != &o) {
            destroy();
            kind_ = o.kind_;
            u_ = o.u_;
            o.kind_ = Type::Null;
        }
        return *this;
    }
    ~Value() { destroy(); }

    void swap(Value& o) noexcept {
        std::swap(kind_, o.kind_);
        std::swap(u_, o.u_);
    }

    [[nodiscard]] static Value array() { return Value(Array{}); }
    [[nodiscard]] static Value object() { return Value(Object{}); }

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()     const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()     const noexcept { return kind_ == Type::Bool; }
    [[nodiscard]] bool is_integer()  const noexcept { return kind_ == Type::Integer; }
    [[nodiscard]] bool is_uinteger() const noexcept { return kind_ == Type::UInteger; }
    [[nodiscard]] bool is_float()    const noexcept { return kind_ == Type::Float; }
    [[nodiscard]] bool is_number()   const noexcept { return is_integer() || is_uinteger() || is_float(); }
    [[nodiscard]] bool is_string()   const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()    const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object()   const noexcept { return kind_ == Type::Object; }

    bool as_bool() const {
        if (SJSON_UNLIKELY(!is_bool())) type_error("bool");
        return u_.b;
    }
    int64_t as_integer() const {
        if (is_integer()) return u_.i;
        if (is_uinteger() && u_.u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            return static_cast<int64_t>(u_.u);
        type_error("integer");
    }
    uint64_t as_uinteger() const {
        if (is_uinteger()) return u_.u;
        if (is_integer() && u_.i >= 0) return static_cast<uint64_t>(u_.i);
        type_error("uinteger");
    }
    double as_float() const {
        if (is_float()) return u_.d;
        if (is_integer()) return static_cast<double>(u_.i);
        if (is_uinteger()) return static_cast<double>(u_.u);
        type_error("number");
    }

    [[nodiscard]] const std::string& as_string() const {
        if (SJSON_UNLIKELY(!is_string())) type_error("string");
        return *u_.str;
    }
    [[nodiscard]] std::string_view as_string_view() const { return as_string(); }

    [[nodiscard]] const Array& as_array() const {
        if (SJSON_UNLIKELY(!is_array())) type_error("array");
        return *u_.arr;
    }
    Array& as_array() {
        if (SJSON_UNLIKELY(!is_array())) type_error("array");
        return *u_.arr;
    }
    [[nodiscard]] const Object& as_object() const {
        if (SJSON_UNLIKELY(!is_object())) type_error("object");
        return *u_.obj;
    }
    Object& as_object() {
        if (SJSON_UNLIKELY(!is_object())) type_error("object");
        return *u_.obj;
    }

    const Value& operator[](size_t index) const {
        const auto& a = as_array();
        if (SJSON_UNLIKELY(index >= a.size()))
            throw OutOfRangeError("array index " + std::to_string(index) +
                                  " out of range (size=" + std::to_string(a.size()) + ")");
        return a[index];
    }
    const Value& operator[](int index) const { return operator[](static_cast<size_t>(index)); }
    const Value& operator[](std::string_view key) const { return as_object().at(key); }
    const Value& operator[](const char* key) const { return operator[](std::string_view(key)); }

    [[nodiscard]] const Value* find(std::string_view key) const {
        return is_object() ? u_.obj->find(key) : nullptr;
    }
    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && u_.obj->contains(key);
    }

    [[nodiscard]] size_t size() const noexcept {
        if (is_array())  return u_.arr->size();
        if (is_object()) return u_.obj->size();
        return 0;
    }

    void push_back(Value v) { as_array().push_back(std::move(v)); }
    void insert(std::string key, Value v) { as_object().insert(std::move(key), std::move(v)); }

    [[nodiscard]] bool operator==(const Value& other) const {
        if (kind_ != other.kind_) {
            if (is_number() && other.is_number()) {
                // Exact int/uint comparison without double-precision loss
                if ((is_integer() && other.is_uinteger()) || (is_uinteger() && other.is_integer())) {
                    int64_t  sv = is_integer()  ? u_.i : other.u_.i;
                    uint64_t uv = is_uinteger() ? u_.u : other.u_.u;
                    return sv >= 0 && static_cast<uint64_t>(sv) == uv;
                }
                return as_float() == other.as_float();
            }
            return false;
        }
        switch (kind_) {
            case Type::Null:     return true;
            case Type::Bool:     return u_.b == other.u_.b;
            case Type::Integer:  return u_.i == other.u_.i;
            case Type::UInteger: return u_.u == other.u_.u;
            case Type::Float:    return u_.d == other.u_.d;
            case Type::String:   return *u_.str == *other.u_.str;
            case Type::Array:    return *u_.arr == *other.u_.arr;
            case Type::Object:   return *u_.obj == *other.u_.obj;
        }
        return false;
    }
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Type kind_;
    union Payload {
        bool b; int64_t i; uint64_t u; double d;
        std::string* str;
        Array* arr;
        Object* obj;
    } u_;

    template <typename U>
    void init_unsigned(U v) noexcept {
        if (static_cast<uint64_t>(v) <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            u_.i = static_cast<int64_t>(v);
        } else {
            kind_ = Type::UInteger;
            u_.u = static_cast<uint64_t>(v);
        }
    }

    [[noreturn]] SJSON_NOINLINE void type_error(const char* expected) const {
        throw TypeError(std::string("expected ") + expected + ", got " + type_name(kind_));
    }

    void copy_payload(const Value& o) {
        switch (o.kind_) {
            case Type::String: u_.str = new std::string(*o.u_.str); break;
            case Type::Array:  u_.arr = new Array(*o.u_.arr); break;
            case Type::Object: u_.obj = new Object(*o.u_.obj); break;
            default:           u_ = o.u_; break;
        }
    }

    void destroy() noexcept {
        switch (kind_) {
            case Type::String: delete u_.str; break;
            case Type::Array:  delete u_.arr; break;
            case Type::Object: delete u_.obj; break;
            default: break;
        }
    }
};

// ─── Object special member functions ─────────────────────────────────────

inline Object::~Object() = default;
inline Object::Object(const Object& o) : entries(o.entries) {}
inline Object::Object(Object&& o) noexcept
    : entries(std::move(o.entries)), index_(std::move(o.index_)) {}
inline Object& Object::operator=(const Object& o) {
    if (this != &o) { entries = o.entries; index_.reset(); }
    return *this;
}
inline Object& Object::operator=(Object&& o) noexcept {
    if (this != &o) { entries = std::move(o.entries); index_ = std::move(o.index_); }
    return *this;
}
inline Object::Object(std::initializer_list<std::pair<std::string, Value>> init)
    : entries(init.begin(), init.end()) {
    finalize();
}

inline void Object::rebuild_index() const {
    if (!index_) {
        index_ = std::make_unique<index_type>(entries.size() * 2);
    } else {
        index_->clear();
    }
    for (size_type i = 0; i < entries.size(); ++i)
        (*index_)[std::string_view(entries[i].first)] = i;
}
inline Value* Object::find(std::string_view key) noexcept {
    return const_cast<Value*>(static_cast<const Object*>(this)->find(key));
}
inline const Value* Object::find(std::string_view key) const noexcept {
    if (use_index()) {
        if (!index_) rebuild_index();
        auto it = index_->find(key);
        if (it != index_->end()) return &entries[it->second].second;
        return nullptr;
    }
    for (const auto& [k, v] : entries) if (k == key) return &v;
    return nullptr;
}
inline bool Object::contains(std::string_view key) const noexcept { return find(key) != nullptr; }
inline const Value& Object::at(std::string_view key) const {
    auto* p = find(key);
    if (SJSON_UNLIKELY(!p))
        throw OutOfRangeError("key not found: \"" + std::string(key) + "\"", errc::key_not_found);
    return *p;
}
inline void Object::insert(std::string key, Value value) {
    if (auto* p = find(key)) {
        *p = std::move(value);
        return;
    }
    entries.emplace_back(std::move(key), std::move(value));
    index_.reset();
}
inline void Object::append(std::string key, Value value) {
    entries.emplace_back(std::move(key), std::move(value));
    index_.reset();
}
inline void Object::finalize() {
    const size_type n = entries.size();
    if (n >= kIndexThreshold) {
        // The index maps every key to its last position.
        rebuild_index();
        if (index_->size() < n) {
            std::vector<bool> keep(n);
            for (size_type i = 0; i < n; ++i)
                keep[i] = index_->find(std::string_view(entries[i].first))->second == i;
            // Compaction moves keys; the index views would dangle.
            index_.reset();
            size_type write = 0;
            for (size_type i = 0; i < n; ++i) {
                if (!keep[i]) continue;
                if (write != i) entries[write] = std::move(entries[i]);
                ++write;
            }
            entries.resize(write);
        }
    } else if (n >= 2) {
        for (size_type i = 0; i < entries.size(); ) {
            bool has_later_dup = false;
            for (size_type j = i + 1; j < entries.size(); ++j) {
                if (entries[i].first == entries[j].first) {
                    has_later_dup = true;
                    break;
                }
            }
            if (SJSON_UNLIKELY(has_later_dup)) {
                entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(i));
            } else {
                ++i;
            }
        }
    }
}
inline bool Object::erase(std::string_view key) {
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it->first == key) {
            entries.erase(it);
            index_.reset();
            return true;
        }
    }
    return false;
}
inline bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    for (const auto& [key, val] : entries) {
        const auto* p = other.find(key);
        if (!p || *p != val) return false;
    }
    return true;
}

} // namespace sjson
