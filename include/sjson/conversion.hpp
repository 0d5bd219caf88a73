#pragma once

/// @file conversion.hpp
/// @author Aleksandr Loshkarev
/// @brief ADL-based decoding of tree values into C++ types.
///
/// Provides:
///   - from_json() for basic types and STL containers
///   - from_value<T>() / try_from_value<T>() helper wrappers
///   - SJSON_DEFINE_TYPE_NON_INTRUSIVE() macro for struct mapping
///   - SJSON_DEFINE_TYPE_INTRUSIVE() macro for friend mapping
///
/// These are what decode_value<T>() applies to a streamed value.
///
/// @code
///   struct User { std::string name; int age; bool active; };
///   SJSON_DEFINE_TYPE_NON_INTRUSIVE(User, name, age, active)
///
///   User u = sjson::from_value<User>(tree);
/// @endcode

#include "error.hpp"
#include "value.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace sjson {

namespace detail {

template <typename I>
I checked_integer(const Value& j) {
    if constexpr (std::is_signed_v<I>) {
        int64_t v = j.as_integer();
        if (SJSON_UNLIKELY(v < static_cast<int64_t>(std::numeric_limits<I>::min()) ||
                           v > static_cast<int64_t>(std::numeric_limits<I>::max())))
            throw OutOfRangeError("integer " + std::to_string(v) + " does not fit the target type",
                                  errc::integer_overflow);
        return static_cast<I>(v);
    } else {
        uint64_t v = j.as_uinteger();
        if (SJSON_UNLIKELY(v > static_cast<uint64_t>(std::numeric_limits<I>::max())))
            throw OutOfRangeError("integer " + std::to_string(v) + " does not fit the target type",
                                  errc::integer_overflow);
        return static_cast<I>(v);
    }
}

} // namespace detail

// =====================================================================
// from_json: Value -> C++ type
// =====================================================================

inline void from_json(const Value& j, bool& v)               { v = j.as_bool(); }
inline void from_json(const Value& j, short& v)              { v = detail::checked_integer<short>(j); }
inline void from_json(const Value& j, unsigned short& v)     { v = detail::checked_integer<unsigned short>(j); }
inline void from_json(const Value& j, int& v)                { v = detail::checked_integer<int>(j); }
inline void from_json(const Value& j, unsigned& v)           { v = detail::checked_integer<unsigned>(j); }
inline void from_json(const Value& j, long& v)               { v = detail::checked_integer<long>(j); }
inline void from_json(const Value& j, unsigned long& v)      { v = detail::checked_integer<unsigned long>(j); }
inline void from_json(const Value& j, long long& v)          { v = detail::checked_integer<long long>(j); }
inline void from_json(const Value& j, unsigned long long& v) { v = detail::checked_integer<unsigned long long>(j); }
inline void from_json(const Value& j, float& v)              { v = static_cast<float>(j.as_float()); }
inline void from_json(const Value& j, double& v)             { v = j.as_float(); }
inline void from_json(const Value& j, std::string& v)        { v = j.as_string(); }
inline void from_json(const Value& j, Value& v)              { v = j; }

template <typename T>
void from_json(const Value& j, std::vector<T>& vec) {
    const auto& arr = j.as_array();
    vec.clear();
    vec.reserve(arr.size());
    for (const auto& elem : arr) {
        T val{};
        from_json(elem, val);
        vec.push_back(std::move(val));
    }
}

template <typename T>
void from_json(const Value& j, std::map<std::string, T>& m) {
    const auto& obj = j.as_object();
    m.clear();
    for (const auto& [key, val] : obj) {
        T v{};
        from_json(val, v);
        m.emplace(key, std::move(v));
    }
}

template <typename T>
void from_json(const Value& j, std::unordered_map<std::string, T>& m) {
    const auto& obj = j.as_object();
    m.clear();
    for (const auto& [key, val] : obj) {
        T v{};
        from_json(val, v);
        m.emplace(key, std::move(v));
    }
}

template <typename T>
void from_json(const Value& j, std::optional<T>& opt) {
    if (j.is_null()) {
        opt = std::nullopt;
    } else {
        T val{};
        from_json(j, val);
        opt = std::move(val);
    }
}

// =====================================================================
// Helper wrappers
// =====================================================================

/// Value -> C++ value (T must be default-constructible). Throws on mismatch.
template <typename T>
[[nodiscard]] T from_value(const Value& j) {
    T val{};
    from_json(j, val);
    return val;
}

/// Value -> C++ value, reporting a mismatch as data.
template <typename T>
[[nodiscard]] decode_result<T> try_from_value(const Value& j) {
    decode_result<T> r;
    try {
        from_json(j, r.value);
    } catch (const std::system_error& e) {
        r.value = T{};
        r.ec = make_error_code(errc::decode_failed);
        r.message = e.what();
    }
    return r;
}

} // namespace sjson

// =====================================================================
// Preprocessor FOREACH utilities (support up to 20 fields)
// =====================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define SJSON_PP_CAT_I(a, b) a##b
#define SJSON_PP_CAT(a, b) SJSON_PP_CAT_I(a, b)

#define SJSON_PP_NARG_I(...) \
    SJSON_PP_ARG_N(__VA_ARGS__, \
    20,19,18,17,16,15,14,13,12,11,10,9,8,7,6,5,4,3,2,1,0)
#define SJSON_PP_ARG_N( \
    _1,_2,_3,_4,_5,_6,_7,_8,_9,_10, \
    _11,_12,_13,_14,_15,_16,_17,_18,_19,_20, N,...) N

#define SJSON_PP_FE_1(m,x) m(x)
#define SJSON_PP_FE_2(m,x,...) m(x) SJSON_PP_FE_1(m,__VA_ARGS__)
#define SJSON_PP_FE_3(m,x,...) m(x) SJSON_PP_FE_2(m,__VA_ARGS__)
#define SJSON_PP_FE_4(m,x,...) m(x) SJSON_PP_FE_3(m,__VA_ARGS__)
#define SJSON_PP_FE_5(m,x,...) m(x) SJSON_PP_FE_4(m,__VA_ARGS__)
#define SJSON_PP_FE_6(m,x,...) m(x) SJSON_PP_FE_5(m,__VA_ARGS__)
#define SJSON_PP_FE_7(m,x,...) m(x) SJSON_PP_FE_6(m,__VA_ARGS__)
#define SJSON_PP_FE_8(m,x,...) m(x) SJSON_PP_FE_7(m,__VA_ARGS__)
#define SJSON_PP_FE_9(m,x,...) m(x) SJSON_PP_FE_8(m,__VA_ARGS__)
#define SJSON_PP_FE_10(m,x,...) m(x) SJSON_PP_FE_9(m,__VA_ARGS__)
#define SJSON_PP_FE_11(m,x,...) m(x) SJSON_PP_FE_10(m,__VA_ARGS__)
#define SJSON_PP_FE_12(m,x,...) m(x) SJSON_PP_FE_11(m,__VA_ARGS__)
#define SJSON_PP_FE_13(m,x,...) m(x) SJSON_PP_FE_12(m,__VA_ARGS__)
#define SJSON_PP_FE_14(m,x,...) m(x) SJSON_PP_FE_13(m,__VA_ARGS__)
#define SJSON_PP_FE_15(m,x,...) m(x) SJSON_PP_FE_14(m,__VA_ARGS__)
#define SJSON_PP_FE_16(m,x,...) m(x) SJSON_PP_FE_15(m,__VA_ARGS__)
#define SJSON_PP_FE_17(m,x,...) m(x) SJSON_PP_FE_16(m,__VA_ARGS__)
#define SJSON_PP_FE_18(m,x,...) m(x) SJSON_PP_FE_17(m,__VA_ARGS__)
#define SJSON_PP_FE_19(m,x,...) m(x) SJSON_PP_FE_18(m,__VA_ARGS__)
#define SJSON_PP_FE_20(m,x,...) m(x) SJSON_PP_FE_19(m,__VA_ARGS__)

#define SJSON_PP_FOREACH(m,...) \
    SJSON_PP_CAT(SJSON_PP_FE_, SJSON_PP_NARG_I(__VA_ARGS__))(m, __VA_ARGS__)

// A missing field decodes as null, so std::optional members may be absent.
#define SJSON_DETAIL_FROM_FIELD(fld) \
    { \
        const ::sjson::Value* _jf = j.find(#fld); \
        from_json(_jf ? *_jf : ::sjson::Value(nullptr), v.fld); \
    }

/// Non-intrusive: use in the same namespace as the type.
#define SJSON_DEFINE_TYPE_NON_INTRUSIVE(Type, ...) \
    inline void from_json(const ::sjson::Value& j, Type& v) { \
        (void)j.as_object(); \
        SJSON_PP_FOREACH(SJSON_DETAIL_FROM_FIELD, __VA_ARGS__) \
    }

/// Intrusive: use inside the class/struct body.
#define SJSON_DEFINE_TYPE_INTRUSIVE(Type, ...) \
    friend void from_json(const ::sjson::Value& j, Type& v) { \
        (void)j.as_object(); \
        SJSON_PP_FOREACH(SJSON_DETAIL_FROM_FIELD, __VA_ARGS__) \
    }

// NOLINTEND(cppcoreguidelines-macro-usage)
