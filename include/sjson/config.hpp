#pragma once

/// @file config.hpp
/// @author Aleksandr Loshkarev
/// @brief Configuration macros for the sjson library.
///
/// Controls:
///   - Branch prediction hints
///   - Nesting depth limit
///   - Token buffer limit
///   - Default chunk size of the stream drivers

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define SJSON_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define SJSON_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define SJSON_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define SJSON_LIKELY(x)   (x)
    #define SJSON_UNLIKELY(x) (x)
    #define SJSON_NOINLINE    __declspec(noinline)
#else
    #define SJSON_LIKELY(x)   (x)
    #define SJSON_UNLIKELY(x) (x)
    #define SJSON_NOINLINE
#endif

// =====================================================================
// Nesting depth limit
// =====================================================================
// Bounds the open-frame stack of a stream. Traversal itself is iterative,
// so this is a memory bound, not a stack-overflow guard.

#if !defined(SJSON_MAX_DEPTH)
    #define SJSON_MAX_DEPTH 512
#endif

// =====================================================================
// Token buffer limit
// =====================================================================
// Maximum number of bytes of a single atom (string, number, literal) that
// may be carried across chunk boundaries.

#if !defined(SJSON_MAX_TOKEN_SIZE)
    #define SJSON_MAX_TOKEN_SIZE (16u * 1024u * 1024u)
#endif

// =====================================================================
// Stream drivers
// =====================================================================

#if !defined(SJSON_DEFAULT_CHUNK_SIZE)
    #define SJSON_DEFAULT_CHUNK_SIZE 65536
#endif
