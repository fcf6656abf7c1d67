/*
Module Name:
- attributes.hpp

Abstract:
- Cross-compiler wrappers for the optimisation and control-flow hints used by the sentinel.
- Unifies spelling across MSVC, Clang, and GCC so call sites stay portable.

Provided Macros:
- TS_FORCE_INLINE
- TS_LIKELY(x), TS_UNLIKELY(x)
- TS_UNREACHABLE()

Notes:
- Hints guide code generation only and do not change semantics.
*/
#pragma once

#ifndef __has_attribute
#define __has_attribute(x) 0
#endif

// TS_FORCE_INLINE
#if !defined(TS_NO_FORCE_INLINE)
#if defined(_MSC_VER)
#define TS_FORCE_INLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#if __has_attribute(always_inline) || defined(__GNUC__)
#define TS_FORCE_INLINE inline __attribute__((always_inline))
#else
#define TS_FORCE_INLINE inline
#endif
#else
#define TS_FORCE_INLINE inline
#endif
#else
#define TS_FORCE_INLINE inline
#endif

// TS_LIKELY / TS_UNLIKELY
#if defined(__clang__) || defined(__GNUC__)
#define TS_LIKELY(x) (__builtin_expect(!!(x), 1))
#define TS_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define TS_LIKELY(x) (x)
#define TS_UNLIKELY(x) (x)
#endif

// TS_UNREACHABLE
#if defined(_MSC_VER)
#define TS_UNREACHABLE() __assume(0)
#elif defined(__clang__) || defined(__GNUC__)
#define TS_UNREACHABLE() __builtin_unreachable()
#else
#define TS_UNREACHABLE() ((void)0)
#endif
