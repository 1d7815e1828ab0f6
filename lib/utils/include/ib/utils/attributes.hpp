/*
Module Name:
- attributes.hpp

Abstract:
- Compiler hint macros shared by the parser and the line wrapper.
- MSVC, Clang and GCC spellings behind one name.

Provided Macros:
- IB_FORCE_INLINE
- IB_LIKELY(x), IB_UNLIKELY(x)

Notes:
- Hints change code generation only, never behaviour.
*/
#pragma once

#ifndef __has_attribute
#define __has_attribute(x) 0
#endif

// IB_FORCE_INLINE
#if defined(IB_NO_FORCE_INLINE)
#define IB_FORCE_INLINE inline
#elif defined(_MSC_VER)
#define IB_FORCE_INLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#if __has_attribute(always_inline) || defined(__GNUC__)
#define IB_FORCE_INLINE inline __attribute__((always_inline))
#else
#define IB_FORCE_INLINE inline
#endif
#else
#define IB_FORCE_INLINE inline
#endif

// IB_LIKELY / IB_UNLIKELY
#if defined(__clang__) || defined(__GNUC__)
#define IB_LIKELY(x) (__builtin_expect(!!(x), 1))
#define IB_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define IB_LIKELY(x) (x)
#define IB_UNLIKELY(x) (x)
#endif
