// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_API_INTERNAL_P_H_INCLUDED
#define TTGLYPH_API_INTERNAL_P_H_INCLUDED

#include <ttglyph/core/api.h>

// C Headers
// =========

// NOTE: Some headers are already included by <api.h>. This should be useful for creating an overview of what
// TTGlyph really needs globally to be included.
#include <math.h>
#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

// C++ Headers
// ===========

#include <limits>
#include <new>
#include <type_traits>
#include <utility>

// Platform Specific Headers
// =========================

#if defined(_WIN32)
  //! \cond NEVER
  #if !defined(WIN32_LEAN_AND_MEAN)
    #define WIN32_LEAN_AND_MEAN
  #endif
  #if !defined(NOMINMAX)
    #define NOMINMAX
  #endif
  //! \endcond

  #include <windows.h>   // OutputDebugStringA().
#endif

//! \cond INTERNAL
//! \addtogroup tg_internal
//! \{

// C++ Compiler Support
// ====================

//! \def TG_HIDDEN
//!
//! Decorates a function that is used across more than one source file, but should never be exported. Expands to
//! a compiler-specific code that affects the visibility.
#if defined(__GNUC__) && !defined(__MINGW32__)
  #define TG_HIDDEN __attribute__((__visibility__("hidden")))
#else
  #define TG_HIDDEN
#endif

//! \def TG_NOINLINE
//!
//! Decorates a function that should never be inlined. Used to decorate functions that are called rarely, like
//! buffer reallocation or diagnostics.
#if defined(__GNUC__)
  #define TG_NOINLINE __attribute__((__noinline__))
#elif defined(_MSC_VER)
  #define TG_NOINLINE __declspec(noinline)
#else
  #define TG_NOINLINE
#endif

//! \def TG_API_IMPL
//!
//! Decorator used to mark all functions and variables that are exported - it expands to "extern C", which ensures
//! that an exported function or variable can be implemented within a private namespace and it would still be exported
//! properly.
#define TG_API_IMPL extern "C" TG_API

#define TG_STRINGIFY_WRAP(N) #N
#define TG_STRINGIFY(N) TG_STRINGIFY_WRAP(N)

#define TG_STATIC_ASSERT(...) static_assert(__VA_ARGS__, "Failed TG_STATIC_ASSERT(" #__VA_ARGS__ ")")

// Internal C++ Macros
// ===================

//! \def TG_NONCOPYABLE
//!
//! Makes a class noncopyable by making its copy constructor and copy assignment operator deleted.
#define TG_NONCOPYABLE(...)                                                   \
  __VA_ARGS__(const __VA_ARGS__& other) = delete;                             \
  __VA_ARGS__& operator=(const __VA_ARGS__& other) = delete;

//! \def TG_NOT_REACHED()
//!
//! Run-time assertion used in code that should never be reached.
#ifdef TG_BUILD_DEBUG
  #define TG_NOT_REACHED() tg_runtime_assertion_failure(__FILE__, __LINE__, "TG_NOT_REACHED()")
#elif defined(__GNUC__)
  #define TG_NOT_REACHED() __builtin_unreachable()
#else
  #define TG_NOT_REACHED() ((void)0)
#endif

#define TG_ARRAY_SIZE(X) uint32_t(sizeof(X) / sizeof(X[0]))

#define TG_PROPAGATE_(exp, cleanup)                                           \
  do {                                                                        \
    TGResult _result_to_propagate = (exp);                                    \
    if (TG_UNLIKELY(_result_to_propagate != TG_SUCCESS)) {                    \
      cleanup                                                                 \
      return _result_to_propagate;                                            \
    }                                                                         \
  } while (0)

//! Propagates a non-successful `TGResult` returned by the given expression to the caller.
#define TG_PROPAGATE(...) TG_PROPAGATE_(__VA_ARGS__, {})

// Internal Functions
// ==================

//! Tests whether `x` is within [start, end] range (both inclusive).
template<typename T>
[[nodiscard]]
static TG_INLINE_CONSTEXPR bool tg_in_range(const T& x, const T& start, const T& end) noexcept {
  return x >= start && x <= end;
}

template<typename T>
[[nodiscard]]
static TG_INLINE_CONSTEXPR T tg_min(const T& a, const T& b) noexcept { return b < a ? b : a; }

template<typename T>
[[nodiscard]]
static TG_INLINE_CONSTEXPR T tg_max(const T& a, const T& b) noexcept { return a < b ? b : a; }

//! \}
//! \endcond

#endif // TTGLYPH_API_INTERNAL_P_H_INCLUDED
