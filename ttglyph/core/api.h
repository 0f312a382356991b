// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_API_H_INCLUDED
#define TTGLYPH_API_H_INCLUDED

// This header can only be included by either <ttglyph/ttglyph.h> or by TTGlyph headers during the build. Prevent
// users including <ttglyph/core/...> headers by accident and prevent not including "ttglyph/api-build_p.h" during
// the build.
#if !defined(TTGLYPH_H_INCLUDED) && !defined(TTGLYPH_API_BUILD_P_H_INCLUDED)
  #pragma message("Include <ttglyph/ttglyph.h> to use TTGlyph library")
#endif

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <string.h>

//! \addtogroup tg_globals
//! \{

// TTGlyph - Version
// =================

//! Makes a version number representing a `MAJOR.MINOR.PATCH` combination.
#define TG_MAKE_VERSION(MAJOR, MINOR, PATCH) (((MAJOR) << 16) | ((MINOR) << 8) | (PATCH))

//! TTGlyph library version.
#define TG_VERSION TG_MAKE_VERSION(0, 3, 0)

// TTGlyph - Build Type
// ====================

//! \def TG_STATIC
//!
//! Defined when TTGlyph is a static library.

//! \def TG_BUILD_DEBUG
//!
//! Defined when TTGlyph is a debug build.

//! \def TG_BUILD_RELEASE
//!
//! Defined when TTGlyph is a release build.

#if defined(TTGLYPH_STATIC) && !defined(TG_STATIC)
  #define TG_STATIC
#endif

#if !defined(TG_BUILD_DEBUG) && !defined(TG_BUILD_RELEASE)
  #if !defined(NDEBUG)
    #define TG_BUILD_DEBUG
  #else
    #define TG_BUILD_RELEASE
  #endif
#endif

// TTGlyph - Compiler Abstraction
// ==============================

//! \def TG_API
//!
//! A base API decorator that marks functions and variables exported by TTGlyph.
#if !defined(TG_STATIC)
  #if defined(_WIN32) && (defined(_MSC_VER) || defined(__MINGW32__))
    #if defined(TG_BUILD_EXPORT)
      #define TG_API __declspec(dllexport)
    #else
      #define TG_API __declspec(dllimport)
    #endif
  #elif defined(_WIN32) && defined(__GNUC__)
    #if defined(TG_BUILD_EXPORT)
      #define TG_API __attribute__((__dllexport__))
    #else
      #define TG_API __attribute__((__dllimport__))
    #endif
  #elif defined(__GNUC__)
    #define TG_API __attribute__((__visibility__("default")))
  #endif
#endif

#if !defined(TG_API)
  #define TG_API
#endif

//! \def TG_CDECL
//!
//! Calling convention used by all exported functions and function callbacks.
#if defined(__GNUC__) && defined(__i386__) && !defined(__x86_64__)
  #define TG_CDECL __attribute__((__cdecl__))
#elif defined(_MSC_VER)
  #define TG_CDECL __cdecl
#else
  #define TG_CDECL
#endif

//! \def TG_INLINE
//!
//! Marks functions that should always be inlined.
#if defined(__GNUC__) && !defined(TG_BUILD_DEBUG)
  #define TG_INLINE inline __attribute__((__always_inline__))
#elif defined(_MSC_VER) && !defined(TG_BUILD_DEBUG)
  #define TG_INLINE __forceinline
#else
  #define TG_INLINE inline
#endif

//! \def TG_INLINE_NODEBUG
//!
//! The same as `TG_INLINE` combined with `__attribute__((artificial))` or `__attribute__((nodebug))` if supported.
#if defined(__clang__)
  #define TG_INLINE_NODEBUG inline __attribute__((__always_inline__, __nodebug__))
#elif defined(__GNUC__)
  #define TG_INLINE_NODEBUG inline __attribute__((__always_inline__, __artificial__))
#else
  #define TG_INLINE_NODEBUG TG_INLINE
#endif

//! \def TG_INLINE_CONSTEXPR
//!
//! The same as `TG_INLINE_NODEBUG`, but having also `constexpr` keyword.
#define TG_INLINE_CONSTEXPR constexpr TG_INLINE_NODEBUG

//! \def TG_NORETURN
//!
//! Function attribute used by functions that never return (that terminate the process).
#if defined(__GNUC__)
  #define TG_NORETURN __attribute__((__noreturn__))
#elif defined(_MSC_VER)
  #define TG_NORETURN __declspec(noreturn)
#else
  #define TG_NORETURN
#endif

//! \def TG_LIKELY(EXP)
//!
//! Expression is likely to be true.

//! \def TG_UNLIKELY(EXP)
//!
//! Expression is unlikely to be true.
#if defined(__GNUC__)
  #define TG_LIKELY(...) __builtin_expect(!!(__VA_ARGS__), 1)
  #define TG_UNLIKELY(...) __builtin_expect(!!(__VA_ARGS__), 0)
#else
  #define TG_LIKELY(...) (__VA_ARGS__)
  #define TG_UNLIKELY(...) (__VA_ARGS__)
#endif

//! \def TG_DEFINE_ENUM(NAME)
//!
//! Defines an enumeration used by TTGlyph that is `uint32_t`.
#define TG_DEFINE_ENUM(NAME) enum NAME : uint32_t

//! \def TG_BEGIN_C_DECLS
//!
//! Begins C declarations scope when compiling with a C++ compiler.

//! \def TG_END_C_DECLS
//!
//! Ends C declarations scope when compiling with a C++ compiler.
#define TG_BEGIN_C_DECLS extern "C" {
#define TG_END_C_DECLS } /* {ExternC} */

//! \}

// TTGlyph - Assertions
// ====================

//! \addtogroup tg_globals
//! \{

TG_BEGIN_C_DECLS

//! Called on assertion failure in case that TTGlyph was compiled with assertions enabled (debug builds).
TG_API TG_NORETURN void TG_CDECL tg_runtime_assertion_failure(const char* file, int line, const char* msg) noexcept;

TG_END_C_DECLS

//! \def TG_ASSERT(EXP)
//!
//! Run-time assertion executed in debug builds.
#ifdef TG_BUILD_DEBUG
  #define TG_ASSERT(EXP)                                                   \
    do {                                                                   \
      if (TG_UNLIKELY(!(EXP)))                                             \
        tg_runtime_assertion_failure(__FILE__, __LINE__, #EXP);            \
    } while (0)
#else
  #define TG_ASSERT(EXP) ((void)0)
#endif

//! \}

// TTGlyph - Result Codes
// ======================

//! \addtogroup tg_globals
//! \{

//! Result code used by most TTGlyph functions (32-bit unsigned integer).
//!
//! The `TGResultCode` enumeration contains TTGlyph result codes that contain TTGlyph specific set of errors.
typedef uint32_t TGResult;

//! Glyph index (32-bit unsigned integer, but valid TrueType glyph indexes only occupy 16 bits).
//!
//! Glyph index 0 is reserved and means "no glyph" when returned by a character to glyph mapping.
typedef uint32_t TGGlyphId;

//! Result codes used by TTGlyph API.
TG_DEFINE_ENUM(TGResultCode) {
  //! Successful result code.
  TG_SUCCESS = 0,

  TG_ERROR_START_INDEX = 0x00010000u,

  TG_ERROR_OUT_OF_MEMORY = 0x00010000u,  //!< Out of memory                 [ENOMEM].
  TG_ERROR_INVALID_VALUE,                //!< Invalid value/argument        [EINVAL].
  TG_ERROR_INVALID_STATE,                //!< Invalid state                 [EFAULT].
  TG_ERROR_NOT_INITIALIZED,              //!< Object not initialized.
  TG_ERROR_INVALID_DATA,                 //!< Invalid data (returned by a collaborator or malformed outline).
  TG_ERROR_INVALID_GLYPH,                //!< Glyph index out of range or the glyph is not defined.
  TG_ERROR_INVALID_CHARACTER,            //!< A name, code, or string could not be mapped to a character.
  TG_ERROR_NO_MATCHING_VERTEX,           //!< No matching vertex in a path.

  //! Maximum value of `TGResultCode`.
  TG_ERROR_MAX_VALUE = TG_ERROR_NO_MATCHING_VERTEX
};

//! Returns the `result` passed.
//!
//! Provided for debugging purposes. Putting a breakpoint inside `tg_make_error()` can help with tracing an origin
//! of errors reported / returned by TTGlyph as each error goes through this function.
//!
//! It's a zero-cost solution that doesn't affect release builds in any way.
[[nodiscard]]
static inline TGResult tg_make_error(TGResult result) noexcept { return result; }

//! \}

#endif // TTGLYPH_API_H_INCLUDED
