// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each TTGlyph source file. This means that any
// macros we might need to define to build 'ttglyph' can be defined here instead of passing them to the compiler
// through command line.

#ifndef TTGLYPH_API_BUILD_P_H_INCLUDED
#define TTGLYPH_API_BUILD_P_H_INCLUDED

// Build - Export
// ==============

//! \cond INTERNAL

//! Export mode is on when `TG_BUILD_EXPORT` is defined - this MUST be defined before including any other header
//! as "api.h" uses `TG_BUILD_EXPORT` to define a proper `TG_API` decorator that is used by all exported functions
//! and variables.
#define TG_BUILD_EXPORT

//! \endcond

// Build - Tracing
// ===============

// #define TG_TRACE_TT_ALL          // Trace TrueType features (all).
// #define TG_TRACE_TT_CMAP         // Trace TrueType code table selection.
// #define TG_TRACE_TT_OUTLINE      // Trace TrueType outline reconstruction.
// #define TG_TRACE_TT_RESOLVER     // Trace TrueType code to glyph resolution.

//! \cond NEVER
#if defined(TG_TRACE_TT_ALL)
  #if !defined(TG_TRACE_TT_CMAP)
    #define TG_TRACE_TT_CMAP
  #endif
  #if !defined(TG_TRACE_TT_OUTLINE)
    #define TG_TRACE_TT_OUTLINE
  #endif
  #if !defined(TG_TRACE_TT_RESOLVER)
    #define TG_TRACE_TT_RESOLVER
  #endif
#endif
//! \endcond

// Build - Warnings
// ================

//! \cond NEVER
#if defined(_MSC_VER)
  #pragma warning(disable: 4127) // conditional expression is constant
  #pragma warning(disable: 4201) // nameless struct/union
  #pragma warning(disable: 4996) // this function or variable may be unsafe
#endif
//! \endcond

// Build - Globals - Internal
// ==========================

#include <ttglyph/core/api-internal_p.h>

#endif // TTGLYPH_API_BUILD_P_H_INCLUDED
