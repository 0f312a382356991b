// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_TRACE_P_H_INCLUDED
#define TTGLYPH_TRACE_P_H_INCLUDED

#include <ttglyph/core/api-internal_p.h>
#include <ttglyph/core/runtime_p.h>

//! \cond INTERNAL
//! \addtogroup tg_internal
//! \{

//! Dummy trace - no tracing, no runtime overhead.
class TGDummyTrace {
public:
  TG_INLINE_NODEBUG bool enabled() const noexcept { return false; }
  TG_INLINE_NODEBUG void indent() noexcept {}
  TG_INLINE_NODEBUG void deindent() noexcept {}

  template<typename... Args>
  TG_INLINE_NODEBUG void out(Args&&...) noexcept {}

  template<typename... Args>
  TG_INLINE_NODEBUG void info(Args&&...) noexcept {}

  template<typename... Args>
  TG_INLINE_NODEBUG bool warn(Args&&...) noexcept { return false; }

  template<typename... Args>
  TG_INLINE_NODEBUG bool fail(Args&&...) noexcept { return false; }
};

//! Debug trace - active / enabled trace that can be useful during debugging.
//!
//! Trace messages go through the runtime message handler at `TG_LOG_LEVEL_DEBUG` (info), `TG_LOG_LEVEL_WARNING`
//! (warn), and `TG_LOG_LEVEL_ERROR` (fail), so they are subject to the runtime log level as well.
class TGDebugTrace {
public:
  TG_INLINE TGDebugTrace() noexcept
    : indentation(0) {}
  TG_INLINE TGDebugTrace(const TGDebugTrace& other) noexcept
    : indentation(other.indentation) {}

  TG_INLINE_NODEBUG bool enabled() const noexcept { return true; }
  TG_INLINE_NODEBUG void indent() noexcept { indentation++; }
  TG_INLINE_NODEBUG void deindent() noexcept { indentation--; }

  template<typename... Args>
  TG_INLINE void out(Args&&... args) noexcept { log(TG_LOG_LEVEL_DEBUG, 0xFFFFFFFFu, std::forward<Args>(args)...); }

  template<typename... Args>
  TG_INLINE void info(Args&&... args) noexcept { log(TG_LOG_LEVEL_DEBUG, indentation, std::forward<Args>(args)...); }

  template<typename... Args>
  TG_INLINE bool warn(Args&&... args) noexcept { log(TG_LOG_LEVEL_WARNING, indentation, std::forward<Args>(args)...); return false; }

  template<typename... Args>
  TG_INLINE bool fail(Args&&... args) noexcept { log(TG_LOG_LEVEL_ERROR, indentation, std::forward<Args>(args)...); return false; }

  TG_HIDDEN static void log(uint32_t level, uint32_t indentation, const char* fmt, ...) noexcept;

  uint32_t indentation;
};

//! \}
//! \endcond

#endif // TTGLYPH_TRACE_P_H_INCLUDED
