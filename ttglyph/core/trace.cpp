// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_p.h>
#include <ttglyph/core/runtime_p.h>
#include <ttglyph/core/trace_p.h>

// TGDebugTrace - Log
// ==================

void TGDebugTrace::log(uint32_t level, uint32_t indentation, const char* fmt, ...) noexcept {
  if (!tg_runtime_is_log_level_enabled(level))
    return;

  const char* prefix = "";
  if (indentation < 0xFFFFFFFFu) {
    switch (level) {
      case TG_LOG_LEVEL_WARNING: prefix = "[WARN] "; break;
      case TG_LOG_LEVEL_ERROR  : prefix = "[FAIL] "; break;
    }
  }
  else {
    indentation = 0;
  }

  char buf[1024];
  int prefix_size = snprintf(buf, TG_ARRAY_SIZE(buf), "%*s%s", int(tg_min<uint32_t>(indentation, 32u) * 2u), "", prefix);

  va_list ap;
  va_start(ap, fmt);
  vsnprintf(buf + prefix_size, TG_ARRAY_SIZE(buf) - size_t(prefix_size), fmt, ap);
  va_end(ap);

  tg_runtime_emit_message(level, buf);
}
