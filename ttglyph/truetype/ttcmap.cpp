// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_p.h>
#include <ttglyph/core/trace_p.h>
#include <ttglyph/truetype/ttcmap_p.h>

namespace tg::TrueType {
namespace CMapImpl {

// tg::TrueType::CMapImpl - Trace
// ==============================

#if defined(TG_TRACE_TT_CMAP)
#define Trace TGDebugTrace
#else
#define Trace TGDummyTrace
#endif

// tg::TrueType::CMapImpl - Select
// ===============================

TableRole role_of(uint32_t platform_id, uint32_t encoding_id) noexcept {
  switch (platform_id) {
    case TG_FONT_PLATFORM_ID_WINDOWS:
      if (encoding_id == TG_FONT_WINDOWS_ENCODING_ID_UCS2)
        return TableRole::kWinUnicode;

      if (encoding_id == TG_FONT_WINDOWS_ENCODING_ID_SYMBOL)
        return TableRole::kWinSymbol;
      break;

    case TG_FONT_PLATFORM_ID_MAC:
      if (encoding_id == TG_FONT_MAC_ENCODING_ID_ROMAN)
        return TableRole::kMacSymbol;
      break;
  }

  return TableRole::kNone;
}

void select(const TGFontSource* font, CMapSelection& out) noexcept {
  out.reset();

  if (!font)
    return;

  Trace trace;
  uint32_t table_count = font->code_table_count();

  trace.info("tg::TrueType::CMapImpl::Select [TableCount=%u]\n", table_count);
  trace.indent();

  for (uint32_t i = 0; i < table_count; i++) {
    const TGCodeTable* table = font->code_table_at(i);
    if (!table)
      continue;

    uint32_t platform_id = table->platform_id();
    uint32_t encoding_id = table->encoding_id();

    switch (role_of(platform_id, encoding_id)) {
      case TableRole::kWinUnicode:
        trace.info("#%u [Platform=%u Encoding=%u] -> WinUnicode\n", i, platform_id, encoding_id);
        out.win_unicode = table;
        break;

      case TableRole::kWinSymbol:
        trace.info("#%u [Platform=%u Encoding=%u] -> WinSymbol\n", i, platform_id, encoding_id);
        out.win_symbol = table;
        break;

      case TableRole::kMacSymbol:
        trace.info("#%u [Platform=%u Encoding=%u] -> MacSymbol\n", i, platform_id, encoding_id);
        out.mac_symbol = table;
        break;

      default:
        trace.info("#%u [Platform=%u Encoding=%u] -> Ignored\n", i, platform_id, encoding_id);
        break;
    }
  }

  trace.deindent();
}

} // {CMapImpl}
} // {tg::TrueType}
