// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_p.h>
#include <ttglyph/core/runtime.h>
#include <ttglyph/core/trace_p.h>
#include <ttglyph/truetype/ttresolver_p.h>
#include <ttglyph/unicode/unicode_p.h>

namespace tg::TrueType {
namespace ResolverImpl {

// tg::TrueType::ResolverImpl - Trace
// ==================================

#if defined(TG_TRACE_TT_RESOLVER)
#define Trace TGDebugTrace
#else
#define Trace TGDummyTrace
#endif

// tg::TrueType::ResolverImpl - CID CMap
// =====================================

//! Looks up `code` in the CID CMap and stores the first code point of the mapped string to `glyph_id_out`. Returns
//! false if there is no CMap, the code is not mapped, or the mapped string is not valid UTF-8.
static bool lookup_cid_cmap(const FontContext& ctx, uint32_t code, TGGlyphId* glyph_id_out) noexcept {
  if (!ctx.cid_cmap)
    return false;

  const char* str = ctx.cid_cmap->lookup(code, ctx.cmap_byte_width());
  if (!str)
    return false;

  uint32_t uc;
  TGResult result = Unicode::first_code_point(str, &uc);

  if (result != TG_SUCCESS) {
    tg_runtime_log(TG_LOG_LEVEL_ERROR, "%s: CMap maps code %u to an invalid string (0x%08X)\n", ctx.font_name, code, result);
    return false;
  }

  *glyph_id_out = uc;
  return true;
}

// tg::TrueType::ResolverImpl - CID
// ================================

TGGlyphId get_gid(const FontContext& ctx, uint32_t code) noexcept {
  switch (ctx.cid_to_gid_mode) {
    case TG_CID_TO_GID_MODE_IDENTITY:
      return code;

    case TG_CID_TO_GID_MODE_EXPLICIT_TABLE:
      return ctx.cid_font ? ctx.cid_font->map_cid_to_gid(code) : code;

    default: {
      TGGlyphId glyph_id;
      if (!lookup_cid_cmap(ctx, code, &glyph_id))
        glyph_id = code;
      return glyph_id;
    }
  }
}

// tg::TrueType::ResolverImpl - Simple
// ===================================

//! Maps glyph `name` through the Windows Unicode table. A name without a Unicode value queries code point zero.
static TGGlyphId resolve_name_win_unicode(const FontContext& ctx, const char* name, Trace& trace) noexcept {
  uint32_t uc = 0;

  if (ctx.name_mapper) {
    TGResult result = ctx.name_mapper->unicode_for_name(name, &uc);

    if (result == TG_ERROR_INVALID_CHARACTER) {
      trace.info("Name '%s' has no Unicode value\n", name);
      uc = 0;
    }
    else if (result != TG_SUCCESS) {
      tg_runtime_log(TG_LOG_LEVEL_ERROR, "%s: Failed to map glyph name '%s' to Unicode (0x%08X)\n", ctx.font_name, name, result);
      return 0;
    }
  }

  TGGlyphId glyph_id = ctx.cmaps.win_unicode->glyph_id_for_code(uc);
  trace.info("WinUnicode [Name=%s U+%04X] -> %u\n", name, uc, glyph_id);
  return glyph_id;
}

//! Maps glyph `name` through the Macintosh Symbol table by using its Mac Roman code.
static TGGlyphId resolve_name_mac_symbol(const FontContext& ctx, const char* name, Trace& trace) noexcept {
  if (!ctx.name_mapper)
    return 0;

  uint32_t mac_code = 0;
  TGResult result = ctx.name_mapper->mac_roman_code_for_name(name, &mac_code);

  if (result != TG_SUCCESS) {
    tg_runtime_log(TG_LOG_LEVEL_ERROR, "%s: Failed to map glyph name '%s' to Mac Roman code (0x%08X)\n", ctx.font_name, name, result);
    return 0;
  }

  TGGlyphId glyph_id = ctx.cmaps.mac_symbol->glyph_id_for_code(mac_code);
  trace.info("MacSymbol [Name=%s Code=%u] -> %u\n", name, mac_code, glyph_id);
  return glyph_id;
}

//! Maps `code` through the Windows Symbol table, probing private use ranges for single byte codes.
static TGGlyphId resolve_win_symbol(const FontContext& ctx, uint32_t code, Trace& trace) noexcept {
  static constexpr uint32_t kRanges[] = { kSymbolRangeF000, kSymbolRangeF100, kSymbolRangeF200 };

  const TGCodeTable* table = ctx.cmaps.win_symbol;
  TGGlyphId glyph_id = table->glyph_id_for_code(code);
  trace.info("WinSymbol [Code=%u] -> %u\n", code, glyph_id);

  if (code <= 0xFFu) {
    for (uint32_t i = 0; i < TG_ARRAY_SIZE(kRanges) && glyph_id == 0; i++) {
      glyph_id = table->glyph_id_for_code(code + kRanges[i]);
      trace.info("WinSymbol [Code=0x%04X] -> %u\n", code + kRanges[i], glyph_id);
    }
  }

  return glyph_id;
}

TGGlyphId resolve_simple(const FontContext& ctx, uint32_t code) noexcept {
  if (ctx.cid_keyed)
    return get_gid(ctx, code);

  Trace trace;
  trace.info("tg::TrueType::ResolverImpl::ResolveSimple [Code=%u]\n", code);
  trace.indent();

  TGGlyphId glyph_id = 0;

  if (ctx.encoding && !ctx.symbolic) {
    const char* name = nullptr;
    TGResult result = ctx.encoding->glyph_name_for_code(code, &name);

    if (result != TG_SUCCESS) {
      tg_runtime_log(TG_LOG_LEVEL_ERROR, "%s: Failed to get glyph name of code %u (0x%08X)\n", ctx.font_name, code, result);
    }
    else if (name) {
      if (ctx.cmaps.win_unicode)
        glyph_id = resolve_name_win_unicode(ctx, name, trace);
      else if (ctx.cmaps.mac_symbol)
        glyph_id = resolve_name_mac_symbol(ctx, name, trace);
    }
  }
  else {
    if (ctx.cmaps.win_symbol) {
      glyph_id = resolve_win_symbol(ctx, code, trace);
    }
    else if (ctx.cmaps.mac_symbol) {
      glyph_id = ctx.cmaps.mac_symbol->glyph_id_for_code(code);
      trace.info("MacSymbol [Code=%u] -> %u\n", code, glyph_id);
    }
  }

  trace.deindent();
  return glyph_id;
}

// tg::TrueType::ResolverImpl - Fallback
// =====================================

TGGlyphId resolve_with_fallback(const FontContext& ctx, uint32_t code) noexcept {
  TGGlyphId glyph_id = resolve_simple(ctx, code);
  if (glyph_id > 0)
    return glyph_id;

  // Not mapped - the code itself is the glyph index unless the CID CMap says otherwise.
  if (!lookup_cid_cmap(ctx, code, &glyph_id))
    glyph_id = code;
  return glyph_id;
}

} // {ResolverImpl}
} // {tg::TrueType}
