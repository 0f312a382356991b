// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_TRUETYPE_TTDEFS_P_H_INCLUDED
#define TTGLYPH_TRUETYPE_TTDEFS_P_H_INCLUDED

#include <ttglyph/core/api-internal_p.h>
#include <ttglyph/core/fontsource.h>

//! \cond INTERNAL
//! \addtogroup tg_truetype_impl
//! \{

namespace tg::TrueType {

//! Scale used when the font has no 'head' table (units per em is unknown).
static constexpr double kDefaultScale = 0.001;

//! Private use ranges, which symbolic fonts use to map single byte codes.
enum SymbolRange : uint32_t {
  kSymbolRangeF000 = 0xF000u,
  kSymbolRangeF100 = 0xF100u,
  kSymbolRangeF200 = 0xF200u
};

//! Code tables selected by role.
struct CMapSelection {
  //! Windows Unicode BMP table (3, 1).
  const TGCodeTable* win_unicode;
  //! Windows Symbol table (3, 0).
  const TGCodeTable* win_symbol;
  //! Macintosh Roman / Symbol table (1, 0).
  const TGCodeTable* mac_symbol;

  TG_INLINE void reset() noexcept {
    win_unicode = nullptr;
    win_symbol = nullptr;
    mac_symbol = nullptr;
  }

  [[nodiscard]]
  TG_INLINE bool is_empty() const noexcept { return !win_unicode && !win_symbol && !mac_symbol; }
};

//! Snapshot of everything captured from the font and its descriptor at initialization.
struct FontContext {
  const TGFontSource* font;
  const TGGlyphTable* glyph_table;
  const TGFontEncoding* encoding;
  const TGGlyphNameMapper* name_mapper;
  const TGCidFont* cid_font;
  const TGCidCMap* cid_cmap;

  CMapSelection cmaps;

  //! Font name used by diagnostics, never null.
  const char* font_name;
  //! Scale that converts font units to em units.
  double scale;

  bool symbolic;
  bool cid_keyed;
  bool two_byte_mappings;
  TGCidToGidMode cid_to_gid_mode;

  TG_INLINE void reset() noexcept {
    font = nullptr;
    glyph_table = nullptr;
    encoding = nullptr;
    name_mapper = nullptr;
    cid_font = nullptr;
    cid_cmap = nullptr;
    cmaps.reset();
    font_name = "";
    scale = kDefaultScale;
    symbolic = false;
    cid_keyed = false;
    two_byte_mappings = false;
    cid_to_gid_mode = TG_CID_TO_GID_MODE_IDENTITY;
  }

  //! Number of bytes per code used by CID CMap lookups.
  [[nodiscard]]
  TG_INLINE uint32_t cmap_byte_width() const noexcept { return two_byte_mappings ? 2u : 1u; }

  [[nodiscard]]
  TG_INLINE uint32_t glyph_count() const noexcept { return glyph_table ? glyph_table->glyph_count() : 0u; }
};

} // {tg::TrueType}

//! \}
//! \endcond

#endif // TTGLYPH_TRUETYPE_TTDEFS_P_H_INCLUDED
