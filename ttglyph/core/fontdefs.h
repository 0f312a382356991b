// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_FONTDEFS_H_INCLUDED
#define TTGLYPH_FONTDEFS_H_INCLUDED

#include <ttglyph/core/api.h>

//! \addtogroup tg_text
//! \{

//! \name Font Constants
//! \{

//! Platform ID used by TrueType 'cmap' tables.
TG_DEFINE_ENUM(TGFontPlatformId) {
  //! Unicode platform.
  TG_FONT_PLATFORM_ID_UNICODE = 0,
  //! Macintosh platform.
  TG_FONT_PLATFORM_ID_MAC = 1,
  //! ISO platform [deprecated].
  TG_FONT_PLATFORM_ID_ISO = 2,
  //! Windows platform.
  TG_FONT_PLATFORM_ID_WINDOWS = 3,
  //! Custom platform.
  TG_FONT_PLATFORM_ID_CUSTOM = 4,

  //! Maximum value of `TGFontPlatformId`.
  TG_FONT_PLATFORM_ID_MAX_VALUE = 4
};

//! Windows platform encoding ID.
TG_DEFINE_ENUM(TGFontWindowsEncodingId) {
  //! Symbol encoding (glyphs usually mapped to 0xF000..0xF0FF).
  TG_FONT_WINDOWS_ENCODING_ID_SYMBOL = 0,
  //! Unicode BMP (UCS-2) encoding.
  TG_FONT_WINDOWS_ENCODING_ID_UCS2 = 1,
  //! Unicode full repertoire (UCS-4) encoding.
  TG_FONT_WINDOWS_ENCODING_ID_UCS4 = 10
};

//! Macintosh platform encoding ID.
TG_DEFINE_ENUM(TGFontMacEncodingId) {
  //! Roman encoding, used by symbolic fonts as a byte to glyph table.
  TG_FONT_MAC_ENCODING_ID_ROMAN = 0
};

//! Describes how a CID-keyed font maps CIDs to glyph indexes.
TG_DEFINE_ENUM(TGCidToGidMode) {
  //! CID is the glyph index.
  TG_CID_TO_GID_MODE_IDENTITY = 0,
  //! CID is mapped through an explicit CID to GID table of the CID font.
  TG_CID_TO_GID_MODE_EXPLICIT_TABLE = 1,
  //! CID is mapped through the font's CMap to a Unicode value, which is used as glyph index.
  TG_CID_TO_GID_MODE_CMAP_DERIVED = 2,

  //! Maximum value of `TGCidToGidMode`.
  TG_CID_TO_GID_MODE_MAX_VALUE = 2
};

//! Flags of a raw TrueType outline point.
TG_DEFINE_ENUM(TGGlyphPointFlags) {
  //! Point is on the curve (otherwise it's a quadratic control point).
  TG_GLYPH_POINT_FLAG_ON_CURVE = 0x01u
};

//! \}

//! \name Font Data
//! \{

//! Classified outline point of a TrueType glyph.
//!
//! The y coordinate is already flipped (negated), so the outline uses a y-down coordinate system.
struct TGGlyphPoint {
  int x;
  int y;
  bool on_curve;
  bool end_of_contour;

  TG_INLINE_NODEBUG TGGlyphPoint() noexcept = default;
  TG_INLINE_CONSTEXPR TGGlyphPoint(const TGGlyphPoint&) noexcept = default;

  TG_INLINE_CONSTEXPR TGGlyphPoint(int x_value, int y_value, bool on_curve_value, bool end_of_contour_value) noexcept
    : x(x_value),
      y(y_value),
      on_curve(on_curve_value),
      end_of_contour(end_of_contour_value) {}

  TG_INLINE_NODEBUG TGGlyphPoint& operator=(const TGGlyphPoint& other) noexcept = default;

  [[nodiscard]]
  TG_INLINE_NODEBUG bool operator==(const TGGlyphPoint& other) const noexcept {
    return x == other.x && y == other.y && on_curve == other.on_curve && end_of_contour == other.end_of_contour;
  }

  [[nodiscard]]
  TG_INLINE_NODEBUG bool operator!=(const TGGlyphPoint& other) const noexcept { return !operator==(other); }
};

//! \}

//! \}

#endif // TTGLYPH_FONTDEFS_H_INCLUDED
