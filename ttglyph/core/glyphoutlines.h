// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_GLYPHOUTLINES_H_INCLUDED
#define TTGLYPH_GLYPHOUTLINES_H_INCLUDED

#include <ttglyph/core/fontsource.h>
#include <ttglyph/core/path.h>

//! \addtogroup tg_text
//! \{

//! \name TGGlyphOutlines - Structs
//! \{

//! Information used to initialize glyph outlines of a font.
struct TGGlyphOutlinesCreateInfo {
  //! Font program that provides code tables and glyph outlines [required].
  const TGFontSource* font;
  //! Font dictionary of the document [required].
  const TGFontDescriptor* font_descriptor;
  //! Descendant font of a composite font, null for simple fonts. Makes the font CID-keyed when set.
  const TGCidFont* cid_font;
  //! Glyph name converter used by simple fonts that have an encoding.
  const TGGlyphNameMapper* name_mapper;
  //! Scale used when the font doesn't specify units per em, zero means the default scale (0.001).
  double default_scale;

  TG_INLINE_NODEBUG void reset() noexcept { *this = TGGlyphOutlinesCreateInfo{}; }
};

//! \}

//! \name TGGlyphOutlines - C++ API
//! \{

//! Glyph outlines - provides scalable outlines of glyphs of a single font.
//!
//! Outlines are returned in em units (the font's units per em map to 1.0) with y axis pointing down.
//!
//! \note Glyph outlines are not thread-safe, a single instance must not be used by more threads concurrently.
class TGGlyphOutlines {
public:
  virtual ~TGGlyphOutlines() noexcept = default;

  //! Stores the outline of `glyph_id` to `out`.
  //!
  //! Returns \ref TG_ERROR_INVALID_GLYPH and clears `out` if the font has no such glyph. A glyph that has no
  //! contours is not an error - `out` would be empty in that case.
  virtual TGResult get_path_for_glyph_id(TGGlyphId glyph_id, TGPath* out) noexcept = 0;

  //! Stores the outline of a glyph that represents character `code` to `out`.
  virtual TGResult get_path_for_character_code(uint32_t code, TGPath* out) noexcept = 0;

  //! Returns the number of glyphs of the font or zero if no font is loaded.
  [[nodiscard]]
  virtual uint32_t glyph_count() const noexcept = 0;

  //! Releases all references to the font and clears all cached outlines.
  virtual void dispose() noexcept = 0;
};

//! \}

//! \}

#endif // TTGLYPH_GLYPHOUTLINES_H_INCLUDED
