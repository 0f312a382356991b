// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_TRUETYPE_TTGLYPHOUTLINES_H_INCLUDED
#define TTGLYPH_TRUETYPE_TTGLYPHOUTLINES_H_INCLUDED

#include <ttglyph/core/glyphoutlines.h>

//! \cond INTERNAL
namespace tg::TrueType { struct GlyphOutlinesImpl; }
//! \endcond

//! \addtogroup tg_truetype
//! \{

//! Glyph outlines of an embedded TrueType font.
//!
//! Resolves character codes of a simple or CID-keyed font to glyph indexes and converts TrueType contours into
//! `TGPath` outlines, which are cached by glyph index. Every call returns an independent copy of the cached path.
//!
//! An instance that was not initialized, or that was disposed, behaves as if the font had no glyphs.
class TGTrueTypeGlyphOutlines final : public TGGlyphOutlines {
public:
  //! \name Construction & Destruction
  //! \{

  TG_API TGTrueTypeGlyphOutlines() noexcept;
  TG_API ~TGTrueTypeGlyphOutlines() noexcept override;

  TGTrueTypeGlyphOutlines(const TGTrueTypeGlyphOutlines& other) = delete;
  TGTrueTypeGlyphOutlines& operator=(const TGTrueTypeGlyphOutlines& other) = delete;

  //! \}

  //! \name Initialization
  //! \{

  //! Initializes glyph outlines from `info`, disposing the previous state first.
  //!
  //! Returns \ref TG_ERROR_NOT_INITIALIZED if `info` has no font, in that case the object stays empty.
  TG_API TGResult init(const TGGlyphOutlinesCreateInfo& info) noexcept;

  [[nodiscard]]
  TG_INLINE_NODEBUG bool is_initialized() const noexcept { return _impl != nullptr; }

  //! \}

  //! \name TGGlyphOutlines Interface
  //! \{

  TG_API TGResult get_path_for_glyph_id(TGGlyphId glyph_id, TGPath* out) noexcept override;
  TG_API TGResult get_path_for_character_code(uint32_t code, TGPath* out) noexcept override;
  TG_API uint32_t glyph_count() const noexcept override;
  TG_API void dispose() noexcept override;

  //! \}

  //! \name Accessors
  //! \{

  //! Resolves `code` to a glyph index without building its outline. Returns zero if nothing is loaded.
  [[nodiscard]]
  TG_API TGGlyphId resolve_glyph_id(uint32_t code) const noexcept;

  //! Returns the scale that converts font units to em units.
  [[nodiscard]]
  TG_API double scale() const noexcept;

  //! Returns the font name (base font name of the font descriptor), never null.
  [[nodiscard]]
  TG_API const char* font_name() const noexcept;

  [[nodiscard]]
  TG_API bool is_cid_font() const noexcept;

  [[nodiscard]]
  TG_API TGCidToGidMode cid_to_gid_mode() const noexcept;

  //! Returns the number of cached outlines.
  [[nodiscard]]
  TG_API uint32_t cached_glyph_count() const noexcept;

  //! \}

private:
  tg::TrueType::GlyphOutlinesImpl* _impl;
};

//! \}

#endif // TTGLYPH_TRUETYPE_TTGLYPHOUTLINES_H_INCLUDED
