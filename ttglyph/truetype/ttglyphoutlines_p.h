// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_TRUETYPE_TTGLYPHOUTLINES_P_H_INCLUDED
#define TTGLYPH_TRUETYPE_TTGLYPHOUTLINES_P_H_INCLUDED

#include <ttglyph/truetype/ttdefs_p.h>
#include <ttglyph/truetype/ttglyphcache_p.h>
#include <ttglyph/truetype/ttglyphoutlines.h>

//! \cond INTERNAL
//! \addtogroup tg_truetype_impl
//! \{

namespace tg::TrueType {

//! Loaded state of `TGTrueTypeGlyphOutlines`.
struct GlyphOutlinesImpl {
  FontContext ctx;
  GlyphCache cache;

  TG_INLINE GlyphOutlinesImpl() noexcept { ctx.reset(); }
};

//! Captures the font context from `info`.
TG_HIDDEN TGResult init_font_context(FontContext& ctx, const TGGlyphOutlinesCreateInfo& info) noexcept;

//! Builds a scaled outline of `glyph_id` and stores it to `out`.
//!
//! Returns \ref TG_ERROR_INVALID_GLYPH if the glyph doesn't exist. A malformed outline is not reported - the part
//! that was built is used.
TG_HIDDEN TGResult build_glyph_outline(const FontContext& ctx, TGGlyphId glyph_id, TGPath& out) noexcept;

} // {tg::TrueType}

//! \}
//! \endcond

#endif // TTGLYPH_TRUETYPE_TTGLYPHOUTLINES_P_H_INCLUDED
