// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_TRUETYPE_TTPOINT_P_H_INCLUDED
#define TTGLYPH_TRUETYPE_TTPOINT_P_H_INCLUDED

#include <ttglyph/truetype/ttdefs_p.h>

//! \cond INTERNAL
//! \addtogroup tg_truetype_impl
//! \{

namespace tg::TrueType {
namespace PointImpl {

//! Classifies a single raw point - flips its y coordinate and decodes on-curve and end-of-contour flags.
[[nodiscard]]
static TG_INLINE TGGlyphPoint classify(int x, int y, uint32_t flags, bool end_of_contour) noexcept {
  return TGGlyphPoint(x, -y, (flags & TG_GLYPH_POINT_FLAG_ON_CURVE) != 0, end_of_contour);
}

//! Classifies the point at `index` of glyph description `gd`.
[[nodiscard]]
static TG_INLINE TGGlyphPoint classify(const TGGlyphDescription& gd, uint32_t index) noexcept {
  return classify(gd.x_coordinate(index), gd.y_coordinate(index), gd.flags(index), gd.is_end_of_contour(index));
}

//! Classifies all points of `gd` into `points_out`, which must have room for `gd.point_count()` points.
TG_HIDDEN void describe(const TGGlyphDescription& gd, TGGlyphPoint* points_out) noexcept;

} // {PointImpl}
} // {tg::TrueType}

//! \}
//! \endcond

#endif // TTGLYPH_TRUETYPE_TTPOINT_P_H_INCLUDED
