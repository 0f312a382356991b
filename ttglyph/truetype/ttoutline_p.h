// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_TRUETYPE_TTOUTLINE_P_H_INCLUDED
#define TTGLYPH_TRUETYPE_TTOUTLINE_P_H_INCLUDED

#include <ttglyph/core/path.h>
#include <ttglyph/truetype/ttdefs_p.h>

//! \cond INTERNAL
//! \addtogroup tg_truetype_impl
//! \{

namespace tg::TrueType {
namespace OutlineImpl {

//! On-curve pattern of the current point and the two points that follow it.
enum class PointPattern : uint32_t {
  //! on, on - line.
  kOnOn = 0,
  //! on, off, on - quadratic curve.
  kOnOffOn = 1,
  //! on, off, off - quadratic curve ending at an implied on-curve point.
  kOnOffOff = 2,
  //! off, off - quadratic curve synthesized from the last control point.
  kOffOff = 3,
  //! off, on - quadratic curve.
  kOffOn = 4
};

//! State of the outline builder.
enum class ContourState : uint32_t {
  //! The next point that is not an end-of-contour marker starts a new contour.
  kAwaitingContourStart = 0,
  //! A contour has been started and not closed yet.
  kInContour = 1
};

[[nodiscard]]
static TG_INLINE PointPattern classify_pattern(const TGGlyphPoint& p0, const TGGlyphPoint& p1, const TGGlyphPoint& p2) noexcept {
  if (p0.on_curve) {
    if (p1.on_curve)
      return PointPattern::kOnOn;
    else
      return p2.on_curve ? PointPattern::kOnOffOn : PointPattern::kOnOffOff;
  }
  else {
    return p1.on_curve ? PointPattern::kOffOn : PointPattern::kOffOff;
  }
}

//! Returns the point in the middle of `a` and `b` (integer division truncates toward zero).
[[nodiscard]]
static TG_INLINE_CONSTEXPR int mid_value(int a, int b) noexcept { return a + (b - a) / 2; }

//! Converts classified `points` of one glyph into `path` (in font units).
//!
//! Returns \ref TG_ERROR_INVALID_DATA if the outline is malformed. In that case the error is logged and `path`
//! contains everything that was built before the malformed point was reached.
TG_HIDDEN TGResult build_path(const TGGlyphPoint* points, size_t count, TGPath& path, const char* font_name) noexcept;

} // {OutlineImpl}
} // {tg::TrueType}

//! \}
//! \endcond

#endif // TTGLYPH_TRUETYPE_TTOUTLINE_P_H_INCLUDED
