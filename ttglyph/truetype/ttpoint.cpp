// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_p.h>
#include <ttglyph/truetype/ttpoint_p.h>

namespace tg::TrueType {
namespace PointImpl {

// tg::TrueType::PointImpl - Describe
// ==================================

void describe(const TGGlyphDescription& gd, TGGlyphPoint* points_out) noexcept {
  uint32_t point_count = gd.point_count();

  for (uint32_t i = 0; i < point_count; i++)
    points_out[i] = classify(gd, i);
}

} // {PointImpl}
} // {tg::TrueType}
