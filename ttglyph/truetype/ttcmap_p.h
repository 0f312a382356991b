// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_TRUETYPE_TTCMAP_P_H_INCLUDED
#define TTGLYPH_TRUETYPE_TTCMAP_P_H_INCLUDED

#include <ttglyph/truetype/ttdefs_p.h>

//! \cond INTERNAL
//! \addtogroup tg_truetype_impl
//! \{

namespace tg::TrueType {
namespace CMapImpl {

//! Role of a code table.
enum class TableRole : uint32_t {
  kNone = 0,
  kWinUnicode = 1,
  kWinSymbol = 2,
  kMacSymbol = 3
};

//! Classifies a table by its platform and encoding IDs.
[[nodiscard]]
TG_HIDDEN TableRole role_of(uint32_t platform_id, uint32_t encoding_id) noexcept;

//! Selects Windows Unicode, Windows Symbol, and Macintosh Symbol tables of `font`. When more tables share the same
//! platform and encoding the last one wins.
TG_HIDDEN void select(const TGFontSource* font, CMapSelection& out) noexcept;

} // {CMapImpl}
} // {tg::TrueType}

//! \}
//! \endcond

#endif // TTGLYPH_TRUETYPE_TTCMAP_P_H_INCLUDED
