// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_TRUETYPE_TTRESOLVER_P_H_INCLUDED
#define TTGLYPH_TRUETYPE_TTRESOLVER_P_H_INCLUDED

#include <ttglyph/truetype/ttdefs_p.h>

//! \cond INTERNAL
//! \addtogroup tg_truetype_impl
//! \{

namespace tg::TrueType {
namespace ResolverImpl {

//! Resolves `code` of a CID-keyed font to a glyph index by using the CID to GID mode of `ctx`.
[[nodiscard]]
TG_HIDDEN TGGlyphId get_gid(const FontContext& ctx, uint32_t code) noexcept;

//! Resolves `code` to a glyph index by using the code tables of the font, returns zero if `code` is not mapped.
[[nodiscard]]
TG_HIDDEN TGGlyphId resolve_simple(const FontContext& ctx, uint32_t code) noexcept;

//! Resolves `code` to a glyph index, falling back to `code` itself or to the first code point that the CID CMap
//! maps `code` to when the code tables don't map it.
[[nodiscard]]
TG_HIDDEN TGGlyphId resolve_with_fallback(const FontContext& ctx, uint32_t code) noexcept;

} // {ResolverImpl}
} // {tg::TrueType}

//! \}
//! \endcond

#endif // TTGLYPH_TRUETYPE_TTRESOLVER_P_H_INCLUDED
