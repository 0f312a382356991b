// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_TRUETYPE_TTGLYPHCACHE_P_H_INCLUDED
#define TTGLYPH_TRUETYPE_TTGLYPHCACHE_P_H_INCLUDED

#include <ttglyph/core/path.h>
#include <ttglyph/truetype/ttdefs_p.h>

//! \cond INTERNAL
//! \addtogroup tg_truetype_impl
//! \{

namespace tg::TrueType {

//! Glyph outline cache - maps glyph indexes to scaled outlines.
//!
//! Slots are indexed directly by glyph index (TrueType fonts have at most 65535 glyphs) and grow on demand. Each
//! populated slot owns a heap allocated `TGPath`, which is never modified after it was inserted.
class GlyphCache {
public:
  TG_NONCOPYABLE(GlyphCache)

  //! Glyph ids at or above this value are never cached (outside of the 16-bit TrueType glyph space).
  static constexpr uint32_t kMaximumSlotCount = 0x10000u;

  //! Slot array, null slots are not populated.
  TGPath** _slots;
  //! Number of slots in `_slots`.
  uint32_t _slot_count;
  //! Number of populated slots.
  uint32_t _size;

  TG_INLINE GlyphCache() noexcept
    : _slots(nullptr),
      _slot_count(0),
      _size(0) {}

  TG_INLINE ~GlyphCache() noexcept { reset(); }

  [[nodiscard]]
  TG_INLINE bool is_empty() const noexcept { return _size == 0; }

  [[nodiscard]]
  TG_INLINE uint32_t size() const noexcept { return _size; }

  [[nodiscard]]
  static TG_INLINE bool is_cacheable(TGGlyphId glyph_id) noexcept { return glyph_id < kMaximumSlotCount; }

  //! Returns the cached outline of `glyph_id` or null if it's not cached.
  [[nodiscard]]
  TG_INLINE const TGPath* get(TGGlyphId glyph_id) const noexcept {
    return glyph_id < _slot_count ? _slots[glyph_id] : nullptr;
  }

  //! Inserts `path` as an outline of `glyph_id` (takes ownership of its content).
  //!
  //! Returns \ref TG_ERROR_INVALID_STATE if `glyph_id` is already cached and \ref TG_ERROR_INVALID_GLYPH if
  //! `glyph_id` is not cacheable.
  TG_HIDDEN TGResult put(TGGlyphId glyph_id, TGPath&& path) noexcept;

  //! Releases all cached outlines and the slot array.
  TG_HIDDEN void reset() noexcept;
};

} // {tg::TrueType}

//! \}
//! \endcond

#endif // TTGLYPH_TRUETYPE_TTGLYPHCACHE_P_H_INCLUDED
