// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_p.h>
#include <ttglyph/truetype/ttglyphcache_p.h>

namespace tg::TrueType {

// tg::TrueType::GlyphCache - Constants
// ====================================

static constexpr uint32_t kMinimumSlotCount = 64;

// tg::TrueType::GlyphCache - Put & Reset
// ======================================

TGResult GlyphCache::put(TGGlyphId glyph_id, TGPath&& path) noexcept {
  if (TG_UNLIKELY(!is_cacheable(glyph_id)))
    return tg_make_error(TG_ERROR_INVALID_GLYPH);

  if (glyph_id >= _slot_count) {
    uint32_t slot_count = tg_max(_slot_count, kMinimumSlotCount);
    while (slot_count <= glyph_id)
      slot_count *= 2u;

    TGPath** slots = static_cast<TGPath**>(malloc(slot_count * sizeof(TGPath*)));
    if (TG_UNLIKELY(!slots))
      return tg_make_error(TG_ERROR_OUT_OF_MEMORY);

    if (_slot_count)
      memcpy(slots, _slots, _slot_count * sizeof(TGPath*));
    memset(slots + _slot_count, 0, (slot_count - _slot_count) * sizeof(TGPath*));

    free(_slots);
    _slots = slots;
    _slot_count = slot_count;
  }

  if (TG_UNLIKELY(_slots[glyph_id]))
    return tg_make_error(TG_ERROR_INVALID_STATE);

  void* p = malloc(sizeof(TGPath));
  if (TG_UNLIKELY(!p))
    return tg_make_error(TG_ERROR_OUT_OF_MEMORY);

  _slots[glyph_id] = new(p) TGPath(std::move(path));
  _size++;
  return TG_SUCCESS;
}

void GlyphCache::reset() noexcept {
  for (uint32_t i = 0; i < _slot_count; i++) {
    TGPath* path = _slots[i];
    if (path) {
      path->~TGPath();
      free(path);
    }
  }

  free(_slots);
  _slots = nullptr;
  _slot_count = 0;
  _size = 0;
}

} // {tg::TrueType}
