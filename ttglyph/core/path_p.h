// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_PATH_P_H_INCLUDED
#define TTGLYPH_PATH_P_H_INCLUDED

#include <ttglyph/core/api-internal_p.h>
#include <ttglyph/core/path.h>

//! \cond INTERNAL
//! \addtogroup tg_internal
//! \{

namespace tg {
namespace PathInternal {

//! \name TGPath - Internals - Capacity
//! \{

//! Minimum capacity of a path that had to allocate.
static constexpr size_t kMinimumCapacity = 16;

//! Maximum capacity that can be represented by `impl_size_from_capacity()` without overflow.
static constexpr size_t kMaximumCapacity = (std::numeric_limits<size_t>::max() / 2u) / (sizeof(TGPoint) + 1u);

static TG_INLINE_CONSTEXPR size_t capacity_from_impl_size(size_t impl_size) noexcept {
  return impl_size / (sizeof(TGPoint) + 1);
}

static TG_INLINE_CONSTEXPR size_t impl_size_from_capacity(size_t capacity) noexcept {
  return capacity * (sizeof(TGPoint) + 1);
}

//! Returns a grown capacity that is able to hold at least `min_capacity` items, or zero on overflow.
static TG_INLINE size_t expand_capacity(size_t old_capacity, size_t min_capacity) noexcept {
  if (TG_UNLIKELY(min_capacity > kMaximumCapacity))
    return 0;

  size_t capacity = tg_max(old_capacity, kMinimumCapacity);
  while (capacity < min_capacity) {
    // Doubles up to 64kB worth of items, then grows by a quarter.
    if (capacity < 65536u / sizeof(TGPoint))
      capacity *= 2u;
    else
      capacity += capacity / 4u;
  }

  return tg_min(capacity, kMaximumCapacity);
}

//! \}

//! \name TGPath - Internals - Append
//! \{

//! Grows the path by `n` items and provides pointers to the first new command and vertex.
TG_HIDDEN TGResult prepare_add(TGPathCore* self, size_t n, uint8_t** cmd_out, TGPoint** vtx_out) noexcept;

//! \}

} // {PathInternal}
} // {tg}

//! \}
//! \endcond

#endif // TTGLYPH_PATH_P_H_INCLUDED
