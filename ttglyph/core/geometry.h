// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_GEOMETRY_H_INCLUDED
#define TTGLYPH_GEOMETRY_H_INCLUDED

#include <ttglyph/core/api.h>

//! \addtogroup tg_geometry
//! \{

//! Point specified as [x, y] using `int` as a storage type.
struct TGPointI {
  int x;
  int y;

  TG_INLINE_NODEBUG TGPointI() noexcept = default;
  TG_INLINE_CONSTEXPR TGPointI(const TGPointI&) noexcept = default;

  TG_INLINE_CONSTEXPR TGPointI(int x, int y) noexcept
    : x(x),
      y(y) {}

  TG_INLINE_NODEBUG TGPointI& operator=(const TGPointI& other) noexcept = default;

  [[nodiscard]]
  TG_INLINE_NODEBUG bool operator==(const TGPointI& other) const noexcept { return  equals(other); }

  [[nodiscard]]
  TG_INLINE_NODEBUG bool operator!=(const TGPointI& other) const noexcept { return !equals(other); }

  TG_INLINE_NODEBUG void reset() noexcept { reset(0, 0); }
  TG_INLINE_NODEBUG void reset(int x_value, int y_value) noexcept {
    x = x_value;
    y = y_value;
  }

  [[nodiscard]]
  TG_INLINE_NODEBUG bool equals(const TGPointI& other) const noexcept {
    return x == other.x && y == other.y;
  }
};

//! Point specified as [x, y] using `double` as a storage type.
struct TGPoint {
  double x;
  double y;

  TG_INLINE_NODEBUG TGPoint() noexcept = default;
  TG_INLINE_CONSTEXPR TGPoint(const TGPoint&) noexcept = default;

  TG_INLINE_CONSTEXPR TGPoint(const TGPointI& other) noexcept
    : x(other.x),
      y(other.y) {}

  TG_INLINE_CONSTEXPR TGPoint(double x, double y) noexcept
    : x(x),
      y(y) {}

  TG_INLINE_NODEBUG TGPoint& operator=(const TGPoint& other) noexcept = default;

  [[nodiscard]]
  TG_INLINE_NODEBUG bool operator==(const TGPoint& other) const noexcept { return  equals(other); }

  [[nodiscard]]
  TG_INLINE_NODEBUG bool operator!=(const TGPoint& other) const noexcept { return !equals(other); }

  TG_INLINE_NODEBUG void reset() noexcept { reset(0, 0); }
  TG_INLINE_NODEBUG void reset(const TGPoint& other) noexcept { reset(other.x, other.y); }
  TG_INLINE_NODEBUG void reset(double x_value, double y_value) noexcept {
    x = x_value;
    y = y_value;
  }

  //! Tests whether this point equals `other` - NaN values are considered equal.
  [[nodiscard]]
  TG_INLINE_NODEBUG bool equals(const TGPoint& other) const noexcept {
    return (x == other.x || (x != x && other.x != other.x)) &&
           (y == other.y || (y != y && other.y != other.y));
  }
};

//! \}

#endif // TTGLYPH_GEOMETRY_H_INCLUDED
