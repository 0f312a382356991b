// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_MATRIX_H_INCLUDED
#define TTGLYPH_MATRIX_H_INCLUDED

#include <ttglyph/core/geometry.h>

//! \addtogroup tg_geometry
//! \{

//! 2D matrix represents an affine transformation matrix that can be used to transform path vertices.
//!
//! The matrix layout is:
//!
//! ```
//!   [m00 m01]
//!   [m10 m11]
//!   [m20 m21]
//! ```
//!
//! where the last row is a translation part.
struct TGMatrix2D {
  double m00;
  double m01;
  double m10;
  double m11;
  double m20;
  double m21;

  TG_INLINE_NODEBUG TGMatrix2D() noexcept = default;
  TG_INLINE_CONSTEXPR TGMatrix2D(const TGMatrix2D& src) noexcept = default;

  TG_INLINE_CONSTEXPR TGMatrix2D(double m00_value, double m01_value, double m10_value, double m11_value, double m20_value, double m21_value) noexcept
    : m00(m00_value), m01(m01_value),
      m10(m10_value), m11(m11_value),
      m20(m20_value), m21(m21_value) {}

  TG_INLINE_NODEBUG TGMatrix2D& operator=(const TGMatrix2D& other) noexcept = default;

  //! \name Static Constructors
  //! \{

  //! Creates a new matrix initialized to identity.
  [[nodiscard]]
  static TG_INLINE_CONSTEXPR TGMatrix2D make_identity() noexcept { return TGMatrix2D(1.0, 0.0, 0.0, 1.0, 0.0, 0.0); }

  //! Creates a new matrix initialized to uniform scaling by `xy`.
  [[nodiscard]]
  static TG_INLINE_CONSTEXPR TGMatrix2D make_scaling(double xy) noexcept { return TGMatrix2D(xy, 0.0, 0.0, xy, 0.0, 0.0); }

  //! Creates a new matrix initialized to scaling by `x` and `y`.
  [[nodiscard]]
  static TG_INLINE_CONSTEXPR TGMatrix2D make_scaling(double x, double y) noexcept { return TGMatrix2D(x, 0.0, 0.0, y, 0.0, 0.0); }

  //! Creates a new matrix initialized to translation by `x` and `y`.
  [[nodiscard]]
  static TG_INLINE_CONSTEXPR TGMatrix2D make_translation(double x, double y) noexcept { return TGMatrix2D(1.0, 0.0, 0.0, 1.0, x, y); }

  //! \}

  //! \name Accessors
  //! \{

  [[nodiscard]]
  TG_INLINE_NODEBUG bool is_identity() const noexcept {
    return m00 == 1.0 && m01 == 0.0 && m10 == 0.0 && m11 == 1.0 && m20 == 0.0 && m21 == 0.0;
  }

  //! \}

  //! \name Map
  //! \{

  [[nodiscard]]
  TG_INLINE_NODEBUG TGPoint map_point(double x, double y) const noexcept {
    return TGPoint(x * m00 + y * m10 + m20, x * m01 + y * m11 + m21);
  }

  [[nodiscard]]
  TG_INLINE_NODEBUG TGPoint map_point(const TGPoint& p) const noexcept { return map_point(p.x, p.y); }

  //! \}
};

//! \}

#endif // TTGLYPH_MATRIX_H_INCLUDED
