// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef TTGLYPH_PATH_H_INCLUDED
#define TTGLYPH_PATH_H_INCLUDED

#include <ttglyph/core/geometry.h>
#include <ttglyph/core/matrix.h>

//! \addtogroup tg_geometry
//! \{

//! \name TGPath - Constants
//! \{

//! Path command.
TG_DEFINE_ENUM(TGPathCmd) {
  //! Move-to command (starts a new figure).
  TG_PATH_CMD_MOVE = 0,
  //! On-path command (interpreted as line-to or the end of a curve).
  TG_PATH_CMD_ON = 1,
  //! Quad-to control point.
  TG_PATH_CMD_QUAD = 2,
  //! Close path.
  TG_PATH_CMD_CLOSE = 3,

  //! Maximum value of `TGPathCmd`.
  TG_PATH_CMD_MAX_VALUE = 3
};

//! \}

//! \name TGPath - C API
//! \{

//! 2D vector path [C API].
//!
//! Commands and vertices are stored in two parallel arrays of the same size. Close commands store a NaN vertex.
struct TGPathCore {
  //! Vertex data (`_size` vertices).
  TGPoint* _vertex_data;
  //! Command data (`_size` commands).
  uint8_t* _command_data;
  //! Number of commands / vertices.
  size_t _size;
  //! Capacity of both arrays.
  size_t _capacity;
};

TG_BEGIN_C_DECLS

TG_API TGResult TG_CDECL tg_path_init(TGPathCore* self) noexcept;
TG_API TGResult TG_CDECL tg_path_init_move(TGPathCore* self, TGPathCore* other) noexcept;
TG_API TGResult TG_CDECL tg_path_destroy(TGPathCore* self) noexcept;
TG_API TGResult TG_CDECL tg_path_reset(TGPathCore* self) noexcept;
TG_API TGResult TG_CDECL tg_path_clear(TGPathCore* self) noexcept;
TG_API TGResult TG_CDECL tg_path_reserve(TGPathCore* self, size_t n) noexcept;
TG_API TGResult TG_CDECL tg_path_assign_move(TGPathCore* self, TGPathCore* other) noexcept;
TG_API TGResult TG_CDECL tg_path_assign_deep(TGPathCore* self, const TGPathCore* other) noexcept;
TG_API TGResult TG_CDECL tg_path_move_to(TGPathCore* self, double x0, double y0) noexcept;
TG_API TGResult TG_CDECL tg_path_line_to(TGPathCore* self, double x1, double y1) noexcept;
TG_API TGResult TG_CDECL tg_path_quad_to(TGPathCore* self, double x1, double y1, double x2, double y2) noexcept;
TG_API TGResult TG_CDECL tg_path_close(TGPathCore* self) noexcept;
TG_API TGResult TG_CDECL tg_path_transform(TGPathCore* self, const TGMatrix2D* transform) noexcept;
TG_API TGResult TG_CDECL tg_path_get_last_vertex(const TGPathCore* self, TGPoint* vtx_out) noexcept;
TG_API bool     TG_CDECL tg_path_equals(const TGPathCore* a, const TGPathCore* b) noexcept;

TG_END_C_DECLS

//! \}

//! \name TGPath - C++ API
//! \{

//! 2D vector path [C++ API].
//!
//! Unlike most value types the path is move-only: copying requires allocation, which can fail, so a copy must be
//! made explicitly by `assign_deep()`, which reports `TG_ERROR_OUT_OF_MEMORY`.
class TGPath : public TGPathCore {
public:
  //! \name Construction & Destruction
  //! \{

  TG_INLINE_NODEBUG TGPath() noexcept { tg_path_init(this); }
  TG_INLINE_NODEBUG TGPath(TGPath&& other) noexcept { tg_path_init_move(this, &other); }
  TG_INLINE_NODEBUG ~TGPath() noexcept { tg_path_destroy(this); }

  TGPath(const TGPath& other) = delete;
  TGPath& operator=(const TGPath& other) = delete;

  //! \}

  //! \name Overloaded Operators
  //! \{

  TG_INLINE_NODEBUG explicit operator bool() const noexcept { return !is_empty(); }

  TG_INLINE_NODEBUG TGPath& operator=(TGPath&& other) noexcept { tg_path_assign_move(this, &other); return *this; }

  [[nodiscard]]
  TG_INLINE_NODEBUG bool operator==(const TGPath& other) const noexcept { return  equals(other); }

  [[nodiscard]]
  TG_INLINE_NODEBUG bool operator!=(const TGPath& other) const noexcept { return !equals(other); }

  //! \}

  //! \name Common Functionality
  //! \{

  //! Clears the content of the path and releases its data.
  TG_INLINE_NODEBUG TGResult reset() noexcept { return tg_path_reset(this); }

  //! Clears the content of the path without releasing its data.
  TG_INLINE_NODEBUG TGResult clear() noexcept { return tg_path_clear(this); }

  TG_INLINE_NODEBUG void swap(TGPath& other) noexcept {
    TGPathCore tmp = *static_cast<TGPathCore*>(this);
    *static_cast<TGPathCore*>(this) = other;
    *static_cast<TGPathCore*>(&other) = tmp;
  }

  //! Copies the content of `other` into this path (deep copy).
  TG_INLINE_NODEBUG TGResult assign_deep(const TGPath& other) noexcept { return tg_path_assign_deep(this, &other); }

  [[nodiscard]]
  TG_INLINE_NODEBUG bool equals(const TGPath& other) const noexcept { return tg_path_equals(this, &other); }

  //! \}

  //! \name Accessors
  //! \{

  //! Tests whether the path is empty, which means its size equals to zero.
  [[nodiscard]]
  TG_INLINE_NODEBUG bool is_empty() const noexcept { return _size == 0; }

  //! Returns the size of the path (number of commands / vertices).
  [[nodiscard]]
  TG_INLINE_NODEBUG size_t size() const noexcept { return _size; }

  [[nodiscard]]
  TG_INLINE_NODEBUG size_t capacity() const noexcept { return _capacity; }

  [[nodiscard]]
  TG_INLINE_NODEBUG const TGPoint* vertex_data() const noexcept { return _vertex_data; }

  [[nodiscard]]
  TG_INLINE_NODEBUG const uint8_t* command_data() const noexcept { return _command_data; }

  //! Returns the command at `index`.
  [[nodiscard]]
  TG_INLINE_NODEBUG uint32_t command_at(size_t index) const noexcept {
    TG_ASSERT(index < _size);
    return _command_data[index];
  }

  //! Returns the vertex at `index`.
  [[nodiscard]]
  TG_INLINE_NODEBUG const TGPoint& vertex_at(size_t index) const noexcept {
    TG_ASSERT(index < _size);
    return _vertex_data[index];
  }

  //! Retrieves the last vertex of the path and stores it to `vtx_out`. If the last command is close, the vertex of
  //! the last move-to command is returned, which is the current point after the figure was closed.
  TG_INLINE_NODEBUG TGResult get_last_vertex(TGPoint* vtx_out) const noexcept {
    return tg_path_get_last_vertex(this, vtx_out);
  }

  //! \}

  //! \name Path Construction
  //! \{

  //! Reserves the capacity of the path for at least `n` vertices and commands.
  TG_INLINE_NODEBUG TGResult reserve(size_t n) noexcept { return tg_path_reserve(this, n); }

  //! Moves to `p0`, which starts a new figure.
  TG_INLINE_NODEBUG TGResult move_to(const TGPoint& p0) noexcept { return tg_path_move_to(this, p0.x, p0.y); }
  //! \overload
  TG_INLINE_NODEBUG TGResult move_to(double x0, double y0) noexcept { return tg_path_move_to(this, x0, y0); }

  //! Adds line to `p1`.
  TG_INLINE_NODEBUG TGResult line_to(const TGPoint& p1) noexcept { return tg_path_line_to(this, p1.x, p1.y); }
  //! \overload
  TG_INLINE_NODEBUG TGResult line_to(double x1, double y1) noexcept { return tg_path_line_to(this, x1, y1); }

  //! Adds a quadratic curve to `p1` and `p2`.
  TG_INLINE_NODEBUG TGResult quad_to(const TGPoint& p1, const TGPoint& p2) noexcept { return tg_path_quad_to(this, p1.x, p1.y, p2.x, p2.y); }
  //! \overload
  TG_INLINE_NODEBUG TGResult quad_to(double x1, double y1, double x2, double y2) noexcept { return tg_path_quad_to(this, x1, y1, x2, y2); }

  //! Closes the current figure.
  TG_INLINE_NODEBUG TGResult close() noexcept { return tg_path_close(this); }

  //! \}

  //! \name Transformations
  //! \{

  //! Transforms all vertices of the path by `transform`.
  TG_INLINE_NODEBUG TGResult transform(const TGMatrix2D& transform) noexcept { return tg_path_transform(this, &transform); }

  //! \}
};

//! \}

//! \}

#endif // TTGLYPH_PATH_H_INCLUDED
