// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_p.h>
#include <ttglyph/core/path_p.h>

namespace tg {
namespace PathInternal {

// tg::Path - Internals - Storage
// ==============================

static TG_INLINE void init_empty(TGPathCore* self) noexcept {
  self->_vertex_data = nullptr;
  self->_command_data = nullptr;
  self->_size = 0;
  self->_capacity = 0;
}

static TG_INLINE void free_storage(TGPathCore* self) noexcept {
  // Commands live in the same block, after the vertices.
  free(self->_vertex_data);
}

static TGResult realloc_storage(TGPathCore* self, size_t capacity) noexcept {
  TG_ASSERT(capacity >= self->_size);

  void* block = malloc(impl_size_from_capacity(capacity));
  if (TG_UNLIKELY(!block))
    return tg_make_error(TG_ERROR_OUT_OF_MEMORY);

  TGPoint* vertex_data = static_cast<TGPoint*>(block);
  uint8_t* command_data = reinterpret_cast<uint8_t*>(vertex_data + capacity);

  size_t size = self->_size;
  if (size) {
    memcpy(vertex_data, self->_vertex_data, size * sizeof(TGPoint));
    memcpy(command_data, self->_command_data, size);
  }

  free_storage(self);
  self->_vertex_data = vertex_data;
  self->_command_data = command_data;
  self->_capacity = capacity;
  return TG_SUCCESS;
}

TGResult prepare_add(TGPathCore* self, size_t n, uint8_t** cmd_out, TGPoint** vtx_out) noexcept {
  size_t size = self->_size;
  size_t remaining = self->_capacity - size;

  if (TG_UNLIKELY(remaining < n)) {
    if (TG_UNLIKELY(n > kMaximumCapacity - size))
      return tg_make_error(TG_ERROR_OUT_OF_MEMORY);

    size_t capacity = expand_capacity(self->_capacity, size + n);
    if (TG_UNLIKELY(!capacity))
      return tg_make_error(TG_ERROR_OUT_OF_MEMORY);

    TG_PROPAGATE(realloc_storage(self, capacity));
  }

  *cmd_out = self->_command_data + size;
  *vtx_out = self->_vertex_data + size;
  self->_size = size + n;
  return TG_SUCCESS;
}

} // {PathInternal}
} // {tg}

// tg::Path - API - Init & Destroy
// ===============================

TG_API_IMPL TGResult tg_path_init(TGPathCore* self) noexcept {
  tg::PathInternal::init_empty(self);
  return TG_SUCCESS;
}

TG_API_IMPL TGResult tg_path_init_move(TGPathCore* self, TGPathCore* other) noexcept {
  TG_ASSERT(self != other);

  *self = *other;
  tg::PathInternal::init_empty(other);
  return TG_SUCCESS;
}

TG_API_IMPL TGResult tg_path_destroy(TGPathCore* self) noexcept {
  tg::PathInternal::free_storage(self);
  tg::PathInternal::init_empty(self);
  return TG_SUCCESS;
}

// tg::Path - API - Reset & Clear
// ==============================

TG_API_IMPL TGResult tg_path_reset(TGPathCore* self) noexcept {
  return tg_path_destroy(self);
}

TG_API_IMPL TGResult tg_path_clear(TGPathCore* self) noexcept {
  self->_size = 0;
  return TG_SUCCESS;
}

// tg::Path - API - Storage Management
// ===================================

TG_API_IMPL TGResult tg_path_reserve(TGPathCore* self, size_t n) noexcept {
  using namespace tg::PathInternal;

  if (n <= self->_capacity)
    return TG_SUCCESS;

  if (TG_UNLIKELY(n > kMaximumCapacity))
    return tg_make_error(TG_ERROR_OUT_OF_MEMORY);

  return realloc_storage(self, n);
}

// tg::Path - API - Assign
// =======================

TG_API_IMPL TGResult tg_path_assign_move(TGPathCore* self, TGPathCore* other) noexcept {
  if (self == other)
    return TG_SUCCESS;

  tg::PathInternal::free_storage(self);
  *self = *other;
  tg::PathInternal::init_empty(other);
  return TG_SUCCESS;
}

TG_API_IMPL TGResult tg_path_assign_deep(TGPathCore* self, const TGPathCore* other) noexcept {
  if (self == other)
    return TG_SUCCESS;

  size_t size = other->_size;
  self->_size = 0;
  TG_PROPAGATE(tg_path_reserve(self, size));

  if (size) {
    memcpy(self->_vertex_data, other->_vertex_data, size * sizeof(TGPoint));
    memcpy(self->_command_data, other->_command_data, size);
  }

  self->_size = size;
  return TG_SUCCESS;
}

// tg::Path - API - Path Construction
// ==================================

TG_API_IMPL TGResult tg_path_move_to(TGPathCore* self, double x0, double y0) noexcept {
  uint8_t* cmd_ptr;
  TGPoint* vtx_ptr;
  TG_PROPAGATE(tg::PathInternal::prepare_add(self, 1, &cmd_ptr, &vtx_ptr));

  cmd_ptr[0] = TG_PATH_CMD_MOVE;
  vtx_ptr[0].reset(x0, y0);
  return TG_SUCCESS;
}

TG_API_IMPL TGResult tg_path_line_to(TGPathCore* self, double x1, double y1) noexcept {
  uint8_t* cmd_ptr;
  TGPoint* vtx_ptr;
  TG_PROPAGATE(tg::PathInternal::prepare_add(self, 1, &cmd_ptr, &vtx_ptr));

  cmd_ptr[0] = TG_PATH_CMD_ON;
  vtx_ptr[0].reset(x1, y1);
  return TG_SUCCESS;
}

TG_API_IMPL TGResult tg_path_quad_to(TGPathCore* self, double x1, double y1, double x2, double y2) noexcept {
  uint8_t* cmd_ptr;
  TGPoint* vtx_ptr;
  TG_PROPAGATE(tg::PathInternal::prepare_add(self, 2, &cmd_ptr, &vtx_ptr));

  cmd_ptr[0] = TG_PATH_CMD_QUAD;
  cmd_ptr[1] = TG_PATH_CMD_ON;
  vtx_ptr[0].reset(x1, y1);
  vtx_ptr[1].reset(x2, y2);
  return TG_SUCCESS;
}

TG_API_IMPL TGResult tg_path_close(TGPathCore* self) noexcept {
  uint8_t* cmd_ptr;
  TGPoint* vtx_ptr;
  TG_PROPAGATE(tg::PathInternal::prepare_add(self, 1, &cmd_ptr, &vtx_ptr));

  cmd_ptr[0] = TG_PATH_CMD_CLOSE;
  vtx_ptr[0].reset(std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::quiet_NaN());
  return TG_SUCCESS;
}

// tg::Path - API - Transformations
// ================================

TG_API_IMPL TGResult tg_path_transform(TGPathCore* self, const TGMatrix2D* transform) noexcept {
  if (TG_UNLIKELY(!transform))
    return tg_make_error(TG_ERROR_INVALID_VALUE);

  size_t size = self->_size;
  const uint8_t* cmd_data = self->_command_data;
  TGPoint* vtx_data = self->_vertex_data;

  for (size_t i = 0; i < size; i++) {
    if (cmd_data[i] != TG_PATH_CMD_CLOSE)
      vtx_data[i] = transform->map_point(vtx_data[i]);
  }

  return TG_SUCCESS;
}

// tg::Path - API - Accessors
// ==========================

TG_API_IMPL TGResult tg_path_get_last_vertex(const TGPathCore* self, TGPoint* vtx_out) noexcept {
  size_t index = self->_size;

  vtx_out->reset();
  if (TG_UNLIKELY(!index))
    return tg_make_error(TG_ERROR_NO_MATCHING_VERTEX);

  const uint8_t* cmd_data = self->_command_data;
  uint32_t cmd = cmd_data[--index];

  if (cmd != TG_PATH_CMD_CLOSE) {
    *vtx_out = self->_vertex_data[index];
    return TG_SUCCESS;
  }

  for (;;) {
    if (index == 0)
      return tg_make_error(TG_ERROR_NO_MATCHING_VERTEX);

    cmd = cmd_data[--index];
    if (cmd == TG_PATH_CMD_CLOSE)
      return tg_make_error(TG_ERROR_NO_MATCHING_VERTEX);

    if (cmd == TG_PATH_CMD_MOVE)
      break;
  }

  *vtx_out = self->_vertex_data[index];
  return TG_SUCCESS;
}

// tg::Path - API - Equality
// =========================

TG_API_IMPL bool tg_path_equals(const TGPathCore* a, const TGPathCore* b) noexcept {
  if (a == b)
    return true;

  size_t size = a->_size;
  if (size != b->_size)
    return false;

  if (size == 0)
    return true;

  if (memcmp(a->_command_data, b->_command_data, size) != 0)
    return false;

  for (size_t i = 0; i < size; i++) {
    if (!a->_vertex_data[i].equals(b->_vertex_data[i]))
      return false;
  }

  return true;
}
