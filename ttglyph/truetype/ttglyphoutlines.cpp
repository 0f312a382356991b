// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_p.h>
#include <ttglyph/core/runtime.h>
#include <ttglyph/support/scopedbuffer_p.h>
#include <ttglyph/truetype/ttcmap_p.h>
#include <ttglyph/truetype/ttglyphoutlines_p.h>
#include <ttglyph/truetype/ttoutline_p.h>
#include <ttglyph/truetype/ttpoint_p.h>
#include <ttglyph/truetype/ttresolver_p.h>

namespace tg::TrueType {

// tg::TrueType::GlyphOutlines - Font Context
// ==========================================

static TGCidToGidMode cid_to_gid_mode_of(const TGCidFont* cid_font) noexcept {
  if (cid_font->has_identity_cid_to_gid_map())
    return TG_CID_TO_GID_MODE_IDENTITY;

  if (cid_font->has_cid_to_gid_map())
    return TG_CID_TO_GID_MODE_EXPLICIT_TABLE;

  return TG_CID_TO_GID_MODE_CMAP_DERIVED;
}

TGResult init_font_context(FontContext& ctx, const TGGlyphOutlinesCreateInfo& info) noexcept {
  ctx.reset();

  const TGFontSource* font = info.font;
  const TGFontDescriptor* descriptor = info.font_descriptor;

  if (TG_UNLIKELY(!font || !descriptor))
    return tg_make_error(TG_ERROR_INVALID_VALUE);

  if (TG_UNLIKELY(!(info.default_scale >= 0.0) || !isfinite(info.default_scale)))
    return tg_make_error(TG_ERROR_INVALID_VALUE);

  ctx.font = font;
  ctx.glyph_table = font->glyph_table();

  uint32_t units_per_em = font->units_per_em();
  if (units_per_em)
    ctx.scale = 1.0 / double(units_per_em);
  else
    ctx.scale = info.default_scale > 0.0 ? info.default_scale : kDefaultScale;

  CMapImpl::select(font, ctx.cmaps);

  const char* font_name = descriptor->base_font_name();
  ctx.font_name = font_name ? font_name : "";
  ctx.symbolic = descriptor->is_symbolic();
  ctx.encoding = descriptor->encoding();
  ctx.name_mapper = info.name_mapper;

  if (info.cid_font) {
    ctx.cid_keyed = true;
    ctx.cid_font = info.cid_font;
    ctx.cid_to_gid_mode = cid_to_gid_mode_of(info.cid_font);
    ctx.cid_cmap = descriptor->cid_cmap();
    ctx.two_byte_mappings = ctx.cid_cmap && ctx.cid_cmap->has_two_byte_mappings();
  }

  return TG_SUCCESS;
}

// tg::TrueType::GlyphOutlines - Build
// ===================================

TGResult build_glyph_outline(const FontContext& ctx, TGGlyphId glyph_id, TGPath& out) noexcept {
  const TGGlyphTable* glyph_table = ctx.glyph_table;
  const TGGlyphDescription* gd = nullptr;

  if (glyph_table && glyph_id < glyph_table->glyph_count())
    gd = glyph_table->glyph_at(glyph_id);

  if (!gd) {
    tg_runtime_log(TG_LOG_LEVEL_DEBUG, "%s: Glyph not found: %u\n", ctx.font_name, glyph_id);
    return tg_make_error(TG_ERROR_INVALID_GLYPH);
  }

  uint32_t point_count = gd->point_count();
  ScopedBufferTmp<TGGlyphPoint, 256> point_buffer;

  TGGlyphPoint* points = point_buffer.alloc(point_count);
  if (TG_UNLIKELY(!points))
    return tg_make_error(TG_ERROR_OUT_OF_MEMORY);

  PointImpl::describe(*gd, points);

  TG_PROPAGATE(out.clear());
  TGResult result = OutlineImpl::build_path(points, point_count, out, ctx.font_name);

  // A malformed outline was already logged, the partial outline is used.
  if (result != TG_SUCCESS && result != TG_ERROR_INVALID_DATA)
    return result;

  return out.transform(TGMatrix2D::make_scaling(ctx.scale));
}

} // {tg::TrueType}

// TGTrueTypeGlyphOutlines - Construction & Destruction
// ====================================================

TGTrueTypeGlyphOutlines::TGTrueTypeGlyphOutlines() noexcept
  : _impl(nullptr) {}

TGTrueTypeGlyphOutlines::~TGTrueTypeGlyphOutlines() noexcept {
  dispose();
}

// TGTrueTypeGlyphOutlines - Initialization
// ========================================

TGResult TGTrueTypeGlyphOutlines::init(const TGGlyphOutlinesCreateInfo& info) noexcept {
  using namespace tg::TrueType;

  dispose();

  if (!info.font)
    return tg_make_error(TG_ERROR_NOT_INITIALIZED);

  void* p = malloc(sizeof(GlyphOutlinesImpl));
  if (TG_UNLIKELY(!p))
    return tg_make_error(TG_ERROR_OUT_OF_MEMORY);

  GlyphOutlinesImpl* impl = new(p) GlyphOutlinesImpl();
  TGResult result = init_font_context(impl->ctx, info);

  if (TG_UNLIKELY(result != TG_SUCCESS)) {
    impl->~GlyphOutlinesImpl();
    free(impl);
    return result;
  }

  _impl = impl;
  return TG_SUCCESS;
}

void TGTrueTypeGlyphOutlines::dispose() noexcept {
  using namespace tg::TrueType;

  GlyphOutlinesImpl* impl = _impl;
  if (!impl)
    return;

  _impl = nullptr;
  impl->~GlyphOutlinesImpl();
  free(impl);
}

// TGTrueTypeGlyphOutlines - Outlines
// ==================================

TGResult TGTrueTypeGlyphOutlines::get_path_for_glyph_id(TGGlyphId glyph_id, TGPath* out) noexcept {
  using namespace tg::TrueType;

  if (TG_UNLIKELY(!out))
    return tg_make_error(TG_ERROR_INVALID_VALUE);

  TG_PROPAGATE(out->clear());

  if (!_impl)
    return tg_make_error(TG_ERROR_INVALID_GLYPH);

  GlyphCache& cache = _impl->cache;
  const TGPath* cached = cache.get(glyph_id);

  if (!cached) {
    TGPath path;
    TG_PROPAGATE(build_glyph_outline(_impl->ctx, glyph_id, path));

    // Glyphs outside of the cacheable range are built on every request.
    if (!GlyphCache::is_cacheable(glyph_id)) {
      *out = std::move(path);
      return TG_SUCCESS;
    }

    TG_PROPAGATE(cache.put(glyph_id, std::move(path)));
    cached = cache.get(glyph_id);
  }

  return out->assign_deep(*cached);
}

TGResult TGTrueTypeGlyphOutlines::get_path_for_character_code(uint32_t code, TGPath* out) noexcept {
  using namespace tg::TrueType;

  if (TG_UNLIKELY(!out))
    return tg_make_error(TG_ERROR_INVALID_VALUE);

  if (!_impl) {
    TG_PROPAGATE(out->clear());
    return tg_make_error(TG_ERROR_INVALID_GLYPH);
  }

  TGGlyphId glyph_id = ResolverImpl::resolve_with_fallback(_impl->ctx, code);
  return get_path_for_glyph_id(glyph_id, out);
}

// TGTrueTypeGlyphOutlines - Accessors
// ===================================

uint32_t TGTrueTypeGlyphOutlines::glyph_count() const noexcept {
  return _impl ? _impl->ctx.glyph_count() : 0u;
}

TGGlyphId TGTrueTypeGlyphOutlines::resolve_glyph_id(uint32_t code) const noexcept {
  return _impl ? tg::TrueType::ResolverImpl::resolve_with_fallback(_impl->ctx, code) : TGGlyphId(0);
}

double TGTrueTypeGlyphOutlines::scale() const noexcept {
  return _impl ? _impl->ctx.scale : tg::TrueType::kDefaultScale;
}

const char* TGTrueTypeGlyphOutlines::font_name() const noexcept {
  return _impl ? _impl->ctx.font_name : "";
}

bool TGTrueTypeGlyphOutlines::is_cid_font() const noexcept {
  return _impl ? _impl->ctx.cid_keyed : false;
}

TGCidToGidMode TGTrueTypeGlyphOutlines::cid_to_gid_mode() const noexcept {
  return _impl ? _impl->ctx.cid_to_gid_mode : TG_CID_TO_GID_MODE_IDENTITY;
}

uint32_t TGTrueTypeGlyphOutlines::cached_glyph_count() const noexcept {
  return _impl ? _impl->cache.size() : 0u;
}
