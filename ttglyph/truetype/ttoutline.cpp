// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_p.h>
#include <ttglyph/core/runtime.h>
#include <ttglyph/core/trace_p.h>
#include <ttglyph/truetype/ttoutline_p.h>

namespace tg::TrueType {
namespace OutlineImpl {

// tg::TrueType::OutlineImpl - Trace
// =================================

#if defined(TG_TRACE_TT_OUTLINE)
#define Trace TGDebugTrace
#else
#define Trace TGDummyTrace
#endif

// tg::TrueType::OutlineImpl - Utilities
// =====================================

static const char* pattern_name(PointPattern pattern) noexcept {
  switch (pattern) {
    case PointPattern::kOnOn    : return "on-on";
    case PointPattern::kOnOffOn : return "on-off-on";
    case PointPattern::kOnOffOff: return "on-off-off";
    case PointPattern::kOffOff  : return "off-off";
    case PointPattern::kOffOn   : return "off-on";
  }
  return "unknown";
}

// tg::TrueType::OutlineImpl - Builder
// ===================================

namespace {

class OutlineBuilder {
public:
  TGPath& _path;
  ContourState _state;

  //! First point of the current contour.
  TGGlyphPoint _start_point;
  //! Last quadratic control point, kept across contours.
  TGPointI _last_control;
  bool _has_last_control;

  TG_INLINE explicit OutlineBuilder(TGPath& path) noexcept
    : _path(path),
      _state(ContourState::kAwaitingContourStart),
      _start_point(0, 0, true, false),
      _last_control(0, 0),
      _has_last_control(false) {}

  TG_INLINE void set_last_control(int x, int y) noexcept {
    _last_control.reset(x, y);
    _has_last_control = true;
  }

  TG_INLINE TGResult close_if(bool end_of_contour) noexcept {
    if (!end_of_contour)
      return TG_SUCCESS;

    _state = ContourState::kAwaitingContourStart;
    return _path.close();
  }
};

} // {anonymous}

TGResult build_path(const TGGlyphPoint* points, size_t count, TGPath& path, const char* font_name) noexcept {
  Trace trace;
  trace.info("tg::TrueType::OutlineImpl::BuildPath [PointCount=%zu]\n", count);
  trace.indent();

  OutlineBuilder builder(path);
  size_t i = 0;

  while (i < count) {
    const TGGlyphPoint& p0 = points[i];
    const TGGlyphPoint& p1 = points[(i + 1) % count];
    const TGGlyphPoint& p2 = points[(i + 2) % count];

    if (builder._state == ContourState::kAwaitingContourStart) {
      // An end-of-contour marker cannot start a contour.
      if (p0.end_of_contour) {
        trace.info("#%zu Skipped end of contour [%d %d]\n", i, p0.x, p0.y);
        i++;
        continue;
      }

      trace.info("#%zu MoveTo [%d %d]\n", i, p0.x, p0.y);
      TG_PROPAGATE(path.move_to(p0.x, p0.y));

      builder._state = ContourState::kInContour;
      builder._start_point = p0;
    }

    const TGGlyphPoint& start = builder._start_point;
    PointPattern pattern = classify_pattern(p0, p1, p2);

    switch (pattern) {
      case PointPattern::kOnOn: {
        trace.info("#%zu %s LineTo [%d %d]\n", i, pattern_name(pattern), p1.x, p1.y);
        TG_PROPAGATE(path.line_to(p1.x, p1.y));
        TG_PROPAGATE(builder.close_if(p0.end_of_contour || p1.end_of_contour));

        i++;
        break;
      }

      case PointPattern::kOnOffOn: {
        // A control point that ends the contour curves back to the start point.
        const TGGlyphPoint& end = p1.end_of_contour ? start : p2;

        trace.info("#%zu %s QuadTo [%d %d] [%d %d]\n", i, pattern_name(pattern), p1.x, p1.y, end.x, end.y);
        TG_PROPAGATE(path.quad_to(p1.x, p1.y, end.x, end.y));
        TG_PROPAGATE(builder.close_if(p1.end_of_contour || p2.end_of_contour));

        builder.set_last_control(p1.x, p1.y);
        i += 2;
        break;
      }

      case PointPattern::kOnOffOff: {
        int mid_x = mid_value(p1.x, p2.x);
        int mid_y = mid_value(p1.y, p2.y);

        trace.info("#%zu %s QuadTo [%d %d] [%d %d]\n", i, pattern_name(pattern), p1.x, p1.y, mid_x, mid_y);
        TG_PROPAGATE(path.quad_to(p1.x, p1.y, mid_x, mid_y));

        if (p0.end_of_contour || p1.end_of_contour || p2.end_of_contour) {
          trace.info("#%zu %s QuadTo [%d %d] [%d %d]\n", i, pattern_name(pattern), p2.x, p2.y, start.x, start.y);
          TG_PROPAGATE(path.quad_to(p2.x, p2.y, start.x, start.y));
          TG_PROPAGATE(builder.close_if(true));
        }

        builder.set_last_control(p1.x, p1.y);
        i += 2;
        break;
      }

      case PointPattern::kOffOff: {
        if (!builder._has_last_control) {
          trace.fail("#%zu %s without a preceding control point\n", i, pattern_name(pattern));
          tg_runtime_log(TG_LOG_LEVEL_ERROR, "%s: Unknown glyph command at point %zu of %zu\n", font_name, i, count);

          trace.deindent();
          return tg_make_error(TG_ERROR_INVALID_DATA);
        }

        TGPoint last_end;
        TG_PROPAGATE(path.get_last_vertex(&last_end));

        int end_x = int(last_end.x);
        int end_y = int(last_end.y);

        builder.set_last_control(mid_value(builder._last_control.x, end_x), mid_value(builder._last_control.y, end_y));
        int mid_x = mid_value(end_x, p1.x);
        int mid_y = mid_value(end_y, p1.y);

        trace.info("#%zu %s QuadTo [%d %d] [%d %d]\n", i, pattern_name(pattern), builder._last_control.x, builder._last_control.y, mid_x, mid_y);
        TG_PROPAGATE(path.quad_to(builder._last_control.x, builder._last_control.y, mid_x, mid_y));
        TG_PROPAGATE(builder.close_if(p0.end_of_contour || p1.end_of_contour));

        i++;
        break;
      }

      case PointPattern::kOffOn: {
        trace.info("#%zu %s QuadTo [%d %d] [%d %d]\n", i, pattern_name(pattern), p0.x, p0.y, p1.x, p1.y);
        TG_PROPAGATE(path.quad_to(p0.x, p0.y, p1.x, p1.y));
        TG_PROPAGATE(builder.close_if(p0.end_of_contour || p1.end_of_contour));

        builder.set_last_control(p0.x, p0.y);
        i++;
        break;
      }
    }
  }

  trace.deindent();
  return TG_SUCCESS;
}

} // {OutlineImpl}
} // {tg::TrueType}
