/**
 * @file transform.cpp
 * @brief Camera transform engine implementation
 */

#include "cinecut/transform.hpp"

#include <algorithm>
#include <cmath>

#include "cinecut/config.hpp"
#include "cinecut/easing.hpp"
#include "cinecut/timeline.hpp"

namespace cinecut {

SmoothingParams SmoothingParams::from_config() {
  SmoothingParams p;
  p.factor = Config::smoothing_factor();
  p.dead_zone = Config::dead_zone_px();
  p.window = Config::smoothing_window_sec();
  return p;
}

int find_last_event_index(const std::vector<MouseEvent> &events, double t) {
  int left = 0;
  int right = static_cast<int>(events.size()) - 1;
  int result = -1;

  while (left <= right) {
    int mid = left + (right - left) / 2;
    if (events[mid].timestamp <= t) {
      result = mid;
      left = mid + 1;
    } else {
      right = mid - 1;
    }
  }
  return result;
}

std::optional<Point> smoothed_mouse_position(const std::vector<MouseEvent> &events,
                                             double t,
                                             const SmoothingParams &params) {
  const int end_index = find_last_event_index(events, t);
  if (end_index < 0)
    return std::nullopt;

  /// Rebuild the average over the trailing window
  const double window_start = std::max(0.0, t - params.window);
  int start_index = find_last_event_index(events, window_start);
  if (start_index < 0)
    start_index = 0;

  double sx = events[start_index].x;
  double sy = events[start_index].y;

  for (int i = start_index + 1; i <= end_index; ++i) {
    const double dx = events[i].x - sx;
    const double dy = events[i].y - sy;
    const double distance = std::sqrt(dx * dx + dy * dy);

    /// Dead zone: damp the response to jitter
    const double rate =
        distance > params.dead_zone ? params.factor : params.factor * 0.3;
    sx = lerp(sx, events[i].x, rate);
    sy = lerp(sy, events[i].y, rate);
  }

  /// Sub-sample interpolation toward the next event
  const size_t next = static_cast<size_t>(end_index) + 1;
  if (next < events.size()) {
    const MouseEvent &last = events[end_index];
    const MouseEvent &upcoming = events[next];
    const double gap = upcoming.timestamp - last.timestamp;
    if (gap > 0) {
      const double progress = (t - last.timestamp) / gap;
      const double fx = lerp(sx, upcoming.x, params.factor);
      const double fy = lerp(sy, upcoming.y, params.factor);
      return Point{lerp(sx, fx, progress), lerp(sy, fy, progress)};
    }
  }

  return Point{sx, sy};
}

PanBounds pan_bounds(const Point &origin, double zoom_level,
                     const Size &content) {
  const double k = (zoom_level - 1.0) / zoom_level;
  PanBounds b;
  b.max_tx = origin.x * content.width * k;
  b.min_tx = -(1.0 - origin.x) * content.width * k;
  b.max_ty = origin.y * content.height * k;
  b.min_ty = -(1.0 - origin.y) * content.height * k;
  return b;
}

PanOffset calculate_bounded_pan(const std::optional<Point> &mouse,
                                const Point &origin, double zoom_level,
                                const Size &recording, const Size &content) {
  if (!mouse || recording.width <= 0 || recording.height <= 0 ||
      zoom_level <= 0)
    return {};

  const double nx = mouse->x / recording.width;
  const double ny = mouse->y / recording.height;

  /// Pan that would put the cursor at the center of the zoomed view
  const double pan_x =
      (0.5 - ((nx - origin.x) * zoom_level + origin.x)) * content.width;
  const double pan_y =
      (0.5 - ((ny - origin.y) * zoom_level + origin.y)) * content.height;

  /// Translation is applied before the scale
  const double tx = pan_x / zoom_level;
  const double ty = pan_y / zoom_level;

  const PanBounds b = pan_bounds(origin, zoom_level, content);
  return {std::max(b.min_tx, std::min(b.max_tx, tx)),
          std::max(b.min_ty, std::min(b.max_ty, ty))};
}

ZoomEnvelope zoom_envelope(const ZoomRegion &region, double t) {
  const double transition =
      std::max(0.0, std::min(region.transition_duration, region.duration / 2.0));
  const double zoom_in_end = region.start_time + transition;
  const double zoom_out_start = region.end_time() - transition;
  const EasingFn easing = easing_by_name(region.easing);

  if (t < zoom_in_end) {
    const double progress =
        transition > 0 ? (t - region.start_time) / transition : 1.0;
    return {ZoomPhase::ZoomIn, easing(progress), zoom_in_end, zoom_out_start};
  }
  if (t < zoom_out_start) {
    return {ZoomPhase::Hold, 1.0, zoom_in_end, zoom_out_start};
  }
  const double progress =
      transition > 0 ? (t - zoom_out_start) / transition : 1.0;
  return {ZoomPhase::ZoomOut, easing(progress), zoom_in_end, zoom_out_start};
}

bool ZoomPanContext::matches(const ZoomRegion &region,
                             const Size &content_box) const {
  return valid && region_id == region.id && start_time == region.start_time &&
         duration == region.duration && zoom_level == region.zoom_level &&
         transition == region.transition_duration &&
         target_x == region.target_x && target_y == region.target_y &&
         content.width == content_box.width &&
         content.height == content_box.height;
}

CameraTransform
calculate_zoom_transform(double t, const RegionMap<ZoomRegion> &regions,
                         const std::vector<MouseEvent> &events,
                         const Size &recording, const Size &content,
                         ZoomPanContext *context,
                         const SmoothingParams &params) {
  const ZoomRegion *region = find_active_region(regions, t);
  if (!region) {
    if (context)
      context->reset();
    return CameraTransform{};
  }

  const Point origin{region->target_x + 0.5, region->target_y + 0.5};
  const ZoomEnvelope env = zoom_envelope(*region, t);
  const bool follows_cursor = region->mode == ZoomMode::Auto &&
                              !events.empty() && recording.width > 0;

  auto pan_at = [&](double when) {
    return calculate_bounded_pan(smoothed_mouse_position(events, when, params),
                                 origin, region->zoom_level, recording,
                                 content);
  };

  /// Anchors of the transition phases, computed once per region
  PanOffset zoom_in_pan;
  PanOffset zoom_out_pan;
  if (follows_cursor) {
    if (context && context->matches(*region, content)) {
      zoom_in_pan = context->zoom_in_pan;
      zoom_out_pan = context->zoom_out_pan;
    } else {
      zoom_in_pan = pan_at(env.zoom_in_end);
      zoom_out_pan = pan_at(env.zoom_out_start);
      if (context) {
        context->valid = true;
        context->region_id = region->id;
        context->start_time = region->start_time;
        context->duration = region->duration;
        context->zoom_level = region->zoom_level;
        context->transition = region->transition_duration;
        context->target_x = region->target_x;
        context->target_y = region->target_y;
        context->content = content;
        context->zoom_in_pan = zoom_in_pan;
        context->zoom_out_pan = zoom_out_pan;
      }
    }
  } else if (context) {
    context->reset();
  }

  CameraTransform out;
  out.origin_x = origin.x;
  out.origin_y = origin.y;

  switch (env.phase) {
  case ZoomPhase::ZoomIn:
    out.scale = lerp(1.0, region->zoom_level, env.progress);
    out.translate_x = lerp(0.0, zoom_in_pan.tx, env.progress);
    out.translate_y = lerp(0.0, zoom_in_pan.ty, env.progress);
    break;
  case ZoomPhase::Hold: {
    out.scale = region->zoom_level;
    if (follows_cursor) {
      const PanOffset live = pan_at(t);
      out.translate_x = live.tx;
      out.translate_y = live.ty;
    }
    break;
  }
  case ZoomPhase::ZoomOut:
    out.scale = lerp(region->zoom_level, 1.0, env.progress);
    out.translate_x = lerp(zoom_out_pan.tx, 0.0, env.progress);
    out.translate_y = lerp(zoom_out_pan.ty, 0.0, env.progress);
    break;
  }
  return out;
}

} // namespace cinecut
