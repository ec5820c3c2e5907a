#include "doctest/doctest.h"

#include "cinecut/easing.hpp"
#include "cinecut/transform.hpp"

using namespace cinecut;

namespace {

ZoomRegion zoom(const std::string &id, double start, double duration,
                double level, double transition) {
  ZoomRegion r;
  r.id = id;
  r.start_time = start;
  r.duration = duration;
  r.zoom_level = level;
  r.transition_duration = transition;
  return r;
}

MouseEvent move(double t, double x, double y) {
  MouseEvent e;
  e.timestamp = t;
  e.x = x;
  e.y = y;
  return e;
}

const Size kRecording{1920.0, 1080.0};
const Size kContent{1600.0, 900.0};

} // namespace

TEST_CASE("zoom envelope follows zoom-in, hold and zoom-out") {
  RegionMap<ZoomRegion> regions{{"z", zoom("z", 1.0, 3.0, 2.0, 0.5)}};
  const std::vector<MouseEvent> none;
  const SmoothingParams params;

  auto scale_at = [&](double t) {
    return calculate_zoom_transform(t, regions, none, kRecording, kContent,
                                    nullptr, params)
        .scale;
  };

  CHECK(scale_at(1.0) == doctest::Approx(1.0));
  CHECK(scale_at(1.5) == doctest::Approx(2.0));
  CHECK(scale_at(2.5) == doctest::Approx(2.0));
  CHECK(scale_at(3.5) == doctest::Approx(2.0));
  CHECK(scale_at(4.0) == doctest::Approx(1.0));
  CHECK(scale_at(0.5) == doctest::Approx(1.0));

  const double mid_in = scale_at(1.25);
  CHECK(mid_in > 1.0);
  CHECK(mid_in < 2.0);
}

TEST_CASE("transition is limited to half the region") {
  const ZoomRegion r = zoom("short", 0.0, 1.0, 2.0, 2.0);
  const ZoomEnvelope env = zoom_envelope(r, 0.25);
  CHECK(env.phase == ZoomPhase::ZoomIn);
  CHECK(env.zoom_in_end == doctest::Approx(0.5));
  CHECK(env.zoom_out_start == doctest::Approx(0.5));
  CHECK(zoom_envelope(r, 0.75).phase == ZoomPhase::ZoomOut);
}

TEST_CASE("no active region yields the identity transform") {
  const CameraTransform tf = calculate_zoom_transform(
      2.0, {}, {move(0.0, 100.0, 100.0)}, kRecording, kContent);
  CHECK(tf.scale == doctest::Approx(1.0));
  CHECK(tf.translate_x == doctest::Approx(0.0));
  CHECK(tf.translate_y == doctest::Approx(0.0));
}

TEST_CASE("pan stays inside the content rectangle") {
  const Point origin{0.5, 0.5};
  const double level = 2.0;
  const PanBounds b = pan_bounds(origin, level, kContent);

  /// Cursor pinned to the far corners
  const PanOffset top_left = calculate_bounded_pan(
      Point{0.0, 0.0}, origin, level, kRecording, kContent);
  CHECK(top_left.tx == doctest::Approx(b.max_tx));
  CHECK(top_left.ty == doctest::Approx(b.max_ty));

  const PanOffset bottom_right = calculate_bounded_pan(
      Point{kRecording.width, kRecording.height}, origin, level, kRecording,
      kContent);
  CHECK(bottom_right.tx == doctest::Approx(b.min_tx));
  CHECK(bottom_right.ty == doctest::Approx(b.min_ty));

  /// Centered cursor needs no pan
  const PanOffset center = calculate_bounded_pan(
      Point{960.0, 540.0}, origin, level, kRecording, kContent);
  CHECK(center.tx == doctest::Approx(0.0));
  CHECK(center.ty == doctest::Approx(0.0));

  CHECK(calculate_bounded_pan(std::nullopt, origin, level, kRecording,
                              kContent)
            .tx == doctest::Approx(0.0));
}

TEST_CASE("hold phase tracks the smoothed cursor within bounds") {
  RegionMap<ZoomRegion> regions{{"z", zoom("z", 0.0, 10.0, 2.0, 1.0)}};
  std::vector<MouseEvent> events;
  for (int i = 0; i <= 100; ++i)
    events.push_back(move(i * 0.1, 1800.0, 1000.0));

  SmoothingParams params;
  ZoomPanContext ctx;
  const CameraTransform tf = calculate_zoom_transform(
      5.0, regions, events, kRecording, kContent, &ctx, params);

  const PanBounds b = pan_bounds({0.5, 0.5}, 2.0, kContent);
  CHECK(tf.scale == doctest::Approx(2.0));
  CHECK(tf.translate_x < 0.0);
  CHECK(tf.translate_x >= b.min_tx - 1e-9);
  CHECK(tf.translate_y >= b.min_ty - 1e-9);
  CHECK(ctx.valid);
  CHECK(ctx.region_id == "z");
}

TEST_CASE("transform is a pure function of its inputs") {
  RegionMap<ZoomRegion> regions{{"z", zoom("z", 1.0, 4.0, 1.8, 0.8)}};
  std::vector<MouseEvent> events;
  for (int i = 0; i < 60; ++i)
    events.push_back(move(i * 0.1, 300.0 + i * 20.0, 200.0 + i * 5.0));

  SmoothingParams params;
  ZoomPanContext ctx;
  for (double t : {1.2, 2.0, 3.1, 4.6}) {
    const CameraTransform cached = calculate_zoom_transform(
        t, regions, events, kRecording, kContent, &ctx, params);
    const CameraTransform fresh = calculate_zoom_transform(
        t, regions, events, kRecording, kContent, nullptr, params);
    CHECK(cached.scale == doctest::Approx(fresh.scale));
    CHECK(cached.translate_x == doctest::Approx(fresh.translate_x));
    CHECK(cached.translate_y == doctest::Approx(fresh.translate_y));
  }
}

TEST_CASE("smoothed position lags behind a jump and returns nothing before events") {
  std::vector<MouseEvent> events{move(0.0, 0.0, 0.0), move(0.1, 100.0, 0.0),
                                 move(0.2, 100.0, 0.0)};
  SmoothingParams params;

  CHECK_FALSE(smoothed_mouse_position(events, -0.5, params).has_value());

  const auto p = smoothed_mouse_position(events, 0.2, params);
  REQUIRE(p.has_value());
  CHECK(p->x > 0.0);
  CHECK(p->x < 100.0);
  CHECK(find_last_event_index(events, 0.15) == 1);
  CHECK(find_last_event_index(events, -1.0) == -1);
}
