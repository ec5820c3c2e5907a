#include "doctest/doctest.h"

#include <cstdlib>
#include <filesystem>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "cinecut/compositor.hpp"
#include "cinecut/system.hpp"

using namespace cinecut;

namespace {

cv::Vec4b pixel(const cv::Mat &m, int x, int y) { return m.at<cv::Vec4b>(y, x); }

ZoomRegion hold_zoom() {
  ZoomRegion r;
  r.id = "z";
  r.start_time = 0.0;
  r.duration = 4.0;
  r.zoom_level = 2.0;
  r.transition_duration = 1.0;
  return r;
}

/// Full-bleed red video at 2x the recording size, no frame decorations
Scene plain_scene() {
  Scene scene;
  scene.video = {160.0, 90.0};
  scene.recording = {160.0, 90.0};
  scene.styles.frame.padding = 0.0;
  scene.styles.frame.border_radius = 0.0;
  scene.styles.frame.border_width = 0.0;
  scene.styles.frame.shadow_blur = 0.0;
  scene.styles.cursor.shadow_blur = 0.0;
  scene.styles.cursor.shadow_offset_x = 0.0;
  scene.styles.cursor.shadow_offset_y = 0.0;
  scene.styles.cursor.click_scale_effect = false;
  return scene;
}

cv::Mat compose_at(const Scene &scene, double t, const cv::Mat *webcam = nullptr) {
  SceneCompositor compositor(scene, cv::Size(320, 180));
  compositor.initialize();
  const cv::Mat video(90, 160, CV_8UC4, cv::Scalar(255, 0, 0, 255));
  cv::Mat out;
  compositor.compose(t, video, webcam, out);
  return out;
}

MouseEvent event_at(double t, double x, double y, MouseEventType type) {
  MouseEvent e;
  e.timestamp = t;
  e.x = x;
  e.y = y;
  e.type = type;
  e.pressed = type == MouseEventType::Click;
  return e;
}

/// Within a couple of levels on every channel
bool near(const cv::Vec4b &a, const cv::Vec4b &b) {
  for (int c = 0; c < 4; ++c) {
    if (std::abs(static_cast<int>(a[c]) - static_cast<int>(b[c])) > 2)
      return false;
  }
  return true;
}

const cv::Vec4b kRed(255, 0, 0, 255);
const cv::Vec4b kGreen(0, 255, 0, 255);
const cv::Vec4b kBlue(0, 0, 255, 255);

} // namespace

TEST_CASE("content rect fits the video aspect inside the padding") {
  const Rect wide = fit_content_rect(cv::Size(320, 180), {160.0, 90.0}, 5.0);
  CHECK(wide.width == doctest::Approx(288.0));
  CHECK(wide.height == doctest::Approx(162.0));
  CHECK(wide.x == doctest::Approx(16.0));
  CHECK(wide.y == doctest::Approx(9.0));

  /// Portrait video is pillarboxed
  const Rect tall = fit_content_rect(cv::Size(320, 180), {90.0, 160.0}, 0.0);
  CHECK(tall.height == doctest::Approx(180.0));
  CHECK(tall.width == doctest::Approx(180.0 * 90.0 / 160.0));
  CHECK(tall.x + tall.width / 2.0 == doctest::Approx(160.0));

  const Rect none = fit_content_rect(cv::Size(320, 180), {0.0, 0.0}, 5.0);
  CHECK(none.width == doctest::Approx(0.0));
}

TEST_CASE("webcam size stays constant when scale on zoom is off") {
  WebcamStyles styles;
  styles.size = 30.0;
  styles.size_on_zoom = 15.0;
  styles.scale_on_zoom = false;
  RegionMap<ZoomRegion> regions{{"z", hold_zoom()}};

  CHECK(webcam_size_percent(styles, regions, 2.0) == doctest::Approx(30.0));

  styles.scale_on_zoom = true;
  CHECK(webcam_size_percent(styles, regions, 2.0) == doctest::Approx(15.0));
  CHECK(webcam_size_percent(styles, regions, 5.0) == doctest::Approx(30.0));
  const double during_zoom_in = webcam_size_percent(styles, regions, 0.5);
  CHECK(during_zoom_in < 30.0);
  CHECK(during_zoom_in > 15.0);
}

TEST_CASE("webcam layout anchors to corners with a 2% margin") {
  WebcamStyles styles;
  const cv::Size out(1000, 500);

  const WebcamLayout br =
      layout_webcam(styles, WebcamAnchor::BottomRight, 40.0, out);
  CHECK(br.rect.width == doctest::Approx(200.0));
  CHECK(br.rect.height == doctest::Approx(200.0));
  CHECK(br.rect.x == doctest::Approx(1000.0 - 200.0 - 10.0));
  CHECK(br.rect.y == doctest::Approx(500.0 - 200.0 - 10.0));

  const WebcamLayout tl = layout_webcam(styles, WebcamAnchor::TopLeft, 40.0, out);
  CHECK(tl.rect.x == doctest::Approx(10.0));
  CHECK(tl.rect.y == doctest::Approx(10.0));

  styles.shape = WebcamShape::Rectangle;
  const WebcamLayout rect =
      layout_webcam(styles, WebcamAnchor::TopCenter, 40.0, out);
  CHECK(rect.rect.height == doctest::Approx(200.0 * 9.0 / 16.0));
  CHECK(rect.rect.x == doctest::Approx(400.0));

  styles.shape = WebcamShape::Circle;
  CHECK(layout_webcam(styles, WebcamAnchor::TopLeft, 40.0, out).radius ==
        doctest::Approx(100.0));
}

TEST_CASE("click pulse shrinks the cursor and recovers") {
  CursorStyles styles;
  styles.click_scale_amount = 0.8;
  styles.click_scale_duration = 0.4;
  styles.click_scale_easing = "Linear";

  MouseEvent press;
  press.timestamp = 1.0;
  press.type = MouseEventType::Click;
  press.pressed = true;
  const std::vector<MouseEvent> events{press};

  CHECK(click_scale_at(styles, events, 0.9) == doctest::Approx(1.0));
  CHECK(click_scale_at(styles, events, 1.0) == doctest::Approx(1.0));
  CHECK(click_scale_at(styles, events, 1.2) == doctest::Approx(0.8));
  CHECK(click_scale_at(styles, events, 1.5) == doctest::Approx(1.0));

  styles.click_scale_effect = false;
  CHECK(click_scale_at(styles, events, 1.2) == doctest::Approx(1.0));
}

TEST_CASE("camera matrix is the identity placement without zoom") {
  const Rect content{16.0, 9.0, 288.0, 162.0};
  const cv::Matx23d m = camera_matrix(content, CameraTransform{});
  CHECK(m(0, 0) == doctest::Approx(1.0));
  CHECK(m(0, 2) == doctest::Approx(16.0));
  CHECK(m(1, 2) == doctest::Approx(9.0));

  CameraTransform zoomed;
  zoomed.scale = 2.0;
  const cv::Matx23d z = camera_matrix(content, zoomed);
  /// The origin (content center) stays put
  CHECK(z(0, 0) * 144.0 + z(0, 2) == doctest::Approx(16.0 + 144.0));
  CHECK(z(1, 1) * 81.0 + z(1, 2) == doctest::Approx(9.0 + 81.0));
}

TEST_CASE("composed frame layers background, video and webcam") {
  Scene scene;
  scene.video = {160.0, 90.0};
  scene.recording = {160.0, 90.0};
  scene.styles.frame.shadow_blur = 0.0;
  scene.styles.webcam.scale_on_zoom = false;
  scene.styles.webcam.shadow_blur = 0.0;

  SceneCompositor compositor(scene, cv::Size(320, 180));
  compositor.initialize();

  const cv::Mat video(90, 160, CV_8UC4, cv::Scalar(255, 0, 0, 255));
  const cv::Mat webcam(48, 64, CV_8UC4, cv::Scalar(0, 255, 0, 255));

  cv::Mat out;
  compositor.compose(0.0, video, nullptr, out);
  REQUIRE(out.size() == cv::Size(320, 180));
  REQUIRE(out.type() == CV_8UC4);

  /// #111827 background outside the content rect
  CHECK(pixel(out, 2, 2) == cv::Vec4b(17, 24, 39, 255));
  CHECK(pixel(out, 160, 90) == cv::Vec4b(255, 0, 0, 255));

  compositor.compose(0.0, video, &webcam, out);
  CHECK(pixel(out, 280, 140) == cv::Vec4b(0, 255, 0, 255));
  CHECK(pixel(out, 100, 60) == cv::Vec4b(255, 0, 0, 255));
}

TEST_CASE("click ripple is drawn only within its duration") {
  Scene scene = plain_scene();
  scene.styles.cursor.click_ripple_effect = true;
  scene.styles.cursor.click_ripple_color = "#0000ff";
  scene.styles.cursor.click_ripple_size = 20.0;
  scene.styles.cursor.click_ripple_duration = 0.5;
  scene.events = {event_at(1.0, 80.0, 45.0, MouseEventType::Click)};

  CHECK(pixel(compose_at(scene, 0.9), 160, 90) == kRed);

  /// Halfway: ease-out radius 17.5px, opacity 1 - 0.875
  const cv::Mat mid = compose_at(scene, 1.25);
  const cv::Vec4b center = pixel(mid, 160, 90);
  CHECK(center[0] == 223);
  CHECK(center[2] == 32);
  CHECK(pixel(mid, 160 + 25, 90) == kRed);

  CHECK(pixel(compose_at(scene, 1.6), 160, 90) == kRed);
}

TEST_CASE("cursor is drawn at its hotspot while the event is fresh") {
  Scene scene = plain_scene();
  CursorBitmap arrow;
  arrow.rgba = cv::Mat(4, 4, CV_8UC4, cv::Scalar(0, 255, 0, 255));
  arrow.xhot = 1;
  arrow.yhot = 1;
  scene.cursors["arrow"] = arrow;

  MouseEvent move = event_at(1.0, 40.0, 20.0, MouseEventType::Move);
  move.cursor_image_key = "arrow";
  scene.events = {move};

  /// Event maps to content (80, 40); the bitmap's top-left sits at (79, 39)
  const cv::Mat fresh = compose_at(scene, 1.09);
  CHECK(pixel(fresh, 80, 40) == kGreen);
  CHECK(pixel(fresh, 79, 39) == kGreen);
  CHECK(pixel(fresh, 82, 42) == kGreen);
  CHECK(pixel(fresh, 78, 40) == kRed);
  CHECK(pixel(fresh, 83, 40) == kRed);

  CHECK(pixel(compose_at(scene, 1.11), 80, 40) == kRed);

  scene.styles.cursor.show_cursor = false;
  CHECK(pixel(compose_at(scene, 1.05), 80, 40) == kRed);
}

TEST_CASE("flipped webcam mirrors the camera image") {
  Scene scene = plain_scene();
  scene.styles.webcam.shape = WebcamShape::Square;
  scene.styles.webcam.border_radius = 0.0;
  scene.styles.webcam.shadow_blur = 0.0;
  scene.styles.webcam.scale_on_zoom = false;
  scene.styles.webcam_position.pos = WebcamAnchor::TopLeft;

  /// Left half blue, right half green
  cv::Mat webcam(64, 64, CV_8UC4, cv::Scalar(0, 255, 0, 255));
  webcam(cv::Rect(0, 0, 32, 64)).setTo(cv::Scalar(0, 0, 255, 255));

  /// Overlay covers x, y in [3.6, 75.6]
  const cv::Mat normal = compose_at(scene, 0.0, &webcam);
  CHECK(pixel(normal, 10, 40) == kBlue);
  CHECK(pixel(normal, 70, 40) == kGreen);

  scene.styles.webcam.is_flipped = true;
  const cv::Mat flipped = compose_at(scene, 0.0, &webcam);
  CHECK(pixel(flipped, 10, 40) == kGreen);
  CHECK(pixel(flipped, 70, 40) == kBlue);
  CHECK(pixel(flipped, 120, 40) == kRed);
}

TEST_CASE("gradient background runs between its endpoint colors") {
  Scene scene = plain_scene();
  scene.styles.frame.padding = 5.0;
  scene.styles.frame.background.type = BackgroundType::Gradient;
  scene.styles.frame.background.gradient_start = "#ff0000";
  scene.styles.frame.background.gradient_end = "#0000ff";

  const cv::Mat across = compose_at(scene, 0.0);
  CHECK(near(pixel(across, 0, 0), kRed));
  CHECK(near(pixel(across, 319, 179), kBlue));
  CHECK(near(pixel(across, 0, 179), kRed));
  CHECK(near(pixel(across, 160, 2), cv::Vec4b(127, 0, 128, 255)));

  scene.styles.frame.background.gradient_direction = "to bottom";
  const cv::Mat down = compose_at(scene, 0.0);
  CHECK(near(pixel(down, 319, 0), kRed));
  CHECK(near(pixel(down, 0, 179), kBlue));
}

TEST_CASE("image background is cover-fit and falls back when unreadable") {
  const std::string dir = make_temp_dir("cinecut-bg");
  REQUIRE_FALSE(dir.empty());
  const std::string path = (std::filesystem::path(dir) / "bg.png").string();
  /// BGR on disk
  REQUIRE(cv::imwrite(path, cv::Mat(20, 40, CV_8UC3, cv::Scalar(0, 128, 255))));

  Scene scene = plain_scene();
  scene.styles.frame.padding = 5.0;
  scene.styles.frame.background.type = BackgroundType::Image;
  scene.styles.frame.background.image_path = path;
  CHECK(pixel(compose_at(scene, 0.0), 0, 0) == cv::Vec4b(255, 128, 0, 255));

  scene.styles.frame.background.image_path =
      (std::filesystem::path(dir) / "missing.png").string();
  CHECK(pixel(compose_at(scene, 0.0), 0, 0) == cv::Vec4b(15, 23, 42, 255));

  CHECK(remove_tree(dir));
}
