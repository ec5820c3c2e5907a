/**
 * @file compositor.cpp
 * @brief Scene composition implementation
 *
 * @details Every layer is rasterized as an 8-bit coverage mask over the
 *          smallest output ROI that contains it, then blended source-over
 *          into the RGBA output. Shapes are anti-aliased polygons with
 *          4 bits of sub-pixel precision.
 */

#include "cinecut/compositor.hpp"

#include <algorithm>
#include <cmath>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "cinecut/config.hpp"
#include "cinecut/easing.hpp"
#include "cinecut/logging.hpp"
#include "cinecut/timeline.hpp"

namespace cinecut {

namespace {

constexpr int SUBPIXEL_BITS = 4;
constexpr double SUBPIXEL_SCALE = 1 << SUBPIXEL_BITS;
constexpr double PI = 3.14159265358979323846;

using Path = std::vector<cv::Point2d>;

// **---- Geometry ----**

/// Rounded rectangle outline (clockwise), radius limited to half the short side
Path rounded_rect_path(double x, double y, double w, double h, double radius) {
  Path path;
  const double r = std::max(0.0, std::min(radius, std::min(w, h) / 2.0));
  if (r <= 0.0) {
    path = {{x, y}, {x + w, y}, {x + w, y + h}, {x, y + h}};
    return path;
  }

  const int steps = std::max(4, std::min(32, static_cast<int>(r / 2.0)));
  const cv::Point2d centers[4] = {{x + w - r, y + r},
                                  {x + w - r, y + h - r},
                                  {x + r, y + h - r},
                                  {x + r, y + r}};
  /// Start angles: top-right, bottom-right, bottom-left, top-left
  const double starts[4] = {-PI / 2, 0.0, PI / 2, PI};

  for (int corner = 0; corner < 4; ++corner) {
    for (int i = 0; i <= steps; ++i) {
      const double a = starts[corner] + (PI / 2) * i / steps;
      path.emplace_back(centers[corner].x + r * std::cos(a),
                        centers[corner].y + r * std::sin(a));
    }
  }
  return path;
}

Path transform_path(const Path &path, const cv::Matx23d &m) {
  Path out;
  out.reserve(path.size());
  for (const auto &p : path) {
    out.emplace_back(m(0, 0) * p.x + m(0, 1) * p.y + m(0, 2),
                     m(1, 0) * p.x + m(1, 1) * p.y + m(1, 2));
  }
  return out;
}

Path offset_path(const Path &path, double dx, double dy) {
  Path out(path);
  for (auto &p : out) {
    p.x += dx;
    p.y += dy;
  }
  return out;
}

/// Integer ROI covering the path plus a margin, clipped to the frame
cv::Rect path_bounds(const Path &path, double margin, const cv::Size &frame) {
  if (path.empty())
    return {};
  double x0 = path[0].x, x1 = path[0].x, y0 = path[0].y, y1 = path[0].y;
  for (const auto &p : path) {
    x0 = std::min(x0, p.x);
    x1 = std::max(x1, p.x);
    y0 = std::min(y0, p.y);
    y1 = std::max(y1, p.y);
  }
  cv::Rect r(static_cast<int>(std::floor(x0 - margin)),
             static_cast<int>(std::floor(y0 - margin)), 0, 0);
  r.width = static_cast<int>(std::ceil(x1 + margin)) - r.x + 1;
  r.height = static_cast<int>(std::ceil(y1 + margin)) - r.y + 1;
  return r & cv::Rect(0, 0, frame.width, frame.height);
}

/// Anti-aliased coverage mask of a polygon inside roi
cv::Mat rasterize(const Path &path, const cv::Rect &roi) {
  cv::Mat mask = cv::Mat::zeros(roi.size(), CV_8UC1);
  std::vector<cv::Point> poly;
  poly.reserve(path.size());
  for (const auto &p : path) {
    poly.emplace_back(cvRound((p.x - roi.x) * SUBPIXEL_SCALE),
                      cvRound((p.y - roi.y) * SUBPIXEL_SCALE));
  }
  std::vector<std::vector<cv::Point>> polys{poly};
  cv::fillPoly(mask, polys, cv::Scalar(255), cv::LINE_AA, SUBPIXEL_BITS);
  return mask;
}

/// Translation-adjusted copy of m so that it renders into roi
cv::Matx23d into_roi(const cv::Matx23d &m, const cv::Rect &roi) {
  cv::Matx23d local = m;
  local(0, 2) -= roi.x;
  local(1, 2) -= roi.y;
  return local;
}

// **---- Blending ----**

inline uint8_t mix(double src, uint8_t dst, double a) {
  return static_cast<uint8_t>(std::lround(src * a + dst * (1.0 - a)));
}

/// Source-over of a solid color, coverage from mask
void blend_solid(cv::Mat &out, const cv::Rect &roi, const cv::Mat &mask,
                 const Rgba &color, double opacity = 1.0) {
  const double base = color.a * opacity;
  if (base <= 0.0 || roi.empty())
    return;

  for (int y = 0; y < roi.height; ++y) {
    uint8_t *dst = out.ptr<uint8_t>(roi.y + y) + roi.x * 4;
    const uint8_t *m = mask.ptr<uint8_t>(y);
    for (int x = 0; x < roi.width; ++x, dst += 4) {
      if (!m[x])
        continue;
      const double a = base * (m[x] / 255.0);
      dst[0] = mix(color.r, dst[0], a);
      dst[1] = mix(color.g, dst[1], a);
      dst[2] = mix(color.b, dst[2], a);
      dst[3] = mix(255.0, dst[3], a);
    }
  }
}

/// Source-over of an RGBA layer the size of roi, optionally clipped by mask
void blend_layer(cv::Mat &out, const cv::Rect &roi, const cv::Mat &layer,
                 const cv::Mat &mask) {
  for (int y = 0; y < roi.height; ++y) {
    uint8_t *dst = out.ptr<uint8_t>(roi.y + y) + roi.x * 4;
    const uint8_t *src = layer.ptr<uint8_t>(y);
    const uint8_t *m = mask.empty() ? nullptr : mask.ptr<uint8_t>(y);
    for (int x = 0; x < roi.width; ++x, dst += 4, src += 4) {
      double a = src[3] / 255.0;
      if (m)
        a *= m[x] / 255.0;
      if (a <= 0.0)
        continue;
      dst[0] = mix(src[0], dst[0], a);
      dst[1] = mix(src[1], dst[1], a);
      dst[2] = mix(src[2], dst[2], a);
      dst[3] = mix(255.0, dst[3], a);
    }
  }
}

/**
 * @brief Blurred, offset silhouette of a shape.
 * @note Blur follows the canvas convention (sigma = blur / 2). Offsets are
 *       output pixels and do not scale with the camera.
 */
void draw_shape_shadow(cv::Mat &out, const Path &shape, double blur,
                       double offset_x, double offset_y, const Rgba &color) {
  const double sigma = blur / 2.0;
  const Path moved = offset_path(shape, offset_x, offset_y);
  const cv::Rect roi =
      path_bounds(moved, std::ceil(3.0 * sigma) + 2.0, out.size());
  if (roi.empty())
    return;

  cv::Mat mask = rasterize(moved, roi);
  if (sigma > 0.0)
    cv::GaussianBlur(mask, mask, cv::Size(0, 0), sigma);
  blend_solid(out, roi, mask, color);
}

// **---- Background ----**

/// Gradient endpoints for a linear direction keyword
void gradient_line(const std::string &direction, double w, double h,
                   cv::Point2d &from, cv::Point2d &to) {
  if (direction == "to bottom") {
    from = {0, 0};
    to = {0, h};
  } else if (direction == "to top") {
    from = {0, h};
    to = {0, 0};
  } else if (direction == "to left") {
    from = {w, 0};
    to = {0, 0};
  } else if (direction == "to bottom right") {
    from = {0, 0};
    to = {w, h};
  } else if (direction == "to bottom left") {
    from = {w, 0};
    to = {0, h};
  } else if (direction == "to top right") {
    from = {0, h};
    to = {w, 0};
  } else if (direction == "to top left") {
    from = {w, h};
    to = {0, 0};
  } else {
    from = {0, 0};
    to = {w, 0};
  }
}

void fill_gradient(cv::Mat &out, const Background &bg) {
  Rgba start = color_or(bg.gradient_start, Rgba{0, 0, 0, 1.0});
  Rgba end = color_or(bg.gradient_end, Rgba{255, 255, 255, 1.0});
  const std::string &dir = bg.gradient_direction;
  const double w = out.cols;
  const double h = out.rows;

  const bool radial = dir.rfind("circle", 0) == 0;
  if (radial && dir == "circle-in")
    std::swap(start, end);

  cv::Point2d from, to;
  gradient_line(dir, w, h, from, to);
  const cv::Point2d d = to - from;
  const double len_sq = d.dot(d);
  const double radius = std::max(w, h) / 2.0;

  for (int y = 0; y < out.rows; ++y) {
    uint8_t *px = out.ptr<uint8_t>(y);
    for (int x = 0; x < out.cols; ++x, px += 4) {
      double t;
      if (radial) {
        t = std::hypot(x + 0.5 - w / 2.0, y + 0.5 - h / 2.0) / radius;
      } else {
        t = len_sq > 0 ? ((x + 0.5 - from.x) * d.x + (y + 0.5 - from.y) * d.y) /
                             len_sq
                       : 0.0;
      }
      t = std::max(0.0, std::min(1.0, t));
      px[0] = static_cast<uint8_t>(std::lround(lerp(start.r, end.r, t)));
      px[1] = static_cast<uint8_t>(std::lround(lerp(start.g, end.g, t)));
      px[2] = static_cast<uint8_t>(std::lround(lerp(start.b, end.b, t)));
      px[3] = static_cast<uint8_t>(std::lround(lerp(start.a, end.a, t) * 255));
    }
  }
}

void fill_solid(cv::Mat &out, const Rgba &c) {
  out.setTo(cv::Scalar(c.r, c.g, c.b, std::lround(c.a * 255)));
}

/// Cover-fit the image into out (center crop to the output aspect)
bool fill_image(cv::Mat &out, const std::string &path) {
  if (path.empty())
    return false;
  cv::Mat bgr = cv::imread(path, cv::IMREAD_COLOR);
  if (bgr.empty())
    return false;

  const double img_ratio = static_cast<double>(bgr.cols) / bgr.rows;
  const double out_ratio = static_cast<double>(out.cols) / out.rows;
  cv::Rect crop;
  if (img_ratio > out_ratio) {
    crop.height = bgr.rows;
    crop.width = std::max(1, static_cast<int>(std::lround(bgr.rows * out_ratio)));
    crop.x = (bgr.cols - crop.width) / 2;
    crop.y = 0;
  } else {
    crop.width = bgr.cols;
    crop.height =
        std::max(1, static_cast<int>(std::lround(bgr.cols / out_ratio)));
    crop.x = 0;
    crop.y = (bgr.rows - crop.height) / 2;
  }
  crop &= cv::Rect(0, 0, bgr.cols, bgr.rows);

  cv::Mat resized;
  cv::resize(bgr(crop), resized, out.size(), 0, 0, cv::INTER_AREA);
  cv::cvtColor(resized, out, cv::COLOR_BGR2RGBA);
  return true;
}

} // anonymous namespace

// **---- Layout helpers ----**

Rect fit_content_rect(const cv::Size &output, const Size &video,
                      double padding_percent) {
  const double pad = padding_percent / 100.0;
  const double avail_w = output.width * (1.0 - 2.0 * pad);
  const double avail_h = output.height * (1.0 - 2.0 * pad);

  Rect r;
  if (video.width <= 0 || video.height <= 0 || avail_w <= 0 || avail_h <= 0)
    return r;

  const double aspect = video.width / video.height;
  if (avail_w / avail_h > aspect) {
    r.height = avail_h;
    r.width = r.height * aspect;
  } else {
    r.width = avail_w;
    r.height = r.width / aspect;
  }
  r.x = (output.width - r.width) / 2.0;
  r.y = (output.height - r.height) / 2.0;
  return r;
}

double webcam_size_percent(const WebcamStyles &styles,
                           const RegionMap<ZoomRegion> &zoom_regions,
                           double t) {
  if (!styles.scale_on_zoom)
    return styles.size;

  const ZoomRegion *region = find_active_region(zoom_regions, t);
  if (!region)
    return styles.size;

  const ZoomEnvelope env = zoom_envelope(*region, t);
  switch (env.phase) {
  case ZoomPhase::ZoomIn:
    return lerp(styles.size, styles.size_on_zoom, env.progress);
  case ZoomPhase::Hold:
    return styles.size_on_zoom;
  case ZoomPhase::ZoomOut:
    return lerp(styles.size_on_zoom, styles.size, env.progress);
  }
  return styles.size;
}

WebcamLayout layout_webcam(const WebcamStyles &styles, WebcamAnchor anchor,
                           double size_percent, const cv::Size &output) {
  const double base = std::min(output.width, output.height);
  const double edge = base * 0.02;
  const double W = output.width;
  const double H = output.height;

  WebcamLayout layout;
  double w = base * (size_percent / 100.0);
  double h = styles.shape == WebcamShape::Rectangle ? w * (9.0 / 16.0) : w;
  layout.rect.width = w;
  layout.rect.height = h;

  switch (anchor) {
  case WebcamAnchor::TopLeft:
    layout.rect.x = edge;
    layout.rect.y = edge;
    break;
  case WebcamAnchor::TopCenter:
    layout.rect.x = (W - w) / 2;
    layout.rect.y = edge;
    break;
  case WebcamAnchor::TopRight:
    layout.rect.x = W - w - edge;
    layout.rect.y = edge;
    break;
  case WebcamAnchor::LeftCenter:
    layout.rect.x = edge;
    layout.rect.y = (H - h) / 2;
    break;
  case WebcamAnchor::RightCenter:
    layout.rect.x = W - w - edge;
    layout.rect.y = (H - h) / 2;
    break;
  case WebcamAnchor::BottomLeft:
    layout.rect.x = edge;
    layout.rect.y = H - h - edge;
    break;
  case WebcamAnchor::BottomCenter:
    layout.rect.x = (W - w) / 2;
    layout.rect.y = H - h - edge;
    break;
  case WebcamAnchor::BottomRight:
    layout.rect.x = W - w - edge;
    layout.rect.y = H - h - edge;
    break;
  }

  const double max_radius = std::min(w, h) / 2.0;
  layout.radius = styles.shape == WebcamShape::Circle
                      ? max_radius
                      : max_radius * (styles.border_radius / 50.0);
  return layout;
}

double click_scale_at(const CursorStyles &styles,
                      const std::vector<MouseEvent> &events, double t) {
  if (!styles.click_scale_effect || styles.click_scale_duration <= 0)
    return 1.0;

  /// Most recent press in (t - duration, t]
  for (int i = find_last_event_index(events, t); i >= 0; --i) {
    const MouseEvent &e = events[i];
    if (e.timestamp <= t - styles.click_scale_duration)
      break;
    if (e.type != MouseEventType::Click || !e.pressed)
      continue;

    const double progress = (t - e.timestamp) / styles.click_scale_duration;
    const double eased = ease(styles.click_scale_easing, progress);
    return 1.0 - (1.0 - styles.click_scale_amount) * std::sin(eased * PI);
  }
  return 1.0;
}

cv::Matx23d camera_matrix(const Rect &content, const CameraTransform &tf) {
  const double ox = tf.origin_x * content.width;
  const double oy = tf.origin_y * content.height;
  const double s = tf.scale;
  return cv::Matx23d(s, 0.0, content.x + ox + s * (tf.translate_x - ox), 0.0,
                     s, content.y + oy + s * (tf.translate_y - oy));
}

// **---- SceneCompositor ----**

SceneCompositor::SceneCompositor(const Scene &scene, cv::Size output)
    : scene_(scene), output_(output) {}

void SceneCompositor::initialize() { render_background(); }

void SceneCompositor::render_background() {
  background_.create(output_, CV_8UC4);
  const Background &bg = scene_.styles.frame.background;

  switch (bg.type) {
  case BackgroundType::Color:
    fill_solid(background_, color_or(bg.color, Rgba{0, 0, 0, 1.0}));
    break;
  case BackgroundType::Gradient:
    fill_gradient(background_, bg);
    break;
  case BackgroundType::Image:
  case BackgroundType::Wallpaper:
    if (!fill_image(background_, bg.image_path)) {
      LOG_WARN("[Compositor] Background image unavailable: '{}'",
               bg.image_path);
      fill_solid(background_, fallback_background_color());
    }
    break;
  }
}

void SceneCompositor::compose(double t, const cv::Mat &video,
                              const cv::Mat *webcam, cv::Mat &out,
                              ZoomPanContext *pan) {
  if (background_.empty() || background_.size() != output_)
    render_background();
  background_.copyTo(out);

  const Rect content =
      fit_content_rect(output_, scene_.video, scene_.styles.frame.padding);
  if (content.width <= 0 || content.height <= 0)
    return;

  const Size recording =
      scene_.recording.width > 0 ? scene_.recording : scene_.video;
  const CameraTransform tf = calculate_zoom_transform(
      t, scene_.zoom_regions, scene_.events, recording,
      Size{content.width, content.height}, pan);
  const cv::Matx23d camera = camera_matrix(content, tf);

  draw_video(out, video, content, camera);
  draw_ripples(out, t, content, camera, tf.scale);
  draw_cursor(out, t, content, camera, tf.scale);

  if (webcam && !webcam->empty() && scene_.styles.webcam_visible)
    draw_webcam(out, t, *webcam);
}

void SceneCompositor::draw_video(cv::Mat &out, const cv::Mat &video,
                                 const Rect &content,
                                 const cv::Matx23d &camera) const {
  const FrameStyles &fs = scene_.styles.frame;
  const Path local =
      rounded_rect_path(0, 0, content.width, content.height, fs.border_radius);
  const Path shape = transform_path(local, camera);

  // **--- Shadow ---**

  if (fs.shadow_blur > 0) {
    draw_shape_shadow(out, shape, fs.shadow_blur, fs.shadow_offset_x,
                      fs.shadow_offset_y,
                      color_or(fs.shadow_color, Rgba{0, 0, 0, 0.8}));
  }

  const cv::Rect roi = path_bounds(shape, 1.0, out.size());
  if (roi.empty() || video.empty())
    return;

  // **--- Clipped video ---**

  cv::Matx23d m = camera;
  const double kx = content.width / video.cols;
  const double ky = content.height / video.rows;
  m(0, 0) *= kx;
  m(1, 1) *= ky;

  cv::Mat layer;
  cv::warpAffine(video, layer, into_roi(m, roi), roi.size(), cv::INTER_LINEAR,
                 cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0, 0));
  const cv::Mat clip = rasterize(shape, roi);
  blend_layer(out, roi, layer, clip);

  // **--- Inner border ---**

  if (fs.border_width > 0) {
    const double bw = fs.border_width;
    const Path inner = transform_path(
        rounded_rect_path(bw, bw, content.width - 2 * bw,
                          content.height - 2 * bw,
                          std::max(0.0, fs.border_radius - bw)),
        camera);
    cv::Mat ring;
    if (content.width > 2 * bw && content.height > 2 * bw)
      cv::subtract(clip, rasterize(inner, roi), ring);
    else
      ring = clip;
    blend_solid(out, roi, ring,
                color_or(fs.border_color, Rgba{255, 255, 255, 0.2}));
  }
}

void SceneCompositor::draw_ripples(cv::Mat &out, double t, const Rect &content,
                                   const cv::Matx23d &camera,
                                   double scale) const {
  const CursorStyles &cs = scene_.styles.cursor;
  const Size &rec = scene_.recording.width > 0 ? scene_.recording : scene_.video;
  if (!cs.click_ripple_effect || cs.click_ripple_duration <= 0 ||
      rec.width <= 0 || rec.height <= 0)
    return;

  const Rgba color = color_or(cs.click_ripple_color, Rgba{255, 255, 255, 0.8});
  const auto &events = scene_.events;

  for (int i = find_last_event_index(events, t); i >= 0; --i) {
    const MouseEvent &e = events[i];
    if (e.timestamp <= t - cs.click_ripple_duration)
      break;
    if (e.type != MouseEventType::Click || !e.pressed)
      continue;

    const double eased = ease_out_cubic((t - e.timestamp) / cs.click_ripple_duration);
    const double radius = eased * cs.click_ripple_size * scale;
    if (radius <= 0.0)
      continue;

    const Path center = transform_path(
        {{e.x / rec.width * content.width, e.y / rec.height * content.height}},
        camera);
    const cv::Point2d c = center[0];
    const cv::Rect roi =
        path_bounds({{c.x - radius, c.y - radius}, {c.x + radius, c.y + radius}},
                    1.0, out.size());
    if (roi.empty())
      continue;

    cv::Mat mask = cv::Mat::zeros(roi.size(), CV_8UC1);
    cv::circle(mask,
               cv::Point(cvRound((c.x - roi.x) * SUBPIXEL_SCALE),
                         cvRound((c.y - roi.y) * SUBPIXEL_SCALE)),
               cvRound(radius * SUBPIXEL_SCALE), cv::Scalar(255), cv::FILLED,
               cv::LINE_AA, SUBPIXEL_BITS);
    blend_solid(out, roi, mask, color, 1.0 - eased);
  }
}

void SceneCompositor::draw_cursor(cv::Mat &out, double t, const Rect &content,
                                  const cv::Matx23d &camera,
                                  double scale) const {
  const CursorStyles &cs = scene_.styles.cursor;
  const Size &rec = scene_.recording.width > 0 ? scene_.recording : scene_.video;
  if (!cs.show_cursor || rec.width <= 0 || rec.height <= 0)
    return;

  const int idx = find_last_event_index(scene_.events, t);
  if (idx < 0)
    return;
  const MouseEvent &e = scene_.events[idx];
  if (t - e.timestamp >= Config::cursor_freshness_sec())
    return;

  auto found = scene_.cursors.find(e.cursor_image_key);
  if (found == scene_.cursors.end() || found->second.rgba.empty())
    return;
  const CursorBitmap &bitmap = found->second;

  /// Hotspot lands on the event position, pulse scales around it
  const double hot_x = std::round(e.x / rec.width * content.width - bitmap.xhot) +
                       bitmap.xhot;
  const double hot_y =
      std::round(e.y / rec.height * content.height - bitmap.yhot) + bitmap.yhot;
  const double k = click_scale_at(cs, scene_.events, t);
  const double sk = scale * k;

  const cv::Matx23d m(
      sk, 0.0, camera(0, 0) * (hot_x - k * bitmap.xhot) + camera(0, 2), 0.0,
      sk, camera(1, 1) * (hot_y - k * bitmap.yhot) + camera(1, 2));

  const Path outline = transform_path(
      {{0, 0},
       {static_cast<double>(bitmap.rgba.cols), 0},
       {static_cast<double>(bitmap.rgba.cols),
        static_cast<double>(bitmap.rgba.rows)},
       {0, static_cast<double>(bitmap.rgba.rows)}},
      m);

  // **--- Drop shadow ---**

  if (cs.shadow_blur > 0 || cs.shadow_offset_x != 0 || cs.shadow_offset_y != 0) {
    const double sigma = cs.shadow_blur / 2.0;
    const Path moved = offset_path(outline, cs.shadow_offset_x, cs.shadow_offset_y);
    const cv::Rect roi =
        path_bounds(moved, std::ceil(3.0 * sigma) + 2.0, out.size());
    if (!roi.empty()) {
      cv::Matx23d shifted = m;
      shifted(0, 2) += cs.shadow_offset_x;
      shifted(1, 2) += cs.shadow_offset_y;
      cv::Mat warped, alpha;
      cv::warpAffine(bitmap.rgba, warped, into_roi(shifted, roi), roi.size(),
                     cv::INTER_LINEAR, cv::BORDER_CONSTANT,
                     cv::Scalar(0, 0, 0, 0));
      cv::extractChannel(warped, alpha, 3);
      if (sigma > 0.0)
        cv::GaussianBlur(alpha, alpha, cv::Size(0, 0), sigma);
      blend_solid(out, roi, alpha, color_or(cs.shadow_color, Rgba{0, 0, 0, 0.4}));
    }
  }

  const cv::Rect roi = path_bounds(outline, 1.0, out.size());
  if (roi.empty())
    return;
  cv::Mat layer;
  cv::warpAffine(bitmap.rgba, layer, into_roi(m, roi), roi.size(),
                 cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0, 0));
  blend_layer(out, roi, layer, cv::Mat());
}

void SceneCompositor::draw_webcam(cv::Mat &out, double t,
                                  const cv::Mat &webcam) const {
  const WebcamStyles &ws = scene_.styles.webcam;
  const double pct = webcam_size_percent(ws, scene_.zoom_regions, t);
  const WebcamLayout layout =
      layout_webcam(ws, scene_.styles.webcam_position.pos, pct, output_);
  const Rect &r = layout.rect;
  if (r.width <= 0 || r.height <= 0)
    return;

  const Path shape = rounded_rect_path(r.x, r.y, r.width, r.height, layout.radius);

  if (ws.shadow_blur > 0) {
    draw_shape_shadow(out, shape, ws.shadow_blur, ws.shadow_offset_x,
                      ws.shadow_offset_y,
                      color_or(ws.shadow_color, Rgba{0, 0, 0, 0.4}));
  }

  /// Center crop of the camera image to the overlay aspect
  const double cam_ar = static_cast<double>(webcam.cols) / webcam.rows;
  const double target_ar = r.width / r.height;
  double sx = 0, sy = 0, sw = webcam.cols, sh = webcam.rows;
  if (cam_ar > target_ar) {
    sw = webcam.rows * target_ar;
    sx = (webcam.cols - sw) / 2.0;
  } else {
    sh = webcam.cols / target_ar;
    sy = (webcam.rows - sh) / 2.0;
  }

  const double kx = r.width / sw;
  const double ky = r.height / sh;
  /// Mirrored horizontally in place when flipped
  const cv::Matx23d m =
      ws.is_flipped
          ? cv::Matx23d(-kx, 0.0, r.x + r.width + sx * kx, 0.0, ky, r.y - sy * ky)
          : cv::Matx23d(kx, 0.0, r.x - sx * kx, 0.0, ky, r.y - sy * ky);

  const cv::Rect roi = path_bounds(shape, 1.0, out.size());
  if (roi.empty())
    return;

  cv::Mat layer;
  cv::warpAffine(webcam, layer, into_roi(m, roi), roi.size(), cv::INTER_LINEAR,
                 cv::BORDER_REPLICATE);
  blend_layer(out, roi, layer, rasterize(shape, roi));
}

} // namespace cinecut
