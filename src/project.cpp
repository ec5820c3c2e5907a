/**
 * @file project.cpp
 * @brief Project document and metadata loading implementation
 */

#include "cinecut/project.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "cinecut/config.hpp"
#include "cinecut/logging.hpp"
#include "cinecut/timeline.hpp"

namespace cinecut {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// **---- Field readers ----**

bool read_json_file(const std::string &path, json &root) {
  std::ifstream in(path);
  if (!in) {
    LOG_ERROR("Failed to open file: {}", path);
    return false;
  }
  try {
    in >> root;
  } catch (const json::exception &e) {
    LOG_ERROR("Failed to parse {}: {}", path, e.what());
    return false;
  }
  return true;
}

std::string resolve_path(const std::string &base_dir, const std::string &p) {
  if (p.empty())
    return p;
  fs::path path(p);
  if (path.is_relative() && !base_dir.empty())
    path = fs::path(base_dir) / path;
  return path.lexically_normal().string();
}

MouseEventType event_type_from_string(const std::string &name) {
  if (name == "click")
    return MouseEventType::Click;
  if (name == "scroll")
    return MouseEventType::Scroll;
  return MouseEventType::Move;
}

MouseEvent read_event(const json &j) {
  MouseEvent ev;
  ev.timestamp = j.value("timestamp", 0.0) / 1000.0;
  ev.x = j.value("x", 0.0);
  ev.y = j.value("y", 0.0);
  ev.type = event_type_from_string(j.value("type", std::string("move")));
  ev.pressed = j.value("pressed", false);
  ev.cursor_image_key = j.value("cursorImageKey", std::string());
  return ev;
}

void read_background(const json &j, Background &bg) {
  bg.type = background_type_from_string(j.value("type", std::string("color")));
  bg.color = j.value("color", bg.color);
  bg.gradient_start = j.value("gradientStart", bg.gradient_start);
  bg.gradient_end = j.value("gradientEnd", bg.gradient_end);
  bg.gradient_direction = j.value("gradientDirection", bg.gradient_direction);
  bg.image_path = j.value("imageUrl", bg.image_path);
  bg.image_path = j.value("imagePath", bg.image_path);
}

void read_frame_styles(const json &j, FrameStyles &s) {
  s.padding = j.value("padding", s.padding);
  s.border_radius = j.value("borderRadius", s.border_radius);
  s.shadow_blur = j.value("shadowBlur", s.shadow_blur);
  s.shadow_offset_x = j.value("shadowOffsetX", s.shadow_offset_x);
  s.shadow_offset_y = j.value("shadowOffsetY", s.shadow_offset_y);
  s.shadow_color = j.value("shadowColor", s.shadow_color);
  s.border_width = j.value("borderWidth", s.border_width);
  s.border_color = j.value("borderColor", s.border_color);
  if (j.contains("background") && j["background"].is_object())
    read_background(j["background"], s.background);
}

void read_cursor_styles(const json &j, CursorStyles &s) {
  s.show_cursor = j.value("showCursor", s.show_cursor);
  s.shadow_blur = j.value("shadowBlur", s.shadow_blur);
  s.shadow_offset_x = j.value("shadowOffsetX", s.shadow_offset_x);
  s.shadow_offset_y = j.value("shadowOffsetY", s.shadow_offset_y);
  s.shadow_color = j.value("shadowColor", s.shadow_color);
  s.click_ripple_effect = j.value("clickRippleEffect", s.click_ripple_effect);
  s.click_ripple_color = j.value("clickRippleColor", s.click_ripple_color);
  s.click_ripple_size = j.value("clickRippleSize", s.click_ripple_size);
  s.click_ripple_duration =
      j.value("clickRippleDuration", s.click_ripple_duration);
  s.click_scale_effect = j.value("clickScaleEffect", s.click_scale_effect);
  s.click_scale_amount = j.value("clickScaleAmount", s.click_scale_amount);
  s.click_scale_duration = j.value("clickScaleDuration", s.click_scale_duration);
  s.click_scale_easing = j.value("clickScaleEasing", s.click_scale_easing);
}

void read_webcam_styles(const json &j, WebcamStyles &s) {
  if (j.contains("shape"))
    s.shape = webcam_shape_from_string(j["shape"].get<std::string>());
  s.border_radius = j.value("borderRadius", s.border_radius);
  s.size = j.value("size", s.size);
  s.size_on_zoom = j.value("sizeOnZoom", s.size_on_zoom);
  s.shadow_blur = j.value("shadowBlur", s.shadow_blur);
  s.shadow_offset_x = j.value("shadowOffsetX", s.shadow_offset_x);
  s.shadow_offset_y = j.value("shadowOffsetY", s.shadow_offset_y);
  s.shadow_color = j.value("shadowColor", s.shadow_color);
  s.is_flipped = j.value("isFlipped", s.is_flipped);
  s.scale_on_zoom = j.value("scaleOnZoom", s.scale_on_zoom);
}

ZoomRegion read_zoom_region(const json &j) {
  ZoomRegion r;
  r.start_time = j.value("startTime", 0.0);
  r.duration = j.value("duration", 0.0);
  r.zoom_level = j.value("zoomLevel", r.zoom_level);
  r.target_x = j.value("targetX", 0.0);
  r.target_y = j.value("targetY", 0.0);
  r.mode = (j.value("mode", std::string("auto")) == "fixed") ? ZoomMode::Fixed
                                                             : ZoomMode::Auto;
  r.easing = j.value("easing", r.easing);
  r.transition_duration =
      j.value("transitionDuration", r.transition_duration);
  return r;
}

CutRegion read_cut_region(const json &j) {
  CutRegion r;
  r.start_time = j.value("startTime", 0.0);
  r.duration = j.value("duration", 0.0);
  const std::string trim = j.value("trimType", std::string());
  if (trim == "start")
    r.trim_type = TrimType::Start;
  else if (trim == "end")
    r.trim_type = TrimType::End;
  return r;
}

SpeedRegion read_speed_region(const json &j) {
  SpeedRegion r;
  r.start_time = j.value("startTime", 0.0);
  r.duration = j.value("duration", 0.0);
  r.speed = j.value("speed", 1.0);
  return r;
}

/// Regions are stored either as an object keyed by id or as an array
template <typename T, typename Reader>
void read_regions(const json &root, const char *key, RegionMap<T> &out,
                  Reader read_one) {
  auto it = root.find(key);
  if (it == root.end() || it->is_null())
    return;

  auto add = [&](const std::string &fallback_id, const json &j) {
    T region = read_one(j);
    region.id = j.value("id", fallback_id);
    out[region.id] = region;
  };

  if (it->is_object()) {
    for (const auto &el : it->items())
      add(el.key(), el.value());
  } else if (it->is_array()) {
    size_t i = 0;
    for (const auto &el : *it)
      add(fmt::format("{}-{}", key, i++), el);
  } else {
    LOG_WARN("Ignoring \"{}\": expected an object or array", key);
  }
}

template <typename T>
void clamp_regions(RegionMap<T> &regions, double source_duration,
                   const char *kind) {
  for (auto &entry : regions) {
    T &r = entry.second;
    if (r.start_time < 0.0)
      r.start_time = 0.0;
    const double available = source_duration - r.start_time;
    const double clamped = std::max(MIN_REGION_DURATION,
                                    std::min(r.duration, available));
    if (clamped != r.duration) {
      LOG_DEBUG("Clamped {} region {} duration {:.3f} -> {:.3f}", kind,
                r.id, r.duration, clamped);
      r.duration = clamped;
    }
  }
}

template <typename T>
void warn_overlaps(const RegionMap<T> &regions, const char *kind) {
  for (const auto &pair : find_overlapping_regions(regions)) {
    LOG_WARN("Overlapping {} regions {} and {}: the earlier one wins", kind,
             pair.first, pair.second);
  }
}

} // anonymous namespace

// **---- Recorded metadata ----**

bool parse_recording_metadata(const json &root, RecordingMetadata &meta) {
  if (!root.is_object()) {
    LOG_ERROR("Metadata is not a JSON object");
    return false;
  }

  try {
    meta.platform = root.value("platform", std::string("linux"));
    meta.sync_offset = root.value("syncOffset", 0.0) / 1000.0;
    meta.scale_factor = root.value("scaleFactor", 1.0);

    if (root.contains("screenSize") && root["screenSize"].is_object()) {
      const json &s = root["screenSize"];
      meta.screen_size = {s.value("width", 0.0), s.value("height", 0.0)};
    }

    meta.has_geometry = false;
    if (root.contains("geometry") && root["geometry"].is_object()) {
      const json &g = root["geometry"];
      meta.geometry = {g.value("x", 0.0), g.value("y", 0.0),
                       g.value("width", 0.0), g.value("height", 0.0)};
      meta.has_geometry = meta.geometry.width > 0 && meta.geometry.height > 0;
    }

    meta.cursor_images.clear();
    if (root.contains("cursorImages") && root["cursorImages"].is_object()) {
      for (const auto &el : root["cursorImages"].items()) {
        if (el.value().is_object())
          meta.cursor_images[el.key()] = cursor_image_from_json(el.value());
      }
    }

    meta.events.clear();
    if (root.contains("events") && root["events"].is_array()) {
      meta.events.reserve(root["events"].size());
      for (const auto &ev : root["events"]) {
        meta.events.push_back(read_event(ev));
        meta.events.back().timestamp += meta.sync_offset;
      }
    }
  } catch (const json::exception &e) {
    LOG_ERROR("Invalid metadata: {}", e.what());
    return false;
  }

  /// Binary searches over the events need timestamp order
  std::stable_sort(meta.events.begin(), meta.events.end(),
                   [](const MouseEvent &a, const MouseEvent &b) {
                     return a.timestamp < b.timestamp;
                   });
  return true;
}

bool load_recording_metadata(const std::string &path, RecordingMetadata &meta) {
  TIMER_START(load_metadata);
  json root;
  if (!read_json_file(path, root))
    return false;
  if (!parse_recording_metadata(root, meta))
    return false;
  LOG_INFO("Loaded {} mouse events ({} cursor images, platform {})",
           meta.events.size(), meta.cursor_images.size(), meta.platform);
  TIMER_END(load_metadata);
  return true;
}

RecordingGeometry scale_geometry(const RecordingGeometry &geometry,
                                 double factor) {
  return {std::floor(geometry.x * factor), std::floor(geometry.y * factor),
          std::floor(geometry.width * factor),
          std::floor(geometry.height * factor)};
}

// **---- Auto zoom ----**

RegionMap<ZoomRegion>
generate_auto_zoom_regions(const std::vector<MouseEvent> &events,
                           const Size &geometry) {
  RegionMap<ZoomRegion> regions;
  if (geometry.width <= 0 || geometry.height <= 0)
    return regions;

  std::vector<const MouseEvent *> clicks;
  for (const auto &ev : events) {
    if (ev.type == MouseEventType::Click && ev.pressed)
      clicks.push_back(&ev);
  }
  if (clicks.empty())
    return regions;

  /// Clicks closer than the minimum duration share one region
  std::vector<std::vector<const MouseEvent *>> groups;
  groups.push_back({clicks[0]});
  for (size_t i = 1; i < clicks.size(); ++i) {
    auto &current = groups.back();
    if (clicks[i]->timestamp - current.back()->timestamp <
        AUTO_ZOOM_MIN_DURATION) {
      current.push_back(clicks[i]);
    } else {
      groups.push_back({clicks[i]});
    }
  }

  for (size_t i = 0; i < groups.size(); ++i) {
    const MouseEvent &first = *groups[i].front();
    const MouseEvent &last = *groups[i].back();

    ZoomRegion r;
    r.id = fmt::format("auto-zoom-{}", i);
    r.start_time = std::max(0.0, first.timestamp - AUTO_ZOOM_PRE_CLICK_OFFSET);
    const double end = last.timestamp + AUTO_ZOOM_POST_CLICK_PADDING;
    r.duration = std::max(AUTO_ZOOM_MIN_DURATION, end - r.start_time);
    r.zoom_level = AUTO_ZOOM_LEVEL;
    r.easing = "Balanced";
    r.transition_duration = AUTO_ZOOM_TRANSITION;
    r.target_x = first.x / geometry.width - 0.5;
    r.target_y = first.y / geometry.height - 0.5;
    r.mode = ZoomMode::Auto;
    regions[r.id] = r;
  }
  return regions;
}

// **---- Project ----**

bool parse_project(const json &root, const std::string &base_dir,
                   Project &project) {
  if (!root.is_object()) {
    LOG_ERROR("Project is not a JSON object");
    return false;
  }

  try {
    project.video_path =
        resolve_path(base_dir, root.value("videoPath", std::string()));
    project.webcam_video_path =
        resolve_path(base_dir, root.value("webcamVideoPath", std::string()));
    project.audio_path =
        resolve_path(base_dir, root.value("audioPath", std::string()));
    project.metadata_path =
        resolve_path(base_dir, root.value("metadataPath", std::string()));
    project.cursor_theme_path =
        resolve_path(base_dir, root.value("cursorThemePath", std::string()));
    project.aspect_ratio = root.value("aspectRatio", project.aspect_ratio);

    SceneStyles &styles = project.scene.styles;
    if (root.contains("frameStyles") && root["frameStyles"].is_object())
      read_frame_styles(root["frameStyles"], styles.frame);
    if (root.contains("cursorStyles") && root["cursorStyles"].is_object())
      read_cursor_styles(root["cursorStyles"], styles.cursor);
    if (root.contains("webcamStyles") && root["webcamStyles"].is_object())
      read_webcam_styles(root["webcamStyles"], styles.webcam);
    if (root.contains("webcamPosition") && root["webcamPosition"].is_object()) {
      styles.webcam_position.pos = webcam_anchor_from_string(
          root["webcamPosition"].value("pos", std::string("bottom-right")));
    }
    styles.webcam_visible = root.value("isWebcamVisible", true);

    project.auto_zoom_pending = !root.contains("zoomRegions");
    read_regions<ZoomRegion>(root, "zoomRegions", project.scene.zoom_regions,
                             read_zoom_region);
    read_regions<CutRegion>(root, "cutRegions", project.cut_regions,
                            read_cut_region);
    read_regions<SpeedRegion>(root, "speedRegions", project.speed_regions,
                              read_speed_region);

    for (auto &entry : project.speed_regions) {
      if (entry.second.speed <= 0.0) {
        LOG_WARN("Speed region {} has invalid speed {}, using 1.0",
                 entry.first, entry.second.speed);
        entry.second.speed = 1.0;
      }
    }

    if (root.contains("export") && root["export"].is_object()) {
      const json &ex = root["export"];
      ExportSettings &settings = project.export_settings;
      if (ex.contains("format") &&
          !parse_export_format(ex["format"].get<std::string>(), settings.format))
        LOG_WARN("Unknown export format, using {}", to_string(settings.format));
      if (ex.contains("resolution") &&
          !parse_resolution(ex["resolution"].get<std::string>(),
                            settings.resolution))
        LOG_WARN("Unknown resolution, using {}", to_string(settings.resolution));
      if (ex.contains("quality") &&
          !parse_quality(ex["quality"].get<std::string>(), settings.quality))
        LOG_WARN("Unknown quality, using {}", to_string(settings.quality));
      settings.fps = ex.value("fps", settings.fps);
    }
  } catch (const json::exception &e) {
    LOG_ERROR("Invalid project document: {}", e.what());
    return false;
  }

  if (project.video_path.empty()) {
    LOG_ERROR("Project has no videoPath");
    return false;
  }
  return true;
}

bool load_project(const std::string &path, Project &project) {
  json root;
  if (!read_json_file(path, root))
    return false;

  const std::string base_dir = fs::path(path).parent_path().string();
  if (!parse_project(root, base_dir, project))
    return false;

  if (project.metadata_path.empty()) {
    LOG_WARN("Project has no metadataPath: cursor and auto zoom disabled");
    return true;
  }
  if (!load_recording_metadata(project.metadata_path, project.metadata))
    return false;

  project.scene.events = project.metadata.events;
  return true;
}

void finalize_project(Project &project, const Size &video,
                      double source_duration) {
  RecordingMetadata &meta = project.metadata;
  Scene &scene = project.scene;

  /// Mouse coordinates live in the captured region, else the whole screen
  Size recording = video;
  if (meta.screen_size.width > 0 && meta.screen_size.height > 0)
    recording = meta.screen_size;
  if (meta.has_geometry) {
    RecordingGeometry g = meta.geometry;
    if (meta.platform == "win32" && meta.scale_factor != 1.0)
      g = scale_geometry(g, meta.scale_factor);
    if (g.width > 0 && g.height > 0)
      recording = {g.width, g.height};
  }
  scene.recording = recording;
  scene.video = video;
  scene.events = meta.events;

  if (project.auto_zoom_pending) {
    scene.zoom_regions = generate_auto_zoom_regions(meta.events, recording);
    project.auto_zoom_pending = false;
    LOG_INFO("Generated {} auto zoom regions", scene.zoom_regions.size());
  }

  if (source_duration > 0.0) {
    clamp_regions(scene.zoom_regions, source_duration, "zoom");
    clamp_regions(project.cut_regions, source_duration, "cut");
    clamp_regions(project.speed_regions, source_duration, "speed");
  }

  warn_overlaps(scene.zoom_regions, "zoom");
  warn_overlaps(project.cut_regions, "cut");
  warn_overlaps(project.speed_regions, "speed");

  // **---- Cursor bitmaps ----**

  CursorTheme theme;
  const bool themed = meta.platform == "win32" || meta.platform == "darwin";
  if (themed) {
    if (project.cursor_theme_path.empty())
      LOG_WARN("No cursor theme for {} recording: cursor hidden", meta.platform);
    else if (!load_cursor_theme(project.cursor_theme_path, theme))
      LOG_WARN("Cursor theme unavailable: cursor hidden");
  }

  auto preparer = make_cursor_preparer(meta.platform, meta.cursor_images,
                                       theme, Config::cursor_scale());
  scene.cursors = preparer->prepare();
  LOG_INFO("Prepared {} cursor bitmaps ({})", scene.cursors.size(),
           preparer->name());
}

} // namespace cinecut
