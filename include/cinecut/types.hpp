/**
 * @file types.hpp
 * @brief Core data types shared by the render and export pipeline
 *
 * @details Contains the immutable inputs of the renderer:
 *          - Timeline regions (zoom, cut, speed) keyed by id
 *
 *          - Recorded mouse events and recording geometry
 *
 *          - CameraTransform produced by the transform engine
 */

#ifndef CINECUT_TYPES_HPP
#define CINECUT_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cinecut {

// **----- CONSTANTS -----**

/// Size of the I/O buffer handed to libavformat for custom reads.
constexpr size_t AVIO_BUFFER_SIZE = 256 * 1024; //< 256KB

// **----- TIMELINE REGIONS -----**

enum class ZoomMode { Auto, Fixed };

enum class TrimType { None, Start, End };

/**
 * @struct ZoomRegion
 * @brief Rectangular zoom/pan effect over [start_time, start_time+duration).
 * @note target_x/target_y are normalized to [-0.5, 0.5] around the frame
 *       center; the transform origin is target + 0.5.
 */
struct ZoomRegion {
  std::string id;
  double start_time = 0.0;
  double duration = 0.0;
  double zoom_level = 1.5;
  double target_x = 0.0;
  double target_y = 0.0;
  ZoomMode mode = ZoomMode::Auto;
  std::string easing = "Balanced";
  double transition_duration = 1.0;

  double end_time() const { return start_time + duration; }
};

/**
 * @struct CutRegion
 * @brief Source range removed from the export timeline.
 */
struct CutRegion {
  std::string id;
  double start_time = 0.0;
  double duration = 0.0;
  TrimType trim_type = TrimType::None;

  double end_time() const { return start_time + duration; }
};

/**
 * @struct SpeedRegion
 * @brief Source range played back at a constant speed factor (> 0).
 */
struct SpeedRegion {
  std::string id;
  double start_time = 0.0;
  double duration = 0.0;
  double speed = 1.0;

  double end_time() const { return start_time + duration; }
};

/// Regions of one type keyed by id. Iteration order carries no meaning.
template <typename T> using RegionMap = std::map<std::string, T>;

// **----- RECORDED INPUT -----**

enum class MouseEventType { Move, Click, Scroll };

/**
 * @struct MouseEvent
 * @brief One recorded pointer sample. Timestamps are in seconds.
 */
struct MouseEvent {
  double timestamp = 0.0; //< Seconds from recording start
  double x = 0.0;         //< Recording-space X
  double y = 0.0;         //< Recording-space Y
  MouseEventType type = MouseEventType::Move;
  bool pressed = false;           //< Click events: press (true) or release
  std::string cursor_image_key;   //< Key into the prepared cursor bitmaps
};

/**
 * @struct RecordingGeometry
 * @brief Captured region in source pixel space.
 */
struct RecordingGeometry {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
};

struct Size {
  double width = 0.0;
  double height = 0.0;
};

struct Rect {
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;
};

// **----- DERIVED VALUES -----**

/**
 * @struct CameraTransform
 * @brief Per-frame camera parameters.
 * @note origin_x/origin_y are fractions (0..1) of the content box;
 *       translation is in content-box pixels, applied before scaling.
 */
struct CameraTransform {
  double scale = 1.0;
  double translate_x = 0.0;
  double translate_y = 0.0;
  double origin_x = 0.5;
  double origin_y = 0.5;
};

} // namespace cinecut

#endif // CINECUT_TYPES_HPP
