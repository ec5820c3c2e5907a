/**
 * @file transform.hpp
 * @brief Camera transform engine (auto zoom and bounded pan)
 *
 * @details Computes, for a source timestamp, the camera scale, translation
 *          and origin applied to the framed video. Every active zoom region
 *          runs three phases:
 *
 *          1. Zoom-in: scale eases 1 -> zoomLevel, translation eases toward
 *             the pan target at the end of the zoom-in
 *
 *          2. Hold: scale pinned, translation follows the smoothed cursor
 *
 *          3. Zoom-out: scale eases back to 1, translation eases from the
 *             pan target at the start of the zoom-out back to 0
 *
 * @note The result depends only on its inputs. ZoomPanContext caches the
 *       per-region pan anchors between calls and resets itself whenever a
 *       different region becomes active.
 */

#ifndef CINECUT_TRANSFORM_HPP
#define CINECUT_TRANSFORM_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace cinecut {

struct Point {
  double x = 0.0;
  double y = 0.0;
};

struct PanOffset {
  double tx = 0.0;
  double ty = 0.0;
};

/**
 * @struct SmoothingParams
 * @brief Cursor smoothing tunables (see Config for defaults).
 */
struct SmoothingParams {
  double factor = 0.07;   //< EMA rate per event
  double dead_zone = 10.0; //< Pixels; shorter moves use 30% of the rate
  double window = 0.5;    //< Seconds of history replayed per query

  static SmoothingParams from_config();
};

/**
 * @brief Index of the last event with timestamp <= t (binary search).
 * @return -1 if no such event
 */
int find_last_event_index(const std::vector<MouseEvent> &events, double t);

/**
 * @brief Exponentially smoothed cursor position at time t.
 * @note Seeds at the last event at/before (t - window), replays events up
 *       to t, then interpolates toward the next event for sub-sample
 *       accuracy. Returns nullopt when no event precedes t.
 */
std::optional<Point> smoothed_mouse_position(const std::vector<MouseEvent> &events,
                                             double t,
                                             const SmoothingParams &params);

/**
 * @struct PanBounds
 * @brief Allowed translation range keeping the zoomed window inside the
 *        content rectangle.
 */
struct PanBounds {
  double min_tx, max_tx;
  double min_ty, max_ty;
};

PanBounds pan_bounds(const Point &origin, double zoom_level,
                     const Size &content);

/**
 * @brief Translation that centers the cursor, clamped to pan_bounds.
 * @param mouse Smoothed cursor in recording space (nullopt -> no pan)
 * @param origin Transform origin as fractions of the content box
 */
PanOffset calculate_bounded_pan(const std::optional<Point> &mouse,
                                const Point &origin, double zoom_level,
                                const Size &recording, const Size &content);

// **---- Zoom Envelope ----**

enum class ZoomPhase { ZoomIn, Hold, ZoomOut };

/**
 * @struct ZoomEnvelope
 * @brief Phase of a zoom region at time t and the eased progress within
 *        the transition phases (1 while holding).
 */
struct ZoomEnvelope {
  ZoomPhase phase;
  double progress;     //< Eased progress of the current phase
  double zoom_in_end;  //< start + transition
  double zoom_out_start; //< end - transition
};

/**
 * @brief Envelope of an active region. The transition is limited to half
 *        the region so the phases never overlap.
 */
ZoomEnvelope zoom_envelope(const ZoomRegion &region, double t);

/**
 * @struct ZoomPanContext
 * @brief Per-session pan state threaded through calculate_zoom_transform.
 * @note Holds the pan anchors of the region that was active on the last
 *       call. A different (or edited) region invalidates it.
 */
struct ZoomPanContext {
  bool valid = false;
  std::string region_id;
  double start_time = 0.0;
  double duration = 0.0;
  double zoom_level = 1.0;
  double transition = 0.0;
  double target_x = 0.0;
  double target_y = 0.0;
  Size content;
  PanOffset zoom_in_pan;  //< Pan target at the end of the zoom-in
  PanOffset zoom_out_pan; //< Pan target at the start of the zoom-out

  void reset() { valid = false; }

  /// True when the cached anchors belong to this region and content box
  bool matches(const ZoomRegion &region, const Size &content_box) const;
};

/**
 * @brief Camera transform at time t.
 * @param recording Recording geometry size (mouse coordinate space)
 * @param content Framed content box size in output pixels
 * @param context Optional pan context (nullptr = recompute anchors)
 * @return Identity transform when no zoom region is active
 */
CameraTransform
calculate_zoom_transform(double t, const RegionMap<ZoomRegion> &regions,
                         const std::vector<MouseEvent> &events,
                         const Size &recording, const Size &content,
                         ZoomPanContext *context = nullptr,
                         const SmoothingParams &params = SmoothingParams::from_config());

} // namespace cinecut

#endif // CINECUT_TRANSFORM_HPP
