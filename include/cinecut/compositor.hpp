/**
 * @file compositor.hpp
 * @brief Per-frame scene composition
 *
 * @details Draws one output frame, in order:
 *
 *          1. Background (solid, gradient or cover-fit image)
 *
 *          2. Framed main video under the camera transform: drop shadow,
 *             rounded clip, inner border
 *
 *          3. Click ripples and the replayed cursor (same camera transform)
 *
 *          4. Webcam overlay anchored to a corner or edge
 *
 * @note All surfaces are CV_8UC4 in RGBA channel order. Recording-space
 *       coordinates map to content space as
 *       coord / recording dimension * content dimension.
 */

#ifndef CINECUT_COMPOSITOR_HPP
#define CINECUT_COMPOSITOR_HPP

#include <vector>

#include <opencv2/core.hpp>

#include "cursor_bitmaps.hpp"
#include "styles.hpp"
#include "transform.hpp"
#include "types.hpp"

namespace cinecut {

/**
 * @struct Scene
 * @brief Immutable per-project inputs of the compositor.
 */
struct Scene {
  RegionMap<ZoomRegion> zoom_regions;
  std::vector<MouseEvent> events; //< Sorted by timestamp
  Size recording;                 //< Recording geometry (mouse space)
  Size video;                     //< Main video dimensions
  CursorBitmapSet cursors;
  SceneStyles styles;
};

// **---- Layout helpers ----**

/**
 * @brief Content rectangle: the video aspect fitted inside
 *        (1 - 2 * padding%) of the output, centered.
 */
Rect fit_content_rect(const cv::Size &output, const Size &video,
                      double padding_percent);

/**
 * @brief Webcam size in percent of min(outW, outH) at time t.
 * @note Follows the zoom envelope of the active region when scale_on_zoom
 *       is set, otherwise always WebcamStyles::size.
 */
double webcam_size_percent(const WebcamStyles &styles,
                           const RegionMap<ZoomRegion> &zoom_regions,
                           double t);

/**
 * @struct WebcamLayout
 * @brief Placement of the webcam overlay in output pixels.
 */
struct WebcamLayout {
  Rect rect;
  double radius = 0.0;
};

WebcamLayout layout_webcam(const WebcamStyles &styles, WebcamAnchor anchor,
                           double size_percent, const cv::Size &output);

/**
 * @brief Cursor scale of the click pulse at time t (1 when idle).
 * @note Keyed to the most recent press within the pulse duration:
 *       1 - (1 - amount) * sin(eased * PI).
 */
double click_scale_at(const CursorStyles &styles,
                      const std::vector<MouseEvent> &events, double t);

/// Affine map from content-box coordinates to output pixels
cv::Matx23d camera_matrix(const Rect &content, const CameraTransform &tf);

/**
 * @class SceneCompositor
 * @brief Composes output frames for one project at a fixed output size.
 *
 * @note The only state kept between frames is the rendered background,
 *       which depends on the output size alone.
 */
class SceneCompositor {
public:
  SceneCompositor(const Scene &scene, cv::Size output);

  /// Disable copy
  SceneCompositor(const SceneCompositor &) = delete;
  SceneCompositor &operator=(const SceneCompositor &) = delete;

  /**
   * @brief Render the background (loads image backgrounds).
   * @note Never fails: an unreadable image falls back to a solid fill.
   */
  void initialize();

  /**
   * @brief Compose the frame visible at source time t.
   * @param video Main video frame (RGBA)
   * @param webcam Webcam frame (RGBA) or nullptr
   * @param out Output surface, (re)allocated to the output size
   * @param pan Pan context carried across consecutive frames
   */
  void compose(double t, const cv::Mat &video, const cv::Mat *webcam,
               cv::Mat &out, ZoomPanContext *pan = nullptr);

  const cv::Size &output_size() const { return output_; }

private:
  void render_background();
  void draw_video(cv::Mat &out, const cv::Mat &video, const Rect &content,
                  const cv::Matx23d &camera) const;
  void draw_ripples(cv::Mat &out, double t, const Rect &content,
                    const cv::Matx23d &camera, double scale) const;
  void draw_cursor(cv::Mat &out, double t, const Rect &content,
                   const cv::Matx23d &camera, double scale) const;
  void draw_webcam(cv::Mat &out, double t, const cv::Mat &webcam) const;

  const Scene &scene_;
  cv::Size output_;
  cv::Mat background_;
};

} // namespace cinecut

#endif // CINECUT_COMPOSITOR_HPP
