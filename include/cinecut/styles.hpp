/**
 * @file styles.hpp
 * @brief Visual style settings of the composed frame
 *
 * @details Plain value structs consumed by the SceneCompositor:
 *          - FrameStyles (padding, corners, border, shadow, background)
 *
 *          - WebcamStyles and WebcamPosition for the camera overlay
 *
 *          - CursorStyles (cursor shadow, click ripple, click scale)
 *
 * @note Defaults match a freshly created project.
 */

#ifndef CINECUT_STYLES_HPP
#define CINECUT_STYLES_HPP

#include <cstdint>
#include <string>

namespace cinecut {

/**
 * @struct Rgba
 * @brief 8-bit color with a fractional alpha.
 */
struct Rgba {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
  double a = 1.0; //< 0..1
};

/**
 * @brief Parse a CSS-style color.
 * @note Accepts #rgb, #rrggbb, #rrggbbaa, rgb(r, g, b) and
 *       rgba(r, g, b, a).
 * @return false if the string is not a recognized color (out untouched)
 */
bool parse_color(const std::string &text, Rgba &out);

/// parse_color with a fallback for unparsable input
Rgba color_or(const std::string &text, const Rgba &fallback);

// **----- FRAME -----**

enum class BackgroundType { Color, Gradient, Image, Wallpaper };

struct Background {
  BackgroundType type = BackgroundType::Color;
  std::string color = "#111827";
  std::string gradient_start = "#000000";
  std::string gradient_end = "#ffffff";
  std::string gradient_direction = "to right";
  std::string image_path; //< Image/wallpaper file (cover-fit)
};

BackgroundType background_type_from_string(const std::string &name);

/// Fill used when an image background cannot be loaded
inline Rgba fallback_background_color() { return Rgba{15, 23, 42, 1.0}; }

struct FrameStyles {
  double padding = 5.0;        //< Percent of the output on each side
  double border_radius = 16.0; //< Output pixels
  double shadow_blur = 35.0;
  double shadow_offset_x = 0.0;
  double shadow_offset_y = 15.0;
  std::string shadow_color = "rgba(0, 0, 0, 0.8)";
  double border_width = 4.0;
  std::string border_color = "rgba(255, 255, 255, 0.2)";
  Background background;
};

// **----- WEBCAM -----**

enum class WebcamShape { Circle, Square, Rectangle };

enum class WebcamAnchor {
  TopLeft,
  TopCenter,
  TopRight,
  LeftCenter,
  RightCenter,
  BottomLeft,
  BottomCenter,
  BottomRight
};

WebcamShape webcam_shape_from_string(const std::string &name);
WebcamAnchor webcam_anchor_from_string(const std::string &name);

struct WebcamStyles {
  WebcamShape shape = WebcamShape::Square;
  double border_radius = 35.0; //< 0..50, percent of the largest radius
  double size = 40.0;          //< Percent of min(outW, outH)
  double size_on_zoom = 40.0;  //< Size while a zoom region holds
  double shadow_blur = 20.0;
  double shadow_offset_x = 0.0;
  double shadow_offset_y = 10.0;
  std::string shadow_color = "rgba(0, 0, 0, 0.4)";
  bool is_flipped = false;
  bool scale_on_zoom = true;
};

struct WebcamPosition {
  WebcamAnchor pos = WebcamAnchor::BottomRight;
};

// **----- CURSOR -----**

struct CursorStyles {
  bool show_cursor = true;
  double shadow_blur = 6.0;
  double shadow_offset_x = 3.0;
  double shadow_offset_y = 3.0;
  std::string shadow_color = "rgba(0, 0, 0, 0.4)";

  bool click_ripple_effect = false;
  std::string click_ripple_color = "rgba(255, 255, 255, 0.8)";
  double click_ripple_size = 30.0;
  double click_ripple_duration = 0.5;

  bool click_scale_effect = true;
  double click_scale_amount = 0.8;
  double click_scale_duration = 0.4;
  std::string click_scale_easing = "Balanced";
};

/**
 * @struct SceneStyles
 * @brief Every style the compositor reads for one project.
 */
struct SceneStyles {
  FrameStyles frame;
  CursorStyles cursor;
  WebcamStyles webcam;
  WebcamPosition webcam_position;
  bool webcam_visible = true;
};

} // namespace cinecut

#endif // CINECUT_STYLES_HPP
