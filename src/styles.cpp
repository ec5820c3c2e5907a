/**
 * @file styles.cpp
 * @brief Color parsing and style enum lookup
 */

#include "cinecut/styles.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace cinecut {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f')
    return 10 + (c - 'a');
  return -1;
}

bool parse_hex_color(const std::string &hex, Rgba &out) {
  for (char c : hex) {
    if (hex_value(c) < 0)
      return false;
  }

  auto pair = [&](size_t i) {
    return static_cast<uint8_t>(hex_value(hex[i]) * 16 + hex_value(hex[i + 1]));
  };
  auto single = [&](size_t i) {
    return static_cast<uint8_t>(hex_value(hex[i]) * 17);
  };

  Rgba c;
  if (hex.size() == 3) {
    c.r = single(0);
    c.g = single(1);
    c.b = single(2);
  } else if (hex.size() == 6 || hex.size() == 8) {
    c.r = pair(0);
    c.g = pair(2);
    c.b = pair(4);
    if (hex.size() == 8)
      c.a = pair(6) / 255.0;
  } else {
    return false;
  }
  out = c;
  return true;
}

/// Parse "rgb(...)"/"rgba(...)" argument list
bool parse_functional_color(const std::string &args, bool with_alpha,
                            Rgba &out) {
  std::vector<double> values;
  std::stringstream ss(args);
  std::string item;
  while (std::getline(ss, item, ',')) {
    char *end = nullptr;
    double v = std::strtod(item.c_str(), &end);
    if (end == item.c_str())
      return false;
    values.push_back(v);
  }

  if (values.size() != (with_alpha ? 4u : 3u))
    return false;

  auto channel = [](double v) {
    return static_cast<uint8_t>(std::max(0.0, std::min(255.0, v)));
  };
  Rgba c;
  c.r = channel(values[0]);
  c.g = channel(values[1]);
  c.b = channel(values[2]);
  c.a = with_alpha ? std::max(0.0, std::min(1.0, values[3])) : 1.0;
  out = c;
  return true;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // anonymous namespace

bool parse_color(const std::string &text, Rgba &out) {
  std::string s = to_lower(text);
  s.erase(std::remove_if(s.begin(), s.end(),
                         [](unsigned char c) { return std::isspace(c); }),
          s.end());
  if (s.empty())
    return false;

  if (s[0] == '#')
    return parse_hex_color(s.substr(1), out);

  if (s.back() != ')')
    return false;
  if (s.rfind("rgba(", 0) == 0)
    return parse_functional_color(s.substr(5, s.size() - 6), true, out);
  if (s.rfind("rgb(", 0) == 0)
    return parse_functional_color(s.substr(4, s.size() - 5), false, out);
  return false;
}

Rgba color_or(const std::string &text, const Rgba &fallback) {
  Rgba c;
  return parse_color(text, c) ? c : fallback;
}

BackgroundType background_type_from_string(const std::string &name) {
  if (name == "gradient")
    return BackgroundType::Gradient;
  if (name == "image")
    return BackgroundType::Image;
  if (name == "wallpaper")
    return BackgroundType::Wallpaper;
  return BackgroundType::Color;
}

WebcamShape webcam_shape_from_string(const std::string &name) {
  if (name == "circle")
    return WebcamShape::Circle;
  if (name == "rectangle")
    return WebcamShape::Rectangle;
  return WebcamShape::Square;
}

WebcamAnchor webcam_anchor_from_string(const std::string &name) {
  if (name == "top-left")
    return WebcamAnchor::TopLeft;
  if (name == "top-center")
    return WebcamAnchor::TopCenter;
  if (name == "top-right")
    return WebcamAnchor::TopRight;
  if (name == "left-center")
    return WebcamAnchor::LeftCenter;
  if (name == "right-center")
    return WebcamAnchor::RightCenter;
  if (name == "bottom-left")
    return WebcamAnchor::BottomLeft;
  if (name == "bottom-center")
    return WebcamAnchor::BottomCenter;
  return WebcamAnchor::BottomRight;
}

} // namespace cinecut
