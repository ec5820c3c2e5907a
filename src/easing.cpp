/**
 * @file easing.cpp
 * @brief Easing curve implementations
 */

#include "cinecut/easing.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace cinecut {

namespace {

constexpr double PI = 3.14159265358979323846;

double clamp01(double t) { return std::min(1.0, std::max(0.0, t)); }

double ease_in_out_sine(double t) {
  t = clamp01(t);
  return -(std::cos(PI * t) - 1.0) / 2.0;
}

double ease_out_quart(double t) {
  t = clamp01(t);
  return 1.0 - std::pow(1.0 - t, 4.0);
}

double ease_out_back(double t) {
  t = clamp01(t);
  const double c1 = 1.70158;
  const double c3 = c1 + 1.0;
  return 1.0 + c3 * std::pow(t - 1.0, 3.0) + c1 * std::pow(t - 1.0, 2.0);
}

} // namespace

double ease_linear(double t) { return clamp01(t); }

double ease_in_out_cubic(double t) {
  t = clamp01(t);
  return t < 0.5 ? 4.0 * t * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 3.0) / 2.0;
}

double ease_out_cubic(double t) {
  t = clamp01(t);
  return 1.0 - std::pow(1.0 - t, 3.0);
}

EasingFn easing_by_name(const std::string &name) {
  static const std::pair<const char *, EasingFn> table[] = {
      {"Linear", ease_linear},       {"Balanced", ease_in_out_cubic},
      {"Smooth", ease_in_out_sine},  {"Snappy", ease_out_quart},
      {"EaseOut", ease_out_cubic},   {"Bouncy", ease_out_back},
  };
  for (const auto &entry : table) {
    if (name == entry.first)
      return entry.second;
  }
  return ease_in_out_cubic;
}

} // namespace cinecut
