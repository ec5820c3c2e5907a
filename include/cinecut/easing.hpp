/**
 * @file easing.hpp
 * @brief Named easing curves used by zoom transitions and click effects
 */

#ifndef CINECUT_EASING_HPP
#define CINECUT_EASING_HPP

#include <string>

namespace cinecut {

using EasingFn = double (*)(double);

/**
 * @brief Look up an easing curve by name.
 * @note Known names: Linear, Balanced, Smooth, Snappy, EaseOut, Bouncy.
 *       Unknown names resolve to Balanced. Every curve clamps its input to
 *       [0, 1] and maps 0 -> 0, 1 -> 1.
 */
EasingFn easing_by_name(const std::string &name);

/// Apply the named curve to t.
inline double ease(const std::string &name, double t) {
  return easing_by_name(name)(t);
}

double ease_linear(double t);
double ease_in_out_cubic(double t);
double ease_out_cubic(double t);

inline double lerp(double start, double end, double t) {
  return start * (1.0 - t) + end * t;
}

} // namespace cinecut

#endif // CINECUT_EASING_HPP
