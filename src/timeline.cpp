/**
 * @file timeline.cpp
 * @brief Timeline remapping implementation
 */

#include "cinecut/timeline.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace cinecut {

double export_duration(double source_duration,
                       const RegionMap<CutRegion> &cuts,
                       const RegionMap<SpeedRegion> &speeds) {
  return total_exported_duration(
      plan_playback_segments(std::max(0.0, source_duration), cuts, speeds));
}

double total_exported_duration(const std::vector<PlaybackSegment> &segments) {
  double result = 0.0;
  for (const auto &seg : segments)
    result += seg.exported_duration();
  return result;
}

std::vector<double> timeline_breakpoints(double source_duration,
                                         const RegionMap<CutRegion> &cuts,
                                         const RegionMap<SpeedRegion> &speeds) {
  std::vector<double> times;
  times.reserve(2 + 2 * (cuts.size() + speeds.size()));
  times.push_back(0.0);
  times.push_back(source_duration);

  auto add = [&times, source_duration](double t) {
    times.push_back(std::min(source_duration, std::max(0.0, t)));
  };
  for (const auto &entry : cuts) {
    add(entry.second.start_time);
    add(entry.second.end_time());
  }
  for (const auto &entry : speeds) {
    add(entry.second.start_time);
    add(entry.second.end_time());
  }

  std::sort(times.begin(), times.end());
  times.erase(std::unique(times.begin(), times.end()), times.end());
  return times;
}

std::vector<PlaybackSegment>
plan_playback_segments(double source_duration,
                       const RegionMap<CutRegion> &cuts,
                       const RegionMap<SpeedRegion> &speeds) {
  std::vector<PlaybackSegment> segments;
  const std::vector<double> times =
      timeline_breakpoints(source_duration, cuts, speeds);

  for (size_t i = 0; i + 1 < times.size(); ++i) {
    const double start = times[i];
    const double duration = times[i + 1] - start;
    if (duration <= 0)
      continue;

    /// Segments never straddle a boundary, so testing the start suffices
    if (find_active_region(cuts, start))
      continue;

    const SpeedRegion *speed = find_active_region(speeds, start);
    const double factor = (speed && speed->speed > 0) ? speed->speed : 1.0;
    segments.push_back({start, duration, factor});
  }
  return segments;
}

// **---- TimelineRemapper ----**

TimelineRemapper::TimelineRemapper(double source_duration,
                                   const RegionMap<CutRegion> &cuts,
                                   const RegionMap<SpeedRegion> &speeds)
    : source_duration_(std::max(0.0, source_duration)),
      has_regions_(!cuts.empty() || !speeds.empty()),
      segments_(plan_playback_segments(source_duration_, cuts, speeds)),
      export_duration_(total_exported_duration(segments_)) {}

double TimelineRemapper::clamp_to_source(double t) const {
  if (t <= 0)
    return 0.0;
  if (source_duration_ <= 0)
    return 0.0;
  /// Half-open: the last representable instant before the end
  const double last = std::nextafter(source_duration_, 0.0);
  return std::min(t, last);
}

double TimelineRemapper::to_source(double export_time) const {
  if (!has_regions_ || export_duration_ <= 0 || segments_.empty()) {
    return clamp_to_source(export_time);
  }
  if (export_time <= 0) {
    return clamp_to_source(segments_.front().start);
  }

  double accumulated = 0.0;
  for (const auto &seg : segments_) {
    const double exported = seg.exported_duration();
    if (accumulated + exported > export_time) {
      return clamp_to_source(seg.start +
                             (export_time - accumulated) * seg.speed);
    }
    accumulated += exported;
  }

  /// Past the end of the edited timeline: hold the last kept instant
  const PlaybackSegment &last = segments_.back();
  return clamp_to_source(last.start + last.duration);
}

double map_export_to_source(double export_time, double source_duration,
                            const RegionMap<CutRegion> &cuts,
                            const RegionMap<SpeedRegion> &speeds) {
  return TimelineRemapper(source_duration, cuts, speeds).to_source(export_time);
}

} // namespace cinecut
