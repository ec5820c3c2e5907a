/**
 * @file timeline.hpp
 * @brief Export-time to source-time remapping and region lookup
 *
 * @details The edited ("export") timeline is the source timeline with cut
 *          regions removed and speed regions compressed or stretched. This
 *          module provides:
 *
 *          - Export duration from the region set
 *
 *          - The ordered non-cut playback segments (shared by the video
 *            remapper and the audio resegmenter)
 *
 *          - TimelineRemapper: export timestamp -> source timestamp
 *
 *          - Deterministic active-region lookup for overlapping regions
 */

#ifndef CINECUT_TIMELINE_HPP
#define CINECUT_TIMELINE_HPP

#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace cinecut {

/**
 * @struct PlaybackSegment
 * @brief A non-cut source range played at a constant speed.
 */
struct PlaybackSegment {
  double start;    //< Source start (seconds)
  double duration; //< Source duration (seconds)
  double speed;    //< Playback speed factor (> 0)

  double exported_duration() const { return duration / speed; }
};

/**
 * @brief Length of the edited timeline.
 * @note Equals sourceDuration - sum(cuts) + sum(speed.duration * (1/speed - 1))
 *       when no two regions overlap. Overlapping regions are counted once,
 *       through the playback segments.
 */
double export_duration(double source_duration,
                       const RegionMap<CutRegion> &cuts,
                       const RegionMap<SpeedRegion> &speeds);

/**
 * @brief Sorted, de-duplicated region boundaries within [0, duration],
 *        always including 0 and duration.
 */
std::vector<double> timeline_breakpoints(double source_duration,
                                         const RegionMap<CutRegion> &cuts,
                                         const RegionMap<SpeedRegion> &speeds);

/**
 * @brief Ordered non-cut segments between consecutive breakpoints.
 */
std::vector<PlaybackSegment>
plan_playback_segments(double source_duration,
                       const RegionMap<CutRegion> &cuts,
                       const RegionMap<SpeedRegion> &speeds);

/// Sum of the exported lengths of the segments.
double total_exported_duration(const std::vector<PlaybackSegment> &segments);

/**
 * @class TimelineRemapper
 * @brief Maps export timestamps back to source timestamps.
 *
 * @attention The mapping is monotonic non-decreasing in the export time,
 *            which the Frame Source's sequential decode relies on. Source
 *            times never fall strictly inside a cut region.
 */
class TimelineRemapper {
public:
  TimelineRemapper(double source_duration, const RegionMap<CutRegion> &cuts,
                   const RegionMap<SpeedRegion> &speeds);

  /// Source timestamp for an export timestamp, within [0, sourceDuration).
  double to_source(double export_time) const;

  double export_duration() const { return export_duration_; }
  double source_duration() const { return source_duration_; }
  const std::vector<PlaybackSegment> &segments() const { return segments_; }

private:
  double clamp_to_source(double t) const;

  double source_duration_;
  bool has_regions_;
  std::vector<PlaybackSegment> segments_;
  double export_duration_; //< Initialized from segments_
};

/// One-shot form of TimelineRemapper::to_source.
double map_export_to_source(double export_time, double source_duration,
                            const RegionMap<CutRegion> &cuts,
                            const RegionMap<SpeedRegion> &speeds);

// **---- Active Region Lookup ----**

/**
 * @brief Region of a given type active at t (start <= t < end).
 * @note Overlapping regions resolve to the smallest start time, then the
 *       smallest id. Returns nullptr when none is active.
 */
template <typename T>
const T *find_active_region(const RegionMap<T> &regions, double t) {
  const T *best = nullptr;
  for (const auto &entry : regions) {
    const T &r = entry.second;
    if (t < r.start_time || t >= r.start_time + r.duration)
      continue;
    if (!best || r.start_time < best->start_time ||
        (r.start_time == best->start_time && r.id < best->id)) {
      best = &r;
    }
  }
  return best;
}

/**
 * @brief Pairs of region ids whose time ranges intersect.
 */
template <typename T>
std::vector<std::pair<std::string, std::string>>
find_overlapping_regions(const RegionMap<T> &regions) {
  std::vector<std::pair<std::string, std::string>> overlaps;
  for (auto a = regions.begin(); a != regions.end(); ++a) {
    for (auto b = std::next(a); b != regions.end(); ++b) {
      const T &ra = a->second;
      const T &rb = b->second;
      if (ra.start_time < rb.start_time + rb.duration &&
          rb.start_time < ra.start_time + ra.duration) {
        overlaps.emplace_back(a->first, b->first);
      }
    }
  }
  return overlaps;
}

} // namespace cinecut

#endif // CINECUT_TIMELINE_HPP
