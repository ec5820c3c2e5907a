#include "doctest/doctest.h"

#include <cmath>

#include "cinecut/timeline.hpp"

using namespace cinecut;

namespace {

CutRegion cut(const std::string &id, double start, double duration) {
  CutRegion r;
  r.id = id;
  r.start_time = start;
  r.duration = duration;
  return r;
}

SpeedRegion speed(const std::string &id, double start, double duration,
                  double factor) {
  SpeedRegion r;
  r.id = id;
  r.start_time = start;
  r.duration = duration;
  r.speed = factor;
  return r;
}

} // namespace

TEST_CASE("no regions maps export time to itself") {
  TimelineRemapper remap(10.0, {}, {});
  CHECK(remap.export_duration() == doctest::Approx(10.0));
  CHECK(remap.to_source(0.0) == doctest::Approx(0.0));
  CHECK(remap.to_source(4.25) == doctest::Approx(4.25));
  CHECK(remap.to_source(-1.0) == doctest::Approx(0.0));
  CHECK(remap.to_source(20.0) < 10.0);
}

TEST_CASE("single cut shortens the timeline and skips the cut range") {
  RegionMap<CutRegion> cuts{{"c1", cut("c1", 2.0, 1.0)}};
  TimelineRemapper remap(10.0, cuts, {});

  CHECK(remap.export_duration() == doctest::Approx(9.0));
  CHECK(remap.to_source(1.5) == doctest::Approx(1.5));
  CHECK(remap.to_source(5.0) == doctest::Approx(6.0));
  CHECK(map_export_to_source(5.0, 10.0, cuts, {}) == doctest::Approx(6.0));

  for (double t = 0.0; t < 9.0; t += 0.01) {
    const double s = remap.to_source(t);
    CHECK_FALSE((s > 2.0 && s < 3.0));
  }
}

TEST_CASE("speed region compresses the timeline") {
  RegionMap<SpeedRegion> speeds{{"s1", speed("s1", 0.0, 10.0, 2.0)}};
  TimelineRemapper remap(10.0, {}, speeds);

  CHECK(remap.export_duration() == doctest::Approx(5.0));
  CHECK(remap.to_source(2.5) == doctest::Approx(5.0));
}

TEST_CASE("slow speed region stretches the timeline") {
  RegionMap<SpeedRegion> speeds{{"s1", speed("s1", 2.0, 2.0, 0.5)}};
  TimelineRemapper remap(10.0, {}, speeds);

  CHECK(remap.export_duration() == doctest::Approx(12.0));
  CHECK(remap.to_source(2.0) == doctest::Approx(2.0));
  CHECK(remap.to_source(4.0) == doctest::Approx(3.0));
  CHECK(remap.to_source(7.0) == doctest::Approx(5.0));
}

TEST_CASE("mapping is monotonic with cuts and speeds combined") {
  RegionMap<CutRegion> cuts{{"a", cut("a", 1.0, 0.5)},
                            {"b", cut("b", 6.0, 2.0)}};
  RegionMap<SpeedRegion> speeds{{"fast", speed("fast", 2.0, 3.0, 3.0)},
                                {"slow", speed("slow", 8.5, 1.0, 0.25)}};
  TimelineRemapper remap(10.0, cuts, speeds);

  double previous = -1.0;
  for (double t = 0.0; t < remap.export_duration(); t += 1.0 / 60.0) {
    const double s = remap.to_source(t);
    CHECK(s >= previous);
    CHECK(s >= 0.0);
    CHECK(s < 10.0);
    CHECK(find_active_region(cuts, s) == nullptr);
    previous = s;
  }
}

TEST_CASE("cut at the very start begins playback after it") {
  RegionMap<CutRegion> cuts{{"head", cut("head", 0.0, 2.0)}};
  TimelineRemapper remap(10.0, cuts, {});
  CHECK(remap.to_source(0.0) == doctest::Approx(2.0));
  CHECK(remap.export_duration() == doctest::Approx(8.0));
}

TEST_CASE("export duration is never negative") {
  RegionMap<CutRegion> cuts{{"a", cut("a", 0.0, 6.0)},
                            {"b", cut("b", 4.0, 6.0)}};
  CHECK(export_duration(10.0, cuts, {}) == doctest::Approx(0.0));
}

TEST_CASE("playback segments exclude cuts and carry speeds") {
  RegionMap<CutRegion> cuts{{"c", cut("c", 4.0, 1.0)}};
  RegionMap<SpeedRegion> speeds{{"s", speed("s", 1.0, 2.0, 2.0)}};
  const auto segments = plan_playback_segments(6.0, cuts, speeds);

  REQUIRE(segments.size() == 4);
  CHECK(segments[0].start == doctest::Approx(0.0));
  CHECK(segments[0].speed == doctest::Approx(1.0));
  CHECK(segments[1].start == doctest::Approx(1.0));
  CHECK(segments[1].duration == doctest::Approx(2.0));
  CHECK(segments[1].speed == doctest::Approx(2.0));
  CHECK(segments[2].start == doctest::Approx(3.0));
  CHECK(segments[3].start == doctest::Approx(5.0));

  double exported = 0.0;
  for (const auto &seg : segments)
    exported += seg.exported_duration();
  CHECK(exported == doctest::Approx(export_duration(6.0, cuts, speeds)));
}

TEST_CASE("overlapping regions resolve to the earliest start then smallest id") {
  RegionMap<SpeedRegion> speeds{{"b", speed("b", 1.0, 4.0, 2.0)},
                                {"a", speed("a", 1.0, 4.0, 3.0)},
                                {"c", speed("c", 0.5, 1.0, 4.0)}};

  const SpeedRegion *at1 = find_active_region(speeds, 1.2);
  REQUIRE(at1 != nullptr);
  CHECK(at1->id == "c");

  const SpeedRegion *at2 = find_active_region(speeds, 2.0);
  REQUIRE(at2 != nullptr);
  CHECK(at2->id == "a");

  CHECK(find_active_region(speeds, 5.0) == nullptr);
  CHECK(find_overlapping_regions(speeds).size() == 3);
}

TEST_CASE("overlapping cuts are removed once") {
  RegionMap<CutRegion> cuts{{"a", cut("a", 2.0, 2.0)},
                            {"b", cut("b", 3.0, 2.0)}};
  TimelineRemapper remap(10.0, cuts, {});

  CHECK(remap.export_duration() == doctest::Approx(7.0));
  CHECK(export_duration(10.0, cuts, {}) == doctest::Approx(7.0));

  const double last = remap.to_source(remap.export_duration() - 1.0 / 30.0);
  CHECK(last > 9.9);
  CHECK(last < 10.0);
}

TEST_CASE("speed region partly covered by a cut only speeds up the kept part") {
  RegionMap<CutRegion> cuts{{"c", cut("c", 2.0, 2.0)}};
  RegionMap<SpeedRegion> speeds{{"s", speed("s", 3.0, 2.0, 2.0)}};
  TimelineRemapper remap(10.0, cuts, speeds);

  /// [0,2) kept, [2,4) cut, [4,5) at 2x, [5,10) kept
  CHECK(remap.export_duration() == doctest::Approx(7.5));
  CHECK(remap.to_source(2.0) == doctest::Approx(4.0));
  CHECK(remap.to_source(2.5) == doctest::Approx(5.0));

  const double last = remap.to_source(remap.export_duration() - 1.0 / 30.0);
  CHECK(last > 9.9);
  CHECK(last < 10.0);
}
