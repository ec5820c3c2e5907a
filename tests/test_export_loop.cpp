#include "doctest/doctest.h"

#include <string>

#include "cinecut/errors.hpp"
#include "cinecut/export_pipeline.hpp"
#include "fake_media.hpp"

using namespace cinecut;
using cinecut::testing::FakeDecoder;
using cinecut::testing::frame_tag;
using cinecut::testing::RecordingSink;

namespace {

struct LoopFixture {
  Scene scene;
  RecordingSink sink;
  CancellationToken cancel;
  std::unique_ptr<FrameSource> main;
  std::unique_ptr<FrameSource> webcam;

  explicit LoopFixture(int main_frames) {
    scene.video = {16.0, 9.0};
    scene.recording = {16.0, 9.0};
    scene.styles.frame.shadow_blur = 0.0;
    main = std::make_unique<FrameSource>(
        "main", std::make_unique<FakeDecoder>(main_frames, 10.0));
  }

  RenderLoopParams params(const TimelineRemapper &remapper) const {
    RenderLoopParams p;
    p.fps = 10;
    p.total_frames = total_export_frames(remapper.export_duration(), p.fps);
    p.max_in_flight = 2;
    p.poll_ms = 0;
    return p;
  }
};

ErrorKind run_and_catch(FrameRenderLoop &loop) {
  try {
    loop.run();
  } catch (const ExportError &e) {
    return e.kind();
  }
  FAIL("expected an ExportError");
  return ErrorKind::Io;
}

} // namespace

TEST_CASE("frames are submitted once each, in order, at the output size") {
  LoopFixture f(20);
  TimelineRemapper remapper(2.0, {}, {});
  SceneCompositor compositor(f.scene, cv::Size(32, 18));
  compositor.initialize();

  FrameRenderLoop loop(remapper, *f.main, nullptr, compositor, f.sink,
                       f.params(remapper));
  loop.run();

  REQUIRE(f.sink.indices.size() == 20);
  for (size_t i = 0; i < f.sink.indices.size(); ++i)
    CHECK(f.sink.indices[i] == static_cast<int64_t>(i));
  CHECK(f.sink.size == cv::Size(32, 18));
  CHECK(loop.frames_rendered() == 20);
}

TEST_CASE("cut regions shorten the rendered frame count") {
  LoopFixture f(20);
  CutRegion cut;
  cut.id = "c";
  cut.start_time = 0.5;
  cut.duration = 0.5;
  TimelineRemapper remapper(2.0, {{"c", cut}}, {});
  SceneCompositor compositor(f.scene, cv::Size(32, 18));
  compositor.initialize();

  FrameRenderLoop loop(remapper, *f.main, nullptr, compositor, f.sink,
                       f.params(remapper));
  loop.run();

  CHECK(f.sink.indices.size() == 15);
  CHECK(loop.frames_rendered() == 15);
}

TEST_CASE("missing main frame is a configuration error") {
  LoopFixture f(0);
  TimelineRemapper remapper(1.0, {}, {});
  SceneCompositor compositor(f.scene, cv::Size(32, 18));

  FrameRenderLoop loop(remapper, *f.main, nullptr, compositor, f.sink,
                       f.params(remapper));
  CHECK(run_and_catch(loop) == ErrorKind::Configuration);
  CHECK(f.sink.indices.empty());
}

TEST_CASE("cancellation stops the loop between frames") {
  LoopFixture f(20);
  TimelineRemapper remapper(2.0, {}, {});
  SceneCompositor compositor(f.scene, cv::Size(32, 18));

  CancellationToken &cancel = f.cancel;
  auto on_progress = [&cancel](const ExportProgress &p) {
    if (p.progress > 10)
      cancel.cancel();
  };
  FrameRenderLoop loop(remapper, *f.main, nullptr, compositor, f.sink,
                       f.params(remapper), &f.cancel, on_progress);

  CHECK(run_and_catch(loop) == ErrorKind::Cancelled);
  CHECK(f.sink.indices.size() == 3);
}

TEST_CASE("a cancelled token stops the loop before the first frame") {
  LoopFixture f(20);
  TimelineRemapper remapper(2.0, {}, {});
  SceneCompositor compositor(f.scene, cv::Size(32, 18));
  f.cancel.cancel();

  FrameRenderLoop loop(remapper, *f.main, nullptr, compositor, f.sink,
                       f.params(remapper), &f.cancel);
  CHECK(run_and_catch(loop) == ErrorKind::Cancelled);
  CHECK(f.sink.indices.empty());
}

TEST_CASE("the loop waits while the sink backlog is over the bound") {
  LoopFixture f(10);
  f.sink.backlog_per_submit = 4;
  TimelineRemapper remapper(1.0, {}, {});
  SceneCompositor compositor(f.scene, cv::Size(32, 18));

  FrameRenderLoop loop(remapper, *f.main, nullptr, compositor, f.sink,
                       f.params(remapper));
  loop.run();

  CHECK(f.sink.indices.size() == 10);
  CHECK(f.sink.polls > 10);
}

TEST_CASE("progress is reported per percent change and stays below 100") {
  LoopFixture f(20);
  TimelineRemapper remapper(2.0, {}, {});
  SceneCompositor compositor(f.scene, cv::Size(32, 18));

  std::vector<int> reported;
  FrameRenderLoop loop(
      remapper, *f.main, nullptr, compositor, f.sink, f.params(remapper),
      nullptr, [&reported](const ExportProgress &p) {
        CHECK(p.stage == "Rendering...");
        reported.push_back(p.progress);
      });
  loop.run();

  REQUIRE_FALSE(reported.empty());
  CHECK(reported.front() == 5);
  CHECK(reported.back() == 99);
  for (size_t i = 1; i < reported.size(); ++i)
    CHECK(reported[i] > reported[i - 1]);
}

TEST_CASE("webcam is sampled on its own time scale") {
  LoopFixture f(10);
  f.webcam = std::make_unique<FrameSource>(
      "webcam", std::make_unique<FakeDecoder>(20, 10.0));
  TimelineRemapper remapper(1.0, {}, {});
  SceneCompositor compositor(f.scene, cv::Size(32, 18));

  RenderLoopParams params = f.params(remapper);
  params.webcam_scale = webcam_time_scale(2.0, 1.0);
  FrameRenderLoop loop(remapper, *f.main, f.webcam.get(), compositor, f.sink,
                       params);
  loop.run();

  /// Last main frame at 0.9s maps to 1.8s of webcam footage
  CHECK(frame_tag(f.webcam->get_frame(0.0)) == 18);
}

TEST_CASE("frame count and progress helpers") {
  CHECK(total_export_frames(9.0, 30) == 270);
  CHECK(total_export_frames(1.99, 10) == 19);
  CHECK(total_export_frames(0.0, 30) == 0);
  CHECK(total_export_frames(-1.0, 30) == 0);

  CHECK(progress_percent(0, 4) == 25);
  CHECK(progress_percent(3, 4) == 99);
  CHECK(progress_percent(0, 0) == 0);

  CHECK(webcam_time_scale(12.0, 10.0) == doctest::Approx(1.2));
  CHECK(webcam_time_scale(0.0, 10.0) == doctest::Approx(1.0));
}
