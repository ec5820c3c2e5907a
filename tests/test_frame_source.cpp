#include "doctest/doctest.h"

#include "cinecut/frame_source.hpp"
#include "fake_media.hpp"

using namespace cinecut;
using cinecut::testing::FakeDecoder;
using cinecut::testing::frame_tag;

namespace {

FrameSource make_source(int frames, double fps, FakeDecoder **raw = nullptr) {
  auto decoder = std::make_unique<FakeDecoder>(frames, fps);
  if (raw)
    *raw = decoder.get();
  return FrameSource("test", std::move(decoder));
}

} // namespace

TEST_CASE("returns the last frame at or before the requested time") {
  FrameSource source = make_source(30, 10.0);

  CHECK(frame_tag(source.get_frame(0.0)) == 0);
  CHECK(frame_tag(source.get_frame(0.05)) == 0);
  CHECK(frame_tag(source.get_frame(0.1)) == 1);
  CHECK(frame_tag(source.get_frame(0.25)) == 2);
  CHECK(frame_tag(source.get_frame(1.0)) == 10);
}

TEST_CASE("repeated timestamps reuse the held frame without decoding") {
  FakeDecoder *decoder = nullptr;
  FrameSource source = make_source(30, 10.0, &decoder);

  CHECK(frame_tag(source.get_frame(0.5)) == 5);
  const int decoded = decoder->decoded();
  CHECK(frame_tag(source.get_frame(0.5)) == 5);
  CHECK(frame_tag(source.get_frame(0.55)) == 5);
  CHECK(decoder->decoded() == decoded);
}

TEST_CASE("time before the first frame yields the first frame") {
  FrameSource source = make_source(5, 10.0);
  CHECK(frame_tag(source.get_frame(-1.0)) == 0);
}

TEST_CASE("earlier requests do not rewind") {
  FrameSource source = make_source(30, 10.0);
  CHECK(frame_tag(source.get_frame(1.5)) == 15);
  CHECK(frame_tag(source.get_frame(0.2)) == 15);
  CHECK(frame_tag(source.get_frame(1.6)) == 16);
}

TEST_CASE("the last frame is held past the end of the stream") {
  FrameSource source = make_source(5, 10.0);
  CHECK(frame_tag(source.get_frame(0.4)) == 4);
  CHECK(frame_tag(source.get_frame(3.0)) == 4);
  CHECK(frame_tag(source.get_frame(10.0)) == 4);
}

TEST_CASE("an empty stream produces no frame") {
  FrameSource source = make_source(0, 10.0);
  CHECK(source.get_frame(0.0) == nullptr);
}

TEST_CASE("seek restarts at the preceding key frame") {
  FrameSource source = make_source(100, 10.0);
  CHECK(frame_tag(source.get_frame(8.0)) == 80);

  REQUIRE(source.seek(2.35));
  CHECK(frame_tag(source.get_frame(2.35)) == 23);
  CHECK(frame_tag(source.get_frame(2.5)) == 25);
}

TEST_CASE("failed seek is reported") {
  FakeDecoder *decoder = nullptr;
  FrameSource source = make_source(10, 10.0, &decoder);
  decoder->fail_seek = true;
  CHECK_FALSE(source.seek(0.5));
}

TEST_CASE("closed source returns nothing and close is idempotent") {
  FrameSource source = make_source(10, 10.0);
  CHECK(source.is_open());
  CHECK(source.width() == 16);
  CHECK(source.duration() == doctest::Approx(1.0));

  source.close();
  source.close();
  CHECK_FALSE(source.is_open());
  CHECK(source.get_frame(0.0) == nullptr);
  CHECK_FALSE(source.seek(0.0));
  CHECK(source.width() == 0);
}
