#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "cinecut/ffmpeg_decoder.hpp"
#include "cinecut/system.hpp"
#include "cinecut/video_encoder.hpp"

using namespace cinecut;

namespace {

/// Annex-B stream of `count` frames, each filled with a distinct gray level
std::vector<uint8_t> encode_frames(int count, int width, int height) {
  std::vector<uint8_t> stream;
  H264Encoder encoder("libx264", width, height, 30, 400000);
  REQUIRE(encoder.initialize());

  const PacketWriter write = [&stream](const uint8_t *data, size_t size) {
    stream.insert(stream.end(), data, data + size);
  };
  for (int i = 0; i < count; ++i) {
    const int level = 20 + i * 8;
    const cv::Mat frame(height, width, CV_8UC4,
                        cv::Scalar(level, level, level, 255));
    encoder.encode(frame, i, write);
  }
  encoder.flush(write);
  return stream;
}

} // namespace

TEST_CASE("decoder returns every encoded frame in order") {
  if (!avcodec_find_encoder_by_name("libx264")) {
    MESSAGE("libx264 not available, skipping");
    return;
  }

  constexpr int kFrames = 24;
  const std::vector<uint8_t> stream = encode_frames(kFrames, 64, 64);
  REQUIRE_FALSE(stream.empty());

  const std::string dir = make_temp_dir("cinecut-decode");
  REQUIRE_FALSE(dir.empty());
  const std::string path = (std::filesystem::path(dir) / "clip.h264").string();
  {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char *>(stream.data()),
              static_cast<std::streamsize>(stream.size()));
  }

  {
    FFmpegDecoder decoder(path);
    REQUIRE(decoder.initialize());
    CHECK(decoder.width() == 64);
    CHECK(decoder.height() == 64);

    int decoded = 0;
    int previous_level = -1;
    while (FramePtr frame = decoder.next_frame()) {
      REQUIRE(frame->rgba.type() == CV_8UC4);
      const int level = frame->rgba.at<cv::Vec4b>(32, 32)[0];
      CHECK(level > previous_level);
      previous_level = level;
      ++decoded;
    }
    CHECK(decoded == kFrames);
    CHECK(decoder.next_frame() == nullptr);
  }

  CHECK(remove_tree(dir));
}
