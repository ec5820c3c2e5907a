/**
 * @file audio_resegmenter.cpp
 * @brief Audio resegmentation implementation
 */

#include "cinecut/audio_resegmenter.hpp"

#include <cmath>
#include <filesystem>
#include <utility>

#include <fmt/core.h>

#include "cinecut/config.hpp"
#include "cinecut/logging.hpp"
#include "cinecut/muxer_process.hpp"
#include "cinecut/system.hpp"
#include "cinecut/timeline.hpp"

namespace cinecut {

namespace fs = std::filesystem;

std::vector<AudioSegment>
plan_audio_segments(double source_duration, const RegionMap<CutRegion> &cuts,
                    const RegionMap<SpeedRegion> &speeds) {
  std::vector<AudioSegment> segments;
  for (const auto &p : plan_playback_segments(source_duration, cuts, speeds))
    segments.push_back({p.start, p.duration, p.speed});
  return segments;
}

std::vector<double> build_atempo_chain(double speed) {
  std::vector<double> chain;
  if (std::abs(speed - 1.0) < 0.01)
    return chain;

  /// atempo accepts [0.5, 2.0] per stage
  double remaining = speed;
  while (remaining > 2.0) {
    chain.push_back(2.0);
    remaining /= 2.0;
  }
  while (remaining < 0.5) {
    chain.push_back(0.5);
    remaining /= 0.5;
  }
  chain.push_back(remaining);
  return chain;
}

std::string atempo_filter(const std::vector<double> &chain) {
  std::string filter;
  for (size_t i = 0; i < chain.size(); ++i) {
    if (i > 0)
      filter += ',';
    filter += fmt::format("atempo={}", chain[i]);
  }
  return filter;
}

std::vector<std::string> build_segment_args(const AudioSegment &segment,
                                            const std::string &audio_path,
                                            const std::string &output_path) {
  std::vector<std::string> args = {"-y",
                                   "-hide_banner",
                                   "-loglevel",
                                   "error",
                                   "-ss",
                                   fmt::format("{:.4f}", segment.start),
                                   "-t",
                                   fmt::format("{:.4f}", segment.duration),
                                   "-i",
                                   audio_path,
                                   "-vn"};

  const std::string filter = atempo_filter(build_atempo_chain(segment.speed));
  if (!filter.empty())
    args.insert(args.end(), {"-af", filter});

  /// Re-encode: stream copy would snap the cut to packet boundaries
  args.insert(args.end(),
              {"-c:a", "aac", "-b:a", Config::audio_bitrate(), output_path});
  return args;
}

std::string build_concat_list(const std::vector<std::string> &files) {
  std::string list;
  list.reserve(files.size() * 64);
  for (const auto &f : files) {
    std::string escaped;
    for (char c : f) {
      if (c == '\'')
        escaped += "'\\''";
      else
        escaped += c;
    }
    list += fmt::format("file '{}'\n", escaped);
  }
  return list;
}

// **---- AudioResegmenter ----**

AudioResegmenter::AudioResegmenter(std::string audio_path)
    : AudioResegmenter(std::move(audio_path), run_ffmpeg) {}

AudioResegmenter::AudioResegmenter(std::string audio_path,
                                   CommandRunner runner)
    : audio_path_(std::move(audio_path)), runner_(std::move(runner)) {}

AudioResegmenter::~AudioResegmenter() { cleanup(); }

void AudioResegmenter::cleanup() {
  if (temp_dir_.empty())
    return;
  remove_tree(temp_dir_);
  temp_dir_.clear();
}

std::string AudioResegmenter::process(double source_duration,
                                      const RegionMap<CutRegion> &cuts,
                                      const RegionMap<SpeedRegion> &speeds,
                                      const CancellationToken *cancel) {
  if (cuts.empty() && speeds.empty()) {
    LOG_INFO("[Audio] No edits, using the original track");
    return audio_path_;
  }

  const auto segments = plan_audio_segments(source_duration, cuts, speeds);
  if (segments.empty()) {
    LOG_WARN("[Audio] Every segment is cut, using the original track");
    return audio_path_;
  }

  TIMER_START(audio_resegment);

  cleanup();
  temp_dir_ = make_temp_dir("cinecut-audio");
  if (temp_dir_.empty()) {
    LOG_WARN("[Audio] No temp dir, falling back to the original track");
    return audio_path_;
  }

  std::vector<std::string> segment_files;
  segment_files.reserve(segments.size());

  for (size_t i = 0; i < segments.size(); ++i) {
    throw_if_cancelled(cancel);

    const AudioSegment &seg = segments[i];
    const std::string out = (fs::path(temp_dir_) / fmt::format("seg-{}.m4a", i)).string();
    LOG_INFO("[Audio] Segment {}: start={:.3f} dur={:.3f} speed={}", i,
             seg.start, seg.duration, seg.speed);

    const int code = runner_(build_segment_args(seg, audio_path_, out));
    if (code != 0) {
      LOG_WARN("[Audio] Segment {} failed (FFmpeg exited with code {}), "
               "falling back to the original track",
               i, code);
      cleanup();
      return audio_path_;
    }
    segment_files.push_back(out);
  }

  throw_if_cancelled(cancel);

  MemFile list;
  if (!list.create("audio_concat_list", build_concat_list(segment_files))) {
    LOG_WARN("[Audio] Falling back to the original track");
    cleanup();
    return audio_path_;
  }

  const std::string processed = (fs::path(temp_dir_) / "processed.m4a").string();
  const int code = runner_({"-y", "-hide_banner", "-loglevel", "error", "-f",
                            "concat", "-safe", "0", "-protocol_whitelist",
                            "file,pipe,fd", "-i", list.path(), "-c", "copy",
                            processed});
  if (code != 0) {
    LOG_WARN("[Audio] Concat failed (FFmpeg exited with code {}), falling "
             "back to the original track",
             code);
    cleanup();
    return audio_path_;
  }

  TIMER_END(audio_resegment);
  LOG_SUCCESS("[Audio] Resegmented {} segments", segments.size());
  return processed;
}

} // namespace cinecut
