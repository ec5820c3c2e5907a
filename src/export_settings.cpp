/**
 * @file export_settings.cpp
 * @brief Export settings, bitrate heuristic and encoder negotiation
 */

#include "cinecut/export_settings.hpp"

#include <cmath>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
}

#include "cinecut/config.hpp"
#include "cinecut/errors.hpp"
#include "cinecut/logging.hpp"
#include "cinecut/video_encoder.hpp"

namespace cinecut {

bool parse_export_format(const std::string &name, ExportFormat &out) {
  if (name == "mp4") {
    out = ExportFormat::Mp4;
    return true;
  }
  if (name == "gif") {
    out = ExportFormat::Gif;
    return true;
  }
  return false;
}

bool parse_resolution(const std::string &name, Resolution &out) {
  if (name == "720p") {
    out = Resolution::P720;
    return true;
  }
  if (name == "1080p") {
    out = Resolution::P1080;
    return true;
  }
  if (name == "2k") {
    out = Resolution::K2;
    return true;
  }
  return false;
}

bool parse_quality(const std::string &name, Quality &out) {
  if (name == "low") {
    out = Quality::Low;
    return true;
  }
  if (name == "medium") {
    out = Quality::Medium;
    return true;
  }
  if (name == "high") {
    out = Quality::High;
    return true;
  }
  return false;
}

const char *to_string(ExportFormat format) {
  return format == ExportFormat::Gif ? "gif" : "mp4";
}

const char *to_string(Resolution resolution) {
  switch (resolution) {
  case Resolution::P720:
    return "720p";
  case Resolution::K2:
    return "2k";
  case Resolution::P1080:
    break;
  }
  return "1080p";
}

const char *to_string(Quality quality) {
  switch (quality) {
  case Quality::Low:
    return "low";
  case Quality::High:
    return "high";
  case Quality::Medium:
    break;
  }
  return "medium";
}

int preset_height(Resolution resolution) {
  switch (resolution) {
  case Resolution::P720:
    return 720;
  case Resolution::K2:
    return 1440;
  case Resolution::P1080:
    break;
  }
  return 1080;
}

ExportDimensions calculate_export_dimensions(Resolution resolution,
                                             const std::string &aspect_ratio) {
  double rw = 16.0;
  double rh = 9.0;

  const size_t colon = aspect_ratio.find(':');
  if (colon != std::string::npos) {
    try {
      double w = std::stod(aspect_ratio.substr(0, colon));
      double h = std::stod(aspect_ratio.substr(colon + 1));
      if (w > 0 && h > 0) {
        rw = w;
        rh = h;
      }
    } catch (const std::exception &) {
      LOG_WARN("Invalid aspect ratio '{}', using 16:9", aspect_ratio);
    }
  } else {
    LOG_WARN("Invalid aspect ratio '{}', using 16:9", aspect_ratio);
  }

  ExportDimensions dims;
  dims.height = preset_height(resolution);
  dims.width = static_cast<int>(std::lround(dims.height * (rw / rh)));
  if (dims.width % 2 != 0)
    dims.width += 1;
  return dims;
}

int64_t bitrate_for(Resolution resolution, Quality quality, int fps) {
  double base = 8000000.0;
  switch (resolution) {
  case Resolution::P720:
    base = 5000000.0;
    break;
  case Resolution::P1080:
    base = 8000000.0;
    break;
  case Resolution::K2:
    base = 16000000.0;
    break;
  }

  double factor = 1.0;
  switch (quality) {
  case Quality::Low:
    factor = 0.6;
    break;
  case Quality::Medium:
    factor = 1.0;
    break;
  case Quality::High:
    factor = 1.6;
    break;
  }

  const double bps = base * factor * (fps / 30.0);
  return static_cast<int64_t>(std::llround(bps / 1000.0)) * 1000;
}

// **---- Negotiation ----**

bool probe_h264_encoder(const std::string &name, const ExportDimensions &dims,
                        int fps, int64_t bitrate) {
  const AVCodec *codec = avcodec_find_encoder_by_name(name.c_str());
  if (!codec || codec->id != AV_CODEC_ID_H264)
    return false;

  const AVPixelFormat pix_fmt = encoder_pixel_format(codec);
  if (pix_fmt == AV_PIX_FMT_NONE)
    return false;

  AVCodecContext *ctx = avcodec_alloc_context3(codec);
  if (!ctx)
    return false;

  configure_h264_context(ctx, codec, pix_fmt, dims.width, dims.height, fps,
                         bitrate);
  const bool ok = avcodec_open2(ctx, codec, nullptr) >= 0;
  avcodec_free_context(&ctx);
  return ok;
}

PipelineConfig negotiate_pipeline(const ExportSettings &settings,
                                  const ExportDimensions &dims) {
  const int64_t bitrate =
      bitrate_for(settings.resolution, settings.quality, settings.fps);
  return negotiate_pipeline(settings, dims, [&](const std::string &name) {
    return probe_h264_encoder(name, dims, settings.fps, bitrate);
  });
}

PipelineConfig negotiate_pipeline(const ExportSettings &settings,
                                  const ExportDimensions &dims,
                                  const EncoderProbe &probe) {
  PipelineConfig config;
  config.dims = dims;
  config.fps = settings.fps;
  config.bitrate =
      bitrate_for(settings.resolution, settings.quality, settings.fps);

  if (settings.format == ExportFormat::Gif) {
    config.path = OutputPath::RawRgba;
    LOG_INFO("[Export] Output path: raw RGBA ({}x{} @ {}fps)", dims.width,
             dims.height, settings.fps);
    return config;
  }

  std::vector<std::string> candidates;
  if (Config::prefer_hw_encoder()) {
    candidates = {"h264_nvenc", "h264_qsv", "h264_vaapi", "h264_videotoolbox",
                  "h264_amf"};
  }
  candidates.push_back("libx264");

  for (const auto &name : candidates) {
    if (probe(name)) {
      config.path = OutputPath::EncodedH264;
      config.encoder = name;
      LOG_INFO("[Export] Output path: H.264 via {} ({}x{} @ {}fps, {} kbps)",
               name, dims.width, dims.height, settings.fps,
               config.bitrate / 1000);
      return config;
    }
    LOG_DEBUG("[Export] Encoder {} unavailable", name);
  }

  throw ExportError(ErrorKind::Configuration, "No H.264 encoder available");
}

} // namespace cinecut
