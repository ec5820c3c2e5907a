#include "doctest/doctest.h"

#include <string>
#include <vector>

#include "cinecut/config.hpp"
#include "cinecut/errors.hpp"
#include "cinecut/export_settings.hpp"

using namespace cinecut;

TEST_CASE("bitrate scales with resolution, quality and frame rate") {
  CHECK(bitrate_for(Resolution::P1080, Quality::Medium, 30) == 8000000);
  CHECK(bitrate_for(Resolution::P720, Quality::Low, 30) == 3000000);
  CHECK(bitrate_for(Resolution::K2, Quality::High, 60) == 51200000);
  CHECK(bitrate_for(Resolution::P1080, Quality::Medium, 15) == 4000000);
}

TEST_CASE("export dimensions follow the preset height and aspect ratio") {
  const ExportDimensions hd = calculate_export_dimensions(Resolution::P1080, "16:9");
  CHECK(hd.width == 1920);
  CHECK(hd.height == 1080);

  const ExportDimensions classic = calculate_export_dimensions(Resolution::P720, "4:3");
  CHECK(classic.width == 960);
  CHECK(classic.height == 720);

  const ExportDimensions wide = calculate_export_dimensions(Resolution::K2, "21:9");
  CHECK(wide.width == 3360);
  CHECK(wide.height == 1440);

  /// Widths are rounded up to an even number for the encoder
  const ExportDimensions portrait =
      calculate_export_dimensions(Resolution::P1080, "9:16");
  CHECK(portrait.width == 608);
  CHECK(portrait.width % 2 == 0);

  CHECK(calculate_export_dimensions(Resolution::P1080, "bogus").width == 1920);
  CHECK(calculate_export_dimensions(Resolution::P1080, "x:y").width == 1920);
}

TEST_CASE("settings names round-trip through the parse helpers") {
  ExportFormat format = ExportFormat::Mp4;
  CHECK(parse_export_format("gif", format));
  CHECK(format == ExportFormat::Gif);
  CHECK_FALSE(parse_export_format("webm", format));
  CHECK(format == ExportFormat::Gif);

  Resolution resolution = Resolution::P1080;
  CHECK(parse_resolution("2k", resolution));
  CHECK(std::string(to_string(resolution)) == "2k");
  CHECK_FALSE(parse_resolution("4k", resolution));

  Quality quality = Quality::Medium;
  CHECK(parse_quality("low", quality));
  CHECK(std::string(to_string(quality)) == "low");
  CHECK_FALSE(parse_quality("ultra", quality));
}

TEST_CASE("gif exports use the raw frame path without probing encoders") {
  ExportSettings settings;
  settings.format = ExportFormat::Gif;
  settings.fps = 15;

  int probes = 0;
  const PipelineConfig config = negotiate_pipeline(
      settings, {640, 360}, [&probes](const std::string &) {
        ++probes;
        return true;
      });

  CHECK(config.path == OutputPath::RawRgba);
  CHECK(config.encoder.empty());
  CHECK(config.fps == 15);
  CHECK(config.dims.width == 640);
  CHECK(probes == 0);
}

TEST_CASE("mp4 exports pick the first encoder that opens") {
  ExportSettings settings;
  std::vector<std::string> tried;

  const PipelineConfig software = negotiate_pipeline(
      settings, {1920, 1080}, [&tried](const std::string &name) {
        tried.push_back(name);
        return name == "libx264";
      });
  CHECK(software.path == OutputPath::EncodedH264);
  CHECK(software.encoder == "libx264");
  CHECK(software.bitrate == 8000000);
  CHECK(tried.back() == "libx264");

  if (Config::prefer_hw_encoder()) {
    CHECK(tried.front() == "h264_nvenc");
    const PipelineConfig hardware = negotiate_pipeline(
        settings, {1920, 1080},
        [](const std::string &name) { return name == "h264_qsv"; });
    CHECK(hardware.encoder == "h264_qsv");
  }
}

TEST_CASE("mp4 export without any H.264 encoder is a configuration error") {
  ExportSettings settings;
  try {
    negotiate_pipeline(settings, {1920, 1080},
                       [](const std::string &) { return false; });
    FAIL("expected an ExportError");
  } catch (const ExportError &e) {
    CHECK(e.kind() == ErrorKind::Configuration);
  }
}
