/**
 * @file export_settings.hpp
 * @brief Export configuration and one-time pipeline negotiation
 *
 * @details Provides:
 *          - ExportSettings (format, resolution preset, fps, quality)
 *
 *          - Output dimensions from preset and aspect ratio
 *
 *          - The bitrate heuristic
 *
 *          - negotiate_pipeline: probes encoders once and returns a typed
 *            PipelineConfig (raw RGBA or H.264 path)
 */

#ifndef CINECUT_EXPORT_SETTINGS_HPP
#define CINECUT_EXPORT_SETTINGS_HPP

#include <cstdint>
#include <functional>
#include <string>

namespace cinecut {

enum class ExportFormat { Mp4, Gif };
enum class Resolution { P720, P1080, K2 };
enum class Quality { Low, Medium, High };

struct ExportSettings {
  ExportFormat format = ExportFormat::Mp4;
  Resolution resolution = Resolution::P1080;
  int fps = 30;
  Quality quality = Quality::Medium;
};

/// Parse helpers, false on unknown names (out untouched)
bool parse_export_format(const std::string &name, ExportFormat &out);
bool parse_resolution(const std::string &name, Resolution &out);
bool parse_quality(const std::string &name, Quality &out);

const char *to_string(ExportFormat format);
const char *to_string(Resolution resolution);
const char *to_string(Quality quality);

struct ExportDimensions {
  int width = 0;
  int height = 0;
};

/// Output height of a resolution preset (720/1080/1440)
int preset_height(Resolution resolution);

/**
 * @brief Output size for a preset and an aspect ratio ("16:9").
 * @note width = round(h * rw / rh), bumped to the next even number.
 *       Unparsable ratios fall back to 16:9.
 */
ExportDimensions calculate_export_dimensions(Resolution resolution,
                                             const std::string &aspect_ratio);

/**
 * @brief Target video bitrate in bits per second.
 * @note 720p 5 Mbps, 1080p 8 Mbps, 2k 16 Mbps; x0.6/x1.0/x1.6 by quality;
 *       x fps/30; rounded to whole kbps.
 */
int64_t bitrate_for(Resolution resolution, Quality quality, int fps);

// **---- Pipeline negotiation ----**

enum class OutputPath {
  RawRgba,    //< Raw frames piped to ffmpeg (GIF)
  EncodedH264 //< In-process H.264, Annex-B piped to ffmpeg (MP4)
};

/**
 * @struct PipelineConfig
 * @brief Result of the capability negotiation, fixed for one export.
 */
struct PipelineConfig {
  OutputPath path = OutputPath::RawRgba;
  std::string encoder; //< libavcodec encoder name (EncodedH264 only)
  ExportDimensions dims;
  int fps = 30;
  int64_t bitrate = 0;
};

/// Returns true if the named encoder can be opened for this export
using EncoderProbe = std::function<bool(const std::string &encoder)>;

/**
 * @brief Try to open an H.264 encoder with the export parameters.
 * @return false if the encoder is missing or refuses to open
 */
bool probe_h264_encoder(const std::string &name, const ExportDimensions &dims,
                        int fps, int64_t bitrate);

/**
 * @brief Negotiate the output path once at pipeline setup.
 * @throws ExportError(Configuration) when MP4 is requested and no H.264
 *         encoder can be opened
 */
PipelineConfig negotiate_pipeline(const ExportSettings &settings,
                                  const ExportDimensions &dims);

/// Same, with a caller-provided encoder probe
PipelineConfig negotiate_pipeline(const ExportSettings &settings,
                                  const ExportDimensions &dims,
                                  const EncoderProbe &probe);

} // namespace cinecut

#endif // CINECUT_EXPORT_SETTINGS_HPP
