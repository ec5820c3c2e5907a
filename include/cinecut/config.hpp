/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Per-export choices (format, resolution, fps, quality) and all
 *          styling come from the project document instead.
 *
 */

#ifndef CINECUT_CONFIG_HPP
#define CINECUT_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

namespace cinecut {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

/// External ffmpeg binary used for muxing and audio processing
inline const std::string &ffmpeg_path() {
  static std::string val = get_env_string("CINECUT_FFMPEG", "ffmpeg");
  return val;
}

// **---- CAMERA MOVEMENT ----**

/**
 * @brief EMA rate of the cursor smoothing.
 * @note Lower value = smoother/slower camera response.
 */
inline double smoothing_factor() {
  static double val = get_env_double("SMOOTHING_FACTOR", 0.07);
  return val;
}

/// Movements shorter than this (recording pixels) use 30% of the rate
inline double dead_zone_px() {
  static double val = get_env_double("DEAD_ZONE_PX", 10.0);
  return val;
}

/// Trailing window the smoothing is rebuilt over (seconds)
inline double smoothing_window_sec() {
  static double val = get_env_double("SMOOTHING_WINDOW_SEC", 0.5);
  return val;
}

/// Maximum age of the mouse event the cursor is drawn from (seconds)
inline double cursor_freshness_sec() {
  static double val = get_env_double("CURSOR_FRESHNESS_SEC", 0.1);
  return val;
}

/// Cursor theme scale selected on Windows/macOS recordings
inline int cursor_scale() {
  static int val = get_env_int("CURSOR_SCALE", 2);
  return val;
}

// **---- ENCODER / MUXER ----**

/**
 * @brief Maximum frames in flight inside the encoder before the render
 *        loop waits.
 */
inline int encoder_max_in_flight() {
  static int val = get_env_int("ENCODER_MAX_IN_FLIGHT", 2);
  return val;
}

/// Sleep between encoder queue polls (milliseconds)
inline int encoder_poll_ms() {
  static int val = get_env_int("ENCODER_POLL_MS", 2);
  return val;
}

/// Bound on the muxer readiness handshake (milliseconds)
inline int muxer_ready_timeout_ms() {
  static int val = get_env_int("MUXER_READY_TIMEOUT_MS", 2000);
  return val;
}

/// Try hardware H.264 encoders before libx264
inline bool prefer_hw_encoder() {
  static bool val = (get_env_int("PREFER_HW_ENCODER", 1) != 0);
  return val;
}

/// AAC bitrate for resegmented audio
inline const std::string &audio_bitrate() {
  static std::string val = get_env_string("AUDIO_BITRATE", "192k");
  return val;
}

} // namespace Config
} // namespace cinecut

#endif // CINECUT_CONFIG_HPP
