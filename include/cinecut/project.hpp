/**
 * @file project.hpp
 * @brief Project document and recorded metadata loading
 *
 * @details Provides:
 *          - RecordingMetadata: the capture-side JSON (events, geometry,
 *            embedded cursor images)
 *
 *          - Project: paths, regions, styles and export settings of one
 *            edit, resolved against the project file location
 *
 *          - Auto-zoom generation for projects without zoom regions
 *
 *          - finalize_project: the steps that need the decoded source
 *            (geometry fallback, duration clamp, cursor bitmaps)
 */

#ifndef CINECUT_PROJECT_HPP
#define CINECUT_PROJECT_HPP

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "compositor.hpp"
#include "cursor_bitmaps.hpp"
#include "export_settings.hpp"
#include "types.hpp"

namespace cinecut {

// **----- AUTO ZOOM CONSTANTS -----**

constexpr double AUTO_ZOOM_PRE_CLICK_OFFSET = 1.0;   //< Zoom starts before the first click
constexpr double AUTO_ZOOM_POST_CLICK_PADDING = 0.9; //< Hold after the last click
constexpr double AUTO_ZOOM_MIN_DURATION = 3.0;       //< Also the click grouping gap
constexpr double AUTO_ZOOM_LEVEL = 1.5;
constexpr double AUTO_ZOOM_TRANSITION = 1.0;         //< "Mellow" speed

/// Shortest region left after clamping to the source duration
constexpr double MIN_REGION_DURATION = 0.1;

/**
 * @struct RecordingMetadata
 * @brief Contents of the recorded metadata file.
 * @note Event timestamps are converted to seconds, shifted by syncOffset
 *       (milliseconds in the file) and sorted on load.
 */
struct RecordingMetadata {
  std::string platform;
  Size screen_size;
  RecordingGeometry geometry;
  bool has_geometry = false;
  double scale_factor = 1.0; //< Display DPI factor of the capture
  double sync_offset = 0.0; //< Seconds added to every event timestamp
  std::map<std::string, CursorImage> cursor_images;
  std::vector<MouseEvent> events;
};

/**
 * @brief Read metadata from a parsed JSON document.
 * @return false if the document is not an object or a field has the
 *         wrong type (logged)
 */
bool parse_recording_metadata(const nlohmann::json &root,
                              RecordingMetadata &meta);

/// Load and parse a metadata file.
bool load_recording_metadata(const std::string &path, RecordingMetadata &meta);

/**
 * @brief DPI correction of a captured region: every field is multiplied
 *        by the factor and floored.
 */
RecordingGeometry scale_geometry(const RecordingGeometry &geometry,
                                 double factor);

/**
 * @brief Zoom regions around groups of pressed clicks.
 * @param geometry Mouse coordinate space used to normalize the target
 */
RegionMap<ZoomRegion>
generate_auto_zoom_regions(const std::vector<MouseEvent> &events,
                           const Size &geometry);

/**
 * @struct Project
 * @brief One edit of a recording, ready to be previewed or exported.
 */
struct Project {
  std::string video_path;
  std::string webcam_video_path; //< Empty when no webcam was recorded
  std::string audio_path;        //< Empty when no audio was recorded
  std::string metadata_path;
  std::string cursor_theme_path; //< Windows/macOS cursor theme file
  std::string aspect_ratio = "16:9";

  RegionMap<CutRegion> cut_regions;
  RegionMap<SpeedRegion> speed_regions;
  RecordingMetadata metadata;

  Scene scene; //< Zoom regions, events and styles for the compositor
  ExportSettings export_settings;

  /// Set when the document has no "zoomRegions" key
  bool auto_zoom_pending = false;

  bool has_webcam() const { return !webcam_video_path.empty(); }
  bool has_audio() const { return !audio_path.empty(); }
};

/**
 * @brief Read a project document. Relative paths resolve against base_dir.
 * @note Does not read the metadata file.
 */
bool parse_project(const nlohmann::json &root, const std::string &base_dir,
                   Project &project);

/**
 * @brief Load a project file and its metadata file.
 * @return true on success, false on failure (logged)
 */
bool load_project(const std::string &path, Project &project);

/**
 * @brief Complete a loaded project once the source is open.
 * @param video Main video dimensions
 * @param source_duration Main video duration (seconds)
 *
 * @details Applies the geometry fallback and DPI correction, generates
 *          auto-zoom regions if pending, clamps region durations to the
 *          source, warns about overlapping regions and prepares the cursor
 *          bitmaps for the capture platform.
 */
void finalize_project(Project &project, const Size &video,
                      double source_duration);

} // namespace cinecut

#endif // CINECUT_PROJECT_HPP
