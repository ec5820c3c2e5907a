/**
 * @file preview.hpp
 * @brief Single-frame rendering for the live preview
 */

#ifndef CINECUT_PREVIEW_HPP
#define CINECUT_PREVIEW_HPP

#include <string>

#include <opencv2/core.hpp>

#include "export_settings.hpp"
#include "project.hpp"

namespace cinecut {

/**
 * @brief Compose the frame visible at a source timestamp.
 * @param project Loaded project (finalized here)
 * @param source_time Source timestamp in seconds
 * @param resolution Output preset (aspect ratio from the project)
 * @param out Composed RGBA surface
 * @return true on success, false on failure (logged)
 *
 * @note Seeks both frame sources to the key frame at/before source_time and
 *       decodes forward, so any timestamp can be previewed in any order.
 */
bool render_preview_frame(Project &project, double source_time,
                          Resolution resolution, cv::Mat &out);

/**
 * @brief render_preview_frame + PNG encode.
 * @return true on success, false on failure (logged)
 */
bool write_preview_png(Project &project, double source_time,
                       Resolution resolution, const std::string &png_path);

} // namespace cinecut

#endif // CINECUT_PREVIEW_HPP
