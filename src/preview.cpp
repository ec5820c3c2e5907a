/**
 * @file preview.cpp
 * @brief Preview rendering implementation
 */

#include "cinecut/preview.hpp"

#include <memory>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "cinecut/compositor.hpp"
#include "cinecut/errors.hpp"
#include "cinecut/export_pipeline.hpp"
#include "cinecut/ffmpeg_decoder.hpp"
#include "cinecut/frame_source.hpp"
#include "cinecut/logging.hpp"

namespace cinecut {

bool render_preview_frame(Project &project, double source_time,
                          Resolution resolution, cv::Mat &out) {
  TIMER_START(preview_frame);

  auto decoder = std::make_unique<FFmpegDecoder>(project.video_path);
  if (!decoder->initialize())
    return false;

  const double duration = decoder->duration();
  finalize_project(project, {static_cast<double>(decoder->width()),
                             static_cast<double>(decoder->height())},
                   duration);
  FrameSource main("main", std::move(decoder));

  std::unique_ptr<FrameSource> webcam;
  double webcam_scale = 1.0;
  if (project.has_webcam() && project.scene.styles.webcam_visible) {
    auto cam = std::make_unique<FFmpegDecoder>(project.webcam_video_path);
    if (cam->initialize()) {
      webcam_scale = webcam_time_scale(cam->duration(), duration);
      webcam = std::make_unique<FrameSource>("webcam", std::move(cam));
    } else {
      LOG_WARN("[Preview] Webcam video unavailable");
    }
  }

  try {
    if (!main.seek(source_time))
      return false;
    const DecodedFrame *frame = main.get_frame(source_time);
    if (!frame) {
      LOG_ERROR("[Preview] No frame at {:.3f}s", source_time);
      return false;
    }

    const cv::Mat *cam_frame = nullptr;
    if (webcam) {
      const double cam_time = source_time * webcam_scale;
      if (webcam->seek(cam_time)) {
        const DecodedFrame *cf = webcam->get_frame(cam_time);
        if (cf)
          cam_frame = &cf->rgba;
      }
    }

    const ExportDimensions dims =
        calculate_export_dimensions(resolution, project.aspect_ratio);
    SceneCompositor compositor(project.scene,
                               cv::Size(dims.width, dims.height));
    compositor.initialize();
    compositor.compose(source_time, frame->rgba, cam_frame, out);
  } catch (const ExportError &e) {
    LOG_ERROR("[Preview] {}", e.what());
    return false;
  }

  TIMER_END(preview_frame);
  return true;
}

bool write_preview_png(Project &project, double source_time,
                       Resolution resolution, const std::string &png_path) {
  cv::Mat rgba;
  if (!render_preview_frame(project, source_time, resolution, rgba))
    return false;

  cv::Mat bgra;
  cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);
  try {
    if (!cv::imwrite(png_path, bgra)) {
      LOG_ERROR("[Preview] Failed to write {}", png_path);
      return false;
    }
  } catch (const cv::Exception &e) {
    LOG_ERROR("[Preview] Failed to write {}: {}", png_path, e.what());
    return false;
  }
  LOG_SUCCESS("Preview saved to: {}", png_path);
  return true;
}

} // namespace cinecut
