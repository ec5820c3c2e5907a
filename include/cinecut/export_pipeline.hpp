/**
 * @file export_pipeline.hpp
 * @brief Export orchestration
 *
 * @details Orchestrates one export:
 *
 *          1. Open the recording(s) and complete the project
 *
 *          2. Resegment the audio track (degrades to the original track)
 *
 *          3. Negotiate the output path and start the muxer
 *
 *          4. Render loop: remap, fetch frames, composite, submit with
 *             backpressure
 *
 *          5. Flush the sink and wait for the muxer
 *
 * @note ExportPipeline::run() is the single catch point: every failure ends
 *       in exactly one ExportResult, after the muxer is killed, the frame
 *       sources are closed and the partial output is deleted.
 */

#ifndef CINECUT_EXPORT_PIPELINE_HPP
#define CINECUT_EXPORT_PIPELINE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "audio_resegmenter.hpp"
#include "cancellation.hpp"
#include "compositor.hpp"
#include "export_settings.hpp"
#include "frame_sink.hpp"
#include "frame_source.hpp"
#include "muxer_process.hpp"
#include "project.hpp"
#include "timeline.hpp"
#include "transform.hpp"

namespace cinecut {

/// Progress message: percent (0-100) and stage label
struct ExportProgress {
  int progress = 0;
  std::string stage;
};

using ProgressCallback = std::function<void(const ExportProgress &)>;

/**
 * @struct ExportResult
 * @brief Terminal state of an export.
 * @note A cancelled export has error == "Export cancelled.".
 */
struct ExportResult {
  bool success = false;
  bool cancelled = false;
  std::string output_path; //< Set on success only
  std::string error;
};

/// floor(exportDuration * fps), never negative
int64_t total_export_frames(double export_duration, int fps);

/// min(99, (frame + 1) / total * 100)
int progress_percent(int64_t frame, int64_t total_frames);

/// webcamDuration / mainDuration, 1 when either is unknown
double webcam_time_scale(double webcam_duration, double main_duration);

// **---- Render loop ----**

struct RenderLoopParams {
  int fps = 30;
  int64_t total_frames = 0;
  double webcam_scale = 1.0;
  size_t max_in_flight = 2; //< Sink backlog bound
  int poll_ms = 2;          //< Sleep between backlog polls
};

/**
 * @class FrameRenderLoop
 * @brief Produces every export frame in index order.
 *
 * @attention Suspends only while waiting for a decoded frame or for the
 *            sink backlog; cancellation is checked at both.
 */
class FrameRenderLoop {
public:
  FrameRenderLoop(const TimelineRemapper &remapper, FrameSource &main,
                  FrameSource *webcam, SceneCompositor &compositor,
                  FrameSink &sink, const RenderLoopParams &params,
                  const CancellationToken *cancel = nullptr,
                  ProgressCallback progress = nullptr);

  /**
   * @brief Render and submit all frames.
   * @throws ExportError(Configuration) when the main frame is unavailable
   * @throws ExportError(Cancelled) on cancellation
   */
  void run();

  int64_t frames_rendered() const { return frames_rendered_; }

private:
  void wait_for_sink();

  const TimelineRemapper &remapper_;
  FrameSource &main_;
  FrameSource *webcam_;
  SceneCompositor &compositor_;
  FrameSink &sink_;
  RenderLoopParams params_;
  const CancellationToken *cancel_;
  ProgressCallback progress_;

  ZoomPanContext pan_;
  cv::Mat surface_;
  int64_t frames_rendered_ = 0;
};

// **---- Export pipeline ----**

/**
 * @struct ExportJob
 * @brief Everything one export needs.
 */
struct ExportJob {
  Project project;
  ExportSettings settings;
  std::string output_path;
  CancellationToken *cancel = nullptr;
  ProgressCallback on_progress;
};

/**
 * @class ExportPipeline
 * @brief Runs an ExportJob to a single terminal result.
 */
class ExportPipeline {
public:
  explicit ExportPipeline(ExportJob job);
  ~ExportPipeline();

  ExportPipeline(const ExportPipeline &) = delete;
  ExportPipeline &operator=(const ExportPipeline &) = delete;

  /// Run the export. Never throws.
  ExportResult run();

private:
  void execute();
  void teardown_on_failure();
  void report(int progress, const char *stage);
  void print_summary(const ExportResult &result) const;

  ExportJob job_;

  /// Destroyed bottom-up: the sink goes before the muxer it writes to
  std::unique_ptr<FrameSource> main_;
  std::unique_ptr<FrameSource> webcam_;
  std::unique_ptr<AudioResegmenter> audio_;
  std::unique_ptr<MuxerProcess> muxer_;
  std::unique_ptr<FrameSink> sink_;

  bool output_started_ = false;
  double source_duration_ = 0.0;
  double export_duration_ = 0.0;
  int64_t frames_ = 0;
  std::string encoder_name_;
  ExportDimensions dims_;
  double elapsed_sec_ = 0.0;
};

} // namespace cinecut

#endif // CINECUT_EXPORT_PIPELINE_HPP
