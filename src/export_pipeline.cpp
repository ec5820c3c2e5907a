/**
 * @file export_pipeline.cpp
 * @brief Export orchestration implementation
 */

#include "cinecut/export_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <thread>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "cinecut/config.hpp"
#include "cinecut/errors.hpp"
#include "cinecut/ffmpeg_decoder.hpp"
#include "cinecut/logging.hpp"
#include "cinecut/system.hpp"

namespace cinecut {

namespace fs = std::filesystem;

int64_t total_export_frames(double export_duration, int fps) {
  if (export_duration <= 0.0 || fps <= 0)
    return 0;
  return static_cast<int64_t>(std::floor(export_duration * fps));
}

int progress_percent(int64_t frame, int64_t total_frames) {
  if (total_frames <= 0)
    return 0;
  const double pct =
      static_cast<double>(frame + 1) / static_cast<double>(total_frames) * 100.0;
  return std::min(99, static_cast<int>(pct));
}

double webcam_time_scale(double webcam_duration, double main_duration) {
  if (webcam_duration <= 0.0 || main_duration <= 0.0)
    return 1.0;
  return webcam_duration / main_duration;
}

// **---- FrameRenderLoop ----**

FrameRenderLoop::FrameRenderLoop(const TimelineRemapper &remapper,
                                 FrameSource &main, FrameSource *webcam,
                                 SceneCompositor &compositor, FrameSink &sink,
                                 const RenderLoopParams &params,
                                 const CancellationToken *cancel,
                                 ProgressCallback progress)
    : remapper_(remapper), main_(main), webcam_(webcam),
      compositor_(compositor), sink_(sink), params_(params), cancel_(cancel),
      progress_(std::move(progress)) {}

void FrameRenderLoop::wait_for_sink() {
  while (sink_.pending() > params_.max_in_flight) {
    throw_if_cancelled(cancel_);
    std::this_thread::sleep_for(std::chrono::milliseconds(params_.poll_ms));
  }
}

void FrameRenderLoop::run() {
  int last_percent = -1;

  for (int64_t frame = 0; frame < params_.total_frames; ++frame) {
    throw_if_cancelled(cancel_);

    const double export_time = static_cast<double>(frame) / params_.fps;
    const double source_time = remapper_.to_source(export_time);

    TIMER_START(decode);
    const DecodedFrame *main = main_.get_frame(source_time);
    if (!main) {
      throw ExportError(ErrorKind::Configuration,
                        fmt::format("Main video frame unavailable at {:.3f}s",
                                    source_time));
    }

    const cv::Mat *webcam = nullptr;
    if (webcam_) {
      const DecodedFrame *cam =
          webcam_->get_frame(source_time * params_.webcam_scale);
      if (cam)
        webcam = &cam->rgba;
    }
    TIMER_ACCUMULATE(decode);

    TIMER_START(composite);
    compositor_.compose(source_time, main->rgba, webcam, surface_, &pan_);
    TIMER_ACCUMULATE(composite);

    TIMER_START(backpressure);
    wait_for_sink();
    TIMER_ACCUMULATE(backpressure);

    sink_.submit(frame, surface_);
    frames_rendered_ = frame + 1;

    const int percent = progress_percent(frame, params_.total_frames);
    if (progress_ && percent != last_percent) {
      progress_({percent, "Rendering..."});
      last_percent = percent;
    }
  }
}

// **---- ExportPipeline ----**

ExportPipeline::ExportPipeline(ExportJob job) : job_(std::move(job)) {}

ExportPipeline::~ExportPipeline() = default;

void ExportPipeline::report(int progress, const char *stage) {
  LOG_PHASE("[Export] {} ({}%)", stage, progress);
  if (job_.on_progress)
    job_.on_progress({progress, stage});
}

void ExportPipeline::execute() {
  Project &project = job_.project;
  const ExportSettings &settings = job_.settings;

  report(0, "Preparing audio...");

  // **----- OPEN SOURCES -----**

  auto decoder = std::make_unique<FFmpegDecoder>(project.video_path);
  if (!decoder->initialize()) {
    throw ExportError(ErrorKind::Configuration,
                      fmt::format("Failed to open video: {}",
                                  project.video_path));
  }
  source_duration_ = decoder->duration();
  finalize_project(project, {static_cast<double>(decoder->width()),
                             static_cast<double>(decoder->height())},
                   source_duration_);
  main_ = std::make_unique<FrameSource>("main", std::move(decoder));

  double webcam_scale = 1.0;
  if (project.has_webcam() && project.scene.styles.webcam_visible) {
    auto cam = std::make_unique<FFmpegDecoder>(project.webcam_video_path);
    if (cam->initialize()) {
      webcam_scale = webcam_time_scale(cam->duration(), source_duration_);
      webcam_ = std::make_unique<FrameSource>("webcam", std::move(cam));
    } else {
      LOG_WARN("[Export] Webcam video unavailable, exporting without it");
    }
  }

  TimelineRemapper remapper(source_duration_, project.cut_regions,
                            project.speed_regions);
  export_duration_ = remapper.export_duration();
  const int64_t total_frames = total_export_frames(export_duration_, settings.fps);
  if (total_frames <= 0) {
    throw ExportError(ErrorKind::Configuration,
                      "Nothing to export: the edited timeline is empty");
  }
  LOG_INFO("[Export] {} -> {} ({} frames @ {}fps)",
           format_time(source_duration_), format_time(export_duration_),
           total_frames, settings.fps);

  // **----- AUDIO PRE-PASS -----**

  std::string audio_path;
  if (project.has_audio() && settings.format == ExportFormat::Mp4) {
    TIMER_START(audio_pass);
    audio_ = std::make_unique<AudioResegmenter>(project.audio_path);
    audio_path = audio_->process(source_duration_, project.cut_regions,
                                 project.speed_regions, job_.cancel);
    TIMER_END(audio_pass);
  }
  throw_if_cancelled(job_.cancel);

  // **----- PIPELINE SETUP -----**

  dims_ = calculate_export_dimensions(settings.resolution, project.aspect_ratio);
  const PipelineConfig config = negotiate_pipeline(settings, dims_);
  encoder_name_ =
      (config.path == OutputPath::EncodedH264) ? config.encoder : "rawvideo";

  const auto args =
      (config.path == OutputPath::RawRgba)
          ? build_gif_mux_args(config, job_.output_path)
          : build_mp4_mux_args(config, audio_path, job_.output_path);

  muxer_ = std::make_unique<MuxerProcess>(args);
  if (!muxer_->start())
    throw ExportError(ErrorKind::Io, "Failed to start ffmpeg");
  output_started_ = true;

  if (!muxer_->wait_ready(Config::muxer_ready_timeout_ms()))
    throw ExportError(ErrorKind::Io, "Muxer did not become ready");

  sink_ = make_frame_sink(config, *muxer_);

  SceneCompositor compositor(project.scene,
                             cv::Size(dims_.width, dims_.height));
  compositor.initialize();

  // **----- RENDER LOOP -----**

  report(0, "Rendering...");

  RenderLoopParams params;
  params.fps = settings.fps;
  params.total_frames = total_frames;
  params.webcam_scale = webcam_scale;
  params.max_in_flight =
      static_cast<size_t>(std::max(1, Config::encoder_max_in_flight()));
  params.poll_ms = Config::encoder_poll_ms();

  FrameRenderLoop loop(remapper, *main_, webcam_.get(), compositor, *sink_,
                       params, job_.cancel, job_.on_progress);

  TIMER_START(render_loop);
  loop.run();
  TIMER_END(render_loop);
  frames_ = loop.frames_rendered();

  // **----- FINALIZE -----**

  report(99, "Finalizing...");

  TIMER_START(encoder_flush);
  sink_->finish();
  TIMER_END(encoder_flush);

  muxer_->close_input();

  TIMER_START(mux_wait);
  const int code = muxer_->wait();
  TIMER_END(mux_wait);
  if (code != 0) {
    throw ExportError(ErrorKind::Io,
                      fmt::format("FFmpeg exited with code {}", code));
  }

  main_->close();
  if (webcam_)
    webcam_->close();
}

void ExportPipeline::teardown_on_failure() {
  /// Muxer first: a worker blocked on the pipe gets EPIPE and exits
  if (muxer_)
    muxer_->kill();
  if (sink_)
    sink_->abort();
  if (main_)
    main_->close();
  if (webcam_)
    webcam_->close();

  if (output_started_) {
    std::error_code ec;
    if (fs::remove(job_.output_path, ec))
      LOG_INFO("[Export] Removed partial output {}", job_.output_path);
    else if (ec)
      LOG_WARN("[Export] Failed to remove {}: {}", job_.output_path,
               ec.message());
  }
}

ExportResult ExportPipeline::run() {
  TimingCollector::clear();
  const auto start = std::chrono::steady_clock::now();

  ExportResult result;
  try {
    execute();
    result.success = true;
    result.output_path = job_.output_path;
  } catch (const ExportError &e) {
    result.cancelled = e.kind() == ErrorKind::Cancelled;
    result.error = e.what();
  } catch (const std::exception &e) {
    result.error = e.what();
  }

  /// A failure caused by a cancelled muxer still reports cancellation
  if (!result.success && job_.cancel && job_.cancel->is_cancelled()) {
    result.cancelled = true;
    result.error = cancelled_message();
  }

  if (!result.success) {
    if (result.cancelled)
      LOG_WARN("[Export] {}", result.error);
    else
      LOG_ERROR("[Export] {}", result.error);
    teardown_on_failure();
  }

  if (audio_)
    audio_->cleanup();

  elapsed_sec_ = std::chrono::duration<double>(
                     std::chrono::steady_clock::now() - start)
                     .count();

  if (result.success) {
    report(100, "Finalizing...");
    LOG_SUCCESS("Output saved to: {}", result.output_path);
  }

  TimingCollector::print_summary();
  print_summary(result);
  return result;
}

// **---- Export Summary ----**

void ExportPipeline::print_summary(const ExportResult &result) const {
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== EXPORT SUMMARY ==================\n");
  fmt::print("{:<20} {:>15}\n", "Source:", format_time(source_duration_));
  fmt::print("{:<20} {:>15}\n", "Export:", format_time(export_duration_));
  fmt::print("{:<20} {:>15}\n", "Frames:", frames_);
  fmt::print("{:<20} {:>15}\n", "Size:",
             fmt::format("{}x{}", dims_.width, dims_.height));
  fmt::print("{:<20} {:>15}\n", "Encoder:",
             encoder_name_.empty() ? "-" : encoder_name_);
  fmt::print("{:<20} {:>14.1f}s\n", "Elapsed:", elapsed_sec_);
  if (result.success)
    fmt::print(fg(fmt::color::green), "{:<20} {:>15}\n", "Status:", "OK");
  else
    fmt::print(fg(fmt::color::red), "{:<20} {:>15}\n", "Status:",
               result.cancelled ? "CANCELLED" : "FAILED");
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

} // namespace cinecut
