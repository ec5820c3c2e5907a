/**
 * @file frame_sink.cpp
 * @brief Frame sink implementations
 */

#include "cinecut/frame_sink.hpp"

#include <utility>

#include "cinecut/errors.hpp"
#include "cinecut/logging.hpp"

namespace cinecut {

// **---- ThreadedSink ----**

ThreadedSink::~ThreadedSink() {
  queue_.abort();
  join_worker();
}

void ThreadedSink::start_worker() {
  worker_ = std::thread([this]() { worker_loop(); });
}

void ThreadedSink::worker_loop() {
  EncodeJob job;
  while (queue_.pop(job)) {
    try {
      TIMER_START(sink_frame);
      process(job);
      TIMER_ACCUMULATE(sink_frame);
    } catch (const std::exception &e) {
      LOG_ERROR("[Sink] Frame {} failed: {}", job.frame_index, e.what());
      {
        std::lock_guard<std::mutex> lock(error_mutex_);
        error_ = std::current_exception();
      }
      failed_.store(true);
      queue_.abort();
      in_flight_.store(0);
      return;
    }
    job.rgba.release();
    --in_flight_;
  }

  /// Aborted queues end here too; only a clean finish flushes
  if (failed_.load())
    return;
  try {
    on_finish();
  } catch (const std::exception &e) {
    LOG_ERROR("[Sink] Flush failed: {}", e.what());
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_ = std::current_exception();
    failed_.store(true);
  }
}

void ThreadedSink::rethrow_if_failed() {
  if (!failed_.load())
    return;
  std::lock_guard<std::mutex> lock(error_mutex_);
  if (error_)
    std::rethrow_exception(error_);
}

void ThreadedSink::join_worker() {
  if (worker_.joinable())
    worker_.join();
}

void ThreadedSink::submit(int64_t frame_index, const cv::Mat &rgba) {
  rethrow_if_failed();
  ++in_flight_;
  queue_.push({frame_index, rgba.clone()});
}

size_t ThreadedSink::pending() const {
  /// A failed worker processes nothing more
  return failed_.load() ? 0 : in_flight_.load();
}

void ThreadedSink::finish() {
  queue_.finish();
  join_worker();
  rethrow_if_failed();
}

void ThreadedSink::abort() {
  /// Failed state makes the worker skip on_finish()
  failed_.store(true);
  const size_t dropped = queue_.abort();
  join_worker();
  in_flight_.store(0);
  if (dropped > 0)
    LOG_DEBUG("[Sink] Dropped {} queued frames", dropped);
}

// **---- RawPipeSink ----**

RawPipeSink::RawPipeSink(MuxerProcess &muxer, const ExportDimensions &dims)
    : muxer_(muxer), dims_(dims) {
  start_worker();
}

RawPipeSink::~RawPipeSink() { abort(); }

void RawPipeSink::process(const EncodeJob &job) {
  if (job.rgba.cols != dims_.width || job.rgba.rows != dims_.height ||
      job.rgba.type() != CV_8UC4) {
    throw ExportError(ErrorKind::Configuration,
                      fmt::format("Frame {} is {}x{}, expected {}x{} RGBA",
                                  job.frame_index, job.rgba.cols,
                                  job.rgba.rows, dims_.width, dims_.height));
  }

  /// clone() output is continuous: rows are tightly packed
  muxer_.write(job.rgba.data, job.rgba.total() * job.rgba.elemSize());
}

// **---- H264StreamSink ----**

H264StreamSink::H264StreamSink(MuxerProcess &muxer,
                               const PipelineConfig &config)
    : muxer_(muxer), encoder_(config.encoder, config.dims.width,
                              config.dims.height, config.fps, config.bitrate) {
  writer_ = [this](const uint8_t *data, size_t size) {
    muxer_.write(data, size);
  };
}

H264StreamSink::~H264StreamSink() { abort(); }

bool H264StreamSink::initialize() {
  if (!encoder_.initialize())
    return false;
  start_worker();
  return true;
}

void H264StreamSink::process(const EncodeJob &job) {
  encoder_.encode(job.rgba, job.frame_index, writer_);
}

void H264StreamSink::on_finish() { encoder_.flush(writer_); }

// **---- Factory ----**

std::unique_ptr<FrameSink> make_frame_sink(const PipelineConfig &config,
                                           MuxerProcess &muxer) {
  if (config.path == OutputPath::RawRgba)
    return std::make_unique<RawPipeSink>(muxer, config.dims);

  auto sink = std::make_unique<H264StreamSink>(muxer, config);
  if (!sink->initialize()) {
    throw ExportError(ErrorKind::Configuration,
                      fmt::format("Failed to open H.264 encoder {}",
                                  config.encoder));
  }
  return sink;
}

} // namespace cinecut
