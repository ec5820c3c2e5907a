/**
 * @file frame_sink.hpp
 * @brief Destinations for composed export frames
 *
 * @details The render loop submits frames in index order; a sink hands them
 *          to the muxer either as raw RGBA (GIF path) or as H.264 encoded
 *          in-process (MP4 path). Both sinks encode/write on one worker
 *          thread so rendering and encoding overlap, and report their
 *          backlog through pending() for the render loop's backpressure.
 */

#ifndef CINECUT_FRAME_SINK_HPP
#define CINECUT_FRAME_SINK_HPP

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>

#include <opencv2/core.hpp>

#include "export_settings.hpp"
#include "frame_queue.hpp"
#include "muxer_process.hpp"
#include "video_encoder.hpp"

namespace cinecut {

/**
 * @class FrameSink
 * @brief Consumer of composed RGBA frames.
 */
class FrameSink {
public:
  virtual ~FrameSink() = default;

  /**
   * @brief Queue one frame. The surface is copied.
   * @throws the worker's error if an earlier frame failed
   */
  virtual void submit(int64_t frame_index, const cv::Mat &rgba) = 0;

  /// Frames submitted but not yet written/encoded
  virtual size_t pending() const = 0;

  /**
   * @brief Drain the backlog and flush.
   * @throws the worker's error, if any
   */
  virtual void finish() = 0;

  /// Drop the backlog and stop. Never throws.
  virtual void abort() = 0;

  virtual const char *name() const = 0;
};

/**
 * @class ThreadedSink
 * @brief FrameQueue + worker thread shared by the concrete sinks.
 *
 * @attention The first error raised on the worker aborts the queue, makes
 *            pending() drop to 0 and is rethrown by the next submit() or
 *            finish().
 */
class ThreadedSink : public FrameSink {
public:
  ~ThreadedSink() override;

  void submit(int64_t frame_index, const cv::Mat &rgba) override;
  size_t pending() const override;
  void finish() override;
  void abort() override;

protected:
  /// Start the worker. Called once the sink is fully set up.
  void start_worker();

  /// Worker: write or encode one frame
  virtual void process(const EncodeJob &job) = 0;

  /// Worker: after the last frame (encoder flush)
  virtual void on_finish() {}

private:
  void worker_loop();
  void rethrow_if_failed();
  void join_worker();

  FrameQueue queue_;
  std::thread worker_;
  std::atomic<size_t> in_flight_{0};
  std::atomic<bool> failed_{false};
  std::mutex error_mutex_;
  std::exception_ptr error_;
};

/**
 * @class RawPipeSink
 * @brief Writes tightly packed RGBA frames to the muxer's stdin.
 */
class RawPipeSink : public ThreadedSink {
public:
  RawPipeSink(MuxerProcess &muxer, const ExportDimensions &dims);
  ~RawPipeSink() override;

  const char *name() const override { return "rawvideo"; }

protected:
  void process(const EncodeJob &job) override;

private:
  MuxerProcess &muxer_;
  ExportDimensions dims_;
};

/**
 * @class H264StreamSink
 * @brief Encodes frames with libavcodec and streams Annex-B to the muxer.
 */
class H264StreamSink : public ThreadedSink {
public:
  H264StreamSink(MuxerProcess &muxer, const PipelineConfig &config);
  ~H264StreamSink() override;

  /**
   * @brief Open the encoder and start the worker.
   * @return true on success, false on failure (logged)
   */
  bool initialize();

  const char *name() const override { return encoder_.name().c_str(); }

protected:
  void process(const EncodeJob &job) override;
  void on_finish() override;

private:
  MuxerProcess &muxer_;
  H264Encoder encoder_;
  PacketWriter writer_;
};

/**
 * @brief Create and start the sink for a negotiated pipeline.
 * @throws ExportError(Configuration) if the encoder cannot be opened
 */
std::unique_ptr<FrameSink> make_frame_sink(const PipelineConfig &config,
                                           MuxerProcess &muxer);

} // namespace cinecut

#endif // CINECUT_FRAME_SINK_HPP
