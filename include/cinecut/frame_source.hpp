/**
 * @file frame_source.hpp
 * @brief Sequential frame access for one media stream
 *
 * @details FrameSource turns a non-decreasing sequence of source timestamps
 *          into decoded frames, decoding lazily and only one frame ahead.
 *          It owns exactly two frames at a time (current and lookahead);
 *          a superseded frame is released before the next one is pulled.
 */

#ifndef CINECUT_FRAME_SOURCE_HPP
#define CINECUT_FRAME_SOURCE_HPP

#include <memory>
#include <string>

#include <opencv2/core.hpp>

namespace cinecut {

/**
 * @struct DecodedFrame
 * @brief One decoded picture in RGBA (CV_8UC4).
 */
struct DecodedFrame {
  double timestamp = 0.0; //< Presentation time in seconds from stream start
  cv::Mat rgba;
};

using FramePtr = std::unique_ptr<DecodedFrame>;

/**
 * @class FrameDecoder
 * @brief Bitstream-order decoder feeding a FrameSource.
 */
class FrameDecoder {
public:
  virtual ~FrameDecoder() = default;

  /**
   * @brief Next frame in presentation order.
   * @return nullptr at the end of the stream
   * @throws ExportError(Decode) on out-of-order or non-key-start input
   */
  virtual FramePtr next_frame() = 0;

  /// Reposition at the key frame at/before t. False on failure (logged).
  virtual bool seek(double t) = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;
  virtual double duration() const = 0;
};

/**
 * @class FrameSource
 * @brief Current/lookahead frame pair over a FrameDecoder.
 *
 * @attention Requests must be non-decreasing between seeks. An earlier
 *            request is logged and answered with the current frame.
 */
class FrameSource {
public:
  FrameSource(std::string label, std::unique_ptr<FrameDecoder> decoder);
  ~FrameSource();

  /// Disable copy (owns the decoder and its frames)
  FrameSource(const FrameSource &) = delete;
  FrameSource &operator=(const FrameSource &) = delete;

  /**
   * @brief Frame visible at t: the last decoded frame with timestamp <= t,
   *        or the first frame when t precedes it.
   * @return nullptr if the source is closed or produced no frame
   * @note The pointer stays valid until the next get_frame/seek/close.
   */
  const DecodedFrame *get_frame(double t);

  /**
   * @brief Drop held frames and restart decoding at the key frame at/before
   *        t. Used by the preview path only.
   */
  bool seek(double t);

  /// Release held frames and destroy the decoder. Idempotent.
  void close();

  bool is_open() const { return decoder_ != nullptr; }
  const std::string &label() const { return label_; }

  /// Decoder properties (0 once closed)
  int width() const { return decoder_ ? decoder_->width() : 0; }
  int height() const { return decoder_ ? decoder_->height() : 0; }
  double duration() const { return decoder_ ? decoder_->duration() : 0.0; }

private:
  std::string label_;
  std::unique_ptr<FrameDecoder> decoder_;
  FramePtr current_;
  FramePtr lookahead_;
  bool primed_ = false;
  bool exhausted_ = false;
  double last_request_ = 0.0;
  bool has_request_ = false;
};

} // namespace cinecut

#endif // CINECUT_FRAME_SOURCE_HPP
