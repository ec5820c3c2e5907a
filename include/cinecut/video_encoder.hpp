/**
 * @file video_encoder.hpp
 * @brief In-process H.264 encoding with libavcodec
 *
 * @details Converts composed RGBA frames to the encoder pixel format with
 *          libswscale and emits Annex-B packets. Parameter sets (SPS/PPS)
 *          must be present, either in-band on the first key frame or in the
 *          codec extradata, before anything is written downstream.
 */

#ifndef CINECUT_VIDEO_ENCODER_HPP
#define CINECUT_VIDEO_ENCODER_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
}

#include <cstdint>
#include <functional>
#include <string>

#include <opencv2/core.hpp>

namespace cinecut {

/// Receives encoded bytes in bitstream order
using PacketWriter = std::function<void(const uint8_t *data, size_t size)>;

/**
 * @brief Pixel format to feed an encoder (YUV420P, else NV12).
 * @return AV_PIX_FMT_NONE if the encoder accepts neither
 */
AVPixelFormat encoder_pixel_format(const AVCodec *codec);

/**
 * @brief Apply the export parameters and low-latency options.
 * @note No B-frames: the muxer rewrites timestamps as dts = pts = N.
 */
void configure_h264_context(AVCodecContext *ctx, const AVCodec *codec,
                            AVPixelFormat pix_fmt, int width, int height,
                            int fps, int64_t bitrate);

/**
 * @brief True if an Annex-B buffer carries both an SPS (7) and PPS (8).
 */
bool has_parameter_sets(const uint8_t *data, size_t size);

/**
 * @class H264Encoder
 * @brief Owns the encoder, scaler and scratch frame/packet of one export.
 *
 * @attention Not thread-safe. Used from the sink worker thread only.
 */
class H264Encoder {
  AVCodecContext *ctx_ = nullptr;
  SwsContext *sws_ = nullptr;
  AVFrame *frame_ = nullptr;
  AVPacket *pkt_ = nullptr;

  std::string name_;
  int width_;
  int height_;
  int fps_;
  int64_t bitrate_;
  bool parameter_sets_checked_ = false;

  /// Drain available packets into the writer
  void receive_packets(const PacketWriter &write);

public:
  H264Encoder(std::string encoder_name, int width, int height, int fps,
              int64_t bitrate);
  ~H264Encoder();

  /// Disable copy (FFmpeg contexts are not copyable)
  H264Encoder(const H264Encoder &) = delete;
  H264Encoder &operator=(const H264Encoder &) = delete;

  /**
   * @brief Open the encoder and scaler.
   * @return true on success, false on failure (logged)
   */
  bool initialize();

  /**
   * @brief Encode one RGBA frame with pts = frame index.
   * @throws ExportError(Configuration) if the first key frame has no
   *         parameter sets and the extradata has none either
   * @throws ExportError(Io) on encoder failure
   */
  void encode(const cv::Mat &rgba, int64_t pts, const PacketWriter &write);

  /// Flush delayed packets at end of stream
  void flush(const PacketWriter &write);

  const std::string &name() const { return name_; }
};

} // namespace cinecut

#endif // CINECUT_VIDEO_ENCODER_HPP
