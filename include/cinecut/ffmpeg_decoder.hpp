/**
 * @file ffmpeg_decoder.hpp
 * @brief libavcodec-backed FrameDecoder
 *
 * @details Demuxes a memory-mapped recording through custom AVIO callbacks,
 *          decodes the best video stream and converts every picture to RGBA
 *          with libswscale.
 */

#ifndef CINECUT_FFMPEG_DECODER_HPP
#define CINECUT_FFMPEG_DECODER_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswscale/swscale.h>
}

#include <cstdint>
#include <string>

#include "frame_source.hpp"
#include "mapped_media.hpp"

namespace cinecut {

/**
 * @class FFmpegDecoder
 * @brief Sequential decoder for one recording.
 *
 * @attention
 * `BITSTREAM ORDER`:
 *
 *            - After opening or seeking, the first packet fed to the decoder
 *              must be a key frame
 *
 *            - Packet decode timestamps must not go backwards
 *
 *            - Either violation raises ExportError(Decode)
 *
 * `MANAGEMENT`:
 *
 *            - Uses AVFMT_FLAG_CUSTOM_IO so avformat_close_input frees the
 *              AVIO buffer
 *
 *            - Destructor handles partial initialization failures
 */
class FFmpegDecoder : public FrameDecoder {
  /// FFmpeg contexts (owned by this instance)
  AVFormatContext *fmt_ctx_ = nullptr;
  AVCodecContext *dec_ctx_ = nullptr;
  AVIOContext *avio_ctx_ = nullptr;
  uint8_t *avio_buffer_ = nullptr;
  SwsContext *sws_ = nullptr;
  AVFrame *frame_ = nullptr;
  AVPacket *pkt_ = nullptr;

  MappedMedia media_;
  MediaReaderState reader_;
  std::string path_;
  int stream_idx_ = -1;
  AVRational time_base_{0, 1};
  int64_t start_pts_ = 0; //< Stream start time in time_base units

  /// Bitstream order tracking (reset on seek)
  bool expect_key_ = true;
  int64_t last_dts_ = AV_NOPTS_VALUE;
  bool eof_sent_ = false;
  bool packet_pending_ = false; //< pkt_ was refused with EAGAIN

  /// Send pkt_ to the decoder, keeping it for a resend on EAGAIN
  void send_packet();

  /// Feed one packet of the video stream (or the flush packet at EOF)
  void feed_packet();

  /// Copy the decoded picture into an owned RGBA frame
  FramePtr convert(const AVFrame *f);

public:
  explicit FFmpegDecoder(std::string path);
  ~FFmpegDecoder() override;

  /// Disable copy (FFmpeg contexts are not copyable)
  FFmpegDecoder(const FFmpegDecoder &) = delete;
  FFmpegDecoder &operator=(const FFmpegDecoder &) = delete;

  /**
   * @brief Map the file and open demuxer and decoder.
   * @return true on success, false on failure (logged)
   */
  bool initialize();

  FramePtr next_frame() override;
  bool seek(double t) override;

  int width() const override { return dec_ctx_ ? dec_ctx_->width : 0; }
  int height() const override { return dec_ctx_ ? dec_ctx_->height : 0; }
  double duration() const override;

  /// Average frame rate, 30 if the container does not say
  double fps() const;
};

} // namespace cinecut

#endif // CINECUT_FFMPEG_DECODER_HPP
