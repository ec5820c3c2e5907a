/**
 * @file ffmpeg_decoder.cpp
 * @brief FFmpeg decoder implementation
 */

#include "cinecut/ffmpeg_decoder.hpp"

#include <cmath>
#include <utility>

extern "C" {
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
}

#include "cinecut/errors.hpp"
#include "cinecut/logging.hpp"
#include "cinecut/types.hpp"

namespace cinecut {

namespace {

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

} // anonymous namespace

FFmpegDecoder::FFmpegDecoder(std::string path) : path_(std::move(path)) {
  frame_ = av_frame_alloc();
  pkt_ = av_packet_alloc();
}

FFmpegDecoder::~FFmpegDecoder() {
  if (sws_)
    sws_freeContext(sws_);

  if (dec_ctx_)
    avcodec_free_context(&dec_ctx_);

  /// With AVFMT_FLAG_CUSTOM_IO the AVIO context stays ours to free
  if (fmt_ctx_)
    avformat_close_input(&fmt_ctx_);
  if (avio_ctx_) {
    /// The buffer may have been reallocated by libavformat
    av_freep(&avio_ctx_->buffer);
    avio_context_free(&avio_ctx_);
  } else if (avio_buffer_) {
    av_free(avio_buffer_);
  }

  av_frame_free(&frame_);
  av_packet_free(&pkt_);
}

bool FFmpegDecoder::initialize() {
  if (!frame_ || !pkt_) {
    LOG_ERROR("Failed to allocate frame/packet");
    return false;
  }

  if (!media_.map(path_))
    return false;
  reader_ = media_.reader();

  fmt_ctx_ = avformat_alloc_context();
  if (!fmt_ctx_) {
    LOG_ERROR("Failed to allocate AVFormatContext");
    return false;
  }

  avio_buffer_ = static_cast<uint8_t *>(av_malloc(AVIO_BUFFER_SIZE));
  if (!avio_buffer_) {
    LOG_ERROR("Failed to allocate AVIO buffer");
    return false;
  }

  avio_ctx_ = avio_alloc_context(avio_buffer_, AVIO_BUFFER_SIZE, 0, &reader_,
                                 MappedMedia::read_packet, nullptr,
                                 MappedMedia::seek);
  if (!avio_ctx_) {
    LOG_ERROR("Failed to allocate AVIOContext");
    return false;
  }

  fmt_ctx_->pb = avio_ctx_;
  fmt_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

  /// On failure avformat_open_input frees fmt_ctx_ and leaves avio_ctx_
  int ret = avformat_open_input(&fmt_ctx_, path_.c_str(), nullptr, nullptr);
  if (ret < 0) {
    LOG_ERROR("avformat_open_input failed for {}: {}", path_,
              av_error_string(ret));
    return false;
  }

  if (avformat_find_stream_info(fmt_ctx_, nullptr) < 0) {
    LOG_ERROR("avformat_find_stream_info failed for {}", path_);
    return false;
  }

  stream_idx_ =
      av_find_best_stream(fmt_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (stream_idx_ < 0) {
    LOG_ERROR("No video stream found in {}", path_);
    return false;
  }

  /// Only the video stream is demuxed
  for (unsigned int i = 0; i < fmt_ctx_->nb_streams; i++) {
    if (i != static_cast<unsigned int>(stream_idx_))
      fmt_ctx_->streams[i]->discard = AVDISCARD_ALL;
  }

  AVStream *stream = fmt_ctx_->streams[stream_idx_];
  time_base_ = stream->time_base;
  start_pts_ = (stream->start_time != AV_NOPTS_VALUE) ? stream->start_time : 0;

  const AVCodec *codec = avcodec_find_decoder(stream->codecpar->codec_id);
  if (!codec) {
    LOG_ERROR("No decoder found for codec ID {}",
              static_cast<int>(stream->codecpar->codec_id));
    return false;
  }

  dec_ctx_ = avcodec_alloc_context3(codec);
  if (!dec_ctx_) {
    LOG_ERROR("Failed to allocate decoder context");
    return false;
  }
  if (avcodec_parameters_to_context(dec_ctx_, stream->codecpar) < 0) {
    LOG_ERROR("Failed to copy codec parameters");
    return false;
  }
  dec_ctx_->pkt_timebase = time_base_;

  /// Thread count chosen by libavcodec
  dec_ctx_->thread_count = 0;
  dec_ctx_->thread_type = FF_THREAD_SLICE | FF_THREAD_FRAME;

  ret = avcodec_open2(dec_ctx_, codec, nullptr);
  if (ret < 0) {
    LOG_ERROR("avcodec_open2 failed: {}", av_error_string(ret));
    return false;
  }

  LOG_INFO("Opened {} ({}x{}, {} @ {:.2f}fps, {:.2f}s)", path_,
           dec_ctx_->width, dec_ctx_->height, codec->name, fps(), duration());
  return true;
}

double FFmpegDecoder::duration() const {
  if (!fmt_ctx_ || stream_idx_ < 0)
    return 0.0;
  const AVStream *stream = fmt_ctx_->streams[stream_idx_];
  if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
    return stream->duration * av_q2d(stream->time_base);
  return (fmt_ctx_->duration != AV_NOPTS_VALUE)
             ? fmt_ctx_->duration / static_cast<double>(AV_TIME_BASE)
             : 0.0;
}

double FFmpegDecoder::fps() const {
  if (!fmt_ctx_ || stream_idx_ < 0)
    return 30.0;
  AVRational r = fmt_ctx_->streams[stream_idx_]->avg_frame_rate;
  return (r.num > 0 && r.den > 0) ? av_q2d(r) : 30.0;
}

void FFmpegDecoder::send_packet() {
  const int ret = avcodec_send_packet(dec_ctx_, pkt_);
  if (ret == AVERROR(EAGAIN)) {
    /// Output must be drained first, the packet is resent on the next feed
    packet_pending_ = true;
    return;
  }
  packet_pending_ = false;
  av_packet_unref(pkt_);
  if (ret < 0) {
    throw ExportError(ErrorKind::Decode,
                      fmt::format("{}: error sending packet: {}", path_,
                                  av_error_string(ret)));
  }
}

void FFmpegDecoder::feed_packet() {
  if (packet_pending_) {
    send_packet();
    return;
  }

  while (true) {
    int ret = av_read_frame(fmt_ctx_, pkt_);
    if (ret < 0) {
      /// End of input: enter draining mode
      avcodec_send_packet(dec_ctx_, nullptr);
      eof_sent_ = true;
      return;
    }

    if (pkt_->stream_index != stream_idx_) {
      av_packet_unref(pkt_);
      continue;
    }

    if (expect_key_ && !(pkt_->flags & AV_PKT_FLAG_KEY)) {
      av_packet_unref(pkt_);
      throw ExportError(ErrorKind::Decode,
                        fmt::format("{}: decoding must start at a key frame",
                                    path_));
    }
    if (pkt_->dts != AV_NOPTS_VALUE) {
      if (last_dts_ != AV_NOPTS_VALUE && pkt_->dts < last_dts_) {
        const int64_t dts = pkt_->dts;
        av_packet_unref(pkt_);
        throw ExportError(ErrorKind::Decode,
                          fmt::format("{}: packet out of order (dts {} < {})",
                                      path_, dts, last_dts_));
      }
      last_dts_ = pkt_->dts;
    }
    expect_key_ = false;

    send_packet();
    return;
  }
}

FramePtr FFmpegDecoder::next_frame() {
  if (!dec_ctx_)
    return nullptr;

  while (true) {
    int ret = avcodec_receive_frame(dec_ctx_, frame_);
    if (ret == 0) {
      TIMER_START(convert);
      FramePtr out = convert(frame_);
      av_frame_unref(frame_);
      TIMER_ACCUMULATE(convert);
      return out;
    }
    if (ret == AVERROR_EOF)
      return nullptr;
    if (ret != AVERROR(EAGAIN)) {
      throw ExportError(ErrorKind::Decode,
                        fmt::format("{}: decode error: {}", path_,
                                    av_error_string(ret)));
    }
    if (eof_sent_)
      return nullptr;
    feed_packet();
  }
}

FramePtr FFmpegDecoder::convert(const AVFrame *f) {
  sws_ = sws_getCachedContext(sws_, f->width, f->height,
                              static_cast<AVPixelFormat>(f->format), f->width,
                              f->height, AV_PIX_FMT_RGBA, SWS_BILINEAR,
                              nullptr, nullptr, nullptr);
  if (!sws_) {
    throw ExportError(ErrorKind::Configuration,
                      fmt::format("{}: no RGBA conversion for pixel format {}",
                                  path_, f->format));
  }

  auto out = std::make_unique<DecodedFrame>();
  out->rgba.create(f->height, f->width, CV_8UC4);

  uint8_t *dst_data[1] = {out->rgba.data};
  int dst_linesize[1] = {static_cast<int>(out->rgba.step[0])};
  sws_scale(sws_, f->data, f->linesize, 0, f->height, dst_data, dst_linesize);

  const int64_t pts = (f->best_effort_timestamp != AV_NOPTS_VALUE)
                          ? f->best_effort_timestamp
                          : f->pts;
  out->timestamp =
      (pts != AV_NOPTS_VALUE) ? (pts - start_pts_) * av_q2d(time_base_) : 0.0;
  return out;
}

bool FFmpegDecoder::seek(double t) {
  if (!fmt_ctx_ || !dec_ctx_)
    return false;

  const int64_t target =
      start_pts_ + static_cast<int64_t>(std::llround(t / av_q2d(time_base_)));
  int ret = av_seek_frame(fmt_ctx_, stream_idx_, target, AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    LOG_ERROR("Seek to {:.3f}s failed in {}: {}", t, path_,
              av_error_string(ret));
    return false;
  }

  avcodec_flush_buffers(dec_ctx_);
  av_packet_unref(pkt_);
  packet_pending_ = false;
  expect_key_ = true;
  last_dts_ = AV_NOPTS_VALUE;
  eof_sent_ = false;
  return true;
}

} // namespace cinecut
