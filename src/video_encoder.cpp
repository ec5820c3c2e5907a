/**
 * @file video_encoder.cpp
 * @brief libavcodec H.264 encoder implementation
 */

#include "cinecut/video_encoder.hpp"

#include <cstring>
#include <utility>

extern "C" {
#include <libavutil/error.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
}

#include "cinecut/errors.hpp"
#include "cinecut/logging.hpp"

namespace cinecut {

namespace {

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

/// Private option, ignored by encoders that do not know it
void set_option(AVCodecContext *ctx, const char *key, const char *value) {
  if (av_opt_set(ctx->priv_data, key, value, 0) < 0)
    LOG_DEBUG("[Encoder] Option {}={} not supported", key, value);
}

} // anonymous namespace

AVPixelFormat encoder_pixel_format(const AVCodec *codec) {
  if (!codec->pix_fmts)
    return AV_PIX_FMT_YUV420P;

  bool has_nv12 = false;
  for (const AVPixelFormat *p = codec->pix_fmts; *p != AV_PIX_FMT_NONE; ++p) {
    if (*p == AV_PIX_FMT_YUV420P)
      return AV_PIX_FMT_YUV420P;
    if (*p == AV_PIX_FMT_NV12)
      has_nv12 = true;
  }
  return has_nv12 ? AV_PIX_FMT_NV12 : AV_PIX_FMT_NONE;
}

void configure_h264_context(AVCodecContext *ctx, const AVCodec *codec,
                            AVPixelFormat pix_fmt, int width, int height,
                            int fps, int64_t bitrate) {
  ctx->codec_id = codec->id;
  ctx->codec_type = AVMEDIA_TYPE_VIDEO;
  ctx->width = width;
  ctx->height = height;
  ctx->time_base = {1, fps};
  ctx->framerate = {fps, 1};
  ctx->pix_fmt = pix_fmt;
  ctx->bit_rate = bitrate;
  ctx->rc_max_rate = bitrate;
  ctx->rc_buffer_size = static_cast<int>(bitrate);
  ctx->gop_size = fps * 2;
  ctx->max_b_frames = 0;

  const std::string name = codec->name;
  if (name == "libx264") {
    set_option(ctx, "preset", "medium");
    set_option(ctx, "tune", "zerolatency");
  } else if (name == "h264_nvenc") {
    set_option(ctx, "preset", "p4");
    set_option(ctx, "zerolatency", "1");
  } else if (name == "h264_videotoolbox") {
    set_option(ctx, "realtime", "1");
    set_option(ctx, "allow_sw", "1");
  } else if (name == "h264_qsv") {
    set_option(ctx, "async_depth", "1");
  } else if (name == "h264_amf") {
    set_option(ctx, "usage", "lowlatency");
  }
}

bool has_parameter_sets(const uint8_t *data, size_t size) {
  bool sps = false;
  bool pps = false;
  for (size_t i = 0; i + 3 < size; ++i) {
    /// 00 00 01 start code (the 4-byte form ends with the same bytes)
    if (data[i] == 0 && data[i + 1] == 0 && data[i + 2] == 1) {
      const int nal_type = data[i + 3] & 0x1F;
      if (nal_type == 7)
        sps = true;
      else if (nal_type == 8)
        pps = true;
      i += 2;
    }
  }
  return sps && pps;
}

// **---- H264Encoder ----**

H264Encoder::H264Encoder(std::string encoder_name, int width, int height,
                         int fps, int64_t bitrate)
    : name_(std::move(encoder_name)), width_(width), height_(height),
      fps_(fps), bitrate_(bitrate) {
  frame_ = av_frame_alloc();
  pkt_ = av_packet_alloc();
}

H264Encoder::~H264Encoder() {
  if (sws_)
    sws_freeContext(sws_);
  if (ctx_)
    avcodec_free_context(&ctx_);
  av_frame_free(&frame_);
  av_packet_free(&pkt_);
}

bool H264Encoder::initialize() {
  if (!frame_ || !pkt_) {
    LOG_ERROR("[Encoder] Failed to allocate frame/packet");
    return false;
  }

  const AVCodec *codec = avcodec_find_encoder_by_name(name_.c_str());
  if (!codec) {
    LOG_ERROR("[Encoder] Encoder not found: {}", name_);
    return false;
  }

  const AVPixelFormat pix_fmt = encoder_pixel_format(codec);
  if (pix_fmt == AV_PIX_FMT_NONE) {
    LOG_ERROR("[Encoder] {} accepts no software pixel format", name_);
    return false;
  }

  ctx_ = avcodec_alloc_context3(codec);
  if (!ctx_) {
    LOG_ERROR("[Encoder] Failed to allocate codec context");
    return false;
  }
  configure_h264_context(ctx_, codec, pix_fmt, width_, height_, fps_, bitrate_);

  int ret = avcodec_open2(ctx_, codec, nullptr);
  if (ret < 0) {
    LOG_ERROR("[Encoder] avcodec_open2 failed for {}: {}", name_,
              av_error_string(ret));
    return false;
  }

  frame_->format = pix_fmt;
  frame_->width = width_;
  frame_->height = height_;
  if (av_frame_get_buffer(frame_, 0) < 0) {
    LOG_ERROR("[Encoder] Failed to allocate frame buffer");
    return false;
  }

  sws_ = sws_getContext(width_, height_, AV_PIX_FMT_RGBA, width_, height_,
                        pix_fmt, SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_) {
    LOG_ERROR("[Encoder] Failed to create swscale context");
    return false;
  }

  LOG_INFO("[Encoder] Opened {} ({}x{} @ {}fps, {} kbps)", name_, width_,
           height_, fps_, bitrate_ / 1000);
  return true;
}

void H264Encoder::encode(const cv::Mat &rgba, int64_t pts,
                         const PacketWriter &write) {
  if (av_frame_make_writable(frame_) < 0)
    throw ExportError(ErrorKind::Io, "Encoder frame is not writable");

  const uint8_t *src_data[1] = {rgba.data};
  const int src_linesize[1] = {static_cast<int>(rgba.step[0])};
  sws_scale(sws_, src_data, src_linesize, 0, height_, frame_->data,
            frame_->linesize);

  frame_->pts = pts;
  int ret = avcodec_send_frame(ctx_, frame_);
  if (ret < 0) {
    throw ExportError(ErrorKind::Io,
                      fmt::format("Error sending frame to {}: {}", name_,
                                  av_error_string(ret)));
  }
  receive_packets(write);
}

void H264Encoder::flush(const PacketWriter &write) {
  int ret = avcodec_send_frame(ctx_, nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    throw ExportError(ErrorKind::Io, fmt::format("Error flushing {}: {}",
                                                 name_, av_error_string(ret)));
  }
  receive_packets(write);
}

void H264Encoder::receive_packets(const PacketWriter &write) {
  while (true) {
    int ret = avcodec_receive_packet(ctx_, pkt_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
      break;
    if (ret < 0) {
      throw ExportError(ErrorKind::Io, fmt::format("Error encoding frame: {}",
                                                   av_error_string(ret)));
    }

    /// The muxer cannot start without SPS/PPS ahead of the first slice
    if (!parameter_sets_checked_) {
      parameter_sets_checked_ = true;
      if (!has_parameter_sets(pkt_->data, pkt_->size)) {
        if (ctx_->extradata &&
            has_parameter_sets(ctx_->extradata, ctx_->extradata_size)) {
          write(ctx_->extradata, static_cast<size_t>(ctx_->extradata_size));
        } else {
          av_packet_unref(pkt_);
          throw ExportError(ErrorKind::Configuration,
                            "Encoder produced no codec parameter sets (SPS/PPS)");
        }
      }
    }

    write(pkt_->data, static_cast<size_t>(pkt_->size));
    av_packet_unref(pkt_);
  }
}

} // namespace cinecut
