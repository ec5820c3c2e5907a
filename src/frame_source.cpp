/**
 * @file frame_source.cpp
 * @brief FrameSource implementation
 */

#include "cinecut/frame_source.hpp"

#include <utility>

#include "cinecut/logging.hpp"

namespace cinecut {

FrameSource::FrameSource(std::string label,
                         std::unique_ptr<FrameDecoder> decoder)
    : label_(std::move(label)), decoder_(std::move(decoder)) {}

FrameSource::~FrameSource() { close(); }

const DecodedFrame *FrameSource::get_frame(double t) {
  if (!decoder_)
    return nullptr;

  if (has_request_ && t < last_request_) {
    LOG_WARN("[FrameSource:{}] Request {:.3f}s precedes {:.3f}s, not rewinding",
             label_, t, last_request_);
    return current_ ? current_.get() : lookahead_.get();
  }
  has_request_ = true;
  last_request_ = t;

  if (!primed_) {
    lookahead_ = decoder_->next_frame();
    primed_ = true;
    exhausted_ = !lookahead_;
  }

  /// Promote until the lookahead lies in the future
  while (lookahead_ && lookahead_->timestamp <= t) {
    current_ = std::move(lookahead_);
    if (!exhausted_) {
      lookahead_ = decoder_->next_frame();
      exhausted_ = !lookahead_;
    }
  }

  return current_ ? current_.get() : lookahead_.get();
}

bool FrameSource::seek(double t) {
  if (!decoder_)
    return false;

  current_.reset();
  lookahead_.reset();
  primed_ = false;
  exhausted_ = false;
  has_request_ = false;

  if (!decoder_->seek(t)) {
    LOG_ERROR("[FrameSource:{}] Seek to {:.3f}s failed", label_, t);
    return false;
  }
  return true;
}

void FrameSource::close() {
  current_.reset();
  lookahead_.reset();
  decoder_.reset();
}

} // namespace cinecut
