/**
 * @file frame_queue.cpp
 * @brief Frame queue implementation
 */

#include "cinecut/frame_queue.hpp"

#include <utility>

namespace cinecut {

void FrameQueue::push(EncodeJob job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_.load())
      return;
    jobs_.push(std::move(job));
  }
  cv_.notify_one();
}

bool FrameQueue::pop(EncodeJob &job) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !jobs_.empty() || done_.load(); });

  if (jobs_.empty())
    return false;

  job = std::move(jobs_.front());
  jobs_.pop();
  return true;
}

void FrameQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

size_t FrameQueue::abort() {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped = jobs_.size();
    std::queue<EncodeJob>().swap(jobs_);
    done_.store(true);
  }
  cv_.notify_all();
  return dropped;
}

} // namespace cinecut
