/**
 * @file frame_queue.hpp
 * @brief Thread-safe FIFO between the render loop and the sink worker
 *
 * @details Producer-consumer hand-off for composed frames:
 *
 *          - The render loop (producer) pushes frames in index order
 *
 *          - The sink worker (consumer) encodes/writes them one at a time
 *
 *          - The queue never reorders, so the output keeps frame order
 */

#ifndef CINECUT_FRAME_QUEUE_HPP
#define CINECUT_FRAME_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>

#include <opencv2/core.hpp>

namespace cinecut {

/**
 * @struct EncodeJob
 * @brief One composed frame waiting for the sink worker.
 */
struct EncodeJob {
  int64_t frame_index = 0; //< Export frame number (pts)
  cv::Mat rgba;            //< Owned copy of the composed surface
};

/**
 * @class FrameQueue
 * @brief Blocking FIFO of EncodeJobs.
 *
 * @attention USAGE:
 *
 *   - The render loop calls push() once per frame
 *
 *   - The worker calls pop() in a loop until it returns false
 *
 *   - finish() after the last frame; abort() drops what is still queued
 */
class FrameQueue {
public:
  void push(EncodeJob job);

  /**
   * @brief Pop the oldest job (blocking).
   * @return false once the queue is finished and drained, or aborted
   */
  bool pop(EncodeJob &job);

  /// No more jobs will be pushed
  void finish();

  /**
   * @brief Drop queued jobs and wake the worker.
   * @return number of jobs dropped
   */
  size_t abort();

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
  }

  bool is_done() const { return done_.load() && size() == 0; }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<EncodeJob> jobs_;
  std::atomic<bool> done_{false};
};

} // namespace cinecut

#endif // CINECUT_FRAME_QUEUE_HPP
