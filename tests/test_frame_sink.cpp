#include "doctest/doctest.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "cinecut/errors.hpp"
#include "cinecut/frame_queue.hpp"
#include "cinecut/frame_sink.hpp"

using namespace cinecut;

namespace {

/// Worker-side recorder; fails on fail_at when set
class CollectingSink : public ThreadedSink {
public:
  explicit CollectingSink(int64_t fail_at = -1, bool slow = false)
      : fail_at_(fail_at), slow_(slow) {
    start_worker();
  }
  ~CollectingSink() override { abort(); }

  const char *name() const override { return "collecting"; }

  std::vector<int64_t> indices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return indices_;
  }
  std::vector<int> values() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_;
  }

  std::atomic<bool> flushed{false};

protected:
  void process(const EncodeJob &job) override {
    if (slow_)
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    if (job.frame_index == fail_at_)
      throw ExportError(ErrorKind::Io, "pipe closed");
    std::lock_guard<std::mutex> lock(mutex_);
    indices_.push_back(job.frame_index);
    values_.push_back(job.rgba.at<cv::Vec4b>(0, 0)[0]);
  }

  void on_finish() override { flushed = true; }

private:
  int64_t fail_at_;
  bool slow_;
  mutable std::mutex mutex_;
  std::vector<int64_t> indices_;
  std::vector<int> values_;
};

} // namespace

TEST_CASE("sink processes frames in order and flushes on finish") {
  CollectingSink sink;
  cv::Mat frame(4, 4, CV_8UC4, cv::Scalar(0, 0, 0, 255));
  for (int i = 0; i < 20; ++i)
    sink.submit(i, frame);
  sink.finish();

  const auto indices = sink.indices();
  REQUIRE(indices.size() == 20);
  for (size_t i = 0; i < indices.size(); ++i)
    CHECK(indices[i] == static_cast<int64_t>(i));
  CHECK(sink.flushed);
  CHECK(sink.pending() == 0);
}

TEST_CASE("submitted surfaces are copied") {
  CollectingSink sink(-1, true);
  cv::Mat frame(2, 2, CV_8UC4, cv::Scalar(7, 0, 0, 255));
  sink.submit(0, frame);
  frame.setTo(cv::Scalar(99, 0, 0, 255));
  sink.finish();

  REQUIRE(sink.values().size() == 1);
  CHECK(sink.values()[0] == 7);
}

TEST_CASE("pending counts frames not yet processed") {
  CollectingSink sink(-1, true);
  cv::Mat frame(2, 2, CV_8UC4, cv::Scalar::all(0));
  for (int i = 0; i < 5; ++i)
    sink.submit(i, frame);
  CHECK(sink.pending() >= 1);
  CHECK(sink.pending() <= 5);
  sink.finish();
  CHECK(sink.pending() == 0);
}

TEST_CASE("worker failure surfaces on finish and skips the flush") {
  CollectingSink sink(3);
  cv::Mat frame(2, 2, CV_8UC4, cv::Scalar::all(0));
  for (int i = 0; i < 10; ++i) {
    try {
      sink.submit(i, frame);
    } catch (const ExportError &) {
      break;
    }
  }

  CHECK_THROWS_AS(sink.finish(), ExportError);
  CHECK_FALSE(sink.flushed);
  CHECK(sink.indices().size() == 3);
  CHECK(sink.pending() == 0);
}

TEST_CASE("abort drops the backlog without flushing") {
  CollectingSink sink(-1, true);
  cv::Mat frame(2, 2, CV_8UC4, cv::Scalar::all(0));
  for (int i = 0; i < 50; ++i)
    sink.submit(i, frame);
  sink.abort();

  CHECK(sink.indices().size() < 50);
  CHECK_FALSE(sink.flushed);
  CHECK(sink.pending() == 0);
}

TEST_CASE("frame queue drains after finish and drops on abort") {
  FrameQueue queue;
  queue.push({0, cv::Mat()});
  queue.push({1, cv::Mat()});
  queue.finish();
  queue.push({2, cv::Mat()});

  EncodeJob job;
  REQUIRE(queue.pop(job));
  CHECK(job.frame_index == 0);
  REQUIRE(queue.pop(job));
  CHECK(job.frame_index == 1);
  CHECK_FALSE(queue.pop(job));
  CHECK(queue.is_done());

  FrameQueue aborted;
  aborted.push({0, cv::Mat()});
  aborted.push({1, cv::Mat()});
  CHECK(aborted.abort() == 2);
  CHECK_FALSE(aborted.pop(job));
}
