/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex and runtime threshold
 *
 *          - TimingCollector static members and methods
 */

#include "cinecut/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <fmt/color.h>
#include <fmt/core.h>

namespace cinecut {

// **----- GLOBAL LOG STATE -----**

std::mutex log_mutex;

LogLevel log_threshold() {
  static LogLevel level = [] {
    const char *val = std::getenv("CINECUT_LOG_LEVEL");
    if (!val)
      return LogLevel::Info;
    std::string name(val);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (name == "debug")
      return LogLevel::Debug;
    if (name == "warn")
      return LogLevel::Warn;
    if (name == "error")
      return LogLevel::Error;
    return LogLevel::Info;
  }();
  return level;
}

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::accumulate(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  auto it = std::find_if(entries.begin(), entries.end(),
                         [&name](const TimingEntry &e) { return e.name == name; });
  if (it == entries.end()) {
    entries.push_back({name, us});
  } else {
    it->microseconds += us;
  }
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<30} {:>20}\n", "Stage", "Time (us) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds, seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace cinecut
