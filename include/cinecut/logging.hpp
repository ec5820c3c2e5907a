/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *            with a runtime verbosity threshold (CINECUT_LOG_LEVEL)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for the per-export stage summary
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so progress stays visible while ffmpeg writes to the
 *       same terminal.
 *
 */

#ifndef CINECUT_LOGGING_HPP
#define CINECUT_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace cinecut {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/**
 * @brief Runtime threshold read once from CINECUT_LOG_LEVEL
 *        (debug|info|warn|error, default info).
 */
LogLevel log_threshold();

inline bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(log_threshold());
}

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define CINECUT_LOG_STYLED(level, style, format_str, ...)                      \
  do {                                                                         \
    if (cinecut::log_enabled(level)) {                                         \
      std::lock_guard<std::mutex> lock(cinecut::log_mutex);                    \
      fmt::print(style, format_str "\n", ##__VA_ARGS__);                       \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  CINECUT_LOG_STYLED(cinecut::LogLevel::Debug, fmt::emphasis::faint,           \
                     "[DEBUG] " format_str, ##__VA_ARGS__)

#define LOG_INFO(format_str, ...)                                              \
  CINECUT_LOG_STYLED(cinecut::LogLevel::Info, fmt::text_style(),               \
                     "[INFO] " format_str, ##__VA_ARGS__)

#define LOG_WARN(format_str, ...)                                              \
  CINECUT_LOG_STYLED(cinecut::LogLevel::Warn, fg(fmt::color::yellow),          \
                     "[WARN] " format_str, ##__VA_ARGS__)

#define LOG_ERROR(format_str, ...)                                             \
  CINECUT_LOG_STYLED(cinecut::LogLevel::Error, fg(fmt::color::red),            \
                     "[ERROR] " format_str, ##__VA_ARGS__)

#define LOG_PHASE(format_str, ...)                                             \
  CINECUT_LOG_STYLED(cinecut::LogLevel::Info, fg(fmt::color::cyan),            \
                     format_str, ##__VA_ARGS__)

#define LOG_SUCCESS(format_str, ...)                                           \
  CINECUT_LOG_STYLED(cinecut::LogLevel::Info, fg(fmt::color::green),           \
                     format_str, ##__VA_ARGS__)
#else
#define LOG_DEBUG(...) ((void)0)
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Stage name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe singleton for collecting timing measurements.
 * @note The render loop and the encoder worker both record here.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Stage name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Add to an existing entry (or create it). Used for per-frame
   *        stages that would otherwise flood the summary.
   */
  static void accumulate(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   * @note Called at the start of every export.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    cinecut::TimingCollector::record(#name, timer_duration_##name);            \
  } while (0)

#define TIMER_ACCUMULATE(name)                                                 \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    cinecut::TimingCollector::accumulate(                                      \
        #name, std::chrono::duration_cast<std::chrono::microseconds>(          \
                   timer_end_##name - timer_start_##name)                      \
                   .count());                                                  \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#define TIMER_ACCUMULATE(name) ((void)0)
#endif

} // namespace cinecut

#endif // CINECUT_LOGGING_HPP
