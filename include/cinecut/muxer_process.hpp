/**
 * @file muxer_process.hpp
 * @brief External ffmpeg process with a streaming stdin pipe
 *
 * @details The export writes either raw RGBA frames or an Annex-B H.264
 *          elementary stream into ffmpeg's stdin; ffmpeg muxes (and for GIF
 *          palettizes) into the output file. ffmpeg's stderr is forwarded to
 *          the log line by line.
 */

#ifndef CINECUT_MUXER_PROCESS_HPP
#define CINECUT_MUXER_PROCESS_HPP

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "export_settings.hpp"

namespace cinecut {

/// Palette filter used for GIF output
constexpr const char *GIF_PALETTE_FILTER =
    "split[s0][s1];[s0]palettegen[p];[s1][p]paletteuse";

/**
 * @brief Arguments (without the binary) muxing an Annex-B stream from
 *        stdin, with an optional audio file, into an MP4.
 * @note Timestamps are rewritten to the frame index (dts = pts = N).
 */
std::vector<std::string> build_mp4_mux_args(const PipelineConfig &config,
                                            const std::string &audio_path,
                                            const std::string &output_path);

/// Arguments turning raw RGBA frames from stdin into a palettized GIF.
std::vector<std::string> build_gif_mux_args(const PipelineConfig &config,
                                            const std::string &output_path);

/// Shell-style rendering of an argument list for logs
std::string format_command(const std::vector<std::string> &args);

/**
 * @brief Run ffmpeg to completion with the given arguments.
 * @return exit code, or -1 if the process could not be started (logged)
 */
int run_ffmpeg(const std::vector<std::string> &args);

/**
 * @class MuxerProcess
 * @brief ffmpeg child process fed through its stdin.
 *
 * @attention Lifecycle: start() -> wait_ready() -> write()* ->
 *            close_input() -> wait(). kill() may be called at any time;
 *            the destructor kills a process that is still running.
 */
class MuxerProcess {
public:
  explicit MuxerProcess(std::vector<std::string> args);
  ~MuxerProcess();

  /// Disable copy (owns the child and its pipes)
  MuxerProcess(const MuxerProcess &) = delete;
  MuxerProcess &operator=(const MuxerProcess &) = delete;

  /**
   * @brief fork/exec ffmpeg.
   * @return true on success, false if the binary could not be executed
   *         (logged)
   */
  bool start();

  /**
   * @brief Readiness handshake: the process is alive and its stdin accepts
   *        data within timeout_ms.
   *
   * @note ffmpeg reads its input before it reports anything, so there is no
   *       earlier signal to wait for. exec itself is confirmed by start();
   *       this check catches a child that exits during argument or output
   *       setup and a pipe whose read end is already gone.
   * @return false if not started, exited, closed its stdin or timed out
   */
  bool wait_ready(int timeout_ms);

  /**
   * @brief Write all bytes to ffmpeg's stdin.
   * @throws ExportError(Io) if the pipe is closed or the write fails
   */
  void write(const uint8_t *data, size_t size);

  /// Close stdin so ffmpeg sees end of input
  void close_input();

  /**
   * @brief Wait for the process to exit.
   * @return exit code (128 + signal if killed), -1 if never started
   */
  int wait();

  /// SIGKILL and reap the process (no-op if not running)
  void kill();

  bool running() const { return pid_ > 0 && !reaped_; }

private:
  void forward_stderr(int fd);

  std::vector<std::string> args_;
  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  bool reaped_ = false;
  int exit_code_ = -1;
  std::thread stderr_thread_;
};

} // namespace cinecut

#endif // CINECUT_MUXER_PROCESS_HPP
