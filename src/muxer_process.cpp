/**
 * @file muxer_process.cpp
 * @brief External ffmpeg process implementation
 */

#include "cinecut/muxer_process.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

#include <fmt/core.h>

#include "cinecut/config.hpp"
#include "cinecut/errors.hpp"
#include "cinecut/logging.hpp"

namespace cinecut {

namespace {

void close_fd(int &fd) {
  if (fd != -1) {
    close(fd);
    fd = -1;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

/**
 * @brief fork/exec ffmpeg with stderr (and optionally stdin) piped.
 * @note A CLOEXEC status pipe reports exec failure: the parent reads EOF
 *       when exec succeeds, or the child's errno when it fails.
 * @return child pid, or -1 on failure (logged)
 */
pid_t spawn_ffmpeg(const std::vector<std::string> &args, bool pipe_stdin,
                   int &stdin_fd, int &stderr_fd) {
  std::vector<std::string> full;
  full.reserve(args.size() + 1);
  full.push_back(Config::ffmpeg_path());
  full.insert(full.end(), args.begin(), args.end());

  std::vector<char *> argv;
  argv.reserve(full.size() + 1);
  for (auto &a : full)
    argv.push_back(&a[0]);
  argv.push_back(nullptr);

  int in_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};

  if ((pipe_stdin && pipe2(in_pipe, O_CLOEXEC) == -1) ||
      pipe2(err_pipe, O_CLOEXEC) == -1 || pipe2(status_pipe, O_CLOEXEC) == -1) {
    LOG_ERROR("Failed to create pipes: {}", std::strerror(errno));
    for (int fd : {in_pipe[0], in_pipe[1], err_pipe[0], err_pipe[1],
                   status_pipe[0], status_pipe[1]}) {
      if (fd != -1)
        close(fd);
    }
    return -1;
  }

  pid_t pid = fork();
  if (pid == -1) {
    LOG_ERROR("fork failed: {}", std::strerror(errno));
    for (int fd : {in_pipe[0], in_pipe[1], err_pipe[0], err_pipe[1],
                   status_pipe[0], status_pipe[1]}) {
      if (fd != -1)
        close(fd);
    }
    return -1;
  }

  if (pid == 0) {
    /// Child: only async-signal-safe calls from here on
    if (pipe_stdin) {
      dup2(in_pipe[0], STDIN_FILENO);
    } else {
      int devnull = open("/dev/null", O_RDONLY);
      if (devnull != -1)
        dup2(devnull, STDIN_FILENO);
    }
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(argv[0], argv.data());

    int err = errno;
    ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  /// Parent
  close(status_pipe[1]);
  close(err_pipe[1]);
  if (pipe_stdin)
    close(in_pipe[0]);

  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n == -1 && errno == EINTR);
  close(status_pipe[0]);

  if (n > 0) {
    LOG_ERROR("Failed to execute {}: {}", full[0], std::strerror(exec_errno));
    int status;
    waitpid(pid, &status, 0);
    close(err_pipe[0]);
    if (pipe_stdin)
      close(in_pipe[1]);
    return -1;
  }

  stdin_fd = pipe_stdin ? in_pipe[1] : -1;
  stderr_fd = err_pipe[0];
  return pid;
}

/// Read a pipe to EOF, logging each line
void drain_to_log(int fd, const char *prefix) {
  std::string pending;
  char buf[4096];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n == -1 && errno == EINTR)
      continue;
    if (n <= 0)
      break;
    pending.append(buf, static_cast<size_t>(n));

    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, pos);
      pending.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      if (!line.empty())
        LOG_WARN("{} {}", prefix, line);
    }
  }
  if (!pending.empty())
    LOG_WARN("{} {}", prefix, pending);
}

} // anonymous namespace

// **---- Argument lists ----**

std::vector<std::string> build_mp4_mux_args(const PipelineConfig &config,
                                            const std::string &audio_path,
                                            const std::string &output_path) {
  std::vector<std::string> args = {"-y",
                                   "-hide_banner",
                                   "-loglevel",
                                   "error",
                                   "-thread_queue_size",
                                   "1024",
                                   "-f",
                                   "h264",
                                   "-r",
                                   std::to_string(config.fps),
                                   "-i",
                                   "-"};
  if (!audio_path.empty()) {
    args.insert(args.end(), {"-i", audio_path, "-map", "0:v:0", "-map",
                             "1:a:0", "-c:a", "aac", "-shortest"});
  }
  args.insert(args.end(), {"-c:v", "copy", "-bsf:v", "setts=dts=N:pts=N",
                           "-movflags", "+faststart", output_path});
  return args;
}

std::vector<std::string> build_gif_mux_args(const PipelineConfig &config,
                                            const std::string &output_path) {
  return {"-y",
          "-hide_banner",
          "-loglevel",
          "error",
          "-f",
          "rawvideo",
          "-vcodec",
          "rawvideo",
          "-pix_fmt",
          "rgba",
          "-s",
          fmt::format("{}x{}", config.dims.width, config.dims.height),
          "-r",
          std::to_string(config.fps),
          "-i",
          "-",
          "-vf",
          GIF_PALETTE_FILTER,
          output_path};
}

std::string format_command(const std::vector<std::string> &args) {
  std::string cmd = Config::ffmpeg_path();
  for (const auto &a : args) {
    cmd += ' ';
    if (a.find_first_of(" ;[]'\"") != std::string::npos)
      cmd += fmt::format("\"{}\"", a);
    else
      cmd += a;
  }
  return cmd;
}

int run_ffmpeg(const std::vector<std::string> &args) {
  LOG_DEBUG("Running: {}", format_command(args));

  int stdin_fd = -1;
  int stderr_fd = -1;
  pid_t pid = spawn_ffmpeg(args, false, stdin_fd, stderr_fd);
  if (pid == -1)
    return -1;

  drain_to_log(stderr_fd, "[ffmpeg]");
  close(stderr_fd);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR)
      return -1;
  }
  return decode_status(status);
}

// **---- MuxerProcess ----**

MuxerProcess::MuxerProcess(std::vector<std::string> args)
    : args_(std::move(args)) {}

MuxerProcess::~MuxerProcess() {
  if (running())
    kill();
  close_fd(stdin_fd_);
  if (stderr_thread_.joinable())
    stderr_thread_.join();
}

bool MuxerProcess::start() {
  /// Writes to a dead muxer must fail with EPIPE instead of killing us
  std::signal(SIGPIPE, SIG_IGN);

  LOG_INFO("[Muxer] {}", format_command(args_));

  int stderr_fd = -1;
  pid_ = spawn_ffmpeg(args_, true, stdin_fd_, stderr_fd);
  if (pid_ == -1)
    return false;

  stderr_thread_ = std::thread([this, stderr_fd]() { forward_stderr(stderr_fd); });
  return true;
}

void MuxerProcess::forward_stderr(int fd) {
  drain_to_log(fd, "[Muxer]");
  close(fd);
}

bool MuxerProcess::wait_ready(int timeout_ms) {
  if (!running() || stdin_fd_ == -1)
    return false;

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

  while (std::chrono::steady_clock::now() < deadline) {
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
      reaped_ = true;
      exit_code_ = decode_status(status);
      LOG_ERROR("[Muxer] ffmpeg exited during startup with code {}",
                exit_code_);
      return false;
    }

    struct pollfd pfd = {stdin_fd_, POLLOUT, 0};
    int ready = poll(&pfd, 1, 10);
    if (ready > 0) {
      if (pfd.revents & (POLLERR | POLLHUP)) {
        LOG_ERROR("[Muxer] stdin pipe closed during startup");
        return false;
      }
      if (pfd.revents & POLLOUT)
        return true;
    }
  }

  LOG_ERROR("[Muxer] Not ready after {} ms", timeout_ms);
  return false;
}

void MuxerProcess::write(const uint8_t *data, size_t size) {
  if (stdin_fd_ == -1)
    throw ExportError(ErrorKind::Io, "Muxer input is closed");

  size_t written = 0;
  while (written < size) {
    ssize_t n = ::write(stdin_fd_, data + written, size - written);
    if (n == -1) {
      if (errno == EINTR)
        continue;
      throw ExportError(ErrorKind::Io, fmt::format("Muxer write failed: {}",
                                                   std::strerror(errno)));
    }
    written += static_cast<size_t>(n);
  }
}

void MuxerProcess::close_input() { close_fd(stdin_fd_); }

int MuxerProcess::wait() {
  if (pid_ <= 0)
    return -1;

  if (!reaped_) {
    int status = 0;
    pid_t r;
    do {
      r = waitpid(pid_, &status, 0);
    } while (r == -1 && errno == EINTR);
    reaped_ = true;
    exit_code_ = (r == pid_) ? decode_status(status) : -1;
  }

  if (stderr_thread_.joinable())
    stderr_thread_.join();
  return exit_code_;
}

void MuxerProcess::kill() {
  /// stdin stays open: a sink worker may still be inside write()
  if (!running())
    return;
  ::kill(pid_, SIGKILL);
  wait();
  LOG_WARN("[Muxer] ffmpeg killed");
}

} // namespace cinecut
