/**
 * @file system.cpp
 * @brief System utilities implementation
 */

#include "cinecut/system.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sys/syscall.h>
#include <unistd.h>
#include <vector>

#include <fmt/core.h>

#include "cinecut/logging.hpp"

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace cinecut {

namespace fs = std::filesystem;

// **---- Temporary files ----**

std::string make_temp_dir(const std::string &prefix) {
  std::error_code ec;
  fs::path base = fs::temp_directory_path(ec);
  if (ec)
    base = "/tmp";

  std::string pattern = (base / (prefix + "-XXXXXX")).string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  if (!mkdtemp(buf.data())) {
    LOG_ERROR("Failed to create temp dir {}: {}", pattern,
              std::strerror(errno));
    return {};
  }
  return std::string(buf.data());
}

bool remove_tree(const std::string &path) {
  if (path.empty())
    return true;
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    LOG_WARN("Failed to remove {}: {}", path, ec.message());
    return false;
  }
  return true;
}

// **---- MemFile ----**

MemFile::~MemFile() {
  if (fd_ != -1)
    close(fd_);
}

bool MemFile::create(const char *name, const std::string &contents) {
  int fd = static_cast<int>(syscall(SYS_memfd_create, name, MFD_CLOEXEC));
  if (fd == -1) {
    LOG_ERROR("Failed to create memory file! (kernel >= 3.17 required)");
    return false;
  }

  size_t written = 0;
  while (written < contents.size()) {
    ssize_t n = write(fd, contents.data() + written, contents.size() - written);
    if (n == -1) {
      if (errno == EINTR)
        continue;
      LOG_ERROR("Failed to write to memory file: {}", std::strerror(errno));
      close(fd);
      return false;
    }
    written += static_cast<size_t>(n);
  }

  if (fd_ != -1)
    close(fd_);
  fd_ = fd;
  path_ = fmt::format("/proc/{}/fd/{}", getpid(), fd_);
  return true;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  if (seconds < 0)
    seconds = 0;
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace cinecut
