/**
 * @file mapped_media.cpp
 * @brief Memory-mapped media implementation
 */

#include "cinecut/mapped_media.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

extern "C" {
#include <libavformat/avio.h>
#include <libavutil/error.h>
}

#include "cinecut/logging.hpp"

namespace cinecut {

// **---- MappedMedia ----**

MappedMedia::~MappedMedia() { release(); }

MappedMedia::MappedMedia(MappedMedia &&other) noexcept
    : data_(other.data_), size_(other.size_), fd_(other.fd_),
      path_(std::move(other.path_)) {
  other.data_ = nullptr;
  other.size_ = 0;
  other.fd_ = -1;
}

MappedMedia &MappedMedia::operator=(MappedMedia &&other) noexcept {
  if (this != &other) {
    release();
    data_ = other.data_;
    size_ = other.size_;
    fd_ = other.fd_;
    path_ = std::move(other.path_);

    other.data_ = nullptr;
    other.size_ = 0;
    other.fd_ = -1;
  }
  return *this;
}

void MappedMedia::release() {
  if (data_)
    munmap(data_, size_);
  if (fd_ != -1)
    close(fd_);
  data_ = nullptr;
  size_ = 0;
  fd_ = -1;
}

bool MappedMedia::map(const std::string &path) {
  TIMER_START(map_media);

  int fd = open(path.c_str(), O_RDONLY);
  if (fd == -1) {
    LOG_ERROR("Failed to open media: {} ({})", path, std::strerror(errno));
    return false;
  }

  struct stat sb;
  if (fstat(fd, &sb) == -1) {
    LOG_ERROR("Failed to stat media: {}", path);
    close(fd);
    return false;
  }

  if (sb.st_size <= 0) {
    LOG_ERROR("Media file is empty: {}", path);
    close(fd);
    return false;
  }

  /// Recordings can exceed RAM: pages are faulted in as the demuxer reads
  void *addr = mmap(nullptr, sb.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
  if (addr == MAP_FAILED) {
    LOG_ERROR("Failed to mmap media: {}", path);
    close(fd);
    return false;
  }

  ///\note Decoding reads front to back; preview seeks are rare
  madvise(addr, sb.st_size, MADV_SEQUENTIAL);

  release();
  data_ = static_cast<uint8_t *>(addr);
  size_ = static_cast<size_t>(sb.st_size);
  fd_ = fd;
  path_ = path;

  TIMER_END(map_media);
  return true;
}

int MappedMedia::read_packet(void *opaque, uint8_t *buf, int buf_size) {
  auto *state = static_cast<MediaReaderState *>(opaque);
  const size_t remaining = state->size - state->pos;
  if (remaining == 0)
    return AVERROR_EOF;
  const size_t n = std::min(remaining, static_cast<size_t>(buf_size));
  std::memcpy(buf, state->ptr + state->pos, n);
  state->pos += n;
  return static_cast<int>(n);
}

int64_t MappedMedia::seek(void *opaque, int64_t offset, int whence) {
  auto *state = static_cast<MediaReaderState *>(opaque);
  const auto size = static_cast<int64_t>(state->size);

  /// FFmpeg may OR in AVSEEK_FORCE
  whence &= ~AVSEEK_FORCE;
  if (whence == AVSEEK_SIZE)
    return size;

  int64_t target;
  switch (whence) {
  case SEEK_SET:
    target = offset;
    break;
  case SEEK_CUR:
    target = static_cast<int64_t>(state->pos) + offset;
    break;
  case SEEK_END:
    target = size + offset;
    break;
  default:
    return AVERROR(EINVAL);
  }

  if (target < 0 || target > size)
    return AVERROR(EINVAL);

  state->pos = static_cast<size_t>(target);
  return target;
}

} // namespace cinecut
