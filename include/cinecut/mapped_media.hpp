/**
 * @file mapped_media.hpp
 * @brief Memory-mapped media files read by libavformat
 *
 * @details Provides:
 *          - MediaReaderState: cursor handed to the custom AVIO callbacks
 *
 *          - MappedMedia: RAII mmap of a recording plus the read/seek
 *            callbacks that let FFmpeg demux straight from the mapping
 */

#ifndef CINECUT_MAPPED_MEDIA_HPP
#define CINECUT_MAPPED_MEDIA_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace cinecut {

/**
 * @brief MediaReaderState: read position inside a mapped file.
 * @note One per demuxer. Two decoders may share a mapping, never a state.
 */
struct MediaReaderState {
  const uint8_t *ptr = nullptr; //< Mapping start
  size_t size = 0;              //< Mapping size
  size_t pos = 0;               //< Current read position
};

/**
 * @class MappedMedia
 * @brief RAII wrapper for a read-only file mapping.
 * @note Movable, not copyable. munmap/close happen on destruction.
 */
class MappedMedia {
public:
  MappedMedia() = default;
  ~MappedMedia();

  /// Disable copy
  MappedMedia(const MappedMedia &) = delete;
  MappedMedia &operator=(const MappedMedia &) = delete;

  /// Enable move
  MappedMedia(MappedMedia &&other) noexcept;
  MappedMedia &operator=(MappedMedia &&other) noexcept;

  /**
   * @brief Map a file, replacing any previous mapping.
   * @return true on success, false on failure (logged)
   */
  bool map(const std::string &path);

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }
  bool is_valid() const { return data_ != nullptr; }
  const std::string &path() const { return path_; }

  /// Reader state positioned at the start of the mapping
  MediaReaderState reader() const { return {data_, size_, 0}; }

  /**
   * @brief AVIO read callback (opaque = MediaReaderState).
   * @return bytes copied, or AVERROR_EOF at the end of the mapping
   */
  static int read_packet(void *opaque, uint8_t *buf, int buf_size);

  /// AVIO seek callback, including AVSEEK_SIZE
  static int64_t seek(void *opaque, int64_t offset, int whence);

private:
  void release();

  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  int fd_ = -1;
  std::string path_;
};

} // namespace cinecut

#endif // CINECUT_MAPPED_MEDIA_HPP
