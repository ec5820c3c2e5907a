/**
 * @file system.hpp
 * @brief System utilities: temporary directories, in-memory files, time
 *        formatting
 *
 * @note memfd_create is Linux-specific (kernel >= 3.17).
 */

#ifndef CINECUT_SYSTEM_HPP
#define CINECUT_SYSTEM_HPP

#include <string>

namespace cinecut {

// **---- Temporary files ----**

/**
 * @brief Create a private directory under the system temp dir.
 * @param prefix Directory name prefix
 * @return the new path, or an empty string on failure (logged)
 */
std::string make_temp_dir(const std::string &prefix);

/**
 * @brief Recursively remove a directory. Missing paths are ignored.
 * @return false if something could not be removed (logged)
 */
bool remove_tree(const std::string &path);

/**
 * @class MemFile
 * @brief Anonymous in-memory file readable by child processes through
 *        /proc/<pid>/fd/<fd>.
 */
class MemFile {
public:
  MemFile() = default;
  ~MemFile();

  MemFile(const MemFile &) = delete;
  MemFile &operator=(const MemFile &) = delete;

  /**
   * @brief Create the file with the given contents.
   * @return true on success, false on failure (logged)
   */
  bool create(const char *name, const std::string &contents);

  /// Path other processes can open, empty until created
  const std::string &path() const { return path_; }

private:
  int fd_ = -1;
  std::string path_;
};

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace cinecut

#endif // CINECUT_SYSTEM_HPP
