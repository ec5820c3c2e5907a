/**
 * @file cursor_bitmaps.hpp
 * @brief Cursor bitmap preparation per capture platform
 *
 * @details Recorded mouse events carry a cursor image key. Before rendering
 *          the keys are resolved into RGBA bitmaps once per session:
 *
 *          - Linux: images embedded in the recording metadata
 *
 *          - Windows: cursor theme frames keyed by IDC name
 *
 *          - macOS: cursor theme frames keyed by theme name
 */

#ifndef CINECUT_CURSOR_BITMAPS_HPP
#define CINECUT_CURSOR_BITMAPS_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>
#include <opencv2/core.hpp>

namespace cinecut {

/**
 * @struct CursorImage
 * @brief Raw cursor image (tightly packed RGBA) with its hotspot.
 */
struct CursorImage {
  int width = 0;
  int height = 0;
  int xhot = 0;
  int yhot = 0;
  double delay = 0.0;        //< Animation delay (theme frames only)
  std::vector<uint8_t> rgba; //< width * height * 4 bytes
};

/// Scale -> theme cursor name -> animation frames
using CursorTheme =
    std::map<int, std::map<std::string, std::vector<CursorImage>>>;

struct CursorBitmap {
  cv::Mat rgba; //< CV_8UC4
  int xhot = 0;
  int yhot = 0;
};

using CursorBitmapSet = std::map<std::string, CursorBitmap>;

/// Read one cursor image ("image" or "rgba" pixel array)
CursorImage cursor_image_from_json(const nlohmann::json &j);

/**
 * @brief Load a cursor theme file (JSON, see CursorTheme).
 * @return true on success, false on failure (logged)
 */
bool load_cursor_theme(const std::string &path, CursorTheme &theme);

/**
 * @brief Map a theme cursor name to the Windows IDC identifier.
 * @note Unknown names are upper-cased with an IDC_ prefix.
 */
std::string map_cursor_name_to_idc(const std::string &name);

/**
 * @class CursorBitmapPreparer
 * @brief Resolves cursor image keys into bitmaps for one platform.
 */
class CursorBitmapPreparer {
public:
  virtual ~CursorBitmapPreparer() = default;

  /// Build the key -> bitmap table. Invalid frames are skipped.
  virtual CursorBitmapSet prepare() const = 0;

  virtual const char *name() const = 0;
};

class LinuxCursorPreparer : public CursorBitmapPreparer {
public:
  explicit LinuxCursorPreparer(std::map<std::string, CursorImage> images)
      : images_(std::move(images)) {}

  CursorBitmapSet prepare() const override;
  const char *name() const override { return "linux"; }

private:
  std::map<std::string, CursorImage> images_;
};

/**
 * @class ThemeCursorPreparer
 * @brief Shared part of the theme-based preparers: picks the frame set of
 *        the configured scale and keys each frame as <name>-<index>.
 */
class ThemeCursorPreparer : public CursorBitmapPreparer {
public:
  ThemeCursorPreparer(CursorTheme theme, int scale)
      : theme_(std::move(theme)), scale_(scale) {}

  CursorBitmapSet prepare() const override;

protected:
  /// Key prefix for one theme cursor name
  virtual std::string key_name(const std::string &theme_name) const = 0;

private:
  CursorTheme theme_;
  int scale_;
};

class WindowsCursorPreparer : public ThemeCursorPreparer {
public:
  using ThemeCursorPreparer::ThemeCursorPreparer;
  const char *name() const override { return "win32"; }

protected:
  std::string key_name(const std::string &theme_name) const override {
    return map_cursor_name_to_idc(theme_name);
  }
};

class MacCursorPreparer : public ThemeCursorPreparer {
public:
  using ThemeCursorPreparer::ThemeCursorPreparer;
  const char *name() const override { return "darwin"; }

protected:
  std::string key_name(const std::string &theme_name) const override {
    return theme_name;
  }
};

/**
 * @brief Select the preparer for a capture platform.
 * @param platform "win32", "darwin" or anything else (Linux)
 * @param images Embedded metadata images (Linux)
 * @param theme Cursor theme (Windows/macOS)
 * @param scale Theme scale to use
 */
std::unique_ptr<CursorBitmapPreparer>
make_cursor_preparer(const std::string &platform,
                     const std::map<std::string, CursorImage> &images,
                     const CursorTheme &theme, int scale);

} // namespace cinecut

#endif // CINECUT_CURSOR_BITMAPS_HPP
