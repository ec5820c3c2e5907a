/**
 * @file cursor_bitmaps.cpp
 * @brief Cursor bitmap preparation implementation
 */

#include "cinecut/cursor_bitmaps.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>

#include <nlohmann/json.hpp>

#include "cinecut/logging.hpp"

namespace cinecut {

namespace {

/**
 * @brief Wrap a raw cursor image into a bitmap.
 * @return false for empty images or a pixel count mismatch
 */
bool make_bitmap(const CursorImage &image, const std::string &key,
                 CursorBitmap &out) {
  if (image.width <= 0 || image.height <= 0) {
    LOG_WARN("[Cursor] Skipping '{}': empty image", key);
    return false;
  }
  const size_t expected = static_cast<size_t>(image.width) * image.height * 4;
  if (image.rgba.size() != expected) {
    LOG_WARN("[Cursor] Skipping '{}': {} bytes, expected {}", key,
             image.rgba.size(), expected);
    return false;
  }

  out.rgba.create(image.height, image.width, CV_8UC4);
  std::memcpy(out.rgba.data, image.rgba.data(), expected);
  out.xhot = image.xhot;
  out.yhot = image.yhot;
  return true;
}

} // anonymous namespace

CursorImage cursor_image_from_json(const nlohmann::json &j) {
  CursorImage img;
  img.width = j.value("width", 0);
  img.height = j.value("height", 0);
  img.xhot = j.value("xhot", 0);
  img.yhot = j.value("yhot", 0);
  img.delay = j.value("delay", 0.0);

  /// Embedded images use "image", theme frames use "rgba"
  const char *field = j.contains("rgba") ? "rgba" : "image";
  if (j.contains(field) && j[field].is_array()) {
    img.rgba.reserve(j[field].size());
    for (const auto &v : j[field])
      img.rgba.push_back(v.is_number() ? static_cast<uint8_t>(v.get<int>()) : 0);
  } else if (j.contains(field) && j[field].is_object()) {
    /// Buffers serialized as {"0": r, "1": g, ...}
    img.rgba.resize(j[field].size());
    for (auto it = j[field].begin(); it != j[field].end(); ++it) {
      const std::string &k = it.key();
      const bool numeric =
          !k.empty() && k.size() <= 9 &&
          std::all_of(k.begin(), k.end(),
                      [](unsigned char c) { return std::isdigit(c) != 0; });
      if (!numeric)
        continue;
      size_t idx = std::stoul(k);
      if (idx < img.rgba.size() && it.value().is_number())
        img.rgba[idx] = static_cast<uint8_t>(it.value().get<int>());
    }
  }
  return img;
}

bool load_cursor_theme(const std::string &path, CursorTheme &theme) {
  std::ifstream in(path);
  if (!in) {
    LOG_ERROR("[Cursor] Failed to open cursor theme: {}", path);
    return false;
  }

  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    LOG_ERROR("[Cursor] Invalid cursor theme file: {}", path);
    return false;
  }

  CursorTheme parsed;
  for (auto scale_it = doc.begin(); scale_it != doc.end(); ++scale_it) {
    if (!scale_it->is_object())
      continue;
    int scale = 0;
    try {
      scale = std::stoi(scale_it.key());
    } catch (const std::exception &) {
      LOG_WARN("[Cursor] Ignoring non-numeric scale '{}'", scale_it.key());
      continue;
    }
    auto &set = parsed[scale];
    for (auto name_it = scale_it->begin(); name_it != scale_it->end();
         ++name_it) {
      if (!name_it->is_array())
        continue;
      auto &frames = set[name_it.key()];
      for (const auto &frame : *name_it)
        frames.push_back(cursor_image_from_json(frame));
    }
  }

  theme = std::move(parsed);
  return true;
}

std::string map_cursor_name_to_idc(const std::string &name) {
  static const std::map<std::string, std::string> table = {
      {"arrow", "IDC_ARROW"},           {"ibeam", "IDC_IBEAM"},
      {"text", "IDC_IBEAM"},            {"wait", "IDC_WAIT"},
      {"cross", "IDC_CROSS"},           {"crosshair", "IDC_CROSS"},
      {"hand", "IDC_HAND"},             {"pointer", "IDC_HAND"},
      {"link", "IDC_HAND"},             {"appstarting", "IDC_APPSTARTING"},
      {"progress", "IDC_APPSTARTING"},  {"help", "IDC_HELP"},
      {"no", "IDC_NO"},                 {"not-allowed", "IDC_NO"},
      {"sizeall", "IDC_SIZEALL"},       {"move", "IDC_SIZEALL"},
      {"sizenwse", "IDC_SIZENWSE"},     {"sizenesw", "IDC_SIZENESW"},
      {"sizewe", "IDC_SIZEWE"},         {"sizens", "IDC_SIZENS"},
      {"uparrow", "IDC_UPARROW"}};

  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  auto it = table.find(lower);
  if (it != table.end())
    return it->second;

  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return "IDC_" + upper;
}

// **---- Preparers ----**

CursorBitmapSet LinuxCursorPreparer::prepare() const {
  CursorBitmapSet out;
  for (const auto &entry : images_) {
    CursorBitmap bitmap;
    if (make_bitmap(entry.second, entry.first, bitmap))
      out.emplace(entry.first, std::move(bitmap));
  }
  return out;
}

CursorBitmapSet ThemeCursorPreparer::prepare() const {
  CursorBitmapSet out;
  auto set = theme_.find(scale_);
  if (set == theme_.end()) {
    LOG_WARN("[Cursor] No cursor set found for scale {}x ({})", scale_,
             name());
    return out;
  }

  for (const auto &entry : set->second) {
    const std::string prefix = key_name(entry.first);
    for (size_t i = 0; i < entry.second.size(); ++i) {
      const std::string key = fmt::format("{}-{}", prefix, i);
      CursorBitmap bitmap;
      if (make_bitmap(entry.second[i], key, bitmap))
        out.emplace(key, std::move(bitmap));
    }
  }
  return out;
}

std::unique_ptr<CursorBitmapPreparer>
make_cursor_preparer(const std::string &platform,
                     const std::map<std::string, CursorImage> &images,
                     const CursorTheme &theme, int scale) {
  if (platform == "win32")
    return std::make_unique<WindowsCursorPreparer>(theme, scale);
  if (platform == "darwin")
    return std::make_unique<MacCursorPreparer>(theme, scale);
  return std::make_unique<LinuxCursorPreparer>(images);
}

} // namespace cinecut
