#include "doctest/doctest.h"

#include <nlohmann/json.hpp>

#include "cinecut/cursor_bitmaps.hpp"

using namespace cinecut;

namespace {

CursorImage solid_image(int w, int h, uint8_t value, int xhot = 0, int yhot = 0) {
  CursorImage img;
  img.width = w;
  img.height = h;
  img.xhot = xhot;
  img.yhot = yhot;
  img.rgba.assign(static_cast<size_t>(w) * h * 4, value);
  return img;
}

CursorTheme two_scale_theme() {
  CursorTheme theme;
  theme[1]["arrow"] = {solid_image(8, 8, 10)};
  theme[2]["arrow"] = {solid_image(16, 16, 20, 1, 2), solid_image(16, 16, 30)};
  theme[2]["pointer"] = {solid_image(16, 16, 40)};
  return theme;
}

} // namespace

TEST_CASE("linux cursors are keyed by their recorded name") {
  std::map<std::string, CursorImage> images;
  images["arrow"] = solid_image(4, 3, 255, 1, 2);
  images["empty"] = solid_image(0, 0, 0);
  CursorImage truncated = solid_image(4, 4, 1);
  truncated.rgba.resize(10);
  images["truncated"] = truncated;

  LinuxCursorPreparer preparer(images);
  const CursorBitmapSet set = preparer.prepare();

  REQUIRE(set.size() == 1);
  const CursorBitmap &arrow = set.at("arrow");
  CHECK(arrow.rgba.cols == 4);
  CHECK(arrow.rgba.rows == 3);
  CHECK(arrow.rgba.type() == CV_8UC4);
  CHECK(arrow.xhot == 1);
  CHECK(arrow.yhot == 2);
}

TEST_CASE("windows cursors use IDC names and the configured scale") {
  WindowsCursorPreparer preparer(two_scale_theme(), 2);
  const CursorBitmapSet set = preparer.prepare();

  CHECK(set.size() == 3);
  REQUIRE(set.count("IDC_ARROW-0") == 1);
  CHECK(set.count("IDC_ARROW-1") == 1);
  CHECK(set.count("IDC_HAND-0") == 1);
  CHECK(set.at("IDC_ARROW-0").rgba.cols == 16);
  CHECK(set.at("IDC_ARROW-0").yhot == 2);
}

TEST_CASE("mac cursors keep their theme names") {
  MacCursorPreparer preparer(two_scale_theme(), 1);
  const CursorBitmapSet set = preparer.prepare();
  REQUIRE(set.size() == 1);
  CHECK(set.at("arrow-0").rgba.cols == 8);
}

TEST_CASE("a missing scale yields no cursors") {
  WindowsCursorPreparer preparer(two_scale_theme(), 3);
  CHECK(preparer.prepare().empty());
}

TEST_CASE("preparer is chosen by capture platform") {
  const CursorTheme theme;
  const std::map<std::string, CursorImage> images;
  CHECK(std::string(make_cursor_preparer("win32", images, theme, 2)->name()) ==
        "win32");
  CHECK(std::string(make_cursor_preparer("darwin", images, theme, 2)->name()) ==
        "darwin");
  CHECK(std::string(make_cursor_preparer("linux", images, theme, 2)->name()) ==
        "linux");
}

TEST_CASE("cursor names map to IDC identifiers") {
  CHECK(map_cursor_name_to_idc("arrow") == "IDC_ARROW");
  CHECK(map_cursor_name_to_idc("Pointer") == "IDC_HAND");
  CHECK(map_cursor_name_to_idc("text") == "IDC_IBEAM");
  CHECK(map_cursor_name_to_idc("zoom-in") == "IDC_ZOOM-IN");
}

TEST_CASE("cursor images read array and keyed pixel buffers") {
  const CursorImage from_array = cursor_image_from_json(nlohmann::json::parse(
      R"({"width": 1, "height": 1, "xhot": 0, "yhot": 0,
          "image": [1, 2, 3, 4]})"));
  CHECK((from_array.rgba == std::vector<uint8_t>{1, 2, 3, 4}));

  const CursorImage from_object = cursor_image_from_json(nlohmann::json::parse(
      R"({"width": 1, "height": 1, "delay": 50,
          "rgba": {"0": 9, "1": 8, "2": 7, "3": 6}})"));
  CHECK((from_object.rgba == std::vector<uint8_t>{9, 8, 7, 6}));
  CHECK(from_object.delay == doctest::Approx(50.0));
}

TEST_CASE("keyed pixel buffers skip non-numeric keys") {
  const CursorImage img = cursor_image_from_json(nlohmann::json::parse(
      u8R"({"width": 1, "height": 1,
            "rgba": {"0": 9, "é": 1, "1x": 2, "2": 7,
                     "12345678901234567890": 3}})"));

  REQUIRE(img.rgba.size() == 5);
  CHECK(img.rgba[0] == 9);
  CHECK(img.rgba[1] == 0);
  CHECK(img.rgba[2] == 7);
  CHECK(img.rgba[3] == 0);
  CHECK(img.rgba[4] == 0);
}
