#include "doctest/doctest.h"

#include "cinecut/styles.hpp"

using namespace cinecut;

TEST_CASE("hex colors") {
  Rgba c;
  REQUIRE(parse_color("#111827", c));
  CHECK(c.r == 0x11);
  CHECK(c.g == 0x18);
  CHECK(c.b == 0x27);
  CHECK(c.a == doctest::Approx(1.0));

  REQUIRE(parse_color("#fff", c));
  CHECK(c.r == 255);

  REQUIRE(parse_color("#00000080", c));
  CHECK(c.a == doctest::Approx(128.0 / 255.0));
}

TEST_CASE("functional colors") {
  Rgba c;
  REQUIRE(parse_color("rgba(0, 0, 0, 0.8)", c));
  CHECK(c.r == 0);
  CHECK(c.a == doctest::Approx(0.8));

  REQUIRE(parse_color("RGB(300, 20, 30)", c));
  CHECK(c.r == 255);
  CHECK(c.g == 20);
  CHECK(c.a == doctest::Approx(1.0));
}

TEST_CASE("invalid colors leave the output untouched") {
  Rgba c{1, 2, 3, 0.5};
  CHECK_FALSE(parse_color("", c));
  CHECK_FALSE(parse_color("#12", c));
  CHECK_FALSE(parse_color("#zzzzzz", c));
  CHECK_FALSE(parse_color("rgba(1, 2, 3)", c));
  CHECK_FALSE(parse_color("hsl(0, 0%, 0%)", c));
  CHECK(c.r == 1);

  const Rgba fallback = color_or("nonsense", Rgba{9, 9, 9, 1.0});
  CHECK(fallback.r == 9);
}

TEST_CASE("style names map to enums with defaults") {
  CHECK(background_type_from_string("image") == BackgroundType::Image);
  CHECK(background_type_from_string("unknown") == BackgroundType::Color);
  CHECK(webcam_shape_from_string("circle") == WebcamShape::Circle);
  CHECK(webcam_shape_from_string("blob") == WebcamShape::Square);
  CHECK(webcam_anchor_from_string("left-center") == WebcamAnchor::LeftCenter);
  CHECK(webcam_anchor_from_string("") == WebcamAnchor::BottomRight);
}
