// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <cmath>
#include <catch2/catch.hpp>

#include "geodesy/input.h"

TEST_CASE("Degrees parser - numeric values", "[input]")
{
  using namespace geoline::geodesy;

  REQUIRE(parse_degrees("1.3521") == Approx(1.3521));
  REQUIRE(parse_degrees("  103.8198\t") == Approx(103.8198));
  REQUIRE(parse_degrees("-45") == -45.0);
  REQUIRE(parse_degrees("+12.5") == 12.5);
  REQUIRE(parse_degrees("1e1") == 10.0);
}

TEST_CASE("Degrees parser - garbage turns into NaN", "[input]")
{
  using namespace geoline::geodesy;

  REQUIRE(std::isnan(parse_degrees("")));
  REQUIRE(std::isnan(parse_degrees("   ")));
  REQUIRE(std::isnan(parse_degrees("abc")));
  REQUIRE(std::isnan(parse_degrees("12,5")));
  REQUIRE(std::isnan(parse_degrees("12.5.1")));
  REQUIRE(std::isnan(parse_degrees("1 2")));
}

TEST_CASE("Coordinates validation - ranges", "[input]")
{
  using namespace geoline::geodesy;

  REQUIRE(valid_latitude(90));
  REQUIRE(valid_latitude(-90));
  REQUIRE_FALSE(valid_latitude(90.0001));
  REQUIRE_FALSE(valid_latitude(std::nan("")));

  REQUIRE(valid_longitude(180));
  REQUIRE(valid_longitude(-180));
  REQUIRE_FALSE(valid_longitude(-180.5));
  REQUIRE_FALSE(valid_longitude(INFINITY));
}

TEST_CASE("Coordinates validation - whole point", "[input]")
{
  using namespace geoline::geodesy;

  auto singapore = make_coordinates(" 1.3521", "103.8198 ");
  REQUIRE(singapore.has_value());
  REQUIRE(singapore->latitude() == Approx(1.3521));
  REQUIRE(singapore->longitude() == Approx(103.8198));

  // one bad component invalidates the point, nothing gets clamped
  REQUIRE_FALSE(make_coordinates("1.3521", "").has_value());
  REQUIRE_FALSE(make_coordinates("", "103.8198").has_value());
  REQUIRE_FALSE(make_coordinates("91", "0").has_value());
  REQUIRE_FALSE(make_coordinates("45", "181").has_value());
  REQUIRE_FALSE(make_coordinates("nan", "10").has_value());
  REQUIRE_FALSE(make_coordinates("10", "inf").has_value());
  REQUIRE_FALSE(make_coordinates("north", "east").has_value());
}
