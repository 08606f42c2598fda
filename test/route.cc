// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <cmath>
#include <string>
#include <catch2/catch.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "geodesy/route.h"

using geoline::spacial::coordinates;

namespace
{
  bool same_point(coordinates const& a, coordinates const& b)
  {
    return a.latitude() == Approx(b.latitude()).margin(1e-12) &&
           a.longitude() == Approx(b.longitude()).margin(1e-12);
  }
}

TEST_CASE("Route planning - incomplete input", "[route]")
{
  using namespace geoline::geodesy;

  SECTION("invalid start keeps only the destination marker") {
    for (auto const* bad : { "", "abc", "91", "-90.5", "nan", "1,5" }) {
      auto view = plan(bad, "103.8198", "35.6895", "139.6917");
      REQUIRE_FALSE(view.start_marker.has_value());
      REQUIRE(view.dest_marker.has_value());
      REQUIRE(same_point(view.dest_marker->position, coordinates(35.6895, 139.6917)));
      REQUIRE_FALSE(view.path.has_value());
      REQUIRE_FALSE(view.bounds.has_value());
      REQUIRE_FALSE(view.solved.has_value());
      REQUIRE(view.summary == prompt_message);
    }
  }

  SECTION("invalid destination keeps only the start marker") {
    for (auto const* bad : { "", "east", "180.01", "-181", "inf" }) {
      auto view = plan("1.3521", "103.8198", "35.6895", bad);
      REQUIRE(view.start_marker.has_value());
      REQUIRE_FALSE(view.dest_marker.has_value());
      REQUIRE_FALSE(view.path.has_value());
      REQUIRE_FALSE(view.bounds.has_value());
      REQUIRE(view.summary == prompt_message);
    }
  }

  SECTION("nothing valid") {
    auto view = plan("", "", "", "");
    REQUIRE_FALSE(view.start_marker.has_value());
    REQUIRE_FALSE(view.dest_marker.has_value());
    REQUIRE_FALSE(view.path.has_value());
    REQUIRE(view.summary == 
      "Enter both Start and Destination coordinates "
      "to compute distance and azimuth.");
  }
}

TEST_CASE("Route planning - Singapore to Tokyo", "[route]")
{
  using namespace geoline::geodesy;

  auto view = plan("1.3521", " 103.8198", "35.6895 ", "139.6917");
  REQUIRE(view.solved.has_value());
  REQUIRE(view.path.has_value());
  REQUIRE(view.path->size() == 1026);
  REQUIRE(view.solved->path().size() == 1026);

  REQUIRE(same_point(view.path->front(), coordinates(1.3521, 103.8198)));
  REQUIRE(same_point(view.path->back(), coordinates(35.6895, 139.6917)));

  REQUIRE(view.solved->distance() == Approx(5307106.512).margin(0.01));
  REQUIRE(view.solved->bearing() == Approx(40.138).margin(0.01));
  REQUIRE(view.solved->reverse_bearing() >= 0);
  REQUIRE(view.solved->reverse_bearing() < 360);

  REQUIRE(view.start_marker->tooltip == "Start");
  REQUIRE(view.start_marker->popup == "Start: 1.352, 103.820");
  REQUIRE(view.dest_marker->tooltip == "Destination");
  REQUIRE(boost::starts_with(view.dest_marker->popup, "Dest: 35.6"));

  REQUIRE(same_point(view.bounds->min_corner(), coordinates(1.3521, 103.8198)));
  REQUIRE(same_point(view.bounds->max_corner(), coordinates(35.6895, 139.6917)));
}

TEST_CASE("Route planning - summary text", "[route]")
{
  using namespace geoline::geodesy;

  auto view = plan("1.3521", "103.8198", "35.6895", "139.6917");
  REQUIRE(view.summary ==
    "Distance: 5307.107 km\n"
    "Azimuth (Start → Dest): 40.1° (clockwise from true North)");
}

TEST_CASE("Route planning - identical points", "[route]")
{
  using namespace geoline::geodesy;

  auto view = plan("48.8566", "2.3522", "48.8566", "2.3522");
  REQUIRE(view.solved.has_value());
  REQUIRE(view.solved->distance() == 0);
  REQUIRE(std::isfinite(view.solved->bearing()));
  REQUIRE(view.path->size() == 1026);
  REQUIRE(view.summary == 
    "Distance: 0.000 km\n"
    "Azimuth (Start → Dest): 0.0° (clockwise from true North)");
}

TEST_CASE("Route planning - eastward across the antimeridian", "[route]")
{
  using namespace geoline::geodesy;

  auto view = plan("10", "170", "20", "-170");
  REQUIRE(view.path->size() == 1026);

  // markers and polyline are shifted together
  REQUIRE(view.start_marker->position.longitude() == 170);
  REQUIRE(view.dest_marker->position.longitude() == 190);
  REQUIRE(view.path->front().longitude() == 170);
  REQUIRE(view.path->back().longitude() == 190);
  REQUIRE(view.dest_marker->popup == "Dest: 20.000, 190.000");

  for (size_t i = 1; i < view.path->size(); ++i) {
    REQUIRE(view.path->at(i).longitude() > view.path->at(i - 1).longitude());
    REQUIRE(view.path->at(i).longitude() >= 170);
    REQUIRE(view.path->at(i).longitude() <= 190);
  }

  // the solved route stays in native longitudes
  REQUIRE(view.solved->destination().longitude() == -170);
  REQUIRE(view.solved->path().back().longitude() == -170);
  for (auto const& p : view.solved->path()) {
    REQUIRE(p.longitude() >= -180);
    REQUIRE(p.longitude() <= 180);
  }

  // bounds come from the raw endpoints
  REQUIRE(view.bounds->min_corner() == coordinates(10, -170));
  REQUIRE(view.bounds->max_corner() == coordinates(20, 170));
}

TEST_CASE("Route planning - westward across the antimeridian", "[route]")
{
  using namespace geoline::geodesy;

  auto view = plan("-5", "-170", "5", "170");
  REQUIRE(view.start_marker->position.longitude() == -170);
  REQUIRE(view.dest_marker->position.longitude() == -190);

  for (size_t i = 1; i < view.path->size(); ++i) {
    REQUIRE(view.path->at(i).longitude() < view.path->at(i - 1).longitude());
    REQUIRE(view.path->at(i).longitude() <= -170);
    REQUIRE(view.path->at(i).longitude() >= -190);
  }
}

TEST_CASE("Route planning - no crossing leaves longitudes alone", "[route]")
{
  using namespace geoline::geodesy;

  auto view = plan("0", "10", "5", "20");
  REQUIRE(*view.path == view.solved->path());
  REQUIRE(view.dest_marker->position.longitude() == 20);
}

TEST_CASE("Route planning - same answer on every call", "[route]")
{
  using namespace geoline::geodesy;

  auto first = plan("51.5074", "-0.1278", "40.7128", "-74.0060");
  auto second = plan("51.5074", "-0.1278", "40.7128", "-74.0060");

  REQUIRE(first.summary == second.summary);
  REQUIRE(*first.path == *second.path);
}

TEST_CASE("Route view - json layout", "[route]")
{
  using namespace geoline::geodesy;

  auto json = plan("10", "170", "20", "-170").to_json();
  REQUIRE(json.get_child("path").size() == 1026);
  REQUIRE(json.get_child("bounds").size() == 2);
  REQUIRE(json.get<std::string>("start.tooltip") == "Start");
  REQUIRE(json.get<std::string>("destination.popup") == "Dest: 20.000, 190.000");
  REQUIRE(json.get<double>("distance") > 0);
  REQUIRE(json.get<double>("azimuth") >= 0);
  REQUIRE(json.get<double>("azimuth") < 360);

  auto position = coordinates::from_json(
    json.get_child("destination.position"));
  REQUIRE(position == coordinates(20, 190));

  auto last = coordinates::from_json(
    json.get_child("path").back().second);
  REQUIRE(last == coordinates(20, 190));

  auto incomplete = plan("10", "170", "", "").to_json();
  REQUIRE(incomplete.get_child_optional("start").has_value());
  REQUIRE_FALSE(incomplete.get_child_optional("destination").has_value());
  REQUIRE_FALSE(incomplete.get_child_optional("path").has_value());
  REQUIRE_FALSE(incomplete.get_child_optional("bounds").has_value());
  REQUIRE_FALSE(incomplete.get_child_optional("distance").has_value());
  REQUIRE(incomplete.get<std::string>("summary") == prompt_message);
}
