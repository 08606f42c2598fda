// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "route.h"
#include "input.h"
#include "spacial/antimeridian.h"
#include "utils/log.h"

#include <iomanip>
#include <sstream>

namespace geoline::geodesy
{

const char* const prompt_message =
  "Enter both Start and Destination coordinates "
  "to compute distance and azimuth.";

route::route(spacial::coordinates start, spacial::coordinates destination)
  : start_(std::move(start))
  , destination_(std::move(destination))
  , solution_(solve_inverse(start_, destination_))
  , bounds_(spacial::make_bounds(start_, destination_))
{
  auto samples = sample_geodesic(start_, solution_);

  path_.reserve(samples.size() + 2);
  path_.push_back(start_);
  path_.insert(path_.end(), samples.begin(), samples.end());
  path_.push_back(destination_);
}

spacial::coordinates const& route::start() const
{ return start_; }

spacial::coordinates const& route::destination() const
{ return destination_; }

double route::distance() const
{ return solution_.distance; }

double route::bearing() const
{ return normalize_bearing(solution_.azimuth); }

double route::reverse_bearing() const
{ return normalize_bearing(solution_.reverse_azimuth); }

std::vector<spacial::coordinates> const& route::path() const
{ return path_; }

spacial::bounds const& route::bounds() const
{ return bounds_; }

std::string route::summary() const
{
  std::stringstream ss;
  ss << std::fixed
     << "Distance: " << std::setprecision(3) << distance() / 1000.0 << " km\n"
     << "Azimuth (Start → Dest): " << std::setprecision(1) << bearing()
     << "° (clockwise from true North)";
  return ss.str();
}

json_t marker::to_json() const
{
  json_t output;
  output.add_child("position", position.to_json());
  output.add("tooltip", tooltip);
  output.add("popup", popup);
  return output;
}

json_t route_view::to_json() const
{
  json_t output;
  if (start_marker.has_value()) {
    output.add_child("start", start_marker->to_json());
  }

  if (dest_marker.has_value()) {
    output.add_child("destination", dest_marker->to_json());
  }

  if (path.has_value()) {
    json_t points;
    for (auto const& point : *path) {
      points.push_back(std::make_pair("", point.to_json()));
    }
    output.add_child("path", std::move(points));
  }

  if (bounds.has_value()) {
    output.add_child("bounds", spacial::to_json(*bounds));
  }

  if (solved.has_value()) {
    output.add("distance", solved->distance());
    output.add("azimuth", solved->bearing());
    output.add("reverse_azimuth", solved->reverse_bearing());
  }

  output.add("summary", summary);
  return output;
}

static marker make_marker(
  spacial::coordinates position,
  std::string tooltip,
  std::string popup_prefix)
{
  std::stringstream ss;
  ss << std::fixed << std::setprecision(3)
     << popup_prefix << ": "
     << position.latitude() << ", "
     << position.longitude();

  return marker {
    .position = std::move(position),
    .tooltip = std::move(tooltip),
    .popup = ss.str()
  };
}

route_view plan(
  std::string_view start_lat, std::string_view start_lng,
  std::string_view dest_lat, std::string_view dest_lng)
{
  auto start = make_coordinates(start_lat, start_lng);
  auto destination = make_coordinates(dest_lat, dest_lng);

  route_view view;
  if (!start.has_value() || !destination.has_value()) {
    if (start.has_value()) {
      view.start_marker = make_marker(*start, "Start", "Start");
    }
    if (destination.has_value()) {
      view.dest_marker = make_marker(*destination, "Destination", "Dest");
    }
    view.summary = prompt_message;
    tracelog << "route incomplete: start "
             << (start.has_value() ? "ok" : "invalid")
             << ", destination "
             << (destination.has_value() ? "ok" : "invalid");
    return view;
  }

  route solved(*start, *destination);
  auto direction = spacial::detect_crossing(
    start->longitude(), destination->longitude());

  // markers and the polyline are unwrapped together, from the
  // same anchor, so they always line up on the rendered map.
  auto display = spacial::unwrap_longitudes(solved.path(), direction);

  view.start_marker = make_marker(display.front(), "Start", "Start");
  view.dest_marker = make_marker(display.back(), "Destination", "Dest");
  view.bounds = solved.bounds();
  view.summary = solved.summary();
  view.path = std::move(display);

  dbglog << "route (" << start->latitude() << ", " << start->longitude()
         << ") -> (" << destination->latitude() << ", "
         << destination->longitude() << "): "
         << solved.distance() << " m, " << solved.bearing() << " deg"
         << (direction != spacial::crossing::none
              ? ", crosses antimeridian" : "");

  view.solved = std::move(solved);
  return view;
}

}
