// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <string_view>

#include "solver.h"
#include "spacial/bounds.h"
#include "spacial/coords.h"

namespace geoline::geodesy
{

/**
 * The geodesic between two validated points on WGS84.
 * 
 * Everything in here is "geodesy-true": longitudes are in the native
 * [-180, 180] range and may be used for further calculations. Display
 * normalization happens only when building a route_view.
 */
class route
{
public:
  route(spacial::coordinates start, spacial::coordinates destination);

public:
  spacial::coordinates const& start() const;
  spacial::coordinates const& destination() const;

  /**
   * Surface distance in meters.
   */
  double distance() const;

  /**
   * Initial bearing at the start, clockwise from true north, in [0, 360).
   */
  double bearing() const;

  /**
   * Direction of travel when arriving at the destination, in [0, 360).
   */
  double reverse_bearing() const;

  /**
   * Start, path_samples intermediate points and the destination.
   */
  std::vector<spacial::coordinates> const& path() const;

  /**
   * Box over the two raw endpoints, used to frame the viewport.
   */
  spacial::bounds const& bounds() const;

  /**
   * Human readable distance (km, 3 decimals) and azimuth (1 decimal).
   */
  std::string summary() const;

private:
  spacial::coordinates start_;
  spacial::coordinates destination_;
  inverse_solution solution_;
  std::vector<spacial::coordinates> path_;
  spacial::bounds bounds_;
};

/**
 * A map pin placed at a display position.
 */
struct marker
{
  spacial::coordinates position;
  std::string tooltip;
  std::string popup;

  json_t to_json() const;
};

/**
 * Everything a map front-end needs to render the current inputs.
 *
 * Markers and path are in display coordinates: when the route crosses
 * the antimeridian their longitudes are unwrapped onto one continuous
 * branch and may leave the [-180, 180] range.
 */
struct route_view
{
  std::optional<marker> start_marker;
  std::optional<marker> dest_marker;
  std::optional<std::vector<spacial::coordinates>> path;
  std::optional<spacial::bounds> bounds;
  std::optional<route> solved;
  std::string summary;

  json_t to_json() const;
};

/**
 * Shown whenever one of the two points is missing or invalid.
 */
extern const char* const prompt_message;

/**
 * Turns the four raw input values into a renderable view.
 *
 * This is a pure function of its arguments and is meant to be called 
 * again on every input change. Invalid points are simply left out,
 * nothing in here throws because of bad user input.
 */
route_view plan(
  std::string_view start_lat, std::string_view start_lng,
  std::string_view dest_lat, std::string_view dest_lng);

}
