// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>
#include <vector>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/register/point.hpp>
#include "utils/json.h"

namespace geoline::spacial
{
  
/**
 * Represents a single GPS coordinate (lat, lng) in degrees.
 *
 * This type carries no validity invariant on its own, values that
 * went through geodesy::make_coordinates are guaranteed to be finite
 * and within [-90, 90] x [-180, 180]. Display normalized copies may
 * hold longitudes outside of that range.
 */
class coordinates
{
public:
  coordinates();
  coordinates(double lat, double lng);

public:  // r/o
  double longitude() const;
  double latitude() const;

public:  // r/w
  double& longitude();
  double& latitude();

public:
  bool operator==(coordinates const& other) const;
  bool operator!=(coordinates const& other) const;

public:
  /**
   * Serializes as a two element array [lat, lng], which is the
   * position format expected by leaflet-style map front-ends.
   */
  json_t to_json() const;
  static coordinates from_json(json_t const&);

private:
  double lat_, lng_;
};

}

/**
 * This registers the custom class `coordinates` type
 * as a point type with boost::geometry for use in all
 * geometric algorithms and boxes. This avoids having 
 * to convert them to point2d and unessessary copies.
 */
BOOST_GEOMETRY_REGISTER_POINT_2D(
  geoline::spacial::coordinates, double,
  boost::geometry::cs::geographic<boost::geometry::degree>, 
  longitude(), latitude())
