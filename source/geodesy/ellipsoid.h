// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <boost/geometry/srs/spheroid.hpp>

namespace geoline::geodesy
{

/**
 * WGS84 defining parameters. These are the only reference
 * ellipsoid parameters used anywhere in the system.
 */
constexpr double wgs84_semi_major_axis = 6378137.0;
constexpr double wgs84_flattening = 1.0 / 298.257223563;
constexpr double wgs84_semi_minor_axis = 
  wgs84_semi_major_axis * (1.0 - wgs84_flattening);

using spheroid = boost::geometry::srs::spheroid<double>;

inline spheroid const& wgs84()
{
  static const spheroid instance(
    wgs84_semi_major_axis, 
    wgs84_semi_minor_axis);
  return instance;
}

}
