// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "solver.h"
#include "ellipsoid.h"
#include "utils/log.h"

#include <cmath>

#include <boost/geometry/util/math.hpp>
#include <boost/geometry/formulas/karney_direct.hpp>
#include <boost/geometry/formulas/karney_inverse.hpp>
#include <boost/geometry/strategies/geographic/parameters.hpp>

namespace geoline::geodesy
{

namespace bg = boost::geometry;

namespace // detail
{
  double to_radians(double degrees)
  { return degrees * bg::math::d2r<double>(); }

  double to_degrees(double radians)
  { return radians * bg::math::r2d<double>(); }

  // karney formulas take and return degrees.
  typedef bg::formula::karney_inverse<
    double, true, true, true, false, false> karney_inverse_t;

  typedef bg::formula::karney_direct<
    double, true, false, false, false> karney_direct_t;

  typedef bg::strategy::andoyer::inverse<
    double, true, true, true, false, false> andoyer_inverse_t;

  inverse_solution solve_karney(
    spacial::coordinates const& from, 
    spacial::coordinates const& to)
  {
    auto result = karney_inverse_t::apply(
      from.longitude(), from.latitude(),
      to.longitude(), to.latitude(),
      wgs84());

    return inverse_solution {
      .distance = result.distance,
      .azimuth = result.azimuth,
      .reverse_azimuth = result.reverse_azimuth
    };
  }

  inverse_solution solve_andoyer(
    spacial::coordinates const& from, 
    spacial::coordinates const& to)
  {
    auto result = andoyer_inverse_t::apply(
      to_radians(from.longitude()), to_radians(from.latitude()),
      to_radians(to.longitude()), to_radians(to.latitude()),
      wgs84());

    return inverse_solution {
      .distance = result.distance,
      .azimuth = to_degrees(result.azimuth),
      .reverse_azimuth = to_degrees(result.reverse_azimuth)
    };
  }

  bool is_finite(inverse_solution const& s)
  {
    return std::isfinite(s.distance) && 
           std::isfinite(s.azimuth) &&
           std::isfinite(s.reverse_azimuth);
  }
}

inverse_solution solve_inverse(
  spacial::coordinates const& from, 
  spacial::coordinates const& to)
{
  if (from == to) {
    return inverse_solution { 
      .distance = 0, 
      .azimuth = 0, 
      .reverse_azimuth = 0 
    };
  }

  auto solution = solve_karney(from, to);
  if (is_finite(solution)) {
    return solution;
  }

  warnlog << "karney inverse failed between ("
          << from.latitude() << ", " << from.longitude() << ") and ("
          << to.latitude() << ", " << to.longitude() 
          << "), falling back to andoyer";
  return solve_andoyer(from, to);
}

double normalize_bearing(double azimuth)
{
  double bearing = std::fmod(azimuth + 360.0, 360.0);
  if (bearing < 0) {
    bearing += 360.0;  // fmod keeps the sign of azimuths below -360
  }
  return bearing >= 360.0 ? 0.0 : bearing;
}

std::vector<spacial::coordinates> sample_geodesic(
  spacial::coordinates const& from,
  inverse_solution const& solution,
  size_t count)
{
  std::vector<spacial::coordinates> output;
  output.reserve(count);

  if (solution.distance == 0) {
    output.assign(count, from);
    return output;
  }

  double const step = solution.distance / (count + 1);

  for (size_t i = 1; i <= count; ++i) {
    auto result = karney_direct_t::apply(
      from.longitude(), from.latitude(), 
      step * i, solution.azimuth, wgs84());
    output.emplace_back(result.lat2, result.lon2);
  }
  return output;
}

}
