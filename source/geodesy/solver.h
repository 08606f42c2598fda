// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <vector>
#include <cstddef>

#include "spacial/coords.h"

namespace geoline::geodesy
{

/**
 * Number of points sampled strictly between the two ends of a route.
 */
constexpr size_t path_samples = 1024;

/**
 * The solution of the inverse geodesic problem on WGS84.
 *
 * Azimuths are in degrees, measured clockwise from true north, in the 
 * (-180, 180] range the formulas produce. The reverse azimuth is the 
 * direction of travel at the destination (add 180° for the back azimuth).
 */
struct inverse_solution
{
  double distance;
  double azimuth;
  double reverse_azimuth;
};

/**
 * Solves the inverse problem between two validated points using
 * Karney's algorithm, accurate to nanometers including nearly antipodal
 * pairs. Should it ever come out non-finite the closed form Andoyer 
 * approximation is used instead. Identical points yield a zero distance
 * and zero azimuths.
 */
inverse_solution solve_inverse(
  spacial::coordinates const& from, 
  spacial::coordinates const& to);

/**
 * Maps any azimuth in degrees into [0, 360).
 */
double normalize_bearing(double azimuth);

/**
 * Walks the geodesic described by `solution` starting at `from` and
 * returns `count` points evenly spaced by distance, excluding both ends.
 * Longitudes are in the native [-180, 180] range.
 */
std::vector<spacial::coordinates> sample_geodesic(
  spacial::coordinates const& from,
  inverse_solution const& solution,
  size_t count = path_samples);

}
