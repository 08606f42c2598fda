// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <vector>

#include "coords.h"

namespace geoline::spacial
{

/**
 * Direction in which a route traverses the ±180° meridian.
 */
enum class crossing {
  none,
  eastward,  // e.g. 170 -> -170, display longitudes grow past 180
  westward   // e.g. -170 -> 170, display longitudes drop below -180
};

/**
 * Classifies a route by the signed longitude delta of its raw endpoints.
 * A delta outside of [-180, 180] means the shorter way goes across the
 * antimeridian.
 */
crossing detect_crossing(double start_lng, double dest_lng);

/**
 * Produces a copy of a solved path suitable for a flat, 360° wide map.
 *
 * When the route crosses the antimeridian every longitude that lies on the
 * far side of it (relative to the first point) is shifted by 360° so that
 * the whole sequence is continuous and monotonic. Paths that do not cross
 * are returned unchanged. The result must never be fed back into geodesic
 * calculations.
 */
std::vector<coordinates> unwrap_longitudes(
  std::vector<coordinates> path, 
  crossing direction);

/**
 * Shifts a single longitude onto the same branch as the route start.
 */
double unwrap_longitude(double lng, double start_lng, crossing direction);

}
