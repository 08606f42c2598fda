// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "antimeridian.h"

namespace geoline::spacial
{

crossing detect_crossing(double start_lng, double dest_lng)
{
  double delta = dest_lng - start_lng;
  if (delta < -180) {
    return crossing::eastward;
  }
  if (delta > 180) {
    return crossing::westward;
  }
  return crossing::none;
}

double unwrap_longitude(double lng, double start_lng, crossing direction)
{
  switch (direction) {
    case crossing::eastward:
      return lng - start_lng < -180 ? lng + 360 : lng;
    case crossing::westward:
      return lng - start_lng > 180 ? lng - 360 : lng;
    case crossing::none:
    default:
      return lng;
  }
}

std::vector<coordinates> unwrap_longitudes(
  std::vector<coordinates> path, 
  crossing direction)
{
  if (direction == crossing::none || path.empty()) {
    return path;
  }

  // the first point anchors the branch, it is never shifted itself.
  double const start_lng = path.front().longitude();
  for (auto& point : path) {
    point.longitude() = unwrap_longitude(
      point.longitude(), start_lng, direction);
  }
  return path;
}

}
