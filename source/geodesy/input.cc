// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "input.h"

#include <cmath>
#include <limits>
#include <string>

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace geoline::geodesy
{

double parse_degrees(std::string_view raw)
{
  std::string trimmed = boost::trim_copy(std::string(raw));
  if (trimmed.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }

  try {
    return boost::lexical_cast<double>(trimmed);
  } catch (boost::bad_lexical_cast const&) {
    return std::numeric_limits<double>::quiet_NaN();
  }
}

// NaN fails both comparisons, so it never passes as a valid value.
bool valid_latitude(double lat)
{ return lat >= -90.0 && lat <= 90.0; }

bool valid_longitude(double lng)
{ return lng >= -180.0 && lng <= 180.0; }

std::optional<spacial::coordinates> make_coordinates(
  std::string_view raw_lat, 
  std::string_view raw_lng)
{
  double lat = parse_degrees(raw_lat);
  double lng = parse_degrees(raw_lng);

  if (!valid_latitude(lat) || !valid_longitude(lng)) {
    return std::nullopt;
  }
  return spacial::coordinates(lat, lng);
}

}
