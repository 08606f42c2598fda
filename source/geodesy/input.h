// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <optional>
#include <string_view>

#include "spacial/coords.h"

namespace geoline::geodesy
{

/**
 * Converts a user typed value to degrees.
 *
 * Surrounding whitespace is ignored. Anything that is not a number
 * (including an empty string) yields a quiet NaN instead of throwing,
 * callers must run the value through the range checks below before
 * doing any arithmetic with it.
 */
double parse_degrees(std::string_view raw);

bool valid_latitude(double lat);
bool valid_longitude(double lng);

/**
 * Builds a point out of two raw values. Returns an empty optional if
 * either component is not a number or is outside of its range, values
 * are never clamped.
 */
std::optional<spacial::coordinates> make_coordinates(
  std::string_view raw_lat, 
  std::string_view raw_lng);

}
