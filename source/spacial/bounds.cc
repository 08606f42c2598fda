// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "bounds.h"

#include <algorithm>

namespace geoline::spacial
{

bounds make_bounds(coordinates const& a, coordinates const& b)
{
  return bounds(
    coordinates(
      std::min(a.latitude(), b.latitude()),
      std::min(a.longitude(), b.longitude())),
    coordinates(
      std::max(a.latitude(), b.latitude()),
      std::max(a.longitude(), b.longitude())));
}

json_t to_json(bounds const& box)
{
  json_t output;
  output.push_back(std::make_pair("", box.min_corner().to_json()));
  output.push_back(std::make_pair("", box.max_corner().to_json()));
  return output;
}

}
