// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "coords.h"

#include <iterator>
#include <stdexcept>

namespace geoline::spacial
{

coordinates::coordinates()
  : lat_(0)
  , lng_(0)
{
}

coordinates::coordinates(double lat, double lng)
    : lat_(lat)
    , lng_(lng)
{
}

double coordinates::latitude() const 
{ return lat_; }

double coordinates::longitude() const 
{ return lng_; }

double& coordinates::latitude() 
{ return lat_; }

double& coordinates::longitude() 
{ return lng_; }

bool coordinates::operator==(coordinates const& other) const
{ 
  return latitude() == other.latitude() && 
         longitude() == other.longitude();
}

bool coordinates::operator!=(coordinates const& other) const
{ return !(*this == other); }

json_t coordinates::to_json() const
{
  json_t output, lat, lng;
  lat.put_value(latitude());
  lng.put_value(longitude());
  output.push_back(std::make_pair("", std::move(lat)));
  output.push_back(std::make_pair("", std::move(lng)));
  return output;
}

coordinates coordinates::from_json(json_t const& j) 
{
  if (j.size() != 2) {
    throw std::invalid_argument("expected a [lat, lng] pair");
  }
  return coordinates(
    j.begin()->second.get_value<double>(),
    std::next(j.begin())->second.get_value<double>());
}

}
