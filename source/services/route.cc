// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "route.h"
#include "utils/log.h"
#include "utils/meta.h"

namespace geoline::services 
{

route_request::route_request(json_t json)
  : json_(std::move(json)) { }

std::string route_request::raw(const char* path) const
{ return to_std(json_.get_optional<std::string>(path)).value_or(""); }

std::string route_request::start_latitude() const
{ return raw("start.latitude"); }

std::string route_request::start_longitude() const
{ return raw("start.longitude"); }

std::string route_request::destination_latitude() const
{ return raw("destination.latitude"); }

std::string route_request::destination_longitude() const
{ return raw("destination.longitude"); }

json_t route_service::invoke(json_t params, rpc::context ctx) const 
{
  route_request request(std::move(params));
  tracelog << "route request from " << ctx.remote_ep;

  return geodesy::plan(
    request.start_latitude(), 
    request.start_longitude(),
    request.destination_latitude(), 
    request.destination_longitude()).to_json();
}

}
