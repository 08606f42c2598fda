// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>

#include "rpc/service.h"
#include "geodesy/route.h"

namespace geoline::services 
{

/**
 * Reads the four raw coordinate values out of a JSON-RPC request.
 *
 * Values are kept as typed by the user, missing fields are read as
 * empty strings and end up as absent points further down the line.
 */
class route_request
{
public:
  route_request(json_t json);

public:
  std::string start_latitude() const;
  std::string start_longitude() const;
  std::string destination_latitude() const;
  std::string destination_longitude() const;

private:
  std::string raw(const char* path) const;

private:
  json_t json_;
};

/**
 * The "route" JSON-RPC method. Invoked by the map front-end every time
 * any of the four inputs changes.
 */
class route_service final 
  : public rpc::service_base
{
public:
  json_t invoke(
    json_t params, 
    rpc::context ctx) const override;
};

}
