// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <memory>
#include <string>
#include <cstdint>
#include <unordered_map>

#include "service.h"
#include "utils/json.h"

namespace geoline::rpc
{

/**
 * Represents a mapping from method-name to service handler instance.
 * 
 * Whenever an HTTP request arrives on the wire, its body is first parsed as
 * JSON and then the "method" field is extracted. Individual methods correspond
 * to instances of classes that handle tham in this map.
 */
using service_map_t = 
  std::unordered_map<
    std::string,      // key
    std::unique_ptr<  // instance
      service_base
    >
  >;

/**
 * This type holds all the settings captured from the "rpc" section
 * of the configuration file.
 */
struct config {
  /**
   * The IP on which the server will listen for requests.
   * Its recommended to use 0.0.0.0 (its also the default value if not
   * specified).
   */
  std::string listen_ip;

  /**
   * The port on which this server will be running.
   * The default value is 8050.
   */
  uint16_t listen_port;

  static config from_json(json_t const& json);
};

/**
 * Starts listening on the configured endpoint and serves requests
 * until the process terminates. Blocks the calling thread.
 */
void run_server(config config, service_map_t services);

}  // namespace geoline::rpc
