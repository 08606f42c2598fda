// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <string>
#include <iostream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "rpc/server.h"
#include "geodesy/route.h"
#include "services/route.h"

#include "utils/log.h"

void print_usage(const char* exe)
{
  std::cerr << "usage: " << exe << " <config-file>" << std::endl
            << "       " << exe
            << " route <start-lat> <start-lon> <dest-lat> <dest-lon>"
            << std::endl;
}

/**
 * Computes a single route from the command line and prints the
 * same JSON document the "route" rpc method would respond with.
 */
int run_once(const char** argv)
{
  auto view = geoline::geodesy::plan(argv[2], argv[3], argv[4], argv[5]);
  boost::property_tree::write_json(std::cout, view.to_json());
  return view.solved.has_value() ? 0 : 2;
}

void run_service(boost::property_tree::ptree const& systemconfig)
{
  using namespace geoline::services;

  auto rpcconfig = geoline::rpc::config::from_json(
    systemconfig.get_child("rpc"));

  geoline::rpc::service_map_t svcmap;
  svcmap.emplace("route",
    geoline::rpc::create_service(route_service()));

  // this blocks the current thread until the server terminates
  geoline::rpc::run_server(
    std::move(rpcconfig),
    std::move(svcmap));
}

int main(int argc, const char** argv)
{
  bool once = argc == 6 && boost::iequals(argv[1], "route");
  if (argc != 2 && !once) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    if (once) {
      geoline::logging::init(boost::property_tree::ptree());
      int status = run_once(argv);
      geoline::logging::shutdown();
      return status;
    }

    // this holds rpc and logging config.
    boost::property_tree::ptree systemconfig;
    boost::property_tree::read_json(argv[1], systemconfig);

    geoline::logging::init(systemconfig.get_child(
      "logging", boost::property_tree::ptree()));
    infolog << "loaded configuration from " << argv[1];

    run_service(systemconfig);

  } catch (std::exception const& e) {
    errlog << "fatal: " << e.what();
    geoline::logging::shutdown();
    return 1;
  }
  geoline::logging::shutdown();
  return 0;
}
