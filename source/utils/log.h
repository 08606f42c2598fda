// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include "json.h"

#include <string>
#include <boost/log/trivial.hpp>

#define tracelog BOOST_LOG_TRIVIAL(trace)
#define dbglog BOOST_LOG_TRIVIAL(debug)
#define infolog BOOST_LOG_TRIVIAL(info)
#define warnlog BOOST_LOG_TRIVIAL(warning)
#define errlog BOOST_LOG_TRIVIAL(error)
#define fatallog BOOST_LOG_TRIVIAL(fatal)


namespace geoline::logging
{
  /**
   * Installs the console sink and sets the minimum severity
   * from the "level" key of the logging config section.
   */
  void init(json_t const& config);

  /**
   * Parses a severity name (trace, debug, info, warning, error, fatal).
   * Throws std::invalid_argument for anything else.
   */
  boost::log::trivial::severity_level parse_level(std::string const& name);

  /**
   * Drains pending records and detaches the sink. Call before
   * exiting so the asynchronous queue does not drop anything.
   */
  void shutdown();

  size_t assign_thread_id();
}
