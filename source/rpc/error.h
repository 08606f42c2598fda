// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <stdexcept>

namespace geoline::rpc
{

/**
 * Thrown when the JSON-RPC request could not be
 * parsed or has some missing or invalid fields.
 * Gets translated to HTTP 400 error.
 */
class bad_request : public std::runtime_error
{
public:
  bad_request();
  bad_request(const char* msg);
};

/**
 * Thrown when a request attempts to invoke a non-existing JSON-RPC method
 * or uses an HTTP verb other than POST.
 * Gets translated to HTTP 405 Method not allowed error code.
 */
class bad_method : public std::runtime_error
{
public:
  bad_method();
  bad_method(const char* msg);
};

}  // namespace geoline::rpc
