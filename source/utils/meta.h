// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <optional>
#include <stdexcept>
#include <boost/optional.hpp>

/**
 * Used mostly to maintain input argument invariants to functions.
 */
#define verify_argument(expr)                                      \
  do {                                                             \
    if (!(expr)) {                                                 \
      throw std::invalid_argument("argument test failed: " #expr); \
    }                                                              \
  } while (0)


template <typename T>
inline std::optional<T> to_std(boost::optional<T>&& v)
{ 
  if (v.has_value()) {
    return { std::move(v.value()) };
  }
  return {};
}
