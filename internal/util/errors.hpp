#pragma once

#include <stdexcept>
#include <string>

namespace tending::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Malformed or missing required input. The operation had no effect.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A referenced id does not exist in the document. The operation had no effect.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The backing store is unavailable or returned data it cannot decode.
class StorageFailure : public std::runtime_error {
 public:
  explicit StorageFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace tending::util
