#pragma once

#include <stdexcept>
#include <string>

namespace actions::util {

/*
  Central error types.

  Repository result codes are translated into these by the store layer.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace actions::util
