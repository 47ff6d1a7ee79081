#pragma once

#include <stdexcept>
#include <string>

namespace accessres::util {

/*
  Central error types.

  Thrown for caller and configuration mistakes only. Transport and decode
  failures never surface as exceptions; they become empty results.
*/

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

} // namespace accessres::util
