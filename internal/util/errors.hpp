#pragma once

#include <stdexcept>
#include <string>

namespace rdsync::util {

/*
  Errors thrown while wiring the runtime.

  Sync failures (fetch, persistence, stale commits) are never thrown; they
  travel as Result codes and cycle outcomes.
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

} // namespace rdsync::util
