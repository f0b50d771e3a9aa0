#pragma once

#include <stdexcept>
#include <string>

namespace taskpilot::util {

/*
  Central error types.

  Thrown by the task store before any write is applied. Lookups of unknown
  ids are not errors at this level: they surface as empty optionals or false.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CycleDetected : public ValidationError {
 public:
  explicit CycleDetected(const std::string& msg) : ValidationError(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace taskpilot::util
