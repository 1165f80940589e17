#pragma once

#include <stdexcept>
#include <string>

namespace staging::util {

/*
  Central error types.

  Every failure that crosses the lifecycle manager boundary is one of these.
  Tolerated sub-step failures are logged and never surface as exceptions.
*/

// Missing or malformed request fields. Raised before any side effect.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Admission ceiling reached. Raised before any side effect.
class CapacityError : public std::runtime_error {
 public:
  explicit CapacityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Physical resource could not be created; no definition was persisted.
class CreationError : public std::runtime_error {
 public:
  explicit CreationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

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

} // namespace staging::util
