#pragma once

#include <stdexcept>
#include <string>

namespace vigil::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
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

class Unauthenticated : public std::runtime_error {
 public:
  explicit Unauthenticated(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backing store or downstream temporarily unreachable; callers may retry.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace vigil::util
