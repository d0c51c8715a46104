#pragma once

#include <stdexcept>
#include <string>

namespace circulation::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  The class carries the retry decision for callers:
    NotFound, Forbidden, InvalidArgument: do not retry without changing input
    Conflict: retry only after re-reading state
    Timeout: retry with the same idempotency key
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

class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Same idempotency key presented with a different operation or parameters.
class KeyReuseMismatch : public Conflict {
 public:
  explicit KeyReuseMismatch(const std::string& msg) : Conflict(msg) {
  }
};

class Forbidden : public std::runtime_error {
 public:
  explicit Forbidden(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Timeout : public std::runtime_error {
 public:
  explicit Timeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Internal : public std::runtime_error {
 public:
  explicit Internal(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace circulation::util
