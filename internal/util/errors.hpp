#pragma once

#include <stdexcept>
#include <string>

namespace ure::util {

/*
  Central error types.

  Repositories report portable db::Result codes; the store, session and
  executor layers translate them into these.
*/

// Malformed structured payload or constraint violation. Raised before any write.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Missing owning device/session/parent.
class ReferentialError : public std::runtime_error {
 public:
  explicit ReferentialError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeviceUnknownError : public ReferentialError {
 public:
  explicit DeviceUnknownError(const std::string& msg) : ReferentialError(msg) {
  }
};

class UnknownGraphError : public std::runtime_error {
 public:
  explicit UnknownGraphError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyClosedError : public std::runtime_error {
 public:
  explicit AlreadyClosedError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Only raised when the backend cannot serialize a compare-and-insert/update.
class ConcurrencyConflict : public std::runtime_error {
 public:
  explicit ConcurrencyConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Store unreachable or integrity corruption. Fatal to the current session.
class StoreFailure : public std::runtime_error {
 public:
  explicit StoreFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ure::util
