#pragma once

#include <stdexcept>
#include <string>

namespace resolver::util {

/*
  Central error types.

  Thrown by the pipeline and caught at the CLI boundary.
  Repository backends never throw these directly; they return db::Result.
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Broken configuration. Raised before any mention is processed.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Persisted state contradicts itself (e.g. a membership row for a mention
// that no longer exists). The run aborts; nothing is repaired.
class DataIntegrityViolation : public std::runtime_error {
 public:
  explicit DataIntegrityViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace resolver::util
