#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace resolver::db {

// Maps a failed store result onto the util:: exception for its code.
inline void ThrowIfDbError(const Result& result, const std::string& prefix) {
  if (result) {
    return;
  }

  const std::string message = prefix + ": " + std::string(ToString(result.code)) + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::ConstraintViolation:
    case ErrorCode::Corruption:
      throw util::DataIntegrityViolation(message);
    case ErrorCode::Conflict:
    case ErrorCode::Busy:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace resolver::db
