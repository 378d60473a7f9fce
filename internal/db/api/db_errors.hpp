#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace rulegraph::db {

// Raises the util:: error matching a failed repository result.
inline void ThrowIfDbError(const Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  const auto msg = prefix + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(msg);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(msg);
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
      throw util::OptimisticLockConflict(msg);
    case ErrorCode::Busy:
    case ErrorCode::IOError:
      throw util::StoreUnavailable(msg);
    default:
      throw std::runtime_error(msg);
  }
}

} // namespace rulegraph::db
