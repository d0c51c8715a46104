#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace circulation::db {

/*
  Raises the util exception matching a failed Result.

  Expected outcomes carry only `context` so storage wording never reaches
  callers. Anything else is an internal failure and keeps the backend
  message for the log.
*/
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(context);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(context);
    case ErrorCode::Conflict:
    case ErrorCode::ConstraintViolation:
    case ErrorCode::SerializationFailure:
      throw util::Conflict(context);
    default:
      throw std::runtime_error(result.message.empty() ? context : context + ": " + result.message);
  }
}

} // namespace circulation::db
