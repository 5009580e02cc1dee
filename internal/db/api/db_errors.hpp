#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace engram::db {

// Maps a repository Result onto the public error taxonomy. Retryable codes
// surface as Stale; everything unexpected is a StorageError.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + ToString(result.code) + (result.message.empty() ? "" : " (" + result.message + ")");
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      break;
  }
  if (result.Retryable()) throw util::Stale(message);
  throw util::StorageError(message);
}

} // namespace engram::db
