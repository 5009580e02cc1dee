#pragma once

#include <stdexcept>
#include <string>

namespace engram::util {

/*
  Central error types.

  Every public operation of the store either returns a value or throws one of
  these. Persistence backends report db::Result codes which are translated by
  ThrowIfDbError.
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
  ValidationError(std::string field, std::string reason)
      : std::runtime_error("invalid " + field + ": " + reason), field_(std::move(field)), reason_(std::move(reason)) {
  }

  const std::string& field() const {
    return field_;
  }

  const std::string& reason() const {
    return reason_;
  }

 private:
  std::string field_;
  std::string reason_;
};

// Optimistic pointer compare-and-swap lost. Re-read and retry.
class Stale : public std::runtime_error {
 public:
  explicit Stale(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CyclePrevented : public std::runtime_error {
 public:
  explicit CyclePrevented(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LimitExceeded : public std::runtime_error {
 public:
  explicit LimitExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownStrategy : public std::runtime_error {
 public:
  explicit UnknownStrategy(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Object I/O exhausted (disk full, permissions, corrupt object).
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace engram::util
