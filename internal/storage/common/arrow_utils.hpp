#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace engram::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageError
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw engram::util::StorageError(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw engram::util::StorageError(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

// Owning copy of a byte string as an Arrow buffer.
inline std::shared_ptr<arrow::Buffer> BufferFromString(std::string bytes) {
  return arrow::Buffer::FromString(std::move(bytes));
}

inline std::string_view View(const arrow::Buffer& buffer) {
  return {reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(buffer.size())};
}

} // namespace engram::storage::common
