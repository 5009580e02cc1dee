#include "disk_object_store.hpp"

#include <arrow/io/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <random>
#include <sstream>
#include <system_error>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace engram::storage {

using namespace engram::storage::common;

namespace {

void SyncDescriptor(int fd, const std::string& what) {
  if (::fsync(fd) != 0) {
    throw engram::util::StorageError("fsync " + what + ": " + std::strerror(errno));
  }
}

// Makes a completed rename durable.
void SyncDirectory(const std::filesystem::path& dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    throw engram::util::StorageError("open directory " + dir.string() + ": " + std::strerror(errno));
  }
  const int rc  = ::fsync(fd);
  const int err = errno;
  ::close(fd);
  if (rc != 0) {
    throw engram::util::StorageError("fsync directory " + dir.string() + ": " + std::strerror(err));
  }
}

} // namespace

DiskObjectStore::DiskObjectStore(std::filesystem::path root, bool fsync) : root_(std::move(root)), fsync_(fsync) {
  std::error_code ec;
  std::filesystem::create_directories(root_ / "objects", ec);
  if (ec) {
    throw engram::util::StorageError("create object root " + root_.string() + ": " + ec.message());
  }
}

// Unique per process, thread and call so concurrent puts of the same bytes
// never share a tmp file.
std::filesystem::path DiskObjectStore::TempPath(const std::filesystem::path& final_path) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::ostringstream name;
  name << final_path.filename().string() << ".tmp." << std::hash<std::thread::id>{}(std::this_thread::get_id()) << '.' << tmp_counter_++
       << '.' << rng();
  return final_path.parent_path() / name.str();
}

/*
  Atomic write:
      write tmp -> close -> rename
  With fsync the file is synced before the rename and its directory after.
*/
std::string DiskObjectStore::Put(const std::shared_ptr<arrow::Buffer>& buffer) {
  const auto digest     = engram::util::Sha256Hex(buffer->data(), static_cast<std::size_t>(buffer->size()));
  const auto final_path = ObjectPath(root_, digest);

  if (std::filesystem::exists(final_path)) {
    return digest;
  }

  std::error_code ec;
  std::filesystem::create_directories(final_path.parent_path(), ec);
  if (ec) {
    throw engram::util::StorageError("create object directory " + final_path.parent_path().string() + ": " + ec.message());
  }

  const auto tmp_path = TempPath(final_path);
  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
    Unwrap(out->Write(buffer->data(), buffer->size()));
    if (fsync_) {
      Unwrap(out->Flush());
      SyncDescriptor(out->file_descriptor(), tmp_path.string());
    }
    Unwrap(out->Close());

    // rename(2) replaces atomically; a concurrent identical put yields the same bytes.
    std::filesystem::rename(tmp_path, final_path);
    if (fsync_) SyncDirectory(final_path.parent_path());
  } catch (const std::exception& e) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    throw engram::util::StorageError("write object " + digest + ": " + e.what());
  }

  ENGRAM_LOG_DEBUG("object stored", {engram::observability::StringField("digest", digest),
                                     engram::observability::IntField("bytes", buffer->size())});
  return digest;
}

std::shared_ptr<arrow::Buffer> DiskObjectStore::Get(const std::string& digest) {
  const auto path = ObjectPath(root_, digest);
  if (!std::filesystem::exists(path)) {
    throw engram::util::NotFound("object not found: " + digest);
  }

  auto file   = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = ReadAll(file);
  Unwrap(file->Close());

  if (engram::util::Sha256Hex(buffer->data(), static_cast<std::size_t>(buffer->size())) != digest) {
    throw engram::util::StorageError("object " + digest + " is corrupt");
  }
  return buffer;
}

bool DiskObjectStore::Contains(const std::string& digest) {
  return std::filesystem::exists(ObjectPath(root_, digest));
}

uint64_t DiskObjectStore::Size(const std::string& digest) {
  const auto path = ObjectPath(root_, digest);
  std::error_code ec;
  const auto      size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw engram::util::NotFound("object not found: " + digest);
  }
  return static_cast<uint64_t>(size);
}

std::vector<std::string> DiskObjectStore::List() {
  std::vector<std::string> digests;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(root_ / "objects")) {
    if (!entry.is_regular_file()) {
      continue;
    }
    auto name = entry.path().filename().string();
    // tmp files carry a suffix and are skipped
    if (engram::util::IsDigest(name)) {
      digests.push_back(std::move(name));
    }
  }
  std::sort(digests.begin(), digests.end());
  return digests;
}

} // namespace engram::storage
