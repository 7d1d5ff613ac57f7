#include "file_tx.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <google/protobuf/util/json_util.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace timekeeper::db::file {

namespace {

std::string ErrnoMessage(const std::string& what, const std::filesystem::path& path) {
  return what + " " + path.string() + ": " + std::strerror(errno);
}

void WriteAll(int fd, const std::string& data, const std::filesystem::path& path) {
  const char* p    = data.data();
  std::size_t left = data.size();
  while (left > 0) {
    const ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw DbError(ErrorCode::IOError, ErrnoMessage("write", path));
    }
    p += n;
    left -= static_cast<std::size_t>(n);
  }
}

} // namespace

FileTransaction::FileTransaction(const std::filesystem::path& path, const std::filesystem::path& lock_path, Mode mode)
    : path_(path), lock_path_(lock_path), mode_(mode) {
  Lock(mode_ != Mode::kRead);

  try {
    if (mode_ == Mode::kCreate && std::filesystem::exists(path_)) {
      // Nothing to initialize; an existing document is parsed lazily by later transactions.
      committed_ = true;
      Unlock();
      return;
    }
    if (mode_ != Mode::kCreate) {
      Load();
    }
  } catch (...) {
    Unlock();
    throw;
  }
}

FileTransaction::~FileTransaction() {
  Unlock();
}

timekeeper::store::v1::StoreDocument& FileTransaction::Mutable() {
  if (mode_ == Mode::kRead) {
    throw DbError(ErrorCode::Unsupported, "write attempted in a read-only file transaction");
  }
  return document_;
}

void FileTransaction::Commit() {
  if (committed_) {
    return;
  }
  if (mode_ != Mode::kRead) {
    Persist();
  }
  committed_ = true;
  Unlock();
}

void FileTransaction::Rollback() {
  committed_ = true;
  Unlock();
}

void FileTransaction::Lock(bool exclusive) {
  lock_fd_ = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (lock_fd_ < 0) {
    throw DbError(ErrorCode::IOError, ErrnoMessage("open lock file", lock_path_));
  }

  while (::flock(lock_fd_, exclusive ? LOCK_EX : LOCK_SH) != 0) {
    if (errno == EINTR) continue;
    const auto msg = ErrnoMessage("flock", lock_path_);
    ::close(lock_fd_);
    lock_fd_ = -1;
    throw DbError(ErrorCode::IOError, msg);
  }
}

void FileTransaction::Unlock() {
  if (lock_fd_ < 0) {
    return;
  }
  // closing the descriptor releases the flock
  ::close(lock_fd_);
  lock_fd_ = -1;
}

void FileTransaction::Load() {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw DbError(ErrorCode::IOError, "store unavailable: cannot open " + path_.string());
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw DbError(ErrorCode::IOError, "store unavailable: read failed on " + path_.string());
  }

  const auto content = buffer.str();
  if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw DbError(ErrorCode::Corruption, "store corrupted: " + path_.string() + " is empty");
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(content, &document_, options);
  if (!status.ok()) {
    throw DbError(ErrorCode::Corruption, "store corrupted: " + path_.string() + ": " + std::string(status.message()));
  }
}

void FileTransaction::Persist() {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(document_, &json, options);
  if (!status.ok()) {
    throw DbError(ErrorCode::InternalError, "serialize store document: " + std::string(status.message()));
  }

  auto tmp_path = path_;
  tmp_path += ".tmp";

  int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw DbError(ErrorCode::IOError, ErrnoMessage("open", tmp_path));
  }

  try {
    WriteAll(fd, json, tmp_path);
    if (::fsync(fd) != 0) {
      throw DbError(ErrorCode::IOError, ErrnoMessage("fsync", tmp_path));
    }
  } catch (const DbError&) {
    ::close(fd);
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw;
  }

  if (::close(fd) != 0) {
    throw DbError(ErrorCode::IOError, ErrnoMessage("close", tmp_path));
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw DbError(ErrorCode::IOError, "rename " + tmp_path.string() + " -> " + path_.string() + ": " + ec.message());
  }

  TIMEKEEPER_LOG_DEBUG("store document written", {observability::StringField("path", path_.string()),
                                                  observability::IntField("matches", document_.matches_size()),
                                                  observability::IntField("users", document_.users_size())});
}

} // namespace timekeeper::db::file
