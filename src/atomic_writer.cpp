#include "atomic_writer.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>

#include "log.hpp"
#include "sync_types.hpp"

namespace {

std::atomic<uint64_t> temp_counter{0};

} // namespace

FileReader::~FileReader() {
  close();
}

Result<void> FileReader::open(const std::filesystem::path& path) {
  close();
  path_ = path;
  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if(fd_ < 0) {
    return Result<void>::Error(make_errno_error(errno, "cannot open source", path.string()));
  }
  return Result<void>::Ok();
}

Result<std::size_t> FileReader::read(void* buffer, std::size_t size) {
  if(fd_ < 0) {
    return Result<std::size_t>::Error(make_error(ErrorKind::SourceUnreadable, "source is not open", path_.string()));
  }
  while(true) {
    ssize_t n = ::read(fd_, buffer, size);
    if(n >= 0) return Result<std::size_t>::Ok(static_cast<std::size_t>(n));
    if(errno == EINTR) continue;
    return Result<std::size_t>::Error(make_errno_error(errno, "read failed", path_.string()));
  }
}

void FileReader::close() {
  if(fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

AtomicFileWriter::~AtomicFileWriter() {
  abort();
}

void AtomicFileWriter::close_fd() {
  if(fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

Result<void> AtomicFileWriter::open(const std::filesystem::path& destination) {
  abort();
  destination_ = destination;
  bytes_ = 0;
  fingerprint_.clear();
  hash_.reset();

  std::error_code ec;
  auto parent = destination.parent_path();
  if(!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if(ec) {
      return Result<void>::Error(make_errno_error(ec.value(), "cannot create directory", parent.string()));
    }
  }

  auto name = std::string(kTempPrefix) + std::to_string(::getpid()) + "-" +
              std::to_string(++temp_counter) + "-" + destination.filename().string() + kTempSuffix;
  temp_path_ = parent / name;
  fd_ = ::open(temp_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if(fd_ < 0) {
    int err = errno;
    temp_path_.clear();
    return Result<void>::Error(make_errno_error(err, "cannot create temporary file", destination.string()));
  }
  return Result<void>::Ok();
}

Result<void> AtomicFileWriter::write(const void* data, std::size_t size) {
  if(fd_ < 0) {
    return Result<void>::Error(make_error(ErrorKind::TransientIo, "writer is not open", destination_.string()));
  }
  const auto* bytes = static_cast<const char*>(data);
  std::size_t remaining = size;
  while(remaining > 0) {
    ssize_t written = ::write(fd_, bytes, remaining);
    if(written < 0) {
      if(errno == EINTR) continue;
      int err = errno;
      abort();
      return Result<void>::Error(make_errno_error(err, "write failed", destination_.string()));
    }
    bytes += written;
    remaining -= static_cast<std::size_t>(written);
  }
  hash_.update(data, size);
  bytes_ += size;
  return Result<void>::Ok();
}

Result<void> AtomicFileWriter::commit(const std::string& expected_fingerprint, bool sync) {
  if(fd_ < 0) {
    return Result<void>::Error(make_error(ErrorKind::TransientIo, "writer is not open", destination_.string()));
  }
  fingerprint_ = hash_.final_hex();
  if(!expected_fingerprint.empty() && fingerprint_ != expected_fingerprint) {
    auto message = "checksum mismatch: expected " + expected_fingerprint + ", got " + fingerprint_;
    abort();
    return Result<void>::Error(make_error(ErrorKind::ChecksumMismatch, message, destination_.string()));
  }
  if(sync && ::fsync(fd_) != 0) {
    int err = errno;
    abort();
    return Result<void>::Error(make_errno_error(err, "fsync failed", destination_.string()));
  }
  close_fd();

  std::error_code ec;
  std::filesystem::rename(temp_path_, destination_, ec);
  if(ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path_, ignored);
    temp_path_.clear();
    return Result<void>::Error(make_errno_error(ec.value(), "rename into place failed", destination_.string()));
  }
  temp_path_.clear();
  if(sync) fsync_directory(destination_.parent_path());
  return Result<void>::Ok();
}

void AtomicFileWriter::abort() {
  close_fd();
  if(!temp_path_.empty()) {
    std::error_code ignored;
    std::filesystem::remove(temp_path_, ignored);
    temp_path_.clear();
  }
}

bool AtomicFileWriter::is_temp_name(const std::string& filename) {
  const std::string prefix = kTempPrefix;
  const std::string suffix = kTempSuffix;
  return filename.size() > prefix.size() + suffix.size() &&
         filename.compare(0, prefix.size(), prefix) == 0 &&
         filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::size_t AtomicFileWriter::cleanup_orphans(const std::filesystem::path& root,
                                              std::chrono::seconds min_age,
                                              Logger* logger) {
  std::error_code ec;
  if(!std::filesystem::is_directory(root, ec)) return 0;

  const auto now_ns = static_cast<int64_t>(now_epoch_ms()) * 1000000;
  const auto min_age_ns = static_cast<int64_t>(min_age.count()) * 1000000000;
  std::size_t removed = 0;

  std::filesystem::recursive_directory_iterator it(root, std::filesystem::directory_options::skip_permission_denied, ec);
  std::filesystem::recursive_directory_iterator end;
  while(!ec && it != end) {
    const auto& path = it->path();
    if(is_temp_name(path.filename().string())) {
      auto st = stat_path(path);
      if(st && st->regular && now_ns - st->mtime_ns >= min_age_ns) {
        std::error_code remove_ec;
        if(std::filesystem::remove(path, remove_ec)) {
          ++removed;
          log_info(logger, "removed orphaned partial file {}", path.string());
        } else if(remove_ec) {
          log_warn(logger, "cannot remove orphaned partial file {}: {}", path.string(), remove_ec.message());
        }
      }
    }
    it.increment(ec);
  }
  if(ec) {
    log_warn(logger, "orphan cleanup under {} stopped early: {}", root.string(), ec.message());
  }
  return removed;
}
