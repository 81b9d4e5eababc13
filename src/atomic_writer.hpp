#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "errors.hpp"
#include "utils.hpp"

class Logger;

// Read side of a transfer: POSIX descriptor with errors mapped to ErrorKind.
class FileReader {
public:
  FileReader() = default;
  ~FileReader();

  FileReader(const FileReader&) = delete;
  FileReader& operator=(const FileReader&) = delete;

  Result<void> open(const std::filesystem::path& path);
  // Zero at end of file.
  Result<std::size_t> read(void* buffer, std::size_t size);
  void close();

private:
  int fd_ = -1;
  std::filesystem::path path_;
};

inline constexpr const char* kTempPrefix = ".efsync-tmp-";
inline constexpr const char* kTempSuffix = ".partial";

// Streams bytes into a hidden temporary sibling of the destination and only
// renames it into place once the running checksum matches. A destination
// never holds a partially written file.
class AtomicFileWriter {
public:
  AtomicFileWriter() = default;
  ~AtomicFileWriter();

  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

  Result<void> open(const std::filesystem::path& destination);
  Result<void> write(const void* data, std::size_t size);
  // Empty expected_fingerprint skips the comparison.
  Result<void> commit(const std::string& expected_fingerprint, bool sync = true);
  void abort();

  bool is_open() const { return fd_ >= 0; }
  uint64_t bytes_written() const { return bytes_; }
  // Valid after commit.
  const std::string& fingerprint() const { return fingerprint_; }
  const std::filesystem::path& temp_path() const { return temp_path_; }
  const std::filesystem::path& destination() const { return destination_; }

  static bool is_temp_name(const std::string& filename);
  // Removes leftovers of interrupted writes older than min_age. Returns how many went.
  static std::size_t cleanup_orphans(const std::filesystem::path& root,
                                     std::chrono::seconds min_age,
                                     Logger* logger = nullptr);

private:
  void close_fd();

  int fd_ = -1;
  std::filesystem::path destination_;
  std::filesystem::path temp_path_;
  Sha256Stream hash_;
  uint64_t bytes_ = 0;
  std::string fingerprint_;
};
