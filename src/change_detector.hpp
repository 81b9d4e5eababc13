#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "file_index.hpp"
#include "sync_types.hpp"

class Logger;

struct ScanOptions {
  std::vector<std::string> exclude_patterns;
  std::chrono::milliseconds stability_delay{500};
  bool follow_symlinks = false;
};

struct ScanReport {
  std::vector<FileRecord> changed; // new, or fingerprint differs from the last scan
  std::vector<std::string> removed;
  std::size_t examined = 0;
  std::size_t hashed = 0;
  std::size_t unstable = 0;
  std::size_t unreadable = 0;
  bool complete = true; // false when the walk could not cover the whole tree
};

class ChangeDetector {
public:
  using HashFunction = std::function<std::optional<std::string>(const std::filesystem::path&)>;
  using Sleeper = std::function<void(std::chrono::milliseconds)>;
  // Called with each subdirectory just before it is opened.
  using DescendHook = std::function<void(const std::filesystem::path&)>;

  ChangeDetector(std::shared_ptr<FileIndex> index,
                 ScanOptions options,
                 std::shared_ptr<Logger> logger = nullptr);

  // Walks root and reports files newer than since_ns (unix epoch, nanoseconds).
  ScanReport scan(const std::filesystem::path& root, std::optional<int64_t> since_ns = std::nullopt);

  // Every current file under root, hashing only what changed since the last call.
  std::vector<FileRecord> full_manifest(const std::filesystem::path& root);

  bool is_excluded(const std::string& relative_path) const;

  void set_hash_function(HashFunction hash);
  void set_sleeper(Sleeper sleeper);
  void set_descend_hook(DescendHook hook) { descend_hook_ = std::move(hook); }

  std::shared_ptr<FileIndex> index() const { return index_; }
  const ScanOptions& options() const { return options_; }

  static std::vector<std::string> default_exclude_patterns();

private:
  struct Candidate {
    std::string relative_path;
    std::filesystem::path absolute_path;
    uint64_t size = 0;
    int64_t mtime_ns = 0;
    std::optional<FileRecord> previous;
  };

  std::vector<Candidate> walk(const std::filesystem::path& root,
                              std::vector<std::string>& seen,
                              ScanReport& report) const;

  ScanOptions options_;
  std::shared_ptr<FileIndex> index_;
  std::shared_ptr<Logger> logger_;
  HashFunction hash_;
  Sleeper sleeper_;
  DescendHook descend_hook_;
};
