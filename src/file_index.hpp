#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "errors.hpp"
#include "state_db.hpp"
#include "sync_types.hpp"

// Last-known FileRecord per relative path, stored in a sqlite `files` table.
// Changes stay in memory until save(). An empty storage path keeps it in memory only.
class FileIndex {
public:
  FileIndex() = default;
  explicit FileIndex(std::filesystem::path storage, bool sync_writes = true);

  std::optional<FileRecord> get(const std::string& relative_path) const;
  void put(const FileRecord& record);
  bool erase(const std::string& relative_path);
  void clear();

  std::vector<FileRecord> list() const;
  std::vector<std::string> paths() const;
  std::size_t size() const;
  bool dirty() const;

  Result<void> load();
  Result<void> save();

  const std::filesystem::path& storage_path() const { return storage_; }

private:
  Result<void> open_locked();

  mutable std::mutex m_;
  std::unordered_map<std::string, FileRecord> map_;
  std::set<std::string> changed_; // put or erased since the last save
  bool cleared_ = false;
  std::filesystem::path storage_;
  bool sync_writes_ = true;
  StateDatabase db_;
};
