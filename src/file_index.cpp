#include "file_index.hpp"

#include <algorithm>

FileIndex::FileIndex(std::filesystem::path storage, bool sync_writes)
  : storage_(std::move(storage)), sync_writes_(sync_writes) {}

std::optional<FileRecord> FileIndex::get(const std::string& relative_path) const {
  std::lock_guard lg(m_);
  auto it = map_.find(relative_path);
  if(it == map_.end()) return std::nullopt;
  return it->second;
}

void FileIndex::put(const FileRecord& record) {
  std::lock_guard lg(m_);
  map_[record.relative_path] = record;
  changed_.insert(record.relative_path);
}

bool FileIndex::erase(const std::string& relative_path) {
  std::lock_guard lg(m_);
  if(map_.erase(relative_path) == 0) return false;
  changed_.insert(relative_path);
  return true;
}

void FileIndex::clear() {
  std::lock_guard lg(m_);
  if(map_.empty()) return;
  map_.clear();
  changed_.clear();
  cleared_ = true;
}

std::vector<FileRecord> FileIndex::list() const {
  std::lock_guard lg(m_);
  std::vector<FileRecord> out;
  out.reserve(map_.size());
  for(const auto& p : map_) out.push_back(p.second);
  std::sort(out.begin(), out.end(),
            [](const FileRecord& a, const FileRecord& b){ return a.relative_path < b.relative_path; });
  return out;
}

std::vector<std::string> FileIndex::paths() const {
  std::lock_guard lg(m_);
  std::vector<std::string> out;
  out.reserve(map_.size());
  for(const auto& p : map_) out.push_back(p.first);
  return out;
}

std::size_t FileIndex::size() const {
  std::lock_guard lg(m_);
  return map_.size();
}

bool FileIndex::dirty() const {
  std::lock_guard lg(m_);
  return cleared_ || !changed_.empty();
}

Result<void> FileIndex::open_locked() {
  if(db_.is_open()) return Result<void>::Ok();
  auto opened = db_.open(storage_, sync_writes_);
  if(!opened.success) return opened;
  auto schema = db_.exec(
    "CREATE TABLE IF NOT EXISTS files ("
    " relative_path TEXT PRIMARY KEY,"
    " absolute_path TEXT NOT NULL,"
    " size INTEGER NOT NULL,"
    " fingerprint TEXT NOT NULL,"
    " mtime_ns INTEGER NOT NULL,"
    " version TEXT);");
  if(!schema.success) db_.close();
  return schema;
}

Result<void> FileIndex::load() {
  if(storage_.empty()) return Result<void>::Ok();
  std::lock_guard lg(m_);
  auto opened = open_locked();
  if(!opened.success) return opened;

  Statement rows(db_, "SELECT relative_path, absolute_path, size, fingerprint, mtime_ns, version FROM files");
  if(!rows.prepared()) return Result<void>::Error(db_.failure("cannot read file index"));
  std::unordered_map<std::string, FileRecord> loaded;
  int rc;
  while((rc = rows.step()) == SQLITE_ROW) {
    FileRecord record;
    record.relative_path = rows.column_text(0);
    record.absolute_path = rows.column_text(1);
    record.size = static_cast<uint64_t>(rows.column_int(2));
    record.fingerprint = rows.column_text(3);
    record.mtime_ns = rows.column_int(4);
    if(!rows.column_null(5)) record.version = rows.column_text(5);
    if(record.relative_path.empty()) continue;
    loaded[record.relative_path] = std::move(record);
  }
  if(rc != SQLITE_DONE) return Result<void>::Error(db_.failure("cannot read file index"));

  map_ = std::move(loaded);
  changed_.clear();
  cleared_ = false;
  return Result<void>::Ok();
}

Result<void> FileIndex::save() {
  std::lock_guard lg(m_);
  if(storage_.empty()) {
    changed_.clear();
    cleared_ = false;
    return Result<void>::Ok();
  }
  if(!cleared_ && changed_.empty()) return Result<void>::Ok();
  auto opened = open_locked();
  if(!opened.success) return opened;

  Transaction tx(db_);
  if(!tx.begun().success) return tx.begun();
  if(cleared_) {
    auto wiped = db_.exec("DELETE FROM files;");
    if(!wiped.success) return wiped;
  }
  for(const auto& path : changed_) {
    auto it = map_.find(path);
    if(it == map_.end()) {
      Statement remove(db_, "DELETE FROM files WHERE relative_path = ?");
      remove.bind_text(1, path);
      auto removed = remove.run("cannot delete index record");
      if(!removed.success) return removed;
      continue;
    }
    const auto& record = it->second;
    Statement upsert(db_,
      "INSERT OR REPLACE INTO files (relative_path, absolute_path, size, fingerprint, mtime_ns, version)"
      " VALUES (?, ?, ?, ?, ?, ?)");
    upsert.bind_text(1, record.relative_path);
    upsert.bind_text(2, record.absolute_path.string());
    upsert.bind_int(3, static_cast<int64_t>(record.size));
    upsert.bind_text(4, record.fingerprint);
    upsert.bind_int(5, record.mtime_ns);
    if(record.version) upsert.bind_text(6, *record.version);
    else upsert.bind_null(6);
    auto stored = upsert.run("cannot store index record");
    if(!stored.success) return stored;
  }
  auto committed = tx.commit();
  if(!committed.success) return committed;
  changed_.clear();
  cleared_ = false;
  return Result<void>::Ok();
}
