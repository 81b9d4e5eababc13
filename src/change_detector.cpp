#include "change_detector.hpp"

#include <algorithm>
#include <thread>
#include <unordered_set>

#include "log.hpp"
#include "media_patterns.hpp"
#include "utils.hpp"

ChangeDetector::ChangeDetector(std::shared_ptr<FileIndex> index,
                               ScanOptions options,
                               std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    index_(index ? std::move(index) : std::make_shared<FileIndex>()),
    logger_(std::move(logger)),
    hash_([](const std::filesystem::path& p){ return sha256_file(p); }),
    sleeper_([](std::chrono::milliseconds d){ std::this_thread::sleep_for(d); }) {
  for(const auto& pattern : default_exclude_patterns()) {
    if(std::find(options_.exclude_patterns.begin(), options_.exclude_patterns.end(), pattern) ==
       options_.exclude_patterns.end()) {
      options_.exclude_patterns.push_back(pattern);
    }
  }
}

std::vector<std::string> ChangeDetector::default_exclude_patterns() {
  return {
    ".efsync-tmp-*",
    "*.partial",
    "*.tmp",
    "*.part",
    ".DS_Store",
    "._*",
    ".Spotlight-V100",
    ".Trashes",
    ".fseventsd",
    "Thumbs.db",
    "desktop.ini",
    "$RECYCLE.BIN",
    "System Volume Information",
  };
}

void ChangeDetector::set_hash_function(HashFunction hash) {
  if(hash) hash_ = std::move(hash);
}

void ChangeDetector::set_sleeper(Sleeper sleeper) {
  if(sleeper) sleeper_ = std::move(sleeper);
}

bool ChangeDetector::is_excluded(const std::string& relative_path) const {
  return matches_any_component(options_.exclude_patterns, relative_path);
}

std::vector<ChangeDetector::Candidate> ChangeDetector::walk(const std::filesystem::path& root,
                                                             std::vector<std::string>& seen,
                                                             ScanReport& report) const {
  namespace fs = std::filesystem;
  std::vector<Candidate> candidates;

  const auto dir_options = fs::directory_options::skip_permission_denied;
  std::vector<fs::path> pending{root};
  bool at_root = true;

  while(!pending.empty()) {
    auto dir = std::move(pending.back());
    pending.pop_back();
    if(!at_root && descend_hook_) descend_hook_(dir);

    std::error_code ec;
    fs::directory_iterator it(dir, dir_options, ec);
    if(ec) {
      if(at_root) {
        log_warn(logger_.get(), "scan: cannot open {}: {}", root.string(), ec.message());
        report.complete = false;
        return candidates;
      }
      if(ec == std::errc::no_such_file_or_directory) {
        // removed while the walk was running; its files are gone too
        log_debug(logger_.get(), "scan: {} vanished during the walk", dir.string());
      } else {
        log_warn(logger_.get(), "scan: skipping directory {}: {}", dir.string(), ec.message());
        report.complete = false;
      }
      continue;
    }
    at_root = false;

    for(fs::directory_iterator end; it != end; it.increment(ec)) {
      const auto& entry = *it;
      auto relative = entry.path().lexically_relative(root).generic_string();
      if(!is_valid_utf8(relative)) {
        ++report.unreadable;
        log_warn(logger_.get(), "scan: skipping {}: name is not valid UTF-8", entry.path().string());
        continue;
      }
      std::error_code status_ec;
      if(entry.is_directory(status_ec)) {
        if(is_excluded(relative)) continue;
        if(!options_.follow_symlinks && entry.is_symlink(status_ec)) continue;
        pending.push_back(entry.path());
      } else if(entry.is_regular_file(status_ec) && !is_excluded(relative)) {
        auto st = stat_path(entry.path());
        if(st && st->regular) { // vanished between listing and stat means not present
          seen.push_back(relative);
          ++report.examined;

          Candidate c;
          c.relative_path = relative;
          c.absolute_path = entry.path();
          c.size = st->size;
          c.mtime_ns = st->mtime_ns;
          c.previous = index_->get(relative);
          candidates.push_back(std::move(c));
        }
      }
    }
    if(ec) {
      log_warn(logger_.get(), "scan: listing of {} ended early: {}", dir.string(), ec.message());
      report.complete = false;
    }
  }
  return candidates;
}

ScanReport ChangeDetector::scan(const std::filesystem::path& root, std::optional<int64_t> since_ns) {
  ScanReport report;
  std::vector<std::string> seen;
  auto candidates = walk(root, seen, report);

  std::vector<Candidate*> to_hash;
  for(auto& c : candidates) {
    if(c.previous && c.previous->size == c.size && c.previous->mtime_ns == c.mtime_ns) {
      continue;
    }
    if(since_ns && c.mtime_ns < *since_ns) continue;
    to_hash.push_back(&c);
  }

  // Stability check: files still being written change size or mtime between the two probes.
  if(!to_hash.empty() && options_.stability_delay.count() > 0) {
    sleeper_(options_.stability_delay);
    std::vector<Candidate*> stable;
    stable.reserve(to_hash.size());
    for(auto* c : to_hash) {
      auto st = stat_path(c->absolute_path);
      if(!st) continue; // vanished
      if(st->size != c->size || st->mtime_ns != c->mtime_ns) {
        ++report.unstable;
        log_debug(logger_.get(), "scan: {} is still changing, deferring", c->relative_path);
        continue;
      }
      stable.push_back(c);
    }
    to_hash.swap(stable);
  }

  for(auto* c : to_hash) {
    auto fingerprint = hash_(c->absolute_path);
    ++report.hashed;
    if(!fingerprint) {
      std::error_code ec;
      if(!std::filesystem::exists(c->absolute_path, ec)) continue;
      ++report.unreadable;
      log_warn(logger_.get(), "scan: unable to read {}, skipping", c->absolute_path.string());
      continue;
    }

    FileRecord record;
    record.relative_path = c->relative_path;
    record.absolute_path = c->absolute_path;
    record.size = c->size;
    record.mtime_ns = c->mtime_ns;
    record.fingerprint = *fingerprint;
    record.version = parse_version_tag(c->absolute_path.filename().string());

    bool changed = !c->previous || !c->previous->same_content(record);
    index_->put(record);
    if(changed) report.changed.push_back(std::move(record));
  }

  std::unordered_set<std::string> seen_set(seen.begin(), seen.end());
  for(const auto& known : report.complete ? index_->paths() : std::vector<std::string>{}) {
    if(seen_set.count(known)) continue;
    index_->erase(known);
    report.removed.push_back(known);
  }

  std::sort(report.changed.begin(), report.changed.end(),
            [](const FileRecord& a, const FileRecord& b){ return a.relative_path < b.relative_path; });
  std::sort(report.removed.begin(), report.removed.end());

  log_debug(logger_.get(), "scan {}: examined={} hashed={} changed={} removed={}",
            root.string(), report.examined, report.hashed, report.changed.size(), report.removed.size());
  return report;
}

std::vector<FileRecord> ChangeDetector::full_manifest(const std::filesystem::path& root) {
  scan(root);
  return index_->list();
}
