#include "media_reconciler.hpp"

#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <sstream>

#include "change_detector.hpp"
#include "log.hpp"
#include "media_patterns.hpp"
#include "operation_queue.hpp"
#include "queue_drainer.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kMaxMarkerBytes = 64 * 1024;

std::optional<VolumeSpace> filesystem_space(const std::filesystem::path& mount) {
  std::error_code ec;
  auto info = std::filesystem::space(mount, ec);
  if(ec) return std::nullopt;
  return VolumeSpace{info.capacity, info.available};
}

std::string read_head(const std::filesystem::path& file, std::size_t limit) {
  std::ifstream in(file, std::ios::binary);
  if(!in) return std::string();
  std::string content(limit, '\0');
  in.read(content.data(), static_cast<std::streamsize>(limit));
  content.resize(static_cast<std::size_t>(in.gcount()));
  return content;
}

// Next free name: name_1.ext, name_2.ext, ...
std::filesystem::path with_suffix(const std::filesystem::path& path, int n) {
  auto stem = path.stem().string();
  auto ext = path.extension().string();
  return path.parent_path() / (stem + "_" + std::to_string(n) + ext);
}

std::mutex& lock_registry_mutex() {
  static std::mutex m;
  return m;
}

std::set<std::string>& lock_registry() {
  static std::set<std::string> held;
  return held;
}

} // namespace

VolumeLock::VolumeLock(std::string key) : key_(std::move(key)) {
  std::lock_guard<std::mutex> lock(lock_registry_mutex());
  owns_ = lock_registry().insert(key_).second;
}

VolumeLock::~VolumeLock() {
  if(!owns_) return;
  std::lock_guard<std::mutex> lock(lock_registry_mutex());
  lock_registry().erase(key_);
}

MediaReconciler::MediaReconciler(MediaOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(std::move(logger)),
    space_probe_(&filesystem_space) {}

void MediaReconciler::set_space_probe(SpaceProbe probe) {
  space_probe_ = probe ? std::move(probe) : SpaceProbe(&filesystem_space);
}

std::vector<FileRecord> MediaReconciler::list_files(const std::filesystem::path& root, bool volume) const {
  ScanOptions scan;
  scan.exclude_patterns = options_.exclude_patterns;
  scan.stability_delay = std::chrono::milliseconds(0);
  if(volume) {
    // hidden files on the device are left alone
    scan.exclude_patterns.push_back(".*");
  }
  ChangeDetector detector(std::make_shared<FileIndex>(), scan, logger_);
  return detector.full_manifest(root);
}

std::string MediaReconciler::logical_id(const std::filesystem::path& mount_path,
                                        const std::vector<std::string>& markers,
                                        uint64_t capacity) const {
  auto marker = mount_path / options_.marker_file;
  auto st = stat_path(marker);
  if(st && st->regular) {
    auto content = read_head(marker, kMaxMarkerBytes);
    std::istringstream lines(content);
    std::string line;
    while(std::getline(lines, line)) {
      line = trim_copy(line);
      if(line.size() > 3 && to_lower_copy(line.substr(0, 3)) == "id=") {
        auto value = trim_copy(line.substr(3));
        if(!value.empty()) return value;
      }
    }
    if(!trim_copy(content).empty()) return sha256_hex(content).substr(0, 16);
  }
  auto sorted = markers;
  std::sort(sorted.begin(), sorted.end());
  std::string basis;
  for(const auto& m : sorted) basis += m + "\n";
  basis += std::to_string(capacity);
  return sha256_hex(basis).substr(0, 16);
}

std::optional<ManagedVolume> MediaReconciler::identify(const std::filesystem::path& mount_path) {
  std::error_code ec;
  if(!std::filesystem::is_directory(mount_path, ec)) {
    log_debug(logger_.get(), "media: {} is not a mounted directory", mount_path.string());
    return std::nullopt;
  }

  ManagedVolume volume;
  volume.mount_path = mount_path;
  bool primary = false;
  auto marker = stat_path(mount_path / options_.marker_file);
  if(marker && marker->regular) {
    primary = true;
    volume.markers.push_back(options_.marker_file);
  }
  std::size_t secondary = 0;
  for(const auto& name : options_.secondary_markers) {
    if(std::filesystem::exists(mount_path / name, ec)) {
      ++secondary;
      volume.markers.push_back(name);
    }
  }
  if(!primary && secondary < options_.min_secondary_markers) {
    log_debug(logger_.get(), "media: {} is not a managed volume ({} marker(s))", mount_path.string(), secondary);
    return std::nullopt;
  }

  if(auto space = space_probe_(mount_path)) {
    volume.capacity_bytes = space->capacity;
    volume.free_bytes = space->available;
  } else {
    log_warn(logger_.get(), "media: cannot read free space of {}", mount_path.string());
  }
  volume.logical_id = logical_id(mount_path, volume.markers, volume.capacity_bytes);
  volume.files = list_files(mount_path, true);
  log_info(logger_.get(), "media: managed volume {} at {} ({} files, {} free)", volume.logical_id,
           mount_path.string(), volume.files.size(), format_size(volume.free_bytes));
  return volume;
}

Result<ReconcilePlan> MediaReconciler::reconcile(const ManagedVolume& volume,
                                                 const std::filesystem::path& archive_root) {
  std::error_code ec;
  if(!std::filesystem::is_directory(archive_root, ec)) {
    return Result<ReconcilePlan>::Error(make_error(ErrorKind::ArchiveInaccessible,
                                                   "archive root is not accessible", archive_root.string()));
  }

  ReconcilePlan plan;
  plan.volume_id = volume.logical_id;
  plan.mount_path = volume.mount_path;
  plan.free_bytes = volume.free_bytes;

  std::vector<FileRecord> inject_sources;
  auto inject_root = archive_root / options_.inject_dir;
  if(std::filesystem::is_directory(inject_root, ec)) {
    inject_sources = list_files(inject_root, false);
  }
  std::set<std::string> inject_targets;
  for(const auto& record : inject_sources) inject_targets.insert(record.relative_path);

  std::map<std::string, const FileRecord*> on_volume;
  for(const auto& record : volume.files) on_volume[record.relative_path] = &record;

  MediaLayout layout;
  layout.demo_dir = options_.demo_dir;
  layout.logbook_dir = options_.logbook_dir;

  std::set<std::filesystem::path> planned_destinations;
  for(const auto& record : volume.files) {
    if(inject_targets.count(record.relative_path)) continue;
    auto rule = classify_media_file(record, layout);
    if(!rule) continue;

    PlannedExtract extract;
    extract.source = record;
    extract.category = rule->category;
    auto base = archive_root / rule->archive_relative;
    auto candidate = base;
    for(int n = 1; ; ++n) {
      if(planned_destinations.count(candidate) == 0) {
        auto existing = stat_path(candidate);
        if(!existing) break;
        if(existing->regular && existing->size == record.size) {
          auto fingerprint = sha256_file(candidate);
          if(fingerprint && *fingerprint == record.fingerprint) {
            extract.already_archived = true;
            break;
          }
        }
      }
      candidate = with_suffix(base, n);
    }
    extract.destination = candidate;
    planned_destinations.insert(candidate);
    plan.extract_bytes += record.size;
    plan.extracts.push_back(std::move(extract));
  }

  for(const auto& source : inject_sources) {
    auto it = on_volume.find(source.relative_path);
    const FileRecord* present = it != on_volume.end() ? it->second : nullptr;
    std::optional<FileRecord> unlisted;
    if(!present) {
      // hidden and excluded names are not in the volume listing
      auto target = volume.mount_path / std::filesystem::path(source.relative_path);
      auto st = stat_path(target);
      if(st && st->regular) {
        unlisted = FileRecord{};
        unlisted->relative_path = source.relative_path;
        unlisted->absolute_path = target;
        unlisted->size = st->size;
        unlisted->mtime_ns = st->mtime_ns;
        if(st->size == source.size) unlisted->fingerprint = sha256_file(target).value_or(std::string());
        present = &*unlisted;
      }
    }
    if(present && present->same_content(source)) {
      plan.unchanged.push_back(source.relative_path);
      continue;
    }
    if(source.version) {
      const auto stem = artifact_stem(std::filesystem::path(source.relative_path).filename().string());
      const auto parent = std::filesystem::path(source.relative_path).parent_path();
      const FileRecord* newer = nullptr;
      for(const auto& present : volume.files) {
        if(!present.version) continue;
        std::filesystem::path present_path(present.relative_path);
        if(present_path.parent_path() != parent) continue;
        if(artifact_stem(present_path.filename().string()) != stem) continue;
        if(compare_versions(*present.version, *source.version) > 0) {
          newer = &present;
          break;
        }
      }
      if(newer) {
        log_info(logger_.get(), "media: not replacing {} {} with older {}", newer->relative_path,
                 *newer->version, *source.version);
        plan.unchanged.push_back(source.relative_path);
        continue;
      }
    }
    PlannedInject inject;
    inject.source = source;
    inject.destination = volume.mount_path / std::filesystem::path(source.relative_path);
    inject.replaces_existing = present != nullptr;
    plan.inject_bytes += source.size;
    plan.injects.push_back(std::move(inject));
  }

  auto by_source = [](const auto& a, const auto& b){ return a.source.relative_path < b.source.relative_path; };
  std::sort(plan.extracts.begin(), plan.extracts.end(), by_source);
  std::sort(plan.injects.begin(), plan.injects.end(), by_source);

  if(!plan.injects.empty()) {
    const uint64_t usable = volume.free_bytes + plan.extract_bytes;
    if(plan.inject_bytes > usable) {
      plan.capacity_error = make_error(ErrorKind::CapacityExceeded,
                                       "injects need " + format_size(plan.inject_bytes) + ", only " +
                                       format_size(usable) + " usable after extracts",
                                       volume.mount_path.string());
    } else if(::access(volume.mount_path.c_str(), W_OK) != 0) {
      plan.capacity_error = make_error(ErrorKind::PermissionDenied, "volume is not writable",
                                       volume.mount_path.string());
    }
  }

  log_info(logger_.get(), "media: plan for {}: {} extract(s), {} inject(s), {} unchanged{}",
           plan.volume_id, plan.extracts.size(), plan.injects.size(), plan.unchanged.size(),
           plan.capacity_error ? " (injects refused: " + plan.capacity_error->message + ")" : std::string());
  return Result<ReconcilePlan>::Ok(std::move(plan));
}

std::vector<TransferTask> MediaReconciler::plan_tasks(const ReconcilePlan& plan) const {
  std::vector<TransferTask> tasks;
  for(const auto& extract : plan.extracts) {
    TransferTask task;
    task.kind = TaskKind::ExtractFromMedia;
    task.source = extract.source;
    task.destination = extract.destination.string();
    task.volume_root = plan.mount_path.string();
    tasks.push_back(std::move(task));
  }
  if(plan.capacity_error) return tasks;
  for(const auto& inject : plan.injects) {
    TransferTask task;
    task.kind = TaskKind::CopyToMedia;
    task.source = inject.source;
    task.destination = inject.destination.string();
    task.volume_root = plan.mount_path.string();
    tasks.push_back(std::move(task));
  }
  return tasks;
}

nlohmann::json reconcile_report_to_json(const ReconcileReport& report) {
  nlohmann::json j;
  j["volume_id"] = report.volume_id;
  j["mount_path"] = report.mount_path.string();
  j["extracted"] = report.extracted;
  j["injected"] = report.injected;
  j["unchanged"] = report.unchanged;
  j["pending"] = report.pending;
  j["bytes"] = report.bytes;
  j["aborted"] = report.aborted;
  j["capacity_refused"] = report.capacity_refused;
  j["duration_ms"] = report.duration.count();
  auto errors = nlohmann::json::array();
  for(const auto& error : report.errors) errors.push_back(sync_error_to_json(error));
  j["errors"] = std::move(errors);
  return j;
}

ReconcileSession::ReconcileSession(ManagedVolume volume,
                                   ReconcilePlan plan,
                                   TaskRunner runner,
                                   const RetryPolicy& retry,
                                   uint32_t attempt_ceiling,
                                   std::shared_ptr<Logger> logger)
  : volume_(std::move(volume)),
    plan_(std::move(plan)),
    runner_(std::move(runner)),
    retry_(retry),
    attempt_ceiling_(attempt_ceiling),
    logger_(std::move(logger)),
    space_probe_(&filesystem_space) {}

void ReconcileSession::set_space_probe(SpaceProbe probe) {
  space_probe_ = probe ? std::move(probe) : SpaceProbe(&filesystem_space);
}

Result<ReconcileReport> ReconcileSession::run() {
  using R = Result<ReconcileReport>;
  VolumeLock lock(volume_.logical_id);
  if(!lock.owns()) {
    return R::Error(make_error(ErrorKind::LockContention, "volume is busy with another session",
                               volume_.mount_path.string()));
  }

  auto start = std::chrono::steady_clock::now();
  ReconcileReport report;
  report.volume_id = volume_.logical_id;
  report.mount_path = volume_.mount_path;
  report.unchanged = plan_.unchanged.size();

  QueueOptions queue_options;
  queue_options.ceiling = plan_.extracts.size() + plan_.injects.size() + 1;
  queue_options.attempt_ceiling = attempt_ceiling_;
  OperationQueue queue(queue_options, logger_);
  auto opened = queue.open();
  if(!opened.success) return R::Error(opened.error);

  MediaReconciler planner(MediaOptions{}, logger_);
  std::vector<TransferTask> injects;
  for(auto& task : planner.plan_tasks(plan_)) {
    if(task.kind == TaskKind::CopyToMedia) {
      injects.push_back(std::move(task));
      continue;
    }
    auto queued = queue.enqueue(std::move(task));
    if(!queued.success) return R::Error(queued.error);
  }
  if(plan_.capacity_error) {
    report.capacity_refused = true;
    report.errors.push_back(*plan_.capacity_error);
  }

  std::atomic<bool> volume_gone{false};
  uint64_t freed_bytes = 0;
  DrainHooks hooks;
  hooks.should_stop = [&]{
    if(cancelled_.load() || volume_gone.load()) return true;
    std::error_code ec;
    if(!std::filesystem::is_directory(volume_.mount_path, ec)) {
      volume_gone = true;
      return true;
    }
    return false;
  };
  hooks.on_finished = [&](const TransferTask& task, const Result<TransferOutcome>& result, TaskState state){
    if(result.success) {
      if(task.kind == TaskKind::ExtractFromMedia) {
        ++report.extracted;
        freed_bytes += task.source.size;
      } else {
        ++report.injected;
      }
      report.bytes += result.data.bytes;
    } else if(result.error.kind == ErrorKind::VolumeRemoved) {
      volume_gone = true;
    }
    if(observer_) observer_(task, result, state);
  };

  bool healthy = true;
  auto drain = [&]{
    auto drained = run_queue_drain(queue, retry_, 1, runner_, hooks);
    for(const auto& error : drained.errors) report.errors.push_back(error);
    if(drained.fatal) {
      report.errors.push_back(*drained.fatal);
      healthy = false;
    }
  };

  // Extracts run first; injects only get the space they actually freed.
  drain();
  if(!injects.empty() && healthy && !volume_gone.load() && !cancelled_.load()) {
    uint64_t usable = plan_.free_bytes + freed_bytes;
    if(auto space = space_probe_(volume_.mount_path)) usable = std::min(usable, space->available);
    if(plan_.inject_bytes > usable) {
      auto refusal = make_error(ErrorKind::CapacityExceeded,
                                "injects need " + format_size(plan_.inject_bytes) + ", only " +
                                format_size(usable) + " free after extracts",
                                volume_.mount_path.string());
      log_warn(logger_.get(), "media: {}: {}", volume_.logical_id, refusal.message);
      report.capacity_refused = true;
      report.errors.push_back(std::move(refusal));
      injects.clear();
    } else {
      for(auto& task : injects) {
        auto queued = queue.enqueue(std::move(task));
        if(!queued.success) return R::Error(queued.error);
      }
      injects.clear();
      drain();
    }
  }

  report.pending = queue.depth() + injects.size();
  report.aborted = volume_gone.load() || cancelled_.load();
  if(report.aborted && report.pending > 0) {
    log_warn(logger_.get(), "media: session on {} aborted with {} task(s) left", volume_.logical_id, report.pending);
  }
  report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start);
  return R::Ok(std::move(report));
}
