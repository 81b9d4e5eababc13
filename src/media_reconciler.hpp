#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "retry_policy.hpp"
#include "sync_types.hpp"
#include "transfer_engine.hpp"

class Logger;

struct MediaOptions {
  std::string marker_file = "EFIS_DRIVE.txt";
  std::vector<std::string> secondary_markers{"NAV.DB", "DEMO", "SNAP"};
  std::size_t min_secondary_markers = 2;
  std::string inject_dir = "updates";
  std::string demo_dir = "demo";
  std::string logbook_dir = "logbook";
  std::vector<std::string> exclude_patterns;
};

struct VolumeSpace {
  uint64_t capacity = 0;
  uint64_t available = 0;
};

// Decides whether a mount belongs to this system and what to move on or off it.
// Identification looks only at marker files on the volume, never at labels
// or mount names.
class MediaReconciler {
public:
  using SpaceProbe = std::function<std::optional<VolumeSpace>(const std::filesystem::path&)>;

  explicit MediaReconciler(MediaOptions options, std::shared_ptr<Logger> logger = nullptr);

  // nullopt when the mount is missing or carries no markers.
  std::optional<ManagedVolume> identify(const std::filesystem::path& mount_path);
  Result<ReconcilePlan> reconcile(const ManagedVolume& volume, const std::filesystem::path& archive_root);

  // Extract tasks first, then inject tasks unless the plan carries a capacity error.
  std::vector<TransferTask> plan_tasks(const ReconcilePlan& plan) const;

  void set_space_probe(SpaceProbe probe);
  const SpaceProbe& space_probe() const { return space_probe_; }
  const MediaOptions& options() const { return options_; }

private:
  std::string logical_id(const std::filesystem::path& mount_path,
                         const std::vector<std::string>& markers,
                         uint64_t capacity) const;
  std::vector<FileRecord> list_files(const std::filesystem::path& root, bool volume) const;

  MediaOptions options_;
  std::shared_ptr<Logger> logger_;
  SpaceProbe space_probe_;
};

struct ReconcileReport {
  std::string volume_id;
  std::filesystem::path mount_path;
  std::size_t extracted = 0;
  std::size_t injected = 0;
  std::size_t unchanged = 0;
  std::size_t pending = 0;     // left for the next insertion (retry budget or abort)
  uint64_t bytes = 0;
  std::vector<SyncError> errors;
  bool aborted = false;
  bool capacity_refused = false;
  std::chrono::milliseconds duration{0};
};

nlohmann::json reconcile_report_to_json(const ReconcileReport& report);

// Exclusive hold on one volume for the lifetime of the object.
class VolumeLock {
public:
  explicit VolumeLock(std::string key);
  ~VolumeLock();

  VolumeLock(const VolumeLock&) = delete;
  VolumeLock& operator=(const VolumeLock&) = delete;

  bool owns() const { return owns_; }

private:
  std::string key_;
  bool owns_ = false;
};

// Executes one plan against one volume through a session-scoped queue and a
// single worker. Volume removal stops the session; what is left stays on the
// volume for the next insertion.
class ReconcileSession {
public:
  using TaskRunner = std::function<Result<TransferOutcome>(TransferTask&)>;
  using TaskObserver = std::function<void(const TransferTask&, const Result<TransferOutcome>&, TaskState)>;
  using SpaceProbe = MediaReconciler::SpaceProbe;

  ReconcileSession(ManagedVolume volume,
                   ReconcilePlan plan,
                   TaskRunner runner,
                   const RetryPolicy& retry,
                   uint32_t attempt_ceiling,
                   std::shared_ptr<Logger> logger = nullptr);

  // LockContention when another session holds the volume.
  Result<ReconcileReport> run();
  void cancel() { cancelled_ = true; }
  void set_observer(TaskObserver observer) { observer_ = std::move(observer); }
  void set_space_probe(SpaceProbe probe);

private:
  ManagedVolume volume_;
  ReconcilePlan plan_;
  TaskRunner runner_;
  const RetryPolicy& retry_;
  uint32_t attempt_ceiling_;
  std::shared_ptr<Logger> logger_;
  TaskObserver observer_;
  SpaceProbe space_probe_;
  std::atomic<bool> cancelled_{false};
};
