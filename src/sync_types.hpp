#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"

// One tracked file. Compared by fingerprint + size, never by timestamp.
struct FileRecord {
  std::string relative_path; // generic form, '/' separated
  std::filesystem::path absolute_path;
  uint64_t size = 0;
  std::string fingerprint; // sha256 hex
  int64_t mtime_ns = 0;
  std::optional<std::string> version;

  bool same_content(const FileRecord& other) const {
    return size == other.size && fingerprint == other.fingerprint;
  }
};

enum class TaskKind {
  Push,
  Pull,
  CopyToMedia,
  ExtractFromMedia
};

enum class TaskState {
  Created,
  Queued,
  InFlight,
  Succeeded,
  Failed,
  Dead
};

const char* to_string(TaskKind kind);
const char* to_string(TaskState state);
std::optional<TaskKind> task_kind_from_string(const std::string& name);
std::optional<TaskState> task_state_from_string(const std::string& name);
inline bool is_remote_kind(TaskKind kind) { return kind == TaskKind::Push || kind == TaskKind::Pull; }

struct TransferTask {
  std::string id;
  uint64_t seq = 0;
  TaskKind kind = TaskKind::Push;
  FileRecord source;
  std::string destination; // remote relative path or absolute local target
  std::string volume_root; // set for media tasks
  uint32_t attempts = 0;
  std::optional<SyncError> last_error;
  int64_t enqueued_at_ms = 0;
  int64_t not_before_ms = 0;
  TaskState state = TaskState::Created;

  // Tasks sharing this key are processed strictly in enqueue order.
  std::string ordering_key() const;
};

enum class SyncStatus {
  Success,
  Partial,
  Failed
};

const char* to_string(SyncStatus status);

struct SyncResult {
  uint64_t cycle = 0;
  std::chrono::system_clock::time_point started_at{};
  std::size_t files_transferred = 0;
  uint64_t bytes_transferred = 0;
  std::vector<SyncError> errors;
  std::chrono::milliseconds duration{0};
  SyncStatus status = SyncStatus::Success;
  std::size_t tasks_enqueued = 0;
  std::size_t dead_tasks = 0;
  std::size_t deferred_tasks = 0;
};

struct ManagedVolume {
  std::filesystem::path mount_path;
  std::string logical_id;
  uint64_t capacity_bytes = 0;
  uint64_t free_bytes = 0;
  std::vector<std::string> markers;
  std::vector<FileRecord> files;
};

enum class MediaCategory {
  None,
  FlightLog,
  Snapshot,
  Logbook
};

const char* to_string(MediaCategory category);

struct PlannedExtract {
  FileRecord source;
  std::filesystem::path destination;
  MediaCategory category = MediaCategory::None;
  bool already_archived = false; // identical copy exists, only the volume copy is removed
};

struct PlannedInject {
  FileRecord source;
  std::filesystem::path destination;
  bool replaces_existing = false;
};

struct ReconcilePlan {
  std::string volume_id;
  std::filesystem::path mount_path;
  std::vector<PlannedExtract> extracts;
  std::vector<PlannedInject> injects;
  std::vector<std::string> unchanged;
  uint64_t extract_bytes = 0;
  uint64_t inject_bytes = 0;
  uint64_t free_bytes = 0;
  std::optional<SyncError> capacity_error;

  bool empty() const { return extracts.empty() && injects.empty(); }
};

nlohmann::json file_record_to_json(const FileRecord& record);
FileRecord file_record_from_json(const nlohmann::json& doc);
nlohmann::json sync_result_to_json(const SyncResult& result);
nlohmann::json reconcile_plan_to_json(const ReconcilePlan& plan);

int64_t now_epoch_ms();
