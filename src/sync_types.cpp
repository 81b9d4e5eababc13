#include "sync_types.hpp"

#include <utility>

namespace {

template<typename Enum, std::size_t N>
std::optional<Enum> lookup(const std::pair<Enum, const char*> (&table)[N], const std::string& name) {
  for(const auto& entry : table) {
    if(name == entry.second) return entry.first;
  }
  return std::nullopt;
}

template<typename Enum, std::size_t N>
const char* name_of(const std::pair<Enum, const char*> (&table)[N], Enum value) {
  for(const auto& entry : table) {
    if(entry.first == value) return entry.second;
  }
  return "unknown";
}

const std::pair<TaskKind, const char*> kTaskKinds[] = {
  {TaskKind::Push, "push"},
  {TaskKind::Pull, "pull"},
  {TaskKind::CopyToMedia, "copy_to_media"},
  {TaskKind::ExtractFromMedia, "extract_from_media"},
};

const std::pair<TaskState, const char*> kTaskStates[] = {
  {TaskState::Created, "created"},
  {TaskState::Queued, "queued"},
  {TaskState::InFlight, "in_flight"},
  {TaskState::Succeeded, "succeeded"},
  {TaskState::Failed, "failed"},
  {TaskState::Dead, "dead"},
};

} // namespace

const char* to_string(TaskKind kind) { return name_of(kTaskKinds, kind); }
const char* to_string(TaskState state) { return name_of(kTaskStates, state); }

std::optional<TaskKind> task_kind_from_string(const std::string& name) {
  return lookup(kTaskKinds, name);
}

std::optional<TaskState> task_state_from_string(const std::string& name) {
  return lookup(kTaskStates, name);
}

const char* to_string(SyncStatus status) {
  switch(status) {
    case SyncStatus::Success: return "SUCCESS";
    case SyncStatus::Partial: return "PARTIAL";
    case SyncStatus::Failed: return "FAILED";
  }
  return "UNKNOWN";
}

const char* to_string(MediaCategory category) {
  switch(category) {
    case MediaCategory::None: return "none";
    case MediaCategory::FlightLog: return "flight_log";
    case MediaCategory::Snapshot: return "snapshot";
    case MediaCategory::Logbook: return "logbook";
  }
  return "unknown";
}

std::string TransferTask::ordering_key() const {
  if(!source.absolute_path.empty()) {
    return source.absolute_path.generic_string();
  }
  return std::string(to_string(kind)) + ":" + source.relative_path;
}

int64_t now_epoch_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
}

nlohmann::json file_record_to_json(const FileRecord& record) {
  nlohmann::json j;
  j["path"] = record.relative_path;
  if(!record.absolute_path.empty()) {
    j["absolute_path"] = record.absolute_path.string();
  }
  j["size"] = record.size;
  j["fingerprint"] = record.fingerprint;
  j["mtime_ns"] = record.mtime_ns;
  if(record.version) j["version"] = *record.version;
  return j;
}

FileRecord file_record_from_json(const nlohmann::json& doc) {
  FileRecord record;
  record.relative_path = doc.value("path", std::string());
  record.absolute_path = doc.value("absolute_path", std::string());
  record.size = doc.value("size", uint64_t{0});
  record.fingerprint = doc.value("fingerprint", std::string());
  record.mtime_ns = doc.value("mtime_ns", int64_t{0});
  if(doc.contains("version") && doc["version"].is_string()) {
    record.version = doc["version"].get<std::string>();
  }
  return record;
}

nlohmann::json sync_result_to_json(const SyncResult& result) {
  nlohmann::json j;
  j["cycle"] = result.cycle;
  j["started_at_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
    result.started_at.time_since_epoch()).count();
  j["files_transferred"] = result.files_transferred;
  j["bytes_transferred"] = result.bytes_transferred;
  j["duration_ms"] = result.duration.count();
  j["status"] = to_string(result.status);
  j["tasks_enqueued"] = result.tasks_enqueued;
  j["dead_tasks"] = result.dead_tasks;
  j["deferred_tasks"] = result.deferred_tasks;
  auto errors = nlohmann::json::array();
  for(const auto& error : result.errors) {
    errors.push_back(sync_error_to_json(error));
  }
  j["errors"] = std::move(errors);
  return j;
}

nlohmann::json reconcile_plan_to_json(const ReconcilePlan& plan) {
  nlohmann::json j;
  j["volume_id"] = plan.volume_id;
  j["mount_path"] = plan.mount_path.string();
  auto extracts = nlohmann::json::array();
  for(const auto& extract : plan.extracts) {
    extracts.push_back({
      {"path", extract.source.relative_path},
      {"destination", extract.destination.string()},
      {"category", to_string(extract.category)},
      {"size", extract.source.size},
      {"already_archived", extract.already_archived}
    });
  }
  auto injects = nlohmann::json::array();
  for(const auto& inject : plan.injects) {
    injects.push_back({
      {"path", inject.source.relative_path},
      {"destination", inject.destination.string()},
      {"size", inject.source.size},
      {"replaces_existing", inject.replaces_existing}
    });
  }
  j["extracts"] = std::move(extracts);
  j["injects"] = std::move(injects);
  j["unchanged"] = plan.unchanged;
  j["extract_bytes"] = plan.extract_bytes;
  j["inject_bytes"] = plan.inject_bytes;
  j["free_bytes"] = plan.free_bytes;
  if(plan.capacity_error) j["capacity_error"] = sync_error_to_json(*plan.capacity_error);
  return j;
}
