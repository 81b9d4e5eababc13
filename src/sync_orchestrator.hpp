#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "change_detector.hpp"
#include "connection_manager.hpp"
#include "event_channel.hpp"
#include "event_sink.hpp"
#include "media_reconciler.hpp"
#include "operation_queue.hpp"
#include "queue_drainer.hpp"
#include "remote_transport.hpp"
#include "retry_policy.hpp"
#include "sync_config.hpp"
#include "transfer_engine.hpp"

class Logger;

enum class OrchestratorState {
  Idle,
  Scanning,
  Queuing,
  Draining,
  Stopped
};

const char* to_string(OrchestratorState state);

struct StatusSnapshot {
  OrchestratorState state = OrchestratorState::Stopped;
  bool running = false;
  std::string direction;
  std::optional<Endpoint> endpoint;
  Reachability reachability = Reachability::Unknown;
  std::optional<std::chrono::milliseconds> latency;
  std::size_t queue_depth = 0;
  std::size_t queued = 0;
  std::size_t in_flight = 0;
  std::size_t dead = 0;
  std::size_t pending_remote = 0;
  std::optional<std::chrono::milliseconds> oldest_task_age;
  uint64_t cycles = 0;
  std::optional<SyncResult> last_result;
  std::optional<std::string> active_volume;
  std::optional<ReconcileReport> last_volume_report;

  nlohmann::json to_json() const;
};

// Ties scanning, queuing, draining and media reconciliation together.
//
// Threads: an io thread runs the cycle and probe timers, a control thread
// consumes the event channel (ticks, drain requests, volume notifications)
// and runs cycles one at a time, and a media thread runs reconcile sessions
// one volume at a time.
class SyncOrchestrator {
public:
  SyncOrchestrator(SyncConfig config,
                   std::shared_ptr<Logger> logger = nullptr,
                   std::shared_ptr<EventSink> events = nullptr,
                   std::shared_ptr<RemoteTransport> remote = nullptr);
  ~SyncOrchestrator();

  SyncOrchestrator(const SyncOrchestrator&) = delete;
  SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

  // Opens the queue and the detector table and removes orphaned temporary
  // files. start() calls it when needed.
  Result<void> open();

  Result<void> start();
  // In-flight transfers finish; nothing new is dequeued.
  void stop();
  // Blocks until stop().
  void run();

  StatusSnapshot status_snapshot() const;

  void trigger_cycle();
  void notify_volume_inserted(const std::filesystem::path& mount_path);
  void notify_volume_removed(const std::filesystem::path& mount_path);

  // Synchronous versions of what the threads do.
  SyncResult run_cycle();
  SyncResult drain_pending();
  // nullopt when the mount is not a managed volume.
  std::optional<ReconcileReport> reconcile_volume(const std::filesystem::path& mount_path);

  std::vector<SyncResult> results() const;
  std::vector<TransferTask> dead_tasks() const;
  Result<void> retry_dead(const std::string& id);

  std::shared_ptr<ConnectionManager> connections() const { return connections_; }
  OperationQueue& queue() { return *queue_; }
  MediaReconciler& media() { return media_; }
  RetryPolicy& retry() { return *retry_; }
  const SyncConfig& config() const { return config_; }

private:
  struct ControlEvent {
    enum class Kind { Tick, Drain, VolumeInserted, VolumeRemoved };
    Kind kind = Kind::Tick;
    std::filesystem::path mount;
  };

  void control_loop();
  void media_loop();
  void schedule_cycle_tick();
  void schedule_probe_tick();
  void on_reachability(const Endpoint& endpoint, Reachability from, Reachability to);

  bool collect_push_tasks(SyncResult& result, std::vector<TransferTask>& tasks);
  bool collect_pull_tasks(SyncResult& result, std::vector<TransferTask>& tasks);
  void drain_into(SyncResult& result);
  void finish_result(SyncResult& result, std::chrono::steady_clock::time_point start);
  void surface_evicted(SyncResult& result);
  void on_task_finished(const TransferTask& task, const Result<TransferOutcome>& result, TaskState state);
  void set_state(OrchestratorState state);
  void emit(SyncEvent event);
  bool endpoint_usable();

  SyncConfig config_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<EventSink> events_;
  std::shared_ptr<ConnectionManager> connections_;
  std::shared_ptr<RemoteTransport> remote_;
  std::unique_ptr<RetryPolicy> retry_;
  std::unique_ptr<OperationQueue> queue_;
  std::shared_ptr<FileIndex> index_;
  std::unique_ptr<ChangeDetector> detector_;
  std::unique_ptr<TransferEngine> engine_;
  MediaReconciler media_;
  ConnectionManager::ListenerHandle listener_ = 0;

  std::mutex cycle_mutex_; // one cycle or drain at a time
  mutable std::mutex state_mutex_;
  OrchestratorState state_ = OrchestratorState::Stopped;
  uint64_t cycle_counter_ = 0;
  std::deque<SyncResult> history_;
  std::optional<ReconcileReport> last_volume_report_;

  mutable std::mutex session_mutex_;
  ReconcileSession* active_session_ = nullptr;
  std::filesystem::path active_mount_;

  EventChannel<ControlEvent> control_;
  EventChannel<std::filesystem::path> media_events_;

  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::unique_ptr<asio::steady_timer> cycle_timer_;
  std::unique_ptr<asio::steady_timer> probe_timer_;
  std::thread io_thread_;
  std::thread control_thread_;
  std::thread media_thread_;

  std::atomic<bool> opened_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::mutex run_mutex_;
  std::condition_variable run_cv_;
};
