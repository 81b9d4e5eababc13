#include "sync_orchestrator.hpp"

#include <algorithm>
#include <map>

#include "atomic_writer.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {

constexpr std::chrono::milliseconds kChannelPoll{250};

nlohmann::json task_fields(const TransferTask& task) {
  return {
    {"id", task.id},
    {"kind", to_string(task.kind)},
    {"path", task.source.relative_path},
    {"destination", task.destination},
    {"attempts", task.attempts}
  };
}

} // namespace

const char* to_string(OrchestratorState state) {
  switch(state) {
    case OrchestratorState::Idle: return "IDLE";
    case OrchestratorState::Scanning: return "SCANNING";
    case OrchestratorState::Queuing: return "QUEUING";
    case OrchestratorState::Draining: return "DRAINING";
    case OrchestratorState::Stopped: return "STOPPED";
  }
  return "STOPPED";
}

nlohmann::json StatusSnapshot::to_json() const {
  nlohmann::json j;
  j["state"] = to_string(state);
  j["running"] = running;
  j["direction"] = direction;
  if(endpoint) {
    j["endpoint"] = endpoint->to_string();
    j["reachability"] = to_string(reachability);
    if(latency) j["latency_ms"] = latency->count();
  }
  j["queue"] = {
    {"depth", queue_depth},
    {"queued", queued},
    {"in_flight", in_flight},
    {"dead", dead},
    {"pending_remote", pending_remote}
  };
  if(oldest_task_age) j["queue"]["oldest_age_ms"] = oldest_task_age->count();
  j["cycles"] = cycles;
  if(last_result) j["last_result"] = sync_result_to_json(*last_result);
  if(active_volume) j["active_volume"] = *active_volume;
  if(last_volume_report) j["last_volume"] = reconcile_report_to_json(*last_volume_report);
  return j;
}

SyncOrchestrator::SyncOrchestrator(SyncConfig config,
                                   std::shared_ptr<Logger> logger,
                                   std::shared_ptr<EventSink> events,
                                   std::shared_ptr<RemoteTransport> remote)
  : config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("efsync")),
    events_(events ? std::move(events) : std::make_shared<LoggingEventSink>(logger_)),
    connections_(std::make_shared<ConnectionManager>(config_.connection, logger_)),
    remote_(std::move(remote)),
    retry_(std::make_unique<RetryPolicy>(config_.retry, logger_)),
    queue_(std::make_unique<OperationQueue>(config_.queue, logger_)),
    index_(std::make_shared<FileIndex>(config_.index_path(), config_.queue.fsync)),
    detector_(std::make_unique<ChangeDetector>(index_, config_.scan, logger_)),
    media_(config_.media, logger_) {
  if(!remote_ && config_.endpoint) {
    remote_ = std::make_shared<TcpTransport>(*config_.endpoint, config_.tcp, connections_, logger_);
  }
  engine_ = std::make_unique<TransferEngine>(config_.transfer, remote_, logger_);
  listener_ = connections_->add_transition_listener(
    [this](const Endpoint& endpoint, Reachability from, Reachability to){
      on_reachability(endpoint, from, to);
    });
}

SyncOrchestrator::~SyncOrchestrator() {
  stop();
  connections_->remove_transition_listener(listener_);
}

Result<void> SyncOrchestrator::open() {
  std::lock_guard<std::mutex> lock(cycle_mutex_);
  if(opened_) return Result<void>::Ok();

  std::error_code ec;
  std::filesystem::create_directories(config_.state_dir, ec);
  if(ec) {
    return Result<void>::Error(make_error(ErrorKind::StateStoreFailure,
                                          "cannot create state directory: " + ec.message(),
                                          config_.state_dir.string()));
  }
  auto queued = queue_->open();
  if(!queued.success) return queued;

  auto loaded = index_->load();
  if(!loaded.success) {
    log_warn(logger_.get(), "file index unusable, every file will be hashed again: {}", loaded.error.describe());
    index_->clear();
  }

  std::vector<std::filesystem::path> roots{config_.archive_root, config_.local_root};
  if(config_.serve) roots.push_back(config_.server.root);
  for(const auto& root : roots) {
    if(root.empty() || !std::filesystem::is_directory(root, ec)) continue;
    auto removed = AtomicFileWriter::cleanup_orphans(root, config_.orphan_age, logger_.get());
    if(removed > 0) log_info(logger_.get(), "removed {} orphaned temporary file(s) under {}", removed, root.string());
  }

  if(queue_->depth() > 0 || queue_->dead_count() > 0) {
    log_info(logger_.get(), "queue holds {} pending and {} dead task(s)", queue_->depth(), queue_->dead_count());
  }
  opened_ = true;
  set_state(OrchestratorState::Idle);
  return Result<void>::Ok();
}

Result<void> SyncOrchestrator::start() {
  if(running_) return Result<void>::Ok();
  auto opened = open();
  if(!opened.success) return opened;

  stop_requested_ = false;
  running_ = true;
  control_.reopen();
  media_events_.reopen();

  io_.restart();
  work_.emplace(asio::make_work_guard(io_));
  if(config_.endpoint) {
    cycle_timer_ = std::make_unique<asio::steady_timer>(io_);
    probe_timer_ = std::make_unique<asio::steady_timer>(io_);
    schedule_cycle_tick();
    schedule_probe_tick();
  }
  io_thread_ = std::thread([this](){ io_.run(); });
  control_thread_ = std::thread([this](){ control_loop(); });
  media_thread_ = std::thread([this](){ media_loop(); });

  log_info(logger_.get(), "efsync started: direction {}, endpoint {}, archive {}",
           to_string(config_.direction),
           config_.endpoint ? config_.endpoint->to_string() : std::string("none"),
           config_.archive_root.empty() ? std::string("none") : config_.archive_root.string());
  if(config_.endpoint) control_.push(ControlEvent{ControlEvent::Kind::Tick, {}});
  return Result<void>::Ok();
}

void SyncOrchestrator::stop() {
  if(!running_.exchange(false)) return;
  stop_requested_ = true;
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if(active_session_) active_session_->cancel();
  }
  control_.close();
  media_events_.close();

  asio::post(io_, [this](){
    std::error_code ec;
    if(cycle_timer_) cycle_timer_->cancel(ec);
    if(probe_timer_) probe_timer_->cancel(ec);
  });
  work_.reset();
  if(io_thread_.joinable()) io_thread_.join();
  if(control_thread_.joinable()) control_thread_.join();
  if(media_thread_.joinable()) media_thread_.join();
  cycle_timer_.reset();
  probe_timer_.reset();

  set_state(OrchestratorState::Stopped);
  log_info(logger_.get(), "efsync stopped ({} task(s) still queued)", queue_->depth());
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
  }
  run_cv_.notify_all();
}

void SyncOrchestrator::run() {
  std::unique_lock<std::mutex> lock(run_mutex_);
  run_cv_.wait(lock, [this]{ return !running_.load(); });
}

void SyncOrchestrator::schedule_cycle_tick() {
  if(!cycle_timer_) return;
  cycle_timer_->expires_after(config_.cycle_interval);
  cycle_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    control_.push(ControlEvent{ControlEvent::Kind::Tick, {}});
    schedule_cycle_tick();
  });
}

void SyncOrchestrator::schedule_probe_tick() {
  if(!probe_timer_ || !config_.endpoint) return;
  probe_timer_->expires_after(config_.probe_interval);
  probe_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    connections_->probe(*config_.endpoint);
    schedule_probe_tick();
  });
}

void SyncOrchestrator::control_loop() {
  while(!stop_requested_) {
    auto event = control_.pop_for(kChannelPoll);
    if(!event) {
      if(control_.closed()) break;
      continue;
    }
    if(stop_requested_) break;
    switch(event->kind) {
      case ControlEvent::Kind::Tick:
        run_cycle();
        break;
      case ControlEvent::Kind::Drain:
        drain_pending();
        break;
      case ControlEvent::Kind::VolumeInserted:
        media_events_.push(event->mount);
        break;
      case ControlEvent::Kind::VolumeRemoved: {
        std::lock_guard<std::mutex> lock(session_mutex_);
        if(active_session_ && active_mount_ == event->mount) {
          log_warn(logger_.get(), "media: {} removed during reconciliation", event->mount.string());
          active_session_->cancel();
        }
        break;
      }
    }
  }
}

void SyncOrchestrator::media_loop() {
  while(!stop_requested_) {
    auto mount = media_events_.pop_for(kChannelPoll);
    if(!mount) {
      if(media_events_.closed()) break;
      continue;
    }
    if(stop_requested_) break;
    reconcile_volume(*mount);
  }
}

void SyncOrchestrator::trigger_cycle() {
  control_.push(ControlEvent{ControlEvent::Kind::Tick, {}});
}

void SyncOrchestrator::notify_volume_inserted(const std::filesystem::path& mount_path) {
  log_info(logger_.get(), "media: volume inserted at {}", mount_path.string());
  control_.push(ControlEvent{ControlEvent::Kind::VolumeInserted, mount_path});
}

void SyncOrchestrator::notify_volume_removed(const std::filesystem::path& mount_path) {
  log_info(logger_.get(), "media: volume removed from {}", mount_path.string());
  control_.push(ControlEvent{ControlEvent::Kind::VolumeRemoved, mount_path});
}

void SyncOrchestrator::on_reachability(const Endpoint& endpoint, Reachability from, Reachability to) {
  if(!config_.endpoint || !(endpoint == *config_.endpoint)) return;
  queue_->set_remote_hold(to == Reachability::Unreachable);
  emit(make_event("endpoint_state_changed", {
    {"endpoint", endpoint.to_string()},
    {"from", to_string(from)},
    {"to", to_string(to)}
  }));
  if(to == Reachability::Reachable && from == Reachability::Unreachable && running_) {
    log_info(logger_.get(), "endpoint {} is back, draining {} queued task(s)", endpoint.to_string(),
             queue_->pending_remote_count());
    control_.push(ControlEvent{ControlEvent::Kind::Drain, {}});
  }
}

bool SyncOrchestrator::endpoint_usable() {
  return config_.endpoint && remote_ && connections_->is_reachable(*config_.endpoint);
}

SyncResult SyncOrchestrator::run_cycle() {
  auto start = std::chrono::steady_clock::now();
  SyncResult result;
  result.started_at = std::chrono::system_clock::now();
  if(!opened_) {
    auto opened = open();
    if(!opened.success) {
      std::lock_guard<std::mutex> lock(cycle_mutex_);
      result.errors.push_back(opened.error);
      finish_result(result, start);
      return result;
    }
  }

  std::lock_guard<std::mutex> lock(cycle_mutex_);
  if(!config_.endpoint) {
    finish_result(result, start);
    return result;
  }

  set_state(OrchestratorState::Scanning);
  std::vector<TransferTask> tasks;
  bool scanned = config_.direction == SyncDirection::Push ? collect_push_tasks(result, tasks)
                                                          : collect_pull_tasks(result, tasks);
  if(!scanned) {
    finish_result(result, start);
    return result;
  }

  set_state(OrchestratorState::Queuing);
  for(auto& task : tasks) {
    auto queued = queue_->enqueue(std::move(task));
    if(!queued.success) {
      result.errors.push_back(queued.error);
      // the index must not get ahead of the stored queue
      index_->clear();
      auto reloaded = index_->load();
      if(!reloaded.success) log_warn(logger_.get(), "file index reload failed: {}", reloaded.error.describe());
      finish_result(result, start);
      return result;
    }
    ++result.tasks_enqueued;
  }
  if(config_.direction == SyncDirection::Push && index_->dirty()) {
    auto saved = index_->save();
    if(!saved.success) log_warn(logger_.get(), "file index not saved: {}", saved.error.describe());
  }
  surface_evicted(result);

  drain_into(result);
  finish_result(result, start);
  return result;
}

SyncResult SyncOrchestrator::drain_pending() {
  auto start = std::chrono::steady_clock::now();
  SyncResult result;
  result.started_at = std::chrono::system_clock::now();
  std::lock_guard<std::mutex> lock(cycle_mutex_);
  drain_into(result);
  finish_result(result, start);
  return result;
}

bool SyncOrchestrator::collect_push_tasks(SyncResult& result, std::vector<TransferTask>& tasks) {
  std::error_code ec;
  if(!std::filesystem::is_directory(config_.source_root, ec)) {
    result.errors.push_back(make_error(ErrorKind::ArchiveInaccessible, "source root is not accessible",
                                       config_.source_root.string()));
    return false;
  }
  auto report = detector_->scan(config_.source_root);
  if(!report.complete) {
    log_warn(logger_.get(), "scan of {} was incomplete", config_.source_root.string());
  }
  for(const auto& removed : report.removed) {
    log_info(logger_.get(), "{} disappeared from the source (not propagated)", removed);
  }
  for(const auto& record : report.changed) {
    TransferTask task;
    task.kind = TaskKind::Push;
    task.source = record;
    task.destination = record.relative_path;
    tasks.push_back(std::move(task));
  }
  log_debug(logger_.get(), "scan: {} examined, {} hashed, {} changed, {} unstable",
            report.examined, report.hashed, report.changed.size(), report.unstable);
  return true;
}

bool SyncOrchestrator::collect_pull_tasks(SyncResult& result, std::vector<TransferTask>& tasks) {
  std::error_code ec;
  std::filesystem::create_directories(config_.local_root, ec);
  if(ec || !std::filesystem::is_directory(config_.local_root, ec)) {
    result.errors.push_back(make_error(ErrorKind::ArchiveInaccessible, "local root is not accessible",
                                       config_.local_root.string()));
    return false;
  }
  if(!endpoint_usable()) {
    log_debug(logger_.get(), "endpoint unreachable, remote manifest deferred");
    return true;
  }
  auto remote = remote_->manifest();
  if(!remote.success) {
    result.errors.push_back(remote.error);
    return remote.error.error_class() != ErrorClass::TerminalGlobal;
  }

  std::map<std::string, FileRecord> local;
  for(auto& record : detector_->full_manifest(config_.local_root)) {
    local[record.relative_path] = std::move(record);
  }
  for(auto record : remote.data) {
    auto safe = safe_relative_path(record.relative_path);
    if(!safe) {
      log_warn(logger_.get(), "ignoring remote path {}", record.relative_path);
      continue;
    }
    auto it = local.find(*safe);
    if(it != local.end() && it->second.same_content(record)) continue;
    record.relative_path = *safe;
    record.absolute_path.clear();
    TransferTask task;
    task.kind = TaskKind::Pull;
    task.destination = (config_.local_root / std::filesystem::path(*safe)).string();
    task.source = std::move(record);
    tasks.push_back(std::move(task));
  }
  return true;
}

void SyncOrchestrator::drain_into(SyncResult& result) {
  if(!config_.endpoint) return;
  set_state(OrchestratorState::Draining);
  if(queue_->queued_count() == 0) return;

  if(!endpoint_usable()) {
    queue_->set_remote_hold(true);
    result.deferred_tasks = queue_->pending_remote_count();
    log_info(logger_.get(), "endpoint {} unreachable, {} task(s) stay queued",
             config_.endpoint->to_string(), result.deferred_tasks);
    return;
  }
  queue_->set_remote_hold(false);

  DrainHooks hooks;
  hooks.should_stop = [this]{ return stop_requested_.load(); };
  hooks.on_finished = [this](const TransferTask& task, const Result<TransferOutcome>& outcome, TaskState state){
    on_task_finished(task, outcome, state);
  };
  auto report = run_queue_drain(*queue_, *retry_, config_.workers,
                                [this](TransferTask& task){ return engine_->transfer(task); },
                                hooks);
  result.files_transferred += report.succeeded;
  result.bytes_transferred += report.bytes;
  result.dead_tasks += report.dead;
  result.errors.insert(result.errors.end(), report.errors.begin(), report.errors.end());
  if(report.fatal) result.errors.push_back(*report.fatal);
  surface_evicted(result);
  result.deferred_tasks = queue_->queued_count();
}

void SyncOrchestrator::surface_evicted(SyncResult& result) {
  for(const auto& task : queue_->take_evicted()) {
    auto error = task.last_error ? *task.last_error : make_error(ErrorKind::None, "evicted");
    error.message = "evicted from the dead list: " + error.message;
    if(error.path.empty()) error.path = task.source.relative_path;
    result.errors.push_back(error);
    auto fields = task_fields(task);
    fields["error"] = sync_error_to_json(error);
    emit(make_event("task_evicted", std::move(fields)));
  }
}

void SyncOrchestrator::finish_result(SyncResult& result, std::chrono::steady_clock::time_point start) {
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
  bool global = std::any_of(result.errors.begin(), result.errors.end(),
                            [](const SyncError& e){ return e.error_class() == ErrorClass::TerminalGlobal; });
  if(global) {
    result.status = SyncStatus::Failed;
  } else if(!result.errors.empty() || result.dead_tasks > 0 || result.deferred_tasks > 0) {
    result.status = SyncStatus::Partial;
  } else {
    result.status = SyncStatus::Success;
  }
  for(const auto& error : result.errors) {
    if(error.error_class() == ErrorClass::TerminalGlobal) {
      log_error(logger_.get(), "cycle aborted: {}", error.describe());
    }
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    result.cycle = ++cycle_counter_;
    history_.push_back(result);
    while(history_.size() > std::max<std::size_t>(config_.result_history, 1)) history_.pop_front();
  }
  set_state(stop_requested_ ? OrchestratorState::Stopped : OrchestratorState::Idle);
  emit(make_event("cycle_completed", sync_result_to_json(result)));
}

void SyncOrchestrator::on_task_finished(const TransferTask& task, const Result<TransferOutcome>& result, TaskState state) {
  auto fields = task_fields(task);
  if(result.success) {
    fields["bytes"] = result.data.bytes;
    fields["duration_ms"] = result.data.duration.count();
    fields["skipped"] = result.data.skipped;
    emit(make_event("task_succeeded", std::move(fields)));
    return;
  }
  fields["error_kind"] = to_string(result.error.kind);
  fields["message"] = result.error.message;
  fields["retryable"] = result.error.retryable() && state != TaskState::Dead;
  fields["state"] = to_string(state);
  emit(make_event("task_failed", fields));
  if(state == TaskState::Dead) emit(make_event("task_dead", std::move(fields)));
}

std::optional<ReconcileReport> SyncOrchestrator::reconcile_volume(const std::filesystem::path& mount_path) {
  auto volume = media_.identify(mount_path);
  if(!volume) {
    emit(make_event("volume_rejected", {{"mount_path", mount_path.string()}, {"reason", "not a managed volume"}}));
    return std::nullopt;
  }

  auto finish = [this](ReconcileReport report){
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      last_volume_report_ = report;
    }
    emit(make_event("volume_reconciled", reconcile_report_to_json(report)));
    return report;
  };

  ReconcileReport report;
  report.volume_id = volume->logical_id;
  report.mount_path = mount_path;
  if(config_.archive_root.empty()) {
    report.errors.push_back(make_error(ErrorKind::ConfigInvalid, "no archive_root configured"));
    report.aborted = true;
    return finish(report);
  }

  auto plan = media_.reconcile(*volume, config_.archive_root);
  if(!plan.success) {
    log_error(logger_.get(), "media: cannot reconcile {}: {}", volume->logical_id, plan.error.describe());
    report.errors.push_back(plan.error);
    report.aborted = true;
    return finish(report);
  }
  if(plan.data.empty()) {
    report.unchanged = plan.data.unchanged.size();
    log_info(logger_.get(), "media: {} is up to date", volume->logical_id);
    return finish(report);
  }

  ReconcileSession session(*volume, plan.data,
                           [this](TransferTask& task){ return engine_->transfer(task); },
                           *retry_, config_.queue.attempt_ceiling, logger_);
  session.set_space_probe(media_.space_probe());
  session.set_observer([this](const TransferTask& task, const Result<TransferOutcome>& result, TaskState state){
    on_task_finished(task, result, state);
  });
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    active_session_ = &session;
    active_mount_ = mount_path;
  }
  if(stop_requested_) session.cancel();
  auto ran = session.run();
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    active_session_ = nullptr;
    active_mount_.clear();
  }
  if(!ran.success) {
    log_warn(logger_.get(), "media: session on {} not run: {}", volume->logical_id, ran.error.describe());
    report.errors.push_back(ran.error);
    report.aborted = true;
    return finish(report);
  }
  log_info(logger_.get(), "media: {} reconciled: {} extracted, {} injected, {} unchanged, {} pending",
           ran.data.volume_id, ran.data.extracted, ran.data.injected, ran.data.unchanged, ran.data.pending);
  return finish(ran.data);
}

std::vector<SyncResult> SyncOrchestrator::results() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return std::vector<SyncResult>(history_.begin(), history_.end());
}

std::vector<TransferTask> SyncOrchestrator::dead_tasks() const {
  return queue_->dead_tasks();
}

Result<void> SyncOrchestrator::retry_dead(const std::string& id) {
  auto retried = queue_->retry_dead(id);
  if(retried.success) {
    log_info(logger_.get(), "task {} re-queued by operator", id);
    if(running_) control_.push(ControlEvent{ControlEvent::Kind::Drain, {}});
  }
  return retried;
}

StatusSnapshot SyncOrchestrator::status_snapshot() const {
  StatusSnapshot snapshot;
  snapshot.running = running_;
  snapshot.direction = to_string(config_.direction);
  snapshot.endpoint = config_.endpoint;
  if(config_.endpoint) {
    snapshot.reachability = connections_->state(*config_.endpoint);
    snapshot.latency = connections_->last_latency(*config_.endpoint);
  }
  snapshot.queue_depth = queue_->depth();
  snapshot.queued = queue_->queued_count();
  snapshot.in_flight = queue_->in_flight_count();
  snapshot.dead = queue_->dead_count();
  snapshot.pending_remote = queue_->pending_remote_count();
  snapshot.oldest_task_age = queue_->oldest_age();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    snapshot.state = state_;
    snapshot.cycles = cycle_counter_;
    if(!history_.empty()) snapshot.last_result = history_.back();
    snapshot.last_volume_report = last_volume_report_;
  }
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if(active_session_) snapshot.active_volume = active_mount_.string();
  }
  return snapshot;
}

void SyncOrchestrator::set_state(OrchestratorState state) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if(state_ != state) {
    log_debug(logger_.get(), "orchestrator: {} -> {}", to_string(state_), to_string(state));
    state_ = state;
  }
}

void SyncOrchestrator::emit(SyncEvent event) {
  if(events_) events_->emit(event);
}
