#include "operation_queue.hpp"

#include <algorithm>
#include <unordered_map>

#include "log.hpp"
#include "utils.hpp"

namespace {

const char* kSchema =
  "CREATE TABLE IF NOT EXISTS tasks ("
  " id TEXT PRIMARY KEY,"
  " seq INTEGER NOT NULL,"
  " position INTEGER NOT NULL,"
  " kind TEXT NOT NULL,"
  " state TEXT NOT NULL,"
  " relative_path TEXT NOT NULL,"
  " absolute_path TEXT NOT NULL,"
  " size INTEGER NOT NULL,"
  " fingerprint TEXT NOT NULL,"
  " mtime_ns INTEGER NOT NULL,"
  " version TEXT,"
  " destination TEXT NOT NULL,"
  " volume_root TEXT NOT NULL,"
  " attempts INTEGER NOT NULL,"
  " enqueued_at_ms INTEGER NOT NULL,"
  " not_before_ms INTEGER NOT NULL,"
  " error_kind TEXT,"
  " error_message TEXT,"
  " error_path TEXT);"
  "CREATE TABLE IF NOT EXISTS queue_meta (key TEXT PRIMARY KEY, value INTEGER NOT NULL);";

bool same_work(const TransferTask& a, const TransferTask& b) {
  return a.kind == b.kind &&
         a.destination == b.destination &&
         a.source.relative_path == b.source.relative_path &&
         a.source.absolute_path == b.source.absolute_path &&
         a.source.fingerprint == b.source.fingerprint;
}

void bind_error(Statement& stmt, int first, const std::optional<SyncError>& error) {
  if(error) {
    stmt.bind_text(first, to_string(error->kind));
    stmt.bind_text(first + 1, error->message);
    stmt.bind_text(first + 2, error->path);
  } else {
    stmt.bind_null(first);
    stmt.bind_null(first + 1);
    stmt.bind_null(first + 2);
  }
}

} // namespace

OperationQueue::OperationQueue(QueueOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)), logger_(std::move(logger)) {
  if(options_.attempt_ceiling == 0) options_.attempt_ceiling = 1;
  if(options_.ceiling == 0) options_.ceiling = 1;
}

Result<void> OperationQueue::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(opened_) return Result<void>::Ok();
  if(!durable()) {
    opened_ = true;
    return Result<void>::Ok();
  }

  auto opened = db_.open(options_.database_path, options_.fsync);
  if(!opened.success) return opened;
  auto schema = db_.exec(kSchema);
  if(!schema.success) {
    db_.close();
    return schema;
  }
  auto loaded = load_locked();
  if(!loaded.success) {
    live_.clear();
    dead_.clear();
    db_.close();
    return loaded;
  }
  opened_ = true;
  log_info(logger_.get(), "queue: recovered {} live and {} dead tasks from {}",
           live_.size(), dead_.size(), options_.database_path.string());
  return Result<void>::Ok();
}

Result<void> OperationQueue::load_locked() {
  Statement meta(db_, "SELECT value FROM queue_meta WHERE key = 'next_seq'");
  if(!meta.prepared()) return Result<void>::Error(db_.failure("cannot read queue metadata"));
  if(meta.step() == SQLITE_ROW) {
    next_seq_ = std::max<uint64_t>(next_seq_, static_cast<uint64_t>(meta.column_int(0)));
  }

  Statement rows(db_,
    "SELECT id, seq, position, kind, state, relative_path, absolute_path, size, fingerprint,"
    " mtime_ns, version, destination, volume_root, attempts, enqueued_at_ms, not_before_ms,"
    " error_kind, error_message, error_path FROM tasks ORDER BY position");
  if(!rows.prepared()) return Result<void>::Error(db_.failure("cannot read queued tasks"));

  int rc;
  while((rc = rows.step()) == SQLITE_ROW) {
    TransferTask task;
    task.id = rows.column_text(0);
    task.seq = static_cast<uint64_t>(rows.column_int(1));
    next_position_ = std::max(next_position_, rows.column_int(2) + 1);
    auto kind = task_kind_from_string(rows.column_text(3));
    if(!kind) {
      log_warn(logger_.get(), "queue: dropping task {} with unknown kind '{}'", task.id, rows.column_text(3));
      continue;
    }
    task.kind = *kind;
    auto state = task_state_from_string(rows.column_text(4));
    task.source.relative_path = rows.column_text(5);
    task.source.absolute_path = rows.column_text(6);
    task.source.size = static_cast<uint64_t>(rows.column_int(7));
    task.source.fingerprint = rows.column_text(8);
    task.source.mtime_ns = rows.column_int(9);
    if(!rows.column_null(10)) task.source.version = rows.column_text(10);
    task.destination = rows.column_text(11);
    task.volume_root = rows.column_text(12);
    task.attempts = static_cast<uint32_t>(rows.column_int(13));
    task.enqueued_at_ms = rows.column_int(14);
    task.not_before_ms = rows.column_int(15);
    if(!rows.column_null(16)) {
      auto error_kind = error_kind_from_string(rows.column_text(16));
      task.last_error = make_error(error_kind ? *error_kind : ErrorKind::ProtocolError,
                                   rows.column_text(17), rows.column_text(18));
    }
    next_seq_ = std::max(next_seq_, task.seq + 1);

    // nothing survives a restart in flight
    if(state && *state == TaskState::Dead) {
      task.state = TaskState::Dead;
      dead_.push_back(std::move(task));
    } else {
      task.state = TaskState::Queued;
      live_.push_back(std::move(task));
    }
  }
  if(rc != SQLITE_DONE) return Result<void>::Error(db_.failure("cannot read queued tasks"));
  return Result<void>::Ok();
}

Result<void> OperationQueue::store_insert(const TransferTask& task, int64_t position) {
  if(!durable()) return Result<void>::Ok();
  Transaction tx(db_);
  if(!tx.begun().success) return tx.begun();

  Statement insert(db_,
    "INSERT INTO tasks (id, seq, position, kind, state, relative_path, absolute_path, size,"
    " fingerprint, mtime_ns, version, destination, volume_root, attempts, enqueued_at_ms,"
    " not_before_ms, error_kind, error_message, error_path)"
    " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
  insert.bind_text(1, task.id);
  insert.bind_int(2, static_cast<int64_t>(task.seq));
  insert.bind_int(3, position);
  insert.bind_text(4, to_string(task.kind));
  insert.bind_text(5, to_string(task.state));
  insert.bind_text(6, task.source.relative_path);
  insert.bind_text(7, task.source.absolute_path.string());
  insert.bind_int(8, static_cast<int64_t>(task.source.size));
  insert.bind_text(9, task.source.fingerprint);
  insert.bind_int(10, task.source.mtime_ns);
  if(task.source.version) insert.bind_text(11, *task.source.version);
  else insert.bind_null(11);
  insert.bind_text(12, task.destination);
  insert.bind_text(13, task.volume_root);
  insert.bind_int(14, task.attempts);
  insert.bind_int(15, task.enqueued_at_ms);
  insert.bind_int(16, task.not_before_ms);
  bind_error(insert, 17, task.last_error);
  auto inserted = insert.run("cannot store task " + task.id);
  if(!inserted.success) return inserted;

  Statement meta(db_, "INSERT OR REPLACE INTO queue_meta (key, value) VALUES ('next_seq', ?)");
  meta.bind_int(1, static_cast<int64_t>(task.seq + 1));
  auto stored = meta.run("cannot store queue sequence");
  if(!stored.success) return stored;
  return tx.commit();
}

Result<void> OperationQueue::store_update(const TransferTask& task, int64_t position) {
  if(!durable()) return Result<void>::Ok();
  Statement update(db_,
    "UPDATE tasks SET position = ?, state = ?, attempts = ?, not_before_ms = ?,"
    " error_kind = ?, error_message = ?, error_path = ? WHERE id = ?");
  update.bind_int(1, position);
  update.bind_text(2, to_string(task.state));
  update.bind_int(3, task.attempts);
  update.bind_int(4, task.not_before_ms);
  bind_error(update, 5, task.last_error);
  update.bind_text(8, task.id);
  return update.run("cannot update task " + task.id);
}

Result<void> OperationQueue::store_delete(const std::string& id) {
  if(!durable()) return Result<void>::Ok();
  Statement remove(db_, "DELETE FROM tasks WHERE id = ?");
  remove.bind_text(1, id);
  return remove.run("cannot delete task " + id);
}

OperationQueue::TaskList::iterator OperationQueue::find_live(const std::string& id) {
  return std::find_if(live_.begin(), live_.end(),
                      [&](const TransferTask& t){ return t.id == id; });
}

std::deque<TransferTask>::iterator OperationQueue::find_dead(const std::string& id) {
  return std::find_if(dead_.begin(), dead_.end(),
                      [&](const TransferTask& t){ return t.id == id; });
}

void OperationQueue::enforce_ceiling_locked() {
  while(live_.size() + dead_.size() > options_.ceiling && !dead_.empty()) {
    auto victim = dead_.front();
    auto deleted = store_delete(victim.id);
    if(!deleted.success) {
      log_warn(logger_.get(), "queue: eviction of {} not stored: {}", victim.id, deleted.error.describe());
    }
    dead_.pop_front();
    log_error(logger_.get(), "queue: evicted dead task {} ({}) to stay under ceiling {}",
              victim.id, victim.source.relative_path, options_.ceiling);
    evicted_.push_back(std::move(victim));
  }
  if(live_.size() + dead_.size() > options_.ceiling) {
    log_warn(logger_.get(), "queue: depth {} exceeds ceiling {}; live tasks are kept",
             live_.size() + dead_.size(), options_.ceiling);
  }
}

void OperationQueue::notify_change() {
  ++change_counter_;
  changed_cv_.notify_all();
}

Result<std::string> OperationQueue::enqueue(TransferTask task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!opened_) {
    return Result<std::string>::Error(make_error(ErrorKind::StateStoreFailure, "queue is not open"));
  }
  for(const auto& existing : live_) {
    if(same_work(existing, task)) {
      log_debug(logger_.get(), "queue: {} already queued as {}", task.source.relative_path, existing.id);
      return Result<std::string>::Ok(existing.id);
    }
  }

  task.seq = next_seq_;
  if(task.id.empty()) task.id = "t-" + std::to_string(task.seq);
  if(task.enqueued_at_ms == 0) task.enqueued_at_ms = now_epoch_ms();
  task.state = TaskState::Queued;

  auto stored = store_insert(task, next_position_);
  if(!stored.success) return Result<std::string>::Error(stored.error);

  ++next_seq_;
  ++next_position_;
  auto id = task.id;
  live_.push_back(std::move(task));
  enforce_ceiling_locked();
  notify_change();
  return Result<std::string>::Ok(id);
}

std::optional<TransferTask> OperationQueue::dequeue_next(const Filter& filter) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_map<std::string, uint64_t> head_of_key;
  for(const auto& task : live_) {
    auto key = task.ordering_key();
    auto it = head_of_key.find(key);
    if(it == head_of_key.end() || task.seq < it->second) head_of_key[key] = task.seq;
  }

  const auto now = now_epoch_ms();
  for(auto& task : live_) {
    if(task.state != TaskState::Queued) continue;
    if(head_of_key[task.ordering_key()] != task.seq) continue;
    if(task.not_before_ms > now) continue;
    if(remote_hold_ && is_remote_kind(task.kind)) continue;
    if(filter && !filter(task)) continue;
    task.state = TaskState::InFlight;
    notify_change();
    return task;
  }
  return std::nullopt;
}

Result<void> OperationQueue::ack(const TransferTask& task) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_live(task.id);
  if(it == live_.end()) {
    log_debug(logger_.get(), "queue: ack for unknown task {}", task.id);
    return Result<void>::Ok();
  }
  auto deleted = store_delete(task.id);
  if(!deleted.success) return deleted;
  live_.erase(it);
  notify_change();
  return Result<void>::Ok();
}

Result<TaskState> OperationQueue::nack(const TransferTask& task, const SyncError& error,
                                       std::chrono::milliseconds retry_after) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_live(task.id);
  if(it == live_.end()) {
    return Result<TaskState>::Error(make_error(ErrorKind::ProtocolError,
                                               "nack for unknown task " + task.id));
  }
  const bool dead = !error.retryable() || task.attempts >= options_.attempt_ceiling;

  TransferTask updated = *it;
  updated.attempts = task.attempts;
  updated.last_error = error;
  updated.state = dead ? TaskState::Dead : TaskState::Queued;
  updated.not_before_ms = dead ? 0 : now_epoch_ms() + retry_after.count();

  auto stored = store_update(updated, next_position_);
  if(!stored.success) return Result<TaskState>::Error(stored.error);
  ++next_position_;

  live_.erase(it);
  if(dead) {
    log_error(logger_.get(), "queue: task {} ({}) is DEAD after {} attempt(s): {}",
              task.id, task.source.relative_path, task.attempts, error.describe());
    dead_.push_back(std::move(updated));
    enforce_ceiling_locked();
  } else {
    live_.push_back(std::move(updated));
  }
  notify_change();
  return Result<TaskState>::Ok(dead ? TaskState::Dead : TaskState::Queued);
}

Result<void> OperationQueue::retry_dead(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = find_dead(id);
  if(it == dead_.end()) {
    return Result<void>::Error(make_error(ErrorKind::ProtocolError, "no dead task " + id));
  }
  TransferTask task = *it;
  task.state = TaskState::Queued;
  task.attempts = 0;
  task.not_before_ms = 0;
  auto stored = store_update(task, next_position_);
  if(!stored.success) return stored;
  ++next_position_;

  dead_.erase(it);
  live_.push_back(std::move(task));
  notify_change();
  return Result<void>::Ok();
}

void OperationQueue::set_remote_hold(bool hold) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(remote_hold_ == hold) return;
  remote_hold_ = hold;
  log_debug(logger_.get(), "queue: remote hold {}", hold ? "on" : "off");
  notify_change();
}

bool OperationQueue::remote_hold() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return remote_hold_;
}

void OperationQueue::wait_for_change(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  const auto seen = change_counter_;
  changed_cv_.wait_for(lock, timeout, [&]{ return change_counter_ != seen; });
}

std::size_t OperationQueue::depth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_.size();
}

std::size_t OperationQueue::queued_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(live_.begin(), live_.end(),
    [](const TransferTask& t){ return t.state == TaskState::Queued; }));
}

std::size_t OperationQueue::in_flight_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(live_.begin(), live_.end(),
    [](const TransferTask& t){ return t.state == TaskState::InFlight; }));
}

std::size_t OperationQueue::dead_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dead_.size();
}

std::size_t OperationQueue::pending_remote_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(live_.begin(), live_.end(),
    [](const TransferTask& t){ return t.state == TaskState::Queued && is_remote_kind(t.kind); }));
}

std::optional<std::chrono::milliseconds> OperationQueue::oldest_age() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if(live_.empty()) return std::nullopt;
  int64_t oldest = live_.front().enqueued_at_ms;
  for(const auto& task : live_) oldest = std::min(oldest, task.enqueued_at_ms);
  return std::chrono::milliseconds(std::max<int64_t>(0, now_epoch_ms() - oldest));
}

std::vector<TransferTask> OperationQueue::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<TransferTask>(live_.begin(), live_.end());
}

std::vector<TransferTask> OperationQueue::dead_tasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<TransferTask>(dead_.begin(), dead_.end());
}

std::vector<TransferTask> OperationQueue::take_evicted() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TransferTask> out;
  out.swap(evicted_);
  return out;
}
