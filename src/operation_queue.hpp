#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "state_db.hpp"
#include "sync_types.hpp"

class Logger;

struct QueueOptions {
  std::filesystem::path database_path; // empty keeps the queue in memory
  std::size_t ceiling = 10000;
  uint32_t attempt_ceiling = 5;
  bool fsync = true; // synchronous commits
};

// Ordered queue of outstanding transfer work.
//
// FIFO by enqueue order; a nack'd task moves to the back. Tasks sharing an
// ordering key are handed out strictly by sequence number, one at a time.
// Every mutation is committed to the tasks table before it is applied in
// memory, so a restart recovers everything not yet ack'd. In-flight is not
// stored; a task that was in flight at a crash comes back queued.
class OperationQueue {
public:
  using Filter = std::function<bool(const TransferTask&)>;

  explicit OperationQueue(QueueOptions options, std::shared_ptr<Logger> logger = nullptr);
  ~OperationQueue() = default;

  OperationQueue(const OperationQueue&) = delete;
  OperationQueue& operator=(const OperationQueue&) = delete;

  Result<void> open();

  // Returns the task id. A task identical to a live one (kind, source, destination,
  // fingerprint) is not queued twice; the existing id is returned.
  Result<std::string> enqueue(TransferTask task);
  std::optional<TransferTask> dequeue_next(const Filter& filter = {});
  Result<void> ack(const TransferTask& task);
  // Decides between re-queue (back of the queue, after retry_after) and DEAD.
  Result<TaskState> nack(const TransferTask& task, const SyncError& error,
                         std::chrono::milliseconds retry_after = std::chrono::milliseconds(0));

  Result<void> retry_dead(const std::string& id);

  // Remote tasks are held back while the endpoint is unreachable.
  void set_remote_hold(bool hold);
  bool remote_hold() const;

  // Blocks until any task changes state or the timeout passes.
  void wait_for_change(std::chrono::milliseconds timeout);

  std::size_t depth() const; // queued + in flight
  std::size_t queued_count() const;
  std::size_t in_flight_count() const;
  std::size_t dead_count() const;
  std::size_t pending_remote_count() const;
  std::optional<std::chrono::milliseconds> oldest_age() const;

  std::vector<TransferTask> snapshot() const;
  std::vector<TransferTask> dead_tasks() const;
  std::vector<TransferTask> take_evicted();

  uint32_t attempt_ceiling() const { return options_.attempt_ceiling; }
  bool durable() const { return !options_.database_path.empty(); }

private:
  using TaskList = std::list<TransferTask>;

  TaskList::iterator find_live(const std::string& id);
  std::deque<TransferTask>::iterator find_dead(const std::string& id);

  Result<void> load_locked();
  Result<void> store_insert(const TransferTask& task, int64_t position);
  Result<void> store_update(const TransferTask& task, int64_t position);
  Result<void> store_delete(const std::string& id);
  void enforce_ceiling_locked();
  void notify_change();

  QueueOptions options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable changed_cv_;
  uint64_t change_counter_ = 0;
  TaskList live_;                  // queued and in flight, in queue order
  std::deque<TransferTask> dead_;  // oldest death first
  std::vector<TransferTask> evicted_;
  uint64_t next_seq_ = 1;
  int64_t next_position_ = 1; // queue order of the rows, bumped on every re-queue
  bool remote_hold_ = false;
  bool opened_ = false;

  StateDatabase db_;
};
