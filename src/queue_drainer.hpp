#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "errors.hpp"
#include "operation_queue.hpp"
#include "retry_policy.hpp"
#include "sync_types.hpp"
#include "transfer_engine.hpp"

using DrainTaskRunner = std::function<Result<TransferOutcome>(TransferTask&)>;

struct DrainHooks {
  std::function<bool()> should_stop;         // checked before every dequeue and between retries
  OperationQueue::Filter filter;
  // Called once per dequeue with the state the queue settled on (Succeeded, Queued or Dead).
  std::function<void(const TransferTask&, const Result<TransferOutcome>&, TaskState)> on_finished;
};

struct DrainReport {
  std::size_t succeeded = 0;
  std::size_t requeued = 0;
  std::size_t dead = 0;
  uint64_t bytes = 0;
  std::vector<SyncError> errors;
  std::optional<SyncError> fatal; // queue could not record an outcome
  bool stopped = false;
};

// Drains everything eligible right now with a fixed pool of workers. Each
// dequeued task gets up to min(retry max attempts, remaining attempt budget)
// tries in place before it is nack'd with a backoff.
DrainReport run_queue_drain(OperationQueue& queue,
                            const RetryPolicy& retry,
                            std::size_t workers,
                            const DrainTaskRunner& runner,
                            const DrainHooks& hooks = {});
