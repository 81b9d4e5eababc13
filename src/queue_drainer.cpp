#include "queue_drainer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

#include "log.hpp"

DrainReport run_queue_drain(OperationQueue& queue,
                            const RetryPolicy& retry,
                            std::size_t workers,
                            const DrainTaskRunner& runner,
                            const DrainHooks& hooks) {
  DrainReport report;
  if(!runner) return report;
  workers = std::clamp<std::size_t>(workers, 1, 8);

  std::mutex report_mutex;
  std::atomic<bool> halt{false};
  std::atomic<std::size_t> active{0};

  auto stop_requested = [&]() -> bool {
    if(halt.load()) return true;
    return hooks.should_stop && hooks.should_stop();
  };

  auto worker_fn = [&](std::size_t /*worker_id*/){
    while(true) {
      if(stop_requested()) {
        std::lock_guard<std::mutex> lock(report_mutex);
        if(!halt.load()) report.stopped = true;
        break;
      }
      // claim before dequeue so idle workers see this one as busy
      ++active;
      auto claimed = queue.dequeue_next(hooks.filter);
      if(!claimed) {
        --active;
        if(active.load() == 0) break;
        // another worker may re-queue or unblock a task for the same path
        queue.wait_for_change(std::chrono::milliseconds(100));
        continue;
      }
      TransferTask task = std::move(*claimed);

      const uint32_t ceiling = queue.attempt_ceiling();
      uint32_t budget = retry.options().max_attempts;
      if(task.attempts < ceiling) budget = std::min(budget, ceiling - task.attempts);
      budget = std::max<uint32_t>(budget, 1);

      auto result = retry.execute([&](uint32_t){ return runner(task); },
                                  budget, retry.options().base_delay, nullptr,
                                  [&]{ return stop_requested(); });

      TaskState settled = TaskState::Succeeded;
      std::optional<SyncError> fatal;
      if(result.success) {
        auto acked = queue.ack(task);
        if(!acked.success) fatal = acked.error;
      } else {
        auto nacked = queue.nack(task, result.error, retry.delay_for_attempt(task.attempts));
        if(nacked.success) {
          settled = nacked.data;
        } else {
          fatal = nacked.error;
          settled = TaskState::Failed;
        }
      }

      {
        std::lock_guard<std::mutex> lock(report_mutex);
        if(fatal) {
          if(!report.fatal) report.fatal = fatal;
          halt = true;
        }
        if(result.success) {
          ++report.succeeded;
          report.bytes += result.data.bytes;
        } else {
          report.errors.push_back(result.error);
          if(settled == TaskState::Dead) {
            ++report.dead;
          } else {
            ++report.requeued;
          }
        }
      }
      if(hooks.on_finished) hooks.on_finished(task, result, settled);
      --active;
    }
  };

  if(workers == 1) {
    worker_fn(0);
  } else {
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for(std::size_t i = 0; i < workers; ++i) {
      threads.emplace_back(worker_fn, i);
    }
    for(auto& thread : threads) {
      if(thread.joinable()) thread.join();
    }
  }
  return report;
}
