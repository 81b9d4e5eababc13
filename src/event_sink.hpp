#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

class Logger;

// Structured notification emitted by the core. Sinks format it; the core never does.
struct SyncEvent {
  std::string type; // task_succeeded, task_failed, task_dead, task_evicted, volume_reconciled,
                    // volume_rejected, cycle_completed, endpoint_state_changed
  nlohmann::json fields = nlohmann::json::object();
  std::chrono::system_clock::time_point at = std::chrono::system_clock::now();

  nlohmann::json to_json() const;
};

SyncEvent make_event(std::string type, nlohmann::json fields = nlohmann::json::object());

class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void emit(const SyncEvent& event) = 0;
};

// One JSON line per event through the logger. Retryable task failures go to
// debug, DEAD/evicted tasks and failed cycles to error.
class LoggingEventSink : public EventSink {
public:
  explicit LoggingEventSink(std::shared_ptr<Logger> logger = nullptr);
  void emit(const SyncEvent& event) override;

private:
  std::shared_ptr<Logger> logger_;
};
