#include "event_sink.hpp"

#include "log.hpp"

nlohmann::json SyncEvent::to_json() const {
  nlohmann::json j;
  j["event"] = type;
  j["at_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
  for(const auto& item : fields.items()) {
    j[item.key()] = item.value();
  }
  return j;
}

SyncEvent make_event(std::string type, nlohmann::json fields) {
  SyncEvent event;
  event.type = std::move(type);
  event.fields = std::move(fields);
  return event;
}

LoggingEventSink::LoggingEventSink(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

namespace {

spdlog::level::level_enum level_for(const SyncEvent& event) {
  if(event.type == "task_dead" || event.type == "task_evicted") return spdlog::level::err;
  if(event.type == "task_failed") {
    bool retryable = event.fields.value("retryable", false);
    return retryable ? spdlog::level::debug : spdlog::level::err;
  }
  if(event.type == "cycle_completed") {
    auto status = event.fields.value("status", std::string());
    if(status == "FAILED") return spdlog::level::err;
    if(status == "PARTIAL") return spdlog::level::warn;
  }
  if(event.type == "volume_reconciled") {
    if(event.fields.value("aborted", false) || event.fields.value("capacity_refused", false)) {
      return spdlog::level::warn;
    }
  }
  if(event.type == "endpoint_state_changed") {
    if(event.fields.value("to", std::string()) == "unreachable") return spdlog::level::warn;
  }
  return spdlog::level::info;
}

} // namespace

void LoggingEventSink::emit(const SyncEvent& event) {
  // event fields can carry raw path bytes
  auto line = event.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  auto level = level_for(event);
  if(logger_) {
    logger_->write(level, line);
  } else {
    detail::emit_to_default("event", "event", level, line);
  }
}
